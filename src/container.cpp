// Copyright Global Phasing Ltd.

#include <ensfit/container.hpp>

namespace ensfit {

Conformation::Conformation(Frame frame, TopologyPtr topology) : frame_(std::move(frame)) {
  if (topology)
    ctx_.set_topology(topology, frame_.size());
}

void Conformation::set_atoms(TopologyPtr topology) {
  ctx_.set_topology(topology, frame_.size());
}

void Conformation::set_reference(const Frame& frame) {
  ctx_.set_reference(frame, frame_.size());
}

double Conformation::rmsd() {
  if (!ctx_.has_reference())
    fail("Conformation::rmsd(): reference is not set");
  return calculate_current_rmsd(frame_, ctx_.reference(), ctx_.mask(frame_.size()),
                                ctx_.weights_ptr());
}

SupResult Conformation::superpose(const SupOptions& options, const Logger& logger) {
  if (!ctx_.has_reference())
    fail("Conformation::superpose(): reference is not set");
  return superpose_in_place(frame_, ctx_.reference(), ctx_.mask(frame_.size()),
                            ctx_.weights_ptr(), options, logger);
}

} // namespace ensfit

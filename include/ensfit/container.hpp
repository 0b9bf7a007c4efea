// Copyright Global Phasing Ltd.
//
// Common interface of frame containers (Conformation, Ensemble, Trajectory)
// and the state they share: topology, active selection, reference, weights.

#ifndef ENSFIT_CONTAINER_HPP_
#define ENSFIT_CONTAINER_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include "fail.hpp"       // for ENSFIT_DLL
#include "frame.hpp"      // for Frame, SelectionMask
#include "logger.hpp"     // for Logger
#include "select.hpp"     // for MaskCache
#include "superpose.hpp"  // for SupResult, SupOptions
#include "topology.hpp"   // for TopologyPtr

namespace ensfit {

/// Operations shared by all containers of frames.
class ENSFIT_DLL FrameContainer {
public:
  virtual ~FrameContainer() {}
  /// number of atoms per frame, 0 if not known yet
  virtual size_t n_atoms() const = 0;
  virtual void set_atoms(TopologyPtr topology) = 0;
  virtual void select(const std::string& selstr) = 0;
  virtual void set_reference(const Frame& frame) = 0;
  /// nullptr if there is no current frame
  virtual const Frame* current_frame() const = 0;
  /// RMSD of the current frame from the reference, over the selected atoms
  virtual double rmsd() = 0;
};

/// Topology, selection, reference and weights of one container.
/// Each change increments version, which is used to detect stale results.
class ENSFIT_DLL AtomContext {
public:
  const TopologyPtr& topology() const { return topology_; }
  const std::string& selection() const { return selstr_; }
  bool has_reference() const { return has_reference_; }
  const Frame& reference() const { return reference_; }
  const std::vector<double>& weights() const { return weights_; }
  const std::vector<double>* weights_ptr() const {
    return weights_.empty() ? nullptr : &weights_;
  }
  std::uint64_t version() const { return version_; }

  /// size from topology, reference or weights; 0 if nothing is set
  size_t n_atoms() const {
    if (topology_)
      return topology_->size();
    if (has_reference_)
      return reference_.size();
    return weights_.size();
  }

  /// The mask of the active selection, or all atoms if nothing is selected.
  const SelectionMask& mask(size_t n) {
    if (mask_.size() != n)
      mask_ = SelectionMask::all(n);
    return mask_;
  }

  /// n is the size of frames already stored in the container, 0 if none.
  /// The current selection is resolved against the new topology.
  void set_topology(TopologyPtr topology, size_t n) {
    if (!topology)
      fail("set_atoms(): null topology");
    if (n != 0 && topology->size() != n)
      fail_with<SizeMismatch>("set_atoms(): topology has ",
                              std::to_string(topology->size()),
                              " atoms, frames have ", std::to_string(n));
    if (has_reference_)
      check_same_size(topology->size(), reference_.size(), "set_atoms(): reference");
    if (!weights_.empty())
      check_same_size(topology->size(), weights_.size(), "set_atoms(): weights");
    cache_.clear();
    SelectionMask new_mask;
    if (!selstr_.empty())
      new_mask = cache_.get(selstr_, *topology);
    topology_ = topology;
    mask_ = new_mask;
    ++version_;
  }

  void select(const std::string& selstr) {
    if (!topology_)
      throw SelectionError("select(): atoms (topology) are not set");
    mask_ = cache_.get(selstr, *topology_);
    selstr_ = selstr;
    ++version_;
  }

  /// Selects all atoms.
  void select_all() {
    selstr_.clear();
    mask_ = SelectionMask();
    ++version_;
  }

  void set_reference(const Frame& frame, size_t n) {
    if (n != 0)
      check_same_size(frame.size(), n, "set_reference(): reference and frames");
    check_size(frame.size(), "set_reference()");
    if (!weights_.empty())
      check_same_size(frame.size(), weights_.size(), "set_reference(): weights");
    reference_ = frame;
    has_reference_ = true;
    ++version_;
  }

  void set_weights(const std::vector<double>& weights, size_t n) {
    if (n != 0)
      check_same_size(weights.size(), n, "set_weights(): weights and frames");
    check_size(weights.size(), "set_weights()");
    if (has_reference_)
      check_same_size(weights.size(), reference_.size(), "set_weights(): reference");
    weights_ = weights;
    ++version_;
  }

  void clear_reference() { has_reference_ = false; reference_ = Frame(); ++version_; }

  size_t cached_masks() const { return cache_.size(); }

private:
  TopologyPtr topology_;
  MaskCache cache_;
  std::string selstr_;
  SelectionMask mask_;
  Frame reference_;
  bool has_reference_ = false;
  std::vector<double> weights_;
  std::uint64_t version_ = 0;

  void check_size(size_t n, const char* func) const {
    if (topology_)
      check_same_size(n, topology_->size(), cat(func, ": atoms").c_str());
  }
};

/// A single frame with its own reference.
class ENSFIT_DLL Conformation : public FrameContainer {
public:
  Conformation() = default;
  explicit Conformation(Frame frame, TopologyPtr topology=TopologyPtr());

  size_t n_atoms() const override { return frame_.size(); }
  void set_atoms(TopologyPtr topology) override;
  void select(const std::string& selstr) override { ctx_.select(selstr); }
  void set_reference(const Frame& frame) override;
  const Frame* current_frame() const override { return &frame_; }
  double rmsd() override;

  /// Superposes the frame onto the reference (in place).
  SupResult superpose(const SupOptions& options=SupOptions(),
                      const Logger& logger=Logger());

  Frame& frame() { return frame_; }
  const AtomContext& context() const { return ctx_; }

private:
  Frame frame_;
  AtomContext ctx_;
};

} // namespace ensfit
#endif

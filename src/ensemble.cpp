// Copyright Global Phasing Ltd.

#include <ensfit/ensemble.hpp>
#include <cmath>  // for sqrt

namespace ensfit {

void Ensemble::check_frame_size(size_t n) const {
  size_t expected = n_atoms();
  if (expected != 0 && n != expected)
    fail_with<SizeMismatch>("Ensemble ", title_, ": frame has ", std::to_string(n),
                            " atoms, expected ", std::to_string(expected));
}

void Ensemble::require_frames(const char* func) const {
  if (frames_.empty())
    fail("Ensemble::", func, "(): no frames");
}

void Ensemble::set_atoms(TopologyPtr topology) {
  ctx_.set_topology(topology, frames_.empty() ? 0 : frames_[0].size());
}

void Ensemble::select(const std::string& selstr) {
  ctx_.select(selstr);
}

void Ensemble::select_all() {
  ctx_.select_all();
}

void Ensemble::set_reference(const Frame& frame) {
  ctx_.set_reference(frame, frames_.empty() ? 0 : frames_[0].size());
}

void Ensemble::set_reference(size_t index) {
  if (index >= frames_.size())
    throw std::out_of_range("Ensemble::set_reference(): no frame #" +
                            std::to_string(index));
  ctx_.set_reference(frames_[index], frames_[index].size());
}

void Ensemble::set_weights(const std::vector<double>& weights) {
  ctx_.set_weights(weights, frames_.empty() ? 0 : frames_[0].size());
}

const Frame& Ensemble::reference() const {
  if (ctx_.has_reference())
    return ctx_.reference();
  if (frames_.empty())
    fail("Ensemble ", title_, ": no reference and no frames");
  return frames_[0];
}

void Ensemble::add_frame(Frame frame) {
  check_frame_size(frame.size());
  frames_.push_back(std::move(frame));
  ++frames_version_;
}

void Ensemble::add_frames(const std::vector<Frame>& frames) {
  // all or nothing
  for (const Frame& frame : frames) {
    check_frame_size(frame.size());
    if (frame.size() != frames[0].size())
      fail_with<SizeMismatch>("Ensemble::add_frames(): frames differ in size");
  }
  frames_.insert(frames_.end(), frames.begin(), frames.end());
  ++frames_version_;
}

void Ensemble::delete_frame(size_t index) {
  if (index >= frames_.size())
    throw std::out_of_range("Ensemble::delete_frame(): no frame #" +
                            std::to_string(index));
  frames_.erase(frames_.begin() + index);
  if (active_ >= frames_.size())
    active_ = 0;
  ++frames_version_;
}

void Ensemble::set_active(size_t index) {
  if (index >= frames_.size())
    throw std::out_of_range("Ensemble::set_active(): no frame #" +
                            std::to_string(index));
  active_ = index;
}

double Ensemble::rmsd() {
  require_frames("rmsd");
  return calculate_current_rmsd(frames_[active_], reference(), mask(),
                                ctx_.weights_ptr());
}

void Ensemble::superpose(const SupOptions& options, const Logger& logger) {
  require_frames("superpose");
  // copy, the reference may be frames_[0]
  const Frame ref = reference();
  const SelectionMask& m = mask();
  std::vector<SupResult> results;
  results.reserve(frames_.size());
  for (Frame& frame : frames_)
    results.push_back(superpose_in_place(frame, ref, m, ctx_.weights_ptr(),
                                         options, logger));
  superpositions_.swap(results);
  sup_context_version_ = ctx_.version();
  sup_frames_version_ = frames_version_;
  logger.debug("superposed ", frames_.size(), " frames on ", m.count(), " atoms");
}

bool Ensemble::superposition_is_valid() const {
  return !superpositions_.empty() &&
         superpositions_.size() == frames_.size() &&
         sup_context_version_ == ctx_.version() &&
         sup_frames_version_ == frames_version_;
}

std::vector<double> Ensemble::rmsds() {
  std::vector<double> result;
  result.reserve(frames_.size());
  if (superposition_is_valid()) {
    for (const SupResult& sr : superpositions_)
      result.push_back(sr.rmsd);
    return result;
  }
  if (frames_.empty())
    return result;
  const Frame& ref = reference();
  const SelectionMask& m = mask();
  for (const Frame& frame : frames_)
    result.push_back(calculate_current_rmsd(frame, ref, m, ctx_.weights_ptr()));
  return result;
}

std::vector<double> Ensemble::rmsfs() {
  require_frames("rmsfs");
  std::vector<size_t> indices = mask().indices();
  std::vector<Variance3> var(indices.size());
  for (const Frame& frame : frames_)
    for (size_t k = 0; k != indices.size(); ++k)
      var[k].add_point(frame[indices[k]]);
  std::vector<double> result(var.size());
  for (size_t k = 0; k != var.size(); ++k)
    result[k] = std::sqrt(var[k].for_population());
  return result;
}

Frame Ensemble::mean_coordinates() const {
  require_frames("mean_coordinates");
  Frame mean(frames_[0].size());
  for (const Frame& frame : frames_)
    for (size_t i = 0; i != frame.size(); ++i)
      mean[i] += frame[i];
  for (Vec3& p : mean.pos)
    p /= (double) frames_.size();
  mean.label = "mean";
  return mean;
}

std::vector<std::vector<Vec3>> Ensemble::deviations() {
  std::vector<std::vector<Vec3>> result;
  if (frames_.empty())
    return result;
  const Frame& ref = reference();
  std::vector<size_t> indices = mask().indices();
  result.reserve(frames_.size());
  for (const Frame& frame : frames_) {
    result.emplace_back();
    std::vector<Vec3>& dev = result.back();
    dev.reserve(indices.size());
    for (size_t i : indices)
      dev.push_back(frame[i] - ref[i]);
  }
  return result;
}

std::vector<double> Ensemble::radii_of_gyration() {
  std::vector<double> result;
  result.reserve(frames_.size());
  for (const Frame& frame : frames_)
    result.push_back(calculate_radius_of_gyration(frame, mask(), ctx_.weights_ptr()));
  return result;
}

int Ensemble::iterpose(double rmsd_tol, int max_iter, const Logger& logger) {
  require_frames("iterpose");
  superpose(SupOptions(), logger);
  Frame ref = reference();
  int iter = 0;
  while (iter < max_iter) {
    ++iter;
    Frame mean = mean_coordinates();
    double change = calculate_current_rmsd(mean, ref, mask(), ctx_.weights_ptr());
    set_reference(mean);
    superpose(SupOptions(), logger);
    logger.mesg("iterpose: step ", iter, ", mean moved by ", change);
    if (change < rmsd_tol)
      break;
    ref = mean;
  }
  return iter;
}

} // namespace ensfit

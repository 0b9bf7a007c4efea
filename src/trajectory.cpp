// Copyright Global Phasing Ltd.

#include <ensfit/trajectory.hpp>
#include <cmath>  // for sqrt
#include <ensfit/dcd.hpp>

namespace ensfit {

MemorySource::MemorySource(std::vector<Frame> frames, std::string name)
  : frames_(std::move(frames)), name_(std::move(name)) {
  if (!frames_.empty())
    n_atoms_ = frames_[0].size();
  for (const Frame& f : frames_)
    if (f.size() != n_atoms_)
      fail_with<SizeMismatch>("MemorySource ", name_, ": frames differ in size");
}

void MemorySource::read_frame(size_t index, Frame& frame) {
  if (!open_)
    fail("MemorySource ", name_, ": read_frame() on closed source");
  frame = frames_.at(index);
}

void Trajectory::check_new_segment(const FrameSource& source) const {
  size_t n = n_atoms();
  if (n != 0 && source.n_atoms() != n)
    fail_with<SizeMismatch>("Trajectory ", title_, ": ", source.name(), " has ",
                            std::to_string(source.n_atoms()), " atoms, expected ",
                            std::to_string(n));
}

void Trajectory::add_file(const std::string& path) {
  add_source(std::unique_ptr<FrameSource>(new DcdFile(path)));
}

void Trajectory::add_source(std::unique_ptr<FrameSource> source) {
  if (!source)
    fail("Trajectory::add_source(): null source");
  check_new_segment(*source);
  offsets_.push_back(total_frames());
  segments_.push_back(std::move(source));
  has_default_reference_ = false;
}

size_t Trajectory::n_atoms() const {
  if (!segments_.empty())
    return segments_[0]->n_atoms();
  return ctx_.n_atoms();
}

size_t Trajectory::total_frames() const {
  if (segments_.empty())
    return 0;
  return offsets_.back() + segments_.back()->n_frames();
}

size_t Trajectory::n_frames() const {
  size_t total = total_frames();
  if (range_.first >= total)
    return 0;
  size_t end = range_.last < total ? range_.last + 1 : total;
  return (end - range_.first + range_.stride - 1) / range_.stride;
}

void Trajectory::set_range(size_t first, size_t last, size_t stride) {
  if (stride == 0)
    fail("Trajectory::set_range(): stride must be positive");
  if (last < first)
    fail("Trajectory::set_range(): last (", std::to_string(last),
         ") < first (", std::to_string(first), ")");
  range_.first = first;
  range_.last = last;
  range_.stride = stride;
  has_default_reference_ = false;
  if (state_ != StreamState::Unopened)
    reset();
}

StreamItem Trajectory::next() {
  if (state_ == StreamState::Unopened) {
    cursor_ = range_.first;
    state_ = StreamState::Positioned;
  }
  StreamItem item;
  if (state_ == StreamState::Exhausted)
    return item;
  if (cursor_ >= total_frames() || cursor_ > range_.last) {
    state_ = StreamState::Exhausted;
    has_frame_ = false;
    close();
    return item;
  }
  read_frame_at(cursor_, frame_);
  has_frame_ = true;
  frame_index_ = cursor_;
  cursor_ += range_.stride;
  item.frame = &frame_;
  item.index = frame_index_;
  return item;
}

size_t Trajectory::next_index() const {
  if (state_ == StreamState::Unopened)
    return range_.first;
  if (state_ == StreamState::Exhausted)
    return total_frames();
  return cursor_;
}

void Trajectory::skip(size_t n) {
  if (state_ == StreamState::Exhausted)
    return;
  if (state_ == StreamState::Unopened) {
    cursor_ = range_.first;
    state_ = StreamState::Positioned;
  }
  cursor_ += n * range_.stride;
}

void Trajectory::goto_frame(size_t index) {
  if (index <= range_.first)
    cursor_ = range_.first;
  else
    cursor_ = range_.first +
              (index - range_.first + range_.stride - 1) / range_.stride * range_.stride;
  state_ = StreamState::Positioned;
}

void Trajectory::reset() {
  cursor_ = range_.first;
  state_ = StreamState::Positioned;
}

void Trajectory::close() {
  if (open_segment_ < segments_.size())
    segments_[open_segment_]->close();
  open_segment_ = SIZE_MAX;
}

void Trajectory::read_frame_at(size_t index, Frame& frame) {
  // find the segment, offsets_ is sorted
  size_t seg = segments_.size();
  while (seg > 0 && offsets_[seg-1] > index)
    --seg;
  if (seg == 0 || index >= offsets_[seg-1] + segments_[seg-1]->n_frames())
    throw std::out_of_range("Trajectory " + title_ + ": no frame #" +
                            std::to_string(index));
  --seg;
  if (seg != open_segment_) {
    close();
    segments_[seg]->open();
    open_segment_ = seg;
  }
  segments_[seg]->read_frame(index - offsets_[seg], frame);
  if (frame.label.empty())
    frame.label = std::to_string(index);
}

void Trajectory::set_atoms(TopologyPtr topology) {
  ctx_.set_topology(topology, segments_.empty() ? 0 : n_atoms());
}

void Trajectory::set_reference(const Frame& frame) {
  ctx_.set_reference(frame, segments_.empty() ? 0 : n_atoms());
}

void Trajectory::set_weights(const std::vector<double>& weights) {
  ctx_.set_weights(weights, segments_.empty() ? 0 : n_atoms());
}

const Frame& Trajectory::reference() {
  if (ctx_.has_reference())
    return ctx_.reference();
  if (!has_default_reference_) {
    if (range_.first >= total_frames())
      fail("Trajectory ", title_, ": no reference and no frames");
    read_frame_at(range_.first, default_reference_);
    has_default_reference_ = true;
  }
  return default_reference_;
}

double Trajectory::rmsd() {
  if (!has_frame_)
    fail("Trajectory::rmsd(): no current frame");
  return calculate_current_rmsd(frame_, reference(), mask(), ctx_.weights_ptr());
}

SupResult Trajectory::superpose(const SupOptions& options, const Logger& logger) {
  if (!has_frame_)
    fail("Trajectory::superpose(): no current frame");
  const Frame& ref = reference();
  return superpose_in_place(frame_, ref, mask(), ctx_.weights_ptr(), options, logger);
}

std::vector<double> calculate_rmsf(Trajectory& traj, bool superpose,
                                   const Logger& logger) {
  std::vector<size_t> indices = traj.mask().indices();
  std::vector<Vec3> mean(indices.size());
  size_t n = 0;
  traj.reset();
  while (StreamItem item = traj.next()) {
    if (superpose)
      traj.superpose(SupOptions(), logger);
    const Frame& frame = *traj.current_frame();
    for (size_t k = 0; k != indices.size(); ++k)
      mean[k] += frame[indices[k]];
    ++n;
  }
  if (n == 0)
    fail("calculate_rmsf(): no frames in trajectory ", traj.title());
  for (Vec3& m : mean)
    m /= (double) n;

  std::vector<double> sum_sq(indices.size(), 0.);
  traj.reset();
  while (StreamItem item = traj.next()) {
    if (superpose)
      traj.superpose(SupOptions(), logger);
    const Frame& frame = *traj.current_frame();
    for (size_t k = 0; k != indices.size(); ++k)
      sum_sq[k] += frame[indices[k]].dist_sq(mean[k]);
  }
  traj.reset();
  for (double& x : sum_sq)
    x = std::sqrt(x / n);
  logger.debug("RMSF from ", n, " frames, ", indices.size(), " atoms");
  return sum_sq;
}

} // namespace ensfit

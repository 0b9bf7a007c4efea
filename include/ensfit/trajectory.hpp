// Copyright Global Phasing Ltd.
//
// Trajectory: frames streamed one at a time from a list of segments
// (files or in-memory sources), with the same reference and selection
// handling as Ensemble.

#ifndef ENSFIT_TRAJECTORY_HPP_
#define ENSFIT_TRAJECTORY_HPP_

#include <cstdint>
#include <memory>   // for unique_ptr
#include <string>
#include <vector>
#include "container.hpp"  // for FrameContainer, AtomContext

namespace ensfit {

/// One segment of a trajectory. Frames are addressed by local index.
/// read_frame() may be called only between open() and close().
class ENSFIT_DLL FrameSource {
public:
  virtual ~FrameSource() {}
  virtual std::string name() const = 0;
  virtual size_t n_atoms() const = 0;
  virtual size_t n_frames() const = 0;
  virtual void open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  virtual void read_frame(size_t index, Frame& frame) = 0;
};

/// Frames kept in memory; counts calls to open().
class ENSFIT_DLL MemorySource : public FrameSource {
public:
  explicit MemorySource(std::vector<Frame> frames, std::string name="memory");

  std::string name() const override { return name_; }
  size_t n_atoms() const override { return n_atoms_; }
  size_t n_frames() const override { return frames_.size(); }
  void open() override { open_ = true; ++open_count_; }
  void close() override { open_ = false; }
  bool is_open() const override { return open_; }
  void read_frame(size_t index, Frame& frame) override;

  int open_count() const { return open_count_; }

private:
  std::vector<Frame> frames_;
  std::string name_;
  size_t n_atoms_ = 0;
  bool open_ = false;
  int open_count_ = 0;
};

/// Visible frames: first, first+stride, ... up to last (inclusive).
struct StreamRange {
  size_t first = 0;
  size_t last = SIZE_MAX;
  size_t stride = 1;
};

/// Result of Trajectory::next(): a frame or the end-of-stream marker.
struct StreamItem {
  const Frame* frame = nullptr;
  size_t index = 0;  // index in the concatenated frames of all segments
  explicit operator bool() const { return frame != nullptr; }
};

enum class StreamState { Unopened, Positioned, Exhausted };

class ENSFIT_DLL Trajectory : public FrameContainer {
public:
  Trajectory() = default;
  explicit Trajectory(std::string title) : title_(std::move(title)) {}
  Trajectory(const Trajectory&) = delete;
  Trajectory& operator=(const Trajectory&) = delete;

  const std::string& title() const { return title_; }

  /// Appends a DCD file. Throws SizeMismatch if the number of atoms
  /// differs from the existing segments; the segment list is then unchanged.
  void add_file(const std::string& path);
  void add_source(std::unique_ptr<FrameSource> source);
  size_t n_segments() const { return segments_.size(); }
  const FrameSource& segment(size_t i) const { return *segments_.at(i); }

  size_t n_atoms() const override;
  /// number of frames in all segments
  size_t total_frames() const;
  /// number of frames visible in the current range
  size_t n_frames() const;

  void set_range(size_t first, size_t last=SIZE_MAX, size_t stride=1);
  const StreamRange& range() const { return range_; }

  StreamState state() const { return state_; }
  /// Reads the next visible frame. At the end returns a false StreamItem
  /// and moves into the Exhausted state.
  StreamItem next();
  /// Index of the frame that next() would return; read-only.
  size_t next_index() const;
  /// Skips n visible frames.
  void skip(size_t n);
  /// Positions the cursor at the first visible frame with index >= index.
  void goto_frame(size_t index);
  /// Returns to the first visible frame.
  void reset();
  /// Closes the open segment (it is reopened when needed).
  void close();

  void set_atoms(TopologyPtr topology) override;
  void select(const std::string& selstr) override { ctx_.select(selstr); }
  void select_all() { ctx_.select_all(); }
  void set_reference(const Frame& frame) override;
  void set_weights(const std::vector<double>& weights);
  /// Explicit reference or, if not set, the first visible frame.
  const Frame& reference();
  const SelectionMask& mask() { return ctx_.mask(n_atoms()); }
  const AtomContext& context() const { return ctx_; }

  const Frame* current_frame() const override {
    return has_frame_ ? &frame_ : nullptr;
  }
  /// index of the current frame (valid if current_frame() is not null)
  size_t current_index() const { return frame_index_; }
  /// RMSD of the current frame from the reference, without fitting.
  double rmsd() override;
  /// Superposes the current frame onto the reference, in place.
  SupResult superpose(const SupOptions& options=SupOptions(),
                      const Logger& logger=Logger());

private:
  std::string title_;
  std::vector<std::unique_ptr<FrameSource>> segments_;
  std::vector<size_t> offsets_;  // index of the first frame of each segment
  AtomContext ctx_;
  StreamRange range_;
  StreamState state_ = StreamState::Unopened;
  size_t cursor_ = 0;
  Frame frame_;
  bool has_frame_ = false;
  size_t frame_index_ = 0;
  size_t open_segment_ = SIZE_MAX;
  Frame default_reference_;
  bool has_default_reference_ = false;

  void read_frame_at(size_t index, Frame& frame);
  void check_new_segment(const FrameSource& source) const;
};

/// RMS fluctuation of each selected atom in two passes over the trajectory:
/// the mean positions, then the mean squared deviations from them.
/// If superpose is set, each frame is superposed in both passes.
/// The trajectory is reset before and after.
ENSFIT_DLL std::vector<double> calculate_rmsf(Trajectory& traj, bool superpose,
                                              const Logger& logger=Logger());

} // namespace ensfit
#endif

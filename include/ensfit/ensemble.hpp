// Copyright Global Phasing Ltd.
//
// Ensemble: in-memory frames of one topology with a common reference
// and selection. Bulk superposition and per-frame / per-atom statistics.

#ifndef ENSFIT_ENSEMBLE_HPP_
#define ENSFIT_ENSEMBLE_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include "container.hpp"  // for FrameContainer, AtomContext

namespace ensfit {

class ENSFIT_DLL Ensemble : public FrameContainer {
public:
  Ensemble() = default;
  explicit Ensemble(std::string title) : title_(std::move(title)) {}

  const std::string& title() const { return title_; }
  size_t size() const { return frames_.size(); }
  bool empty() const { return frames_.empty(); }

  size_t n_atoms() const override {
    return frames_.empty() ? ctx_.n_atoms() : frames_[0].size();
  }
  /// Throws SizeMismatch if the topology does not fit the stored frames.
  void set_atoms(TopologyPtr topology) override;
  void select(const std::string& selstr) override;
  void select_all();
  void set_reference(const Frame& frame) override;
  /// Uses a copy of the stored frame as the reference.
  void set_reference(size_t index);
  /// Per-atom weights, used in superposition, RMSD and radius of gyration.
  void set_weights(const std::vector<double>& weights);

  /// Explicit reference or, if not set, the first frame.
  const Frame& reference() const;
  /// Active selection as mask (all atoms if nothing is selected).
  const SelectionMask& mask() { return ctx_.mask(n_atoms()); }
  const AtomContext& context() const { return ctx_; }

  void add_frame(Frame frame);
  void add_frames(const std::vector<Frame>& frames);
  void delete_frame(size_t index);
  const std::vector<Frame>& frames() const { return frames_; }
  Frame& operator[](size_t i) { return frames_[i]; }
  const Frame& operator[](size_t i) const { return frames_[i]; }
  const Frame& at(size_t i) const { return frames_.at(i); }

  void set_active(size_t index);
  size_t active() const { return active_; }
  const Frame* current_frame() const override {
    return frames_.empty() ? nullptr : &frames_[active_];
  }
  /// RMSD of the active frame from the reference, without fitting.
  double rmsd() override;

  /// Superposes all frames onto the reference, in order, in place.
  void superpose(const SupOptions& options=SupOptions(), const Logger& logger=Logger());
  /// Results of the last superpose(); one per frame.
  const std::vector<SupResult>& superpositions() const { return superpositions_; }
  /// false if selection, reference, weights or frames changed since superpose()
  bool superposition_is_valid() const;

  /// Per-frame RMSD: from the last superpose() if still valid, otherwise
  /// calculated from the current coordinates without fitting.
  std::vector<double> rmsds();
  /// Per selected atom: RMS fluctuation about the mean position.
  std::vector<double> rmsfs();
  /// Mean position of each atom across frames.
  Frame mean_coordinates() const;
  /// Per frame, per selected atom: displacement from the reference.
  std::vector<std::vector<Vec3>> deviations();
  std::vector<double> radii_of_gyration();

  /// Iterative superposition onto the mean structure, until the mean moves
  /// by less than rmsd_tol (RMSD over selected atoms) or max_iter is reached.
  /// The final mean becomes the reference. Returns the number of iterations.
  int iterpose(double rmsd_tol=1e-4, int max_iter=10,
               const Logger& logger=Logger());

private:
  std::string title_;
  std::vector<Frame> frames_;
  AtomContext ctx_;
  size_t active_ = 0;
  std::uint64_t frames_version_ = 0;
  std::vector<SupResult> superpositions_;
  std::uint64_t sup_context_version_ = 0;
  std::uint64_t sup_frames_version_ = 0;

  void check_frame_size(size_t n) const;
  void require_frames(const char* func) const;
};

} // namespace ensfit
#endif

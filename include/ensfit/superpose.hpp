// Copyright Global Phasing Ltd.
//
// Least-squares rigid-body superposition of two sets of points
// (Kabsch algorithm with explicit reflection correction)
// and simple statistics on frames: RMSD, radius of gyration, deviations.

#ifndef ENSFIT_SUPERPOSE_HPP_
#define ENSFIT_SUPERPOSE_HPP_

#include <cmath>     // for NAN
#include <vector>
#include "fail.hpp"    // for ENSFIT_DLL, DimensionMismatch
#include "frame.hpp"   // for Frame, SelectionMask
#include "logger.hpp"  // for Logger
#include "math.hpp"    // for Vec3, Mat33, Transform

namespace ensfit {

struct SupOptions {
  /// also fit a uniform scale factor (the ratio of RMS extents)
  bool scale = false;
};

struct SupResult {
  double rmsd = NAN;
  size_t count = 0;
  Vec3 center1;  // centroid of the reference points
  Vec3 center2;  // centroid of the mobile points
  /// proper rotation and translation; the scale is stored separately
  Transform transform;
  double scale = 1.0;
  /// dimension spanned by the atoms (the smaller of the two sets):
  /// 3 in general, 2 for planar points
  int rank = 0;

  Vec3 apply(const Vec3& p) const {
    return transform.mat.multiply(p) * scale + transform.vec;
  }

  /// homogeneous 4x4 matrix (scaled rotation in the upper-left corner)
  std::vector<std::vector<double>> as_4x4() const {
    std::vector<std::vector<double>> m(4, std::vector<double>(4, 0.));
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j)
        m[i][j] = scale * transform.mat[i][j];
      m[i][3] = transform.vec.at(i);
    }
    m[3][3] = 1.;
    return m;
  }
};

//! @brief Superpose mobile points onto reference points.
//! @param ref reference (fixed) positions
//! @param mob mobile positions, paired with ref by index
//! @param len number of points
//! @param weights per-point weights or nullptr
//! @return transformation that moves mob onto ref, and the resulting RMSD
//!
//! Throws InsufficientAtoms if len < 3 or the points are collinear.
//! Planar points give a valid rotation, rank 2 and a warning.
ENSFIT_DLL SupResult superpose_positions(const Vec3* ref, const Vec3* mob, size_t len,
                                         const double* weights,
                                         const SupOptions& options=SupOptions(),
                                         const Logger& logger=Logger());

/// Frame-level superposition. The masked atoms determine the transformation.
/// weights, if given, have one value per atom of the frame.
/// Throws DimensionMismatch if frames, mask and weights differ in size.
ENSFIT_DLL SupResult superpose(const Frame& mobile, const Frame& reference,
                               const SelectionMask& mask,
                               const std::vector<double>* weights=nullptr,
                               const SupOptions& options=SupOptions(),
                               const Logger& logger=Logger());

/// Applies the transformation to all atoms of the frame.
ENSFIT_DLL void apply_transform(Frame& frame, const SupResult& sr);

/// Superposes and rewrites all coordinates of mobile.
inline SupResult superpose_in_place(Frame& mobile, const Frame& reference,
                                    const SelectionMask& mask,
                                    const std::vector<double>* weights=nullptr,
                                    const SupOptions& options=SupOptions(),
                                    const Logger& logger=Logger()) {
  SupResult sr = superpose(mobile, reference, mask, weights, options, logger);
  apply_transform(mobile, sr);
  return sr;
}

/// RMSD over masked atoms in the current positions, without superposition.
ENSFIT_DLL double calculate_current_rmsd(const Frame& a, const Frame& b,
                                         const SelectionMask& mask,
                                         const std::vector<double>* weights=nullptr);

ENSFIT_DLL double calculate_radius_of_gyration(const Frame& frame,
                                               const SelectionMask& mask,
                                               const std::vector<double>* weights=nullptr);

/// Displacement vectors to - from, for all atoms.
ENSFIT_DLL std::vector<Vec3> calculate_deformation(const Frame& from, const Frame& to);

/// Per-atom distances between two frames.
ENSFIT_DLL std::vector<double> calculate_distances(const Frame& a, const Frame& b);

inline void check_same_size(size_t n1, size_t n2, const char* what) {
  if (n1 != n2)
    fail_with<DimensionMismatch>(std::string(what), ": ", std::to_string(n1),
                                 " vs ", std::to_string(n2), " atoms");
}

} // namespace ensfit
#endif

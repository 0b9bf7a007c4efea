// Copyright Global Phasing Ltd.

#include <ensfit/superpose.hpp>
#include <ensfit/svd3.hpp>
#include <algorithm>  // for min
#include <cmath>

namespace ensfit {

namespace {

// Number of principal axes along which centered points have a spread
// above round-off. cov = sum w p p^T; its eigenvalues are accurate to
// about 1e-16 * largest, so 1e-10 separates flat directions reliably.
int spread_rank(const Mat33& cov) {
  double eig[3];
  eigen_decomposition(cov, eig);
  int rank = 0;
  for (int i = 0; i < 3; ++i)
    if (eig[i] > 0 && eig[i] > 1e-10 * eig[0])
      ++rank;
  return rank;
}

} // anonymous namespace

SupResult superpose_positions(const Vec3* ref, const Vec3* mob, size_t len,
                              const double* weights, const SupOptions& options,
                              const Logger& logger) {
  if (len < 3)
    fail_with<InsufficientAtoms>("superposition needs at least 3 atoms, got ",
                                 std::to_string(len));
  SupResult r;
  r.count = len;
  double wsum = 0.;
  for (size_t i = 0; i != len; ++i) {
    double w = weights ? weights[i] : 1.0;
    wsum += w;
    r.center1 += ref[i] * w;
    r.center2 += mob[i] * w;
  }
  if (!(wsum > 0))
    throw InsufficientAtoms("superposition: total weight of atoms is zero");
  r.center1 /= wsum;
  r.center2 /= wsum;

  // H = sum w (m - m0)(r - r0)^T
  Mat33 h(0, 0, 0, 0, 0, 0, 0, 0, 0);
  Mat33 cov1(0, 0, 0, 0, 0, 0, 0, 0, 0);
  Mat33 cov2(0, 0, 0, 0, 0, 0, 0, 0, 0);
  double extent1 = 0.;
  double extent2 = 0.;
  bool identical = true;
  for (size_t i = 0; i != len; ++i) {
    double w = weights ? weights[i] : 1.0;
    Vec3 m = mob[i] - r.center2;
    Vec3 f = ref[i] - r.center1;
    for (int j = 0; j < 3; ++j)
      for (int k = 0; k < 3; ++k) {
        h[j][k] += w * m.at(j) * f.at(k);
        cov1[j][k] += w * f.at(j) * f.at(k);
        cov2[j][k] += w * m.at(j) * m.at(k);
      }
    extent1 += w * f.length_sq();
    extent2 += w * m.length_sq();
    if (mob[i] != ref[i])
      identical = false;
  }

  r.rank = std::min(spread_rank(cov1), spread_rank(cov2));
  if (r.rank < 2)
    fail_with<InsufficientAtoms>("superposition: the ", std::to_string(len),
                                 " selected atoms are collinear or coincident");
  if (r.rank < 3)
    logger.warn("superposition: the ", std::to_string(len),
                " selected atoms are coplanar");

  if (identical) {
    r.rmsd = 0.;
    return r;
  }

  Svd3 svd = svd3(h);
  // R = V diag(1, 1, d) U^T, d = sign(det(V U^T))
  Mat33 ut = svd.u.transpose();
  double d = svd.v.multiply(ut).determinant() < 0 ? -1. : 1.;
  Mat33 dmat;
  dmat[2][2] = d;
  r.transform.mat = svd.v.multiply(dmat).multiply(ut);
  if (options.scale && extent2 > 0)
    r.scale = std::sqrt(extent1 / extent2);
  r.transform.vec = r.center1 - r.transform.mat.multiply(r.center2) * r.scale;

  double sd = 0.;
  for (size_t i = 0; i != len; ++i)
    sd += (weights ? weights[i] : 1.0) * r.apply(mob[i]).dist_sq(ref[i]);
  r.rmsd = std::sqrt(sd / wsum);
  return r;
}

SupResult superpose(const Frame& mobile, const Frame& reference,
                    const SelectionMask& mask, const std::vector<double>* weights,
                    const SupOptions& options, const Logger& logger) {
  check_same_size(mobile.size(), reference.size(), "superpose(): mobile and reference");
  check_same_size(mask.size(), reference.size(), "superpose(): mask and frames");
  if (weights)
    check_same_size(weights->size(), reference.size(), "superpose(): weights and frames");
  std::vector<Vec3> pos1, pos2;
  std::vector<double> w;
  for (size_t i = 0; i != mask.size(); ++i)
    if (mask[i]) {
      pos1.push_back(reference[i]);
      pos2.push_back(mobile[i]);
      if (weights)
        w.push_back((*weights)[i]);
    }
  return superpose_positions(pos1.data(), pos2.data(), pos1.size(),
                             weights ? w.data() : nullptr, options, logger);
}

void apply_transform(Frame& frame, const SupResult& sr) {
  for (Vec3& p : frame.pos)
    p = sr.apply(p);
}

double calculate_current_rmsd(const Frame& a, const Frame& b, const SelectionMask& mask,
                              const std::vector<double>* weights) {
  check_same_size(a.size(), b.size(), "calculate_current_rmsd(): frames");
  check_same_size(mask.size(), a.size(), "calculate_current_rmsd(): mask and frames");
  if (weights)
    check_same_size(weights->size(), a.size(), "calculate_current_rmsd(): weights");
  double sd = 0.;
  double wsum = 0.;
  for (size_t i = 0; i != a.size(); ++i)
    if (mask[i]) {
      double w = weights ? (*weights)[i] : 1.0;
      sd += w * a[i].dist_sq(b[i]);
      wsum += w;
    }
  if (wsum == 0.)
    return NAN;
  return std::sqrt(sd / wsum);
}

double calculate_radius_of_gyration(const Frame& frame, const SelectionMask& mask,
                                    const std::vector<double>* weights) {
  check_same_size(mask.size(), frame.size(), "calculate_radius_of_gyration(): mask");
  if (weights)
    check_same_size(weights->size(), frame.size(), "calculate_radius_of_gyration(): weights");
  Vec3 center;
  double wsum = 0.;
  for (size_t i = 0; i != frame.size(); ++i)
    if (mask[i]) {
      double w = weights ? (*weights)[i] : 1.0;
      center += frame[i] * w;
      wsum += w;
    }
  if (wsum == 0.)
    return NAN;
  center /= wsum;
  double sd = 0.;
  for (size_t i = 0; i != frame.size(); ++i)
    if (mask[i])
      sd += (weights ? (*weights)[i] : 1.0) * frame[i].dist_sq(center);
  return std::sqrt(sd / wsum);
}

std::vector<Vec3> calculate_deformation(const Frame& from, const Frame& to) {
  check_same_size(from.size(), to.size(), "calculate_deformation()");
  std::vector<Vec3> result(from.size());
  for (size_t i = 0; i != from.size(); ++i)
    result[i] = to[i] - from[i];
  return result;
}

std::vector<double> calculate_distances(const Frame& a, const Frame& b) {
  check_same_size(a.size(), b.size(), "calculate_distances()");
  std::vector<double> result(a.size());
  for (size_t i = 0; i != a.size(); ++i)
    result[i] = a[i].dist(b[i]);
  return result;
}

} // namespace ensfit

// Copyright Global Phasing Ltd.

#include <ensfit/svd3.hpp>
#include <algorithm>  // for swap
#include <cmath>

namespace ensfit {

Mat33 eigen_decomposition(const Mat33& A, double (&d)[3]) {
  Mat33 a = A;
  Mat33 v;  // identity
  for (int sweep = 0; sweep < 50; ++sweep) {
    double off = sq(a[0][1]) + sq(a[0][2]) + sq(a[1][2]);
    if (off == 0)
      break;
    for (int p = 0; p < 2; ++p)
      for (int q = p + 1; q < 3; ++q) {
        if (a[p][q] == 0)
          continue;
        double theta = (a[q][q] - a[p][p]) / (2 * a[p][q]);
        double t = (theta >= 0 ? 1. : -1.) /
                   (std::fabs(theta) + std::sqrt(theta * theta + 1));
        double c = 1 / std::sqrt(t * t + 1);
        double s = t * c;
        // a = J^T a J, where J is the Givens rotation in the (p, q) plane
        for (int k = 0; k < 3; ++k) {
          double akp = a[k][p];
          double akq = a[k][q];
          a[k][p] = c * akp - s * akq;
          a[k][q] = s * akp + c * akq;
        }
        for (int k = 0; k < 3; ++k) {
          double apk = a[p][k];
          double aqk = a[q][k];
          a[p][k] = c * apk - s * aqk;
          a[q][k] = s * apk + c * aqk;
        }
        for (int k = 0; k < 3; ++k) {
          double vkp = v[k][p];
          double vkq = v[k][q];
          v[k][p] = c * vkp - s * vkq;
          v[k][q] = s * vkp + c * vkq;
        }
      }
  }
  for (int i = 0; i < 3; ++i)
    d[i] = a[i][i];
  // selection sort, descending, swapping columns of v
  for (int i = 0; i < 2; ++i) {
    int k = i;
    for (int j = i + 1; j < 3; ++j)
      if (d[j] > d[k])
        k = j;
    if (k != i) {
      std::swap(d[i], d[k]);
      for (int r = 0; r < 3; ++r)
        std::swap(v[r][i], v[r][k]);
    }
  }
  return v;
}

namespace {

// any unit vector perpendicular to n (n is a unit vector)
Vec3 perpendicular_to(const Vec3& n) {
  Vec3 trial = std::fabs(n.x) < 0.9 ? Vec3(1, 0, 0) : Vec3(0, 1, 0);
  return (trial - n * n.dot(trial)).normalized();
}

} // anonymous namespace

Svd3 svd3(const Mat33& A, double rel_tol) {
  Svd3 r;
  double eig[3];
  // eigenvectors of A^T A are the right singular vectors
  r.v = eigen_decomposition(A.transpose().multiply(A), eig);
  for (int i = 0; i < 3; ++i)
    r.s[i] = std::sqrt(std::max(eig[i], 0.));
  r.rank = 0;
  // decided on eigenvalues: a zero singular value comes out of sqrt()
  // as about 1e-8 * s[0], while a zero eigenvalue is about 1e-16 * eig[0]
  for (int i = 0; i < 3; ++i)
    if (eig[i] > rel_tol * eig[0] && eig[i] > 0)
      ++r.rank;

  Vec3 u[3];
  for (int i = 0; i < r.rank; ++i)
    u[i] = A.multiply(r.v.column_copy(i)) / r.s[i];
  switch (r.rank) {
    case 0:
      u[0] = Vec3(1, 0, 0);
      u[1] = Vec3(0, 1, 0);
      break;
    case 1:
      u[0] = u[0].normalized();
      u[1] = perpendicular_to(u[0]);
      break;
    default:
      // re-orthogonalize, the products above are only approximately orthogonal
      u[0] = u[0].normalized();
      u[1] = (u[1] - u[0] * u[0].dot(u[1])).normalized();
      break;
  }
  Vec3 u2 = u[0].cross(u[1]);
  if (r.rank == 3 && u2.dot(u[2]) < 0) {
    // A has negative determinant; keep det(u) = +1 by flipping v instead
    for (int k = 0; k < 3; ++k)
      r.v[k][2] = -r.v[k][2];
  }
  r.u = Mat33::from_columns(u[0], u[1], u2);
  return r;
}

} // namespace ensfit

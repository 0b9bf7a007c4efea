// Copyright Global Phasing Ltd.
//
// Eigen decomposition of symmetric 3x3 matrices and singular value
// decomposition of general 3x3 matrices.

#ifndef ENSFIT_SVD3_HPP_
#define ENSFIT_SVD3_HPP_

#include "math.hpp"  // for Mat33
#include "fail.hpp"  // for ENSFIT_DLL

namespace ensfit {

/// Jacobi eigenvalue algorithm for a symmetric matrix A.
/// Returns eigenvectors as columns; eigenvalues are stored in d
/// in descending order (column i corresponds to d[i]).
ENSFIT_DLL Mat33 eigen_decomposition(const Mat33& A, double (&d)[3]);

struct Svd3 {
  Mat33 u;      // left singular vectors (columns), always det(u) = +1
  double s[3];  // singular values, descending
  Mat33 v;      // right singular vectors (columns)
  int rank;     // number of s[i] with s[i]^2 > rel_tol * s[0]^2
};

/// A = u * diag(s) * v^T.
/// For rank-deficient A the missing columns of u are completed to an
/// orthonormal right-handed basis, so the result is always usable.
ENSFIT_DLL Svd3 svd3(const Mat33& A, double rel_tol=1e-10);

} // namespace ensfit
#endif

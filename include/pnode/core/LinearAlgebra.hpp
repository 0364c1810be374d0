#pragma once

#include "pnode/core/Types.hpp"

namespace pnode {

// Tolerance policy shared by conditioning, smoothing and linearisation.
struct NumericalTolerance_t {
  // Added to observation noise and to near-singular matrices before a solve.
  double jitter = 1e-12;
  // Smallest admissible diagonal entry of a triangular factor.
  double singularThreshold = 1e-15;
};

// Returns (A + A^T) / 2.
Matrix symmetrize(const Matrix& matrix);

// Lower-triangular L with L L^T = M M^T, computed by QR of M^T.
// The diagonal of the result is non-negative.
Matrix triangularize(const Matrix& stacked);

// Lower-triangular factor of a symmetric positive semi-definite matrix.
// Falls back to a pivoted LDL^T with clamped pivots when plain Cholesky
// fails, so semi-definite inputs (such as process noise of a
// position-only component) still produce a factor.
Matrix choleskyFactor(const Matrix& covariance);

// Smallest absolute diagonal entry of a square matrix (0 for empty).
double minAbsDiagonal(const Matrix& triangular);

// Solves (L L^T) X = B for lower-triangular L. Throws
// SingularCovarianceError if L has a diagonal entry below the threshold.
Matrix solveWithFactor(const Matrix& lower, const Matrix& rhs, const NumericalTolerance_t& tolerance);

} // namespace pnode

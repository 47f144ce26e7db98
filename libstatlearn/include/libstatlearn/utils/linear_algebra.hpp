#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace libstatlearn {
namespace utils {

/**
 * Small dense linear algebra helpers on top of Eigen
 *
 * Feature dimensions in this library are small (<= ~80 after polynomial
 * expansion), so dense decompositions are used throughout.
 */

inline Eigen::VectorXd ToEigen(const std::vector<double> &values) {
	Eigen::VectorXd out(static_cast<Eigen::Index>(values.size()));
	for (size_t i = 0; i < values.size(); i++) {
		out(static_cast<Eigen::Index>(i)) = values[i];
	}
	return out;
}

inline std::vector<double> ToStd(const Eigen::VectorXd &values) {
	std::vector<double> out(static_cast<size_t>(values.size()));
	for (Eigen::Index i = 0; i < values.size(); i++) {
		out[static_cast<size_t>(i)] = values(i);
	}
	return out;
}

/**
 * Invert a square matrix with partial-pivot LU
 *
 * If any pivot has absolute value below `pivot_tolerance` the matrix is
 * treated as singular and the identity is returned instead, which turns a
 * Mahalanobis distance into an unscaled Euclidean one rather than failing.
 *
 * @param matrix Square matrix
 * @param pivot_tolerance Absolute pivot threshold
 * @param singular Optional out-flag, set when the identity was substituted
 * @return Inverse or identity
 */
inline Eigen::MatrixXd InvertOrIdentity(const Eigen::MatrixXd &matrix, double pivot_tolerance = 1e-10,
                                        bool *singular = nullptr) {
	if (matrix.rows() != matrix.cols()) {
		throw std::invalid_argument("InvertOrIdentity requires a square matrix");
	}
	const Eigen::Index n = matrix.rows();
	if (singular) {
		*singular = false;
	}
	if (n == 0) {
		return Eigen::MatrixXd(0, 0);
	}

	Eigen::PartialPivLU<Eigen::MatrixXd> lu(matrix);

	// The diagonal of U holds the pivots chosen during elimination
	const Eigen::VectorXd pivots = lu.matrixLU().diagonal();
	for (Eigen::Index i = 0; i < n; i++) {
		if (!std::isfinite(pivots(i)) || std::abs(pivots(i)) < pivot_tolerance) {
			if (singular) {
				*singular = true;
			}
			return Eigen::MatrixXd::Identity(n, n);
		}
	}

	return lu.inverse();
}

/**
 * Solve the (possibly regularized, possibly weighted) normal equations A x = b
 *
 * Uses full-pivot LU when A is numerically invertible. When the largest
 * to smallest pivot ratio falls below `relative_tolerance` (constant or
 * collinear feature columns, fewer samples than parameters) the minimum
 * norm solution from a complete orthogonal decomposition is returned so the
 * coefficients stay finite.
 *
 * @param A Square system matrix (X'WX [+ lambda*I])
 * @param b Right-hand side (X'Wy)
 * @param relative_tolerance Pivot threshold relative to the largest pivot
 * @param used_minimum_norm Optional out-flag, set when the fallback was taken
 * @return Solution vector
 */
inline Eigen::VectorXd SolveNormalEquations(const Eigen::MatrixXd &A, const Eigen::VectorXd &b,
                                            double relative_tolerance = 1e-10, bool *used_minimum_norm = nullptr) {
	if (A.rows() != A.cols() || A.rows() != b.size()) {
		throw std::invalid_argument("SolveNormalEquations: dimension mismatch");
	}
	if (used_minimum_norm) {
		*used_minimum_norm = false;
	}

	Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
	lu.setThreshold(relative_tolerance);
	if (lu.isInvertible()) {
		return lu.solve(b);
	}

	if (used_minimum_norm) {
		*used_minimum_norm = true;
	}
	Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(A);
	cod.setThreshold(relative_tolerance);
	return cod.solve(b);
}

} // namespace utils
} // namespace libstatlearn

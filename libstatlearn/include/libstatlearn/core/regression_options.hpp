#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <stdexcept>

namespace libstatlearn {
namespace core {

/// Fitting strategy used by RegressionFitter
enum class RegressionVariant { LINEAR, RIDGE, TIME_WEIGHTED, POLYNOMIAL };

inline std::string RegressionVariantName(RegressionVariant variant) {
	switch (variant) {
	case RegressionVariant::LINEAR:
		return "linear";
	case RegressionVariant::RIDGE:
		return "ridge";
	case RegressionVariant::TIME_WEIGHTED:
		return "time_weighted";
	case RegressionVariant::POLYNOMIAL:
		return "polynomial";
	}
	return "linear";
}

/**
 * Configuration options for the regression fitter
 *
 * All options have defaults matching the learning loop and can be
 * overridden per fit.
 *
 * Design notes:
 * - All defaults specified in-class for clarity
 * - Named constructors for each variant
 * - Validate() rejects values the solvers cannot honour
 */
struct RegressionOptions {
	// ========================================================================
	// Common options
	// ========================================================================

	/// Fitting strategy
	/// Default: LINEAR (ordinary least squares)
	RegressionVariant variant = RegressionVariant::LINEAR;

	// ========================================================================
	// Regularization
	// ========================================================================

	/// L2 penalty strength added to every non-intercept diagonal entry of X'X
	/// - lambda = 0: No regularization (OLS)
	/// Default: 0.1 (applies to RIDGE only)
	double lambda = 0.1;

	/// Fixed penalty used after polynomial expansion
	/// Default: 0.01
	double polynomial_lambda = 0.01;

	// ========================================================================
	// Time weighting
	// ========================================================================

	/// Half-life in days of the exponential recency weight
	/// w = exp(-ln2 * days_ago / half_life)
	/// Default: 30
	double half_life_days = 30.0;

	/// Instant "days ago" is measured from
	/// Unset: latest timestamp among the fitted points
	std::optional<TimePoint> reference_time;

	// ========================================================================
	// Polynomial expansion
	// ========================================================================

	/// Degree >= 2 adds squares and pairwise interactions, >= 3 adds cubes
	/// Default: 2
	int degree = 2;

	// ========================================================================
	// Numerical parameters
	// ========================================================================

	/// Relative pivot threshold below which the normal equations are treated
	/// as singular and solved by complete orthogonal decomposition instead
	/// Default: 1e-10
	double singular_tolerance = 1e-10;

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionOptions() = default;

	static RegressionOptions OLS() {
		RegressionOptions opts;
		opts.variant = RegressionVariant::LINEAR;
		opts.lambda = 0.0;
		return opts;
	}

	static RegressionOptions Ridge(double lambda_ = 0.1) {
		RegressionOptions opts;
		opts.variant = RegressionVariant::RIDGE;
		opts.lambda = lambda_;
		return opts;
	}

	static RegressionOptions TimeWeighted(double half_life_days_ = 30.0,
	                                      std::optional<TimePoint> reference_time_ = std::nullopt) {
		RegressionOptions opts;
		opts.variant = RegressionVariant::TIME_WEIGHTED;
		opts.lambda = 0.0;
		opts.half_life_days = half_life_days_;
		opts.reference_time = reference_time_;
		return opts;
	}

	static RegressionOptions Polynomial(int degree_ = 2) {
		RegressionOptions opts;
		opts.variant = RegressionVariant::POLYNOMIAL;
		opts.degree = degree_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (lambda < 0.0) {
			throw std::invalid_argument("lambda must be non-negative (got " + std::to_string(lambda) + ")");
		}

		if (polynomial_lambda < 0.0) {
			throw std::invalid_argument("polynomial_lambda must be non-negative (got " +
			                            std::to_string(polynomial_lambda) + ")");
		}

		if (half_life_days <= 0.0) {
			throw std::invalid_argument("half_life_days must be positive (got " + std::to_string(half_life_days) +
			                            ")");
		}

		if (variant == RegressionVariant::POLYNOMIAL && (degree < 2 || degree > 3)) {
			throw std::invalid_argument("polynomial degree must be 2 or 3 (got " + std::to_string(degree) + ")");
		}

		if (singular_tolerance <= 0.0) {
			throw std::invalid_argument("singular_tolerance must be positive");
		}
	}
};

} // namespace core
} // namespace libstatlearn

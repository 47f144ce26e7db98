#pragma once

#include "libstatlearn/core/regression_options.hpp"
#include "libstatlearn/core/training_observation.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace libstatlearn {
namespace core {

/**
 * Result of a regression fit
 *
 * Immutable once returned: refitting always produces a new model.
 *
 * Design notes:
 * - Eigen types for coefficient and residual vectors
 * - Intercept kept apart from the feature coefficients
 * - Fit metrics are computed against the unweighted targets, also for
 *   time-weighted fits
 */
struct RegressionModel {
	// ========================================================================
	// Core outputs
	// ========================================================================

	/// Feature coefficients in feature order (length = n_features after any
	/// polynomial expansion). Does NOT include the intercept.
	Eigen::VectorXd coefficients;

	/// Intercept term
	double intercept = 0.0;

	/// Residuals y - y_hat in input order
	Eigen::VectorXd residuals;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SS_res/SS_tot
	double r2_score = std::numeric_limits<double>::quiet_NaN();

	/// Mean squared error: SS_res / n
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Mean absolute error: sum|e| / n
	double mae = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Metadata
	// ========================================================================

	size_t sample_count = 0;

	/// Width of the raw feature vectors the model was fitted on (before any
	/// polynomial expansion)
	size_t input_feature_count = 0;

	RegressionVariant model_type = RegressionVariant::LINEAR;

	/// Polynomial degree (0 for non-polynomial models)
	int polynomial_degree = 0;

	/// Set when the normal equations were singular and the minimum-norm
	/// solution was used
	bool used_minimum_norm = false;

	/// Generated names x0..x{p-1} unless supplied by the caller
	std::vector<std::string> feature_names;

	/// Reference time of the fit, not the wall clock
	TimePoint created_at;

	/// Check if the model holds finite coefficients
	bool is_valid() const {
		if (sample_count == 0 || !std::isfinite(intercept)) {
			return false;
		}
		for (Eigen::Index i = 0; i < coefficients.size(); i++) {
			if (!std::isfinite(coefficients(i))) {
				return false;
			}
		}
		return true;
	}
};

} // namespace core
} // namespace libstatlearn

#pragma once

#include "libstatlearn/core/data_point.hpp"
#include "libstatlearn/core/regression_model.hpp"
#include "libstatlearn/core/regression_options.hpp"
#include "libstatlearn/utils/linear_algebra.hpp"
#include <Eigen/Dense>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace solvers {

/**
 * Regression Fitter: least squares through the normal equations
 *
 * All variants prepend an intercept column of ones to the features and
 * solve
 *
 *   (X'WX + lambda*D) beta = X'Wy
 *
 * where W is diagonal (identity unless time-weighted) and D is the identity
 * with D(0,0) = 0 so the intercept is never penalized.
 *
 * Variants:
 * - LINEAR:        W = I, lambda = 0
 * - RIDGE:         W = I, lambda = options.lambda
 * - TIME_WEIGHTED: w_i = exp(-ln2 * days_ago_i / half_life) for points with
 *                  a timestamp, 1 otherwise
 * - POLYNOMIAL:    features expanded (squares, pairwise interactions, cubes
 *                  for degree 3) then RIDGE with options.polynomial_lambda
 *
 * Design notes:
 * - Header-only
 * - Numerically singular systems fall back to the minimum-norm solution
 * - Metrics (R², MSE, MAE) always use unweighted targets
 * - Stateless design (all methods are static)
 */
class RegressionFitter {
public:
	/**
	 * Fit the variant selected in options
	 *
	 * @param points Training points, all with the same feature width
	 * @param options Variant and its parameters
	 * @param feature_names Optional names of the raw features (x0.. when empty)
	 * @return Freshly fitted model
	 * @throws std::invalid_argument on empty input, ragged features or
	 *         invalid options
	 */
	static core::RegressionModel Fit(const std::vector<core::DataPoint> &points,
	                                 const core::RegressionOptions &options = core::RegressionOptions(),
	                                 const std::vector<std::string> &feature_names = {});

	static core::RegressionModel FitLinear(const std::vector<core::DataPoint> &points);

	static core::RegressionModel FitRidge(const std::vector<core::DataPoint> &points, double lambda = 0.1);

	static core::RegressionModel FitTimeWeighted(const std::vector<core::DataPoint> &points,
	                                             double half_life_days = 30.0,
	                                             std::optional<core::TimePoint> reference_time = std::nullopt);

	static core::RegressionModel FitPolynomial(const std::vector<core::DataPoint> &points, int degree = 2);

	/**
	 * Point prediction: intercept + sum_i coefficients_i * features_i
	 *
	 * @throws std::invalid_argument if the feature width does not match
	 */
	static double Predict(const core::RegressionModel &model, const std::vector<double> &features);

	/// Expand raw features with the model's polynomial degree, then predict
	static double PredictPolynomial(const core::RegressionModel &model, const std::vector<double> &features);

	/**
	 * Polynomial basis: original features, then squares, then pairwise
	 * products (i < j), then cubes when degree >= 3
	 */
	static std::vector<double> CreatePolynomialFeatures(const std::vector<double> &features, int degree);

	/// Names matching CreatePolynomialFeatures, e.g. "x0^2", "x0*x1"
	static std::vector<std::string> CreatePolynomialNames(const std::vector<std::string> &names, int degree);

	/// Recency weight exp(-ln2 * days_ago / half_life)
	static double HalfLifeWeight(double days_ago, double half_life_days);

private:
	static void ValidatePoints(const std::vector<core::DataPoint> &points);

	static core::RegressionModel Solve(const std::vector<core::DataPoint> &points, const Eigen::VectorXd &weights,
	                                   double lambda, double singular_tolerance);

	static void ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred,
	                              core::RegressionModel &model);

	static std::vector<std::string> DefaultNames(size_t count);

	/// options.reference_time, else the latest point timestamp, else the epoch
	static core::TimePoint ReferenceTime(const std::vector<core::DataPoint> &points,
	                                     const core::RegressionOptions &options);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void RegressionFitter::ValidatePoints(const std::vector<core::DataPoint> &points) {
	if (points.empty()) {
		throw std::invalid_argument("regression requires at least one data point");
	}
	const size_t width = points[0].features.size();
	for (size_t i = 1; i < points.size(); i++) {
		if (points[i].features.size() != width) {
			throw std::invalid_argument("data point " + std::to_string(i) + " has " +
			                            std::to_string(points[i].features.size()) + " features, expected " +
			                            std::to_string(width));
		}
	}
}

inline std::vector<std::string> RegressionFitter::DefaultNames(size_t count) {
	std::vector<std::string> names;
	names.reserve(count);
	for (size_t i = 0; i < count; i++) {
		names.push_back("x" + std::to_string(i));
	}
	return names;
}

inline core::TimePoint RegressionFitter::ReferenceTime(const std::vector<core::DataPoint> &points,
                                                      const core::RegressionOptions &options) {
	if (options.reference_time) {
		return *options.reference_time;
	}
	core::TimePoint reference;
	bool found = false;
	for (const auto &pt : points) {
		if (pt.timestamp && (!found || *pt.timestamp > reference)) {
			reference = *pt.timestamp;
			found = true;
		}
	}
	return reference;
}

inline double RegressionFitter::HalfLifeWeight(double days_ago, double half_life_days) {
	return std::exp(-std::log(2.0) * days_ago / half_life_days);
}

inline core::RegressionModel RegressionFitter::Solve(const std::vector<core::DataPoint> &points,
                                                     const Eigen::VectorXd &weights, double lambda,
                                                     double singular_tolerance) {
	const auto n = static_cast<Eigen::Index>(points.size());
	const auto m = static_cast<Eigen::Index>(points[0].features.size());
	const Eigen::Index p = m + 1;

	// Design matrix with intercept column
	Eigen::MatrixXd X(n, p);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const auto &pt = points[static_cast<size_t>(i)];
		X(i, 0) = 1.0;
		for (Eigen::Index j = 0; j < m; j++) {
			X(i, j + 1) = pt.features[static_cast<size_t>(j)];
		}
		y(i) = pt.target;
	}

	// X'W
	const Eigen::MatrixXd XtW = X.transpose() * weights.asDiagonal();
	Eigen::MatrixXd XtWX = XtW * X;
	const Eigen::VectorXd XtWy = XtW * y;

	// Do NOT penalize the intercept
	for (Eigen::Index j = 1; j < p; j++) {
		XtWX(j, j) += lambda;
	}

	core::RegressionModel model;
	const Eigen::VectorXd beta = utils::SolveNormalEquations(XtWX, XtWy, singular_tolerance, &model.used_minimum_norm);

	model.intercept = beta(0);
	model.coefficients = beta.tail(m);
	model.sample_count = points.size();
	model.input_feature_count = static_cast<size_t>(m);

	const Eigen::VectorXd y_pred = X * beta;
	ComputeStatistics(y, y_pred, model);

	return model;
}

inline void RegressionFitter::ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred,
                                                core::RegressionModel &model) {
	const double n = static_cast<double>(y.size());
	model.residuals = y - y_pred;

	const double ss_res = model.residuals.squaredNorm();
	const double ss_tot = (y.array() - y.mean()).square().sum();

	if (ss_tot > 0.0) {
		model.r2_score = 1.0 - ss_res / ss_tot;
	} else {
		// Constant target: perfect if reproduced exactly
		model.r2_score = ss_res < 1e-20 ? 1.0 : 0.0;
	}
	model.mse = ss_res / n;
	model.mae = model.residuals.cwiseAbs().sum() / n;
}

inline core::RegressionModel RegressionFitter::Fit(const std::vector<core::DataPoint> &points,
                                                   const core::RegressionOptions &options,
                                                   const std::vector<std::string> &feature_names) {
	options.Validate();
	ValidatePoints(points);

	const size_t width = points[0].features.size();
	if (!feature_names.empty() && feature_names.size() != width) {
		throw std::invalid_argument("feature_names has " + std::to_string(feature_names.size()) +
		                            " entries, expected " + std::to_string(width));
	}
	const auto names = feature_names.empty() ? DefaultNames(width) : feature_names;

	const auto n = static_cast<Eigen::Index>(points.size());
	Eigen::VectorXd unit_weights = Eigen::VectorXd::Ones(n);
	const core::TimePoint reference = ReferenceTime(points, options);

	core::RegressionModel model;
	switch (options.variant) {
	case core::RegressionVariant::LINEAR:
		model = Solve(points, unit_weights, 0.0, options.singular_tolerance);
		model.feature_names = names;
		break;

	case core::RegressionVariant::RIDGE:
		model = Solve(points, unit_weights, options.lambda, options.singular_tolerance);
		model.feature_names = names;
		break;

	case core::RegressionVariant::TIME_WEIGHTED: {
		Eigen::VectorXd weights(n);
		for (Eigen::Index i = 0; i < n; i++) {
			const auto &pt = points[static_cast<size_t>(i)];
			weights(i) = pt.timestamp
			                 ? HalfLifeWeight(core::DaysBetween(*pt.timestamp, reference), options.half_life_days)
			                 : 1.0;
		}
		model = Solve(points, weights, 0.0, options.singular_tolerance);
		model.feature_names = names;
		break;
	}

	case core::RegressionVariant::POLYNOMIAL: {
		std::vector<core::DataPoint> expanded;
		expanded.reserve(points.size());
		for (const auto &pt : points) {
			core::DataPoint e = pt;
			e.features = CreatePolynomialFeatures(pt.features, options.degree);
			expanded.push_back(std::move(e));
		}
		model = Solve(expanded, unit_weights, options.polynomial_lambda, options.singular_tolerance);
		model.input_feature_count = width;
		model.polynomial_degree = options.degree;
		model.feature_names = CreatePolynomialNames(names, options.degree);
		break;
	}
	}

	model.model_type = options.variant;
	model.created_at = reference;
	return model;
}

inline core::RegressionModel RegressionFitter::FitLinear(const std::vector<core::DataPoint> &points) {
	return Fit(points, core::RegressionOptions::OLS());
}

inline core::RegressionModel RegressionFitter::FitRidge(const std::vector<core::DataPoint> &points, double lambda) {
	return Fit(points, core::RegressionOptions::Ridge(lambda));
}

inline core::RegressionModel RegressionFitter::FitTimeWeighted(const std::vector<core::DataPoint> &points,
                                                               double half_life_days,
                                                               std::optional<core::TimePoint> reference_time) {
	return Fit(points, core::RegressionOptions::TimeWeighted(half_life_days, reference_time));
}

inline core::RegressionModel RegressionFitter::FitPolynomial(const std::vector<core::DataPoint> &points,
                                                             int degree) {
	return Fit(points, core::RegressionOptions::Polynomial(degree));
}

inline double RegressionFitter::Predict(const core::RegressionModel &model, const std::vector<double> &features) {
	if (static_cast<Eigen::Index>(features.size()) != model.coefficients.size()) {
		throw std::invalid_argument("Predict: model has " + std::to_string(model.coefficients.size()) +
		                            " coefficients but " + std::to_string(features.size()) + " features were given");
	}
	double value = model.intercept;
	for (size_t i = 0; i < features.size(); i++) {
		value += model.coefficients(static_cast<Eigen::Index>(i)) * features[i];
	}
	return value;
}

inline double RegressionFitter::PredictPolynomial(const core::RegressionModel &model,
                                                  const std::vector<double> &features) {
	if (model.polynomial_degree < 2) {
		throw std::invalid_argument("PredictPolynomial requires a polynomial model");
	}
	return Predict(model, CreatePolynomialFeatures(features, model.polynomial_degree));
}

inline std::vector<double> RegressionFitter::CreatePolynomialFeatures(const std::vector<double> &features,
                                                                      int degree) {
	std::vector<double> poly(features);
	const size_t m = features.size();

	if (degree >= 2) {
		for (size_t i = 0; i < m; i++) {
			poly.push_back(features[i] * features[i]);
		}
		for (size_t i = 0; i < m; i++) {
			for (size_t j = i + 1; j < m; j++) {
				poly.push_back(features[i] * features[j]);
			}
		}
	}

	if (degree >= 3) {
		for (size_t i = 0; i < m; i++) {
			poly.push_back(features[i] * features[i] * features[i]);
		}
	}

	return poly;
}

inline std::vector<std::string> RegressionFitter::CreatePolynomialNames(const std::vector<std::string> &names,
                                                                        int degree) {
	std::vector<std::string> poly(names);
	const size_t m = names.size();

	if (degree >= 2) {
		for (size_t i = 0; i < m; i++) {
			poly.push_back(names[i] + "^2");
		}
		for (size_t i = 0; i < m; i++) {
			for (size_t j = i + 1; j < m; j++) {
				poly.push_back(names[i] + "*" + names[j]);
			}
		}
	}

	if (degree >= 3) {
		for (size_t i = 0; i < m; i++) {
			poly.push_back(names[i] + "^3");
		}
	}

	return poly;
}

} // namespace solvers
} // namespace libstatlearn

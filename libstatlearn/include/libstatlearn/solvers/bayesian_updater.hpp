#pragma once

#include "libstatlearn/core/data_point.hpp"
#include "libstatlearn/utils/descriptive.hpp"
#include "libstatlearn/utils/distributions.hpp"
#include "libstatlearn/utils/linear_algebra.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace solvers {

struct CredibleInterval {
	double lower = -std::numeric_limits<double>::infinity();
	double upper = std::numeric_limits<double>::infinity();
};

/// Normal-Gamma prior over (coefficients, noise precision)
struct BayesianPrior {
	Eigen::VectorXd mean;

	/// Coefficient covariance (inverse precision), unscaled by the noise
	Eigen::MatrixXd covariance;

	/// Gamma shape / rate of the noise precision
	double alpha = 1.0;
	double beta = 1.0;
};

struct BayesianPosterior {
	Eigen::VectorXd mean;
	Eigen::MatrixXd covariance;
	double alpha = 1.0;
	double beta = 1.0;

	/// 95% interval per coefficient
	std::vector<CredibleInterval> credible_intervals;

	/// Posterior std-dev per coefficient: sqrt(|cov_ii| * beta / alpha)
	Eigen::VectorXd uncertainty;
};

/**
 * Sequential Bayesian linear regression state
 *
 * A value type: Update() and BatchUpdate() return a new model and never
 * touch the one passed in.
 */
struct BayesianModel {
	BayesianPrior prior;
	BayesianPosterior posterior;

	/// Number of Update() calls folded in (including zero-weight ones)
	size_t observations = 0;

	size_t feature_count() const {
		return static_cast<size_t>(posterior.mean.size());
	}
};

struct BayesianPrediction {
	double mean = 0.0;
	double variance = 0.0;
	CredibleInterval credible_interval;
};

struct DriftReport {
	bool has_drift = false;
	double severity = 0.0;
	std::string recommendation;
};

/**
 * Bayesian Updater: conjugate Normal-Gamma linear regression
 *
 * Each observation (x, y, w) is folded in with the rank-one
 * (Sherman-Morrison) form of the recursive least squares update:
 *
 *   K  = S x / (1/w + x' S x)               [gain]
 *   mu = mu + K (y - x' mu)
 *   S  = S - K x' S
 *   a  = a + w/2
 *   b  = b + w e^2 / 2,   e = y - x' mu_old
 *
 * which is O(p²) per observation and exactly matches adding w x x' to the
 * precision matrix and re-solving.
 *
 * Design notes:
 * - Header-only
 * - No intercept term: features are used as given
 * - Stateless design (all methods are static)
 */
class BayesianUpdater {
public:
	/// Default prior variance of every coefficient (weak prior)
	static constexpr double DEFAULT_PRIOR_VARIANCE = 1000.0;

	/**
	 * Weak prior centred on prior_mean for every coefficient
	 *
	 * @throws std::invalid_argument if feature_dim == 0 or prior_variance <= 0
	 */
	static BayesianModel Initialize(size_t feature_dim, double prior_mean = 0.0,
	                                double prior_variance = DEFAULT_PRIOR_VARIANCE);

	/// Prior with an explicit mean vector
	static BayesianModel Initialize(const std::vector<double> &prior_mean,
	                                double prior_variance = DEFAULT_PRIOR_VARIANCE);

	/**
	 * Fold one observation into the posterior
	 *
	 * @param model Current state (unchanged)
	 * @param features Feature vector of width feature_count()
	 * @param target Observed value
	 * @param weight Observation weight >= 0; 0 only advances the counter
	 * @return Updated state
	 * @throws std::invalid_argument on width mismatch or negative weight
	 */
	static BayesianModel Update(const BayesianModel &model, const std::vector<double> &features, double target,
	                            double weight = 1.0);

	/// Left fold of Update over points (using each point's weight)
	static BayesianModel BatchUpdate(const BayesianModel &model, const std::vector<core::DataPoint> &points);

	/**
	 * Posterior predictive for a feature vector
	 *
	 * variance = noise + x' S x with noise = b/(a-1) when a > 1, else b/a
	 */
	static BayesianPrediction Predict(const BayesianModel &model, const std::vector<double> &features);

	/// min(n/100, 1) / (1 + mean coefficient uncertainty), in [0, 1]
	static double Confidence(const BayesianModel &model);

	/**
	 * Compare the spread of recent residuals against the posterior noise
	 *
	 * severity = population variance of residuals / (b / a)
	 *
	 * @param model Fitted posterior
	 * @param recent_residuals Residuals observed since the model was built
	 * @param threshold Severity above which drift is reported
	 */
	static DriftReport DetectDrift(const BayesianModel &model, const std::vector<double> &recent_residuals,
	                               double threshold = 2.0);

private:
	static void CheckWidth(const BayesianModel &model, size_t width);

	static void RefreshIntervals(BayesianPosterior &posterior);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void BayesianUpdater::CheckWidth(const BayesianModel &model, size_t width) {
	if (width != model.feature_count()) {
		throw std::invalid_argument("Bayesian model expects " + std::to_string(model.feature_count()) +
		                            " features, got " + std::to_string(width));
	}
}

inline void BayesianUpdater::RefreshIntervals(BayesianPosterior &posterior) {
	const Eigen::Index p = posterior.mean.size();
	const double noise_scale = posterior.beta / posterior.alpha;

	posterior.uncertainty.resize(p);
	posterior.credible_intervals.resize(static_cast<size_t>(p));
	for (Eigen::Index i = 0; i < p; i++) {
		const double u = std::sqrt(std::abs(posterior.covariance(i, i)) * noise_scale);
		posterior.uncertainty(i) = u;
		posterior.credible_intervals[static_cast<size_t>(i)] = {posterior.mean(i) - utils::Z_95 * u,
		                                                        posterior.mean(i) + utils::Z_95 * u};
	}
}

inline BayesianModel BayesianUpdater::Initialize(size_t feature_dim, double prior_mean, double prior_variance) {
	if (feature_dim == 0) {
		throw std::invalid_argument("Bayesian model requires at least one feature");
	}
	return Initialize(std::vector<double>(feature_dim, prior_mean), prior_variance);
}

inline BayesianModel BayesianUpdater::Initialize(const std::vector<double> &prior_mean, double prior_variance) {
	if (prior_mean.empty()) {
		throw std::invalid_argument("Bayesian model requires at least one feature");
	}
	if (!(prior_variance > 0.0)) {
		throw std::invalid_argument("prior_variance must be positive (got " + std::to_string(prior_variance) + ")");
	}

	const auto p = static_cast<Eigen::Index>(prior_mean.size());

	BayesianModel model;
	model.prior.mean = utils::ToEigen(prior_mean);
	model.prior.covariance = Eigen::MatrixXd::Identity(p, p) * prior_variance;

	model.posterior.mean = model.prior.mean;
	model.posterior.covariance = model.prior.covariance;
	model.posterior.alpha = model.prior.alpha;
	model.posterior.beta = model.prior.beta;

	// Nothing observed yet: unbounded intervals, unit uncertainty
	model.posterior.credible_intervals.assign(prior_mean.size(), CredibleInterval());
	model.posterior.uncertainty = Eigen::VectorXd::Ones(p);
	return model;
}

inline BayesianModel BayesianUpdater::Update(const BayesianModel &model, const std::vector<double> &features,
                                             double target, double weight) {
	CheckWidth(model, features.size());
	if (weight < 0.0 || !std::isfinite(weight)) {
		throw std::invalid_argument("observation weight must be finite and non-negative (got " +
		                            std::to_string(weight) + ")");
	}

	BayesianModel next = model;
	next.observations = model.observations + 1;
	if (weight == 0.0) {
		return next;
	}

	const Eigen::VectorXd x = utils::ToEigen(features);
	const Eigen::VectorXd &mu = model.posterior.mean;
	const Eigen::MatrixXd &S = model.posterior.covariance;

	const double error = target - x.dot(mu);

	// Gain: K = S x / (1/w + x' S x)
	const Eigen::VectorXd Sx = S * x;
	const double denominator = 1.0 / weight + x.dot(Sx);
	const Eigen::VectorXd K = Sx / denominator;

	next.posterior.mean = mu + K * error;

	// S - K x' S, re-symmetrized against round-off
	Eigen::MatrixXd updated = S - K * Sx.transpose();
	next.posterior.covariance = 0.5 * (updated + updated.transpose());

	next.posterior.alpha = model.posterior.alpha + 0.5 * weight;
	next.posterior.beta = model.posterior.beta + 0.5 * weight * error * error;

	RefreshIntervals(next.posterior);
	return next;
}

inline BayesianModel BayesianUpdater::BatchUpdate(const BayesianModel &model,
                                                  const std::vector<core::DataPoint> &points) {
	BayesianModel current = model;
	for (const auto &pt : points) {
		current = Update(current, pt.features, pt.target, pt.weight);
	}
	return current;
}

inline BayesianPrediction BayesianUpdater::Predict(const BayesianModel &model, const std::vector<double> &features) {
	CheckWidth(model, features.size());

	const Eigen::VectorXd x = utils::ToEigen(features);
	const auto &post = model.posterior;

	BayesianPrediction pred;
	pred.mean = x.dot(post.mean);

	const double noise = post.alpha > 1.0 ? post.beta / (post.alpha - 1.0) : post.beta / post.alpha;
	pred.variance = noise + x.dot(post.covariance * x);

	const double sd = std::sqrt(std::max(pred.variance, 0.0));
	pred.credible_interval = {pred.mean - utils::Z_95 * sd, pred.mean + utils::Z_95 * sd};
	return pred;
}

inline double BayesianUpdater::Confidence(const BayesianModel &model) {
	const double observation_confidence = std::min(static_cast<double>(model.observations) / 100.0, 1.0);
	const auto &u = model.posterior.uncertainty;
	const double mean_uncertainty = u.size() > 0 ? u.mean() : 0.0;
	return observation_confidence * (1.0 / (1.0 + mean_uncertainty));
}

inline DriftReport BayesianUpdater::DetectDrift(const BayesianModel &model, const std::vector<double> &recent_residuals,
                                                double threshold) {
	DriftReport report;
	if (recent_residuals.size() < 5) {
		report.recommendation = "Insufficient data for drift detection";
		return report;
	}

	const double expected_noise = model.posterior.beta / model.posterior.alpha;

	const double actual_variance = utils::PopulationVariance(recent_residuals);

	report.severity = actual_variance / expected_noise;
	report.has_drift = report.severity > threshold;

	if (!report.has_drift) {
		report.recommendation = "Model performing well - no drift detected";
	} else if (report.severity > 5.0) {
		report.recommendation = "Critical drift detected - recommend full model reset with recent data";
	} else if (report.severity > 3.0) {
		report.recommendation = "Significant drift - increase learning rate or add more recent observations";
	} else {
		report.recommendation = "Mild drift - continue monitoring";
	}
	return report;
}

} // namespace solvers
} // namespace libstatlearn

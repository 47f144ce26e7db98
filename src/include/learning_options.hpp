#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include "libstatlearn/detection/outlier_detector.hpp"
#include "libstatlearn/ensemble/ensemble_combiner.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace statlearn {

/**
 * Options for one RunLearningLoop() call
 *
 * All options have defaults matching the standard pipeline and can be
 * overridden in code or from a JSON document (see ParseLearningOptions).
 */
struct LearningOptions {
	// Preprocessing
	libstatlearn::detection::OutlierMethod outlier_method = libstatlearn::detection::OutlierMethod::MODIFIED_Z_SCORE;

	/// Fewer clean observations than this short-circuits to insufficient_data
	size_t min_clean_points = 5;

	// Model fitting
	double half_life_days = 30.0;

	// Time-series members
	double smoothing_alpha = 0.3;
	double smoothing_beta = 0.1;

	/// A time-series member joins the ensemble only above this confidence
	double time_series_min_confidence = 0.3;

	// Member toggles (quick simulations run with members switched off)
	bool enable_bayesian = true;
	bool enable_time_series = true;

	/// Severity threshold passed to drift detection
	double drift_threshold = 2.0;

	libstatlearn::ensemble::EnsembleConfig ensemble = DefaultEnsemble();

	/// Instant recency weights are measured from
	/// Unset: latest observation timestamp
	std::optional<libstatlearn::core::TimePoint> reference_time;

	static libstatlearn::ensemble::EnsembleConfig DefaultEnsemble() {
		libstatlearn::ensemble::EnsembleConfig config;
		config.method = libstatlearn::ensemble::EnsembleMethod::ADAPTIVE;
		config.min_models = 2;
		config.confidence_threshold = 0.4;
		return config;
	}

	/// Regression, Bayesian and both time-series members, adaptive combination
	static LearningOptions Defaults() {
		return LearningOptions();
	}

	/// Regression and Bayesian members only
	static LearningOptions QuickSimulation() {
		LearningOptions opts;
		opts.enable_time_series = false;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		using libstatlearn::detection::OutlierMethod;
		if (outlier_method != OutlierMethod::Z_SCORE && outlier_method != OutlierMethod::MODIFIED_Z_SCORE &&
		    outlier_method != OutlierMethod::IQR) {
			throw std::invalid_argument("outlier_method must be z_score, modified_z_score or iqr");
		}
		if (min_clean_points < 2) {
			throw std::invalid_argument("min_clean_points must be at least 2 (got " +
			                            std::to_string(min_clean_points) + ")");
		}
		if (half_life_days <= 0.0) {
			throw std::invalid_argument("half_life_days must be positive (got " + std::to_string(half_life_days) +
			                            ")");
		}
		if (smoothing_alpha < 0.0 || smoothing_alpha > 1.0) {
			throw std::invalid_argument("smoothing_alpha must be in [0, 1]");
		}
		if (smoothing_beta < 0.0 || smoothing_beta > 1.0) {
			throw std::invalid_argument("smoothing_beta must be in [0, 1]");
		}
		if (time_series_min_confidence < 0.0 || time_series_min_confidence > 1.0) {
			throw std::invalid_argument("time_series_min_confidence must be in [0, 1]");
		}
		if (drift_threshold <= 0.0) {
			throw std::invalid_argument("drift_threshold must be positive");
		}
		ensemble.Validate();
	}
};

/**
 * Values a caller accumulated on earlier runs
 *
 * The engine itself keeps nothing between calls; whatever is passed here is
 * the only memory it has.
 */
struct LearningHistory {
	/// Recent residuals (actual - predicted) used for drift detection
	std::vector<double> recent_residuals;

	/// Recent signed errors per ensemble member id, oldest first
	libstatlearn::ensemble::RecentErrors member_errors;

	bool empty() const {
		return recent_residuals.empty() && member_errors.empty();
	}
};

} // namespace statlearn

#pragma once

#include "libstatlearn/core/data_point.hpp"
#include "libstatlearn/core/training_observation.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace libstatlearn {
namespace features {

/**
 * Feature Engineer
 *
 * Turns each TrainingObservation into a fixed-width feature vector:
 *
 *   [0]  distance
 *   [1]  duration (minutes)
 *   [2]  elevation
 *   [3]  pace = distance / (duration / 60), 0 when duration <= 0
 *   [4]  avg_hr            (default 150)
 *   [5]  perceived_effort  (default 5)
 *   [6]  sleep_quality     (default 7)
 *   [7]  readiness         (default 75)
 *   [8]  sin(2*pi*dow/7)   (UTC day of week, Sunday = 0)
 *   [9]  cos(2*pi*dow/7)
 *   [10] rolling_3_distance: mean distance of observations i-2..i, own
 *        distance for the first two
 *
 * The recency weight exp(-days_since / 30) is measured from reference_time
 * and attached to each DataPoint together with the timestamp.
 *
 * Design notes:
 * - One output per input, input order preserved
 * - Rolling window is positional (input order), not calendar based
 * - Stateless design (all methods are static)
 */
class FeatureEngineer {
public:
	static constexpr size_t FEATURE_COUNT = 11;

	/// Decay constant (days) of the recency weight
	static constexpr double RECENCY_DECAY_DAYS = 30.0;

	static constexpr double PI = 3.14159265358979323846;

	/// Names of the features in vector order
	static std::vector<std::string> FeatureNames();

	/**
	 * Engineer features for a history of observations
	 *
	 * @param observations Sessions in the order they should be featurized
	 * @param target Which value becomes DataPoint::target
	 * @param reference_time Instant the recency weight is measured from
	 * @return One DataPoint per observation
	 */
	static std::vector<core::DataPoint> Engineer(const std::vector<core::TrainingObservation> &observations,
	                                             core::TargetVariable target, core::TimePoint reference_time);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<std::string> FeatureEngineer::FeatureNames() {
	return {"distance",      "duration",  "elevation", "pace",    "avg_hr",            "perceived_effort",
	        "sleep_quality", "readiness", "dow_sin",   "dow_cos", "rolling_3_distance"};
}

inline std::vector<core::DataPoint>
FeatureEngineer::Engineer(const std::vector<core::TrainingObservation> &observations, core::TargetVariable target,
                          core::TimePoint reference_time) {
	const double two_pi = 2.0 * PI;

	std::vector<core::DataPoint> points;
	points.reserve(observations.size());

	for (size_t idx = 0; idx < observations.size(); idx++) {
		const auto &obs = observations[idx];

		core::DataPoint point;
		auto &f = point.features;
		f.reserve(FEATURE_COUNT);

		// Raw
		f.push_back(obs.distance);
		f.push_back(obs.duration);
		f.push_back(obs.elevation);

		// Derived: km/h
		f.push_back(obs.duration > 0.0 ? obs.distance / (obs.duration / 60.0) : 0.0);

		// Physiological
		f.push_back(obs.avg_hr.value_or(150.0));
		f.push_back(obs.perceived_effort.value_or(5.0));
		f.push_back(obs.sleep_quality.value_or(7.0));
		f.push_back(obs.readiness.value_or(75.0));

		// Weekly cycle
		const double dow = static_cast<double>(core::DayOfWeek(obs.timestamp));
		f.push_back(std::sin(two_pi * dow / 7.0));
		f.push_back(std::cos(two_pi * dow / 7.0));

		// Rolling 3-session distance
		if (idx >= 2) {
			f.push_back((observations[idx - 2].distance + observations[idx - 1].distance + obs.distance) / 3.0);
		} else {
			f.push_back(obs.distance);
		}

		const double days_since = core::DaysBetween(obs.timestamp, reference_time);
		point.weight = std::exp(-days_since / RECENCY_DECAY_DAYS);
		point.target = core::TargetValue(obs, target);
		point.timestamp = obs.timestamp;

		points.push_back(std::move(point));
	}

	return points;
}

} // namespace features
} // namespace libstatlearn

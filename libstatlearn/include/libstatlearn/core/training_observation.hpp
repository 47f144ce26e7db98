#pragma once

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace libstatlearn {
namespace core {

using TimePoint = std::chrono::system_clock::time_point;

/// Fractional days elapsed from `from` to `to` (negative if `to` is earlier)
inline double DaysBetween(TimePoint from, TimePoint to) {
	return std::chrono::duration<double, std::ratio<86400>>(to - from).count();
}

/// Time point `days` whole or fractional days after the system clock epoch
inline TimePoint FromEpochDays(double days) {
	auto offset = std::chrono::duration<double, std::ratio<86400>>(days);
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(offset));
}

/// UTC day of week, Sunday = 0 ... Saturday = 6
inline int DayOfWeek(TimePoint t) {
	double days = std::floor(DaysBetween(TimePoint(), t));
	// 1970-01-01 was a Thursday
	long long dow = (static_cast<long long>(days) + 4) % 7;
	if (dow < 0) {
		dow += 7;
	}
	return static_cast<int>(dow);
}

/**
 * One recorded training session
 *
 * Supplied by the caller and never mutated by the engine. Optional fields
 * that are absent fall back to population defaults during feature
 * engineering (see FeatureEngineer).
 */
struct TrainingObservation {
	TimePoint timestamp;

	/// Distance in km
	double distance = 0.0;

	/// Duration in minutes
	double duration = 0.0;

	/// Elevation gain in metres
	double elevation = 0.0;

	std::optional<double> avg_hr;
	std::optional<double> perceived_effort;
	std::optional<double> fatigue;
	std::optional<double> sleep_quality;
	std::optional<double> readiness;
};

/// Quantity the learning loop forecasts
enum class TargetVariable { DISTANCE, FATIGUE, READINESS };

inline double TargetValue(const TrainingObservation &obs, TargetVariable target) {
	switch (target) {
	case TargetVariable::DISTANCE:
		return obs.distance;
	case TargetVariable::FATIGUE:
		return obs.fatigue.value_or(5.0);
	case TargetVariable::READINESS:
		return obs.readiness.value_or(75.0);
	}
	return obs.distance;
}

inline std::string TargetVariableName(TargetVariable target) {
	switch (target) {
	case TargetVariable::DISTANCE:
		return "distance";
	case TargetVariable::FATIGUE:
		return "fatigue";
	case TargetVariable::READINESS:
		return "readiness";
	}
	return "distance";
}

inline TargetVariable ParseTargetVariable(const std::string &name) {
	if (name == "distance") {
		return TargetVariable::DISTANCE;
	}
	if (name == "fatigue") {
		return TargetVariable::FATIGUE;
	}
	if (name == "readiness") {
		return TargetVariable::READINESS;
	}
	throw std::invalid_argument("target variable must be 'distance', 'fatigue' or 'readiness' (got '" + name + "')");
}

/// Single value of a time series
struct TimeSeriesPoint {
	TimePoint timestamp;
	double value = 0.0;
};

} // namespace core
} // namespace libstatlearn

#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include <optional>
#include <vector>

namespace libstatlearn {
namespace core {

/**
 * Numeric training example derived from one TrainingObservation
 *
 * features has a fixed width for every point produced by one
 * FeatureEngineer call; weight is 1 unless time-decayed.
 */
struct DataPoint {
	std::vector<double> features;
	double target = 0.0;
	double weight = 1.0;
	std::optional<TimePoint> timestamp;
};

} // namespace core
} // namespace libstatlearn

#pragma once

#include "../include/learning_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace statlearn {

/**
 * Parse LearningOptions from a JSON object
 *
 * Every key is optional; missing keys keep their defaults. Recognised keys:
 *   outlier_method, min_clean_points, half_life_days, smoothing_alpha,
 *   smoothing_beta, time_series_min_confidence, enable_bayesian,
 *   enable_time_series, drift_threshold, reference_date ("YYYY-MM-DD"),
 *   ensemble { method, min_models, adaptive_window, confidence_threshold }
 *
 * @param doc JSON object (null yields the defaults)
 * @return Validated options
 * @throws std::invalid_argument on unknown keys, wrongly typed values or
 *         values rejected by LearningOptions::Validate()
 */
LearningOptions ParseLearningOptions(const nlohmann::json &doc);

/**
 * Parse a LearningHistory from a JSON object
 *
 *   { "recent_residuals": [..], "member_errors": { "<member id>": [..] } }
 *
 * @throws std::invalid_argument on unknown keys or wrongly typed values
 */
LearningHistory ParseLearningHistory(const nlohmann::json &doc);

/// Read and parse a JSON file
/// @throws std::runtime_error if the file cannot be read or parsed
nlohmann::json LoadJsonFile(const std::string &path);

} // namespace statlearn

#pragma once

#include "../include/learning_loop.hpp"
#include <nlohmann/json.hpp>

namespace statlearn {
namespace io {

/**
 * @brief JSON rendering of learning loop output
 *
 * Non-finite numbers (the infinite uncertainty of sentinel predictions,
 * unbounded credible intervals) are written as null so the document stays
 * valid JSON.
 */

nlohmann::json ToJson(const LearningLoopResult &result);

nlohmann::json ToJson(const LearningState &state);

nlohmann::json ToJson(const libstatlearn::ensemble::EnsemblePrediction &prediction);

nlohmann::json ToJson(const libstatlearn::detection::DataQualityReport &report);

nlohmann::json ToJson(const libstatlearn::trend::TrendAnalysis &trend);

nlohmann::json ToJson(const libstatlearn::core::RegressionModel &model);

nlohmann::json ToJson(const libstatlearn::solvers::BayesianModel &model);

/// Finite value, or null
nlohmann::json NumberOrNull(double value);

} // namespace io
} // namespace statlearn

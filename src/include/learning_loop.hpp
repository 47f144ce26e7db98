#pragma once

#include "learning_options.hpp"
#include "libstatlearn/core/regression_model.hpp"
#include "libstatlearn/core/training_observation.hpp"
#include "libstatlearn/detection/outlier_detector.hpp"
#include "libstatlearn/ensemble/ensemble_combiner.hpp"
#include "libstatlearn/solvers/bayesian_updater.hpp"
#include "libstatlearn/trend/trend_analyzer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace statlearn {

/// Stages of one learning loop run, executed strictly in this order
enum class LoopStage {
	PREPROCESSING,
	FEATURE_ENGINEERING,
	TREND_ANALYSIS,
	MODEL_FITTING,
	ENSEMBLE_ASSEMBLY,
	PREDICTION,
	NARRATION,
	DONE
};

std::string LoopStageName(LoopStage stage);

struct PerformanceSummary {
	double mae = 0.0;
	double mse = 0.0;
	double r2 = 0.0;
	double confidence = 0.0;
};

/**
 * Everything one run computed
 *
 * Built fresh per call and handed to the caller; the engine keeps no copy.
 */
struct LearningState {
	/// Report over the input series (indices refer to the input order)
	libstatlearn::detection::DataQualityReport data_quality;

	libstatlearn::trend::TrendAnalysis trend;

	/// Unset when the run exited early
	std::optional<libstatlearn::core::RegressionModel> regression_model;
	std::optional<libstatlearn::solvers::BayesianModel> bayesian_model;

	std::vector<libstatlearn::ensemble::EnsembleMember> ensemble_members;
	libstatlearn::ensemble::EnsembleConfig ensemble_config;

	/// Drift check against LearningHistory::recent_residuals
	std::optional<libstatlearn::solvers::DriftReport> drift;

	PerformanceSummary performance;

	/// Clean observations the models were trained on
	size_t observation_count = 0;

	std::vector<LoopStage> completed_stages;
};

struct LearningLoopResult {
	LearningState state;
	libstatlearn::ensemble::EnsemblePrediction prediction;
	std::vector<std::string> recommendations;
	std::vector<std::string> insights;
};

/**
 * Accumulates ensemble members, applying the admission rule in one place
 */
class EnsembleBuilder {
public:
	/// Unconditional member
	EnsembleBuilder &Add(libstatlearn::ensemble::EnsembleMember member);

	/**
	 * Append only when the member's self-reported confidence exceeds
	 * min_confidence (members without a confidence are never admitted)
	 *
	 * @return true if the member was added
	 */
	bool AddIfConfident(libstatlearn::ensemble::EnsembleMember member, double min_confidence);

	size_t size() const {
		return members_.size();
	}

	std::vector<libstatlearn::ensemble::EnsembleMember> Build() const {
		return members_;
	}

private:
	std::vector<libstatlearn::ensemble::EnsembleMember> members_;
};

/**
 * Run the full learning cycle over one athlete's history
 *
 * clean -> featurize -> trend -> fit -> ensemble -> predict -> narrate
 *
 * Deterministic for fixed inputs. Fewer than options.min_clean_points clean
 * observations short-circuit to an insufficient_data result.
 *
 * @param observations Sessions in any order (input order is kept for indices
 *        and positional features)
 * @param target Quantity to forecast
 * @param options Pipeline options
 * @param history Values accumulated by the caller on earlier runs
 * @throws std::invalid_argument if options are invalid
 */
LearningLoopResult RunLearningLoop(const std::vector<libstatlearn::core::TrainingObservation> &observations,
                                   libstatlearn::core::TargetVariable target,
                                   const LearningOptions &options = LearningOptions(),
                                   const LearningHistory &history = LearningHistory());

} // namespace statlearn

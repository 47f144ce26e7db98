#include "include/learning_loop.hpp"
#include "libstatlearn/features/feature_engineer.hpp"
#include "libstatlearn/forecast/time_series_forecaster.hpp"
#include "libstatlearn/solvers/regression_fitter.hpp"
#include "utils/tracing.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace statlearn {

using namespace libstatlearn;

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string Fixed(double value, int precision) {
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(precision) << value;
	return oss.str();
}

/// Subject of the narration sentences
std::string TargetLabel(core::TargetVariable target) {
	switch (target) {
	case core::TargetVariable::DISTANCE:
		return "Training load";
	case core::TargetVariable::FATIGUE:
		return "Fatigue";
	case core::TargetVariable::READINESS:
		return "Readiness";
	}
	return "Training load";
}

std::string TargetUnit(core::TargetVariable target) {
	return target == core::TargetVariable::DISTANCE ? "km" : "points";
}

std::string FitLabel(double r2) {
	if (r2 >= 0.7) {
		return "excellent";
	}
	if (r2 >= 0.5) {
		return "good";
	}
	return "fair";
}

void CompleteStage(LearningState &state, LoopStage stage) {
	state.completed_stages.push_back(stage);
	STATLEARN_DEBUG("Learning loop stage " << LoopStageName(stage) << " completed");
}

core::TimePoint ResolveReferenceTime(const std::vector<core::TrainingObservation> &observations,
                                     const LearningOptions &options) {
	if (options.reference_time) {
		return *options.reference_time;
	}
	core::TimePoint latest = observations.front().timestamp;
	for (const auto &obs : observations) {
		latest = std::max(latest, obs.timestamp);
	}
	return latest;
}

std::vector<core::TimeSeriesPoint> TimeOrderedSeries(const std::vector<core::TrainingObservation> &observations,
                                                     core::TargetVariable target) {
	std::vector<core::TimeSeriesPoint> series;
	series.reserve(observations.size());
	for (const auto &obs : observations) {
		series.push_back({obs.timestamp, core::TargetValue(obs, target)});
	}
	std::stable_sort(series.begin(), series.end(),
	                 [](const core::TimeSeriesPoint &a, const core::TimeSeriesPoint &b) {
		                 return a.timestamp < b.timestamp;
	                 });
	return series;
}

/// Most recent point by timestamp; the later input position wins ties
const core::DataPoint &LatestPoint(const std::vector<core::DataPoint> &points) {
	size_t latest = 0;
	for (size_t i = 1; i < points.size(); i++) {
		const auto &ts = points[i].timestamp;
		const auto &best = points[latest].timestamp;
		if (!best || (ts && *ts >= *best)) {
			latest = i;
		}
	}
	return points[latest];
}

ensemble::EnsembleMember ForecastMember(const std::string &id, const std::string &name,
                                        const forecast::ForecastResult &result) {
	ensemble::EnsembleMember member;
	member.id = id;
	member.name = name;
	member.type = ensemble::MemberType::TIME_SERIES;
	member.weight = result.confidence;
	member.performance.r2 = result.confidence;
	member.performance.recent_accuracy = result.confidence;
	member.confidence = result.confidence;
	if (!result.predictions.empty()) {
		member.predictions = {result.predictions[0]};
	}
	return member;
}

std::vector<std::string> Recommend(const LearningState &state, const ensemble::EnsemblePrediction &prediction,
                                   core::TargetVariable target) {
	std::vector<std::string> out;
	const auto &analysis = state.trend;
	const std::string weekly = Fixed(analysis.slope * 7.0, 1) + " " + TargetUnit(target) + "/week";

	if (analysis.direction == trend::TrendDirection::INCREASING && analysis.confidence > 0.7) {
		out.push_back(TargetLabel(target) + " trending upward (+" + weekly + "). Monitor for overtraining signs.");
	}
	if (analysis.direction == trend::TrendDirection::DECREASING && analysis.confidence > 0.7) {
		out.push_back(TargetLabel(target) + " decreasing (" + weekly + "). Consider if this is intentional taper.");
	}

	if (state.data_quality.outlier_percentage > 10.0) {
		out.push_back(Fixed(state.data_quality.outlier_percentage, 1) +
		              "% of data points are outliers. Review data quality or consider abnormal training days.");
	}

	if (prediction.uncertainty > 0.3 * std::abs(prediction.value)) {
		out.push_back("High prediction uncertainty detected. Models need more consistent data for accurate "
		              "forecasting.");
	}

	if (state.drift && state.drift->has_drift) {
		out.push_back(state.drift->recommendation);
	}
	return out;
}

std::vector<std::string> Narrate(const LearningState &state, core::TargetVariable target) {
	std::vector<std::string> out;
	const auto &quality = state.data_quality;

	out.push_back("Model trained on " + std::to_string(state.observation_count) + " sessions with " +
	              std::to_string(quality.outlier_indices.size()) + " outliers removed (" +
	              Fixed(quality.outlier_percentage, 1) + "%).");

	if (state.regression_model) {
		const double r2 = state.regression_model->r2_score;
		out.push_back("Regression R^2 score: " + Fixed(r2 * 100.0, 1) + "% (" + FitLabel(r2) + " fit)");
	}

	if (state.bayesian_model) {
		out.push_back("Bayesian model confidence: " +
		              Fixed(solvers::BayesianUpdater::Confidence(*state.bayesian_model) * 100.0, 1) +
		              "% based on " + std::to_string(state.bayesian_model->observations) + " observations");
	}

	if (state.trend.direction != trend::TrendDirection::STABLE) {
		out.push_back("Statistically significant " + trend::TrendDirectionName(state.trend.direction) +
		              " trend detected (p=" + Fixed(state.trend.p_value, 3) + ")");
	} else {
		std::string subject = TargetLabel(target);
		subject[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(subject[0])));
		out.push_back("No significant trend detected - " + subject + " is stable");
	}

	if (state.regression_model && state.regression_model->coefficients.size() > 0) {
		const auto &model = *state.regression_model;
		std::vector<size_t> order(static_cast<size_t>(model.coefficients.size()));
		std::iota(order.begin(), order.end(), size_t {0});
		std::stable_sort(order.begin(), order.end(), [&model](size_t a, size_t b) {
			return std::abs(model.coefficients(static_cast<Eigen::Index>(a))) >
			       std::abs(model.coefficients(static_cast<Eigen::Index>(b)));
		});

		std::string line = "Top predictive factors: ";
		const size_t top = std::min<size_t>(3, order.size());
		for (size_t k = 0; k < top; k++) {
			const size_t i = order[k];
			const std::string name = i < model.feature_names.size() ? model.feature_names[i] : "x" + std::to_string(i);
			if (k > 0) {
				line += ", ";
			}
			line += name + " (" + Fixed(std::abs(model.coefficients(static_cast<Eigen::Index>(i))), 2) + ")";
		}
		out.push_back(line);
	}
	return out;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

std::string LoopStageName(LoopStage stage) {
	switch (stage) {
	case LoopStage::PREPROCESSING:
		return "preprocessing";
	case LoopStage::FEATURE_ENGINEERING:
		return "feature_engineering";
	case LoopStage::TREND_ANALYSIS:
		return "trend_analysis";
	case LoopStage::MODEL_FITTING:
		return "model_fitting";
	case LoopStage::ENSEMBLE_ASSEMBLY:
		return "ensemble_assembly";
	case LoopStage::PREDICTION:
		return "prediction";
	case LoopStage::NARRATION:
		return "narration";
	case LoopStage::DONE:
		return "done";
	}
	return "unknown";
}

EnsembleBuilder &EnsembleBuilder::Add(ensemble::EnsembleMember member) {
	members_.push_back(std::move(member));
	return *this;
}

bool EnsembleBuilder::AddIfConfident(ensemble::EnsembleMember member, double min_confidence) {
	if (!member.confidence || !(*member.confidence > min_confidence) || member.predictions.empty()) {
		STATLEARN_DEBUG("Ensemble member " << member.id << " omitted (confidence "
		                                   << member.confidence.value_or(0.0) << ")");
		return false;
	}
	members_.push_back(std::move(member));
	return true;
}

LearningLoopResult RunLearningLoop(const std::vector<core::TrainingObservation> &observations,
                                   core::TargetVariable target, const LearningOptions &options,
                                   const LearningHistory &history) {
	options.Validate();
	STATLEARN_TIMING_START();

	LearningLoopResult result;
	LearningState &state = result.state;
	state.ensemble_config = options.ensemble;

	// ------------------------------------------------------------------
	// Preprocessing: drop outliers of the target, keep input order
	// ------------------------------------------------------------------
	std::vector<double> targets;
	targets.reserve(observations.size());
	for (const auto &obs : observations) {
		targets.push_back(core::TargetValue(obs, target));
	}
	state.data_quality = detection::OutlierDetector::GenerateDataQualityReport(targets, options.outlier_method);

	std::vector<bool> is_outlier(observations.size(), false);
	for (size_t idx : state.data_quality.outlier_indices) {
		is_outlier[idx] = true;
	}
	std::vector<core::TrainingObservation> clean;
	clean.reserve(observations.size());
	for (size_t i = 0; i < observations.size(); i++) {
		if (!is_outlier[i]) {
			clean.push_back(observations[i]);
		}
	}
	CompleteStage(state, LoopStage::PREPROCESSING);

	if (clean.size() < options.min_clean_points) {
		STATLEARN_INFO("Only " << clean.size() << " clean observations (need " << options.min_clean_points
		                       << "), skipping model training");
		result.prediction = ensemble::EnsembleCombiner::Unusable("insufficient_data");
		result.recommendations = {"Need at least " + std::to_string(options.min_clean_points) +
		                          " clean data points for meaningful predictions"};
		result.insights = {"Continue logging training data to enable statistical learning"};
		state.observation_count = clean.size();
		CompleteStage(state, LoopStage::DONE);
		return result;
	}

	const core::TimePoint reference_time = ResolveReferenceTime(observations, options);

	// ------------------------------------------------------------------
	// Feature engineering
	// ------------------------------------------------------------------
	const auto points = features::FeatureEngineer::Engineer(clean, target, reference_time);
	CompleteStage(state, LoopStage::FEATURE_ENGINEERING);

	// ------------------------------------------------------------------
	// Trend analysis
	// ------------------------------------------------------------------
	const auto series = TimeOrderedSeries(clean, target);
	state.trend = trend::TrendAnalyzer::DetectTrend(series);
	CompleteStage(state, LoopStage::TREND_ANALYSIS);

	// ------------------------------------------------------------------
	// Model fitting
	// ------------------------------------------------------------------
	state.regression_model =
	    solvers::RegressionFitter::Fit(points, core::RegressionOptions::TimeWeighted(options.half_life_days, reference_time),
	                                   features::FeatureEngineer::FeatureNames());
	if (state.regression_model->used_minimum_norm) {
		STATLEARN_DEBUG("Normal equations singular, using minimum-norm regression coefficients");
	}

	if (options.enable_bayesian) {
		auto prior = solvers::BayesianUpdater::Initialize(points[0].features.size());
		state.bayesian_model = solvers::BayesianUpdater::BatchUpdate(prior, points);
		state.drift =
		    solvers::BayesianUpdater::DetectDrift(*state.bayesian_model, history.recent_residuals, options.drift_threshold);
	}
	CompleteStage(state, LoopStage::MODEL_FITTING);

	// ------------------------------------------------------------------
	// Ensemble assembly
	// ------------------------------------------------------------------
	const auto &latest_features = LatestPoint(points).features;
	EnsembleBuilder builder;

	{
		const auto &model = *state.regression_model;
		ensemble::EnsembleMember member;
		member.id = "regression_time_weighted";
		member.name = "Time-Weighted Regression";
		member.type = ensemble::MemberType::REGRESSION;
		member.weight = 1.0;
		member.performance = {model.mae, model.mse, model.r2_score, model.r2_score};
		member.predictions = {solvers::RegressionFitter::Predict(model, latest_features)};
		// R² of a weighted fit can be negative on the unweighted targets
		member.confidence = std::max(0.0, std::min(1.0, model.r2_score));
		builder.Add(std::move(member));
	}

	if (state.bayesian_model) {
		const double confidence = solvers::BayesianUpdater::Confidence(*state.bayesian_model);
		ensemble::EnsembleMember member;
		member.id = "bayesian_adaptive";
		member.name = "Bayesian Adaptive Model";
		member.type = ensemble::MemberType::BAYESIAN;
		member.weight = 1.0;
		member.performance = {0.0, 0.0, confidence, confidence};
		member.predictions = {solvers::BayesianUpdater::Predict(*state.bayesian_model, latest_features).mean};
		member.confidence = confidence;
		builder.Add(std::move(member));
	}

	if (options.enable_time_series) {
		const auto smoothing = forecast::TimeSeriesForecaster::TripleExponentialSmoothing(
		    series, options.smoothing_alpha, options.smoothing_beta, 1);
		builder.AddIfConfident(ForecastMember("exponential_smoothing", "Exponential Smoothing", smoothing),
		                       options.time_series_min_confidence);

		const auto moving_average = forecast::TimeSeriesForecaster::AdaptiveMovingAverage(series, 1);
		builder.AddIfConfident(ForecastMember("moving_average", "Adaptive Moving Average", moving_average),
		                       options.time_series_min_confidence);
	}

	state.ensemble_members = builder.Build();
	CompleteStage(state, LoopStage::ENSEMBLE_ASSEMBLY);

	// ------------------------------------------------------------------
	// Prediction
	// ------------------------------------------------------------------
	const ensemble::RecentErrors *recent_errors = history.member_errors.empty() ? nullptr : &history.member_errors;
	result.prediction = ensemble::EnsembleCombiner::Combine(state.ensemble_members, options.ensemble, recent_errors);
	CompleteStage(state, LoopStage::PREDICTION);

	state.observation_count = clean.size();
	state.performance.mae = state.regression_model->mae;
	state.performance.mse = state.regression_model->mse;
	state.performance.r2 = state.regression_model->r2_score;
	state.performance.confidence = result.prediction.confidence;

	// ------------------------------------------------------------------
	// Narration
	// ------------------------------------------------------------------
	result.recommendations = Recommend(state, result.prediction, target);
	result.insights = Narrate(state, target);
	CompleteStage(state, LoopStage::NARRATION);

	CompleteStage(state, LoopStage::DONE);
	STATLEARN_TIMING_END("Learning loop");
	return result;
}

} // namespace statlearn

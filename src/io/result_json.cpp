#include "result_json.hpp"
#include <cmath>

namespace statlearn {
namespace io {

using nlohmann::json;
using namespace libstatlearn;

json NumberOrNull(double value) {
	if (!std::isfinite(value)) {
		return json(nullptr);
	}
	return json(value);
}

namespace {

json NumberArray(const std::vector<double> &values) {
	json arr = json::array();
	for (double v : values) {
		arr.push_back(NumberOrNull(v));
	}
	return arr;
}

json NumberArray(const Eigen::VectorXd &values) {
	json arr = json::array();
	for (Eigen::Index i = 0; i < values.size(); i++) {
		arr.push_back(NumberOrNull(values(i)));
	}
	return arr;
}

json Interval(double lower, double upper) {
	return json {{"lower", NumberOrNull(lower)}, {"upper", NumberOrNull(upper)}};
}

json MemberJson(const ensemble::EnsembleMember &member) {
	json j;
	j["id"] = member.id;
	j["name"] = member.name;
	j["type"] = ensemble::MemberTypeName(member.type);
	j["weight"] = NumberOrNull(member.weight);
	j["predictions"] = NumberArray(member.predictions);
	j["confidence"] = member.confidence ? NumberOrNull(*member.confidence) : json(nullptr);
	j["performance"] = {{"mae", NumberOrNull(member.performance.mae)},
	                    {"mse", NumberOrNull(member.performance.mse)},
	                    {"r2", NumberOrNull(member.performance.r2)},
	                    {"recent_accuracy", NumberOrNull(member.performance.recent_accuracy)}};
	return j;
}

} // namespace

json ToJson(const ensemble::EnsemblePrediction &prediction) {
	json contributions = json::array();
	for (const auto &c : prediction.model_contributions) {
		contributions.push_back(
		    {{"model_id", c.model_id}, {"prediction", NumberOrNull(c.prediction)}, {"weight", NumberOrNull(c.weight)}});
	}

	json j;
	j["value"] = NumberOrNull(prediction.value);
	j["confidence"] = NumberOrNull(prediction.confidence);
	j["uncertainty"] = NumberOrNull(prediction.uncertainty);
	j["interval"] = Interval(prediction.interval.lower, prediction.interval.upper);
	j["model_contributions"] = contributions;
	j["method"] = prediction.method;
	return j;
}

json ToJson(const detection::DataQualityReport &report) {
	json j;
	j["total_points"] = report.total_points;
	j["outlier_indices"] = report.outlier_indices;
	j["outlier_percentage"] = NumberOrNull(report.outlier_percentage);
	j["clean_values"] = NumberArray(report.clean_values);
	j["statistics"] = {{"mean", NumberOrNull(report.statistics.mean)},
	                   {"median", NumberOrNull(report.statistics.median)},
	                   {"std_dev", NumberOrNull(report.statistics.std_dev)},
	                   {"iqr", NumberOrNull(report.statistics.iqr)},
	                   {"mad", NumberOrNull(report.statistics.mad)}};
	return j;
}

json ToJson(const trend::TrendAnalysis &trend) {
	return json {{"direction", trend::TrendDirectionName(trend.direction)},
	             {"slope", NumberOrNull(trend.slope)},
	             {"confidence", NumberOrNull(trend.confidence)},
	             {"p_value", NumberOrNull(trend.p_value)},
	             {"kendall_tau", NumberOrNull(trend.kendall_tau)}};
}

json ToJson(const core::RegressionModel &model) {
	json j;
	j["model_type"] = core::RegressionVariantName(model.model_type);
	j["intercept"] = NumberOrNull(model.intercept);
	j["coefficients"] = NumberArray(model.coefficients);
	j["feature_names"] = model.feature_names;
	j["r2_score"] = NumberOrNull(model.r2_score);
	j["mse"] = NumberOrNull(model.mse);
	j["mae"] = NumberOrNull(model.mae);
	j["sample_count"] = model.sample_count;
	j["used_minimum_norm"] = model.used_minimum_norm;
	if (model.polynomial_degree > 0) {
		j["polynomial_degree"] = model.polynomial_degree;
	}
	return j;
}

json ToJson(const solvers::BayesianModel &model) {
	json intervals = json::array();
	for (const auto &ci : model.posterior.credible_intervals) {
		intervals.push_back(Interval(ci.lower, ci.upper));
	}

	json j;
	j["observations"] = model.observations;
	j["confidence"] = NumberOrNull(solvers::BayesianUpdater::Confidence(model));
	j["alpha"] = NumberOrNull(model.posterior.alpha);
	j["beta"] = NumberOrNull(model.posterior.beta);
	j["mean"] = NumberArray(model.posterior.mean);
	j["uncertainty"] = NumberArray(model.posterior.uncertainty);
	j["credible_intervals"] = intervals;
	return j;
}

json ToJson(const LearningState &state) {
	json stages = json::array();
	for (auto stage : state.completed_stages) {
		stages.push_back(LoopStageName(stage));
	}

	json members = json::array();
	for (const auto &m : state.ensemble_members) {
		members.push_back(MemberJson(m));
	}

	json j;
	j["observation_count"] = state.observation_count;
	j["completed_stages"] = stages;
	j["data_quality"] = ToJson(state.data_quality);
	j["trend"] = ToJson(state.trend);
	j["regression_model"] = state.regression_model ? ToJson(*state.regression_model) : json(nullptr);
	j["bayesian_model"] = state.bayesian_model ? ToJson(*state.bayesian_model) : json(nullptr);
	if (state.drift) {
		j["drift"] = {{"has_drift", state.drift->has_drift},
		              {"severity", NumberOrNull(state.drift->severity)},
		              {"recommendation", state.drift->recommendation}};
	} else {
		j["drift"] = nullptr;
	}
	j["ensemble"] = {{"method", ensemble::EnsembleMethodName(state.ensemble_config.method)},
	                 {"min_models", state.ensemble_config.min_models},
	                 {"adaptive_window", state.ensemble_config.adaptive_window},
	                 {"confidence_threshold", NumberOrNull(state.ensemble_config.confidence_threshold)},
	                 {"members", members}};
	j["performance"] = {{"mae", NumberOrNull(state.performance.mae)},
	                    {"mse", NumberOrNull(state.performance.mse)},
	                    {"r2", NumberOrNull(state.performance.r2)},
	                    {"confidence", NumberOrNull(state.performance.confidence)}};
	return j;
}

json ToJson(const LearningLoopResult &result) {
	json j;
	j["prediction"] = ToJson(result.prediction);
	j["recommendations"] = result.recommendations;
	j["insights"] = result.insights;
	j["state"] = ToJson(result.state);
	return j;
}

} // namespace io
} // namespace statlearn

#pragma once

#include "libstatlearn/utils/distributions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace ensemble {

enum class MemberType { REGRESSION, TIME_SERIES, BAYESIAN, CUSTOM };

inline std::string MemberTypeName(MemberType type) {
	switch (type) {
	case MemberType::REGRESSION:
		return "regression";
	case MemberType::TIME_SERIES:
		return "time_series";
	case MemberType::BAYESIAN:
		return "bayesian";
	case MemberType::CUSTOM:
		return "custom";
	}
	return "custom";
}

struct MemberPerformance {
	double mae = 0.0;
	double mse = 0.0;
	double r2 = 0.0;
	double recent_accuracy = 0.0;
};

/// Snapshot of one model taking part in the ensemble
struct EnsembleMember {
	std::string id;
	std::string name;
	MemberType type = MemberType::CUSTOM;

	/// Static weight; members with weight <= 0 are ignored by weighted averaging
	double weight = 1.0;

	MemberPerformance performance;

	/// Forecasts; only predictions[0] is combined
	std::vector<double> predictions;

	/// Self-reported confidence, performance.r2 is used when unset
	std::optional<double> confidence;
};

struct ModelContribution {
	std::string model_id;
	double prediction = 0.0;

	/// Normalized weight (sums to 1 over the contributions)
	double weight = 0.0;
};

struct PredictionInterval {
	double lower = -std::numeric_limits<double>::infinity();
	double upper = std::numeric_limits<double>::infinity();
};

struct EnsemblePrediction {
	double value = 0.0;
	double confidence = 0.0;

	/// Infinite when no usable model contributed
	double uncertainty = std::numeric_limits<double>::infinity();

	PredictionInterval interval;
	std::vector<ModelContribution> model_contributions;
	std::string method;

	bool has_finite_uncertainty() const {
		return std::isfinite(uncertainty);
	}
};

enum class EnsembleMethod { WEIGHTED_AVERAGE, MEDIAN, ADAPTIVE };

inline std::string EnsembleMethodName(EnsembleMethod method) {
	switch (method) {
	case EnsembleMethod::WEIGHTED_AVERAGE:
		return "weighted_average";
	case EnsembleMethod::MEDIAN:
		return "median";
	case EnsembleMethod::ADAPTIVE:
		return "adaptive";
	}
	return "adaptive";
}

inline EnsembleMethod ParseEnsembleMethod(const std::string &name) {
	if (name == "weighted_average") {
		return EnsembleMethod::WEIGHTED_AVERAGE;
	}
	if (name == "median") {
		return EnsembleMethod::MEDIAN;
	}
	if (name == "adaptive") {
		return EnsembleMethod::ADAPTIVE;
	}
	throw std::invalid_argument("unknown ensemble method '" + name + "'");
}

/**
 * Configuration of the ensemble combiner
 */
struct EnsembleConfig {
	/// Combination strategy
	/// Default: ADAPTIVE
	EnsembleMethod method = EnsembleMethod::ADAPTIVE;

	/// Fewer members than this yields the insufficient_models sentinel
	/// Default: 2
	size_t min_models = 2;

	/// Number of most recent errors per member used by ADAPTIVE
	/// Default: 10
	size_t adaptive_window = 10;

	/// Confidence a caller should require before acting on a prediction
	/// (informational, not applied by the combiner)
	/// Default: 0.5
	double confidence_threshold = 0.5;

	EnsembleConfig() = default;

	static EnsembleConfig WeightedAverage() {
		EnsembleConfig config;
		config.method = EnsembleMethod::WEIGHTED_AVERAGE;
		return config;
	}

	static EnsembleConfig Median() {
		EnsembleConfig config;
		config.method = EnsembleMethod::MEDIAN;
		return config;
	}

	static EnsembleConfig Adaptive(size_t window = 10) {
		EnsembleConfig config;
		config.method = EnsembleMethod::ADAPTIVE;
		config.adaptive_window = window;
		return config;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (adaptive_window == 0) {
			throw std::invalid_argument("adaptive_window must be at least 1");
		}
		if (confidence_threshold < 0.0 || confidence_threshold > 1.0) {
			throw std::invalid_argument("confidence_threshold must be in [0, 1] (got " +
			                            std::to_string(confidence_threshold) + ")");
		}
	}
};

/// Recent signed prediction errors per member id, oldest first
using RecentErrors = std::map<std::string, std::vector<double>>;

/// Properties of the training data used to pick a single best member
struct DataCharacteristics {
	bool has_outliers = false;
	bool is_trending = false;
	bool is_volatile = false;
	size_t sample_size = 0;
};

/**
 * Ensemble Combiner
 *
 * Strategies (all combine predictions[0] of each member):
 * - WEIGHTED_AVERAGE: weights normalized over members with weight > 0,
 *     value = sum w_i p_i, uncertainty = sqrt(sum w_i (p_i - value)²)
 * - MEDIAN: upper median of the predictions, uncertainty = 1.4826 * MAD
 * - ADAPTIVE: weight_i = 1 / (mean |recent error_i| + 0.01), static weight
 *     for members without history, then as WEIGHTED_AVERAGE
 *
 * Intervals are value +/- 1.96 * uncertainty.
 *
 * Design notes:
 * - Header-only
 * - Unusable input yields sentinels with infinite uncertainty, never NaN
 * - Stateless design (all methods are static)
 */
class EnsembleCombiner {
public:
	static constexpr double ERROR_EPSILON = 0.01;
	static constexpr double MAD_NORMAL_SCALE = 1.4826;

	/**
	 * Combine members with the configured strategy
	 *
	 * @param members Ensemble members, each with at least one prediction
	 * @param config Strategy and minimum member count
	 * @param recent_errors Optional error history for ADAPTIVE
	 * @throws std::invalid_argument if a member has no prediction or the
	 *         config is invalid
	 */
	static EnsemblePrediction Combine(const std::vector<EnsembleMember> &members,
	                                  const EnsembleConfig &config = EnsembleConfig(),
	                                  const RecentErrors *recent_errors = nullptr);

	static EnsemblePrediction WeightedAverage(const std::vector<EnsembleMember> &members);

	static EnsemblePrediction Median(const std::vector<EnsembleMember> &members);

	static EnsemblePrediction Adaptive(const std::vector<EnsembleMember> &members, const RecentErrors &recent_errors,
	                                   size_t window = 10);

	/**
	 * Damped multiplicative weight update after the actual value is known
	 *
	 * weight *= 1 + 0.1 (|ensemble error| / (|member error| + 0.01) - 1),
	 * clamped to [0.1, 5.0]
	 *
	 * @return Members with updated weights (input unchanged)
	 */
	static std::vector<EnsembleMember> UpdateModelWeights(const std::vector<EnsembleMember> &members, double actual,
	                                                      double predicted);

	/// Mean pairwise |difference| of first predictions, 0 for < 2 members
	static double CalculateDiversity(const std::vector<EnsembleMember> &members);

	/**
	 * Pick one member by r2, adjusted for the data characteristics
	 *
	 * @throws std::invalid_argument if members is empty
	 */
	static const EnsembleMember &SelectBestMember(const std::vector<EnsembleMember> &members,
	                                              const DataCharacteristics &characteristics);

	/// Sentinel: value 0, confidence 0, infinite uncertainty
	static EnsemblePrediction Unusable(const std::string &method);

	/// Member confidence, falling back to performance.r2
	static double MemberConfidence(const EnsembleMember &member);

private:
	static void RequirePredictions(const std::vector<EnsembleMember> &members);

	static EnsemblePrediction Weighted(const std::vector<EnsembleMember> &members, const std::vector<double> &weights,
	                                   const std::string &method);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline EnsemblePrediction EnsembleCombiner::Unusable(const std::string &method) {
	EnsemblePrediction p;
	p.value = 0.0;
	p.confidence = 0.0;
	p.uncertainty = std::numeric_limits<double>::infinity();
	p.interval = PredictionInterval();
	p.method = method;
	return p;
}

inline double EnsembleCombiner::MemberConfidence(const EnsembleMember &member) {
	return member.confidence ? *member.confidence : member.performance.r2;
}

inline void EnsembleCombiner::RequirePredictions(const std::vector<EnsembleMember> &members) {
	for (const auto &m : members) {
		if (m.predictions.empty()) {
			throw std::invalid_argument("ensemble member '" + m.id + "' has no prediction");
		}
	}
}

inline EnsemblePrediction EnsembleCombiner::Weighted(const std::vector<EnsembleMember> &members,
                                                     const std::vector<double> &weights, const std::string &method) {
	double total = 0.0;
	for (double w : weights) {
		if (w > 0.0) {
			total += w;
		}
	}
	if (!(total > 0.0) || !std::isfinite(total)) {
		return Unusable(method);
	}

	EnsemblePrediction result;
	result.method = method;

	for (size_t i = 0; i < members.size(); i++) {
		if (weights[i] > 0.0) {
			const double w = weights[i] / total;
			result.value += w * members[i].predictions[0];
			result.confidence += w * MemberConfidence(members[i]);
			result.model_contributions.push_back({members[i].id, members[i].predictions[0], w});
		}
	}

	double variance = 0.0;
	for (const auto &c : result.model_contributions) {
		const double diff = c.prediction - result.value;
		variance += c.weight * diff * diff;
	}
	result.uncertainty = std::sqrt(variance);
	result.interval = {result.value - utils::Z_95 * result.uncertainty,
	                   result.value + utils::Z_95 * result.uncertainty};
	return result;
}

inline EnsemblePrediction EnsembleCombiner::WeightedAverage(const std::vector<EnsembleMember> &members) {
	RequirePredictions(members);
	std::vector<double> weights;
	weights.reserve(members.size());
	for (const auto &m : members) {
		weights.push_back(m.weight);
	}
	return Weighted(members, weights, "weighted_average");
}

inline EnsemblePrediction EnsembleCombiner::Median(const std::vector<EnsembleMember> &members) {
	RequirePredictions(members);
	if (members.empty()) {
		return Unusable("median");
	}

	std::vector<double> predictions;
	predictions.reserve(members.size());
	for (const auto &m : members) {
		predictions.push_back(m.predictions[0]);
	}

	auto sorted = predictions;
	std::sort(sorted.begin(), sorted.end());
	const double value = sorted[sorted.size() / 2];

	std::vector<double> deviations;
	deviations.reserve(predictions.size());
	for (double p : predictions) {
		deviations.push_back(std::abs(p - value));
	}
	std::sort(deviations.begin(), deviations.end());
	const double mad = deviations[deviations.size() / 2];

	EnsemblePrediction result;
	result.method = "median";
	result.value = value;
	result.uncertainty = MAD_NORMAL_SCALE * mad;
	result.interval = {value - utils::Z_95 * result.uncertainty, value + utils::Z_95 * result.uncertainty};

	const double share = 1.0 / static_cast<double>(members.size());
	for (const auto &m : members) {
		result.confidence += MemberConfidence(m);
		result.model_contributions.push_back({m.id, m.predictions[0], share});
	}
	result.confidence /= static_cast<double>(members.size());
	return result;
}

inline EnsemblePrediction EnsembleCombiner::Adaptive(const std::vector<EnsembleMember> &members,
                                                     const RecentErrors &recent_errors, size_t window) {
	RequirePredictions(members);

	std::vector<double> weights;
	weights.reserve(members.size());
	for (const auto &m : members) {
		auto it = recent_errors.find(m.id);
		if (it == recent_errors.end() || it->second.empty()) {
			weights.push_back(m.weight);
			continue;
		}

		// Mean absolute error over the most recent `window` entries
		const auto &errors = it->second;
		const size_t start = errors.size() > window ? errors.size() - window : 0;
		double sum = 0.0;
		for (size_t k = start; k < errors.size(); k++) {
			sum += std::abs(errors[k]);
		}
		const double mae = sum / static_cast<double>(errors.size() - start);
		weights.push_back(1.0 / (mae + ERROR_EPSILON));
	}
	return Weighted(members, weights, "adaptive");
}

inline EnsemblePrediction EnsembleCombiner::Combine(const std::vector<EnsembleMember> &members,
                                                    const EnsembleConfig &config, const RecentErrors *recent_errors) {
	config.Validate();

	if (members.size() < config.min_models) {
		return Unusable("insufficient_models");
	}
	RequirePredictions(members);

	switch (config.method) {
	case EnsembleMethod::WEIGHTED_AVERAGE:
		return WeightedAverage(members);
	case EnsembleMethod::MEDIAN:
		return Median(members);
	case EnsembleMethod::ADAPTIVE: {
		bool any_history = false;
		if (recent_errors) {
			for (const auto &m : members) {
				auto it = recent_errors->find(m.id);
				if (it != recent_errors->end() && !it->second.empty()) {
					any_history = true;
					break;
				}
			}
		}
		if (!any_history) {
			return WeightedAverage(members);
		}
		return Adaptive(members, *recent_errors, config.adaptive_window);
	}
	}
	return WeightedAverage(members);
}

inline std::vector<EnsembleMember> EnsembleCombiner::UpdateModelWeights(const std::vector<EnsembleMember> &members,
                                                                        double actual, double predicted) {
	RequirePredictions(members);

	const double learning_rate = 0.1;
	const double ensemble_error = std::abs(predicted - actual);

	std::vector<EnsembleMember> updated = members;
	for (auto &m : updated) {
		const double member_error = std::abs(m.predictions[0] - actual);
		const double ratio = ensemble_error / (member_error + ERROR_EPSILON);
		const double weight = m.weight * (1.0 + learning_rate * (ratio - 1.0));
		m.weight = std::max(0.1, std::min(5.0, weight));
	}
	return updated;
}

inline double EnsembleCombiner::CalculateDiversity(const std::vector<EnsembleMember> &members) {
	if (members.size() < 2) {
		return 0.0;
	}
	RequirePredictions(members);

	double total = 0.0;
	size_t comparisons = 0;
	for (size_t i = 0; i < members.size(); i++) {
		for (size_t j = i + 1; j < members.size(); j++) {
			total += std::abs(members[i].predictions[0] - members[j].predictions[0]);
			comparisons++;
		}
	}
	return total / static_cast<double>(comparisons);
}

inline const EnsembleMember &EnsembleCombiner::SelectBestMember(const std::vector<EnsembleMember> &members,
                                                                const DataCharacteristics &characteristics) {
	if (members.empty()) {
		throw std::invalid_argument("SelectBestMember requires at least one member");
	}

	const EnsembleMember *best = &members[0];
	double best_score = 0.0;

	for (const auto &m : members) {
		double score = m.performance.r2;

		if (m.type == MemberType::BAYESIAN && characteristics.sample_size < 20) {
			score *= 1.3;
		}
		if (characteristics.has_outliers && m.type == MemberType::REGRESSION) {
			score *= 1.2;
		}
		if (characteristics.is_trending && m.type == MemberType::TIME_SERIES) {
			score *= 1.4;
		}
		// Penalize members much noisier than the current pick
		if (characteristics.is_volatile && m.performance.mse > 1.5 * best->performance.mse) {
			score *= 0.8;
		}

		if (score > best_score) {
			best_score = score;
			best = &m;
		}
	}
	return *best;
}

} // namespace ensemble
} // namespace libstatlearn

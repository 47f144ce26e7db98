#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include "libstatlearn/utils/distributions.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace libstatlearn {
namespace trend {

enum class TrendDirection { INCREASING, DECREASING, STABLE };

inline std::string TrendDirectionName(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::INCREASING:
		return "increasing";
	case TrendDirection::DECREASING:
		return "decreasing";
	case TrendDirection::STABLE:
		return "stable";
	}
	return "stable";
}

struct TrendAnalysis {
	/// STABLE whenever p_value >= SIGNIFICANCE_LEVEL, whatever the slope sign
	TrendDirection direction = TrendDirection::STABLE;

	/// Sen's slope in units per day
	double slope = 0.0;

	/// 1 - p_value (0 for too-short series)
	double confidence = 0.0;

	double p_value = 1.0;

	double kendall_tau = 0.0;
};

/**
 * Trend Analyzer: Mann-Kendall test with Sen's slope
 *
 * For a series x_1..x_n ordered by time:
 *   S      = sum_{i<j} sign(x_j - x_i)
 *   Var(S) = n(n-1)(2n+5) / 18               (no tie correction)
 *   Z      = (S - 1)/sqrt(Var) if S > 0, (S + 1)/sqrt(Var) if S < 0, else 0
 *   p      = 2 (1 - Phi(|Z|))
 *   tau    = S / (n(n-1)/2)
 *   slope  = upper median of (x_j - x_i) / days(t_i, t_j) over pairs with a
 *            strictly positive day gap
 *
 * Design notes:
 * - Requires n >= 4, shorter series are reported as stable with p = 1
 * - Input may be in any order; a stably sorted copy is analysed
 * - Stateless design (all methods are static)
 */
class TrendAnalyzer {
public:
	static constexpr size_t MIN_POINTS = 4;
	static constexpr double SIGNIFICANCE_LEVEL = 0.05;

	static TrendAnalysis DetectTrend(const std::vector<core::TimeSeriesPoint> &series);

	/// Mann-Kendall S statistic of values in the given order
	static long long KendallS(const std::vector<double> &values);

	/// Sen's slope per day; 0 when no pair has a positive time gap
	static double SensSlope(const std::vector<core::TimeSeriesPoint> &ordered);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline long long TrendAnalyzer::KendallS(const std::vector<double> &values) {
	long long s = 0;
	const size_t n = values.size();
	for (size_t i = 0; i + 1 < n; i++) {
		for (size_t j = i + 1; j < n; j++) {
			if (values[j] > values[i]) {
				s++;
			} else if (values[j] < values[i]) {
				s--;
			}
		}
	}
	return s;
}

inline double TrendAnalyzer::SensSlope(const std::vector<core::TimeSeriesPoint> &ordered) {
	std::vector<double> slopes;
	const size_t n = ordered.size();
	for (size_t i = 0; i + 1 < n; i++) {
		for (size_t j = i + 1; j < n; j++) {
			const double days = core::DaysBetween(ordered[i].timestamp, ordered[j].timestamp);
			if (days > 0.0) {
				slopes.push_back((ordered[j].value - ordered[i].value) / days);
			}
		}
	}
	if (slopes.empty()) {
		return 0.0;
	}
	std::sort(slopes.begin(), slopes.end());
	return slopes[slopes.size() / 2];
}

inline TrendAnalysis TrendAnalyzer::DetectTrend(const std::vector<core::TimeSeriesPoint> &series) {
	TrendAnalysis result;
	const size_t n = series.size();
	if (n < MIN_POINTS) {
		return result;
	}

	auto ordered = series;
	std::stable_sort(ordered.begin(), ordered.end(),
	                 [](const core::TimeSeriesPoint &a, const core::TimeSeriesPoint &b) {
		                 return a.timestamp < b.timestamp;
	                 });

	std::vector<double> values;
	values.reserve(n);
	for (const auto &p : ordered) {
		values.push_back(p.value);
	}

	const double s = static_cast<double>(KendallS(values));
	const double n_dbl = static_cast<double>(n);
	const double var_s = n_dbl * (n_dbl - 1.0) * (2.0 * n_dbl + 5.0) / 18.0;
	const double std_s = std::sqrt(var_s);

	// Continuity correction toward zero
	double z = 0.0;
	if (s > 0.0) {
		z = (s - 1.0) / std_s;
	} else if (s < 0.0) {
		z = (s + 1.0) / std_s;
	}

	result.p_value = utils::normal_two_tailed_pvalue(z);
	result.kendall_tau = s / (n_dbl * (n_dbl - 1.0) / 2.0);
	result.slope = SensSlope(ordered);
	result.confidence = 1.0 - result.p_value;

	// A zero slope (no positive time gaps) carries no direction
	if (result.p_value < SIGNIFICANCE_LEVEL && result.slope > 0.0) {
		result.direction = TrendDirection::INCREASING;
	} else if (result.p_value < SIGNIFICANCE_LEVEL && result.slope < 0.0) {
		result.direction = TrendDirection::DECREASING;
	} else {
		result.direction = TrendDirection::STABLE;
	}

	return result;
}

} // namespace trend
} // namespace libstatlearn

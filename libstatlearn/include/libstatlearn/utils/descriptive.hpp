#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace utils {

/**
 * Descriptive statistics shared by the detectors, forecasters and the
 * ensemble combiner.
 *
 * Conventions:
 * - Variances are population variances (divide by n)
 * - Median is the upper median sorted[n/2], quartiles are sorted[floor(n*q)],
 *   so every statistic is an element of (or derived from) the input
 */

inline void RequireNonEmpty(const std::vector<double> &values, const char *what) {
	if (values.empty()) {
		throw std::invalid_argument(std::string(what) + " requires at least one value");
	}
}

inline double Mean(const std::vector<double> &values) {
	RequireNonEmpty(values, "Mean");
	double sum = 0.0;
	for (double v : values) {
		sum += v;
	}
	return sum / static_cast<double>(values.size());
}

inline double PopulationVariance(const std::vector<double> &values) {
	const double mean = Mean(values);
	double ss = 0.0;
	for (double v : values) {
		ss += (v - mean) * (v - mean);
	}
	return ss / static_cast<double>(values.size());
}

inline double PopulationStdDev(const std::vector<double> &values) {
	return std::sqrt(PopulationVariance(values));
}

inline std::vector<double> Sorted(std::vector<double> values) {
	std::sort(values.begin(), values.end());
	return values;
}

/// Element at floor(n * q) of the sorted values, q in [0, 1)
inline double QuantileFloor(const std::vector<double> &values, double q) {
	RequireNonEmpty(values, "QuantileFloor");
	auto sorted = Sorted(values);
	auto idx = static_cast<size_t>(std::floor(static_cast<double>(sorted.size()) * q));
	if (idx >= sorted.size()) {
		idx = sorted.size() - 1;
	}
	return sorted[idx];
}

inline double UpperMedian(const std::vector<double> &values) {
	RequireNonEmpty(values, "UpperMedian");
	auto sorted = Sorted(values);
	return sorted[sorted.size() / 2];
}

/// median(|x_i - center|)
inline double MedianAbsoluteDeviation(const std::vector<double> &values, double center) {
	RequireNonEmpty(values, "MedianAbsoluteDeviation");
	std::vector<double> deviations;
	deviations.reserve(values.size());
	for (double v : values) {
		deviations.push_back(std::abs(v - center));
	}
	return UpperMedian(deviations);
}

inline double MedianAbsoluteDeviation(const std::vector<double> &values) {
	return MedianAbsoluteDeviation(values, UpperMedian(values));
}

} // namespace utils
} // namespace libstatlearn

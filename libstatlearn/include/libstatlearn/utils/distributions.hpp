#pragma once

#include <cmath>

namespace libstatlearn {
namespace utils {

/**
 * Standard normal CDF
 *
 * Abramowitz & Stegun 26.2.17 polynomial approximation, absolute error
 * below 7.5e-8. Closed form, no special-function library required.
 */
inline double normal_cdf(double z) {
	const double t = 1.0 / (1.0 + 0.2316419 * std::abs(z));
	const double d = 0.3989423 * std::exp(-z * z / 2.0);
	const double p =
	    d * t * (0.3193815 + t * (-0.3565638 + t * (1.781478 + t * (-1.821256 + t * 1.330274))));
	return z > 0.0 ? 1.0 - p : p;
}

/// Two-tailed p-value for a standard normal test statistic
inline double normal_two_tailed_pvalue(double z) {
	double p = 2.0 * (1.0 - normal_cdf(std::abs(z)));
	if (p < 0.0) {
		return 0.0;
	}
	if (p > 1.0) {
		return 1.0;
	}
	return p;
}

/// z critical value of the 95% two-sided normal interval
constexpr double Z_95 = 1.96;

} // namespace utils
} // namespace libstatlearn

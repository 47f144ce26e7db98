#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include "libstatlearn/utils/descriptive.hpp"
#include "libstatlearn/utils/distributions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace forecast {

struct ForecastResult {
	/// Point forecasts for steps 1..horizon
	std::vector<double> predictions;

	/// 95% band, same length as predictions
	std::vector<double> lower_bound;
	std::vector<double> upper_bound;

	/// In-sample fit quality max(0, 1 - mse/variance), 0 when unusable
	double confidence = 0.0;

	std::string method;

	bool empty() const {
		return predictions.empty();
	}
};

/// Additive decomposition: value = trend + seasonal + residual
struct SeriesDecomposition {
	std::vector<double> trend;
	std::vector<double> seasonal;
	std::vector<double> residual;
};

/**
 * Time-Series Forecaster
 *
 * Methods:
 * - TripleExponentialSmoothing: Holt level/trend smoothing
 *     level_t = a x_t + (1-a)(level_{t-1} + trend_{t-1})
 *     trend_t = b (level_t - level_{t-1}) + (1-b) trend_{t-1}
 *     forecast_h = level_n + h trend_n
 *   initialised with level = x_0, trend = (x_{n-1} - x_0)/n
 * - AdaptiveMovingAverage: window picked from {3,5,7,10,14} by one-step
 *   backtest MSE, flat forecast
 * - DecomposeSeries: centred moving-average trend plus mean seasonal profile
 * - Autocorrelation: sample ACF up to max_lag
 *
 * Series are taken in the order given; timestamps are carried but unused.
 *
 * Design notes:
 * - Header-only
 * - Too-short series return an empty forecast with confidence 0
 * - Stateless design (all methods are static)
 */
class TimeSeriesForecaster {
public:
	static ForecastResult TripleExponentialSmoothing(const std::vector<core::TimeSeriesPoint> &series,
	                                                 double alpha = 0.3, double beta = 0.1, size_t horizon = 7);

	static ForecastResult AdaptiveMovingAverage(const std::vector<core::TimeSeriesPoint> &series,
	                                            size_t horizon = 7);

	/**
	 * Split a series into trend, seasonal and residual components
	 *
	 * @param series Values in time order
	 * @param period Season length (default weekly)
	 * @return Components of the same length as the series; for n < 2*period
	 *         the trend is the series itself and the rest is zero
	 * @throws std::invalid_argument if period == 0
	 */
	static SeriesDecomposition DecomposeSeries(const std::vector<core::TimeSeriesPoint> &series, size_t period = 7);

	/**
	 * Sample autocorrelation for lags 0..min(max_lag, n-1)
	 *
	 * @return Empty for an empty or constant series
	 */
	static std::vector<double> Autocorrelation(const std::vector<core::TimeSeriesPoint> &series, size_t max_lag = 14);

	static std::vector<double> Values(const std::vector<core::TimeSeriesPoint> &series);

private:
	/// Windows tried by AdaptiveMovingAverage, in preference order on ties
	static const std::vector<size_t> &CandidateWindows();
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<double> TimeSeriesForecaster::Values(const std::vector<core::TimeSeriesPoint> &series) {
	std::vector<double> values;
	values.reserve(series.size());
	for (const auto &p : series) {
		values.push_back(p.value);
	}
	return values;
}

inline const std::vector<size_t> &TimeSeriesForecaster::CandidateWindows() {
	static const std::vector<size_t> windows = {3, 5, 7, 10, 14};
	return windows;
}

inline ForecastResult TimeSeriesForecaster::TripleExponentialSmoothing(const std::vector<core::TimeSeriesPoint> &series,
                                                                       double alpha, double beta, size_t horizon) {
	if (alpha < 0.0 || alpha > 1.0 || beta < 0.0 || beta > 1.0) {
		throw std::invalid_argument("smoothing factors must lie in [0, 1]");
	}

	ForecastResult result;
	result.method = "triple_exponential_smoothing";

	const auto values = Values(series);
	const size_t n = values.size();
	if (n < 3) {
		return result;
	}

	double level = values[0];
	double trend = (values[n - 1] - values[0]) / static_cast<double>(n);

	std::vector<double> levels;
	levels.reserve(n);
	levels.push_back(level);

	for (size_t i = 1; i < n; i++) {
		const double prev_level = level;
		const double prev_trend = trend;
		level = alpha * values[i] + (1.0 - alpha) * (prev_level + prev_trend);
		trend = beta * (level - prev_level) + (1.0 - beta) * prev_trend;
		levels.push_back(level);
	}

	// Residuals of the smoothed levels against the observations
	double ss = 0.0;
	for (size_t i = 0; i < n; i++) {
		const double r = values[i] - levels[i];
		ss += r * r;
	}
	const double sigma = std::sqrt(ss / static_cast<double>(n - 1));

	for (size_t h = 1; h <= horizon; h++) {
		const double p = level + static_cast<double>(h) * trend;
		result.predictions.push_back(p);
		result.lower_bound.push_back(p - utils::Z_95 * sigma);
		result.upper_bound.push_back(p + utils::Z_95 * sigma);
	}

	const double mse = ss / static_cast<double>(n);
	const double variance = utils::PopulationVariance(values);
	result.confidence = variance > 0.0 ? std::max(0.0, 1.0 - mse / variance) : 0.0;
	return result;
}

inline ForecastResult TimeSeriesForecaster::AdaptiveMovingAverage(const std::vector<core::TimeSeriesPoint> &series,
                                                                  size_t horizon) {
	ForecastResult result;
	const auto values = Values(series);
	const size_t n = values.size();

	size_t best_window = 0;
	double best_mse = std::numeric_limits<double>::infinity();

	for (size_t window : CandidateWindows()) {
		if (static_cast<double>(window) > static_cast<double>(n) / 2.0) {
			continue;
		}

		// One-step-ahead backtest over every position with a full window
		double ss = 0.0;
		size_t count = 0;
		for (size_t i = window; i < n; i++) {
			double sum = 0.0;
			for (size_t k = i - window; k < i; k++) {
				sum += values[k];
			}
			const double err = sum / static_cast<double>(window) - values[i];
			ss += err * err;
			count++;
		}
		const double mse = ss / static_cast<double>(count);
		if (mse < best_mse) {
			best_mse = mse;
			best_window = window;
		}
	}

	if (best_window == 0) {
		result.method = "moving_average";
		return result;
	}

	result.method = "moving_average_" + std::to_string(best_window);

	double sum = 0.0;
	for (size_t k = n - best_window; k < n; k++) {
		sum += values[k];
	}
	const double forecast = sum / static_cast<double>(best_window);
	const double sigma = std::sqrt(best_mse);

	result.predictions.assign(horizon, forecast);
	result.lower_bound.assign(horizon, forecast - utils::Z_95 * sigma);
	result.upper_bound.assign(horizon, forecast + utils::Z_95 * sigma);

	const double variance = utils::PopulationVariance(values);
	result.confidence = variance > 0.0 ? std::max(0.0, 1.0 - best_mse / variance) : 0.0;
	return result;
}

inline SeriesDecomposition TimeSeriesForecaster::DecomposeSeries(const std::vector<core::TimeSeriesPoint> &series,
                                                                 size_t period) {
	if (period == 0) {
		throw std::invalid_argument("decomposition period must be positive");
	}

	const auto values = Values(series);
	const size_t n = values.size();

	SeriesDecomposition out;
	if (n < 2 * period) {
		out.trend = values;
		out.seasonal.assign(n, 0.0);
		out.residual.assign(n, 0.0);
		return out;
	}

	// Centred moving average over 2*half+1 points, normalised by period
	const size_t half = period / 2;
	out.trend.assign(n, 0.0);
	for (size_t i = half; i < n - half; i++) {
		double sum = 0.0;
		for (size_t j = i - half; j <= i + half; j++) {
			sum += values[j];
		}
		out.trend[i] = sum / static_cast<double>(period);
	}

	// Hold the edge values flat
	for (size_t i = 0; i < half; i++) {
		out.trend[i] = out.trend[half];
		out.trend[n - 1 - i] = out.trend[n - 1 - half];
	}

	std::vector<double> profile(period, 0.0);
	std::vector<size_t> counts(period, 0);
	for (size_t i = 0; i < n; i++) {
		profile[i % period] += values[i] - out.trend[i];
		counts[i % period]++;
	}

	double profile_mean = 0.0;
	for (size_t s = 0; s < period; s++) {
		profile[s] /= static_cast<double>(counts[s]);
		profile_mean += profile[s];
	}
	profile_mean /= static_cast<double>(period);
	for (auto &v : profile) {
		v -= profile_mean;
	}

	out.seasonal.resize(n);
	out.residual.resize(n);
	for (size_t i = 0; i < n; i++) {
		out.seasonal[i] = profile[i % period];
		out.residual[i] = values[i] - out.trend[i] - out.seasonal[i];
	}
	return out;
}

inline std::vector<double> TimeSeriesForecaster::Autocorrelation(const std::vector<core::TimeSeriesPoint> &series,
                                                                 size_t max_lag) {
	std::vector<double> acf;
	const auto values = Values(series);
	const size_t n = values.size();
	if (n == 0) {
		return acf;
	}

	const double mean = utils::Mean(values);
	const double variance = utils::PopulationVariance(values);
	if (variance == 0.0) {
		return acf;
	}

	for (size_t lag = 0; lag <= max_lag && lag < n; lag++) {
		double sum = 0.0;
		for (size_t i = lag; i < n; i++) {
			sum += (values[i] - mean) * (values[i - lag] - mean);
		}
		acf.push_back(sum / static_cast<double>(n) / variance);
	}
	return acf;
}

} // namespace forecast
} // namespace libstatlearn

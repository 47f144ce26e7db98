#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include "libstatlearn/utils/descriptive.hpp"
#include "libstatlearn/utils/linear_algebra.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace libstatlearn {
namespace detection {

enum class OutlierMethod { Z_SCORE, MODIFIED_Z_SCORE, IQR, MAHALANOBIS, TIME_SERIES_WINDOW };

inline std::string OutlierMethodName(OutlierMethod method) {
	switch (method) {
	case OutlierMethod::Z_SCORE:
		return "z_score";
	case OutlierMethod::MODIFIED_Z_SCORE:
		return "modified_z_score";
	case OutlierMethod::IQR:
		return "iqr";
	case OutlierMethod::MAHALANOBIS:
		return "mahalanobis";
	case OutlierMethod::TIME_SERIES_WINDOW:
		return "time_series_window";
	}
	return "modified_z_score";
}

inline OutlierMethod ParseOutlierMethod(const std::string &name) {
	if (name == "z_score") {
		return OutlierMethod::Z_SCORE;
	}
	if (name == "modified_z_score") {
		return OutlierMethod::MODIFIED_Z_SCORE;
	}
	if (name == "iqr") {
		return OutlierMethod::IQR;
	}
	if (name == "mahalanobis") {
		return OutlierMethod::MAHALANOBIS;
	}
	if (name == "time_series_window") {
		return OutlierMethod::TIME_SERIES_WINDOW;
	}
	throw std::invalid_argument("unknown outlier method '" + name + "'");
}

/// Verdict for a single observation
struct OutlierResult {
	bool is_outlier = false;

	/// Method-specific magnitude (|z|, |modified z|, normalized IQR distance,
	/// Mahalanobis distance). 0 means "not anomalous at all".
	double score = 0.0;

	std::string method;

	/// Human readable explanation, empty for inliers
	std::string reason;
};

/// Summary statistics computed over the original, uncleaned series
struct SeriesStatistics {
	double mean = 0.0;
	double median = 0.0;
	double std_dev = 0.0;
	double iqr = 0.0;
	double mad = 0.0;
};

struct DataQualityReport {
	size_t total_points = 0;

	/// Indices into the input series, ascending, never renumbered
	std::vector<size_t> outlier_indices;

	/// Percentage in [0, 100]
	double outlier_percentage = 0.0;

	/// Retained values in input order
	std::vector<double> clean_values;

	SeriesStatistics statistics;
};

/**
 * Outlier Detector
 *
 * Univariate tests:
 * - Z-score:            |x - mean| / std > threshold (default 3)
 * - Modified Z-score:   |0.6745 (x - median) / MAD| > threshold (default 3.5)
 * - IQR:                x outside [Q1 - k*IQR, Q3 + k*IQR] (default k = 1.5)
 * - Time-series window: local z-score against a centred window that
 *                       excludes the point (default threshold 2.5)
 *
 * Multivariate test:
 * - Mahalanobis:        sqrt(|d' S^-1 d|) > threshold (default 3), with the
 *                       identity substituted for a singular covariance S
 *
 * Design notes:
 * - Header-only
 * - One result per input value, in input order
 * - Degenerate spread (std = 0, MAD = 0, IQR = 0) yields score 0 instead of
 *   NaN/Inf so constant data never produces false positives
 * - Stateless design (all methods are static)
 */
class OutlierDetector {
public:
	/// Threshold used when a negative threshold (auto) is passed
	static double DefaultThreshold(OutlierMethod method);

	/**
	 * Run one detector over a scalar series
	 *
	 * MAHALANOBIS treats each value as a one-dimensional point and
	 * TIME_SERIES_WINDOW uses input order as time order.
	 *
	 * @param values Series to test
	 * @param method Detection method
	 * @param threshold Decision threshold (IQR multiplier for IQR); -1 = default
	 * @return One OutlierResult per value
	 */
	static std::vector<OutlierResult> Detect(const std::vector<double> &values, OutlierMethod method,
	                                         double threshold = -1.0);

	static std::vector<OutlierResult> DetectZScore(const std::vector<double> &values, double threshold = 3.0);

	static std::vector<OutlierResult> DetectModifiedZScore(const std::vector<double> &values,
	                                                       double threshold = 3.5);

	static std::vector<OutlierResult> DetectIQR(const std::vector<double> &values, double multiplier = 1.5);

	/**
	 * Mahalanobis distance test over multi-feature rows
	 *
	 * @param rows One feature vector per observation, all of equal width
	 * @param threshold Distance threshold
	 * @param singular_covariance Optional out-flag, set when the identity was used
	 * @throws std::invalid_argument on ragged rows
	 */
	static std::vector<OutlierResult> DetectMultivariate(const std::vector<std::vector<double>> &rows,
	                                                     double threshold = 3.0,
	                                                     bool *singular_covariance = nullptr);

	/**
	 * Local z-score against the centred window [i - window, i + window],
	 * clipped at the series ends and excluding point i itself
	 */
	static std::vector<OutlierResult> DetectTimeSeries(const std::vector<double> &values, size_t window = 7,
	                                                   double threshold = 2.5);

	static std::vector<OutlierResult> DetectTimeSeries(const std::vector<core::TimeSeriesPoint> &points,
	                                                   size_t window = 7, double threshold = 2.5);

	/**
	 * Run a univariate detector and summarize the series
	 *
	 * @param values Series to clean
	 * @param method Z_SCORE, MODIFIED_Z_SCORE or IQR
	 * @return Report with outlier indices, clean values and statistics of
	 *         the original series
	 * @throws std::invalid_argument for a non-univariate method
	 */
	static DataQualityReport GenerateDataQualityReport(const std::vector<double> &values,
	                                                   OutlierMethod method = OutlierMethod::MODIFIED_Z_SCORE);

	/// Mean, median, std-dev, IQR and MAD of a series (zeros when empty)
	static SeriesStatistics Summarize(const std::vector<double> &values);

private:
	static std::string FormatFixed(double value, int precision);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::string OutlierDetector::FormatFixed(double value, int precision) {
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(precision) << value;
	return oss.str();
}

inline double OutlierDetector::DefaultThreshold(OutlierMethod method) {
	switch (method) {
	case OutlierMethod::Z_SCORE:
		return 3.0;
	case OutlierMethod::MODIFIED_Z_SCORE:
		return 3.5;
	case OutlierMethod::IQR:
		return 1.5;
	case OutlierMethod::MAHALANOBIS:
		return 3.0;
	case OutlierMethod::TIME_SERIES_WINDOW:
		return 2.5;
	}
	return 3.0;
}

inline std::vector<OutlierResult> OutlierDetector::Detect(const std::vector<double> &values, OutlierMethod method,
                                                          double threshold) {
	const double t = threshold < 0.0 ? DefaultThreshold(method) : threshold;

	switch (method) {
	case OutlierMethod::Z_SCORE:
		return DetectZScore(values, t);
	case OutlierMethod::MODIFIED_Z_SCORE:
		return DetectModifiedZScore(values, t);
	case OutlierMethod::IQR:
		return DetectIQR(values, t);
	case OutlierMethod::MAHALANOBIS: {
		std::vector<std::vector<double>> rows;
		rows.reserve(values.size());
		for (double v : values) {
			rows.push_back({v});
		}
		return DetectMultivariate(rows, t);
	}
	case OutlierMethod::TIME_SERIES_WINDOW:
		return DetectTimeSeries(values, 7, t);
	}
	throw std::invalid_argument("unknown outlier method");
}

inline std::vector<OutlierResult> OutlierDetector::DetectZScore(const std::vector<double> &values,
                                                                double threshold) {
	std::vector<OutlierResult> results;
	if (values.empty()) {
		return results;
	}

	const double mean = utils::Mean(values);
	const double std_dev = utils::PopulationStdDev(values);

	results.reserve(values.size());
	for (double value : values) {
		OutlierResult r;
		r.method = "z_score";
		r.score = std_dev == 0.0 ? 0.0 : std::abs((value - mean) / std_dev);
		r.is_outlier = r.score > threshold;
		if (r.is_outlier) {
			r.reason = FormatFixed(r.score, 2) + " standard deviations from mean (threshold: " +
			           FormatFixed(threshold, 1) + ")";
		}
		results.push_back(std::move(r));
	}
	return results;
}

inline std::vector<OutlierResult> OutlierDetector::DetectModifiedZScore(const std::vector<double> &values,
                                                                        double threshold) {
	std::vector<OutlierResult> results;
	if (values.empty()) {
		return results;
	}

	const double median = utils::UpperMedian(values);
	const double mad = utils::MedianAbsoluteDeviation(values, median);

	results.reserve(values.size());
	for (double value : values) {
		OutlierResult r;
		r.method = "modified_z_score";
		// MAD = 0 means at least half the values coincide; score them all 0
		const double modified_z = mad == 0.0 ? 0.0 : 0.6745 * (value - median) / mad;
		r.score = std::abs(modified_z);
		r.is_outlier = r.score > threshold;
		if (r.is_outlier) {
			r.reason = "Modified Z-score: " + FormatFixed(r.score, 2) + " (threshold: " + FormatFixed(threshold, 1) +
			           ")";
		}
		results.push_back(std::move(r));
	}
	return results;
}

inline std::vector<OutlierResult> OutlierDetector::DetectIQR(const std::vector<double> &values, double multiplier) {
	std::vector<OutlierResult> results;
	if (values.empty()) {
		return results;
	}

	const double q1 = utils::QuantileFloor(values, 0.25);
	const double q3 = utils::QuantileFloor(values, 0.75);
	const double iqr = q3 - q1;
	const double lower = q1 - multiplier * iqr;
	const double upper = q3 + multiplier * iqr;

	results.reserve(values.size());
	for (double value : values) {
		OutlierResult r;
		r.method = "iqr";
		r.is_outlier = value < lower || value > upper;

		double distance = 0.0;
		if (value < lower) {
			distance = lower - value;
		} else if (value > upper) {
			distance = value - upper;
		}
		r.score = iqr > 0.0 ? distance / iqr : distance;

		if (r.is_outlier) {
			r.reason = "Outside bounds [" + FormatFixed(lower, 1) + ", " + FormatFixed(upper, 1) + "]";
		}
		results.push_back(std::move(r));
	}
	return results;
}

inline std::vector<OutlierResult> OutlierDetector::DetectMultivariate(const std::vector<std::vector<double>> &rows,
                                                                      double threshold, bool *singular_covariance) {
	std::vector<OutlierResult> results;
	if (singular_covariance) {
		*singular_covariance = false;
	}
	if (rows.empty()) {
		return results;
	}

	const size_t n = rows.size();
	const size_t m = rows[0].size();
	for (const auto &row : rows) {
		if (row.size() != m) {
			throw std::invalid_argument("DetectMultivariate: all rows must have the same number of features");
		}
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(m));
	for (size_t i = 0; i < n; i++) {
		for (size_t j = 0; j < m; j++) {
			X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}

	// Population mean vector and covariance
	const Eigen::RowVectorXd means = X.colwise().mean();
	const Eigen::MatrixXd centered = X.rowwise() - means;
	const Eigen::MatrixXd covariance = (centered.transpose() * centered) / static_cast<double>(n);

	const Eigen::MatrixXd inv_cov = utils::InvertOrIdentity(covariance, 1e-10, singular_covariance);

	results.reserve(n);
	for (size_t i = 0; i < n; i++) {
		const Eigen::VectorXd diff = centered.row(static_cast<Eigen::Index>(i)).transpose();
		const double quad = diff.dot(inv_cov * diff);

		OutlierResult r;
		r.method = "mahalanobis";
		r.score = std::sqrt(std::abs(quad));
		r.is_outlier = r.score > threshold;
		if (r.is_outlier) {
			r.reason = "Mahalanobis distance: " + FormatFixed(r.score, 2);
		}
		results.push_back(std::move(r));
	}
	return results;
}

inline std::vector<OutlierResult> OutlierDetector::DetectTimeSeries(const std::vector<double> &values, size_t window,
                                                                    double threshold) {
	std::vector<OutlierResult> results;
	results.reserve(values.size());
	const size_t n = values.size();

	for (size_t i = 0; i < n; i++) {
		const size_t start = i >= window ? i - window : 0;
		const size_t end = std::min(n, i + window + 1);

		std::vector<double> local;
		local.reserve(end - start);
		for (size_t k = start; k < end; k++) {
			if (k != i) {
				local.push_back(values[k]);
			}
		}

		OutlierResult r;
		r.method = "time_series_window";
		if (local.empty()) {
			results.push_back(std::move(r));
			continue;
		}

		const double mean = utils::Mean(local);
		const double std_dev = utils::PopulationStdDev(local);
		r.score = std_dev == 0.0 ? 0.0 : std::abs((values[i] - mean) / std_dev);
		r.is_outlier = r.score > threshold;
		if (r.is_outlier) {
			r.reason = FormatFixed(r.score, 2) + " sigma from local window (expected: " + FormatFixed(mean, 1) +
			           " +/- " + FormatFixed(std_dev, 1) + ")";
		}
		results.push_back(std::move(r));
	}
	return results;
}

inline std::vector<OutlierResult> OutlierDetector::DetectTimeSeries(const std::vector<core::TimeSeriesPoint> &points,
                                                                    size_t window, double threshold) {
	std::vector<double> values;
	values.reserve(points.size());
	for (const auto &p : points) {
		values.push_back(p.value);
	}
	return DetectTimeSeries(values, window, threshold);
}

inline SeriesStatistics OutlierDetector::Summarize(const std::vector<double> &values) {
	SeriesStatistics stats;
	if (values.empty()) {
		return stats;
	}
	stats.mean = utils::Mean(values);
	stats.median = utils::UpperMedian(values);
	stats.std_dev = utils::PopulationStdDev(values);
	stats.iqr = utils::QuantileFloor(values, 0.75) - utils::QuantileFloor(values, 0.25);
	stats.mad = utils::MedianAbsoluteDeviation(values, stats.median);
	return stats;
}

inline DataQualityReport OutlierDetector::GenerateDataQualityReport(const std::vector<double> &values,
                                                                    OutlierMethod method) {
	if (method != OutlierMethod::Z_SCORE && method != OutlierMethod::MODIFIED_Z_SCORE &&
	    method != OutlierMethod::IQR) {
		throw std::invalid_argument("data quality report supports z_score, modified_z_score or iqr (got " +
		                            OutlierMethodName(method) + ")");
	}

	DataQualityReport report;
	report.total_points = values.size();
	if (values.empty()) {
		return report;
	}

	const auto results = Detect(values, method);
	for (size_t i = 0; i < results.size(); i++) {
		if (results[i].is_outlier) {
			report.outlier_indices.push_back(i);
		} else {
			report.clean_values.push_back(values[i]);
		}
	}

	report.outlier_percentage =
	    static_cast<double>(report.outlier_indices.size()) / static_cast<double>(values.size()) * 100.0;
	report.statistics = Summarize(values);
	return report;
}

} // namespace detection
} // namespace libstatlearn

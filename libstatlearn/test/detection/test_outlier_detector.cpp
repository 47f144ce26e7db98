#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <libstatlearn/detection/outlier_detector.hpp>

using namespace libstatlearn;
using namespace libstatlearn::detection;

const double TOLERANCE = 1e-6;

namespace {

std::vector<size_t> FlaggedIndices(const std::vector<OutlierResult> &results) {
	std::vector<size_t> out;
	for (size_t i = 0; i < results.size(); i++) {
		if (results[i].is_outlier) {
			out.push_back(i);
		}
	}
	return out;
}

const std::vector<double> WEEKLY_RUNS = {40, 42, 38, 45, 150, 41, 43};

} // namespace

TEST_CASE("Outliers: Modified Z-score flags the single spike", "[outlier][modified_z]") {
	auto results = OutlierDetector::DetectModifiedZScore(WEEKLY_RUNS);

	REQUIRE(results.size() == WEEKLY_RUNS.size());
	REQUIRE(FlaggedIndices(results) == std::vector<size_t> {4});

	// median 42, MAD 2: 0.6745 * 108 / 2
	REQUIRE_THAT(results[4].score, Catch::Matchers::WithinAbs(36.423, 1e-3));
	REQUIRE(results[4].method == "modified_z_score");
	REQUIRE(results[4].reason == "Modified Z-score: 36.42 (threshold: 3.5)");
	REQUIRE(results[0].reason.empty());
}

TEST_CASE("Outliers: Z-score is masked by the spike it inflates", "[outlier][z_score]") {
	auto results = OutlierDetector::DetectZScore(WEEKLY_RUNS);

	// mean 57, population std ~38.02, so 150 sits only ~2.45 sigma out
	REQUIRE(FlaggedIndices(results).empty());
	REQUIRE_THAT(results[4].score, Catch::Matchers::WithinAbs(93.0 / std::sqrt(10120.0 / 7.0), TOLERANCE));

	auto strict = OutlierDetector::DetectZScore(WEEKLY_RUNS, 2.0);
	REQUIRE(FlaggedIndices(strict) == std::vector<size_t> {4});
	REQUIRE_THAT(strict[4].reason, Catch::Matchers::EndsWith("standard deviations from mean (threshold: 2.0)"));
}

TEST_CASE("Outliers: IQR bounds", "[outlier][iqr]") {
	auto results = OutlierDetector::DetectIQR(WEEKLY_RUNS);

	// Q1 = 40, Q3 = 45, bounds [32.5, 52.5]
	REQUIRE(FlaggedIndices(results) == std::vector<size_t> {4});
	REQUIRE_THAT(results[4].score, Catch::Matchers::WithinAbs(19.5, TOLERANCE));
	REQUIRE(results[4].reason == "Outside bounds [32.5, 52.5]");
}

TEST_CASE("Outliers: Constant series never flags", "[outlier][edge_case]") {
	std::vector<double> constant(10, 7.0);

	for (auto method : {OutlierMethod::Z_SCORE, OutlierMethod::MODIFIED_Z_SCORE, OutlierMethod::IQR,
	                    OutlierMethod::MAHALANOBIS, OutlierMethod::TIME_SERIES_WINDOW}) {
		auto results = OutlierDetector::Detect(constant, method);
		REQUIRE(results.size() == constant.size());
		for (const auto &r : results) {
			REQUIRE_FALSE(r.is_outlier);
			REQUIRE(std::isfinite(r.score));
		}
	}
}

TEST_CASE("Outliers: Empty series yields no results", "[outlier][edge_case]") {
	std::vector<double> empty;
	REQUIRE(OutlierDetector::DetectZScore(empty).empty());
	REQUIRE(OutlierDetector::DetectModifiedZScore(empty).empty());
	REQUIRE(OutlierDetector::DetectIQR(empty).empty());
	REQUIRE(OutlierDetector::DetectTimeSeries(empty).empty());

	auto report = OutlierDetector::GenerateDataQualityReport(empty);
	REQUIRE(report.total_points == 0);
	REQUIRE(report.outlier_percentage == 0.0);
}

TEST_CASE("Outliers: Negative threshold selects the method default", "[outlier][threshold]") {
	REQUIRE(OutlierDetector::DefaultThreshold(OutlierMethod::Z_SCORE) == 3.0);
	REQUIRE(OutlierDetector::DefaultThreshold(OutlierMethod::MODIFIED_Z_SCORE) == 3.5);
	REQUIRE(OutlierDetector::DefaultThreshold(OutlierMethod::IQR) == 1.5);
	REQUIRE(OutlierDetector::DefaultThreshold(OutlierMethod::MAHALANOBIS) == 3.0);
	REQUIRE(OutlierDetector::DefaultThreshold(OutlierMethod::TIME_SERIES_WINDOW) == 2.5);

	auto automatic = OutlierDetector::Detect(WEEKLY_RUNS, OutlierMethod::MODIFIED_Z_SCORE);
	auto explicit_default = OutlierDetector::Detect(WEEKLY_RUNS, OutlierMethod::MODIFIED_Z_SCORE, 3.5);
	REQUIRE(FlaggedIndices(automatic) == FlaggedIndices(explicit_default));
}

TEST_CASE("Outliers: Mahalanobis over two features", "[outlier][mahalanobis]") {
	std::vector<std::vector<double>> rows = {{1.0, 2.0}, {2.0, 1.0}, {1.5, 1.5}, {2.0, 2.0},
	                                         {1.0, 1.0}, {1.2, 1.8}, {1.8, 1.2}, {1.5, 1.4},
	                                         {1.4, 1.6}, {1.6, 1.5}, {9.0, 9.5}};

	bool singular = true;
	auto results = OutlierDetector::DetectMultivariate(rows, 3.0, &singular);

	REQUIRE_FALSE(singular);
	REQUIRE(results.size() == rows.size());
	// The far point dominates the distance ranking
	for (size_t i = 0; i + 1 < results.size(); i++) {
		REQUIRE(results[i].score < results.back().score);
	}
	REQUIRE(results.back().method == "mahalanobis");
}

TEST_CASE("Outliers: Mahalanobis with singular covariance uses identity", "[outlier][mahalanobis]") {
	// Second column is an exact multiple of the first
	std::vector<std::vector<double>> rows = {{1.0, 2.0}, {2.0, 4.0}, {3.0, 6.0}, {4.0, 8.0}};

	bool singular = false;
	auto results = OutlierDetector::DetectMultivariate(rows, 3.0, &singular);

	REQUIRE(singular);
	// Euclidean distance from the mean (2.5, 5.0)
	REQUIRE_THAT(results[0].score, Catch::Matchers::WithinAbs(std::sqrt(1.5 * 1.5 + 3.0 * 3.0), TOLERANCE));
}

TEST_CASE("Outliers: Mahalanobis rejects ragged rows", "[outlier][mahalanobis][validation]") {
	std::vector<std::vector<double>> rows = {{1.0, 2.0}, {2.0}};
	REQUIRE_THROWS_AS(OutlierDetector::DetectMultivariate(rows), std::invalid_argument);
}

TEST_CASE("Outliers: Time-series window excludes the point itself", "[outlier][time_series]") {
	std::vector<double> values = {10, 11, 10, 12, 11, 10, 40, 11, 10, 12, 11, 10};

	auto results = OutlierDetector::DetectTimeSeries(values, 3, 2.5);

	REQUIRE(FlaggedIndices(results) == std::vector<size_t> {6});
	REQUIRE_THAT(results[6].reason, Catch::Matchers::ContainsSubstring("sigma from local window"));
}

TEST_CASE("Outliers: Time-series overload on points", "[outlier][time_series]") {
	std::vector<core::TimeSeriesPoint> points;
	std::vector<double> values = {5, 5, 6, 5, 30, 5, 6, 5};
	for (size_t i = 0; i < values.size(); i++) {
		points.push_back({core::FromEpochDays(static_cast<double>(i)), values[i]});
	}

	auto from_points = OutlierDetector::DetectTimeSeries(points);
	auto from_values = OutlierDetector::DetectTimeSeries(values);
	REQUIRE(FlaggedIndices(from_points) == FlaggedIndices(from_values));
	REQUIRE(FlaggedIndices(from_points) == std::vector<size_t> {4});
}

TEST_CASE("Outliers: Data quality report", "[outlier][report]") {
	auto report = OutlierDetector::GenerateDataQualityReport(WEEKLY_RUNS);

	REQUIRE(report.total_points == 7);
	REQUIRE(report.outlier_indices == std::vector<size_t> {4});
	REQUIRE_THAT(report.outlier_percentage, Catch::Matchers::WithinAbs(100.0 / 7.0, TOLERANCE));
	REQUIRE(report.clean_values == std::vector<double> {40, 42, 38, 45, 41, 43});

	// Statistics describe the original series
	REQUIRE_THAT(report.statistics.mean, Catch::Matchers::WithinAbs(57.0, TOLERANCE));
	REQUIRE(report.statistics.median == 42.0);
	REQUIRE(report.statistics.iqr == 5.0);
	REQUIRE(report.statistics.mad == 2.0);
}

TEST_CASE("Outliers: Report rejects non-univariate methods", "[outlier][report][validation]") {
	REQUIRE_THROWS_AS(OutlierDetector::GenerateDataQualityReport(WEEKLY_RUNS, OutlierMethod::MAHALANOBIS),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(OutlierDetector::GenerateDataQualityReport(WEEKLY_RUNS, OutlierMethod::TIME_SERIES_WINDOW),
	                  std::invalid_argument);
}

TEST_CASE("Outliers: Method names round-trip", "[outlier]") {
	for (auto method : {OutlierMethod::Z_SCORE, OutlierMethod::MODIFIED_Z_SCORE, OutlierMethod::IQR,
	                    OutlierMethod::MAHALANOBIS, OutlierMethod::TIME_SERIES_WINDOW}) {
		REQUIRE(ParseOutlierMethod(OutlierMethodName(method)) == method);
	}
	REQUIRE_THROWS_AS(ParseOutlierMethod("grubbs"), std::invalid_argument);
}

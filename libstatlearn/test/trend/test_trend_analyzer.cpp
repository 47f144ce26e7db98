#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libstatlearn/trend/trend_analyzer.hpp>

using namespace libstatlearn;
using namespace libstatlearn::core;
using namespace libstatlearn::trend;

const double TOLERANCE = 1e-9;

namespace {

std::vector<TimeSeriesPoint> Daily(const std::vector<double> &values) {
	std::vector<TimeSeriesPoint> series;
	for (size_t i = 0; i < values.size(); i++) {
		series.push_back({FromEpochDays(19000.0 + static_cast<double>(i)), values[i]});
	}
	return series;
}

} // namespace

TEST_CASE("Trend: Strictly increasing series", "[trend][mann_kendall]") {
	auto analysis = TrendAnalyzer::DetectTrend(Daily({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));

	REQUIRE(analysis.direction == TrendDirection::INCREASING);
	REQUIRE(analysis.p_value < TrendAnalyzer::SIGNIFICANCE_LEVEL);
	REQUIRE_THAT(analysis.kendall_tau, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(analysis.slope, Catch::Matchers::WithinAbs(1.0, 1e-6));
	REQUIRE_THAT(analysis.confidence, Catch::Matchers::WithinAbs(1.0 - analysis.p_value, TOLERANCE));
}

TEST_CASE("Trend: Strictly decreasing series", "[trend][mann_kendall]") {
	auto analysis = TrendAnalyzer::DetectTrend(Daily({20, 18, 16, 14, 12, 10, 8, 6, 4, 2}));

	REQUIRE(analysis.direction == TrendDirection::DECREASING);
	REQUIRE_THAT(analysis.kendall_tau, Catch::Matchers::WithinAbs(-1.0, TOLERANCE));
	REQUIRE_THAT(analysis.slope, Catch::Matchers::WithinAbs(-2.0, 1e-6));
}

TEST_CASE("Trend: Direction requires significance", "[trend][gating]") {
	// Four rising points: S = 6 but p ~ 0.09
	auto analysis = TrendAnalyzer::DetectTrend(Daily({1, 2, 3, 4}));

	REQUIRE(analysis.slope > 0.0);
	REQUIRE(analysis.p_value >= TrendAnalyzer::SIGNIFICANCE_LEVEL);
	REQUIRE(analysis.direction == TrendDirection::STABLE);
}

TEST_CASE("Trend: Flat series is stable", "[trend]") {
	auto analysis = TrendAnalyzer::DetectTrend(Daily({5, 5, 5, 5, 5, 5}));

	REQUIRE(analysis.direction == TrendDirection::STABLE);
	REQUIRE(analysis.p_value == 1.0);
	REQUIRE(analysis.slope == 0.0);
	REQUIRE(analysis.kendall_tau == 0.0);
}

TEST_CASE("Trend: Short series", "[trend][edge_case]") {
	auto analysis = TrendAnalyzer::DetectTrend(Daily({1, 5, 9}));

	REQUIRE(analysis.direction == TrendDirection::STABLE);
	REQUIRE(analysis.p_value == 1.0);
	REQUIRE(analysis.confidence == 0.0);
	REQUIRE(analysis.slope == 0.0);

	REQUIRE(TrendAnalyzer::DetectTrend({}).direction == TrendDirection::STABLE);
}

TEST_CASE("Trend: Input order does not matter", "[trend]") {
	auto ordered = Daily({3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8});
	auto shuffled = ordered;
	std::reverse(shuffled.begin(), shuffled.end());
	std::swap(shuffled[2], shuffled[7]);

	auto a = TrendAnalyzer::DetectTrend(ordered);
	auto b = TrendAnalyzer::DetectTrend(shuffled);

	REQUIRE(a.direction == b.direction);
	REQUIRE(a.p_value == b.p_value);
	REQUIRE(a.slope == b.slope);
	REQUIRE(a.kendall_tau == b.kendall_tau);
}

TEST_CASE("Trend: Same-day points have no slope", "[trend][edge_case]") {
	std::vector<TimeSeriesPoint> series;
	for (int i = 0; i < 8; i++) {
		series.push_back({FromEpochDays(19000.0), static_cast<double>(i)});
	}

	auto analysis = TrendAnalyzer::DetectTrend(series);

	// S is large but no pair spans a positive time gap
	REQUIRE(analysis.p_value < TrendAnalyzer::SIGNIFICANCE_LEVEL);
	REQUIRE(analysis.slope == 0.0);
	REQUIRE(analysis.direction == TrendDirection::STABLE);
}

TEST_CASE("Trend: Kendall S statistic", "[trend][mann_kendall]") {
	REQUIRE(TrendAnalyzer::KendallS({1, 2, 3}) == 3);
	REQUIRE(TrendAnalyzer::KendallS({3, 2, 1}) == -3);
	REQUIRE(TrendAnalyzer::KendallS({1, 1, 1}) == 0);
	REQUIRE(TrendAnalyzer::KendallS({1, 3, 2}) == 1);
}

TEST_CASE("Trend: Sen's slope is the upper median of pairwise slopes", "[trend][sens_slope]") {
	// Pairwise slopes per day: 2, 0.5, -1
	auto series = Daily({0, 2, 1});
	REQUIRE_THAT(TrendAnalyzer::SensSlope(series), Catch::Matchers::WithinAbs(0.5, 1e-6));
}

TEST_CASE("Trend: Direction names", "[trend]") {
	REQUIRE(TrendDirectionName(TrendDirection::INCREASING) == "increasing");
	REQUIRE(TrendDirectionName(TrendDirection::DECREASING) == "decreasing");
	REQUIRE(TrendDirectionName(TrendDirection::STABLE) == "stable");
}

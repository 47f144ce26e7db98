#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "io/observation_csv.hpp"
#include "utils/options_parser.hpp"

using namespace statlearn;
using json = nlohmann::json;
using libstatlearn::detection::OutlierMethod;
using libstatlearn::ensemble::EnsembleMethod;

const std::string CONFIG_DIR = std::string(STATLEARN_TEST_DATA_DIR) + "/config/";

TEST_CASE("Options: Defaults", "[options]") {
	LearningOptions opts;

	REQUIRE(opts.outlier_method == OutlierMethod::MODIFIED_Z_SCORE);
	REQUIRE(opts.min_clean_points == 5);
	REQUIRE(opts.half_life_days == 30.0);
	REQUIRE(opts.enable_bayesian);
	REQUIRE(opts.enable_time_series);
	REQUIRE(opts.ensemble.method == EnsembleMethod::ADAPTIVE);
	REQUIRE(opts.ensemble.min_models == 2);
	REQUIRE_FALSE(opts.reference_time.has_value());
	REQUIRE_NOTHROW(opts.Validate());

	REQUIRE_FALSE(LearningOptions::QuickSimulation().enable_time_series);
	REQUIRE(LearningOptions::QuickSimulation().enable_bayesian);
}

TEST_CASE("Options: Null and empty documents keep defaults", "[options][parser]") {
	auto from_null = ParseLearningOptions(json());
	auto from_empty = ParseLearningOptions(json::object());

	REQUIRE(from_null.min_clean_points == 5);
	REQUIRE(from_empty.outlier_method == OutlierMethod::MODIFIED_Z_SCORE);
}

TEST_CASE("Options: Parse from file", "[options][parser]") {
	auto opts = ParseLearningOptions(LoadJsonFile(CONFIG_DIR + "options.json"));

	REQUIRE(opts.outlier_method == OutlierMethod::IQR);
	REQUIRE(opts.min_clean_points == 6);
	REQUIRE(opts.half_life_days == 21.0);
	REQUIRE(opts.smoothing_alpha == 0.4);
	// Untouched keys keep their defaults
	REQUIRE(opts.smoothing_beta == 0.1);
	REQUIRE(opts.ensemble.method == EnsembleMethod::MEDIAN);
	REQUIRE(opts.ensemble.adaptive_window == 10);
	REQUIRE(opts.reference_time.has_value());
	REQUIRE(io::FormatIsoDate(*opts.reference_time) == "2024-03-15");
}

TEST_CASE("Options: Unknown keys list the valid ones", "[options][parser][validation]") {
	REQUIRE_THROWS_WITH(ParseLearningOptions(json {{"half_life", 10}}),
	                    Catch::Matchers::ContainsSubstring("Unknown option: 'half_life'") &&
	                        Catch::Matchers::ContainsSubstring("half_life_days"));

	REQUIRE_THROWS_WITH(ParseLearningOptions(json {{"ensemble", {{"strategy", "median"}}}}),
	                    Catch::Matchers::ContainsSubstring("Unknown ensemble option: 'strategy'"));
}

TEST_CASE("Options: Type and range errors", "[options][parser][validation]") {
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"min_clean_points", "five"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"min_clean_points", -3}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"enable_bayesian", "yes"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"outlier_method", "grubbs"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"reference_date", "15/03/2024"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json::array()), std::invalid_argument);

	// Parsed values still go through validation
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"outlier_method", "mahalanobis"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"min_clean_points", 1}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"smoothing_alpha", 1.5}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningOptions(json {{"ensemble", {{"confidence_threshold", 2.0}}}}),
	                  std::invalid_argument);
}

TEST_CASE("History: Parse from file", "[options][history]") {
	auto history = ParseLearningHistory(LoadJsonFile(CONFIG_DIR + "history.json"));

	REQUIRE(history.recent_residuals.size() == 6);
	REQUIRE(history.recent_residuals[3] == 2.1);
	REQUIRE(history.member_errors.size() == 2);
	REQUIRE(history.member_errors.at("bayesian_adaptive").size() == 4);
	REQUIRE_FALSE(history.empty());

	REQUIRE(ParseLearningHistory(json()).empty());
}

TEST_CASE("History: Validation", "[options][history][validation]") {
	REQUIRE_THROWS_AS(ParseLearningHistory(json {{"residuals", json::array()}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningHistory(json {{"recent_residuals", {1.0, "x"}}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ParseLearningHistory(json {{"member_errors", {1.0, 2.0}}}), std::invalid_argument);
}

TEST_CASE("Options: Unreadable files", "[options][parser][validation]") {
	REQUIRE_THROWS_AS(LoadJsonFile(CONFIG_DIR + "missing.json"), std::runtime_error);
	// A CSV is not JSON
	REQUIRE_THROWS_AS(LoadJsonFile(std::string(STATLEARN_TEST_DATA_DIR) + "/observations/two_weeks.csv"),
	                  std::runtime_error);
}

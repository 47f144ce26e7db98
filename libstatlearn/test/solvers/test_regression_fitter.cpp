#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libstatlearn/solvers/regression_fitter.hpp>
#include <fstream>
#include <sstream>

using namespace libstatlearn;
using namespace libstatlearn::core;
using namespace libstatlearn::solvers;

// Helper to load CSV data: feature columns followed by the target column
std::vector<DataPoint> load_csv(const std::string &filepath) {
	std::ifstream file(filepath);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open file: " + filepath);
	}

	std::string line;
	std::getline(file, line); // Skip header

	std::vector<DataPoint> points;
	while (std::getline(file, line)) {
		std::istringstream iss(line);
		std::string token;
		std::vector<double> row;

		while (std::getline(iss, token, ',')) {
			row.push_back(std::stod(token));
		}

		if (!row.empty()) {
			DataPoint point;
			point.target = row.back();
			row.pop_back();
			point.features = row;
			points.push_back(point);
		}
	}

	if (points.empty()) {
		throw std::runtime_error("No data in CSV file");
	}
	return points;
}

const std::string DATA_DIR = std::string(STATLEARN_TEST_DATA_DIR) + "/regression/";
const double TOLERANCE = 1e-6;

namespace {

DataPoint Point(std::vector<double> features, double target) {
	DataPoint p;
	p.features = std::move(features);
	p.target = target;
	return p;
}

DataPoint TimedPoint(std::vector<double> features, double target, double day) {
	DataPoint p = Point(std::move(features), target);
	p.timestamp = FromEpochDays(day);
	return p;
}

} // namespace

TEST_CASE("Regression: OLS recovers exact coefficients", "[regression][ols]") {
	auto points = load_csv(DATA_DIR + "two_feature_exact.csv");

	auto model = RegressionFitter::FitLinear(points);

	REQUIRE(model.is_valid());
	REQUIRE(model.model_type == RegressionVariant::LINEAR);
	REQUIRE(model.sample_count == points.size());
	REQUIRE(model.coefficients.size() == 2);
	REQUIRE_THAT(model.intercept, Catch::Matchers::WithinAbs(2.0, TOLERANCE));
	REQUIRE_THAT(model.coefficients(0), Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	REQUIRE_THAT(model.coefficients(1), Catch::Matchers::WithinAbs(-1.0, TOLERANCE));
	REQUIRE_THAT(model.r2_score, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(model.mse, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_THAT(model.mae, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_FALSE(model.used_minimum_norm);
	REQUIRE(model.feature_names == std::vector<std::string> {"x0", "x1"});

	REQUIRE_THAT(RegressionFitter::Predict(model, {1.0, 1.0}), Catch::Matchers::WithinAbs(4.0, TOLERANCE));
}

TEST_CASE("Ridge: Lambda 0 equals OLS", "[ridge][validation]") {
	auto points = load_csv(DATA_DIR + "three_feature_noisy.csv");

	auto ridge = RegressionFitter::FitRidge(points, 0.0);
	auto ols = RegressionFitter::FitLinear(points);

	REQUIRE(ridge.coefficients.size() == ols.coefficients.size());
	for (Eigen::Index i = 0; i < ols.coefficients.size(); i++) {
		REQUIRE_THAT(ridge.coefficients(i), Catch::Matchers::WithinAbs(ols.coefficients(i), 1e-8));
	}
	REQUIRE_THAT(ridge.intercept, Catch::Matchers::WithinAbs(ols.intercept, 1e-8));
	REQUIRE_THAT(ridge.r2_score, Catch::Matchers::WithinAbs(ols.r2_score, 1e-10));
}

TEST_CASE("Ridge: Coefficient norm shrinks as lambda grows", "[ridge][shrinkage]") {
	auto points = load_csv(DATA_DIR + "three_feature_noisy.csv");

	double previous_norm = RegressionFitter::FitLinear(points).coefficients.norm();
	double previous_r2 = RegressionFitter::FitLinear(points).r2_score;
	for (double lambda : {0.1, 1.0, 10.0, 100.0}) {
		auto model = RegressionFitter::FitRidge(points, lambda);
		REQUIRE(model.model_type == RegressionVariant::RIDGE);
		REQUIRE(model.coefficients.norm() < previous_norm);
		// OLS minimizes the residuals, so the penalized fit can only be worse
		REQUIRE(model.r2_score <= previous_r2 + 1e-12);
		previous_norm = model.coefficients.norm();
		previous_r2 = model.r2_score;
	}
}

TEST_CASE("Time-weighted: Without timestamps equals OLS", "[time_weighted]") {
	auto points = load_csv(DATA_DIR + "three_feature_noisy.csv");

	auto weighted = RegressionFitter::FitTimeWeighted(points, 30.0);
	auto ols = RegressionFitter::FitLinear(points);

	REQUIRE(weighted.model_type == RegressionVariant::TIME_WEIGHTED);
	for (Eigen::Index i = 0; i < ols.coefficients.size(); i++) {
		REQUIRE_THAT(weighted.coefficients(i), Catch::Matchers::WithinAbs(ols.coefficients(i), 1e-8));
	}
}

TEST_CASE("Time-weighted: Recent points dominate", "[time_weighted]") {
	std::vector<DataPoint> points;
	// Old regime y = x, recent regime y = 3x
	for (int i = 1; i <= 5; i++) {
		points.push_back(TimedPoint({static_cast<double>(i)}, static_cast<double>(i), static_cast<double>(i)));
	}
	for (int i = 1; i <= 5; i++) {
		points.push_back(
		    TimedPoint({static_cast<double>(i)}, 3.0 * static_cast<double>(i), 100.0 + static_cast<double>(i)));
	}

	auto recent = RegressionFitter::FitTimeWeighted(points, 1.0);
	REQUIRE_THAT(recent.coefficients(0), Catch::Matchers::WithinAbs(3.0, 1e-6));

	// A long half-life blends the two regimes
	auto blended = RegressionFitter::FitTimeWeighted(points, 10000.0);
	REQUIRE(blended.coefficients(0) > 1.5);
	REQUIRE(blended.coefficients(0) < 2.5);
}

TEST_CASE("Time-weighted: Reference time defaults to the latest point", "[time_weighted]") {
	std::vector<DataPoint> points;
	std::vector<double> xs = {1, 4, 2, 8, 5, 7, 3, 6};
	std::vector<double> ys = {2.1, 7.9, 4.2, 16.5, 9.8, 14.1, 6.3, 11.7};
	for (size_t i = 0; i < xs.size(); i++) {
		points.push_back(TimedPoint({xs[i]}, ys[i], 200.0 + 3.0 * static_cast<double>(i)));
	}

	auto implicit = RegressionFitter::FitTimeWeighted(points, 7.0);
	auto explicit_ref = RegressionFitter::FitTimeWeighted(points, 7.0, FromEpochDays(200.0 + 21.0));
	REQUIRE_THAT(implicit.coefficients(0), Catch::Matchers::WithinAbs(explicit_ref.coefficients(0), 1e-9));
	REQUIRE_THAT(implicit.intercept, Catch::Matchers::WithinAbs(explicit_ref.intercept, 1e-9));

	// Shifting the reference scales every weight equally
	auto later = RegressionFitter::FitTimeWeighted(points, 7.0, FromEpochDays(200.0 + 50.0));
	REQUIRE_THAT(later.coefficients(0), Catch::Matchers::WithinAbs(implicit.coefficients(0), 1e-6));
}

TEST_CASE("Regression: Fit timestamp follows the reference time", "[regression][determinism]") {
	std::vector<DataPoint> points;
	for (size_t i = 0; i < 6; i++) {
		const double x = static_cast<double>(i);
		points.push_back(TimedPoint({x}, 1.0 + 2.0 * x, 300.0 + 2.0 * x));
	}

	// Latest point is day 310
	auto implicit = RegressionFitter::FitTimeWeighted(points, 14.0);
	REQUIRE(implicit.created_at == FromEpochDays(310.0));
	REQUIRE(RegressionFitter::FitTimeWeighted(points, 14.0).created_at == implicit.created_at);

	auto explicit_ref = RegressionFitter::FitTimeWeighted(points, 14.0, FromEpochDays(320.0));
	REQUIRE(explicit_ref.created_at == FromEpochDays(320.0));

	REQUIRE(RegressionFitter::FitLinear(points).created_at == FromEpochDays(310.0));

	// No timestamps at all
	auto untimed = RegressionFitter::FitLinear(load_csv(DATA_DIR + "two_feature_exact.csv"));
	REQUIRE(untimed.created_at == TimePoint());
}

TEST_CASE("Time-weighted: Half-life weight", "[time_weighted]") {
	REQUIRE_THAT(RegressionFitter::HalfLifeWeight(0.0, 30.0), Catch::Matchers::WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(RegressionFitter::HalfLifeWeight(30.0, 30.0), Catch::Matchers::WithinAbs(0.5, 1e-12));
	REQUIRE_THAT(RegressionFitter::HalfLifeWeight(60.0, 30.0), Catch::Matchers::WithinAbs(0.25, 1e-12));
}

TEST_CASE("Polynomial: Quadratic relationship", "[polynomial]") {
	std::vector<DataPoint> points;
	for (int x = -3; x <= 3; x++) {
		const double xd = static_cast<double>(x);
		points.push_back(Point({xd}, 1.0 + xd + 2.0 * xd * xd));
	}

	auto model = RegressionFitter::FitPolynomial(points, 2);

	REQUIRE(model.model_type == RegressionVariant::POLYNOMIAL);
	REQUIRE(model.polynomial_degree == 2);
	REQUIRE(model.input_feature_count == 1);
	REQUIRE(model.coefficients.size() == 2);
	REQUIRE(model.feature_names == std::vector<std::string> {"x0", "x0^2"});
	REQUIRE_THAT(RegressionFitter::PredictPolynomial(model, {2.0}), Catch::Matchers::WithinAbs(11.0, 0.05));
	REQUIRE(model.r2_score > 0.999);
}

TEST_CASE("Polynomial: Feature expansion layout", "[polynomial]") {
	auto quad = RegressionFitter::CreatePolynomialFeatures({2.0, 3.0}, 2);
	REQUIRE(quad == std::vector<double> {2.0, 3.0, 4.0, 9.0, 6.0});

	auto cubic = RegressionFitter::CreatePolynomialFeatures({2.0, 3.0}, 3);
	REQUIRE(cubic == std::vector<double> {2.0, 3.0, 4.0, 9.0, 6.0, 8.0, 27.0});

	auto names = RegressionFitter::CreatePolynomialNames({"a", "b"}, 3);
	REQUIRE(names == std::vector<std::string> {"a", "b", "a^2", "b^2", "a*b", "a^3", "b^3"});
}

TEST_CASE("Polynomial: Caller feature names are expanded", "[polynomial]") {
	std::vector<DataPoint> points;
	for (int i = 0; i < 12; i++) {
		const double a = static_cast<double>(i % 4);
		const double b = static_cast<double>(i / 4);
		points.push_back(Point({a, b}, a * b + a));
	}

	auto model = RegressionFitter::Fit(points, RegressionOptions::Polynomial(2), {"distance", "duration"});
	REQUIRE(model.feature_names ==
	        std::vector<std::string> {"distance", "duration", "distance^2", "duration^2", "distance*duration"});
}

TEST_CASE("Regression: Collinear features fall back to minimum norm", "[regression][rank_deficient]") {
	std::vector<DataPoint> points;
	for (int i = 1; i <= 5; i++) {
		const double x = static_cast<double>(i);
		points.push_back(Point({x, x}, 2.0 * x));
	}

	auto model = RegressionFitter::FitLinear(points);

	REQUIRE(model.used_minimum_norm);
	REQUIRE(model.is_valid());
	REQUIRE_THAT(model.intercept, Catch::Matchers::WithinAbs(0.0, 1e-6));
	REQUIRE_THAT(model.coefficients(0), Catch::Matchers::WithinAbs(1.0, 1e-6));
	REQUIRE_THAT(model.coefficients(1), Catch::Matchers::WithinAbs(1.0, 1e-6));
	REQUIRE_THAT(RegressionFitter::Predict(model, {6.0, 6.0}), Catch::Matchers::WithinAbs(12.0, 1e-6));
}

TEST_CASE("Regression: Constant target", "[regression][edge_case]") {
	std::vector<DataPoint> points;
	for (int i = 0; i < 6; i++) {
		points.push_back(Point({static_cast<double>(i), static_cast<double>(i * i % 5)}, 5.0));
	}

	auto model = RegressionFitter::FitLinear(points);
	REQUIRE_THAT(model.intercept, Catch::Matchers::WithinAbs(5.0, 1e-8));
	REQUIRE(model.r2_score == 1.0);
}

TEST_CASE("Regression: Input validation", "[regression][validation]") {
	std::vector<DataPoint> empty;
	REQUIRE_THROWS_AS(RegressionFitter::FitLinear(empty), std::invalid_argument);

	std::vector<DataPoint> ragged = {Point({1.0, 2.0}, 1.0), Point({1.0}, 2.0)};
	REQUIRE_THROWS_AS(RegressionFitter::FitLinear(ragged), std::invalid_argument);

	std::vector<DataPoint> points = {Point({1.0}, 1.0), Point({2.0}, 2.0), Point({3.0}, 3.1)};
	REQUIRE_THROWS_AS(RegressionFitter::FitRidge(points, -0.5), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressionFitter::Fit(points, RegressionOptions::OLS(), {"a", "b"}), std::invalid_argument);

	auto model = RegressionFitter::FitLinear(points);
	REQUIRE_THROWS_AS(RegressionFitter::Predict(model, {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressionFitter::PredictPolynomial(model, {1.0}), std::invalid_argument);
}

TEST_CASE("Regression: Residuals are in input order", "[regression]") {
	std::vector<DataPoint> points = {Point({0.0}, 0.0), Point({1.0}, 2.0), Point({2.0}, 1.0), Point({3.0}, 3.0)};

	auto model = RegressionFitter::FitLinear(points);

	REQUIRE(model.residuals.size() == 4);
	for (size_t i = 0; i < points.size(); i++) {
		const double fitted = RegressionFitter::Predict(model, points[i].features);
		REQUIRE_THAT(model.residuals(static_cast<Eigen::Index>(i)),
		             Catch::Matchers::WithinAbs(points[i].target - fitted, 1e-9));
	}
}

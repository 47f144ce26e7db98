#include "options_parser.hpp"
#include "../io/observation_csv.hpp"
#include "tracing.hpp"
#include <fstream>
#include <stdexcept>

namespace statlearn {

using nlohmann::json;

namespace {

template <typename T>
T GetTyped(const json &value, const std::string &key) {
	try {
		return value.get<T>();
	} catch (const json::exception &e) {
		throw std::invalid_argument("Option '" + key + "' has the wrong type: " + e.what());
	}
}

size_t GetCount(const json &value, const std::string &key) {
	if (!value.is_number_integer() || value.get<long long>() < 0) {
		throw std::invalid_argument("Option '" + key + "' must be a non-negative integer");
	}
	return value.get<size_t>();
}

void RequireObject(const json &doc, const std::string &what) {
	if (!doc.is_object()) {
		throw std::invalid_argument(what + " must be a JSON object");
	}
}

libstatlearn::ensemble::EnsembleConfig ParseEnsembleConfig(const json &doc,
                                                           libstatlearn::ensemble::EnsembleConfig config) {
	RequireObject(doc, "Option 'ensemble'");
	for (auto it = doc.begin(); it != doc.end(); ++it) {
		const std::string &key = it.key();
		const json &value = it.value();

		if (key == "method") {
			config.method = libstatlearn::ensemble::ParseEnsembleMethod(GetTyped<std::string>(value, key));
		} else if (key == "min_models") {
			config.min_models = GetCount(value, key);
		} else if (key == "adaptive_window") {
			config.adaptive_window = GetCount(value, key);
		} else if (key == "confidence_threshold") {
			config.confidence_threshold = GetTyped<double>(value, key);
		} else {
			throw std::invalid_argument("Unknown ensemble option: '" + key +
			                            "'. Valid options are: method, min_models, adaptive_window, "
			                            "confidence_threshold");
		}
	}
	return config;
}

std::vector<double> GetNumberArray(const json &value, const std::string &key) {
	if (!value.is_array()) {
		throw std::invalid_argument("'" + key + "' must be an array of numbers");
	}
	std::vector<double> out;
	out.reserve(value.size());
	for (const auto &v : value) {
		if (!v.is_number()) {
			throw std::invalid_argument("'" + key + "' must be an array of numbers");
		}
		out.push_back(v.get<double>());
	}
	return out;
}

} // namespace

LearningOptions ParseLearningOptions(const json &doc) {
	LearningOptions opts;
	if (doc.is_null()) {
		return opts;
	}
	RequireObject(doc, "Learning options");

	for (auto it = doc.begin(); it != doc.end(); ++it) {
		const std::string &key = it.key();
		const json &value = it.value();

		if (key == "outlier_method") {
			opts.outlier_method = libstatlearn::detection::ParseOutlierMethod(GetTyped<std::string>(value, key));
		} else if (key == "min_clean_points") {
			opts.min_clean_points = GetCount(value, key);
		} else if (key == "half_life_days") {
			opts.half_life_days = GetTyped<double>(value, key);
		} else if (key == "smoothing_alpha") {
			opts.smoothing_alpha = GetTyped<double>(value, key);
		} else if (key == "smoothing_beta") {
			opts.smoothing_beta = GetTyped<double>(value, key);
		} else if (key == "time_series_min_confidence") {
			opts.time_series_min_confidence = GetTyped<double>(value, key);
		} else if (key == "enable_bayesian") {
			opts.enable_bayesian = GetTyped<bool>(value, key);
		} else if (key == "enable_time_series") {
			opts.enable_time_series = GetTyped<bool>(value, key);
		} else if (key == "drift_threshold") {
			opts.drift_threshold = GetTyped<double>(value, key);
		} else if (key == "reference_date") {
			opts.reference_time = io::ParseIsoDate(GetTyped<std::string>(value, key));
		} else if (key == "ensemble") {
			opts.ensemble = ParseEnsembleConfig(value, opts.ensemble);
		} else {
			throw std::invalid_argument("Unknown option: '" + key +
			                            "'. Valid options are: outlier_method, min_clean_points, half_life_days, "
			                            "smoothing_alpha, smoothing_beta, time_series_min_confidence, "
			                            "enable_bayesian, enable_time_series, drift_threshold, reference_date, "
			                            "ensemble");
		}
	}

	opts.Validate();
	STATLEARN_DEBUG("Learning options: outlier_method=" << libstatlearn::detection::OutlierMethodName(opts.outlier_method)
	                                                    << " ensemble=" << libstatlearn::ensemble::EnsembleMethodName(opts.ensemble.method)
	                                                    << " min_clean_points=" << opts.min_clean_points);
	return opts;
}

LearningHistory ParseLearningHistory(const json &doc) {
	LearningHistory history;
	if (doc.is_null()) {
		return history;
	}
	RequireObject(doc, "Learning history");

	for (auto it = doc.begin(); it != doc.end(); ++it) {
		const std::string &key = it.key();
		const json &value = it.value();

		if (key == "recent_residuals") {
			history.recent_residuals = GetNumberArray(value, key);
		} else if (key == "member_errors") {
			RequireObject(value, "'member_errors'");
			for (auto member = value.begin(); member != value.end(); ++member) {
				history.member_errors[member.key()] = GetNumberArray(member.value(), "member_errors." + member.key());
			}
		} else {
			throw std::invalid_argument("Unknown history field: '" + key +
			                            "'. Valid fields are: recent_residuals, member_errors");
		}
	}
	return history;
}

json LoadJsonFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("cannot open JSON file '" + path + "'");
	}
	try {
		return json::parse(file);
	} catch (const json::parse_error &e) {
		throw std::runtime_error(path + ": " + e.what());
	}
}

} // namespace statlearn

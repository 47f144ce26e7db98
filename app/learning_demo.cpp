#include "io/observation_csv.hpp"
#include "io/result_json.hpp"
#include "include/learning_loop.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"
#include <exception>
#include <iostream>
#include <string>

namespace {

void PrintUsage(const char *program) {
	std::cerr << "usage: " << program
	          << " <observations.csv> [distance|fatigue|readiness] [--options file.json] [--history file.json]"
	          << std::endl;
}

} // namespace

int main(int argc, char **argv) {
	using namespace statlearn;

	std::string csv_path;
	std::string target_name = "distance";
	std::string options_path;
	std::string history_path;
	bool target_seen = false;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--options" || arg == "--history") {
			if (i + 1 >= argc) {
				PrintUsage(argv[0]);
				return 1;
			}
			(arg == "--options" ? options_path : history_path) = argv[++i];
		} else if (arg == "-h" || arg == "--help") {
			PrintUsage(argv[0]);
			return 0;
		} else if (csv_path.empty()) {
			csv_path = arg;
		} else if (!target_seen) {
			target_name = arg;
			target_seen = true;
		} else {
			PrintUsage(argv[0]);
			return 1;
		}
	}

	if (csv_path.empty()) {
		PrintUsage(argv[0]);
		return 1;
	}

	try {
		Tracer::Initialize();

		auto target = libstatlearn::core::ParseTargetVariable(target_name);
		auto observations = io::ReadObservationsCsv(csv_path);

		LearningOptions options;
		if (!options_path.empty()) {
			options = ParseLearningOptions(LoadJsonFile(options_path));
		}
		LearningHistory history;
		if (!history_path.empty()) {
			history = ParseLearningHistory(LoadJsonFile(history_path));
		}

		STATLEARN_INFO("Loaded " << observations.size() << " observations from " << csv_path);

		auto result = RunLearningLoop(observations, target, options, history);
		std::cout << io::ToJson(result).dump(2) << std::endl;
	} catch (const std::exception &e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}

#include "observation_csv.hpp"
#include "../utils/tracing.hpp"
#include <cctype>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace statlearn {
namespace io {

using libstatlearn::core::TimePoint;
using libstatlearn::core::TrainingObservation;

namespace {

// Days since 1970-01-01 of a proleptic Gregorian date
long long DaysFromCivil(long long y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const long long era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}

void CivilFromDays(long long z, long long &y, unsigned &m, unsigned &d) {
	z += 719468;
	const long long era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	d = doy - (153 * mp + 2) / 5 + 1;
	m = mp < 10 ? mp + 3 : mp - 9;
	y = static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool IsLeap(long long y) {
	return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(long long y, unsigned m) {
	static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	return m == 2 && IsLeap(y) ? 29 : days[m - 1];
}

std::string Trim(const std::string &s) {
	size_t start = 0;
	size_t end = s.size();
	while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
		end--;
	}
	return s.substr(start, end - start);
}

std::vector<std::string> SplitRow(const std::string &line) {
	std::vector<std::string> cells;
	std::stringstream ss(line);
	std::string cell;
	while (std::getline(ss, cell, ',')) {
		cells.push_back(Trim(cell));
	}
	// "a,b," has an empty trailing cell
	if (!line.empty() && line.back() == ',') {
		cells.emplace_back();
	}
	return cells;
}

double ParseNumber(const std::string &cell, const std::string &column) {
	size_t consumed = 0;
	double value = 0.0;
	try {
		value = std::stod(cell, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument("column '" + column + "': '" + cell + "' is not a number");
	}
	if (consumed != cell.size() || !std::isfinite(value)) {
		throw std::invalid_argument("column '" + column + "': '" + cell + "' is not a number");
	}
	return value;
}

} // namespace

TimePoint ParseIsoDate(const std::string &text) {
	const std::string s = Trim(text);
	if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
		throw std::invalid_argument("date '" + text + "' is not in YYYY-MM-DD format");
	}
	for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
		if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
			throw std::invalid_argument("date '" + text + "' is not in YYYY-MM-DD format");
		}
	}

	const long long year = std::stoll(s.substr(0, 4));
	const auto month = static_cast<unsigned>(std::stoul(s.substr(5, 2)));
	const auto day = static_cast<unsigned>(std::stoul(s.substr(8, 2)));
	if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
		throw std::invalid_argument("date '" + text + "' does not exist");
	}

	const long long days = DaysFromCivil(year, month, day);
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::hours(24 * days)));
}

std::string FormatIsoDate(TimePoint t) {
	const auto days = static_cast<long long>(
	    std::floor(libstatlearn::core::DaysBetween(TimePoint(), t)));
	long long y = 0;
	unsigned m = 0;
	unsigned d = 0;
	CivilFromDays(days, y, m, d);

	char buf[16];
	std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", y, m, d);
	return buf;
}

std::vector<TrainingObservation> ReadObservationsCsv(std::istream &in, const std::string &source_name) {
	std::vector<TrainingObservation> observations;

	std::string line;
	size_t line_no = 0;

	// Header
	std::map<std::string, size_t> columns;
	while (std::getline(in, line)) {
		line_no++;
		if (Trim(line).empty()) {
			continue;
		}
		const auto names = SplitRow(line);
		for (size_t i = 0; i < names.size(); i++) {
			columns[names[i]] = i;
		}
		break;
	}
	if (columns.empty()) {
		throw std::runtime_error(source_name + ": missing header row");
	}
	for (const char *required : {"date", "distance", "duration", "elevation"}) {
		if (columns.find(required) == columns.end()) {
			throw std::runtime_error(source_name + ": missing required column '" + required + "'");
		}
	}

	auto optional_column = [&columns](const char *name) -> long long {
		auto it = columns.find(name);
		return it == columns.end() ? -1 : static_cast<long long>(it->second);
	};
	const long long col_avg_hr = optional_column("avg_hr");
	const long long col_effort = optional_column("perceived_effort");
	const long long col_fatigue = optional_column("fatigue");
	const long long col_sleep = optional_column("sleep_quality");
	const long long col_readiness = optional_column("readiness");

	while (std::getline(in, line)) {
		line_no++;
		if (Trim(line).empty()) {
			continue;
		}

		const auto cells = SplitRow(line);
		if (cells.size() != columns.size()) {
			throw std::runtime_error(source_name + ":" + std::to_string(line_no) + ": expected " +
			                         std::to_string(columns.size()) + " fields, found " +
			                         std::to_string(cells.size()));
		}

		try {
			TrainingObservation obs;
			obs.timestamp = ParseIsoDate(cells[columns["date"]]);
			obs.distance = ParseNumber(cells[columns["distance"]], "distance");
			obs.duration = ParseNumber(cells[columns["duration"]], "duration");
			obs.elevation = ParseNumber(cells[columns["elevation"]], "elevation");

			auto read_optional = [&cells](long long col, const char *name) -> std::optional<double> {
				if (col < 0 || cells[static_cast<size_t>(col)].empty()) {
					return std::nullopt;
				}
				return ParseNumber(cells[static_cast<size_t>(col)], name);
			};
			obs.avg_hr = read_optional(col_avg_hr, "avg_hr");
			obs.perceived_effort = read_optional(col_effort, "perceived_effort");
			obs.fatigue = read_optional(col_fatigue, "fatigue");
			obs.sleep_quality = read_optional(col_sleep, "sleep_quality");
			obs.readiness = read_optional(col_readiness, "readiness");

			observations.push_back(obs);
		} catch (const std::invalid_argument &e) {
			throw std::runtime_error(source_name + ":" + std::to_string(line_no) + ": " + e.what());
		}
	}

	STATLEARN_DEBUG("Read " << observations.size() << " observations from " << source_name);
	return observations;
}

std::vector<TrainingObservation> ReadObservationsCsv(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("cannot open observation file '" + path + "'");
	}
	return ReadObservationsCsv(file, path);
}

} // namespace io
} // namespace statlearn

#pragma once

#include "libstatlearn/core/training_observation.hpp"
#include <istream>
#include <string>
#include <vector>

namespace statlearn {
namespace io {

/**
 * @brief Parse a calendar date "YYYY-MM-DD" as UTC midnight
 *
 * @throws std::invalid_argument on a malformed or impossible date
 */
libstatlearn::core::TimePoint ParseIsoDate(const std::string &text);

/// Format a time point as "YYYY-MM-DD" (UTC)
std::string FormatIsoDate(libstatlearn::core::TimePoint t);

/**
 * @brief Read training observations from CSV
 *
 * The first line is a header naming the columns. Required columns:
 *   date, distance, duration, elevation
 * Optional columns:
 *   avg_hr, perceived_effort, fatigue, sleep_quality, readiness
 * Columns may appear in any order; an empty cell of an optional column
 * means "not recorded". Blank lines are skipped.
 *
 * @param path CSV file
 * @return Observations in file order
 * @throws std::runtime_error if the file cannot be opened, a required column
 *         is missing, or a row is malformed (the message names the line)
 */
std::vector<libstatlearn::core::TrainingObservation> ReadObservationsCsv(const std::string &path);

/// Same as ReadObservationsCsv for an already open stream
std::vector<libstatlearn::core::TrainingObservation> ReadObservationsCsv(std::istream &in,
                                                                         const std::string &source_name = "<stream>");

} // namespace io
} // namespace statlearn

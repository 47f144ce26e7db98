#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace statlearn {

/**
 * @brief Leveled logging for the learning engine
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped lines with file/line info on stderr
 * - Stage timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: STATLEARN_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 * Default: warn in release builds, info in debug builds
 *
 * Example usage:
 *   STATLEARN_DEBUG("Fitting " << points.size() << " points");
 *   STATLEARN_TIMING_START();
 *   // ... do work ...
 *   STATLEARN_TIMING_END("Model fitting");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read STATLEARN_LOG_LEVEL once
	 *
	 * Called lazily by the first ShouldLog()/GetLogLevel().
	 */
	static void Initialize();

	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @return Level, or nullopt for an unknown name
	 */
	static std::optional<LogLevel> ParseLevel(const std::string &name);

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file (directories are stripped)
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const char *file, int line, const std::string &message);

	/// Log without location (used by the timing helpers)
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/// Local wall-clock time with millisecond precision
	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for TimingEnd()
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log its duration at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	static std::atomic<LogLevel> current_level_;
	static std::atomic<bool> initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

/**
 * @brief Stream-style logging at an explicit level
 *
 * Usage: STATLEARN_LOG(statlearn::LogLevel::INFO, "n=" << n)
 */
#define STATLEARN_LOG(level, msg)                                                                                      \
	do {                                                                                                               \
		if (statlearn::Tracer::ShouldLog(level)) {                                                                     \
			std::ostringstream statlearn_log_oss_;                                                                     \
			statlearn_log_oss_ << msg;                                                                                 \
			statlearn::Tracer::Log(level, __FILE__, __LINE__, statlearn_log_oss_.str());                               \
		}                                                                                                              \
	} while (0)

#define STATLEARN_TRACE(msg) STATLEARN_LOG(statlearn::LogLevel::TRACE, msg)
#define STATLEARN_DEBUG(msg) STATLEARN_LOG(statlearn::LogLevel::DBG, msg)
#define STATLEARN_INFO(msg)  STATLEARN_LOG(statlearn::LogLevel::INFO, msg)
#define STATLEARN_WARN(msg)  STATLEARN_LOG(statlearn::LogLevel::WARN, msg)
#define STATLEARN_ERROR(msg) STATLEARN_LOG(statlearn::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   STATLEARN_TIMING_START();
 *   // ... do work ...
 *   STATLEARN_TIMING_END("Operation name");
 */
#define STATLEARN_TIMING_START() uint64_t statlearn_timing_handle_ = statlearn::Tracer::TimingStart()

#define STATLEARN_TIMING_END(operation_name) statlearn::Tracer::TimingEnd(statlearn_timing_handle_, operation_name)

} // namespace statlearn

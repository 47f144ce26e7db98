#include "tracing.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace statlearn {

std::atomic<LogLevel> Tracer::current_level_ {Tracer::DefaultLevel()};
std::atomic<bool> Tracer::initialized_ {false};

// Serializes writes to stderr
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

LogLevel Tracer::DefaultLevel() {
	// Release: suppress INFO, debug builds: show it
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

std::optional<LogLevel> Tracer::ParseLevel(const std::string &name) {
	std::string lower = name;
	for (auto &c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (lower == "trace") {
		return LogLevel::TRACE;
	}
	if (lower == "debug") {
		return LogLevel::DBG;
	}
	if (lower == "info") {
		return LogLevel::INFO;
	}
	if (lower == "warn" || lower == "warning") {
		return LogLevel::WARN;
	}
	if (lower == "error") {
		return LogLevel::ERR;
	}
	if (lower == "none" || lower == "off") {
		return LogLevel::NONE;
	}
	return std::nullopt;
}

void Tracer::Initialize() {
	if (initialized_.exchange(true)) {
		return;
	}

	const char *env_level = std::getenv("STATLEARN_LOG_LEVEL");
	if (env_level == nullptr) {
		current_level_ = DefaultLevel();
		return;
	}

	// Unrecognized values keep the build default
	current_level_ = ParseLevel(env_level).value_or(DefaultLevel());
}

void Tracer::SetLogLevel(LogLevel level) {
	initialized_ = true;
	current_level_ = level;
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_) {
		Initialize();
	}
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	return level != LogLevel::NONE && level >= GetLogLevel();
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	}
	return "UNKNOWN";
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_tm {};
	localtime_r(&time, &local_tm);

	std::ostringstream oss;
	oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void Tracer::Log(LogLevel level, const char *file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const std::string path = file ? file : "";
	const size_t last_slash = path.find_last_of("/\\");
	const std::string filename = (last_slash == std::string::npos) ? path : path.substr(last_slash + 1);
	const std::string timestamp = GetTimestamp();

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [statlearn/" << GetLevelName(level) << "] " << filename << ":" << line
	          << " - " << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const std::string timestamp = GetTimestamp();

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [statlearn/" << GetLevelName(level) << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(
	    std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
	        .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	const uint64_t end_ns = TimingStart();
	const double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace statlearn

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace stippler::stipple::core {

enum class LogLevel { Debug, Info, Warning, Error };

std::string_view toString(LogLevel level);

//! Sink for pipeline progress messages. Passed into the engine so the core never writes to global streams.
class Logger {
public:
	virtual ~Logger() = default;

	virtual void log(LogLevel level, std::string_view message) = 0;

	void debug(std::string_view message) {
		log(LogLevel::Debug, message);
	}
	void info(std::string_view message) {
		log(LogLevel::Info, message);
	}
	void warning(std::string_view message) {
		log(LogLevel::Warning, message);
	}
	void error(std::string_view message) {
		log(LogLevel::Error, message);
	}
};

//! Discards everything. Default for headless runs and tests.
class NullLogger : public Logger {
public:
	void log(LogLevel, std::string_view) override {
	}
};

/*! Console and/or text file logger.
 *  File entries are timestamped: "[YYYY-MM-DD HH:MM:SS] LEVEL: message".
 */
class DebugLogger : public Logger {
public:
	//! \param [in] console Print messages to std::cout.
	//! \param [in] logFile Log file path. Truncated on construction. Empty path disables file logging.
	//! \throws     ExportError if the log file cannot be opened.
	DebugLogger(bool console, const std::filesystem::path& logFile);

	void log(LogLevel level, std::string_view message) override;

	static std::string timestamp(); //!< Current local time as "YYYY-MM-DD HH:MM:SS".

private:
	bool m_console{false};
	std::ofstream m_file{};
};

} // namespace stippler::stipple::core

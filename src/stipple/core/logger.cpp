#include "stipple/core/logger.hpp"

#include "stipple/core/errors.hpp"

#include <ctime>
#include <iostream>

namespace stippler::stipple::core {

std::string_view toString(const LogLevel level) {
	switch (level) {
	case LogLevel::Debug:
		return "DEBUG";
	case LogLevel::Info:
		return "INFO";
	case LogLevel::Warning:
		return "WARNING";
	case LogLevel::Error:
		return "ERROR";
	}
	return "UNKNOWN";
}

DebugLogger::DebugLogger(const bool console, const std::filesystem::path& logFile) : m_console{console} {
	if (logFile.empty()) {
		return;
	}

	m_file.open(logFile, std::ios::out | std::ios::trunc);
	if (!m_file.is_open()) {
		throw ExportError("Could not open log file " + logFile.string());
	}
	m_file << '[' << timestamp() << "] " << toString(LogLevel::Info) << ": Created\n";
	m_file.flush();
}

void DebugLogger::log(const LogLevel level, const std::string_view message) {
	if (m_console) {
		if (level == LogLevel::Error) {
			std::cerr << "[Error] " << message << '\n';
		} else {
			std::cout << message << '\n';
		}
	}

	if (m_file.is_open()) {
		m_file << '[' << timestamp() << "] " << toString(level) << ": " << message << '\n';
		m_file.flush();
	}
}

std::string DebugLogger::timestamp() {
	const std::time_t now = std::time(nullptr);
	std::tm timeInfo{};
	localtime_r(&now, &timeInfo);

	char buffer[20];
	std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeInfo);
	return buffer;
}

} // namespace stippler::stipple::core

#pragma once

#include <cstddef>
#include <string>

namespace youwee {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Open (truncate) the log file; empty path keeps console-only logging.
void initLogFile(const std::string& path, size_t maxBytes = 512 * 1024);
void closeLogFile();
void setLogLevel(LogLevel level);
// Returns false for an unrecognized level name (level is left unchanged).
bool setLogLevelFromString(const std::string& level);
LogLevel logLevel();

void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace youwee

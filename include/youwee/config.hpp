#pragma once

#include <cstddef>
#include <string>

namespace youwee {

constexpr const char* kLogLevelEnvVar = "YOUWEE_LOG_LEVEL";

struct Config {
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file; blank keeps console-only logging
    std::string logFile;
    // Rotate the log file past this size
    size_t logMaxBytes{512 * 1024};
};

// Load <dir>/.env then <dir>/config.json (JSON wins). Missing files keep defaults;
// a present but malformed file, or an unknown log level, is an error.
bool loadConfig(Config& outCfg, std::string& outError, const std::string& dir = ".");

#ifdef UNIT_TEST
// Test helpers: parse in-memory contents.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError);
#endif

} // namespace youwee

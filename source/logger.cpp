#include "youwee/logger.hpp"
#include "youwee/util.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace youwee {

static std::atomic<LogLevel> gMinLevel{LogLevel::Info};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;
static size_t gMaxLogBytes = 512 * 1024;

void initLogFile(const std::string& path, size_t maxBytes) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogPath = path;
    gLogBytes = 0;
    gMaxLogBytes = maxBytes;
    if (path.empty()) return;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    gLogFile.open(path, std::ios::trunc);
    if (gLogFile) {
        gLogFile << "youwee-links log start\n";
        gLogFile.flush();
        gLogBytes = static_cast<size_t>(gLogFile.tellp());
    } else {
        std::cerr << "[LOG] cannot open log file " << path << ", console only" << std::endl;
        gLogPath.clear();
    }
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogPath.clear();
    gLogBytes = 0;
}

void setLogLevel(LogLevel level) { gMinLevel.store(level); }

LogLevel logLevel() { return gMinLevel.load(); }

bool setLogLevelFromString(const std::string& level) {
    const std::string l = util::toLowerCopy(util::trimCopy(level));
    if (l == "debug") gMinLevel.store(LogLevel::Debug);
    else if (l == "info") gMinLevel.store(LogLevel::Info);
    else if (l == "warn" || l == "warning") gMinLevel.store(LogLevel::Warn);
    else if (l == "error") gMinLevel.store(LogLevel::Error);
    else return false;
    return true;
}

// Caller holds gLogMutex.
static void rotateLocked() {
    if (gLogFile.is_open()) gLogFile.close();
    std::error_code ec;
    std::filesystem::path p(gLogPath);
    std::filesystem::path rotated = p;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(p, rotated, ec); // best-effort
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
    if (gLogFile) {
        gLogFile << "youwee-links log start (rotated)\n";
        gLogFile.flush();
        gLogBytes = static_cast<size_t>(gLogFile.tellp());
    }
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < gMinLevel.load()) return;
    const std::string line = "[" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (level == LogLevel::Error) std::cerr << line << std::endl;
    else std::cout << line << std::endl;

    if (gLogPath.empty()) return;
    const size_t writeBytes = line.size() + 1;
    if (gLogBytes + writeBytes > gMaxLogBytes) rotateLocked();
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace youwee

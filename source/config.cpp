#include "youwee/config.hpp"
#include "youwee/logger.hpp"
#include "youwee/util.hpp"
#include "mini/json.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace youwee {

static bool isKnownLogLevel(const std::string& lvl) {
    return lvl == "debug" || lvl == "info" || lvl == "warn" || lvl == "warning" || lvl == "error";
}

static bool parseEnvContents(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        line = util::trimCopy(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            outError = "Invalid config line " + std::to_string(lineNo) + " in .env";
            return false;
        }
        std::string key = util::toLowerCopy(util::trimCopy(line.substr(0, pos)));
        std::string val = util::trimCopy(line.substr(pos + 1));
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        if (key == "log_level") outCfg.logLevel = util::toLowerCopy(val);
        else if (key == "log_file") outCfg.logFile = val;
        else if (key == "log_max_bytes") {
            long long n = std::atoll(val.c_str());
            if (n > 0) outCfg.logMaxBytes = static_cast<size_t>(n);
        }
    }
    return true;
}

static bool parseJsonContents(const std::string& contents, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(contents, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    auto getStr = [&](const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::String) {
            out = it->second.str;
        }
    };
    {
        std::string lvl;
        getStr("log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = util::toLowerCopy(lvl);
    }
    getStr("log_file", outCfg.logFile);
    auto it = obj.find("log_max_bytes");
    if (it != obj.end() && it->second.type == mini::Value::Type::Number && it->second.number > 0) {
        outCfg.logMaxBytes = static_cast<size_t>(it->second.number);
    }
    return true;
}

static bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) return false;
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

static bool validate(const Config& cfg, std::string& outError) {
    if (!isKnownLogLevel(cfg.logLevel)) {
        outError = "Unsupported log_level '" + cfg.logLevel + "'.";
        return false;
    }
    return true;
}

bool loadConfig(Config& outCfg, std::string& outError, const std::string& dir) {
    const std::string envPath = dir + "/.env";
    const std::string jsonPath = dir + "/config.json";

    std::string contents;
    if (readFile(envPath, contents)) {
        if (!parseEnvContents(contents, outCfg, outError)) return false;
        logDebug("loaded " + envPath, "CFG");
    }
    if (readFile(jsonPath, contents)) {
        if (!parseJsonContents(contents, outCfg, outError)) return false;
        logDebug("loaded " + jsonPath, "CFG");
    }
    if (const char* env = std::getenv(kLogLevelEnvVar)) {
        if (*env) outCfg.logLevel = util::toLowerCopy(util::trimCopy(env));
    }
    return validate(outCfg, outError);
}

#ifdef UNIT_TEST
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    return parseEnvContents(contents, outCfg, outError) && validate(outCfg, outError);
}

bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError) {
    return parseJsonContents(contents, outCfg, outError) && validate(outCfg, outError);
}
#endif

} // namespace youwee

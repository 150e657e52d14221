#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "youwee/activation.hpp"
#include "youwee/commands.hpp"
#include "youwee/config.hpp"
#include "youwee/errors.hpp"
#include "youwee/events.hpp"
#include "youwee/logger.hpp"
#include "youwee/pending_links.hpp"
#include "youwee/version.hpp"

using youwee::ActivationRouter;
using youwee::Config;
using youwee::PendingLinkQueue;

static void printUsage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--config DIR] [activation args...]\n"
              << "stdin commands:\n"
              << "  activate <args...>   second-instance activation\n"
              << "  listen               attach a listener that prints payload JSON\n"
              << "  unlisten             detach the listener (links are buffered)\n"
              << "  consume              run " << youwee::kConsumePendingLinksCommand << "\n"
              << "  quit\n";
}

static std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string w;
    while (in >> w) out.push_back(w);
    return out;
}

int main(int argc, char** argv) {
    std::string configDir = ".";
    std::vector<std::string> launchArgs;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            configDir = argv[++i];
        } else if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            launchArgs.push_back(a);
        }
    }

    Config cfg;
    std::string err;
    if (!youwee::loadConfig(cfg, err, configDir)) {
        youwee::ErrorInfo info = youwee::classifyError(err, youwee::ErrorCategory::Config);
        youwee::logError(std::string(youwee::errorCodeLabel(info.code)) + ": " + info.userMessage + " (" + err + ")", "CFG");
        return 2;
    }
    youwee::setLogLevelFromString(cfg.logLevel); // loadConfig rejected unknown levels
    if (!cfg.logFile.empty()) youwee::initLogFile(cfg.logFile, cfg.logMaxBytes);
    youwee::logInfo(std::string("youwee-linkd ") + youwee::appVersion() + " starting");

    // One queue for the whole process, shared by reference.
    PendingLinkQueue pending;
    ActivationRouter router(pending);

    router.handleActivation(launchArgs, "launch");

    std::string line;
    while (std::getline(std::cin, line)) {
        auto words = splitWords(line);
        if (words.empty()) continue;
        const std::string cmd = words.front();
        if (cmd == "quit" || cmd == "exit") break;
        if (cmd == "activate") {
            words.erase(words.begin());
            router.handleActivation(words, "second-instance");
        } else if (cmd == "listen") {
            router.attachListener([](const youwee::ExternalOpenUrlPayload& payload) {
                std::cout << youwee::kExternalOpenUrlEvent << " " << youwee::toJson(payload) << std::endl;
            });
        } else if (cmd == "unlisten") {
            router.detachListener();
        } else {
            const std::string name = cmd == "consume" ? youwee::kConsumePendingLinksCommand : cmd;
            std::string out;
            if (youwee::dispatchUiCommand(name, pending, out, err)) {
                std::cout << out << std::endl;
            } else {
                youwee::ErrorInfo info = youwee::classifyError(err);
                std::cout << "error: " << info.userMessage << std::endl;
            }
        }
    }

    router.detachListener();
    youwee::logInfo("shutdown, " + std::to_string(pending.size()) + " link(s) left unconsumed");
    youwee::closeLogFile();
    return 0;
}

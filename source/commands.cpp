#include "youwee/commands.hpp"
#include "youwee/logger.hpp"
#include "youwee/util.hpp"
#include "mini/json.hpp"

namespace youwee {

std::vector<std::string> consumePendingLinks(PendingLinkQueue& queue) {
    return queue.takeAll();
}

bool dispatchUiCommand(const std::string& name, PendingLinkQueue& queue,
                       std::string& outJson, std::string& outError) {
    const std::string cmd = util::trimCopy(name);
    if (cmd == kConsumePendingLinksCommand) {
        auto links = consumePendingLinks(queue);
        logDebug("UI consumed " + std::to_string(links.size()) + " pending link(s)", "CMD");
        outJson = mini::dump_string_array(links);
        return true;
    }
    outError = "Unknown command: " + cmd;
    logWarn(outError, "CMD");
    return false;
}

} // namespace youwee

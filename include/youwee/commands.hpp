#pragma once

#include "youwee/pending_links.hpp"
#include <string>
#include <vector>

namespace youwee {

constexpr const char* kConsumePendingLinksCommand = "consume_pending_external_links";

// UI pull for links that arrived before its listener was attached. Empties the queue.
std::vector<std::string> consumePendingLinks(PendingLinkQueue& queue);

// Request boundary for the UI. On success outJson holds the command's JSON result.
bool dispatchUiCommand(const std::string& name, PendingLinkQueue& queue,
                       std::string& outJson, std::string& outError);

} // namespace youwee

#include "youwee/link_extractor.hpp"
#include "youwee/util.hpp"
#include <algorithm>

namespace youwee {

bool isValidExternalLink(const std::string& link) {
    const std::string trimmed = util::trimCopy(link);
    if (trimmed.empty() || trimmed.size() > kMaxExternalLinkLength) return false;
    if (!util::startsWith(trimmed, kDownloadLinkPrefix)) return false;
    return trimmed.find(kVersionMarker) != std::string::npos &&
           trimmed.find(kPayloadMarker) != std::string::npos;
}

std::optional<std::string> extractLinkFromArgument(const std::string& arg) {
    const std::string trimmed = util::trimOneQuote(util::trimOneQuote(util::trimCopy(arg), '"'), '\'');
    if (util::startsWith(trimmed, kLinkScheme)) {
        if (isValidExternalLink(trimmed)) return trimmed;
        return std::nullopt;
    }

    // Scheme glued behind another token, e.g. a launcher flag.
    const auto start = trimmed.find(kLinkScheme);
    if (start == std::string::npos) return std::nullopt;
    std::string candidate = util::trimOneQuote(trimmed.substr(start), '"');
    if (isValidExternalLink(candidate)) return candidate;
    return std::nullopt;
}

std::vector<std::string> extractLinksFromArguments(const std::vector<std::string>& args) {
    std::vector<std::string> links;
    for (const auto& arg : args) {
        auto link = extractLinkFromArgument(arg);
        if (!link) continue;
        if (std::find(links.begin(), links.end(), *link) == links.end()) {
            links.push_back(std::move(*link));
        }
    }
    return links;
}

} // namespace youwee

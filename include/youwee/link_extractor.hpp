#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace youwee {

constexpr const char* kLinkScheme = "youwee://";
constexpr const char* kDownloadLinkPrefix = "youwee://download";
constexpr const char* kVersionMarker = "v=1";
constexpr const char* kPayloadMarker = "url=";
constexpr size_t kMaxExternalLinkLength = 4096;

// Coarse syntactic gate for a download deep link: after trimming, non-empty,
// at most kMaxExternalLinkLength chars, starts with youwee://download and
// contains both "v=1" and "url=". Not a URI parse.
bool isValidExternalLink(const std::string& link);

// Pull at most one valid link out of a single process argument.
// Handles quoted arguments and a scheme embedded after other text.
std::optional<std::string> extractLinkFromArgument(const std::string& arg);

// Valid links found in argv, deduplicated, in first-seen order. Pure.
std::vector<std::string> extractLinksFromArguments(const std::vector<std::string>& args);

} // namespace youwee

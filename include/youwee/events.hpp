#pragma once

#include <string>
#include <vector>

namespace youwee {

// Event name the UI listens on for links delivered while it is running.
constexpr const char* kExternalOpenUrlEvent = "external-open-url";

// Shared by live delivery and consumePendingLinks so both paths carry one shape.
struct ExternalOpenUrlPayload {
    std::vector<std::string> urls;
};

// {"urls":[...]}
std::string toJson(const ExternalOpenUrlPayload& payload);

bool parseOpenUrlPayload(const std::string& json, ExternalOpenUrlPayload& out, std::string& outError);

} // namespace youwee

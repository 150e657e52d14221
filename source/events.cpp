#include "youwee/events.hpp"
#include "mini/json.hpp"

namespace youwee {

std::string toJson(const ExternalOpenUrlPayload& payload) {
    return "{\"urls\":" + mini::dump_string_array(payload.urls) + "}";
}

bool parseOpenUrlPayload(const std::string& json, ExternalOpenUrlPayload& out, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(json, obj)) {
        outError = "Malformed payload JSON.";
        return false;
    }
    auto it = obj.find("urls");
    if (it == obj.end() || it->second.type != mini::Value::Type::Array) {
        outError = "Malformed payload: missing urls array.";
        return false;
    }
    std::vector<std::string> urls;
    urls.reserve(it->second.array.size());
    for (const auto& v : it->second.array) {
        if (v.type != mini::Value::Type::String) {
            outError = "Malformed payload: urls must be strings.";
            return false;
        }
        urls.push_back(v.str);
    }
    out.urls = std::move(urls);
    return true;
}

} // namespace youwee

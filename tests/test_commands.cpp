#include "catch.hpp"
#include "youwee/commands.hpp"
#include "youwee/events.hpp"

#include <string>
#include <vector>

namespace {
const std::string kA = "youwee://download?v=1&url=https://a.example/watch?x=\"1\"";
const std::string kB = "youwee://download?v=1&url=https://b.example/";
} // namespace

TEST_CASE("consumePendingLinks empties the queue") {
    youwee::PendingLinkQueue q;
    q.enqueue({kA, kB});
    REQUIRE(youwee::consumePendingLinks(q) == std::vector<std::string>{kA, kB});
    REQUIRE(youwee::consumePendingLinks(q).empty());
}

TEST_CASE("dispatchUiCommand returns pending links as a JSON array") {
    youwee::PendingLinkQueue q;
    q.enqueue({kB});
    std::string json;
    std::string err;
    REQUIRE(youwee::dispatchUiCommand(youwee::kConsumePendingLinksCommand, q, json, err));
    REQUIRE(err.empty());
    REQUIRE(json == "[\"youwee://download?v=1&url=https://b.example/\"]");

    REQUIRE(youwee::dispatchUiCommand(youwee::kConsumePendingLinksCommand, q, json, err));
    REQUIRE(json == "[]");
}

TEST_CASE("dispatchUiCommand rejects unknown commands") {
    youwee::PendingLinkQueue q;
    q.enqueue({kB});
    std::string json;
    std::string err;
    REQUIRE_FALSE(youwee::dispatchUiCommand("drop_everything", q, json, err));
    REQUIRE_FALSE(err.empty());
    REQUIRE(q.size() == 1);
}

TEST_CASE("payload JSON escapes quotes and parses back") {
    youwee::ExternalOpenUrlPayload p{{kA, kB}};
    const std::string json = youwee::toJson(p);
    REQUIRE(json.rfind("{\"urls\":[", 0) == 0);
    REQUIRE(json.find("x=\\\"1\\\"") != std::string::npos);

    youwee::ExternalOpenUrlPayload back;
    std::string err;
    REQUIRE(youwee::parseOpenUrlPayload(json, back, err));
    REQUIRE(back.urls == p.urls);
}

TEST_CASE("empty payload serializes to an empty urls array") {
    REQUIRE(youwee::toJson(youwee::ExternalOpenUrlPayload{}) == "{\"urls\":[]}");
}

TEST_CASE("parseOpenUrlPayload rejects malformed input") {
    youwee::ExternalOpenUrlPayload out;
    std::string err;
    REQUIRE_FALSE(youwee::parseOpenUrlPayload("{\"urls\":", out, err));
    REQUIRE_FALSE(err.empty());
    err.clear();
    REQUIRE_FALSE(youwee::parseOpenUrlPayload("{\"links\":[]}", out, err));
    REQUIRE_FALSE(err.empty());
    err.clear();
    REQUIRE_FALSE(youwee::parseOpenUrlPayload("{\"urls\":[1,2]}", out, err));
    REQUIRE_FALSE(err.empty());
}

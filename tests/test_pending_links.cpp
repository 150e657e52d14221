#include "catch.hpp"
#include "youwee/pending_links.hpp"

#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::string makeLink(int i) {
    return "youwee://download?v=1&url=https://example.com/watch/" + std::to_string(i);
}

// Lock fails on demand, standing in for a lock left unusable by a crashed holder.
struct PoisonableMutex {
    std::mutex inner;
    bool poisoned{false};

    void lock() {
        if (poisoned) throw std::system_error(std::make_error_code(std::errc::state_not_recoverable));
        inner.lock();
    }
    void unlock() { inner.unlock(); }
};

} // namespace

TEST_CASE("takeAll on a fresh queue is empty") {
    youwee::PendingLinkQueue q;
    REQUIRE(q.takeAll().empty());
    REQUIRE(q.size() == 0);
}

TEST_CASE("enqueue of an empty list leaves the queue alone") {
    youwee::PendingLinkQueue q;
    q.enqueue({makeLink(1)});
    q.enqueue({});
    REQUIRE(q.size() == 1);
}

TEST_CASE("enqueue skips links already pending") {
    youwee::PendingLinkQueue q;
    q.enqueue({makeLink(1)});
    q.enqueue({makeLink(1)});
    REQUIRE(q.size() == 1);

    q.enqueue({makeLink(2), makeLink(1), makeLink(2)});
    REQUIRE(q.snapshot() == std::vector<std::string>{makeLink(1), makeLink(2)});
}

TEST_CASE("enqueue re-validates its input") {
    youwee::PendingLinkQueue q;
    q.enqueue({"", "noise", "youwee://download?v=1", makeLink(7), "youwee://settings?v=1&url=x"});
    REQUIRE(q.snapshot() == std::vector<std::string>{makeLink(7)});
}

TEST_CASE("overflow drops the oldest links") {
    youwee::PendingLinkQueue q;
    for (int i = 1; i <= 101; ++i) q.enqueue({makeLink(i)});
    auto all = q.takeAll();
    REQUIRE(all.size() == youwee::kMaxPendingExternalLinks);
    REQUIRE(all.front() == makeLink(2));
    REQUIRE(all.back() == makeLink(101));
    for (size_t k = 0; k < all.size(); ++k) REQUIRE(all[k] == makeLink(static_cast<int>(k) + 2));
}

TEST_CASE("overflow within a single batch keeps the newest 100") {
    youwee::PendingLinkQueue q;
    std::vector<std::string> batch;
    for (int i = 0; i < 150; ++i) batch.push_back(makeLink(i));
    q.enqueue(batch);
    auto all = q.takeAll();
    REQUIRE(all.size() == 100);
    REQUIRE(all.front() == makeLink(50));
    REQUIRE(all.back() == makeLink(149));
}

TEST_CASE("evicted link can be enqueued again") {
    youwee::PendingLinkQueue q;
    for (int i = 0; i <= 100; ++i) q.enqueue({makeLink(i)});
    q.enqueue({makeLink(0)});
    auto all = q.snapshot();
    REQUIRE(all.size() == 100);
    REQUIRE(all.front() == makeLink(2));
    REQUIRE(all.back() == makeLink(0));
}

TEST_CASE("takeAll drains in insertion order and leaves the queue empty") {
    youwee::PendingLinkQueue q;
    q.enqueue({makeLink(3), makeLink(1)});
    q.enqueue({makeLink(2)});
    auto before = q.snapshot();
    auto drained = q.takeAll();
    REQUIRE(drained == before);
    REQUIRE(drained == std::vector<std::string>{makeLink(3), makeLink(1), makeLink(2)});
    REQUIRE(q.takeAll().empty());
    REQUIRE(q.size() == 0);
}

TEST_CASE("accepted links come back byte-for-byte") {
    youwee::PendingLinkQueue q;
    const std::string odd = "youwee://download?v=1&url=https%3A%2F%2Fex.com%2F%E2%9C%93&title=\xE2\x9C\x93";
    q.enqueue({odd});
    auto out = q.takeAll();
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == odd);
}

TEST_CASE("lock failure turns enqueue into a no-op and reads into empty results") {
    youwee::BasicPendingLinkQueue<PoisonableMutex> q;
    q.enqueue({makeLink(1)});
    REQUIRE(q.size() == 1);

    q.mutex().poisoned = true;
    REQUIRE_NOTHROW(q.enqueue({makeLink(2)}));
    REQUIRE(q.takeAll().empty());
    REQUIRE(q.size() == 0);
    REQUIRE(q.snapshot().empty());

    q.mutex().poisoned = false;
    REQUIRE(q.takeAll() == std::vector<std::string>{makeLink(1)});
}

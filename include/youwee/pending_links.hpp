#pragma once

#include "youwee/link_extractor.hpp"
#include "youwee/logger.hpp"
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace youwee {

constexpr size_t kMaxPendingExternalLinks = 100;

// Deep links that arrived before the UI listener was attached.
// Bounded FIFO: unique entries in insertion order, oldest dropped on overflow.
// Every operation is total. If the lock cannot be taken (Mutex::lock throws
// std::system_error) enqueue does nothing and reads come back empty.
template <typename Mutex>
class BasicPendingLinkQueue {
public:
    BasicPendingLinkQueue() = default;

    BasicPendingLinkQueue(const BasicPendingLinkQueue&) = delete;
    BasicPendingLinkQueue& operator=(const BasicPendingLinkQueue&) = delete;

    // Links are re-validated here; callers are not trusted to have done it.
    void enqueue(const std::vector<std::string>& urls) {
        if (urls.empty()) return;
        withLock([&]() {
            for (const auto& url : urls) {
                if (!isValidExternalLink(url)) continue;
                if (std::find(pending_.begin(), pending_.end(), url) != pending_.end()) continue;
                pending_.push_back(url);
                if (pending_.size() > kMaxPendingExternalLinks) {
                    const size_t overflow = pending_.size() - kMaxPendingExternalLinks;
                    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(overflow));
                }
            }
        });
    }

    // Swap the contents out for an empty queue and return them in order.
    std::vector<std::string> takeAll() {
        std::vector<std::string> out;
        withLock([&]() { std::swap(out, pending_); });
        return out;
    }

    size_t size() const {
        size_t n = 0;
        withLock([&]() { n = pending_.size(); });
        return n;
    }

    std::vector<std::string> snapshot() const {
        std::vector<std::string> out;
        withLock([&]() { out = pending_; });
        return out;
    }

#ifdef UNIT_TEST
    Mutex& mutex() { return mutex_; }
#endif

private:
    template <typename F>
    void withLock(F&& fn) const {
        std::unique_lock<Mutex> lock(mutex_, std::defer_lock);
        try {
            lock.lock();
        } catch (const std::system_error& e) {
            logWarn(std::string("pending link queue lock failed: ") + e.what(), "LINK");
            return;
        }
        fn();
    }

    mutable Mutex mutex_;
    std::vector<std::string> pending_;
};

using PendingLinkQueue = BasicPendingLinkQueue<std::mutex>;

} // namespace youwee

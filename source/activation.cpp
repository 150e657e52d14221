#include "youwee/activation.hpp"
#include "youwee/link_extractor.hpp"
#include "youwee/logger.hpp"
#include "youwee/util.hpp"
#include <exception>

namespace youwee {

ActivationRouter::ActivationRouter(PendingLinkQueue& queue) : queue_(queue) {}

size_t ActivationRouter::handleActivation(const std::vector<std::string>& argv, const std::string& source) {
    auto links = extractLinksFromArguments(argv);
    if (links.empty()) {
        logDebug("activation from " + source + " carried no deep link (" +
                 std::to_string(argv.size()) + " arg(s))", "LINK");
        return 0;
    }
    const size_t count = links.size();
    for (const auto& l : links) logInfo("deep link from " + source + ": " + util::ellipsize(l, 120), "LINK");

    Listener listener;
    {
        // Buffering happens under listenerMutex_ so attachListener's flush cannot slip in between.
        std::lock_guard<std::mutex> lock(listenerMutex_);
        if (!listener_) {
            queue_.enqueue(links);
            logDebug("buffered " + std::to_string(count) + " link(s)", "LINK");
            return count;
        }
        listener = listener_;
    }
    deliver(listener, std::move(links));
    return count;
}

void ActivationRouter::attachListener(Listener listener) {
    if (!listener) {
        detachListener();
        return;
    }
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener_ = listener;
        pending = queue_.takeAll();
    }
    if (!pending.empty()) {
        logInfo("flushing " + std::to_string(pending.size()) + " pending link(s) to listener", "LINK");
        deliver(listener, std::move(pending));
    }
}

void ActivationRouter::detachListener() {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = nullptr;
}

bool ActivationRouter::hasListener() const {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    return static_cast<bool>(listener_);
}

void ActivationRouter::deliver(const Listener& listener, std::vector<std::string> urls) {
    ExternalOpenUrlPayload payload{std::move(urls)};
    try {
        listener(payload);
    } catch (const std::exception& e) {
        logError(std::string("listener failed, re-queueing links: ") + e.what(), "LINK");
        queue_.enqueue(payload.urls);
    }
}

} // namespace youwee

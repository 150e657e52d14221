#pragma once

#include "youwee/events.hpp"
#include "youwee/pending_links.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace youwee {

// Routes OS activations (cold-start argv, second-instance argv) either to the
// pending queue or, once the UI has attached a listener, straight to it.
// The listener runs on the activating thread and never under a lock.
// Lock order: listenerMutex_ before the queue's own lock.
class ActivationRouter {
public:
    using Listener = std::function<void(const ExternalOpenUrlPayload&)>;

    explicit ActivationRouter(PendingLinkQueue& queue);

    ActivationRouter(const ActivationRouter&) = delete;
    ActivationRouter& operator=(const ActivationRouter&) = delete;

    // Returns the number of valid links found in argv.
    size_t handleActivation(const std::vector<std::string>& argv, const std::string& source);

    // Install the UI listener and hand it anything already pending.
    void attachListener(Listener listener);
    void detachListener();
    bool hasListener() const;

private:
    // A listener that throws gets its links re-queued.
    void deliver(const Listener& listener, std::vector<std::string> urls);

    PendingLinkQueue& queue_;
    mutable std::mutex listenerMutex_;
    Listener listener_;
};

} // namespace youwee

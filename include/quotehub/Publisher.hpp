#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace qh {

// Fans a reconciled snapshot out to every registered subscriber.
class Publisher {
public:
    using Handler   = std::function<void(const Snapshot&)>;
    using HandlerId = std::uint64_t;

    // Subscribe under a name. Subscribing a name that is already registered
    // is a no-op and returns the existing id.
    HandlerId subscribe(const std::string& name, Handler handler);

    // Unsubscribe; returns true if a handler was removed.
    bool unsubscribe(HandlerId id);

    // Deliver the same snapshot to every subscriber. A subscriber that throws
    // is logged and skipped. Returns the number of successful deliveries.
    std::size_t notify(const Snapshot& snapshot) const;

private:
    struct Subscriber {
        HandlerId   id;
        std::string name;
        Handler     handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    HandlerId next_id_{1};
};

} // namespace qh

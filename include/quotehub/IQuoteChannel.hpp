#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <functional>
#include <string>
#include <vector>

/*
The interface that channels -- the classes that bring quotes in from the provider -- inherit.
The engine wires its callbacks in before start(); a channel only ever calls the
callbacks relevant to it.
*/

namespace support { class ShutdownSignal; }

namespace qh {

// One completed poll.
struct PollBatch {
    std::vector<PolledQuote> quotes;
    MarketStatus             market_status{MarketStatus::Closed};
};

// Connection state change on a streaming channel.
struct ChannelStatus {
    bool                     connected{false};
    std::string              detail;
    std::vector<std::string> subscribed;   // identifiers subscribed on this connection
};

class IQuoteChannel {
public:
    using PollHandler   = std::function<std::size_t(const PollBatch&)>;
    using PushHandler   = std::function<std::size_t(const std::vector<PushUpdate>&)>;
    using StatusHandler = std::function<void(const ChannelStatus&)>;

    virtual ~IQuoteChannel() = default;

    virtual std::string name() const = 0;

    // Default no-ops so a channel only implements the feeds it produces.
    virtual void subscribe_polls(PollHandler /*on_batch*/) { }
    virtual void subscribe_pushes(PushHandler /*on_updates*/) { }
    virtual void subscribe_status(StatusHandler /*on_status*/) { }

    // Start the channel's worker; it runs until `shutdown` fires or stop() is called.
    virtual void start(support::ShutdownSignal& shutdown) = 0;
    virtual void stop() = 0;

    virtual bool is_connected() const { return false; }
};

}

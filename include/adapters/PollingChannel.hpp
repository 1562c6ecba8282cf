#pragma once
#include "quotehub/EngineConfig.hpp"
#include "quotehub/IQuoteApi.hpp"
#include "quotehub/IQuoteChannel.hpp"
#include "quotehub/InstrumentRegistry.hpp"
#include "support/ShutdownSignal.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

/*
PollingChannel:
  Fetches a bulk quote for every instrument at a fixed interval and hands the
  batch, stamped with the current market status, to the engine. The first
  fetch runs synchronously inside start() so the table is populated before
  the stream connects. Fetch errors are logged; the next tick retries.
*/

namespace adapter {

class PollingChannel : public qh::IQuoteChannel {
public:
    using Clock = std::function<qh::TimePoint()>;

    PollingChannel(std::shared_ptr<qh::IQuoteApi> api,
                   std::shared_ptr<const qh::InstrumentRegistry> registry,
                   qh::EngineConfig config,
                   Clock clock = Clock());
    ~PollingChannel() override;

    std::string name() const override { return "PollingChannel"; }

    void subscribe_polls(PollHandler on_batch) override { on_batch_ = std::move(on_batch); }

    void start(support::ShutdownSignal& shutdown) override;
    void stop() override;
    bool is_connected() const override { return last_ok_.load(); }

    // One poll. Returns the number of quotes the engine applied; 0 on failure.
    std::size_t fetch_quotes();

private:
    void run_loop(support::ShutdownSignal& shutdown);

    std::shared_ptr<qh::IQuoteApi> api_;
    std::shared_ptr<const qh::InstrumentRegistry> registry_;
    qh::EngineConfig config_;
    Clock clock_;
    PollHandler on_batch_;

    std::atomic<bool> running_{false};
    std::atomic<bool> last_ok_{false};
    std::thread th_;
};

}

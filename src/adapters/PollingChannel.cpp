#include "adapters/PollingChannel.hpp"
#include "quotehub/MarketSession.hpp"
#include <iostream>

namespace adapter {

PollingChannel::PollingChannel(std::shared_ptr<qh::IQuoteApi> api,
                               std::shared_ptr<const qh::InstrumentRegistry> registry,
                               qh::EngineConfig config,
                               Clock clock)
    : api_(std::move(api)),
      registry_(std::move(registry)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

PollingChannel::~PollingChannel() {
    stop();
}

std::size_t PollingChannel::fetch_quotes() {
    try {
        qh::PollBatch batch;
        batch.quotes = api_->quotes(registry_->identifiers());
        batch.market_status = qh::market_status_at(clock_(), config_.session);
        last_ok_.store(true);
        if (!on_batch_) return 0;
        return on_batch_(batch);
    } catch (const std::exception& e) {
        last_ok_.store(false);
        std::cerr << "[PollingChannel] Error fetching quotes: " << e.what() << "\n";
        return 0;
    }
}

void PollingChannel::start(support::ShutdownSignal& shutdown) {
    if (running_.exchange(true)) return;

    std::cout << "[PollingChannel] Fetching initial data...\n";
    fetch_quotes();

    th_ = std::thread([this, &shutdown] { run_loop(shutdown); });
}

void PollingChannel::run_loop(support::ShutdownSignal& shutdown) {
    while (running_.load()) {
        if (shutdown.wait_for(config_.poll_interval)) break;
        if (!running_.load()) break;
        fetch_quotes();
    }
}

void PollingChannel::stop() {
    running_.store(false);
    if (th_.joinable()) th_.join();
}

}

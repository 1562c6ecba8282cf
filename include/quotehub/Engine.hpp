#pragma once

#include "EngineConfig.hpp"
#include "HistoricalWorker.hpp"
#include "InstrumentRegistry.hpp"
#include "IQuoteApi.hpp"
#include "IQuoteChannel.hpp"
#include "LivenessMonitor.hpp"
#include "Publisher.hpp"
#include "SnapshotStore.hpp"
#include "SymbolMapping.hpp"
#include "SymbolResolver.hpp"
#include "support/ShutdownSignal.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>


namespace qh {

/**
 * The reconciliation engine.
 *
 * Owns the snapshot store, the symbol mapping, the liveness state and the
 * publisher, and merges updates from every attached channel into one table.
 * Each poll batch or push message ends in exactly one full-snapshot publication.
 *
 * Construct one per process and hand it by reference to whatever serves
 * consumers; there is no global instance.
 */
class Engine {
public:
    using Clock = std::function<TimePoint()>;
    using DataCallback = Publisher::Handler;

    // Throws RegistryError if the registry is null or empty.
    Engine(EngineConfig config,
           std::shared_ptr<const InstrumentRegistry> registry,
           Clock clock = Clock());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ---- wiring (before start) ----
    void set_quote_api(std::shared_ptr<IQuoteApi> api);
    void add_channel(std::unique_ptr<IQuoteChannel> channel);
    void set_historical_worker(std::unique_ptr<HistoricalWorker> worker);

    // ---- consumer API ----
    // Registering an already registered name is a no-op.
    Publisher::HandlerId register_data_callback(const std::string& name, DataCallback cb);
    bool unregister_data_callback(Publisher::HandlerId id);

    // Point-in-time copy of every quote, index first.
    Snapshot get_market_data() const;

    // ---- ingestion (called from channel threads) ----
    std::size_t apply_poll_batch(const PollBatch& batch);
    std::size_t apply_push_updates(const std::vector<PushUpdate>& updates);
    void on_channel_status(const std::string& channel, const ChannelStatus& status);

    // Historical signal hook; publishes once for the whole set.
    std::size_t attach_signals(const std::unordered_map<std::string, Signal>& signals);

    // ---- liveness ----
    void check_liveness();
    bool fallback_active() const { return liveness_.fallback_active(); }
    FeedState feed_state() const { return liveness_.state(); }
    std::optional<TimePoint> last_push_timestamp() const { return liveness_.last_push(); }
    std::size_t liveness_transitions() const { return liveness_transitions_; }

    // ---- lifecycle ----
    // Verifies credentials and starts every channel and the historical worker.
    // Throws CredentialError if the provider rejects the credentials.
    void start();

    // Tick liveness until shutdown is requested.
    void run();

    // Request shutdown - safe to call from signal handlers
    void request_shutdown() { shutdown_requested_ = true; }
    bool is_shutdown_requested() const { return shutdown_requested_; }

    // Stop and join every worker. Idempotent.
    void stop();

private:
    void publish();
    std::optional<std::string> resolve_polled(const std::string& identifier) const;

    EngineConfig config_;
    std::shared_ptr<const InstrumentRegistry> registry_;
    Clock clock_;

    SnapshotStore store_;
    SymbolMapping mapping_;
    SymbolResolver resolver_;
    LivenessMonitor liveness_;
    Publisher publisher_;

    std::shared_ptr<IQuoteApi> api_;
    std::vector<std::unique_ptr<IQuoteChannel>> channels_;
    std::unique_ptr<HistoricalWorker> history_;

    support::ShutdownSignal shutdown_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> liveness_transitions_{0};
};

}

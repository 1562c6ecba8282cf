#pragma once

#include "EngineConfig.hpp"
#include "HistoryStore.hpp"
#include "InstrumentRegistry.hpp"
#include "IQuoteApi.hpp"
#include "SignalFunction.hpp"
#include "support/ShutdownSignal.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace qh {

/**
 * HistoricalWorker
 *
 * Every `history_interval`, during market hours, fetches a rolling window of
 * daily bars for each instrument, replaces the stored series, and hands a
 * freshly computed signal per instrument to the engine's signal hook in one
 * call. Per-instrument failures are logged and skipped.
 */
class HistoricalWorker {
public:
    using Clock = std::function<TimePoint()>;
    using SignalHook = std::function<void(const std::unordered_map<std::string, Signal>&)>;

    /**
     * @param store optional persistence; may be null
     */
    HistoricalWorker(std::shared_ptr<IQuoteApi> api,
                     std::shared_ptr<const InstrumentRegistry> registry,
                     SignalFunction signal_fn,
                     EngineConfig config,
                     std::shared_ptr<HistoryStore> store = nullptr,
                     Clock clock = Clock());
    ~HistoricalWorker();

    void subscribe_signals(SignalHook hook) { hook_ = std::move(hook); }

    // Compute signals from stored series. Returns the number of instruments with data.
    std::size_t warm_from_store();

    // One refresh pass. Skipped outside market hours unless `force`.
    // Returns the number of instruments refreshed.
    std::size_t refresh(bool force = false);

    void start(support::ShutdownSignal& shutdown);
    void stop();

    std::optional<HistoricalSeries> series(const std::string& short_name) const;

private:
    void run_loop();
    void publish_signals(const std::unordered_map<std::string, HistoricalSeries>& updated);
    bool pause(std::chrono::milliseconds d);

    std::shared_ptr<IQuoteApi> api_;
    std::shared_ptr<const InstrumentRegistry> registry_;
    SignalFunction signal_fn_;
    EngineConfig config_;
    std::shared_ptr<HistoryStore> store_;
    Clock clock_;
    SignalHook hook_;

    mutable std::mutex series_mutex_;
    std::unordered_map<std::string, HistoricalSeries> series_;

    support::ShutdownSignal* shutdown_{nullptr};
    std::atomic<bool> running_{false};
    std::thread th_;
};

}

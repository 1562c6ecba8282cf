#include "quotehub/HistoricalWorker.hpp"
#include "quotehub/MarketSession.hpp"
#include <iostream>

namespace qh {

namespace {

TimePoint system_now() {
    return std::chrono::system_clock::now();
}

} // namespace

HistoricalWorker::HistoricalWorker(std::shared_ptr<IQuoteApi> api,
                                   std::shared_ptr<const InstrumentRegistry> registry,
                                   SignalFunction signal_fn,
                                   EngineConfig config,
                                   std::shared_ptr<HistoryStore> store,
                                   Clock clock)
    : api_(std::move(api)),
      registry_(std::move(registry)),
      signal_fn_(std::move(signal_fn)),
      config_(std::move(config)),
      store_(std::move(store)),
      clock_(clock ? std::move(clock) : Clock(system_now)) {}

HistoricalWorker::~HistoricalWorker() {
    stop();
}

bool HistoricalWorker::pause(std::chrono::milliseconds d) {
    if (d.count() <= 0) return shutdown_ && shutdown_->triggered();
    if (shutdown_) return shutdown_->wait_for(d);
    std::this_thread::sleep_for(d);
    return false;
}

std::size_t HistoricalWorker::warm_from_store() {
    if (!store_) return 0;

    const auto since = clock_() - std::chrono::hours(24 * config_.history_lookback_days);
    const auto since_s = std::chrono::duration_cast<std::chrono::seconds>(since.time_since_epoch()).count();

    std::unordered_map<std::string, HistoricalSeries> loaded;
    for (const auto& instr : registry_->all_instruments()) {
        try {
            auto s = store_->load_series(instr.short_name, since_s);
            if (!s.empty()) loaded.emplace(instr.short_name, std::move(s));
        } catch (const std::exception& e) {
            std::cerr << "[HistoricalWorker] Failed to load stored bars for "
                      << instr.short_name << ": " << e.what() << "\n";
        }
    }

    if (!loaded.empty()) {
        std::cout << "[HistoricalWorker] Warmed " << loaded.size() << " instruments from store\n";
        publish_signals(loaded);
    }
    return loaded.size();
}

std::size_t HistoricalWorker::refresh(bool force) {
    const TimePoint now = clock_();
    if (!force && !is_market_open(now, config_.session)) {
        return 0;
    }

    const std::string to_date = local_date(now);
    const std::string from_date = local_date(now - std::chrono::hours(24 * config_.history_lookback_days));

    std::unordered_map<std::string, HistoricalSeries> updated;
    for (const auto& instr : registry_->display_order()) {
        if (shutdown_ && shutdown_->triggered()) break;
        try {
            HistoricalSeries s = api_->history(instr.symbol, from_date, to_date);
            if (!s.empty()) {
                if (store_) store_->save_series(instr.short_name, s);
                updated.emplace(instr.short_name, std::move(s));
            }
            if (pause(config_.history_request_pause)) break;
        } catch (const std::exception& e) {
            std::cerr << "[HistoricalWorker] Error fetching history for " << instr.symbol
                      << ": " << e.what() << "\n";
            // back off harder after a failure
            if (pause(config_.history_request_pause * 2)) break;
        }
    }

    std::cout << "[HistoricalWorker] Historical data updated for " << updated.size() << " symbols\n";
    if (!updated.empty()) publish_signals(updated);
    return updated.size();
}

void HistoricalWorker::publish_signals(const std::unordered_map<std::string, HistoricalSeries>& updated) {
    std::unordered_map<std::string, Signal> signals;
    {
        std::lock_guard<std::mutex> lock(series_mutex_);
        for (const auto& [name, s] : updated) {
            series_[name] = s;
            Signal sig = Signal::Hold;
            try {
                if (signal_fn_) sig = signal_fn_(s);
            } catch (const std::exception& e) {
                std::cerr << "[HistoricalWorker] Signal computation failed for " << name
                          << ": " << e.what() << "\n";
            }
            signals.emplace(name, sig);
        }
    }
    if (hook_) hook_(signals);
}

std::optional<HistoricalSeries> HistoricalWorker::series(const std::string& short_name) const {
    std::lock_guard<std::mutex> lock(series_mutex_);
    auto it = series_.find(short_name);
    if (it == series_.end()) return std::nullopt;
    return it->second;
}

void HistoricalWorker::start(support::ShutdownSignal& shutdown) {
    if (!config_.enable_history) return;
    if (running_.exchange(true)) return;
    shutdown_ = &shutdown;
    th_ = std::thread([this] { run_loop(); });
}

void HistoricalWorker::run_loop() {
    std::cout << "[HistoricalWorker] started (every " << config_.history_interval.count() << " min)\n";
    while (running_.load()) {
        try {
            refresh();
        } catch (const std::exception& e) {
            std::cerr << "[HistoricalWorker] Error in historical refresh: " << e.what() << "\n";
        }
        if (shutdown_->wait_for(config_.history_interval)) break;
    }
    running_.store(false);
}

void HistoricalWorker::stop() {
    running_.store(false);
    if (th_.joinable()) th_.join();
}

}

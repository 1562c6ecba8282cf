/*
 * The core Engine class, responsible for tying together channels, the snapshot store and the publisher.
 */

#include "quotehub/Engine.hpp"
#include "quotehub/Errors.hpp"
#include <iostream>
#include <memory>
#include <thread>

using namespace qh;

namespace {

std::shared_ptr<const InstrumentRegistry> require_registry(std::shared_ptr<const InstrumentRegistry> registry) {
    if (!registry || registry->empty()) {
        throw RegistryError("instrument registry is empty; refusing to start");
    }
    return registry;
}

TimePoint system_now() {
    return std::chrono::system_clock::now();
}

} // namespace

Engine::Engine(EngineConfig config, std::shared_ptr<const InstrumentRegistry> registry, Clock clock)
    : config_(std::move(config)),
      registry_(require_registry(std::move(registry))),
      clock_(clock ? std::move(clock) : Clock(system_now)),
      store_(*registry_, config_.price_change_threshold_pct, clock_()),
      resolver_(mapping_, store_, config_.bid_match_tolerance),
      liveness_(config_.stale_after) {
    mapping_.seed(*registry_);
    std::cout << "[Engine] Tracking " << registry_->size() << " instruments ("
              << registry_->index_instruments().size() << " index)\n";
}

Engine::~Engine() {
    stop();
}

void Engine::set_quote_api(std::shared_ptr<IQuoteApi> api) {
    api_ = std::move(api);
}

void Engine::add_channel(std::unique_ptr<IQuoteChannel> channel) {
    IQuoteChannel* ch = channel.get();
    const std::string name = ch->name();

    // wire the channel's callbacks straight into the reconciliation paths
    ch->subscribe_polls([this](const PollBatch& batch) {
        return apply_poll_batch(batch);
    });
    ch->subscribe_pushes([this](const std::vector<PushUpdate>& updates) {
        return apply_push_updates(updates);
    });
    ch->subscribe_status([this, name](const ChannelStatus& status) {
        on_channel_status(name, status);
    });

    channels_.push_back(std::move(channel));
}

void Engine::set_historical_worker(std::unique_ptr<HistoricalWorker> worker) {
    history_ = std::move(worker);
    history_->subscribe_signals([this](const std::unordered_map<std::string, Signal>& signals) {
        attach_signals(signals);
    });
}

Publisher::HandlerId Engine::register_data_callback(const std::string& name, DataCallback cb) {
    return publisher_.subscribe(name, std::move(cb));
}

bool Engine::unregister_data_callback(Publisher::HandlerId id) {
    return publisher_.unsubscribe(id);
}

Snapshot Engine::get_market_data() const {
    return store_.snapshot_all();
}

std::optional<std::string> Engine::resolve_polled(const std::string& identifier) const {
    if (auto mapped = mapping_.lookup(identifier)) return mapped;
    std::string name = strip_exchange_prefix(identifier);
    if (store_.contains(name)) return name;
    return std::nullopt;
}

std::size_t Engine::apply_poll_batch(const PollBatch& batch) {
    const TimePoint now = clock_();
    std::size_t updated = 0;

    for (const auto& pq : batch.quotes) {
        try {
            auto name = resolve_polled(pq.identifier);
            if (!name) {
                #ifdef QH_DEBUG
                    std::cout << "[debug] [Engine] poll entry for unknown identifier " << pq.identifier << "\n";
                #endif
                continue;
            }
            // nothing usable: leave the quote (and its timestamp) as it was
            if (!pq.fields.has_data()) {
                #ifdef QH_DEBUG
                    std::cout << "[debug] [Engine] poll entry for " << *name << " has no usable values\n";
                #endif
                continue;
            }
            if (store_.upsert(*name, pq.fields, now, batch.market_status)) ++updated;
        } catch (const std::exception& e) {
            std::cerr << "[Engine] Error applying quote for " << pq.identifier << ": " << e.what() << "\n";
        }
    }

    // polling is authoritative only while push is down; otherwise keep it quiet
    if (liveness_.fallback_active()) {
        std::cout << "[Engine] Poll updated " << updated << " of " << batch.quotes.size()
                  << " quotes, " << store_.non_zero_count() << " with data (market "
                  << market_status_to_string(batch.market_status) << ")\n";
    } else {
        #ifdef QH_DEBUG
            std::cout << "[debug] [Engine] Poll updated " << updated << " of " << batch.quotes.size() << " quotes\n";
        #endif
    }

    publish();
    return updated;
}

std::size_t Engine::apply_push_updates(const std::vector<PushUpdate>& updates) {
    const TimePoint now = clock_();
    std::size_t applied = 0;
    bool received = false;

    for (const auto& update : updates) {
        try {
            auto resolution = resolver_.resolve(update, now);
            if (update.identified() || resolution) received = true;
            if (!resolution || !update.fields.has_data()) continue;
            if (store_.upsert(resolution->short_name, update.fields, now)) ++applied;
        } catch (const std::exception& e) {
            std::cerr << "[Engine] Error applying push update: " << e.what() << "\n";
        }
    }

    if (received && liveness_.record_push(now)) {
        ++liveness_transitions_;
        std::cout << "[Engine] Push updates resumed, fallback polling inactive\n";
    }

    if (applied > 0) publish();
    return applied;
}

void Engine::on_channel_status(const std::string& channel, const ChannelStatus& status) {
    if (status.connected) {
        mapping_.seed(*registry_);
        resolver_.set_active_symbols(status.subscribed);
        std::cout << "[Engine] " << channel << " connected, " << status.subscribed.size()
                  << " instruments subscribed\n";
    } else {
        std::cerr << "[Engine] " << channel << " disconnected: " << status.detail << "\n";
    }
}

std::size_t Engine::attach_signals(const std::unordered_map<std::string, Signal>& signals) {
    std::size_t attached = 0;
    for (const auto& [name, signal] : signals) {
        if (store_.set_signal(name, signal)) ++attached;
    }
    std::cout << "[Engine] Attached signals for " << attached << " instruments\n";
    publish();
    return attached;
}

void Engine::check_liveness() {
    if (liveness_.evaluate(clock_())) {
        ++liveness_transitions_;
        std::cerr << "[Engine] No push updates for " << config_.stale_after.count()
                  << "s, fallback polling active\n";
    }
}

void Engine::publish() {
    Snapshot snapshot = store_.snapshot_all();
    #ifdef QH_DEBUG
        std::cout << "[debug] [Engine] Publishing " << snapshot.size() << " quotes, "
                  << store_.non_zero_count() << " with data\n";
    #endif
    publisher_.notify(snapshot);
}

void Engine::start() {
    if (started_.exchange(true)) return;

    if (api_) {
        bool accepted = false;
        try {
            accepted = api_->verify_credentials();
        } catch (const CredentialError&) {
            throw;
        } catch (const std::exception& e) {
            // provider unreachable is not a credential problem; channels will retry
            std::cerr << "[Engine] Could not verify credentials: " << e.what() << "\n";
            accepted = true;
        }
        if (!accepted) {
            throw CredentialError("provider rejected the supplied credentials");
        }
        std::cout << "[Engine] Credentials verified\n";
    }

    for (auto& ch : channels_) {
        std::cout << "[Engine] Starting " << ch->name() << "\n";
        ch->start(shutdown_);
    }

    if (history_) {
        history_->warm_from_store();
        history_->start(shutdown_);
    }
}

void Engine::run() {
    if (!started_) {
        std::cerr << "[Engine] run() called before start().\n";
        return;
    }

    std::cout << "[Engine] Running; state " << feed_state_to_string(feed_state()) << "\n";
    auto next_check = std::chrono::steady_clock::now();

    while (!shutdown_requested_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_check) {
            check_liveness();
            next_check = now + config_.liveness_tick;
        }
        // Check shutdown every 100ms
        if (shutdown_.wait_for(std::chrono::milliseconds(100))) break;
    }

    std::cout << "[Engine] Shutdown requested - stopping.\n";
}

void Engine::stop() {
    if (stopped_.exchange(true)) return;
    shutdown_requested_ = true;
    shutdown_.trigger();

    for (auto& ch : channels_) {
        ch->stop();
    }
    if (history_) history_->stop();

    if (started_) std::cout << "[Engine] Stopped.\n";
}

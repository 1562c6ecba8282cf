#include "quotehub/SymbolResolver.hpp"
#include <iostream>

namespace qh {

const char* resolution_step_to_string(ResolutionStep step) {
    switch (step) {
        case ResolutionStep::Explicit: return "explicit";
        case ResolutionStep::AlternateField: return "alternate-field";
        case ResolutionStep::InstrumentName: return "instrument-name";
        case ResolutionStep::BidPrice: return "bid-price";
        case ResolutionStep::SecurityId: return "security-id";
        case ResolutionStep::Sequence: return "sequence";
        case ResolutionStep::Timestamp: return "timestamp";
    }
    return "unknown";
}

SymbolResolver::SymbolResolver(SymbolMapping& mapping, const SnapshotStore& store, double bid_tolerance)
    : mapping_(mapping), store_(store), bid_tolerance_(bid_tolerance) {}

void SymbolResolver::set_active_symbols(std::vector<std::string> symbols) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_symbols_ = std::move(symbols);
}

size_t SymbolResolver::active_count() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_symbols_.size();
}

std::optional<std::string> SymbolResolver::canonicalize(const std::string& raw, bool learn) const {
    std::string name;
    if (raw.find(':') != std::string::npos) {
        name = strip_exchange_prefix(raw);
    } else {
        name = mapping_.lookup(raw).value_or(raw);
    }

    if (!store_.contains(name)) return std::nullopt;

    if (learn && raw != name && !mapping_.lookup(raw)) {
        mapping_.insert(raw, name);
    }
    return name;
}

std::optional<Resolution> SymbolResolver::resolve(const PushUpdate& update, TimePoint now) const {
    if (update.identifier) {
        auto name = canonicalize(*update.identifier, true);
        if (!name) {
            #ifdef QH_DEBUG
                std::cout << "[debug] [SymbolResolver] unknown identifier " << *update.identifier << "\n";
            #endif
            return std::nullopt;
        }
        return Resolution{*name, ResolutionStep::Explicit};
    }

    const IdentityHints& hints = update.hints;
    std::optional<std::string> raw;
    ResolutionStep step = ResolutionStep::AlternateField;

    if (hints.alternate_id && !hints.alternate_id->empty()) {
        raw = hints.alternate_id;
        step = ResolutionStep::AlternateField;
    } else if (hints.instrument_name && !hints.instrument_name->empty()) {
        raw = hints.instrument_name;
        step = ResolutionStep::InstrumentName;
    } else if (hints.bid_price && *hints.bid_price > 0.0) {
        auto matches = store_.match_ltp(*hints.bid_price, bid_tolerance_);
        if (matches.size() == 1) {
            return Resolution{matches.front(), ResolutionStep::BidPrice};
        }
        if (matches.size() > 1) {
            #ifdef QH_DEBUG
                std::cout << "[debug] [SymbolResolver] bid " << *hints.bid_price << " matches "
                          << matches.size() << " instruments, dropping update\n";
            #endif
            return std::nullopt;
        }
    }

    if (!raw && hints.security_id) {
        if (auto mapped = mapping_.lookup(*hints.security_id)) {
            raw = mapped;
            step = ResolutionStep::SecurityId;
        }
    }

    if (!raw) {
        std::vector<std::string> active;
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active = active_symbols_;
        }
        if (active.empty()) {
            #ifdef QH_DEBUG
                std::cout << "[debug] [SymbolResolver] no subscribed instruments to map update onto\n";
            #endif
            return std::nullopt;
        }

        const auto count = static_cast<long long>(active.size());
        long long index = 0;
        if (hints.sequence) {
            index = *hints.sequence % count;
            step = ResolutionStep::Sequence;
        } else {
            index = to_epoch_ms(now) % count;
            step = ResolutionStep::Timestamp;
        }
        if (index < 0) index += count;
        raw = active[static_cast<size_t>(index)];

        #ifdef QH_DEBUG
            std::cout << "[debug] [SymbolResolver] guessed " << *raw << " by "
                      << resolution_step_to_string(step) << "\n";
        #endif
    }

    auto name = canonicalize(*raw, true);
    if (!name) {
        #ifdef QH_DEBUG
            std::cout << "[debug] [SymbolResolver] cannot map " << *raw << " ("
                      << resolution_step_to_string(step) << ") to a tracked instrument\n";
        #endif
        return std::nullopt;
    }
    return Resolution{*name, step};
}

}

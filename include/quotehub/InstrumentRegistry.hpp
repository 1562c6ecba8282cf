#pragma once
#include <unordered_map>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include "MarketDataTypes.hpp"

namespace qh {

/**
 * Static catalog of tracked instruments.
 * Loaded once at startup and read-only afterwards; engines hold it through
 * std::shared_ptr<const InstrumentRegistry>.
 */
class InstrumentRegistry {
public:
    InstrumentRegistry() = default;

    /**
     * Register an exchange-qualified symbol.
     * Registering an already known symbol returns the existing entry.
     */
    const Instrument& register_instrument(const std::string& symbol, bool is_index = false) {
        auto it = _by_symbol.find(symbol);
        if (it != _by_symbol.end()) {
            return _instruments[it->second];
        }

        Instrument instr;
        instr.symbol = symbol;
        instr.short_name = strip_exchange_prefix(symbol);
        instr.is_index = is_index;

        if (_by_short_name.count(instr.short_name)) {
            throw std::invalid_argument("duplicate short name: " + instr.short_name);
        }

        _instruments.push_back(instr);
        _by_symbol[symbol] = _instruments.size() - 1;
        _by_short_name[instr.short_name] = _instruments.size() - 1;
        return _instruments.back();
    }

    /**
     * Get instrument by short name.
     * Throws std::out_of_range if not found.
     */
    const Instrument& get(const std::string& short_name) const {
        return _instruments.at(_by_short_name.at(short_name));
    }

    /**
     * Every instrument sorted by short name.
     */
    std::vector<Instrument> all_instruments() const {
        std::vector<Instrument> out = _instruments;
        std::sort(out.begin(), out.end(), [](const Instrument& a, const Instrument& b) {
            return a.short_name < b.short_name;
        });
        return out;
    }

    std::vector<Instrument> index_instruments() const {
        std::vector<Instrument> out;
        for (const auto& instr : all_instruments()) {
            if (instr.is_index) out.push_back(instr);
        }
        return out;
    }

    /**
     * Publication order: index instrument(s) first, then the rest by short name.
     */
    std::vector<Instrument> display_order() const {
        auto out = all_instruments();
        std::stable_partition(out.begin(), out.end(),
                              [](const Instrument& i) { return i.is_index; });
        return out;
    }

    /**
     * Exchange-qualified identifiers in registration order, as sent to the
     * provider. The push channel's positional fallback indexes this list.
     */
    std::vector<std::string> identifiers() const {
        std::vector<std::string> out;
        out.reserve(_instruments.size());
        for (const auto& instr : _instruments) out.push_back(instr.symbol);
        return out;
    }

    size_t size() const { return _instruments.size(); }
    bool empty() const { return _instruments.empty(); }

private:
    std::vector<Instrument> _instruments;
    std::unordered_map<std::string, size_t> _by_symbol;
    std::unordered_map<std::string, size_t> _by_short_name;
};

// The NIFTY 50 constituents plus the NIFTY 50 index.
InstrumentRegistry nifty50_registry();

}

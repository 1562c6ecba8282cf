#pragma once
#include "quotehub/InstrumentRegistry.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace qh {

/**
 * Many-to-one lookup from provider identifiers (exchange-qualified symbol,
 * bare token, numeric security id) to the canonical short name.
 * Seeded from the registry at subscription time and extended whenever a
 * heuristic resolves an identifier the static table did not know.
 */
class SymbolMapping {
public:
    // Map every symbol and every short name onto its short name.
    void seed(const InstrumentRegistry& registry);

    std::optional<std::string> lookup(const std::string& raw) const;

    void insert(const std::string& raw, const std::string& short_name);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> map_;
};

}

#include "quotehub/SymbolMapping.hpp"

namespace qh {

void SymbolMapping::seed(const InstrumentRegistry& registry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& instr : registry.all_instruments()) {
        map_[instr.symbol] = instr.short_name;
        map_[instr.short_name] = instr.short_name;
    }
}

std::optional<std::string> SymbolMapping::lookup(const std::string& raw) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(raw);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

void SymbolMapping::insert(const std::string& raw, const std::string& short_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    map_[raw] = short_name;
}

size_t SymbolMapping::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
}

}

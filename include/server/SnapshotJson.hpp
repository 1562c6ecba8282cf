#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <nlohmann/json.hpp>

namespace server {

using ordered_json = nlohmann::ordered_json;

// One quote as the dashboard reads it.
ordered_json quote_to_json(const qh::Quote& q);

// Quotes keyed by short name, in snapshot order.
ordered_json snapshot_to_json(const qh::Snapshot& snapshot);

// {"type":"market_data","data":{...}}
ordered_json market_data_message(const qh::Snapshot& snapshot);

}

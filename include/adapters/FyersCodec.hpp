#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/*
FyersCodec:
  Decodes the provider's JSON bodies into quotehub types. The REST bulk-quote
  response and the identified push batch share one entry shape
  ({"n": "NSE:X-EQ", "v": {...}}); the direct push shape carries `ltp` and
  whatever identity hints the provider happened to include.

  Numeric fields are accepted as JSON numbers or numeric strings; anything else
  reads as absent.
*/

namespace adapter {

using json = nlohmann::json;

struct PushMessage {
    enum class Kind { Updates, Control, Ignored };

    Kind kind{Kind::Ignored};
    std::vector<qh::PushUpdate> updates;
    std::string control_type;   // for Control
    std::string control_text;
};

// {"code":200,"d":[...]} -> one PolledQuote per well-formed entry.
// Throws ParseError on an unreadable body, TransportError on a failure code.
std::vector<qh::PolledQuote> parse_quotes_response(const std::string& body);

// {"code":200,"candles":[[ts,o,h,l,c,v],...]}
qh::HistoricalSeries parse_history_response(const std::string& body);

// True if the profile response carries code 200. Throws ParseError on an unreadable body.
bool parse_profile_response(const std::string& body);

// Classifies one push text frame. Throws ParseError if it is not JSON.
PushMessage parse_push_message(const std::string& text);

// Value bag of a REST entry / identified push entry.
qh::QuoteFields fields_from_value_bag(const json& v);

// Direct-format update: OHLCV plus identity hints.
qh::PushUpdate direct_update_from_json(const json& j);

// Subscribe frame sent once per connection.
std::string make_subscribe_frame(const std::vector<std::string>& identifiers);

}

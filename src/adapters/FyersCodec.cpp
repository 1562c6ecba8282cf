#include "adapters/FyersCodec.hpp"
#include "quotehub/Errors.hpp"
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>

namespace adapter {

namespace {

std::optional<double> as_double(const json& v) {
    if (v.is_number()) {
        double d = v.get<double>();
        if (std::isfinite(d)) return d;
        return std::nullopt;
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        try {
            std::size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size() && std::isfinite(d)) return d;
        } catch (const std::exception&) {
            // not numeric
        }
    }
    return std::nullopt;
}

std::optional<std::string> as_text(const json& v) {
    if (v.is_string()) {
        auto s = v.get<std::string>();
        if (!s.empty()) return s;
        return std::nullopt;
    }
    if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
    if (v.is_number_unsigned()) return std::to_string(v.get<std::uint64_t>());
    return std::nullopt;
}

// first key present with a usable number
std::optional<double> first_number(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it == j.end()) continue;
        if (auto d = as_double(*it)) return d;
    }
    return std::nullopt;
}

std::optional<std::string> first_text(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it == j.end()) continue;
        if (auto s = as_text(*it)) return s;
    }
    return std::nullopt;
}

// Whole-number conversion for values off the wire; out of int64 range is treated as absent.
std::optional<std::int64_t> to_int64(double d) {
    const double lo = static_cast<double>(std::numeric_limits<std::int64_t>::min());  // -2^63, exact
    if (!std::isfinite(d) || d < lo || d >= -lo) return std::nullopt;
    return static_cast<std::int64_t>(d);
}

std::optional<std::int64_t> as_volume(std::optional<double> d) {
    if (!d) return std::nullopt;
    return to_int64(std::round(*d));
}

json parse_body(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw qh::ParseError(std::string("malformed JSON body: ") + e.what());
    }
}

void require_ok(const json& j) {
    if (!j.is_object()) throw qh::ParseError("response is not a JSON object");
    auto it = j.find("code");
    if (it == j.end() || !it->is_number_integer() || it->get<int>() != 200) {
        auto m = j.find("message");
        std::string detail = m == j.end() ? "no message" : (m->is_string() ? m->get<std::string>() : m->dump());
        std::string code = it == j.end() ? "missing" : it->dump();
        throw qh::TransportError("provider returned code " + code + ": " + detail);
    }
}

void log_skipped(const char* what, const std::string& id, const std::string& reason) {
    std::cerr << "[FyersCodec] Skipping " << what << " entry " << (id.empty() ? "<unnamed>" : id)
              << ": " << reason << "\n";
}

// {"n": ..., "s": ..., "v": {...}} entries, shared by REST quotes and identified pushes.
// An entry whose own status is not "ok" carries an error payload in "v", not prices.
template <class Fn>
void for_each_entry(const json& d, const char* what, Fn&& fn) {
    if (!d.is_array()) return;
    for (const auto& entry : d) {
        if (!entry.is_object()) {
            log_skipped(what, "", "not an object");
            continue;
        }
        auto n = entry.find("n");
        auto id = n == entry.end() ? std::nullopt : as_text(*n);
        if (!id) {
            log_skipped(what, "", "missing identifier");
            continue;
        }

        auto st = entry.find("s");
        if (st != entry.end() && st->is_string() && st->get_ref<const std::string&>() != "ok") {
            std::string reason = "status " + st->get<std::string>();
            auto v = entry.find("v");
            if (v != entry.end() && v->is_object()) {
                auto msg = v->find("errmsg");
                if (msg != v->end()) reason += ": " + (msg->is_string() ? msg->get<std::string>() : msg->dump());
            }
            log_skipped(what, *id, reason);
            continue;
        }

        auto v = entry.find("v");
        if (v == entry.end() || !v->is_object()) {
            log_skipped(what, *id, "missing value bag");
            continue;
        }
        fn(*id, *v);
    }
}

} // namespace

qh::QuoteFields fields_from_value_bag(const json& v) {
    qh::QuoteFields f;
    f.ltp = first_number(v, {"lp", "ltp"});
    f.open = first_number(v, {"op", "open", "open_price"});
    f.high = first_number(v, {"h", "high", "high_price"});
    f.low = first_number(v, {"l", "low", "low_price"});
    f.close = first_number(v, {"c", "close", "prev_close_price"});
    f.volume = as_volume(first_number(v, {"v", "volume"}));
    return f;
}

qh::PushUpdate direct_update_from_json(const json& j) {
    qh::PushUpdate u;
    u.fields.ltp = first_number(j, {"ltp"});
    u.fields.open = first_number(j, {"open", "op", "open_price"});
    u.fields.high = first_number(j, {"high", "h", "high_price"});
    u.fields.low = first_number(j, {"low", "l", "low_price"});
    u.fields.close = first_number(j, {"close", "c", "prev_close", "prev_close_price"});
    u.fields.volume = as_volume(first_number(j, {"volume", "vol", "v", "vol_traded_today"}));

    auto& h = u.hints;
    h.alternate_id = first_text(j, {"symbol", "sym", "symbol_name", "n", "name", "tk", "token", "id"});
    h.instrument_name = first_text(j, {"instrument_name", "instrument"});
    h.bid_price = first_number(j, {"bid_price"});
    h.security_id = first_text(j, {"security_id"});
    if (auto seq = first_number(j, {"seq", "sequence", "seq_no"})) {
        h.sequence = to_int64(*seq);
    }
    return u;
}

std::vector<qh::PolledQuote> parse_quotes_response(const std::string& body) {
    json j = parse_body(body);
    require_ok(j);

    std::vector<qh::PolledQuote> out;
    auto d = j.find("d");
    if (d == j.end()) return out;

    for_each_entry(*d, "quote", [&](const std::string& id, const json& v) {
        try {
            out.push_back(qh::PolledQuote{id, fields_from_value_bag(v)});
        } catch (const json::exception& e) {
            std::cerr << "[FyersCodec] Skipping quote entry " << id << ": " << e.what() << "\n";
        }
    });
    return out;
}

qh::HistoricalSeries parse_history_response(const std::string& body) {
    json j = parse_body(body);
    require_ok(j);

    qh::HistoricalSeries s;
    auto candles = j.find("candles");
    if (candles == j.end() || !candles->is_array()) return s;

    for (const auto& c : *candles) {
        if (!c.is_array() || c.size() < 6) {
            log_skipped("candle", "", "expected [ts,o,h,l,c,v]");
            continue;
        }
        auto raw_ts = as_double(c[0]);
        auto ts = raw_ts ? to_int64(*raw_ts) : std::nullopt;
        auto o = as_double(c[1]);
        auto h = as_double(c[2]);
        auto l = as_double(c[3]);
        auto cl = as_double(c[4]);
        auto v = as_double(c[5]);
        if (!ts || !o || !h || !l || !cl || !v) {
            log_skipped("candle", c[0].dump(), "non-numeric or out-of-range value");
            continue;
        }
        s.push_back(*ts, *o, *h, *l, *cl, *v);
    }
    return s;
}

bool parse_profile_response(const std::string& body) {
    json j = parse_body(body);
    if (!j.is_object()) throw qh::ParseError("profile response is not a JSON object");
    auto it = j.find("code");
    return it != j.end() && it->is_number_integer() && it->get<int>() == 200;
}

PushMessage parse_push_message(const std::string& text) {
    json j = parse_body(text);
    PushMessage msg;
    if (!j.is_object()) return msg;

    if (j.contains("s") && j.contains("d")) {
        for_each_entry(j["d"], "push", [&](const std::string& id, const json& v) {
            qh::PushUpdate u;
            u.identifier = id;
            u.fields = fields_from_value_bag(v);
            msg.updates.push_back(std::move(u));
        });
        msg.kind = PushMessage::Kind::Updates;
        return msg;
    }

    if (j.contains("ltp")) {
        msg.updates.push_back(direct_update_from_json(j));
        msg.kind = PushMessage::Kind::Updates;
        return msg;
    }

    if (j.contains("type")) {
        msg.kind = PushMessage::Kind::Control;
        msg.control_type = as_text(j["type"]).value_or("");
        auto m = j.find("message");
        if (m != j.end()) msg.control_text = m->is_string() ? m->get<std::string>() : m->dump();
        return msg;
    }

    return msg;
}

std::string make_subscribe_frame(const std::vector<std::string>& identifiers) {
    json frame;
    frame["T"] = "SUB_DATA";
    frame["SLIST"] = identifiers;
    frame["SUB_T"] = 1;
    frame["mode"] = "SymbolUpdate";
    return frame.dump();
}

}

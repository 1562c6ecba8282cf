#include "adapters/FyersRestApi.hpp"
#include "adapters/FyersCodec.hpp"
#include "quotehub/Errors.hpp"
#include <iostream>
#include <sstream>

namespace adapter {

FyersRestApi::FyersRestApi(qh::Credentials credentials, std::string host)
    : credentials_(std::move(credentials)), http_(std::move(host)) {}

support::HttpResponse FyersRestApi::get(const std::string& target) const {
    auto res = http_.get(target, {{"Authorization", credentials_.authorization()}});
    #ifdef QH_DEBUG
        std::cout << "[debug] [FyersRestApi] GET " << target << " -> " << res.status << "\n";
    #endif
    return res;
}

std::vector<qh::PolledQuote> FyersRestApi::quotes(const std::vector<std::string>& identifiers) {
    std::ostringstream joined;
    for (std::size_t i = 0; i < identifiers.size(); ++i) {
        if (i) joined << ',';
        joined << identifiers[i];
    }
    auto res = get("/data/quotes?symbols=" + support::url_encode(joined.str()));
    // the body carries the real failure code even on non-2xx
    return parse_quotes_response(res.body);
}

qh::HistoricalSeries FyersRestApi::history(const std::string& identifier,
                                           const std::string& from_date,
                                           const std::string& to_date) {
    std::string target = "/data/history?symbol=" + support::url_encode(identifier) +
                         "&resolution=D&date_format=1" +
                         "&range_from=" + from_date +
                         "&range_to=" + to_date +
                         "&cont_flag=1";
    auto res = get(target);
    return parse_history_response(res.body);
}

bool FyersRestApi::verify_credentials() {
    auto res = get("/api/v3/profile");
    if (res.status == 401 || res.status == 403) return false;
    try {
        return parse_profile_response(res.body);
    } catch (const qh::ParseError& e) {
        throw qh::TransportError(std::string("unreadable profile response: ") + e.what());
    }
}

}

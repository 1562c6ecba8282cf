#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <string>
#include <vector>

/*
the interface to the provider's request/response API. FyersRestApi talks to the
real service; tests substitute their own.
*/

namespace qh {

class IQuoteApi {
public:
    virtual ~IQuoteApi() = default;

    // Bulk quote for every identifier in one request.
    // Throws TransportError on a failed request or a failure-coded response,
    // ParseError on an unreadable body. Bad entries are skipped, not thrown.
    virtual std::vector<PolledQuote> quotes(const std::vector<std::string>& identifiers) = 0;

    // Daily bars for one identifier between two YYYY-MM-DD dates.
    virtual HistoricalSeries history(const std::string& identifier,
                                     const std::string& from_date,
                                     const std::string& to_date) = 0;

    // True if the provider accepts the credentials this API was built with.
    virtual bool verify_credentials() = 0;
};

}

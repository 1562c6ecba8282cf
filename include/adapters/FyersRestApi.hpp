#pragma once
#include "quotehub/Credentials.hpp"
#include "quotehub/IQuoteApi.hpp"
#include "support/HttpsClient.hpp"

namespace adapter {

// IQuoteApi over the provider's HTTPS data endpoints.
class FyersRestApi : public qh::IQuoteApi {
public:
    FyersRestApi(qh::Credentials credentials, std::string host);

    std::vector<qh::PolledQuote> quotes(const std::vector<std::string>& identifiers) override;
    qh::HistoricalSeries history(const std::string& identifier,
                                 const std::string& from_date,
                                 const std::string& to_date) override;
    bool verify_credentials() override;

private:
    support::HttpResponse get(const std::string& target) const;

    qh::Credentials credentials_;
    support::HttpsClient http_;
};

}

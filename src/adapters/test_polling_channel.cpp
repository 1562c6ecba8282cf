#include "adapters/PollingChannel.hpp"
#include "quotehub/Errors.hpp"
#include <atomic>
#include <cassert>
#include <ctime>
#include <iostream>

using namespace adapter;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

namespace {

qh::TimePoint local_time(int day, int hour) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = day;     // 15 = Monday
    tm.tm_hour = hour;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class FakeApi : public qh::IQuoteApi {
public:
    std::vector<qh::PolledQuote> quotes(const std::vector<std::string>& identifiers) override {
        ++calls;
        requested = identifiers;
        if (fail) throw qh::TransportError("HTTP 503");
        std::vector<qh::PolledQuote> out;
        for (const auto& id : identifiers) {
            qh::PolledQuote pq;
            pq.identifier = id;
            pq.fields.ltp = 100.0;
            out.push_back(pq);
        }
        return out;
    }
    qh::HistoricalSeries history(const std::string&, const std::string&, const std::string&) override { return {}; }
    bool verify_credentials() override { return true; }

    std::atomic<int> calls{0};
    std::vector<std::string> requested;
    bool fail{false};
};

std::shared_ptr<const qh::InstrumentRegistry> test_registry() {
    auto r = std::make_shared<qh::InstrumentRegistry>();
    r->register_instrument("NSE:NIFTY50-INDEX", true);
    r->register_instrument("NSE:SBIN-EQ");
    return r;
}

} // namespace

TEST(test_fetch_requests_every_identifier_and_stamps_status) {
    auto api = std::make_shared<FakeApi>();
    const auto open_time = local_time(15, 11);
    PollingChannel channel(api, test_registry(), qh::EngineConfig{}, [open_time] { return open_time; });

    qh::PollBatch seen;
    channel.subscribe_polls([&](const qh::PollBatch& b) { seen = b; return b.quotes.size(); });

    ASSERT_EQ(channel.fetch_quotes(), 2u);
    ASSERT_EQ(api->requested.size(), 2u);
    ASSERT_EQ(api->requested[0], "NSE:NIFTY50-INDEX");
    ASSERT_TRUE(seen.market_status == qh::MarketStatus::Open);
    ASSERT_TRUE(channel.is_connected());
}

TEST(test_closed_outside_session) {
    auto api = std::make_shared<FakeApi>();
    const auto evening = local_time(15, 20);
    PollingChannel channel(api, test_registry(), qh::EngineConfig{}, [evening] { return evening; });

    qh::PollBatch seen;
    seen.market_status = qh::MarketStatus::Open;
    channel.subscribe_polls([&](const qh::PollBatch& b) { seen = b; return b.quotes.size(); });
    channel.fetch_quotes();
    ASSERT_TRUE(seen.market_status == qh::MarketStatus::Closed);
}

TEST(test_fetch_error_is_contained) {
    auto api = std::make_shared<FakeApi>();
    api->fail = true;
    PollingChannel channel(api, test_registry(), qh::EngineConfig{});

    int batches = 0;
    channel.subscribe_polls([&](const qh::PollBatch& b) { ++batches; return b.quotes.size(); });
    ASSERT_EQ(channel.fetch_quotes(), 0u);
    ASSERT_EQ(batches, 0);
    ASSERT_FALSE(channel.is_connected());

    api->fail = false;
    ASSERT_EQ(channel.fetch_quotes(), 2u);
    ASSERT_EQ(batches, 1);
}

TEST(test_start_fetches_synchronously_then_stops) {
    auto api = std::make_shared<FakeApi>();
    qh::EngineConfig config;
    config.poll_interval = std::chrono::seconds(60);
    PollingChannel channel(api, test_registry(), config);

    int batches = 0;
    channel.subscribe_polls([&](const qh::PollBatch& b) { ++batches; return b.quotes.size(); });

    support::ShutdownSignal shutdown;
    channel.start(shutdown);
    ASSERT_EQ(batches, 1);

    shutdown.trigger();
    channel.stop();
    ASSERT_EQ(api->calls.load(), 1);
}

int main() {
    std::cout << "\n=== PollingChannel Tests ===\n\n";

    RUN_TEST(test_fetch_requests_every_identifier_and_stamps_status);
    RUN_TEST(test_closed_outside_session);
    RUN_TEST(test_fetch_error_is_contained);
    RUN_TEST(test_start_fetches_synchronously_then_stops);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}

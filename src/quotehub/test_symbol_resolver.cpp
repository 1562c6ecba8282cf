#include "quotehub/InstrumentRegistry.hpp"
#include "quotehub/SnapshotStore.hpp"
#include "quotehub/SymbolMapping.hpp"
#include "quotehub/SymbolResolver.hpp"
#include <cassert>
#include <iostream>
#include <memory>

using namespace qh;

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

const TimePoint T0 = TimePoint(std::chrono::seconds(1700000000));

// Registry, store and mapping wired the way the engine wires them.
struct Fixture {
    InstrumentRegistry registry;
    std::unique_ptr<SnapshotStore> store;
    SymbolMapping mapping;
    std::unique_ptr<SymbolResolver> resolver;

    Fixture() {
        registry.register_instrument("NSE:NIFTY50-INDEX", true);
        registry.register_instrument("NSE:INFY-EQ");
        registry.register_instrument("NSE:SBIN-EQ");
        registry.register_instrument("NSE:TCS-EQ");
        store = std::make_unique<SnapshotStore>(registry, 0.01, T0);
        mapping.seed(registry);
        resolver = std::make_unique<SymbolResolver>(mapping, *store, 0.1);
    }

    void price(const std::string& name, double ltp) {
        QuoteFields f;
        f.ltp = ltp;
        store->upsert(name, f, T0);
    }
};

PushUpdate unidentified() {
    PushUpdate u;
    u.fields.ltp = 1.0;
    return u;
}

} // namespace

TEST(test_explicit_identifier_strips_prefix) {
    Fixture fx;
    PushUpdate u;
    u.identifier = "NSE:SBIN-EQ";
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "SBIN-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::Explicit);
}

TEST(test_explicit_unknown_identifier_is_dropped) {
    Fixture fx;
    PushUpdate u;
    u.identifier = "NSE:UNKNOWN-EQ";
    ASSERT_FALSE(fx.resolver->resolve(u, T0).has_value());
}

TEST(test_new_exchange_prefix_is_learned) {
    Fixture fx;
    const size_t before = fx.mapping.size();
    PushUpdate u;
    u.identifier = "BSE:TCS-EQ";
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "TCS-EQ");
    ASSERT_EQ(fx.mapping.size(), before + 1);
    ASSERT_EQ(*fx.mapping.lookup("BSE:TCS-EQ"), "TCS-EQ");
}

TEST(test_alternate_field_resolves) {
    Fixture fx;
    auto u = unidentified();
    u.hints.alternate_id = "INFY-EQ";
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "INFY-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::AlternateField);
}

TEST(test_instrument_name_resolves) {
    Fixture fx;
    auto u = unidentified();
    u.hints.instrument_name = "NSE:TCS-EQ";
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "TCS-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::InstrumentName);
}

TEST(test_bid_price_unique_match) {
    Fixture fx;
    fx.price("INFY-EQ", 100.00);
    fx.price("SBIN-EQ", 200.00);

    auto u = unidentified();
    u.hints.bid_price = 100.05;
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "INFY-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::BidPrice);
}

TEST(test_bid_price_ambiguous_match_is_dropped) {
    Fixture fx;
    fx.price("INFY-EQ", 100.00);
    fx.price("SBIN-EQ", 200.00);
    fx.price("TCS-EQ", 100.02);
    fx.resolver->set_active_symbols(fx.registry.identifiers());

    auto u = unidentified();
    u.hints.bid_price = 100.05;
    u.hints.sequence = 1;   // would resolve if the bid step fell through
    ASSERT_FALSE(fx.resolver->resolve(u, T0).has_value());
}

TEST(test_security_id_via_mapping) {
    Fixture fx;
    fx.mapping.insert("3045", "SBIN-EQ");

    auto u = unidentified();
    u.hints.security_id = "3045";
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "SBIN-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::SecurityId);
}

TEST(test_nothing_to_go_on_without_subscription) {
    Fixture fx;
    auto u = unidentified();
    u.hints.security_id = "99999";
    ASSERT_EQ(fx.resolver->active_count(), 0u);
    ASSERT_FALSE(fx.resolver->resolve(u, T0).has_value());
}

TEST(test_sequence_modulo_subscription) {
    Fixture fx;
    auto ids = fx.registry.identifiers();   // NIFTY50-INDEX, INFY-EQ, SBIN-EQ, TCS-EQ
    fx.resolver->set_active_symbols(ids);

    auto u = unidentified();
    u.hints.sequence = 6;   // 6 % 4 == 2
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "SBIN-EQ");
    ASSERT_TRUE(r->step == ResolutionStep::Sequence);

    u.hints.sequence = -1;  // wraps to the last entry
    r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->short_name, "TCS-EQ");
}

TEST(test_timestamp_modulo_subscription) {
    Fixture fx;
    auto ids = fx.registry.identifiers();
    fx.resolver->set_active_symbols(ids);

    auto u = unidentified();
    auto r = fx.resolver->resolve(u, T0);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->step == ResolutionStep::Timestamp);
    const auto expected = strip_exchange_prefix(ids[static_cast<size_t>(to_epoch_ms(T0) % 4)]);
    ASSERT_EQ(r->short_name, expected);
}

TEST(test_sequence_follows_subscription_order) {
    auto registry = nifty50_registry();
    SnapshotStore store(registry, 0.01, T0);
    SymbolMapping mapping;
    mapping.seed(registry);
    SymbolResolver resolver(mapping, store, 0.1);
    resolver.set_active_symbols(registry.identifiers());

    // the provider list keeps BAJFINANCE ahead of BAJAJFINSV and INFY ahead of INDUSINDBK
    auto u = unidentified();
    u.hints.sequence = 7;
    ASSERT_EQ(resolver.resolve(u, T0)->short_name, "BAJFINANCE-EQ");
    u.hints.sequence = 8;
    ASSERT_EQ(resolver.resolve(u, T0)->short_name, "BAJAJFINSV-EQ");
    u.hints.sequence = 24;
    ASSERT_EQ(resolver.resolve(u, T0)->short_name, "INFY-EQ");
    u.hints.sequence = 51 + 25;
    ASSERT_EQ(resolver.resolve(u, T0)->short_name, "INDUSINDBK-EQ");
}

int main() {
    std::cout << "\n=== SymbolResolver Tests ===\n\n";

    RUN_TEST(test_explicit_identifier_strips_prefix);
    RUN_TEST(test_explicit_unknown_identifier_is_dropped);
    RUN_TEST(test_new_exchange_prefix_is_learned);
    RUN_TEST(test_alternate_field_resolves);
    RUN_TEST(test_instrument_name_resolves);
    RUN_TEST(test_bid_price_unique_match);
    RUN_TEST(test_bid_price_ambiguous_match_is_dropped);
    RUN_TEST(test_security_id_via_mapping);
    RUN_TEST(test_nothing_to_go_on_without_subscription);
    RUN_TEST(test_sequence_modulo_subscription);
    RUN_TEST(test_timestamp_modulo_subscription);
    RUN_TEST(test_sequence_follows_subscription_order);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}

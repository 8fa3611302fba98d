// cpswap - Pool Engine Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <string>
#include <utility>
#include "pool_harness.hpp"

using namespace cpswap;
using cpswap::test::PoolHarness;

namespace {

constexpr uint64_t FUNDING = PoolHarness::FUNDING;

PolicyConfig policy_named(const std::string& name) {
    return name == "naive" ? PolicyConfig::naive() : PolicyConfig::hardened();
}

} // namespace

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("Pool initialization", "[engine]") {
    PoolHarness h(PolicyConfig::hardened());
    REQUIRE(h.init_status == errors::OK);

    SECTION("Registers the pool under its custody address") {
        auto custody = h.authorizer.find_pool_address(h.usdc, h.sol);
        REQUIRE(h.pool == custody->address);
        REQUIRE(h.engine.pool_exists(h.pool));

        auto pool = h.engine.get_pool(h.pool);
        REQUIRE(pool.has_value());
        REQUIRE(pool->bump == custody->bump);
        REQUIRE(pool->reserve_a == h.reserve_a);
        REQUIRE(pool->fee_numerator == 3);
        REQUIRE(pool->fee_denominator == 1000);
        REQUIRE(h.engine.pools().size() == 1);
    }

    SECTION("Emits PoolCreated") {
        REQUIRE(h.events.size() == 1);
        auto created = h.events.last<PoolCreated>();
        REQUIRE(created.has_value());
        REQUIRE(created->pool == h.pool);
        REQUIRE(created->fee == 0.003);
    }

    SECTION("Duplicate pair") {
        REQUIRE(h.engine.initialize_pool(h.init_params()).status == errors::POOL_ALREADY_INITIALIZED);
        REQUIRE(h.events.size() == 1);
    }

    SECTION("Fee must be a proper fraction") {
        REQUIRE(h.engine.initialize_pool(h.init_params(3, 0)).status == errors::INVALID_AMOUNT);
        REQUIRE(h.engine.initialize_pool(h.init_params(1001, 1000)).status == errors::INVALID_AMOUNT);
    }

    SECTION("Assets must be distinct and known") {
        auto params = h.init_params();
        params.asset_b = h.usdc;
        REQUIRE(h.engine.initialize_pool(params).status == errors::INVALID_ASSET);

        params = h.init_params();
        params.share_token = from_label("no-such-mint");
        REQUIRE(h.engine.initialize_pool(params).status == errors::MINT_NOT_FOUND);
    }

    SECTION("Reserves must be in pool custody") {
        auto params = h.init_params();
        params.reserve_a = h.alice_a;
        REQUIRE(h.engine.initialize_pool(params).status == errors::INVALID_ACCOUNT);

        params = h.init_params();
        params.reserve_b = h.reserve_a;
        REQUIRE(h.engine.initialize_pool(params).status == errors::INVALID_ACCOUNT);
    }

    SECTION("Side-payment routing needs fee recipients per asset") {
        auto params = h.init_params();
        params.fee_recipient_a = AccountId{};
        REQUIRE(h.engine.initialize_pool(params).status == errors::INVALID_ACCOUNT);

        params = h.init_params();
        params.fee_recipient_a = h.fee_b;
        REQUIRE(h.engine.initialize_pool(params).status == errors::INVALID_ACCOUNT);
    }

    SECTION("Creator must sign") {
        auto params = h.init_params();
        params.authority = AccountId{};
        REQUIRE(h.engine.initialize_pool(params).status == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Retained fees need no recipients", "[engine][naive]") {
    PoolHarness h(PolicyConfig::naive());
    auto params = h.init_params();
    params.fee_recipient_a = AccountId{};
    params.fee_recipient_b = AccountId{};
    // Passes validation and reaches the registry check
    REQUIRE(h.engine.initialize_pool(params).status == errors::POOL_ALREADY_INITIALIZED);
}

// =============================================================================
// Liquidity
// =============================================================================

TEST_CASE("Adding liquidity", "[engine]") {
    auto name = GENERATE(as<std::string>{}, "naive", "hardened");
    PoolHarness h(policy_named(name));
    REQUIRE(h.init_status == errors::OK);

    SECTION("Bootstrap deposit mints exactly 1,000,000") {
        auto r = h.add(h.alice, 1000000, 1000000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.lp_minted == 1000000);
        REQUIRE(r.reserve_a == 1000000);
        REQUIRE(r.reserve_b == 1000000);
        REQUIRE(h.supply() == 1000000);
        REQUIRE(h.balance(h.alice_lp) == 1000000);
        REQUIRE(h.balance(h.alice_a) == FUNDING - 1000000);

        auto added = h.events.last<LiquidityAdded>();
        REQUIRE(added.has_value());
        REQUIRE(added->lp_minted == 1000000);
        REQUIRE(added->reserve_a == 1000000);
    }

    SECTION("Empty or one-sided first deposit mints nothing") {
        for (auto [amount_a, amount_b] : {std::make_pair(0ULL, 0ULL), std::make_pair(1000000ULL, 0ULL),
                                          std::make_pair(0ULL, 1000000ULL)}) {
            auto r = h.add(h.alice, amount_a, amount_b);
            REQUIRE(r.status == errors::INVALID_AMOUNT);
        }
        REQUIRE(h.supply() == 0);
        REQUIRE(h.balance(h.alice_lp) == 0);
        REQUIRE(h.balance(h.alice_a) == FUNDING);
        REQUIRE(h.balance(h.alice_b) == FUNDING);
        REQUIRE(h.balance(h.reserve_a) == 0);
        REQUIRE(h.balance(h.reserve_b) == 0);

        // The first real depositor still bootstraps
        auto r = h.add(h.bob, 1000000, 1000000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.lp_minted == 1000000);
        REQUIRE(h.supply() == h.balance(h.bob_lp));
    }

    SECTION("Balanced deposit mints proportionally") {
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);
        auto r = h.add(h.bob, 500000, 500000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.lp_minted == 500000);
        REQUIRE(h.supply() == 1500000);
    }

    SECTION("Unbalanced deposit mints for the smaller side") {
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);
        auto r = h.add(h.bob, 500000, 100000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.lp_minted == 100000);
        REQUIRE(h.balance(h.reserve_a) == 1500000);
    }

    SECTION("Slippage floor leaves state untouched") {
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);
        size_t events_before = h.events.size();

        auto r = h.add(h.bob, 500000, 500000, 500001);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(h.balance(h.bob_a) == FUNDING);
        REQUIRE(h.balance(h.bob_b) == FUNDING);
        REQUIRE(h.balance(h.reserve_a) == 1000000);
        REQUIRE(h.supply() == 1000000);
        REQUIRE(h.events.size() == events_before);
        REQUIRE(h.engine.get_stats().total_rejected == 1);
    }

    SECTION("Deposit larger than the user's balance changes nothing") {
        auto r = h.add(h.alice, FUNDING + 1, 1000000);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(h.balance(h.alice_b) == FUNDING);
        REQUIRE(h.supply() == 0);
    }

    SECTION("User must control the accounts") {
        auto r = h.engine.add_liquidity(h.pool, AddLiquidityParams{
            h.bob, h.alice_a, h.bob_b, h.bob_lp, 1000, 1000, 0});
        REQUIRE(r.status == errors::UNAUTHORIZED);

        r = h.engine.add_liquidity(h.pool, AddLiquidityParams{
            h.bob, h.bob_b, h.bob_a, h.bob_lp, 1000, 1000, 0});
        REQUIRE(r.status == errors::INVALID_ACCOUNT);
    }

    SECTION("Unknown pool") {
        auto r = h.engine.add_liquidity(from_label("elsewhere"), AddLiquidityParams{
            h.alice, h.alice_a, h.alice_b, h.alice_lp, 1000, 1000, 0});
        REQUIRE(r.status == errors::POOL_NOT_INITIALIZED);
    }
}

TEST_CASE("Decimal-normalized issuance", "[engine][hardened]") {
    // USDC at 6 decimals, SOL at 9, shares at 6
    PoolHarness h(PolicyConfig::hardened(), 6, 9, 6);
    REQUIRE(h.init_status == errors::OK);

    REQUIRE(h.add(h.alice, 1000000, 1000000000).lp_minted == 1000000);

    auto r = h.add(h.bob, 250000, 250000000);
    REQUIRE(r.status == errors::OK);
    REQUIRE(r.lp_minted == 250000);
    REQUIRE(h.supply() == 1250000);
}

// =============================================================================
// Swaps
// =============================================================================

TEST_CASE("Swapping", "[engine]") {
    auto name = GENERATE(as<std::string>{}, "naive", "hardened");
    PoolHarness h(policy_named(name));
    REQUIRE(h.init_status == errors::OK);
    REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);

    SECTION("Reference swap prices 10,000 in at fee 30 and output 9,871") {
        auto r = h.swap_a_for_b(h.bob, 10000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.fee == 30);
        REQUIRE(r.amount_in_after_fee == 9970);
        REQUIRE(r.amount_out == 9871);
        REQUIRE(h.balance(h.bob_a) == FUNDING - 10000);
        REQUIRE(h.balance(h.bob_b) == FUNDING + 9871);
        REQUIRE(h.balance(h.reserve_b) == 990129);

        auto executed = h.events.last<SwapExecuted>();
        REQUIRE(executed.has_value());
        REQUIRE(executed->asset_in == h.usdc);
        REQUIRE(executed->amount_out == 9871);
        REQUIRE(executed->fee == 30);
    }

    SECTION("Constant product never decreases") {
        uint64_t in_before = h.balance(h.reserve_a);
        uint64_t out_before = h.balance(h.reserve_b);
        REQUIRE(h.swap_a_for_b(h.bob, 37123).status == errors::OK);
        REQUIRE(pool_math::constant_product_holds(in_before, out_before,
                                                  h.balance(h.reserve_a), h.balance(h.reserve_b)));

        in_before = h.balance(h.reserve_b);
        out_before = h.balance(h.reserve_a);
        REQUIRE(h.swap_b_for_a(h.bob, 250000).status == errors::OK);
        REQUIRE(pool_math::constant_product_holds(in_before, out_before,
                                                  h.balance(h.reserve_b), h.balance(h.reserve_a)));
    }

    SECTION("Quote matches execution") {
        auto quote = h.engine.quote_swap(h.pool, h.sol, 55555);
        REQUIRE(quote.status == errors::OK);
        auto r = h.swap_b_for_a(h.bob, 55555);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_out == quote.amount_out);
        REQUIRE(r.fee == quote.fee);
    }

    SECTION("Slippage floor is inclusive and leaves state untouched on failure") {
        size_t events_before = h.events.size();
        auto r = h.swap_a_for_b(h.bob, 10000, 9872);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(h.balance(h.bob_a) == FUNDING);
        REQUIRE(h.balance(h.reserve_a) == 1000000);
        REQUIRE(h.balance(h.reserve_b) == 1000000);
        REQUIRE(h.events.size() == events_before);

        REQUIRE(h.swap_a_for_b(h.bob, 10000, 9871).status == errors::OK);
    }

    SECTION("Invalid inputs") {
        REQUIRE(h.swap_a_for_b(h.bob, 0).status == errors::INVALID_AMOUNT);

        SwapParams same{h.bob, h.usdc, h.usdc, h.bob_a, h.bob_a, h.reserve_a, h.reserve_a, 100, 0};
        REQUIRE(h.engine.swap(h.pool, same).status == errors::INVALID_AMOUNT);

        SwapParams foreign{h.bob, h.share, h.sol, h.bob_lp, h.bob_b, h.reserve_a, h.reserve_b, 100, 0};
        REQUIRE(h.engine.swap(h.pool, foreign).status == errors::INVALID_ASSET);

        SwapParams wrong_reserve{h.bob, h.usdc, h.sol, h.bob_a, h.bob_b, h.reserve_b, h.reserve_a, 100, 0};
        REQUIRE(h.engine.swap(h.pool, wrong_reserve).status == errors::INVALID_ACCOUNT);

        SwapParams stolen{h.bob, h.usdc, h.sol, h.alice_a, h.bob_b, h.reserve_a, h.reserve_b, 100, 0};
        REQUIRE(h.engine.swap(h.pool, stolen).status == errors::UNAUTHORIZED);

        REQUIRE(h.engine.swap(from_label("elsewhere"), stolen).status == errors::POOL_NOT_INITIALIZED);
        REQUIRE(h.balance(h.alice_a) == FUNDING - 1000000);
        REQUIRE(h.engine.get_stats().total_swaps == 0);
    }

    SECTION("Input larger than the user's balance changes nothing") {
        auto r = h.swap_a_for_b(h.bob, FUNDING + 1);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(h.balance(h.reserve_b) == 1000000);
    }
}

TEST_CASE("Fee routing", "[engine]") {
    SECTION("Retained fees stay in the reserve") {
        PoolHarness h(PolicyConfig::naive());
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);
        REQUIRE(h.swap_a_for_b(h.bob, 10000).status == errors::OK);
        REQUIRE(h.balance(h.reserve_a) == 1010000);
        REQUIRE(h.balance(h.fee_a) == 0);
    }

    SECTION("Side payments go to the input asset's recipient") {
        PoolHarness h(PolicyConfig::hardened());
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);

        REQUIRE(h.swap_a_for_b(h.bob, 10000).status == errors::OK);
        REQUIRE(h.balance(h.reserve_a) == 1009970);
        REQUIRE(h.balance(h.fee_a) == 30);
        REQUIRE(h.balance(h.bob_a) == FUNDING - 10000);

        auto r = h.swap_b_for_a(h.bob, 20000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.fee == 60);
        REQUIRE(h.balance(h.fee_b) == 60);
        REQUIRE(h.balance(h.fee_a) == 30);
    }
}

TEST_CASE("Swapping against an empty pool", "[engine]") {
    SECTION("Guarded math rejects the swap") {
        PoolHarness h(PolicyConfig::hardened());
        REQUIRE(h.swap_a_for_b(h.bob, 1000).status == errors::INVALID_AMOUNT);
        REQUIRE(h.balance(h.bob_a) == FUNDING);
    }

    SECTION("Direct math pays out nothing") {
        PoolHarness h(PolicyConfig::naive());
        auto r = h.swap_a_for_b(h.bob, 1000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_out == 0);
        REQUIRE(h.balance(h.reserve_a) == 1000);
    }
}

// =============================================================================
// Withdrawals
// =============================================================================

TEST_CASE("Removing liquidity", "[engine]") {
    auto name = GENERATE(as<std::string>{}, "naive", "hardened");
    PoolHarness h(policy_named(name));
    REQUIRE(h.init_status == errors::OK);
    REQUIRE(h.add(h.alice, 1000000, 4000000).status == errors::OK);
    if (h.engine.config().policy.burn_authority == BurnAuthority::POOL) {
        REQUIRE(h.ledger.approve(h.alice_lp, h.alice, h.pool) == errors::OK);
    }

    SECTION("Pays out proportionally and burns exactly lp_amount") {
        auto r = h.remove(h.alice, 250000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_a == 250000);
        REQUIRE(r.amount_b == 1000000);
        REQUIRE(r.reserve_a == 750000);
        REQUIRE(r.reserve_b == 3000000);
        REQUIRE(h.supply() == 750000);
        REQUIRE(h.balance(h.alice_lp) == 750000);

        auto removed = h.events.last<LiquidityRemoved>();
        REQUIRE(removed.has_value());
        REQUIRE(removed->lp_burned == 250000);
        REQUIRE(removed->reserve_b == 3000000);
    }

    SECTION("Quote matches execution") {
        auto quote = h.engine.quote_remove_liquidity(h.pool, 333333);
        auto r = h.remove(h.alice, 333333);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_a == quote.amount_a);
        REQUIRE(r.amount_b == quote.amount_b);
    }

    SECTION("Each floor is checked independently") {
        REQUIRE(h.remove(h.alice, 250000, 250001, 0).status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(h.remove(h.alice, 250000, 0, 1000001).status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(h.supply() == 1000000);
        REQUIRE(h.balance(h.reserve_a) == 1000000);
    }

    SECTION("Zero amount") {
        REQUIRE(h.remove(h.alice, 0).status == errors::INVALID_AMOUNT);
    }

    SECTION("Burning more than held rolls back the payout") {
        auto r = h.remove(h.bob, 100);
        REQUIRE(r.status != errors::OK);
        REQUIRE(h.balance(h.reserve_a) == 1000000);
        REQUIRE(h.balance(h.reserve_b) == 4000000);
        REQUIRE(h.balance(h.bob_a) == FUNDING);
        REQUIRE(h.ledger.transaction_depth() == 0);
    }

    SECTION("Supply is conserved across operations") {
        REQUIRE(h.add(h.bob, 500000, 2000000).status == errors::OK);
        REQUIRE(h.swap_a_for_b(h.bob, 12345).status == errors::OK);
        REQUIRE(h.remove(h.alice, 400000).status == errors::OK);
        REQUIRE(h.supply() == h.balance(h.alice_lp) + h.balance(h.bob_lp));
    }
}

TEST_CASE("Burn authority", "[engine]") {
    SECTION("Pool-signed burn needs the user's delegation") {
        PoolHarness h(PolicyConfig::naive());
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);

        auto r = h.remove(h.alice, 500000);
        REQUIRE(r.status == errors::UNAUTHORIZED);
        REQUIRE(h.balance(h.reserve_a) == 1000000);
        REQUIRE(h.balance(h.alice_a) == FUNDING - 1000000);
        REQUIRE(h.supply() == 1000000);

        REQUIRE(h.ledger.approve(h.alice_lp, h.alice, h.pool) == errors::OK);
        r = h.remove(h.alice, 500000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(h.supply() == 500000);
    }

    SECTION("Owner-signed burn needs no delegation") {
        PoolHarness h(PolicyConfig::hardened());
        REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);
        REQUIRE(h.remove(h.alice, 500000).status == errors::OK);
        REQUIRE(h.supply() == 500000);
    }
}

// =============================================================================
// Queries
// =============================================================================

TEST_CASE("Engine queries", "[engine]") {
    PoolHarness h(PolicyConfig::hardened());
    REQUIRE(h.add(h.alice, 1000000, 1000000).status == errors::OK);

    SECTION("Snapshot reads live balances") {
        auto snap = h.engine.snapshot(h.pool);
        REQUIRE(snap.has_value());
        REQUIRE(snap->reserve_a == 1000000);
        REQUIRE(snap->share_supply == 1000000);
        REQUIRE(snap->decimals_b == 6);
        REQUIRE_FALSE(h.engine.snapshot(from_label("elsewhere")).has_value());
    }

    SECTION("Quotes") {
        REQUIRE(h.engine.quote_swap(h.pool, h.usdc, 10000).amount_out == 9871);
        REQUIRE(h.engine.quote_swap(h.pool, h.share, 10000).status == errors::INVALID_ASSET);
        REQUIRE(h.engine.quote_add_liquidity(h.pool, 500000, 500000).mint_amount == 500000);
        REQUIRE(h.engine.quote_remove_liquidity(from_label("elsewhere"), 1).status ==
                errors::POOL_NOT_INITIALIZED);
    }

    SECTION("Statistics") {
        REQUIRE(h.swap_a_for_b(h.bob, 1000).status == errors::OK);
        REQUIRE(h.swap_a_for_b(h.bob, 1000, U64_MAX).status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(h.remove(h.alice, 1000).status == errors::OK);

        auto stats = h.engine.get_stats();
        REQUIRE(stats.total_pools == 1);
        REQUIRE(stats.total_swaps == 1);
        REQUIRE(stats.total_liquidity_adds == 1);
        REQUIRE(stats.total_liquidity_removes == 1);
        REQUIRE(stats.total_rejected == 1);
    }
}

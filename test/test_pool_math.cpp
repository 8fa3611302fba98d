// cpswap - Pool Math Tests

#include <catch2/catch_test_macros.hpp>
#include <cpswap/pool_math.hpp>

using namespace cpswap;

TEST_CASE("Checked arithmetic", "[math]") {
    SECTION("Add") {
        REQUIRE(checked::add(1, 2) == 3u);
        REQUIRE_FALSE(checked::add(U64_MAX, 1).has_value());
    }

    SECTION("Sub") {
        REQUIRE(checked::sub(5, 5) == 0u);
        REQUIRE_FALSE(checked::sub(4, 5).has_value());
    }

    SECTION("Mul") {
        REQUIRE(checked::mul(0, U64_MAX) == 0u);
        REQUIRE(checked::mul(1ULL << 32, (1ULL << 32) - 1).has_value());
        REQUIRE_FALSE(checked::mul(1ULL << 32, 1ULL << 32).has_value());
    }

    SECTION("Div by zero") {
        REQUIRE(checked::div(10, 3) == 3u);
        REQUIRE_FALSE(checked::div(10, 0).has_value());
    }

    SECTION("Pow10") {
        REQUIRE(checked::pow10(0) == 1u);
        REQUIRE(checked::pow10(19) == 10000000000000000000ULL);
        REQUIRE_FALSE(checked::pow10(20).has_value());
    }
}

TEST_CASE("Decimal normalization", "[math]") {
    SECTION("Same decimals pass through") {
        REQUIRE(decimals::normalize(123, 6, 6) == 123u);
    }

    SECTION("Downscale truncates") {
        REQUIRE(decimals::normalize(123456789, 9, 6) == 123456u);
        REQUIRE(decimals::normalize(999, 9, 6) == 0u);
    }

    SECTION("Upscale multiplies") {
        REQUIRE(decimals::normalize(123456, 6, 9) == 123456000u);
    }

    SECTION("Upscale overflow") {
        REQUIRE_FALSE(decimals::normalize(U64_MAX, 0, 1).has_value());
        REQUIRE_FALSE(decimals::normalize(1, 0, 20).has_value());
        REQUIRE(decimals::normalize(0, 0, 20) == 0u);
    }

    SECTION("Round trip never amplifies") {
        for (uint64_t amount : {0ULL, 1ULL, 999ULL, 1000ULL, 123456789ULL, 18446744073709551615ULL}) {
            auto down = decimals::normalize(amount, 9, 6);
            REQUIRE(down.has_value());
            auto back = decimals::normalize(*down, 6, 9);
            REQUIRE(back.has_value());
            REQUIRE(*back <= amount);
        }
    }
}

TEST_CASE("Swap quote", "[math]") {
    const auto naive = PolicyConfig::naive();
    const auto hardened = PolicyConfig::hardened();

    SECTION("Reference scenario 1,000,000 / 1,000,000 at 3/1000") {
        for (const auto& policy : {naive, hardened}) {
            auto q = pool_math::quote_swap(policy, 3, 1000, 1000000, 1000000, 10000);
            REQUIRE(q.status == errors::OK);
            REQUIRE(q.fee == 30);
            REQUIRE(q.amount_in_after_fee == 9970);
            REQUIRE(q.amount_out == 9871);
            REQUIRE_FALSE(q.used_scaled_path);
        }
    }

    SECTION("Zero input") {
        REQUIRE(pool_math::quote_swap(naive, 3, 1000, 1000, 1000, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(pool_math::quote_swap(hardened, 3, 1000, 1000, 1000, 0).status == errors::INVALID_AMOUNT);
    }

    SECTION("Zero fee denominator") {
        REQUIRE(pool_math::quote_swap(hardened, 3, 0, 1000, 1000, 10).status == errors::INVALID_AMOUNT);
    }

    SECTION("Guarded math rejects empty reserves") {
        REQUIRE(pool_math::quote_swap(hardened, 3, 1000, 0, 1000, 10).status == errors::INVALID_AMOUNT);
        REQUIRE(pool_math::quote_swap(hardened, 3, 1000, 1000, 0, 10).status == errors::INVALID_AMOUNT);
    }

    SECTION("Direct math against empty reserves pays nothing") {
        auto q = pool_math::quote_swap(naive, 3, 1000, 0, 0, 1000);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_out == 0);
    }

    SECTION("Overflow boundary uses the scaled fallback") {
        const uint64_t reserve = 1000000000000000000ULL;  // 1e18
        const uint64_t amount = 10000000000ULL;            // 1e10

        auto guarded = pool_math::quote_swap(hardened, 0, 1, reserve, reserve, amount);
        REQUIRE(guarded.status == errors::OK);
        REQUIRE(guarded.used_scaled_path);
        REQUIRE(guarded.amount_out == 9000000000ULL);

        auto direct = pool_math::quote_swap(naive, 0, 1, reserve, reserve, amount);
        REQUIRE(direct.status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Fallback never exceeds the exact output") {
        bool scaled = false;
        auto out = pool_math::swap_output_guarded(3000000000000000000ULL, 5000000000000000000ULL,
                                                  7000000000ULL, pool_math::DEFAULT_PRECISION_SCALE,
                                                  &scaled);
        REQUIRE(out.has_value());
        REQUIRE(scaled);
        U128 exact = static_cast<U128>(5000000000000000000ULL) * 7000000000ULL /
                     (3000000000000000000ULL + 7000000000ULL);
        bool within_exact = static_cast<U128>(*out) <= exact;
        REQUIRE(within_exact);
    }

    SECTION("Fee product overflow") {
        auto q = pool_math::quote_swap(hardened, 1000, 1000, 1000, 1000, U64_MAX);
        REQUIRE(q.status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Liquidity quote", "[math]") {
    pool_math::ReserveSnapshot empty{0, 0, 0, 6, 6, 6};

    SECTION("Bootstrap mints the fixed amount") {
        for (const auto& policy : {PolicyConfig::naive(), PolicyConfig::hardened()}) {
            auto q = pool_math::quote_add_liquidity(policy, empty, 5, 7);
            REQUIRE(q.status == errors::OK);
            REQUIRE(q.bootstrap);
            REQUIRE(q.mint_amount == 1000000);
        }
    }

    SECTION("Bootstrap needs both sides") {
        for (const auto& policy : {PolicyConfig::naive(), PolicyConfig::hardened()}) {
            auto none = pool_math::quote_add_liquidity(policy, empty, 0, 0);
            REQUIRE(none.status == errors::INVALID_AMOUNT);
            REQUIRE(none.mint_amount == 0);

            REQUIRE(pool_math::quote_add_liquidity(policy, empty, 5, 0).status == errors::INVALID_AMOUNT);
            REQUIRE(pool_math::quote_add_liquidity(policy, empty, 0, 5).status == errors::INVALID_AMOUNT);
        }
    }

    SECTION("Naive bootstraps on empty reserve A alone") {
        pool_math::ReserveSnapshot half{0, 500, 1000000, 6, 6, 6};
        auto naive = pool_math::quote_add_liquidity(PolicyConfig::naive(), half, 10, 10);
        REQUIRE(naive.bootstrap);

        auto hardened = pool_math::quote_add_liquidity(PolicyConfig::hardened(), half, 10, 10);
        REQUIRE_FALSE(hardened.bootstrap);
        REQUIRE(hardened.mint_amount == 0);
    }

    SECTION("Minimum of the two sides") {
        pool_math::ReserveSnapshot snap{1000000, 2000000, 1000000, 6, 6, 6};
        for (const auto& policy : {PolicyConfig::naive(), PolicyConfig::hardened()}) {
            auto q = pool_math::quote_add_liquidity(policy, snap, 100000, 100000);
            REQUIRE(q.status == errors::OK);
            REQUIRE(q.lp_for_a == 100000);
            REQUIRE(q.lp_for_b == 50000);
            REQUIRE(q.mint_amount == 50000);
        }
    }

    SECTION("Normalized issuance compares values in share decimals") {
        // A has 6 decimals, B has 9, shares have 6
        pool_math::ReserveSnapshot snap{1000000, 1000000000, 1000000, 6, 9, 6};
        auto q = pool_math::quote_add_liquidity(PolicyConfig::hardened(), snap, 250000, 250000000);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.lp_for_a == 250000);
        REQUIRE(q.lp_for_b == 250000);
        REQUIRE(q.mint_amount == 250000);
    }

    SECTION("Naive issuance overflow") {
        pool_math::ReserveSnapshot snap{1, 1, U64_MAX, 6, 6, 6};
        auto q = pool_math::quote_add_liquidity(PolicyConfig::naive(), snap, 2, 2);
        REQUIRE(q.status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Withdraw quote", "[math]") {
    pool_math::ReserveSnapshot snap{1000000, 4000000, 2000000, 6, 6, 6};

    SECTION("Proportional payout") {
        auto q = pool_math::quote_remove_liquidity(snap, 500000);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_a == 250000);
        REQUIRE(q.amount_b == 1000000);
    }

    SECTION("Zero amount or supply") {
        REQUIRE(pool_math::quote_remove_liquidity(snap, 0).status == errors::INVALID_AMOUNT);
        pool_math::ReserveSnapshot drained{10, 10, 0, 6, 6, 6};
        REQUIRE(pool_math::quote_remove_liquidity(drained, 1).status == errors::INVALID_AMOUNT);
    }

    SECTION("Overflow") {
        pool_math::ReserveSnapshot big{U64_MAX, 1, U64_MAX, 6, 6, 6};
        REQUIRE(pool_math::quote_remove_liquidity(big, 2).status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Constant product check", "[math]") {
    REQUIRE(pool_math::constant_product_holds(1000000, 1000000, 1010000, 990129));
    REQUIRE_FALSE(pool_math::constant_product_holds(1000000, 1000000, 1010000, 980000));
    REQUIRE(pool_math::constant_product_holds(U64_MAX, U64_MAX, U64_MAX, U64_MAX));
}

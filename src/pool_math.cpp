// =============================================================================
// pool_math.cpp - Constant-product pricing and share issuance
// All value-path arithmetic is unsigned 64-bit with explicit overflow checks.
// =============================================================================

#include "cpswap/pool_math.hpp"
#include <algorithm>

namespace cpswap {
namespace pool_math {

namespace {

// amount * supply / reserve with a pre-multiplication overflow check.
// A zero reserve contributes no issuance.
std::optional<uint64_t> proportional_share(uint64_t amount, uint64_t supply, uint64_t reserve) {
    if (reserve == 0) return uint64_t{0};
    if (supply != 0 && amount > U64_MAX / supply) return std::nullopt;
    return amount * supply / reserve;
}

// lp_amount * reserve / supply, same guard
std::optional<uint64_t> proportional_payout(uint64_t lp_amount, uint64_t reserve, uint64_t supply) {
    if (reserve != 0 && lp_amount > U64_MAX / reserve) return std::nullopt;
    return (lp_amount * reserve) / supply;
}

// First deposit must seed both reserves
LiquidityQuote bootstrap_quote(uint64_t amount_a, uint64_t amount_b, uint64_t bootstrap_amount) {
    LiquidityQuote q{errors::OK, true, 0, 0, 0};
    if (amount_a == 0 || amount_b == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }
    q.mint_amount = bootstrap_amount;
    return q;
}

} // anonymous namespace

// =============================================================================
// Swap Math
// =============================================================================

std::optional<uint64_t> compute_fee(uint64_t amount_in, uint64_t fee_numerator,
                                    uint64_t fee_denominator) {
    auto product = checked::mul(amount_in, fee_numerator);
    if (!product) return std::nullopt;
    return checked::div(*product, fee_denominator);
}

std::optional<uint64_t> swap_output_direct(uint64_t reserve_in, uint64_t reserve_out,
                                           uint64_t amount_in_after_fee) {
    auto numerator = checked::mul(reserve_out, amount_in_after_fee);
    if (!numerator) return std::nullopt;
    auto denominator = checked::add(reserve_in, amount_in_after_fee);
    if (!denominator) return std::nullopt;
    return checked::div(*numerator, *denominator);
}

std::optional<uint64_t> swap_output_guarded(uint64_t reserve_in, uint64_t reserve_out,
                                            uint64_t amount_in_after_fee,
                                            uint64_t precision_scale, bool* scaled) {
    if (scaled) *scaled = false;
    if (amount_in_after_fee == 0) return uint64_t{0};

    if (reserve_out <= U64_MAX / amount_in_after_fee) {
        return swap_output_direct(reserve_in, reserve_out, amount_in_after_fee);
    }

    // reserve_out * in would overflow: divide first at reduced precision
    if (scaled) *scaled = true;
    if (precision_scale == 0) return std::nullopt;

    auto scaled_in = checked::mul(amount_in_after_fee, precision_scale);
    if (!scaled_in) return std::nullopt;
    auto denominator = checked::add(reserve_in, amount_in_after_fee);
    if (!denominator) return std::nullopt;

    uint64_t ratio = *scaled_in / *denominator;
    auto out_scaled = checked::mul(ratio, reserve_out);
    if (!out_scaled) return std::nullopt;
    return *out_scaled / precision_scale;
}

SwapQuote quote_swap(const PolicyConfig& policy, uint64_t fee_numerator,
                     uint64_t fee_denominator, uint64_t reserve_in,
                     uint64_t reserve_out, uint64_t amount_in,
                     uint64_t precision_scale) {
    SwapQuote q{errors::OK, 0, 0, 0, false};

    if (amount_in == 0 || fee_denominator == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    auto fee = compute_fee(amount_in, fee_numerator, fee_denominator);
    if (!fee) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }
    auto after_fee = checked::sub(amount_in, *fee);
    if (!after_fee) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }
    q.fee = *fee;
    q.amount_in_after_fee = *after_fee;

    std::optional<uint64_t> out;
    if (policy.swap_math == SwapMath::GUARDED) {
        if (reserve_in == 0 || reserve_out == 0) {
            q.status = errors::INVALID_AMOUNT;
            return q;
        }
        out = swap_output_guarded(reserve_in, reserve_out, *after_fee,
                                  precision_scale, &q.used_scaled_path);
    } else {
        out = swap_output_direct(reserve_in, reserve_out, *after_fee);
    }

    if (!out) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }
    q.amount_out = *out;
    return q;
}

// =============================================================================
// Liquidity Math
// =============================================================================

LiquidityQuote quote_add_liquidity(const PolicyConfig& policy, const ReserveSnapshot& snap,
                                   uint64_t amount_a, uint64_t amount_b,
                                   uint64_t bootstrap_amount) {
    LiquidityQuote q{errors::OK, false, 0, 0, 0};

    if (policy.issuance == IssuancePolicy::NAIVE) {
        if (snap.reserve_a == 0) {
            return bootstrap_quote(amount_a, amount_b, bootstrap_amount);
        }

        auto a_product = checked::mul(amount_a, snap.share_supply);
        auto lp_a = a_product ? checked::div(*a_product, snap.reserve_a) : std::nullopt;
        auto b_product = checked::mul(amount_b, snap.share_supply);
        auto lp_b = b_product ? checked::div(*b_product, snap.reserve_b) : std::nullopt;
        if (!lp_a || !lp_b) {
            q.status = errors::ARITHMETIC_OVERFLOW;
            return q;
        }
        q.lp_for_a = *lp_a;
        q.lp_for_b = *lp_b;
        q.mint_amount = std::min(*lp_a, *lp_b);
        return q;
    }

    // Decimal-normalized issuance
    if (snap.reserve_a == 0 && snap.reserve_b == 0) {
        return bootstrap_quote(amount_a, amount_b, bootstrap_amount);
    }

    auto norm_amount_a = decimals::normalize(amount_a, snap.decimals_a, snap.share_decimals);
    auto norm_amount_b = decimals::normalize(amount_b, snap.decimals_b, snap.share_decimals);
    auto norm_reserve_a = decimals::normalize(snap.reserve_a, snap.decimals_a, snap.share_decimals);
    auto norm_reserve_b = decimals::normalize(snap.reserve_b, snap.decimals_b, snap.share_decimals);
    if (!norm_amount_a || !norm_amount_b || !norm_reserve_a || !norm_reserve_b) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }

    auto lp_a = proportional_share(*norm_amount_a, snap.share_supply, *norm_reserve_a);
    auto lp_b = proportional_share(*norm_amount_b, snap.share_supply, *norm_reserve_b);
    if (!lp_a || !lp_b) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }
    q.lp_for_a = *lp_a;
    q.lp_for_b = *lp_b;
    q.mint_amount = std::min(*lp_a, *lp_b);
    return q;
}

WithdrawQuote quote_remove_liquidity(const ReserveSnapshot& snap, uint64_t lp_amount) {
    WithdrawQuote q{errors::OK, 0, 0};

    if (lp_amount == 0 || snap.share_supply == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    auto amount_a = proportional_payout(lp_amount, snap.reserve_a, snap.share_supply);
    auto amount_b = proportional_payout(lp_amount, snap.reserve_b, snap.share_supply);
    if (!amount_a || !amount_b) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }
    q.amount_a = *amount_a;
    q.amount_b = *amount_b;
    return q;
}

} // namespace pool_math
} // namespace cpswap

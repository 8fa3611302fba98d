#ifndef CPSWAP_POOL_MATH_HPP
#define CPSWAP_POOL_MATH_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"
#include "policy.hpp"

namespace cpswap {

// =============================================================================
// Checked Arithmetic (uint64_t, nullopt on overflow / division by zero)
// =============================================================================

namespace checked {

inline std::optional<uint64_t> add(uint64_t a, uint64_t b) {
    if (a > U64_MAX - b) return std::nullopt;
    return a + b;
}

inline std::optional<uint64_t> sub(uint64_t a, uint64_t b) {
    if (b > a) return std::nullopt;
    return a - b;
}

inline std::optional<uint64_t> mul(uint64_t a, uint64_t b) {
    if (a != 0 && b > U64_MAX / a) return std::nullopt;
    return a * b;
}

inline std::optional<uint64_t> div(uint64_t a, uint64_t b) {
    if (b == 0) return std::nullopt;
    return a / b;
}

// 10^n, representable for n <= 19
inline std::optional<uint64_t> pow10(uint32_t n) {
    if (n > 19) return std::nullopt;
    uint64_t r = 1;
    for (uint32_t i = 0; i < n; ++i) r *= 10;
    return r;
}

} // namespace checked

// =============================================================================
// Decimal Normalization
// =============================================================================

namespace decimals {

// Rescale a raw amount from `from` decimals to `to` decimals.
// Downscaling truncates; upscaling fails on overflow.
inline std::optional<uint64_t> normalize(uint64_t amount, uint8_t from, uint8_t to) {
    if (from == to) return amount;
    if (from > to) {
        auto scale = checked::pow10(static_cast<uint32_t>(from - to));
        if (!scale) return uint64_t{0};  // 10^20 and beyond exceeds any u64
        return amount / *scale;
    }
    auto scale = checked::pow10(static_cast<uint32_t>(to - from));
    if (!scale) {
        if (amount == 0) return uint64_t{0};
        return std::nullopt;
    }
    return checked::mul(amount, *scale);
}

} // namespace decimals

// =============================================================================
// Pricing
// =============================================================================

namespace pool_math {

constexpr uint64_t DEFAULT_BOOTSTRAP_LP = 1000000;       // 1.0 share token at 6 decimals
constexpr uint64_t DEFAULT_PRECISION_SCALE = 1000000000;  // 1e9

struct SwapQuote {
    int32_t status;
    uint64_t fee;
    uint64_t amount_in_after_fee;
    uint64_t amount_out;
    bool used_scaled_path;  // guarded math fell back to the precision-scaled formula
};

struct LiquidityQuote {
    int32_t status;
    bool bootstrap;
    uint64_t lp_for_a;
    uint64_t lp_for_b;
    uint64_t mint_amount;
};

struct WithdrawQuote {
    int32_t status;
    uint64_t amount_a;
    uint64_t amount_b;
};

// Live pool figures read once per operation
struct ReserveSnapshot {
    uint64_t reserve_a;
    uint64_t reserve_b;
    uint64_t share_supply;
    uint8_t decimals_a;
    uint8_t decimals_b;
    uint8_t share_decimals;
};

// floor(amount_in * fee_numerator / fee_denominator)
std::optional<uint64_t> compute_fee(uint64_t amount_in, uint64_t fee_numerator,
                                    uint64_t fee_denominator);

// floor(reserve_out * in / (reserve_in + in)); nullopt on any overflow
std::optional<uint64_t> swap_output_direct(uint64_t reserve_in, uint64_t reserve_out,
                                           uint64_t amount_in_after_fee);

// As above, but when reserve_out * in would overflow, computes
// ((in * scale) / (reserve_in + in)) * reserve_out / scale instead.
// `scaled` reports which path ran.
std::optional<uint64_t> swap_output_guarded(uint64_t reserve_in, uint64_t reserve_out,
                                            uint64_t amount_in_after_fee,
                                            uint64_t precision_scale, bool* scaled);

SwapQuote quote_swap(const PolicyConfig& policy, uint64_t fee_numerator,
                     uint64_t fee_denominator, uint64_t reserve_in,
                     uint64_t reserve_out, uint64_t amount_in,
                     uint64_t precision_scale = DEFAULT_PRECISION_SCALE);

LiquidityQuote quote_add_liquidity(const PolicyConfig& policy, const ReserveSnapshot& snap,
                                   uint64_t amount_a, uint64_t amount_b,
                                   uint64_t bootstrap_amount = DEFAULT_BOOTSTRAP_LP);

WithdrawQuote quote_remove_liquidity(const ReserveSnapshot& snap, uint64_t lp_amount);

// Product of reserves never decreases across a swap
inline bool constant_product_holds(uint64_t before_in, uint64_t before_out,
                                   uint64_t after_in, uint64_t after_out) {
    return static_cast<U128>(after_in) * after_out >=
           static_cast<U128>(before_in) * before_out;
}

} // namespace pool_math

} // namespace cpswap

#endif // CPSWAP_POOL_MATH_HPP

#ifndef CPSWAP_POLICY_HPP
#define CPSWAP_POLICY_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace cpswap {

// =============================================================================
// Engine Policies
//
// Two designs exist for LP issuance, fee routing, swap arithmetic and LP burn
// authority. Each knob is independent; naive() and hardened() are the two
// coherent presets.
// =============================================================================

// How share tokens are issued on deposit
enum class IssuancePolicy : uint8_t {
    NAIVE = 0,              // bootstrap when reserve A is empty, raw-unit ratios
    DECIMAL_NORMALIZED = 1  // bootstrap when both empty, ratios in share-token decimals
};

// Where the swap fee ends up
enum class FeeRouting : uint8_t {
    RETAIN_IN_RESERVE = 0,  // full amount_in enters the pool (LP revenue)
    SIDE_PAYMENT = 1        // fee paid to the pool's fee recipient (protocol revenue)
};

// Whose authority burns redeemed share tokens
enum class BurnAuthority : uint8_t {
    POOL = 0,   // pool signs; requires a delegation on the user's LP account
    OWNER = 1   // user signs for their own tokens
};

// Constant-product output computation
enum class SwapMath : uint8_t {
    DIRECT = 0,   // reserve_out * in / (reserve_in + in), overflow is an error
    GUARDED = 1   // zero-reserve check plus scaled fallback on product overflow
};

struct PolicyConfig {
    IssuancePolicy issuance = IssuancePolicy::DECIMAL_NORMALIZED;
    FeeRouting fee_routing = FeeRouting::SIDE_PAYMENT;
    BurnAuthority burn_authority = BurnAuthority::OWNER;
    SwapMath swap_math = SwapMath::GUARDED;

    static PolicyConfig naive() {
        PolicyConfig p;
        p.issuance = IssuancePolicy::NAIVE;
        p.fee_routing = FeeRouting::RETAIN_IN_RESERVE;
        p.burn_authority = BurnAuthority::POOL;
        p.swap_math = SwapMath::DIRECT;
        return p;
    }

    static PolicyConfig hardened() { return PolicyConfig{}; }

    bool operator==(const PolicyConfig& other) const {
        return issuance == other.issuance &&
               fee_routing == other.fee_routing &&
               burn_authority == other.burn_authority &&
               swap_math == other.swap_math;
    }
    bool operator!=(const PolicyConfig& other) const { return !(*this == other); }
};

// Name <-> enum (config files, logs)
const char* to_string(IssuancePolicy p);
const char* to_string(FeeRouting p);
const char* to_string(BurnAuthority p);
const char* to_string(SwapMath p);

std::optional<IssuancePolicy> parse_issuance_policy(std::string_view name);
std::optional<FeeRouting> parse_fee_routing(std::string_view name);
std::optional<BurnAuthority> parse_burn_authority(std::string_view name);
std::optional<SwapMath> parse_swap_math(std::string_view name);

} // namespace cpswap

#endif // CPSWAP_POLICY_HPP

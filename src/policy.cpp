// =============================================================================
// policy.cpp - Policy names
// =============================================================================

#include "cpswap/policy.hpp"

namespace cpswap {

const char* to_string(IssuancePolicy p) {
    switch (p) {
        case IssuancePolicy::NAIVE: return "naive";
        case IssuancePolicy::DECIMAL_NORMALIZED: return "decimal_normalized";
    }
    return "unknown";
}

const char* to_string(FeeRouting p) {
    switch (p) {
        case FeeRouting::RETAIN_IN_RESERVE: return "retain_in_reserve";
        case FeeRouting::SIDE_PAYMENT: return "side_payment";
    }
    return "unknown";
}

const char* to_string(BurnAuthority p) {
    switch (p) {
        case BurnAuthority::POOL: return "pool";
        case BurnAuthority::OWNER: return "owner";
    }
    return "unknown";
}

const char* to_string(SwapMath p) {
    switch (p) {
        case SwapMath::DIRECT: return "direct";
        case SwapMath::GUARDED: return "guarded";
    }
    return "unknown";
}

std::optional<IssuancePolicy> parse_issuance_policy(std::string_view name) {
    if (name == "naive") return IssuancePolicy::NAIVE;
    if (name == "decimal_normalized") return IssuancePolicy::DECIMAL_NORMALIZED;
    return std::nullopt;
}

std::optional<FeeRouting> parse_fee_routing(std::string_view name) {
    if (name == "retain_in_reserve") return FeeRouting::RETAIN_IN_RESERVE;
    if (name == "side_payment") return FeeRouting::SIDE_PAYMENT;
    return std::nullopt;
}

std::optional<BurnAuthority> parse_burn_authority(std::string_view name) {
    if (name == "pool") return BurnAuthority::POOL;
    if (name == "owner") return BurnAuthority::OWNER;
    return std::nullopt;
}

std::optional<SwapMath> parse_swap_math(std::string_view name) {
    if (name == "direct") return SwapMath::DIRECT;
    if (name == "guarded") return SwapMath::GUARDED;
    return std::nullopt;
}

} // namespace cpswap

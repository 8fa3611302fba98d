#ifndef CPSWAP_TYPES_HPP
#define CPSWAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <limits>

namespace cpswap {

// =============================================================================
// Identifiers (32-byte keys, zero = unset)
// =============================================================================

using Key = std::array<uint8_t, 32>;
using AccountId = Key;
using AssetId = Key;

using U128 = unsigned __int128;

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

inline bool is_zero(const Key& k) {
    for (uint8_t b : k) if (b != 0) return false;
    return true;
}

// Hash for unordered containers
struct KeyHash {
    size_t operator()(const Key& k) const {
        uint64_t h = 0;
        for (uint8_t b : k) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// Lowercase hex rendering
std::string to_hex(const Key& k);

// Deterministic key from a label ("alice", "usdc-mint", ...)
Key from_label(std::string_view label);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t SLIPPAGE_EXCEEDED = -1;
constexpr int32_t ARITHMETIC_OVERFLOW = -2;
constexpr int32_t INVALID_AMOUNT = -3;
constexpr int32_t POOL_NOT_INITIALIZED = -10;
constexpr int32_t POOL_ALREADY_INITIALIZED = -11;
constexpr int32_t INVALID_ASSET = -12;
constexpr int32_t INVALID_ACCOUNT = -13;
constexpr int32_t INSUFFICIENT_BALANCE = -20;
constexpr int32_t ACCOUNT_NOT_FOUND = -21;
constexpr int32_t MINT_NOT_FOUND = -22;
constexpr int32_t ACCOUNT_EXISTS = -23;
constexpr int32_t NO_TRANSACTION = -24;
constexpr int32_t UNAUTHORIZED = -40;

const char* message(int32_t code);
}

} // namespace cpswap

#endif // CPSWAP_TYPES_HPP

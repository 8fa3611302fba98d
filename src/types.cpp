// =============================================================================
// types.cpp - Identifier helpers and error strings
// =============================================================================

#include "cpswap/types.hpp"

namespace cpswap {

std::string to_hex(const Key& k) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(k.size() * 2);
    for (uint8_t b : k) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Key from_label(std::string_view label) {
    // FNV-1a over the label, one lane per 8-byte word
    Key key{};
    for (size_t lane = 0; lane < 4; ++lane) {
        uint64_t h = 0xcbf29ce484222325ULL ^ (lane * 0x9e3779b97f4a7c15ULL);
        for (char c : label) {
            h ^= static_cast<uint8_t>(c);
            h *= 0x100000001b3ULL;
        }
        for (size_t i = 0; i < 8; ++i) {
            key[lane * 8 + i] = static_cast<uint8_t>(h >> (56 - 8 * i));
        }
    }
    return key;
}

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case SLIPPAGE_EXCEEDED: return "slippage tolerance exceeded";
        case ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case INVALID_AMOUNT: return "invalid input amount";
        case POOL_NOT_INITIALIZED: return "pool not initialized";
        case POOL_ALREADY_INITIALIZED: return "pool already initialized";
        case INVALID_ASSET: return "invalid asset";
        case INVALID_ACCOUNT: return "invalid account";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case ACCOUNT_NOT_FOUND: return "account not found";
        case MINT_NOT_FOUND: return "mint not found";
        case ACCOUNT_EXISTS: return "account already exists";
        case NO_TRANSACTION: return "no open transaction";
        case UNAUTHORIZED: return "unauthorized";
        default: return "unknown error";
    }
}

} // namespace errors

} // namespace cpswap

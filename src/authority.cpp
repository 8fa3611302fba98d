// =============================================================================
// authority.cpp - Ledger-backed authorization and custody-address derivation
// =============================================================================

#include "cpswap/authority.hpp"
#include "cpswap/ledger.hpp"
#include "cpswap/pool.hpp"

namespace cpswap {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

inline uint64_t fnv_mix(uint64_t h, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= FNV_PRIME;
    }
    return h;
}

} // anonymous namespace

LedgerAuthorizer::LedgerAuthorizer(const IAssetLedger& ledger, std::string_view program_seed)
    : ledger_(ledger), program_id_(from_label(program_seed)) {}

AccountId LedgerAuthorizer::derive_address(const AssetId& asset_a, const AssetId& asset_b,
                                           uint8_t bump) const {
    static const uint8_t tag[] = {'p', 'o', 'o', 'l'};

    AccountId out{};
    for (size_t lane = 0; lane < 4; ++lane) {
        uint64_t h = FNV_OFFSET ^ (lane * 0x9e3779b97f4a7c15ULL);
        h = fnv_mix(h, program_id_.data(), program_id_.size());
        h = fnv_mix(h, tag, sizeof(tag));
        h = fnv_mix(h, asset_a.data(), asset_a.size());
        h = fnv_mix(h, asset_b.data(), asset_b.size());
        h = fnv_mix(h, &bump, 1);
        for (size_t i = 0; i < 8; ++i) {
            out[lane * 8 + i] = static_cast<uint8_t>(h >> (56 - 8 * i));
        }
    }
    return out;
}

std::optional<PoolAddress> LedgerAuthorizer::find_pool_address(const AssetId& asset_a,
                                                               const AssetId& asset_b) const {
    // Highest bump whose address is not already a ledger account
    for (int bump = 255; bump >= 0; --bump) {
        AccountId candidate = derive_address(asset_a, asset_b, static_cast<uint8_t>(bump));
        if (!ledger_.account_info(candidate)) {
            return PoolAddress{candidate, static_cast<uint8_t>(bump)};
        }
    }
    return std::nullopt;
}

std::optional<SigningAuthority> LedgerAuthorizer::pool_authority(const Pool& pool) const {
    AccountId derived = derive_address(pool.asset_a, pool.asset_b, pool.bump);
    if (derived != pool.address) return std::nullopt;
    return grant(derived);
}

std::optional<SigningAuthority> LedgerAuthorizer::user_authority(const AccountId& signer) const {
    if (is_zero(signer)) return std::nullopt;
    return grant(signer);
}

bool LedgerAuthorizer::controls(const AccountId& user, const AccountId& account) const {
    auto info = ledger_.account_info(account);
    return info && !is_zero(user) && info->owner == user;
}

} // namespace cpswap

#ifndef CPSWAP_AUTHORITY_HPP
#define CPSWAP_AUTHORITY_HPP

#include <optional>

#include "types.hpp"

namespace cpswap {

class IAssetLedger;
struct Pool;

// =============================================================================
// SigningAuthority - capability to act for an account on the ledger
//
// Only an authorizer can mint one; the engine passes it through to ledger
// mutators and never constructs custody keys itself.
// =============================================================================

class SigningAuthority {
public:
    const AccountId& key() const { return key_; }

private:
    explicit SigningAuthority(const AccountId& key) : key_(key) {}
    AccountId key_;

    friend class IAuthorizer;
};

struct PoolAddress {
    AccountId address;
    uint8_t bump;
};

// =============================================================================
// Authorizer Interface
// =============================================================================

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    // Deterministic custody address for an ordered asset pair
    virtual std::optional<PoolAddress> find_pool_address(const AssetId& asset_a,
                                                         const AssetId& asset_b) const = 0;

    // Reconstruct the pool's signing key from (asset_a, asset_b, bump);
    // nullopt if it does not match the pool's recorded address
    virtual std::optional<SigningAuthority> pool_authority(const Pool& pool) const = 0;

    // Authority of a transaction signer
    virtual std::optional<SigningAuthority> user_authority(const AccountId& signer) const = 0;

    // True if `user` controls `account`
    virtual bool controls(const AccountId& user, const AccountId& account) const = 0;

protected:
    static SigningAuthority grant(const AccountId& key) { return SigningAuthority(key); }
};

// =============================================================================
// LedgerAuthorizer - ownership checks against an IAssetLedger
// =============================================================================

class LedgerAuthorizer : public IAuthorizer {
public:
    explicit LedgerAuthorizer(const IAssetLedger& ledger, std::string_view program_seed = "cpswap");

    std::optional<PoolAddress> find_pool_address(const AssetId& asset_a,
                                                 const AssetId& asset_b) const override;
    std::optional<SigningAuthority> pool_authority(const Pool& pool) const override;
    std::optional<SigningAuthority> user_authority(const AccountId& signer) const override;
    bool controls(const AccountId& user, const AccountId& account) const override;

    // Hash of "pool" || asset_a || asset_b || bump under the program seed
    AccountId derive_address(const AssetId& asset_a, const AssetId& asset_b, uint8_t bump) const;

private:
    const IAssetLedger& ledger_;
    AccountId program_id_;
};

} // namespace cpswap

#endif // CPSWAP_AUTHORITY_HPP

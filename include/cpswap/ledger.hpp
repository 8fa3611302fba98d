#ifndef CPSWAP_LEDGER_HPP
#define CPSWAP_LEDGER_HPP

#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <thread>
#include <vector>

#include "types.hpp"

namespace cpswap {

// =============================================================================
// Ledger Records
// =============================================================================

struct MintInfo {
    uint8_t decimals;
    uint64_t supply;
    AccountId mint_authority;
};

struct TokenAccountInfo {
    AssetId mint;
    AccountId owner;
    AccountId delegate;   // zero = none
    uint64_t balance;
};

// =============================================================================
// Asset Ledger Interface
//
// Fungible-token primitives the pool engine moves value through. Every
// mutator either applies fully or returns an error and changes nothing.
// begin()/commit()/rollback() group several mutators into one atomic unit.
// Transactions nest strictly: commit() and rollback() close the innermost one.
// =============================================================================

class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    // Queries
    virtual std::optional<TokenAccountInfo> account_info(const AccountId& account) const = 0;
    virtual std::optional<MintInfo> mint_info(const AssetId& mint) const = 0;

    uint64_t balance(const AccountId& account) const {
        auto info = account_info(account);
        return info ? info->balance : 0;
    }
    uint64_t supply(const AssetId& mint) const {
        auto info = mint_info(mint);
        return info ? info->supply : 0;
    }

    // Mutators; `authority` must own (or be delegate of) the source account,
    // or be the mint authority for mint()
    virtual int32_t transfer(const AccountId& from, const AccountId& to,
                             uint64_t amount, const AccountId& authority) = 0;
    virtual int32_t mint(const AssetId& mint, const AccountId& to,
                         uint64_t amount, const AccountId& authority) = 0;
    virtual int32_t burn(const AssetId& mint, const AccountId& from,
                         uint64_t amount, const AccountId& authority) = 0;

    // Transactions (nestable)
    virtual void begin() = 0;
    virtual int32_t commit() = 0;
    virtual int32_t rollback() = 0;
};

// =============================================================================
// LedgerTransaction - rolls back on scope exit unless committed
// =============================================================================

class LedgerTransaction {
public:
    explicit LedgerTransaction(IAssetLedger& ledger) : ledger_(ledger) {
        ledger_.begin();
    }

    // Rolls back if still open; a failed rollback is logged, never thrown
    ~LedgerTransaction() noexcept;

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    int32_t commit() {
        if (!open_) return errors::NO_TRANSACTION;
        open_ = false;
        return ledger_.commit();
    }

private:
    IAssetLedger& ledger_;
    bool open_{true};
};

// =============================================================================
// AssetLedger - In-memory reference ledger with journaled transactions
//
// The thread that opens the outermost transaction owns the ledger until it
// commits or rolls back; mutators and begin() on other threads wait. Queries
// never wait.
// =============================================================================

class AssetLedger : public IAssetLedger {
public:
    AssetLedger();
    ~AssetLedger() override = default;

    // Non-copyable
    AssetLedger(const AssetLedger&) = delete;
    AssetLedger& operator=(const AssetLedger&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t create_mint(const AssetId& mint, uint8_t decimals, const AccountId& authority);
    int32_t set_mint_authority(const AssetId& mint, const AccountId& current_authority,
                               const AccountId& new_authority);
    int32_t create_account(const AccountId& account, const AssetId& mint, const AccountId& owner);
    int32_t approve(const AccountId& account, const AccountId& owner, const AccountId& delegate);
    int32_t revoke(const AccountId& account, const AccountId& owner);

    // =========================================================================
    // IAssetLedger
    // =========================================================================

    std::optional<TokenAccountInfo> account_info(const AccountId& account) const override;
    std::optional<MintInfo> mint_info(const AssetId& mint) const override;

    int32_t transfer(const AccountId& from, const AccountId& to,
                     uint64_t amount, const AccountId& authority) override;
    int32_t mint(const AssetId& mint, const AccountId& to,
                 uint64_t amount, const AccountId& authority) override;
    int32_t burn(const AssetId& mint, const AccountId& from,
                 uint64_t amount, const AccountId& authority) override;

    void begin() override;
    int32_t commit() override;
    int32_t rollback() override;

    size_t transaction_depth() const;

private:
    // Prior state of a record touched inside a transaction
    struct UndoEntry {
        bool is_mint;
        Key key;
        std::optional<TokenAccountInfo> account;
        std::optional<MintInfo> mint;
    };

    std::unordered_map<AccountId, TokenAccountInfo, KeyHash> accounts_;
    std::unordered_map<AssetId, MintInfo, KeyHash> mints_;
    std::vector<std::vector<UndoEntry>> journal_;  // one frame per open transaction
    mutable std::shared_mutex mutex_;

    // Writer gate: held by every mutator, owned across an open transaction
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    std::thread::id txn_owner_;

    // Waits until no other thread has a transaction open
    std::unique_lock<std::mutex> acquire_writer();
    void release_ownership();

    // Callers hold mutex_ exclusively
    void record_account(const AccountId& account);
    void record_mint(const AssetId& mint);
    static bool can_move(const TokenAccountInfo& info, const AccountId& authority);
};

} // namespace cpswap

#endif // CPSWAP_LEDGER_HPP

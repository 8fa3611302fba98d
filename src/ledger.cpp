// =============================================================================
// ledger.cpp - In-memory Asset Ledger
// =============================================================================

#include "cpswap/ledger.hpp"
#include "cpswap/log.hpp"
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>

namespace cpswap {

// =============================================================================
// LedgerTransaction
// =============================================================================

LedgerTransaction::~LedgerTransaction() noexcept {
    if (!open_) return;
    try {
        int32_t status = ledger_.rollback();
        if (status != errors::OK) {
            log::error(std::string("ledger rollback failed: ") + errors::message(status));
        }
    } catch (const std::system_error& e) {
        log::error(std::string("ledger rollback failed: ") + e.what());
    }
}

// =============================================================================
// AssetLedger
// =============================================================================

AssetLedger::AssetLedger() = default;

// =============================================================================
// Journal
// =============================================================================

void AssetLedger::record_account(const AccountId& account) {
    if (journal_.empty()) return;
    UndoEntry entry{false, account, std::nullopt, std::nullopt};
    auto it = accounts_.find(account);
    if (it != accounts_.end()) entry.account = it->second;
    journal_.back().push_back(std::move(entry));
}

void AssetLedger::record_mint(const AssetId& mint) {
    if (journal_.empty()) return;
    UndoEntry entry{true, mint, std::nullopt, std::nullopt};
    auto it = mints_.find(mint);
    if (it != mints_.end()) entry.mint = it->second;
    journal_.back().push_back(std::move(entry));
}

std::unique_lock<std::mutex> AssetLedger::acquire_writer() {
    std::unique_lock<std::mutex> gate(gate_mutex_);
    const auto self = std::this_thread::get_id();
    gate_cv_.wait(gate, [&] { return txn_owner_ == std::thread::id{} || txn_owner_ == self; });
    return gate;
}

void AssetLedger::begin() {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    txn_owner_ = std::this_thread::get_id();
    journal_.emplace_back();
}

int32_t AssetLedger::commit() {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    if (journal_.empty()) return errors::NO_TRANSACTION;

    std::vector<UndoEntry> frame = std::move(journal_.back());
    journal_.pop_back();

    // Nested commit: the enclosing transaction can still undo these changes
    if (!journal_.empty()) {
        auto& outer = journal_.back();
        outer.insert(outer.end(), std::make_move_iterator(frame.begin()),
                     std::make_move_iterator(frame.end()));
    } else {
        release_ownership();
    }
    return errors::OK;
}

int32_t AssetLedger::rollback() {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    if (journal_.empty()) return errors::NO_TRANSACTION;

    auto& frame = journal_.back();
    for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
        if (it->is_mint) {
            if (it->mint) mints_[it->key] = *it->mint;
            else mints_.erase(it->key);
        } else {
            if (it->account) accounts_[it->key] = *it->account;
            else accounts_.erase(it->key);
        }
    }
    journal_.pop_back();
    if (journal_.empty()) release_ownership();
    return errors::OK;
}

// Caller holds the writer gate
void AssetLedger::release_ownership() {
    txn_owner_ = std::thread::id{};
    gate_cv_.notify_all();
}

size_t AssetLedger::transaction_depth() const {
    std::shared_lock lock(mutex_);
    return journal_.size();
}

bool AssetLedger::can_move(const TokenAccountInfo& info, const AccountId& authority) {
    if (is_zero(authority)) return false;
    return info.owner == authority || (!is_zero(info.delegate) && info.delegate == authority);
}

// =============================================================================
// Administration
// =============================================================================

int32_t AssetLedger::create_mint(const AssetId& mint, uint8_t decimals, const AccountId& authority) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    if (mints_.find(mint) != mints_.end()) {
        return errors::ACCOUNT_EXISTS;
    }
    record_mint(mint);
    mints_[mint] = MintInfo{decimals, 0, authority};
    return errors::OK;
}

int32_t AssetLedger::set_mint_authority(const AssetId& mint, const AccountId& current_authority,
                                        const AccountId& new_authority) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    auto it = mints_.find(mint);
    if (it == mints_.end()) return errors::MINT_NOT_FOUND;
    if (it->second.mint_authority != current_authority) return errors::UNAUTHORIZED;

    record_mint(mint);
    it->second.mint_authority = new_authority;
    return errors::OK;
}

int32_t AssetLedger::create_account(const AccountId& account, const AssetId& mint,
                                    const AccountId& owner) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    if (mints_.find(mint) == mints_.end()) return errors::MINT_NOT_FOUND;
    if (accounts_.find(account) != accounts_.end()) return errors::ACCOUNT_EXISTS;

    record_account(account);
    accounts_[account] = TokenAccountInfo{mint, owner, AccountId{}, 0};
    return errors::OK;
}

int32_t AssetLedger::approve(const AccountId& account, const AccountId& owner,
                             const AccountId& delegate) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) return errors::ACCOUNT_NOT_FOUND;
    if (it->second.owner != owner) return errors::UNAUTHORIZED;

    record_account(account);
    it->second.delegate = delegate;
    return errors::OK;
}

int32_t AssetLedger::revoke(const AccountId& account, const AccountId& owner) {
    return approve(account, owner, AccountId{});
}

// =============================================================================
// Queries
// =============================================================================

std::optional<TokenAccountInfo> AssetLedger::account_info(const AccountId& account) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

std::optional<MintInfo> AssetLedger::mint_info(const AssetId& mint) const {
    std::shared_lock lock(mutex_);
    auto it = mints_.find(mint);
    if (it == mints_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Mutators
// =============================================================================

int32_t AssetLedger::transfer(const AccountId& from, const AccountId& to,
                              uint64_t amount, const AccountId& authority) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);

    auto from_it = accounts_.find(from);
    auto to_it = accounts_.find(to);
    if (from_it == accounts_.end() || to_it == accounts_.end()) {
        return errors::ACCOUNT_NOT_FOUND;
    }
    if (from_it->second.mint != to_it->second.mint) {
        return errors::INVALID_ACCOUNT;
    }
    if (!can_move(from_it->second, authority)) {
        return errors::UNAUTHORIZED;
    }
    if (from_it->second.balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (amount == 0 || from == to) {
        return errors::OK;
    }
    if (to_it->second.balance > U64_MAX - amount) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    record_account(from);
    record_account(to);
    from_it->second.balance -= amount;
    to_it->second.balance += amount;
    return errors::OK;
}

int32_t AssetLedger::mint(const AssetId& mint, const AccountId& to,
                          uint64_t amount, const AccountId& authority) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);

    auto mint_it = mints_.find(mint);
    if (mint_it == mints_.end()) return errors::MINT_NOT_FOUND;
    auto to_it = accounts_.find(to);
    if (to_it == accounts_.end()) return errors::ACCOUNT_NOT_FOUND;
    if (to_it->second.mint != mint) return errors::INVALID_ACCOUNT;
    if (is_zero(authority) || mint_it->second.mint_authority != authority) {
        return errors::UNAUTHORIZED;
    }
    if (amount == 0) return errors::OK;
    if (mint_it->second.supply > U64_MAX - amount ||
        to_it->second.balance > U64_MAX - amount) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    record_mint(mint);
    record_account(to);
    mint_it->second.supply += amount;
    to_it->second.balance += amount;
    return errors::OK;
}

int32_t AssetLedger::burn(const AssetId& mint, const AccountId& from,
                          uint64_t amount, const AccountId& authority) {
    auto gate = acquire_writer();
    std::unique_lock lock(mutex_);

    auto mint_it = mints_.find(mint);
    if (mint_it == mints_.end()) return errors::MINT_NOT_FOUND;
    auto from_it = accounts_.find(from);
    if (from_it == accounts_.end()) return errors::ACCOUNT_NOT_FOUND;
    if (from_it->second.mint != mint) return errors::INVALID_ACCOUNT;
    if (!can_move(from_it->second, authority)) return errors::UNAUTHORIZED;
    if (from_it->second.balance < amount) return errors::INSUFFICIENT_BALANCE;
    if (amount == 0) return errors::OK;

    record_mint(mint);
    record_account(from);
    from_it->second.balance -= amount;
    mint_it->second.supply -= amount;
    return errors::OK;
}

} // namespace cpswap

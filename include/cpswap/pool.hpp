#ifndef CPSWAP_POOL_HPP
#define CPSWAP_POOL_HPP

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "pool_math.hpp"

namespace cpswap {

class IAssetLedger;
class IAuthorizer;
class IEventSink;

// =============================================================================
// Pool Record
//
// Balances and share supply are never stored here; they are read from the
// ledger on every operation.
// =============================================================================

struct Pool {
    AccountId address;        // derived custody address (registry key)
    AssetId asset_a;
    AssetId asset_b;
    AccountId reserve_a;      // pool-owned custody accounts
    AccountId reserve_b;
    AssetId share_token;
    uint64_t fee_numerator;
    uint64_t fee_denominator;
    AccountId authority;        // pool creator
    AccountId fee_recipient_a;  // fee accounts under FeeRouting::SIDE_PAYMENT
    AccountId fee_recipient_b;
    uint8_t bump;
};

// =============================================================================
// Operation Parameters
// =============================================================================

struct InitializePoolParams {
    AccountId authority;
    AssetId asset_a;
    AssetId asset_b;
    AccountId reserve_a;
    AccountId reserve_b;
    AssetId share_token;
    uint64_t fee_numerator;
    uint64_t fee_denominator;
    AccountId fee_recipient_a;  // required for side-payment fee routing
    AccountId fee_recipient_b;
};

struct AddLiquidityParams {
    AccountId user;
    AccountId user_token_a;
    AccountId user_token_b;
    AccountId user_lp;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t min_lp_tokens;
};

// Direction is implied by which asset/reserve pair is designated "in"
struct SwapParams {
    AccountId user;
    AssetId asset_in;
    AssetId asset_out;
    AccountId user_token_in;
    AccountId user_token_out;
    AccountId pool_token_in;
    AccountId pool_token_out;
    uint64_t amount_in;
    uint64_t min_amount_out;
};

struct RemoveLiquidityParams {
    AccountId user;
    AccountId user_token_a;
    AccountId user_token_b;
    AccountId user_lp;
    uint64_t lp_amount;
    uint64_t min_amount_a;
    uint64_t min_amount_b;
};

// =============================================================================
// Operation Results (status == errors::OK on success)
// =============================================================================

struct InitializePoolResult {
    int32_t status;
    AccountId pool;
    uint8_t bump;
};

struct AddLiquidityResult {
    int32_t status;
    uint64_t lp_minted;
    uint64_t reserve_a;  // post-transaction
    uint64_t reserve_b;
};

struct SwapResult {
    int32_t status;
    uint64_t fee;
    uint64_t amount_in_after_fee;
    uint64_t amount_out;
    bool used_scaled_path;
};

struct RemoveLiquidityResult {
    int32_t status;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t reserve_a;  // post-transaction
    uint64_t reserve_b;
};

// =============================================================================
// PoolEngine - constant-product pool accounting
//
// Each operation reads one snapshot of reserves and supply, computes the
// outcome, validates it against the caller's floors, then applies every
// movement inside a single ledger transaction. Nothing moves on failure.
// Callers serialize operations against the same pool.
// =============================================================================

class PoolEngine {
public:
    PoolEngine(IAssetLedger& ledger, const IAuthorizer& authorizer, IEventSink& events,
               EngineConfig config = {});
    ~PoolEngine() = default;

    // Non-copyable
    PoolEngine(const PoolEngine&) = delete;
    PoolEngine& operator=(const PoolEngine&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    InitializePoolResult initialize_pool(const InitializePoolParams& params);

    AddLiquidityResult add_liquidity(const AccountId& pool, const AddLiquidityParams& params);

    SwapResult swap(const AccountId& pool, const SwapParams& params);

    RemoveLiquidityResult remove_liquidity(const AccountId& pool, const RemoveLiquidityParams& params);

    // =========================================================================
    // Read-only Quotes (same snapshot and math as the operations)
    // =========================================================================

    pool_math::SwapQuote quote_swap(const AccountId& pool, const AssetId& asset_in,
                                    uint64_t amount_in) const;
    pool_math::LiquidityQuote quote_add_liquidity(const AccountId& pool, uint64_t amount_a,
                                                  uint64_t amount_b) const;
    pool_math::WithdrawQuote quote_remove_liquidity(const AccountId& pool,
                                                    uint64_t lp_amount) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Pool> get_pool(const AccountId& pool) const;
    bool pool_exists(const AccountId& pool) const;
    std::vector<Pool> pools() const;

    // Live reserves / supply / decimals for a pool
    std::optional<pool_math::ReserveSnapshot> snapshot(const AccountId& pool) const;

    const EngineConfig& config() const { return config_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_adds;
        uint64_t total_liquidity_removes;
        uint64_t total_rejected;
    };
    Stats get_stats() const;

private:
    IAssetLedger& ledger_;
    const IAuthorizer& authorizer_;
    IEventSink& events_;
    EngineConfig config_;

    // Pool registry: address -> record
    std::unordered_map<AccountId, Pool, KeyHash> pools_;
    mutable std::shared_mutex pools_mutex_;

    // Statistics
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_adds_{0};
    std::atomic<uint64_t> total_liquidity_removes_{0};
    std::atomic<uint64_t> total_rejected_{0};

    // Internal helpers
    pool_math::ReserveSnapshot read_snapshot(const Pool& pool) const;
    int32_t check_user_account(const AccountId& user, const AccountId& account,
                               const AssetId& asset) const;
    int32_t reject(const char* op, int32_t status);
};

} // namespace cpswap

#endif // CPSWAP_POOL_HPP

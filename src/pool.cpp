// =============================================================================
// pool.cpp - PoolEngine: constant-product pool accounting
// Validate fully, then move value inside one ledger transaction.
// =============================================================================

#include "cpswap/pool.hpp"
#include "cpswap/authority.hpp"
#include "cpswap/events.hpp"
#include "cpswap/ledger.hpp"
#include "cpswap/log.hpp"
#include <mutex>
#include <string>
#include <utility>

namespace cpswap {

namespace {

inline std::string short_id(const Key& k) {
    return to_hex(k).substr(0, 8);
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolEngine::PoolEngine(IAssetLedger& ledger, const IAuthorizer& authorizer, IEventSink& events,
                       EngineConfig config)
    : ledger_(ledger), authorizer_(authorizer), events_(events), config_(std::move(config)) {}

// =============================================================================
// Internal Helpers
// =============================================================================

pool_math::ReserveSnapshot PoolEngine::read_snapshot(const Pool& pool) const {
    pool_math::ReserveSnapshot snap{};
    snap.reserve_a = ledger_.balance(pool.reserve_a);
    snap.reserve_b = ledger_.balance(pool.reserve_b);
    snap.share_supply = ledger_.supply(pool.share_token);

    auto mint_a = ledger_.mint_info(pool.asset_a);
    auto mint_b = ledger_.mint_info(pool.asset_b);
    auto mint_lp = ledger_.mint_info(pool.share_token);
    snap.decimals_a = mint_a ? mint_a->decimals : 0;
    snap.decimals_b = mint_b ? mint_b->decimals : 0;
    snap.share_decimals = mint_lp ? mint_lp->decimals : 0;
    return snap;
}

int32_t PoolEngine::check_user_account(const AccountId& user, const AccountId& account,
                                       const AssetId& asset) const {
    auto info = ledger_.account_info(account);
    if (!info) return errors::ACCOUNT_NOT_FOUND;
    if (info->mint != asset) return errors::INVALID_ACCOUNT;
    if (!authorizer_.controls(user, account)) return errors::UNAUTHORIZED;
    return errors::OK;
}

int32_t PoolEngine::reject(const char* op, int32_t status) {
    total_rejected_.fetch_add(1, std::memory_order_relaxed);
    if (log::enabled(log::Level::Debug)) {
        log::debug(std::string(op) + " rejected: " + errors::message(status));
    }
    return status;
}

// =============================================================================
// Initialize Pool
// =============================================================================

InitializePoolResult PoolEngine::initialize_pool(const InitializePoolParams& params) {
    InitializePoolResult result{errors::OK, AccountId{}, 0};

    // Validate: fee is a proper fraction
    if (params.fee_denominator == 0 || params.fee_numerator > params.fee_denominator) {
        result.status = reject("initialize_pool", errors::INVALID_AMOUNT);
        return result;
    }

    // Validate: two distinct assets plus a separate share token, all known
    if (is_zero(params.asset_a) || is_zero(params.asset_b) || params.asset_a == params.asset_b ||
        params.share_token == params.asset_a || params.share_token == params.asset_b) {
        result.status = reject("initialize_pool", errors::INVALID_ASSET);
        return result;
    }
    if (!ledger_.mint_info(params.asset_a) || !ledger_.mint_info(params.asset_b) ||
        !ledger_.mint_info(params.share_token)) {
        result.status = reject("initialize_pool", errors::MINT_NOT_FOUND);
        return result;
    }

    if (!authorizer_.user_authority(params.authority)) {
        result.status = reject("initialize_pool", errors::UNAUTHORIZED);
        return result;
    }

    auto derived = authorizer_.find_pool_address(params.asset_a, params.asset_b);
    if (!derived) {
        result.status = reject("initialize_pool", errors::INVALID_ACCOUNT);
        return result;
    }

    // Validate: reserves hold the right assets and are in pool custody
    auto reserve_ok = [&](const AccountId& account, const AssetId& asset) {
        auto info = ledger_.account_info(account);
        return info && info->mint == asset && info->owner == derived->address;
    };
    if (params.reserve_a == params.reserve_b ||
        !reserve_ok(params.reserve_a, params.asset_a) ||
        !reserve_ok(params.reserve_b, params.asset_b)) {
        result.status = reject("initialize_pool", errors::INVALID_ACCOUNT);
        return result;
    }

    // Validate: fee recipients exist for side-payment routing
    if (config_.policy.fee_routing == FeeRouting::SIDE_PAYMENT) {
        auto fee_a = ledger_.account_info(params.fee_recipient_a);
        auto fee_b = ledger_.account_info(params.fee_recipient_b);
        if (!fee_a || fee_a->mint != params.asset_a || !fee_b || fee_b->mint != params.asset_b) {
            result.status = reject("initialize_pool", errors::INVALID_ACCOUNT);
            return result;
        }
    }

    Pool pool{};
    pool.address = derived->address;
    pool.asset_a = params.asset_a;
    pool.asset_b = params.asset_b;
    pool.reserve_a = params.reserve_a;
    pool.reserve_b = params.reserve_b;
    pool.share_token = params.share_token;
    pool.fee_numerator = params.fee_numerator;
    pool.fee_denominator = params.fee_denominator;
    pool.authority = params.authority;
    pool.fee_recipient_a = params.fee_recipient_a;
    pool.fee_recipient_b = params.fee_recipient_b;
    pool.bump = derived->bump;

    {
        std::unique_lock lock(pools_mutex_);
        if (pools_.find(pool.address) != pools_.end()) {
            lock.unlock();
            result.status = reject("initialize_pool", errors::POOL_ALREADY_INITIALIZED);
            return result;
        }
        pools_[pool.address] = pool;
    }

    events_.emit(PoolCreated{
        pool.address, pool.asset_a, pool.asset_b,
        pool.fee_numerator, pool.fee_denominator,
        static_cast<double>(pool.fee_numerator) / static_cast<double>(pool.fee_denominator)
    });

    log::info("pool " + short_id(pool.address) + " created, fee " +
              std::to_string(pool.fee_numerator) + "/" + std::to_string(pool.fee_denominator));

    result.pool = pool.address;
    result.bump = pool.bump;
    return result;
}

// =============================================================================
// Add Liquidity
// =============================================================================

AddLiquidityResult PoolEngine::add_liquidity(const AccountId& pool_id,
                                             const AddLiquidityParams& params) {
    AddLiquidityResult result{errors::OK, 0, 0, 0};

    auto pool = get_pool(pool_id);
    if (!pool) {
        result.status = reject("add_liquidity", errors::POOL_NOT_INITIALIZED);
        return result;
    }

    auto user_auth = authorizer_.user_authority(params.user);
    if (!user_auth) {
        result.status = reject("add_liquidity", errors::UNAUTHORIZED);
        return result;
    }
    for (auto [account, asset] : {std::make_pair(params.user_token_a, pool->asset_a),
                                  std::make_pair(params.user_token_b, pool->asset_b),
                                  std::make_pair(params.user_lp, pool->share_token)}) {
        int32_t status = check_user_account(params.user, account, asset);
        if (status != errors::OK) {
            result.status = reject("add_liquidity", status);
            return result;
        }
    }

    auto pool_auth = authorizer_.pool_authority(*pool);
    if (!pool_auth) {
        result.status = reject("add_liquidity", errors::UNAUTHORIZED);
        return result;
    }

    // Price against one snapshot, enforce the floor, then act
    auto snap = read_snapshot(*pool);
    auto quote = pool_math::quote_add_liquidity(config_.policy, snap, params.amount_a,
                                                params.amount_b, config_.bootstrap_lp_amount);
    if (quote.status != errors::OK) {
        result.status = reject("add_liquidity", quote.status);
        return result;
    }
    if (quote.mint_amount < params.min_lp_tokens) {
        result.status = reject("add_liquidity", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    LedgerTransaction txn(ledger_);
    int32_t status = ledger_.transfer(params.user_token_a, pool->reserve_a,
                                      params.amount_a, user_auth->key());
    if (status == errors::OK) {
        status = ledger_.transfer(params.user_token_b, pool->reserve_b,
                                  params.amount_b, user_auth->key());
    }
    if (status == errors::OK) {
        status = ledger_.mint(pool->share_token, params.user_lp,
                              quote.mint_amount, pool_auth->key());
    }
    if (status == errors::OK) {
        status = txn.commit();
    }
    if (status != errors::OK) {
        result.status = reject("add_liquidity", status);
        return result;
    }

    result.lp_minted = quote.mint_amount;
    result.reserve_a = ledger_.balance(pool->reserve_a);
    result.reserve_b = ledger_.balance(pool->reserve_b);
    total_liquidity_adds_.fetch_add(1, std::memory_order_relaxed);

    events_.emit(LiquidityAdded{
        pool->address, params.user, params.amount_a, params.amount_b,
        result.lp_minted, result.reserve_a, result.reserve_b
    });

    log::info("pool " + short_id(pool->address) + " add_liquidity " +
              std::to_string(params.amount_a) + "/" + std::to_string(params.amount_b) +
              " minted " + std::to_string(result.lp_minted) +
              (quote.bootstrap ? " (bootstrap)" : ""));
    return result;
}

// =============================================================================
// Swap
// =============================================================================

SwapResult PoolEngine::swap(const AccountId& pool_id, const SwapParams& params) {
    SwapResult result{errors::OK, 0, 0, 0, false};

    auto pool = get_pool(pool_id);
    if (!pool) {
        result.status = reject("swap", errors::POOL_NOT_INITIALIZED);
        return result;
    }

    if (params.amount_in == 0 || params.asset_in == params.asset_out) {
        result.status = reject("swap", errors::INVALID_AMOUNT);
        return result;
    }

    // Resolve direction from the designated assets
    const bool a_to_b = params.asset_in == pool->asset_a && params.asset_out == pool->asset_b;
    const bool b_to_a = params.asset_in == pool->asset_b && params.asset_out == pool->asset_a;
    if (!a_to_b && !b_to_a) {
        result.status = reject("swap", errors::INVALID_ASSET);
        return result;
    }
    const AccountId& reserve_in = a_to_b ? pool->reserve_a : pool->reserve_b;
    const AccountId& reserve_out = a_to_b ? pool->reserve_b : pool->reserve_a;
    const AccountId& fee_recipient = a_to_b ? pool->fee_recipient_a : pool->fee_recipient_b;
    if (params.pool_token_in != reserve_in || params.pool_token_out != reserve_out) {
        result.status = reject("swap", errors::INVALID_ACCOUNT);
        return result;
    }

    auto user_auth = authorizer_.user_authority(params.user);
    if (!user_auth) {
        result.status = reject("swap", errors::UNAUTHORIZED);
        return result;
    }
    int32_t status = check_user_account(params.user, params.user_token_in, params.asset_in);
    if (status == errors::OK) {
        status = check_user_account(params.user, params.user_token_out, params.asset_out);
    }
    if (status != errors::OK) {
        result.status = reject("swap", status);
        return result;
    }

    auto pool_auth = authorizer_.pool_authority(*pool);
    if (!pool_auth) {
        result.status = reject("swap", errors::UNAUTHORIZED);
        return result;
    }

    // Snapshot and price
    const uint64_t balance_in = ledger_.balance(reserve_in);
    const uint64_t balance_out = ledger_.balance(reserve_out);
    auto quote = pool_math::quote_swap(config_.policy, pool->fee_numerator, pool->fee_denominator,
                                       balance_in, balance_out, params.amount_in,
                                       config_.precision_scale);
    if (quote.status != errors::OK) {
        result.status = reject("swap", quote.status);
        return result;
    }
    if (quote.amount_out < params.min_amount_out) {
        result.status = reject("swap", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    LedgerTransaction txn(ledger_);
    if (config_.policy.fee_routing == FeeRouting::SIDE_PAYMENT) {
        // Fee goes to the fee recipient, only the net amount enters the reserve
        status = errors::OK;
        if (quote.fee > 0) {
            status = ledger_.transfer(params.user_token_in, fee_recipient, quote.fee, user_auth->key());
        }
        if (status == errors::OK) {
            status = ledger_.transfer(params.user_token_in, reserve_in,
                                      quote.amount_in_after_fee, user_auth->key());
        }
    } else {
        // Fee stays in the reserve
        status = ledger_.transfer(params.user_token_in, reserve_in,
                                  params.amount_in, user_auth->key());
    }
    if (status == errors::OK) {
        status = ledger_.transfer(reserve_out, params.user_token_out,
                                  quote.amount_out, pool_auth->key());
    }
    if (status == errors::OK) {
        status = txn.commit();
    }
    if (status != errors::OK) {
        result.status = reject("swap", status);
        return result;
    }

    result.fee = quote.fee;
    result.amount_in_after_fee = quote.amount_in_after_fee;
    result.amount_out = quote.amount_out;
    result.used_scaled_path = quote.used_scaled_path;
    total_swaps_.fetch_add(1, std::memory_order_relaxed);

    events_.emit(SwapExecuted{
        pool->address, params.user, params.asset_in, params.asset_out,
        params.amount_in, result.amount_out, result.fee
    });

    log::info("pool " + short_id(pool->address) + " swap " +
              std::to_string(params.amount_in) + " -> " + std::to_string(result.amount_out) +
              " fee " + std::to_string(result.fee) +
              (result.used_scaled_path ? " (scaled)" : ""));
    return result;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

RemoveLiquidityResult PoolEngine::remove_liquidity(const AccountId& pool_id,
                                                   const RemoveLiquidityParams& params) {
    RemoveLiquidityResult result{errors::OK, 0, 0, 0, 0};

    auto pool = get_pool(pool_id);
    if (!pool) {
        result.status = reject("remove_liquidity", errors::POOL_NOT_INITIALIZED);
        return result;
    }

    if (params.lp_amount == 0) {
        result.status = reject("remove_liquidity", errors::INVALID_AMOUNT);
        return result;
    }

    auto user_auth = authorizer_.user_authority(params.user);
    if (!user_auth) {
        result.status = reject("remove_liquidity", errors::UNAUTHORIZED);
        return result;
    }
    for (auto [account, asset] : {std::make_pair(params.user_token_a, pool->asset_a),
                                  std::make_pair(params.user_token_b, pool->asset_b),
                                  std::make_pair(params.user_lp, pool->share_token)}) {
        int32_t status = check_user_account(params.user, account, asset);
        if (status != errors::OK) {
            result.status = reject("remove_liquidity", status);
            return result;
        }
    }

    auto pool_auth = authorizer_.pool_authority(*pool);
    if (!pool_auth) {
        result.status = reject("remove_liquidity", errors::UNAUTHORIZED);
        return result;
    }

    auto snap = read_snapshot(*pool);
    auto quote = pool_math::quote_remove_liquidity(snap, params.lp_amount);
    if (quote.status != errors::OK) {
        result.status = reject("remove_liquidity", quote.status);
        return result;
    }
    if (quote.amount_a < params.min_amount_a || quote.amount_b < params.min_amount_b) {
        result.status = reject("remove_liquidity", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    const AccountId& burn_authority =
        config_.policy.burn_authority == BurnAuthority::POOL ? pool_auth->key() : user_auth->key();

    LedgerTransaction txn(ledger_);
    int32_t status = ledger_.transfer(pool->reserve_a, params.user_token_a,
                                      quote.amount_a, pool_auth->key());
    if (status == errors::OK) {
        status = ledger_.transfer(pool->reserve_b, params.user_token_b,
                                  quote.amount_b, pool_auth->key());
    }
    if (status == errors::OK) {
        status = ledger_.burn(pool->share_token, params.user_lp, params.lp_amount, burn_authority);
    }
    if (status == errors::OK) {
        status = txn.commit();
    }
    if (status != errors::OK) {
        result.status = reject("remove_liquidity", status);
        return result;
    }

    result.amount_a = quote.amount_a;
    result.amount_b = quote.amount_b;
    result.reserve_a = ledger_.balance(pool->reserve_a);
    result.reserve_b = ledger_.balance(pool->reserve_b);
    total_liquidity_removes_.fetch_add(1, std::memory_order_relaxed);

    events_.emit(LiquidityRemoved{
        pool->address, params.user, result.amount_a, result.amount_b,
        params.lp_amount, result.reserve_a, result.reserve_b
    });

    log::info("pool " + short_id(pool->address) + " remove_liquidity " +
              std::to_string(params.lp_amount) + " -> " +
              std::to_string(result.amount_a) + "/" + std::to_string(result.amount_b));
    return result;
}

// =============================================================================
// Quotes
// =============================================================================

pool_math::SwapQuote PoolEngine::quote_swap(const AccountId& pool_id, const AssetId& asset_in,
                                            uint64_t amount_in) const {
    pool_math::SwapQuote quote{errors::OK, 0, 0, 0, false};

    auto pool = get_pool(pool_id);
    if (!pool) {
        quote.status = errors::POOL_NOT_INITIALIZED;
        return quote;
    }
    if (asset_in != pool->asset_a && asset_in != pool->asset_b) {
        quote.status = errors::INVALID_ASSET;
        return quote;
    }

    const bool a_to_b = asset_in == pool->asset_a;
    const uint64_t balance_in = ledger_.balance(a_to_b ? pool->reserve_a : pool->reserve_b);
    const uint64_t balance_out = ledger_.balance(a_to_b ? pool->reserve_b : pool->reserve_a);
    return pool_math::quote_swap(config_.policy, pool->fee_numerator, pool->fee_denominator,
                                 balance_in, balance_out, amount_in, config_.precision_scale);
}

pool_math::LiquidityQuote PoolEngine::quote_add_liquidity(const AccountId& pool_id,
                                                          uint64_t amount_a,
                                                          uint64_t amount_b) const {
    auto pool = get_pool(pool_id);
    if (!pool) {
        return pool_math::LiquidityQuote{errors::POOL_NOT_INITIALIZED, false, 0, 0, 0};
    }
    return pool_math::quote_add_liquidity(config_.policy, read_snapshot(*pool), amount_a,
                                          amount_b, config_.bootstrap_lp_amount);
}

pool_math::WithdrawQuote PoolEngine::quote_remove_liquidity(const AccountId& pool_id,
                                                            uint64_t lp_amount) const {
    auto pool = get_pool(pool_id);
    if (!pool) {
        return pool_math::WithdrawQuote{errors::POOL_NOT_INITIALIZED, 0, 0};
    }
    return pool_math::quote_remove_liquidity(read_snapshot(*pool), lp_amount);
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Pool> PoolEngine::get_pool(const AccountId& pool_id) const {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

bool PoolEngine::pool_exists(const AccountId& pool_id) const {
    std::shared_lock lock(pools_mutex_);
    return pools_.find(pool_id) != pools_.end();
}

std::vector<Pool> PoolEngine::pools() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<Pool> out;
    out.reserve(pools_.size());
    for (const auto& [address, pool] : pools_) {
        out.push_back(pool);
    }
    return out;
}

std::optional<pool_math::ReserveSnapshot> PoolEngine::snapshot(const AccountId& pool_id) const {
    auto pool = get_pool(pool_id);
    if (!pool) return std::nullopt;
    return read_snapshot(*pool);
}

PoolEngine::Stats PoolEngine::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(pools_mutex_);
        stats.total_pools = pools_.size();
    }
    stats.total_swaps = total_swaps_.load(std::memory_order_relaxed);
    stats.total_liquidity_adds = total_liquidity_adds_.load(std::memory_order_relaxed);
    stats.total_liquidity_removes = total_liquidity_removes_.load(std::memory_order_relaxed);
    stats.total_rejected = total_rejected_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace cpswap

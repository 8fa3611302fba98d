#ifndef CPSWAP_CPSWAP_HPP
#define CPSWAP_CPSWAP_HPP

// =============================================================================
// cpswap - Constant-Product Pool Accounting
//
// Components:
//   PoolEngine        initialize / add liquidity / swap / remove liquidity
//   IAssetLedger      balances, supplies, atomic transfer/mint/burn
//   IAuthorizer       custody-address derivation and signing capabilities
//   IEventSink        ordered domain events
//
// =============================================================================

#include "types.hpp"
#include "policy.hpp"
#include "pool_math.hpp"
#include "config.hpp"
#include "log.hpp"
#include "ledger.hpp"
#include "authority.hpp"
#include "events.hpp"
#include "pool.hpp"

#endif // CPSWAP_CPSWAP_HPP

#ifndef CLAMM_CLAMM_HPP
#define CLAMM_CLAMM_HPP

// =============================================================================
// clamm - Concentrated Liquidity AMM with Flash Accounting
//
//   tick_math        tick <-> Q128.128 sqrt ratio
//   liquidity_math   liquidity <-> token amounts
//   swap_math        fees and single swap steps
//   TickBitmap       initialized tick search
//   JournaledMap     undoable writes for aborted operations
//   Pool             ticks, positions, fee growth
//   FlashAccountant  lock stack and debt settlement
//   Extensions       hook registry and dispatch
//   Core             the engine entry point
//
// =============================================================================

#include "types.hpp"
#include "error.hpp"
#include "uint256.hpp"
#include "tick_math.hpp"
#include "liquidity_math.hpp"
#include "swap_math.hpp"
#include "tick_bitmap.hpp"
#include "journal.hpp"
#include "pool.hpp"
#include "token_ledger.hpp"
#include "flash_accountant.hpp"
#include "locker.hpp"
#include "extension.hpp"
#include "config.hpp"
#include "log.hpp"
#include "core.hpp"

#endif // CLAMM_CLAMM_HPP

#ifndef CLAMM_CORE_HPP
#define CLAMM_CORE_HPP

#include <map>
#include <optional>
#include <tuple>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"
#include "config.hpp"
#include "log.hpp"
#include "pool.hpp"
#include "token_ledger.hpp"
#include "flash_accountant.hpp"
#include "locker.hpp"
#include "extension.hpp"
#include "journal.hpp"

namespace clamm {

// =============================================================================
// Operation Results
// =============================================================================

struct SwapResult {
    BalanceDelta delta;       // Positive = owed by the locker
    PoolState state;          // Pool state after the swap
};

struct UpdatePositionResult {
    BalanceDelta delta;       // Principal, net of the withdrawal fee
    U128 fees0;               // Uncollected fees accrued by the position
    U128 fees1;
};

struct FeesCollected {
    U128 amount0;
    U128 amount1;
};

struct SavedBalance {
    U128 amount0;
    U128 amount1;
};

// =============================================================================
// Core - pools, positions and flash accounting behind one entry point
// =============================================================================
//
// Pool operations and token movements are only valid inside lock(). Each lock
// must end with every token debt of its context at zero. Any failure inside a
// lock discards every state change made since the outermost entry, including
// failures a locker catches itself.

class Core {
public:
    // Throws std::invalid_argument if the config does not validate
    explicit Core(Config config = Config());
    ~Core();

    // Non-copyable
    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    // =========================================================================
    // Extensions
    // =========================================================================

    void register_extension(IExtension& extension, const CallPoints& call_points);
    bool is_extension_registered(const Address& address) const;

    // =========================================================================
    // Pools
    // =========================================================================

    // Create a pool at `tick`. Returns its sqrt ratio.
    U256 initialize_pool(const PoolKey& key, int32_t tick);

    // =========================================================================
    // Flash Accounting
    // =========================================================================

    // Run `locker` under a new lock context. Throws CoreError(DEBTS_NOT_ZEROED)
    // if the context does not settle and CoreError(OPERATION_ABORTED) if an
    // operation inside it failed.
    Bytes lock(ILocker& locker, const Bytes& data = {});

    // Hand control to `target` inside the current lock; its debts settle in
    // the forwarding context
    Bytes forward(IForwardee& target, const Bytes& data = {});

    // Send `amount` of the engine's tokens to `recipient`; the locker owes it
    void withdraw(const Token& token, const Address& recipient, U128 amount);

    // Pull `amount` from the locker to settle debt
    void pay(const Token& token, U128 amount);

    // Pull `amount` from `from` (allowance to the locker required)
    void pay_from(const Address& from, const Token& token, U128 amount);

    // =========================================================================
    // Pool Operations (inside a lock)
    // =========================================================================

    SwapResult swap(const PoolKey& key, const SwapParams& params);

    UpdatePositionResult update_position(const PoolKey& key, const UpdatePositionParams& params);

    FeesCollected collect_fees(const PoolKey& key, uint64_t salt,
                               int32_t tick_lower, int32_t tick_upper);

    // Pool extension only: donate amounts to in-range liquidity
    void accumulate_as_fees(const PoolKey& key, U128 amount0, U128 amount1);

    // Positive deltas save (locker owes), negative deltas load (locker is credited)
    void update_saved_balances(const Token& token0, const Token& token1, uint64_t salt,
                               I128 delta0, I128 delta1);

    // =========================================================================
    // Protocol Fees
    // =========================================================================

    // Owner only. Throws CoreError(UNAUTHORIZED) or CoreError(INSUFFICIENT_BALANCE).
    void withdraw_protocol_fees(const Address& caller, const Address& recipient,
                                const Token& token, U128 amount);

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<PoolState> get_pool_state(const PoolKey& key) const;
    std::optional<TickInfo> get_tick_info(const PoolKey& key, int32_t tick) const;
    std::vector<int32_t> get_initialized_ticks(const PoolKey& key) const;
    std::optional<Position> get_position(const PoolKey& key, const Address& owner, uint64_t salt,
                                         int32_t tick_lower, int32_t tick_upper) const;
    FeesPerLiquidity get_fees_per_liquidity_inside(const PoolKey& key, int32_t tick_lower,
                                                   int32_t tick_upper) const;
    SavedBalance get_saved_balances(const Address& owner, const Token& token0, const Token& token1,
                                    uint64_t salt) const;
    U128 get_protocol_fees(const Token& token) const;

    TokenLedger& tokens() { return state_.tokens; }
    const TokenLedger& tokens() const { return state_.tokens; }
    const FlashAccountant& accountant() const { return accountant_; }
    const Address& address() const { return config_.core_address; }
    const Config& config() const { return config_; }
    Logger& logger() { return logger_; }

private:
    using SavedBalanceKey = std::tuple<Address, Token, Token, uint64_t>;

    // Everything an aborted operation rolls back. Each part journals its
    // own writes between begin_journal() and commit/rollback.
    struct CoreState {
        PoolRegistry pools;
        ExtensionDispatcher extensions;
        TokenLedger tokens;
        JournaledMap<std::map<SavedBalanceKey, SavedBalance>> saved_balances;
        JournaledMap<std::map<Token, U128>> protocol_fees;

        void begin_journal();
        void commit_journal();
        void rollback_journal();
    };

    class EntryScope;
    class FrameGuard;

    const Address& current_locker() const { return accountant_.current().locker; }
    void validate_bounds(const PoolKey& key, int32_t tick_lower, int32_t tick_upper) const;
    // Throws CoreError(AMOUNT_OVERFLOW) past U128
    void add_protocol_fees(const Token& token, U128 amount);
    TickBitmap::SearchResult next_tick(const Pool& pool, int32_t from, bool increasing,
                                       uint32_t skip_ahead) const;

    Config config_;
    Logger logger_;
    CoreState state_;
    FlashAccountant accountant_;
    uint32_t entry_depth_ = 0;
    bool aborted_ = false;
};

} // namespace clamm

#endif // CLAMM_CORE_HPP

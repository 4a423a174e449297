// =============================================================================
// core.cpp - Core entry points, positions and flash accounting
// =============================================================================

#include "clamm/core.hpp"
#include "clamm/error.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/swap_math.hpp"
#include "clamm/tick_math.hpp"
#include "entry_scope.hpp"

#include <string>
#include <utility>

namespace clamm {

namespace {

inline I128 to_debt(U128 amount) {
    if (amount > static_cast<U128>(I128_MAX)) {
        throw CoreError(errors::AMOUNT_OVERFLOW, u128_to_string(amount));
    }
    return static_cast<I128>(amount);
}

inline U128 magnitude(I128 amount) {
    return amount >= 0 ? static_cast<U128>(amount) : U128(0) - static_cast<U128>(amount);
}

inline const Config& validated(const Config& config) {
    config.validate();
    return config;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Core::Core(Config config)
    : config_(validated(config))
    , logger_(parse_log_level(config_.log_level))
    , accountant_(config_.max_lock_depth) {}

Core::~Core() = default;

void Core::CoreState::begin_journal() {
    pools.begin_journal();
    extensions.begin_journal();
    tokens.begin_journal();
    saved_balances.begin_journal();
    protocol_fees.begin_journal();
}

void Core::CoreState::commit_journal() {
    pools.commit_journal();
    extensions.commit_journal();
    tokens.commit_journal();
    saved_balances.commit_journal();
    protocol_fees.commit_journal();
}

void Core::CoreState::rollback_journal() {
    pools.rollback_journal();
    extensions.rollback_journal();
    tokens.rollback_journal();
    saved_balances.rollback_journal();
    protocol_fees.rollback_journal();
}

// =============================================================================
// Extensions
// =============================================================================

void Core::register_extension(IExtension& extension, const CallPoints& call_points) {
    EntryScope scope(*this);
    state_.extensions.register_extension(extension, call_points);
    logger_.info("registered extension ", addresses::to_hex(extension.address()),
                 " call points ", static_cast<int>(call_points.to_mask()));
    scope.commit();
}

bool Core::is_extension_registered(const Address& address) const {
    return state_.extensions.is_registered(address);
}

// =============================================================================
// Pools
// =============================================================================

U256 Core::initialize_pool(const PoolKey& key, int32_t tick) {
    EntryScope scope(*this);

    if (!(key.token0 < key.token1)) {
        throw CoreError(errors::TOKENS_MUST_BE_SORTED);
    }
    if (key.tick_spacing > tick_math::MAX_TICK_SPACING) {
        throw CoreError(errors::INVALID_TICK_SPACING, std::to_string(key.tick_spacing));
    }
    if (!addresses::is_zero(key.extension) && !state_.extensions.is_registered(key.extension)) {
        throw CoreError(errors::EXTENSION_NOT_REGISTERED, addresses::to_hex(key.extension));
    }
    if (state_.pools.contains(key)) {
        throw CoreError(errors::POOL_ALREADY_INITIALIZED);
    }
    U256 sqrt_ratio = tick_math::tick_to_sqrt_ratio(tick);

    Address caller = accountant_.is_locked() ? current_locker() : Address{};
    state_.extensions.before_initialize_pool(caller, key, tick);

    state_.pools.create(key, PoolState{sqrt_ratio, tick, 0});

    state_.extensions.after_initialize_pool(caller, key, tick, sqrt_ratio);

    logger_.info("initialized pool ", key.id(), " at tick ", tick);
    scope.commit();
    return sqrt_ratio;
}

void Core::validate_bounds(const PoolKey& key, int32_t tick_lower, int32_t tick_upper) const {
    if (key.tick_spacing == tick_math::FULL_RANGE_ONLY_TICK_SPACING) {
        if (tick_lower != tick_math::MIN_TICK || tick_upper != tick_math::MAX_TICK) {
            throw CoreError(errors::INVALID_TICK_RANGE, "full-range-only pool");
        }
        return;
    }
    if (tick_lower >= tick_upper) {
        throw CoreError(errors::INVALID_TICK_RANGE, "lower must be below upper");
    }
    if (tick_lower < tick_math::MIN_TICK || tick_upper > tick_math::MAX_TICK) {
        throw CoreError(errors::INVALID_TICK_RANGE, "bounds outside tick range");
    }
    int32_t spacing = static_cast<int32_t>(key.tick_spacing);
    if (tick_lower % spacing != 0 || tick_upper % spacing != 0) {
        throw CoreError(errors::INVALID_TICK_RANGE, "bounds not aligned to spacing");
    }
}

// =============================================================================
// Lock / Forward
// =============================================================================

Bytes Core::lock(ILocker& locker, const Bytes& data) {
    EntryScope scope(*this);

    uint32_t id = accountant_.open_lock(locker.address());
    FrameGuard frame(accountant_);
    logger_.trace("lock ", id, " opened by ", addresses::to_hex(locker.address()));

    Bytes result = locker.locked(id, data);

    if (aborted_) {
        throw CoreError(errors::OPERATION_ABORTED, "lock " + std::to_string(id));
    }

    // close_lock pops the frame even when settlement fails
    frame.release();
    accountant_.close_lock();

    logger_.trace("lock ", id, " settled");
    scope.commit();
    return result;
}

Bytes Core::forward(IForwardee& target, const Bytes& data) {
    EntryScope scope(*this);

    const LockFrame& parent = accountant_.current();
    Address original_locker = parent.locker;
    uint32_t debt_id = parent.debt_id;

    accountant_.begin_forward(target.address());
    FrameGuard frame(accountant_);

    Bytes result = target.forwarded(debt_id, original_locker, data);

    frame.release();
    accountant_.end_forward();
    scope.commit();
    return result;
}

void Core::withdraw(const Token& token, const Address& recipient, U128 amount) {
    EntryScope scope(*this);
    accountant_.account_debt(token, to_debt(amount));
    state_.tokens.transfer(token, config_.core_address, recipient, amount);
    scope.commit();
}

void Core::pay(const Token& token, U128 amount) {
    EntryScope scope(*this);
    Address payer = current_locker();
    state_.tokens.transfer(token, payer, config_.core_address, amount);
    accountant_.account_debt(token, -to_debt(amount));
    scope.commit();
}

void Core::pay_from(const Address& from, const Token& token, U128 amount) {
    EntryScope scope(*this);
    Address spender = current_locker();
    state_.tokens.transfer_from(token, spender, from, config_.core_address, amount);
    accountant_.account_debt(token, -to_debt(amount));
    scope.commit();
}

// =============================================================================
// Positions
// =============================================================================

UpdatePositionResult Core::update_position(const PoolKey& key, const UpdatePositionParams& params) {
    EntryScope scope(*this);

    Address locker = current_locker();
    PoolId id = key.id();
    if (!state_.pools.contains(key)) {
        throw CoreError(errors::POOL_NOT_INITIALIZED);
    }
    validate_bounds(key, params.tick_lower, params.tick_upper);

    state_.extensions.before_update_position(locker, key, params);

    Pool& pool = state_.pools.mutable_pool(key);
    PositionKey position_key{locker, params.salt, params.tick_lower, params.tick_upper};

    auto existing = pool.positions.find(position_key);
    Position position = existing != pool.positions.end() ? existing->second : Position{};

    if (params.liquidity_delta < 0 && magnitude(params.liquidity_delta) > position.liquidity) {
        throw CoreError(errors::INSUFFICIENT_LIQUIDITY,
                        "position holds " + u128_to_string(position.liquidity));
    }

    U256 sqrt_lower = tick_math::tick_to_sqrt_ratio(params.tick_lower);
    U256 sqrt_upper = tick_math::tick_to_sqrt_ratio(params.tick_upper);
    BalanceDelta delta = liquidity_math::liquidity_delta_to_amount_delta(
        pool.state.sqrt_ratio, params.liquidity_delta, sqrt_lower, sqrt_upper);

    if (params.liquidity_delta != 0) {
        U128 max_per_tick = liquidity_math::max_liquidity_per_tick(key.tick_spacing);
        pool.update_tick(params.tick_lower, params.liquidity_delta, false, max_per_tick);
        pool.update_tick(params.tick_upper, params.liquidity_delta, true, max_per_tick);

        if (pool.state.tick >= params.tick_lower && pool.state.tick < params.tick_upper) {
            pool.state.liquidity = liquidity_math::add_delta(pool.state.liquidity,
                                                             params.liquidity_delta);
        }
    }

    // Fees stay embedded in the checkpoint until collect_fees
    FeesPerLiquidity inside = pool.fees_inside(params.tick_lower, params.tick_upper);
    auto [fees0, fees1] = position.fees(inside);
    U128 liquidity_next = liquidity_math::add_delta(position.liquidity, params.liquidity_delta);

    if (liquidity_next == 0) {
        if (fees0 != 0 || fees1 != 0) {
            throw CoreError(errors::MUST_COLLECT_FEES_BEFORE_WITHDRAWING_ALL_LIQUIDITY);
        }
        pool.positions.erase(position_key);
    } else {
        position.liquidity = liquidity_next;
        position.fees_per_liquidity_inside_last =
            inside - FeesPerLiquidity::from_amounts(fees0, fees1, liquidity_next);
        pool.positions[position_key] = position;
    }

    if (params.liquidity_delta < 0) {
        pool.prune_tick(params.tick_lower);
        pool.prune_tick(params.tick_upper);

        // Withdrawal fee at the pool rate, kept as protocol revenue
        U128 withdrawal_fee0 = swap_math::compute_fee(magnitude(delta.amount0), key.fee);
        U128 withdrawal_fee1 = swap_math::compute_fee(magnitude(delta.amount1), key.fee);
        if (withdrawal_fee0 != 0) {
            add_protocol_fees(key.token0, withdrawal_fee0);
            delta.amount0 += static_cast<I128>(withdrawal_fee0);
        }
        if (withdrawal_fee1 != 0) {
            add_protocol_fees(key.token1, withdrawal_fee1);
            delta.amount1 += static_cast<I128>(withdrawal_fee1);
        }
    }

    accountant_.account_debt(key.token0, delta.amount0);
    accountant_.account_debt(key.token1, delta.amount1);

    state_.extensions.after_update_position(locker, key, params, delta);

    logger_.debug("update_position pool ", id,
                  " [", params.tick_lower, ", ", params.tick_upper, ")",
                  " liquidity_delta ", i128_to_string(params.liquidity_delta),
                  " delta ", i128_to_string(delta.amount0), "/", i128_to_string(delta.amount1));
    scope.commit();
    return UpdatePositionResult{delta, fees0, fees1};
}

FeesCollected Core::collect_fees(const PoolKey& key, uint64_t salt,
                                 int32_t tick_lower, int32_t tick_upper) {
    EntryScope scope(*this);

    Address locker = current_locker();
    PoolId id = key.id();
    if (!state_.pools.contains(key)) {
        throw CoreError(errors::POOL_NOT_INITIALIZED);
    }
    validate_bounds(key, tick_lower, tick_upper);

    state_.extensions.before_collect_fees(locker, key, salt, tick_lower, tick_upper);

    Pool& pool = state_.pools.mutable_pool(key);
    PositionKey position_key{locker, salt, tick_lower, tick_upper};

    FeesCollected collected{0, 0};
    auto it = pool.positions.find(position_key);
    if (it != pool.positions.end()) {
        FeesPerLiquidity inside = pool.fees_inside(tick_lower, tick_upper);
        auto [fees0, fees1] = it->second.fees(inside);
        it->second.fees_per_liquidity_inside_last = inside;
        collected = FeesCollected{fees0, fees1};
    }

    accountant_.account_debt(key.token0, -to_debt(collected.amount0));
    accountant_.account_debt(key.token1, -to_debt(collected.amount1));

    state_.extensions.after_collect_fees(locker, key, salt, tick_lower, tick_upper,
                                         collected.amount0, collected.amount1);

    logger_.debug("collect_fees pool ", id, " ", u128_to_string(collected.amount0), "/",
                  u128_to_string(collected.amount1));
    scope.commit();
    return collected;
}

void Core::accumulate_as_fees(const PoolKey& key, U128 amount0, U128 amount1) {
    EntryScope scope(*this);

    Address locker = current_locker();
    if (addresses::is_zero(key.extension) || locker != key.extension) {
        throw CoreError(errors::UNAUTHORIZED, "only the pool extension may accumulate fees");
    }

    Pool& pool = state_.pools.mutable_pool(key);
    if (pool.state.liquidity != 0) {
        pool.fees_per_liquidity = pool.fees_per_liquidity +
            FeesPerLiquidity::from_amounts(amount0, amount1, pool.state.liquidity);
    }

    accountant_.account_debt(key.token0, to_debt(amount0));
    accountant_.account_debt(key.token1, to_debt(amount1));
    scope.commit();
}

void Core::update_saved_balances(const Token& token0, const Token& token1, uint64_t salt,
                                 I128 delta0, I128 delta1) {
    EntryScope scope(*this);

    if (!(token0 < token1)) {
        throw CoreError(errors::TOKENS_MUST_BE_SORTED);
    }
    Address locker = current_locker();
    SavedBalanceKey key{locker, token0, token1, salt};
    const SavedBalance* saved = state_.saved_balances.find(key);
    SavedBalance balance = saved != nullptr ? *saved : SavedBalance{0, 0};

    auto apply = [](U128 current, I128 delta) -> U128 {
        if (delta >= 0) {
            U128 next = current + static_cast<U128>(delta);
            if (next < current) throw CoreError(errors::SAVED_BALANCE_OVERFLOW);
            return next;
        }
        U128 amount = magnitude(delta);
        if (amount > current) throw CoreError(errors::INSUFFICIENT_SAVED_BALANCE);
        return current - amount;
    };
    balance.amount0 = apply(balance.amount0, delta0);
    balance.amount1 = apply(balance.amount1, delta1);

    if (balance.amount0 == 0 && balance.amount1 == 0) {
        state_.saved_balances.erase(key);
    } else {
        state_.saved_balances.write(key) = balance;
    }

    accountant_.account_debt(token0, delta0);
    accountant_.account_debt(token1, delta1);
    scope.commit();
}

// =============================================================================
// Protocol Fees
// =============================================================================

void Core::add_protocol_fees(const Token& token, U128 amount) {
    const U128* accrued = state_.protocol_fees.find(token);
    U128 current = accrued != nullptr ? *accrued : 0;
    if (current + amount < current) {
        throw CoreError(errors::AMOUNT_OVERFLOW, "protocol fees of " + addresses::to_hex(token));
    }
    state_.protocol_fees.write(token) = current + amount;
}

void Core::withdraw_protocol_fees(const Address& caller, const Address& recipient,
                                  const Token& token, U128 amount) {
    EntryScope scope(*this);

    if (addresses::is_zero(config_.owner) || caller != config_.owner) {
        throw CoreError(errors::UNAUTHORIZED, addresses::to_hex(caller));
    }
    const U128* accrued = state_.protocol_fees.find(token);
    U128 available = accrued != nullptr ? *accrued : 0;
    if (amount > available) {
        throw CoreError(errors::INSUFFICIENT_BALANCE,
                        "protocol fees " + u128_to_string(available));
    }
    if (amount != 0) {
        state_.protocol_fees.write(token) = available - amount;
        state_.tokens.transfer(token, config_.core_address, recipient, amount);
    }

    logger_.info("withdrew ", u128_to_string(amount), " protocol fees of ",
                 addresses::to_hex(token), " to ", addresses::to_hex(recipient));
    scope.commit();
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<PoolState> Core::get_pool_state(const PoolKey& key) const {
    const Pool* pool = state_.pools.find(key);
    if (pool == nullptr) return std::nullopt;
    return pool->state;
}

std::optional<TickInfo> Core::get_tick_info(const PoolKey& key, int32_t tick) const {
    const Pool* pool = state_.pools.find(key);
    if (pool == nullptr) return std::nullopt;
    auto it = pool->ticks.find(tick);
    if (it == pool->ticks.end()) return std::nullopt;
    return it->second;
}

std::vector<int32_t> Core::get_initialized_ticks(const PoolKey& key) const {
    std::vector<int32_t> result;
    const Pool* pool = state_.pools.find(key);
    if (pool == nullptr) return result;
    result.reserve(pool->ticks.size());
    for (const auto& [tick, info] : pool->ticks) {
        result.push_back(tick);
    }
    return result;
}

std::optional<Position> Core::get_position(const PoolKey& key, const Address& owner, uint64_t salt,
                                           int32_t tick_lower, int32_t tick_upper) const {
    const Pool* pool = state_.pools.find(key);
    if (pool == nullptr) return std::nullopt;
    auto it = pool->positions.find(PositionKey{owner, salt, tick_lower, tick_upper});
    if (it == pool->positions.end()) return std::nullopt;
    return it->second;
}

FeesPerLiquidity Core::get_fees_per_liquidity_inside(const PoolKey& key, int32_t tick_lower,
                                                     int32_t tick_upper) const {
    return state_.pools.pool(key).fees_inside(tick_lower, tick_upper);
}

SavedBalance Core::get_saved_balances(const Address& owner, const Token& token0,
                                      const Token& token1, uint64_t salt) const {
    const SavedBalance* saved = state_.saved_balances.find(SavedBalanceKey{owner, token0, token1, salt});
    return saved != nullptr ? *saved : SavedBalance{0, 0};
}

U128 Core::get_protocol_fees(const Token& token) const {
    const U128* accrued = state_.protocol_fees.find(token);
    return accrued != nullptr ? *accrued : 0;
}

} // namespace clamm

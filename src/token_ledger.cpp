// =============================================================================
// token_ledger.cpp - Token balances and allowances
// =============================================================================

#include "clamm/token_ledger.hpp"
#include "clamm/error.hpp"

namespace clamm {

void TokenLedger::mint(const Token& token, const Address& to, U128 amount) {
    U128 balance = balance_of(token, to);
    if (balance + amount < balance) {
        throw CoreError(errors::AMOUNT_OVERFLOW, "mint to " + addresses::to_hex(to));
    }
    balances_.write({token, to}) = balance + amount;
}

void TokenLedger::transfer(const Token& token, const Address& from, const Address& to, U128 amount) {
    U128 from_balance = balance_of(token, from);
    if (from_balance < amount) {
        throw CoreError(errors::INSUFFICIENT_BALANCE,
                        addresses::to_hex(from) + " needs " + u128_to_string(amount));
    }
    if (amount == 0 || from == to) {
        return;
    }

    U128 to_balance = balance_of(token, to);
    if (to_balance + amount < to_balance) {
        throw CoreError(errors::AMOUNT_OVERFLOW, "transfer to " + addresses::to_hex(to));
    }
    balances_.write({token, from}) = from_balance - amount;
    balances_.write({token, to}) = to_balance + amount;
}

void TokenLedger::approve(const Token& token, const Address& owner, const Address& spender,
                          U128 amount) {
    allowances_.write({token, owner, spender}) = amount;
}

void TokenLedger::transfer_from(const Token& token, const Address& spender, const Address& from,
                                const Address& to, U128 amount) {
    if (spender != from) {
        U128 allowed = allowance(token, from, spender);
        if (allowed < amount) {
            throw CoreError(errors::INSUFFICIENT_ALLOWANCE,
                            addresses::to_hex(spender) + " on " + addresses::to_hex(from));
        }
        transfer(token, from, to, amount);
        if (allowed != U128_MAX) {
            allowances_.write({token, from, spender}) = allowed - amount;
        }
        return;
    }
    transfer(token, from, to, amount);
}

U128 TokenLedger::balance_of(const Token& token, const Address& owner) const {
    const U128* balance = balances_.find({token, owner});
    return balance != nullptr ? *balance : 0;
}

U128 TokenLedger::allowance(const Token& token, const Address& owner, const Address& spender) const {
    const U128* allowed = allowances_.find({token, owner, spender});
    return allowed != nullptr ? *allowed : 0;
}

void TokenLedger::begin_journal() {
    balances_.begin_journal();
    allowances_.begin_journal();
}

void TokenLedger::commit_journal() {
    balances_.commit_journal();
    allowances_.commit_journal();
}

void TokenLedger::rollback_journal() {
    balances_.rollback_journal();
    allowances_.rollback_journal();
}

} // namespace clamm

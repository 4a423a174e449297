#ifndef CLAMM_TOKEN_LEDGER_HPP
#define CLAMM_TOKEN_LEDGER_HPP

#include <cstddef>
#include <map>
#include <tuple>

#include "journal.hpp"
#include "types.hpp"

namespace clamm {

// =============================================================================
// TokenLedger - token balances and allowances moved by the engine
// =============================================================================
//
// Stands in for the token contracts the engine pulls from and pushes to.
// Every failing call throws CoreError and leaves balances unchanged.

class TokenLedger {
public:
    TokenLedger() = default;

    // Create supply out of thin air (test and bootstrap helper).
    // Throws CoreError(AMOUNT_OVERFLOW).
    void mint(const Token& token, const Address& to, U128 amount);

    // Throws CoreError(INSUFFICIENT_BALANCE)
    void transfer(const Token& token, const Address& from, const Address& to, U128 amount);

    void approve(const Token& token, const Address& owner, const Address& spender, U128 amount);

    // Spend `spender`'s allowance from `from`. An allowance of U128_MAX is
    // never decremented. Throws CoreError(INSUFFICIENT_ALLOWANCE) or
    // CoreError(INSUFFICIENT_BALANCE).
    void transfer_from(const Token& token, const Address& spender, const Address& from,
                       const Address& to, U128 amount);

    U128 balance_of(const Token& token, const Address& owner) const;
    U128 allowance(const Token& token, const Address& owner, const Address& spender) const;

    // Undo support for the engine's all-or-nothing entries
    void begin_journal();
    void commit_journal();
    void rollback_journal();
    std::size_t journal_size() const { return balances_.journal_size() + allowances_.journal_size(); }

private:
    using BalanceKey = std::pair<Token, Address>;
    using AllowanceKey = std::tuple<Token, Address, Address>;

    JournaledMap<std::map<BalanceKey, U128>> balances_;
    JournaledMap<std::map<AllowanceKey, U128>> allowances_;
};

} // namespace clamm

#endif // CLAMM_TOKEN_LEDGER_HPP

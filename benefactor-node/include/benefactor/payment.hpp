#pragma once

#include <unordered_map>
#include <shared_mutex>
#include "benefactor/types.hpp"

namespace benefactor {
namespace payment {

/**
 * @brief Payment rail moving the donated asset from donor to charity
 *
 * transfer_from only succeeds when the payer has authorized the caller
 * beforehand (out of band) and holds enough balance. A declined transfer
 * moves nothing.
 */
class PaymentRail {
public:
    virtual ~PaymentRail() = default;
    virtual bool transfer_from(const Address& payer, const Address& payee, const Amount& amount) = 0;
};

/**
 * @brief In-memory account book with balances and allowances
 *
 * Allowances are granted by a payer to the rail's operator (the donation
 * orchestrator), not to a specific payee.
 */
class AccountRail : public PaymentRail {
public:
    AccountRail() = default;

    bool transfer_from(const Address& payer, const Address& payee, const Amount& amount) override;

    // Mint balance into an account, false if it would overflow
    bool credit(const Address& addr, const Amount& amount);

    // Payer authorizes up to `amount` to be pulled
    void approve(const Address& payer, const Amount& amount);

    Amount balance_of(const Address& addr) const;
    Amount allowance(const Address& payer) const;

private:
    struct Account {
        Amount balance{0};
        Amount allowance{0};
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
};

} // namespace payment
} // namespace benefactor

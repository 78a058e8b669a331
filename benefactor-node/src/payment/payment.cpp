#include "benefactor/payment.hpp"
#include "benefactor/logging.hpp"
#include <limits>
#include <mutex>

namespace benefactor {
namespace payment {

bool AccountRail::transfer_from(const Address& payer, const Address& payee, const Amount& amount) {
    if (amount == 0 || payer.is_zero() || payee.is_zero()) {
        return false;
    }

    std::unique_lock lock(mutex_);

    auto it = accounts_.find(payer.to_hex());
    if (it == accounts_.end()) {
        BENEFACTOR_LOG(Debug, "RAIL") << "Declined: unknown payer " << payer.to_hex();
        return false;
    }

    auto& from = it->second;
    if (from.allowance < amount) {
        BENEFACTOR_LOG(Debug, "RAIL") << "Declined: allowance " << from.allowance.str()
                                      << " < " << amount.str();
        return false;
    }
    if (from.balance < amount) {
        BENEFACTOR_LOG(Debug, "RAIL") << "Declined: balance " << from.balance.str()
                                      << " < " << amount.str();
        return false;
    }

    Amount payee_balance{0};
    auto to = accounts_.find(payee.to_hex());
    if (to != accounts_.end()) payee_balance = to->second.balance;
    if (payee_balance > std::numeric_limits<Amount>::max() - amount) {
        BENEFACTOR_LOG(Debug, "RAIL") << "Declined: payee balance " << payee_balance.str()
                                      << " cannot take " << amount.str();
        return false;
    }

    from.allowance -= amount;
    from.balance -= amount;
    accounts_[payee.to_hex()].balance += amount;
    return true;
}

bool AccountRail::credit(const Address& addr, const Amount& amount) {
    std::unique_lock lock(mutex_);
    auto& account = accounts_[addr.to_hex()];
    if (account.balance > std::numeric_limits<Amount>::max() - amount) {
        return false;
    }
    account.balance += amount;
    return true;
}

void AccountRail::approve(const Address& payer, const Amount& amount) {
    std::unique_lock lock(mutex_);
    accounts_[payer.to_hex()].allowance = amount;
}

Amount AccountRail::balance_of(const Address& addr) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(addr.to_hex());
    return (it != accounts_.end()) ? it->second.balance : Amount(0);
}

Amount AccountRail::allowance(const Address& payer) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(payer.to_hex());
    return (it != accounts_.end()) ? it->second.allowance : Amount(0);
}

} // namespace payment
} // namespace benefactor

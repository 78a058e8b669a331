#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include "benefactor/types.hpp"
#include "benefactor/errors.hpp"
#include "benefactor/payment.hpp"
#include "benefactor/registry.hpp"
#include "benefactor/ledger.hpp"
#include "benefactor/verifier.hpp"
#include "benefactor/storage.hpp"

namespace benefactor {

/**
 * @brief Donation use cases for a single charity
 *
 * donate:          payment rail -> ledger.record -> registry total + mint
 * verify_donation: verifier -> ledger.mark_verified -> mint -> invoice index
 *
 * Every mutating call runs under one exclusive lock that spans the external
 * payment / verifier call and the state commit, so calls are globally
 * ordered and never observe each other's intermediate state. A failure at
 * any step leaves ledger, roster, registry and store untouched.
 */
class DonationOrchestrator {
public:
    struct DonationEvent {
        Address donor;
        Amount amount;
        TokenId token_id;
    };

    struct VerificationEvent {
        Address donor;
        std::string invoice_id;
        TokenId token_id;
    };

    using DonationCallback = std::function<void(const DonationEvent&)>;
    using VerificationCallback = std::function<void(const VerificationEvent&)>;

    // Takes the registry's minter capability; throws std::invalid_argument
    // if it was already granted or a collaborator is missing.
    DonationOrchestrator(CharityDescriptor charity,
                         const Address& payout_address,
                         std::shared_ptr<payment::PaymentRail> rail,
                         std::shared_ptr<registry::TokenRegistry> registry,
                         std::shared_ptr<ledger::DonationLedger> ledger,
                         std::shared_ptr<verification::ProofVerifier> verifier,
                         std::shared_ptr<storage::StateStore> store = nullptr,
                         const std::vector<std::pair<Address, TokenId>>& invoice_tokens = {});

    // Errors: InvalidAddress, InvalidAmount, TransferFailed, StorageFailure
    Result<TokenId> donate(const Address& donor, const Amount& amount);

    // Errors: InvalidAddress, ProofVerificationFailed, StorageFailure
    Result<TokenId> verify_donation(const Address& donor, const ProofData& proof,
                                    const std::string& invoice_id);

    // Administrative, restricted to the registry administrator
    Status set_base_locator(const Address& caller, const std::string& base);
    Status transfer_admin(const Address& caller, const Address& new_admin);

    // Reads
    DonationSummary all_donations() const;
    const CharityDescriptor& charity_info() const { return charity_; }
    const Address& payout_address() const { return payout_; }
    Amount donations_of(const Address& donor) const;
    Result<TokenId> invoice_token_of(const Address& donor) const;
    DonationRecord record_of(const Address& donor) const;
    ledger::DonorState state_of(const Address& donor) const;
    std::vector<Log> event_log() const;

    // Subscribers run after the call has committed, outside the lock
    void on_donation(DonationCallback cb);
    void on_verification(VerificationCallback cb);

    // Locator suffixes: <base><id>.json?donation=<amount> / ?invoiceId=<id>
    static std::string donation_suffix(const Amount& amount);
    static std::string invoice_suffix(const std::string& invoice_id);

    static constexpr const char* DONATION_EVENT = "DonationReceived(address,uint256,uint64)";
    static constexpr const char* VERIFICATION_EVENT = "DonationVerified(address,string,uint64)";

private:
    CharityDescriptor charity_;
    Address payout_;

    std::shared_ptr<payment::PaymentRail> rail_;
    std::shared_ptr<registry::TokenRegistry> registry_;
    std::shared_ptr<ledger::DonationLedger> ledger_;
    std::shared_ptr<verification::ProofVerifier> verifier_;
    std::shared_ptr<storage::StateStore> store_;
    std::shared_ptr<registry::TokenMinter> minter_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TokenId> invoice_tokens_;
    std::vector<Log> events_;

    std::mutex callbacks_mutex_;
    std::vector<DonationCallback> donation_callbacks_;
    std::vector<VerificationCallback> verification_callbacks_;

    bool persist(const storage::StateStore::Batch& batch);
};

} // namespace benefactor

#include "benefactor/orchestrator.hpp"
#include "benefactor/logging.hpp"
#include <limits>
#include <stdexcept>

namespace benefactor {

DonationOrchestrator::DonationOrchestrator(CharityDescriptor charity,
                                           const Address& payout_address,
                                           std::shared_ptr<payment::PaymentRail> rail,
                                           std::shared_ptr<registry::TokenRegistry> registry,
                                           std::shared_ptr<ledger::DonationLedger> ledger,
                                           std::shared_ptr<verification::ProofVerifier> verifier,
                                           std::shared_ptr<storage::StateStore> store,
                                           const std::vector<std::pair<Address, TokenId>>& invoice_tokens)
    : charity_(std::move(charity)),
      payout_(payout_address),
      rail_(std::move(rail)),
      registry_(std::move(registry)),
      ledger_(std::move(ledger)),
      verifier_(std::move(verifier)),
      store_(std::move(store)) {
    if (!rail_ || !registry_ || !ledger_ || !verifier_) {
        throw std::invalid_argument("orchestrator requires rail, registry, ledger and verifier");
    }
    if (payout_.is_zero()) {
        throw std::invalid_argument("charity payout address is the zero address");
    }

    minter_ = registry_->grant_minter();
    if (!minter_) {
        throw std::invalid_argument("token registry minter capability is already held");
    }

    for (const auto& [donor, id] : invoice_tokens) {
        invoice_tokens_[donor.to_hex()] = id;
    }

    BENEFACTOR_LOG(Info, "ORCHESTRATOR") << "Collecting for \"" << charity_.name << "\" into "
                                         << payout_.to_hex() << " (verifier: " << verifier_->name() << ")";
}

std::string DonationOrchestrator::donation_suffix(const Amount& amount) {
    return ".json?donation=" + amount.str();
}

std::string DonationOrchestrator::invoice_suffix(const std::string& invoice_id) {
    return ".json?invoiceId=" + invoice_id;
}

bool DonationOrchestrator::persist(const storage::StateStore::Batch& batch) {
    if (!store_) return true;
    return store_->commit(batch);
}

// ============================================================================
// donate
// ============================================================================

Result<TokenId> DonationOrchestrator::donate(const Address& donor, const Amount& amount) {
    if (donor.is_zero()) {
        return Result<TokenId>::failure(ErrorCode::InvalidAddress, "donor is the zero address");
    }
    if (amount == 0) {
        return Result<TokenId>::failure(ErrorCode::InvalidAmount, "donation amount must be greater than zero");
    }

    DonationEvent event{donor, amount, 0};
    {
        std::unique_lock lock(mutex_);

        // Reject before any money moves if the running total could not hold it
        Amount total = registry_->donations_of(donor);
        if (amount > std::numeric_limits<Amount>::max() - total) {
            return Result<TokenId>::failure(ErrorCode::InvalidAmount,
                                            "donation would overflow the donor's cumulative total");
        }

        if (!rail_->transfer_from(donor, payout_, amount)) {
            BENEFACTOR_LOG(Warn, "ORCHESTRATOR") << "Transfer of " << amount.str() << " from "
                                                 << donor.to_hex() << " declined";
            return Result<TokenId>::failure(ErrorCode::TransferFailed, "payment rail declined the transfer");
        }

        auto ledger_snap = ledger_->snapshot();
        auto registry_snap = registry_->snapshot();
        bool new_donor = !ledger_->in_roster(donor);

        auto recorded = ledger_->record(donor, amount);
        if (!recorded.ok()) {
            ledger_->revert(ledger_snap);
            return Result<TokenId>::failure(recorded.code, recorded.error);
        }
        minter_->record_donation(donor, amount);
        TokenId id = minter_->mint(donor, donation_suffix(amount));

        storage::StateStore::Batch batch;
        batch.put_record(ledger_->record_of(donor));
        if (new_donor) {
            batch.put_roster_entry(ledger_->donor_count() - 1, donor);
        }
        batch.put_total(donor, registry_->donations_of(donor));
        if (auto token = registry_->token(id)) {
            batch.put_token(*token);
        }

        if (!persist(batch)) {
            ledger_->revert(ledger_snap);
            registry_->revert(registry_snap);
            BENEFACTOR_LOG(Error, "ORCHESTRATOR") << "State commit failed after transfer of "
                                                  << amount.str() << " from " << donor.to_hex();
            return Result<TokenId>::failure(ErrorCode::StorageFailure, "state commit failed");
        }
        ledger_->commit();
        registry_->commit();

        Log log;
        log.address = payout_;
        log.topics.push_back(DONATION_EVENT);
        log.topics.push_back(donor.to_hex());
        codec::append_amount(log.data, amount);
        codec::append_uint64(log.data, id);
        events_.push_back(std::move(log));

        event.token_id = id;
        BENEFACTOR_LOG(Info, "DONATION") << donor.to_hex() << " gave " << amount.str()
                                         << " -> token #" << id;
    }

    std::vector<DonationCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = donation_callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(event);
    }
    return Result<TokenId>::success(event.token_id);
}

// ============================================================================
// verify_donation
// ============================================================================

Result<TokenId> DonationOrchestrator::verify_donation(const Address& donor, const ProofData& proof,
                                                      const std::string& invoice_id) {
    if (donor.is_zero()) {
        return Result<TokenId>::failure(ErrorCode::InvalidAddress, "donor is the zero address");
    }

    VerificationEvent event{donor, invoice_id, 0};
    {
        std::unique_lock lock(mutex_);

        if (!verifier_->verify(proof, donor)) {
            BENEFACTOR_LOG(Warn, "ORCHESTRATOR") << "Proof from " << donor.to_hex() << " rejected by "
                                                 << verifier_->name();
            return Result<TokenId>::failure(ErrorCode::ProofVerificationFailed,
                                            "proof of payment could not be verified");
        }

        auto ledger_snap = ledger_->snapshot();
        auto registry_snap = registry_->snapshot();

        ledger_->mark_verified(donor, invoice_id);
        TokenId id = minter_->mint(donor, invoice_suffix(invoice_id));

        auto key = donor.to_hex();
        std::optional<TokenId> previous;
        if (auto it = invoice_tokens_.find(key); it != invoice_tokens_.end()) {
            previous = it->second;
        }
        invoice_tokens_[key] = id;

        storage::StateStore::Batch batch;
        batch.put_record(ledger_->record_of(donor));
        batch.put_invoice_token(donor, id);
        if (auto token = registry_->token(id)) {
            batch.put_token(*token);
        }

        if (!persist(batch)) {
            ledger_->revert(ledger_snap);
            registry_->revert(registry_snap);
            if (previous) {
                invoice_tokens_[key] = *previous;
            } else {
                invoice_tokens_.erase(key);
            }
            BENEFACTOR_LOG(Error, "ORCHESTRATOR") << "State commit failed verifying " << donor.to_hex();
            return Result<TokenId>::failure(ErrorCode::StorageFailure, "state commit failed");
        }
        ledger_->commit();
        registry_->commit();

        Log log;
        log.address = payout_;
        log.topics.push_back(VERIFICATION_EVENT);
        log.topics.push_back(donor.to_hex());
        codec::append_string(log.data, invoice_id);
        codec::append_uint64(log.data, id);
        events_.push_back(std::move(log));

        event.token_id = id;
        BENEFACTOR_LOG(Info, "DONATION") << donor.to_hex() << " verified invoice " << invoice_id
                                         << " (" << proof.payload.size() << "-byte proof) -> token #" << id;
    }

    std::vector<VerificationCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = verification_callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(event);
    }
    return Result<TokenId>::success(event.token_id);
}

// ============================================================================
// Administrative
// ============================================================================

Status DonationOrchestrator::set_base_locator(const Address& caller, const std::string& base) {
    std::unique_lock lock(mutex_);

    auto previous = registry_->base_locator();
    auto status = registry_->set_base_locator(caller, base);
    if (!status.ok()) {
        return status;
    }

    storage::StateStore::Batch batch;
    batch.put_meta(registry_->admin(), base);
    if (!persist(batch)) {
        auto restored = registry_->set_base_locator(caller, previous);
        if (!restored.ok()) {
            BENEFACTOR_LOG(Error, "ORCHESTRATOR") << "Could not restore base locator: " << restored.error;
        }
        return Status::failure(ErrorCode::StorageFailure, "state commit failed");
    }
    return Status::success();
}

Status DonationOrchestrator::transfer_admin(const Address& caller, const Address& new_admin) {
    std::unique_lock lock(mutex_);

    auto status = registry_->transfer_admin(caller, new_admin);
    if (!status.ok()) {
        return status;
    }

    storage::StateStore::Batch batch;
    batch.put_meta(new_admin, registry_->base_locator());
    if (!persist(batch)) {
        auto restored = registry_->transfer_admin(new_admin, caller);
        if (!restored.ok()) {
            BENEFACTOR_LOG(Error, "ORCHESTRATOR") << "Could not restore administrator: " << restored.error;
        }
        return Status::failure(ErrorCode::StorageFailure, "state commit failed");
    }
    return Status::success();
}

// ============================================================================
// Reads
// ============================================================================

DonationSummary DonationOrchestrator::all_donations() const {
    std::shared_lock lock(mutex_);
    return ledger_->all_donations();
}

Amount DonationOrchestrator::donations_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    return registry_->donations_of(donor);
}

Result<TokenId> DonationOrchestrator::invoice_token_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    auto it = invoice_tokens_.find(donor.to_hex());
    if (it == invoice_tokens_.end()) {
        return Result<TokenId>::failure(ErrorCode::TokenNotFound,
                                        "no invoice token for " + donor.to_hex());
    }
    return Result<TokenId>::success(it->second);
}

DonationRecord DonationOrchestrator::record_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    return ledger_->record_of(donor);
}

ledger::DonorState DonationOrchestrator::state_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    return ledger_->state_of(donor);
}

std::vector<Log> DonationOrchestrator::event_log() const {
    std::shared_lock lock(mutex_);
    return events_;
}

void DonationOrchestrator::on_donation(DonationCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    donation_callbacks_.push_back(std::move(cb));
}

void DonationOrchestrator::on_verification(VerificationCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    verification_callbacks_.push_back(std::move(cb));
}

} // namespace benefactor

#include "benefactor/ledger.hpp"
#include "benefactor/logging.hpp"
#include <mutex>

namespace benefactor {
namespace ledger {

const char* donor_state_name(DonorState state) {
    switch (state) {
        case DonorState::NoDonation: return "no-donation";
        case DonorState::Donated: return "donated";
        case DonorState::Verified: return "verified";
    }
    return "unknown";
}

DonationLedger::DonationLedger(LedgerState state) {
    for (auto& record : state.records) {
        auto key = record.donor.to_hex();
        records_[key] = std::move(record);
    }
    for (const auto& donor : state.roster) {
        if (members_.insert(donor.to_hex()).second) {
            roster_.push_back(donor);
        }
    }
}

// Caller holds the exclusive lock
void DonationLedger::journal_record(const Address& donor) {
    auto it = records_.find(donor.to_hex());
    if (it != records_.end()) {
        journal_.push_back(JournalEntry{donor, it->second});
    } else {
        journal_.push_back(JournalEntry{donor, std::nullopt});
    }
}

Status DonationLedger::record(const Address& donor, const Amount& amount) {
    if (amount == 0) {
        return Status::failure(ErrorCode::InvalidAmount, "donation amount must be greater than zero");
    }

    std::unique_lock lock(mutex_);

    journal_record(donor);

    auto& record = records_[donor.to_hex()];
    record.donor = donor;
    record.amount = amount;
    record.verified = false;
    record.invoice_id.reset();

    if (members_.insert(donor.to_hex()).second) {
        roster_.push_back(donor);
        BENEFACTOR_LOG(Debug, "LEDGER") << "Donor #" << roster_.size() - 1 << " joined roster: "
                                        << donor.to_hex();
    }

    BENEFACTOR_LOG(Debug, "LEDGER") << "Recorded donation of " << amount.str() << " from "
                                    << donor.to_hex();
    return Status::success();
}

void DonationLedger::mark_verified(const Address& donor, const std::string& invoice_id) {
    std::unique_lock lock(mutex_);

    journal_record(donor);

    auto& record = records_[donor.to_hex()];
    if (record.donor.is_zero()) {
        record.donor = donor;
        BENEFACTOR_LOG(Debug, "LEDGER") << "Verifying " << donor.to_hex() << " with no prior donation";
    }
    record.verified = true;
    record.invoice_id = invoice_id;
}

DonationSummary DonationLedger::all_donations() const {
    std::shared_lock lock(mutex_);

    DonationSummary summary;
    summary.donors.reserve(roster_.size());
    summary.amounts.reserve(roster_.size());
    summary.verified.reserve(roster_.size());

    for (const auto& donor : roster_) {
        auto it = records_.find(donor.to_hex());
        summary.donors.push_back(donor);
        if (it != records_.end()) {
            summary.amounts.push_back(it->second.amount);
            summary.verified.push_back(it->second.verified);
        } else {
            summary.amounts.push_back(Amount(0));
            summary.verified.push_back(false);
        }
    }
    return summary;
}

DonationRecord DonationLedger::record_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(donor.to_hex());
    if (it != records_.end()) {
        return it->second;
    }
    DonationRecord empty;
    empty.donor = donor;
    return empty;
}

bool DonationLedger::has_record(const Address& donor) const {
    std::shared_lock lock(mutex_);
    return records_.find(donor.to_hex()) != records_.end();
}

bool DonationLedger::in_roster(const Address& donor) const {
    std::shared_lock lock(mutex_);
    return members_.find(donor.to_hex()) != members_.end();
}

DonorState DonationLedger::state_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(donor.to_hex());
    if (it == records_.end()) {
        return DonorState::NoDonation;
    }
    if (it->second.verified) {
        return DonorState::Verified;
    }
    return it->second.amount > 0 ? DonorState::Donated : DonorState::NoDonation;
}

std::vector<Address> DonationLedger::roster() const {
    std::shared_lock lock(mutex_);
    return roster_;
}

size_t DonationLedger::donor_count() const {
    std::shared_lock lock(mutex_);
    return roster_.size();
}

DonationLedger::Snapshot DonationLedger::snapshot() const {
    std::shared_lock lock(mutex_);
    return Snapshot{roster_.size(), journal_.size()};
}

void DonationLedger::revert(const Snapshot& snap) {
    std::unique_lock lock(mutex_);

    while (roster_.size() > snap.roster_size) {
        members_.erase(roster_.back().to_hex());
        roster_.pop_back();
    }

    while (journal_.size() > snap.journal_size) {
        const auto& entry = journal_.back();
        if (entry.prev_record.has_value()) {
            records_[entry.donor.to_hex()] = *entry.prev_record;
        } else {
            records_.erase(entry.donor.to_hex());
        }
        journal_.pop_back();
    }
}

void DonationLedger::commit() {
    std::unique_lock lock(mutex_);
    journal_.clear();
}

} // namespace ledger
} // namespace benefactor

#pragma once

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include "benefactor/types.hpp"
#include "benefactor/errors.hpp"

namespace benefactor {
namespace ledger {

/**
 * @brief Per-donor lifecycle
 *
 * NoDonation -> Donated (donate) -> Verified (verify_donation).
 * A new donation from a Verified donor goes back to Donated.
 */
enum class DonorState {
    NoDonation,
    Donated,
    Verified
};

const char* donor_state_name(DonorState state);

/**
 * @brief Persisted image of a ledger, used to restore it at start-up
 */
struct LedgerState {
    std::vector<Address> roster;           // insertion order
    std::vector<DonationRecord> records;
};

/**
 * @brief Donation ledger: latest record per donor plus donor roster
 *
 * The roster is append-only and duplicate-free; membership is a set
 * lookup, enumeration follows insertion order.
 */
class DonationLedger {
public:
    DonationLedger() = default;
    explicit DonationLedger(LedgerState state);

    // Overwrites the donor's record; InvalidAmount when amount == 0
    Status record(const Address& donor, const Amount& amount);

    // Succeeds against a zero-valued record when the donor never donated.
    // Does not add the donor to the roster.
    void mark_verified(const Address& donor, const std::string& invoice_id);

    DonationSummary all_donations() const;

    // Zero-valued record when absent
    DonationRecord record_of(const Address& donor) const;
    bool has_record(const Address& donor) const;
    bool in_roster(const Address& donor) const;
    DonorState state_of(const Address& donor) const;

    std::vector<Address> roster() const;
    size_t donor_count() const;

    // Journal
    struct Snapshot {
        size_t roster_size;
        size_t journal_size;
    };
    Snapshot snapshot() const;
    void revert(const Snapshot& snap);
    void commit();

private:
    mutable std::shared_mutex mutex_;

    std::unordered_map<std::string, DonationRecord> records_;
    std::vector<Address> roster_;
    std::unordered_set<std::string> members_;

    struct JournalEntry {
        Address donor;
        std::optional<DonationRecord> prev_record;
    };
    std::vector<JournalEntry> journal_;

    void journal_record(const Address& donor);
};

} // namespace ledger
} // namespace benefactor

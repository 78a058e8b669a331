#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include "benefactor/types.hpp"
#include "benefactor/errors.hpp"

namespace benefactor {
namespace registry {

/**
 * @brief Capability to issue tokens and accumulate donation totals
 *
 * Only obtainable once per registry through TokenRegistry::grant_minter().
 * The orchestrator holds it; nothing else can mint.
 */
class TokenMinter {
public:
    virtual ~TokenMinter() = default;

    // Never fails for a non-zero owner; throws std::invalid_argument otherwise
    virtual TokenId mint(const Address& owner, const std::string& suffix) = 0;

    virtual void record_donation(const Address& donor, const Amount& amount) = 0;
};

struct DonorTotal {
    Address donor;
    Amount total{0};
};

/**
 * @brief Persisted image of a registry, used to restore it at start-up
 */
struct RegistryState {
    Address admin;
    std::string base_locator;
    std::vector<Token> tokens;      // tokens[i].id == i
    std::vector<DonorTotal> totals;
};

/**
 * @brief Monotonic token registry
 *
 * - IDs are dense, start at 0 and are never reused
 * - Locators are computed as base + id + suffix from the base current at
 *   query time; the per-token suffix is fixed at mint time
 * - Cumulative donation totals per donor only ever grow
 *
 * Mutations are journaled so the orchestrator can revert a partially
 * applied unit of work (snapshot/revert/commit).
 */
class TokenRegistry {
public:
    TokenRegistry(const Address& admin, std::string base_locator);
    explicit TokenRegistry(RegistryState state);

    // Returns nullptr once the capability has been handed out
    std::shared_ptr<TokenMinter> grant_minter();

    // Administrative
    Status set_base_locator(const Address& caller, const std::string& base);
    Status transfer_admin(const Address& caller, const Address& new_admin);
    Address admin() const;
    std::string base_locator() const;

    // Lookup
    Result<std::string> locator_of(TokenId id) const;
    Result<Address> owner_of(TokenId id) const;
    std::optional<Token> token(TokenId id) const;

    TokenId next_token_id() const;
    uint64_t total_supply() const { return next_token_id(); }
    uint64_t balance_of(const Address& owner) const;
    std::vector<TokenId> tokens_of(const Address& owner) const;

    // Cumulative total of every amount recorded for donor
    Amount donations_of(const Address& donor) const;

    // Transfer(zero, owner, id) per mint
    std::vector<Log> logs() const;

    // Journal
    struct Snapshot {
        size_t token_count;
        size_t journal_size;
        size_t log_count;
    };
    Snapshot snapshot() const;
    void revert(const Snapshot& snap);
    void commit();

private:
    friend class RegistryMinter;

    TokenId mint_token(const Address& owner, const std::string& suffix);
    void add_donation(const Address& donor, const Amount& amount);

    mutable std::shared_mutex mutex_;

    Address admin_;
    std::string base_locator_;
    std::vector<Token> tokens_;
    std::unordered_map<std::string, DonorTotal> totals_;
    std::unordered_map<std::string, std::vector<TokenId>> owned_;
    std::vector<Log> logs_;
    bool minter_granted_{false};

    struct JournalEntry {
        Address donor;
        std::optional<Amount> prev_total;
    };
    std::vector<JournalEntry> journal_;
};

} // namespace registry
} // namespace benefactor

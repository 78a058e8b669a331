#include "benefactor/registry.hpp"
#include "benefactor/logging.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace benefactor {
namespace registry {

static const char* TRANSFER_EVENT = "Transfer(address,address,uint64)";

// ============================================================================
// RegistryMinter
// ============================================================================

// The registry must outlive every capability it grants.
class RegistryMinter : public TokenMinter {
public:
    explicit RegistryMinter(TokenRegistry& registry) : registry_(registry) {}

    TokenId mint(const Address& owner, const std::string& suffix) override {
        return registry_.mint_token(owner, suffix);
    }

    void record_donation(const Address& donor, const Amount& amount) override {
        registry_.add_donation(donor, amount);
    }

private:
    TokenRegistry& registry_;
};

// ============================================================================
// TokenRegistry Implementation
// ============================================================================

TokenRegistry::TokenRegistry(const Address& admin, std::string base_locator)
    : admin_(admin), base_locator_(std::move(base_locator)) {}

TokenRegistry::TokenRegistry(RegistryState state)
    : admin_(state.admin), base_locator_(std::move(state.base_locator)) {
    tokens_.reserve(state.tokens.size());
    for (auto& token : state.tokens) {
        if (token.id != tokens_.size()) {
            throw std::invalid_argument("registry state has a gap at token #" +
                                        std::to_string(tokens_.size()));
        }
        owned_[token.owner.to_hex()].push_back(token.id);
        tokens_.push_back(std::move(token));
    }
    for (const auto& entry : state.totals) {
        totals_[entry.donor.to_hex()] = entry;
    }
}

std::shared_ptr<TokenMinter> TokenRegistry::grant_minter() {
    std::unique_lock lock(mutex_);
    if (minter_granted_) {
        BENEFACTOR_LOG(Warn, "REGISTRY") << "Minter capability already granted";
        return nullptr;
    }
    minter_granted_ = true;
    return std::make_shared<RegistryMinter>(*this);
}

TokenId TokenRegistry::mint_token(const Address& owner, const std::string& suffix) {
    if (owner.is_zero()) {
        throw std::invalid_argument("mint to the zero address");
    }

    std::unique_lock lock(mutex_);

    TokenId id = tokens_.size();
    tokens_.push_back(Token{id, owner, suffix});
    owned_[owner.to_hex()].push_back(id);

    Log log;
    log.topics.push_back(TRANSFER_EVENT);
    log.topics.push_back(Address{}.to_hex());
    log.topics.push_back(owner.to_hex());
    codec::append_uint64(log.data, id);
    logs_.push_back(std::move(log));

    BENEFACTOR_LOG(Debug, "REGISTRY") << "Minted token #" << id << " to " << owner.to_hex();
    return id;
}

void TokenRegistry::add_donation(const Address& donor, const Amount& amount) {
    std::unique_lock lock(mutex_);

    auto key = donor.to_hex();
    auto it = totals_.find(key);

    JournalEntry entry{donor, std::nullopt};
    if (it != totals_.end()) {
        entry.prev_total = it->second.total;
        // Checked arithmetic: throws before anything is modified
        it->second.total = it->second.total + amount;
    } else {
        totals_[key] = DonorTotal{donor, amount};
    }
    journal_.push_back(std::move(entry));
}

Status TokenRegistry::set_base_locator(const Address& caller, const std::string& base) {
    std::unique_lock lock(mutex_);
    if (caller != admin_) {
        return Status::failure(ErrorCode::Unauthorized,
                               "caller " + caller.to_hex() + " is not the registry administrator");
    }
    BENEFACTOR_LOG(Info, "REGISTRY") << "Base locator changed: " << base_locator_ << " -> " << base;
    base_locator_ = base;
    return Status::success();
}

Status TokenRegistry::transfer_admin(const Address& caller, const Address& new_admin) {
    std::unique_lock lock(mutex_);
    if (caller != admin_) {
        return Status::failure(ErrorCode::Unauthorized,
                               "caller " + caller.to_hex() + " is not the registry administrator");
    }
    if (new_admin.is_zero()) {
        return Status::failure(ErrorCode::InvalidAddress, "new administrator is the zero address");
    }
    admin_ = new_admin;
    BENEFACTOR_LOG(Info, "REGISTRY") << "Administrator transferred to " << new_admin.to_hex();
    return Status::success();
}

Address TokenRegistry::admin() const {
    std::shared_lock lock(mutex_);
    return admin_;
}

std::string TokenRegistry::base_locator() const {
    std::shared_lock lock(mutex_);
    return base_locator_;
}

Result<std::string> TokenRegistry::locator_of(TokenId id) const {
    std::shared_lock lock(mutex_);
    if (id >= tokens_.size()) {
        return Result<std::string>::failure(ErrorCode::TokenNotFound,
                                            "token #" + std::to_string(id) + " does not exist");
    }
    return Result<std::string>::success(base_locator_ + std::to_string(id) + tokens_[id].suffix);
}

Result<Address> TokenRegistry::owner_of(TokenId id) const {
    std::shared_lock lock(mutex_);
    if (id >= tokens_.size()) {
        return Result<Address>::failure(ErrorCode::TokenNotFound,
                                        "token #" + std::to_string(id) + " does not exist");
    }
    return Result<Address>::success(tokens_[id].owner);
}

std::optional<Token> TokenRegistry::token(TokenId id) const {
    std::shared_lock lock(mutex_);
    if (id >= tokens_.size()) return std::nullopt;
    return tokens_[id];
}

TokenId TokenRegistry::next_token_id() const {
    std::shared_lock lock(mutex_);
    return tokens_.size();
}

uint64_t TokenRegistry::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = owned_.find(owner.to_hex());
    return (it != owned_.end()) ? it->second.size() : 0;
}

std::vector<TokenId> TokenRegistry::tokens_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = owned_.find(owner.to_hex());
    return (it != owned_.end()) ? it->second : std::vector<TokenId>{};
}

Amount TokenRegistry::donations_of(const Address& donor) const {
    std::shared_lock lock(mutex_);
    auto it = totals_.find(donor.to_hex());
    return (it != totals_.end()) ? it->second.total : Amount(0);
}

std::vector<Log> TokenRegistry::logs() const {
    std::shared_lock lock(mutex_);
    return logs_;
}

TokenRegistry::Snapshot TokenRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return Snapshot{tokens_.size(), journal_.size(), logs_.size()};
}

void TokenRegistry::revert(const Snapshot& snap) {
    std::unique_lock lock(mutex_);

    while (tokens_.size() > snap.token_count) {
        auto& owned = owned_[tokens_.back().owner.to_hex()];
        owned.pop_back();
        if (owned.empty()) {
            owned_.erase(tokens_.back().owner.to_hex());
        }
        tokens_.pop_back();
    }

    while (journal_.size() > snap.journal_size) {
        const auto& entry = journal_.back();
        if (entry.prev_total.has_value()) {
            totals_[entry.donor.to_hex()].total = *entry.prev_total;
        } else {
            totals_.erase(entry.donor.to_hex());
        }
        journal_.pop_back();
    }

    logs_.resize(std::min(logs_.size(), snap.log_count));
}

void TokenRegistry::commit() {
    std::unique_lock lock(mutex_);
    journal_.clear();
}

} // namespace registry
} // namespace benefactor

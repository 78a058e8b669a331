#pragma once

#include <memory>
#include <string>
#include "benefactor/types.hpp"
#include "benefactor/logging.hpp"
#include "benefactor/payment.hpp"
#include "benefactor/registry.hpp"
#include "benefactor/ledger.hpp"
#include "benefactor/verifier.hpp"
#include "benefactor/storage.hpp"
#include "benefactor/orchestrator.hpp"

namespace benefactor {

/**
 * @brief Node configuration
 */
struct NodeConfig {
    // Identity
    std::string node_name{"benefactor-node"};
    std::string data_dir{"./data"};
    bool persistent{true};

    // Logging
    logging::Level log_level{logging::Level::Info};

    // Proof verifier implementation
    std::string verifier{"always-accept-non-empty"};

    // Charity
    CharityDescriptor charity;
    Address payout_address;

    // Registry
    std::string base_locator;
    Address admin;

    // Load from file
    static NodeConfig from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

/**
 * @brief Donation node
 *
 * Wires the components together:
 * - Storage (append-only log or in-memory)
 * - Token registry and donation ledger, restored from storage
 * - Proof verifier
 * - Donation orchestrator (sole minter)
 */
class Node {
public:
    Node(const NodeConfig& config, std::shared_ptr<payment::PaymentRail> rail);

    bool initialize();
    bool is_initialized() const { return orchestrator_ != nullptr; }

    const NodeConfig& config() const { return config_; }

    // Component access
    std::shared_ptr<DonationOrchestrator> orchestrator() { return orchestrator_; }
    std::shared_ptr<registry::TokenRegistry> token_registry() { return registry_; }
    std::shared_ptr<ledger::DonationLedger> donation_ledger() { return ledger_; }
    std::shared_ptr<storage::Database> database() { return db_; }

private:
    NodeConfig config_;

    std::shared_ptr<payment::PaymentRail> rail_;
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<storage::StateStore> store_;
    std::shared_ptr<registry::TokenRegistry> registry_;
    std::shared_ptr<ledger::DonationLedger> ledger_;
    std::shared_ptr<verification::ProofVerifier> verifier_;
    std::shared_ptr<DonationOrchestrator> orchestrator_;

    std::vector<std::pair<Address, TokenId>> restore_state();
};

} // namespace benefactor

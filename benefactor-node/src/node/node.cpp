#include "benefactor/node.hpp"
#include <charconv>
#include <fstream>

namespace benefactor {

// ============================================================================
// NodeConfig Implementation
// ============================================================================

NodeConfig NodeConfig::from_file(const std::string& path) {
    NodeConfig config;
    std::ifstream file(path);
    if (!file.is_open()) {
        BENEFACTOR_LOG(Warn, "CONFIG") << "Cannot open " << path << ", using defaults";
        return config;
    }

    std::string line;
    std::string current_section = "node";

    auto trim = [](const std::string& str) {
        auto first = str.find_first_not_of(" \t\r\n");
        if (std::string::npos == first) return std::string();
        auto last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    };

    auto to_uint64 = [](const std::string& s) {
        uint64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc() || ptr != s.data() + s.size()) return uint64_t{0};
        return v;
    };

    auto to_address = [&](const std::string& key, const std::string& s) {
        auto addr = Address::parse(s);
        if (!addr) {
            BENEFACTOR_LOG(Warn, "CONFIG") << "Invalid address for " << key << ": " << s;
        }
        return addr.value_or(Address{});
    };

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val_str = trim(line.substr(eq + 1));

        // Remove quotes if present
        if (val_str.size() >= 2 && val_str.front() == '"' && val_str.back() == '"') {
            val_str = val_str.substr(1, val_str.size() - 2);
        }

        bool known = true;
        if (current_section == "node") {
            if (key == "name") config.node_name = val_str;
            else if (key == "data_dir") config.data_dir = val_str;
            else if (key == "persistent") config.persistent = (val_str == "true");
            else if (key == "verifier") config.verifier = val_str;
            else if (key == "log_level") {
                auto level = logging::parse_level(val_str);
                if (level) config.log_level = *level;
                else BENEFACTOR_LOG(Warn, "CONFIG") << "Unknown log level: " << val_str;
            }
            else known = false;
        }
        else if (current_section == "charity") {
            if (key == "name") config.charity.name = val_str;
            else if (key == "foundation") config.charity.foundation = val_str;
            else if (key == "link") config.charity.link = val_str;
            else if (key == "source") config.charity.source = val_str;
            else if (key == "image") config.charity.image_locator = val_str;
            else if (key == "registered_at") config.charity.registered_at = to_uint64(val_str);
            else if (key == "payout_address") config.payout_address = to_address(key, val_str);
            else if (key == "suggested_price") {
                auto price = parse_amount(val_str);
                if (price) config.charity.suggested_price = *price;
                else BENEFACTOR_LOG(Warn, "CONFIG") << "Invalid suggested_price: " << val_str;
            }
            else known = false;
        }
        else if (current_section == "registry") {
            if (key == "base_locator") config.base_locator = val_str;
            else if (key == "admin") config.admin = to_address(key, val_str);
            else known = false;
        }
        else {
            known = false;
        }

        if (!known) {
            BENEFACTOR_LOG(Debug, "CONFIG") << "Ignoring " << current_section << "." << key;
        }
    }
    return config;
}

void NodeConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        BENEFACTOR_LOG(Error, "CONFIG") << "Cannot write " << path;
        return;
    }

    file << "# Benefactor Node Configuration\n\n";

    file << "[node]\n";
    file << "name = \"" << node_name << "\"\n";
    file << "data_dir = \"" << data_dir << "\"\n";
    file << "persistent = " << (persistent ? "true" : "false") << "\n";
    file << "log_level = \"" << logging::level_name(log_level) << "\"\n";
    file << "verifier = \"" << verifier << "\"\n\n";

    file << "[charity]\n";
    file << "name = \"" << charity.name << "\"\n";
    file << "foundation = \"" << charity.foundation << "\"\n";
    file << "link = \"" << charity.link << "\"\n";
    file << "source = \"" << charity.source << "\"\n";
    file << "image = \"" << charity.image_locator << "\"\n";
    file << "suggested_price = " << charity.suggested_price.str() << "\n";
    file << "registered_at = " << charity.registered_at << "\n";
    if (!payout_address.is_zero()) file << "payout_address = \"" << payout_address.to_bech32() << "\"\n";
    file << "\n";

    file << "[registry]\n";
    file << "base_locator = \"" << base_locator << "\"\n";
    if (!admin.is_zero()) file << "admin = \"" << admin.to_bech32() << "\"\n";
}

// ============================================================================
// Node Implementation
// ============================================================================

Node::Node(const NodeConfig& config, std::shared_ptr<payment::PaymentRail> rail)
    : config_(config), rail_(std::move(rail)) {
    logging::set_level(config_.log_level);
    BENEFACTOR_LOG(Info, "BENEFACTOR") << "Creating node with config:";
    BENEFACTOR_LOG(Info, "BENEFACTOR") << "  Name: " << config_.node_name;
    BENEFACTOR_LOG(Info, "BENEFACTOR") << "  Data dir: " << (config_.persistent ? config_.data_dir : "(memory)");
    BENEFACTOR_LOG(Info, "BENEFACTOR") << "  Charity: " << config_.charity.name;
}

bool Node::initialize() {
    BENEFACTOR_LOG(Info, "BENEFACTOR") << "Initializing node...";

    try {
        if (!rail_) {
            BENEFACTOR_LOG(Error, "BENEFACTOR") << "No payment rail configured";
            return false;
        }

        if (config_.persistent) {
            std::string db_path = config_.data_dir + "/state.log";
            BENEFACTOR_LOG(Info, "BENEFACTOR") << "Opening database at " << db_path;
            auto db = std::make_shared<storage::PersistentDatabase>(db_path);
            if (!db->is_open()) {
                BENEFACTOR_LOG(Error, "BENEFACTOR") << "Database at " << db_path << " is not writable";
                return false;
            }
            db_ = db;
        } else {
            db_ = std::make_shared<storage::MemoryDatabase>();
        }
        store_ = std::make_shared<storage::StateStore>(db_);

        auto invoice_tokens = restore_state();
        if (!registry_) {
            return false;
        }

        verifier_ = verification::make_verifier(config_.verifier);
        if (!verifier_) {
            BENEFACTOR_LOG(Error, "BENEFACTOR") << "Unknown proof verifier: " << config_.verifier;
            return false;
        }

        orchestrator_ = std::make_shared<DonationOrchestrator>(
            config_.charity, config_.payout_address, rail_, registry_, ledger_, verifier_,
            store_, invoice_tokens);

        BENEFACTOR_LOG(Info, "BENEFACTOR") << "Initialization complete!";
        return true;

    } catch (const std::exception& e) {
        BENEFACTOR_LOG(Error, "BENEFACTOR") << "Initialization failed: " << e.what();
        orchestrator_.reset();
        return false;
    }
}

std::vector<std::pair<Address, TokenId>> Node::restore_state() {
    auto stored = store_->load();
    if (stored) {
        if (!config_.admin.is_zero() && !(stored->registry.admin == config_.admin)) {
            BENEFACTOR_LOG(Warn, "BENEFACTOR") << "Configured admin differs from stored admin "
                                               << stored->registry.admin.to_hex() << ", keeping stored";
        }
        registry_ = std::make_shared<registry::TokenRegistry>(std::move(stored->registry));
        ledger_ = std::make_shared<ledger::DonationLedger>(std::move(stored->ledger));
        return std::move(stored->invoice_tokens);
    }

    if (config_.admin.is_zero()) {
        BENEFACTOR_LOG(Error, "BENEFACTOR") << "Registry administrator is not configured";
        return {};
    }

    BENEFACTOR_LOG(Info, "BENEFACTOR") << "Fresh state, base locator \"" << config_.base_locator << "\"";
    storage::StateStore::Batch batch;
    batch.put_meta(config_.admin, config_.base_locator);
    if (!store_->commit(batch)) {
        BENEFACTOR_LOG(Error, "BENEFACTOR") << "Cannot write initial registry metadata";
        return {};
    }

    registry_ = std::make_shared<registry::TokenRegistry>(config_.admin, config_.base_locator);
    ledger_ = std::make_shared<ledger::DonationLedger>();
    return {};
}

} // namespace benefactor

#include <cstdlib>
#include <iostream>
#include <sstream>
#include "benefactor/node.hpp"

using namespace benefactor;

void print_banner() {
    std::cout << R"(
    +-----------------------------------------------+
    |                                               |
    |   B E N E F A C T O R                         |
    |                                               |
    |   Donation ledger and proof-of-gift tokens    |
    |                                               |
    +-----------------------------------------------+
    )" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [command [args...]]\n"
              << "\nOptions:\n"
              << "  --config <path>      Path to config file (default: benefactor.toml)\n"
              << "  --data-dir <path>    Data directory (default: ./data)\n"
              << "  --memory             Keep state in memory only\n"
              << "  --log-level <level>  Log level: trace, debug, info, warn, error\n"
              << "  --help               Show this help message\n"
              << "\nWithout a command, commands are read from stdin.\n"
              << std::endl;
}

void print_commands() {
    std::cout << "Commands:\n"
              << "  info                                  Charity and registry details\n"
              << "  fund <addr> <amount>                  Credit a payment account\n"
              << "  approve <addr> <amount>               Authorize the node to pull funds\n"
              << "  donate <addr> <amount>                Donate and mint a token\n"
              << "  verify <addr> <proof-hex> <invoice>   Verify an off-chain payment\n"
              << "  donations                             List all donations\n"
              << "  total <addr>                          Cumulative donations of a donor\n"
              << "  invoice <addr>                        Latest invoice token of a donor\n"
              << "  token <id>                            Token owner and locator\n"
              << "  set-base <caller> <base>              Change the locator base\n"
              << "  help                                  This list\n"
              << "  quit                                  Leave the console\n"
              << std::endl;
}

struct Options {
    NodeConfig config;
    std::vector<std::string> command;
};

Options parse_args(int argc, char* argv[]) {
    Options options;

    // The config file is read first so the other flags override it
    std::string config_path = "benefactor.toml";
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
        }
    }
    options.config = NodeConfig::from_file(config_path);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!options.command.empty()) {
            options.command.push_back(arg);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            print_commands();
            std::exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--data-dir" && i + 1 < argc) {
            options.config.data_dir = argv[++i];
        } else if (arg == "--memory") {
            options.config.persistent = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level = argv[++i];
            auto parsed = logging::parse_level(level);
            if (parsed) options.config.log_level = *parsed;
            else std::cerr << "[BENEFACTOR] Unknown log level: " << level << std::endl;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "[BENEFACTOR] Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            std::exit(1);
        } else {
            options.command.push_back(arg);
        }
    }

    return options;
}

static int fail(const std::string& message) {
    std::cerr << "[BENEFACTOR] Error: " << message << std::endl;
    return 1;
}

static int fail(const Status& status) {
    return fail(std::string(error_name(status.code)) + ": " + status.error);
}

static std::optional<Address> arg_address(const std::string& str) {
    auto addr = Address::parse(str);
    if (!addr) {
        std::cerr << "[BENEFACTOR] Not an address: " << str << std::endl;
    }
    return addr;
}

static std::optional<Amount> arg_amount(const std::string& str) {
    auto amount = parse_amount(str);
    if (!amount) {
        std::cerr << "[BENEFACTOR] Not an amount: " << str << std::endl;
    }
    return amount;
}

// Returns the process exit code for the command
int run_command(Node& node, payment::AccountRail& rail, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto orchestrator = node.orchestrator();
    auto registry = node.token_registry();

    auto want = [&](size_t n) {
        if (args.size() != n + 1) {
            std::cerr << "[BENEFACTOR] " << cmd << " takes " << n << " argument(s)" << std::endl;
            return false;
        }
        return true;
    };

    if (cmd == "help") {
        print_commands();
        return 0;
    }

    if (cmd == "quit" || cmd == "exit") {
        return 0;
    }

    if (cmd == "info") {
        if (!want(0)) return 1;
        const auto& charity = orchestrator->charity_info();
        std::cout << "Charity:         " << charity.name << "\n"
                  << "Foundation:      " << charity.foundation << "\n"
                  << "Link:            " << charity.link << "\n"
                  << "Source:          " << charity.source << "\n"
                  << "Image:           " << charity.image_locator << "\n"
                  << "Suggested price: " << charity.suggested_price.str() << "\n"
                  << "Registered at:   " << charity.registered_at << "\n"
                  << "Payout address:  " << orchestrator->payout_address().to_bech32() << "\n"
                  << "Administrator:   " << registry->admin().to_bech32() << "\n"
                  << "Base locator:    " << registry->base_locator() << "\n"
                  << "Tokens minted:   " << registry->total_supply() << "\n"
                  << "Donors:          " << node.donation_ledger()->donor_count() << std::endl;
        return 0;
    }

    if (cmd == "fund" || cmd == "approve") {
        if (!want(2)) return 1;
        auto addr = arg_address(args[1]);
        auto amount = arg_amount(args[2]);
        if (!addr || !amount) return 1;
        if (cmd == "fund") {
            if (!rail.credit(*addr, *amount)) return fail("balance of " + args[1] + " would overflow");
            std::cout << "Balance of " << args[1] << ": " << rail.balance_of(*addr).str() << std::endl;
        } else {
            rail.approve(*addr, *amount);
            std::cout << "Allowance of " << args[1] << ": " << rail.allowance(*addr).str() << std::endl;
        }
        return 0;
    }

    if (cmd == "donate") {
        if (!want(2)) return 1;
        auto donor = arg_address(args[1]);
        auto amount = arg_amount(args[2]);
        if (!donor || !amount) return 1;
        auto result = orchestrator->donate(*donor, *amount);
        if (!result.ok()) return fail(result.status());
        std::cout << "Token #" << result.value << ": " << registry->locator_of(result.value).value << std::endl;
        return 0;
    }

    if (cmd == "verify") {
        if (!want(3)) return 1;
        auto donor = arg_address(args[1]);
        if (!donor) return 1;
        auto proof = ProofData::from_hex(args[2]);
        if (!proof) return fail("proof is not valid hex");
        auto result = orchestrator->verify_donation(*donor, *proof, args[3]);
        if (!result.ok()) return fail(result.status());
        std::cout << "Token #" << result.value << ": " << registry->locator_of(result.value).value << std::endl;
        return 0;
    }

    if (cmd == "donations") {
        if (!want(0)) return 1;
        auto summary = orchestrator->all_donations();
        if (summary.donors.empty()) {
            std::cout << "No donations yet" << std::endl;
        }
        for (size_t i = 0; i < summary.donors.size(); ++i) {
            std::cout << summary.donors[i].to_bech32() << "  " << summary.amounts[i].str()
                      << (summary.verified[i] ? "  verified" : "") << std::endl;
        }
        return 0;
    }

    if (cmd == "total") {
        if (!want(1)) return 1;
        auto donor = arg_address(args[1]);
        if (!donor) return 1;
        std::cout << orchestrator->donations_of(*donor).str() << std::endl;
        return 0;
    }

    if (cmd == "invoice") {
        if (!want(1)) return 1;
        auto donor = arg_address(args[1]);
        if (!donor) return 1;
        auto result = orchestrator->invoice_token_of(*donor);
        if (!result.ok()) return fail(result.status());
        std::cout << "Token #" << result.value << ": " << registry->locator_of(result.value).value << std::endl;
        return 0;
    }

    if (cmd == "token") {
        if (!want(1)) return 1;
        uint64_t id = 0;
        std::istringstream in(args[1]);
        if (!(in >> id) || !in.eof()) return fail("not a token id: " + args[1]);
        auto owner = registry->owner_of(id);
        if (!owner.ok()) return fail(owner.status());
        std::cout << "Owner:   " << owner.value.to_bech32() << "\n"
                  << "Locator: " << registry->locator_of(id).value << std::endl;
        return 0;
    }

    if (cmd == "set-base") {
        if (!want(2)) return 1;
        auto caller = arg_address(args[1]);
        if (!caller) return 1;
        auto status = orchestrator->set_base_locator(*caller, args[2]);
        if (!status.ok()) return fail(status);
        std::cout << "Base locator: " << registry->base_locator() << std::endl;
        return 0;
    }

    std::cerr << "[BENEFACTOR] Unknown command: " << cmd << " (try help)" << std::endl;
    return 1;
}

void run_console(Node& node, payment::AccountRail& rail) {
    std::cout << "[BENEFACTOR] Console ready, type help for commands" << std::endl;
    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::vector<std::string> args;
        std::string word;
        while (in >> word) args.push_back(word);

        if (args.empty() || args[0][0] == '#') continue;
        if (args[0] == "quit" || args[0] == "exit") break;
        run_command(node, rail, args);
    }
}

int main(int argc, char* argv[]) {
    try {
        Options options = parse_args(argc, argv);
        bool console = options.command.empty();

        if (console) {
            print_banner();
        } else if (options.config.log_level < logging::Level::Warn) {
            // Keep one-shot output to the command's result
            options.config.log_level = logging::Level::Warn;
        }

        // Balances and allowances live only for this process
        auto rail = std::make_shared<payment::AccountRail>();

        Node node(options.config, rail);
        if (!node.initialize()) {
            std::cerr << "[BENEFACTOR] Failed to initialize node" << std::endl;
            return 1;
        }

        if (!console) {
            return run_command(node, *rail, options.command);
        }

        run_console(node, *rail);
        std::cout << "[BENEFACTOR] Shutdown complete" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[BENEFACTOR] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

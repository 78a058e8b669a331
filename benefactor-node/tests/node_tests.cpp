#include "tests/test_benefactor.hpp"
#include "benefactor/node.hpp"

#include <filesystem>
#include <fstream>
#include <boost/test/unit_test.hpp>

using namespace benefactor;
using benefactor::test::make_address;
using benefactor::test::make_proof;

struct NodeSetup {
    std::filesystem::path dir;
    NodeConfig config;
    std::shared_ptr<payment::AccountRail> rail = std::make_shared<payment::AccountRail>();

    NodeSetup()
    {
        dir = std::filesystem::temp_directory_path() /
              ("benefactor_node_" + std::to_string(reinterpret_cast<uintptr_t>(this)));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        config.data_dir = (dir / "data").string();
        config.log_level = logging::Level::Error;
        config.charity.name = "Clean Water";
        config.payout_address = make_address(0xC0);
        config.admin = make_address(0xA0);
        config.base_locator = "https://x/";
    }
    ~NodeSetup()
    {
        std::filesystem::remove_all(dir);
    }
};

BOOST_FIXTURE_TEST_SUITE(node_tests, NodeSetup)

BOOST_AUTO_TEST_CASE(config_from_file)
{
    std::string path = (dir / "benefactor.toml").string();
    {
        std::ofstream out(path);
        out << "# test config\n"
            << "[node]\n"
            << "name = \"water-node\"\n"
            << "data_dir = \"/var/lib/benefactor\"\n"
            << "persistent = false\n"
            << "log_level = \"debug\"\n"
            << "\n"
            << "[charity]\n"
            << "name = \"Clean Water\"\n"
            << "foundation = \"Water Foundation\"\n"
            << "suggested_price = 0050000000000000000\n"
            << "registered_at = 1700000000\n"
            << "payout_address = \"" << make_address(0xC0).to_bech32() << "\"\n"
            << "\n"
            << "[registry]\n"
            << "base_locator = \"https://meta.example/\"\n"
            << "admin = \"" << make_address(0xA0).to_hex() << "\"\n"
            << "unknown_key = 1\n";
    }

    auto loaded = NodeConfig::from_file(path);
    BOOST_CHECK_EQUAL(loaded.node_name, "water-node");
    BOOST_CHECK_EQUAL(loaded.data_dir, "/var/lib/benefactor");
    BOOST_CHECK(!loaded.persistent);
    BOOST_CHECK(loaded.log_level == logging::Level::Debug);
    BOOST_CHECK_EQUAL(loaded.charity.name, "Clean Water");
    BOOST_CHECK_EQUAL(loaded.charity.foundation, "Water Foundation");
    BOOST_CHECK(loaded.charity.suggested_price == Amount("50000000000000000"));
    BOOST_CHECK_EQUAL(loaded.charity.registered_at, 1700000000u);
    BOOST_CHECK(loaded.payout_address == make_address(0xC0));
    BOOST_CHECK_EQUAL(loaded.base_locator, "https://meta.example/");
    BOOST_CHECK(loaded.admin == make_address(0xA0));
}

BOOST_AUTO_TEST_CASE(config_save_and_reload)
{
    std::string path = (dir / "saved.toml").string();
    config.charity.suggested_price = Amount(42);
    config.charity.registered_at = 123;
    config.save_to_file(path);

    auto loaded = NodeConfig::from_file(path);
    BOOST_CHECK_EQUAL(loaded.data_dir, config.data_dir);
    BOOST_CHECK(loaded.log_level == logging::Level::Error);
    BOOST_CHECK(loaded.charity.suggested_price == 42);
    BOOST_CHECK_EQUAL(loaded.charity.registered_at, 123u);
    BOOST_CHECK(loaded.payout_address == config.payout_address);
    BOOST_CHECK(loaded.admin == config.admin);
    BOOST_CHECK_EQUAL(loaded.base_locator, "https://x/");
}

BOOST_AUTO_TEST_CASE(missing_config_uses_defaults)
{
    auto loaded = NodeConfig::from_file((dir / "absent.toml").string());
    BOOST_CHECK_EQUAL(loaded.node_name, "benefactor-node");
    BOOST_CHECK(loaded.persistent);
}

BOOST_AUTO_TEST_CASE(initialize_in_memory)
{
    config.persistent = false;
    Node node(config, rail);
    BOOST_REQUIRE(node.initialize());
    BOOST_CHECK(node.is_initialized());
    BOOST_CHECK_EQUAL(node.token_registry()->base_locator(), "https://x/");
    BOOST_CHECK(node.orchestrator()->payout_address() == make_address(0xC0));
}

BOOST_AUTO_TEST_CASE(initialize_requires_admin_and_payout)
{
    config.persistent = false;
    config.admin = Address{};
    Node no_admin(config, rail);
    BOOST_CHECK(!no_admin.initialize());
    BOOST_CHECK(!no_admin.is_initialized());

    config.admin = make_address(0xA0);
    config.payout_address = Address{};
    Node no_payout(config, rail);
    BOOST_CHECK(!no_payout.initialize());
}

BOOST_AUTO_TEST_CASE(initialize_rejects_unknown_verifier)
{
    config.persistent = false;
    config.verifier = "groth16";
    Node node(config, rail);
    BOOST_CHECK(!node.initialize());
}

BOOST_AUTO_TEST_CASE(state_survives_restart)
{
    Address alice = make_address(1);
    rail->credit(alice, Amount(100));
    rail->approve(alice, Amount(100));

    {
        Node node(config, rail);
        BOOST_REQUIRE(node.initialize());
        auto orchestrator = node.orchestrator();
        BOOST_REQUIRE(orchestrator->donate(alice, Amount(40)).ok());
        BOOST_REQUIRE(orchestrator->donate(alice, Amount(2)).ok());
        BOOST_REQUIRE(orchestrator->verify_donation(alice, make_proof("p"), "INV-1").ok());
        BOOST_REQUIRE(orchestrator->set_base_locator(make_address(0xA0), "ipfs://cid/").ok());
    }

    // Config changes to the registry do not override stored state
    config.base_locator = "https://ignored/";
    Node node(config, rail);
    BOOST_REQUIRE(node.initialize());
    auto orchestrator = node.orchestrator();
    auto registry = node.token_registry();

    BOOST_CHECK_EQUAL(registry->next_token_id(), 3u);
    BOOST_CHECK_EQUAL(registry->base_locator(), "ipfs://cid/");
    BOOST_CHECK_EQUAL(registry->locator_of(1).value, "ipfs://cid/1.json?donation=2");
    BOOST_CHECK(orchestrator->donations_of(alice) == 42);
    BOOST_CHECK(orchestrator->record_of(alice).amount == 2);
    BOOST_CHECK(orchestrator->state_of(alice) == ledger::DonorState::Verified);
    BOOST_CHECK_EQUAL(orchestrator->invoice_token_of(alice).value, 2u);
    BOOST_CHECK_EQUAL(node.donation_ledger()->donor_count(), 1u);

    // Ids continue after the restored tokens
    BOOST_REQUIRE(orchestrator->donate(alice, Amount(1)).ok());
    BOOST_CHECK_EQUAL(registry->next_token_id(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

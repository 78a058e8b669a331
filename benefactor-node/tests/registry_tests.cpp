#include "tests/test_benefactor.hpp"

#include <boost/test/unit_test.hpp>

using namespace benefactor;
using benefactor::test::make_address;

struct RegistrySetup {
    Address admin = make_address(0xA0);
    benefactor::registry::TokenRegistry registry{admin, "https://x/"};
    std::shared_ptr<benefactor::registry::TokenMinter> minter = registry.grant_minter();
};

BOOST_FIXTURE_TEST_SUITE(registry_tests, RegistrySetup)

BOOST_AUTO_TEST_CASE(minter_granted_once)
{
    BOOST_REQUIRE(minter);
    BOOST_CHECK(!registry.grant_minter());
}

BOOST_AUTO_TEST_CASE(ids_are_dense_and_monotonic)
{
    Address alice = make_address(1);
    Address bob = make_address(2);

    BOOST_CHECK_EQUAL(registry.next_token_id(), 0u);
    BOOST_CHECK_EQUAL(minter->mint(alice, ".json?donation=1"), 0u);
    BOOST_CHECK_EQUAL(minter->mint(bob, ".json?donation=2"), 1u);
    BOOST_CHECK_EQUAL(minter->mint(alice, ".json?invoiceId=A"), 2u);

    BOOST_CHECK_EQUAL(registry.total_supply(), 3u);
    BOOST_CHECK_EQUAL(registry.balance_of(alice), 2u);
    BOOST_CHECK_EQUAL(registry.balance_of(bob), 1u);
    BOOST_CHECK(registry.tokens_of(alice) == (std::vector<TokenId>{0, 2}));
    BOOST_CHECK(registry.owner_of(1).value == bob);
}

BOOST_AUTO_TEST_CASE(locator_uses_current_base)
{
    Address alice = make_address(1);
    TokenId id = minter->mint(alice, ".json?donation=5000000000000000000");

    auto locator = registry.locator_of(id);
    BOOST_REQUIRE(locator.ok());
    BOOST_CHECK_EQUAL(locator.value, "https://x/0.json?donation=5000000000000000000");

    BOOST_CHECK(registry.set_base_locator(admin, "ipfs://cid/").ok());
    BOOST_CHECK_EQUAL(registry.locator_of(id).value, "ipfs://cid/0.json?donation=5000000000000000000");
}

BOOST_AUTO_TEST_CASE(unknown_token)
{
    auto locator = registry.locator_of(0);
    BOOST_CHECK(locator.code == ErrorCode::TokenNotFound);

    minter->mint(make_address(1), ".json");
    BOOST_CHECK(registry.locator_of(0).ok());
    BOOST_CHECK(registry.owner_of(1).code == ErrorCode::TokenNotFound);
    BOOST_CHECK(!registry.token(1));
}

BOOST_AUTO_TEST_CASE(base_locator_admin_only)
{
    auto status = registry.set_base_locator(make_address(7), "https://evil/");
    BOOST_CHECK(status.code == ErrorCode::Unauthorized);
    BOOST_CHECK_EQUAL(registry.base_locator(), "https://x/");
}

BOOST_AUTO_TEST_CASE(admin_recognized_on_either_network)
{
    Address testnet_admin = admin;
    testnet_admin.is_mainnet = false;

    BOOST_CHECK(registry.set_base_locator(testnet_admin, "https://y/").ok());
    BOOST_CHECK_EQUAL(registry.base_locator(), "https://y/");
}

BOOST_AUTO_TEST_CASE(admin_transfer)
{
    Address next = make_address(0xA1);

    BOOST_CHECK(registry.transfer_admin(next, next).code == ErrorCode::Unauthorized);
    BOOST_CHECK(registry.transfer_admin(admin, Address{}).code == ErrorCode::InvalidAddress);
    BOOST_CHECK(registry.transfer_admin(admin, next).ok());
    BOOST_CHECK(registry.admin() == next);

    BOOST_CHECK(registry.set_base_locator(admin, "https://old/").code == ErrorCode::Unauthorized);
    BOOST_CHECK(registry.set_base_locator(next, "https://new/").ok());
}

BOOST_AUTO_TEST_CASE(donation_totals_accumulate)
{
    Address alice = make_address(1);
    BOOST_CHECK(registry.donations_of(alice) == 0);

    minter->record_donation(alice, Amount(1));
    minter->record_donation(alice, Amount(2));
    BOOST_CHECK(registry.donations_of(alice) == 3);
    BOOST_CHECK(registry.donations_of(make_address(2)) == 0);
}

BOOST_AUTO_TEST_CASE(mint_to_zero_address_throws)
{
    BOOST_CHECK_THROW(minter->mint(Address{}, ".json"), std::invalid_argument);
    BOOST_CHECK_EQUAL(registry.next_token_id(), 0u);
}

BOOST_AUTO_TEST_CASE(mint_emits_transfer_log)
{
    Address alice = make_address(1);
    minter->mint(alice, ".json");

    auto logs = registry.logs();
    BOOST_REQUIRE_EQUAL(logs.size(), 1u);
    BOOST_REQUIRE_EQUAL(logs[0].topics.size(), 3u);
    BOOST_CHECK_EQUAL(logs[0].topics[0], "Transfer(address,address,uint64)");
    BOOST_CHECK_EQUAL(logs[0].topics[1], Address{}.to_hex());
    BOOST_CHECK_EQUAL(logs[0].topics[2], alice.to_hex());
}

BOOST_AUTO_TEST_CASE(revert_undoes_mints_and_totals)
{
    Address alice = make_address(1);
    minter->record_donation(alice, Amount(10));
    minter->mint(alice, ".json?donation=10");
    registry.commit();

    auto snap = registry.snapshot();
    minter->record_donation(alice, Amount(5));
    minter->record_donation(make_address(2), Amount(7));
    minter->mint(alice, ".json?donation=5");
    registry.revert(snap);

    BOOST_CHECK_EQUAL(registry.next_token_id(), 1u);
    BOOST_CHECK_EQUAL(registry.balance_of(alice), 1u);
    BOOST_CHECK(registry.donations_of(alice) == 10);
    BOOST_CHECK(registry.donations_of(make_address(2)) == 0);
    BOOST_CHECK_EQUAL(registry.logs().size(), 1u);

    // The next id is reused only because the mint never committed
    BOOST_CHECK_EQUAL(minter->mint(alice, ".json"), 1u);
}

BOOST_AUTO_TEST_CASE(restore_from_state)
{
    benefactor::registry::RegistryState state;
    state.admin = admin;
    state.base_locator = "https://y/";
    state.tokens.push_back(Token{0, make_address(1), ".json?donation=1"});
    state.tokens.push_back(Token{1, make_address(2), ".json?donation=2"});
    state.totals.push_back(benefactor::registry::DonorTotal{make_address(1), Amount(1)});

    benefactor::registry::TokenRegistry restored(state);
    BOOST_CHECK_EQUAL(restored.next_token_id(), 2u);
    BOOST_CHECK_EQUAL(restored.locator_of(1).value, "https://y/1.json?donation=2");
    BOOST_CHECK(restored.donations_of(make_address(1)) == 1);

    auto restored_minter = restored.grant_minter();
    BOOST_REQUIRE(restored_minter);
    BOOST_CHECK_EQUAL(restored_minter->mint(make_address(3), ".json"), 2u);

    state.tokens.erase(state.tokens.begin());
    BOOST_CHECK_THROW(benefactor::registry::TokenRegistry{state}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

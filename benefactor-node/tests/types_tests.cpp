#include "tests/test_benefactor.hpp"

#include <limits>
#include <boost/test/unit_test.hpp>

using namespace benefactor;
using benefactor::test::make_address;

BOOST_AUTO_TEST_SUITE(types_tests)

// =============================================================================
// Amounts
// =============================================================================
BOOST_AUTO_TEST_CASE(parse_amount_decimal)
{
    auto five_eth = parse_amount("5000000000000000000");
    BOOST_REQUIRE(five_eth);
    BOOST_CHECK_EQUAL(five_eth->str(), "5000000000000000000");

    // Leading zeros are decimal, not octal
    auto ten = parse_amount("0010");
    BOOST_REQUIRE(ten);
    BOOST_CHECK(*ten == 10);

    auto zero = parse_amount("000");
    BOOST_REQUIRE(zero);
    BOOST_CHECK(*zero == 0);
}

BOOST_AUTO_TEST_CASE(parse_amount_rejects_malformed)
{
    BOOST_CHECK(!parse_amount(""));
    BOOST_CHECK(!parse_amount("-1"));
    BOOST_CHECK(!parse_amount("1.5"));
    BOOST_CHECK(!parse_amount("12a"));
    BOOST_CHECK(!parse_amount(" 12"));
    BOOST_CHECK(!parse_amount(std::string(79, '1')));
}

BOOST_AUTO_TEST_CASE(parse_amount_full_range)
{
    auto max = parse_amount("115792089237316195423570985008687907853269984665640564039457584007913129639935");
    BOOST_REQUIRE(max);
    BOOST_CHECK(*max == std::numeric_limits<Amount>::max());

    // 2^256
    BOOST_CHECK(!parse_amount("115792089237316195423570985008687907853269984665640564039457584007913129639936"));
}

BOOST_AUTO_TEST_CASE(amount_overflow_throws)
{
    Amount max = std::numeric_limits<Amount>::max();
    BOOST_CHECK_THROW(max + 1, std::overflow_error);
}

// =============================================================================
// Addresses
// =============================================================================
BOOST_AUTO_TEST_CASE(address_zero)
{
    BOOST_CHECK(Address{}.is_zero());
    BOOST_CHECK(!make_address(1).is_zero());
}

BOOST_AUTO_TEST_CASE(address_bech32_mainnet_and_testnet)
{
    Address addr = make_address(0x42);
    std::string encoded = addr.to_bech32();
    BOOST_CHECK(encoded.starts_with("addr1"));

    auto decoded = Address::parse(encoded);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == addr);

    addr.is_mainnet = false;
    encoded = addr.to_bech32();
    BOOST_CHECK(encoded.starts_with("addr_test1"));
    decoded = Address::parse(encoded);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(!decoded->is_mainnet);
    BOOST_CHECK(*decoded == addr);
}

BOOST_AUTO_TEST_CASE(address_identity_ignores_network)
{
    Address mainnet = make_address(0x42);
    Address testnet = mainnet;
    testnet.is_mainnet = false;

    BOOST_CHECK(mainnet == testnet);
    BOOST_CHECK_EQUAL(mainnet.to_hex(), testnet.to_hex());
    BOOST_CHECK(mainnet.to_bech32() != testnet.to_bech32());

    Address other_type = mainnet;
    other_type.type = Address::Type::Script;
    BOOST_CHECK(!(mainnet == other_type));
    BOOST_CHECK(mainnet.to_hex() != other_type.to_hex());

    Address staked = mainnet;
    staked.stake_credential = std::array<uint8_t, 28>{};
    BOOST_CHECK(!(mainnet == staked));
    BOOST_CHECK(mainnet.to_hex() != staked.to_hex());
}

BOOST_AUTO_TEST_CASE(address_with_stake_credential)
{
    Address addr = make_address(0x07);
    addr.type = Address::Type::Base;
    addr.stake_credential = std::array<uint8_t, 28>{};
    (*addr.stake_credential)[5] = 0x99;

    auto decoded = Address::from_bech32(addr.to_bech32());
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == addr);

    auto from_hex = Address::from_hex(addr.to_hex());
    BOOST_REQUIRE(from_hex);
    BOOST_CHECK(*from_hex == addr);
}

BOOST_AUTO_TEST_CASE(address_hex_forms)
{
    Address addr = make_address(0x11);

    // Bare 28-byte credential
    auto bare = Address::parse("0x" + to_hex(addr.payment_credential.data(), 28));
    BOOST_REQUIRE(bare);
    BOOST_CHECK(*bare == addr);

    // Type byte + credential
    auto typed = Address::parse(addr.to_hex());
    BOOST_REQUIRE(typed);
    BOOST_CHECK(*typed == addr);

    BOOST_CHECK(!Address::parse("0x1234"));
    BOOST_CHECK(!Address::parse("zz"));
    BOOST_CHECK(!Address::parse("addr1qqqqqq"));
}

BOOST_AUTO_TEST_CASE(address_bech32_detects_corruption)
{
    std::string encoded = make_address(0x33).to_bech32();
    char& c = encoded[encoded.size() - 3];
    c = (c == 'q') ? 'p' : 'q';
    BOOST_CHECK(!Address::from_bech32(encoded));
}

// =============================================================================
// Records
// =============================================================================
BOOST_AUTO_TEST_CASE(donation_record_codec)
{
    DonationRecord record;
    record.donor = make_address(9);
    record.amount = *parse_amount("340282366920938463463374607431768211457");
    record.verified = true;
    record.invoice_id = "INV-2024-0007";

    auto decoded = DonationRecord::decode(record.encode());
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(decoded->donor == record.donor);
    BOOST_CHECK(decoded->amount == record.amount);
    BOOST_CHECK(decoded->verified);
    BOOST_REQUIRE(decoded->invoice_id);
    BOOST_CHECK_EQUAL(*decoded->invoice_id, "INV-2024-0007");

    Bytes truncated = record.encode();
    truncated.pop_back();
    BOOST_CHECK(!DonationRecord::decode(truncated));
}

BOOST_AUTO_TEST_CASE(token_codec)
{
    Token token{17, make_address(3), ".json?invoiceId=abc"};
    auto decoded = Token::decode(token.encode());
    BOOST_REQUIRE(decoded);
    BOOST_CHECK_EQUAL(decoded->id, 17u);
    BOOST_CHECK(decoded->owner == token.owner);
    BOOST_CHECK_EQUAL(decoded->suffix, token.suffix);
}

BOOST_AUTO_TEST_CASE(proof_data_emptiness)
{
    BOOST_CHECK(ProofData{}.is_empty());
    BOOST_CHECK(ProofData{Bytes(32, 0)}.is_empty());
    BOOST_CHECK(!(ProofData{Bytes{0, 0, 1}}.is_empty()));

    auto proof = ProofData::from_hex("0xdeadbeef");
    BOOST_REQUIRE(proof);
    BOOST_CHECK_EQUAL(proof->payload.size(), 4u);
    BOOST_CHECK(!ProofData::from_hex("abc"));
}

BOOST_AUTO_TEST_SUITE_END()

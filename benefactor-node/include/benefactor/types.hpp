#pragma once

#include <vector>
#include <string>
#include <array>
#include <cstdint>
#include <optional>
#include <boost/multiprecision/cpp_int.hpp>

namespace benefactor {

using Bytes = std::vector<uint8_t>;

// Smallest indivisible unit of the payment asset. Overflow throws.
using Amount = boost::multiprecision::checked_uint256_t;

using TokenId = uint64_t;

std::optional<Amount> parse_amount(const std::string& str);

/**
 * @brief Donor / administrator / payee address - Bech32 or hex
 *
 * Format: addr1<payload> (mainnet) or addr_test1<payload> (testnet)
 * Payload:
 *   - Address type (1 byte): 0x00 = base, 0x01 = enterprise, 0x02 = script
 *   - Payment credential (28 bytes)
 *   - Optional stake credential (28 bytes)
 *
 * The all-zero payment credential is the null address.
 */
struct Address {
    enum class Type : uint8_t {
        Base = 0x00,
        Enterprise = 0x01,
        Script = 0x02
    };

    Type type{Type::Enterprise};
    std::array<uint8_t, 28> payment_credential{};
    std::optional<std::array<uint8_t, 28>> stake_credential;
    bool is_mainnet{true};

    std::string to_bech32() const;
    static std::optional<Address> from_bech32(const std::string& str);
    static std::optional<Address> from_hex(const std::string& str);

    // Accepts either bech32 or hex
    static std::optional<Address> parse(const std::string& str);

    bool is_zero() const;

    // Network is a display property; identity is type and credentials, as in to_hex()
    bool operator==(const Address& other) const;

    // For use as map key
    std::string to_hex() const;
};

/**
 * @brief Event entry emitted by the registry and orchestrator
 *
 * topics[0] is the event signature, followed by the hex form of each
 * indexed address.
 */
struct Log {
    Address address;
    std::vector<std::string> topics;
    Bytes data;
};

/**
 * @brief Minted token
 *
 * The locator is never stored: it is derived as base + id + suffix
 * from whatever base the registry holds at query time.
 */
struct Token {
    TokenId id{0};
    Address owner;
    std::string suffix;

    Bytes encode() const;
    static std::optional<Token> decode(const Bytes& data);
};

/**
 * @brief Latest donation of a donor
 *
 * One per donor. A new donation overwrites amount and clears
 * verified / invoice_id.
 */
struct DonationRecord {
    Address donor;
    Amount amount{0};
    bool verified{false};
    std::optional<std::string> invoice_id;

    Bytes encode() const;
    static std::optional<DonationRecord> decode(const Bytes& data);
};

/**
 * @brief Static description of the charity this node collects for
 */
struct CharityDescriptor {
    std::string link;
    uint64_t registered_at{0};   // Unix seconds
    std::string name;
    std::string foundation;
    std::string source;
    Amount suggested_price{0};
    std::string image_locator;
};

/**
 * @brief Roster-ordered view over all donations
 */
struct DonationSummary {
    std::vector<Address> donors;
    std::vector<Amount> amounts;
    std::vector<bool> verified;
};

/**
 * @brief Proof of payment presented for verification
 */
struct ProofData {
    Bytes payload;

    // Empty or all-zero payload
    bool is_empty() const;

    static std::optional<ProofData> from_hex(const std::string& str);
};

std::string to_hex(const uint8_t* data, size_t len);

namespace codec {

// Big-endian, length-prefixed encoding shared by records and the state store
void append_uint8(Bytes& out, uint8_t v);
void append_uint64(Bytes& out, uint64_t v);
void append_amount(Bytes& out, const Amount& amount);  // 32 bytes
void append_bytes(Bytes& out, const Bytes& b);
void append_string(Bytes& out, const std::string& s);
void append_address(Bytes& out, const Address& addr);

class Reader {
public:
    explicit Reader(const Bytes& data) : data_(data) {}

    std::optional<uint64_t> read_uint64();
    std::optional<uint8_t> read_uint8();
    std::optional<Bytes> read_bytes();
    std::optional<std::string> read_string();
    std::optional<Address> read_address();
    std::optional<Amount> read_amount();

    bool at_end() const { return offset_ == data_.size(); }

private:
    const Bytes& data_;
    size_t offset_{0};
};

} // namespace codec

} // namespace benefactor

#include "benefactor/types.hpp"
#include "benefactor/bech32.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace benefactor {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::optional<Bytes> parse_hex(std::string hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex = hex.substr(2);
    }
    if (hex.size() % 2 != 0) return std::nullopt;

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

// ============================================================================
// Amount
// ============================================================================

std::optional<Amount> parse_amount(const std::string& str) {
    // 2^256 - 1 has 78 decimal digits
    if (str.empty() || str.size() > 78) return std::nullopt;
    if (!std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    // A leading zero would select octal parsing
    auto first = str.find_first_not_of('0');
    std::string digits = (first == std::string::npos) ? "0" : str.substr(first);
    try {
        return Amount(digits);
    } catch (const std::runtime_error&) {
        // range_error / overflow_error past 2^256 - 1
        return std::nullopt;
    }
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::to_bech32() const {
    std::vector<uint8_t> payload;
    payload.push_back(static_cast<uint8_t>(type));
    payload.insert(payload.end(), payment_credential.begin(), payment_credential.end());

    if (stake_credential.has_value()) {
        payload.insert(payload.end(), stake_credential->begin(), stake_credential->end());
    }

    return bech32::encode(is_mainnet ? bech32::MAINNET_HRP : bech32::TESTNET_HRP, payload);
}

static std::optional<Address> address_from_payload(const Bytes& data) {
    if (data.size() != 29 && data.size() != 57) {
        return std::nullopt;
    }
    if (data[0] > static_cast<uint8_t>(Address::Type::Script)) {
        return std::nullopt;
    }

    Address addr;
    addr.type = static_cast<Address::Type>(data[0]);
    std::copy(data.begin() + 1, data.begin() + 29, addr.payment_credential.begin());

    if (data.size() == 57) {
        addr.stake_credential = std::array<uint8_t, 28>{};
        std::copy(data.begin() + 29, data.begin() + 57, addr.stake_credential->begin());
    }
    return addr;
}

std::optional<Address> Address::from_bech32(const std::string& str) {
    auto decoded = bech32::decode(str);
    if (!decoded) {
        return std::nullopt;
    }

    bool mainnet = (decoded->hrp == bech32::MAINNET_HRP);
    if (!mainnet && decoded->hrp != bech32::TESTNET_HRP) {
        return std::nullopt;
    }

    auto addr = address_from_payload(decoded->data);
    if (addr) {
        addr->is_mainnet = mainnet;
    }
    return addr;
}

std::optional<Address> Address::from_hex(const std::string& str) {
    auto bytes = parse_hex(str);
    if (!bytes) return std::nullopt;

    // Bare payment credential: enterprise address
    if (bytes->size() == 28) {
        Address addr;
        std::copy(bytes->begin(), bytes->end(), addr.payment_credential.begin());
        return addr;
    }
    return address_from_payload(*bytes);
}

std::optional<Address> Address::parse(const std::string& str) {
    if (str.starts_with(bech32::MAINNET_HRP)) {
        return from_bech32(str);
    }
    return from_hex(str);
}

bool Address::operator==(const Address& other) const {
    return type == other.type &&
           payment_credential == other.payment_credential &&
           stake_credential == other.stake_credential;
}

bool Address::is_zero() const {
    return std::all_of(payment_credential.begin(), payment_credential.end(),
                       [](uint8_t b) { return b == 0; });
}

std::string Address::to_hex() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(2) << static_cast<int>(type);
    for (auto b : payment_credential) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    if (stake_credential.has_value()) {
        for (auto b : *stake_credential) {
            ss << std::setw(2) << static_cast<int>(b);
        }
    }
    return ss.str();
}

// ============================================================================
// ProofData
// ============================================================================

bool ProofData::is_empty() const {
    return std::all_of(payload.begin(), payload.end(), [](uint8_t b) { return b == 0; });
}

std::optional<ProofData> ProofData::from_hex(const std::string& str) {
    auto bytes = parse_hex(str);
    if (!bytes) return std::nullopt;
    return ProofData{std::move(*bytes)};
}

// ============================================================================
// Codec
// ============================================================================

namespace codec {

void append_uint8(Bytes& out, uint8_t v) {
    out.push_back(v);
}

void append_uint64(Bytes& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void append_amount(Bytes& out, const Amount& amount) {
    for (int i = 31; i >= 0; --i) {
        Amount byte = (amount >> (i * 8)) & 0xFF;
        out.push_back(byte.convert_to<uint8_t>());
    }
}

void append_bytes(Bytes& out, const Bytes& b) {
    append_uint64(out, b.size());
    out.insert(out.end(), b.begin(), b.end());
}

void append_string(Bytes& out, const std::string& s) {
    append_uint64(out, s.size());
    out.insert(out.end(), s.begin(), s.end());
}

void append_address(Bytes& out, const Address& addr) {
    out.push_back(static_cast<uint8_t>(addr.type));
    out.insert(out.end(), addr.payment_credential.begin(), addr.payment_credential.end());
    out.push_back(addr.stake_credential.has_value() ? 1 : 0);
    if (addr.stake_credential.has_value()) {
        out.insert(out.end(), addr.stake_credential->begin(), addr.stake_credential->end());
    }
    out.push_back(addr.is_mainnet ? 1 : 0);
}

std::optional<uint8_t> Reader::read_uint8() {
    if (offset_ + 1 > data_.size()) return std::nullopt;
    return data_[offset_++];
}

std::optional<uint64_t> Reader::read_uint64() {
    if (offset_ + 8 > data_.size()) return std::nullopt;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i, ++offset_) {
        v = (v << 8) | data_[offset_];
    }
    return v;
}

std::optional<Amount> Reader::read_amount() {
    if (offset_ + 32 > data_.size()) return std::nullopt;
    Amount v = 0;
    for (int i = 0; i < 32; ++i, ++offset_) {
        v = (v << 8) | data_[offset_];
    }
    return v;
}

std::optional<Bytes> Reader::read_bytes() {
    auto len = read_uint64();
    if (!len || *len > data_.size() - offset_) return std::nullopt;
    Bytes result(data_.begin() + offset_, data_.begin() + offset_ + *len);
    offset_ += *len;
    return result;
}

std::optional<std::string> Reader::read_string() {
    auto bytes = read_bytes();
    if (!bytes) return std::nullopt;
    return std::string(bytes->begin(), bytes->end());
}

std::optional<Address> Reader::read_address() {
    auto type = read_uint8();
    if (!type || *type > static_cast<uint8_t>(Address::Type::Script)) return std::nullopt;
    if (offset_ + 28 > data_.size()) return std::nullopt;

    Address addr;
    addr.type = static_cast<Address::Type>(*type);
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + 28, addr.payment_credential.begin());
    offset_ += 28;

    auto has_stake = read_uint8();
    if (!has_stake) return std::nullopt;
    if (*has_stake == 1) {
        if (offset_ + 28 > data_.size()) return std::nullopt;
        addr.stake_credential = std::array<uint8_t, 28>{};
        std::copy(data_.begin() + offset_, data_.begin() + offset_ + 28, addr.stake_credential->begin());
        offset_ += 28;
    }

    auto mainnet = read_uint8();
    if (!mainnet) return std::nullopt;
    addr.is_mainnet = (*mainnet == 1);
    return addr;
}

} // namespace codec

// ============================================================================
// Token / DonationRecord
// ============================================================================

Bytes Token::encode() const {
    Bytes result;
    codec::append_uint64(result, id);
    codec::append_address(result, owner);
    codec::append_string(result, suffix);
    return result;
}

std::optional<Token> Token::decode(const Bytes& data) {
    codec::Reader reader(data);

    auto id = reader.read_uint64();
    auto owner = reader.read_address();
    auto suffix = reader.read_string();
    if (!id || !owner || !suffix || !reader.at_end()) return std::nullopt;

    return Token{*id, *owner, *suffix};
}

Bytes DonationRecord::encode() const {
    Bytes result;
    codec::append_address(result, donor);
    codec::append_amount(result, amount);
    codec::append_uint8(result, verified ? 1 : 0);
    codec::append_uint8(result, invoice_id.has_value() ? 1 : 0);
    if (invoice_id.has_value()) {
        codec::append_string(result, *invoice_id);
    }
    return result;
}

std::optional<DonationRecord> DonationRecord::decode(const Bytes& data) {
    codec::Reader reader(data);

    DonationRecord record;
    auto donor = reader.read_address();
    auto amount = reader.read_amount();
    auto verified = reader.read_uint8();
    auto has_invoice = reader.read_uint8();
    if (!donor || !amount || !verified || !has_invoice) return std::nullopt;

    record.donor = *donor;
    record.amount = *amount;
    record.verified = (*verified == 1);
    if (*has_invoice == 1) {
        auto invoice = reader.read_string();
        if (!invoice) return std::nullopt;
        record.invoice_id = *invoice;
    }
    if (!reader.at_end()) return std::nullopt;
    return record;
}

} // namespace benefactor

#include "benefactor/bech32.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace benefactor {
namespace bech32 {

namespace {

constexpr char ALPHABET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr size_t CHECKSUM_SYMBOLS = 6;

int symbol_value(char c) {
    static const std::array<int8_t, 128> table = [] {
        std::array<int8_t, 128> t;
        t.fill(-1);
        for (int i = 0; i < 32; ++i) {
            t[static_cast<size_t>(ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    auto u = static_cast<unsigned char>(c);
    return u < table.size() ? table[u] : -1;
}

uint32_t polymod_step(uint32_t chk, uint8_t value) {
    static constexpr uint32_t GENERATOR[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t top = chk >> 25;
    chk = ((chk & 0x1ffffff) << 5) ^ value;
    for (int i = 0; i < 5; ++i) {
        if ((top >> i) & 1) chk ^= GENERATOR[i];
    }
    return chk;
}

// Polymod over the expanded hrp followed by the data symbols
uint32_t checksum_state(const std::string& hrp, const std::vector<uint8_t>& symbols) {
    uint32_t chk = 1;
    for (char c : hrp) chk = polymod_step(chk, static_cast<uint8_t>(c) >> 5);
    chk = polymod_step(chk, 0);
    for (char c : hrp) chk = polymod_step(chk, static_cast<uint8_t>(c) & 31);
    for (uint8_t s : symbols) chk = polymod_step(chk, s);
    return chk;
}

} // namespace

bool regroup(const std::vector<uint8_t>& in, int from_bits, int to_bits, bool pad,
             std::vector<uint8_t>& out) {
    const uint32_t out_mask = (1u << to_bits) - 1;
    const uint32_t acc_mask = (1u << (from_bits + to_bits - 1)) - 1;
    uint32_t acc = 0;
    int bits = 0;

    for (uint8_t v : in) {
        if (v >> from_bits) return false;
        acc = ((acc << from_bits) | v) & acc_mask;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & out_mask));
        }
    }

    if (pad) {
        if (bits > 0) out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & out_mask));
        return true;
    }
    return bits < from_bits && ((acc << (to_bits - bits)) & out_mask) == 0;
}

std::string encode(const std::string& hrp, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> symbols;
    symbols.reserve((data.size() * 8 + 4) / 5 + CHECKSUM_SYMBOLS);
    regroup(data, 8, 5, true, symbols);

    uint32_t chk = checksum_state(hrp, symbols);
    for (size_t i = 0; i < CHECKSUM_SYMBOLS; ++i) chk = polymod_step(chk, 0);
    chk ^= 1;
    for (size_t i = 0; i < CHECKSUM_SYMBOLS; ++i) {
        symbols.push_back(static_cast<uint8_t>((chk >> (5 * (CHECKSUM_SYMBOLS - 1 - i))) & 31));
    }

    std::string out = hrp;
    out.reserve(hrp.size() + 1 + symbols.size());
    out += '1';
    for (uint8_t s : symbols) out += ALPHABET[s];
    return out;
}

std::optional<Decoded> decode(const std::string& str) {
    if (str.size() > MAX_LENGTH) return std::nullopt;

    bool lower = std::any_of(str.begin(), str.end(), [](char c) { return c >= 'a' && c <= 'z'; });
    bool upper = std::any_of(str.begin(), str.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
    if (lower && upper) return std::nullopt;

    std::string text = str;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    size_t sep = text.rfind('1');
    if (sep == std::string::npos || sep == 0 || sep + 1 + CHECKSUM_SYMBOLS > text.size()) {
        return std::nullopt;
    }

    Decoded result;
    result.hrp = text.substr(0, sep);
    for (char c : result.hrp) {
        if (c < 33 || c > 126) return std::nullopt;
    }

    std::vector<uint8_t> symbols;
    symbols.reserve(text.size() - sep - 1);
    for (size_t i = sep + 1; i < text.size(); ++i) {
        int v = symbol_value(text[i]);
        if (v < 0) return std::nullopt;
        symbols.push_back(static_cast<uint8_t>(v));
    }

    if (checksum_state(result.hrp, symbols) != 1) return std::nullopt;
    symbols.resize(symbols.size() - CHECKSUM_SYMBOLS);

    if (!regroup(symbols, 5, 8, false, result.data)) return std::nullopt;
    return result;
}

} // namespace bech32
} // namespace benefactor

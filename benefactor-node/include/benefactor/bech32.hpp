#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace benefactor {
namespace bech32 {

constexpr const char* MAINNET_HRP = "addr";
constexpr const char* TESTNET_HRP = "addr_test";
constexpr size_t MAX_LENGTH = 128;

struct Decoded {
    std::string hrp;
    std::vector<uint8_t> data;
};

// Lowercase hrp + "1" + 5-bit groups of `data` + 6-symbol checksum
std::string encode(const std::string& hrp, const std::vector<uint8_t>& data);

// Accepts all-lowercase or all-uppercase input; hrp comes back lowercase
std::optional<Decoded> decode(const std::string& str);

/**
 * @brief Repack a stream of `from_bits`-wide groups into `to_bits`-wide groups
 *
 * With `pad`, a short final group is zero-filled. Without it, leftover bits
 * must be fewer than `from_bits` and all zero.
 */
bool regroup(const std::vector<uint8_t>& in, int from_bits, int to_bits, bool pad,
             std::vector<uint8_t>& out);

} // namespace bech32
} // namespace benefactor

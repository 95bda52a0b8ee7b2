#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bech32
{

struct Decoded
{
    std::string hrp;
    std::vector<unsigned char> data;
};

// Encodes 8-bit data under a human-readable prefix, e.g. “npub”.
std::string encode(std::string_view hrp,
                   const std::vector<unsigned char>& data);

// Decodes a bech32 string back into its prefix and 8-bit data. Mixed
// case, a bad checksum or non-zero padding bits give nullopt.
std::optional<Decoded> decode(std::string_view str);

// Shortcuts for 32-byte keys and ids written as lowercase hex.
std::string encodeHex(std::string_view hrp, std::string_view hex);
std::optional<std::string> decodeHex(std::string_view expected_hrp,
                                     std::string_view str);

} // namespace bech32

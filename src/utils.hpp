#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/utils.hpp>

std::string_view lstrip(std::string_view s);
std::string_view rstrip(std::string_view s);
std::string_view strip(std::string_view s);

std::string hexEncode(const std::vector<unsigned char>& bytes);
std::string hexEncode(std::string_view bytes);
// Returns nullopt on odd length or a non-hex digit. Accepts both
// cases.
std::optional<std::vector<unsigned char>> hexDecode(std::string_view hex);
bool isLowerHex(std::string_view s, size_t expected_length);

// “bridge.example.com” -> “com.example.bridge”. Used as the label
// namespace on events this bridge signs.
std::string reverseDomain(std::string_view domain);

// Host part of an absolute URI, lower-cased, without the port. Empty
// if the URI has no host.
std::string hostOf(std::string_view uri);

int64_t nowSeconds();

// Builds a visitor for std::visit out of lambdas.
template<class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

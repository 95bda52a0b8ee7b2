#include "bech32.hpp"

#include <array>
#include <cstdint>

#include "utils.hpp"

namespace bech32
{

namespace
{

constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

int charsetIndex(char c)
{
    for(int i = 0; i < 32; i++)
    {
        if(CHARSET[i] == c)
        {
            return i;
        }
    }
    return -1;
}

uint32_t polymod(const std::vector<unsigned char>& values)
{
    constexpr std::array<uint32_t, 5> GEN = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for(unsigned char v : values)
    {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for(int i = 0; i < 5; i++)
        {
            if((top >> i) & 1)
            {
                chk ^= GEN[i];
            }
        }
    }
    return chk;
}

std::vector<unsigned char> expandHrp(std::string_view hrp)
{
    std::vector<unsigned char> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for(char c : hrp)
    {
        ret.push_back(static_cast<unsigned char>(c) >> 5);
    }
    ret.push_back(0);
    for(char c : hrp)
    {
        ret.push_back(static_cast<unsigned char>(c) & 31);
    }
    return ret;
}

// Regroups bits from from_bits-wide values into to_bits-wide values.
std::optional<std::vector<unsigned char>>
convertBits(const std::vector<unsigned char>& in, int from_bits, int to_bits,
            bool pad)
{
    std::vector<unsigned char> out;
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for(unsigned char value : in)
    {
        if((value >> from_bits) != 0)
        {
            return std::nullopt;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while(bits >= to_bits)
        {
            bits -= to_bits;
            out.push_back((acc >> bits) & maxv);
        }
    }
    if(pad)
    {
        if(bits > 0)
        {
            out.push_back((acc << (to_bits - bits)) & maxv);
        }
    }
    else if(bits >= from_bits || ((acc << (to_bits - bits)) & maxv) != 0)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace

std::string encode(std::string_view hrp, const std::vector<unsigned char>& data)
{
    auto values = *convertBits(data, 8, 5, true);
    std::vector<unsigned char> enc = expandHrp(hrp);
    enc.insert(enc.end(), values.begin(), values.end());
    enc.resize(enc.size() + 6, 0);
    uint32_t mod = polymod(enc) ^ 1;

    std::string result(hrp);
    result += '1';
    for(unsigned char v : values)
    {
        result += CHARSET[v];
    }
    for(int i = 0; i < 6; i++)
    {
        result += CHARSET[(mod >> (5 * (5 - i))) & 31];
    }
    return result;
}

std::optional<Decoded> decode(std::string_view str)
{
    bool has_lower = false;
    bool has_upper = false;
    for(char c : str)
    {
        if(c < 33 || c > 126)
        {
            return std::nullopt;
        }
        if(c >= 'a' && c <= 'z')
        {
            has_lower = true;
        }
        if(c >= 'A' && c <= 'Z')
        {
            has_upper = true;
        }
    }
    if(has_lower && has_upper)
    {
        return std::nullopt;
    }

    std::string lower(str);
    mw::toLower(lower);
    size_t pos = lower.rfind('1');
    if(pos == std::string::npos || pos == 0 || pos + 7 > lower.size())
    {
        return std::nullopt;
    }

    std::string hrp = lower.substr(0, pos);
    std::vector<unsigned char> values;
    for(size_t i = pos + 1; i < lower.size(); i++)
    {
        int idx = charsetIndex(lower[i]);
        if(idx < 0)
        {
            return std::nullopt;
        }
        values.push_back(static_cast<unsigned char>(idx));
    }

    std::vector<unsigned char> check = expandHrp(hrp);
    check.insert(check.end(), values.begin(), values.end());
    if(polymod(check) != 1)
    {
        return std::nullopt;
    }

    values.resize(values.size() - 6);
    auto data = convertBits(values, 5, 8, false);
    if(!data.has_value())
    {
        return std::nullopt;
    }
    return Decoded{std::move(hrp), std::move(*data)};
}

std::string encodeHex(std::string_view hrp, std::string_view hex)
{
    auto bytes = hexDecode(hex);
    if(!bytes.has_value())
    {
        return "";
    }
    return encode(hrp, *bytes);
}

std::optional<std::string> decodeHex(std::string_view expected_hrp,
                                     std::string_view str)
{
    auto decoded = decode(str);
    if(!decoded.has_value() || decoded->hrp != expected_hrp ||
       decoded->data.size() != 32)
    {
        return std::nullopt;
    }
    return hexEncode(decoded->data);
}

} // namespace bech32

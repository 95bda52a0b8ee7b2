#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <mw/url.hpp>
#include <mw/utils.hpp>

#include "utils.hpp"

namespace {

int hexValue(char c)
{
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string_view lstrip(std::string_view s)
{
    size_t i = 0;
    while(i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    {
        i++;
    }
    return s.substr(i);
}

std::string_view rstrip(std::string_view s)
{
    size_t n = s.size();
    while(n > 0 && std::isspace(static_cast<unsigned char>(s[n - 1])))
    {
        n--;
    }
    return s.substr(0, n);
}

std::string_view strip(std::string_view s)
{
    return rstrip(lstrip(s));
}

std::string hexEncode(std::string_view bytes)
{
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for(char c : bytes)
    {
        auto b = static_cast<unsigned char>(c);
        result.push_back(DIGITS[b >> 4]);
        result.push_back(DIGITS[b & 0x0f]);
    }
    return result;
}

std::string hexEncode(const std::vector<unsigned char>& bytes)
{
    return hexEncode(std::string_view(
        reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

std::optional<std::vector<unsigned char>> hexDecode(std::string_view hex)
{
    if(hex.size() % 2 != 0)
    {
        return std::nullopt;
    }
    std::vector<unsigned char> result;
    result.reserve(hex.size() / 2);
    for(size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if(hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        result.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return result;
}

bool isLowerHex(std::string_view s, size_t expected_length)
{
    if(s.size() != expected_length)
    {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c)
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string reverseDomain(std::string_view domain)
{
    std::vector<std::string_view> parts;
    size_t begin = 0;
    while(begin <= domain.size())
    {
        size_t dot = domain.find('.', begin);
        if(dot == std::string_view::npos)
        {
            dot = domain.size();
        }
        parts.push_back(domain.substr(begin, dot - begin));
        begin = dot + 1;
    }
    std::string result;
    for(auto it = parts.rbegin(); it != parts.rend(); ++it)
    {
        if(!result.empty())
        {
            result += '.';
        }
        result += *it;
    }
    return result;
}

std::string hostOf(std::string_view uri)
{
    auto url = mw::URL::fromStr(std::string(uri));
    if(!url.has_value())
    {
        return "";
    }
    std::string host = url->host();
    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return host;
}

int64_t nowSeconds()
{
    return mw::timeToSeconds(mw::Clock::now());
}

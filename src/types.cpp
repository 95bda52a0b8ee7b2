#include "types.hpp"

#include <format>

#include "utils.hpp"

E<AccountHandle> AccountHandle::fromStr(std::string_view s)
{
    const std::string original(s);
    s = strip(s);
    if(s.starts_with("acct:"))
    {
        s.remove_prefix(5);
    }
    size_t name_begin = 0;
    if(!s.empty() && s[0] == '@')
    {
        name_begin = 1;
    }
    size_t name_end = s.find('@', name_begin);
    if(name_end == std::string_view::npos)
    {
        return std::unexpected(invalidInput(
            std::format("Invalid account string: {}", original)));
    }
    AccountHandle u;
    u.name = strip(s.substr(name_begin, name_end - name_begin));
    if(u.name.empty())
    {
        return std::unexpected(invalidInput(
            std::format("Invalid account string: {}", original)));
    }
    // The account string should not contains a “@” in the domain
    // part.
    if(s.find('@', name_end + 1) != std::string_view::npos)
    {
        return std::unexpected(invalidInput(
            std::format("Invalid account string: {}", original)));
    }
    u.server = strip(s.substr(name_end + 1));
    if(u.server.empty())
    {
        return std::unexpected(invalidInput(
            std::format("Invalid account string: {}", original)));
    }
    return u;
}

std::string AccountHandle::idStr() const
{
    return std::format("{}@{}", name, server);
}

#include "http_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <mw/url.hpp>

namespace http_utils {

std::string formatHttpDate(std::time_t t)
{
    std::tm tm = *std::gmtime(&t);
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return ss.str();
}

std::string getHttpDate()
{
    return formatHttpDate(std::time(nullptr));
}

std::optional<std::time_t> parseHttpDate(std::string_view date_str)
{
    std::tm tm = {};
    std::stringstream ss{std::string(date_str)};
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    if(ss.fail())
    {
        return std::nullopt;
    }
    return timegm(&tm);
}

bool checkDateSkew(const std::string& date_str, int max_skew_seconds)
{
    auto time = parseHttpDate(date_str);
    if(!time.has_value())
    {
        return false;
    }
    std::time_t now = std::time(nullptr);
    double diff = std::difftime(now, *time);
    return std::abs(diff) <= max_skew_seconds;
}

std::string formatIsoTime(std::time_t t)
{
    std::tm tm = *std::gmtime(&t);
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::optional<std::time_t> parseIsoTime(std::string_view s)
{
    std::tm tm = {};
    std::stringstream ss{std::string(s)};
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(ss.fail())
    {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);

    // Skip fractional seconds.
    if(ss.peek() == '.')
    {
        ss.get();
        while(std::isdigit(ss.peek()))
        {
            ss.get();
        }
    }
    int c = ss.peek();
    if(c == '+' || c == '-')
    {
        ss.get();
        std::string offset;
        ss >> offset;
        offset.erase(std::remove(offset.begin(), offset.end(), ':'),
                     offset.end());
        if(offset.size() != 4 ||
           !std::all_of(offset.begin(), offset.end(), [](unsigned char d)
                        {
                            return std::isdigit(d) != 0;
                        }))
        {
            return std::nullopt;
        }
        int seconds = std::stoi(offset.substr(0, 2)) * 3600 +
            std::stoi(offset.substr(2, 2)) * 60;
        // Local time minus offset is UTC.
        t += (c == '+') ? -seconds : seconds;
    }
    return t;
}

std::string hostHeader(const std::string& url)
{
    auto url_obj = mw::URL::fromStr(url);
    if(!url_obj.has_value())
    {
        return "";
    }
    std::string host = url_obj->host();
    if(url_obj->port() != "80" && url_obj->port() != "443" &&
       !url_obj->port().empty())
    {
        host += ":" + url_obj->port();
    }
    return host;
}

std::string requestTarget(const std::string& url)
{
    auto url_obj = mw::URL::fromStr(url);
    if(!url_obj.has_value())
    {
        return "/";
    }
    std::string path = url_obj->path();
    if(path.empty())
    {
        path = "/";
    }
    if(!url_obj->query().empty())
    {
        path += "?" + url_obj->query();
    }
    return path;
}

} // namespace http_utils

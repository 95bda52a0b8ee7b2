#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace http_utils
{
std::string getHttpDate();
std::string formatHttpDate(std::time_t t);
std::optional<std::time_t> parseHttpDate(std::string_view date_str);
bool checkDateSkew(const std::string& date_str, int max_skew_seconds = 300);

// “2024-01-02T03:04:05Z”, as used by “published”.
std::string formatIsoTime(std::time_t t);
// Accepts fractional seconds and a “Z” or numeric offset suffix.
std::optional<std::time_t> parseIsoTime(std::string_view s);

// The “Host” header value for a URL: host, plus the port if it is not
// the default one.
std::string hostHeader(const std::string& url);
// Path plus query, as used in “(request-target)”.
std::string requestTarget(const std::string& url);
} // namespace http_utils

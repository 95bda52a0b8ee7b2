#include "http_signature.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>

#include <mw/utils.hpp>

#include "http_utils.hpp"

namespace http_signature
{
namespace
{

std::string lower(std::string_view s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::map<std::string, std::string> splitParams(std::string_view header)
{
    std::map<std::string, std::string> params;
    std::string key, val;
    bool in_quote = false;
    bool parsing_key = true;

    for(char c : header)
    {
        if(parsing_key)
        {
            if(c == '=')
            {
                parsing_key = false;
            }
            else if(c != ' ' && c != ',')
            {
                key += c;
            }
        }
        else
        {
            if(c == '"')
            {
                in_quote = !in_quote;
            }
            else if(c == ',' && !in_quote)
            {
                params[key] = val;
                key.clear();
                val.clear();
                parsing_key = true;
            }
            else
            {
                val += c;
            }
        }
    }
    if(!key.empty())
    {
        params[key] = val;
    }
    return params;
}

} // namespace

E<SignatureParams> parseSignatureHeader(std::string_view header)
{
    auto params = splitParams(header);
    if(!params.contains("keyId") || !params.contains("signature"))
    {
        return std::unexpected(invalidInput("Invalid Signature header format"));
    }

    SignatureParams result;
    result.key_id = params["keyId"];
    result.algorithm = params["algorithm"];
    // Without a header list only the date is signed.
    std::string headers = params.contains("headers") ? params["headers"] :
        "date";
    size_t start = 0;
    while(start <= headers.size())
    {
        size_t end = headers.find(' ', start);
        if(end == std::string::npos)
        {
            end = headers.size();
        }
        if(end > start)
        {
            result.headers.push_back(
                lower(std::string_view(headers).substr(start, end - start)));
        }
        start = end + 1;
    }
    if(result.headers.empty())
    {
        return std::unexpected(invalidInput("Signature covers no headers"));
    }

    auto sig_bytes = mw::base64Decode(params["signature"]);
    if(!sig_bytes.has_value())
    {
        return std::unexpected(invalidInput("Invalid base64 signature"));
    }
    result.signature = *std::move(sig_bytes);
    return result;
}

E<std::string> digestHeader(std::string_view body)
{
    auto digest_bytes = mw::SHA256Hasher().hashToBytes(std::string(body));
    if(!digest_bytes.has_value())
    {
        return std::unexpected(fromInternalError(digest_bytes.error()));
    }
    return "SHA-256=" + mw::base64Encode(*digest_bytes);
}

E<std::string> signingString(const std::vector<std::string>& headers,
                             std::string_view method, std::string_view target,
                             const HeaderLookup& lookup)
{
    std::string result;
    for(const std::string& name : headers)
    {
        if(!result.empty())
        {
            result += "\n";
        }
        if(name == "(request-target)")
        {
            result += std::format("(request-target): {} {}", lower(method),
                                  target);
            continue;
        }
        std::optional<std::string> value = lookup(name);
        if(!value.has_value())
        {
            return std::unexpected(invalidInput(
                std::format("Signed header {} is missing", name)));
        }
        result += std::format("{}: {}", name, *value);
    }
    return result;
}

std::string keyOwner(std::string_view key_id)
{
    size_t hash_pos = key_id.find('#');
    if(hash_pos == std::string_view::npos)
    {
        return std::string(key_id);
    }
    return std::string(key_id.substr(0, hash_pos));
}

E<void> signRequest(mw::HTTPRequest& req, std::string_view method,
                    const std::string& url, std::string_view body,
                    const std::string& key_id,
                    const std::string& private_key_pem,
                    mw::CryptoInterface& crypto)
{
    std::map<std::string, std::string> values;
    values["host"] = http_utils::hostHeader(url);
    values["date"] = http_utils::getHttpDate();
    std::vector<std::string> headers = {"(request-target)", "host", "date"};
    if(!body.empty())
    {
        ASSIGN_OR_RETURN(values["digest"], digestHeader(body));
        headers.push_back("digest");
    }

    ASSIGN_OR_RETURN(std::string to_sign, signingString(
        headers, method, http_utils::requestTarget(url),
        [&](const std::string& name) -> std::optional<std::string>
        {
            return values.at(name);
        }));

    auto sig_bytes = crypto.sign(mw::SignatureAlgorithm::RSA_V1_5_SHA256,
                                 private_key_pem, to_sign);
    if(!sig_bytes.has_value())
    {
        return std::unexpected(fromInternalError(sig_bytes.error()));
    }

    std::string header_list;
    for(const auto& name : headers)
    {
        if(!header_list.empty())
        {
            header_list += " ";
        }
        header_list += name;
    }
    req.addHeader("Host", values["host"]);
    req.addHeader("Date", values["date"]);
    if(!body.empty())
    {
        req.addHeader("Digest", values["digest"]);
    }
    req.addHeader("Signature", std::format(
        R"(keyId="{}",algorithm="rsa-sha256",headers="{}",signature="{}")",
        key_id, header_list, mw::base64Encode(*sig_bytes)));
    return {};
}

} // namespace http_signature

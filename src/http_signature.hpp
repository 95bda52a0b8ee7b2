#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/crypto.hpp>
#include <mw/http_client.hpp>

#include "error.hpp"

// HTTP signatures (draft-cavage) as used between federated servers.
namespace http_signature
{

// Parameters of a “Signature” header.
struct SignatureParams
{
    std::string key_id;
    std::string algorithm;
    // Lower-case header names in signing order.
    std::vector<std::string> headers;
    std::vector<unsigned char> signature;
};

// INVALID_INPUT if keyId, headers or signature is missing, or the
// signature is not base64.
E<SignatureParams> parseSignatureHeader(std::string_view header);

// “SHA-256=<base64>” of a body.
E<std::string> digestHeader(std::string_view body);

// Returns the value of a request header, or nullopt if it is missing.
using HeaderLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

// The string that gets signed. method is upper or lower case, target is
// path plus query. INVALID_INPUT if a listed header is missing.
E<std::string> signingString(const std::vector<std::string>& headers,
                             std::string_view method, std::string_view target,
                             const HeaderLookup& lookup);

// The actor a key id belongs to: the key id without its fragment.
std::string keyOwner(std::string_view key_id);

// Signs a request to url in place, adding Host, Date, Signature, and for
// a body also Digest. body is empty for GET.
E<void> signRequest(mw::HTTPRequest& req, std::string_view method,
                    const std::string& url, std::string_view body,
                    const std::string& key_id,
                    const std::string& private_key_pem,
                    mw::CryptoInterface& crypto);

} // namespace http_signature

#include "signature_verifier.hpp"

#include <algorithm>

#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "http_signature.hpp"
#include "http_utils.hpp"

SignatureVerifier::SignatureVerifier(ActorResolver& resolver,
                                     mw::CryptoInterface& crypto,
                                     int max_skew_seconds)
    : resolver(resolver), crypto(crypto), max_skew_seconds(max_skew_seconds)
{
}

bool SignatureVerifier::verifyWith(const std::string& public_key_pem,
                                   const std::vector<unsigned char>& signature,
                                   const std::string& signed_string)
{
    auto valid = crypto.verifySignature(mw::SignatureAlgorithm::RSA_V1_5_SHA256,
                                        public_key_pem, signature,
                                        signed_string);
    if(!valid.has_value())
    {
        spdlog::debug("Cannot check signature: {}", mw::errorMsg(valid.error()));
        return false;
    }
    return *valid;
}

E<RemoteActor> SignatureVerifier::verify(const mw::HTTPServer::Request& req,
                                         const std::string& method,
                                         const std::string& target)
{
    // 1. Date Validation
    if(!req.has_header("Date"))
    {
        return std::unexpected(signatureInvalid("Missing Date header"));
    }
    if(!http_utils::checkDateSkew(req.get_header_value("Date"),
                                  max_skew_seconds))
    {
        return std::unexpected(signatureInvalid("Date header too skewed"));
    }

    // 2. Digest Verification
    const bool has_body = method == "POST" || method == "PUT";
    if(has_body)
    {
        if(!req.has_header("Digest"))
        {
            return std::unexpected(signatureInvalid("Missing Digest header"));
        }
        ASSIGN_OR_RETURN(std::string local_digest,
                         http_signature::digestHeader(req.body));
        if(req.get_header_value("Digest") != local_digest)
        {
            return std::unexpected(signatureInvalid("Digest mismatch"));
        }
    }

    // 3. Signature
    if(!req.has_header("Signature"))
    {
        return std::unexpected(signatureInvalid("Missing Signature header"));
    }
    auto params = http_signature::parseSignatureHeader(
        req.get_header_value("Signature"));
    if(!params.has_value())
    {
        return std::unexpected(signatureInvalid(errorMsg(params.error())));
    }
    const auto& covered = params->headers;
    std::vector<std::string> required = {"(request-target)", "host", "date"};
    if(has_body)
    {
        required.push_back("digest");
    }
    for(const auto& name : required)
    {
        if(std::find(covered.begin(), covered.end(), name) == covered.end())
        {
            return std::unexpected(signatureInvalid(name + " is not signed"));
        }
    }

    auto signed_string = http_signature::signingString(
        covered, method, target,
        [&](const std::string& name) -> std::optional<std::string>
        {
            if(!req.has_header(name))
            {
                return std::nullopt;
            }
            return req.get_header_value(name);
        });
    if(!signed_string.has_value())
    {
        return std::unexpected(signatureInvalid(errorMsg(signed_string.error())));
    }

    const std::string owner = http_signature::keyOwner(params->key_id);
    ASSIGN_OR_RETURN(auto known, resolver.lookup(owner));
    if(known.has_value())
    {
        if(verifyWith(known->public_key_pem, params->signature, *signed_string))
        {
            return *known;
        }
        spdlog::info("Verification failed with cached key for {}, re-fetching",
                     owner);
    }

    // Fetch-on-failure or initial fetch
    auto fetched = resolver.fetch(owner);
    if(!fetched.has_value())
    {
        if(fetched.error().kind == ErrorKind::TRANSPORT_TRANSIENT)
        {
            return std::unexpected(fetched.error());
        }
        return std::unexpected(signatureInvalid(
            "Cannot get key of " + owner + ": " + errorMsg(fetched.error())));
    }
    if(!verifyWith(fetched->public_key_pem, params->signature, *signed_string))
    {
        return std::unexpected(signatureInvalid("Invalid signature by " + owner));
    }
    DO_OR_RETURN(resolver.remember(*fetched));
    return *fetched;
}

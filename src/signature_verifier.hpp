#pragma once

#include <string>

#include <mw/crypto.hpp>
#include <mw/http_server.hpp>

#include "actor_resolver.hpp"
#include "error.hpp"
#include "types.hpp"

class SignatureVerifier
{
public:
    SignatureVerifier(ActorResolver& resolver, mw::CryptoInterface& crypto,
                      int max_skew_seconds);

    // Verifies the HTTP signature of an incoming request and returns
    // the signing actor. target is the path plus query the request was
    // made to. A known key that fails is re-fetched once, in case the
    // actor rotated it. A fetched key is only remembered after it
    // verified the request, so a rejected request leaves no trace.
    E<RemoteActor> verify(const mw::HTTPServer::Request& req,
                          const std::string& method,
                          const std::string& target);

private:
    bool verifyWith(const std::string& public_key_pem,
                    const std::vector<unsigned char>& signature,
                    const std::string& signed_string);

    ActorResolver& resolver;
    mw::CryptoInterface& crypto;
    int max_skew_seconds;
};

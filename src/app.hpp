#pragma once

#include <string>

#include <mw/http_server.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "coordinator.hpp"
#include "error.hpp"
#include "identity_mapper.hpp"
#include "signature_verifier.hpp"
#include "text_transform.hpp"
#include "url_manager.hpp"

// The federation face of the bridge: discovery documents, virtual
// actor documents, note objects and the inboxes.
class App : public mw::HTTPServer
{
public:
    App() = delete;
    App(const Config& conf, const URLManager& urls, IdentityMapper& identities,
        SignatureVerifier& verifier, BridgeCoordinator& coordinator,
        const TextTransformInterface& transform,
        const mw::HTTPServer::ListenAddress& listen);

    void handleWebFinger(const Request& req, Response& res);
    void handleNodeInfoIndex(Response& res) const;
    void handleNodeInfo(Response& res) const;
    void handleUser(Response& res, const std::string& npub);
    void handleFollowers(Response& res, const std::string& npub);
    void handleOutbox(Response& res, const std::string& npub);
    void handleNote(Response& res, const std::string& note_id);
    void handleSystemActor(Response& res);
    // Both the shared inbox and the per-actor inboxes end up here.
    void handleInbox(const Request& req, Response& res);

protected:
    void setup() override;

private:
    // The hex key of a virtual actor from its npub. Keys derived for
    // federated actors have no virtual actor here.
    E<std::string> localPubkey(const std::string& npub);

    const Config& config;
    const URLManager& urls;
    IdentityMapper& identities;
    SignatureVerifier& verifier;
    BridgeCoordinator& coordinator;
    const TextTransformInterface& transform;
};

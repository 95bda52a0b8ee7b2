#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "bech32.hpp"
#include "json_ld.hpp"
#include "translator.hpp"
#include "types.hpp"

#define _ASSIGN_OR_RESPOND_ERROR(tmp, var, val, res)                    \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        res.status = httpStatusFor(tmp.error());                        \
        res.set_content(errorMsg(tmp.error()), CONTENT_TYPE_TEXT);      \
        return;                                                         \
    }                                                                   \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RESPOND_ERROR(var, val, res)                          \
    _ASSIGN_OR_RESPOND_ERROR(_CONCAT_NAMES(assign_or_respond_tmp, __COUNTER__), \
                             var, val, res)

namespace
{

constexpr char CONTENT_TYPE_TEXT[] = "text/plain";
constexpr char CONTENT_TYPE_JSON[] = "application/json";
constexpr char CONTENT_TYPE_JRD[] = "application/jrd+json";
constexpr char CONTENT_TYPE_ACTIVITY[] = "application/activity+json";
constexpr char SOFTWARE_NAME[] = "nostap";
constexpr char SOFTWARE_VERSION[] = "0.1.0";
constexpr char NODEINFO_SCHEMA[] = "http://nodeinfo.diaspora.software/ns/schema/2.1";

nlohmann::json emptyCollection(const std::string& id, size_t total)
{
    return {
        {"@context", "https://www.w3.org/ns/activitystreams"},
        {"id", id},
        {"type", "OrderedCollection"},
        {"totalItems", total},
    };
}

} // namespace

App::App(const Config& conf, const URLManager& urls,
         IdentityMapper& identities, SignatureVerifier& verifier,
         BridgeCoordinator& coordinator,
         const TextTransformInterface& transform,
         const mw::HTTPServer::ListenAddress& listen)
        : mw::HTTPServer(listen), config(conf), urls(urls),
          identities(identities), verifier(verifier),
          coordinator(coordinator), transform(transform)
{
}

E<std::string> App::localPubkey(const std::string& npub)
{
    std::optional<std::string> pubkey = bech32::decodeHex("npub", npub);
    if(!pubkey.has_value())
    {
        return std::unexpected(notFound("Not an npub: " + npub));
    }
    ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(*pubkey));
    if(derived.has_value())
    {
        return std::unexpected(notFound(
            npub + " stands for " + derived->actor_uri));
    }
    return *pubkey;
}

void App::handleWebFinger(const Request& req, Response& res)
{
    if(!req.has_param("resource"))
    {
        res.status = 400;
        res.set_content("Missing resource", CONTENT_TYPE_TEXT);
        return;
    }
    const std::string resource = req.get_param_value("resource");
    ASSIGN_OR_RESPOND_ERROR(AccountHandle handle, AccountHandle::fromStr(resource),
                            res);
    if(handle.server != urls.domain())
    {
        res.status = 404;
        res.set_content("Unknown domain " + handle.server, CONTENT_TYPE_TEXT);
        return;
    }
    ASSIGN_OR_RESPOND_ERROR(std::string pubkey, localPubkey(handle.name), res);
    const std::string actor = urls.actor(pubkey);
    nlohmann::json jrd = {
        {"subject", "acct:" + handle.idStr()},
        {"aliases", {actor}},
        {"links", {
            {{"rel", "self"}, {"type", CONTENT_TYPE_ACTIVITY}, {"href", actor}},
            {{"rel", "http://webfinger.net/rel/profile-page"},
             {"type", "text/html"}, {"href", urls.webProfile(pubkey)}},
        }},
    };
    res.set_content(jrd.dump(), CONTENT_TYPE_JRD);
}

void App::handleNodeInfoIndex(Response& res) const
{
    nlohmann::json links = {
        {"links", {{{"rel", NODEINFO_SCHEMA},
                    {"href", urls.root() + "/nodeinfo/2.1"}}}},
    };
    res.set_content(links.dump(), CONTENT_TYPE_JSON);
}

void App::handleNodeInfo(Response& res) const
{
    nlohmann::json info = {
        {"version", "2.1"},
        {"software", {{"name", SOFTWARE_NAME}, {"version", SOFTWARE_VERSION}}},
        {"protocols", {"activitypub", "nostr"}},
        {"services", {{"inbound", nlohmann::json::array()},
                      {"outbound", nlohmann::json::array()}}},
        {"openRegistrations", false},
        {"usage", {{"users", nlohmann::json::object()}}},
        {"metadata", {{"nodeName", config.nodeinfo.name},
                      {"nodeDescription", config.nodeinfo.description}}},
    };
    res.set_content(info.dump(), CONTENT_TYPE_JSON);
}

void App::handleUser(Response& res, const std::string& npub)
{
    ASSIGN_OR_RESPOND_ERROR(std::string pubkey, localPubkey(npub), res);
    ASSIGN_OR_RESPOND_ERROR(VirtualActor actor,
                            identities.resolveOrCreateActor(pubkey), res);
    res.set_content(actorDocument(actor, urls, transform).dump(),
                    CONTENT_TYPE_ACTIVITY);
}

void App::handleFollowers(Response& res, const std::string& npub)
{
    ASSIGN_OR_RESPOND_ERROR(std::string pubkey, localPubkey(npub), res);
    ASSIGN_OR_RESPOND_ERROR(std::vector<std::string> followers,
                            identities.followerUris(pubkey), res);
    res.set_content(emptyCollection(urls.followers(pubkey), followers.size())
                    .dump(), CONTENT_TYPE_ACTIVITY);
}

void App::handleOutbox(Response& res, const std::string& npub)
{
    ASSIGN_OR_RESPOND_ERROR(std::string pubkey, localPubkey(npub), res);
    res.set_content(emptyCollection(urls.outbox(pubkey), 0).dump(),
                    CONTENT_TYPE_ACTIVITY);
}

void App::handleNote(Response& res, const std::string& note_id)
{
    std::optional<std::string> event_id = bech32::decodeHex("note", note_id);
    if(!event_id.has_value())
    {
        res.status = 404;
        res.set_content("Not a note id", CONTENT_TYPE_TEXT);
        return;
    }
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json object,
                            coordinator.noteObject(*event_id), res);
    res.set_content(object.dump(), CONTENT_TYPE_ACTIVITY);
}

void App::handleSystemActor(Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(SystemKeys keys, identities.systemKeys(), res);
    res.set_content(systemActorDocument(keys.public_key_pem, urls).dump(),
                    CONTENT_TYPE_ACTIVITY);
}

void App::handleInbox(const Request& req, Response& res)
{
    auto signer = verifier.verify(req, "POST", req.target);
    if(!signer.has_value())
    {
        spdlog::warn("Rejected POST to {}: {}", req.path, errorMsg(signer.error()));
        res.status = httpStatusFor(signer.error());
        res.set_content(errorMsg(signer.error()), CONTENT_TYPE_TEXT);
        return;
    }

    nlohmann::json doc = nlohmann::json::parse(req.body, nullptr, false);
    if(doc.is_discarded())
    {
        res.status = 400;
        res.set_content("Invalid JSON", CONTENT_TYPE_TEXT);
        return;
    }

    auto result = coordinator.ingestFederationActivity(doc, *signer);
    if(!result.has_value())
    {
        spdlog::info("Activity {} from {} not bridged: {}",
                     json_ld::getString(doc, "id"), signer->uri,
                     errorMsg(result.error()));
        res.status = httpStatusFor(result.error());
        res.set_content(errorMsg(result.error()), CONTENT_TYPE_TEXT);
        return;
    }
    res.status = 202;
}

void App::setup()
{
    server.Get("/.well-known/webfinger", [&](const Request& req, Response& res)
    {
        handleWebFinger(req, res);
    });
    server.Get("/.well-known/nodeinfo", [&](const Request&, Response& res)
    {
        handleNodeInfoIndex(res);
    });
    server.Get("/nodeinfo/2.1", [&](const Request&, Response& res)
    {
        handleNodeInfo(res);
    });

    server.Get(URLManager::USER_PATH, [&](const Request& req, Response& res)
    {
        handleUser(res, req.path_params.at("npub"));
    });
    server.Get(URLManager::USER_FOLLOWERS_PATH,
               [&](const Request& req, Response& res)
    {
        handleFollowers(res, req.path_params.at("npub"));
    });
    server.Get(URLManager::USER_OUTBOX_PATH,
               [&](const Request& req, Response& res)
    {
        handleOutbox(res, req.path_params.at("npub"));
    });
    server.Get(URLManager::NOTE_PATH, [&](const Request& req, Response& res)
    {
        handleNote(res, req.path_params.at("id"));
    });
    server.Get(URLManager::SYSTEM_ACTOR_PATH, [&](const Request&, Response& res)
    {
        handleSystemActor(res);
    });

    server.Post(URLManager::USER_INBOX_PATH,
                [&](const Request& req, Response& res)
    {
        handleInbox(req, res);
    });
    server.Post(URLManager::SHARED_INBOX_PATH,
                [&](const Request& req, Response& res)
    {
        handleInbox(req, res);
    });
}

#include "actor_resolver.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "http_signature.hpp"
#include "json_ld.hpp"
#include "translator.hpp"
#include "utils.hpp"

ActorResolver::ActorResolver(StoreInterface& store, HttpClientPool& http,
                             mw::CryptoInterface& crypto,
                             const URLManager& urls, SystemKeys system_keys,
                             const CacheConfig& cache_conf)
    : store(store), http(http), crypto(crypto), urls(urls),
      system_keys(std::move(system_keys)),
      ttl_seconds(cache_conf.actor_ttl_seconds),
      actors(cache_conf.actor_capacity,
             std::chrono::seconds(cache_conf.actor_ttl_seconds))
{
}

bool ActorResolver::fresh(const RemoteActor& actor) const
{
    return nowSeconds() - actor.fetched_at < ttl_seconds;
}

E<std::optional<RemoteActor>> ActorResolver::lookup(const std::string& uri)
{
    if(auto cached = actors.get(uri); cached.has_value())
    {
        return cached;
    }
    return store.getRemoteActor(uri);
}

E<nlohmann::json> ActorResolver::fetchObject(const std::string& uri)
{
    if(hostOf(uri).empty())
    {
        return std::unexpected(invalidInput("Not an absolute URI: " + uri));
    }
    if(urls.isLocal(uri))
    {
        return std::unexpected(invalidInput("Refusing to fetch own URI " + uri));
    }

    mw::HTTPRequest req(uri);
    req.addHeader("Accept", "application/activity+json, application/ld+json");
    DO_OR_RETURN(http_signature::signRequest(
        req, "GET", uri, "", urls.systemActorKeyId(),
        system_keys.private_key_pem, crypto));

    auto session = http.acquire();
    auto res = session->get(req);
    if(!res.has_value())
    {
        return std::unexpected(fromTransportError(res.error()));
    }
    int status = (*res)->status;
    if(status == 404 || status == 410)
    {
        return std::unexpected(notFound(std::format("{} is gone", uri)));
    }
    if(status < 200 || status >= 300)
    {
        return std::unexpected(transportTransient(
            std::format("Fetching {} returned {}", uri, status)));
    }

    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse((*res)->payloadAsStr());
    }
    catch(const nlohmann::json::parse_error& e)
    {
        return std::unexpected(invalidInput(
            std::format("Invalid JSON from {}: {}", uri, e.what())));
    }
    if(!doc.is_object())
    {
        return std::unexpected(invalidInput("Document is not an object"));
    }
    // A server only speaks for its own objects.
    std::string id = json_ld::getId(doc, "id");
    if(!id.empty() && hostOf(id) != hostOf(uri))
    {
        return std::unexpected(invalidInput(
            std::format("{} claims to be {}", uri, id)));
    }
    return doc;
}

E<RemoteActor> ActorResolver::fetch(const std::string& uri)
{
    spdlog::debug("Fetching actor {}", uri);
    ASSIGN_OR_RETURN(nlohmann::json doc, fetchObject(uri));
    ASSIGN_OR_RETURN(RemoteActor actor, remoteActorFromJson(doc, nowSeconds()));
    return actor;
}

E<void> ActorResolver::remember(const RemoteActor& actor)
{
    DO_OR_RETURN(store.putRemoteActor(actor));
    actors.put(actor.uri, actor);
    return {};
}

E<RemoteActor> ActorResolver::resolve(const std::string& uri)
{
    ASSIGN_OR_RETURN(auto known, lookup(uri));
    if(known.has_value() && fresh(*known))
    {
        return *known;
    }

    return fetch_flight.run(uri, [&]() -> E<RemoteActor>
    {
        auto fetched = fetch(uri);
        if(!fetched.has_value())
        {
            if(known.has_value() && fetched.error().kind != ErrorKind::NOT_FOUND)
            {
                spdlog::warn("Using stale copy of {}: {}", uri,
                             errorMsg(fetched.error()));
                return *known;
            }
            return std::unexpected(fetched.error());
        }
        DO_OR_RETURN(remember(*fetched));
        return *fetched;
    });
}

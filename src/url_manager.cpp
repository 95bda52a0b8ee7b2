#include "url_manager.hpp"

#include <format>

#include "bech32.hpp"

std::string URLManager::actor(std::string_view pubkey) const
{
    return std::format("{}/users/{}", root(), bech32::encodeHex("npub", pubkey));
}

std::string URLManager::inbox(std::string_view pubkey) const
{
    return actor(pubkey) + "/inbox";
}

std::string URLManager::outbox(std::string_view pubkey) const
{
    return actor(pubkey) + "/outbox";
}

std::string URLManager::followers(std::string_view pubkey) const
{
    return actor(pubkey) + "/followers";
}

std::string URLManager::note(std::string_view event_id) const
{
    return std::format("{}/notes/{}", root(),
                       bech32::encodeHex("note", event_id));
}

std::string URLManager::sharedInbox() const
{
    return root() + "/inbox";
}

std::string URLManager::systemActor() const
{
    return root() + "/actor";
}

std::string URLManager::systemActorKeyId() const
{
    return systemActor() + "#main-key";
}

std::string URLManager::activity(std::string_view kind,
                                 std::string_view unique_part) const
{
    return std::format("{}/activities/{}/{}", root(), kind, unique_part);
}

std::string URLManager::webProfile(std::string_view pubkey) const
{
    return config.web_client_url + bech32::encodeHex("npub", pubkey);
}

std::optional<std::string>
URLManager::pubkeyFromActor(std::string_view uri) const
{
    const std::string prefix = root() + "/users/";
    if(!uri.starts_with(prefix))
    {
        return std::nullopt;
    }
    uri.remove_prefix(prefix.size());
    size_t end = uri.find_first_of("/#?");
    if(end != std::string_view::npos)
    {
        uri = uri.substr(0, end);
    }
    return bech32::decodeHex("npub", uri);
}

std::optional<std::string>
URLManager::eventIdFromNote(std::string_view uri) const
{
    const std::string prefix = root() + "/notes/";
    if(!uri.starts_with(prefix))
    {
        return std::nullopt;
    }
    uri.remove_prefix(prefix.size());
    return bech32::decodeHex("note", uri);
}

bool URLManager::isLocal(std::string_view uri) const
{
    return uri == root() || uri.starts_with(root() + "/");
}

#include "native_event.hpp"

#include <algorithm>

#include <mw/crypto.hpp>

#include "schnorr.hpp"
#include "utils.hpp"

namespace
{

std::string compactDump(const nlohmann::json& j)
{
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool contains(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::string NativeEvent::computeId() const
{
    nlohmann::json serial = nlohmann::json::array(
        {0, pubkey, created_at, kind, tags, content});
    auto hash = mw::SHA256Hasher().hashToBytes(compactDump(serial));
    if(!hash.has_value())
    {
        return "";
    }
    return hexEncode(*hash);
}

E<void> NativeEvent::sign(std::string_view secret_hex)
{
    ASSIGN_OR_RETURN(pubkey, schnorr::publicKeyFor(secret_hex));
    id = computeId();
    if(id.empty())
    {
        return std::unexpected(internalError("Failed to hash event"));
    }
    ASSIGN_OR_RETURN(sig, schnorr::sign(secret_hex, id));
    return {};
}

bool NativeEvent::verify() const
{
    if(!isLowerHex(id, 64) || !isLowerHex(pubkey, 64) || !isLowerHex(sig, 128))
    {
        return false;
    }
    if(computeId() != id)
    {
        return false;
    }
    return schnorr::verify(pubkey, id, sig);
}

const Tag* NativeEvent::findTag(std::string_view name) const
{
    for(const auto& tag : tags)
    {
        if(!tag.empty() && tag[0] == name)
        {
            return &tag;
        }
    }
    return nullptr;
}

std::vector<std::string> NativeEvent::tagValues(std::string_view name) const
{
    std::vector<std::string> values;
    for(const auto& tag : tags)
    {
        if(tag.size() >= 2 && tag[0] == name)
        {
            values.push_back(tag[1]);
        }
    }
    return values;
}

bool NativeEvent::isFromFederation() const
{
    for(const auto& tag : tags)
    {
        if(tag.size() >= 3 && tag[0] == "proxy" && tag[2] == "activitypub")
        {
            return true;
        }
    }
    return false;
}

nlohmann::json NativeEvent::toJson() const
{
    return {
        {"id", id},
        {"pubkey", pubkey},
        {"created_at", created_at},
        {"kind", kind},
        {"tags", tags},
        {"content", content},
        {"sig", sig},
    };
}

E<NativeEvent> NativeEvent::fromJson(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(invalidInput("Event is not an object"));
    }
    NativeEvent e;
    try
    {
        e.id = j.at("id").get<std::string>();
        e.pubkey = j.at("pubkey").get<std::string>();
        e.created_at = j.at("created_at").get<int64_t>();
        e.kind = j.at("kind").get<int>();
        e.content = j.at("content").get<std::string>();
        e.sig = j.value("sig", "");
        for(const auto& tag : j.at("tags"))
        {
            Tag t;
            for(const auto& item : tag)
            {
                t.push_back(item.get<std::string>());
            }
            e.tags.push_back(std::move(t));
        }
    }
    catch(const nlohmann::json::exception& ex)
    {
        return std::unexpected(
            invalidInput(std::string("Malformed event: ") + ex.what()));
    }
    return e;
}

bool Filter::matches(const NativeEvent& event) const
{
    if(!ids.empty() && !contains(ids, event.id))
    {
        return false;
    }
    if(!authors.empty() && !contains(authors, event.pubkey))
    {
        return false;
    }
    if(!kinds.empty() &&
       std::find(kinds.begin(), kinds.end(), event.kind) == kinds.end())
    {
        return false;
    }
    if(since.has_value() && event.created_at < *since)
    {
        return false;
    }
    if(until.has_value() && event.created_at > *until)
    {
        return false;
    }
    for(const auto& [name, wanted] : tags)
    {
        auto values = event.tagValues(std::string(1, name));
        bool found = std::any_of(values.begin(), values.end(),
                                 [&](const std::string& v)
                                 { return contains(wanted, v); });
        if(!found)
        {
            return false;
        }
    }
    return true;
}

nlohmann::json Filter::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    if(!ids.empty())
    {
        j["ids"] = ids;
    }
    if(!authors.empty())
    {
        j["authors"] = authors;
    }
    if(!kinds.empty())
    {
        j["kinds"] = kinds;
    }
    for(const auto& [name, values] : tags)
    {
        j[std::string("#") + name] = values;
    }
    if(since.has_value())
    {
        j["since"] = *since;
    }
    if(until.has_value())
    {
        j["until"] = *until;
    }
    if(limit.has_value())
    {
        j["limit"] = *limit;
    }
    return j;
}

E<RelayMessage> parseRelayMessage(std::string_view text)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text);
    }
    catch(const nlohmann::json::parse_error& e)
    {
        return std::unexpected(
            invalidInput(std::string("Invalid relay message: ") + e.what()));
    }
    if(!j.is_array() || j.empty() || !j[0].is_string())
    {
        return std::unexpected(invalidInput("Relay message is not a list"));
    }

    try
    {
        const std::string type = j[0].get<std::string>();
        if(type == "EVENT" && j.size() >= 3)
        {
            ASSIGN_OR_RETURN(NativeEvent event, NativeEvent::fromJson(j[2]));
            return relay_msg::Event{j[1].get<std::string>(), std::move(event)};
        }
        if(type == "EOSE" && j.size() >= 2)
        {
            return relay_msg::Eose{j[1].get<std::string>()};
        }
        if(type == "OK" && j.size() >= 3)
        {
            return relay_msg::Ok{j[1].get<std::string>(), j[2].get<bool>(),
                                 j.size() >= 4 ? j[3].get<std::string>() : ""};
        }
        if(type == "NOTICE" && j.size() >= 2)
        {
            return relay_msg::Notice{j[1].get<std::string>()};
        }
        if(type == "CLOSED" && j.size() >= 2)
        {
            return relay_msg::Closed{
                j[1].get<std::string>(),
                j.size() >= 3 ? j[2].get<std::string>() : ""};
        }
        return std::unexpected(invalidInput("Unknown relay message: " + type));
    }
    catch(const nlohmann::json::exception& e)
    {
        return std::unexpected(
            invalidInput(std::string("Malformed relay message: ") + e.what()));
    }
}

std::string reqMessage(const std::string& subscription,
                       const std::vector<Filter>& filters)
{
    nlohmann::json j = nlohmann::json::array({"REQ", subscription});
    for(const auto& f : filters)
    {
        j.push_back(f.toJson());
    }
    return compactDump(j);
}

std::string closeMessage(const std::string& subscription)
{
    return compactDump(nlohmann::json::array({"CLOSE", subscription}));
}

std::string eventMessage(const NativeEvent& event)
{
    return compactDump(nlohmann::json::array({"EVENT", event.toJson()}));
}

#include "json_ld.hpp"

namespace json_ld
{

namespace
{

std::string idOf(const nlohmann::json& val)
{
    if(val.is_string())
    {
        return val.get<std::string>();
    }
    if(val.is_object() && val.contains("id") && val["id"].is_string())
    {
        return val["id"].get<std::string>();
    }
    if(val.is_object() && val.contains("href") && val["href"].is_string())
    {
        return val["href"].get<std::string>();
    }
    return "";
}

} // namespace

std::vector<std::string> asList(const nlohmann::json& j,
                                const std::string& key)
{
    std::vector<std::string> result;
    if(!j.is_object() || !j.contains(key))
    {
        return result;
    }

    const auto& val = j[key];
    if(val.is_array())
    {
        for(const auto& item : val)
        {
            std::string id = idOf(item);
            if(!id.empty())
            {
                result.push_back(std::move(id));
            }
        }
    }
    else
    {
        std::string id = idOf(val);
        if(!id.empty())
        {
            result.push_back(std::move(id));
        }
    }
    return result;
}

std::string getId(const nlohmann::json& j, const std::string& key)
{
    if(!j.is_object() || !j.contains(key))
    {
        return "";
    }
    return idOf(j[key]);
}

bool hasType(const nlohmann::json& j, const std::string& type)
{
    for(const auto& t : asList(j, "type"))
    {
        if(t == type)
        {
            return true;
        }
    }
    return false;
}

std::string firstType(const nlohmann::json& j)
{
    auto types = asList(j, "type");
    if(types.empty())
    {
        return "";
    }
    return types.front();
}

bool isPublic(const nlohmann::json& j)
{
    for(const char* key : {"to", "cc"})
    {
        for(const auto& target : asList(j, key))
        {
            if(target == PUBLIC_COLLECTION || target == "Public" ||
               target == "as:Public")
            {
                return true;
            }
        }
    }
    return false;
}

std::string getString(const nlohmann::json& j, const std::string& key)
{
    if(j.is_object() && j.contains(key) && j[key].is_string())
    {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace json_ld

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace json_ld
{

constexpr char PUBLIC_COLLECTION[] =
    "https://www.w3.org/ns/activitystreams#Public";

// Normalizes a field that can be a single string, an object or a list
// of either into a vector of IDs.
std::vector<std::string> asList(const nlohmann::json& j,
                                const std::string& key);

// Normalizes a field that can be a string (URI) or an object (Link/Object)
// and returns the ID/URI.
std::string getId(const nlohmann::json& j, const std::string& key);

// Check if a field exists and is of a certain type
bool hasType(const nlohmann::json& j, const std::string& type);

// The first entry of “type”, or empty.
std::string firstType(const nlohmann::json& j);

// Whether “to” or “cc” addresses the public collection, in any of
// the spellings servers use.
bool isPublic(const nlohmann::json& j);

// String value of a key, or empty if it is missing or not a string.
std::string getString(const nlohmann::json& j, const std::string& key);

} // namespace json_ld

#pragma once

#include "core/error.h"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

// Insertion-ordered so that member order and CityObject order survive a round trip.
using Json = nlohmann::ordered_json;

/**
 * Parse one JSON text, turning nlohmann parse errors into SeqError.
 */
Json parseJson(const std::string& text);

/**
 * Read an optional member. Absent and null both yield nullopt.
 */
template <typename T>
std::optional<T> optionalField(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

/**
 * Write an optional member only when it holds a value.
 */
template <typename T>
void putOptional(Json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

/**
 * Collect the members of an object that are not in the known list.
 * Returns an empty object when there are none.
 */
Json extraMembers(const Json& j, std::initializer_list<const char*> known);

/**
 * Append previously collected unknown members to an output object.
 */
void appendExtraMembers(Json& out, const Json& extra);

/**
 * Throw SeqError(MalformedJson) when a required member is missing.
 */
const Json& requireField(const Json& j, const char* key, const char* context);

}

#include "json_io.h"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace CitySeq::Core::Model {

Json parseJson(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw SeqError(ErrorKind::MalformedJson, e.what());
    }
}

Json extraMembers(const Json& j, std::initializer_list<const char*> known) {
    Json extra = Json::object();
    if (!j.is_object()) {
        return extra;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        bool isKnown = std::any_of(known.begin(), known.end(),
                                   [&key](const char* k) { return key == k; });
        if (!isKnown) {
            extra[key] = it.value();
        }
    }
    return extra;
}

void appendExtraMembers(Json& out, const Json& extra) {
    if (!extra.is_object()) {
        return;
    }
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        if (!out.contains(it.key())) {
            out[it.key()] = it.value();
        }
    }
}

const Json& requireField(const Json& j, const char* key, const char* context) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, fmt::format("{} is not a JSON object", context));
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw SeqError(ErrorKind::MalformedJson,
                       fmt::format("{} has no \"{}\" member", context, key));
    }
    return *it;
}

}

#include "extension.h"
#include <fmt/format.h>

namespace CitySeq::Core::Model {

ExtensionMap extensionsFromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "\"extensions\" is not an object");
    }
    ExtensionMap extensions;
    for (const auto& item : j.items()) {
        const Json& e = item.value();
        Extension ext;
        ext.url = requireField(e, "url", "extension").get<std::string>();
        ext.version = requireField(e, "version", "extension").get<std::string>();
        extensions.emplace(item.key(), std::move(ext));
    }
    return extensions;
}

Json extensionsToJson(const ExtensionMap& extensions) {
    Json j = Json::object();
    for (const auto& [name, ext] : extensions) {
        j[name] = {{"url", ext.url}, {"version", ext.version}};
    }
    return j;
}

std::string ExtensionFile::stringMember(const char* key) const {
    auto it = schema_.find(key);
    if (it == schema_.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

std::string ExtensionFile::name() const { return stringMember("name"); }
std::string ExtensionFile::url() const { return stringMember("url"); }
std::string ExtensionFile::version() const { return stringMember("version"); }
std::string ExtensionFile::versionCityJSON() const { return stringMember("versionCityJSON"); }

void ExtensionFile::validate() const {
    if (!schema_.is_object()) {
        throw SeqError(ErrorKind::InvalidValue, "extension schema is not an object");
    }
    if (stringMember("type") != "CityJSONExtension") {
        throw SeqError(ErrorKind::InvalidValue, "extension schema type is not CityJSONExtension");
    }
    for (const char* key : {"name", "url", "version", "versionCityJSON"}) {
        if (stringMember(key).empty()) {
            throw SeqError(ErrorKind::InvalidValue, fmt::format("extension schema lacks \"{}\"", key));
        }
    }
    for (const char* key : {"extraAttributes", "extraCityObjects", "extraRootProperties", "extraSemanticSurfaces"}) {
        auto it = schema_.find(key);
        if (it != schema_.end() && !it->is_object()) {
            throw SeqError(ErrorKind::InvalidValue, fmt::format("extension schema \"{}\" is not an object", key));
        }
    }
}

std::vector<std::string> ExtensionFile::extraCityObjectTypes() const {
    std::vector<std::string> types;
    auto it = schema_.find("extraCityObjects");
    if (it == schema_.end() || !it->is_object()) {
        return types;
    }
    for (const auto& item : it->items()) {
        types.push_back(item.key());
    }
    return types;
}

}

#pragma once

#include "json_io.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace CitySeq::Core::Model {

// Entry of a document's "extensions" member.
struct Extension {
    std::string url;
    std::string version;

    bool operator==(const Extension& other) const {
        return url == other.url && version == other.version;
    }
};

using ExtensionMap = std::map<std::string, Extension>;

ExtensionMap extensionsFromJson(const Json& j);
Json extensionsToJson(const ExtensionMap& extensions);

/**
 * A CityJSONExtension schema document that has already been loaded.
 */
class ExtensionFile {
public:
    explicit ExtensionFile(Json schema) : schema_(std::move(schema)) {}

    /**
     * Check the type tag, the non-empty identification members and that the
     * extra* members are objects.
     * @throws SeqError(InvalidValue) describing the first problem found
     */
    void validate() const;

    std::string name() const;
    std::string url() const;
    std::string version() const;
    std::string versionCityJSON() const;

    // Keys of extraCityObjects, e.g. "+NoiseBuilding".
    std::vector<std::string> extraCityObjectTypes() const;

    const Json& schema() const { return schema_; }

private:
    std::string stringMember(const char* key) const;

    Json schema_;
};

}

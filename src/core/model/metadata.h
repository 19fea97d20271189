#pragma once

#include "json_io.h"
#include <array>
#include <optional>
#include <string>

namespace CitySeq::Core::Model {

/**
 * CRS reference in OGC name-type URL form:
 * http(s)://www.opengis.net/def/crs/{authority}/{version}/{code}
 */
struct ReferenceSystem {
    std::string base;
    std::string authority;
    std::string version;
    std::string code;

    /**
     * @throws SeqError(InvalidValue) if url is not a crs URL
     */
    static ReferenceSystem fromUrl(const std::string& url);
    std::string toUrl() const;

    // "EPSG:<code>" for EPSG references, empty otherwise.
    std::string epsgCode() const;

    bool operator==(const ReferenceSystem& other) const {
        return toUrl() == other.toUrl();
    }
};

struct Metadata {
    std::optional<std::array<double, 6>> geographicalExtent;
    std::optional<std::string> identifier;
    std::optional<Json> pointOfContact;
    std::optional<std::string> referenceDate;
    std::optional<ReferenceSystem> referenceSystem;
    std::optional<std::string> title;
    Json extra = Json::object();

    static Metadata fromJson(const Json& j);
    Json toJson() const;
};

}

#pragma once

#include "appearance.h"
#include "city_object.h"
#include "json_io.h"
#include "transform.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

/**
 * One line of a CityJSONSeq: a top-level CityObject with its direct children,
 * a zero-based local vertex array and the appearance entries they use.
 */
class CityFeature {
public:
    static constexpr const char* kType = "CityJSONFeature";

    std::string type = kType;
    std::string id;
    CityObjectMap cityObjects;
    std::vector<Vertex> vertices;
    std::optional<Appearance> appearance;
    Json extra = Json::object();

    /**
     * @throws SeqError(MalformedJson) on invalid JSON, a wrong type tag or a
     * member of the wrong shape
     */
    static CityFeature parse(const std::string& text);
    static CityFeature fromJson(const Json& j);
    Json toJson() const;
    std::string dump() const { return toJson().dump(); }

    /**
     * Average of the local vertices, still in quantized space. Empty when the
     * feature has no vertices.
     */
    std::optional<glm::dvec3> centroid() const;

    /**
     * @throws SeqError(MissingObject) if the feature does not hold its own id
     */
    const CityObject& topLevelObject() const { return cityObjects.at(id); }

    bool hasValidVertexIndices() const;
};

}

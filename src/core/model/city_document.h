#pragma once

#include "appearance.h"
#include "city_object.h"
#include "extension.h"
#include "geometry.h"
#include "json_io.h"
#include "metadata.h"
#include "transform.h"
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

enum class SortingStrategy {
    Insertion,
    Alphabetical,
    Morton,
    Hilbert
};

const char* toString(SortingStrategy strategy);

/**
 * @throws SeqError(InvalidValue) for an unknown name
 */
SortingStrategy sortingStrategyFromString(const std::string& name);

struct GeometryTemplates {
    std::vector<Geometry> templates;
    std::vector<std::array<double, 3>> verticesTemplates;
    Json extra = Json::object();

    static GeometryTemplates fromJson(const Json& j);
    Json toJson() const;
};

/**
 * A whole CityJSON document: one global vertex array and one appearance
 * catalog shared by every CityObject.
 */
class CityDocument {
public:
    static constexpr const char* kType = "CityJSON";

    std::string type = kType;
    std::string version = "2.0";
    Transform transform;
    CityObjectMap cityObjects;
    std::vector<Vertex> vertices;
    std::optional<Metadata> metadata;
    std::optional<Appearance> appearance;
    std::optional<GeometryTemplates> geometryTemplates;
    std::optional<ExtensionMap> extensions;
    Json extra = Json::object();

    /**
     * @throws SeqError(MalformedJson) on invalid JSON or a member of the wrong shape
     */
    static CityDocument parse(const std::string& text);
    static CityDocument fromJson(const Json& j);
    Json toJson() const;
    std::string dump() const { return toJson().dump(); }

    /**
     * Reject anything but CityJSON 1.1 or 2.0.
     * @throws SeqError(UnsupportedDocument)
     */
    void checkSupported() const;

    // Number of top-level CityObjects.
    std::size_t numberOfCityObjects() const;

    /**
     * Top-level ids in the requested order.
     * @throws SeqError(UnsupportedOperation) for space-filling-curve orders
     */
    std::vector<std::string> topLevelIds(SortingStrategy strategy) const;

    // Rebuild the cached list of top-level ids.
    void sortFeatures(SortingStrategy strategy) { sortedIds_ = topLevelIds(strategy); }

    // Top-level ids from the last sortFeatures() call.
    const std::vector<std::string>& sortedIds() const { return sortedIds_; }

    /**
     * Copy of everything but the CityObjects, vertices and appearance.
     */
    CityDocument emptyCopy() const;

    void addCityObject(const std::string& id, CityObject object) {
        cityObjects.insert(id, std::move(object));
    }

    void appendVertices(const std::vector<Vertex>& more) {
        vertices.insert(vertices.end(), more.begin(), more.end());
    }

    std::size_t addMaterial(const MaterialObject& material);
    std::size_t addTexture(const TextureObject& texture);
    std::size_t addTextureVertices(const std::vector<TextureVertex>& uvs);

    /**
     * Collapse vertices with identical coordinates, keeping the first
     * occurrence, and renumber every boundary accordingly.
     * @return number of vertices removed
     */
    std::size_t removeDuplicateVertices();

    /**
     * Subtract the per-axis minimum from every vertex and fold it into the
     * translation so that real-world coordinates are unchanged.
     */
    void updateTransform();

    /**
     * Every boundary index of every CityObject is a valid vertex position.
     */
    bool hasValidVertexIndices() const;

private:
    std::vector<std::string> sortedIds_;
};

}

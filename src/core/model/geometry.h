#pragma once

#include "id_remap_table.h"
#include "json_io.h"
#include "nested_array.h"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

enum class GeometryType {
    MultiPoint,
    MultiLineString,
    MultiSurface,
    CompositeSurface,
    Solid,
    MultiSolid,
    CompositeSolid,
    GeometryInstance
};

const char* toString(GeometryType type);

/**
 * @throws SeqError(InvalidValue) for an unknown type name
 */
GeometryType geometryTypeFromString(const std::string& name);

/**
 * Boundary nesting depth of a type, as returned by NestedArray::depth().
 * MultiPoint 0, MultiLineString 1, surfaces 2, Solid 3, solid aggregates 4.
 * A GeometryInstance boundary is a single reference-point index (0).
 */
std::size_t boundaryDepth(GeometryType type);

/**
 * Depth of per-surface values (semantics and materials). Surface-based types
 * carry one value per surface, so the ring and index levels collapse.
 */
std::size_t surfaceValueDepth(GeometryType type);

struct SemanticSurface {
    std::string type;
    std::optional<std::size_t> parent;
    std::optional<std::vector<std::size_t>> children;
    Json extra = Json::object();

    bool operator==(const SemanticSurface& other) const {
        return type == other.type && parent == other.parent &&
               children == other.children && extra == other.extra;
    }
};

struct Semantics {
    std::vector<SemanticSurface> surfaces;
    NullableValues values;

    bool operator==(const Semantics& other) const {
        return surfaces == other.surfaces && values == other.values;
    }
};

// Either one material for the whole geometry or one per surface, never both.
struct MaterialReference {
    std::optional<std::size_t> value;
    std::optional<NullableValues> values;

    bool operator==(const MaterialReference& other) const {
        return value == other.value && values == other.values;
    }
};

// Each leaf list is [texture-id, uv, uv, ...] for one ring.
struct TextureReference {
    NullableValues values;

    bool operator==(const TextureReference& other) const { return values == other.values; }
};

class Geometry {
public:
    GeometryType type = GeometryType::MultiSurface;
    std::optional<std::string> lod;
    Boundaries boundaries;
    std::optional<Semantics> semantics;
    std::map<std::string, MaterialReference> material;
    std::map<std::string, TextureReference> texture;
    std::optional<std::size_t> templateIndex;
    std::optional<std::array<double, 16>> transformationMatrix;
    Json extra = Json::object();

    /**
     * Renumber boundary vertex ids through table; first-seen ids get
     * table.size() + offset.
     */
    void renumberVertices(IdRemapTable& table, std::size_t offset = 0) {
        boundaries.renumber(table, offset);
    }

    void offsetVertices(std::size_t k) { boundaries.offset(k); }

    /**
     * Renumber every theme's material value or values through table.
     */
    void renumberMaterials(IdRemapTable& table);

    /**
     * Renumber texture references: position 0 of each ring list goes through
     * textureTable, the remaining uv indices through uvTable with uvOffset.
     */
    void renumberTextures(IdRemapTable& textureTable, IdRemapTable& uvTable, std::size_t uvOffset = 0);

    /**
     * Check the boundary depth against the type, material and semantic values
     * against the per-surface depth, and texture values against the boundary
     * depth. Empty arrays are accepted at any depth.
     */
    bool hasConsistentDepth() const;

    /**
     * Numeric value of lod, or nullopt if absent or not a number.
     */
    std::optional<double> lodValue() const;

    bool operator==(const Geometry& other) const;

    static Geometry fromJson(const Json& j);
    Json toJson() const;
};

}

#pragma once

#include "json_io.h"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

// Quantized vertex; only meaningful relative to its document's Transform.
using Vertex = std::array<std::int64_t, 3>;

struct VertexHash {
    std::size_t operator()(const Vertex& v) const {
        std::size_t h = std::hash<std::int64_t>()(v[0]);
        h ^= std::hash<std::int64_t>()(v[1]) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::int64_t>()(v[2]) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

/**
 * Quantization transform of a document.
 *
 * real = vertex * scale + translate, per axis.
 */
struct Transform {
    glm::dvec3 scale = glm::dvec3(1.0);
    glm::dvec3 translate = glm::dvec3(0.0);

    glm::dvec3 toWorld(const Vertex& v) const {
        return glm::dvec3(static_cast<double>(v[0]) * scale.x + translate.x,
                          static_cast<double>(v[1]) * scale.y + translate.y,
                          static_cast<double>(v[2]) * scale.z + translate.z);
    }

    glm::dvec3 toWorld(const glm::dvec3& v) const {
        return v * scale + translate;
    }

    /**
     * Quantize a real-world coordinate into this transform's integer space.
     * Rounds half away from zero.
     */
    Vertex quantize(const glm::dvec3& world) const;

    /**
     * Re-express a vertex quantized under source in this transform.
     */
    Vertex requantize(const Vertex& v, const Transform& source) const {
        return quantize(source.toWorld(v));
    }

    bool operator==(const Transform& other) const {
        return scale == other.scale && translate == other.translate;
    }

    static Transform fromJson(const Json& j);
    Json toJson() const;

    std::string toString() const;
};

std::vector<Vertex> verticesFromJson(const Json& j);
Json verticesToJson(const std::vector<Vertex>& vertices);

}

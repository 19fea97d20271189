#include "transform.h"
#include <cmath>
#include <fmt/format.h>

namespace CitySeq::Core::Model {

Vertex Transform::quantize(const glm::dvec3& world) const {
    glm::dvec3 q = (world - translate) / scale;
    return Vertex{static_cast<std::int64_t>(std::llround(q.x)),
                  static_cast<std::int64_t>(std::llround(q.y)),
                  static_cast<std::int64_t>(std::llround(q.z))};
}

Transform Transform::fromJson(const Json& j) {
    Transform t;
    const Json& scale = requireField(j, "scale", "transform");
    const Json& translate = requireField(j, "translate", "transform");
    if (!scale.is_array() || scale.size() != 3 || !translate.is_array() || translate.size() != 3) {
        throw SeqError(ErrorKind::MalformedJson, "transform scale/translate must have 3 numbers");
    }
    for (int i = 0; i < 3; ++i) {
        t.scale[i] = scale[i].get<double>();
        t.translate[i] = translate[i].get<double>();
    }
    return t;
}

Json Transform::toJson() const {
    Json j = Json::object();
    j["scale"] = {scale.x, scale.y, scale.z};
    j["translate"] = {translate.x, translate.y, translate.z};
    return j;
}

std::string Transform::toString() const {
    return fmt::format("[scale=({},{},{}), translate=({},{},{})]",
                       scale.x, scale.y, scale.z,
                       translate.x, translate.y, translate.z);
}

std::vector<Vertex> verticesFromJson(const Json& j) {
    std::vector<Vertex> vertices;
    if (!j.is_array()) {
        throw SeqError(ErrorKind::MalformedJson, "\"vertices\" is not an array");
    }
    vertices.reserve(j.size());
    for (const auto& v : j) {
        if (!v.is_array() || v.size() < 3) {
            throw SeqError(ErrorKind::MalformedJson, "vertex is not an [x,y,z] array");
        }
        vertices.push_back(Vertex{v[0].get<std::int64_t>(), v[1].get<std::int64_t>(), v[2].get<std::int64_t>()});
    }
    return vertices;
}

Json verticesToJson(const std::vector<Vertex>& vertices) {
    Json out = Json::array();
    for (const auto& v : vertices) {
        out.push_back({v[0], v[1], v[2]});
    }
    return out;
}

}

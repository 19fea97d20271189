#include "city_feature.h"
#include <fmt/format.h>

namespace CitySeq::Core::Model {

CityFeature CityFeature::parse(const std::string& text) {
    return fromJson(parseJson(text));
}

CityFeature CityFeature::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "feature is not a JSON object");
    }
    try {
        CityFeature f;
        f.type = requireField(j, "type", "feature").get<std::string>();
        if (f.type != kType) {
            throw SeqError(ErrorKind::MalformedJson, fmt::format("line is \"{}\", not {}", f.type, kType));
        }
        f.id = requireField(j, "id", "feature").get<std::string>();
        f.cityObjects = CityObjectMap::fromJson(requireField(j, "CityObjects", "feature"));
        f.vertices = verticesFromJson(requireField(j, "vertices", "feature"));
        if (auto it = j.find("appearance"); it != j.end() && !it->is_null()) {
            f.appearance = Appearance::fromJson(*it);
        }
        f.extra = extraMembers(j, {"type", "id", "CityObjects", "vertices", "appearance"});
        return f;
    } catch (const nlohmann::json::exception& e) {
        throw SeqError(ErrorKind::MalformedJson, e.what());
    }
}

Json CityFeature::toJson() const {
    Json j = Json::object();
    j["type"] = type;
    j["id"] = id;
    j["CityObjects"] = cityObjects.toJson();
    j["vertices"] = verticesToJson(vertices);
    if (appearance) {
        j["appearance"] = appearance->toJson();
    }
    appendExtraMembers(j, extra);
    return j;
}

std::optional<glm::dvec3> CityFeature::centroid() const {
    if (vertices.empty()) {
        return std::nullopt;
    }
    glm::dvec3 total(0.0);
    for (const auto& v : vertices) {
        total += glm::dvec3(static_cast<double>(v[0]), static_cast<double>(v[1]), static_cast<double>(v[2]));
    }
    return total / static_cast<double>(vertices.size());
}

bool CityFeature::hasValidVertexIndices() const {
    for (const auto& [key, co] : cityObjects) {
        if (!co.geometry) {
            continue;
        }
        for (const auto& g : *co.geometry) {
            auto max = g.boundaries.maxIndex();
            if (max && *max >= vertices.size()) {
                return false;
            }
        }
    }
    return true;
}

}

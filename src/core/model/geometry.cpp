#include "geometry.h"
#include "log.h"
#include <cstdlib>
#include <fmt/format.h>

namespace CitySeq::Core::Model {

namespace {

struct TypeName {
    GeometryType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {GeometryType::MultiPoint, "MultiPoint"},
    {GeometryType::MultiLineString, "MultiLineString"},
    {GeometryType::MultiSurface, "MultiSurface"},
    {GeometryType::CompositeSurface, "CompositeSurface"},
    {GeometryType::Solid, "Solid"},
    {GeometryType::MultiSolid, "MultiSolid"},
    {GeometryType::CompositeSolid, "CompositeSolid"},
    {GeometryType::GeometryInstance, "GeometryInstance"},
};

template <typename T>
bool depthMatches(const NestedArray<T>& values, std::size_t expected) {
    if (values.isIndices() && values.indices().empty()) {
        return true;
    }
    return values.depth() == expected;
}

std::optional<std::size_t> indexField(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    auto index = IndexTraits<std::size_t>::fromJson(*it);
    if (!index) {
        throw SeqError(ErrorKind::MalformedJson, fmt::format("\"{}\" is not a non-negative integer", key));
    }
    return index;
}

SemanticSurface surfaceFromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "semantic surface is not an object");
    }
    SemanticSurface s;
    s.type = requireField(j, "type", "semantic surface").get<std::string>();
    s.parent = indexField(j, "parent");
    s.children = optionalField<std::vector<std::size_t>>(j, "children");
    s.extra = extraMembers(j, {"type", "parent", "children"});
    return s;
}

Json surfaceToJson(const SemanticSurface& s) {
    Json j = Json::object();
    j["type"] = s.type;
    putOptional(j, "parent", s.parent);
    putOptional(j, "children", s.children);
    appendExtraMembers(j, s.extra);
    return j;
}

}

const char* toString(GeometryType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Unknown";
}

GeometryType geometryTypeFromString(const std::string& name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    throw SeqError(ErrorKind::InvalidValue, fmt::format("unknown geometry type \"{}\"", name));
}

std::size_t boundaryDepth(GeometryType type) {
    switch (type) {
        case GeometryType::MultiPoint:
        case GeometryType::GeometryInstance:
            return 0;
        case GeometryType::MultiLineString:
            return 1;
        case GeometryType::MultiSurface:
        case GeometryType::CompositeSurface:
            return 2;
        case GeometryType::Solid:
            return 3;
        case GeometryType::MultiSolid:
        case GeometryType::CompositeSolid:
            return 4;
    }
    return 0;
}

std::size_t surfaceValueDepth(GeometryType type) {
    std::size_t depth = boundaryDepth(type);
    return depth >= 2 ? depth - 2 : 0;
}

void Geometry::renumberMaterials(IdRemapTable& table) {
    for (auto& [theme, ref] : material) {
        if (ref.value) {
            ref.value = table.resolve(*ref.value);
        }
        if (ref.values) {
            ref.values->renumber(table);
        }
    }
}

void Geometry::renumberTextures(IdRemapTable& textureTable, IdRemapTable& uvTable, std::size_t uvOffset) {
    for (auto& [theme, ref] : texture) {
        ref.values.forEachList([&](NullableValues::Indices& ring) {
            for (std::size_t k = 0; k < ring.size(); ++k) {
                if (!ring[k]) {
                    continue;
                }
                if (k == 0) {
                    ring[k] = textureTable.resolve(*ring[k]);
                } else {
                    ring[k] = uvTable.resolve(*ring[k], uvOffset);
                }
            }
        });
    }
}

bool Geometry::hasConsistentDepth() const {
    if (!depthMatches(boundaries, boundaryDepth(type))) {
        return false;
    }
    std::size_t perSurface = surfaceValueDepth(type);
    if (semantics && !depthMatches(semantics->values, perSurface)) {
        return false;
    }
    for (const auto& [theme, ref] : material) {
        if (ref.values && !depthMatches(*ref.values, perSurface)) {
            return false;
        }
    }
    for (const auto& [theme, ref] : texture) {
        if (!depthMatches(ref.values, boundaryDepth(type))) {
            return false;
        }
    }
    return true;
}

std::optional<double> Geometry::lodValue() const {
    if (!lod || lod->empty()) {
        return std::nullopt;
    }
    const char* begin = lod->c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

bool Geometry::operator==(const Geometry& other) const {
    return type == other.type && lod == other.lod && boundaries == other.boundaries &&
           semantics == other.semantics && material == other.material &&
           texture == other.texture && templateIndex == other.templateIndex &&
           transformationMatrix == other.transformationMatrix && extra == other.extra;
}

Geometry Geometry::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "geometry is not an object");
    }
    Geometry g;
    g.type = geometryTypeFromString(requireField(j, "type", "geometry").get<std::string>());

    if (auto it = j.find("lod"); it != j.end() && !it->is_null()) {
        g.lod = it->is_string() ? it->get<std::string>() : it->dump();
    }
    if (auto it = j.find("boundaries"); it != j.end()) {
        g.boundaries = Boundaries::fromJson(*it);
    }
    if (auto it = j.find("semantics"); it != j.end() && it->is_object()) {
        Semantics sem;
        if (auto surfaces = it->find("surfaces"); surfaces != it->end() && surfaces->is_array()) {
            for (const auto& s : *surfaces) {
                sem.surfaces.push_back(surfaceFromJson(s));
            }
        }
        if (auto values = it->find("values"); values != it->end()) {
            sem.values = NullableValues::fromJson(*values);
        }
        g.semantics = std::move(sem);
    }
    if (auto it = j.find("material"); it != j.end() && it->is_object()) {
        for (const auto& item : it->items()) {
            const std::string& theme = item.key();
            const Json& m = item.value();
            MaterialReference ref;
            ref.value = indexField(m, "value");
            if (auto values = m.find("values"); values != m.end() && !values->is_null()) {
                ref.values = NullableValues::fromJson(*values);
            }
            if (ref.value && ref.values) {
                throw SeqError(ErrorKind::InvalidValue,
                               fmt::format("material theme \"{}\" has both value and values", theme));
            }
            g.material.emplace(theme, std::move(ref));
        }
    }
    if (auto it = j.find("texture"); it != j.end() && it->is_object()) {
        for (const auto& item : it->items()) {
            const Json& t = item.value();
            TextureReference ref;
            if (auto values = t.find("values"); values != t.end()) {
                ref.values = NullableValues::fromJson(*values);
            }
            g.texture.emplace(item.key(), std::move(ref));
        }
    }
    g.templateIndex = indexField(j, "template");
    if (auto it = j.find("transformationMatrix"); it != j.end() && !it->is_null()) {
        if (!it->is_array() || it->size() != 16) {
            throw SeqError(ErrorKind::MalformedJson, "transformationMatrix must hold 16 numbers");
        }
        std::array<double, 16> m{};
        for (std::size_t i = 0; i < 16; ++i) {
            m[i] = (*it)[i].get<double>();
        }
        g.transformationMatrix = m;
    }
    g.extra = extraMembers(j, {"type", "lod", "boundaries", "semantics", "material", "texture",
                               "template", "transformationMatrix"});

    if (!g.hasConsistentDepth()) {
        LOG_W("%s geometry has values nested at an unexpected depth", toString(g.type));
    }
    return g;
}

Json Geometry::toJson() const {
    Json j = Json::object();
    j["type"] = toString(type);
    putOptional(j, "lod", lod);
    j["boundaries"] = boundaries.toJson();
    if (semantics) {
        Json surfaces = Json::array();
        for (const auto& s : semantics->surfaces) {
            surfaces.push_back(surfaceToJson(s));
        }
        Json sem = Json::object();
        sem["surfaces"] = std::move(surfaces);
        sem["values"] = semantics->values.toJson();
        j["semantics"] = std::move(sem);
    }
    if (!material.empty()) {
        Json themes = Json::object();
        for (const auto& [theme, ref] : material) {
            Json m = Json::object();
            putOptional(m, "value", ref.value);
            if (ref.values) {
                m["values"] = ref.values->toJson();
            }
            themes[theme] = std::move(m);
        }
        j["material"] = std::move(themes);
    }
    if (!texture.empty()) {
        Json themes = Json::object();
        for (const auto& [theme, ref] : texture) {
            Json t = Json::object();
            t["values"] = ref.values.toJson();
            themes[theme] = std::move(t);
        }
        j["texture"] = std::move(themes);
    }
    putOptional(j, "template", templateIndex);
    putOptional(j, "transformationMatrix", transformationMatrix);
    appendExtraMembers(j, extra);
    return j;
}

}

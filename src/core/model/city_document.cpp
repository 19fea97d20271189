#include "city_document.h"
#include "log.h"
#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <unordered_map>

namespace CitySeq::Core::Model {

const char* toString(SortingStrategy strategy) {
    switch (strategy) {
        case SortingStrategy::Insertion: return "insertion";
        case SortingStrategy::Alphabetical: return "alphabetical";
        case SortingStrategy::Morton: return "morton";
        case SortingStrategy::Hilbert: return "hilbert";
    }
    return "unknown";
}

SortingStrategy sortingStrategyFromString(const std::string& name) {
    for (SortingStrategy s : {SortingStrategy::Insertion, SortingStrategy::Alphabetical,
                              SortingStrategy::Morton, SortingStrategy::Hilbert}) {
        if (name == toString(s)) {
            return s;
        }
    }
    throw SeqError(ErrorKind::InvalidValue, fmt::format("unknown sorting order \"{}\"", name));
}

GeometryTemplates GeometryTemplates::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "\"geometry-templates\" is not an object");
    }
    GeometryTemplates gt;
    for (const auto& g : requireField(j, "templates", "geometry-templates")) {
        gt.templates.push_back(Geometry::fromJson(g));
    }
    for (const auto& v : requireField(j, "vertices-templates", "geometry-templates")) {
        if (!v.is_array() || v.size() < 3) {
            throw SeqError(ErrorKind::MalformedJson, "template vertex is not an [x,y,z] array");
        }
        gt.verticesTemplates.push_back({v[0].get<double>(), v[1].get<double>(), v[2].get<double>()});
    }
    gt.extra = extraMembers(j, {"templates", "vertices-templates"});
    return gt;
}

Json GeometryTemplates::toJson() const {
    Json j = Json::object();
    Json geoms = Json::array();
    for (const auto& g : templates) {
        geoms.push_back(g.toJson());
    }
    j["templates"] = std::move(geoms);
    Json verts = Json::array();
    for (const auto& v : verticesTemplates) {
        verts.push_back({v[0], v[1], v[2]});
    }
    j["vertices-templates"] = std::move(verts);
    appendExtraMembers(j, extra);
    return j;
}

CityDocument CityDocument::parse(const std::string& text) {
    return fromJson(parseJson(text));
}

CityDocument CityDocument::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "document is not a JSON object");
    }
    try {
        CityDocument doc;
        doc.type = requireField(j, "type", "document").get<std::string>();
        doc.version = requireField(j, "version", "document").get<std::string>();
        doc.transform = Transform::fromJson(requireField(j, "transform", "document"));
        doc.cityObjects = CityObjectMap::fromJson(requireField(j, "CityObjects", "document"));
        doc.vertices = verticesFromJson(requireField(j, "vertices", "document"));
        if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
            doc.metadata = Metadata::fromJson(*it);
        }
        if (auto it = j.find("appearance"); it != j.end() && !it->is_null()) {
            doc.appearance = Appearance::fromJson(*it);
        }
        if (auto it = j.find("geometry-templates"); it != j.end() && !it->is_null()) {
            doc.geometryTemplates = GeometryTemplates::fromJson(*it);
        }
        if (auto it = j.find("extensions"); it != j.end() && !it->is_null()) {
            doc.extensions = extensionsFromJson(*it);
        }
        doc.extra = extraMembers(j, {"type", "version", "transform", "CityObjects", "vertices",
                                     "metadata", "appearance", "geometry-templates", "extensions"});
        return doc;
    } catch (const nlohmann::json::exception& e) {
        throw SeqError(ErrorKind::MalformedJson, e.what());
    }
}

Json CityDocument::toJson() const {
    Json j = Json::object();
    j["type"] = type;
    j["version"] = version;
    j["transform"] = transform.toJson();
    j["CityObjects"] = cityObjects.toJson();
    j["vertices"] = verticesToJson(vertices);
    if (metadata) {
        j["metadata"] = metadata->toJson();
    }
    if (appearance) {
        j["appearance"] = appearance->toJson();
    }
    if (geometryTemplates) {
        j["geometry-templates"] = geometryTemplates->toJson();
    }
    if (extensions) {
        j["extensions"] = extensionsToJson(*extensions);
    }
    appendExtraMembers(j, extra);
    return j;
}

void CityDocument::checkSupported() const {
    if (type != kType) {
        throw SeqError(ErrorKind::UnsupportedDocument, fmt::format("input is \"{}\", not CityJSON", type));
    }
    if (version != "1.1" && version != "2.0") {
        throw SeqError(ErrorKind::UnsupportedDocument,
                       fmt::format("CityJSON version \"{}\" is neither 1.1 nor 2.0", version));
    }
}

std::size_t CityDocument::numberOfCityObjects() const {
    return static_cast<std::size_t>(std::count_if(cityObjects.begin(), cityObjects.end(),
        [](const CityObjectMap::Entry& e) { return e.second.isTopLevel(); }));
}

std::vector<std::string> CityDocument::topLevelIds(SortingStrategy strategy) const {
    if (strategy == SortingStrategy::Morton || strategy == SortingStrategy::Hilbert) {
        throw SeqError(ErrorKind::UnsupportedOperation,
                       fmt::format("{} ordering is not implemented", toString(strategy)));
    }
    std::vector<std::string> ids;
    for (const auto& [id, co] : cityObjects) {
        if (co.isTopLevel()) {
            ids.push_back(id);
        }
    }
    if (strategy == SortingStrategy::Alphabetical) {
        std::sort(ids.begin(), ids.end());
    }
    return ids;
}

CityDocument CityDocument::emptyCopy() const {
    CityDocument copy;
    copy.type = type;
    copy.version = version;
    copy.transform = transform;
    copy.metadata = metadata;
    copy.geometryTemplates = geometryTemplates;
    copy.extensions = extensions;
    copy.extra = extra;
    return copy;
}

std::size_t CityDocument::addMaterial(const MaterialObject& material) {
    if (!appearance) {
        appearance.emplace();
    }
    return appearance->addMaterial(material);
}

std::size_t CityDocument::addTexture(const TextureObject& texture) {
    if (!appearance) {
        appearance.emplace();
    }
    return appearance->addTexture(texture);
}

std::size_t CityDocument::addTextureVertices(const std::vector<TextureVertex>& uvs) {
    if (!appearance) {
        appearance.emplace();
    }
    return appearance->addTextureVertices(uvs);
}

std::size_t CityDocument::removeDuplicateVertices() {
    std::unordered_map<Vertex, std::size_t, VertexHash> seen;
    IdRemapTable table;
    std::vector<Vertex> unique;
    unique.reserve(vertices.size());
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        auto inserted = seen.emplace(vertices[i], unique.size());
        if (inserted.second) {
            unique.push_back(vertices[i]);
        }
        table.record(i, inserted.first->second);
    }
    for (auto& [id, co] : cityObjects) {
        if (!co.geometry) {
            continue;
        }
        for (auto& g : *co.geometry) {
            g.renumberVertices(table);
        }
    }
    std::size_t removed = vertices.size() - unique.size();
    vertices = std::move(unique);
    LOG_D("vertex dedup removed %zu of %zu vertices", removed, removed + vertices.size());
    return removed;
}

void CityDocument::updateTransform() {
    if (vertices.empty()) {
        return;
    }
    Vertex mins{std::numeric_limits<std::int64_t>::max(),
                std::numeric_limits<std::int64_t>::max(),
                std::numeric_limits<std::int64_t>::max()};
    for (const auto& v : vertices) {
        for (int i = 0; i < 3; ++i) {
            mins[i] = std::min(mins[i], v[i]);
        }
    }
    for (auto& v : vertices) {
        for (int i = 0; i < 3; ++i) {
            v[i] -= mins[i];
        }
    }
    for (int i = 0; i < 3; ++i) {
        transform.translate[i] += static_cast<double>(mins[i]) * transform.scale[i];
    }
}

bool CityDocument::hasValidVertexIndices() const {
    for (const auto& [id, co] : cityObjects) {
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

#include "city_object.h"
#include <fmt/format.h>

namespace CitySeq::Core::Model {

std::string CityObject::extensionType() const {
    if (!isExtensionType()) {
        return std::string();
    }
    std::size_t end = type.find_first_of("+.", 1);
    return type.substr(1, end == std::string::npos ? std::string::npos : end - 1);
}

bool CityObject::operator==(const CityObject& other) const {
    return type == other.type && geographicalExtent == other.geographicalExtent &&
           attributes == other.attributes && geometry == other.geometry &&
           children == other.children && childrenRoles == other.childrenRoles &&
           parents == other.parents && extra == other.extra;
}

CityObject CityObject::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "CityObject is not an object");
    }
    CityObject co;
    co.type = requireField(j, "type", "CityObject").get<std::string>();
    if (auto it = j.find("geographicalExtent"); it != j.end() && !it->is_null()) {
        if (!it->is_array() || it->size() != 6) {
            throw SeqError(ErrorKind::MalformedJson, "geographicalExtent must hold 6 numbers");
        }
        std::array<double, 6> extent{};
        for (std::size_t i = 0; i < 6; ++i) {
            extent[i] = (*it)[i].get<double>();
        }
        co.geographicalExtent = extent;
    }
    co.attributes = optionalField<Json>(j, "attributes");
    if (auto it = j.find("geometry"); it != j.end() && it->is_array()) {
        std::vector<Geometry> geoms;
        geoms.reserve(it->size());
        for (const auto& g : *it) {
            geoms.push_back(Geometry::fromJson(g));
        }
        co.geometry = std::move(geoms);
    }
    co.children = optionalField<std::vector<std::string>>(j, "children");
    co.childrenRoles = optionalField<Json>(j, "children_roles");
    co.parents = optionalField<std::vector<std::string>>(j, "parents");
    co.extra = extraMembers(j, {"type", "geographicalExtent", "attributes", "geometry",
                                "children", "children_roles", "parents"});
    return co;
}

Json CityObject::toJson() const {
    Json j = Json::object();
    j["type"] = type;
    putOptional(j, "geographicalExtent", geographicalExtent);
    putOptional(j, "attributes", attributes);
    if (geometry) {
        Json geoms = Json::array();
        for (const auto& g : *geometry) {
            geoms.push_back(g.toJson());
        }
        j["geometry"] = std::move(geoms);
    }
    putOptional(j, "children", children);
    putOptional(j, "children_roles", childrenRoles);
    putOptional(j, "parents", parents);
    appendExtraMembers(j, extra);
    return j;
}

void CityObjectMap::insert(const std::string& id, CityObject object) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(object);
        return;
    }
    index_.emplace(id, entries_.size());
    entries_.emplace_back(id, std::move(object));
}

CityObject* CityObjectMap::find(const std::string& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

const CityObject* CityObjectMap::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

CityObject& CityObjectMap::at(const std::string& id) {
    CityObject* co = find(id);
    if (!co) {
        throw SeqError(ErrorKind::MissingObject, fmt::format("CityObject \"{}\" not found", id));
    }
    return *co;
}

const CityObject& CityObjectMap::at(const std::string& id) const {
    const CityObject* co = find(id);
    if (!co) {
        throw SeqError(ErrorKind::MissingObject, fmt::format("CityObject \"{}\" not found", id));
    }
    return *co;
}

void CityObjectMap::clear() {
    entries_.clear();
    index_.clear();
}

// Order-insensitive: two maps are equal when they hold equal objects under the same ids.
bool CityObjectMap::operator==(const CityObjectMap& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const auto& [id, co] : entries_) {
        const CityObject* theirs = other.find(id);
        if (!theirs || !(*theirs == co)) {
            return false;
        }
    }
    return true;
}

CityObjectMap CityObjectMap::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "\"CityObjects\" is not an object");
    }
    CityObjectMap map;
    for (const auto& item : j.items()) {
        map.insert(item.key(), CityObject::fromJson(item.value()));
    }
    return map;
}

Json CityObjectMap::toJson() const {
    Json j = Json::object();
    for (const auto& [id, co] : entries_) {
        j[id] = co.toJson();
    }
    return j;
}

}

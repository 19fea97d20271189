#pragma once

#include "geometry.h"
#include "json_io.h"
#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace CitySeq::Core::Model {

class CityObject {
public:
    std::string type;
    std::optional<std::array<double, 6>> geographicalExtent;
    std::optional<Json> attributes;
    std::optional<std::vector<Geometry>> geometry;
    std::optional<std::vector<std::string>> children;
    std::optional<Json> childrenRoles;
    std::optional<std::vector<std::string>> parents;
    Json extra = Json::object();

    // Top-level iff it has no parents.
    bool isTopLevel() const { return !parents || parents->empty(); }

    bool isExtensionType() const { return !type.empty() && type[0] == '+'; }

    /**
     * Name of an extension type: text after the leading '+' up to the next
     * '+' or '.'. Empty for core types.
     */
    std::string extensionType() const;

    std::vector<std::string> childIds() const {
        return children ? *children : std::vector<std::string>();
    }

    bool operator==(const CityObject& other) const;

    static CityObject fromJson(const Json& j);
    Json toJson() const;
};

/**
 * CityObjects keyed by id, iterated in insertion order.
 */
class CityObjectMap {
public:
    using Entry = std::pair<std::string, CityObject>;

    /**
     * Insert or replace the object stored under id. A replaced object keeps
     * its original position.
     */
    void insert(const std::string& id, CityObject object);

    CityObject* find(const std::string& id);
    const CityObject* find(const std::string& id) const;

    /**
     * @throws SeqError(MissingObject) if id is absent
     */
    CityObject& at(const std::string& id);
    const CityObject& at(const std::string& id) const;

    bool contains(const std::string& id) const { return index_.count(id) != 0; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    std::vector<Entry>::iterator begin() { return entries_.begin(); }
    std::vector<Entry>::iterator end() { return entries_.end(); }
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    bool operator==(const CityObjectMap& other) const;

    static CityObjectMap fromJson(const Json& j);
    Json toJson() const;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}

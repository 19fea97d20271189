#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace CitySeq::Core::Model {

/**
 * Append-only old-id -> new-id mapping.
 *
 * The same table type renumbers vertices, materials, textures and texture
 * vertices. The first time an old id is resolved fixes its new id for the
 * lifetime of the table.
 */
class IdRemapTable {
public:
    /**
     * Return the recorded new id of oldId, assigning size() + offset on a miss.
     */
    std::size_t resolve(std::size_t oldId, std::size_t offset = 0);

    /**
     * Record an explicit assignment. An existing entry is left untouched.
     * @return true if the entry was added
     */
    bool record(std::size_t oldId, std::size_t newId);

    std::optional<std::size_t> find(std::size_t oldId) const;

    bool contains(std::size_t oldId) const { return map_.count(oldId) != 0; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    /**
     * Largest new id + 1, i.e. the length of an array that can hold every
     * mapped entry at its new position.
     */
    std::size_t span() const { return span_; }

    // (old, new) pairs in the order they were recorded.
    const std::vector<std::pair<std::size_t, std::size_t>>& entries() const { return entries_; }

private:
    std::unordered_map<std::size_t, std::size_t> map_;
    std::vector<std::pair<std::size_t, std::size_t>> entries_;
    std::size_t span_ = 0;
};

}

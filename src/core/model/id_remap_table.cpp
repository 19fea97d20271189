#include "id_remap_table.h"
#include <algorithm>

namespace CitySeq::Core::Model {

std::size_t IdRemapTable::resolve(std::size_t oldId, std::size_t offset) {
    auto it = map_.find(oldId);
    if (it != map_.end()) {
        return it->second;
    }
    std::size_t newId = entries_.size() + offset;
    record(oldId, newId);
    return newId;
}

bool IdRemapTable::record(std::size_t oldId, std::size_t newId) {
    auto inserted = map_.emplace(oldId, newId);
    if (!inserted.second) {
        return false;
    }
    entries_.emplace_back(oldId, newId);
    span_ = std::max(span_, newId + 1);
    return true;
}

std::optional<std::size_t> IdRemapTable::find(std::size_t oldId) const {
    auto it = map_.find(oldId);
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void IdRemapTable::clear() {
    map_.clear();
    entries_.clear();
    span_ = 0;
}

}

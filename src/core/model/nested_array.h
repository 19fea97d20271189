#pragma once

#include "id_remap_table.h"
#include "json_io.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace CitySeq::Core::Model {

/**
 * Conversion between JSON array elements and leaf values of a NestedArray.
 *
 * fromJson returns nullopt for an element that cannot be coerced; such
 * elements are dropped by the parser. slot() exposes the index stored in a
 * leaf, or nullptr for a null leaf.
 */
template <typename T>
struct IndexTraits;

template <>
struct IndexTraits<std::size_t> {
    static std::optional<std::size_t> fromJson(const Json& v) {
        if (v.is_number_unsigned()) {
            return v.get<std::size_t>();
        }
        if (v.is_number_integer()) {
            std::int64_t i = v.get<std::int64_t>();
            if (i >= 0) {
                return static_cast<std::size_t>(i);
            }
        }
        return std::nullopt;
    }
    static Json toJson(std::size_t v) { return v; }
    static std::size_t* slot(std::size_t& v) { return &v; }
    static const std::size_t* slot(const std::size_t& v) { return &v; }
};

template <>
struct IndexTraits<std::optional<std::size_t>> {
    static std::optional<std::optional<std::size_t>> fromJson(const Json& v) {
        if (v.is_null()) {
            return std::optional<std::optional<std::size_t>>(std::in_place, std::nullopt);
        }
        auto index = IndexTraits<std::size_t>::fromJson(v);
        if (!index) {
            return std::nullopt;
        }
        return std::optional<std::size_t>(*index);
    }
    static Json toJson(const std::optional<std::size_t>& v) {
        return v ? Json(*v) : Json(nullptr);
    }
    static std::size_t* slot(std::optional<std::size_t>& v) { return v ? &*v : nullptr; }
    static const std::size_t* slot(const std::optional<std::size_t>& v) { return v ? &*v : nullptr; }
};

/**
 * Variable-depth nested array of indices.
 *
 * A node is either a flat list of leaf values or a list of sub-arrays. The
 * depth that is meaningful depends on the owner (geometry type, material or
 * texture values); every traversal here is depth-agnostic.
 */
template <typename T>
class NestedArray {
public:
    using Indices = std::vector<T>;
    using Nested = std::vector<NestedArray<T>>;

    NestedArray() : data_(Indices()) {}
    explicit NestedArray(Indices indices) : data_(std::move(indices)) {}
    explicit NestedArray(Nested children) : data_(std::move(children)) {}

    bool isIndices() const { return std::holds_alternative<Indices>(data_); }
    bool isNested() const { return std::holds_alternative<Nested>(data_); }

    const Indices& indices() const { return std::get<Indices>(data_); }
    Indices& indices() { return std::get<Indices>(data_); }
    const Nested& children() const { return std::get<Nested>(data_); }
    Nested& children() { return std::get<Nested>(data_); }

    bool operator==(const NestedArray& other) const { return data_ == other.data_; }

    /**
     * Visit every flat index list in document order.
     */
    template <typename Fn>
    void forEachList(Fn&& fn) {
        if (auto* leaf = std::get_if<Indices>(&data_)) {
            fn(*leaf);
            return;
        }
        for (auto& child : std::get<Nested>(data_)) {
            child.forEachList(fn);
        }
    }

    template <typename Fn>
    void forEachList(Fn&& fn) const {
        if (const auto* leaf = std::get_if<Indices>(&data_)) {
            fn(*leaf);
            return;
        }
        for (const auto& child : std::get<Nested>(data_)) {
            child.forEachList(fn);
        }
    }

    /**
     * Visit every non-null index in document order.
     */
    template <typename Fn>
    void forEachIndex(Fn&& fn) {
        forEachList([&fn](Indices& list) {
            for (auto& value : list) {
                if (std::size_t* index = IndexTraits<T>::slot(value)) {
                    fn(*index);
                }
            }
        });
    }

    template <typename Fn>
    void forEachIndex(Fn&& fn) const {
        forEachList([&fn](const Indices& list) {
            for (const auto& value : list) {
                if (const std::size_t* index = IndexTraits<T>::slot(value)) {
                    fn(*index);
                }
            }
        });
    }

    /**
     * Replace every index by its id in table, assigning table.size() + scopeOffset
     * to ids seen for the first time.
     */
    void renumber(IdRemapTable& table, std::size_t scopeOffset = 0) {
        forEachIndex([&table, scopeOffset](std::size_t& index) {
            index = table.resolve(index, scopeOffset);
        });
    }

    /**
     * Add k to every index.
     */
    void offset(std::size_t k) {
        forEachIndex([k](std::size_t& index) { index += k; });
    }

    /**
     * Nesting depth: 0 for a flat list, following the first child otherwise.
     */
    std::size_t depth() const {
        const NestedArray* node = this;
        std::size_t d = 0;
        while (node->isNested() && !node->children().empty()) {
            node = &node->children().front();
            ++d;
        }
        return d;
    }

    std::size_t leafCount() const {
        std::size_t count = 0;
        forEachIndex([&count](std::size_t) { ++count; });
        return count;
    }

    std::optional<std::size_t> maxIndex() const {
        std::optional<std::size_t> result;
        forEachIndex([&result](std::size_t index) {
            if (!result || index > *result) {
                result = index;
            }
        });
        return result;
    }

    /**
     * An array whose first element is an array is nested, anything else
     * (including the empty array) is a flat list. Non-arrays parse as an
     * empty list.
     */
    static NestedArray fromJson(const Json& j) {
        if (!j.is_array() || j.empty()) {
            return NestedArray();
        }
        if (j.front().is_array()) {
            Nested children;
            children.reserve(j.size());
            for (const auto& sub : j) {
                children.push_back(fromJson(sub));
            }
            return NestedArray(std::move(children));
        }
        Indices values;
        values.reserve(j.size());
        for (const auto& element : j) {
            if (auto value = IndexTraits<T>::fromJson(element)) {
                values.push_back(*value);
            }
        }
        return NestedArray(std::move(values));
    }

    Json toJson() const {
        Json out = Json::array();
        if (const auto* leaf = std::get_if<Indices>(&data_)) {
            for (const auto& value : *leaf) {
                out.push_back(IndexTraits<T>::toJson(value));
            }
            return out;
        }
        for (const auto& child : std::get<Nested>(data_)) {
            out.push_back(child.toJson());
        }
        return out;
    }

private:
    std::variant<Indices, Nested> data_;
};

// Geometry boundaries never contain null.
using Boundaries = NestedArray<std::size_t>;
// Semantic, material and texture values may contain null.
using NullableValues = NestedArray<std::optional<std::size_t>>;

}

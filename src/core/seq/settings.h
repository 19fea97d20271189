#pragma once

#include "core/model/city_document.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace CitySeq::Core::Seq {

struct SplitSettings {
    // Order of the features after the header line.
    Model::SortingStrategy order = Model::SortingStrategy::Insertion;
};

struct MergeSettings {
    bool removeDuplicateVertices = true;
    // Shift vertices so the per-axis minimum is 0 and fold the shift into translate.
    bool renormalizeTransform = true;
};

enum class FilterKind {
    BBox,
    Radius,
    CityObjectType,
    Random
};

struct FilterSettings {
    FilterKind kind = FilterKind::BBox;

    // minx, miny, maxx, maxy
    std::array<double, 4> bbox = {0.0, 0.0, 0.0, 0.0};

    // centre x, centre y, radius
    double centerX = 0.0;
    double centerY = 0.0;
    double radius = 0.0;

    std::string cityObjectType;

    // Keep roughly one feature in randomFactor.
    std::uint32_t randomFactor = 1;
    std::optional<std::uint64_t> seed;

    // Drop the selected features instead of keeping them.
    bool exclude = false;
};

}

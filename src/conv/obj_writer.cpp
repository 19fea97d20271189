#include "obj_writer.h"
#include "log.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>

namespace CitySeq::Conv {

using namespace CitySeq::Core::Model;

std::vector<const Geometry*> highestLodGeometries(const std::vector<Geometry>& geometries) {
    std::optional<double> maxLod;
    for (const auto& g : geometries) {
        if (auto lod = g.lodValue()) {
            maxLod = maxLod ? std::max(*maxLod, *lod) : *lod;
        }
    }
    std::vector<const Geometry*> selected;
    for (const auto& g : geometries) {
        if (!maxLod) {
            selected.push_back(&g);
            continue;
        }
        auto lod = g.lodValue();
        if (lod && std::abs(*lod - *maxLod) < std::numeric_limits<double>::epsilon()) {
            selected.push_back(&g);
        }
    }
    return selected;
}

std::size_t writeObj(const CityDocument& document, std::ostream& out) {
    out << "# Converted from CityJSON to OBJ\n";
    out << "# by cityseq\n\n";

    for (const auto& v : document.vertices) {
        glm::dvec3 p = document.transform.toWorld(v);
        out << fmt::format("v {} {} {}\n", p.x, p.y, p.z);
    }
    out << '\n';

    std::size_t faces = 0;
    std::size_t skipped = 0;
    for (const auto& [id, co] : document.cityObjects) {
        if (!co.geometry) {
            continue;
        }
        for (const Geometry* g : highestLodGeometries(*co.geometry)) {
            if (g->type == GeometryType::GeometryInstance) {
                ++skipped;
                continue;
            }
            g->boundaries.forEachList([&out, &faces](const Boundaries::Indices& ring) {
                if (ring.empty()) {
                    return;
                }
                out << 'f';
                for (std::size_t index : ring) {
                    out << ' ' << index + 1;
                }
                out << '\n';
                ++faces;
            });
        }
    }
    if (!out) {
        throw SeqError(ErrorKind::Io, "failed to write OBJ output");
    }
    if (skipped > 0) {
        LOG_W("obj: %zu GeometryInstance geometries not exported", skipped);
    }
    LOG_I("obj: wrote %zu vertices and %zu faces", document.vertices.size(), faces);
    return faces;
}

std::string toObjString(const CityDocument& document) {
    std::ostringstream out;
    writeObj(document, out);
    return out.str();
}

}

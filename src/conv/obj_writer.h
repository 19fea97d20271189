#pragma once

#include "core/model/city_document.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace CitySeq::Conv {

/**
 * Geometries of one CityObject with the highest numeric lod. When no lod
 * parses as a number, every geometry is returned.
 */
std::vector<const Core::Model::Geometry*> highestLodGeometries(
    const std::vector<Core::Model::Geometry>& geometries);

/**
 * Write a document as Wavefront OBJ.
 *
 * One "v" line per document vertex in real-world coordinates, then one "f"
 * line per ring of each CityObject's highest-lod geometries, with 1-based
 * indices. GeometryInstance geometries are not expanded.
 *
 * @return number of faces written
 * @throws SeqError(Io) if the stream fails
 */
std::size_t writeObj(const Core::Model::CityDocument& document, std::ostream& out);

std::string toObjString(const Core::Model::CityDocument& document);

}

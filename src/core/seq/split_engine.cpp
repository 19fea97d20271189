#include "split_engine.h"
#include "log.h"
#include <fmt/format.h>
#include <ostream>

namespace CitySeq::Core::Seq {

using namespace CitySeq::Core::Model;

namespace {

// Per-feature renumbering state; every feature starts from empty tables.
struct FeatureTables {
    IdRemapTable vertices;
    IdRemapTable materials;
    IdRemapTable textures;
    IdRemapTable uvs;
};

CityObject renumbered(const CityObject& source, FeatureTables& tables) {
    CityObject copy = source;
    if (copy.geometry) {
        for (auto& g : *copy.geometry) {
            g.renumberVertices(tables.vertices);
            g.renumberMaterials(tables.materials);
            g.renumberTextures(tables.textures, tables.uvs);
        }
    }
    return copy;
}

}

SplitEngine::SplitEngine(const CityDocument& document, const SplitSettings& settings)
    : document_(document) {
    document_.checkSupported();
    order_ = document_.topLevelIds(settings.order);
    header_ = buildHeader();
}

CityDocument SplitEngine::buildHeader() const {
    CityDocument header = document_.emptyCopy();
    if (!header.geometryTemplates) {
        return header;
    }
    // Templates keep only the appearance entries they reference.
    FeatureTables tables;
    for (auto& g : header.geometryTemplates->templates) {
        g.renumberMaterials(tables.materials);
        g.renumberTextures(tables.textures, tables.uvs);
    }
    if (document_.appearance) {
        Appearance sliced = document_.appearance->slice(tables.materials, tables.textures, tables.uvs);
        if (!sliced.empty()) {
            header.appearance = std::move(sliced);
        }
    }
    return header;
}

CityFeature SplitEngine::featureAt(std::size_t i) const {
    const std::string& id = order_.at(i);
    const CityObject& top = document_.cityObjects.at(id);

    FeatureTables tables;
    CityFeature feature;
    feature.id = id;
    feature.cityObjects.insert(id, renumbered(top, tables));
    for (const auto& childId : top.childIds()) {
        feature.cityObjects.insert(childId, renumbered(document_.cityObjects.at(childId), tables));
    }

    feature.vertices.resize(tables.vertices.span());
    for (const auto& [oldId, newId] : tables.vertices.entries()) {
        if (oldId >= document_.vertices.size()) {
            throw SeqError(ErrorKind::InvalidValue,
                           fmt::format("CityObject \"{}\" references vertex {} of {}", id, oldId,
                                       document_.vertices.size()));
        }
        feature.vertices[newId] = document_.vertices[oldId];
    }

    if (document_.appearance) {
        Appearance sliced = document_.appearance->slice(tables.materials, tables.textures, tables.uvs);
        if (!sliced.empty()) {
            feature.appearance = std::move(sliced);
        }
    }
    return feature;
}

std::optional<CityFeature> SplitEngine::nextFeature() {
    if (cursor_ >= order_.size()) {
        return std::nullopt;
    }
    return featureAt(cursor_++);
}

std::size_t SplitEngine::write(std::ostream& out) {
    out << header_.dump() << '\n';
    std::size_t written = 0;
    while (auto feature = nextFeature()) {
        out << feature->dump() << '\n';
        ++written;
    }
    if (!out) {
        throw SeqError(ErrorKind::Io, "failed to write CityJSONSeq output");
    }
    LOG_I("cat: wrote %zu features from %zu CityObjects and %zu vertices",
          written, document_.cityObjects.size(), document_.vertices.size());
    return written;
}

}

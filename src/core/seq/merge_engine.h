#pragma once

#include "core/model/city_document.h"
#include "core/model/city_feature.h"
#include "core/model/id_remap_table.h"
#include "settings.h"
#include <iosfwd>
#include <optional>
#include <vector>

namespace CitySeq::Core::Seq {

/**
 * Renumbering state of a merge, re-seeded for every incoming feature:
 * feature-local material, texture and texture-vertex ids map to their
 * position in the accumulated document.
 */
struct MergeTables {
    Model::IdRemapTable materials;
    Model::IdRemapTable textures;
    Model::IdRemapTable uvs;

    void clear() {
        materials.clear();
        textures.clear();
        uvs.clear();
    }
};

/**
 * Folds a CityJSONSeq back into one CityJSON document.
 *
 * Features are appended in arrival order; vertex deduplication and transform
 * renormalisation run once in finish().
 */
class MergeEngine {
public:
    explicit MergeEngine(const MergeSettings& settings = MergeSettings());

    /**
     * Start a new document from a header line.
     * @throws SeqError(UnsupportedDocument) for anything but CityJSON 1.1/2.0
     */
    void begin(const Model::CityDocument& header);

    /**
     * Append one feature. When source is given and differs from the document
     * transform, the feature's vertices are re-quantized from source.
     */
    void addFeature(Model::CityFeature feature,
                    const std::optional<Model::Transform>& source = std::nullopt);

    /**
     * Run the final dedup and transform pass and hand over the document.
     */
    Model::CityDocument finish();

    const Model::CityDocument& document() const { return document_; }
    std::size_t featureCount() const { return featureCount_; }

private:
    MergeSettings settings_;
    Model::CityDocument document_;
    MergeTables tables_;
    bool started_ = false;
    std::size_t featureCount_ = 0;
};

/**
 * Read one or more CityJSONSeq streams into a single document. The first
 * header defines the target; the transform of every later header is used to
 * re-quantize that stream's features.
 * @throws SeqError on the first malformed line
 */
Model::CityDocument collect(const std::vector<std::istream*>& inputs,
                            const MergeSettings& settings = MergeSettings());

}

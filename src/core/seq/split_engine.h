#pragma once

#include "core/model/city_document.h"
#include "core/model/city_feature.h"
#include "settings.h"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Seq {

/**
 * Carves a CityJSON document into a CityJSONSeq.
 *
 * The header is the document without CityObjects and vertices. Each feature
 * holds one top-level CityObject and its direct children, with vertices and
 * appearance entries renumbered from zero. Grandchildren are not emitted.
 *
 * The engine keeps a reference to the document; it must outlive the engine.
 */
class SplitEngine {
public:
    /**
     * @throws SeqError(UnsupportedDocument) for anything but CityJSON 1.1/2.0
     * @throws SeqError(UnsupportedOperation) for an unimplemented order
     */
    SplitEngine(const Model::CityDocument& document, const SplitSettings& settings = SplitSettings());

    const Model::CityDocument& header() const { return header_; }

    // Number of features, i.e. top-level CityObjects.
    std::size_t size() const { return order_.size(); }

    const std::vector<std::string>& order() const { return order_; }

    /**
     * Build the i-th feature in the selected order.
     * @throws SeqError(MissingObject) if a child id is not in the document
     */
    Model::CityFeature featureAt(std::size_t i) const;

    // Next feature, or nullopt once every feature has been produced.
    std::optional<Model::CityFeature> nextFeature();

    /**
     * Write the header and every feature as newline-delimited JSON.
     * @return number of features written
     */
    std::size_t write(std::ostream& out);

private:
    Model::CityDocument buildHeader() const;

    const Model::CityDocument& document_;
    std::vector<std::string> order_;
    Model::CityDocument header_;
    std::size_t cursor_ = 0;
};

}

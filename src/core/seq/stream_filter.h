#pragma once

#include "core/model/city_document.h"
#include "core/model/city_feature.h"
#include "settings.h"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace CitySeq::Core::Seq {

/**
 * Predicate over one feature of a CityJSONSeq.
 *
 * setHeader() is called once with the header line before any feature. Only
 * its transform is read; a header without one leaves the identity transform.
 */
class StreamFilter {
public:
    virtual ~StreamFilter() = default;

    virtual void setHeader(const Model::Json& header);

    // True if the feature is selected.
    virtual bool select(const Model::CityFeature& feature) = 0;

    // Filters that ignore the feature content skip parsing the line.
    virtual bool needsFeature() const { return true; }

    virtual std::string describe() const = 0;

protected:
    /**
     * Real-world centroid of the feature, or nullopt for a feature without vertices.
     */
    std::optional<glm::dvec3> worldCentroid(const Model::CityFeature& feature) const;

    Model::Transform transform_;
};

// Centroid strictly inside [minx, maxx] x [miny, maxy].
class BBoxFilter : public StreamFilter {
public:
    BBoxFilter(double minx, double miny, double maxx, double maxy);
    bool select(const Model::CityFeature& feature) override;
    std::string describe() const override;

private:
    double minx_, miny_, maxx_, maxy_;
};

// Centroid within radius (inclusive) of (x, y).
class RadiusFilter : public StreamFilter {
public:
    RadiusFilter(double x, double y, double radius);
    bool select(const Model::CityFeature& feature) override;
    std::string describe() const override;

private:
    double x_, y_, radius_;
};

// The feature's own CityObject has exactly this type.
class CityObjectTypeFilter : public StreamFilter {
public:
    explicit CityObjectTypeFilter(std::string type);
    bool select(const Model::CityFeature& feature) override;
    std::string describe() const override;

private:
    std::string type_;
};

// Keeps a feature with probability 1/factor.
class RandomFilter : public StreamFilter {
public:
    explicit RandomFilter(std::uint32_t factor, std::optional<std::uint64_t> seed = std::nullopt);
    bool select(const Model::CityFeature& feature) override;
    bool needsFeature() const override { return false; }
    std::string describe() const override;

    // Draw once without a feature.
    bool draw();

private:
    std::uint32_t factor_;
    std::mt19937_64 rng_;
};

/**
 * @throws SeqError(InvalidValue) for parameters no filter accepts
 */
std::unique_ptr<StreamFilter> makeFilter(const FilterSettings& settings);

/**
 * Parse the sampling factor of a random filter.
 * @throws SeqError(InvalidValue) unless text is an integer in [1, 2^32 - 1]
 */
std::uint32_t parseRandomFactor(const std::string& text);

struct FilterStats {
    std::size_t kept = 0;
    std::size_t dropped = 0;
    std::size_t failed = 0;
};

/**
 * Copy the header line and every feature line the filter keeps (or, with
 * exclude, every line it does not select) from in to out. A line that cannot
 * be parsed is logged and skipped.
 * @throws SeqError if the header cannot be read
 */
FilterStats runFilter(std::istream& in, std::ostream& out, StreamFilter& filter, bool exclude);

}

#include "stream_filter.h"
#include "log.h"
#include <charconv>
#include <fmt/format.h>
#include <istream>
#include <limits>
#include <ostream>

namespace CitySeq::Core::Seq {

using namespace CitySeq::Core::Model;

void StreamFilter::setHeader(const Json& header) {
    auto it = header.find("transform");
    if (it != header.end()) {
        transform_ = Transform::fromJson(*it);
    }
}

std::optional<glm::dvec3> StreamFilter::worldCentroid(const CityFeature& feature) const {
    auto local = feature.centroid();
    if (!local) {
        return std::nullopt;
    }
    return transform_.toWorld(*local);
}

BBoxFilter::BBoxFilter(double minx, double miny, double maxx, double maxy)
    : minx_(minx), miny_(miny), maxx_(maxx), maxy_(maxy) {
}

bool BBoxFilter::select(const CityFeature& feature) {
    auto c = worldCentroid(feature);
    if (!c) {
        return false;
    }
    return c->x > minx_ && c->x < maxx_ && c->y > miny_ && c->y < maxy_;
}

std::string BBoxFilter::describe() const {
    return fmt::format("bbox [{}, {}, {}, {}]", minx_, miny_, maxx_, maxy_);
}

RadiusFilter::RadiusFilter(double x, double y, double radius)
    : x_(x), y_(y), radius_(radius) {
}

bool RadiusFilter::select(const CityFeature& feature) {
    auto c = worldCentroid(feature);
    if (!c) {
        return false;
    }
    double dx = c->x - x_;
    double dy = c->y - y_;
    return dx * dx + dy * dy <= radius_ * radius_;
}

std::string RadiusFilter::describe() const {
    return fmt::format("radius {} around ({}, {})", radius_, x_, y_);
}

CityObjectTypeFilter::CityObjectTypeFilter(std::string type)
    : type_(std::move(type)) {
}

bool CityObjectTypeFilter::select(const CityFeature& feature) {
    return feature.topLevelObject().type == type_;
}

std::string CityObjectTypeFilter::describe() const {
    return fmt::format("CityObject type {}", type_);
}

RandomFilter::RandomFilter(std::uint32_t factor, std::optional<std::uint64_t> seed)
    : factor_(factor), rng_(seed ? *seed : std::random_device()()) {
    if (factor_ == 0) {
        throw SeqError(ErrorKind::InvalidValue, "random factor must be at least 1");
    }
}

bool RandomFilter::draw() {
    std::uniform_int_distribution<std::uint32_t> dist(1, factor_);
    return dist(rng_) == 1;
}

bool RandomFilter::select(const CityFeature&) {
    return draw();
}

std::string RandomFilter::describe() const {
    return fmt::format("random 1/{}", factor_);
}

std::unique_ptr<StreamFilter> makeFilter(const FilterSettings& settings) {
    switch (settings.kind) {
        case FilterKind::BBox:
            if (settings.bbox[0] > settings.bbox[2] || settings.bbox[1] > settings.bbox[3]) {
                throw SeqError(ErrorKind::InvalidValue, "bbox minimum exceeds maximum");
            }
            return std::make_unique<BBoxFilter>(settings.bbox[0], settings.bbox[1],
                                                settings.bbox[2], settings.bbox[3]);
        case FilterKind::Radius:
            if (settings.radius < 0.0) {
                throw SeqError(ErrorKind::InvalidValue, "radius must not be negative");
            }
            return std::make_unique<RadiusFilter>(settings.centerX, settings.centerY, settings.radius);
        case FilterKind::CityObjectType:
            if (settings.cityObjectType.empty()) {
                throw SeqError(ErrorKind::InvalidValue, "CityObject type must not be empty");
            }
            return std::make_unique<CityObjectTypeFilter>(settings.cityObjectType);
        case FilterKind::Random:
            return std::make_unique<RandomFilter>(settings.randomFactor, settings.seed);
    }
    throw SeqError(ErrorKind::InvalidValue, "unknown filter");
}

std::uint32_t parseRandomFactor(const std::string& text) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint32_t>::max();
    std::uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value < 1 || value > kMax) {
        throw SeqError(ErrorKind::InvalidValue,
                       fmt::format("random factor must be an integer in [1, {}], got \"{}\"", kMax, text));
    }
    return static_cast<std::uint32_t>(value);
}

FilterStats runFilter(std::istream& in, std::ostream& out, StreamFilter& filter, bool exclude) {
    FilterStats stats;
    std::string line;
    std::size_t lineNo = 0;
    bool haveHeader = false;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!haveHeader) {
            // Passed through verbatim; only the type and transform are read.
            Json header = parseJson(line);
            auto type = header.find("type");
            if (type == header.end() || *type != CityDocument::kType) {
                throw SeqError(ErrorKind::UnsupportedDocument, "first line is not a CityJSON header");
            }
            filter.setHeader(header);
            out << line << '\n';
            haveHeader = true;
            continue;
        }
        if (line.empty()) {
            continue;
        }
        bool selected = false;
        try {
            if (filter.needsFeature()) {
                selected = filter.select(CityFeature::parse(line));
            } else {
                selected = filter.select(CityFeature());
            }
        } catch (const SeqError& e) {
            LOG_E("line %zu skipped: %s", lineNo, e.what());
            ++stats.failed;
            continue;
        }
        if (selected != exclude) {
            out << line << '\n';
            ++stats.kept;
        } else {
            ++stats.dropped;
        }
    }
    if (in.bad() || !out) {
        throw SeqError(ErrorKind::Io, "failed to filter CityJSONSeq stream");
    }
    LOG_I("filter %s%s: kept %zu, dropped %zu, skipped %zu",
          filter.describe().c_str(), exclude ? " (exclude)" : "",
          stats.kept, stats.dropped, stats.failed);
    return stats;
}

}

#include "metadata.h"
#include <fmt/format.h>

namespace CitySeq::Core::Model {

namespace {
constexpr const char* kCrsMarker = "/def/crs/";
}

ReferenceSystem ReferenceSystem::fromUrl(const std::string& url) {
    std::size_t marker = url.find(kCrsMarker);
    if (marker == std::string::npos) {
        throw SeqError(ErrorKind::InvalidValue, fmt::format("\"{}\" is not a CRS URL", url));
    }
    ReferenceSystem rs;
    rs.base = url.substr(0, marker);
    std::string rest = url.substr(marker + std::string(kCrsMarker).size());

    std::size_t first = rest.find('/');
    std::size_t second = first == std::string::npos ? std::string::npos : rest.find('/', first + 1);
    if (second == std::string::npos) {
        throw SeqError(ErrorKind::InvalidValue, fmt::format("\"{}\" lacks authority/version/code", url));
    }
    rs.authority = rest.substr(0, first);
    rs.version = rest.substr(first + 1, second - first - 1);
    rs.code = rest.substr(second + 1);
    if (rs.authority.empty() || rs.code.empty() || rs.code.find('/') != std::string::npos) {
        throw SeqError(ErrorKind::InvalidValue, fmt::format("\"{}\" lacks authority/version/code", url));
    }
    return rs;
}

std::string ReferenceSystem::toUrl() const {
    return fmt::format("{}{}{}/{}/{}", base, kCrsMarker, authority, version, code);
}

std::string ReferenceSystem::epsgCode() const {
    if (authority != "EPSG") {
        return std::string();
    }
    return "EPSG:" + code;
}

Metadata Metadata::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "\"metadata\" is not an object");
    }
    Metadata m;
    if (auto it = j.find("geographicalExtent"); it != j.end() && !it->is_null()) {
        if (!it->is_array() || it->size() != 6) {
            throw SeqError(ErrorKind::MalformedJson, "metadata geographicalExtent must hold 6 numbers");
        }
        std::array<double, 6> extent{};
        for (std::size_t i = 0; i < 6; ++i) {
            extent[i] = (*it)[i].get<double>();
        }
        m.geographicalExtent = extent;
    }
    m.identifier = optionalField<std::string>(j, "identifier");
    m.pointOfContact = optionalField<Json>(j, "pointOfContact");
    m.referenceDate = optionalField<std::string>(j, "referenceDate");
    if (auto url = optionalField<std::string>(j, "referenceSystem")) {
        m.referenceSystem = ReferenceSystem::fromUrl(*url);
    }
    m.title = optionalField<std::string>(j, "title");
    m.extra = extraMembers(j, {"geographicalExtent", "identifier", "pointOfContact",
                               "referenceDate", "referenceSystem", "title"});
    return m;
}

Json Metadata::toJson() const {
    Json j = Json::object();
    putOptional(j, "geographicalExtent", geographicalExtent);
    putOptional(j, "identifier", identifier);
    putOptional(j, "pointOfContact", pointOfContact);
    putOptional(j, "referenceDate", referenceDate);
    if (referenceSystem) {
        j["referenceSystem"] = referenceSystem->toUrl();
    }
    putOptional(j, "title", title);
    appendExtraMembers(j, extra);
    return j;
}

}

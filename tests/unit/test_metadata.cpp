#include <gtest/gtest.h>
#include "core/model/extension.h"
#include "core/model/metadata.h"
#include "core/model/transform.h"
#include "core/error.h"
#include "../utils/test_helpers.h"

using namespace CitySeq;
using namespace CitySeq::Core::Model;
using namespace CitySeq::Test;

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MetadataTest, ReferenceSystemFromUrl) {
    auto rs = ReferenceSystem::fromUrl("https://www.opengis.net/def/crs/EPSG/0/7415");
    EXPECT_EQ(rs.base, "https://www.opengis.net");
    EXPECT_EQ(rs.authority, "EPSG");
    EXPECT_EQ(rs.version, "0");
    EXPECT_EQ(rs.code, "7415");
    EXPECT_EQ(rs.epsgCode(), "EPSG:7415");
    EXPECT_EQ(rs.toUrl(), "https://www.opengis.net/def/crs/EPSG/0/7415");
}

TEST_F(MetadataTest, ReferenceSystemNonEpsg) {
    auto rs = ReferenceSystem::fromUrl("http://www.opengis.net/def/crs/OGC/1.3/CRS84");
    EXPECT_EQ(rs.authority, "OGC");
    EXPECT_EQ(rs.epsgCode(), "");
}

TEST_F(MetadataTest, ReferenceSystemRejectsOtherUrls) {
    EXPECT_THROW(ReferenceSystem::fromUrl("urn:ogc:def:crs:EPSG::7415"), SeqError);
    EXPECT_THROW(ReferenceSystem::fromUrl("https://www.opengis.net/def/crs/EPSG/7415"), SeqError);
}

TEST_F(MetadataTest, MetadataKeepsUnknownMembers) {
    Metadata m = Metadata::fromJson(Json::parse(
        R"({"title":"t","referenceDate":"2024-01-01","x-vendor":{"a":1}})"));
    EXPECT_EQ(m.title.value(), "t");
    EXPECT_FALSE(m.referenceSystem.has_value());
    EXPECT_EQ(m.toJson()["x-vendor"]["a"], 1);
}

TEST_F(MetadataTest, ExtensionsParse) {
    auto ext = extensionsFromJson(Json::parse(
        R"({"Noise":{"url":"https://example.org/noise.ext.json","version":"2.0"}})"));
    ASSERT_EQ(ext.size(), 1u);
    EXPECT_EQ(ext.at("Noise").version, "2.0");
    EXPECT_EQ(extensionsFromJson(extensionsToJson(ext)), ext);
}

TEST_F(MetadataTest, ExtensionFileValidation) {
    ExtensionFile good(Json::parse(R"({
        "type":"CityJSONExtension","name":"Noise","url":"https://example.org/noise.ext.json",
        "version":"2.0","versionCityJSON":"2.0",
        "extraAttributes":{},"extraCityObjects":{"+NoiseBuilding":{},"+NoiseBarrier":{}},
        "extraRootProperties":{},"extraSemanticSurfaces":{}})"));
    EXPECT_NO_THROW(good.validate());
    EXPECT_EQ(good.name(), "Noise");
    EXPECT_EQ(good.extraCityObjectTypes(), (std::vector<std::string>{"+NoiseBuilding", "+NoiseBarrier"}));

    ExtensionFile wrongType(Json::parse(R"({"type":"CityJSON","name":"n","url":"u","version":"1","versionCityJSON":"2.0"})"));
    EXPECT_THROW(wrongType.validate(), SeqError);

    ExtensionFile noName(Json::parse(R"({"type":"CityJSONExtension","name":"","url":"u","version":"1","versionCityJSON":"2.0"})"));
    EXPECT_THROW(noName.validate(), SeqError);

    ExtensionFile badExtra(Json::parse(R"({"type":"CityJSONExtension","name":"n","url":"u","version":"1",
        "versionCityJSON":"2.0","extraAttributes":[]})"));
    EXPECT_THROW(badExtra.validate(), SeqError);
}

TEST_F(MetadataTest, TransformWorldAndQuantize) {
    Transform t;
    t.scale = glm::dvec3(0.01, 0.01, 0.1);
    t.translate = glm::dvec3(100.0, 200.0, 5.0);
    EXPECT_TRUE(vec3Near(t.toWorld(Vertex{150, -20, 3}), glm::dvec3(101.5, 199.8, 5.3)));
    EXPECT_EQ(t.quantize(glm::dvec3(101.5, 199.8, 5.3)), (Vertex{150, -20, 3}));
}

TEST_F(MetadataTest, TransformRequantize) {
    Transform source;
    source.scale = glm::dvec3(0.001);
    source.translate = glm::dvec3(10.0, 10.0, 0.0);
    Transform target;
    target.scale = glm::dvec3(0.01);
    target.translate = glm::dvec3(0.0);
    // (1234 * 0.001 + 10 - 0) / 0.01 = 1123.4 -> 1123
    EXPECT_EQ(target.requantize(Vertex{1234, 1236, 57}, source), (Vertex{1123, 1124, 6}));
}

TEST_F(MetadataTest, TransformToString) {
    Transform t;
    EXPECT_EQ(t.toString(), "[scale=(1,1,1), translate=(0,0,0)]");
    t.scale = glm::dvec3(0.001);
    t.translate = glm::dvec3(10.5, 20.0, 0.0);
    EXPECT_EQ(t.toString(), "[scale=(0.001,0.001,0.001), translate=(10.5,20,0)]");
}

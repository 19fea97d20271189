#include <gtest/gtest.h>
#include "core/seq/merge_engine.h"
#include "core/seq/split_engine.h"
#include "core/error.h"
#include "../utils/test_helpers.h"
#include <sstream>

using namespace CitySeq;
using namespace CitySeq::Core::Model;
using namespace CitySeq::Core::Seq;
using namespace CitySeq::Test;

class MergeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc = sampleDocument();
    }
    void TearDown() override {}

    std::string splitToSeq(const CityDocument& source) {
        SplitEngine engine(source);
        std::ostringstream out;
        engine.write(out);
        return out.str();
    }

    // Name of the material a CityObject's first geometry points at through theme "visual".
    static std::string materialName(const CityDocument& d, const std::string& id) {
        const Geometry& g = d.cityObjects.at(id).geometry->at(0);
        const MaterialReference& ref = g.material.at("visual");
        std::size_t index = 0;
        if (ref.value) {
            index = *ref.value;
        } else {
            ref.values->forEachIndex([&index](std::size_t i) { index = i; });
        }
        return d.appearance->materials.at(index).name;
    }

    CityDocument doc;
};

TEST_F(MergeEngineTest, SplitThenCollectRestoresGeometry) {
    std::istringstream in(splitToSeq(doc));
    CityDocument merged = collect({&in});

    EXPECT_EQ(merged.cityObjects.size(), doc.cityObjects.size());
    for (const auto& id : {"B1", "B1-part", "B2"}) {
        EXPECT_TRUE(ringsNear(worldRings(merged, id), worldRings(doc, id))) << id;
    }
    EXPECT_EQ(materialName(merged, "B1"), materialName(doc, "B1"));
    EXPECT_EQ(materialName(merged, "B1-part"), materialName(doc, "B1-part"));
    EXPECT_TRUE(merged.hasValidVertexIndices());
    ASSERT_TRUE(merged.metadata.has_value());
    EXPECT_EQ(merged.metadata->title.value(), "sample");
}

TEST_F(MergeEngineTest, TexturesSurviveRoundTrip) {
    std::istringstream in(splitToSeq(doc));
    CityDocument merged = collect({&in});

    const Geometry& g = merged.cityObjects.at("B1").geometry->at(0);
    std::vector<std::size_t> indices;
    g.texture.at("winter").values.forEachIndex([&indices](std::size_t i) { indices.push_back(i); });
    ASSERT_EQ(indices.size(), 5u);
    EXPECT_EQ(merged.appearance->textures.at(indices[0]).image, "b.jpg");
    EXPECT_DOUBLE_EQ(merged.appearance->verticesTexture.at(indices[4])[0], 0.2);
}

TEST_F(MergeEngineTest, SharedVerticesAreDeduplicated) {
    std::istringstream in(splitToSeq(doc));
    MergeSettings keep;
    keep.removeDuplicateVertices = false;
    keep.renormalizeTransform = false;
    EXPECT_EQ(collect({&in}, keep).vertices.size(), 9u);

    std::istringstream again(splitToSeq(doc));
    EXPECT_EQ(collect({&again}).vertices.size(), 8u);
}

TEST_F(MergeEngineTest, VertexOffsetsFollowDocumentSize) {
    MergeSettings keep;
    keep.removeDuplicateVertices = false;
    keep.renormalizeTransform = false;
    MergeEngine engine(keep);
    engine.begin(CityDocument::parse(unitHeaderLine()));
    engine.addFeature(CityFeature::parse(singleVertexFeatureLine("F1", "Building", 1, 2, 3)));
    engine.addFeature(CityFeature::parse(singleVertexFeatureLine("F2", "Building", 4, 5, 6)));
    EXPECT_EQ(engine.featureCount(), 2u);

    CityDocument merged = engine.finish();
    ASSERT_EQ(merged.vertices.size(), 2u);
    EXPECT_EQ(merged.cityObjects.at("F2").geometry->at(0).boundaries.toJson().dump(), "[1]");
    EXPECT_EQ(merged.vertices[1], (Vertex{4, 5, 6}));
}

TEST_F(MergeEngineTest, AppearanceSizesSurviveRoundTrip) {
    std::istringstream in(splitToSeq(doc));
    CityDocument merged = collect({&in});
    ASSERT_TRUE(merged.appearance.has_value());
    EXPECT_EQ(merged.appearance->materials.size(), 2u);
    EXPECT_EQ(merged.appearance->textures.size(), 1u);
}

TEST_F(MergeEngineTest, DefaultThemesSurviveRoundTrip) {
    doc.appearance->defaultThemeMaterial = "visual";
    doc.appearance->defaultThemeTexture = "winter";
    std::istringstream in(splitToSeq(doc));
    CityDocument merged = collect({&in});

    ASSERT_TRUE(merged.appearance.has_value());
    EXPECT_EQ(merged.appearance->defaultThemeMaterial.value(), "visual");
    EXPECT_EQ(merged.appearance->defaultThemeTexture.value(), "winter");
    EXPECT_EQ(merged.toJson()["appearance"]["default-theme-material"], "visual");
}

TEST_F(MergeEngineTest, AppearanceAccumulatesAcrossFeatures) {
    const char* first =
        R"({"type":"CityJSONFeature","id":"F1","CityObjects":{"F1":{"type":"Building","geometry":[)"
        R"({"type":"MultiSurface","lod":"2","boundaries":[[[0,1,2]]],)"
        R"("material":{"visual":{"values":[0]}},"texture":{"winter":{"values":[[[0,0,1,1]]]}}}]}},)"
        R"("vertices":[[0,0,0],[1,0,0],[0,1,0]],)"
        R"("appearance":{"materials":[{"name":"roof"}],"textures":[{"type":"PNG","image":"a.png"}],)"
        R"("vertices-texture":[[0.0,0.0],[1.0,1.0]]}})";
    const char* second =
        R"({"type":"CityJSONFeature","id":"F2","CityObjects":{"F2":{"type":"Building","geometry":[)"
        R"({"type":"MultiSurface","lod":"2","boundaries":[[[0,1,2]],[[2,1,0]]],)"
        R"("material":{"visual":{"values":[0,1]}},)"
        R"("texture":{"winter":{"values":[[[1,0,1,2]],[[0,2,1,0]]]}}}]}},)"
        R"("vertices":[[5,5,0],[6,5,0],[5,6,0]],)"
        R"("appearance":{"materials":[{"name":"wall"},{"name":"roof"}],)"
        R"("textures":[{"type":"PNG","image":"b.png"},{"type":"PNG","image":"a.png"}],)"
        R"("vertices-texture":[[0.1,0.1],[0.2,0.2],[0.3,0.3]]}})";

    MergeEngine engine;
    engine.begin(CityDocument::parse(unitHeaderLine()));
    engine.addFeature(CityFeature::parse(first));
    engine.addFeature(CityFeature::parse(second));
    CityDocument merged = engine.finish();

    ASSERT_TRUE(merged.appearance.has_value());
    const Appearance& app = *merged.appearance;
    ASSERT_EQ(app.materials.size(), 2u);
    EXPECT_EQ(app.materials[0].name, "roof");
    EXPECT_EQ(app.materials[1].name, "wall");
    ASSERT_EQ(app.textures.size(), 2u);
    EXPECT_EQ(app.textures[0].image, "a.png");
    EXPECT_EQ(app.textures[1].image, "b.png");
    ASSERT_EQ(app.verticesTexture.size(), 5u);
    EXPECT_DOUBLE_EQ(app.verticesTexture[2][0], 0.1);

    const Geometry& g1 = merged.cityObjects.at("F1").geometry->at(0);
    EXPECT_EQ(g1.material.at("visual").values->toJson().dump(), "[0]");
    EXPECT_EQ(g1.texture.at("winter").values.toJson().dump(), "[[[0,0,1,1]]]");

    const Geometry& g2 = merged.cityObjects.at("F2").geometry->at(0);
    EXPECT_EQ(g2.material.at("visual").values->toJson().dump(), "[1,0]");
    EXPECT_EQ(materialName(merged, "F2"), "roof");
    EXPECT_EQ(g2.texture.at("winter").values.toJson().dump(), "[[[0,2,3,4]],[[1,4,3,2]]]");
}

TEST_F(MergeEngineTest, SecondStreamIsRequantized) {
    std::string first = unitHeaderLine() + "\n" + singleVertexFeatureLine("F1", "Building", 5, 5, 0) + "\n";
    std::string second =
        R"({"type":"CityJSON","version":"2.0","transform":{"scale":[0.5,0.5,0.5],"translate":[10.0,0.0,0.0]},"CityObjects":{},"vertices":[]})"
        "\n" + singleVertexFeatureLine("F2", "Road", 4, 6, 2) + "\n";
    std::istringstream a(first), b(second);

    MergeSettings keep;
    keep.renormalizeTransform = false;
    CityDocument merged = collect({&a, &b}, keep);

    ASSERT_EQ(merged.vertices.size(), 2u);
    // (4 * 0.5 + 10, 6 * 0.5, 2 * 0.5) in the unit transform
    EXPECT_EQ(merged.vertices[1], (Vertex{12, 3, 1}));
    EXPECT_EQ(merged.cityObjects.at("F2").type, "Road");
}

TEST_F(MergeEngineTest, FeatureBeforeHeaderIsRejected) {
    MergeEngine engine;
    try {
        engine.addFeature(CityFeature::parse(singleVertexFeatureLine("F1", "Building", 0, 0, 0)));
        FAIL() << "expected SeqError";
    } catch (const SeqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedOperation);
    }
}

TEST_F(MergeEngineTest, ErrorsCarryStreamAndLine) {
    std::istringstream in(unitHeaderLine() + "\n{not json\n");
    try {
        collect({&in});
        FAIL() << "expected SeqError";
    } catch (const SeqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedJson);
        EXPECT_NE(std::string(e.what()).find("stream 1 line 2"), std::string::npos);
    }
}

TEST_F(MergeEngineTest, EmptyInputHasNoHeader) {
    std::istringstream in("");
    EXPECT_THROW(collect({&in}), SeqError);
}

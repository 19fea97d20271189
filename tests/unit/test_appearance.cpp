#include <gtest/gtest.h>
#include "core/model/appearance.h"
#include "core/error.h"

using namespace CitySeq;
using namespace CitySeq::Core::Model;

class AppearanceTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static MaterialObject material(const std::string& name) {
        MaterialObject m;
        m.name = name;
        return m;
    }

    static TextureObject texture(const std::string& image) {
        TextureObject t;
        t.type = "PNG";
        t.image = image;
        return t;
    }
};

TEST_F(AppearanceTest, AddMaterialDedupsByName) {
    Appearance app;
    EXPECT_EQ(app.addMaterial(material("roof")), 0u);
    EXPECT_EQ(app.addMaterial(material("wall")), 1u);
    EXPECT_EQ(app.addMaterial(material("roof")), 0u);
    EXPECT_EQ(app.materials.size(), 2u);
}

TEST_F(AppearanceTest, AddTextureDedupsByImage) {
    Appearance app;
    EXPECT_EQ(app.addTexture(texture("a.png")), 0u);
    EXPECT_EQ(app.addTexture(texture("b.png")), 1u);
    EXPECT_EQ(app.addTexture(texture("a.png")), 0u);
    EXPECT_EQ(app.textures.size(), 2u);
}

TEST_F(AppearanceTest, AddTextureVerticesReturnsBase) {
    Appearance app;
    EXPECT_EQ(app.addTextureVertices({{0.0, 0.0}, {1.0, 1.0}}), 0u);
    EXPECT_EQ(app.addTextureVertices({{0.5, 0.5}}), 2u);
    EXPECT_EQ(app.verticesTexture.size(), 3u);
}

TEST_F(AppearanceTest, MaterialOutOfRangeIsRejected) {
    Appearance app;
    MaterialObject m = material("hot");
    m.diffuseColor = Color3{0.2, 1.5, 0.0};
    try {
        app.addMaterial(m);
        FAIL() << "expected SeqError";
    } catch (const SeqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidValue);
    }
    EXPECT_TRUE(app.materials.empty());

    MaterialObject t = material("glass");
    t.transparency = -0.1;
    EXPECT_THROW(app.addMaterial(t), SeqError);

    MaterialObject s = material("shiny");
    s.shininess = 1.0;
    s.ambientIntensity = 0.0;
    EXPECT_NO_THROW(app.addMaterial(s));
}

TEST_F(AppearanceTest, TextureBorderColorIsChecked) {
    Appearance app;
    TextureObject t = texture("c.png");
    t.borderColor = Color4{0.0, 0.0, 0.0, 2.0};
    EXPECT_THROW(app.addTexture(t), SeqError);
}

TEST_F(AppearanceTest, SliceProjectsThroughTables) {
    Appearance app;
    app.addMaterial(material("m0"));
    app.addMaterial(material("m1"));
    app.addMaterial(material("m2"));
    app.addTexture(texture("t0.png"));
    app.addTexture(texture("t1.png"));
    app.addTextureVertices({{0.0, 0.0}, {0.1, 0.1}, {0.2, 0.2}});
    app.defaultThemeMaterial = "visual";

    IdRemapTable mt, tt, uvt;
    mt.resolve(2);
    mt.resolve(0);
    tt.resolve(1);
    uvt.resolve(2);

    Appearance sliced = app.slice(mt, tt, uvt);
    ASSERT_EQ(sliced.materials.size(), 2u);
    EXPECT_EQ(sliced.materials[0].name, "m2");
    EXPECT_EQ(sliced.materials[1].name, "m0");
    ASSERT_EQ(sliced.textures.size(), 1u);
    EXPECT_EQ(sliced.textures[0].image, "t1.png");
    ASSERT_EQ(sliced.verticesTexture.size(), 1u);
    EXPECT_DOUBLE_EQ(sliced.verticesTexture[0][0], 0.2);
    EXPECT_EQ(sliced.defaultThemeMaterial.value(), "visual");
}

TEST_F(AppearanceTest, SliceWithDanglingIndexThrows) {
    Appearance app;
    app.addMaterial(material("only"));
    IdRemapTable mt, tt, uvt;
    mt.resolve(5);
    EXPECT_THROW(app.slice(mt, tt, uvt), SeqError);
}

TEST_F(AppearanceTest, JsonRoundTripKeepsUnknownMembers) {
    const char* text = R"({"materials":[{"name":"roof","shininess":0.2,"x-vendor":1}],)"
                       R"("textures":[{"type":"PNG","image":"a.png","wrapMode":"wrap"}],)"
                       R"("vertices-texture":[[0.0,1.0]],"default-theme-texture":"winter"})";
    Appearance app = Appearance::fromJson(Json::parse(text));
    ASSERT_EQ(app.materials.size(), 1u);
    EXPECT_EQ(app.materials[0].extra["x-vendor"], 1);
    EXPECT_EQ(app.textures[0].wrapMode.value(), "wrap");
    EXPECT_EQ(Appearance::fromJson(app.toJson()).toJson(), app.toJson());
}

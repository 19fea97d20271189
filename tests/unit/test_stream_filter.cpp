#include <gtest/gtest.h>
#include "core/seq/stream_filter.h"
#include "core/error.h"
#include "../utils/test_helpers.h"
#include <sstream>

using namespace CitySeq;
using namespace CitySeq::Core::Model;
using namespace CitySeq::Core::Seq;
using namespace CitySeq::Test;

class StreamFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        input = unitHeaderLine() + "\n" + singleVertexFeatureLine("F1", "Building", 5, 5, 0) + "\n";
    }
    void TearDown() override {}

    FilterStats run(const FilterSettings& settings, std::string* output = nullptr) {
        auto filter = makeFilter(settings);
        std::istringstream in(input);
        std::ostringstream out;
        FilterStats stats = runFilter(in, out, *filter, settings.exclude);
        if (output) {
            *output = out.str();
        }
        return stats;
    }

    static FilterSettings bbox(double minx, double miny, double maxx, double maxy) {
        FilterSettings s;
        s.kind = FilterKind::BBox;
        s.bbox = {minx, miny, maxx, maxy};
        return s;
    }

    static FilterSettings radius(double x, double y, double r) {
        FilterSettings s;
        s.kind = FilterKind::Radius;
        s.centerX = x;
        s.centerY = y;
        s.radius = r;
        return s;
    }

    static FilterSettings cotype(const std::string& type) {
        FilterSettings s;
        s.kind = FilterKind::CityObjectType;
        s.cityObjectType = type;
        return s;
    }

    std::string input;
};

TEST_F(StreamFilterTest, BBoxKeepsInsideCentroid) {
    std::string out;
    FilterStats stats = run(bbox(0, 0, 10, 10), &out);
    EXPECT_EQ(stats.kept, 1u);
    EXPECT_EQ(stats.dropped, 0u);
    EXPECT_EQ(out, input);
}

TEST_F(StreamFilterTest, BBoxIsStrict) {
    EXPECT_EQ(run(bbox(5, 0, 10, 10)).kept, 0u);
    EXPECT_EQ(run(bbox(0, 0, 10, 5)).kept, 0u);
}

TEST_F(StreamFilterTest, ExcludeInvertsSelection) {
    FilterSettings s = bbox(0, 0, 10, 10);
    s.exclude = true;
    std::string out;
    FilterStats stats = run(s, &out);
    EXPECT_EQ(stats.kept, 0u);
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(out, unitHeaderLine() + "\n");
}

TEST_F(StreamFilterTest, Radius) {
    EXPECT_EQ(run(radius(0, 0, 8)).kept, 1u);
    EXPECT_EQ(run(radius(0, 0, 5)).kept, 0u);
    // Distance exactly equal to the radius is inside.
    EXPECT_EQ(run(radius(2, 1, 5)).kept, 1u);
}

TEST_F(StreamFilterTest, CityObjectType) {
    EXPECT_EQ(run(cotype("Building")).kept, 1u);
    EXPECT_EQ(run(cotype("Road")).kept, 0u);
}

TEST_F(StreamFilterTest, CentroidUsesHeaderTransform) {
    input = R"({"type":"CityJSON","version":"2.0","transform":{"scale":[0.1,0.1,0.1],"translate":[100.0,0.0,0.0]},"CityObjects":{},"vertices":[]})"
            "\n" + singleVertexFeatureLine("F1", "Building", 50, 50, 0) + "\n";
    EXPECT_EQ(run(bbox(104, 4, 106, 6)).kept, 1u);
    EXPECT_EQ(run(bbox(0, 0, 10, 10)).kept, 0u);
}

TEST_F(StreamFilterTest, BadLineIsSkipped) {
    input += "{\"type\":\"CityJSONFeature\"\n";
    input += singleVertexFeatureLine("F2", "Building", 6, 6, 0) + "\n";
    std::string out;
    FilterStats stats = run(bbox(0, 0, 10, 10), &out);
    EXPECT_EQ(stats.kept, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(out.find("CityJSONFeature\"\n"), std::string::npos);
}

TEST_F(StreamFilterTest, HeaderPassesThroughVerbatim) {
    std::string header = R"({"type":"CityJSON", "version":"2.0", "x-note":"kept as is",)"
                         R"( "transform":{"scale":[1,1,1],"translate":[0,0,0]},"CityObjects":{},"vertices":[]})";
    input = header + "\n";
    std::string out;
    run(cotype("Building"), &out);
    EXPECT_EQ(out, header + "\n");
}

TEST_F(StreamFilterTest, BadHeaderIsFatal) {
    input = "not a header\n";
    EXPECT_THROW(run(cotype("Building")), SeqError);

    input = singleVertexFeatureLine("F1", "Building", 5, 5, 0) + "\n";
    try {
        run(cotype("Building"));
        FAIL() << "expected SeqError";
    } catch (const SeqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedDocument);
    }
}

TEST_F(StreamFilterTest, HeaderMembersBesidesTransformAreNotValidated) {
    std::string header = R"({"type":"CityJSON","version":"2.0",)"
                         R"("metadata":{"referenceSystem":"urn:ogc:def:crs:EPSG::7415"},)"
                         R"("transform":{"scale":[1.0,1.0,1.0],"translate":[0.0,0.0,0.0]},"CityObjects":{},"vertices":[]})";
    input = header + "\n" + singleVertexFeatureLine("F1", "Building", 5, 5, 0) + "\n";

    std::string out;
    EXPECT_EQ(run(cotype("Building"), &out).kept, 1u);
    EXPECT_EQ(out, input);

    FilterSettings s;
    s.kind = FilterKind::Random;
    EXPECT_EQ(run(s).kept, 1u);
    EXPECT_EQ(run(bbox(0, 0, 10, 10)).kept, 1u);
}

TEST_F(StreamFilterTest, RandomFactorOneKeepsEverything) {
    for (int i = 0; i < 5; ++i) {
        input += singleVertexFeatureLine("G" + std::to_string(i), "Road", i, i, 0) + "\n";
    }
    FilterSettings s;
    s.kind = FilterKind::Random;
    s.randomFactor = 1;
    EXPECT_EQ(run(s).kept, 6u);
}

TEST_F(StreamFilterTest, RandomIsReproducibleWithSeed) {
    RandomFilter a(4, 42u), b(4, 42u);
    std::size_t kept = 0;
    for (int i = 0; i < 1000; ++i) {
        bool x = a.draw();
        EXPECT_EQ(x, b.draw());
        kept += x ? 1 : 0;
    }
    EXPECT_GT(kept, 150u);
    EXPECT_LT(kept, 350u);
}

TEST_F(StreamFilterTest, RandomFactorParsing) {
    EXPECT_EQ(parseRandomFactor("1"), 1u);
    EXPECT_EQ(parseRandomFactor("4294967295"), 4294967295u);
    EXPECT_THROW(parseRandomFactor("0"), SeqError);
    EXPECT_THROW(parseRandomFactor("-3"), SeqError);
    EXPECT_THROW(parseRandomFactor("4294967297"), SeqError);
    EXPECT_THROW(parseRandomFactor("99999999999999999999"), SeqError);
    EXPECT_THROW(parseRandomFactor("10x"), SeqError);
    EXPECT_THROW(parseRandomFactor(""), SeqError);
}

TEST_F(StreamFilterTest, InvalidParametersAreRejected) {
    EXPECT_THROW(makeFilter(bbox(10, 0, 0, 10)), SeqError);
    EXPECT_THROW(makeFilter(radius(0, 0, -1)), SeqError);
    EXPECT_THROW(makeFilter(cotype("")), SeqError);
    EXPECT_THROW(RandomFilter(0), SeqError);
}

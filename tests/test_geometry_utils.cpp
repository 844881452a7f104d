#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "geometry/geometry_conversion.hpp"
#include "geometry/geometry_utils.hpp"
#include "errors.hpp"
#include "temp_directory.hpp"

using namespace geoconvert;
using geometry::BoundingBox;
using geometry::GeometryUtils;

namespace {

nlohmann::json unitSquare() {
    return nlohmann::json::parse(R"({"type": "Polygon",
        "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]]})");
}

} // namespace

TEST(GeometryUtilsTest, AreaOfOneDegreeSquareAtEquator) {
    // R^2 * (pi / 180) * sin(1 degree)
    EXPECT_NEAR(GeometryUtils::getArea(unitSquare()), 12363.684, 0.01);
}

TEST(GeometryUtilsTest, AreaAcceptsFeaturesStringsAndMultiPolygons) {
    nlohmann::json feature = {{"type", "Feature"}, {"geometry", unitSquare()}, {"properties", nullptr}};
    EXPECT_NEAR(GeometryUtils::getArea(feature), 12363.684, 0.01);
    EXPECT_NEAR(GeometryUtils::getArea(unitSquare().dump()), 12363.684, 0.01);

    nlohmann::json multi = {{"type", "MultiPolygon"},
                            {"coordinates", {unitSquare()["coordinates"], unitSquare()["coordinates"]}}};
    EXPECT_NEAR(GeometryUtils::getArea(multi), 2 * 12363.684, 0.02);
}

TEST(GeometryUtilsTest, AreaIsInvariantUnderRingRotationAndDirection) {
    nlohmann::json rotated = nlohmann::json::parse(R"({"type": "Polygon",
        "coordinates": [[[1, 1], [0, 1], [0, 0], [1, 0], [1, 1]]]})");
    nlohmann::json reversed = nlohmann::json::parse(R"({"type": "Polygon",
        "coordinates": [[[0, 0], [0, 1], [1, 1], [1, 0], [0, 0]]]})");

    double area = GeometryUtils::getArea(unitSquare());
    EXPECT_NEAR(GeometryUtils::getArea(rotated), area, 1e-6);
    EXPECT_NEAR(GeometryUtils::getArea(reversed), area, 1e-6);
}

TEST(GeometryUtilsTest, AreaSkipsDegenerateRingsAndKeepsInput) {
    nlohmann::json line = nlohmann::json::parse(R"({"type": "Polygon",
        "coordinates": [[[0, 0], [1, 0], [0, 0]]]})");
    EXPECT_DOUBLE_EQ(GeometryUtils::getArea(line), 0.0);

    nlohmann::json square = unitSquare();
    GeometryUtils::getArea(square);
    EXPECT_EQ(square["coordinates"][0].size(), 5u);
}

TEST(GeometryUtilsTest, AreaRejectsOtherGeometryTypes) {
    nlohmann::json point = {{"type", "Point"}, {"coordinates", {1.0, 2.0}}};
    EXPECT_THROW(GeometryUtils::getArea(point), UnsupportedGeometryError);
    EXPECT_THROW(GeometryUtils::getArea(std::string("not json")), UnsupportedGeometryError);
}

TEST(GeometryUtilsTest, IsEnvelope) {
    const std::string envelope = R"({"type": "MultiPolygon",
        "coordinates": [[[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]]]})";
    const std::string triangle = R"({"type": "MultiPolygon",
        "coordinates": [[[[0, 0], [1, 0], [0, 1], [0, 0]]]]})";
    const std::string skewed = R"({"type": "MultiPolygon",
        "coordinates": [[[[0, 0], [1.5, 0], [1, 1], [0, 1], [0, 0]]]]})";
    const std::string two_polygons = R"({"type": "MultiPolygon",
        "coordinates": [[[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]],
                        [[[2, 2], [3, 2], [3, 3], [2, 3], [2, 2]]]]})";

    EXPECT_TRUE(GeometryUtils::isEnvelope(envelope));
    EXPECT_TRUE(GeometryUtils::isEnvelope(unitSquare()));
    EXPECT_FALSE(GeometryUtils::isEnvelope(triangle));
    EXPECT_FALSE(GeometryUtils::isEnvelope(skewed));
    EXPECT_FALSE(GeometryUtils::isEnvelope(two_polygons));
    EXPECT_FALSE(GeometryUtils::isEnvelope(std::string("")));
    EXPECT_FALSE(GeometryUtils::isEnvelope(std::string("{\"type\": ")));
}

TEST(GeometryUtilsTest, IsEnvelopeReadsFiles) {
    test_support::TempDirectory directory;
    std::string path = directory.touch("square.geojson", unitSquare().dump());
    EXPECT_TRUE(GeometryUtils::isEnvelope(path));
}

TEST(GeometryUtilsTest, BboxValidation) {
    EXPECT_TRUE(GeometryUtils::isValidBbox(BoundingBox(-1, -1, 1, 1)));
    EXPECT_FALSE(GeometryUtils::isValidBbox(BoundingBox(1, -1, -1, 1)));
    EXPECT_FALSE(GeometryUtils::isValidBbox(BoundingBox(-1, 1, 1, 1)));

    EXPECT_TRUE(GeometryUtils::validateBbox(BoundingBox(-180, -90, 180, 90)).has_value());
    EXPECT_FALSE(GeometryUtils::validateBbox(BoundingBox(-181, 0, 10, 10)).has_value());
    EXPECT_FALSE(GeometryUtils::validateBbox(BoundingBox(0, 0, 10, 91)).has_value());
}

TEST(GeometryUtilsTest, ExpandBbox) {
    std::optional<BoundingBox> accumulated;
    accumulated = GeometryUtils::expandBbox(accumulated, BoundingBox(0, 0, 1, 1));
    EXPECT_EQ(*accumulated, BoundingBox(0, 0, 1, 1));

    accumulated = GeometryUtils::expandBbox(accumulated, BoundingBox(-2, 0.5, 0.5, 3));
    EXPECT_EQ(*accumulated, BoundingBox(-2, 0, 1, 3));
}

TEST(GeometryUtilsTest, BboxFromJSON) {
    EXPECT_EQ(*GeometryUtils::bboxFromJSON(nlohmann::json::array({1, 2, 3, 4})), BoundingBox(1, 2, 3, 4));
    EXPECT_FALSE(GeometryUtils::bboxFromJSON(nlohmann::json::array({1, 2, 3})).has_value());
    EXPECT_FALSE(GeometryUtils::bboxFromJSON(nlohmann::json::array({1, "2", 3, 4})).has_value());
}

TEST(GeometryConversionTest, BboxToPolygonRing) {
    nlohmann::json polygon = geometry::bboxToGeoJSON(BoundingBox(-1, -2, 3, 4));
    nlohmann::json expected = nlohmann::json::parse(R"({"type": "Polygon",
        "coordinates": [[[-1.0, -2.0], [3.0, -2.0], [3.0, 4.0], [-1.0, 4.0], [-1.0, -2.0]]]})");
    EXPECT_EQ(polygon, expected);
    EXPECT_TRUE(GeometryUtils::isEnvelope(polygon));
}

TEST(GeometryConversionTest, PolygonToBboxRecoversBox) {
    BoundingBox bbox(10.5, -3.25, 12.0, 7.75);
    EXPECT_EQ(geometry::polygonToBbox(geometry::bboxToPolygon(bbox)), bbox);
}

TEST(GeometryConversionTest, GeoJSONToMultiPolygon) {
    geometry::MultiPolygon from_polygon = geometry::geoJSONToMultiPolygon(unitSquare());
    ASSERT_EQ(from_polygon.size(), 1u);
    EXPECT_EQ(from_polygon[0].outer().size(), 5u);

    nlohmann::json line = {{"type", "LineString"}, {"coordinates", {{0, 0}, {1, 1}}}};
    EXPECT_THROW(geometry::geoJSONToMultiPolygon(line), UnsupportedGeometryError);
}

TEST(GeometryConversionTest, GeometryTypeIgnoresCase) {
    nlohmann::json upper = unitSquare();
    upper["type"] = "POLYGON";
    EXPECT_EQ(geometry::geoJSONToMultiPolygon(upper).size(), 1u);
    EXPECT_GT(GeometryUtils::getArea(upper), 0.0);

    // Bytes outside ASCII are kept as they are and never match a type
    nlohmann::json accented = unitSquare();
    accented["type"] = "Polyg\xC3\xB3n";
    EXPECT_THROW(geometry::geoJSONToMultiPolygon(accented), UnsupportedGeometryError);
    EXPECT_THROW(GeometryUtils::getArea(accented), UnsupportedGeometryError);
}

#include "geometry/geometry_conversion.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace geoconvert {
namespace geometry {

namespace {

nlohmann::json ringToGeoJSON(const LinearRing& ring) {
    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& point : ring) {
        coordinates.push_back({bg::get<0>(point), bg::get<1>(point)});
    }
    return coordinates;
}

nlohmann::json polygonCoordinates(const Polygon& polygon) {
    nlohmann::json coordinates = nlohmann::json::array();
    coordinates.push_back(ringToGeoJSON(polygon.outer()));
    for (const auto& inner : polygon.inners()) {
        coordinates.push_back(ringToGeoJSON(inner));
    }
    return coordinates;
}

LinearRing geoJSONToRing(const nlohmann::json& coordinates) {
    LinearRing ring;
    for (const auto& coordinate : coordinates) {
        if (!coordinate.is_array() || coordinate.size() < 2) {
            throw UnsupportedGeometryError("Invalid GeoJSON coordinate: " + coordinate.dump());
        }
        ring.push_back(Point(coordinate[0].get<double>(), coordinate[1].get<double>()));
    }
    return ring;
}

Polygon geoJSONToPolygon(const nlohmann::json& coordinates) {
    Polygon polygon;
    if (!coordinates.is_array() || coordinates.empty()) {
        return polygon;
    }
    polygon.outer() = geoJSONToRing(coordinates[0]);
    for (size_t i = 1; i < coordinates.size(); ++i) {
        polygon.inners().push_back(geoJSONToRing(coordinates[i]));
    }
    return polygon;
}

} // namespace

// Boost Geometry to GeoJSON
nlohmann::json polygonToGeoJSON(const Polygon& polygon) {
    nlohmann::json geometry;
    geometry["type"] = "Polygon";
    geometry["coordinates"] = polygonCoordinates(polygon);
    return geometry;
}

nlohmann::json multiPolygonToGeoJSON(const MultiPolygon& multi_polygon) {
    nlohmann::json geometry;
    geometry["type"] = "MultiPolygon";
    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& polygon : multi_polygon) {
        coordinates.push_back(polygonCoordinates(polygon));
    }
    geometry["coordinates"] = coordinates;
    return geometry;
}

nlohmann::json bboxToGeoJSON(const BoundingBox& bbox) {
    return polygonToGeoJSON(bboxToPolygon(bbox));
}

Polygon bboxToPolygon(const BoundingBox& bbox) {
    Polygon polygon;
    auto& ring = polygon.outer();
    ring.push_back(Point(bbox.west, bbox.south));
    ring.push_back(Point(bbox.east, bbox.south));
    ring.push_back(Point(bbox.east, bbox.north));
    ring.push_back(Point(bbox.west, bbox.north));
    ring.push_back(Point(bbox.west, bbox.south));
    return polygon;
}

BoundingBox polygonToBbox(const Polygon& polygon) {
    Box envelope;
    bg::envelope(polygon, envelope);
    return BoundingBox(bg::get<bg::min_corner, 0>(envelope), bg::get<bg::min_corner, 1>(envelope),
                       bg::get<bg::max_corner, 0>(envelope), bg::get<bg::max_corner, 1>(envelope));
}

// GeoJSON to Boost Geometry
MultiPolygon geoJSONToMultiPolygon(const nlohmann::json& geometry) {
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
        throw UnsupportedGeometryError("Invalid GeoJSON geometry: missing type");
    }

    std::string type = geometry["type"].get<std::string>();
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const nlohmann::json coordinates = geometry.value("coordinates", nlohmann::json::array());

    MultiPolygon multi_polygon;
    if (type == "polygon") {
        multi_polygon.push_back(geoJSONToPolygon(coordinates));
    } else if (type == "multipolygon") {
        for (const auto& polygon_coordinates : coordinates) {
            multi_polygon.push_back(geoJSONToPolygon(polygon_coordinates));
        }
    } else {
        throw UnsupportedGeometryError("Invalid geometry type: " + type);
    }
    return multi_polygon;
}

} // namespace geometry
} // namespace geoconvert

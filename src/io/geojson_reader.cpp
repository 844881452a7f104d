#include "io/geojson_reader.hpp"
#include "errors.hpp"
#include <vector>

namespace geoconvert {
namespace io {

nlohmann::json GeoJSONReader::readGeometry(const nlohmann::json& geojson) {
    if (!geojson.is_object() || !geojson.contains("type") || !geojson["type"].is_string()) {
        throw InputError("Invalid GeoJSON: missing type");
    }

    const std::string type = geojson["type"].get<std::string>();

    if (type == "Feature") {
        if (!geojson.contains("geometry") || !geojson["geometry"].is_object()) {
            throw InputError("Invalid GeoJSON: Feature has no geometry");
        }
        return readGeometry(geojson["geometry"]);
    }

    if (type == "FeatureCollection") {
        if (!geojson.contains("features") || !geojson["features"].is_array()) {
            throw InputError("Invalid GeoJSON: FeatureCollection has no features");
        }

        std::vector<nlohmann::json> geometries;
        for (const auto& feature : geojson["features"]) {
            if (feature.contains("geometry") && feature["geometry"].is_object()) {
                geometries.push_back(readGeometry(feature["geometry"]));
            }
        }
        if (geometries.empty()) {
            throw InputError("No valid features found in GeoJSON");
        }
        if (geometries.size() == 1) {
            return geometries.front();
        }

        // Fold several polygons into one MultiPolygon
        nlohmann::json coordinates = nlohmann::json::array();
        for (const auto& geometry : geometries) {
            const std::string geometry_type = geometry["type"].get<std::string>();
            if (geometry_type == "Polygon") {
                coordinates.push_back(geometry["coordinates"]);
            } else if (geometry_type == "MultiPolygon") {
                for (const auto& polygon : geometry["coordinates"]) {
                    coordinates.push_back(polygon);
                }
            } else {
                throw InputError("Cannot combine geometry of type " + geometry_type + " into a boundary");
            }
        }
        return nlohmann::json{{"type", "MultiPolygon"}, {"coordinates", coordinates}};
    }

    if (!geojson.contains("coordinates")) {
        throw InputError("Invalid GeoJSON: geometry of type " + type + " has no coordinates");
    }
    return nlohmann::json{{"type", type}, {"coordinates", geojson["coordinates"]}};
}

std::string GeoJSONReader::parseCRS(const nlohmann::json& geojson) {
    if (!geojson.is_object() || !geojson.contains("crs") || !geojson["crs"].is_object()) {
        return "";
    }

    const auto& crs_obj = geojson["crs"];
    if (!crs_obj.contains("properties") || !crs_obj["properties"].is_object()) {
        return "";
    }
    const auto& properties = crs_obj["properties"];

    // Handle standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:32633"}}
    if (crs_obj.value("type", "") == "name" && properties.contains("name") && properties["name"].is_string()) {
        return properties["name"].get<std::string>();
    }

    // Handle legacy CRS format: {"type": "EPSG", "properties": {"code": 32633}}
    if (crs_obj.value("type", "") == "EPSG" && properties.contains("code") && properties["code"].is_number_integer()) {
        return "EPSG:" + std::to_string(properties["code"].get<int>());
    }

    return "";
}

} // namespace io
} // namespace geoconvert

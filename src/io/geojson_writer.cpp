#include "io/geojson_writer.hpp"
#include "errors.hpp"
#include <fstream>

namespace geoconvert {
namespace io {

void GeoJSONWriter::writeGeometryToFile(const nlohmann::json& geometry, const std::string& filepath,
                                        const std::string& crs) {
    std::string geojson_string = writeGeometryToString(geometry, crs);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw ConversionError("Failed to open file for writing: " + filepath);
    }

    file << geojson_string;
    file.close();
    if (file.fail()) {
        throw ConversionError("Error writing file " + filepath);
    }
}

std::string GeoJSONWriter::writeGeometryToString(const nlohmann::json& geometry, const std::string& crs) {
    nlohmann::json geojson;
    geojson["type"] = "FeatureCollection";

    if (!crs.empty()) {
        setCRS(geojson, crs);
    }

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["geometry"] = geometry;
    feature["properties"] = nlohmann::json::object();

    geojson["features"] = nlohmann::json::array({feature});

    return geojson.dump(2); // Pretty print with 2-space indentation
}

void GeoJSONWriter::setCRS(nlohmann::json& geojson, const std::string& crs) {
    if (crs.empty()) {
        return;
    }

    // Standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:32633"}}
    nlohmann::json crs_obj;
    crs_obj["type"] = "name";
    crs_obj["properties"]["name"] = crs;

    geojson["crs"] = crs_obj;
}

} // namespace io
} // namespace geoconvert

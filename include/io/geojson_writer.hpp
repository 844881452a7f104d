#ifndef GEOCONVERT_GEOJSON_WRITER_HPP
#define GEOCONVERT_GEOJSON_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace geoconvert {
namespace io {

/**
 * GeoJSON writer for boundary geometries
 */
class GeoJSONWriter {
public:
    /**
     * Write a geometry as a one-feature FeatureCollection
     * @param geometry GeoJSON geometry object
     * @param filepath Path to the output GeoJSON file
     * @param crs Optional CRS string (e.g., "EPSG:4326"); omitted when empty
     * @throws ConversionError if the file cannot be written
     */
    static void writeGeometryToFile(const nlohmann::json& geometry, const std::string& filepath,
                                    const std::string& crs = "");

    /**
     * Wrap a geometry in a one-feature FeatureCollection
     * @param geometry GeoJSON geometry object
     * @param crs Optional CRS string
     * @return GeoJSON string representation
     */
    static std::string writeGeometryToString(const nlohmann::json& geometry, const std::string& crs = "");

    /**
     * Set CRS information in a GeoJSON object
     * @param geojson JSON object to modify
     * @param crs CRS string (e.g., "EPSG:32633")
     */
    static void setCRS(nlohmann::json& geojson, const std::string& crs);

private:
    // Disable instantiation
    GeoJSONWriter() = delete;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_GEOJSON_WRITER_HPP

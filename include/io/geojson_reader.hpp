#ifndef GEOCONVERT_GEOJSON_READER_HPP
#define GEOCONVERT_GEOJSON_READER_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace geoconvert {
namespace io {

/**
 * GeoJSON reader for boundary geometries
 */
class GeoJSONReader {
public:
    /**
     * Reduce a GeoJSON object to a single geometry
     * A bare geometry is returned as is, a Feature yields its geometry and a FeatureCollection
     * yields its only geometry or, when it holds several polygons, one MultiPolygon.
     * @param geojson Parsed GeoJSON object
     * @return Geometry object with "type" and "coordinates"
     * @throws InputError if no usable geometry is found
     */
    static nlohmann::json readGeometry(const nlohmann::json& geojson);

    /**
     * Parse CRS information from a GeoJSON object
     * @param geojson JSON object containing GeoJSON data
     * @return CRS string (e.g., "EPSG:32633") or empty string if not found
     */
    static std::string parseCRS(const nlohmann::json& geojson);

private:
    // Disable instantiation
    GeoJSONReader() = delete;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_GEOJSON_READER_HPP

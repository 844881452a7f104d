#ifndef GEOCONVERT_GEOMETRY_UTILS_HPP
#define GEOCONVERT_GEOMETRY_UTILS_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "geometry/common.hpp"

namespace geoconvert {
namespace geometry {

/**
 * Planar and spherical helpers used to plan conversions
 */
class GeometryUtils {
public:
    // Mean earth radius in kilometers
    static constexpr double EARTH_RADIUS_KM = 6371.0;

    /**
     * Approximate geodesic area of a polygon or multipolygon in square kilometers
     * Uses the Chamberlain-Duquette spherical excess summation on the outer ring of each polygon.
     * Holes are ignored and rings with fewer than 4 points are skipped.
     * @param geojson GeoJSON geometry or Feature
     * @return Area in km^2
     * @throws UnsupportedGeometryError if the geometry is not a Polygon or MultiPolygon
     */
    static double getArea(const nlohmann::json& geojson);

    /**
     * Same as getArea, parsing the GeoJSON from a string first
     * @throws UnsupportedGeometryError if the string is not valid GeoJSON geometry
     */
    static double getArea(const std::string& geojson_string);

    /**
     * Check whether a GeoJSON geometry is an axis-aligned rectangle
     * @param path_or_json Path to a GeoJSON file, or a GeoJSON string
     * @return true for a single polygon with one closed 5-point ring having exactly
     *         two distinct x values and two distinct y values; false otherwise,
     *         including when the input cannot be read or parsed
     */
    static bool isEnvelope(const std::string& path_or_json);

    // Same check on an already parsed geometry
    static bool isEnvelope(const nlohmann::json& geometry);

    /**
     * A valid selection box has west < east and south < north
     */
    static bool isValidBbox(const BoundingBox& bbox);

    /**
     * Validate a box against the legal WGS84 ranges
     * @param bbox Bounding box in degrees
     * @return The box if it is a valid selection box within [-180,180] x [-90,90], otherwise nullopt
     */
    static std::optional<BoundingBox> validateBbox(const BoundingBox& bbox);

    /**
     * Grow an accumulated box so it covers another one
     * @param accumulated Box seen so far (nullopt seeds the fold with new_bbox)
     * @param new_bbox Box to add
     * @return Pointwise min of west/south and max of east/north
     */
    static BoundingBox expandBbox(const std::optional<BoundingBox>& accumulated, const BoundingBox& new_bbox);

    /**
     * Read a [w, s, e, n] array
     * @param value JSON array of 4 numbers
     * @return Bounding box, or nullopt if the value is not a 4-number array
     */
    static std::optional<BoundingBox> bboxFromJSON(const nlohmann::json& value);

private:
    // Disable instantiation
    GeometryUtils() = delete;
};

} // namespace geometry
} // namespace geoconvert

#endif // GEOCONVERT_GEOMETRY_UTILS_HPP

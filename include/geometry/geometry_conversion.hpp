#ifndef GEOCONVERT_GEOMETRY_CONVERSION_HPP
#define GEOCONVERT_GEOMETRY_CONVERSION_HPP

#include <nlohmann/json.hpp>
#include "geometry/common.hpp"

namespace geoconvert {
namespace geometry {

// Boost Geometry to GeoJSON
nlohmann::json polygonToGeoJSON(const Polygon& polygon);
nlohmann::json multiPolygonToGeoJSON(const MultiPolygon& multi_polygon);

/**
 * Build a GeoJSON Polygon for a bounding box
 * The ring is [[w,s],[e,s],[e,n],[w,n],[w,s]]
 * @param bbox Bounding box
 * @return GeoJSON Polygon geometry
 */
nlohmann::json bboxToGeoJSON(const BoundingBox& bbox);

/**
 * Build a closed, counter-clockwise rectangle for a bounding box
 * @param bbox Bounding box
 * @return Polygon with a single 5-point ring
 */
Polygon bboxToPolygon(const BoundingBox& bbox);

/**
 * Compute the bounding coordinates of a polygon
 * @param polygon Polygon
 * @return Bounding box [west, south, east, north]
 */
BoundingBox polygonToBbox(const Polygon& polygon);

/**
 * Convert a GeoJSON Polygon or MultiPolygon into a Boost multipolygon
 * @param geometry GeoJSON geometry object
 * @return MultiPolygon (a Polygon becomes a single member)
 * @throws UnsupportedGeometryError for any other geometry type
 */
MultiPolygon geoJSONToMultiPolygon(const nlohmann::json& geometry);

} // namespace geometry
} // namespace geoconvert

#endif // GEOCONVERT_GEOMETRY_CONVERSION_HPP

#ifndef GEOCONVERT_COORDINATE_SYSTEM_UTILS_HPP
#define GEOCONVERT_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_spatialref.h>
#include "geometry/common.hpp"
#include "io/gdal_handles.hpp"

namespace geoconvert {
namespace io {

/**
 * Coordinate system utility functions for reprojection and pixel scale estimation
 */
class CoordinateSystemUtils {
public:
    /**
     * Check if coordinate system is EPSG:4326 (WGS84)
     * @param spatial_ref OGRSpatialReference handle
     * @return true if EPSG:4326, false otherwise
     */
    static bool isEPSG4326(OGRSpatialReferenceH spatial_ref);

    /**
     * Create a coordinate transformation between two EPSG codes
     * Both sides use the traditional GIS axis order (x = longitude/easting, y = latitude/northing)
     * regardless of the order the authority declares.
     * @param from_epsg Source EPSG code
     * @param to_epsg Target EPSG code
     * @return Owned transformation handle
     * @throws ConversionError if either code is unknown or the transformation cannot be built
     */
    static TransformPtr getTransform(int from_epsg, int to_epsg);

    /**
     * Reproject a geometry in place
     * @param geometry OGR geometry handle
     * @param from_epsg Source EPSG code
     * @param to_epsg Target EPSG code
     * @throws ConversionError if the transformation fails
     */
    static void reprojectGeometry(OGRGeometryH geometry, int from_epsg, int to_epsg);

    /**
     * Length of the line between two lon/lat points measured in web mercator (EPSG:3857)
     * The result carries mercator distortion and is meant for pixel scale estimation only.
     * @param point_a First point [lon, lat]
     * @param point_b Second point [lon, lat]
     * @return Distance in meters
     */
    static double getDistance(const geometry::Point& point_a, const geometry::Point& point_b);

    /**
     * Pixel dimensions of a lon/lat box at a given scale
     * @param bbox Bounding box in EPSG:4326
     * @param scale Meters per pixel
     * @return Width and height in pixels, each at least 1
     */
    static geometry::PixelDimensions getDimensions(const geometry::BoundingBox& bbox, double scale);

    /**
     * Pixel dimensions from already measured ground distances
     * @param width_meters Ground width
     * @param height_meters Ground height
     * @param scale Meters per pixel
     * @return Floored width and height in pixels, each at least 1
     */
    static geometry::PixelDimensions getDimensions(double width_meters, double height_meters, double scale);

    /**
     * Single scale value for a pixel size given in degrees
     * @param pixel_size Pixel size along x and y
     * @return Mean of the two axis distances in meters, rounded to the nearest integer
     */
    static int getScaleInMeters(const geometry::PixelSize& pixel_size);

    /**
     * Reproject the lower-left and upper-right corners of a box
     * @param bbox Box in the source projection
     * @param from_epsg Source EPSG code
     * @param to_epsg Target EPSG code
     * @return Box in the target projection (unchanged when both codes match)
     */
    static geometry::BoundingBox convertBbox(const geometry::BoundingBox& bbox, int from_epsg, int to_epsg);

private:
    static SpatialReferencePtr createSpatialReference(int epsg);

    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_COORDINATE_SYSTEM_UTILS_HPP

#include "io/coordinate_system_utils.hpp"
#include "errors.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_spatialref.h>
#include <cpl_error.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace geoconvert {
namespace io {

bool CoordinateSystemUtils::isEPSG4326(OGRSpatialReferenceH spatial_ref) {
    if (!spatial_ref) {
        return false;
    }

    // Check if it's WGS84
    OGRSpatialReferenceH wgs84 = OSRNewSpatialReference(nullptr);
    OSRImportFromEPSG(wgs84, 4326);

    bool is_same = OSRIsSame(spatial_ref, wgs84);

    OSRDestroySpatialReference(wgs84);
    return is_same;
}

SpatialReferencePtr CoordinateSystemUtils::createSpatialReference(int epsg) {
    SpatialReferencePtr srs(OSRNewSpatialReference(nullptr));
    if (!srs || OSRImportFromEPSG(srs.get(), epsg) != OGRERR_NONE) {
        throw ConversionError("Unknown spatial reference: EPSG:" + std::to_string(epsg));
    }

    // Set axis mapping strategy for GDAL 3+
    OSRSetAxisMappingStrategy(srs.get(), OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

TransformPtr CoordinateSystemUtils::getTransform(int from_epsg, int to_epsg) {
    SpatialReferencePtr source = createSpatialReference(from_epsg);
    SpatialReferencePtr target = createSpatialReference(to_epsg);

    // The transformation keeps its own copies of both references
    TransformPtr transform(OCTNewCoordinateTransformation(source.get(), target.get()));
    if (!transform) {
        throw ConversionError("Failed to create transformation from EPSG:" + std::to_string(from_epsg) +
                              " to EPSG:" + std::to_string(to_epsg) + ": " + CPLGetLastErrorMsg());
    }
    return transform;
}

void CoordinateSystemUtils::reprojectGeometry(OGRGeometryH geometry, int from_epsg, int to_epsg) {
    if (!geometry) {
        throw ConversionError("Cannot reproject a null geometry");
    }

    TransformPtr transform = getTransform(from_epsg, to_epsg);
    if (OGR_G_Transform(geometry, transform.get()) != OGRERR_NONE) {
        throw ConversionError("Failed to reproject geometry from EPSG:" + std::to_string(from_epsg) +
                              " to EPSG:" + std::to_string(to_epsg));
    }
}

double CoordinateSystemUtils::getDistance(const geometry::Point& point_a, const geometry::Point& point_b) {
    // A line given in lon/lat is implicitly EPSG:4326
    GeometryPtr line(OGR_G_CreateGeometry(wkbLineString));
    OGR_G_AddPoint_2D(line.get(), geometry::bg::get<0>(point_a), geometry::bg::get<1>(point_a));
    OGR_G_AddPoint_2D(line.get(), geometry::bg::get<0>(point_b), geometry::bg::get<1>(point_b));

    // Length is measured in the units of the reference system, meters for web mercator
    reprojectGeometry(line.get(), 4326, 3857);
    return OGR_G_Length(line.get());
}

geometry::PixelDimensions CoordinateSystemUtils::getDimensions(const geometry::BoundingBox& bbox, double scale) {
    double width = getDistance(geometry::Point(bbox.west, bbox.south), geometry::Point(bbox.east, bbox.south));
    double height = getDistance(geometry::Point(bbox.west, bbox.south), geometry::Point(bbox.west, bbox.north));
    return getDimensions(width, height, scale);
}

geometry::PixelDimensions CoordinateSystemUtils::getDimensions(double width_meters, double height_meters, double scale) {
    if (scale <= 0.0) {
        throw InputError("Scale must be positive");
    }

    // Request at least one pixel
    int width = static_cast<int>(std::floor(width_meters / scale));
    int height = static_cast<int>(std::floor(height_meters / scale));
    return geometry::PixelDimensions(std::max(width, 1), std::max(height, 1));
}

int CoordinateSystemUtils::getScaleInMeters(const geometry::PixelSize& pixel_size) {
    const geometry::Point origin(0.0, 0.0);
    double x_distance = getDistance(origin, geometry::Point(pixel_size.x, 0.0));
    double y_distance = getDistance(origin, geometry::Point(0.0, pixel_size.y));
    return static_cast<int>(std::lround((x_distance + y_distance) / 2.0));
}

geometry::BoundingBox CoordinateSystemUtils::convertBbox(const geometry::BoundingBox& bbox, int from_epsg, int to_epsg) {
    if (from_epsg == to_epsg) {
        return bbox;
    }

    TransformPtr transform = getTransform(from_epsg, to_epsg);
    double xs[2] = {bbox.west, bbox.east};
    double ys[2] = {bbox.south, bbox.north};
    if (!OCTTransform(transform.get(), 2, xs, ys, nullptr)) {
        throw ConversionError("Failed to reproject bounding box from EPSG:" + std::to_string(from_epsg) +
                              " to EPSG:" + std::to_string(to_epsg));
    }
    return geometry::BoundingBox(xs[0], ys[0], xs[1], ys[1]);
}

} // namespace io
} // namespace geoconvert

#ifndef GEOCONVERT_COMMON_HPP
#define GEOCONVERT_COMMON_HPP

#include <array>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>

namespace geoconvert {
namespace geometry {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// 2D geometry types (lon/lat or projected x/y, always x first)
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using Box = bg::model::box<Point>;
using LinearRing = bg::model::ring<Point, false>;
using Polygon = bg::model::polygon<Point, false>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;

// Bounding box as [west, south, east, north]
struct BoundingBox {
    double west;
    double south;
    double east;
    double north;

    BoundingBox() : west(0.0), south(0.0), east(0.0), north(0.0) {}
    BoundingBox(double w, double s, double e, double n)
        : west(w), south(s), east(e), north(n) {}

    std::array<double, 4> toArray() const { return {west, south, east, north}; }

    bool operator==(const BoundingBox& other) const {
        return west == other.west && south == other.south &&
               east == other.east && north == other.north;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

// Pixel size of a raster along x and y (in the units of its reference system)
struct PixelSize {
    double x;
    double y;

    PixelSize(double size_x, double size_y) : x(size_x), y(size_y) {}
};

// Raster size in pixels
struct PixelDimensions {
    int width;
    int height;

    PixelDimensions(int w, int h) : width(w), height(h) {}

    bool operator==(const PixelDimensions& other) const {
        return width == other.width && height == other.height;
    }
};

} // namespace geometry
} // namespace geoconvert

#endif // GEOCONVERT_COMMON_HPP

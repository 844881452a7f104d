#include "geometry/geometry_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>
#include <boost/filesystem.hpp>

namespace geoconvert {
namespace geometry {

namespace {

double toRadians(double degrees) {
    return M_PI * degrees / 180.0;
}

std::string lowerType(const nlohmann::json& geometry) {
    std::string type = geometry.at("type").get<std::string>();
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type;
}

// Unwrap a Feature to its geometry
const nlohmann::json& geometryOf(const nlohmann::json& geojson) {
    if (geojson.is_object() && geojson.contains("geometry") && geojson.value("type", "") == "Feature") {
        return geojson["geometry"];
    }
    return geojson;
}

// Polygon coordinate arrays of a Polygon or MultiPolygon, or an empty array for other types
nlohmann::json polygonsOf(const nlohmann::json& geometry, bool& supported) {
    std::string type = lowerType(geometry);
    supported = true;
    if (type == "polygon") {
        return nlohmann::json::array({geometry.at("coordinates")});
    }
    if (type == "multipolygon") {
        return geometry.at("coordinates");
    }
    supported = false;
    return nlohmann::json::array();
}

} // namespace

double GeometryUtils::getArea(const nlohmann::json& geojson) {
    const nlohmann::json& geometry = geometryOf(geojson);
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
        throw UnsupportedGeometryError("Invalid geometry: missing type");
    }

    bool supported = false;
    nlohmann::json polygons = polygonsOf(geometry, supported);
    if (!supported) {
        throw UnsupportedGeometryError("Invalid geometry type: " + lowerType(geometry));
    }

    double sum = 0.0;
    for (const auto& polygon : polygons) {
        if (!polygon.is_array() || polygon.empty()) {
            continue;
        }
        const auto& ring = polygon[0];
        if (ring.size() < 4) {
            continue;
        }

        // Work on a copy extended with the second-to-last vertex for circular indexing
        std::vector<std::pair<double, double>> points;
        points.reserve(ring.size() + 1);
        for (const auto& coordinate : ring) {
            points.emplace_back(coordinate.at(0).get<double>(), coordinate.at(1).get<double>());
        }
        points.push_back(points[points.size() - 2]);

        const size_t count = points.size();
        for (size_t i = 0; i + 2 < count; ++i) {
            const auto& previous = (i == 0) ? points[count - 1] : points[i - 1];
            const auto& next = points[i + 1];
            sum += (toRadians(next.first) - toRadians(previous.first)) * std::sin(toRadians(points[i].second));
        }
    }

    return std::abs(sum * EARTH_RADIUS_KM * EARTH_RADIUS_KM / 2.0);
}

double GeometryUtils::getArea(const std::string& geojson_string) {
    nlohmann::json geojson;
    try {
        geojson = nlohmann::json::parse(geojson_string);
    } catch (const nlohmann::json::parse_error& e) {
        throw UnsupportedGeometryError("JSON parse error: " + std::string(e.what()));
    }
    return getArea(geojson);
}

bool GeometryUtils::isEnvelope(const std::string& path_or_json) {
    try {
        nlohmann::json geojson;
        boost::system::error_code ec;
        if (boost::filesystem::is_regular_file(path_or_json, ec)) {
            std::ifstream file(path_or_json);
            if (!file.is_open()) {
                return false;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            geojson = nlohmann::json::parse(buffer.str());
        } else {
            geojson = nlohmann::json::parse(path_or_json);
        }
        return isEnvelope(geojson);
    } catch (const std::exception&) {
        // Unreadable or unparseable input is not an envelope
        return false;
    }
}

bool GeometryUtils::isEnvelope(const nlohmann::json& geometry) {
    try {
        if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
            return false;
        }

        bool supported = false;
        nlohmann::json polygons = polygonsOf(geometry, supported);
        if (!supported || polygons.size() != 1) {
            return false;
        }

        const auto& polygon = polygons[0];
        if (!polygon.is_array() || polygon.size() != 1) {
            return false;
        }

        const auto& ring = polygon[0];
        if (!ring.is_array() || ring.size() != 5 || ring[4] != ring[0]) {
            return false;
        }

        std::set<double> xs;
        std::set<double> ys;
        for (size_t i = 0; i < 4; ++i) {
            xs.insert(ring[i].at(0).get<double>());
            ys.insert(ring[i].at(1).get<double>());
        }
        return xs.size() == 2 && ys.size() == 2;
    } catch (const std::exception&) {
        return false;
    }
}

bool GeometryUtils::isValidBbox(const BoundingBox& bbox) {
    return bbox.west < bbox.east && bbox.south < bbox.north;
}

std::optional<BoundingBox> GeometryUtils::validateBbox(const BoundingBox& bbox) {
    if (!isValidBbox(bbox)) {
        return std::nullopt;
    }
    if (bbox.west < -180.0 || bbox.east > 180.0 || bbox.south < -90.0 || bbox.north > 90.0) {
        return std::nullopt;
    }
    return bbox;
}

BoundingBox GeometryUtils::expandBbox(const std::optional<BoundingBox>& accumulated, const BoundingBox& new_bbox) {
    if (!accumulated) {
        return new_bbox;
    }
    return BoundingBox(std::min(accumulated->west, new_bbox.west),
                       std::min(accumulated->south, new_bbox.south),
                       std::max(accumulated->east, new_bbox.east),
                       std::max(accumulated->north, new_bbox.north));
}

std::optional<BoundingBox> GeometryUtils::bboxFromJSON(const nlohmann::json& value) {
    if (!value.is_array() || value.size() != 4) {
        return std::nullopt;
    }
    for (const auto& item : value) {
        if (!item.is_number()) {
            return std::nullopt;
        }
    }
    return BoundingBox(value[0].get<double>(), value[1].get<double>(),
                       value[2].get<double>(), value[3].get<double>());
}

} // namespace geometry
} // namespace geoconvert

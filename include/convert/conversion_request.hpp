#ifndef GEOCONVERT_CONVERSION_REQUEST_HPP
#define GEOCONVERT_CONVERSION_REQUEST_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "geometry/common.hpp"
#include "io/gdal_utils.hpp"

namespace geoconvert {
namespace convert {

// Path to an existing vector file holding the boundary
struct BoundaryPath {
    std::string path;
};

// Area of interest: a vector file, a [w, s, e, n] box, or an inline GeoJSON Polygon/MultiPolygon
using Boundary = std::variant<BoundaryPath, geometry::BoundingBox, nlohmann::json>;

// Vector write mode
enum class AccessMode {
    Overwrite,
    Append
};

std::string accessModeName(AccessMode mode);

/**
 * Everything a caller can ask of one conversion
 */
struct ConversionRequest {
    std::vector<std::string> input_files;
    std::string output_file;                        // Defaults to the first input
    std::optional<std::string> driver;              // Inferred from the input when empty
    std::optional<Boundary> boundary;
    std::optional<int> src_srs;                     // EPSG code of the input
    std::optional<int> dst_srs;                     // EPSG code of the output, 4326 when empty
    bool is_raster = true;                          // Hint for mixed raster/vector containers

    // Raster options
    std::vector<std::string> creation_options;
    std::optional<std::vector<std::string>> warp_params;       // Replace every derived warp argument
    std::optional<std::vector<std::string>> translate_params;  // Force and drive the second pass
    bool use_translate = false;

    // Vector options
    std::vector<std::string> layers;
    std::optional<std::string> layer_name;
    std::vector<std::string> dataset_creation_options;
    std::vector<std::string> layer_creation_options;
    AccessMode access_mode = AccessMode::Overwrite;
    bool skip_failures = false;
    std::optional<std::string> distinct_field;

    io::ConfigOptions config_options;
    std::optional<std::string> task_uid;            // Progress reporting key
};

/**
 * Resolved parameters of a raster conversion
 */
struct RasterJob {
    std::vector<std::string> input_files;
    std::string output_file;
    std::string driver;
    std::vector<std::string> creation_options;
    std::optional<std::string> band_type;
    bool dst_alpha = false;
    std::optional<std::string> boundary;            // Vector file used as cutline
    std::optional<std::string> src_srs;             // "EPSG:<code>"
    std::optional<std::string> dst_srs;
    std::optional<std::vector<std::string>> warp_params;
    std::optional<std::vector<std::string>> translate_params;
    bool use_translate = false;
    io::ConfigOptions config_options;
};

/**
 * Resolved parameters of a vector conversion
 */
struct VectorJob {
    std::vector<std::string> input_files;
    std::string output_file;
    std::string driver;
    std::vector<std::string> dataset_creation_options;
    std::vector<std::string> layer_creation_options;
    std::optional<std::string> src_srs;
    std::optional<std::string> dst_srs;
    std::vector<std::string> layers;
    std::optional<std::string> layer_name;
    std::vector<std::string> clip_source;           // A vector file, or the 4 box coordinates
    std::optional<geometry::BoundingBox> spatial_filter;
    AccessMode access_mode = AccessMode::Overwrite;
    io::ConfigOptions config_options;
    std::optional<std::string> distinct_field;
    bool skip_failures = false;
};

using ConversionJob = std::variant<RasterJob, VectorJob>;

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_CONVERSION_REQUEST_HPP

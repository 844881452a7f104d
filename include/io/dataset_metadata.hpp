#ifndef GEOCONVERT_DATASET_METADATA_HPP
#define GEOCONVERT_DATASET_METADATA_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace geoconvert {
namespace io {

// Raster size and band count; all zero for vectors and unidentified datasets
struct RasterDimensions {
    int width = 0;
    int height = 0;
    int band_count = 0;

    bool operator==(const RasterDimensions& other) const {
        return width == other.width && height == other.height && band_count == other.band_count;
    }
};

/**
 * What introspection learned about one input dataset
 * Every optional is empty when the dataset could not be identified.
 */
struct DatasetMetadata {
    std::optional<std::string> driver;  // GDAL driver short name
    std::optional<bool> is_raster;
    std::optional<double> nodata;       // Set only when every band shares the same nodata value
    RasterDimensions dim;
    std::optional<int> srs;             // EPSG code

    bool identified() const { return driver.has_value(); }
};

// JSON form used on the introspection worker channel
void to_json(nlohmann::json& j, const DatasetMetadata& metadata);
void from_json(const nlohmann::json& j, DatasetMetadata& metadata);

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_DATASET_METADATA_HPP

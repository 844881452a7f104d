#include "io/dataset_metadata.hpp"
#include <cmath>
#include <string>

namespace geoconvert {
namespace io {

namespace {

template <typename T>
nlohmann::json optionalToJSON(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJSON(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

// JSON has no NaN or infinity, those nodata values travel as text
nlohmann::json nodataToJSON(const std::optional<double>& nodata) {
    if (!nodata) {
        return nullptr;
    }
    if (std::isnan(*nodata)) {
        return "nan";
    }
    if (std::isinf(*nodata)) {
        return *nodata > 0 ? "inf" : "-inf";
    }
    return *nodata;
}

std::optional<double> nodataFromJSON(const nlohmann::json& j) {
    if (!j.contains("nodata") || j["nodata"].is_null()) {
        return std::nullopt;
    }
    if (j["nodata"].is_string()) {
        return std::stod(j["nodata"].get<std::string>());
    }
    return j["nodata"].get<double>();
}

} // namespace

void to_json(nlohmann::json& j, const DatasetMetadata& metadata) {
    j = nlohmann::json{
        {"driver", optionalToJSON(metadata.driver)},
        {"is_raster", optionalToJSON(metadata.is_raster)},
        {"nodata", nodataToJSON(metadata.nodata)},
        {"dim", {metadata.dim.width, metadata.dim.height, metadata.dim.band_count}},
        {"srs", optionalToJSON(metadata.srs)}
    };
}

void from_json(const nlohmann::json& j, DatasetMetadata& metadata) {
    metadata.driver = optionalFromJSON<std::string>(j, "driver");
    metadata.is_raster = optionalFromJSON<bool>(j, "is_raster");
    metadata.nodata = nodataFromJSON(j);
    metadata.srs = optionalFromJSON<int>(j, "srs");

    metadata.dim = RasterDimensions();
    if (j.contains("dim") && j["dim"].is_array() && j["dim"].size() == 3) {
        metadata.dim.width = j["dim"][0].get<int>();
        metadata.dim.height = j["dim"][1].get<int>();
        metadata.dim.band_count = j["dim"][2].get<int>();
    }
}

} // namespace io
} // namespace geoconvert

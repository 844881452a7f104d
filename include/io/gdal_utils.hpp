#ifndef GEOCONVERT_GDAL_UTILS_HPP
#define GEOCONVERT_GDAL_UTILS_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geoconvert {
namespace io {

// GDAL configuration options as key/value pairs, applied in order
using ConfigOptions = std::vector<std::pair<std::string, std::string>>;

/**
 * GDAL utility functions for driver handling and error text
 */
class GDALUtils {
public:
    // Default driver for rasters and vectors when nothing else is known
    static constexpr const char* BASELINE_DRIVER = "gpkg";

    /**
     * Register all GDAL drivers once per process
     */
    static void registerDrivers();

    /**
     * Check if a specific GDAL driver is available and supports creation
     * @param driver_name GDAL driver name
     * @return true if driver is available and supports creation, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Case-insensitive driver name comparison ("gpkg" matches "GPKG")
     */
    static bool isDriver(const std::string& driver_name, const std::string& expected);

    /**
     * Check whether a GDAL error message means the file is simply not a supported format
     * (or does not exist), as opposed to a real failure while reading it
     * @param message Text from CPLGetLastErrorMsg
     * @return true if the failure can be treated as "unrecognized dataset"
     */
    static bool isUnsupportedFormatMessage(const std::string& message);

    /**
     * Last GDAL error message, or a fallback text when GDAL recorded none
     */
    static std::string lastErrorMessage(const std::string& fallback);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

/**
 * Sets GDAL configuration options for the current thread and restores the previous
 * values when it goes out of scope
 */
class ScopedConfigOptions {
public:
    explicit ScopedConfigOptions(const ConfigOptions& options);
    ~ScopedConfigOptions();

    ScopedConfigOptions(const ScopedConfigOptions&) = delete;
    ScopedConfigOptions& operator=(const ScopedConfigOptions&) = delete;

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> previous_;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_GDAL_UTILS_HPP

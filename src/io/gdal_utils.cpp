#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <cstring>

namespace geoconvert {
namespace io {

void GDALUtils::registerDrivers() {
    static std::once_flag registered;
    std::call_once(registered, []() {
        GDALAllRegister();
    });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    registerDrivers();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cerr << "Warning: GDAL driver '" << driver_name << "' is not available." << std::endl;
        return false;
    }

    // Check if the driver supports creation (directly or by copy)
    const char* create_support = driver->GetMetadataItem(GDAL_DCAP_CREATE);
    const char* create_copy_support = driver->GetMetadataItem(GDAL_DCAP_CREATECOPY);
    bool can_create = (create_support && strcmp(create_support, "YES") == 0) ||
                      (create_copy_support && strcmp(create_copy_support, "YES") == 0);
    if (!can_create) {
        std::cerr << "Warning: GDAL driver '" << driver_name << "' does not support creation." << std::endl;
        return false;
    }

    return true;
}

bool GDALUtils::isDriver(const std::string& driver_name, const std::string& expected) {
    return EQUAL(driver_name.c_str(), expected.c_str());
}

bool GDALUtils::isUnsupportedFormatMessage(const std::string& message) {
    // Database-backed raster drivers report connection failures with this text,
    // which must never be mistaken for an unknown format
    if (message.find("Error browsing database for PostGIS Raster tables") != std::string::npos) {
        return false;
    }
    return message.find("not recognized as a supported file format") != std::string::npos ||
           message.find("not recognized as being in a supported file format") != std::string::npos ||
           message.find("No such file or directory") != std::string::npos ||
           message.find("does not exist in the file system") != std::string::npos;
}

std::string GDALUtils::lastErrorMessage(const std::string& fallback) {
    const char* message = CPLGetLastErrorMsg();
    if (message && message[0] != '\0') {
        return std::string(message);
    }
    return fallback;
}

ScopedConfigOptions::ScopedConfigOptions(const ConfigOptions& options) {
    for (const auto& [key, value] : options) {
        const char* current = CPLGetThreadLocalConfigOption(key.c_str(), nullptr);
        previous_.emplace_back(key, current ? std::optional<std::string>(current) : std::nullopt);
        CPLSetThreadLocalConfigOption(key.c_str(), value.c_str());
    }
}

ScopedConfigOptions::~ScopedConfigOptions() {
    // Restore in reverse order so repeated keys end up with their original value
    for (auto it = previous_.rbegin(); it != previous_.rend(); ++it) {
        CPLSetThreadLocalConfigOption(it->first.c_str(), it->second ? it->second->c_str() : nullptr);
    }
}

} // namespace io
} // namespace geoconvert

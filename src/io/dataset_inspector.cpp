#include "io/dataset_inspector.hpp"
#include "io/coordinate_system_utils.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <cpl_error.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace geoconvert {
namespace io {

namespace {

// Keep GDAL from printing open failures we may decide to ignore
struct QuietErrors {
    QuietErrors() { CPLPushErrorHandler(CPLQuietErrorHandler); }
    ~QuietErrors() { CPLPopErrorHandler(); }
};

const char* POSTGIS_RASTER_ERROR = "Error browsing database for PostGIS Raster tables";

void checkOpenFailure(const std::string& path, const std::string& message) {
    if (message.empty() || GDALUtils::isUnsupportedFormatMessage(message)) {
        return;
    }
    throw IntrospectionError("Failed to open " + path + ": " + message);
}

bool sameNodata(const std::optional<double>& a, const std::optional<double>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    if (std::isnan(*a) && std::isnan(*b)) {
        return true;
    }
    return *a == *b;
}

void writeAll(int fd, const std::string& payload) {
    size_t written = 0;
    while (written < payload.size()) {
        ssize_t n = write(fd, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        written += static_cast<size_t>(n);
    }
}

// Read until end of file; false if the deadline passes first
bool readUntilClosed(int fd, std::string& payload, std::chrono::steady_clock::time_point deadline) {
    char buffer[4096];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return true;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return true;
        }
        if (n == 0) {
            return true;
        }
        payload.append(buffer, static_cast<size_t>(n));
    }
}

int waitForWorker(pid_t pid) {
    int status = -1;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return status;
}

} // namespace

InspectorConfig InspectorConfig::fromEnvironment() {
    InspectorConfig config;
    const char* timeout = std::getenv("GEOCONVERT_INSPECT_TIMEOUT");
    if (timeout && timeout[0] != '\0') {
        try {
            int seconds = std::stoi(timeout);
            if (seconds > 0) {
                config.timeout = std::chrono::seconds(seconds);
            } else {
                std::cerr << "Warning: Ignoring non-positive GEOCONVERT_INSPECT_TIMEOUT=" << timeout << std::endl;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Warning: Ignoring invalid GEOCONVERT_INSPECT_TIMEOUT=" << timeout << std::endl;
        }
    }
    return config;
}

DatasetInspector::DatasetInspector(InspectorConfig config) : config_(config) {
    GDALUtils::registerDrivers();
}

OpenedDataset DatasetInspector::openDataset(const std::string& path, bool is_raster) {
    GDALUtils::registerDrivers();
    QuietErrors quiet;

    std::cout << "Opening the dataset: " << path << std::endl;

    // Attempt to open as raster
    CPLErrorReset();
    DatasetPtr raster(GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY | GDAL_OF_VERBOSE_ERROR,
                                 nullptr, nullptr, nullptr));
    std::string raster_error = raster ? "" : GDALUtils::lastErrorMessage("");
    if (raster_error.find(POSTGIS_RASTER_ERROR) != std::string::npos) {
        throw IntrospectionError(raster_error);
    }

    if (raster && is_raster) {
        std::cout << "The dataset: " << path << " opened as raster." << std::endl;
        return OpenedDataset{std::move(raster), true};
    }

    // Attempt to open as vector
    CPLErrorReset();
    DatasetPtr vector(GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY | GDAL_OF_VERBOSE_ERROR,
                                 nullptr, nullptr, nullptr));
    std::string vector_error = vector ? "" : GDALUtils::lastErrorMessage("");

    if (vector) {
        std::cout << "The dataset: " << path << " opened as vector." << std::endl;
        return OpenedDataset{std::move(vector), false};
    }
    if (raster) {
        std::cout << "The dataset: " << path << " opened as raster." << std::endl;
        return OpenedDataset{std::move(raster), true};
    }

    checkOpenFailure(path, raster_error);
    checkOpenFailure(path, vector_error);

    std::cout << "DEBUG: Unknown file format: " << path << std::endl;
    return OpenedDataset();
}

DatasetMetadata DatasetInspector::readMetadata(const std::string& path, bool is_raster) {
    DatasetMetadata metadata;

    OpenedDataset dataset = openDataset(path, is_raster);
    if (!dataset.handle) {
        std::cout << "DEBUG: Could not identify dataset " << path << std::endl;
        return metadata;
    }

    GDALDatasetH handle = dataset.handle.get();
    metadata.driver = std::string(GDALGetDriverShortName(GDALGetDatasetDriver(handle)));
    metadata.is_raster = dataset.is_raster;

    OGRSpatialReferenceH srs = nullptr;
    if (dataset.is_raster) {
        int band_count = GDALGetRasterCount(handle);
        if (band_count > 0) {
            std::optional<double> first;
            bool uniform = true;
            for (int i = 1; i <= band_count; ++i) {
                int has_nodata = FALSE;
                double value = GDALGetRasterNoDataValue(GDALGetRasterBand(handle, i), &has_nodata);
                std::optional<double> nodata = has_nodata ? std::optional<double>(value) : std::nullopt;
                if (i == 1) {
                    first = nodata;
                } else if (!sameNodata(first, nodata)) {
                    uniform = false;
                }
            }
            if (uniform) {
                metadata.nodata = first;
            }
            metadata.dim.width = GDALGetRasterXSize(handle);
            metadata.dim.height = GDALGetRasterYSize(handle);
            metadata.dim.band_count = band_count;
        }
        srs = GDALGetSpatialRef(handle);
    } else if (GDALDatasetGetLayerCount(handle) > 0) {
        srs = OGR_L_GetSpatialRef(GDALDatasetGetLayer(handle, 0));
    }

    std::cout << "DEBUG: Identified dataset " << path << " as " << *metadata.driver << std::endl;
    metadata.srs = identifyEPSG(srs);
    return metadata;
}

std::optional<int> DatasetInspector::identifyEPSG(OGRSpatialReferenceH srs) {
    if (!srs) {
        return std::nullopt;
    }

    // Identification modifies the reference, work on a copy
    SpatialReferencePtr copy(OSRClone(srs));
    if (!copy) {
        return std::nullopt;
    }
    OSRAutoIdentifyEPSG(copy.get());

    const char* code = OSRGetAuthorityCode(copy.get(), nullptr);
    if (!code) {
        if (CoordinateSystemUtils::isEPSG4326(copy.get())) {
            return 4326;
        }
        return std::nullopt;
    }

    char* end = nullptr;
    long value = std::strtol(code, &end, 10);
    if (end == code || *end != '\0') {
        std::cout << "File has an srs code that isn't an integer " << code << std::endl;
        return std::nullopt;
    }
    return static_cast<int>(value);
}

DatasetMetadata DatasetInspector::getMetadata(const std::string& path, bool is_raster) const {
    auto read_dataset = [this](const std::string& dataset, bool raster_hint) {
        return config_.reader ? config_.reader(dataset, raster_hint) : readMetadata(dataset, raster_hint);
    };
    if (!config_.isolate) {
        return read_dataset(path, is_raster);
    }

    // Buffered output would otherwise be written by both processes
    std::cout.flush();
    std::cerr.flush();

    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw IntrospectionError(std::string("Could not create pipe: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int fork_errno = errno;
        close(fds[0]);
        close(fds[1]);
        throw IntrospectionError(std::string("Fork failed: ") + std::strerror(fork_errno));
    }

    if (pid == 0) {
        close(fds[0]);
        nlohmann::json message;
        try {
            message["metadata"] = read_dataset(path, is_raster);
        } catch (const std::exception& e) {
            message["error"] = e.what();
        }
        writeAll(fds[1], message.dump());
        close(fds[1]);
        std::cout.flush();
        std::cerr.flush();
        _exit(0);
    }

    close(fds[1]);
    std::string payload;
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    bool finished = readUntilClosed(fds[0], payload, deadline);
    close(fds[0]);

    if (!finished) {
        kill(pid, SIGKILL);
        waitForWorker(pid);
        throw IntrospectionError("Introspection of " + path + " timed out after " +
                                 std::to_string(config_.timeout.count()) + " seconds");
    }

    int status = waitForWorker(pid);
    if (payload.empty()) {
        throw IntrospectionError("Introspection worker for " + path + " exited without a result (status " +
                                 std::to_string(status) + ")");
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw IntrospectionError("Introspection worker for " + path + " sent an unreadable result: " + e.what());
    }

    if (message.contains("error")) {
        throw IntrospectionError(message["error"].get<std::string>());
    }
    return message.at("metadata").get<DatasetMetadata>();
}

std::optional<BandStatistics> DatasetInspector::getBandStatistics(const std::string& path, int band) {
    GDALUtils::registerDrivers();

    CPLErrorReset();
    DatasetPtr dataset(GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
    if (!dataset) {
        std::cerr << "Error: Could not get statistics for " << path << ":" << band << ": "
                  << GDALUtils::lastErrorMessage("unable to open dataset") << std::endl;
        return std::nullopt;
    }

    if (band < 1 || band > GDALGetRasterCount(dataset.get())) {
        std::cerr << "Error: Could not get statistics for " << path << ":" << band
                  << ": band index out of range" << std::endl;
        return std::nullopt;
    }

    BandStatistics stats;
    GDALRasterBandH raster_band = GDALGetRasterBand(dataset.get(), band);
    if (GDALGetRasterStatistics(raster_band, FALSE, TRUE, &stats.min, &stats.max, &stats.mean, &stats.std_dev)
        != CE_None) {
        std::cerr << "Error: Could not get statistics for " << path << ":" << band << ": "
                  << GDALUtils::lastErrorMessage("statistics unavailable") << std::endl;
        return std::nullopt;
    }
    return stats;
}

} // namespace io
} // namespace geoconvert

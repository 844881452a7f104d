#ifndef GEOCONVERT_DATASET_INSPECTOR_HPP
#define GEOCONVERT_DATASET_INSPECTOR_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include "io/dataset_metadata.hpp"
#include "io/gdal_handles.hpp"

namespace geoconvert {
namespace io {

/**
 * Configuration for dataset introspection
 */
struct InspectorConfig {
    std::chrono::seconds timeout = std::chrono::seconds(300);  // Worker wait limit
    bool isolate = true;                                       // Run in a forked worker process

    // Reads one dataset, DatasetInspector::readMetadata when empty
    std::function<DatasetMetadata(const std::string&, bool)> reader;

    /**
     * Defaults, with the timeout overridden by GEOCONVERT_INSPECT_TIMEOUT (seconds) when set
     */
    static InspectorConfig fromEnvironment();
};

// Statistics of a single raster band
struct BandStatistics {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

// An opened dataset and the mode it was opened in
struct OpenedDataset {
    DatasetPtr handle;
    bool is_raster = false;
};

/**
 * Identifies datasets: driver, raster/vector, nodata uniformity, size and EPSG code
 */
class DatasetInspector {
public:
    explicit DatasetInspector(InspectorConfig config = InspectorConfig());

    /**
     * Introspect a dataset, in a separate worker process unless isolation is disabled
     * The worker sends back exactly one JSON message. Native handles opened by the worker
     * die with it, whatever state a failing driver left behind.
     * @param path Dataset path or connection string
     * @param is_raster Hint that the dataset is known to be a raster
     * @return Metadata (all fields empty when the format is not recognized)
     * @throws IntrospectionError if the worker fails, times out or sends no result
     */
    DatasetMetadata getMetadata(const std::string& path, bool is_raster) const;

    /**
     * Introspect a dataset in the calling process
     * @param path Dataset path or connection string
     * @param is_raster Hint that the dataset is known to be a raster
     * @return Metadata (all fields empty when the format is not recognized)
     * @throws IntrospectionError on open failures other than an unrecognized format
     */
    static DatasetMetadata readMetadata(const std::string& path, bool is_raster);

    /**
     * Open a dataset as raster or vector
     * Precedence: a raster confirmed by the hint wins; otherwise a vector open wins;
     * otherwise a raster open; otherwise nothing. The losing handle is closed.
     * @param path Dataset path
     * @param is_raster Hint that the dataset is known to be a raster
     * @return Opened dataset, with a null handle when the format is not recognized
     * @throws IntrospectionError on open failures other than an unrecognized format
     */
    static OpenedDataset openDataset(const std::string& path, bool is_raster);

    /**
     * Compute exact statistics of a raster band
     * @param path Raster path
     * @param band 1-based band index
     * @return Statistics, or nullopt (logged) if the band cannot be read
     */
    static std::optional<BandStatistics> getBandStatistics(const std::string& path, int band = 1);

    const InspectorConfig& config() const { return config_; }

private:
    static std::optional<int> identifyEPSG(OGRSpatialReferenceH srs);

    InspectorConfig config_;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_DATASET_INSPECTOR_HPP

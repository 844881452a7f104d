#ifndef GEOCONVERT_ENGINE_HPP
#define GEOCONVERT_ENGINE_HPP

#include <string>
#include <vector>
#include "io/dataset_metadata.hpp"
#include "io/gdal_utils.hpp"

namespace geoconvert {
namespace convert {

/**
 * One call into a GDAL utility program
 * Arguments use the command line spelling of the matching tool (gdalwarp, gdal_translate, ogr2ogr).
 */
struct EngineCall {
    std::string destination;
    std::vector<std::string> sources;
    std::vector<std::string> arguments;
    io::ConfigOptions config_options;   // Applied for the duration of this call only

    // Arguments joined by spaces, for logging
    std::string joinedArguments() const;
};

/**
 * The geospatial engine the converters drive
 */
class GeoEngine {
public:
    virtual ~GeoEngine() = default;

    /**
     * Introspect a dataset
     * @param path Dataset path
     * @param is_raster Hint that the dataset is known to be a raster
     */
    virtual io::DatasetMetadata readMetadata(const std::string& path, bool is_raster) = 0;

    // Warp/mosaic rasters (gdalwarp)
    virtual void warp(const EngineCall& call) = 0;

    // Transcode one raster (gdal_translate)
    virtual void translate(const EngineCall& call) = 0;

    // Translate, append or filter one vector dataset (ogr2ogr)
    virtual void vectorTranslate(const EngineCall& call) = 0;

    // Clean up near-black collar pixels of one raster (nearblack)
    virtual void nearblack(const EngineCall& call) = 0;

    /**
     * Draw polygons around connected pixel regions of one band
     * The band is used both as the source values and as the mask.
     * @param input Raster path
     * @param output Vector output path
     * @param output_type Vector driver name
     * @param band 1-based band index
     */
    virtual void polygonize(const std::string& input, const std::string& output,
                            const std::string& output_type, int band) = 0;

    /**
     * Copy every feature geometry of the inputs into one new layer
     * @param inputs Vector datasets read in order
     * @param output Output path
     * @param driver Output driver name
     * @throws MergeError if any step fails
     */
    virtual void mergeFeatures(const std::vector<std::string>& inputs, const std::string& output,
                               const std::string& driver) = 0;

    // Remove a file or in-memory dataset, ignoring a missing one
    virtual void removeDataset(const std::string& path) = 0;
};

/**
 * Intermediate datasets of one conversion step, removed on every exit path
 */
class ScratchDatasets {
public:
    explicit ScratchDatasets(GeoEngine& engine);
    ~ScratchDatasets();

    ScratchDatasets(const ScratchDatasets&) = delete;
    ScratchDatasets& operator=(const ScratchDatasets&) = delete;

    /**
     * Unique in-memory dataset path
     * @param suffix File extension, including the dot
     */
    std::string add(const std::string& suffix);

    /**
     * Path with the same file name inside a fresh directory next to a file
     * Layer names derived from the file name stay the same and large results stay on disk.
     * @param file File the intermediate stands in for
     * @return Path of the intermediate
     * @throws ConversionError if the directory cannot be created
     */
    std::string addBeside(const std::string& file);

private:
    GeoEngine& engine_;
    std::vector<std::string> paths_;
    std::vector<std::string> directories_;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_ENGINE_HPP

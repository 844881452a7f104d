#ifndef GEOCONVERT_CONVERTER_HPP
#define GEOCONVERT_CONVERTER_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "convert/conversion_request.hpp"
#include "convert/engine.hpp"
#include "convert/progress.hpp"
#include "convert/task_command.hpp"
#include "io/file_staging.hpp"

namespace geoconvert {
namespace convert {

/**
 * Top-level conversion entry point
 *
 * A call walks through these steps:
 *   1. resolve names: stage each input so the output never replaces the caller's file
 *   2. introspect: read metadata of every input, the first one decides
 *   3. resolve driver: explicit, inferred, or the GeoPackage baseline (Byte bands, alpha when no nodata)
 *   4. resolve boundary: file, box or geometry, materialized to a file and reprojected to the source SRS
 *   5. dispatch: build a raster or vector TaskCommand and run it inline or through the executor
 *   6. post-process: release temporary files, zip Shapefile/KML outputs
 */
class Converter {
public:
    /**
     * @param engine Engine used for introspection and conversion
     * @param progress Optional progress receiver (only used for requests with a task_uid)
     */
    explicit Converter(GeoEngine& engine, ProgressSink* progress = nullptr);

    /**
     * Convert, reproject and clip a dataset
     * Inputs staged by a failed call are reused when the same request is converted again, so a retry
     * never stages its own partial output over the caller's original.
     * @param request Conversion parameters
     * @param executor Optional executor; when empty the task runs before this call returns
     * @return Output path (the archive path for zipped formats)
     */
    std::string convert(const ConversionRequest& request, const Executor& executor = nullptr);

    /**
     * Mosaic several GeoTIFFs into one
     * @return Output path
     */
    std::string mergeGeotiffs(const std::vector<std::string>& inputs, const std::string& output,
                              const Executor& executor = nullptr);

    /**
     * Combine the features of several GeoJSON files
     * @return Output path
     * @throws MergeError if the merge fails
     */
    std::string mergeGeojson(const std::vector<std::string>& inputs, const std::string& output);

    /**
     * Polygonize a raster into a vector file (see RasterConverter::polygonize)
     */
    std::string polygonize(const std::string& input, const std::string& output,
                           const std::string& output_type = "GeoJSON",
                           std::optional<int> band = std::nullopt);

private:
    // Boundary after normalization to a file
    struct ResolvedBoundary {
        std::string file;
        std::optional<geometry::BoundingBox> bbox;
        std::vector<std::shared_ptr<io::TemporaryFile>> temporary_files;
    };

    std::string convertImpl(const ConversionRequest& request, const Executor& executor,
                            bool is_boundary_reprojection);

    // Staged names of an input, reused until a conversion succeeds
    io::DatasetNames stageNames(const std::string& input, const std::string& output);

    ResolvedBoundary resolveBoundary(const Boundary& boundary, const io::DatasetMetadata& metadata);

    void reportProgress(const ConversionRequest& request, double progress, const std::string& message) const;

    GeoEngine& engine_;
    ProgressSink* progress_;
    std::map<std::pair<std::string, std::string>, io::DatasetNames> staged_names_;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_CONVERTER_HPP

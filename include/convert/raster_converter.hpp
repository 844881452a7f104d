#ifndef GEOCONVERT_RASTER_CONVERTER_HPP
#define GEOCONVERT_RASTER_CONVERTER_HPP

#include <optional>
#include <string>
#include <vector>
#include "convert/conversion_request.hpp"
#include "convert/engine.hpp"

namespace geoconvert {
namespace convert {

/**
 * Turns a RasterJob into gdalwarp / gdal_translate calls
 */
class RasterConverter {
public:
    // Clipping is skipped unless the summed input width and height both exceed this many pixels
    static constexpr int MIN_CLIP_DIMENSION = 100;

    // Fixed GeoPackage raster table name; consumers cannot rename it later
    static constexpr const char* RASTER_TABLE_NAME = "imagery";

    explicit RasterConverter(GeoEngine& engine);

    /**
     * Run a raster conversion
     * Warps (or translates, with use_translate) every input into the output, clipping to the boundary
     * when the inputs are large enough. GeoTIFF outputs, or any job with translate_params, get a
     * second translate pass from a scratch file written next to the output, removed afterwards.
     * @param job Resolved raster parameters
     * @return Output path
     * @throws InputError for a missing driver, a boundary that is not a file or a multi-file translate
     * @throws ConversionError if the engine fails
     */
    std::string convert(const RasterJob& job) const;

    /**
     * Polygonize a raster band into a vector file
     * Without an explicit band, the band is picked from the band count (see selectPolygonizeBand);
     * a 3-band image first gets near-black cleanup and an alpha band through in-memory files.
     * @param input Raster path
     * @param output Vector output path
     * @param output_type Vector driver name
     * @param band 1-based band index, picked automatically when empty
     * @return Output path
     */
    std::string polygonize(const std::string& input, const std::string& output,
                           const std::string& output_type = "GeoJSON",
                           std::optional<int> band = std::nullopt) const;

    /**
     * Band used as value and mask when polygonizing
     * 4 bands -> 4 (alpha), 3 bands -> 4 (alpha added first), 2 bands -> 2, otherwise 1
     */
    static int selectPolygonizeBand(int raster_count);

    /**
     * Format and creation option arguments (-of, -co) shared by both passes
     */
    static std::vector<std::string> buildOutputArguments(const RasterJob& job);

    /**
     * Derived gdalwarp arguments (-ot, -dstalpha, -s_srs, -t_srs), or the caller's warp_params
     */
    static std::vector<std::string> buildWarpArguments(const RasterJob& job);

private:
    GeoEngine& engine_;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_RASTER_CONVERTER_HPP

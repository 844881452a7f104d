#ifndef GEOCONVERT_JSON_INTERFACE_HPP
#define GEOCONVERT_JSON_INTERFACE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "convert/conversion_request.hpp"

namespace geoconvert {
namespace api {

/**
 * Fill a ConversionRequest from a JSON object
 * @param request_json Object using the request keys (input_files, output_file, driver, boundary, ...)
 * @return Parsed request, unset keys keep their defaults
 * @throws InputError if a key has the wrong type or value
 */
convert::ConversionRequest parseConversionRequest(const nlohmann::json& request_json);

/**
 * Conversion Tool
 * Converts, reprojects and clips one dataset with the GDAL engine
 * @param request_json JSON string for the conversion request
 * @return "Success: <output path>" or "Error: <message>"
 */
std::string processConversionTool(const std::string& request_json);

/**
 * Merge Tool
 * Mosaics GeoTIFFs or combines GeoJSON features
 * @param merge_json JSON string with input_files, output_file and type ("geotiff" or "geojson")
 * @return "Success: <output path>" or "Error: <message>"
 */
std::string processMergeTool(const std::string& merge_json);

/**
 * Polygonize Tool
 * Draws polygons around connected pixel regions of a raster
 * @param polygonize_json JSON string with input_file, output_file, optional output_type and band
 * @return "Success: <output path>" or "Error: <message>"
 */
std::string processPolygonizeTool(const std::string& polygonize_json);

} // namespace api
} // namespace geoconvert

#endif // GEOCONVERT_JSON_INTERFACE_HPP

#include "api/json_interface.hpp"
#include "convert/converter.hpp"
#include "convert/gdal_engine.hpp"
#include "convert/progress.hpp"
#include "convert/retry.hpp"
#include "io/geojson_reader.hpp"
#include "errors.hpp"
#include <iostream>
#include <optional>
#include <vector>

namespace geoconvert {
namespace api {

namespace {

// Accepts a single string or an array of strings
std::vector<std::string> parseStringList(const nlohmann::json& value, const std::string& key) {
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw InputError("'" + key + "' must be a string or an array of strings");
    }
    std::vector<std::string> result;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw InputError("'" + key + "' must only contain strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::optional<std::string> parseOptionalString(const nlohmann::json& config_json, const std::string& key) {
    if (!config_json.contains(key) || config_json[key].is_null()) {
        return std::nullopt;
    }
    if (!config_json[key].is_string()) {
        throw InputError("'" + key + "' must be a string");
    }
    return config_json[key].get<std::string>();
}

std::optional<int> parseOptionalEpsg(const nlohmann::json& config_json, const std::string& key) {
    if (!config_json.contains(key) || config_json[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = config_json[key];
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    // Also accept "4326" and "EPSG:4326"
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text.rfind("EPSG:", 0) == 0) {
            text = text.substr(5);
        }
        try {
            size_t parsed = 0;
            int code = std::stoi(text, &parsed);
            if (parsed == text.size()) {
                return code;
            }
        } catch (const std::logic_error&) {
            // Reported below
        }
    }
    throw InputError("'" + key + "' must be an EPSG code");
}

convert::Boundary parseBoundary(const nlohmann::json& value) {
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        // GeoJSON text rather than a path
        if (!text.empty() && text.front() == '{') {
            nlohmann::json geojson;
            try {
                geojson = nlohmann::json::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                throw InputError("Boundary is not valid GeoJSON: " + std::string(e.what()));
            }
            return parseBoundary(geojson);
        }
        return convert::BoundaryPath{text};
    }
    if (value.is_array()) {
        if (value.size() != 4) {
            throw InputError("A boundary bbox must be [west, south, east, north]");
        }
        for (const auto& coordinate : value) {
            if (!coordinate.is_number()) {
                throw InputError("A boundary bbox must only contain numbers");
            }
        }
        return geometry::BoundingBox{value[0].get<double>(), value[1].get<double>(),
                                     value[2].get<double>(), value[3].get<double>()};
    }
    if (value.is_object()) {
        std::string crs = io::GeoJSONReader::parseCRS(value);
        if (!crs.empty() && crs != "EPSG:4326" && crs != "urn:ogc:def:crs:OGC:1.3:CRS84") {
            throw InputError("Boundary geometries must use EPSG:4326, got " + crs);
        }
        return io::GeoJSONReader::readGeometry(value);
    }
    throw InputError("'boundary' must be a path, a bbox or a GeoJSON geometry");
}

io::ConfigOptions parseConfigOptions(const nlohmann::json& value) {
    io::ConfigOptions options;
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it.value().is_string()) {
                throw InputError("Config option " + it.key() + " must have a string value");
            }
            options.emplace_back(it.key(), it.value().get<std::string>());
        }
        return options;
    }
    if (value.is_array()) {
        for (const auto& pair : value) {
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_string()) {
                throw InputError("'config_options' entries must be [name, value] pairs");
            }
            options.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
        }
        return options;
    }
    throw InputError("'config_options' must be an object or an array of pairs");
}

convert::AccessMode parseAccessMode(const nlohmann::json& value) {
    std::string mode = value.is_string() ? value.get<std::string>() : "";
    if (mode == "overwrite") {
        return convert::AccessMode::Overwrite;
    }
    if (mode == "append") {
        return convert::AccessMode::Append;
    }
    throw InputError("'access_mode' must be 'overwrite' or 'append'");
}

bool parseFlag(const nlohmann::json& config_json, const std::string& key, bool fallback) {
    if (!config_json.contains(key) || config_json[key].is_null()) {
        return fallback;
    }
    if (!config_json[key].is_boolean()) {
        throw InputError("'" + key + "' must be true or false");
    }
    return config_json[key].get<bool>();
}

} // namespace

convert::ConversionRequest parseConversionRequest(const nlohmann::json& request_json) {
    if (!request_json.is_object()) {
        throw InputError("A conversion request must be a JSON object");
    }

    convert::ConversionRequest request;

    if (request_json.contains("input_files")) {
        request.input_files = parseStringList(request_json["input_files"], "input_files");
    }
    request.output_file = parseOptionalString(request_json, "output_file").value_or("");
    request.driver = parseOptionalString(request_json, "driver");
    if (request_json.contains("boundary") && !request_json["boundary"].is_null()) {
        request.boundary = parseBoundary(request_json["boundary"]);
    }
    request.src_srs = parseOptionalEpsg(request_json, "src_srs");
    request.dst_srs = parseOptionalEpsg(request_json, "dst_srs");
    request.is_raster = parseFlag(request_json, "is_raster", request.is_raster);

    if (request_json.contains("creation_options")) {
        request.creation_options = parseStringList(request_json["creation_options"], "creation_options");
    }
    if (request_json.contains("warp_params")) {
        request.warp_params = parseStringList(request_json["warp_params"], "warp_params");
    }
    if (request_json.contains("translate_params")) {
        request.translate_params = parseStringList(request_json["translate_params"], "translate_params");
    }
    request.use_translate = parseFlag(request_json, "use_translate", request.use_translate);

    if (request_json.contains("layers")) {
        request.layers = parseStringList(request_json["layers"], "layers");
    }
    request.layer_name = parseOptionalString(request_json, "layer_name");
    if (request_json.contains("dataset_creation_options")) {
        request.dataset_creation_options =
            parseStringList(request_json["dataset_creation_options"], "dataset_creation_options");
    }
    if (request_json.contains("layer_creation_options")) {
        request.layer_creation_options =
            parseStringList(request_json["layer_creation_options"], "layer_creation_options");
    }
    if (request_json.contains("access_mode")) {
        request.access_mode = parseAccessMode(request_json["access_mode"]);
    }
    request.skip_failures = parseFlag(request_json, "skip_failures", request.skip_failures);
    request.distinct_field = parseOptionalString(request_json, "distinct_field");

    if (request_json.contains("config_options")) {
        request.config_options = parseConfigOptions(request_json["config_options"]);
    }
    request.task_uid = parseOptionalString(request_json, "task_uid");

    return request;
}

// Conversion Tool
std::string processConversionTool(const std::string& request_json) {
    try {
        convert::ConversionRequest request = parseConversionRequest(nlohmann::json::parse(request_json));

        convert::GdalEngine engine;
        convert::ConsoleProgressSink progress;
        convert::Converter converter(engine, &progress);

        std::string output = convert::retry(convert::RetryPolicy::fromEnvironment(), "convert",
                                            [&]() { return converter.convert(request); });
        return "Success: " + output;

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Merge Tool
std::string processMergeTool(const std::string& merge_json) {
    try {
        nlohmann::json config = nlohmann::json::parse(merge_json);
        if (!config.is_object() || !config.contains("input_files")) {
            return "Error: 'input_files' is required";
        }
        std::vector<std::string> inputs = parseStringList(config["input_files"], "input_files");
        std::string output = parseOptionalString(config, "output_file").value_or("");
        if (output.empty()) {
            return "Error: 'output_file' is required";
        }
        std::string type = parseOptionalString(config, "type").value_or("geotiff");

        convert::GdalEngine engine;
        convert::Converter converter(engine);

        if (type == "geojson") {
            return "Success: " + converter.mergeGeojson(inputs, output);
        }
        if (type == "geotiff") {
            return "Success: " + converter.mergeGeotiffs(inputs, output);
        }
        return "Error: Unknown merge type " + type;

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Polygonize Tool
std::string processPolygonizeTool(const std::string& polygonize_json) {
    try {
        nlohmann::json config = nlohmann::json::parse(polygonize_json);
        std::string input = parseOptionalString(config, "input_file").value_or("");
        std::string output = parseOptionalString(config, "output_file").value_or("");
        if (input.empty() || output.empty()) {
            return "Error: 'input_file' and 'output_file' are required";
        }
        std::string output_type = parseOptionalString(config, "output_type").value_or("GeoJSON");
        std::optional<int> band;
        if (config.contains("band") && config["band"].is_number_integer()) {
            band = config["band"].get<int>();
        }

        convert::GdalEngine engine;
        convert::Converter converter(engine);
        return "Success: " + converter.polygonize(input, output, output_type, band);

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace api
} // namespace geoconvert

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "api/json_interface.hpp"
#include "io/gdal_utils.hpp"

using namespace geoconvert;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --input <paths> [--mode <mode>] [options]\n"
              << "       " << programName << " --request-file <path>\n"
              << "\nRequired arguments:\n"
              << "  --input <paths>              Comma-separated input datasets\n"
              << "\nOptional arguments:\n"
              << "  --mode <mode>                Operation mode: 'convert' (default), 'merge', or 'polygonize'\n"
              << "  --output <path>              Output path (defaults to the input, which is then kept as old_<name>)\n"
              << "  --driver <name>              GDAL driver short name (defaults to the input format, then gpkg)\n"
              << "  --boundary <path|w,s,e,n>    Vector file or EPSG:4326 bbox to clip to\n"
              << "  --src-srs <code>             EPSG code of the input\n"
              << "  --dst-srs <code>             EPSG code of the output (default: 4326)\n"
              << "  --request-file <path>        JSON file holding a full conversion request\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "geoconvert - Geospatial Dataset Conversion Tool\n"
              << "===============================================\n\n"
              << "geoconvert converts, reprojects and clips raster and vector datasets with GDAL.\n\n"
              << "MODES:\n\n"
              << "1. CONVERT MODE (--mode convert)\n"
              << "   Converts one raster or vector dataset, or mosaics/appends several, optionally clipped to a boundary.\n"
              << "   Shapefile and KML outputs are returned as .zip/.kmz archives.\n\n"
              << "   Required Arguments:\n"
              << "     --input <paths>             Comma-separated input datasets\n\n"
              << "   Optional Arguments:\n"
              << "     --output <path>             Output path\n"
              << "     --driver <name>             GDAL driver short name\n"
              << "     --boundary <path|w,s,e,n>   Boundary vector file or bbox\n"
              << "     --src-srs <code>            EPSG code of the input\n"
              << "     --dst-srs <code>            EPSG code of the output (default: 4326)\n"
              << "     --vector                    Treat the input as vector data in mixed containers (e.g. gpkg)\n"
              << "     --creation-options <list>   Comma-separated raster creation options (e.g. COMPRESS=LZW)\n"
              << "     --use-translate             Use gdal_translate instead of gdalwarp (single input only)\n"
              << "     --layers <list>             Comma-separated vector layers to convert\n"
              << "     --layer-name <name>         Name of the output layer\n"
              << "     --access-mode <mode>        'overwrite' (default) or 'append'\n"
              << "     --distinct-field <name>     Keep one feature per value of this field\n"
              << "     --skip-failures             Skip features that fail to convert\n"
              << "     --task-uid <id>             Report progress for this task id\n\n"
              << "   Example:\n"
              << "     " << programName << " --input dem.tif --output dem.gpkg --driver gpkg --boundary -72.5,42.1,-72.3,42.3\n\n"
              << "2. MERGE MODE (--mode merge)\n"
              << "   Mosaics GeoTIFFs (--type geotiff, default) or combines GeoJSON features (--type geojson).\n\n"
              << "   Required Arguments:\n"
              << "     --input <paths>             Comma-separated input files\n"
              << "     --output <path>             Output file\n\n"
              << "   Example:\n"
              << "     " << programName << " --mode merge --type geojson --input a.geojson,b.geojson --output merged.geojson\n\n"
              << "3. POLYGONIZE MODE (--mode polygonize)\n"
              << "   Draws polygons around connected pixel regions of a raster band.\n\n"
              << "   Required Arguments:\n"
              << "     --input <path>              Raster file\n"
              << "     --output <path>             Vector output file\n\n"
              << "   Optional Arguments:\n"
              << "     --output-type <driver>      Vector driver (default: GeoJSON)\n"
              << "     --band <index>              Band to polygonize (chosen from the band count if not specified)\n\n"
              << "ENVIRONMENT:\n"
              << "  GEOCONVERT_TESTING           Disable retry back-off sleeps\n"
              << "  GEOCONVERT_INSPECT_TIMEOUT   Seconds before dataset introspection is abandoned (default: 300)\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Values may start with a single dash (negative coordinates), options never do
            if (i + 1 < argc && std::string(argv[i + 1]).substr(0, 2) != "--") {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                // This is a flag argument - set it to "true"
                args[key] = "true";
            }
        } else if (arg == "-h") {
            args["help"] = "true";
        } else if (arg == "-v") {
            args["version"] = "true";
        }
    }

    return args;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// "w,s,e,n" becomes a bbox array, anything else is a boundary file path
nlohmann::json parseBoundaryArg(const std::string& value) {
    std::vector<std::string> parts = splitList(value);
    if (parts.size() == 4) {
        nlohmann::json bbox = nlohmann::json::array();
        try {
            for (const auto& part : parts) {
                size_t parsed = 0;
                double coordinate = std::stod(part, &parsed);
                if (parsed != part.size()) {
                    return value;
                }
                bbox.push_back(coordinate);
            }
            return bbox;
        } catch (const std::logic_error&) {
            return value;
        }
    }
    return value;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0) {
            std::cout << "geoconvert v1.0.0\n";
            std::cout << "Geospatial Dataset Conversion Tool\n";
            return 0;
        }

        std::string result;

        if (args.count("request-file")) {
            std::ifstream file(args.at("request-file"));
            if (!file.is_open()) {
                std::cerr << "Error: Failed to open request file " << args.at("request-file") << std::endl;
                return 1;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            result = api::processConversionTool(buffer.str());
            std::cout << result << std::endl;
            return result.substr(0, 5) == "Error" ? 1 : 0;
        }

        if (args.count("input") == 0) {
            std::cerr << "Error: --input is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string mode = args.count("mode") ? args.at("mode") : "convert";
        std::vector<std::string> inputs = splitList(args.at("input"));

        if (mode == "convert") {
            nlohmann::json request = nlohmann::json::object();
            request["input_files"] = inputs;
            if (args.count("output")) request["output_file"] = args.at("output");
            if (args.count("driver")) {
                if (!io::GDALUtils::isDriverAvailable(args.at("driver"))) {
                    std::cerr << "Error: Cannot write with driver '" << args.at("driver") << "'" << std::endl;
                    return 1;
                }
                request["driver"] = args.at("driver");
            }
            if (args.count("boundary")) request["boundary"] = parseBoundaryArg(args.at("boundary"));
            if (args.count("src-srs")) request["src_srs"] = std::stoi(args.at("src-srs"));
            if (args.count("dst-srs")) request["dst_srs"] = std::stoi(args.at("dst-srs"));
            if (args.count("vector")) request["is_raster"] = false;
            if (args.count("creation-options")) request["creation_options"] = splitList(args.at("creation-options"));
            if (args.count("use-translate")) request["use_translate"] = true;
            if (args.count("layers")) request["layers"] = splitList(args.at("layers"));
            if (args.count("layer-name")) request["layer_name"] = args.at("layer-name");
            if (args.count("access-mode")) request["access_mode"] = args.at("access-mode");
            if (args.count("distinct-field")) request["distinct_field"] = args.at("distinct-field");
            if (args.count("skip-failures")) request["skip_failures"] = true;
            if (args.count("task-uid")) request["task_uid"] = args.at("task-uid");

            result = api::processConversionTool(request.dump());
        } else if (mode == "merge") {
            if (args.count("output") == 0) {
                std::cerr << "Error: --output is required for merge mode" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            nlohmann::json merge_config = nlohmann::json::object();
            merge_config["input_files"] = inputs;
            merge_config["output_file"] = args.at("output");
            if (args.count("type")) merge_config["type"] = args.at("type");

            result = api::processMergeTool(merge_config.dump());
        } else if (mode == "polygonize") {
            if (args.count("output") == 0 || inputs.size() != 1) {
                std::cerr << "Error: polygonize mode takes one --input and an --output" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            nlohmann::json polygonize_config = nlohmann::json::object();
            polygonize_config["input_file"] = inputs.front();
            polygonize_config["output_file"] = args.at("output");
            if (args.count("output-type")) polygonize_config["output_type"] = args.at("output-type");
            if (args.count("band")) polygonize_config["band"] = std::stoi(args.at("band"));

            result = api::processPolygonizeTool(polygonize_config.dump());
        } else {
            std::cerr << "Error: Unknown mode '" << mode << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

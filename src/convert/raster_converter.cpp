#include "convert/raster_converter.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <iostream>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace geoconvert {
namespace convert {

namespace {

void append(std::vector<std::string>& target, const std::vector<std::string>& values) {
    target.insert(target.end(), values.begin(), values.end());
}

} // namespace

RasterConverter::RasterConverter(GeoEngine& engine) : engine_(engine) {}

std::vector<std::string> RasterConverter::buildOutputArguments(const RasterJob& job) {
    std::vector<std::string> arguments = {"-of", job.driver};
    for (const auto& option : job.creation_options) {
        arguments.push_back("-co");
        arguments.push_back(option);
    }

    // Keep the name imagery which is used when seeding the geopackages
    if (io::GDALUtils::isDriver(job.driver, "gpkg")) {
        arguments.push_back("-co");
        arguments.push_back(std::string("RASTER_TABLE=") + RASTER_TABLE_NAME);
    }
    return arguments;
}

std::vector<std::string> RasterConverter::buildWarpArguments(const RasterJob& job) {
    if (job.warp_params) {
        return *job.warp_params;
    }

    std::vector<std::string> arguments;
    if (job.band_type) {
        append(arguments, {"-ot", *job.band_type});
    }
    if (job.dst_alpha) {
        arguments.push_back("-dstalpha");
    }
    if (job.src_srs) {
        append(arguments, {"-s_srs", *job.src_srs});
    }
    if (job.dst_srs) {
        append(arguments, {"-t_srs", *job.dst_srs});
    }
    return arguments;
}

std::string RasterConverter::convert(const RasterJob& job) const {
    if (job.driver.empty()) {
        throw InputError("Cannot convert a raster without specifying a GDAL driver.");
    }
    if (job.input_files.empty()) {
        throw InputError("No input files specified");
    }
    boost::system::error_code ec;
    if (job.boundary && !fs::is_regular_file(*job.boundary, ec)) {
        throw InputError("The boundary param must be the path to a vector file.");
    }
    if (job.use_translate && job.input_files.size() != 1) {
        throw InputError("Cannot use_translate with a list of files.");
    }

    const std::vector<std::string> output_arguments = buildOutputArguments(job);
    std::vector<std::string> warp_arguments = buildWarpArguments(job);

    if (job.boundary) {
        // Clipping very small rasters fails in the engine (0x1 pixel outputs)
        int width = 0;
        int height = 0;
        for (const auto& input : job.input_files) {
            io::DatasetMetadata metadata = engine_.readMetadata(input, true);
            width += metadata.dim.width;
            height += metadata.dim.height;
        }
        if (width > MIN_CLIP_DIMENSION && height > MIN_CLIP_DIMENSION) {
            append(warp_arguments, {"-cutline", *job.boundary, "-crop_to_cutline"});
        } else {
            std::cout << "Skipping clip of " << width << "x" << height << " px input to " << *job.boundary << std::endl;
        }
    }

    // No need to compress in memory objects as they will be removed later
    const bool second_pass = (io::GDALUtils::isDriver(job.driver, "gtiff") || job.translate_params) &&
                             job.output_file.find("vsimem") == std::string::npos;

    // The first result goes to a scratch sibling, never to a backup name an input may be using
    ScratchDatasets scratch(engine_);
    EngineCall call;
    call.destination = second_pass ? scratch.addBeside(job.output_file) : job.output_file;
    call.sources = job.input_files;
    call.arguments = output_arguments;
    call.config_options = job.config_options;

    if (job.use_translate) {
        if (job.translate_params) {
            append(call.arguments, *job.translate_params);
        }
        engine_.translate(call);
    } else {
        append(call.arguments, warp_arguments);
        engine_.warp(call);
    }

    if (!second_pass) {
        return job.output_file;
    }

    EngineCall compress_call;
    compress_call.destination = job.output_file;
    compress_call.sources = {call.destination};
    compress_call.config_options = job.config_options;
    if (job.translate_params) {
        compress_call.arguments = output_arguments;
        append(compress_call.arguments, *job.translate_params);
    } else {
        compress_call.arguments = {"-of", job.driver,
                                   "-co", "COMPRESS=LZW", "-co", "TILED=YES", "-co", "BIGTIFF=YES"};
    }
    engine_.translate(compress_call);
    return job.output_file;
}

int RasterConverter::selectPolygonizeBand(int raster_count) {
    switch (raster_count) {
        case 4:
        case 3:
            return 4;
        case 2:
            return 2;
        default:
            return 1;
    }
}

std::string RasterConverter::polygonize(const std::string& input, const std::string& output,
                                        const std::string& output_type, std::optional<int> band) const {
    ScratchDatasets scratch(engine_);
    std::string source = input;
    int band_index = band.value_or(0);

    if (!band) {
        io::DatasetMetadata metadata = engine_.readMetadata(input, true);
        if (!metadata.identified()) {
            throw ConversionError("Failed to open the file " + input);
        }
        const int raster_count = metadata.dim.band_count;

        if (raster_count == 3) {
            // Likely RGB: clean up interleaving noise, then use black as transparency
            std::string nearblack_file = scratch.add(".tif");
            EngineCall nearblack_call;
            nearblack_call.destination = nearblack_file;
            nearblack_call.sources = {input};
            nearblack_call.arguments = {"-of", "GTiff"};
            engine_.nearblack(nearblack_call);

            RasterJob alpha_job;
            alpha_job.input_files = {nearblack_file};
            alpha_job.output_file = scratch.add(".tif");
            alpha_job.driver = "gtiff";
            alpha_job.warp_params = std::vector<std::string>{"-dstalpha", "-srcnodata", "0 0 0"};
            source = convert(alpha_job);
        }
        band_index = selectPolygonizeBand(raster_count);
    }

    engine_.polygonize(source, output, output_type, band_index);
    return output;
}

} // namespace convert
} // namespace geoconvert

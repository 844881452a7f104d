#include "convert/converter.hpp"
#include "convert/raster_converter.hpp"
#include "convert/vector_converter.hpp"
#include "geometry/geometry_conversion.hpp"
#include "geometry/geometry_utils.hpp"
#include "io/geojson_writer.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace geoconvert {
namespace convert {

namespace {

constexpr int WGS84_EPSG = 4326;

std::string epsgName(int code) {
    return "EPSG:" + std::to_string(code);
}

void runTask(const TaskCommand& task, const Executor& executor) {
    std::cout << "Dispatching " << task.describe() << std::endl;
    if (executor) {
        executor(task);
    } else {
        task();
    }
}

} // namespace

Converter::Converter(GeoEngine& engine, ProgressSink* progress) : engine_(engine), progress_(progress) {}

std::string Converter::convert(const ConversionRequest& request, const Executor& executor) {
    reportProgress(request, 0.0, "Starting conversion");
    std::string output = convertImpl(request, executor, false);
    staged_names_.clear();
    reportProgress(request, 100.0, "Converted " + output);
    return output;
}

io::DatasetNames Converter::stageNames(const std::string& input, const std::string& output) {
    auto key = std::make_pair(input, output);
    auto it = staged_names_.find(key);
    if (it != staged_names_.end()) {
        std::cout << "Reusing staged input " << it->second.input << std::endl;
        return it->second;
    }
    io::DatasetNames names = io::FileStaging::getDatasetNames(input, output);
    staged_names_.emplace(key, names);
    return names;
}

std::string Converter::convertImpl(const ConversionRequest& request, const Executor& executor,
                                   bool is_boundary_reprojection) {
    if (is_boundary_reprojection && request.boundary) {
        throw std::logic_error("A boundary reprojection cannot itself be clipped to a boundary");
    }
    if (request.input_files.empty()) {
        throw InputError("No input files specified");
    }

    // Resolve names, the output defaults to the first input
    std::vector<std::string> input_files;
    std::vector<io::DatasetMetadata> metadata_list;
    std::string output_file = request.output_file;
    for (const auto& file : request.input_files) {
        io::DatasetNames names = stageNames(file, output_file);
        output_file = names.output;
        input_files.push_back(names.input);
        metadata_list.push_back(engine_.readMetadata(names.input, request.is_raster));
    }

    // Inputs are expected to share a driver, so the first metadata decides
    const io::DatasetMetadata& metadata = metadata_list.front();
    const bool is_raster = metadata.is_raster.value_or(false);

    std::string driver;
    if (request.driver && !request.driver->empty()) {
        driver = *request.driver;
    } else {
        driver = metadata.driver.value_or(io::GDALUtils::BASELINE_DRIVER);
    }

    // GeoPackage rasters only hold Byte bands, transparency stands in for a missing nodata value
    std::optional<std::string> band_type;
    bool dst_alpha = false;
    if (io::GDALUtils::isDriver(driver, io::GDALUtils::BASELINE_DRIVER)) {
        band_type = "Byte";
        dst_alpha = is_raster && !metadata.nodata;
    }

    std::optional<std::string> src_srs;
    if (request.src_srs) {
        src_srs = epsgName(*request.src_srs);
    }
    const std::string dst_srs = epsgName(request.dst_srs.value_or(WGS84_EPSG));

    ResolvedBoundary boundary;
    if (request.boundary) {
        boundary = resolveBoundary(*request.boundary, metadata);
    }

    std::optional<TaskCommand> task;
    if (is_raster) {
        RasterJob job;
        job.input_files = input_files;
        job.output_file = output_file;
        job.driver = driver;
        job.creation_options = request.creation_options;
        job.band_type = band_type;
        job.dst_alpha = dst_alpha;
        if (!boundary.file.empty()) {
            job.boundary = boundary.file;
        }
        job.src_srs = src_srs;
        job.dst_srs = dst_srs;
        job.warp_params = request.warp_params;
        job.translate_params = request.translate_params;
        job.use_translate = request.use_translate;
        job.config_options = request.config_options;
        task.emplace(std::move(job), engine_, boundary.temporary_files);
    } else {
        VectorJob job;
        job.input_files = input_files;
        job.output_file = output_file;
        job.driver = driver;
        job.dataset_creation_options = request.dataset_creation_options;
        job.layer_creation_options = request.layer_creation_options;
        job.src_srs = src_srs;
        job.dst_srs = dst_srs;
        job.layers = request.layers;
        job.layer_name = request.layer_name;
        if (!boundary.file.empty()) {
            job.clip_source = {boundary.file};
        }
        job.spatial_filter = boundary.bbox;
        job.access_mode = request.access_mode;
        job.config_options = request.config_options;
        job.distinct_field = request.distinct_field;
        job.skip_failures = request.skip_failures;
        task.emplace(std::move(job), engine_, boundary.temporary_files);
    }

    runTask(*task, executor);

    // The task keeps its own hold on the boundary files
    boundary.temporary_files.clear();
    task.reset();

    if (io::FileStaging::requiresZip(driver)) {
        std::cout << "DEBUG: Requires zip: " << output_file << std::endl;
        output_file = io::FileStaging::createZipFile(output_file, io::FileStaging::getZipName(output_file));
    }
    return output_file;
}

Converter::ResolvedBoundary Converter::resolveBoundary(const Boundary& boundary,
                                                       const io::DatasetMetadata& metadata) {
    ResolvedBoundary resolved;
    std::optional<nlohmann::json> geometry;

    if (const auto* path = std::get_if<BoundaryPath>(&boundary)) {
        boost::system::error_code ec;
        if (!fs::is_regular_file(path->path, ec)) {
            throw InputError("Called convert using a boundary of " + path->path + " but no such path exists.");
        }
        resolved.file = path->path;
    } else if (const auto* bbox = std::get_if<geometry::BoundingBox>(&boundary)) {
        if (!geometry::GeometryUtils::isValidBbox(*bbox)) {
            throw InputError("Invalid boundary bbox [" + std::to_string(bbox->west) + ", " +
                             std::to_string(bbox->south) + ", " + std::to_string(bbox->east) + ", " +
                             std::to_string(bbox->north) + "]");
        }
        geometry = geometry::bboxToGeoJSON(*bbox);
        resolved.bbox = *bbox;
    } else {
        const auto& object = std::get<nlohmann::json>(boundary);
        // Anything that is not a Polygon or MultiPolygon is rejected here
        geometry = geometry::multiPolygonToGeoJSON(geometry::geoJSONToMultiPolygon(object));
    }

    if (geometry) {
        auto temporary = std::make_shared<io::TemporaryFile>(io::TemporaryFile::uniquePath(".geojson"));
        io::GeoJSONWriter::writeGeometryToFile(*geometry, temporary->path(), epsgName(WGS84_EPSG));
        resolved.file = temporary->path();
        resolved.temporary_files.push_back(temporary);
    }

    if (!metadata.srs) {
        std::cerr << "Warning: Unknown source reference system, using boundary " << resolved.file
                  << " without reprojection" << std::endl;
        return resolved;
    }
    if (*metadata.srs == WGS84_EPSG) {
        return resolved;
    }

    // Bring the boundary into the source reference system so the cutline lines up
    fs::path boundary_path(resolved.file);
    std::string aoi_file = (boundary_path.parent_path() / (boundary_path.stem().string() + "-aoi.gpkg")).string();

    ConversionRequest reprojection;
    reprojection.input_files = {resolved.file};
    reprojection.output_file = aoi_file;
    reprojection.driver = io::GDALUtils::BASELINE_DRIVER;
    reprojection.dst_srs = *metadata.srs;
    reprojection.is_raster = false;

    auto aoi = std::make_shared<io::TemporaryFile>(aoi_file);
    resolved.file = convertImpl(reprojection, nullptr, true);
    resolved.temporary_files.push_back(aoi);
    return resolved;
}

std::string Converter::mergeGeotiffs(const std::vector<std::string>& inputs, const std::string& output,
                                     const Executor& executor) {
    RasterJob job;
    job.input_files = inputs;
    job.output_file = output;
    job.driver = "gtiff";
    runTask(TaskCommand(std::move(job), engine_), executor);
    return output;
}

std::string Converter::mergeGeojson(const std::vector<std::string>& inputs, const std::string& output) {
    return VectorConverter(engine_).mergeGeojson(inputs, output);
}

std::string Converter::polygonize(const std::string& input, const std::string& output,
                                  const std::string& output_type, std::optional<int> band) {
    return RasterConverter(engine_).polygonize(input, output, output_type, band);
}

void Converter::reportProgress(const ConversionRequest& request, double progress,
                               const std::string& message) const {
    if (!progress_ || !request.task_uid) {
        return;
    }
    progress_->updateProgress(*request.task_uid, computeAbsoluteProgress(progress), std::nullopt, message);
}

} // namespace convert
} // namespace geoconvert

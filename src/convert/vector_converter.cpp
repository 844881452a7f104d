#include "convert/vector_converter.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <boost/filesystem.hpp>

namespace geoconvert {
namespace convert {

VectorConverter::VectorConverter(GeoEngine& engine) : engine_(engine) {}

std::string VectorConverter::formatCoordinate(double value) {
    for (int precision : {15, 17}) {
        std::ostringstream text;
        text << std::setprecision(precision) << value;
        if (precision == 17 || std::stod(text.str()) == value) {
            return text.str();
        }
    }
    return std::to_string(value);
}

std::vector<std::string> VectorConverter::buildArguments(const VectorJob& job, AccessMode mode) {
    std::vector<std::string> arguments = {"-f", job.driver};

    for (const auto& option : job.dataset_creation_options) {
        arguments.push_back("-dsco");
        arguments.push_back(option);
    }
    for (const auto& option : job.layer_creation_options) {
        arguments.push_back("-lco");
        arguments.push_back(option);
    }
    if (job.layer_name) {
        arguments.push_back("-nln");
        arguments.push_back(*job.layer_name);
    }

    if (job.src_srs) {
        arguments.push_back("-s_srs");
        arguments.push_back(*job.src_srs);
    }
    if (job.dst_srs) {
        // Reproject only when the reference systems differ, otherwise just assign
        arguments.push_back(job.src_srs != job.dst_srs ? "-t_srs" : "-a_srs");
        arguments.push_back(*job.dst_srs);
    }

    arguments.push_back(mode == AccessMode::Append ? "-append" : "-overwrite");

    if (job.skip_failures) {
        arguments.push_back("-skipfailures");
    }

    if (job.spatial_filter) {
        const auto& bbox = *job.spatial_filter;
        arguments.push_back("-spat");
        arguments.push_back(formatCoordinate(bbox.west));
        arguments.push_back(formatCoordinate(bbox.south));
        arguments.push_back(formatCoordinate(bbox.east));
        arguments.push_back(formatCoordinate(bbox.north));
        arguments.push_back("-spat_srs");
        arguments.push_back("EPSG:4326");
    }

    if (!job.clip_source.empty()) {
        arguments.push_back("-clipsrc");
        arguments.insert(arguments.end(), job.clip_source.begin(), job.clip_source.end());
    }

    if (io::GDALUtils::isDriver(job.driver, "gpkg")) {
        arguments.push_back("-nlt");
        arguments.push_back("PROMOTE_TO_MULTI");
    }

    arguments.insert(arguments.end(), job.layers.begin(), job.layers.end());
    return arguments;
}

std::vector<std::string> VectorConverter::buildDistinctArguments(const VectorJob& job) {
    VectorJob distinct_job = job;
    distinct_job.skip_failures = false;
    distinct_job.spatial_filter.reset();
    distinct_job.clip_source.clear();
    distinct_job.layers.clear();
    // Keep the reference system as assigned, never reproject twice
    if (distinct_job.dst_srs) {
        distinct_job.src_srs = distinct_job.dst_srs;
    }

    std::vector<std::string> arguments = buildArguments(distinct_job, AccessMode::Overwrite);

    const std::string table_name = job.layer_name
        ? *job.layer_name
        : boost::filesystem::path(job.output_file).stem().string();

    // Don't surround the GROUP BY field in quotes, that breaks the query
    arguments.push_back("-sql");
    arguments.push_back("SELECT * from '" + table_name + "' GROUP BY " + *job.distinct_field);
    return arguments;
}

std::string VectorConverter::convert(const VectorJob& job) const {
    if (job.driver.empty()) {
        throw InputError("Cannot convert a vector without specifying a GDAL driver.");
    }
    if (job.input_files.empty()) {
        throw InputError("No input files specified");
    }
    if (job.access_mode == AccessMode::Overwrite && job.input_files.size() > 1) {
        throw InputError("Cannot overwrite with a list of files.");
    }

    // With a distinct pass the full result goes to a scratch copy first, never to a backup name an
    // input may be using
    ScratchDatasets scratch(engine_);
    EngineCall call;
    call.destination = job.distinct_field ? scratch.addBeside(job.output_file) : job.output_file;
    call.config_options = job.config_options;

    // The first input always replaces the output; in append mode the rest follow in order
    for (size_t i = 0; i < job.input_files.size(); ++i) {
        AccessMode mode = (i == 0) ? AccessMode::Overwrite : AccessMode::Append;
        call.sources = {job.input_files[i]};
        call.arguments = buildArguments(job, mode);
        engine_.vectorTranslate(call);
    }

    if (job.distinct_field) {
        std::cout << "Normalizing features based on field: " << *job.distinct_field << std::endl;
        EngineCall distinct_call;
        distinct_call.destination = job.output_file;
        distinct_call.sources = {call.destination};
        distinct_call.arguments = buildDistinctArguments(job);
        distinct_call.config_options = job.config_options;
        engine_.vectorTranslate(distinct_call);
    }

    return job.output_file;
}

std::string VectorConverter::mergeGeojson(const std::vector<std::string>& inputs, const std::string& output) const {
    if (inputs.empty()) {
        throw MergeError("File merge process failed: no input files");
    }
    engine_.mergeFeatures(inputs, output, "GeoJSON");
    return output;
}

} // namespace convert
} // namespace geoconvert

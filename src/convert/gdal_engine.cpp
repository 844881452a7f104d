#include "convert/gdal_engine.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <gdal.h>
#include <gdal_alg.h>
#include <gdal_utils.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <boost/filesystem.hpp>

namespace geoconvert {
namespace convert {

namespace {

std::string joinSources(const std::vector<std::string>& sources) {
    std::ostringstream joined;
    joined << "[";
    for (size_t i = 0; i < sources.size(); ++i) {
        joined << (i ? ", " : "") << sources[i];
    }
    joined << "]";
    return joined.str();
}

void logCall(const char* function, const EngineCall& call) {
    std::cout << "calling " << function << "(" << call.destination << ", " << joinSources(call.sources)
              << ", " << call.joinedArguments() << ")" << std::endl;
}

CPLStringList toArgv(const std::vector<std::string>& arguments) {
    CPLStringList argv;
    for (const auto& argument : arguments) {
        argv.AddString(argument.c_str());
    }
    return argv;
}

void requireSources(const char* function, const EngineCall& call, size_t expected) {
    if (call.sources.size() != expected) {
        throw ConversionError(std::string(function) + " expects " + std::to_string(expected) +
                              " source(s), got " + std::to_string(call.sources.size()));
    }
}

} // namespace

GdalEngine::GdalEngine(io::InspectorConfig inspector_config) : inspector_(inspector_config) {
    // Register GDAL drivers
    io::GDALUtils::registerDrivers();
}

io::DatasetMetadata GdalEngine::readMetadata(const std::string& path, bool is_raster) {
    return inspector_.getMetadata(path, is_raster);
}

io::DatasetPtr GdalEngine::openSource(const std::string& path, unsigned int flags) {
    CPLErrorReset();
    io::DatasetPtr dataset(GDALOpenEx(path.c_str(), flags | GDAL_OF_VERBOSE_ERROR, nullptr, nullptr, nullptr));
    if (!dataset) {
        throw ConversionError("Failed to open " + path + ": " + io::GDALUtils::lastErrorMessage("unknown error"));
    }
    return dataset;
}

void GdalEngine::warp(const EngineCall& call) {
    logCall("GDALWarp", call);
    io::ScopedConfigOptions scoped_options(call.config_options);

    CPLStringList argv = toArgv(call.arguments);
    std::unique_ptr<GDALWarpAppOptions, decltype(&GDALWarpAppOptionsFree)> options(
        GDALWarpAppOptionsNew(argv.List(), nullptr), GDALWarpAppOptionsFree);
    if (!options) {
        throw ConversionError("Invalid warp options: " + io::GDALUtils::lastErrorMessage(call.joinedArguments()));
    }

    std::vector<io::DatasetPtr> sources;
    std::vector<GDALDatasetH> handles;
    for (const auto& source : call.sources) {
        sources.push_back(openSource(source, GDAL_OF_RASTER));
        handles.push_back(sources.back().get());
    }

    int usage_error = FALSE;
    CPLErrorReset();
    io::DatasetPtr result(GDALWarp(call.destination.c_str(), nullptr, static_cast<int>(handles.size()),
                                   handles.data(), options.get(), &usage_error));
    if (!result) {
        throw ConversionError("GDALWarp to " + call.destination + " failed: " +
                              io::GDALUtils::lastErrorMessage(usage_error ? "usage error" : "unknown error"));
    }
}

void GdalEngine::translate(const EngineCall& call) {
    logCall("GDALTranslate", call);
    requireSources("GDALTranslate", call, 1);
    io::ScopedConfigOptions scoped_options(call.config_options);

    CPLStringList argv = toArgv(call.arguments);
    std::unique_ptr<GDALTranslateOptions, decltype(&GDALTranslateOptionsFree)> options(
        GDALTranslateOptionsNew(argv.List(), nullptr), GDALTranslateOptionsFree);
    if (!options) {
        throw ConversionError("Invalid translate options: " + io::GDALUtils::lastErrorMessage(call.joinedArguments()));
    }

    io::DatasetPtr source = openSource(call.sources.front(), GDAL_OF_RASTER);

    int usage_error = FALSE;
    CPLErrorReset();
    io::DatasetPtr result(GDALTranslate(call.destination.c_str(), source.get(), options.get(), &usage_error));
    if (!result) {
        throw ConversionError("GDALTranslate to " + call.destination + " failed: " +
                              io::GDALUtils::lastErrorMessage(usage_error ? "usage error" : "unknown error"));
    }
}

void GdalEngine::vectorTranslate(const EngineCall& call) {
    logCall("GDALVectorTranslate", call);
    requireSources("GDALVectorTranslate", call, 1);
    io::ScopedConfigOptions scoped_options(call.config_options);

    CPLStringList argv = toArgv(call.arguments);
    std::unique_ptr<GDALVectorTranslateOptions, decltype(&GDALVectorTranslateOptionsFree)> options(
        GDALVectorTranslateOptionsNew(argv.List(), nullptr), GDALVectorTranslateOptionsFree);
    if (!options) {
        throw ConversionError("Invalid vector translate options: " +
                              io::GDALUtils::lastErrorMessage(call.joinedArguments()));
    }

    io::DatasetPtr source = openSource(call.sources.front(), GDAL_OF_VECTOR);
    GDALDatasetH source_handle = source.get();

    int usage_error = FALSE;
    CPLErrorReset();
    io::DatasetPtr result(GDALVectorTranslate(call.destination.c_str(), nullptr, 1, &source_handle,
                                              options.get(), &usage_error));
    if (!result) {
        throw ConversionError("GDALVectorTranslate to " + call.destination + " failed: " +
                              io::GDALUtils::lastErrorMessage(usage_error ? "usage error" : "unknown error"));
    }
}

void GdalEngine::nearblack(const EngineCall& call) {
    logCall("GDALNearblack", call);
    requireSources("GDALNearblack", call, 1);
    io::ScopedConfigOptions scoped_options(call.config_options);

    CPLStringList argv = toArgv(call.arguments);
    std::unique_ptr<GDALNearblackOptions, decltype(&GDALNearblackOptionsFree)> options(
        GDALNearblackOptionsNew(argv.List(), nullptr), GDALNearblackOptionsFree);
    if (!options) {
        throw ConversionError("Invalid nearblack options: " + io::GDALUtils::lastErrorMessage(call.joinedArguments()));
    }

    io::DatasetPtr source = openSource(call.sources.front(), GDAL_OF_RASTER);

    int usage_error = FALSE;
    CPLErrorReset();
    io::DatasetPtr result(GDALNearblack(call.destination.c_str(), nullptr, source.get(), options.get(), &usage_error));
    if (!result) {
        throw ConversionError("GDALNearblack to " + call.destination + " failed: " +
                              io::GDALUtils::lastErrorMessage(usage_error ? "usage error" : "unknown error"));
    }
}

void GdalEngine::polygonize(const std::string& input, const std::string& output,
                            const std::string& output_type, int band) {
    std::cout << "calling GDALPolygonize(" << input << ", " << output << ", " << output_type
              << ", band " << band << ")" << std::endl;

    io::DatasetPtr source = openSource(input, GDAL_OF_RASTER);
    if (band < 1 || band > GDALGetRasterCount(source.get())) {
        throw ConversionError("Unable to get raster band " + std::to_string(band) + " of " + input);
    }
    GDALRasterBandH raster_band = GDALGetRasterBand(source.get(), band);

    GDALDriverH driver = GDALGetDriverByName(output_type.c_str());
    if (!driver) {
        throw ConversionError("Failed to get GDAL driver for format: " + output_type);
    }

    CPLErrorReset();
    io::DatasetPtr destination(GDALCreate(driver, output.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!destination) {
        throw ConversionError("Failed to create GDAL dataset: " + output + ": " +
                              io::GDALUtils::lastErrorMessage("unknown error"));
    }

    const std::string layer_name = boost::filesystem::path(output).stem().string();
    OGRLayerH layer = GDALDatasetCreateLayer(destination.get(), layer_name.c_str(),
                                             GDALGetSpatialRef(source.get()), wkbPolygon, nullptr);
    if (!layer) {
        throw ConversionError("Failed to create layer: " + layer_name);
    }

    OGRFieldDefnH value_field = OGR_Fld_Create("value", OFTInteger);
    OGR_L_CreateField(layer, value_field, 1);
    OGR_Fld_Destroy(value_field);

    // Use the band for both the polygonization and as a mask
    CPLErrorReset();
    if (GDALPolygonize(raster_band, raster_band, layer, 0, nullptr, nullptr, nullptr) != CE_None) {
        throw ConversionError("GDALPolygonize of " + input + " failed: " +
                              io::GDALUtils::lastErrorMessage("unknown error"));
    }
}

void GdalEngine::mergeFeatures(const std::vector<std::string>& inputs, const std::string& output,
                               const std::string& driver_name) {
    std::cout << "Merging " << inputs.size() << " file(s) into " << output << std::endl;

    GDALDriverH driver = GDALGetDriverByName(driver_name.c_str());
    if (!driver) {
        throw MergeError("File merge process failed: no GDAL driver for format " + driver_name);
    }

    CPLErrorReset();
    io::DatasetPtr destination(GDALCreate(driver, output.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!destination) {
        throw MergeError("File merge process failed: cannot create " + output + ": " +
                         io::GDALUtils::lastErrorMessage("unknown error"));
    }

    const std::string layer_name = boost::filesystem::path(output).stem().string();
    OGRLayerH out_layer = GDALDatasetCreateLayer(destination.get(), layer_name.c_str(), nullptr, wkbUnknown, nullptr);
    if (!out_layer) {
        throw MergeError("File merge process failed: cannot create layer " + layer_name);
    }
    OGRFeatureDefnH out_definition = OGR_L_GetLayerDefn(out_layer);

    for (const auto& input : inputs) {
        CPLErrorReset();
        io::DatasetPtr source(GDALOpenEx(input.c_str(), GDAL_OF_VECTOR | GDAL_OF_VERBOSE_ERROR,
                                         nullptr, nullptr, nullptr));
        if (!source) {
            throw MergeError("File merge process failed: cannot open " + input + ": " +
                             io::GDALUtils::lastErrorMessage("unknown error"));
        }
        OGRLayerH layer = GDALDatasetGetLayer(source.get(), 0);
        if (!layer) {
            throw MergeError("File merge process failed: " + input + " has no layer");
        }

        OGR_L_ResetReading(layer);
        for (io::FeaturePtr feature(OGR_L_GetNextFeature(layer)); feature;
             feature.reset(OGR_L_GetNextFeature(layer))) {
            io::FeaturePtr out_feature(OGR_F_Create(out_definition));
            OGRGeometryH geometry = OGR_F_GetGeometryRef(feature.get());
            if (geometry) {
                OGR_F_SetGeometry(out_feature.get(), geometry);
            }
            if (OGR_L_CreateFeature(out_layer, out_feature.get()) != OGRERR_NONE) {
                throw MergeError("File merge process failed: cannot write feature from " + input + ": " +
                                 io::GDALUtils::lastErrorMessage("unknown error"));
            }
        }
        OGR_L_SyncToDisk(out_layer);
    }
}

void GdalEngine::removeDataset(const std::string& path) {
    VSIStatBufL stat;
    if (VSIStatL(path.c_str(), &stat) == 0) {
        if (VSIUnlink(path.c_str()) != 0) {
            std::cerr << "Warning: Failed to remove " << path << std::endl;
        }
    }
}

} // namespace convert
} // namespace geoconvert

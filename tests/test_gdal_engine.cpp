#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <cpl_conv.h>
#include <cpl_vsi.h>
#include <gdal.h>
#include <ogr_api.h>
#include "convert/converter.hpp"
#include "convert/gdal_engine.hpp"
#include "io/dataset_inspector.hpp"
#include "errors.hpp"
#include "sample_datasets.hpp"
#include "temp_directory.hpp"

using namespace geoconvert;
using convert::EngineCall;
using convert::GdalEngine;
namespace fs = boost::filesystem;

namespace {

io::InspectorConfig inProcess() {
    io::InspectorConfig config;
    config.isolate = false;
    return config;
}

GIntBig featureCount(const std::string& path) {
    io::DatasetPtr dataset(GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
    if (!dataset || GDALDatasetGetLayerCount(dataset.get()) == 0) {
        return -1;
    }
    return OGR_L_GetFeatureCount(GDALDatasetGetLayer(dataset.get(), 0), TRUE);
}

} // namespace

class GdalEngineTest : public ::testing::Test {
protected:
    GdalEngineTest() : engine(inProcess()) {}

    test_support::TempDirectory directory;
    GdalEngine engine;
};

TEST_F(GdalEngineTest, WarpReprojectsRaster) {
    std::string source = directory.file("source.tif");
    test_support::createRaster(source, 20, 20, 1, {0.0});

    EngineCall call;
    call.destination = directory.file("mercator.tif");
    call.sources = {source};
    call.arguments = {"-of", "GTiff", "-t_srs", "EPSG:3857"};
    engine.warp(call);

    io::DatasetMetadata metadata = engine.readMetadata(call.destination, true);
    EXPECT_EQ(metadata.driver, std::optional<std::string>("GTiff"));
    EXPECT_EQ(metadata.srs, std::optional<int>(3857));
}

TEST_F(GdalEngineTest, TranslateCopiesRaster) {
    std::string source = directory.file("source.tif");
    test_support::createRaster(source, 12, 9, 2);

    EngineCall call;
    call.destination = directory.file("compressed.tif");
    call.sources = {source};
    call.arguments = {"-of", "GTiff", "-co", "COMPRESS=LZW", "-co", "TILED=YES"};
    engine.translate(call);

    io::DatasetMetadata metadata = engine.readMetadata(call.destination, true);
    EXPECT_EQ(metadata.dim, (io::RasterDimensions{12, 9, 2}));

    call.sources.push_back(source);
    EXPECT_THROW(engine.translate(call), ConversionError);
}

TEST_F(GdalEngineTest, VectorTranslateWritesGeoPackage) {
    std::string source = directory.file("parcels.geojson");
    test_support::writeFeatureCollection(source, {test_support::squareFeature(0, 0, 1),
                                                  test_support::squareFeature(2, 2, 2)});

    EngineCall call;
    call.destination = directory.file("parcels.gpkg");
    call.sources = {source};
    call.arguments = {"-f", "GPKG", "-nln", "parcels", "-nlt", "PROMOTE_TO_MULTI"};
    engine.vectorTranslate(call);

    EXPECT_EQ(featureCount(call.destination), 2);
}

TEST_F(GdalEngineTest, MissingSourceThrows) {
    EngineCall call;
    call.destination = directory.file("out.tif");
    call.sources = {directory.file("missing.tif")};
    call.arguments = {"-of", "GTiff"};
    EXPECT_THROW(engine.warp(call), ConversionError);

    call.arguments = {"-f", "GPKG"};
    EXPECT_THROW(engine.vectorTranslate(call), ConversionError);
}

TEST_F(GdalEngineTest, InvalidArgumentsThrow) {
    std::string source = directory.file("source.tif");
    test_support::createRaster(source, 4, 4, 1);

    EngineCall call;
    call.destination = directory.file("out.tif");
    call.sources = {source};
    call.arguments = {"-of", "GTiff", "-no-such-flag"};
    EXPECT_THROW(engine.warp(call), ConversionError);
}

TEST_F(GdalEngineTest, PolygonizeMasksZeroPixels) {
    std::string source = directory.file("classes.tif");
    test_support::createRaster(source, 10, 10, 1);

    std::string output = directory.file("classes.geojson");
    engine.polygonize(source, output, "GeoJSON", 1);

    // One polygon per value region
    EXPECT_EQ(featureCount(output), 2);
    EXPECT_THROW(engine.polygonize(source, directory.file("bad.geojson"), "GeoJSON", 2), ConversionError);
    EXPECT_THROW(engine.polygonize(source, directory.file("bad.xyz"), "NoSuchDriver", 1), ConversionError);
}

TEST_F(GdalEngineTest, MergeFeaturesCollectsEveryInput) {
    std::string first = directory.file("first.geojson");
    std::string second = directory.file("second.geojson");
    test_support::writeFeatureCollection(first, {test_support::squareFeature(0, 0, 1)});
    test_support::writeFeatureCollection(second, {test_support::squareFeature(5, 5, 2),
                                                  test_support::squareFeature(8, 8, 3)});

    std::string output = directory.file("merged.geojson");
    engine.mergeFeatures({first, second}, output, "GeoJSON");

    EXPECT_EQ(featureCount(output), 3);
    EXPECT_THROW(engine.mergeFeatures({directory.file("missing.geojson")}, directory.file("none.geojson"), "GeoJSON"),
                 MergeError);
}

TEST_F(GdalEngineTest, RemoveDataset) {
    std::string path = "/vsimem/geoconvert-remove-test.tif";
    test_support::createRaster(path, 2, 2, 1);

    VSIStatBufL stat;
    ASSERT_EQ(VSIStatL(path.c_str(), &stat), 0);
    engine.removeDataset(path);
    EXPECT_NE(VSIStatL(path.c_str(), &stat), 0);

    // Already gone
    engine.removeDataset(path);
}

TEST_F(GdalEngineTest, ConfigOptionsAreScopedToTheCall) {
    const char* key = "GEOCONVERT_TEST_OPTION";
    ASSERT_EQ(CPLGetConfigOption(key, nullptr), nullptr);
    {
        io::ScopedConfigOptions outer({{key, "outer"}});
        EXPECT_STREQ(CPLGetConfigOption(key, nullptr), "outer");
        {
            io::ScopedConfigOptions inner({{key, "first"}, {key, "second"}});
            EXPECT_STREQ(CPLGetConfigOption(key, nullptr), "second");
        }
        EXPECT_STREQ(CPLGetConfigOption(key, nullptr), "outer");
    }
    EXPECT_EQ(CPLGetConfigOption(key, nullptr), nullptr);
}

TEST_F(GdalEngineTest, ConvertClipsRasterIntoGeoPackage) {
    std::string source = directory.file("imagery.tif");
    test_support::createRaster(source, 150, 150, 3, {0.0, 0.0, 0.0});

    convert::ConversionRequest request;
    request.input_files = {source};
    request.output_file = directory.file("imagery.gpkg");
    request.driver = "GPKG";
    request.boundary = geometry::BoundingBox(-72.5, 42.0, -72.0, 42.5);

    std::string output = convert::Converter(engine).convert(request);

    EXPECT_EQ(output, request.output_file);
    io::DatasetMetadata metadata = engine.readMetadata(output, true);
    EXPECT_EQ(metadata.driver, std::optional<std::string>("GPKG"));
    EXPECT_NEAR(metadata.dim.width, 50, 2);
    EXPECT_NEAR(metadata.dim.height, 50, 2);
    EXPECT_TRUE(fs::exists(source));
}

TEST_F(GdalEngineTest, ConvertVectorToZippedShapefile) {
    std::string source = directory.file("roads.geojson");
    test_support::writeFeatureCollection(source, {test_support::squareFeature(0, 0, 1)});

    convert::ConversionRequest request;
    request.input_files = {source};
    request.output_file = directory.file("roads.shp");
    request.driver = "ESRI Shapefile";

    std::string output = convert::Converter(engine).convert(request);

    EXPECT_EQ(output, directory.file("roads.zip"));
    EXPECT_EQ(featureCount("/vsizip/" + output + "/roads.shp"), 1);
}

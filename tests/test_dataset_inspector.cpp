#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>
#include <sys/stat.h>
#include <unistd.h>
#include "io/dataset_inspector.hpp"
#include "errors.hpp"
#include "sample_datasets.hpp"
#include "temp_directory.hpp"

using namespace geoconvert;
using io::DatasetInspector;
using io::DatasetMetadata;

class DatasetInspectorTest : public ::testing::Test {
protected:
    void SetUp() override { io::GDALUtils::registerDrivers(); }

    test_support::TempDirectory directory;
};

TEST_F(DatasetInspectorTest, RasterWithUniformNodata) {
    std::string path = directory.file("uniform.tif");
    test_support::createRaster(path, 30, 20, 3, {0.0, 0.0, 0.0});

    DatasetMetadata metadata = DatasetInspector::readMetadata(path, true);

    EXPECT_EQ(metadata.driver, std::optional<std::string>("GTiff"));
    EXPECT_EQ(metadata.is_raster, std::optional<bool>(true));
    EXPECT_EQ(metadata.nodata, std::optional<double>(0.0));
    EXPECT_EQ(metadata.dim, (io::RasterDimensions{30, 20, 3}));
    EXPECT_EQ(metadata.srs, std::optional<int>(4326));
}

TEST_F(DatasetInspectorTest, RasterWithDifferingNodata) {
    std::string path = directory.file("mixed.tif");
    test_support::createRaster(path, 10, 10, 2, {0.0, 255.0});

    DatasetMetadata metadata = DatasetInspector::readMetadata(path, true);

    EXPECT_EQ(metadata.is_raster, std::optional<bool>(true));
    EXPECT_FALSE(metadata.nodata.has_value());
    EXPECT_EQ(metadata.dim.band_count, 2);
}

TEST_F(DatasetInspectorTest, RasterWithoutNodata) {
    std::string path = directory.file("plain.tif");
    test_support::createRaster(path, 10, 10, 1);

    DatasetMetadata metadata = DatasetInspector::readMetadata(path, false);

    // No hint needed when the vector open fails
    EXPECT_EQ(metadata.is_raster, std::optional<bool>(true));
    EXPECT_FALSE(metadata.nodata.has_value());
}

TEST_F(DatasetInspectorTest, VectorDataset) {
    std::string path = directory.file("parcels.geojson");
    test_support::writeFeatureCollection(path, {test_support::squareFeature(0, 0, 1)});

    DatasetMetadata metadata = DatasetInspector::readMetadata(path, false);

    EXPECT_EQ(metadata.driver, std::optional<std::string>("GeoJSON"));
    EXPECT_EQ(metadata.is_raster, std::optional<bool>(false));
    EXPECT_EQ(metadata.dim, io::RasterDimensions());
    EXPECT_EQ(metadata.srs, std::optional<int>(4326));
}

TEST_F(DatasetInspectorTest, UnrecognizedDatasetsAreEmpty) {
    std::string text = directory.touch("notes.xyz123", "just some words");

    for (const std::string& path : {directory.file("missing.tif"), text}) {
        DatasetMetadata metadata = DatasetInspector::readMetadata(path, true);
        EXPECT_FALSE(metadata.identified()) << path;
        EXPECT_FALSE(metadata.is_raster.has_value());
        EXPECT_FALSE(metadata.srs.has_value());
    }
}

TEST_F(DatasetInspectorTest, OpenPrefersVectorWithoutRasterHint) {
    std::string path = directory.file("parcels.geojson");
    test_support::writeFeatureCollection(path, {test_support::squareFeature(0, 0, 1)});

    io::OpenedDataset opened = DatasetInspector::openDataset(path, true);
    ASSERT_TRUE(opened.handle);
    EXPECT_FALSE(opened.is_raster);

    io::OpenedDataset missing = DatasetInspector::openDataset(directory.file("missing.gpkg"), false);
    EXPECT_FALSE(missing.handle);
}

TEST_F(DatasetInspectorTest, WorkerProcessReturnsMetadata) {
    std::string path = directory.file("worker.tif");
    test_support::createRaster(path, 16, 8, 4, {0.0, 0.0, 0.0, 0.0});

    io::InspectorConfig config;
    config.isolate = true;
    config.timeout = std::chrono::seconds(60);
    DatasetInspector inspector(config);

    DatasetMetadata isolated = inspector.getMetadata(path, true);
    DatasetMetadata direct = DatasetInspector::readMetadata(path, true);

    EXPECT_EQ(isolated.driver, direct.driver);
    EXPECT_EQ(isolated.is_raster, direct.is_raster);
    EXPECT_EQ(isolated.nodata, direct.nodata);
    EXPECT_EQ(isolated.dim, direct.dim);
    EXPECT_EQ(isolated.srs, direct.srs);

    EXPECT_FALSE(inspector.getMetadata(directory.file("missing.tif"), true).identified());
}

TEST_F(DatasetInspectorTest, WorkerIsKilledAfterTimeout) {
    // Opening a FIFO blocks until a writer shows up, and none ever does
    std::string path = directory.file("stalled.fifo");
    ASSERT_EQ(mkfifo(path.c_str(), 0600), 0);

    io::InspectorConfig config;
    config.isolate = true;
    config.timeout = std::chrono::seconds(1);
    DatasetInspector inspector(config);

    auto start = std::chrono::steady_clock::now();
    try {
        inspector.getMetadata(path, true);
        FAIL() << "a blocked worker should time out";
    } catch (const IntrospectionError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out after 1 seconds"), std::string::npos) << e.what();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(DatasetInspectorTest, WorkerExitingWithoutResultThrows) {
    io::InspectorConfig config;
    config.isolate = true;
    config.timeout = std::chrono::seconds(30);
    config.reader = [](const std::string&, bool) -> DatasetMetadata { _exit(3); };
    DatasetInspector inspector(config);

    try {
        inspector.getMetadata(directory.file("any.tif"), true);
        FAIL() << "a worker without a result should fail";
    } catch (const IntrospectionError& e) {
        EXPECT_NE(std::string(e.what()).find("exited without a result"), std::string::npos) << e.what();
    }
}

TEST_F(DatasetInspectorTest, WorkerErrorsAreForwarded) {
    io::InspectorConfig config;
    config.isolate = true;
    config.timeout = std::chrono::seconds(30);
    config.reader = [](const std::string& path, bool) -> DatasetMetadata {
        throw IntrospectionError("Failed to open " + path + ": broken header");
    };
    DatasetInspector inspector(config);

    std::string path = directory.file("broken.tif");
    try {
        inspector.getMetadata(path, true);
        FAIL() << "the worker error should be rethrown";
    } catch (const IntrospectionError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to open " + path + ": broken header");
    }
}

TEST_F(DatasetInspectorTest, TimeoutFromEnvironment) {
    setenv("GEOCONVERT_INSPECT_TIMEOUT", "12", 1);
    EXPECT_EQ(io::InspectorConfig::fromEnvironment().timeout, std::chrono::seconds(12));

    setenv("GEOCONVERT_INSPECT_TIMEOUT", "soon", 1);
    EXPECT_EQ(io::InspectorConfig::fromEnvironment().timeout, std::chrono::seconds(300));
    unsetenv("GEOCONVERT_INSPECT_TIMEOUT");
}

TEST_F(DatasetInspectorTest, BandStatistics) {
    std::string path = directory.file("stats.tif");
    test_support::createRaster(path, 10, 10, 2);

    std::optional<io::BandStatistics> stats = DatasetInspector::getBandStatistics(path, 2);
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->min, 20.0);
    EXPECT_DOUBLE_EQ(stats->max, 40.0);
    EXPECT_DOUBLE_EQ(stats->mean, 30.0);

    EXPECT_FALSE(DatasetInspector::getBandStatistics(path, 3).has_value());
    EXPECT_FALSE(DatasetInspector::getBandStatistics(directory.file("missing.tif")).has_value());
}

TEST(DatasetMetadataTest, JsonKeepsSpecialNodata) {
    DatasetMetadata metadata;
    metadata.driver = "GTiff";
    metadata.is_raster = true;
    metadata.nodata = std::numeric_limits<double>::quiet_NaN();
    metadata.dim = io::RasterDimensions{5, 6, 1};
    metadata.srs = 3857;

    DatasetMetadata restored = nlohmann::json::parse(nlohmann::json(metadata).dump()).get<DatasetMetadata>();

    EXPECT_EQ(restored.driver, metadata.driver);
    ASSERT_TRUE(restored.nodata.has_value());
    EXPECT_TRUE(std::isnan(*restored.nodata));
    EXPECT_EQ(restored.dim, metadata.dim);
    EXPECT_EQ(restored.srs, metadata.srs);

    metadata.nodata = -std::numeric_limits<double>::infinity();
    restored = nlohmann::json(metadata).get<DatasetMetadata>();
    EXPECT_EQ(restored.nodata, metadata.nodata);
}

TEST(DatasetMetadataTest, JsonOfUnidentifiedDataset) {
    DatasetMetadata restored = nlohmann::json(DatasetMetadata()).get<DatasetMetadata>();
    EXPECT_FALSE(restored.identified());
    EXPECT_FALSE(restored.nodata.has_value());
    EXPECT_FALSE(restored.srs.has_value());
}

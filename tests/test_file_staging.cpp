#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <boost/filesystem.hpp>
#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include "io/file_staging.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include "temp_directory.hpp"

using namespace geoconvert;
using io::FileStaging;
namespace fs = boost::filesystem;

namespace {

std::vector<std::string> zipEntries(const std::string& zip_path) {
    std::vector<std::string> entries;
    char** listing = VSIReadDir(("/vsizip/" + zip_path).c_str());
    for (int i = 0; listing && listing[i]; ++i) {
        entries.push_back(listing[i]);
    }
    CSLDestroy(listing);
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

TEST(FileStagingTest, RenameDuplicateMovesFileAside) {
    test_support::TempDirectory directory;
    std::string original = directory.touch("data.gpkg", "original");

    std::string backup = FileStaging::renameDuplicate(original);

    EXPECT_EQ(backup, directory.file("old_data.gpkg"));
    EXPECT_FALSE(fs::exists(original));
    EXPECT_TRUE(fs::exists(backup));
}

TEST(FileStagingTest, RenameDuplicateIsIdempotentAcrossRetries) {
    test_support::TempDirectory directory;
    std::string original = directory.touch("data.gpkg", "original");

    std::string first = FileStaging::renameDuplicate(original);
    // A retried attempt finds only the backup and leaves it alone
    std::string second = FileStaging::renameDuplicate(original);

    EXPECT_EQ(first, second);
    EXPECT_TRUE(fs::exists(second));
}

TEST(FileStagingTest, RenameDuplicateReplacesStaleBackup) {
    test_support::TempDirectory directory;
    std::string original = directory.touch("data.gpkg", "fresh");
    directory.touch("old_data.gpkg", "stale");

    std::string backup = FileStaging::renameDuplicate(original);

    std::ifstream file(backup);
    std::string content;
    file >> content;
    EXPECT_EQ(content, "fresh");
    EXPECT_FALSE(fs::exists(original));
}

TEST(FileStagingTest, RenameDuplicateProtectsPbf) {
    test_support::TempDirectory directory;
    std::string original = directory.touch("planet.pbf");
    EXPECT_THROW(FileStaging::renameDuplicate(original), ProtectedFileError);
    EXPECT_TRUE(fs::exists(original));
}

TEST(FileStagingTest, RenameDuplicateOfMissingFileThrows) {
    test_support::TempDirectory directory;
    EXPECT_THROW(FileStaging::renameDuplicate(directory.file("missing.tif")), InputError);
}

TEST(FileStagingTest, StripPrefixes) {
    EXPECT_EQ(FileStaging::stripPrefixes("GTIFF_RAW:/data/file.tif"),
              std::make_pair(std::string("GTIFF_RAW:"), std::string("/data/file.tif")));
    EXPECT_EQ(FileStaging::stripPrefixes("/data/file.tif"),
              std::make_pair(std::string(""), std::string("/data/file.tif")));
    // Only a leading prefix counts
    EXPECT_EQ(FileStaging::stripPrefixes("/data/GTIFF_RAW:file.tif").first, "");
}

TEST(FileStagingTest, GetDatasetNamesDefaultsOutputToInput) {
    test_support::TempDirectory directory;
    std::string input = directory.touch("image.tif");

    io::DatasetNames names = FileStaging::getDatasetNames("GTIFF_RAW:" + input, "");

    EXPECT_EQ(names.output, input);
    EXPECT_EQ(names.input, "GTIFF_RAW:" + directory.file("old_image.tif"));
    EXPECT_TRUE(fs::exists(directory.file("old_image.tif")));
}

TEST(FileStagingTest, GetDatasetNamesLeavesDistinctOutputAlone) {
    io::DatasetNames names = FileStaging::getDatasetNames("/data/in.tif", "/data/out.gpkg");
    EXPECT_EQ(names.input, "/data/in.tif");
    EXPECT_EQ(names.output, "/data/out.gpkg");

    EXPECT_THROW(FileStaging::getDatasetNames("", "/data/out.gpkg"), InputError);
}

TEST(FileStagingTest, ZipNames) {
    EXPECT_EQ(FileStaging::getZipName("/data/doc.kml"), "/data/doc.kmz");
    EXPECT_EQ(FileStaging::getZipName("/data/roads.shp"), "/data/roads.zip");
    EXPECT_EQ(FileStaging::getZipName("/data/shapes"), "/data/shapes.zip");

    EXPECT_TRUE(FileStaging::requiresZip("ESRI Shapefile"));
    EXPECT_TRUE(FileStaging::requiresZip("kml"));
    EXPECT_FALSE(FileStaging::requiresZip("gpkg"));
}

TEST(FileStagingTest, CreateZipFileTakesShapefileSidecars) {
    io::GDALUtils::registerDrivers();
    test_support::TempDirectory directory;
    std::string shp = directory.touch("roads.shp");
    directory.touch("roads.dbf");
    directory.touch("roads.shx");
    directory.touch("other.shp");

    std::string zip = FileStaging::createZipFile(shp, FileStaging::getZipName(shp));

    EXPECT_EQ(zip, directory.file("roads.zip"));
    EXPECT_EQ(zipEntries(zip), (std::vector<std::string>{"roads.dbf", "roads.shp", "roads.shx"}));
}

TEST(FileStagingTest, CreateZipFileFlattensDirectories) {
    io::GDALUtils::registerDrivers();
    test_support::TempDirectory directory;
    fs::create_directories(directory.path() / "layers" / "nested");
    directory.touch("layers/a.shp");
    directory.touch("layers/nested/b.shp");

    std::string zip = FileStaging::createZipFile(directory.file("layers"), directory.file("layers.zip"));

    EXPECT_EQ(zipEntries(zip), (std::vector<std::string>{"a.shp", "b.shp"}));
}

TEST(FileStagingTest, CreateZipFileOfMissingInputThrows) {
    test_support::TempDirectory directory;
    EXPECT_THROW(FileStaging::createZipFile(directory.file("missing.shp"), directory.file("missing.zip")),
                 ConversionError);
}

TEST(FileStagingTest, TemporaryFileIsRemovedWithItsOwner) {
    std::string path = io::TemporaryFile::uniquePath(".geojson");
    EXPECT_EQ(fs::path(path).extension().string(), ".geojson");
    {
        io::TemporaryFile temporary(path);
        std::ofstream(temporary.path()) << "{}";
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

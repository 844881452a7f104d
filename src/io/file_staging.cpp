#include "io/file_staging.hpp"
#include "io/gdal_utils.hpp"
#include "errors.hpp"
#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <array>
#include <iostream>
#include <vector>

namespace fs = boost::filesystem;

namespace geoconvert {
namespace io {

namespace {

// Source formats that are never renamed or overwritten
const std::array<const char*, 1> PROTECTED_EXTENSIONS = {".pbf"};

// Engine-specific dataset name decorations
const std::array<const char*, 1> DATASET_PREFIXES = {"GTIFF_RAW:"};

// Drivers whose outputs ship as a single archive
const std::array<const char*, 2> ZIPPED_DRIVERS = {"KML", "ESRI Shapefile"};

} // namespace

std::string FileStaging::renameDuplicate(const std::string& original_file) {
    const fs::path original(original_file);
    const std::string extension = original.extension().string();
    for (const char* protected_extension : PROTECTED_EXTENSIONS) {
        if (extension == protected_extension) {
            throw ProtectedFileError("The " + original_file +
                                     " cannot be renamed it is protected and/or not writable by this module.");
        }
    }

    const fs::path backup = original.parent_path() / (std::string(BACKUP_PREFIX) + original.filename().string());

    boost::system::error_code ec;
    const bool original_exists = fs::is_regular_file(original, ec);
    const bool backup_exists = fs::is_regular_file(backup, ec);

    // Both exist: the backup is stale from an earlier attempt
    if (original_exists && backup_exists) {
        fs::remove(backup, ec);
        if (ec) {
            throw InputError("Failed to remove stale backup " + backup.string() + ": " + ec.message());
        }
    }

    // Only the backup exists: a retried conversion already moved the file
    if (!original_exists && backup_exists) {
        return backup.string();
    }

    std::cout << "Renaming " << original.string() << " to " << backup.string() << std::endl;
    fs::rename(original, backup, ec);
    if (ec) {
        throw InputError("Failed to rename " + original.string() + " to " + backup.string() + ": " + ec.message());
    }
    return backup.string();
}

std::pair<std::string, std::string> FileStaging::stripPrefixes(const std::string& dataset) {
    std::string removed_prefix;
    std::string output_dataset = dataset;
    for (const char* prefix : DATASET_PREFIXES) {
        const std::string prefix_text(prefix);
        if (output_dataset.compare(0, prefix_text.size(), prefix_text) == 0) {
            removed_prefix = prefix_text;
            output_dataset = output_dataset.substr(prefix_text.size());
        }
    }
    return {removed_prefix, output_dataset};
}

DatasetNames FileStaging::getDatasetNames(const std::string& input_file, const std::string& output_file) {
    if (input_file.empty()) {
        throw InputError("Not provided: 'in' dataset");
    }

    auto [file_prefix, in_dataset_file] = stripPrefixes(input_file);

    DatasetNames names;
    names.input = input_file;
    names.output = output_file.empty() ? in_dataset_file : output_file;

    // Never operate on the original file
    if (names.output == in_dataset_file) {
        names.input = file_prefix + renameDuplicate(in_dataset_file);
    }
    return names;
}

bool FileStaging::requiresZip(const std::string& driver) {
    for (const char* zipped_driver : ZIPPED_DRIVERS) {
        if (GDALUtils::isDriver(driver, zipped_driver)) {
            return true;
        }
    }
    return false;
}

std::string FileStaging::getZipName(const std::string& file_name) {
    fs::path path(file_name);
    if (path.extension() == ".kml") {
        return path.replace_extension(".kmz").string();
    }
    return path.replace_extension(".zip").string();
}

void FileStaging::addFileToZip(void* zip, const fs::path& file, const std::string& archive_name) {
    if (CPLCreateFileInZip(zip, archive_name.c_str(), nullptr) != CE_None) {
        throw ConversionError("Failed to add " + archive_name + " to archive: " +
                              GDALUtils::lastErrorMessage("unknown error"));
    }

    VSILFILE* handle = VSIFOpenL(file.string().c_str(), "rb");
    if (!handle) {
        CPLCloseFileInZip(zip);
        throw ConversionError("Failed to open " + file.string() + " for archiving");
    }

    std::vector<char> buffer(1024 * 1024);
    bool ok = true;
    size_t read = 0;
    while ((read = VSIFReadL(buffer.data(), 1, buffer.size(), handle)) > 0) {
        if (CPLWriteFileInZip(zip, buffer.data(), static_cast<int>(read)) != CE_None) {
            ok = false;
            break;
        }
    }
    VSIFCloseL(handle);
    CPLCloseFileInZip(zip);

    if (!ok) {
        throw ConversionError("Failed to write " + file.string() + " to archive: " +
                              GDALUtils::lastErrorMessage("unknown error"));
    }
}

std::string FileStaging::createZipFile(const std::string& in_file, const std::string& out_file) {
    std::cout << "Creating the zipfile " << out_file << " from " << in_file << std::endl;

    const fs::path input(in_file);
    boost::system::error_code ec;

    // Collect (file, archive name) pairs before opening the archive
    std::vector<std::pair<fs::path, std::string>> entries;
    if (fs::is_directory(input, ec)) {
        // Shapefile layers live side by side in one directory; they end up flat in one archive
        for (fs::recursive_directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
            if (fs::is_regular_file(it->path(), ec) && fs::absolute(it->path()) != fs::absolute(out_file)) {
                entries.emplace_back(it->path(), it->path().filename().string());
            }
        }
    } else if (fs::is_regular_file(input, ec)) {
        entries.emplace_back(input, input.filename().string());

        // Sidecar files share the stem (.shx, .dbf, .prj, ...)
        const fs::path directory = input.has_parent_path() ? input.parent_path() : fs::path(".");
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::path& candidate = it->path();
            if (candidate != input && candidate.stem() == input.stem() &&
                candidate.extension() != ".zip" && candidate.extension() != ".kmz" &&
                fs::is_regular_file(candidate, ec)) {
                entries.emplace_back(candidate, candidate.filename().string());
            }
        }
    } else {
        throw ConversionError("Cannot archive " + in_file + ": no such file or directory");
    }

    CPLStringList options;
    if (fs::exists(out_file, ec)) {
        options.SetNameValue("APPEND", "TRUE");
    }

    CPLErrorReset();
    void* zip = CPLCreateZip(out_file.c_str(), options.List());
    if (!zip) {
        throw ConversionError("Failed to create archive " + out_file + ": " +
                              GDALUtils::lastErrorMessage("unknown error"));
    }

    try {
        for (const auto& [file, archive_name] : entries) {
            addFileToZip(zip, file, archive_name);
        }
    } catch (const ConversionError&) {
        CPLCloseZip(zip);
        throw;
    }

    if (CPLCloseZip(zip) != CE_None) {
        throw ConversionError("Failed to finalize archive " + out_file);
    }
    return out_file;
}

TemporaryFile::TemporaryFile(std::string path) : path_(std::move(path)) {}

TemporaryFile::~TemporaryFile() {
    if (path_.empty()) {
        return;
    }
    boost::system::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "Warning: Failed to remove temporary file " << path_ << ": " << ec.message() << std::endl;
    }
}

std::string TemporaryFile::uniquePath(const std::string& extension) {
    fs::path path = fs::temp_directory_path() / fs::unique_path("geoconvert-%%%%-%%%%-%%%%");
    path += extension;
    return path.string();
}

} // namespace io
} // namespace geoconvert

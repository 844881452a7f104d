#ifndef GEOCONVERT_FILE_STAGING_HPP
#define GEOCONVERT_FILE_STAGING_HPP

#include <string>
#include <utility>
#include <boost/filesystem.hpp>

namespace geoconvert {
namespace io {

// Input/output dataset names after staging
struct DatasetNames {
    std::string input;
    std::string output;
};

/**
 * Helpers that stage files around a conversion so the caller's original data is never lost
 */
class FileStaging {
public:
    // Prefix added to the backup copy of a file that is about to be overwritten
    static constexpr const char* BACKUP_PREFIX = "old_";

    /**
     * Move a file aside to <dir>/old_<name>
     * If both the file and a stale backup exist, the stale backup is removed first.
     * If only the backup exists, a previous attempt already moved the file and nothing is renamed.
     * @param original_file File to move aside
     * @return Path of the backup
     * @throws ProtectedFileError for protected extensions (.pbf)
     * @throws InputError if neither the file nor its backup exists
     */
    static std::string renameDuplicate(const std::string& original_file);

    /**
     * Remove engine-specific decorations from a dataset name
     * @param dataset Dataset name such as "GTIFF_RAW:/data/file.tif"
     * @return {removed prefix (empty if none), bare path}
     */
    static std::pair<std::string, std::string> stripPrefixes(const std::string& dataset);

    /**
     * Resolve the input and output names of a conversion
     * The output defaults to the input. When they are the same file, the input is moved aside
     * with renameDuplicate and the returned input names the backup (prefix restored).
     * @param input_file Input dataset name (may carry a prefix)
     * @param output_file Output path, may be empty
     * @throws InputError if input_file is empty
     */
    static DatasetNames getDatasetNames(const std::string& input_file, const std::string& output_file);

    /**
     * Check whether outputs of a driver are distributed as an archive (ESRI Shapefile, KML)
     */
    static bool requiresZip(const std::string& driver);

    /**
     * Archive name for an output: .kml becomes .kmz, everything else gets .zip
     */
    static std::string getZipName(const std::string& file_name);

    /**
     * Compress a file or a directory into a zip archive
     * Directory contents are stored flattened under their base names. A single file is stored
     * with the files sharing its stem (shapefile sidecars). An existing archive is appended to.
     * @param in_file File or directory to compress
     * @param out_file Archive path
     * @return out_file
     * @throws ConversionError if the archive cannot be written
     */
    static std::string createZipFile(const std::string& in_file, const std::string& out_file);

private:
    static void addFileToZip(void* zip, const boost::filesystem::path& file, const std::string& archive_name);

    // Disable instantiation
    FileStaging() = delete;
};

/**
 * Owner of a generated file, removed when the owner goes away
 */
class TemporaryFile {
public:
    /**
     * Take ownership of a path
     * @param path File to remove on destruction
     */
    explicit TemporaryFile(std::string path);
    ~TemporaryFile();

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    /**
     * Reserve a unique name in the system temporary directory
     * @param extension File extension including the dot (e.g. ".geojson")
     */
    static std::string uniquePath(const std::string& extension);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_FILE_STAGING_HPP

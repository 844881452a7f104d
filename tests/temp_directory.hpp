#ifndef GEOCONVERT_TESTS_TEMP_DIRECTORY_HPP
#define GEOCONVERT_TESTS_TEMP_DIRECTORY_HPP

#include <fstream>
#include <iterator>
#include <string>
#include <boost/filesystem.hpp>

namespace geoconvert {
namespace test_support {

// Fresh directory under the system temp dir, removed with its contents
class TempDirectory {
public:
    TempDirectory()
        : path_(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("geoconvert-test-%%%%-%%%%")) {
        boost::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    // Create a file with some content and return its path
    std::string touch(const std::string& name, const std::string& content = "data") const {
        std::string path = file(name);
        std::ofstream(path) << content;
        return path;
    }

    const boost::filesystem::path& path() const { return path_; }

private:
    boost::filesystem::path path_;
};

// Whole content of a file, empty when it cannot be read
inline std::string readText(const std::string& path) {
    std::ifstream stream(path);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

} // namespace test_support
} // namespace geoconvert

#endif // GEOCONVERT_TESTS_TEMP_DIRECTORY_HPP

#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <filesystem>
#include <string>

// Creates a fresh directory under the system temp folder and removes it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& relative) const { return m_path / relative; }

private:
    std::filesystem::path m_path;
};

// Write `content` to `path`, creating parent folders.
void writeFile(const std::filesystem::path& path, const std::string& content);
std::string readFile(const std::filesystem::path& path);
// Uppercase CRC32 of a string, for building manifests that match written files.
std::string crcOf(const std::string& content);

#endif

#ifndef MANIFEST_SCANNER_HPP
#define MANIFEST_SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Produces a FileName,Size,CRC32,Path manifest for every file below a folder.
class ManifestScanner {
public:
    ManifestScanner(unsigned int threads, std::vector<std::string> extraColumns = {});

    // Scan `folder` recursively and write the manifest to `outputCsv`. Unreadable files are skipped.
    bool scan(const std::filesystem::path& folder, const std::filesystem::path& outputCsv);

    std::size_t rowsWritten() const { return m_rowsWritten; }
    std::size_t filesSkipped() const { return m_filesSkipped; }

private:
    unsigned int m_threads;
    std::vector<std::string> m_extraColumns;
    std::size_t m_rowsWritten = 0;
    std::size_t m_filesSkipped = 0;
};

#endif

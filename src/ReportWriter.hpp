#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "ConflictResolver.hpp"
#include "ManifestParser.hpp"

// Computes the destination a manifest entry would be moved to.
using DestinationResolver = std::function<std::filesystem::path(const ManifestEntry&)>;

// Writes the missing-files and conflict CSV reports.
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path reportFolder);

    // `<stem>_missing_files.csv` for one manifest; `timestamp` fills the TimeStamp column.
    bool writeMissingFiles(const std::filesystem::path& manifestPath,
                           const std::vector<ManifestEntry>& missing,
                           const DestinationResolver& expectedPath,
                           const std::string& timestamp,
                           std::filesystem::path& written);
    bool writeConflicts(const std::vector<ConflictRecord>& conflicts, std::filesystem::path& written);

    std::filesystem::path missingFilesPath(const std::filesystem::path& manifestPath) const;
    std::filesystem::path conflictReportPath() const;

    // Last-write time of `path` as "YYYY-MM-DD HH:MM:SS" (UTC); empty when unavailable.
    static std::string fileTimestamp(const std::filesystem::path& path);

private:
    bool ensureFolder();

    std::filesystem::path m_reportFolder;
};

#endif

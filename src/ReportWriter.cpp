#include "ReportWriter.hpp"

#include <ctime>
#include <fstream>
#include <iostream>
#include <system_error>

#include <sys/stat.h>

#include "Csv.hpp"

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kMissingHeader = {
    "FileName", "Size", "CRC32", "Path", "Comment", "ExpectedPath", "OriginalCSV", "TimeStamp"};

const std::vector<std::string> kConflictHeader = {
    "FileName", "Size", "CRC32", "Path", "Comment", "SourceFullPath", "DestinationPath",
    "SourceSize", "DestSize", "SizeMatch", "SourceCRC", "DestCRC", "CRCMatch", "Notes"};

std::string yesNo(bool value) {
    return value ? "Yes" : "No";
}

} // namespace

ReportWriter::ReportWriter(fs::path reportFolder) : m_reportFolder(std::move(reportFolder)) {}

fs::path ReportWriter::missingFilesPath(const fs::path& manifestPath) const {
    return m_reportFolder / (manifestPath.stem().string() + "_missing_files.csv");
}

fs::path ReportWriter::conflictReportPath() const {
    return m_reportFolder / "conflicts.csv";
}

bool ReportWriter::ensureFolder() {
    std::error_code ec;
    fs::create_directories(m_reportFolder, ec);
    if (ec) {
        std::cerr << "Failed to create report folder `" << m_reportFolder.string() << "`: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool ReportWriter::writeMissingFiles(const fs::path& manifestPath,
                                     const std::vector<ManifestEntry>& missing,
                                     const DestinationResolver& expectedPath,
                                     const std::string& timestamp,
                                     fs::path& written) {
    if (!ensureFolder()) {
        return false;
    }

    written = missingFilesPath(manifestPath);
    std::ofstream out(written, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open missing-files report `" << written.string() << "`" << std::endl;
        return false;
    }

    const std::string originalCsv = manifestPath.filename().string();
    writeCsvRow(out, kMissingHeader);
    for (const auto& entry : missing) {
        writeCsvRow(out, {entry.fileName, entry.rawSize, entry.rawChecksum, entry.rawPath, entry.comment,
                          expectedPath(entry).string(), originalCsv, timestamp});
    }

    out.flush();
    if (!out) {
        std::cerr << "Failed to write missing-files report `" << written.string() << "`" << std::endl;
        return false;
    }
    return true;
}

bool ReportWriter::writeConflicts(const std::vector<ConflictRecord>& conflicts, fs::path& written) {
    if (!ensureFolder()) {
        return false;
    }

    written = conflictReportPath();
    std::ofstream out(written, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open conflict report `" << written.string() << "`" << std::endl;
        return false;
    }

    writeCsvRow(out, kConflictHeader);
    for (const auto& conflict : conflicts) {
        const ManifestEntry& entry = conflict.entry;
        std::string sourceSize;
        std::string destinationSize;
        std::string sourceCrc;
        std::string destinationCrc;
        std::string sizeMatch;
        std::string crcMatch;

        if (conflict.sourceSum) {
            sourceSize = std::to_string(conflict.sourceSum->size);
            sourceCrc = conflict.sourceSum->checksum;
        }
        if (conflict.destinationSum) {
            destinationSize = std::to_string(conflict.destinationSum->size);
            destinationCrc = conflict.destinationSum->checksum;
        }
        if (conflict.sourceSum && conflict.destinationSum) {
            sizeMatch = yesNo(conflict.sourceSum->size == conflict.destinationSum->size);
            if (!sourceCrc.empty() && !destinationCrc.empty()) {
                crcMatch = yesNo(sourceCrc == destinationCrc);
            }
        }

        writeCsvRow(out, {entry.fileName, std::to_string(entry.size), entry.checksum, entry.rawPath, entry.comment,
                          conflict.sourcePath.string(), conflict.destinationPath.string(), sourceSize,
                          destinationSize, sizeMatch, sourceCrc, destinationCrc, crcMatch, conflictNote(conflict)});
    }

    out.flush();
    if (!out) {
        std::cerr << "Failed to write conflict report `" << written.string() << "`" << std::endl;
        return false;
    }
    return true;
}

std::string ReportWriter::fileTimestamp(const fs::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return {};
    }

    const std::time_t modified = info.st_mtime;
    std::tm utc {};
    if (gmtime_r(&modified, &utc) == nullptr) {
        return {};
    }

    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &utc) == 0) {
        return {};
    }
    return buffer;
}

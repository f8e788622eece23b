#ifndef MANIFEST_PARSER_HPP
#define MANIFEST_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "RunIssue.hpp"

// One expected file described by a manifest row. The raw* members keep the row's original text.
struct ManifestEntry {
    std::string fileName;
    std::uintmax_t size = 0;
    std::string checksum;
    std::filesystem::path relativePath;
    std::string comment;
    std::string manifestId;
    std::size_t rowIndex = 0;
    std::size_t lineNumber = 0;
    std::string rawSize;
    std::string rawChecksum;
    std::string rawPath;
};

struct ParsedManifest {
    std::string manifestId;
    std::vector<ManifestEntry> entries;
    std::vector<RunIssue> issues;
    bool headerDetected = false;
    std::size_t duplicateRowCount = 0;
};

// Reads FileName,Size,CRC32,Path,Comment manifests, tolerating the quirks of historical exports.
class ManifestParser {
public:
    // Parse manifest text. Bad rows are dropped and recorded as issues; nothing here is fatal.
    ParsedManifest parse(const std::string& text, const std::string& manifestId) const;
    // Read and parse a manifest file; returns false and sets `ec` when the file cannot be read.
    bool parseFile(const std::filesystem::path& path, ParsedManifest& out, std::error_code& ec) const;

    // True when the row's first field names a file column or its third field names a checksum column.
    static bool isHeaderRow(const std::vector<std::string>& fields);
    // A single path component: no separator, no root, not `.` or `..`.
    static bool isPlainFileName(const std::string& name);
    // Trim, drop a bare "," value, convert either slash to the platform separator, strip outer separators.
    static std::filesystem::path normalizeManifestPath(const std::string& raw);
    // Accept exactly 8 hex digits (surrounding whitespace ignored); writes the uppercase form.
    static bool normalizeChecksum(const std::string& raw, std::string& checksum);
    static bool parseSize(const std::string& raw, std::uintmax_t& size);
};

#endif

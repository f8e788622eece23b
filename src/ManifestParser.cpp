#include "ManifestParser.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unordered_map>

#include "CandidateIndex.hpp"
#include "Csv.hpp"

namespace fs = std::filesystem;

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";
constexpr std::size_t kMinimumFields = 4;

void addIssue(ParsedManifest& manifest, IssueKind kind, std::size_t lineNumber, const std::string& message) {
    const std::string subject = manifest.manifestId + ":" + std::to_string(lineNumber);
    std::cerr << "Warning: " << manifest.manifestId << " line " << lineNumber << ": " << message << std::endl;
    manifest.issues.push_back({kind, subject, message});
}

std::string joinComment(const std::vector<std::string>& fields) {
    // Historical exports leave commas in comments unquoted, so everything after Path is one comment.
    std::string comment;
    for (std::size_t i = kMinimumFields; i < fields.size(); ++i) {
        if (i > kMinimumFields) {
            comment.push_back(',');
        }
        comment += fields[i];
    }
    return trimWhitespace(comment);
}

void flagDuplicateKeys(ParsedManifest& manifest) {
    std::unordered_map<std::string, std::vector<std::size_t>> rowsByKey;
    for (const auto& entry : manifest.entries) {
        rowsByKey[makeCompositeKey(entry.checksum, entry.size)].push_back(entry.rowIndex);
    }

    // Report groups in order of their first row so warnings read top to bottom.
    for (const auto& entry : manifest.entries) {
        const std::string key = makeCompositeKey(entry.checksum, entry.size);
        auto it = rowsByKey.find(key);
        if (it == rowsByKey.end() || it->second.size() < 2 || it->second.front() != entry.rowIndex) {
            continue;
        }

        std::ostringstream lines;
        for (std::size_t i = 0; i < it->second.size(); ++i) {
            if (i > 0) {
                lines << ", ";
            }
            lines << manifest.entries[it->second[i]].lineNumber;
        }
        addIssue(manifest, IssueKind::DuplicateKeyWarning, entry.lineNumber,
                 "Duplicate CRC32 value found; CRC=" + entry.checksum + ", Size=" + std::to_string(entry.size) +
                     "; also used on lines: " + lines.str());
        manifest.duplicateRowCount += it->second.size();
    }
}

} // namespace

ParsedManifest ManifestParser::parse(const std::string& text, const std::string& manifestId) const {
    ParsedManifest result;
    result.manifestId = manifestId;

    std::string::size_type start = 0;
    if (text.compare(0, sizeof(kUtf8Bom) - 1, kUtf8Bom) == 0) {
        start = sizeof(kUtf8Bom) - 1;
    }

    std::istringstream stream(text.substr(start));
    std::string line;
    std::size_t lineNumber = 0;
    bool firstRow = true;
    std::vector<std::string> fields;

    while (std::getline(stream, line)) {
        ++lineNumber;
        if (trimWhitespace(line).empty()) {
            continue;
        }

        if (!splitCsvLine(line, fields)) {
            addIssue(result, IssueKind::ParseError, lineNumber, "Unterminated quoted field; using the rest of the line");
        }

        if (firstRow) {
            firstRow = false;
            if (isHeaderRow(fields)) {
                result.headerDetected = true;
                continue;
            }
        }

        if (fields.size() < kMinimumFields) {
            addIssue(result, IssueKind::ParseError, lineNumber,
                     "Insufficient fields (found " + std::to_string(fields.size()) + ", expected at least 4); row dropped");
            continue;
        }

        ManifestEntry entry;
        entry.fileName = trimWhitespace(fields[0]);
        if (entry.fileName.empty()) {
            addIssue(result, IssueKind::ParseError, lineNumber, "Empty filename; row dropped");
            continue;
        }
        if (!isPlainFileName(entry.fileName)) {
            addIssue(result, IssueKind::ParseError, lineNumber,
                     "Filename `" + entry.fileName + "` is not a bare file name; row dropped");
            continue;
        }

        if (!parseSize(fields[1], entry.size)) {
            addIssue(result, IssueKind::ParseError, lineNumber, "Invalid size `" + fields[1] + "`; row dropped");
            continue;
        }

        if (!normalizeChecksum(fields[2], entry.checksum)) {
            addIssue(result, IssueKind::ParseError, lineNumber, "Invalid CRC32 `" + fields[2] + "`; row dropped");
            continue;
        }

        entry.relativePath = normalizeManifestPath(fields[3]);
        entry.comment = joinComment(fields);
        entry.manifestId = manifestId;
        entry.rowIndex = result.entries.size();
        entry.lineNumber = lineNumber;
        entry.rawSize = fields[1];
        entry.rawChecksum = fields[2];
        entry.rawPath = fields[3];
        result.entries.push_back(std::move(entry));
    }

    flagDuplicateKeys(result);
    return result;
}

bool ManifestParser::parseFile(const fs::path& path, ParsedManifest& out, std::error_code& ec) const {
    ec.clear();

    std::error_code statErr;
    if (!fs::is_regular_file(path, statErr)) {
        ec = statErr ? statErr : std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        ec = std::make_error_code(std::errc::permission_denied);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    out = parse(text, path.filename().string());
    return true;
}

bool ManifestParser::isHeaderRow(const std::vector<std::string>& fields) {
    if (!fields.empty()) {
        const std::string first = toLowerAscii(trimWhitespace(fields[0]));
        if (first == "filename" || first == "file" || first == "name") {
            return true;
        }
    }
    if (fields.size() >= 3) {
        const std::string third = toLowerAscii(trimWhitespace(fields[2]));
        if (third == "crc32" || third == "crc" || third == "checksum") {
            return true;
        }
    }
    return false;
}

bool ManifestParser::isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string::npos && !fs::path(name).has_root_path();
}

fs::path ManifestParser::normalizeManifestPath(const std::string& raw) {
    const std::string trimmed = trimWhitespace(raw);
    // Some exports wrote a lone delimiter (sometimes still quoted) where the path should be empty.
    if (trimmed == "," || trimmed == "\",\"") {
        return {};
    }

    fs::path result;
    std::string segment;
    auto flushSegment = [&]() {
        const std::string part = trimWhitespace(segment);
        segment.clear();
        if (part.empty() || part == "." || part == "..") {
            return;
        }
        result /= part;
    };

    for (char ch : trimmed) {
        if (ch == '/' || ch == '\\') {
            flushSegment();
        } else {
            segment.push_back(ch);
        }
    }
    flushSegment();
    return result;
}

bool ManifestParser::normalizeChecksum(const std::string& raw, std::string& checksum) {
    const std::string trimmed = trimWhitespace(raw);
    if (trimmed.size() != 8) {
        return false;
    }

    std::string upper;
    upper.reserve(8);
    for (char ch : trimmed) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    checksum = std::move(upper);
    return true;
}

bool ManifestParser::parseSize(const std::string& raw, std::uintmax_t& size) {
    const std::string trimmed = trimWhitespace(raw);
    if (trimmed.empty()) {
        return false;
    }

    std::uintmax_t value = 0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    auto [ptr, err] = std::from_chars(first, last, value);
    if (err != std::errc() || ptr != last) {
        return false;
    }
    size = value;
    return true;
}

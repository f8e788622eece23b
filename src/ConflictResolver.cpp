#include "ConflictResolver.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include "Csv.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kStoreFieldCount = 13;

std::vector<std::string> toStoreRow(const ConflictRecord& record) {
    const ManifestEntry& entry = record.entry;
    return {entry.manifestId,
            std::to_string(entry.rowIndex),
            std::to_string(entry.lineNumber),
            entry.fileName,
            entry.rawSize,
            entry.rawChecksum,
            entry.rawPath,
            entry.comment,
            std::to_string(entry.size),
            entry.checksum,
            entry.relativePath.string(),
            record.sourcePath.string(),
            record.destinationPath.string()};
}

bool fromStoreRow(const std::vector<std::string>& fields, ConflictRecord& record) {
    if (fields.size() != kStoreFieldCount) {
        return false;
    }

    std::uintmax_t rowIndex = 0;
    std::uintmax_t lineNumber = 0;
    ManifestEntry entry;
    if (!ManifestParser::parseSize(fields[1], rowIndex) || !ManifestParser::parseSize(fields[2], lineNumber) ||
        !ManifestParser::parseSize(fields[8], entry.size)) {
        return false;
    }

    entry.manifestId = fields[0];
    entry.rowIndex = static_cast<std::size_t>(rowIndex);
    entry.lineNumber = static_cast<std::size_t>(lineNumber);
    entry.fileName = fields[3];
    entry.rawSize = fields[4];
    entry.rawChecksum = fields[5];
    entry.rawPath = fields[6];
    entry.comment = fields[7];
    entry.checksum = fields[9];
    entry.relativePath = fields[10];

    record = ConflictRecord{};
    record.entry = std::move(entry);
    record.sourcePath = fields[11];
    record.destinationPath = fields[12];
    return true;
}

} // namespace

const char* resolutionStateName(ResolutionState state) {
    switch (state) {
    case ResolutionState::Unverified:
        return "Unverified";
    case ResolutionState::Match:
        return "Match";
    case ResolutionState::SizeDiffers:
        return "SizeDiffers";
    case ResolutionState::ChecksumDiffers:
        return "ChecksumDiffers";
    case ResolutionState::DestinationMissing:
        return "DestinationMissing";
    }
    return "Unknown";
}

ResolutionState classifyConflict(const FileChecksum& source, const std::optional<FileChecksum>& destination) {
    if (!destination) {
        return ResolutionState::DestinationMissing;
    }
    if (source.size != destination->size) {
        return ResolutionState::SizeDiffers;
    }
    if (source.checksum != destination->checksum) {
        return ResolutionState::ChecksumDiffers;
    }
    return ResolutionState::Match;
}

std::string conflictNote(const ConflictRecord& record) {
    switch (record.state) {
    case ResolutionState::DestinationMissing:
        return "Destination missing";
    case ResolutionState::SizeDiffers:
        return "Size differs";
    case ResolutionState::ChecksumDiffers:
        return "CRC differs";
    case ResolutionState::Match:
        return "Match";
    case ResolutionState::Unverified:
        break;
    }
    return record.note.empty() ? "Not verified" : record.note;
}

ConflictResolver::ConflictResolver(fs::path storePath, bool dryRun)
    : m_storePath(std::move(storePath)), m_dryRun(dryRun) {}

bool ConflictResolver::begin(std::string& error) {
    error.clear();
    m_buffer.clear();
    m_retained.clear();
    m_flushedCount = 0;
    if (m_dryRun) {
        return true;
    }

    std::error_code ec;
    if (fs::exists(m_storePath, ec)) {
        std::cout << "Removing stale conflict store `" << m_storePath.string() << "`" << std::endl;
        fs::remove(m_storePath, ec);
    }
    if (ec) {
        error = "Unable to reset conflict store `" + m_storePath.string() + "`: " + ec.message();
        return false;
    }
    return true;
}

void ConflictResolver::record(const ManifestEntry& entry, const fs::path& sourcePath, const fs::path& destinationPath) {
    ConflictRecord conflict;
    conflict.entry = entry;
    conflict.sourcePath = sourcePath;
    conflict.destinationPath = destinationPath;
    m_buffer.push_back(std::move(conflict));
}

bool ConflictResolver::flushManifest(std::string& error) {
    error.clear();
    if (m_buffer.empty()) {
        return true;
    }

    if (m_dryRun) {
        for (auto& conflict : m_buffer) {
            m_retained.push_back(std::move(conflict));
        }
        m_buffer.clear();
        return true;
    }

    std::error_code ec;
    const fs::path folder = m_storePath.parent_path();
    if (!folder.empty()) {
        fs::create_directories(folder, ec);
    }

    std::ofstream store;
    if (!ec) {
        store.open(m_storePath, std::ios::app);
    }
    if (ec || !store) {
        // Keep the records in memory so the end-of-run report still has them.
        error = "Unable to write conflict store `" + m_storePath.string() + "`" + (ec ? ": " + ec.message() : "");
        for (auto& conflict : m_buffer) {
            m_retained.push_back(std::move(conflict));
        }
        m_buffer.clear();
        return false;
    }

    for (const auto& conflict : m_buffer) {
        writeCsvRow(store, toStoreRow(conflict));
    }
    store.flush();
    if (!store) {
        error = "Write to conflict store `" + m_storePath.string() + "` failed";
        for (auto& conflict : m_buffer) {
            m_retained.push_back(std::move(conflict));
        }
        m_buffer.clear();
        return false;
    }

    m_flushedCount += m_buffer.size();
    m_buffer.clear();
    return true;
}

bool ConflictResolver::consolidate(std::vector<ConflictRecord>& records, std::string& error) {
    error.clear();
    records.clear();

    bool ok = true;
    if (!m_dryRun && m_flushedCount > 0) {
        std::ifstream store(m_storePath);
        if (!store) {
            error = "Unable to read conflict store `" + m_storePath.string() + "`";
            ok = false;
        } else {
            std::vector<std::string> fields;
            std::size_t lineNumber = 0;
            bool terminated = true;
            while (true) {
                const std::size_t firstLine = lineNumber + 1;
                if (!readCsvRecord(store, fields, lineNumber, terminated)) {
                    break;
                }
                ConflictRecord conflict;
                if (!terminated || !fromStoreRow(fields, conflict)) {
                    std::cerr << "Warning: unreadable conflict store row " << firstLine << std::endl;
                    m_issues.push_back({IssueKind::ParseError, m_storePath.string() + ":" + std::to_string(firstLine),
                                        "Unreadable conflict store row"});
                    continue;
                }
                records.push_back(std::move(conflict));
            }
            store.close();

            std::error_code ec;
            fs::remove(m_storePath, ec);
            if (ec) {
                std::cerr << "Failed to remove conflict store `" << m_storePath.string() << "`: " << ec.message()
                          << std::endl;
            }
        }
    }

    for (auto& conflict : m_retained) {
        records.push_back(std::move(conflict));
    }
    m_retained.clear();
    m_flushedCount = 0;
    return ok;
}

VerificationMode ConflictResolver::verify(std::vector<ConflictRecord>& records,
                                          unsigned int threads,
                                          std::size_t threshold,
                                          bool autoConfirm,
                                          const ConfirmCallback& confirm) {
    std::vector<ConflictRecord*> pending;
    for (auto& conflict : records) {
        if (conflict.state == ResolutionState::Unverified) {
            pending.push_back(&conflict);
        }
    }
    if (pending.empty()) {
        return VerificationMode::Skipped;
    }

    bool fullPass = true;
    if (pending.size() > threshold && !autoConfirm) {
        fullPass = confirm ? confirm(pending.size()) : false;
    }

    if (!fullPass) {
        std::cout << "Checksum verification declined; comparing sizes of " << pending.size() << " conflict(s)."
                  << std::endl;
        verifySizes(pending);
        return VerificationMode::SizeOnly;
    }

    std::cout << "Verifying " << pending.size() << " conflict(s) by checksum..." << std::endl;
    verifyChecksums(pending, threads);
    return VerificationMode::Full;
}

void ConflictResolver::verifyChecksums(std::vector<ConflictRecord*>& pending, unsigned int threads) {
    std::vector<fs::path> paths;
    paths.reserve(pending.size() * 2);
    for (const ConflictRecord* conflict : pending) {
        paths.push_back(conflict->sourcePath);
        paths.push_back(conflict->destinationPath);
    }

    const std::vector<HashedFile> hashed = computeChecksums(paths, threads);

    for (std::size_t i = 0; i < pending.size(); ++i) {
        ConflictRecord& conflict = *pending[i];
        const HashedFile& source = hashed[i * 2];
        const HashedFile& destination = hashed[i * 2 + 1];

        if (destination.ec == std::errc::no_such_file_or_directory) {
            if (!source.ec) {
                conflict.sourceSum = source.sum;
            }
            conflict.state = ResolutionState::DestinationMissing;
            continue;
        }

        if (source.ec) {
            std::cerr << "Warning: cannot verify `" << source.path.string() << "`: " << source.ec.message() << std::endl;
            m_issues.push_back({IssueKind::ChecksumComputeError, source.path.string(), source.ec.message()});
            conflict.note = "Source unreadable";
            continue;
        }
        if (destination.ec) {
            std::cerr << "Warning: cannot verify `" << destination.path.string() << "`: " << destination.ec.message()
                      << std::endl;
            m_issues.push_back({IssueKind::ChecksumComputeError, destination.path.string(), destination.ec.message()});
            conflict.sourceSum = source.sum;
            conflict.note = "Destination unreadable";
            continue;
        }

        conflict.sourceSum = source.sum;
        conflict.destinationSum = destination.sum;
        conflict.state = classifyConflict(source.sum, destination.sum);
    }
}

void ConflictResolver::verifySizes(std::vector<ConflictRecord*>& pending) {
    for (ConflictRecord* conflict : pending) {
        std::error_code destErr;
        const bool destinationExists = fs::exists(conflict->destinationPath, destErr);
        if (!destErr && !destinationExists) {
            conflict->state = ResolutionState::DestinationMissing;
            continue;
        }

        std::error_code sourceErr;
        const std::uintmax_t sourceSize = fs::file_size(conflict->sourcePath, sourceErr);
        const std::uintmax_t destinationSize = destErr ? 0 : fs::file_size(conflict->destinationPath, destErr);
        if (sourceErr || destErr) {
            conflict->note = sourceErr ? "Source unreadable" : "Destination unreadable";
            continue;
        }

        FileChecksum sourceSum;
        sourceSum.size = sourceSize;
        FileChecksum destinationSum;
        destinationSum.size = destinationSize;
        conflict->sourceSum = sourceSum;
        conflict->destinationSum = destinationSum;

        if (sourceSize != destinationSize) {
            conflict->state = ResolutionState::SizeDiffers;
        } else {
            conflict->note = "Size matches; CRC not checked";
        }
    }
}

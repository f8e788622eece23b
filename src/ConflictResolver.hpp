#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ChecksumComputer.hpp"
#include "ManifestParser.hpp"
#include "RunIssue.hpp"

enum class ResolutionState {
    Unverified,
    Match,
    SizeDiffers,
    ChecksumDiffers,
    DestinationMissing
};

const char* resolutionStateName(ResolutionState state);

// A skipped move whose destination already held a file.
struct ConflictRecord {
    ManifestEntry entry;
    std::filesystem::path sourcePath;
    std::filesystem::path destinationPath;
    ResolutionState state = ResolutionState::Unverified;
    std::optional<FileChecksum> sourceSum;
    std::optional<FileChecksum> destinationSum;
    std::string note;
};

enum class VerificationMode {
    Skipped,
    Full,
    SizeOnly
};

// Compare a freshly computed source checksum against the destination (nullopt when it vanished).
ResolutionState classifyConflict(const FileChecksum& source, const std::optional<FileChecksum>& destination);

// Report text for the Notes column.
std::string conflictNote(const ConflictRecord& record);

// Asked before a full verification pass over `pending` conflicts when the threshold is exceeded.
using ConfirmCallback = std::function<bool(std::size_t pending)>;

// Buffers conflicts per manifest, spills them to a temporary CSV store, and verifies them at end of run.
class ConflictResolver {
public:
    ConflictResolver(std::filesystem::path storePath, bool dryRun);

    // Drop a store left behind by an interrupted run.
    bool begin(std::string& error);
    void record(const ManifestEntry& entry,
                const std::filesystem::path& sourcePath,
                const std::filesystem::path& destinationPath);
    // Append the current manifest's conflicts to the store and clear the buffer.
    bool flushManifest(std::string& error);
    // Read every stored conflict back and remove the store.
    bool consolidate(std::vector<ConflictRecord>& records, std::string& error);

    // Classify every unverified record. Above `threshold` pending records the pass needs `confirm`
    // (or `autoConfirm`); when declined only sizes are compared.
    VerificationMode verify(std::vector<ConflictRecord>& records,
                            unsigned int threads,
                            std::size_t threshold,
                            bool autoConfirm,
                            const ConfirmCallback& confirm);

    std::size_t bufferedCount() const { return m_buffer.size(); }
    std::size_t flushedCount() const { return m_flushedCount; }
    const std::filesystem::path& storePath() const { return m_storePath; }
    const std::vector<RunIssue>& issues() const { return m_issues; }

private:
    void verifyChecksums(std::vector<ConflictRecord*>& pending, unsigned int threads);
    void verifySizes(std::vector<ConflictRecord*>& pending);

    std::filesystem::path m_storePath;
    bool m_dryRun;
    std::vector<ConflictRecord> m_buffer;
    std::vector<ConflictRecord> m_retained;
    std::size_t m_flushedCount = 0;
    std::vector<RunIssue> m_issues;
};

#endif

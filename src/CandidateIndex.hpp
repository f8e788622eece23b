#ifndef CANDIDATE_INDEX_HPP
#define CANDIDATE_INDEX_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "RunIssue.hpp"

using CandidateId = std::size_t;

// One physical file in the candidate pool. Only the claim fields and `moved` change after indexing.
struct CandidateFile {
    CandidateId id = 0;
    std::filesystem::path path;
    std::uintmax_t size = 0;
    std::string checksum;
    std::optional<std::string> claimedBy;
    std::size_t claimRow = 0;
    bool moved = false;
};

// Serialize (checksum, size) as "CHECKSUM:SIZE" with an uppercase checksum.
std::string makeCompositeKey(const std::string& checksum, std::uintmax_t size);

// Arena of candidate files plus the composite-key lookup. Every key maps to an ordered id list.
class CandidateIndex {
public:
    // Append a file; ids are dense and assigned in insertion order.
    CandidateId add(std::filesystem::path path, std::uintmax_t size, std::string checksum);
    // Candidates sharing `key`, in insertion order; empty when the key is unknown.
    const std::vector<CandidateId>& candidatesFor(const std::string& key) const;

    const CandidateFile& file(CandidateId id) const;
    CandidateFile& file(CandidateId id);
    const std::vector<CandidateFile>& files() const { return m_files; }

    std::size_t size() const { return m_files.size(); }
    std::size_t keyCount() const { return m_byKey.size(); }

private:
    std::vector<CandidateFile> m_files;
    std::unordered_map<std::string, std::vector<CandidateId>> m_byKey;
};

// Collect regular files below `root` in sorted path order, pruning any directory listed in `excluded`.
// Returns false when `root` cannot be enumerated at all.
bool collectRegularFiles(const std::filesystem::path& root,
                         const std::vector<std::filesystem::path>& excluded,
                         std::vector<std::filesystem::path>& files);

// Builds the candidate index for one run: enumerate, hash under a bounded pool, aggregate on the caller's thread.
class CandidateIndexer {
public:
    explicit CandidateIndexer(unsigned int threads, std::vector<std::filesystem::path> excludedDirs = {});

    // Index every readable regular file below `root`; unreadable files are skipped and recorded in issues().
    bool build(const std::filesystem::path& root, CandidateIndex& index);
    const std::vector<RunIssue>& issues() const { return m_issues; }

private:
    unsigned int m_threads;
    std::vector<std::filesystem::path> m_excludedDirs;
    std::vector<RunIssue> m_issues;
};

#endif

#ifndef CLAIM_ARBITER_HPP
#define CLAIM_ARBITER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "CandidateIndex.hpp"
#include "ManifestParser.hpp"

enum class ClaimOutcome {
    Assigned,
    NotFound,
    ClaimedByOther
};

const char* claimOutcomeName(ClaimOutcome outcome);

// Written once per successful claim and never changed afterwards.
struct ClaimRecord {
    CandidateId candidateId = 0;
    std::filesystem::path candidatePath;
    std::string claimedByManifest;
    std::size_t rowIndex = 0;
    std::chrono::system_clock::time_point timestamp;
};

// Result of resolving one manifest row. `claim` is the winning claim for Assigned and the
// blocking claim for ClaimedByOther.
struct RowResolution {
    ManifestEntry entry;
    ClaimOutcome outcome = ClaimOutcome::NotFound;
    std::optional<CandidateId> candidateId;
    std::optional<ClaimRecord> claim;
};

// Sequential first-available assignment of pool files to manifest rows.
// A candidate is claimed by at most one row per run; claims are never released.
class ClaimArbiter {
public:
    explicit ClaimArbiter(CandidateIndex& index);

    // Resolve a single row against the pool, claiming the first unclaimed candidate of its key.
    RowResolution resolve(const ManifestEntry& entry);
    // Resolve every row of one manifest in row order.
    std::vector<RowResolution> resolveManifest(const std::vector<ManifestEntry>& entries);

    // Record that a claimed file left the pool after a successful move.
    void markMoved(CandidateId id);

    const std::vector<ClaimRecord>& claims() const { return m_claims; }
    const ClaimRecord* claimFor(CandidateId id) const;
    std::size_t claimCount() const { return m_claims.size(); }

private:
    CandidateIndex& m_index;
    std::vector<ClaimRecord> m_claims;
    std::unordered_map<CandidateId, std::size_t> m_claimByCandidate;
};

#endif

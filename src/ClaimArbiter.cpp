#include "ClaimArbiter.hpp"

const char* claimOutcomeName(ClaimOutcome outcome) {
    switch (outcome) {
    case ClaimOutcome::Assigned:
        return "Assigned";
    case ClaimOutcome::NotFound:
        return "NotFound";
    case ClaimOutcome::ClaimedByOther:
        return "ClaimedByOther";
    }
    return "Unknown";
}

ClaimArbiter::ClaimArbiter(CandidateIndex& index) : m_index(index) {}

RowResolution ClaimArbiter::resolve(const ManifestEntry& entry) {
    RowResolution resolution;
    resolution.entry = entry;

    const std::vector<CandidateId>& candidates = m_index.candidatesFor(makeCompositeKey(entry.checksum, entry.size));
    if (candidates.empty()) {
        resolution.outcome = ClaimOutcome::NotFound;
        return resolution;
    }

    const ClaimRecord* blocking = nullptr;
    for (CandidateId id : candidates) {
        CandidateFile& candidate = m_index.file(id);
        if (candidate.claimedBy || candidate.moved) {
            if (blocking == nullptr) {
                blocking = claimFor(id);
            }
            continue;
        }

        candidate.claimedBy = entry.manifestId;
        candidate.claimRow = entry.rowIndex;

        ClaimRecord record;
        record.candidateId = id;
        record.candidatePath = candidate.path;
        record.claimedByManifest = entry.manifestId;
        record.rowIndex = entry.rowIndex;
        record.timestamp = std::chrono::system_clock::now();
        m_claimByCandidate.emplace(id, m_claims.size());
        m_claims.push_back(record);

        resolution.outcome = ClaimOutcome::Assigned;
        resolution.candidateId = id;
        resolution.claim = std::move(record);
        return resolution;
    }

    resolution.outcome = ClaimOutcome::ClaimedByOther;
    if (blocking != nullptr) {
        resolution.candidateId = blocking->candidateId;
        resolution.claim = *blocking;
    }
    return resolution;
}

std::vector<RowResolution> ClaimArbiter::resolveManifest(const std::vector<ManifestEntry>& entries) {
    std::vector<RowResolution> resolutions;
    resolutions.reserve(entries.size());
    for (const auto& entry : entries) {
        resolutions.push_back(resolve(entry));
    }
    return resolutions;
}

void ClaimArbiter::markMoved(CandidateId id) {
    m_index.file(id).moved = true;
}

const ClaimRecord* ClaimArbiter::claimFor(CandidateId id) const {
    auto it = m_claimByCandidate.find(id);
    if (it == m_claimByCandidate.end()) {
        return nullptr;
    }
    return &m_claims[it->second];
}

#include "CompletenessEvaluator.hpp"

#include <filesystem>

#include "Csv.hpp"

const char* manifestStatusName(ManifestStatus status) {
    switch (status) {
    case ManifestStatus::Complete:
        return "Complete";
    case ManifestStatus::Partial:
        return "Partial";
    case ManifestStatus::Zero:
        return "Zero";
    }
    return "Unknown";
}

bool matchesPattern(const std::string& pattern, const std::string& name) {
    const std::string p = toLowerAscii(pattern);
    const std::string n = toLowerAscii(name);

    std::size_t pi = 0;
    std::size_t ni = 0;
    std::size_t starPos = std::string::npos;
    std::size_t resumeAt = 0;

    while (ni < n.size()) {
        if (pi < p.size() && (p[pi] == '?' || p[pi] == n[ni])) {
            ++pi;
            ++ni;
        } else if (pi < p.size() && p[pi] == '*') {
            starPos = pi++;
            resumeAt = ni;
        } else if (starPos != std::string::npos) {
            pi = starPos + 1;
            ni = ++resumeAt;
        } else {
            return false;
        }
    }

    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

namespace {

bool anyMatches(const std::vector<std::string>& patterns, const std::string& manifestName) {
    const std::string stem = std::filesystem::path(manifestName).stem().string();
    for (const auto& pattern : patterns) {
        if (matchesPattern(pattern, manifestName) || matchesPattern(pattern, stem)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool OverridePolicy::validate(std::string& error) const {
    for (const auto& forced : forcedComplete) {
        for (const auto& moveOnly : forceMoveOnly) {
            if (toLowerAscii(forced) == toLowerAscii(moveOnly)) {
                error = "`" + forced + "` is listed in both forced_complete and force_move_only";
                return false;
            }
        }
    }
    return true;
}

bool OverridePolicy::validateFor(const std::string& manifestName, std::string& error) const {
    if (isForcedComplete(manifestName) && isForceMoveOnly(manifestName)) {
        error = "`" + manifestName + "` is selected by both forced_complete and force_move_only";
        return false;
    }
    return true;
}

bool OverridePolicy::isForcedComplete(const std::string& manifestName) const {
    return anyMatches(forcedComplete, manifestName);
}

bool OverridePolicy::isForceMoveOnly(const std::string& manifestName) const {
    return anyMatches(forceMoveOnly, manifestName);
}

CompletenessEvaluator::CompletenessEvaluator(OverridePolicy policy) : m_policy(std::move(policy)) {}

ManifestOutcome CompletenessEvaluator::evaluate(const std::string& manifestId,
                                                const std::vector<RowResolution>& resolutions,
                                                const std::vector<bool>& presentAtDestination) const {
    ManifestOutcome outcome;
    outcome.manifestId = manifestId;
    outcome.totalEntries = resolutions.size();

    for (std::size_t i = 0; i < resolutions.size(); ++i) {
        if (resolutions[i].outcome == ClaimOutcome::Assigned) {
            ++outcome.matchedCount;
        } else if (i < presentAtDestination.size() && presentAtDestination[i]) {
            ++outcome.alreadyPresentCount;
        } else {
            outcome.missingEntries.push_back(resolutions[i].entry);
        }
    }

    const std::size_t resolved = outcome.matchedCount + outcome.alreadyPresentCount;
    if (outcome.totalEntries > 0 && resolved == outcome.totalEntries) {
        outcome.status = ManifestStatus::Complete;
    } else if (resolved == 0) {
        outcome.status = ManifestStatus::Zero;
    } else {
        outcome.status = ManifestStatus::Partial;
    }

    if (outcome.status != ManifestStatus::Complete && m_policy.isForcedComplete(manifestId) &&
        (outcome.matchedCount > 0 || m_policy.allowEmptyForce)) {
        outcome.status = ManifestStatus::Complete;
        outcome.forced = true;
    }

    // Force-move-only manifests never leave the manifest folder, even once every row is resolved.
    if (m_policy.isForceMoveOnly(manifestId)) {
        if (outcome.matchedCount > 0) {
            outcome.action = ManifestAction::MoveMatchedOnly;
        }
    } else if (outcome.status == ManifestStatus::Complete) {
        outcome.action = ManifestAction::MoveAll;
    }

    return outcome;
}

#ifndef COMPLETENESS_EVALUATOR_HPP
#define COMPLETENESS_EVALUATOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "ClaimArbiter.hpp"
#include "ManifestParser.hpp"

enum class ManifestStatus {
    Complete,
    Partial,
    Zero
};

// What the run does with a manifest once its status is known.
enum class ManifestAction {
    MoveAll,
    MoveMatchedOnly,
    None
};

const char* manifestStatusName(ManifestStatus status);

struct ManifestOutcome {
    std::string manifestId;
    std::size_t totalEntries = 0;
    std::size_t matchedCount = 0;
    std::size_t alreadyPresentCount = 0;
    std::vector<ManifestEntry> missingEntries;
    ManifestStatus status = ManifestStatus::Zero;
    bool forced = false;
    ManifestAction action = ManifestAction::None;
};

// Case-insensitive match with `*` (any run) and `?` (one character) wildcards.
bool matchesPattern(const std::string& pattern, const std::string& name);

// Manifest names or patterns that change how incomplete manifests are treated.
struct OverridePolicy {
    std::vector<std::string> forcedComplete;
    std::vector<std::string> forceMoveOnly;
    bool allowEmptyForce = false;

    // Fails when one pattern appears in both lists; the two overrides are mutually exclusive.
    bool validate(std::string& error) const;
    // Fails when `manifestName` is selected by both lists.
    bool validateFor(const std::string& manifestName, std::string& error) const;

    bool isForcedComplete(const std::string& manifestName) const;
    bool isForceMoveOnly(const std::string& manifestName) const;
};

// Turns per-row resolutions into a manifest-level status and action.
class CompletenessEvaluator {
public:
    explicit CompletenessEvaluator(OverridePolicy policy);

    // `presentAtDestination[i]` marks rows already satisfied at their destination; it may be empty.
    ManifestOutcome evaluate(const std::string& manifestId,
                             const std::vector<RowResolution>& resolutions,
                             const std::vector<bool>& presentAtDestination) const;

    const OverridePolicy& policy() const { return m_policy; }

private:
    OverridePolicy m_policy;
};

#endif

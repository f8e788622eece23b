#ifndef ORGANIZER_HPP
#define ORGANIZER_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

#include "CandidateIndex.hpp"
#include "ClaimArbiter.hpp"
#include "CompletenessEvaluator.hpp"
#include "ConfigParser.hpp"
#include "ConflictResolver.hpp"
#include "MoveExecutor.hpp"
#include "ReportWriter.hpp"
#include "RunIssue.hpp"

// Totals for one run, filled in as manifests are processed.
struct RunSummary {
    std::size_t manifestsProcessed = 0;
    std::size_t manifestsSkipped = 0;
    std::size_t complete = 0;
    std::size_t partial = 0;
    std::size_t zero = 0;
    std::size_t filesMoved = 0;
    std::size_t filesSimulated = 0;
    std::size_t moveFailures = 0;
    std::size_t conflicts = 0;
    std::map<ResolutionState, std::size_t> conflictsByState;
    VerificationMode verification = VerificationMode::Skipped;
    std::vector<ManifestOutcome> outcomes;
    std::vector<std::filesystem::path> reportsWritten;
    std::vector<RunIssue> issues;
    bool aborted = false;

    // Anything short of every manifest Complete and every move done.
    bool hasIncompleteWork() const {
        return partial > 0 || zero > 0 || manifestsSkipped > 0 || moveFailures > 0;
    }
};

// Optional hooks for callers that want per-row and per-manifest results as they happen.
struct RunObserver {
    std::function<void(const RowResolution&)> onRowResolved;
    std::function<void(const ManifestOutcome&)> onManifestEvaluated;
};

// Drives one organizer run: index the pool, resolve manifests in name order, move, report.
class Organizer {
public:
    explicit Organizer(OrganizerConfig config);

    void setObserver(RunObserver observer);
    void setConfirmCallback(ConfirmCallback confirm);

    // Returns false only when the run could not start (configuration problems or an unreadable pool).
    bool run(RunSummary& summary);

    // `<destination>/<manifest stem>/<Path>/<FileName>` for one entry; empty when that would leave the
    // manifest's folder.
    std::filesystem::path destinationFor(const ManifestEntry& entry) const;
    const OrganizerConfig& config() const { return m_config; }

    // Manifest CSVs directly inside `folder`, sorted by file name, skipping files this tool writes.
    static bool listManifests(const std::filesystem::path& folder,
                              std::vector<std::filesystem::path>& manifests,
                              std::error_code& ec);
    static bool isGeneratedReport(const std::string& fileName);

private:
    bool validate(const std::vector<std::filesystem::path>& manifests, RunSummary& summary) const;
    std::vector<std::filesystem::path> excludedFolders() const;
    void processManifest(const std::filesystem::path& manifestPath,
                         ClaimArbiter& arbiter,
                         MoveExecutor& mover,
                         ConflictResolver& resolver,
                         ReportWriter& reports,
                         RunSummary& summary);
    bool presentAtDestination(const ManifestEntry& entry) const;
    void moveMatched(const std::vector<RowResolution>& resolutions,
                     ClaimArbiter& arbiter,
                     MoveExecutor& mover,
                     ConflictResolver& resolver,
                     RunSummary& summary);
    void moveManifestFile(const std::filesystem::path& manifestPath, MoveExecutor& mover, RunSummary& summary);
    void finishConflicts(ConflictResolver& resolver, ReportWriter& reports, RunSummary& summary);

    OrganizerConfig m_config;
    CompletenessEvaluator m_evaluator;
    RunObserver m_observer;
    ConfirmCallback m_confirm;
    CandidateIndex m_index;
};

// Print the end-of-run Complete/Partial/Zero summary.
void printSummary(const RunSummary& summary, bool dryRun, std::ostream& out);

#endif

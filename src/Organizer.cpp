#include "Organizer.hpp"

#include <algorithm>
#include <iostream>

#include "Csv.hpp"
#include "ManifestParser.hpp"

namespace fs = std::filesystem;

namespace {

constexpr char kConflictStoreName[] = ".crc_organizer_conflicts.tmp";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Organizer::Organizer(OrganizerConfig config)
    : m_config(std::move(config)), m_evaluator(m_config.overrides) {}

void Organizer::setObserver(RunObserver observer) {
    m_observer = std::move(observer);
}

void Organizer::setConfirmCallback(ConfirmCallback confirm) {
    m_confirm = std::move(confirm);
}

bool Organizer::isGeneratedReport(const std::string& fileName) {
    const std::string lower = toLowerAscii(fileName);
    return endsWith(lower, "_missing_files.csv") || endsWith(lower, "_repaired.csv") || lower == "conflicts.csv";
}

bool Organizer::listManifests(const fs::path& folder, std::vector<fs::path>& manifests, std::error_code& ec) {
    manifests.clear();
    ec.clear();

    fs::directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return false;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "Skipping manifest folder entry due to error: " << ec.message() << std::endl;
            ec.clear();
            continue;
        }

        std::error_code statusErr;
        if (!it->is_regular_file(statusErr) || statusErr) {
            continue;
        }

        const std::string name = it->path().filename().string();
        if (toLowerAscii(it->path().extension().string()) != ".csv" || isGeneratedReport(name)) {
            continue;
        }
        manifests.push_back(it->path());
    }

    std::sort(manifests.begin(), manifests.end(), [](const fs::path& lhs, const fs::path& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });
    return true;
}

fs::path Organizer::destinationFor(const ManifestEntry& entry) const {
    const fs::path folder = (fs::path(m_config.destinationFolder) / fs::path(entry.manifestId).stem()).lexically_normal();
    const fs::path destination = (folder / entry.relativePath / entry.fileName).lexically_normal();

    // Anything that does not land strictly below the manifest folder has no destination.
    const fs::path inside = destination.lexically_relative(folder);
    if (inside.empty() || inside == "." || *inside.begin() == "..") {
        return fs::path();
    }
    return destination;
}

std::vector<fs::path> Organizer::excludedFolders() const {
    std::vector<fs::path> excluded;
    for (const std::string* folder :
         {&m_config.destinationFolder, &m_config.manifestFolder, &m_config.reportFolder, &m_config.workFolder}) {
        if (!folder->empty()) {
            excluded.emplace_back(*folder);
        }
    }
    return excluded;
}

bool Organizer::validate(const std::vector<fs::path>& manifests, RunSummary& summary) const {
    bool ok = true;
    auto fail = [&](const std::string& subject, const std::string& message) {
        std::cerr << "Configuration error: " << message << std::endl;
        summary.issues.push_back({IssueKind::ConfigurationError, subject, message});
        ok = false;
    };

    std::error_code ec;
    if (!fs::is_directory(m_config.sourceFolder, ec)) {
        fail(m_config.sourceFolder, "source folder `" + m_config.sourceFolder + "` is not a folder");
    }

    std::string error;
    if (!m_config.overrides.validate(error)) {
        fail("overrides", error);
    }
    for (const auto& manifest : manifests) {
        if (!m_config.overrides.validateFor(manifest.filename().string(), error)) {
            fail(manifest.filename().string(), error);
        }
    }
    return ok;
}

bool Organizer::run(RunSummary& summary) {
    summary = RunSummary{};
    m_index = CandidateIndex{};

    if (m_config.dryRun) {
        std::cout << "Dry run: no files will be moved." << std::endl;
    }

    std::vector<fs::path> manifests;
    std::error_code ec;
    if (!listManifests(m_config.manifestFolder, manifests, ec)) {
        const std::string message =
            "unable to list manifest folder `" + m_config.manifestFolder + "`: " + ec.message();
        std::cerr << "Configuration error: " << message << std::endl;
        summary.issues.push_back({IssueKind::ConfigurationError, m_config.manifestFolder, message});
        summary.aborted = true;
        return false;
    }

    if (!validate(manifests, summary)) {
        summary.aborted = true;
        return false;
    }

    if (manifests.empty()) {
        std::cout << "No manifests found in `" << m_config.manifestFolder << "`." << std::endl;
    }

    CandidateIndexer indexer(m_config.threads, excludedFolders());
    if (!indexer.build(m_config.sourceFolder, m_index)) {
        summary.issues.push_back(
            {IssueKind::ConfigurationError, m_config.sourceFolder, "source folder could not be enumerated"});
        summary.aborted = true;
        return false;
    }
    summary.issues.insert(summary.issues.end(), indexer.issues().begin(), indexer.issues().end());

    ClaimArbiter arbiter(m_index);
    MoveExecutor mover(m_config.dryRun);
    ConflictResolver resolver(fs::path(m_config.workFolder) / kConflictStoreName, m_config.dryRun);
    ReportWriter reports(m_config.reportFolder);

    std::string error;
    if (!resolver.begin(error)) {
        std::cerr << "Warning: " << error << std::endl;
        summary.issues.push_back({IssueKind::ManifestIOError, resolver.storePath().string(), error});
    }

    for (const auto& manifestPath : manifests) {
        processManifest(manifestPath, arbiter, mover, resolver, reports, summary);
    }

    finishConflicts(resolver, reports, summary);
    return true;
}

bool Organizer::presentAtDestination(const ManifestEntry& entry) const {
    std::error_code ec;
    const fs::path destination = destinationFor(entry);
    if (destination.empty() || !fs::is_regular_file(destination, ec) || ec) {
        return false;
    }
    const std::uintmax_t size = fs::file_size(destination, ec);
    return !ec && size == entry.size;
}

void Organizer::processManifest(const fs::path& manifestPath,
                                ClaimArbiter& arbiter,
                                MoveExecutor& mover,
                                ConflictResolver& resolver,
                                ReportWriter& reports,
                                RunSummary& summary) {
    const std::string manifestName = manifestPath.filename().string();
    std::cout << "Processing manifest `" << manifestName << "`" << std::endl;

    ManifestParser parser;
    ParsedManifest parsed;
    std::error_code ec;
    if (!parser.parseFile(manifestPath, parsed, ec)) {
        std::cerr << "Failed to read manifest `" << manifestPath.string() << "`: " << ec.message() << std::endl;
        summary.issues.push_back({IssueKind::ManifestIOError, manifestName, ec.message()});
        ++summary.manifestsSkipped;
        return;
    }
    summary.issues.insert(summary.issues.end(), parsed.issues.begin(), parsed.issues.end());

    const std::vector<RowResolution> resolutions = arbiter.resolveManifest(parsed.entries);

    std::vector<bool> present(resolutions.size(), false);
    for (std::size_t i = 0; i < resolutions.size(); ++i) {
        if (resolutions[i].outcome != ClaimOutcome::Assigned) {
            present[i] = presentAtDestination(resolutions[i].entry);
        }
        if (m_observer.onRowResolved) {
            m_observer.onRowResolved(resolutions[i]);
        }
    }

    const ManifestOutcome outcome = m_evaluator.evaluate(manifestName, resolutions, present);
    ++summary.manifestsProcessed;
    switch (outcome.status) {
    case ManifestStatus::Complete:
        ++summary.complete;
        break;
    case ManifestStatus::Partial:
        ++summary.partial;
        break;
    case ManifestStatus::Zero:
        ++summary.zero;
        break;
    }

    std::cout << "  " << manifestStatusName(outcome.status) << (outcome.forced ? " (forced)" : "") << ": "
              << outcome.matchedCount << " matched, " << outcome.alreadyPresentCount << " already present, "
              << outcome.missingEntries.size() << " missing of " << outcome.totalEntries << std::endl;

    if (outcome.action != ManifestAction::None) {
        moveMatched(resolutions, arbiter, mover, resolver, summary);
    }
    if (outcome.action == ManifestAction::MoveAll) {
        moveManifestFile(manifestPath, mover, summary);
    }

    std::string error;
    if (!resolver.flushManifest(error)) {
        std::cerr << "Warning: " << error << "; keeping conflicts in memory." << std::endl;
        summary.issues.push_back({IssueKind::ManifestIOError, resolver.storePath().string(), error});
    }

    if (outcome.status == ManifestStatus::Zero) {
        std::cerr << "Warning: no file of `" << manifestName << "` was found." << std::endl;
    } else if ((outcome.status == ManifestStatus::Partial || outcome.forced) && !outcome.missingEntries.empty()) {
        fs::path written;
        const DestinationResolver expected = [this](const ManifestEntry& entry) { return destinationFor(entry); };
        if (reports.writeMissingFiles(manifestPath, outcome.missingEntries, expected,
                                      ReportWriter::fileTimestamp(manifestPath), written)) {
            std::cout << "  Missing-files report: `" << written.string() << "`" << std::endl;
            summary.reportsWritten.push_back(written);
        } else {
            summary.issues.push_back({IssueKind::ManifestIOError, reports.missingFilesPath(manifestPath).string(),
                                      "Unable to write missing-files report"});
        }
    }

    if (m_observer.onManifestEvaluated) {
        m_observer.onManifestEvaluated(outcome);
    }
    summary.outcomes.push_back(outcome);
}

void Organizer::moveMatched(const std::vector<RowResolution>& resolutions,
                            ClaimArbiter& arbiter,
                            MoveExecutor& mover,
                            ConflictResolver& resolver,
                            RunSummary& summary) {
    for (const auto& resolution : resolutions) {
        if (resolution.outcome != ClaimOutcome::Assigned || !resolution.candidateId) {
            continue;
        }

        const CandidateFile& candidate = m_index.file(*resolution.candidateId);
        const fs::path destination = destinationFor(resolution.entry);
        std::string error;
        if (destination.empty()) {
            error = "destination of `" + resolution.entry.fileName + "` falls outside `" + m_config.destinationFolder + "`";
            std::cerr << "Failed to move `" << candidate.path.string() << "`: " << error << std::endl;
            summary.issues.push_back({IssueKind::MoveError, candidate.path.string(), error});
            ++summary.moveFailures;
            continue;
        }
        switch (mover.moveFile(candidate.path, destination, error)) {
        case MoveResult::Moved:
            arbiter.markMoved(candidate.id);
            ++summary.filesMoved;
            break;
        case MoveResult::Simulated:
            ++summary.filesSimulated;
            break;
        case MoveResult::Conflict:
            resolver.record(resolution.entry, candidate.path, destination);
            ++summary.conflicts;
            break;
        case MoveResult::Failed:
            std::cerr << "Failed to move `" << candidate.path.string() << "`: " << error << std::endl;
            summary.issues.push_back({IssueKind::MoveError, candidate.path.string(), error});
            ++summary.moveFailures;
            break;
        }
    }
}

void Organizer::moveManifestFile(const fs::path& manifestPath, MoveExecutor& mover, RunSummary& summary) {
    const fs::path destination =
        fs::path(m_config.destinationFolder) / manifestPath.stem() / manifestPath.filename();
    std::string error;
    switch (mover.moveFile(manifestPath, destination, error)) {
    case MoveResult::Moved:
    case MoveResult::Simulated:
        break;
    case MoveResult::Conflict:
        error = "a manifest already exists at `" + destination.string() + "`";
        std::cerr << "Warning: leaving `" << manifestPath.string() << "` in place: " << error << std::endl;
        summary.issues.push_back({IssueKind::MoveError, manifestPath.string(), error});
        break;
    case MoveResult::Failed:
        std::cerr << "Failed to move manifest `" << manifestPath.string() << "`: " << error << std::endl;
        summary.issues.push_back({IssueKind::MoveError, manifestPath.string(), error});
        ++summary.moveFailures;
        break;
    }
}

void Organizer::finishConflicts(ConflictResolver& resolver, ReportWriter& reports, RunSummary& summary) {
    std::vector<ConflictRecord> conflicts;
    std::string error;
    if (!resolver.consolidate(conflicts, error)) {
        std::cerr << "Warning: " << error << std::endl;
        summary.issues.push_back({IssueKind::ManifestIOError, resolver.storePath().string(), error});
    }

    if (conflicts.empty()) {
        return;
    }

    if (m_config.verifyConflicts) {
        summary.verification = resolver.verify(conflicts, m_config.threads, m_config.conflictConfirmThreshold,
                                               m_config.autoConfirm, m_confirm);
    }
    summary.issues.insert(summary.issues.end(), resolver.issues().begin(), resolver.issues().end());

    for (const auto& conflict : conflicts) {
        ++summary.conflictsByState[conflict.state];
    }

    fs::path written;
    if (reports.writeConflicts(conflicts, written)) {
        std::cout << "Conflict report: `" << written.string() << "`" << std::endl;
        summary.reportsWritten.push_back(written);
    } else {
        summary.issues.push_back(
            {IssueKind::ManifestIOError, reports.conflictReportPath().string(), "Unable to write conflict report"});
    }
}

void printSummary(const RunSummary& summary, bool dryRun, std::ostream& out) {
    out << std::endl << (dryRun ? "Dry run summary" : "Run summary") << std::endl;
    out << "  Manifests processed: " << summary.manifestsProcessed;
    if (summary.manifestsSkipped > 0) {
        out << " (" << summary.manifestsSkipped << " unreadable, skipped)";
    }
    out << std::endl;
    out << "  Complete: " << summary.complete << ", Partial: " << summary.partial << ", Zero: " << summary.zero
        << std::endl;

    for (const auto& outcome : summary.outcomes) {
        out << "    " << outcome.manifestId << ": " << manifestStatusName(outcome.status)
            << (outcome.forced ? " (forced)" : "") << ", " << outcome.matchedCount + outcome.alreadyPresentCount
            << "/" << outcome.totalEntries << std::endl;
    }

    if (dryRun) {
        out << "  Files that would move: " << summary.filesSimulated << std::endl;
    } else {
        out << "  Files moved: " << summary.filesMoved << std::endl;
    }
    out << "  Move failures: " << summary.moveFailures << std::endl;
    out << "  Conflicts: " << summary.conflicts << std::endl;
    for (const auto& [state, count] : summary.conflictsByState) {
        out << "    " << resolutionStateName(state) << ": " << count << std::endl;
    }
    if (!summary.issues.empty()) {
        out << "  Issues logged: " << summary.issues.size() << std::endl;
    }
}

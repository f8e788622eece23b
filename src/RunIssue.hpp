#ifndef RUN_ISSUE_HPP
#define RUN_ISSUE_HPP

#include <string>

// Failure classes of a run; only ConfigurationError aborts processing.
enum class IssueKind {
    ParseError,
    DuplicateKeyWarning,
    ChecksumComputeError,
    ManifestIOError,
    ConfigurationError,
    MoveError
};

// One logged, non-fatal problem attached to the smallest affected unit (row, file or manifest).
struct RunIssue {
    IssueKind kind;
    std::string subject;
    std::string message;
};

inline const char* issueKindName(IssueKind kind) {
    switch (kind) {
    case IssueKind::ParseError:
        return "ParseError";
    case IssueKind::DuplicateKeyWarning:
        return "DuplicateKeyWarning";
    case IssueKind::ChecksumComputeError:
        return "ChecksumComputeError";
    case IssueKind::ManifestIOError:
        return "ManifestIOError";
    case IssueKind::ConfigurationError:
        return "ConfigurationError";
    case IssueKind::MoveError:
        return "MoveError";
    }
    return "Unknown";
}

#endif

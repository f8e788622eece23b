#ifndef MOVE_EXECUTOR_HPP
#define MOVE_EXECUTOR_HPP

#include <filesystem>
#include <set>
#include <string>

enum class MoveResult {
    Moved,
    Simulated,
    Conflict,
    Failed
};

// Relocates single files without ever overwriting an existing destination.
// In dry-run mode nothing on disk changes; planned destinations are remembered so that
// a second move onto the same path still reports a conflict.
class MoveExecutor {
public:
    explicit MoveExecutor(bool dryRun);

    // Move `sourcePath` to `destinationPath`, creating parent folders. `error` is set on Failed.
    MoveResult moveFile(const std::filesystem::path& sourcePath,
                        const std::filesystem::path& destinationPath,
                        std::string& error);
    // True when a file already sits at `path`, or a dry-run move has been planned onto it.
    bool destinationOccupied(const std::filesystem::path& path) const;

    bool dryRun() const { return m_dryRun; }

private:
    bool m_dryRun;
    std::set<std::filesystem::path> m_plannedDestinations;
};

#endif

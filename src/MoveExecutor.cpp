#include "MoveExecutor.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

MoveExecutor::MoveExecutor(bool dryRun) : m_dryRun(dryRun) {}

bool MoveExecutor::destinationOccupied(const fs::path& path) const {
    if (m_dryRun && m_plannedDestinations.count(path.lexically_normal()) > 0) {
        return true;
    }

    // symlink_status so that a dangling link still counts as occupied.
    std::error_code ec;
    const fs::file_status status = fs::symlink_status(path, ec);
    return !ec && fs::exists(status);
}

MoveResult MoveExecutor::moveFile(const fs::path& sourcePath, const fs::path& destinationPath, std::string& error) {
    error.clear();

    if (destinationOccupied(destinationPath)) {
        std::cerr << "Destination already exists, not overwriting: `" << destinationPath.string() << "`" << std::endl;
        return MoveResult::Conflict;
    }

    if (m_dryRun) {
        m_plannedDestinations.insert(destinationPath.lexically_normal());
        std::cout << "[dry-run] Would move `" << sourcePath.string() << "` -> `" << destinationPath.string() << "`"
                  << std::endl;
        return MoveResult::Simulated;
    }

    const fs::path destinationFolder = destinationPath.parent_path();
    if (!destinationFolder.empty()) {
        std::error_code mkdirErr;
        fs::create_directories(destinationFolder, mkdirErr);
        if (mkdirErr) {
            error = "Failed to create destination directory `" + destinationFolder.string() + "`: " + mkdirErr.message();
            std::cerr << error << std::endl;
            return MoveResult::Failed;
        }
    }

    std::error_code renameErr;
    fs::rename(sourcePath, destinationPath, renameErr);
    if (!renameErr) {
        std::cout << "Moved `" << sourcePath.string() << "` -> `" << destinationPath.string() << "`" << std::endl;
        return MoveResult::Moved;
    }

    if (renameErr == std::errc::cross_device_link) {
        std::error_code copyErr;
        fs::copy_file(sourcePath, destinationPath, fs::copy_options::none, copyErr);
        if (copyErr) {
            error = "Failed to copy `" + sourcePath.string() + "` to `" + destinationPath.string() + "`: " +
                    copyErr.message();
            std::cerr << error << std::endl;
            return copyErr == std::errc::file_exists ? MoveResult::Conflict : MoveResult::Failed;
        }

        std::error_code removeErr;
        fs::remove(sourcePath, removeErr);
        if (removeErr) {
            error = "Failed to remove original file `" + sourcePath.string() + "` after copy: " + removeErr.message();
            std::cerr << error << std::endl;
            return MoveResult::Failed;
        }

        std::cout << "Copied `" << sourcePath.string() << "` -> `" << destinationPath.string() << "` (cross-device move)"
                  << std::endl;
        return MoveResult::Moved;
    }

    error = "Failed to move `" + sourcePath.string() + "`: " + renameErr.message();
    std::cerr << error << std::endl;
    return MoveResult::Failed;
}

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "ConfigParser.hpp"
#include "ManifestScanner.hpp"
#include "Organizer.hpp"

namespace {

constexpr int kExitIncomplete = 2;

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config FILE|DIR] [--dry-run] [--yes] [--no-verify] [--threads N]\n"
              << "  " << program << " --scan DIR OUTPUT.csv [--extra-column NAME]..." << std::endl;
}

bool parseThreads(const std::string& value, unsigned int& threads) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 6) {
        std::cerr << "`--threads` expects a non-negative integer, got `" << value << "`" << std::endl;
        return false;
    }
    threads = static_cast<unsigned int>(std::stoul(value));
    return true;
}

// Return the folder holding the running executable, or empty when /proc is unavailable.
std::filesystem::path getExecutableFolder() {
    std::error_code ec;
    const std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
    return ec ? std::filesystem::path() : self.parent_path();
}

// Ask on the terminal before hashing a large number of conflicts.
bool confirmVerification(std::size_t pending) {
    if (!isatty(STDIN_FILENO)) {
        std::cout << pending << " conflict(s) pending; not interactive, falling back to size comparison." << std::endl;
        return false;
    }

    std::cout << pending << " conflict(s) need checksum verification. Compute CRC32 for all of them? [y/N] "
              << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

int runScan(int argc, char** argv, int first) {
    if (argc - first < 2) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::filesystem::path folder(argv[first]);
    const std::filesystem::path output(argv[first + 1]);
    std::vector<std::string> extraColumns;
    unsigned int threads = 0;
    for (int i = first + 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--extra-column" && i + 1 < argc) {
            extraColumns.emplace_back(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            if (!parseThreads(argv[++i], threads)) {
                return EXIT_FAILURE;
            }
        } else {
            std::cerr << "Unknown argument `" << arg << "`" << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        std::cerr << "`" << folder.string() << "` is not a folder." << std::endl;
        return EXIT_FAILURE;
    }

    ManifestScanner scanner(threads, std::move(extraColumns));
    if (!scanner.scan(folder, output)) {
        return EXIT_FAILURE;
    }
    return scanner.filesSkipped() > 0 ? kExitIncomplete : EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--scan") {
        return runScan(argc, argv, 2);
    }

    // Default to the executable location so a bundled config folder is found.
    const std::filesystem::path executableFolder = getExecutableFolder();
    std::string configPath =
        (executableFolder.empty() ? std::filesystem::current_path() : executableFolder).string();

    bool dryRun = false;
    bool autoConfirm = false;
    bool noVerify = false;
    bool threadsSet = false;
    unsigned int threads = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else if (arg == "--yes") {
            autoConfirm = true;
        } else if (arg == "--no-verify") {
            noVerify = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            if (!parseThreads(argv[++i], threads)) {
                return EXIT_FAILURE;
            }
            threadsSet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown argument `" << arg << "`" << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    ConfigParser parser;
    if (!parser.load(configPath)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }
    if (!parser.validateFolders()) {
        return EXIT_FAILURE;
    }

    // Command-line switches win over the file.
    OrganizerConfig config = parser.getConfig();
    config.dryRun = config.dryRun || dryRun;
    config.autoConfirm = config.autoConfirm || autoConfirm;
    if (noVerify) {
        config.verifyConflicts = false;
    }
    if (threadsSet) {
        config.threads = threads;
    }

    Organizer organizer(std::move(config));
    organizer.setConfirmCallback(confirmVerification);

    RunSummary summary;
    if (!organizer.run(summary)) {
        std::cerr << "Run aborted before any manifest was processed." << std::endl;
        return EXIT_FAILURE;
    }

    printSummary(summary, organizer.config().dryRun, std::cout);
    return summary.hasIncompleteWork() ? kExitIncomplete : EXIT_SUCCESS;
}

#include "CandidateIndex.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include "ChecksumComputer.hpp"

namespace fs = std::filesystem;

namespace {

fs::path comparablePath(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        resolved = fs::absolute(path, ec).lexically_normal();
    }
    return resolved;
}

bool isExcluded(const fs::path& directory, const std::vector<fs::path>& excluded) {
    const fs::path candidate = comparablePath(directory);
    return std::find(excluded.begin(), excluded.end(), candidate) != excluded.end();
}

} // namespace

std::string makeCompositeKey(const std::string& checksum, std::uintmax_t size) {
    std::string upper = checksum;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return upper + ":" + std::to_string(size);
}

CandidateId CandidateIndex::add(fs::path path, std::uintmax_t size, std::string checksum) {
    const CandidateId id = m_files.size();
    CandidateFile file;
    file.id = id;
    file.path = std::move(path);
    file.size = size;
    file.checksum = std::move(checksum);
    m_byKey[makeCompositeKey(file.checksum, file.size)].push_back(id);
    m_files.push_back(std::move(file));
    return id;
}

const std::vector<CandidateId>& CandidateIndex::candidatesFor(const std::string& key) const {
    static const std::vector<CandidateId> kNoCandidates;
    auto it = m_byKey.find(key);
    if (it == m_byKey.end()) {
        return kNoCandidates;
    }
    return it->second;
}

const CandidateFile& CandidateIndex::file(CandidateId id) const {
    if (id >= m_files.size()) {
        throw std::out_of_range("candidate id " + std::to_string(id) + " is not in the index");
    }
    return m_files[id];
}

CandidateFile& CandidateIndex::file(CandidateId id) {
    if (id >= m_files.size()) {
        throw std::out_of_range("candidate id " + std::to_string(id) + " is not in the index");
    }
    return m_files[id];
}

bool collectRegularFiles(const fs::path& root, const std::vector<fs::path>& excluded, std::vector<fs::path>& files) {
    std::vector<fs::path> excludedResolved;
    excludedResolved.reserve(excluded.size());
    for (const auto& dir : excluded) {
        if (!dir.empty()) {
            excludedResolved.push_back(comparablePath(dir));
        }
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << root.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "Skipping path due to error: " << ec.message() << std::endl;
            ec.clear();
            continue;
        }

        if (it->is_directory(ec) && !ec) {
            if (!excludedResolved.empty() && isExcluded(it->path(), excludedResolved)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (ec) {
            ec.clear();
            continue;
        }

        if (!it->is_regular_file(ec) || ec) {
            ec.clear();
            continue;
        }
        files.push_back(it->path());
    }

    // Enumeration order is filesystem-dependent; sorting makes claim order reproducible.
    std::sort(files.begin(), files.end());
    return true;
}

CandidateIndexer::CandidateIndexer(unsigned int threads, std::vector<fs::path> excludedDirs)
    : m_threads(threads), m_excludedDirs(std::move(excludedDirs)) {}

bool CandidateIndexer::build(const fs::path& root, CandidateIndex& index) {
    m_issues.clear();

    std::vector<fs::path> files;
    if (!collectRegularFiles(root, m_excludedDirs, files)) {
        return false;
    }

    std::cout << "Indexing " << files.size() << " file(s) under `" << root.string() << "`..." << std::endl;

    std::vector<HashedFile> hashed = computeChecksums(files, m_threads);
    for (auto& result : hashed) {
        if (result.ec) {
            std::cerr << "Warning: excluding `" << result.path.string() << "` from the pool: " << result.ec.message()
                      << std::endl;
            m_issues.push_back({IssueKind::ChecksumComputeError, result.path.string(), result.ec.message()});
            continue;
        }
        index.add(std::move(result.path), result.sum.size, std::move(result.sum.checksum));
    }

    std::cout << "Indexed " << index.size() << " file(s) under " << index.keyCount() << " composite key(s)."
              << std::endl;
    return true;
}

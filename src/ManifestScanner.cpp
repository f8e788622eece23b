#include "ManifestScanner.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

#include "CandidateIndex.hpp"
#include "ChecksumComputer.hpp"
#include "Csv.hpp"

namespace fs = std::filesystem;

ManifestScanner::ManifestScanner(unsigned int threads, std::vector<std::string> extraColumns)
    : m_threads(threads), m_extraColumns(std::move(extraColumns)) {}

bool ManifestScanner::scan(const fs::path& folder, const fs::path& outputCsv) {
    m_rowsWritten = 0;
    m_filesSkipped = 0;

    std::vector<fs::path> files;
    if (!collectRegularFiles(folder, {}, files)) {
        return false;
    }

    // The output may live inside the scanned folder; leave it out of its own listing.
    std::error_code ec;
    const fs::path outputResolved = fs::weakly_canonical(outputCsv, ec);
    if (!ec) {
        files.erase(std::remove_if(files.begin(), files.end(), [&](const fs::path& file) {
            std::error_code fileErr;
            return fs::weakly_canonical(file, fileErr) == outputResolved && !fileErr;
        }), files.end());
    }

    const std::vector<HashedFile> hashed = computeChecksums(files, m_threads);

    std::ofstream out(outputCsv, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open output file `" << outputCsv.string() << "`" << std::endl;
        return false;
    }

    std::vector<std::string> header = {"FileName", "Size", "CRC32", "Path"};
    header.insert(header.end(), m_extraColumns.begin(), m_extraColumns.end());
    writeCsvRow(out, header);

    for (const auto& result : hashed) {
        if (result.ec) {
            std::cerr << "Warning: skipping `" << result.path.string() << "`: " << result.ec.message() << std::endl;
            ++m_filesSkipped;
            continue;
        }

        std::vector<std::string> row = {result.path.filename().string(), std::to_string(result.sum.size),
                                        result.sum.checksum, result.path.parent_path().filename().string()};
        row.resize(header.size());
        writeCsvRow(out, row);
        ++m_rowsWritten;
    }

    out.flush();
    if (!out) {
        std::cerr << "Failed to write `" << outputCsv.string() << "`" << std::endl;
        return false;
    }

    std::cout << "Wrote " << m_rowsWritten << " row(s) to `" << outputCsv.string() << "`" << std::endl;
    return true;
}

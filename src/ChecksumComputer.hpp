#ifndef CHECKSUM_COMPUTER_HPP
#define CHECKSUM_COMPUTER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

// CRC32 and byte length of one file.
struct FileChecksum {
    std::string checksum;
    std::uintmax_t size = 0;
};

// Outcome of hashing one path inside a worker; `ec` is set when the file could not be read.
struct HashedFile {
    std::filesystem::path path;
    FileChecksum sum;
    std::error_code ec;
};

// Streams files through zlib's crc32 with a fixed-size buffer; holds no state between calls.
class ChecksumComputer {
public:
    static constexpr std::size_t kBufferSize = 64 * 1024;

    // Compute the checksum of `path`; returns false and sets `ec` on open or read failure.
    bool compute(const std::filesystem::path& path, FileChecksum& out, std::error_code& ec) const;
    // Format a raw CRC32 value as 8 uppercase hex digits.
    static std::string formatChecksum(std::uint32_t crc);
};

// Hash every path with at most `threads` concurrent workers. Results keep the input order.
std::vector<HashedFile> computeChecksums(const std::vector<std::filesystem::path>& paths, unsigned int threads);

#endif

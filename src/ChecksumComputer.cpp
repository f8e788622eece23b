#include "ChecksumComputer.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>

#include <zlib.h>

#include "WorkerPool.hpp"

namespace {
using FileHandle = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;
}

bool ChecksumComputer::compute(const std::filesystem::path& path, FileChecksum& out, std::error_code& ec) const {
    ec.clear();

    errno = 0;
    FileHandle file(std::fopen(path.string().c_str(), "rb"), &std::fclose);
    if (!file) {
        ec.assign(errno != 0 ? errno : EIO, std::generic_category());
        return false;
    }

    std::vector<unsigned char> buffer(kBufferSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uintmax_t total = 0;

    for (;;) {
        const std::size_t got = std::fread(buffer.data(), 1, buffer.size(), file.get());
        if (got > 0) {
            crc = crc32(crc, buffer.data(), static_cast<uInt>(got));
            total += got;
        }
        if (got < buffer.size()) {
            if (std::ferror(file.get())) {
                ec.assign(errno != 0 ? errno : EIO, std::generic_category());
                return false;
            }
            break;
        }
    }

    out.checksum = formatChecksum(static_cast<std::uint32_t>(crc));
    out.size = total;
    return true;
}

std::string ChecksumComputer::formatChecksum(std::uint32_t crc) {
    static const char kDigits[] = "0123456789ABCDEF";
    std::string text(8, '0');
    for (int i = 7; i >= 0; --i) {
        text[static_cast<std::size_t>(i)] = kDigits[crc & 0xFu];
        crc >>= 4;
    }
    return text;
}

std::vector<HashedFile> computeChecksums(const std::vector<std::filesystem::path>& paths, unsigned int threads) {
    std::vector<HashedFile> results(paths.size());
    const ChecksumComputer computer;

    runBounded(paths.size(), threads, [&](std::size_t index) {
        HashedFile& slot = results[index];
        slot.path = paths[index];
        if (!computer.compute(slot.path, slot.sum, slot.ec)) {
            slot.sum = FileChecksum{};
        }
    });

    return results;
}

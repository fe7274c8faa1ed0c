#pragma once

#include <cstdint>
#include <string>

namespace cvdr::upload {

/**
 * @brief One chunk of one file, handed to exactly one worker
 */
struct UploadChunkJob {
    std::string filename;
    /// 1-based; chunk n covers chunk_size_bytes bytes starting at (n-1) * chunk_size_bytes
    std::uint32_t chunk_number = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunk_size_bytes = 0;

    std::uint64_t offset() const { return static_cast<std::uint64_t>(chunk_number - 1) * chunk_size_bytes; }
};

struct FileInfo {
    std::string name;
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
};

/// ceil(size / chunk_size); chunk_size must be non-zero. Callers check the
/// result fits UploadChunkJob::total_chunks before narrowing.
inline std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size) {
    return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

} // namespace cvdr::upload

#pragma once

#include "cvdr/core/result.hpp"
#include "cvdr/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

namespace cvdr::upload {

/**
 * @brief Reads the byte range of one chunk in bounded blocks
 *
 * Covers [offset, offset + chunk_size_bytes) clipped to the file size, so the
 * final chunk yields only the remainder. Never holds more than one block.
 */
class ChunkReader {
public:
    static constexpr std::size_t kDefaultBlockSize = 32 * 1024;

    static Result<ChunkReader> open(const UploadChunkJob& job, std::size_t block_size = kDefaultBlockSize);

    /// Next block of the range, nullopt once the range is exhausted
    Result<std::optional<std::string>> next_block();

    std::uint64_t length() const noexcept { return length_; }
    std::uint64_t remaining() const noexcept { return remaining_; }

private:
    ChunkReader(std::ifstream input, std::uint64_t length, std::size_t block_size, std::string filename);

    std::ifstream input_;
    std::uint64_t length_ = 0;
    std::uint64_t remaining_ = 0;
    std::size_t block_size_ = kDefaultBlockSize;
    std::string filename_;
};

} // namespace cvdr::upload

#include "cvdr/upload/chunk_reader.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace cvdr::upload {
namespace fs = std::filesystem;

ChunkReader::ChunkReader(std::ifstream input, std::uint64_t length, std::size_t block_size, std::string filename)
    : input_(std::move(input)),
      length_(length),
      remaining_(length),
      block_size_(block_size == 0 ? kDefaultBlockSize : block_size),
      filename_(std::move(filename)) {
}

Result<ChunkReader> ChunkReader::open(const UploadChunkJob& job, std::size_t block_size) {
    if (job.chunk_size_bytes == 0 || job.chunk_number == 0 || job.chunk_number > job.total_chunks) {
        return Err<ChunkReader>(Error(ErrorKind::InvalidArgument,
                                      "invalid chunk " + std::to_string(job.chunk_number) + "/" +
                                          std::to_string(job.total_chunks) + " of " + job.filename));
    }

    std::error_code ec;
    const auto file_size = fs::file_size(job.filename, ec);
    if (ec) {
        return Err<ChunkReader>(Error(ErrorKind::Io, "cannot stat " + job.filename + ": " + ec.message()));
    }

    std::ifstream input(job.filename, std::ios::binary);
    if (!input) {
        return Err<ChunkReader>(Error(ErrorKind::Io, "failed to open source file: " + job.filename));
    }

    const auto offset = job.offset();
    const std::uint64_t length = offset >= file_size ? 0 : std::min<std::uint64_t>(job.chunk_size_bytes, file_size - offset);
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return Err<ChunkReader>(Error(ErrorKind::Io, "failed to seek in " + job.filename));
    }

    return Ok(ChunkReader(std::move(input), length, block_size, job.filename));
}

Result<std::optional<std::string>> ChunkReader::next_block() {
    if (remaining_ == 0) {
        return Ok(std::optional<std::string>{});
    }

    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, block_size_));
    std::string block(wanted, '\0');
    input_.read(block.data(), static_cast<std::streamsize>(wanted));
    if (static_cast<std::size_t>(input_.gcount()) != wanted) {
        return Err<std::optional<std::string>>(Error(ErrorKind::Io, "short read from " + filename_));
    }
    remaining_ -= wanted;
    return Ok(std::optional<std::string>{std::move(block)});
}

} // namespace cvdr::upload

#pragma once

#include "cvdr/http/http_client.hpp"
#include "cvdr/upload/chunk_reader.hpp"
#include "cvdr/upload/chunk_sink.hpp"

#include <cstddef>
#include <memory>

namespace cvdr::upload {

struct HttpChunkSinkOptions {
    std::size_t pipe_capacity = 4;  ///< Blocks buffered between encoder and socket
    std::size_t block_size = ChunkReader::kDefaultBlockSize;
};

/**
 * @brief Uploads a chunk as a multipart/form-data PUT to the destination URL
 *
 * Form fields chunk_number, chunk_total and chunk_size_bytes precede the
 * file part "file" (named after the file's basename). A producer thread
 * encodes the body into a bounded pipe while the HTTP client streams it out,
 * so encoding and transmission overlap and at most pipe_capacity blocks are
 * in memory. Any status other than 200 is an ErrorKind::Upload error.
 */
class HttpChunkSink : public ChunkSink {
public:
    explicit HttpChunkSink(std::shared_ptr<http::HttpClient> client, HttpChunkSinkOptions options = {});

    Result<void> put_chunk(const std::string& destination,
                           const UploadChunkJob& job,
                           const CancellationToken& cancel) override;

private:
    std::shared_ptr<http::HttpClient> client_;
    HttpChunkSinkOptions options_;
};

} // namespace cvdr::upload

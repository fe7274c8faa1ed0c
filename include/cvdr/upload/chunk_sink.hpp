#pragma once

#include "cvdr/core/cancellation.hpp"
#include "cvdr/core/result.hpp"
#include "cvdr/upload/types.hpp"

#include <string>

namespace cvdr::upload {

/**
 * @brief Destination for one chunk upload attempt
 *
 * Implementations read the chunk's bytes themselves (see ChunkReader) and
 * should give up promptly, with ErrorKind::Cancelled, once cancel fires.
 * Called concurrently from every upload worker.
 */
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    virtual Result<void> put_chunk(const std::string& destination,
                                   const UploadChunkJob& job,
                                   const CancellationToken& cancel) = 0;
};

} // namespace cvdr::upload

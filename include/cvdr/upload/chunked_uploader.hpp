#pragma once

#include "cvdr/core/backoff.hpp"
#include "cvdr/core/cancellation.hpp"
#include "cvdr/core/channel.hpp"
#include "cvdr/core/result.hpp"
#include "cvdr/upload/chunk_sink.hpp"
#include "cvdr/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cvdr::upload {

inline constexpr std::size_t kDefaultUploadWorkers = 32;

struct UploaderOptions {
    std::uint64_t chunk_size_bytes = 0;
    std::size_t worker_count = kDefaultUploadWorkers;
    BackoffPolicy backoff = BackoffPolicy::chunk_upload_default();
};

/**
 * @brief Uploads files in fixed-size chunks through a bounded worker pool
 *
 * Pipeline:
 * - one generator thread emits a job per chunk, files in the given order and
 *   chunks ascending within a file, onto a bounded job channel
 * - worker_count workers each take a job and push it to the sink, retrying
 *   with exponential backoff until the policy's elapsed-time budget runs out
 * - the calling thread aggregates results; the first error cancels the shared
 *   token, which stops the generator and tells in-flight uploads to abort
 *
 * upload() returns the first error (later ones are only logged) after every
 * worker has drained. Chunks already uploaded are not rolled back.
 */
class ChunkedUploader {
public:
    ChunkedUploader(std::shared_ptr<ChunkSink> sink, UploaderOptions options);

    Result<void> upload(const std::string& destination, const std::vector<std::string>& filenames) const;

    static Result<std::vector<FileInfo>> collect_file_infos(const std::vector<std::string>& filenames,
                                                            std::uint64_t chunk_size_bytes);

private:
    void generate_jobs(const std::vector<FileInfo>& infos,
                       Channel<UploadChunkJob>& jobs,
                       const CancellationToken& cancel) const;

    void run_worker(const std::string& destination,
                    Channel<UploadChunkJob>& jobs,
                    Channel<Result<void>>& results,
                    CancellationToken& cancel) const;

    Result<void> upload_chunk(const std::string& destination,
                              const UploadChunkJob& job,
                              ExponentialBackoff& backoff,
                              const CancellationToken& cancel) const;

    std::shared_ptr<ChunkSink> sink_;
    UploaderOptions options_;
};

} // namespace cvdr::upload

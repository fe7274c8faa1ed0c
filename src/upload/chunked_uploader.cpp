#include "cvdr/upload/chunked_uploader.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <limits>
#include <optional>
#include <system_error>
#include <thread>

namespace cvdr::upload {
namespace fs = std::filesystem;

ChunkedUploader::ChunkedUploader(std::shared_ptr<ChunkSink> sink, UploaderOptions options)
    : sink_(std::move(sink)), options_(options) {
    if (options_.worker_count == 0) {
        options_.worker_count = 1;
    }
}

Result<std::vector<FileInfo>> ChunkedUploader::collect_file_infos(const std::vector<std::string>& filenames,
                                                                  std::uint64_t chunk_size_bytes) {
    if (chunk_size_bytes == 0) {
        return Err<std::vector<FileInfo>>(Error(ErrorKind::InvalidArgument, "chunk size cannot be zero"));
    }
    std::vector<FileInfo> infos;
    infos.reserve(filenames.size());
    for (const auto& name : filenames) {
        std::error_code ec;
        const auto size = fs::file_size(name, ec);
        if (ec) {
            return Err<std::vector<FileInfo>>(Error(ErrorKind::Io, "cannot stat " + name + ": " + ec.message()));
        }
        const auto chunks = chunk_count(size, chunk_size_bytes);
        if (chunks > std::numeric_limits<std::uint32_t>::max()) {
            return Err<std::vector<FileInfo>>(Error(ErrorKind::InvalidArgument,
                name + " needs " + std::to_string(chunks) + " chunks, more than an upload can number"));
        }
        infos.push_back(FileInfo{name, size, static_cast<std::uint32_t>(chunks)});
    }
    return Ok(std::move(infos));
}

Result<void> ChunkedUploader::upload(const std::string& destination,
                                     const std::vector<std::string>& filenames) const {
    if (options_.chunk_size_bytes == 0) {
        return Err<void>(Error(ErrorKind::InvalidArgument, "chunk size cannot be zero"));
    }
    if (destination.empty()) {
        return Err<void>(Error(ErrorKind::InvalidArgument, "upload destination cannot be empty"));
    }
    auto infos = collect_file_infos(filenames, options_.chunk_size_bytes);
    if (infos.is_error()) {
        return Err<void>(infos.error());
    }

    CancellationToken cancel;
    Channel<UploadChunkJob> jobs(options_.worker_count);
    Channel<Result<void>> results(options_.worker_count);
    // Cancellation must also release a generator blocked on a full queue
    cancel.on_cancel([&jobs]() { jobs.close(); });

    std::thread generator([&]() {
        generate_jobs(infos.value(), jobs, cancel);
        jobs.close();
    });

    std::vector<std::thread> workers;
    workers.reserve(options_.worker_count);
    for (std::size_t i = 0; i < options_.worker_count; ++i) {
        workers.emplace_back([&]() { run_worker(destination, jobs, results, cancel); });
    }
    std::thread closer([&]() {
        for (auto& worker : workers) {
            worker.join();
        }
        results.close();
    });

    // Only the first error is returned
    std::optional<Error> first_error;
    while (auto result = results.receive()) {
        if (result->is_ok()) {
            continue;
        }
        // A chunk aborted by another worker's failure is not the cause
        const bool replaces = !first_error ||
            (first_error->is(ErrorKind::Cancelled) && !result->error().is(ErrorKind::Cancelled));
        if (replaces) {
            spdlog::warn("Error uploading file chunk: {}", result->error().to_string());
            first_error = result->error();
            cancel.cancel();
        } else {
            spdlog::debug("Discarding later chunk error: {}", result->error().to_string());
        }
    }

    closer.join();
    generator.join();

    if (first_error) {
        return Err<void>(*first_error);
    }
    return Ok();
}

void ChunkedUploader::generate_jobs(const std::vector<FileInfo>& infos,
                                    Channel<UploadChunkJob>& jobs,
                                    const CancellationToken& cancel) const {
    for (const auto& info : infos) {
        for (std::uint32_t n = 1; n <= info.total_chunks; ++n) {
            if (cancel.is_cancelled()) {
                return;
            }
            UploadChunkJob job{info.name, n, info.total_chunks, options_.chunk_size_bytes};
            if (!jobs.send(std::move(job))) {
                return;
            }
        }
    }
}

void ChunkedUploader::run_worker(const std::string& destination,
                                 Channel<UploadChunkJob>& jobs,
                                 Channel<Result<void>>& results,
                                 CancellationToken& cancel) const {
    ExponentialBackoff backoff(options_.backoff);
    while (auto job = jobs.receive()) {
        if (cancel.is_cancelled()) {
            continue;
        }
        backoff.reset();
        auto result = upload_chunk(destination, *job, backoff, cancel);
        // Stop dispatch before this worker can pick up another job
        if (result.is_error()) {
            cancel.cancel();
        }
        results.send(std::move(result));
    }
}

Result<void> ChunkedUploader::upload_chunk(const std::string& destination,
                                           const UploadChunkJob& job,
                                           ExponentialBackoff& backoff,
                                           const CancellationToken& cancel) const {
    for (;;) {
        auto result = sink_->put_chunk(destination, job, cancel);
        if (result.is_ok() || cancel.is_cancelled()) {
            return result;
        }
        const auto delay = backoff.next_backoff();
        if (!delay) {
            return result;
        }
        spdlog::debug("Chunk {}/{} of {} failed ({}), retrying in {} ms",
                      job.chunk_number, job.total_chunks, job.filename,
                      result.error().to_string(), delay->count());
        if (cancel.wait_for(*delay)) {
            return result;
        }
    }
}

} // namespace cvdr::upload

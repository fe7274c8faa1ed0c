#include "cvdr/upload/http_chunk_sink.hpp"

#include "cvdr/core/channel.hpp"
#include "cvdr/upload/multipart.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <filesystem>
#include <thread>

namespace cvdr::upload {
namespace {

struct BodyPipe {
    explicit BodyPipe(std::size_t capacity) : blocks(capacity) {}
    Channel<std::string> blocks;
    std::atomic<bool> producer_failed{false};
};

class PipeBodySource : public http::BodySource {
public:
    explicit PipeBodySource(BodyPipe& pipe) : pipe_(pipe) {}

    Result<std::optional<std::string>> next_block() override {
        auto block = pipe_.blocks.receive();
        if (block) {
            return Ok(std::optional<std::string>{std::move(*block)});
        }
        if (pipe_.producer_failed) {
            return Err<std::optional<std::string>>(Error(ErrorKind::Io, "multipart body producer failed"));
        }
        return Ok(std::optional<std::string>{});
    }

private:
    BodyPipe& pipe_;
};

Result<void> consumer_gone() {
    return Err<void>(Error(ErrorKind::Cancelled, "request body no longer consumed"));
}

Result<void> write_multipart(MultipartEncoder& encoder,
                             const UploadChunkJob& job,
                             BodyPipe& pipe,
                             const CancellationToken& cancel,
                             std::size_t block_size) {
    auto reader = ChunkReader::open(job, block_size);
    if (reader.is_error()) {
        return Err<void>(reader.error());
    }

    const std::string basename = std::filesystem::path(job.filename).filename().string();
    if (!pipe.blocks.send(encoder.field("chunk_number", std::to_string(job.chunk_number))) ||
        !pipe.blocks.send(encoder.field("chunk_total", std::to_string(job.total_chunks))) ||
        !pipe.blocks.send(encoder.field("chunk_size_bytes", std::to_string(job.chunk_size_bytes))) ||
        !pipe.blocks.send(encoder.file_header("file", basename))) {
        return consumer_gone();
    }

    for (;;) {
        if (cancel.is_cancelled()) {
            return Err<void>(Error(ErrorKind::Cancelled, "upload cancelled"));
        }
        auto block = reader.value().next_block();
        if (block.is_error()) {
            return Err<void>(block.error());
        }
        if (!block.value()) {
            break;
        }
        if (!pipe.blocks.send(std::move(*block.value()))) {
            return consumer_gone();
        }
    }

    if (!pipe.blocks.send(encoder.closing())) {
        return consumer_gone();
    }
    return Ok();
}

} // namespace

HttpChunkSink::HttpChunkSink(std::shared_ptr<http::HttpClient> client, HttpChunkSinkOptions options)
    : client_(std::move(client)), options_(options) {
}

Result<void> HttpChunkSink::put_chunk(const std::string& destination,
                                      const UploadChunkJob& job,
                                      const CancellationToken& cancel) {
    const std::string basename = std::filesystem::path(job.filename).filename().string();
    MultipartEncoder encoder;

    http::HttpRequest request;
    request.method = http::HttpMethod::PUT;
    request.url = destination;
    request.set_header("Content-Type", encoder.content_type());

    BodyPipe pipe(options_.pipe_capacity);
    Result<void> produced = Ok();
    std::thread producer([&]() {
        produced = write_multipart(encoder, job, pipe, cancel, options_.block_size);
        if (produced.is_error()) {
            spdlog::warn("Error writing multipart request: {}", produced.error().to_string());
            pipe.producer_failed = true;
        }
        pipe.blocks.close();
    });

    PipeBodySource source(pipe);
    auto response = client_->send_streaming(request, source, cancel);
    pipe.blocks.close();
    producer.join();

    if (produced.is_error() && !produced.error().is(ErrorKind::Cancelled)) {
        return produced;
    }
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().connection_reused) {
        spdlog::debug("tcp connection was not reused uploading file chunk: \"{}\", chunk number: {}, chunk total: {}",
                      basename, job.chunk_number, job.total_chunks);
    }
    if (response.value().status_code != 200) {
        return Err<void>(Error(ErrorKind::Upload,
                               "Failed uploading file chunk with status code \"" + response.value().status_line() +
                                   "\". File \"" + basename + "\", chunk number: " + std::to_string(job.chunk_number) +
                                   ", chunk total: " + std::to_string(job.total_chunks) + "."));
    }
    return Ok();
}

} // namespace cvdr::upload

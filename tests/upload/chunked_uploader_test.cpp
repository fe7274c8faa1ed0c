#include "cvdr/upload/chunked_uploader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace fs = std::filesystem;
using cvdr::CancellationToken;
using cvdr::Error;
using cvdr::ErrorKind;
using cvdr::Result;
using cvdr::upload::ChunkedUploader;
using cvdr::upload::ChunkSink;
using cvdr::upload::UploadChunkJob;
using cvdr::upload::UploaderOptions;
using namespace std::chrono_literals;

namespace {

fs::path write_file(std::size_t size) {
    static std::atomic<uint64_t> counter{0};
    const auto path = fs::temp_directory_path() / ("cvdr_uploader_test_" + std::to_string(counter++));
    std::ofstream out(path, std::ios::binary);
    out << std::string(size, 'x');
    return path;
}

/// Records every call; fail_attempt decides whether a given attempt fails
class RecordingSink : public ChunkSink {
public:
    std::function<bool(const UploadChunkJob&, int attempt)> fail_attempt;

    Result<void> put_chunk(const std::string& destination,
                           const UploadChunkJob& job,
                           const CancellationToken&) override {
        int attempt = 0;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(job);
            destinations_.insert(destination);
            attempt = ++attempts_[{job.filename, job.chunk_number}];
        }
        if (fail_attempt && fail_attempt(job, attempt)) {
            return cvdr::Err<void>(Error(ErrorKind::Upload, "chunk rejected"));
        }
        return cvdr::Ok();
    }

    std::vector<UploadChunkJob> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::set<std::string> destinations() const {
        std::lock_guard lock(mutex_);
        return destinations_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<UploadChunkJob> calls_;
    std::set<std::string> destinations_;
    std::map<std::pair<std::string, std::uint32_t>, int> attempts_;
};

UploaderOptions options(std::uint64_t chunk_size, std::size_t workers) {
    UploaderOptions opts;
    opts.chunk_size_bytes = chunk_size;
    opts.worker_count = workers;
    opts.backoff.initial_interval = 1ms;
    opts.backoff.max_interval = 2ms;
    opts.backoff.max_elapsed_time = 50ms;
    return opts;
}

} // namespace

TEST(ChunkedUploaderTest, UploadsEveryChunkOfEveryFile) {
    const auto a = write_file(1000);
    const auto b = write_file(10);
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(300, 4));

    auto result = uploader.upload("http://h/dir", {a.string(), b.string()});
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    std::set<std::pair<std::string, std::uint32_t>> seen;
    for (const auto& job : sink->calls()) {
        EXPECT_EQ(job.chunk_size_bytes, 300u);
        EXPECT_EQ(job.total_chunks, job.filename == a.string() ? 4u : 1u);
        seen.insert({job.filename, job.chunk_number});
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_EQ(sink->calls().size(), 5u);
    EXPECT_EQ(sink->destinations(), std::set<std::string>{"http://h/dir"});
    fs::remove(a);
    fs::remove(b);
}

TEST(ChunkedUploaderTest, SingleWorkerPreservesOrder) {
    const auto a = write_file(1000);
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(300, 1));

    ASSERT_TRUE(uploader.upload("http://h/dir", {a.string()}).is_ok());
    const auto calls = sink->calls();
    ASSERT_EQ(calls.size(), 4u);
    for (std::uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(calls[i].chunk_number, i + 1);
        EXPECT_EQ(calls[i].offset(), i * 300u);
    }
    fs::remove(a);
}

TEST(ChunkedUploaderTest, RetriesTransientFailures) {
    const auto a = write_file(600);
    auto sink = std::make_shared<RecordingSink>();
    sink->fail_attempt = [](const UploadChunkJob& job, int attempt) {
        return job.chunk_number == 2 && attempt < 3;
    };
    ChunkedUploader uploader(sink, options(300, 2));

    auto result = uploader.upload("http://h/dir", {a.string()});
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(sink->calls().size(), 4u);
    fs::remove(a);
}

TEST(ChunkedUploaderTest, PermanentFailureStopsDispatch) {
    const auto a = write_file(1000);
    auto sink = std::make_shared<RecordingSink>();
    sink->fail_attempt = [](const UploadChunkJob& job, int) { return job.chunk_number == 1; };

    auto opts = options(100, 1);
    opts.backoff.max_elapsed_time = 1ms;
    opts.backoff.initial_interval = 5ms;
    ChunkedUploader uploader(sink, opts);

    auto result = uploader.upload("http://h/dir", {a.string()});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Upload));

    // The single worker cancels before it can take chunk 2
    const auto calls = sink->calls();
    EXPECT_EQ(calls.size(), 1u);
    for (const auto& call : calls) {
        EXPECT_EQ(call.chunk_number, 1u);
    }
    fs::remove(a);
}

TEST(ChunkedUploaderTest, MiddleChunkFailureIsReturned) {
    const auto a = write_file(1000);
    auto sink = std::make_shared<RecordingSink>();
    sink->fail_attempt = [](const UploadChunkJob& job, int) { return job.chunk_number == 2; };

    auto opts = options(250, 4);
    opts.backoff.max_elapsed_time = 1ms;
    opts.backoff.initial_interval = 5ms;
    ChunkedUploader uploader(sink, opts);

    auto result = uploader.upload("http://h/dir", {a.string()});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Upload));
    EXPECT_LE(sink->calls().size(), 4u);
    fs::remove(a);
}

TEST(ChunkedUploaderTest, ZeroChunkSizeIsRejected) {
    const auto a = write_file(10);
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(0, 4));

    auto result = uploader.upload("http://h/dir", {a.string()});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(sink->calls().empty());
    fs::remove(a);
}

TEST(ChunkedUploaderTest, RejectsFileWithTooManyChunks) {
    const auto a = write_file(0);
    // Sparse; one byte past what a 32-bit chunk number can address
    fs::resize_file(a, (std::uint64_t{1} << 32) + 1);
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(1, 2));

    auto result = uploader.upload("http://h/dir", {a.string()});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(sink->calls().empty());
    fs::remove(a);
}

TEST(ChunkedUploaderTest, MissingFileFailsBeforeUploading) {
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(100, 2));

    auto result = uploader.upload("http://h/dir", {"/nonexistent/cvdr/file"});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Io));
    EXPECT_TRUE(sink->calls().empty());
}

TEST(ChunkedUploaderTest, EmptyFileListSucceeds) {
    auto sink = std::make_shared<RecordingSink>();
    ChunkedUploader uploader(sink, options(100, 2));
    EXPECT_TRUE(uploader.upload("http://h/dir", {}).is_ok());
}

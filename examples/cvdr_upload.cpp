/**
 * @file cvdr_upload.cpp
 * @brief Upload local files to a host's user artifacts directory
 *
 * USAGE:
 * ./cvdr_upload <options.json> <host> <file>...
 *
 * options.json holds the service options, for example:
 * {
 *   "root_endpoint": "http://localhost:8080/v1",
 *   "chunk_size_bytes": 16777216,
 *   "upload_workers": 8
 * }
 *
 * Set CVDR_DEBUG=1 to log every HTTP exchange.
 */

#include "cvdr/client/orchestrator_service.hpp"
#include "cvdr/config/service_options.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace cvdr;

int main(int argc, char* argv[]) {
    spdlog::set_level(std::getenv("CVDR_DEBUG") != nullptr ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 4) {
        spdlog::error("usage: {} <options.json> <host> <file>...", argv[0]);
        return 2;
    }

    auto options = config::load_service_options_file(argv[1]);
    if (options.is_error()) {
        spdlog::error("Invalid options: {}", options.error().to_string());
        return 1;
    }
    if (options.value().chunk_size_bytes == 0) {
        spdlog::error("chunk_size_bytes must be set in {}", argv[1]);
        return 1;
    }

    const std::string host = argv[2];
    const std::vector<std::string> files(argv + 3, argv + argc);

    auto service = client::OrchestratorService::create(options.value());
    if (service.is_error()) {
        spdlog::error("Cannot create service: {}", service.error().to_string());
        return 1;
    }

    auto dir = service.value()->create_upload(host);
    if (dir.is_error()) {
        spdlog::error("Cannot create upload directory on {}: {}", host, dir.error().to_string());
        return 1;
    }
    spdlog::info("Uploading {} file(s) to {}/hosts/{}/userartifacts/{}",
                 files.size(), service.value()->root_uri(), host, dir.value());

    auto uploaded = service.value()->upload_files(host, dir.value(), files);
    if (uploaded.is_error()) {
        spdlog::error("Upload failed: {}", uploaded.error().to_string());
        return 1;
    }

    spdlog::info("Upload directory: {}", dir.value());
    return 0;
}

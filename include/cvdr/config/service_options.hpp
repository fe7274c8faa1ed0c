#pragma once

#include "cvdr/client/operation_waiter.hpp"
#include "cvdr/core/backoff.hpp"
#include "cvdr/core/result.hpp"
#include "cvdr/signaling/signaling_session.hpp"
#include "cvdr/upload/chunked_uploader.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace cvdr::config {

/**
 * @brief Everything needed to talk to one orchestration service
 *
 * Built once (in code or from JSON) and passed by value; nothing reads it
 * from globals.
 */
struct ServiceOptions {
    std::string root_endpoint;
    std::string proxy_url;
    int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{5000};
    std::uint64_t chunk_size_bytes = 0;
    BackoffPolicy chunk_upload_backoff = BackoffPolicy::chunk_upload_default();
    std::size_t upload_workers = upload::kDefaultUploadWorkers;
    signaling::SignalingOptions signaling;
    client::WaiterOptions waiter;
};

/**
 * @brief Reads options from a JSON object
 *
 * Keys (all optional except root_endpoint, durations in milliseconds):
 * {
 *   "root_endpoint": "http://host:port/v1",
 *   "proxy_url": "", "retry_attempts": 3, "retry_delay_ms": 5000,
 *   "chunk_size_bytes": 0, "upload_workers": 32,
 *   "chunk_upload_backoff": {"initial_interval_ms", "multiplier",
 *       "randomization_factor", "max_interval_ms", "max_elapsed_time_ms"},
 *   "signaling": {"min_poll_interval_ms", "max_poll_interval_ms",
 *       "max_consecutive_errors", "receive_capacity", "send_capacity"},
 *   "waiter": {"poll_interval_ms", "max_polls"}
 * }
 * Unknown keys, wrong types and out-of-range values are InvalidArgument.
 */
Result<ServiceOptions> load_service_options(const nlohmann::json& document);

/// Parses the file as JSON and forwards to load_service_options
Result<ServiceOptions> load_service_options_file(const std::string& path);

/// service_url + "/" + version, plus "/zones/" + zone when zone is not empty
std::string build_root_endpoint(const std::string& service_url,
                                const std::string& version,
                                const std::string& zone);

} // namespace cvdr::config

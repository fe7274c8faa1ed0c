#include "cvdr/config/service_options.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <type_traits>

namespace cvdr::config {

namespace {

using json = nlohmann::json;

struct InvalidOption : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void require_object(const json& node, const std::string& where) {
    if (!node.is_object()) {
        throw InvalidOption(where + " must be a JSON object");
    }
}

void reject_unknown_keys(const json& node, const std::string& where,
                         std::initializer_list<const char*> known) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        bool found = false;
        for (const char* key : known) {
            if (it.key() == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw InvalidOption("unknown option \"" + where + it.key() + "\"");
        }
    }
}

template<typename T>
void read(const json& node, const char* key, T& out) {
    auto it = node.find(key);
    if (it == node.end()) {
        return;
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            throw InvalidOption(std::string("option \"") + key + "\" must be a non-negative integer");
        }
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw InvalidOption(std::string("option \"") + key + "\" has the wrong type");
    }
}

void read_ms(const json& node, const char* key, std::chrono::milliseconds& out) {
    auto it = node.find(key);
    if (it == node.end()) {
        return;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        throw InvalidOption(std::string("option \"") + key + "\" must be a non-negative integer");
    }
    out = std::chrono::milliseconds(it->get<std::int64_t>());
}

void read_backoff(const json& node, BackoffPolicy& policy) {
    require_object(node, "chunk_upload_backoff");
    reject_unknown_keys(node, "chunk_upload_backoff.",
                        {"initial_interval_ms", "multiplier", "randomization_factor",
                         "max_interval_ms", "max_elapsed_time_ms"});
    read_ms(node, "initial_interval_ms", policy.initial_interval);
    read(node, "multiplier", policy.multiplier);
    read(node, "randomization_factor", policy.randomization_factor);
    read_ms(node, "max_interval_ms", policy.max_interval);
    read_ms(node, "max_elapsed_time_ms", policy.max_elapsed_time);

    if (policy.multiplier < 1.0) {
        throw InvalidOption("chunk_upload_backoff.multiplier must be at least 1");
    }
    if (policy.randomization_factor < 0.0 || policy.randomization_factor > 1.0) {
        throw InvalidOption("chunk_upload_backoff.randomization_factor must be within [0, 1]");
    }
}

void read_signaling(const json& node, signaling::SignalingOptions& options) {
    require_object(node, "signaling");
    reject_unknown_keys(node, "signaling.",
                        {"min_poll_interval_ms", "max_poll_interval_ms", "max_consecutive_errors",
                         "receive_capacity", "send_capacity"});
    read_ms(node, "min_poll_interval_ms", options.min_poll_interval);
    read_ms(node, "max_poll_interval_ms", options.max_poll_interval);
    read(node, "max_consecutive_errors", options.max_consecutive_errors);
    read(node, "receive_capacity", options.receive_capacity);
    read(node, "send_capacity", options.send_capacity);

    if (options.min_poll_interval.count() == 0 || options.max_poll_interval < options.min_poll_interval) {
        throw InvalidOption("signaling poll intervals must satisfy 0 < min <= max");
    }
    if (options.max_consecutive_errors < 1) {
        throw InvalidOption("signaling.max_consecutive_errors must be at least 1");
    }
}

void read_waiter(const json& node, client::WaiterOptions& options) {
    require_object(node, "waiter");
    reject_unknown_keys(node, "waiter.", {"poll_interval_ms", "max_polls"});
    read_ms(node, "poll_interval_ms", options.poll_interval);
    read(node, "max_polls", options.max_polls);
    if (options.max_polls < 1) {
        throw InvalidOption("waiter.max_polls must be at least 1");
    }
}

} // namespace

Result<ServiceOptions> load_service_options(const nlohmann::json& document) {
    ServiceOptions options;
    try {
        require_object(document, "service options");
        reject_unknown_keys(document, "",
                            {"root_endpoint", "proxy_url", "retry_attempts", "retry_delay_ms",
                             "chunk_size_bytes", "upload_workers", "chunk_upload_backoff",
                             "signaling", "waiter"});

        read(document, "root_endpoint", options.root_endpoint);
        read(document, "proxy_url", options.proxy_url);
        read(document, "retry_attempts", options.retry_attempts);
        read_ms(document, "retry_delay_ms", options.retry_delay);
        read(document, "chunk_size_bytes", options.chunk_size_bytes);
        read(document, "upload_workers", options.upload_workers);

        if (auto it = document.find("chunk_upload_backoff"); it != document.end()) {
            read_backoff(*it, options.chunk_upload_backoff);
        }
        if (auto it = document.find("signaling"); it != document.end()) {
            read_signaling(*it, options.signaling);
        }
        if (auto it = document.find("waiter"); it != document.end()) {
            read_waiter(*it, options.waiter);
        }

        if (options.root_endpoint.empty()) {
            throw InvalidOption("root_endpoint is required");
        }
        if (options.retry_attempts < 0) {
            throw InvalidOption("retry_attempts cannot be negative");
        }
        if (options.upload_workers == 0) {
            throw InvalidOption("upload_workers must be at least 1");
        }
    } catch (const InvalidOption& e) {
        return Err<ServiceOptions>(Error(ErrorKind::InvalidArgument, e.what()));
    }
    return Ok(std::move(options));
}

Result<ServiceOptions> load_service_options_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<ServiceOptions>(Error(ErrorKind::Io, "cannot open options file " + path));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::exception& e) {
        return Err<ServiceOptions>(Error(ErrorKind::Decode, "invalid JSON in " + path + ": " + e.what()));
    }
    spdlog::debug("Loaded service options from {}", path);
    return load_service_options(document);
}

std::string build_root_endpoint(const std::string& service_url,
                                const std::string& version,
                                const std::string& zone) {
    std::string result = service_url + "/" + version;
    if (!zone.empty()) {
        result += "/zones/" + zone;
    }
    return result;
}

} // namespace cvdr::config

#pragma once

#include "cvdr/client/api_types.hpp"
#include "cvdr/core/result.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace cvdr::client {

enum class OperationKind {
    Create,
    Delete
};

/// "insert"/"create" map to Create, "delete" to Delete; anything else is a Decode error
Result<OperationKind> classify_operation(const std::string& operation_type);

/// Resource id from the last path segment of a target link; empty segment is a Decode error
Result<std::string> parse_target_id(const std::string& target_link);

/// Status code reported for an operation that failed without one, or never finished
inline constexpr int kOperationUnavailableStatus = 503;

/**
 * @brief Server calls the waiter drives
 *
 * wait() asks the server for the current state of an operation (a server
 * may block for a while before answering); fetch() loads the resource an
 * operation created.
 */
template<typename Resource>
class OperationBackend {
public:
    virtual ~OperationBackend() = default;
    virtual Result<Operation> wait(const std::string& operation_name) = 0;
    virtual Result<Resource> fetch(const std::string& resource_id) = 0;
};

struct WaiterOptions {
    std::chrono::milliseconds poll_interval{1000};
    int max_polls = 5;
};

/**
 * @brief Waits for a long-running operation to settle and interprets it
 *
 * A finished operation resolves to:
 * - the fetched resource, for a Create whose target link names it
 * - std::nullopt, for a Delete
 * - an Api error carrying the server's status code (503 if absent), when the
 *   operation reports an error
 * Any other kind or an unparsable target link is a Decode error; no identity
 * is ever guessed. An operation still running after max_polls waits is an
 * Api error with status 503 so callers may retry at a higher level.
 */
template<typename Resource>
class OperationWaiter {
public:
    explicit OperationWaiter(OperationBackend<Resource>& backend, WaiterOptions options = {})
        : backend_(backend), options_(options) {}

    Result<std::optional<Resource>> wait_for(const std::string& operation_name) const {
        using Outcome = std::optional<Resource>;

        for (int poll = 1; poll <= options_.max_polls; ++poll) {
            auto op = backend_.wait(operation_name);
            if (op.is_error()) {
                return Err<Outcome>(op.error());
            }
            const auto& operation = op.value();

            if (operation.error) {
                const int status = operation.error->http_status_code != 0
                                       ? operation.error->http_status_code
                                       : kOperationUnavailableStatus;
                return Err<Outcome>(Error::from_api(ApiError{status, operation.error->message, ""}));
            }
            if (operation.done) {
                return interpret(operation);
            }

            spdlog::debug("Operation {} not done after poll {}/{}", operation_name, poll, options_.max_polls);
            if (poll < options_.max_polls) {
                std::this_thread::sleep_for(options_.poll_interval);
            }
        }

        return Err<Outcome>(Error::from_api(
            ApiError{kOperationUnavailableStatus, "operation \"" + operation_name + "\" is not done", ""}));
    }

private:
    Result<std::optional<Resource>> interpret(const Operation& operation) const {
        using Outcome = std::optional<Resource>;

        auto kind = classify_operation(operation.operation_type);
        if (kind.is_error()) {
            return Err<Outcome>(kind.error());
        }
        if (kind.value() == OperationKind::Delete) {
            return Ok(Outcome{});
        }

        auto id = parse_target_id(operation.target_link);
        if (id.is_error()) {
            return Err<Outcome>(id.error());
        }
        auto resource = backend_.fetch(id.value());
        if (resource.is_error()) {
            return Err<Outcome>(resource.error());
        }
        return Ok(Outcome{std::move(resource.value())});
    }

    OperationBackend<Resource>& backend_;
    WaiterOptions options_;
};

} // namespace cvdr::client

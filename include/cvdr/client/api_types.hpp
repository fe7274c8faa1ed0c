#pragma once

#include "cvdr/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cvdr {

// {"code": 404, "error": "...", "details": "..."}
void to_json(nlohmann::json& j, const ApiError& e);
void from_json(const nlohmann::json& j, ApiError& e);

} // namespace cvdr

namespace cvdr::client {

/**
 * @brief Error attached to a finished operation
 */
struct OperationError {
    int http_status_code = 0;  ///< 0 when the server did not provide one
    std::string message;
};

/**
 * @brief Server-side handle for asynchronous work
 *
 * Wire form follows the compute API: "status": "DONE" (or a boolean "done"),
 * "operationType", "targetLink", and on failure an "error" object together
 * with "httpErrorStatusCode" and "httpErrorMessage".
 */
struct Operation {
    std::string name;
    bool done = false;
    std::string operation_type;
    std::string target_link;
    std::optional<OperationError> error;
};

struct GCPInstance {
    std::string machine_type;
    std::string min_cpu_platform;
};

struct HostInstance {
    std::string name;
    std::int64_t boot_disk_size_gb = 0;
    std::optional<GCPInstance> gcp;
};

struct CreateHostRequest {
    HostInstance host_instance;
};

struct ListHostsResponse {
    std::vector<HostInstance> items;
    std::string next_page_token;
};

struct IceServer {
    std::vector<std::string> urls;
};

struct InfraConfig {
    std::vector<IceServer> ice_servers;
};

struct NewConnMsg {
    std::string device_id;
};

struct NewConnReply {
    std::string connection_id;
};

struct UploadDirectory {
    std::string name;
};

struct AndroidCIBuild {
    std::string branch;
    std::string build_id;
    std::string target;
};

struct FetchArtifactsRequest {
    AndroidCIBuild build;
};

struct FetchArtifactsResponse {
    AndroidCIBuild build;
};

struct CVD {
    std::string group;
    std::string name;
    std::string status;
    std::vector<std::string> displays;
};

struct CreateCVDRequest {
    AndroidCIBuild main_build;
};

struct CreateCVDResponse {
    std::vector<CVD> cvds;
};

struct ListCVDsResponse {
    std::vector<CVD> cvds;
};

void from_json(const nlohmann::json& j, Operation& op);
void to_json(nlohmann::json& j, const Operation& op);

void to_json(nlohmann::json& j, const GCPInstance& gcp);
void from_json(const nlohmann::json& j, GCPInstance& gcp);

void to_json(nlohmann::json& j, const HostInstance& host);
void from_json(const nlohmann::json& j, HostInstance& host);

void to_json(nlohmann::json& j, const CreateHostRequest& req);
void from_json(const nlohmann::json& j, ListHostsResponse& res);

void to_json(nlohmann::json& j, const IceServer& server);
void from_json(const nlohmann::json& j, IceServer& server);
void from_json(const nlohmann::json& j, InfraConfig& config);

void to_json(nlohmann::json& j, const NewConnMsg& msg);
void from_json(const nlohmann::json& j, NewConnReply& reply);

void from_json(const nlohmann::json& j, UploadDirectory& dir);

void to_json(nlohmann::json& j, const AndroidCIBuild& build);
void from_json(const nlohmann::json& j, AndroidCIBuild& build);
void to_json(nlohmann::json& j, const FetchArtifactsRequest& req);
void from_json(const nlohmann::json& j, FetchArtifactsResponse& res);

void from_json(const nlohmann::json& j, CVD& cvd);
void to_json(nlohmann::json& j, const CreateCVDRequest& req);
void from_json(const nlohmann::json& j, CreateCVDResponse& res);
void from_json(const nlohmann::json& j, ListCVDsResponse& res);

} // namespace cvdr::client

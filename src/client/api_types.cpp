#include "cvdr/client/api_types.hpp"

namespace cvdr {

void to_json(nlohmann::json& j, const ApiError& e) {
    j = nlohmann::json{{"code", e.code}, {"error", e.message}};
    if (!e.details.empty()) {
        j["details"] = e.details;
    }
}

void from_json(const nlohmann::json& j, ApiError& e) {
    e.code = j.value("code", 0);
    e.message = j.value("error", "");
    e.details = j.value("details", "");
}

} // namespace cvdr

namespace cvdr::client {
using nlohmann::json;

void from_json(const json& j, Operation& op) {
    op.name = j.value("name", "");
    op.done = j.value("done", false) || j.value("status", "") == "DONE";
    op.operation_type = j.value("operationType", "");
    op.target_link = j.value("targetLink", "");
    op.error.reset();
    if (j.contains("error") && !j.at("error").is_null()) {
        OperationError error;
        error.http_status_code = j.value("httpErrorStatusCode", 0);
        error.message = j.value("httpErrorMessage", "");
        op.error = std::move(error);
    }
}

void to_json(json& j, const Operation& op) {
    j = json{{"name", op.name}, {"done", op.done}};
    if (!op.operation_type.empty()) {
        j["operationType"] = op.operation_type;
    }
    if (!op.target_link.empty()) {
        j["targetLink"] = op.target_link;
    }
    if (op.error) {
        j["error"] = json::object();
        j["httpErrorStatusCode"] = op.error->http_status_code;
        j["httpErrorMessage"] = op.error->message;
    }
}

void to_json(json& j, const GCPInstance& gcp) {
    j = json{{"machine_type", gcp.machine_type}, {"min_cpu_platform", gcp.min_cpu_platform}};
}

void from_json(const json& j, GCPInstance& gcp) {
    gcp.machine_type = j.value("machine_type", "");
    gcp.min_cpu_platform = j.value("min_cpu_platform", "");
}

void to_json(json& j, const HostInstance& host) {
    j = json::object();
    if (!host.name.empty()) {
        j["name"] = host.name;
    }
    if (host.boot_disk_size_gb != 0) {
        j["boot_disk_size_gb"] = host.boot_disk_size_gb;
    }
    if (host.gcp) {
        j["gcp"] = *host.gcp;
    }
}

void from_json(const json& j, HostInstance& host) {
    host.name = j.value("name", "");
    host.boot_disk_size_gb = j.value("boot_disk_size_gb", std::int64_t{0});
    if (j.contains("gcp") && j.at("gcp").is_object()) {
        host.gcp = j.at("gcp").get<GCPInstance>();
    } else {
        host.gcp.reset();
    }
}

void to_json(json& j, const CreateHostRequest& req) {
    j = json{{"host_instance", req.host_instance}};
}

void from_json(const json& j, ListHostsResponse& res) {
    res.items = j.value("items", std::vector<HostInstance>{});
    res.next_page_token = j.value("nextPageToken", "");
}

void to_json(json& j, const IceServer& server) {
    j = json{{"urls", server.urls}};
}

void from_json(const json& j, IceServer& server) {
    server.urls = j.value("urls", std::vector<std::string>{});
}

void from_json(const json& j, InfraConfig& config) {
    config.ice_servers = j.value("ice_servers", std::vector<IceServer>{});
}

void to_json(json& j, const NewConnMsg& msg) {
    j = json{{"device_id", msg.device_id}};
}

void from_json(const json& j, NewConnReply& reply) {
    reply.connection_id = j.at("connection_id").get<std::string>();
}

void from_json(const json& j, UploadDirectory& dir) {
    dir.name = j.at("name").get<std::string>();
}

void to_json(json& j, const AndroidCIBuild& build) {
    j = json{{"branch", build.branch}, {"build_id", build.build_id}, {"target", build.target}};
}

void from_json(const json& j, AndroidCIBuild& build) {
    build.branch = j.value("branch", "");
    build.build_id = j.value("build_id", "");
    build.target = j.value("target", "");
}

void to_json(json& j, const FetchArtifactsRequest& req) {
    j = json{{"android_ci_build_source", {{"main_build", req.build}}}};
}

void from_json(const json& j, FetchArtifactsResponse& res) {
    res.build = j.at("android_ci_build_source").at("main_build").get<AndroidCIBuild>();
}

void from_json(const json& j, CVD& cvd) {
    cvd.group = j.value("group", "");
    cvd.name = j.value("name", "");
    cvd.status = j.value("status", "");
    cvd.displays = j.value("displays", std::vector<std::string>{});
}

void to_json(json& j, const CreateCVDRequest& req) {
    j = json{{"cvd", {{"build_source", {{"android_ci_build_source", {{"main_build", req.main_build}}}}}}}};
}

void from_json(const json& j, CreateCVDResponse& res) {
    res.cvds = j.value("cvds", std::vector<CVD>{});
}

void from_json(const json& j, ListCVDsResponse& res) {
    res.cvds = j.value("cvds", std::vector<CVD>{});
}

} // namespace cvdr::client

#include "cvdr/client/orchestrator_service.hpp"

#include "cvdr/client/polled_connection.hpp"
#include "cvdr/http/beast_http_client.hpp"
#include "cvdr/upload/chunked_uploader.hpp"
#include "cvdr/upload/http_chunk_sink.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <thread>

namespace cvdr::client {

namespace {

TransportOptions transport_options_for(const config::ServiceOptions& options) {
    TransportOptions transport;
    transport.root_endpoint = options.root_endpoint;
    transport.retry_attempts = options.retry_attempts;
    transport.retry_delay = options.retry_delay;
    return transport;
}

} // namespace

HostOperationBackend::HostOperationBackend(std::shared_ptr<const Transport> transport)
    : transport_(std::move(transport)) {
}

Result<Operation> HostOperationBackend::wait(const std::string& operation_name) {
    return transport_->call<Operation>(http::HttpMethod::POST, "/operations/" + operation_name + "/:wait");
}

Result<HostInstance> HostOperationBackend::fetch(const std::string& resource_id) {
    return transport_->call<HostInstance>(http::HttpMethod::GET, "/hosts/" + resource_id);
}

OrchestratorService::OrchestratorService(config::ServiceOptions options, std::shared_ptr<http::HttpClient> client)
    : options_(std::move(options)),
      client_(std::move(client)),
      transport_(std::make_shared<const Transport>(client_, transport_options_for(options_))) {
}

Result<std::unique_ptr<OrchestratorService>> OrchestratorService::create(config::ServiceOptions options) {
    http::BeastHttpClientOptions http_options;
    http_options.proxy_url = options.proxy_url;
    http_options.max_idle_per_host = options.upload_workers;
    auto client = http::BeastHttpClient::create(std::move(http_options));
    if (client.is_error()) {
        return Err<std::unique_ptr<OrchestratorService>>(client.error());
    }
    return Ok(std::make_unique<OrchestratorService>(std::move(options), std::move(client.value())));
}

Result<HostInstance> OrchestratorService::create_host(const CreateHostRequest& request) const {
    const nlohmann::json body = request;
    auto op = transport_->call<Operation>(http::HttpMethod::POST, "/hosts", &body);
    if (op.is_error()) {
        return Err<HostInstance>(op.error());
    }

    HostOperationBackend backend(transport_);
    OperationWaiter<HostInstance> waiter(backend, options_.waiter);
    auto host = waiter.wait_for(op.value().name);
    if (host.is_error()) {
        return Err<HostInstance>(host.error());
    }
    if (!host.value()) {
        return Err<HostInstance>(Error(ErrorKind::Decode,
                                       "operation " + op.value().name + " did not create a host"));
    }
    spdlog::info("Created host {}", host.value()->name);
    return Ok(std::move(*host.value()));
}

Result<ListHostsResponse> OrchestratorService::list_hosts() const {
    return transport_->call<ListHostsResponse>(http::HttpMethod::GET, "/hosts");
}

Result<void> OrchestratorService::delete_hosts(const std::vector<std::string>& names) const {
    std::mutex mutex;
    std::vector<std::pair<std::string, Error>> failures;

    std::vector<std::thread> tasks;
    tasks.reserve(names.size());
    for (const auto& name : names) {
        tasks.emplace_back([&, name]() {
            auto result = transport_->execute(http::HttpMethod::DELETE_METHOD, "/hosts/" + name, nullptr, nullptr);
            if (result.is_error()) {
                std::lock_guard lock(mutex);
                failures.emplace_back(name, result.error());
            }
        });
    }
    for (auto& task : tasks) {
        task.join();
    }

    if (failures.empty()) {
        return Ok();
    }
    Error aggregated = failures.front().second;
    aggregated.message.clear();
    if (failures.size() > 1) {
        aggregated.api.reset();
        aggregated.message = std::to_string(failures.size()) + " errors occurred:";
    }
    for (const auto& [name, error] : failures) {
        if (!aggregated.message.empty()) {
            aggregated.message += "\n\t* ";
        }
        aggregated.message += "Delete host \"" + name + "\" failed: " + error.to_string();
    }
    return Err<void>(std::move(aggregated));
}

Result<InfraConfig> OrchestratorService::get_infra_config(const std::string& host) const {
    return transport_->call<InfraConfig>(http::HttpMethod::GET, "/hosts/" + host + "/infra_config");
}

Result<NewConnReply> OrchestratorService::create_polled_connection(const std::string& host,
                                                                   const std::string& device) const {
    const nlohmann::json body = NewConnMsg{device};
    return transport_->call<NewConnReply>(http::HttpMethod::POST, "/hosts/" + host + "/polled_connections", &body);
}

Result<SignalingConnection> OrchestratorService::connect_signaling(const std::string& host,
                                                                   const std::string& device,
                                                                   const std::vector<IceServer>& local_ice_servers) const {
    auto conn = create_polled_connection(host, device);
    if (conn.is_error()) {
        Error error = conn.error();
        error.message = "Failed to create polled connection: " + error.message;
        return Err<SignalingConnection>(std::move(error));
    }
    auto infra = get_infra_config(host);
    if (infra.is_error()) {
        Error error = infra.error();
        error.message = "Failed to obtain infra config: " + error.message;
        return Err<SignalingConnection>(std::move(error));
    }

    SignalingConnection connection;
    connection.connection_id = conn.value().connection_id;
    connection.ice_servers = local_ice_servers;
    connection.ice_servers.insert(connection.ice_servers.end(),
                                  infra.value().ice_servers.begin(), infra.value().ice_servers.end());

    auto transport = std::make_shared<PolledConnectionTransport>(transport_, host, connection.connection_id);
    connection.session = signaling::open_signaling_session(std::move(transport), options_.signaling);
    spdlog::info("Signaling connection {} to device {} on host {} opened",
                 connection.connection_id, device, host);
    return Ok(std::move(connection));
}

template<typename Response, typename Request>
Result<Response> OrchestratorService::run_host_operation(const std::string& host,
                                                         const std::string& path,
                                                         const Request& request) const {
    const nlohmann::json body = request;
    const http::Headers headers{{kInjectBuildApiCredsHeader, ""}};
    auto op = transport_->call<Operation>(http::HttpMethod::POST, path, &body, headers);
    if (op.is_error()) {
        return Err<Response>(op.error());
    }
    return transport_->call<Response>(http::HttpMethod::POST,
                                      "/hosts/" + host + "/operations/" + op.value().name + "/:wait");
}

Result<FetchArtifactsResponse> OrchestratorService::fetch_artifacts(const std::string& host,
                                                                    const FetchArtifactsRequest& request) const {
    return run_host_operation<FetchArtifactsResponse>(host, "/hosts/" + host + "/artifacts", request);
}

Result<CreateCVDResponse> OrchestratorService::create_cvd(const std::string& host,
                                                          const CreateCVDRequest& request) const {
    return run_host_operation<CreateCVDResponse>(host, "/hosts/" + host + "/cvds", request);
}

Result<std::vector<CVD>> OrchestratorService::list_cvds(const std::string& host) const {
    auto res = transport_->call<ListCVDsResponse>(http::HttpMethod::GET, "/hosts/" + host + "/cvds");
    if (res.is_error()) {
        return Err<std::vector<CVD>>(res.error());
    }
    return Ok(std::move(res.value().cvds));
}

Result<void> OrchestratorService::download_runtime_artifacts(const std::string& host, std::ostream& out) const {
    http::HttpRequest request;
    request.method = http::HttpMethod::POST;
    request.url = transport_->url_for("/hosts/" + host + "/runtimeartifacts/:pull");

    auto sent = client_->send(request);
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    const auto& response = sent.value();
    out.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
    if (!out) {
        return Err<void>(Error(ErrorKind::Io, "failed writing runtime artifacts of host " + host));
    }
    if (!response.is_success()) {
        return Err<void>(Error::from_api(ApiError{response.status_code, response.status_line(), ""}));
    }
    return Ok();
}

Result<std::string> OrchestratorService::create_upload(const std::string& host) const {
    auto dir = transport_->call<UploadDirectory>(http::HttpMethod::POST, "/hosts/" + host + "/userartifacts");
    if (dir.is_error()) {
        return Err<std::string>(dir.error());
    }
    return Ok(std::move(dir.value().name));
}

Result<void> OrchestratorService::upload_files(const std::string& host,
                                               const std::string& upload_dir,
                                               const std::vector<std::string>& filenames) const {
    if (upload_dir.empty()) {
        return Err<void>(Error(ErrorKind::InvalidArgument, "upload directory cannot be empty"));
    }
    upload::UploaderOptions uploader_options;
    uploader_options.chunk_size_bytes = options_.chunk_size_bytes;
    uploader_options.worker_count = options_.upload_workers;
    uploader_options.backoff = options_.chunk_upload_backoff;

    upload::ChunkedUploader uploader(std::make_shared<upload::HttpChunkSink>(client_), uploader_options);
    return uploader.upload(transport_->url_for("/hosts/" + host + "/userartifacts/" + upload_dir), filenames);
}

std::string build_webrtc_stream_url(const std::string& root_endpoint, const std::string& host, const std::string& cvd) {
    return root_endpoint + "/hosts/" + host + "/devices/" + cvd + "/files/client.html";
}

std::string build_cvd_logs_url(const std::string& root_endpoint, const std::string& host, const std::string& cvd) {
    return root_endpoint + "/hosts/" + host + "/cvds/" + cvd + "/logs/";
}

} // namespace cvdr::client

#pragma once

#include "cvdr/client/api_types.hpp"
#include "cvdr/client/operation_waiter.hpp"
#include "cvdr/client/transport.hpp"
#include "cvdr/config/service_options.hpp"
#include "cvdr/http/http_client.hpp"
#include "cvdr/signaling/signaling_session.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace cvdr::client {

/// Cloud Orchestrator only checks that this header is present
inline constexpr const char* kInjectBuildApiCredsHeader = "X-Cutf-Cloud-Orchestrator-Inject-BuildAPI-Creds";

/**
 * @brief Signaling endpoints of a device connection
 *
 * ice_servers lists the locally configured servers first, then the ones the
 * host's infra config advertises. WebRTC negotiation over the session's
 * channels is left to the caller.
 */
struct SignalingConnection {
    std::string connection_id;
    std::vector<IceServer> ice_servers;
    std::unique_ptr<signaling::SignalingSession> session;
};

/**
 * @brief Waits for host operations via /operations/{name}/:wait and loads
 * hosts from /hosts/{id}
 */
class HostOperationBackend : public OperationBackend<HostInstance> {
public:
    explicit HostOperationBackend(std::shared_ptr<const Transport> transport);

    Result<Operation> wait(const std::string& operation_name) override;
    Result<HostInstance> fetch(const std::string& resource_id) override;

private:
    std::shared_ptr<const Transport> transport_;
};

/**
 * @brief Client for the cloud orchestration service
 *
 * One object per service endpoint. All calls block the calling thread; the
 * object holds no per-call state and may be shared between threads.
 */
class OrchestratorService {
public:
    OrchestratorService(config::ServiceOptions options, std::shared_ptr<http::HttpClient> client);

    /// Builds the service over a BeastHttpClient honoring options.proxy_url
    static Result<std::unique_ptr<OrchestratorService>> create(config::ServiceOptions options);

    // Hosts
    Result<HostInstance> create_host(const CreateHostRequest& request) const;
    Result<ListHostsResponse> list_hosts() const;
    /// Deletes all hosts concurrently; every failure is reported in the one returned error
    Result<void> delete_hosts(const std::vector<std::string>& names) const;
    Result<InfraConfig> get_infra_config(const std::string& host) const;

    // Device signaling
    Result<NewConnReply> create_polled_connection(const std::string& host, const std::string& device) const;
    Result<SignalingConnection> connect_signaling(const std::string& host,
                                                  const std::string& device,
                                                  const std::vector<IceServer>& local_ice_servers = {}) const;

    // Cuttlefish devices and artifacts
    Result<FetchArtifactsResponse> fetch_artifacts(const std::string& host, const FetchArtifactsRequest& request) const;
    Result<CreateCVDResponse> create_cvd(const std::string& host, const CreateCVDRequest& request) const;
    Result<std::vector<CVD>> list_cvds(const std::string& host) const;

    /// Copies the runtime artifacts tarball of host into out
    Result<void> download_runtime_artifacts(const std::string& host, std::ostream& out) const;

    // User artifacts
    Result<std::string> create_upload(const std::string& host) const;
    Result<void> upload_files(const std::string& host,
                              const std::string& upload_dir,
                              const std::vector<std::string>& filenames) const;

    const std::string& root_uri() const noexcept { return options_.root_endpoint; }
    const config::ServiceOptions& options() const noexcept { return options_; }

private:
    template<typename Response, typename Request>
    Result<Response> run_host_operation(const std::string& host,
                                        const std::string& path,
                                        const Request& request) const;

    config::ServiceOptions options_;
    std::shared_ptr<http::HttpClient> client_;
    std::shared_ptr<const Transport> transport_;
};

std::string build_webrtc_stream_url(const std::string& root_endpoint, const std::string& host, const std::string& cvd);
std::string build_cvd_logs_url(const std::string& root_endpoint, const std::string& host, const std::string& cvd);

} // namespace cvdr::client

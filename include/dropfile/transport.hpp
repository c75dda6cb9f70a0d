#pragma once

#include "dropfile/client_config.hpp"
#include "dropfile/http.hpp"
#include "dropfile/oauth.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dropfile {

class MetricsExporter;

// Which API host serves an endpoint
enum class ApiHost {
    Api,      // metadata, fileops
    Content   // files, files_put, chunked_upload, commit_chunked_upload
};

// One remote API call, before signing
struct ApiRequest {
    net::HttpMethod method = net::HttpMethod::GET;
    ApiHost host = ApiHost::Api;

    // Endpoint below the API version, including root and path where the
    // call takes one, e.g. "files/sandbox/docs/a.txt" or "chunked_upload"
    std::string endpoint;

    // Sent in the query string
    std::map<std::string, std::string> params;

    std::vector<uint8_t> body;

    // Inclusive byte range for ranged reads
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;
};

// Result of a signed request
struct TransportResponse {
    int status = 0;
    net::HttpHeaders headers;
    std::vector<uint8_t> body;

    // Network-level failure (no HTTP status)
    std::string error;
    bool is_network_error = false;

    bool ok() const { return !is_network_error && net::is_success_status(status); }
};

// Abstract interface the handle engine talks to
// Executes one authenticated request and returns status plus body
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportResponse signed_request(const ApiRequest& request) = 0;
};

// Transport over libcurl with OAuth signing
class HttpTransport : public Transport {
public:
    explicit HttpTransport(const ClientConfig& config);
    ~HttpTransport() override;

    TransportResponse signed_request(const ApiRequest& request) override;

    // Not owned; may be null
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Full request URL: scheme://host/1/<endpoint>?<params>
    std::string build_url(const ApiRequest& request) const;

    const net::HttpClient& client() const { return *http_client_; }

private:
    std::string scheme_;
    std::string api_host_;
    std::string content_host_;
    net::OAuthSigner signer_;
    std::unique_ptr<net::HttpClient> http_client_;
    MetricsExporter* metrics_ = nullptr;
};

/// Endpoint for a path-addressed call: "<prefix>/<root><path>".
/// A missing leading '/' on the path is added.
std::string make_endpoint(const std::string& prefix, const std::string& root,
                          const std::string& path);

/// Translate transport_options into HTTP client settings.
/// Unknown keys are logged and ignored.
net::HttpClientConfig make_http_client_config(const std::map<std::string, std::string>& options);

}  // namespace dropfile

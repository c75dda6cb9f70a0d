#include "dropfile/transport.hpp"
#include "dropfile/log.hpp"
#include "dropfile/metrics.hpp"

#include <optional>
#include <stdexcept>

namespace dropfile {

namespace {

constexpr const char* API_VERSION = "1";

bool option_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

net::OAuthSigner make_signer(const ClientConfig& config) {
    if (config.oauth2) {
        return net::OAuthSigner::bearer(config.access_token);
    }
    auto method = config.signature_method == "plaintext"
        ? net::OAuthSigner::Method::Plaintext
        : net::OAuthSigner::Method::HmacSha1;
    return net::OAuthSigner::oauth1(config.app_key, config.app_secret,
                                    config.access_token, config.access_secret, method);
}

// "files/sandbox/a.txt" -> "files", "fileops/copy" -> "fileops"
std::string endpoint_label(const std::string& endpoint) {
    auto slash = endpoint.find('/');
    return slash == std::string::npos ? endpoint : endpoint.substr(0, slash);
}

}  // namespace

std::string make_endpoint(const std::string& prefix, const std::string& root,
                          const std::string& path) {
    std::string endpoint = prefix + "/" + root;
    if (path.empty() || path.front() != '/') {
        endpoint += '/';
    }
    return endpoint + path;
}

net::HttpClientConfig make_http_client_config(const std::map<std::string, std::string>& options) {
    net::HttpClientConfig http;

    for (const auto& [key, value] : options) {
        try {
            if (key == "connect_timeout_ms") {
                http.connect_timeout = std::chrono::milliseconds(std::stoull(value));
            } else if (key == "total_timeout_ms") {
                http.total_timeout = std::chrono::milliseconds(std::stoull(value));
            } else if (key == "max_retries") {
                http.max_retries = std::stoi(value);
            } else if (key == "retry_delay_ms") {
                http.initial_retry_delay = std::chrono::milliseconds(std::stoull(value));
            } else if (key == "max_response_size") {
                http.max_response_size = std::stoull(value);
            } else if (key == "max_idle_handles") {
                http.max_idle_handles = std::stoull(value);
            } else if (key == "user_agent") {
                http.user_agent = value;
            } else if (key == "proxy") {
                http.proxy_url = value;
            } else if (key == "ca_bundle") {
                http.ca_bundle = value;
            } else if (key == "verify_ssl") {
                http.verify_ssl = option_bool(value);
            } else if (key == "verbose") {
                http.verbose = option_bool(value);
            } else {
                log_error("Ignoring unknown transport option: %s", key.c_str());
            }
        } catch (const std::exception&) {
            log_error("Invalid value for transport option %s: %s", key.c_str(), value.c_str());
        }
    }

    return http;
}

HttpTransport::HttpTransport(const ClientConfig& config)
    : scheme_(config.scheme)
    , api_host_(config.api_host)
    , content_host_(config.content_host)
    , signer_(make_signer(config))
    , http_client_(std::make_unique<net::HttpClient>(
          make_http_client_config(config.transport_options))) {}

HttpTransport::~HttpTransport() = default;

std::string HttpTransport::build_url(const ApiRequest& request) const {
    const auto& host = request.host == ApiHost::Content ? content_host_ : api_host_;

    std::string url = scheme_ + "://" + host + "/" + API_VERSION + "/" +
                      net::url_encode_path(request.endpoint);

    bool first = true;
    for (const auto& [key, value] : request.params) {
        url += first ? "?" : "&";
        url += net::url_encode(key) + "=" + net::url_encode(value);
        first = false;
    }
    return url;
}

TransportResponse HttpTransport::signed_request(const ApiRequest& request) {
    net::HttpRequest http;
    http.method = request.method;
    http.url = build_url(request);
    http.body = request.body;
    http.byte_range = request.byte_range;
    if (!http.body.empty() || request.method == net::HttpMethod::PUT) {
        http.headers.set_content_type("application/octet-stream");
    }

    signer_.sign(http);

    net::HttpResponse response;
    if (metrics_) {
        ScopedTimer timer(metrics_->request_duration());
        response = http_client_->execute_with_retry(http);
    } else {
        response = http_client_->execute_with_retry(http);
    }

    log_debug("%s %s -> %d (%zu bytes)", net::http_method_to_string(request.method),
              http.url.c_str(), response.status_code, response.body.size());

    if (metrics_) {
        metrics_->observe_request(endpoint_label(request.endpoint),
                                  !response.is_network_error && response.ok(),
                                  request.body.size(), response.body.size());
    }

    TransportResponse result;
    result.status = response.status_code;
    result.headers = std::move(response.headers);
    result.body = std::move(response.body);
    result.error = std::move(response.error);
    result.is_network_error = response.is_network_error;
    return result;
}

}  // namespace dropfile

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dropfile::net {

enum class HttpMethod {
    GET,
    POST,
    PUT
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// 429 and the gateway errors; everything else is final
bool is_retryable_status(int status);

// Case-insensitive header multimap
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_authorization(const std::string& scheme, const std::string& credentials);
    void set_bearer_token(const std::string& token);

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Inclusive byte range, sent as a Range header
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }

    // Set when no HTTP status was obtained (DNS, connect, TLS, timeout)
    std::string error;
    bool is_network_error = false;
};

// DROPFILE_REQUEST_TIMEOUT (seconds) overrides total_timeout.
struct HttpClientConfig {
    size_t max_idle_handles = 4;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // 0 = unlimited
    size_t max_response_size = 160 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;
    std::string user_agent = "dropfile/1.0";
    std::string proxy_url;

    // Retries on network errors and retryable statuses (0 = never)
    int max_retries = 0;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_backoff_multiplier = 2.0;

    bool verbose = false;
};

// Blocking HTTP client over a small pool of libcurl easy handles
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);
    HttpResponse execute_with_retry(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;    // still percent-encoded, without '?'

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// RFC 3986 percent-encoding (unreserved characters kept)
std::string url_encode(const std::string& str);

// Percent-encode each path segment, keeping '/' separators
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);

} // namespace dropfile::net

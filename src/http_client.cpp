#include "dropfile/http.hpp"
#include "dropfile/log.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

namespace dropfile::net {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// DROPFILE_REQUEST_TIMEOUT, accepted in [5, 3600] seconds
std::optional<std::chrono::milliseconds> env_total_timeout() {
    const char* env = std::getenv("DROPFILE_REQUEST_TIMEOUT");
    if (!env) return std::nullopt;
    try {
        unsigned long secs = std::stoul(env);
        if (secs >= 5 && secs <= 3600) {
            return std::chrono::milliseconds(secs * 1000);
        }
        log_error("DROPFILE_REQUEST_TIMEOUT=%s out of range [5,3600], ignored", env);
    } catch (const std::exception&) {
        log_error("invalid DROPFILE_REQUEST_TIMEOUT=%s, ignored", env);
    }
    return std::nullopt;
}

} // namespace

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 429 || status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t slash = path.find('/', pos);
        out += url_encode(path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos));
        if (slash == std::string::npos) break;
        out += '/';
        pos = slash + 1;
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

// ============================================================================
// Headers, requests, responses
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[to_lower(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[to_lower(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(to_lower(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_authorization(const std::string& scheme, const std::string& credentials) {
    set("Authorization", scheme + " " + credentials);
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set_authorization("Bearer", token);
}

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl result;
    result.scheme = to_lower(url.substr(0, scheme_end));

    size_t authority = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority);
    if (authority_end == std::string::npos) authority_end = url.size();
    std::string host_port = url.substr(authority, authority_end - authority);
    if (host_port.empty()) {
        return std::nullopt;
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.front() != '[') {
        try {
            result.port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        host_port.resize(colon);
    }
    result.host = to_lower(host_port);

    size_t fragment = url.find('#', authority_end);
    std::string rest = url.substr(authority_end, fragment == std::string::npos
                                                     ? std::string::npos
                                                     : fragment - authority_end);
    size_t qmark = rest.find('?');
    result.path = rest.substr(0, qmark);
    if (qmark != std::string::npos) {
        result.query = rest.substr(qmark + 1);
    }
    return result;
}

// ============================================================================
// libcurl transfer
// ============================================================================

namespace {

// Response body accumulator with an optional size cap
struct BodySink {
    std::vector<uint8_t>* body;
    size_t limit;
    bool overflowed = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    size_t bytes = size * nmemb;
    if (sink->limit > 0 && sink->body->size() + bytes > sink->limit) {
        sink->overflowed = true;
        return 0;  // aborts the transfer
    }
    sink->body->insert(sink->body->end(), ptr, ptr + bytes);
    return bytes;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Interim responses (100-continue, redirects) each start a fresh block
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return bytes;
    }
    size_t value_start = line.find_first_not_of(" \t", colon + 1);
    headers->add(line.substr(0, colon),
                 value_start == std::string::npos ? std::string() : line.substr(value_start));
    return bytes;
}

struct BodySource {
    const std::vector<uint8_t>* body;
    size_t offset = 0;
};

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* src = static_cast<BodySource*>(userdata);
    size_t n = std::min(size * nitems, src->body->size() - src->offset);
    if (n > 0) {
        std::memcpy(buffer, src->body->data() + src->offset, n);
        src->offset += n;
    }
    return n;
}

// Owns the per-request curl_slist
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

} // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });

        if (auto timeout = env_total_timeout()) {
            config_.total_timeout = *timeout;
        }
        if (!config_.verify_ssl) {
            log_error("SSL verification disabled via configuration; "
                      "connections are exposed to man-in-the-middle attacks");
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire();
        if (!curl) {
            response.error = "Failed to create CURL handle";
            response.is_network_error = true;
            return response;
        }

        HeaderList headers;
        for (const auto& [name, value] : request.headers.all()) {
            headers.append(name + ": " + value);
        }
        // No "Expect: 100-continue" round trip on uploads
        headers.append("Expect:");

        BodySource source{&request.body};
        std::vector<uint8_t> body;
        BodySink sink{&body, config_.max_response_size};
        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        set_method(curl, request, source);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
        if (!range.empty()) {
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }
        apply_client_options(curl);

        CURLcode rc = curl_easy_perform(curl);

        if (sink.overflowed) {
            response.error = "response body exceeds " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            response.is_network_error = true;
        } else {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(body);
        }

        release(curl);
        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        auto delay = config_.initial_retry_delay;
        for (int attempt = 0;; ++attempt) {
            HttpResponse response = execute(request);
            bool retryable = response.is_network_error || is_retryable_status(response.status_code);
            if (!retryable || attempt >= config_.max_retries) {
                return response;
            }

            log_debug("retrying %s %s after %s (attempt %d of %d)",
                      http_method_to_string(request.method), request.url.c_str(),
                      response.is_network_error ? response.error.c_str()
                                                : std::to_string(response.status_code).c_str(),
                      attempt + 1, config_.max_retries);
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<long>(delay.count() * config_.retry_backoff_multiplier));
        }
    }

    const HttpClientConfig& config() const { return config_; }

private:
    static void set_method(CURL* curl, const HttpRequest& request, BodySource& source) {
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty()
                                     ? ""
                                     : reinterpret_cast<const char*>(request.body.data()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::PUT:
                // Sends Content-Length even for an empty body
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
                curl_easy_setopt(curl, CURLOPT_READDATA, &source);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }
    }

    void apply_client_options(CURL* curl) const {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }
    }

    CURL* acquire() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_.empty()) {
            return curl_easy_init();
        }
        CURL* handle = idle_.back();
        idle_.pop_back();
        return handle;
    }

    void release(CURL* handle) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        curl_easy_reset(handle);
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

} // namespace dropfile::net

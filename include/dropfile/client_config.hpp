#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dropfile {

constexpr uint64_t DEFAULT_CHUNK_SIZE = 4ULL * 1024 * 1024;  // 4 MiB

// Largest payload putfile() sends as one files_put request
constexpr uint64_t DEFAULT_DIRECT_UPLOAD_LIMIT = 150ULL * 1024 * 1024;

/// Configuration for a FileHandle and the HTTP transport behind it.
struct ClientConfig {
    // Credentials
    std::string access_token;
    std::string access_secret;  // OAuth 1 only
    std::string app_key;
    std::string app_secret;     // OAuth 1 only
    bool oauth2 = false;
    std::string signature_method = "hmac-sha1";  // OAuth 1: "hmac-sha1" or "plaintext"

    // Upload flush threshold and read prefetch size
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;

    // putfile() payloads above this go through a chunked upload
    uint64_t direct_upload_limit = DEFAULT_DIRECT_UPLOAD_LIMIT;

    // Access scope: "sandbox" (app folder) or "dropbox" (full)
    std::string root = "sandbox";

    // Remote endpoints
    std::string scheme = "https";
    std::string api_host = "api.dropbox.com";
    std::string content_host = "api-content.dropbox.com";

    // Passed through to the HTTP client:
    //   connect_timeout_ms, total_timeout_ms, user_agent, proxy,
    //   ca_bundle, verify_ssl, max_retries, verbose
    std::map<std::string, std::string> transport_options;

    // Diagnostics
    bool verbose = false;
    std::filesystem::path metrics_file;  // Prometheus textfile, empty = off
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Non-option arguments are appended to `positional` when given,
    /// otherwise they are an error.
    /// Returns empty optional on error or --help (usage printed to stderr).
    static std::optional<ClientConfig> from_args(int argc, char* argv[],
                                                 std::vector<std::string>* positional = nullptr);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill credentials from DROPBOX_* environment variables where unset
    /// and normalize values.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace dropfile

#include "dropfile/client_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace dropfile {

namespace {

// Parse a byte count with an optional K/M/G suffix ("4M", "512K", "1048576").
std::optional<uint64_t> parse_size(const std::string& text) {
    if (text.empty()) return std::nullopt;
    uint64_t multiplier = 1;
    std::string digits = text;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024ULL; digits.pop_back(); break;
        case 'm': case 'M': multiplier = 1024ULL * 1024; digits.pop_back(); break;
        case 'g': case 'G': multiplier = 1024ULL * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(digits) * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Fill `value` from an environment variable when it is still empty.
void env_fallback(std::string& value, const char* name) {
    if (!value.empty()) return;
    if (const char* v = std::getenv(name)) {
        value = v;
    }
}

// JSON values for transport options may be strings, numbers or booleans.
std::string option_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

void print_usage() {
    std::cerr <<
        "Usage: dropfile [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  cat <remote>                     Write a remote file to stdout\n"
        "  get <remote> <local>             Download a remote file\n"
        "  put <local> <remote>             Upload a local file (chunked)\n"
        "  ls <remote-dir>                  List a folder\n"
        "  stat <remote>                    Print metadata as JSON\n"
        "  cp <from> <to>                   Copy a remote file or folder\n"
        "  mv <from> <to>                   Move a remote file or folder\n"
        "  rm <remote>                      Delete a remote file or folder\n"
        "  mkdir <remote>                   Create a folder\n"
        "\n"
        "Credentials:\n"
        "  --access-token <token>           Access token (or DROPBOX_ACCESS_TOKEN env)\n"
        "  --access-secret <secret>         Access secret, OAuth 1 (or DROPBOX_ACCESS_SECRET env)\n"
        "  --app-key <key>                  App key, OAuth 1 (or DROPBOX_APP_KEY env)\n"
        "  --app-secret <secret>            App secret, OAuth 1 (or DROPBOX_APP_SECRET env)\n"
        "  --oauth2                         Use an OAuth 2 bearer token\n"
        "  --signature <method>             OAuth 1 signature: hmac-sha1 (default), plaintext\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --chunk-size <N[K|M|G]>          Upload chunk / read window size (default: 4M)\n"
        "  --root <sandbox|dropbox>         Access scope (default: sandbox)\n"
        "  --api-host <host>                API host (default: api.dropbox.com)\n"
        "  --content-host <host>            Content host (default: api-content.dropbox.com)\n"
        "  --timeout <secs>                 Total request timeout\n"
        "  --connect-timeout <secs>         Connect timeout\n"
        "  --max-retries <N>                Transport retries on 429/5xx/network errors (default: 0)\n"
        "  --proxy <url>                    HTTP proxy\n"
        "  --ca-cert <path>                 CA bundle for TLS\n"
        "  --no-verify-ssl                  Skip TLS verification\n"
        "  --transport-opt <key=value>      Raw transport option\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Debug output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[],
                                                    std::vector<std::string>* positional) {
    ClientConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--access-token") {
            auto* v = next_arg(i, "--access-token");
            if (!v) return std::nullopt;
            config.access_token = v;
        } else if (arg == "--access-secret") {
            auto* v = next_arg(i, "--access-secret");
            if (!v) return std::nullopt;
            config.access_secret = v;
        } else if (arg == "--app-key") {
            auto* v = next_arg(i, "--app-key");
            if (!v) return std::nullopt;
            config.app_key = v;
        } else if (arg == "--app-secret") {
            auto* v = next_arg(i, "--app-secret");
            if (!v) return std::nullopt;
            config.app_secret = v;
        } else if (arg == "--oauth2") {
            config.oauth2 = true;
        } else if (arg == "--signature") {
            auto* v = next_arg(i, "--signature");
            if (!v) return std::nullopt;
            config.signature_method = v;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--chunk-size") {
            auto* v = next_arg(i, "--chunk-size");
            if (!v) return std::nullopt;
            auto size = parse_size(v);
            if (!size) {
                std::cerr << "Error: invalid --chunk-size: " << v << "\n";
                return std::nullopt;
            }
            config.chunk_size = *size;
        } else if (arg == "--root") {
            auto* v = next_arg(i, "--root");
            if (!v) return std::nullopt;
            config.root = v;
        } else if (arg == "--api-host") {
            auto* v = next_arg(i, "--api-host");
            if (!v) return std::nullopt;
            config.api_host = v;
        } else if (arg == "--content-host") {
            auto* v = next_arg(i, "--content-host");
            if (!v) return std::nullopt;
            config.content_host = v;
        } else if (arg == "--timeout") {
            auto* v = next_arg(i, "--timeout");
            if (!v) return std::nullopt;
            config.transport_options["total_timeout_ms"] = std::to_string(std::stoull(v) * 1000);
        } else if (arg == "--connect-timeout") {
            auto* v = next_arg(i, "--connect-timeout");
            if (!v) return std::nullopt;
            config.transport_options["connect_timeout_ms"] = std::to_string(std::stoull(v) * 1000);
        } else if (arg == "--max-retries") {
            auto* v = next_arg(i, "--max-retries");
            if (!v) return std::nullopt;
            config.transport_options["max_retries"] = v;
        } else if (arg == "--proxy") {
            auto* v = next_arg(i, "--proxy");
            if (!v) return std::nullopt;
            config.transport_options["proxy"] = v;
        } else if (arg == "--ca-cert") {
            auto* v = next_arg(i, "--ca-cert");
            if (!v) return std::nullopt;
            config.transport_options["ca_bundle"] = v;
        } else if (arg == "--no-verify-ssl") {
            config.transport_options["verify_ssl"] = "false";
        } else if (arg == "--transport-opt") {
            auto* v = next_arg(i, "--transport-opt");
            if (!v) return std::nullopt;
            std::string kv = v;
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --transport-opt expects key=value, got: " << kv << "\n";
                return std::nullopt;
            }
            config.transport_options[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            config.metrics_interval_secs = std::stoull(v);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (!arg.empty() && arg[0] != '-' && positional) {
            positional->push_back(arg);
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("access_token")) access_token = j["access_token"].get<std::string>();
        if (j.contains("access_secret")) access_secret = j["access_secret"].get<std::string>();
        if (j.contains("app_key")) app_key = j["app_key"].get<std::string>();
        if (j.contains("app_secret")) app_secret = j["app_secret"].get<std::string>();
        if (j.contains("oauth2")) oauth2 = j["oauth2"].get<bool>();
        if (j.contains("signature_method")) signature_method = j["signature_method"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("direct_upload_limit"))
            direct_upload_limit = j["direct_upload_limit"].get<uint64_t>();
        if (j.contains("root")) root = j["root"].get<std::string>();
        if (j.contains("scheme")) scheme = j["scheme"].get<std::string>();
        if (j.contains("api_host")) api_host = j["api_host"].get<std::string>();
        if (j.contains("content_host")) content_host = j["content_host"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("transport") && j["transport"].is_object()) {
            for (auto& [key, val] : j["transport"].items()) {
                transport_options[key] = option_string(val);
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ClientConfig::apply_defaults() {
    env_fallback(access_token, "DROPBOX_ACCESS_TOKEN");
    if (!oauth2) {
        env_fallback(access_secret, "DROPBOX_ACCESS_SECRET");
        env_fallback(app_key, "DROPBOX_APP_KEY");
        env_fallback(app_secret, "DROPBOX_APP_SECRET");
    }

    for (auto& c : signature_method) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // Hosts are given bare; tolerate a trailing slash
    while (!api_host.empty() && api_host.back() == '/') api_host.pop_back();
    while (!content_host.empty() && content_host.back() == '/') content_host.pop_back();
}

std::string ClientConfig::validate() const {
    if (access_token.empty()) return "access_token is required (--access-token)";
    if (!oauth2) {
        if (app_key.empty()) return "app_key is required for OAuth 1 (--app-key)";
        if (app_secret.empty()) return "app_secret is required for OAuth 1 (--app-secret)";
        if (access_secret.empty()) return "access_secret is required for OAuth 1 (--access-secret)";
        if (signature_method != "hmac-sha1" && signature_method != "plaintext")
            return "unknown signature method: " + signature_method;
    }
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (direct_upload_limit == 0) return "direct_upload_limit must be > 0";
    if (root != "sandbox" && root != "dropbox")
        return "root must be 'sandbox' or 'dropbox', got: " + root;
    if (scheme != "https" && scheme != "http") return "scheme must be http or https";
    if (api_host.empty()) return "api_host is required";
    if (content_host.empty()) return "content_host is required";
    return {};
}

}  // namespace dropfile

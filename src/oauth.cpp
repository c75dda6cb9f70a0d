#include "dropfile/oauth.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace dropfile::net {

namespace {

std::string random_nonce() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // OpenSSL RNG unavailable; fall back to the platform source
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd());
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

uint64_t now_epoch() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::vector<uint8_t> hmac_sha1(const std::string& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

// Split an already percent-encoded query string into pairs.
// Parameters without a value become "key=".
std::vector<std::pair<std::string, std::string>> split_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params.emplace_back(param.substr(0, eq), param.substr(eq + 1));
            } else {
                params.emplace_back(param, "");
            }
        }
        pos = amp + 1;
    }
    return params;
}

}  // namespace

OAuthSigner OAuthSigner::bearer(const std::string& access_token) {
    OAuthSigner signer;
    signer.method_ = Method::Bearer;
    signer.access_token_ = access_token;
    return signer;
}

OAuthSigner OAuthSigner::oauth1(const std::string& app_key,
                                const std::string& app_secret,
                                const std::string& access_token,
                                const std::string& access_secret,
                                Method method) {
    OAuthSigner signer;
    signer.method_ = method == Method::Bearer ? Method::HmacSha1 : method;
    signer.app_key_ = app_key;
    signer.app_secret_ = app_secret;
    signer.access_token_ = access_token;
    signer.access_secret_ = access_secret;
    return signer;
}

std::string OAuthSigner::signature_base_string(
    const HttpRequest& request,
    const std::vector<std::pair<std::string, std::string>>& oauth_params) {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream base_uri;
    base_uri << url->scheme << "://" << url->host;
    bool default_port = url->port == 0 ||
        (url->scheme == "https" && url->port == 443) ||
        (url->scheme == "http" && url->port == 80);
    if (!default_port) {
        base_uri << ":" << url->port;
    }
    base_uri << (url->path.empty() ? "/" : url->path);

    // Query values are already encoded; oauth_* values get encoded here
    auto params = split_query(url->query);
    for (const auto& [key, value] : oauth_params) {
        params.emplace_back(url_encode(key), url_encode(value));
    }
    std::sort(params.begin(), params.end());

    std::string normalized;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) normalized += "&";
        normalized += params[i].first + "=" + params[i].second;
    }

    return std::string(http_method_to_string(request.method)) + "&" +
           url_encode(base_uri.str()) + "&" + url_encode(normalized);
}

std::string OAuthSigner::signing_key() const {
    return url_encode(app_secret_) + "&" + url_encode(access_secret_);
}

std::string OAuthSigner::signature(const std::string& base_string) const {
    if (method_ == Method::Plaintext) {
        return signing_key();
    }
    return base64_encode(hmac_sha1(signing_key(), base_string));
}

void OAuthSigner::sign(HttpRequest& request) const {
    sign(request, now_epoch(), random_nonce());
}

void OAuthSigner::sign(HttpRequest& request, uint64_t timestamp, const std::string& nonce) const {
    if (method_ == Method::Bearer) {
        request.headers.set_bearer_token(access_token_);
        return;
    }

    std::vector<std::pair<std::string, std::string>> oauth_params = {
        {"oauth_consumer_key", app_key_},
        {"oauth_nonce", nonce},
        {"oauth_signature_method", method_ == Method::Plaintext ? "PLAINTEXT" : "HMAC-SHA1"},
        {"oauth_timestamp", std::to_string(timestamp)},
        {"oauth_token", access_token_},
        {"oauth_version", "1.0"},
    };

    std::string sig = signature(signature_base_string(request, oauth_params));
    oauth_params.emplace_back("oauth_signature", sig);

    std::ostringstream auth;
    for (size_t i = 0; i < oauth_params.size(); ++i) {
        if (i > 0) auth << ", ";
        auth << oauth_params[i].first << "=\"" << url_encode(oauth_params[i].second) << "\"";
    }

    request.headers.set_authorization("OAuth", auth.str());
}

}  // namespace dropfile::net

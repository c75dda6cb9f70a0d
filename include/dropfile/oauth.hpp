#pragma once

#include "dropfile/http.hpp"

#include <cstdint>
#include <string>

namespace dropfile::net {

/// Adds an Authorization header to outgoing requests.
///
/// OAuth 2: "Bearer <access token>".
/// OAuth 1.0: consumer key/secret plus token/secret, signed with HMAC-SHA1
/// over the RFC 5849 signature base string, or with PLAINTEXT.
class OAuthSigner {
public:
    enum class Method { Bearer, HmacSha1, Plaintext };

    static OAuthSigner bearer(const std::string& access_token);
    static OAuthSigner oauth1(const std::string& app_key,
                              const std::string& app_secret,
                              const std::string& access_token,
                              const std::string& access_secret,
                              Method method = Method::HmacSha1);

    Method method() const { return method_; }

    void sign(HttpRequest& request) const;

    // Deterministic variant for tests
    void sign(HttpRequest& request, uint64_t timestamp, const std::string& nonce) const;

    /// RFC 5849 section 3.4.1 signature base string.
    static std::string signature_base_string(
        const HttpRequest& request,
        const std::vector<std::pair<std::string, std::string>>& oauth_params);

private:
    OAuthSigner() = default;

    std::string signing_key() const;
    std::string signature(const std::string& base_string) const;

    Method method_ = Method::Bearer;
    std::string app_key_;
    std::string app_secret_;
    std::string access_token_;
    std::string access_secret_;
};

}  // namespace dropfile::net

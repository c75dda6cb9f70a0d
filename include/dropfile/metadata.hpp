#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dropfile {

/// Metadata record returned by the remote store for a file or folder.
///
/// The JSON object is kept verbatim; the accessors below are conveniences
/// over the fields the handle engine and the CLI care about.
class Metadata {
public:
    Metadata() = default;
    explicit Metadata(nlohmann::json raw) : raw_(std::move(raw)) {}

    const nlohmann::json& raw() const { return raw_; }

    std::string path() const;
    std::optional<uint64_t> bytes() const;
    bool is_dir() const;
    bool is_deleted() const;
    std::string rev() const;
    std::optional<int64_t> revision() const;
    std::string modified() const;
    std::string size() const;       // human readable, e.g. "2.3 MB"
    std::string mime_type() const;
    std::string hash() const;       // folder listings only

    /// Folder entries, present when the record came from a listing.
    std::vector<Metadata> contents() const;

    /// Opaque keyed lookup; empty when absent.
    std::string get(const std::string& key) const;

    bool operator==(const Metadata& other) const { return raw_ == other.raw_; }

private:
    std::string string_field(const char* key) const;

    nlohmann::json raw_ = nlohmann::json::object();
};

/// Decode a metadata response body. Empty optional if the body is not a
/// JSON object.
std::optional<Metadata> parse_metadata(const std::string& body);
std::optional<Metadata> parse_metadata(const std::vector<uint8_t>& body);

/// Extract the remote "error" message from a failed response body, falling
/// back to "HTTP <status>".
std::string remote_error_message(const std::vector<uint8_t>& body, int status);

}  // namespace dropfile

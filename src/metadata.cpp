#include "dropfile/metadata.hpp"

namespace dropfile {

std::string Metadata::string_field(const char* key) const {
    auto it = raw_.find(key);
    if (it == raw_.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string Metadata::path() const { return string_field("path"); }
std::string Metadata::rev() const { return string_field("rev"); }
std::string Metadata::modified() const { return string_field("modified"); }
std::string Metadata::size() const { return string_field("size"); }
std::string Metadata::mime_type() const { return string_field("mime_type"); }
std::string Metadata::hash() const { return string_field("hash"); }

std::optional<uint64_t> Metadata::bytes() const {
    auto it = raw_.find("bytes");
    if (it == raw_.end() || !it->is_number_integer()) return std::nullopt;
    auto value = it->get<int64_t>();
    if (value < 0) return std::nullopt;
    return static_cast<uint64_t>(value);
}

bool Metadata::is_dir() const {
    auto it = raw_.find("is_dir");
    return it != raw_.end() && it->is_boolean() && it->get<bool>();
}

bool Metadata::is_deleted() const {
    auto it = raw_.find("is_deleted");
    return it != raw_.end() && it->is_boolean() && it->get<bool>();
}

std::optional<int64_t> Metadata::revision() const {
    auto it = raw_.find("revision");
    if (it == raw_.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

std::vector<Metadata> Metadata::contents() const {
    std::vector<Metadata> entries;
    auto it = raw_.find("contents");
    if (it == raw_.end() || !it->is_array()) return entries;
    entries.reserve(it->size());
    for (const auto& entry : *it) {
        if (entry.is_object()) entries.emplace_back(entry);
    }
    return entries;
}

std::string Metadata::get(const std::string& key) const {
    auto it = raw_.find(key);
    if (it == raw_.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<Metadata> parse_metadata(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return Metadata(std::move(j));
}

std::optional<Metadata> parse_metadata(const std::vector<uint8_t>& body) {
    return parse_metadata(std::string(body.begin(), body.end()));
}

std::string remote_error_message(const std::vector<uint8_t>& body, int status) {
    auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        auto it = j.find("error");
        if (it != j.end()) {
            if (it->is_string()) return it->get<std::string>();
            // Some endpoints return {"error": {"field": "message"}}
            if (it->is_object() && !it->empty()) {
                const auto& first = *it->begin();
                if (first.is_string()) return first.get<std::string>();
            }
            return it->dump();
        }
    }
    return "HTTP " + std::to_string(status);
}

}  // namespace dropfile

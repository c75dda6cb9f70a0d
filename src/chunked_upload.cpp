#include "dropfile/chunked_upload.hpp"
#include "dropfile/errors.hpp"
#include "dropfile/log.hpp"
#include "dropfile/transport.hpp"

#include <cstddef>

#include <nlohmann/json.hpp>

namespace dropfile {

ChunkedUpload::ChunkedUpload(Transport* transport, std::string root, uint64_t chunk_size)
    : transport_(transport)
    , root_(std::move(root))
    , chunk_size_(chunk_size) {}

void ChunkedUpload::begin(const std::string& path) {
    reset();
    path_ = path;
}

void ChunkedUpload::reset() {
    path_.clear();
    buffer_.clear();
    upload_id_.reset();
    offset_ = 0;
    appended_ = false;
    tail_appended_ = false;
}

size_t ChunkedUpload::write(std::span<const uint8_t> data) {
    if (!data.empty()) tail_appended_ = false;
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    flush();
    return data.size();
}

void ChunkedUpload::flush() {
    while (buffer_.size() >= chunk_size_) {
        append(static_cast<size_t>(chunk_size_));
    }
}

void ChunkedUpload::append(size_t length) {
    ApiRequest request;
    request.method = net::HttpMethod::PUT;
    request.host = ApiHost::Content;
    request.endpoint = "chunked_upload";
    request.params["offset"] = std::to_string(offset_);
    if (upload_id_) {
        request.params["upload_id"] = *upload_id_;
    }
    request.body.assign(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(length));

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError("chunked_upload", path_, offset_, response.error);
    }
    if (!response.ok()) {
        throw UploadError("chunked upload of " + path_ + " at offset " +
                          std::to_string(offset_) + " failed: " +
                          remote_error_message(response.body, response.status),
                          response.status);
    }

    auto j = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object() ||
        !j.contains("upload_id") || !j["upload_id"].is_string() ||
        !j.contains("offset") || !j["offset"].is_number_unsigned()) {
        throw UploadError("malformed chunked_upload response for " + path_, response.status);
    }

    auto id = j["upload_id"].get<std::string>();
    auto new_offset = j["offset"].get<uint64_t>();
    if (new_offset != offset_ + length) {
        throw UploadError("chunked upload of " + path_ + ": store reports offset " +
                          std::to_string(new_offset) + ", expected " +
                          std::to_string(offset_ + length), response.status);
    }
    if (upload_id_ && *upload_id_ != id) {
        throw UploadError("chunked upload of " + path_ + ": session changed from " +
                          *upload_id_ + " to " + id, response.status);
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(length));
    upload_id_ = std::move(id);
    offset_ = new_offset;
    appended_ = true;

    log_debug("Appended %zu bytes to %s (upload %s, offset %llu)", length, path_.c_str(),
              upload_id_->c_str(), static_cast<unsigned long long>(offset_));
}

Metadata ChunkedUpload::commit() {
    flush();
    if (!tail_appended_) {
        append(buffer_.size());
        tail_appended_ = true;
    }

    ApiRequest request;
    request.method = net::HttpMethod::POST;
    request.host = ApiHost::Content;
    request.endpoint = make_endpoint("commit_chunked_upload", root_, path_);
    request.params["upload_id"] = *upload_id_;
    request.params["overwrite"] = "true";

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError("commit_chunked_upload", path_, offset_, response.error);
    }
    if (!response.ok()) {
        throw UploadError("commit of " + path_ + " failed: " +
                          remote_error_message(response.body, response.status),
                          response.status);
    }

    auto metadata = parse_metadata(response.body);
    if (!metadata) {
        throw UploadError("malformed commit response for " + path_, response.status);
    }

    log_debug("Committed %s (%llu bytes)", path_.c_str(),
              static_cast<unsigned long long>(offset_));

    buffer_.clear();
    upload_id_.reset();
    offset_ = 0;
    appended_ = false;
    tail_appended_ = false;
    return *metadata;
}

}  // namespace dropfile

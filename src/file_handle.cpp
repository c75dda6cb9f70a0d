#include "dropfile/file_handle.hpp"
#include "dropfile/errors.hpp"
#include "dropfile/log.hpp"
#include "dropfile/transport.hpp"

#include <stdexcept>

namespace dropfile {

namespace {

std::span<const uint8_t> as_bytes(std::string_view data) {
    return {reinterpret_cast<const uint8_t*>(data.data()), data.size()};
}

}  // namespace

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Closed: return "closed";
        case Mode::Reading: return "reading";
        case Mode::Writing: return "writing";
    }
    return "unknown";
}

std::optional<OpenMode> parse_open_mode(std::string_view mode) {
    if (mode == "r" || mode == "rb" || mode == "<") return OpenMode::Read;
    if (mode == "w" || mode == "wb" || mode == ">") return OpenMode::Write;
    return std::nullopt;
}

FileHandle::FileHandle(std::shared_ptr<Transport> transport, const ClientConfig& config)
    : FileHandle(std::move(transport), config.chunk_size, config.root, config.direct_upload_limit) {}

FileHandle::FileHandle(std::shared_ptr<Transport> transport, uint64_t chunk_size, std::string root,
                       uint64_t direct_upload_limit)
    : transport_(std::move(transport))
    , chunk_size_(chunk_size)
    , root_(std::move(root))
    , direct_upload_limit_(direct_upload_limit)
    , upload_(transport_.get(), root_, chunk_size)
    , reader_(transport_.get(), root_, chunk_size) {
    if (!transport_) {
        throw std::invalid_argument("FileHandle requires a transport");
    }
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
    if (direct_upload_limit_ == 0) {
        throw std::invalid_argument("direct_upload_limit must be > 0");
    }
}

FileHandle::~FileHandle() {
    finish_quietly();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : transport_(std::move(other.transport_))
    , chunk_size_(other.chunk_size_)
    , root_(std::move(other.root_))
    , direct_upload_limit_(other.direct_upload_limit_)
    , mode_(other.mode_)
    , path_(std::move(other.path_))
    , upload_(std::move(other.upload_))
    , reader_(std::move(other.reader_))
    , metadata_(std::move(other.metadata_)) {
    other.mode_ = Mode::Closed;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        finish_quietly();
        transport_ = std::move(other.transport_);
        chunk_size_ = other.chunk_size_;
        root_ = std::move(other.root_);
        direct_upload_limit_ = other.direct_upload_limit_;
        mode_ = other.mode_;
        path_ = std::move(other.path_);
        upload_ = std::move(other.upload_);
        reader_ = std::move(other.reader_);
        metadata_ = std::move(other.metadata_);
        other.mode_ = Mode::Closed;
    }
    return *this;
}

FileHandle FileHandle::create(const ClientConfig& config, MetricsExporter* metrics) {
    auto error = config.validate();
    if (!error.empty()) {
        throw std::invalid_argument(error);
    }
    auto transport = std::make_shared<HttpTransport>(config);
    transport->set_metrics(metrics);
    return FileHandle(std::move(transport), config);
}

void FileHandle::require_mode(Mode wanted, const char* operation) const {
    if (mode_ != wanted) {
        throw InvalidModeError(std::string(operation) + " requires a handle open for " +
                               mode_name(wanted) + ", handle is " + mode_name(mode_));
    }
}

void FileHandle::commit_pending() {
    if (mode_ != Mode::Writing) return;
    metadata_ = upload_.commit();
    upload_.reset();
    mode_ = Mode::Closed;
}

void FileHandle::finish_quietly() noexcept {
    if (mode_ != Mode::Writing) return;
    try {
        commit_pending();
    } catch (const Error& e) {
        log_error("Upload of %s lost: %s", path_.c_str(), e.what());
    } catch (const std::exception& e) {
        log_error("Upload of %s lost: %s", path_.c_str(), e.what());
    }
    mode_ = Mode::Closed;
}

void FileHandle::open(const std::string& path, OpenMode mode) {
    commit_pending();

    if (mode == OpenMode::Write) {
        reader_.reset();
        upload_.begin(path);
        path_ = path;
        mode_ = Mode::Writing;
        log_debug("Opened %s for writing", path.c_str());
        return;
    }

    reader_.reset();
    mode_ = Mode::Closed;
    path_.clear();

    auto metadata = fetch_metadata(path, "open");
    if (metadata.is_deleted()) {
        throw NotFoundError(path, path + " has been deleted");
    }
    if (metadata.is_dir()) {
        throw NotFoundError(path, path + " is a folder");
    }

    metadata_ = metadata;
    reader_.begin(path, metadata.bytes());
    path_ = path;
    mode_ = Mode::Reading;
    log_debug("Opened %s for reading", path.c_str());
}

void FileHandle::open(const std::string& path, std::string_view mode) {
    auto parsed = parse_open_mode(mode);
    if (!parsed) {
        throw InvalidModeError("unsupported open mode '" + std::string(mode) + "' for " + path);
    }
    open(path, *parsed);
}

void FileHandle::close() {
    switch (mode_) {
        case Mode::Writing:
            commit_pending();
            break;
        case Mode::Reading:
            reader_.reset();
            mode_ = Mode::Closed;
            break;
        case Mode::Closed:
            break;
    }
}

void FileHandle::abort() {
    if (mode_ != Mode::Writing) {
        close();
        return;
    }
    log_debug("Discarding upload of %s (%llu bytes written)", path_.c_str(),
              static_cast<unsigned long long>(upload_.bytes_written()));
    upload_.reset();
    mode_ = Mode::Closed;
}

std::string FileHandle::read(size_t max) {
    require_mode(Mode::Reading, "read");
    return reader_.read(max);
}

std::optional<std::string> FileHandle::read_line() {
    require_mode(Mode::Reading, "read_line");
    return reader_.read_line();
}

std::optional<char> FileHandle::getc() {
    require_mode(Mode::Reading, "getc");
    return reader_.getc();
}

uint64_t FileHandle::seek(int64_t offset, Whence whence) {
    require_mode(Mode::Reading, "seek");
    return reader_.seek(offset, whence);
}

uint64_t FileHandle::tell() const {
    require_mode(Mode::Reading, "tell");
    return reader_.tell();
}

bool FileHandle::eof() const {
    require_mode(Mode::Reading, "eof");
    return reader_.eof();
}

size_t FileHandle::write(std::span<const uint8_t> data) {
    require_mode(Mode::Writing, "write");
    return upload_.write(data);
}

size_t FileHandle::write(std::string_view data) {
    return write(as_bytes(data));
}

void FileHandle::flush() {
    require_mode(Mode::Writing, "flush");
    upload_.flush();
}

Metadata FileHandle::fetch_metadata(const std::string& path, const char* operation) {
    ApiRequest request;
    request.method = net::HttpMethod::GET;
    request.host = ApiHost::Api;
    request.endpoint = make_endpoint("metadata", root_, path);
    request.params["list"] = "false";

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError(operation, path, 0, response.error);
    }
    if (response.status == 404) {
        throw NotFoundError(path, path + ": " + remote_error_message(response.body, response.status));
    }
    if (!response.ok()) {
        throw ApiError("metadata for " + path + " failed: " +
                       remote_error_message(response.body, response.status), response.status);
    }

    auto metadata = parse_metadata(response.body);
    if (!metadata) {
        throw ApiError("malformed metadata response for " + path, response.status);
    }
    return *metadata;
}

std::optional<std::vector<Metadata>> FileHandle::contents(const std::string& path,
                                                          const std::string& hash) {
    commit_pending();

    ApiRequest request;
    request.method = net::HttpMethod::GET;
    request.host = ApiHost::Api;
    request.endpoint = make_endpoint("metadata", root_, path);
    request.params["list"] = "true";
    if (!hash.empty()) {
        request.params["hash"] = hash;
    }

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError("contents", path, 0, response.error);
    }
    if (response.status == 304) {
        return std::nullopt;
    }
    if (response.status == 404) {
        throw NotFoundError(path, path + ": " + remote_error_message(response.body, response.status));
    }
    if (!response.ok()) {
        throw ApiError("listing " + path + " failed: " +
                       remote_error_message(response.body, response.status), response.status);
    }

    auto metadata = parse_metadata(response.body);
    if (!metadata) {
        throw ApiError("malformed listing response for " + path, response.status);
    }
    metadata_ = *metadata;
    return metadata->contents();
}

Metadata FileHandle::putfile(const std::string& path, std::span<const uint8_t> data) {
    commit_pending();

    if (data.size() > direct_upload_limit_) {
        ChunkedUpload upload(transport_.get(), root_, chunk_size_);
        upload.begin(path);
        upload.write(data);
        metadata_ = upload.commit();
        return *metadata_;
    }

    ApiRequest request;
    request.method = net::HttpMethod::PUT;
    request.host = ApiHost::Content;
    request.endpoint = make_endpoint("files_put", root_, path);
    request.params["overwrite"] = "true";
    request.body.assign(data.begin(), data.end());

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError("files_put", path, 0, response.error);
    }
    if (!response.ok()) {
        throw UploadError("upload of " + path + " failed: " +
                          remote_error_message(response.body, response.status), response.status);
    }

    auto metadata = parse_metadata(response.body);
    if (!metadata) {
        throw UploadError("malformed files_put response for " + path, response.status);
    }
    metadata_ = *metadata;
    return *metadata_;
}

Metadata FileHandle::putfile(const std::string& path, std::string_view data) {
    return putfile(path, as_bytes(data));
}

Metadata FileHandle::file_operation(const std::string& operation,
                                    const std::map<std::string, std::string>& params,
                                    const std::string& subject) {
    commit_pending();

    ApiRequest request;
    request.method = net::HttpMethod::POST;
    request.host = ApiHost::Api;
    request.endpoint = "fileops/" + operation;
    request.params = params;
    request.params["root"] = root_;

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError(operation, subject, 0, response.error);
    }
    if (response.status == 404) {
        throw NotFoundError(subject, operation + " " + subject + ": " +
                            remote_error_message(response.body, response.status));
    }
    if (!response.ok()) {
        throw ApiError(operation + " " + subject + " failed: " +
                       remote_error_message(response.body, response.status), response.status);
    }

    auto metadata = parse_metadata(response.body);
    if (!metadata) {
        throw ApiError("malformed " + operation + " response for " + subject, response.status);
    }
    metadata_ = *metadata;
    return *metadata_;
}

Metadata FileHandle::copyfile(const std::string& from, const std::string& to) {
    return file_operation("copy", {{"from_path", from}, {"to_path", to}}, from);
}

Metadata FileHandle::movefile(const std::string& from, const std::string& to) {
    return file_operation("move", {{"from_path", from}, {"to_path", to}}, from);
}

Metadata FileHandle::deletefile(const std::string& path) {
    return file_operation("delete", {{"path", path}}, path);
}

Metadata FileHandle::createfolder(const std::string& path) {
    return file_operation("create_folder", {{"path", path}}, path);
}

}  // namespace dropfile

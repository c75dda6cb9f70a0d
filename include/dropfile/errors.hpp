#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dropfile {

enum class ErrorKind {
    InvalidMode,
    NotFound,
    Upload,
    Download,
    Seek,
    Transport,
    Api
};

const char* error_kind_name(ErrorKind kind);

/// Base of every error raised by a FileHandle.
/// status() is the HTTP status of the failed request, or 0 when no
/// response was involved.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, int status = 0)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }

private:
    ErrorKind kind_;
    int status_;
};

/// Operation attempted in the wrong mode, or before open().
class InvalidModeError : public Error {
public:
    explicit InvalidModeError(const std::string& message)
        : Error(ErrorKind::InvalidMode, message) {}
};

class NotFoundError : public Error {
public:
    NotFoundError(const std::string& path, const std::string& message, int status = 404)
        : Error(ErrorKind::NotFound, message, status), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Chunk append or commit failed. Upload state is left untouched so the
/// same request can be reattempted.
class UploadError : public Error {
public:
    UploadError(const std::string& message, int status)
        : Error(ErrorKind::Upload, message, status) {}
};

/// Ranged GET failed. The current read window is left untouched.
class DownloadError : public Error {
public:
    DownloadError(const std::string& message, int status)
        : Error(ErrorKind::Download, message, status) {}
};

class SeekError : public Error {
public:
    explicit SeekError(const std::string& message)
        : Error(ErrorKind::Seek, message) {}
};

/// Network-level failure reported by the transport.
class TransportError : public Error {
public:
    TransportError(const std::string& operation, const std::string& path,
                   uint64_t offset, const std::string& cause);

    const std::string& operation() const { return operation_; }
    const std::string& path() const { return path_; }
    uint64_t offset() const { return offset_; }

private:
    std::string operation_;
    std::string path_;
    uint64_t offset_;
};

/// Non-success answer to a metadata or file operation request.
class ApiError : public Error {
public:
    ApiError(const std::string& message, int status)
        : Error(ErrorKind::Api, message, status) {}
};

}  // namespace dropfile

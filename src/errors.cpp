#include "dropfile/errors.hpp"

namespace dropfile {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidMode: return "invalid_mode";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Upload: return "upload";
        case ErrorKind::Download: return "download";
        case ErrorKind::Seek: return "seek";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Api: return "api";
    }
    return "unknown";
}

TransportError::TransportError(const std::string& operation, const std::string& path,
                               uint64_t offset, const std::string& cause)
    : Error(ErrorKind::Transport,
            operation + " " + path + " at offset " + std::to_string(offset) + ": " + cause)
    , operation_(operation)
    , path_(path)
    , offset_(offset) {}

}  // namespace dropfile

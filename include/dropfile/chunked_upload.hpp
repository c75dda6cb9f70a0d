#pragma once

#include "dropfile/metadata.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dropfile {

class Transport;

/// Write side of a handle: buffers written bytes and presents them to the
/// store as chunk appends against one upload session, finished by a commit.
///
/// After every flush check the buffer holds fewer than chunk_size bytes.
/// A failed append or commit raises UploadError (or TransportError) and
/// leaves buffer, upload id and offset exactly as they were, so the same
/// request can be reattempted by calling flush() or commit() again.
class ChunkedUpload {
public:
    ChunkedUpload(Transport* transport, std::string root, uint64_t chunk_size);

    /// Start a new upload for `path`, dropping any previous state.
    void begin(const std::string& path);

    /// Buffer `data`, then flush every full chunk. Returns data.size().
    size_t write(std::span<const uint8_t> data);

    /// Flush every full chunk currently buffered.
    void flush();

    /// Append the remainder, possibly empty, then commit the session to
    /// the path. An empty file still gets a session this way. If the
    /// commit request itself fails, a retry skips the tail append.
    Metadata commit();

    /// Forget the upload without any remote call.
    void reset();

    const std::string& path() const { return path_; }
    uint64_t chunk_size() const { return chunk_size_; }
    size_t buffered() const { return buffer_.size(); }
    const std::optional<std::string>& upload_id() const { return upload_id_; }
    uint64_t offset() const { return offset_; }
    bool has_appended() const { return appended_; }

    /// Bytes accepted by write() since begin().
    uint64_t bytes_written() const { return offset_ + buffer_.size(); }

private:
    void append(size_t length);

    Transport* transport_;
    std::string root_;
    uint64_t chunk_size_;

    std::string path_;
    std::vector<uint8_t> buffer_;
    std::optional<std::string> upload_id_;
    uint64_t offset_ = 0;
    bool appended_ = false;
    bool tail_appended_ = false;
};

}  // namespace dropfile

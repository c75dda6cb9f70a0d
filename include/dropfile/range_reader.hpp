#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dropfile {

class Transport;

enum class Whence {
    Start,
    Current,
    End
};

/// Read side of a handle: random-access reads over a file that can only be
/// fetched by ranged GET.
///
/// Holds one prefetch window [window_start, window_end). Reads inside the
/// window are served locally; running off its end fetches the next
/// chunk_size bytes at the current position. A failed fetch raises
/// DownloadError (or TransportError) and keeps the previous window.
class RangeReader {
public:
    RangeReader(Transport* transport, std::string root, uint64_t chunk_size);

    /// Bind to `path`. `size` is the file size from metadata, if known;
    /// it is what End seeks are measured from.
    void begin(const std::string& path, std::optional<uint64_t> size);

    /// Drop the window and the binding.
    void reset();

    /// Up to `max` bytes from the current position. Short only at end of file.
    std::string read(size_t max);

    /// Next line including its '\n', the final unterminated fragment, or
    /// nullopt when already at end of file.
    std::optional<std::string> read_line();

    std::optional<char> getc();

    /// Move the cursor without fetching. Returns the new position.
    uint64_t seek(int64_t offset, Whence whence);

    uint64_t tell() const { return position_; }
    bool eof() const { return position_ >= window_end_ && eof_reached_; }

    const std::string& path() const { return path_; }
    std::optional<uint64_t> size() const { return size_; }
    uint64_t window_start() const { return window_start_; }
    uint64_t window_end() const { return window_end_; }
    bool eof_reached() const { return eof_reached_; }

private:
    // Bytes buffered at or after the cursor
    uint64_t available() const;

    void ensure_buffered(uint64_t min_length);

    // Fetch [start, start + chunk_size). With `extend`, the result is
    // appended to the window instead of replacing it.
    void fetch(uint64_t start, bool extend);

    Transport* transport_;
    std::string root_;
    uint64_t chunk_size_;

    std::string path_;
    std::optional<uint64_t> size_;

    std::string window_;
    uint64_t window_start_ = 0;
    uint64_t window_end_ = 0;
    uint64_t position_ = 0;
    bool eof_reached_ = false;
};

}  // namespace dropfile

#pragma once

#include "dropfile/chunked_upload.hpp"
#include "dropfile/client_config.hpp"
#include "dropfile/metadata.hpp"
#include "dropfile/range_reader.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dropfile {

class MetricsExporter;
class Transport;

enum class Mode {
    Closed,
    Reading,
    Writing
};

const char* mode_name(Mode mode);

enum class OpenMode {
    Read,
    Write
};

/// "r", "rb", "<" -> Read; "w", "wb", ">" -> Write. Anything else,
/// append modes included, is empty.
std::optional<OpenMode> parse_open_mode(std::string_view mode);

/// A remote file opened like a POSIX descriptor.
///
/// The handle is Closed, Reading or Writing. Reads go through a RangeReader,
/// writes through a ChunkedUpload; calling an operation of the other mode
/// raises InvalidModeError. Only one chunked upload may be outstanding, so
/// reopening the handle or running a file operation first commits a pending
/// upload. The result of every metadata-returning request lands in a single
/// slot readable through metadata().
///
/// Not thread-safe. Destroying a Writing handle commits the upload; a
/// failure there is logged.
class FileHandle {
public:
    FileHandle(std::shared_ptr<Transport> transport, const ClientConfig& config);
    explicit FileHandle(std::shared_ptr<Transport> transport,
                        uint64_t chunk_size = DEFAULT_CHUNK_SIZE,
                        std::string root = "sandbox",
                        uint64_t direct_upload_limit = DEFAULT_DIRECT_UPLOAD_LIMIT);
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    /// Handle over an HttpTransport built from `config`.
    /// Throws std::invalid_argument if the config does not validate.
    static FileHandle create(const ClientConfig& config, MetricsExporter* metrics = nullptr);

    void open(const std::string& path, OpenMode mode);
    void open(const std::string& path, std::string_view mode);

    /// Writing: commit the upload. Reading: drop buffers. Closed: no-op.
    void close();

    /// Writing: drop the pending upload without committing it, so the
    /// destination keeps its previous content. Other modes: same as close().
    void abort();

    // Reading
    std::string read(size_t max);
    std::optional<std::string> read_line();
    std::optional<char> getc();
    uint64_t seek(int64_t offset, Whence whence);
    uint64_t tell() const;
    bool eof() const;

    // Writing
    size_t write(std::span<const uint8_t> data);
    size_t write(std::string_view data);
    void flush();

    const std::optional<Metadata>& metadata() const { return metadata_; }

    /// Folder listing. Empty optional when `hash` matches the folder's
    /// current hash (nothing changed).
    std::optional<std::vector<Metadata>> contents(const std::string& path,
                                                  const std::string& hash = "");

    Metadata putfile(const std::string& path, std::span<const uint8_t> data);
    Metadata putfile(const std::string& path, std::string_view data);
    Metadata copyfile(const std::string& from, const std::string& to);
    Metadata movefile(const std::string& from, const std::string& to);
    Metadata deletefile(const std::string& path);
    Metadata createfolder(const std::string& path);

    Mode mode() const { return mode_; }
    bool is_open() const { return mode_ != Mode::Closed; }
    const std::string& path() const { return path_; }
    uint64_t chunk_size() const { return chunk_size_; }
    const std::string& root() const { return root_; }
    uint64_t direct_upload_limit() const { return direct_upload_limit_; }

    const ChunkedUpload& upload() const { return upload_; }
    const RangeReader& reader() const { return reader_; }

private:
    void require_mode(Mode wanted, const char* operation) const;

    // Commit a pending upload before another request. Leaves the handle
    // Closed on success and Writing if the commit throws.
    void commit_pending();

    // Commit without throwing, for the destructor and move assignment
    void finish_quietly() noexcept;

    Metadata fetch_metadata(const std::string& path, const char* operation);
    Metadata file_operation(const std::string& operation,
                            const std::map<std::string, std::string>& params,
                            const std::string& subject);

    std::shared_ptr<Transport> transport_;
    uint64_t chunk_size_;
    std::string root_;
    uint64_t direct_upload_limit_;

    Mode mode_ = Mode::Closed;
    std::string path_;
    ChunkedUpload upload_;
    RangeReader reader_;
    std::optional<Metadata> metadata_;
};

}  // namespace dropfile

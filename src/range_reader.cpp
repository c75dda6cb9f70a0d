#include "dropfile/range_reader.hpp"
#include "dropfile/errors.hpp"
#include "dropfile/log.hpp"
#include "dropfile/metadata.hpp"
#include "dropfile/transport.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>

namespace dropfile {

namespace {

// Total size from "Content-Range: bytes 0-9/30". Empty when the header is
// missing or the total is "*".
std::optional<uint64_t> content_range_total(const net::HttpHeaders& headers) {
    auto value = headers.get("Content-Range");
    if (!value) return std::nullopt;
    auto slash = value->rfind('/');
    if (slash == std::string::npos || slash + 1 >= value->size()) return std::nullopt;
    auto total = value->substr(slash + 1);
    if (total.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    try {
        return std::stoull(total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

RangeReader::RangeReader(Transport* transport, std::string root, uint64_t chunk_size)
    : transport_(transport)
    , root_(std::move(root))
    , chunk_size_(chunk_size) {}

void RangeReader::begin(const std::string& path, std::optional<uint64_t> size) {
    reset();
    path_ = path;
    size_ = size;
}

void RangeReader::reset() {
    path_.clear();
    size_.reset();
    window_.clear();
    window_start_ = 0;
    window_end_ = 0;
    position_ = 0;
    eof_reached_ = false;
}

uint64_t RangeReader::available() const {
    if (position_ < window_start_ || position_ >= window_end_) return 0;
    return window_end_ - position_;
}

void RangeReader::ensure_buffered(uint64_t min_length) {
    bool in_window = position_ >= window_start_ && position_ < window_end_;
    if (in_window && (available() >= min_length || eof_reached_)) {
        return;
    }
    // Sitting exactly at the end of the last window
    if (eof_reached_ && position_ == window_end_ && position_ >= window_start_) {
        return;
    }
    fetch(position_, false);
}

void RangeReader::fetch(uint64_t start, bool extend) {
    ApiRequest request;
    request.method = net::HttpMethod::GET;
    request.host = ApiHost::Content;
    request.endpoint = make_endpoint("files", root_, path_);
    request.byte_range = std::make_pair(start, start + chunk_size_ - 1);

    auto response = transport_->signed_request(request);
    if (response.is_network_error) {
        throw TransportError("download", path_, start, response.error);
    }

    // Range starts at or past the end of the file
    if (response.status == 416) {
        if (!extend) {
            window_.clear();
            window_start_ = start;
            window_end_ = start;
        }
        eof_reached_ = true;
        log_debug("Fetch of %s at %llu: past end of file", path_.c_str(),
                  static_cast<unsigned long long>(start));
        return;
    }

    if (!response.ok()) {
        throw DownloadError("download of " + path_ + " at offset " + std::to_string(start) +
                            " failed: " + remote_error_message(response.body, response.status),
                            response.status);
    }

    std::string data;
    std::optional<uint64_t> total = content_range_total(response.headers);
    if (response.status == 206) {
        data.assign(response.body.begin(), response.body.end());
        if (data.size() > chunk_size_) data.resize(chunk_size_);
    } else {
        // Range ignored: the body is the whole file
        total = response.body.size();
        if (start < response.body.size()) {
            auto first = response.body.begin() + static_cast<ptrdiff_t>(start);
            auto count = std::min<uint64_t>(chunk_size_, response.body.size() - start);
            data.assign(first, first + static_cast<ptrdiff_t>(count));
        }
    }

    if (extend) {
        window_ += data;
    } else {
        window_ = std::move(data);
        window_start_ = start;
    }
    window_end_ = window_start_ + window_.size();

    uint64_t received = window_end_ - start;
    eof_reached_ = received < chunk_size_ || (total && window_end_ >= *total);

    log_debug("Fetched %s [%llu, %llu)%s", path_.c_str(),
              static_cast<unsigned long long>(start),
              static_cast<unsigned long long>(window_end_),
              eof_reached_ ? " eof" : "");
}

std::string RangeReader::read(size_t max) {
    // A failed refill must not consume the bytes already served
    uint64_t start = position_;
    std::string out;
    try {
        while (out.size() < max) {
            ensure_buffered(1);
            uint64_t avail = available();
            if (avail == 0) break;

            uint64_t count = std::min<uint64_t>(avail, max - out.size());
            out.append(window_, static_cast<size_t>(position_ - window_start_),
                       static_cast<size_t>(count));
            position_ += count;
        }
    } catch (const Error&) {
        position_ = start;
        throw;
    }
    return out;
}

std::optional<std::string> RangeReader::read_line() {
    ensure_buffered(1);
    if (available() == 0) return std::nullopt;

    size_t scan_from = static_cast<size_t>(position_ - window_start_);
    while (true) {
        auto nl = window_.find('\n', scan_from);
        if (nl != std::string::npos) {
            size_t begin = static_cast<size_t>(position_ - window_start_);
            std::string line = window_.substr(begin, nl + 1 - begin);
            position_ += line.size();
            return line;
        }
        if (eof_reached_) {
            std::string line = window_.substr(static_cast<size_t>(position_ - window_start_));
            position_ = window_end_;
            return line;
        }
        // Partial line: grow the window rather than discard it
        scan_from = window_.size();
        fetch(window_end_, true);
    }
}

std::optional<char> RangeReader::getc() {
    ensure_buffered(1);
    if (available() == 0) return std::nullopt;
    char c = window_[static_cast<size_t>(position_ - window_start_)];
    ++position_;
    return c;
}

uint64_t RangeReader::seek(int64_t offset, Whence whence) {
    int64_t base = 0;
    switch (whence) {
        case Whence::Start:
            base = 0;
            break;
        case Whence::Current:
            base = static_cast<int64_t>(position_);
            break;
        case Whence::End:
            if (!size_) {
                throw SeekError("cannot seek from end of " + path_ + ": size unknown");
            }
            base = static_cast<int64_t>(*size_);
            break;
    }

    if (offset > 0 && offset > std::numeric_limits<int64_t>::max() - base) {
        throw SeekError("seek offset " + std::to_string(offset) + " overflows in " + path_);
    }
    int64_t target = base + offset;
    if (target < 0) {
        throw SeekError("seek to negative offset " + std::to_string(target) + " in " + path_);
    }
    position_ = static_cast<uint64_t>(target);
    return position_;
}

}  // namespace dropfile

#include "storage/append_log.hpp"

#include "storage/errors.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace logkv::storage {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

// fsync the directory holding `path` so a rename into it is durable.
std::error_code sync_parent_directory(const std::filesystem::path& path) {
    auto dir = path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        return make_errno_error();
    }
    std::error_code ec;
    if (::fsync(dfd) < 0) {
        ec = make_errno_error();
    }
    ::close(dfd);
    return ec;
}

} // anonymous namespace

// ── AppendLog implementation ─────────────────────────────────────────────────

AppendLog::AppendLog(std::filesystem::path path,
                     bool lock_file,
                     std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path))
    , lock_file_(lock_file)
    , logger_(std::move(logger))
{}

AppendLog::~AppendLog() {
    close();
}

std::error_code AppendLog::open(bool reset_if_unreadable) {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(path_, ec);
    if (ec) return ec;

    if (exists) {
        if (!std::filesystem::is_regular_file(path_, ec)) {
            return ec ? ec : make_error_code(StoreErrc::not_a_file);
        }
    } else if (path_.has_parent_path()) {
        // Create parent directories if needed.
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return ec;
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        fd_ = -1;
        return make_errno_error();
    }

    ec = lock();
    if (ec) {
        close();
        return ec;
    }

    ec = refresh_size();
    if (ec) {
        close();
        return ec;
    }

    bool reinitialise = false;
    if (size_ < kLogHeaderSize) {
        // New file, or a crash before the header reached the disk.
        if (size_ > 0) {
            logger_->warn("AppendLog: {} has a torn header ({} bytes), re-initialising",
                          path_.string(), size_);
        }
        reinitialise = true;
    } else if (auto hdr_ec = validate_header()) {
        if (hdr_ec != StoreErrc::bad_header || !reset_if_unreadable) {
            close();
            return hdr_ec;
        }
        logger_->warn("AppendLog: {} has an unreadable header, discarding {} bytes",
                      path_.string(), size_);
        reinitialise = true;
    }

    if (reinitialise) {
        if (::ftruncate(fd_, 0) < 0) {
            auto e = make_errno_error();
            close();
            return e;
        }
        size_ = 0;
        ec = write_header();
        if (ec) {
            close();
            return ec;
        }
    }

    return {};
}

std::error_code AppendLog::create() {
    close();

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        fd_ = -1;
        return make_errno_error();
    }

    auto ec = lock();
    if (ec) {
        close();
        return ec;
    }

    size_ = 0;
    ec = write_header();
    if (ec) {
        close();
        return ec;
    }
    return {};
}

void AppendLog::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code AppendLog::lock() {
    if (!lock_file_) {
        return {};
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK) {
            return make_error_code(StoreErrc::locked);
        }
        return make_errno_error();
    }
    return {};
}

std::error_code AppendLog::refresh_size() {
    struct stat st {};
    if (::fstat(fd_, &st) < 0) {
        return make_errno_error();
    }
    size_ = static_cast<uint64_t>(st.st_size);
    return {};
}

std::error_code AppendLog::write_header() {
    std::vector<uint8_t> hdr(kLogMagic, kLogMagic + kLogMagicSize);
    hdr.push_back(static_cast<uint8_t>(kLogVersion & 0xFF));
    hdr.push_back(static_cast<uint8_t>((kLogVersion >> 8) & 0xFF));

    auto ec = write_at(0, hdr.data(), hdr.size());
    if (ec) return ec;

    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    size_ = kLogHeaderSize;
    return {};
}

std::error_code AppendLog::validate_header() const {
    std::vector<uint8_t> hdr;
    auto ec = read(0, kLogHeaderSize, hdr);
    if (ec) return ec;

    // Check magic.
    if (std::memcmp(hdr.data(), kLogMagic, kLogMagicSize) != 0) {
        return make_error_code(StoreErrc::bad_header);
    }

    // Check version.
    uint16_t version = static_cast<uint16_t>(hdr[4]) |
                       (static_cast<uint16_t>(hdr[5]) << 8);
    if (version != kLogVersion) {
        return make_error_code(StoreErrc::bad_header);
    }

    return {};
}

std::error_code AppendLog::write_at(uint64_t offset, const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::pwrite(fd_, data + written, len - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code AppendLog::append(const std::vector<uint8_t>& frame,
                                  bool sync,
                                  uint64_t& offset) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    auto ec = write_at(size_, frame.data(), frame.size());
    if (!ec && sync && ::fdatasync(fd_) < 0) {
        ec = make_errno_error();
    }

    if (ec) {
        // Drop whatever part of the frame made it to the file.
        if (::ftruncate(fd_, static_cast<off_t>(size_)) < 0) {
            logger_->error("AppendLog: failed to cut back torn append on {}: {}",
                           path_.string(), std::strerror(errno));
        }
        return ec;
    }

    offset = size_;
    size_ += frame.size();
    return {};
}

std::error_code AppendLog::read(uint64_t offset,
                                uint64_t length,
                                std::vector<uint8_t>& out) const {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (offset + length > size_) {
        return make_error_code(StoreErrc::corruption);
    }

    out.resize(length);
    std::size_t total = 0;
    while (total < length) {
        auto n = ::pread(fd_, out.data() + total, length - total,
                         static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) {
            // File shrank underneath us.
            return make_error_code(StoreErrc::corruption);
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code AppendLog::truncate_to(uint64_t offset) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (offset < kLogHeaderSize) {
        return make_error(std::errc::invalid_argument);
    }

    if (::ftruncate(fd_, static_cast<off_t>(offset)) < 0) {
        return make_errno_error();
    }
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    size_ = offset;
    return {};
}

std::error_code AppendLog::sync() {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    return {};
}

std::error_code AppendLog::scan(const FrameVisitor& visit, ScanResult& result) {
    result = {};
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    // The file may have changed size since open(); size_ must match it before
    // the tail is cut and new frames are appended.
    auto ec = refresh_size();
    if (ec) return ec;

    if (size_ < kLogHeaderSize) {
        logger_->warn("AppendLog: {} shrank below its header ({} bytes), re-initialising",
                      path_.string(), size_);
        result.discarded_bytes = size_;
        if (::ftruncate(fd_, 0) < 0) {
            return make_errno_error();
        }
        size_ = 0;
        ec = write_header();
        if (ec) return ec;
        result.valid_end = kLogHeaderSize;
        return {};
    }

    std::vector<uint8_t> frame;
    uint64_t pos = kLogHeaderSize;

    while (pos < size_) {
        const uint64_t remaining = size_ - pos;
        if (remaining < kFrameHeaderSize) {
            logger_->warn("AppendLog: truncated frame header at offset {}", pos);
            break;
        }

        ec = read(pos, kFrameHeaderSize, frame);
        if (ec == StoreErrc::corruption) {
            logger_->warn("AppendLog: short read of frame header at offset {}", pos);
            break;
        }
        if (ec) return ec;

        const FrameHeader hdr = parse_frame_header(frame.data());
        const uint64_t length = hdr.frame_size();
        if (length > remaining) {
            logger_->warn("AppendLog: truncated frame at offset {} ({} of {} bytes)",
                          pos, remaining, length);
            break;
        }

        ec = read(pos, length, frame);
        if (ec == StoreErrc::corruption) {
            logger_->warn("AppendLog: short read of frame at offset {}", pos);
            break;
        }
        if (ec) return ec;

        Record record;
        if (parse_record(frame.data(), frame.size(), record)) {
            logger_->warn("AppendLog: CRC mismatch in frame at offset {}", pos);
            break;
        }

        visit(pos, length, record);
        pos += length;
        ++result.frames;
    }

    result.valid_end = pos;
    if (pos < size_) {
        result.discarded_bytes = size_ - pos;
        logger_->warn("AppendLog: discarding {} bytes of invalid tail in {}",
                      result.discarded_bytes, path_.string());
        ec = truncate_to(pos);
        if (ec) return ec;
    }

    return {};
}

std::error_code AppendLog::replace_with(AppendLog& fresh) {
    if (!fresh.is_open()) return make_error(std::errc::bad_file_descriptor);

    // Atomic rename.
    std::error_code ec;
    std::filesystem::rename(fresh.path_, path_, ec);
    if (ec) return ec;

    if (auto dir_ec = sync_parent_directory(path_)) {
        logger_->warn("AppendLog: failed to sync directory of {}: {}",
                      path_.string(), dir_ec.message());
    }

    // The old inode (and its lock) goes away with the old descriptor.
    close();
    fd_ = std::exchange(fresh.fd_, -1);
    size_ = std::exchange(fresh.size_, 0);
    ++generation_;
    return {};
}

} // namespace logkv::storage

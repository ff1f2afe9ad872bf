#include "append_log.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <algorithm>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/wire_formats.h"

namespace Strata {

namespace {

constexpr size_t kReplayChunk = 1 << 20;
// Checksummed bytes start after {magic, crc}
constexpr size_t kChecksumOffset = 8;
constexpr size_t kCrcChunk = 1u << 30;

bool IsKnownOp(uint8_t op) {
    return op == static_cast<uint8_t>(LogOp::PUT) ||
           op == static_cast<uint8_t>(LogOp::MERGE) ||
           op == static_cast<uint8_t>(LogOp::DELETE) ||
           op == static_cast<uint8_t>(LogOp::PAD);
}

uint32_t RecordChecksum(const char* data, size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    while (len > 0) {
        const size_t n = std::min(len, kCrcChunk);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n));
        data += n;
        len -= n;
    }
    return static_cast<uint32_t>(crc);
}

std::string EncodeRecord(LogOp op, std::string_view key, std::string_view value) {
    std::string record;
    record.reserve(AppendLog::kRecordHeaderSize + key.size() + value.size());
    wire::AppendU32(record, AppendLog::kRecordMagic);
    wire::AppendU32(record, 0);
    record.push_back(static_cast<char>(op));
    wire::AppendU32(record, static_cast<uint32_t>(key.size()));
    wire::AppendU32(record, static_cast<uint32_t>(value.size()));
    record.append(key.data(), key.size());
    record.append(value.data(), value.size());

    const uint32_t crc = RecordChecksum(record.data() + kChecksumOffset, record.size() - kChecksumOffset);
    std::string crc_bytes;
    wire::AppendU32(crc_bytes, crc);
    record.replace(4, 4, crc_bytes);
    return record;
}

} // namespace

AppendLog::AppendLog(std::string path, bool sync_on_write)
    : path_(std::move(path)), sync_on_write_(sync_on_write) {}

AppendLog::~AppendLog() {
    Close();
}

void AppendLog::Open() {
    if (fd_ != -1) {
        return;
    }
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ == -1) {
        throw StorageError("Failed to open store log " + path_ + ": " + strerror(errno));
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        int err = errno;
        Close();
        throw StorageError("fstat failed for store log " + path_ + ": " + strerror(err));
    }
    tail_.store(static_cast<uint64_t>(st.st_size), std::memory_order_release);
    VLOG(1) << "Opened store log " << path_ << " (" << st.st_size << " bytes)";
}

void AppendLog::Close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

size_t AppendLog::Replay(const ApplyFunc& apply) {
    if (fd_ == -1) {
        throw StorageError("Replay on unopened store log " + path_);
    }

    const uint64_t file_size = tail_.load(std::memory_order_acquire);
    std::string buf;
    uint64_t file_offset = 0;   // file offset of buf[0]
    size_t pos = 0;             // parse position in buf
    size_t records = 0;
    uint64_t valid_end = 0;     // end of the last intact record
    uint64_t skipped = 0;       // bytes skipped since the last intact record
    bool eof = false;

    // Top up the buffer until need bytes are available at pos
    auto fill = [&](size_t need) {
        while (buf.size() - pos < need && !eof) {
            if (pos > 0) {
                buf.erase(0, pos);
                file_offset += pos;
                pos = 0;
            }
            const uint64_t read_at = file_offset + buf.size();
            if (read_at >= file_size) {
                eof = true;
                break;
            }
            const size_t want = static_cast<size_t>(
                std::min<uint64_t>(std::max(need, kReplayChunk), file_size - read_at));
            const size_t old_size = buf.size();
            buf.resize(old_size + want);
            ssize_t n = ::pread(fd_, buf.data() + old_size, want, static_cast<off_t>(read_at));
            if (n < 0) {
                if (errno == EINTR) {
                    buf.resize(old_size);
                    continue;
                }
                throw StorageError("pread failed for store log " + path_ + ": " + strerror(errno));
            }
            buf.resize(old_size + static_cast<size_t>(n));
            if (n == 0) {
                eof = true;
            }
        }
        return buf.size() - pos >= need;
    };

    while (fill(kRecordHeaderSize)) {
        const char* header = buf.data() + pos;
        const uint64_t at = file_offset + pos;
        const uint8_t op = static_cast<uint8_t>(header[8]);
        const uint32_t key_len = wire::LoadU32(header + 9);
        const uint32_t value_len = wire::LoadU32(header + 13);
        const uint64_t record_len = kRecordHeaderSize + static_cast<uint64_t>(key_len) + value_len;

        // Not a record boundary: a hole, a torn record or damaged bytes. Slide
        // forward one byte and look for the next header.
        if (wire::LoadU32(header) != kRecordMagic || !IsKnownOp(op) || record_len > file_size - at ||
            !fill(static_cast<size_t>(record_len)) ||
            RecordChecksum(buf.data() + pos + kChecksumOffset, static_cast<size_t>(record_len) - kChecksumOffset) !=
                wire::LoadU32(buf.data() + pos + 4)) {
            ++pos;
            ++skipped;
            continue;
        }

        if (skipped > 0) {
            LOG(WARNING) << "Store log " << path_ << " skipped " << skipped << " unreadable bytes before offset "
                         << (file_offset + pos);
            skipped = 0;
        }
        if (op != static_cast<uint8_t>(LogOp::PAD)) {
            const char* body = buf.data() + pos + kRecordHeaderSize;
            apply(static_cast<LogOp>(op), std::string_view(body, key_len),
                  std::string_view(body + key_len, value_len));
            ++records;
        }
        pos += static_cast<size_t>(record_len);
        valid_end = file_offset + pos;
    }

    // Only bytes after the last intact record are dropped
    if (valid_end < file_size) {
        if (::ftruncate(fd_, static_cast<off_t>(valid_end)) != 0) {
            throw StorageError("ftruncate failed for store log " + path_ + ": " + strerror(errno));
        }
        LOG(WARNING) << "Truncated store log " << path_ << " from " << file_size << " to " << valid_end << " bytes";
    }
    tail_.store(valid_end, std::memory_order_release);
    LOG(INFO) << "Replayed " << records << " records from store log " << path_;
    return records;
}

void AppendLog::Append(LogOp op, std::string_view key, std::string_view value) {
    if (fd_ == -1) {
        throw StorageError("Append on unopened store log " + path_);
    }
    const std::string record = EncodeRecord(op, key, value);

    const uint64_t offset = tail_.fetch_add(record.size(), std::memory_order_acq_rel);
    try {
        WriteFully(record.data(), record.size(), offset);
    } catch (const StorageError&) {
        WritePadding(offset, record.size());
        throw;
    }

    if (sync_on_write_) {
        Sync();
    }
}

void AppendLog::WritePadding(uint64_t offset, size_t len) {
    if (len < kRecordHeaderSize) {
        return;
    }
    const std::string pad = EncodeRecord(LogOp::PAD, {}, std::string(len - kRecordHeaderSize, '\0'));
    try {
        WriteFully(pad.data(), pad.size(), offset);
    } catch (const StorageError& e) {
        LOG(ERROR) << "Could not pad failed record at offset " << offset << " in store log " << path_ << ": "
                   << e.what();
    }
}

void AppendLog::WriteFully(const char* data, size_t len, uint64_t offset) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::pwrite(fd_, data + written, len - written, static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("pwrite failed for store log " + path_ + " offset " +
                               std::to_string(offset + written) + ": " + strerror(errno));
        }
        if (n == 0) {
            throw StorageError("Incomplete pwrite: expected " + std::to_string(len) +
                               " bytes, wrote " + std::to_string(written));
        }
        written += static_cast<size_t>(n);
    }
}

void AppendLog::Sync() {
    if (fd_ == -1) {
        return;
    }
    if (::fsync(fd_) != 0) {
        throw StorageError("fsync failed for store log " + path_ + ": " + strerror(errno));
    }
}

} // namespace Strata

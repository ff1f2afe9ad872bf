#ifndef STRATA_SRC_STORE_APPEND_LOG_H_
#define STRATA_SRC_STORE_APPEND_LOG_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace Strata {

enum class LogOp : uint8_t {
    // 0 is never written
    PUT = 1,
    MERGE = 2,
    DELETE = 3,
    // Fills a reserved range whose real record could not be written
    PAD = 4,
};

/**
 * Append-only mutation log backing a durable OrderedStore.
 *
 * Record layout: {u32 magic BE, u32 crc32 BE, u8 op, u32 key_len BE,
 * u32 value_len BE, key, value}; the checksum covers everything after itself.
 * Appenders reserve their byte range with a fetch_add on the tail and write
 * it with pwrite, so concurrent appenders never serialize on a lock. A range
 * reserved but never written is a hole; replay resynchronizes on the next
 * valid header, so records appended after a hole survive.
 */
class AppendLog {
public:
    using ApplyFunc = std::function<void(LogOp op, std::string_view key, std::string_view value)>;

    static constexpr uint32_t kRecordMagic = 0x53545241;  // "STRA"
    static constexpr size_t kRecordHeaderSize = 4 + 4 + 1 + 4 + 4;

    AppendLog(std::string path, bool sync_on_write);
    ~AppendLog();

    AppendLog(const AppendLog&) = delete;
    AppendLog& operator=(const AppendLog&) = delete;

    // Opens (creating if needed) the log file. Throws StorageError.
    void Open();

    // Feeds every intact record to apply in file order, skipping holes and
    // damaged records, and truncates anything after the last intact record.
    // Returns the number of records applied.
    size_t Replay(const ApplyFunc& apply);

    // Throws StorageError on I/O failure.
    void Append(LogOp op, std::string_view key, std::string_view value);

    void Sync();

    uint64_t size() const { return tail_.load(std::memory_order_acquire); }
    const std::string& path() const { return path_; }

private:
    void WriteFully(const char* data, size_t len, uint64_t offset);
    // Best effort: covers a reserved range with a PAD record
    void WritePadding(uint64_t offset, size_t len);
    void Close();

    std::string path_;
    bool sync_on_write_;
    int fd_ = -1;
    std::atomic<uint64_t> tail_{0};
};

} // namespace Strata

#endif // STRATA_SRC_STORE_APPEND_LOG_H_

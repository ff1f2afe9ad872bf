#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * On-disk layout of keys and values for the region trees.
 * Every integer is stored big-endian so that lexicographic byte order of keys
 * equals numeric order; ordered scans over a scope rely on this.
 */

namespace Strata {
namespace wire {

// ============================================================================
// Field widths
// ============================================================================

static constexpr size_t kLabelSize = sizeof(uint32_t);
static constexpr size_t kOffsetSize = sizeof(uint32_t);
static constexpr size_t kScopeSize = sizeof(uint64_t);

static constexpr size_t kBoundaryRecordSize = kLabelSize + kOffsetSize;
static constexpr size_t kMarkKeySize = kScopeSize + kOffsetSize;
static constexpr size_t kRegionKeySize = kScopeSize + kOffsetSize;
static constexpr size_t kReferenceKeySize = kLabelSize + kScopeSize + kOffsetSize;

static_assert(kBoundaryRecordSize == 8, "Boundary record must be exactly 8 bytes");
static_assert(kReferenceKeySize == 16, "Reference key must be exactly 16 bytes");

// ============================================================================
// Big-endian primitives
// ============================================================================

inline void StoreU32(char* out, uint32_t value) {
    out[0] = static_cast<char>(value >> 24);
    out[1] = static_cast<char>(value >> 16);
    out[2] = static_cast<char>(value >> 8);
    out[3] = static_cast<char>(value);
}

inline uint32_t LoadU32(const char* in) {
    const auto* p = reinterpret_cast<const unsigned char*>(in);
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void StoreU64(char* out, uint64_t value) {
    StoreU32(out, static_cast<uint32_t>(value >> 32));
    StoreU32(out + 4, static_cast<uint32_t>(value));
}

inline uint64_t LoadU64(const char* in) {
    return (static_cast<uint64_t>(LoadU32(in)) << 32) | LoadU32(in + 4);
}

inline void AppendU32(std::string& out, uint32_t value) {
    char buf[4];
    StoreU32(buf, value);
    out.append(buf, sizeof(buf));
}

inline void AppendU64(std::string& out, uint64_t value) {
    char buf[8];
    StoreU64(buf, value);
    out.append(buf, sizeof(buf));
}

// ============================================================================
// Boundary records (marks tree values)
// ============================================================================

/**
 * @brief One mark contribution stored at a (scope, offset) key.
 * The record is written at both the start and the end offset of the mark;
 * a record whose end equals the key offset is the closing side.
 */
struct BoundaryRecord {
    uint32_t label;
    uint32_t end;
};

inline std::string EncodeBoundaryRecord(const BoundaryRecord& record) {
    std::string out;
    out.reserve(kBoundaryRecordSize);
    AppendU32(out, record.label);
    AppendU32(out, record.end);
    return out;
}

inline BoundaryRecord DecodeBoundaryRecord(const char* in) {
    return BoundaryRecord{LoadU32(in), LoadU32(in + kLabelSize)};
}

inline constexpr bool ValidateBoundaryRecords(size_t value_size) {
    return value_size > 0 && value_size % kBoundaryRecordSize == 0;
}

// ============================================================================
// Keys
// ============================================================================

inline std::string EncodeScopePrefix(uint64_t scope) {
    std::string out;
    AppendU64(out, scope);
    return out;
}

inline std::string EncodeMarkKey(uint64_t scope, uint32_t offset) {
    std::string out;
    out.reserve(kMarkKeySize);
    AppendU64(out, scope);
    AppendU32(out, offset);
    return out;
}

inline bool DecodeMarkKey(std::string_view key, uint64_t& scope, uint32_t& offset) {
    if (key.size() != kMarkKeySize) return false;
    scope = LoadU64(key.data());
    offset = LoadU32(key.data() + kScopeSize);
    return true;
}

inline std::string EncodeRegionKey(uint64_t scope, uint32_t start) {
    return EncodeMarkKey(scope, start);
}

inline bool DecodeRegionKey(std::string_view key, uint64_t& scope, uint32_t& start) {
    return DecodeMarkKey(key, scope, start);
}

inline std::string EncodeLabelPrefix(uint32_t label) {
    std::string out;
    AppendU32(out, label);
    return out;
}

inline std::string EncodeReferencePrefix(uint32_t label, uint64_t scope) {
    std::string out;
    out.reserve(kLabelSize + kScopeSize);
    AppendU32(out, label);
    AppendU64(out, scope);
    return out;
}

inline std::string EncodeReferenceKey(uint32_t label, uint64_t scope, uint32_t start) {
    std::string out;
    out.reserve(kReferenceKeySize);
    AppendU32(out, label);
    AppendU64(out, scope);
    AppendU32(out, start);
    return out;
}

inline bool DecodeReferenceKey(std::string_view key, uint32_t& label, uint64_t& scope, uint32_t& start) {
    if (key.size() != kReferenceKeySize) return false;
    label = LoadU32(key.data());
    scope = LoadU64(key.data() + kLabelSize);
    start = LoadU32(key.data() + kLabelSize + kScopeSize);
    return true;
}

// ============================================================================
// Consolidated entry values: {end u32, labels u32[]}
// ============================================================================

/**
 * @brief Serialize a consolidated entry value.
 * @param labels Must already be sorted and deduplicated.
 */
inline std::string EncodeEntryValue(uint32_t end, const std::vector<uint32_t>& labels) {
    std::string out;
    out.reserve(kOffsetSize + labels.size() * kLabelSize);
    AppendU32(out, end);
    for (uint32_t label : labels) {
        AppendU32(out, label);
    }
    return out;
}

/**
 * @brief Parse a consolidated entry value.
 * @return false if the value is truncated, has no labels, or the label array
 *         is not strictly ascending.
 */
inline bool DecodeEntryValue(std::string_view value, uint32_t& end, std::vector<uint32_t>& labels) {
    if (value.size() < kOffsetSize + kLabelSize ||
        (value.size() - kOffsetSize) % kLabelSize != 0) {
        return false;
    }
    end = LoadU32(value.data());
    const size_t count = (value.size() - kOffsetSize) / kLabelSize;
    labels.clear();
    labels.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        uint32_t label = LoadU32(value.data() + kOffsetSize + i * kLabelSize);
        if (!labels.empty() && label <= labels.back()) return false;
        labels.push_back(label);
    }
    return true;
}

}  // namespace wire
}  // namespace Strata

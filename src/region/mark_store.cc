#include "mark_store.h"

#include <limits>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/wire_formats.h"

namespace Strata {

MarkStore::MarkStore(Tree marks) : marks_(marks) {}

std::string MarkStore::ConcatMerge(std::string_view /*key*/, const std::string* existing,
                                   std::string_view operand) {
    std::string value;
    value.reserve((existing ? existing->size() : 0) + operand.size());
    if (existing) {
        value.append(*existing);
    }
    value.append(operand.data(), operand.size());
    return value;
}

void MarkStore::Insert(ScopeId scope, ByteRange range, LabelId label) {
    if (range.start >= range.end) {
        return;
    }

    const std::string record = wire::EncodeBoundaryRecord(wire::BoundaryRecord{label, range.end});
    marks_.Merge(wire::EncodeMarkKey(scope, range.start), record);
    marks_.Merge(wire::EncodeMarkKey(scope, range.end), record);
}

std::vector<BoundaryEvent> MarkStore::Events(ScopeId scope) const {
    std::vector<BoundaryEvent> events;

    for (const auto& [key, value] : marks_.ScanPrefix(wire::EncodeScopePrefix(scope))) {
        ScopeId key_scope;
        uint32_t offset;
        if (!wire::DecodeMarkKey(key, key_scope, offset)) {
            throw StorageError("Malformed mark key of " + std::to_string(key.size()) +
                               " bytes in scope " + std::to_string(scope));
        }
        if (!wire::ValidateBoundaryRecords(value.size())) {
            throw StorageError("Mark value of " + std::to_string(value.size()) +
                               " bytes at scope " + std::to_string(scope) + " offset " +
                               std::to_string(offset) + " is not a whole number of records");
        }

        for (size_t pos = 0; pos < value.size(); pos += wire::kBoundaryRecordSize) {
            const wire::BoundaryRecord record = wire::DecodeBoundaryRecord(value.data() + pos);
            if (record.end < offset) {
                throw StorageError("Mark record for label " + std::to_string(record.label) +
                                   " ends at " + std::to_string(record.end) +
                                   " before its key offset " + std::to_string(offset));
            }
            // The record carries the mark's end: stored at the end it closes,
            // anywhere else it opens
            events.push_back(BoundaryEvent{offset, record.label, record.end == offset ? -1 : 1});
        }
    }

    NormalizeEvents(events);
    VLOG(3) << "Scope " << scope << " has " << events.size() << " boundary events";
    return events;
}

std::vector<ScopeId> MarkStore::Scopes() const {
    std::vector<ScopeId> scopes;
    ScopeId next = 0;
    while (true) {
        auto first = marks_.Scan(wire::EncodeScopePrefix(next), "", 1);
        if (first.empty()) {
            break;
        }
        ScopeId scope;
        uint32_t offset;
        if (!wire::DecodeMarkKey(first.front().first, scope, offset)) {
            throw StorageError("Malformed mark key while listing scopes");
        }
        scopes.push_back(scope);
        if (scope == std::numeric_limits<ScopeId>::max()) {
            break;
        }
        next = scope + 1;
    }
    return scopes;
}

} // namespace Strata

#include "reference_index.h"

#include <limits>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/wire_formats.h"

namespace Strata {

namespace {

Region DecodeRegion(const KeyValue& entry) {
    Region region;
    if (!wire::DecodeRegionKey(entry.first, region.scope, region.start) ||
        !wire::DecodeEntryValue(entry.second, region.end, region.labels)) {
        throw StorageError("Malformed region entry (" + std::to_string(entry.first.size()) +
                           "-byte key, " + std::to_string(entry.second.size()) + "-byte value)");
    }
    return region;
}

ConsolidatedEntry DecodeReference(const KeyValue& entry) {
    ConsolidatedEntry out;
    LabelId label;
    if (!wire::DecodeReferenceKey(entry.first, label, out.scope, out.start) ||
        !wire::DecodeEntryValue(entry.second, out.end, out.labels)) {
        throw StorageError("Malformed reference entry (" + std::to_string(entry.first.size()) +
                           "-byte key, " + std::to_string(entry.second.size()) + "-byte value)");
    }
    return out;
}

} // end of namespace

// ---------------------------------------------------------------------------
// RegionIndex
// ---------------------------------------------------------------------------

RegionIndex::RegionIndex(Tree regions, Tree finalized)
    : regions_(regions), finalized_(finalized) {}

void RegionIndex::Write(const Region& region) {
    regions_.Put(wire::EncodeRegionKey(region.scope, region.start),
                 wire::EncodeEntryValue(region.end, region.labels));
}

std::vector<Region> RegionIndex::Load(ScopeId scope) const {
    std::vector<Region> out;
    for (const auto& entry : regions_.ScanPrefix(wire::EncodeScopePrefix(scope))) {
        out.push_back(DecodeRegion(entry));
    }
    return out;
}

std::vector<Region> RegionIndex::EraseScope(ScopeId scope) {
    std::vector<Region> removed = Load(scope);
    for (const Region& region : removed) {
        regions_.Delete(wire::EncodeRegionKey(region.scope, region.start));
    }
    return removed;
}

void RegionIndex::MarkFinalized(ScopeId scope, uint64_t region_count) {
    std::string value;
    wire::AppendU64(value, region_count);
    finalized_.Put(wire::EncodeScopePrefix(scope), value);
}

void RegionIndex::ClearFinalized(ScopeId scope) {
    finalized_.Delete(wire::EncodeScopePrefix(scope));
}

bool RegionIndex::IsFinalized(ScopeId scope) const {
    return finalized_.Get(wire::EncodeScopePrefix(scope)).has_value();
}

std::vector<Region> RegionIndex::RegionsIn(ScopeId scope) const {
    if (!IsFinalized(scope)) {
        throw ScopeNotFinalized(scope);
    }
    return Load(scope);
}

bool RegionIndex::RegionAt(ScopeId scope, uint32_t offset, Region& out) const {
    if (!IsFinalized(scope)) {
        throw ScopeNotFinalized(scope);
    }
    // Last region starting at or before offset
    const std::string begin = wire::EncodeScopePrefix(scope);
    const std::string end = offset == std::numeric_limits<uint32_t>::max() ? Tree::PrefixSuccessor(begin)
                                                 : wire::EncodeRegionKey(scope, offset + 1);
    auto entry = regions_.Last(begin, end);
    if (!entry) {
        return false;
    }
    Region region = DecodeRegion(*entry);
    if (offset >= region.end) {
        return false;
    }
    out = std::move(region);
    return true;
}

// ---------------------------------------------------------------------------
// ReferenceIterator
// ---------------------------------------------------------------------------

ReferenceIterator::ReferenceIterator(Tree references, std::string begin, std::string end,
                                     size_t batch)
    : references_(references),
      resume_(std::move(begin)),
      end_(std::move(end)),
      batch_(batch == 0 ? 1 : batch) {}

void ReferenceIterator::Fill() {
    page_ = references_.Scan(resume_, end_, batch_);
    pos_ = 0;
    if (page_.size() < batch_) {
        exhausted_ = true;
    }
    if (!page_.empty()) {
        // Smallest key strictly greater than the last one seen
        resume_ = page_.back().first;
        resume_.push_back('\0');
    }
}

bool ReferenceIterator::Next(ConsolidatedEntry& out) {
    if (pos_ >= page_.size()) {
        if (exhausted_) {
            return false;
        }
        Fill();
        if (page_.empty()) {
            return false;
        }
    }
    out = DecodeReference(page_[pos_++]);
    return true;
}

// ---------------------------------------------------------------------------
// ReferenceIndex
// ---------------------------------------------------------------------------

ReferenceIndex::ReferenceIndex(Tree references, const RegionIndex& regions, size_t scan_batch)
    : references_(references), regions_(regions), scan_batch_(scan_batch) {}

void ReferenceIndex::Write(const Region& region) {
    const std::string value = wire::EncodeEntryValue(region.end, region.labels);
    for (LabelId label : region.labels) {
        references_.Put(wire::EncodeReferenceKey(label, region.scope, region.start), value);
    }
}

void ReferenceIndex::Erase(const Region& region) {
    for (LabelId label : region.labels) {
        references_.Delete(wire::EncodeReferenceKey(label, region.scope, region.start));
    }
}

ReferenceIterator ReferenceIndex::References(LabelId label) const {
    const std::string prefix = wire::EncodeLabelPrefix(label);
    return ReferenceIterator(references_, prefix, Tree::PrefixSuccessor(prefix), scan_batch_);
}

std::vector<ConsolidatedEntry> ReferenceIndex::CollectReferences(LabelId label) const {
    std::vector<ConsolidatedEntry> out;
    ReferenceIterator it = References(label);
    ConsolidatedEntry entry;
    while (it.Next(entry)) {
        out.push_back(std::move(entry));
    }
    VLOG(2) << "Label " << label << " has " << out.size() << " references";
    return out;
}

std::vector<ConsolidatedEntry> ReferenceIndex::ReferencesIn(LabelId label, ScopeId scope) const {
    if (!regions_.IsFinalized(scope)) {
        throw ScopeNotFinalized(scope);
    }
    std::vector<ConsolidatedEntry> out;
    for (const auto& entry : references_.ScanPrefix(wire::EncodeReferencePrefix(label, scope))) {
        out.push_back(DecodeReference(entry));
    }
    return out;
}

} // namespace Strata

#include "range_map.h"

namespace Strata {

void RangeMap::Insert(ByteRange range, LabelId label) {
    // empty ranges don't need entries
    if (range.empty()) {
        return;
    }
    AddPoint(range.start, label, 1);
    AddPoint(range.end, label, -1);
}

void RangeMap::AddPoint(uint32_t offset, LabelId label, int32_t delta) {
    auto [it, inserted] = points_.try_emplace({offset, label}, delta);
    if (inserted) {
        return;
    }
    it->second += delta;
    if (it->second == 0) {
        points_.erase(it);
    }
}

std::vector<BoundaryEvent> RangeMap::Events() const {
    std::vector<BoundaryEvent> events;
    events.reserve(points_.size());
    for (const auto& [key, delta] : points_) {
        events.push_back(BoundaryEvent{key.first, key.second, delta});
    }
    return events;
}

std::vector<Region> RangeMap::Regions(ScopeId scope) const {
    // points_ is already sorted and coincidence-merged
    return SweepAll(scope, Events());
}

} // namespace Strata

#include "sweep.h"

#include <algorithm>
#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"

namespace Strata {

void NormalizeEvents(std::vector<BoundaryEvent>& events) {
    std::sort(events.begin(), events.end(), [](const BoundaryEvent& a, const BoundaryEvent& b) {
        if (a.offset != b.offset) return a.offset < b.offset;
        return a.label < b.label;
    });

    size_t out = 0;
    for (size_t i = 0; i < events.size();) {
        BoundaryEvent merged = events[i];
        size_t j = i + 1;
        while (j < events.size() && events[j].offset == merged.offset && events[j].label == merged.label) {
            merged.delta += events[j].delta;
            ++j;
        }
        // An open and a close of the same label at one offset leave the label
        // continuously active, so nothing is recorded there
        if (merged.delta != 0) {
            events[out++] = merged;
        }
        i = j;
    }
    events.resize(out);
}

bool SweepCursor::PeekChangesMembership() const {
    const BoundaryEvent& event = events_[next_];
    auto it = active_.find(event.label);
    const int64_t count = it == active_.end() ? 0 : it->second;
    const int64_t after = count + event.delta;
    // after < 0 is reported as a change so the sweep commits it at a segment
    // start, where CommitNext raises the underflow
    return (count > 0) != (after > 0) || after < 0;
}

void SweepCursor::CommitNext() {
    const BoundaryEvent& event = events_[next_++];
    auto it = active_.find(event.label);
    const int64_t count = it == active_.end() ? 0 : it->second;
    const int64_t after = count + event.delta;

    if (after < 0) [[unlikely]] {
        throw InvariantViolation(scope_, event.offset,
                                 "label " + std::to_string(event.label) + " closed " +
                                 std::to_string(-after) + " more time(s) than it opened");
    }
    if (after == 0) {
        if (it != active_.end()) {
            active_.erase(it);
        }
    } else if (it == active_.end()) {
        active_.emplace(event.label, after);
    } else {
        it->second = after;
    }
}

std::vector<LabelId> SweepCursor::ActiveLabels() const {
    std::vector<LabelId> labels;
    labels.reserve(active_.size());
    for (const auto& [label, count] : active_) {
        labels.push_back(label);
    }
    return labels;
}

Sweep::Sweep(ScopeId scope, std::vector<BoundaryEvent> events)
    : scope_(scope), events_(std::move(events)), cursor_(scope_, events_) {}

bool Sweep::Next(Region& out) {
    while (true) {
        if (cursor_.Done()) {
            if (!finished_) {
                finished_ = true;
                if (!cursor_.ActiveEmpty()) {
                    std::ostringstream labels;
                    for (LabelId label : cursor_.ActiveLabels()) labels << " " << label;
                    const uint32_t last = events_.empty() ? 0 : events_.back().offset;
                    throw InvariantViolation(scope_, last, "labels still active at end of stream:" + labels.str());
                }
            }
            return false;
        }

        // Everything at the segment start is applied unconditionally
        const uint32_t segment_start = cursor_.PeekOffset();
        while (!cursor_.Done() && cursor_.PeekOffset() == segment_start) {
            cursor_.CommitNext();
        }

        // Extend the segment over events that only adjust a count; it always
        // reaches the offset of the first event that changes the active set
        uint32_t segment_end = segment_start;
        while (!cursor_.Done()) {
            segment_end = cursor_.PeekOffset();
            if (cursor_.PeekChangesMembership()) {
                break;
            }
            cursor_.CommitNext();
        }

        if (cursor_.ActiveEmpty()) {
            continue;  // gap between marks
        }
        if (segment_end == segment_start) {
            // Stream ran out with labels active; report it on the next call
            continue;
        }

        out.scope = scope_;
        out.start = segment_start;
        out.end = segment_end;
        out.labels = cursor_.ActiveLabels();
        return true;
    }
}

std::vector<Region> SweepAll(ScopeId scope, std::vector<BoundaryEvent> events) {
    Sweep sweep(scope, std::move(events));
    std::vector<Region> regions;
    Region region;
    while (sweep.Next(region)) {
        regions.push_back(region);
    }
    VLOG(3) << "Swept scope " << scope << " into " << regions.size() << " regions";
    return regions;
}

} // namespace Strata

#pragma once

#include <cstdint>
#include <vector>

#include "absl/container/btree_map.h"
#include "types.h"

namespace Strata {

/**
 * Net change in a label's reference count at one offset.
 * delta is the summed multiplicity of every open (+1) and close (-1) that
 * landed on (offset, label); it is never zero in a normalized stream.
 */
struct BoundaryEvent {
    uint32_t offset;
    LabelId label;
    int32_t delta;

    bool operator==(const BoundaryEvent& other) const {
        return offset == other.offset && label == other.label && delta == other.delta;
    }
};

// Sorts by (offset, label), sums coincident deltas and drops the ones that
// cancel out.
void NormalizeEvents(std::vector<BoundaryEvent>& events);

/**
 * Two-phase cursor over a normalized event stream.
 * Peek inspects the next event without touching the active set; Commit
 * applies it. The sweep decides between the two per event.
 */
class SweepCursor {
public:
    SweepCursor(ScopeId scope, const std::vector<BoundaryEvent>& events)
        : scope_(scope), events_(events) {}

    bool Done() const { return next_ >= events_.size(); }
    uint32_t PeekOffset() const { return events_[next_].offset; }

    // True if committing the next event adds its label to, or removes it
    // from, the active set.
    bool PeekChangesMembership() const;

    // Applies the next event. Throws InvariantViolation on a count underflow.
    void CommitNext();

    bool ActiveEmpty() const { return active_.empty(); }
    std::vector<LabelId> ActiveLabels() const;

private:
    ScopeId scope_;
    const std::vector<BoundaryEvent>& events_;
    size_t next_ = 0;
    // btree keeps labels ordered so region label sets come out sorted
    absl::btree_map<LabelId, int64_t> active_;
};

/**
 * Lazy sweep converting one scope's boundary events into its canonical
 * partition. Restartable: a fresh Sweep over the same events yields the same
 * regions. Owns a copy of the events so it can outlive the caller's buffer.
 */
class Sweep {
public:
    // events must be normalized (see NormalizeEvents)
    Sweep(ScopeId scope, std::vector<BoundaryEvent> events);

    Sweep(const Sweep&) = delete;
    Sweep& operator=(const Sweep&) = delete;

    // Produces the next region. Returns false once the stream is exhausted.
    // Throws InvariantViolation if the stream is unbalanced.
    bool Next(Region& out);

private:
    ScopeId scope_;
    std::vector<BoundaryEvent> events_;
    SweepCursor cursor_;
    bool finished_ = false;
};

// Runs a full sweep and collects every region.
std::vector<Region> SweepAll(ScopeId scope, std::vector<BoundaryEvent> events);

} // namespace Strata

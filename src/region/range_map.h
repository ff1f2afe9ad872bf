#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "sweep.h"
#include "types.h"

namespace Strata {

/**
 * In-memory mark collection for a single scope, for callers that want the
 * consolidated partition without going through a store (e.g. matching one
 * file's citations). Produces exactly what the persistent path produces.
 */
class RangeMap {
public:
    RangeMap() = default;

    // Empty ranges are ignored
    void Insert(ByteRange range, LabelId label);

    // Events currently recorded, normalized
    std::vector<BoundaryEvent> Events() const;

    // Canonical partition of everything inserted so far. Throws
    // InvariantViolation only if the map was corrupted, which Insert cannot do.
    std::vector<Region> Regions(ScopeId scope = 0) const;

    bool empty() const { return points_.empty(); }
    void clear() { points_.clear(); }

private:
    void AddPoint(uint32_t offset, LabelId label, int32_t delta);

    // (offset, label) -> net multiplicity; zero entries are erased
    absl::btree_map<std::pair<uint32_t, LabelId>, int32_t> points_;
};

} // namespace Strata

#ifndef STRATA_SRC_REGION_TYPES_H_
#define STRATA_SRC_REGION_TYPES_H_

#include <cstdint>
#include <ostream>
#include <vector>

namespace Strata {

using LabelId = uint32_t;
using ScopeId = uint64_t;

// Half-open byte range [start, end)
struct ByteRange {
    uint32_t start;
    uint32_t end;

    bool empty() const { return start >= end; }
    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * A maximal sub-range of a scope over which the set of active labels is
 * constant. labels is sorted, unique and never empty.
 */
struct Region {
    ScopeId scope = 0;
    uint32_t start = 0;
    uint32_t end = 0;
    std::vector<LabelId> labels;

    bool operator==(const Region& other) const {
        return scope == other.scope && start == other.start && end == other.end &&
               labels == other.labels;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }
};

// What the reference index hands back to consumers
using ConsolidatedEntry = Region;

inline std::ostream& operator<<(std::ostream& os, const Region& region) {
    os << "{scope=" << region.scope << " " << region.start << ".." << region.end << " [";
    for (size_t i = 0; i < region.labels.size(); ++i) {
        if (i) os << ",";
        os << region.labels[i];
    }
    return os << "]}";
}

} // namespace Strata

#endif // STRATA_SRC_REGION_TYPES_H_

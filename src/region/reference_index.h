#ifndef STRATA_SRC_REGION_REFERENCE_INDEX_H_
#define STRATA_SRC_REGION_REFERENCE_INDEX_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "store/ordered_store.h"
#include "types.h"

namespace Strata {

/**
 * Per-scope publication of consolidated regions, keyed (scope, start), plus
 * the set of scopes whose publication is complete.
 *
 * The finalized marker is written last and cleared first, so a scope is only
 * reported finalized while its regions are whole.
 */
class RegionIndex {
public:
    RegionIndex(Tree regions, Tree finalized);

    void Write(const Region& region);

    // Removes every region published for scope and returns what was removed
    std::vector<Region> EraseScope(ScopeId scope);

    void MarkFinalized(ScopeId scope, uint64_t region_count);
    void ClearFinalized(ScopeId scope);
    bool IsFinalized(ScopeId scope) const;

    // Published regions of a finalized scope, ascending by start.
    // Throws ScopeNotFinalized.
    std::vector<Region> RegionsIn(ScopeId scope) const;

    // Region covering offset, if any. Throws ScopeNotFinalized.
    bool RegionAt(ScopeId scope, uint32_t offset, Region& out) const;

    // Regions stored for scope regardless of the finalized marker
    std::vector<Region> Load(ScopeId scope) const;

private:
    Tree regions_;
    Tree finalized_;
};

class ReferenceIndex;

/**
 * Lazy ascending walk over one label's references. Pulls the index in pages
 * and resumes strictly after the last key returned, so entries written
 * concurrently behind the cursor are not revisited.
 */
class ReferenceIterator {
public:
    // Throws StorageError on a malformed entry
    bool Next(ConsolidatedEntry& out);

private:
    friend class ReferenceIndex;
    ReferenceIterator(Tree references, std::string begin, std::string end, size_t batch);

    void Fill();

    Tree references_;
    std::string resume_;
    std::string end_;
    size_t batch_;
    std::vector<KeyValue> page_;
    size_t pos_ = 0;
    bool exhausted_ = false;
};

/**
 * Inverted index from label to every consolidated region carrying it, keyed
 * (label, scope, start). Each region fans out one copy per label.
 */
class ReferenceIndex {
public:
    ReferenceIndex(Tree references, const RegionIndex& regions, size_t scan_batch = 256);

    void Write(const Region& region);
    void Erase(const Region& region);

    // Entries for label ascending by (scope, start)
    ReferenceIterator References(LabelId label) const;
    std::vector<ConsolidatedEntry> CollectReferences(LabelId label) const;

    // Entries for label within one finalized scope. Throws ScopeNotFinalized.
    std::vector<ConsolidatedEntry> ReferencesIn(LabelId label, ScopeId scope) const;

private:
    Tree references_;
    const RegionIndex& regions_;
    size_t scan_batch_;
};

} // namespace Strata

#endif // STRATA_SRC_REGION_REFERENCE_INDEX_H_

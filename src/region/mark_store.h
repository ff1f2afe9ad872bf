#ifndef STRATA_SRC_REGION_MARK_STORE_H_
#define STRATA_SRC_REGION_MARK_STORE_H_

#include <string>
#include <string_view>
#include <vector>

#include "store/ordered_store.h"
#include "sweep.h"
#include "types.h"

namespace Strata {

/**
 * Append-only record of mark boundaries, keyed (scope, offset).
 *
 * Every insert merges one 8-byte record at the start key and one at the end
 * key. The tree's merge operator concatenates, so concurrent inserts at the
 * same key commute and nothing is read before it is written.
 */
class MarkStore {
public:
    explicit MarkStore(Tree marks);

    // Merge operator to register on the marks tree
    static std::string ConcatMerge(std::string_view key, const std::string* existing,
                                   std::string_view operand);

    // No-op for empty ranges. Safe to call from any number of threads.
    // Throws StorageError.
    void Insert(ScopeId scope, ByteRange range, LabelId label);

    // The scope's normalized boundary events in (offset, label) order.
    // Throws StorageError if a stored value is malformed.
    std::vector<BoundaryEvent> Events(ScopeId scope) const;

    // Every scope holding at least one mark, ascending
    std::vector<ScopeId> Scopes() const;

private:
    Tree marks_;
};

} // namespace Strata

#endif // STRATA_SRC_REGION_MARK_STORE_H_

#ifndef STRATA_SRC_REGION_COMPACTOR_H_
#define STRATA_SRC_REGION_COMPACTOR_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "common/worker_pool.h"
#include "mark_store.h"
#include "reference_index.h"
#include "types.h"

namespace Strata {

struct FinalizeReport {
    std::vector<ScopeId> finalized;
    std::vector<std::pair<ScopeId, std::string>> failed;
    uint64_t regions_written = 0;

    bool ok() const { return failed.empty(); }
};

/**
 * Turns a scope's raw marks into its published consolidation.
 *
 * A scope must not receive inserts while it is being finalized. Distinct
 * scopes share no mutable state, so FinalizeAll runs them on a worker pool.
 */
class Compactor {
public:
    Compactor(const MarkStore& marks, ReferenceIndex& references, RegionIndex& regions,
              size_t worker_threads);

    Compactor(const Compactor&) = delete;
    Compactor& operator=(const Compactor&) = delete;

    // Sweeps the scope and replaces any earlier publication of it. Returns the
    // number of regions written. Throws StorageError or InvariantViolation, in
    // which case the scope is left unfinalized with nothing published.
    uint64_t Finalize(ScopeId scope);

    // Finalizes every scope with marks
    FinalizeReport FinalizeAll();
    // Duplicates in scopes are finalized once; the report is in scope order
    FinalizeReport FinalizeAll(const std::vector<ScopeId>& scopes);

    // Lets queued finalizes finish. Later FinalizeAll calls report every scope
    // as failed; Finalize keeps working on the caller's thread.
    void Stop() { pool_.Stop(); }

private:
    // Removes the scope's regions and every reference fanned out from them
    void Unpublish(ScopeId scope);

    const MarkStore& marks_;
    ReferenceIndex& references_;
    RegionIndex& regions_;
    WorkerPool pool_;
};

} // namespace Strata

#endif // STRATA_SRC_REGION_COMPACTOR_H_

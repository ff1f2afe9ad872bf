#include "compactor.h"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"
#include "sweep.h"

namespace Strata {

Compactor::Compactor(const MarkStore& marks, ReferenceIndex& references, RegionIndex& regions,
                     size_t worker_threads)
    : marks_(marks), references_(references), regions_(regions), pool_(worker_threads, "compactor") {}

void Compactor::Unpublish(ScopeId scope) {
    for (const Region& old : regions_.EraseScope(scope)) {
        references_.Erase(old);
    }
}

uint64_t Compactor::Finalize(ScopeId scope) {
    regions_.ClearFinalized(scope);

    std::vector<Region> fresh;
    try {
        fresh = SweepAll(scope, marks_.Events(scope));
    } catch (const std::exception& e) {
        // An unfinalized scope serves nothing, not its last good partition
        VLOG(1) << "Withdrawing scope " << scope << " after failed sweep: " << e.what();
        Unpublish(scope);
        throw;
    }

    Unpublish(scope);
    for (const Region& entry : fresh) {
        references_.Write(entry);
        regions_.Write(entry);
    }

    regions_.MarkFinalized(scope, fresh.size());
    VLOG(1) << "Finalized scope " << scope << " into " << fresh.size() << " regions";
    return fresh.size();
}

FinalizeReport Compactor::FinalizeAll() {
    return FinalizeAll(marks_.Scopes());
}

FinalizeReport Compactor::FinalizeAll(const std::vector<ScopeId>& requested) {
    // A scope must never be finalized concurrently with itself
    std::vector<ScopeId> scopes(requested);
    std::sort(scopes.begin(), scopes.end());
    scopes.erase(std::unique(scopes.begin(), scopes.end()), scopes.end());

    std::vector<std::future<uint64_t>> pending =
        pool_.SubmitEach(scopes, [this](ScopeId scope) { return Finalize(scope); });

    FinalizeReport report;
    for (size_t i = 0; i < scopes.size(); ++i) {
        try {
            report.regions_written += pending[i].get();
            report.finalized.push_back(scopes[i]);
        } catch (const InvariantViolation& e) {
            LOG(ERROR) << "Finalize of scope " << scopes[i] << " rejected: " << e.what();
            report.failed.emplace_back(scopes[i], e.what());
        } catch (const StorageError& e) {
            LOG(ERROR) << "Finalize of scope " << scopes[i] << " failed: " << e.what();
            report.failed.emplace_back(scopes[i], e.what());
        } catch (const std::exception& e) {
            LOG(ERROR) << "Finalize of scope " << scopes[i] << " aborted: " << e.what();
            report.failed.emplace_back(scopes[i], e.what());
        }
    }

    LOG(INFO) << "Finalized " << report.finalized.size() << " of " << scopes.size()
              << " scopes (" << report.regions_written << " regions, "
              << report.failed.size() << " failed)";
    return report;
}

} // namespace Strata

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "store/ordered_store.h"
#include "types.h"

namespace Strata {

/**
 * Interns label names to dense sequential LabelIds starting at 0.
 * Both directions are persisted in the store, so ids survive a reopen of a
 * durable database. Thread safe.
 */
class LabelRegistry {
public:
    // Restores the id counter from the names tree. Throws StorageError.
    LabelRegistry(Tree ids, Tree names);

    // Existing id for name, or a freshly allocated one
    LabelId Intern(std::string_view name);

    std::optional<LabelId> Find(std::string_view name) const;
    std::optional<std::string> Name(LabelId id) const;

    size_t size() const;

private:
    Tree ids_;    // name -> id
    Tree names_;  // id -> name

    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, LabelId> cache_ ABSL_GUARDED_BY(mu_);
    LabelId next_id_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Strata

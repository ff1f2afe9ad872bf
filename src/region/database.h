#ifndef STRATA_SRC_REGION_DATABASE_H_
#define STRATA_SRC_REGION_DATABASE_H_

#include <cstdint>
#include <memory>

#include "compactor.h"
#include "label_registry.h"
#include "mark_store.h"
#include "reference_index.h"
#include "store/ordered_store.h"

namespace Strata {

class Configuration;

// Key byte reserved for each tree in the shared store
enum TreeId : uint8_t {
    kMarksTree = 0,
    kReferencesTree = 1,
    kRegionsTree = 2,
    kFinalizedTree = 3,
    kLabelIdsTree = 4,
    kLabelNamesTree = 5,
};

struct DatabaseOptions {
    StoreOptions store;
    size_t worker_threads = 4;
    size_t scan_batch = 256;

    static DatabaseOptions FromConfig(const Configuration& config);
};

/**
 * Owns the ordered store and wires every component over its trees.
 * Opening replays the store's log when a path is configured.
 */
class Database {
public:
    // Throws StorageError if the log cannot be opened or replayed
    explicit Database(DatabaseOptions options);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    MarkStore& marks() { return *marks_; }
    RegionIndex& regions() { return *regions_; }
    ReferenceIndex& references() { return *references_; }
    Compactor& compactor() { return *compactor_; }
    LabelRegistry& labels() { return *labels_; }

    void Sync() { store_.Sync(); }
    OrderedStore& store() { return store_; }

private:
    DatabaseOptions options_;
    OrderedStore store_;
    std::unique_ptr<MarkStore> marks_;
    std::unique_ptr<RegionIndex> regions_;
    std::unique_ptr<ReferenceIndex> references_;
    std::unique_ptr<LabelRegistry> labels_;
    std::unique_ptr<Compactor> compactor_;
};

} // namespace Strata

#endif // STRATA_SRC_REGION_DATABASE_H_

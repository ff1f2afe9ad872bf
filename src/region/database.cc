#include "database.h"

#include <utility>

#include <glog/logging.h>

#include "common/configuration.h"
#include "common/wire_formats.h"

namespace Strata {

DatabaseOptions DatabaseOptions::FromConfig(const Configuration& config) {
    const StrataConfig& c = config.config();
    DatabaseOptions options;
    options.store.path = c.store.path.get();
    options.store.num_shards = static_cast<size_t>(c.store.num_shards.get());
    options.store.sync_on_write = c.store.sync_on_write.get();
    options.worker_threads = static_cast<size_t>(c.compactor.worker_threads.get());
    options.scan_batch = static_cast<size_t>(c.compactor.scan_batch.get());
    return options;
}

Database::Database(DatabaseOptions options)
    : options_(std::move(options)), store_(options_.store) {
    // Shard prefixes: a scope's marks and regions, or a label's references,
    // always land in a single shard
    Tree marks = store_.OpenTree(kMarksTree, "marks", wire::kScopeSize, &MarkStore::ConcatMerge);
    Tree references = store_.OpenTree(kReferencesTree, "references", wire::kLabelSize);
    Tree regions = store_.OpenTree(kRegionsTree, "regions", wire::kScopeSize);
    Tree finalized = store_.OpenTree(kFinalizedTree, "finalized", wire::kScopeSize);
    Tree label_ids = store_.OpenTree(kLabelIdsTree, "label_ids", 0);
    Tree label_names = store_.OpenTree(kLabelNamesTree, "label_names", 0);

    store_.Recover();

    marks_ = std::make_unique<MarkStore>(marks);
    regions_ = std::make_unique<RegionIndex>(regions, finalized);
    references_ = std::make_unique<ReferenceIndex>(references, *regions_, options_.scan_batch);
    labels_ = std::make_unique<LabelRegistry>(label_ids, label_names);
    compactor_ = std::make_unique<Compactor>(*marks_, *references_, *regions_,
                                             options_.worker_threads);

    LOG(INFO) << "Opened database"
              << (options_.store.path.empty() ? " in memory" : " at " + options_.store.path)
              << " with " << store_.num_shards() << " shards, " << store_.Size() << " entries";
}

Database::~Database() {
    compactor_->Stop();
}

} // namespace Strata

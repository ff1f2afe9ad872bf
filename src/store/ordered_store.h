#ifndef STRATA_SRC_STORE_ORDERED_STORE_H_
#define STRATA_SRC_STORE_ORDERED_STORE_H_

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

namespace Strata {

class AppendLog;
class Tree;

using KeyValue = std::pair<std::string, std::string>;

/**
 * Combines an operand into the value already stored at a key.
 * existing is nullptr when the key is absent. Called with the shard lock
 * held, so it must not touch the store.
 */
using MergeOperator = std::function<std::string(std::string_view key,
                                                const std::string* existing,
                                                std::string_view operand)>;

struct StoreOptions {
    // Empty path keeps the store in memory only
    std::string path;
    size_t num_shards = 64;
    bool sync_on_write = false;
};

/**
 * Ordered byte-key map split into independently locked shards.
 *
 * Keys begin with a one-byte tree id. Each tree declares how many bytes after
 * the id select the shard, so all keys sharing that prefix (e.g. one scope)
 * live in one shard and scan without touching the others. Writers on
 * different shards never contend; Merge never needs a prior read by the
 * caller.
 */
class OrderedStore {
public:
    explicit OrderedStore(StoreOptions options);
    ~OrderedStore();

    OrderedStore(const OrderedStore&) = delete;
    OrderedStore& operator=(const OrderedStore&) = delete;

    // Registers a keyspace. Must be called for every tree before Recover and
    // before any access to it.
    Tree OpenTree(uint8_t id, const std::string& name, size_t shard_key_len,
                  MergeOperator merge = nullptr);

    // Opens the log (if durable) and replays it. Call once, after every tree
    // is opened and before concurrent use. Throws StorageError.
    void Recover();

    void Put(std::string_view key, std::string_view value);
    void Merge(std::string_view key, std::string_view operand);
    bool Delete(std::string_view key);
    std::optional<std::string> Get(std::string_view key) const;

    // Ascending entries with begin <= key < end; an empty end is unbounded.
    std::vector<KeyValue> Scan(std::string_view begin, std::string_view end,
                               size_t limit = std::numeric_limits<size_t>::max()) const;

    // Greatest entry with begin <= key < end
    std::optional<KeyValue> Last(std::string_view begin, std::string_view end) const;

    size_t Size() const;
    void Sync();

    bool durable() const { return log_ != nullptr; }
    size_t num_shards() const { return shards_.size(); }

private:
    struct Shard {
        mutable absl::Mutex mu;
        absl::btree_map<std::string, std::string> data ABSL_GUARDED_BY(mu);
    };

    struct TreeInfo {
        bool open = false;
        std::string name;
        size_t shard_key_len = 0;
        MergeOperator merge;
    };

    const TreeInfo& InfoFor(std::string_view key) const;
    size_t ShardFor(std::string_view key) const;
    // Shard owning every key in [begin, end), or -1 if the range spans shards
    int SingleShardFor(std::string_view begin, std::string_view end) const;

    void ApplyPut(std::string_view key, std::string_view value);
    void ApplyMerge(std::string_view key, std::string_view operand);
    bool ApplyDelete(std::string_view key);

    StoreOptions options_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::array<TreeInfo, 256> trees_;
    std::unique_ptr<AppendLog> log_;
    bool recovered_ = false;
};

/**
 * Named keyspace of an OrderedStore. Keys passed in and returned are relative
 * to the tree; the tree id byte is added and stripped here. Cheap to copy.
 */
class Tree {
public:
    Tree() = default;

    void Put(std::string_view key, std::string_view value) const;
    void Merge(std::string_view key, std::string_view operand) const;
    bool Delete(std::string_view key) const;
    std::optional<std::string> Get(std::string_view key) const;

    std::vector<KeyValue> Scan(std::string_view begin, std::string_view end,
                               size_t limit = std::numeric_limits<size_t>::max()) const;
    std::vector<KeyValue> ScanPrefix(std::string_view prefix,
                                     size_t limit = std::numeric_limits<size_t>::max()) const;

    // Greatest entry with begin <= key < end (end empty: to the end of the tree)
    std::optional<KeyValue> Last(std::string_view begin, std::string_view end) const;

    uint8_t id() const { return id_; }
    bool valid() const { return store_ != nullptr; }

    // Smallest key greater than every key starting with prefix; empty if none
    static std::string PrefixSuccessor(std::string_view prefix);

private:
    friend class OrderedStore;
    Tree(OrderedStore* store, uint8_t id) : store_(store), id_(id) {}

    std::string Full(std::string_view key) const;

    OrderedStore* store_ = nullptr;
    uint8_t id_ = 0;
};

} // namespace Strata

#endif // STRATA_SRC_STORE_ORDERED_STORE_H_

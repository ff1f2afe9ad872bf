#include "ordered_store.h"

#include <algorithm>
#include <iterator>

#include <glog/logging.h>
#include "absl/hash/hash.h"

#include "append_log.h"
#include "common/errors.h"

namespace Strata {

OrderedStore::OrderedStore(StoreOptions options)
    : options_(std::move(options)) {
    CHECK_GT(options_.num_shards, 0u) << "OrderedStore needs at least one shard";
    shards_.reserve(options_.num_shards);
    for (size_t i = 0; i < options_.num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    if (!options_.path.empty()) {
        log_ = std::make_unique<AppendLog>(options_.path, options_.sync_on_write);
    }
}

OrderedStore::~OrderedStore() = default;

Tree OrderedStore::OpenTree(uint8_t id, const std::string& name, size_t shard_key_len,
                            MergeOperator merge) {
    TreeInfo& info = trees_[id];
    if (info.open && info.name != name) {
        throw StorageError("Tree id " + std::to_string(id) + " already opened as " + info.name);
    }
    info.open = true;
    info.name = name;
    info.shard_key_len = shard_key_len;
    info.merge = std::move(merge);
    VLOG(2) << "Opened tree " << name << " (id " << static_cast<int>(id)
            << ", shard key " << shard_key_len << " bytes)";
    return Tree(this, id);
}

void OrderedStore::Recover() {
    if (recovered_) {
        return;
    }
    recovered_ = true;
    if (!log_) {
        return;
    }
    log_->Open();
    log_->Replay([this](LogOp op, std::string_view key, std::string_view value) {
        switch (op) {
            case LogOp::PUT:
                ApplyPut(key, value);
                break;
            case LogOp::MERGE:
                ApplyMerge(key, value);
                break;
            case LogOp::DELETE:
                ApplyDelete(key);
                break;
        }
    });
}

const OrderedStore::TreeInfo& OrderedStore::InfoFor(std::string_view key) const {
    if (key.empty()) {
        throw StorageError("Empty store key");
    }
    const TreeInfo& info = trees_[static_cast<uint8_t>(key[0])];
    if (!info.open) {
        throw StorageError("Key addresses unopened tree id " +
                           std::to_string(static_cast<uint8_t>(key[0])));
    }
    return info;
}

size_t OrderedStore::ShardFor(std::string_view key) const {
    const TreeInfo& info = InfoFor(key);
    const size_t len = std::min(key.size(), 1 + info.shard_key_len);
    return absl::Hash<std::string_view>{}(key.substr(0, len)) % shards_.size();
}

int OrderedStore::SingleShardFor(std::string_view begin, std::string_view end) const {
    if (begin.empty() || end.empty()) {
        return -1;
    }
    const TreeInfo& info = InfoFor(begin);
    const size_t n = 1 + info.shard_key_len;
    if (begin.size() < n) {
        return -1;
    }
    // Every key in [begin, end) shares begin's shard prefix iff end does not
    // pass the prefix's successor
    const std::string successor = Tree::PrefixSuccessor(begin.substr(0, n));
    if (successor.empty() || end > std::string_view(successor)) {
        return -1;
    }
    return static_cast<int>(ShardFor(begin));
}

void OrderedStore::ApplyPut(std::string_view key, std::string_view value) {
    Shard& shard = *shards_[ShardFor(key)];
    absl::MutexLock lock(&shard.mu);
    shard.data.insert_or_assign(std::string(key), std::string(value));
}

void OrderedStore::ApplyMerge(std::string_view key, std::string_view operand) {
    const TreeInfo& info = InfoFor(key);
    if (!info.merge) {
        throw StorageError("Merge on tree " + info.name + " which has no merge operator");
    }
    Shard& shard = *shards_[ShardFor(key)];
    absl::MutexLock lock(&shard.mu);
    auto it = shard.data.find(key);
    if (it == shard.data.end()) {
        shard.data.emplace(std::string(key), info.merge(key.substr(1), nullptr, operand));
    } else {
        it->second = info.merge(key.substr(1), &it->second, operand);
    }
}

bool OrderedStore::ApplyDelete(std::string_view key) {
    Shard& shard = *shards_[ShardFor(key)];
    absl::MutexLock lock(&shard.mu);
    auto it = shard.data.find(key);
    if (it == shard.data.end()) {
        return false;
    }
    shard.data.erase(it);
    return true;
}

void OrderedStore::Put(std::string_view key, std::string_view value) {
    InfoFor(key);
    if (log_) {
        log_->Append(LogOp::PUT, key, value);
    }
    ApplyPut(key, value);
}

void OrderedStore::Merge(std::string_view key, std::string_view operand) {
    const TreeInfo& info = InfoFor(key);
    if (!info.merge) {
        throw StorageError("Merge on tree " + info.name + " which has no merge operator");
    }
    if (log_) {
        log_->Append(LogOp::MERGE, key, operand);
    }
    ApplyMerge(key, operand);
}

bool OrderedStore::Delete(std::string_view key) {
    InfoFor(key);
    if (log_) {
        log_->Append(LogOp::DELETE, key, {});
    }
    return ApplyDelete(key);
}

std::optional<std::string> OrderedStore::Get(std::string_view key) const {
    const Shard& shard = *shards_[ShardFor(key)];
    absl::ReaderMutexLock lock(&shard.mu);
    auto it = shard.data.find(key);
    if (it == shard.data.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<KeyValue> OrderedStore::Scan(std::string_view begin, std::string_view end,
                                         size_t limit) const {
    std::vector<KeyValue> out;
    if (limit == 0 || (!end.empty() && end <= begin)) {
        return out;
    }

    auto collect = [&](const Shard& shard, std::vector<KeyValue>& into) {
        absl::ReaderMutexLock lock(&shard.mu);
        for (auto it = shard.data.lower_bound(begin); it != shard.data.end(); ++it) {
            if (!end.empty() && std::string_view(it->first) >= end) break;
            if (into.size() >= limit) break;
            into.emplace_back(it->first, it->second);
        }
    };

    const int single = SingleShardFor(begin, end);
    if (single >= 0) {
        collect(*shards_[static_cast<size_t>(single)], out);
        return out;
    }

    // Range spans shards. Each shard contributes its own first `limit` keys;
    // any of them may belong to the global first `limit`. Keys are unique
    // across shards since every key hashes to exactly one.
    std::vector<KeyValue> part;
    for (const auto& shard : shards_) {
        part.clear();
        collect(*shard, part);
        const size_t mid = out.size();
        out.insert(out.end(), std::make_move_iterator(part.begin()),
                   std::make_move_iterator(part.end()));
        std::inplace_merge(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(mid), out.end(),
                           [](const KeyValue& a, const KeyValue& b) { return a.first < b.first; });
        if (out.size() > limit) {
            out.resize(limit);
        }
    }
    return out;
}

std::optional<KeyValue> OrderedStore::Last(std::string_view begin, std::string_view end) const {
    std::optional<KeyValue> best;

    auto check_shard = [&](const Shard& shard) {
        absl::ReaderMutexLock lock(&shard.mu);
        auto it = end.empty() ? shard.data.end() : shard.data.lower_bound(end);
        if (it == shard.data.begin()) return;
        --it;
        if (std::string_view(it->first) < begin) return;
        if (!best || it->first > best->first) {
            best = KeyValue(it->first, it->second);
        }
    };

    const int single = SingleShardFor(begin, end);
    if (single >= 0) {
        check_shard(*shards_[static_cast<size_t>(single)]);
    } else {
        for (const auto& shard : shards_) {
            check_shard(*shard);
        }
    }
    return best;
}

size_t OrderedStore::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        absl::ReaderMutexLock lock(&shard->mu);
        total += shard->data.size();
    }
    return total;
}

void OrderedStore::Sync() {
    if (log_) {
        log_->Sync();
    }
}

// ---------------------------------------------------------------------------
// Tree
// ---------------------------------------------------------------------------

std::string Tree::PrefixSuccessor(std::string_view prefix) {
    std::string out(prefix);
    while (!out.empty()) {
        unsigned char last = static_cast<unsigned char>(out.back());
        if (last != 0xff) {
            out.back() = static_cast<char>(last + 1);
            return out;
        }
        out.pop_back();
    }
    return out;
}

std::string Tree::Full(std::string_view key) const {
    if (!store_) {
        throw StorageError("Use of an unopened tree");
    }
    std::string full;
    full.reserve(1 + key.size());
    full.push_back(static_cast<char>(id_));
    full.append(key.data(), key.size());
    return full;
}

void Tree::Put(std::string_view key, std::string_view value) const {
    store_->Put(Full(key), value);
}

void Tree::Merge(std::string_view key, std::string_view operand) const {
    store_->Merge(Full(key), operand);
}

bool Tree::Delete(std::string_view key) const {
    return store_->Delete(Full(key));
}

std::optional<std::string> Tree::Get(std::string_view key) const {
    return store_->Get(Full(key));
}

std::vector<KeyValue> Tree::Scan(std::string_view begin, std::string_view end, size_t limit) const {
    const std::string full_begin = Full(begin);
    // An empty end means "to the end of this tree"
    const std::string full_end = end.empty() ? PrefixSuccessor(full_begin.substr(0, 1)) : Full(end);
    std::vector<KeyValue> entries = store_->Scan(full_begin, full_end, limit);
    for (auto& entry : entries) {
        entry.first.erase(0, 1);
    }
    return entries;
}

std::optional<KeyValue> Tree::Last(std::string_view begin, std::string_view end) const {
    const std::string full_begin = Full(begin);
    const std::string full_end = end.empty() ? PrefixSuccessor(full_begin.substr(0, 1)) : Full(end);
    auto entry = store_->Last(full_begin, full_end);
    if (entry) {
        entry->first.erase(0, 1);
    }
    return entry;
}

std::vector<KeyValue> Tree::ScanPrefix(std::string_view prefix, size_t limit) const {
    return Scan(prefix, PrefixSuccessor(prefix), limit);
}

} // namespace Strata

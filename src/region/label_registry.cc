#include "label_registry.h"

#include <glog/logging.h>

#include "common/errors.h"
#include "common/wire_formats.h"

namespace Strata {

LabelRegistry::LabelRegistry(Tree ids, Tree names) : ids_(ids), names_(names) {
    auto last = names_.Last("", "");
    if (last) {
        if (last->first.size() != wire::kLabelSize) {
            throw StorageError("Malformed label name key of " +
                               std::to_string(last->first.size()) + " bytes");
        }
        absl::MutexLock lock(&mu_);
        next_id_ = wire::LoadU32(last->first.data()) + 1;
        VLOG(1) << "Label registry restored with " << next_id_ << " labels";
    }
}

LabelId LabelRegistry::Intern(std::string_view name) {
    absl::MutexLock lock(&mu_);
    auto it = cache_.find(name);
    if (it != cache_.end()) {
        return it->second;
    }

    LabelId id;
    auto stored = ids_.Get(name);
    if (stored) {
        if (stored->size() != wire::kLabelSize) {
            throw StorageError("Malformed label id for '" + std::string(name) + "'");
        }
        id = wire::LoadU32(stored->data());
    } else {
        id = next_id_;
        // Reverse mapping first: the constructor derives the next id from it
        names_.Put(wire::EncodeLabelPrefix(id), name);
        ids_.Put(name, wire::EncodeLabelPrefix(id));
        ++next_id_;
    }
    cache_.emplace(std::string(name), id);
    return id;
}

std::optional<LabelId> LabelRegistry::Find(std::string_view name) const {
    {
        absl::ReaderMutexLock lock(&mu_);
        auto it = cache_.find(name);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    auto stored = ids_.Get(name);
    if (!stored || stored->size() != wire::kLabelSize) {
        return std::nullopt;
    }
    return wire::LoadU32(stored->data());
}

std::optional<std::string> LabelRegistry::Name(LabelId id) const {
    return names_.Get(wire::EncodeLabelPrefix(id));
}

size_t LabelRegistry::size() const {
    absl::ReaderMutexLock lock(&mu_);
    return next_id_;
}

} // namespace Strata

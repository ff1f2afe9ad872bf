#ifndef STRATA_SRC_COMMON_ERRORS_H_
#define STRATA_SRC_COMMON_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Strata {

// I/O failure, malformed stored bytes, or misuse of the store (e.g. merge on a
// tree with no merge operator). Never retried internally.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A scope's boundary event stream is malformed: a label closed more often
 * than it opened, or labels were still active when the stream ran out.
 * Indicates a producer bug or a scope finalized with interleaved inserts.
 */
class InvariantViolation : public std::runtime_error {
public:
    InvariantViolation(uint64_t scope, uint32_t offset, const std::string& what)
        : std::runtime_error("scope " + std::to_string(scope) + " offset " +
                             std::to_string(offset) + ": " + what),
          scope_(scope),
          offset_(offset) {}

    uint64_t scope() const { return scope_; }
    uint32_t offset() const { return offset_; }

private:
    uint64_t scope_;
    uint32_t offset_;
};

// Scoped query against a scope whose consolidation was never published.
class ScopeNotFinalized : public std::runtime_error {
public:
    explicit ScopeNotFinalized(uint64_t scope)
        : std::runtime_error("scope " + std::to_string(scope) + " is not finalized"),
          scope_(scope) {}

    uint64_t scope() const { return scope_; }

private:
    uint64_t scope_;
};

} // namespace Strata

#endif // STRATA_SRC_COMMON_ERRORS_H_

#pragma once

#include <optional>

#include "domain/Snapshot.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::app {

struct SnapshotLoadResult {
    bool                                        ok{false};
    et::mirror::domain::Error                   error;
    std::optional<et::mirror::domain::Snapshot> snapshot; // empty when nothing is stored
};

// Port/interface for the single-snapshot TTL cache.
// Implementations live in infra (e.g. JSON file).
//
// Validity and loading are separate on purpose: callers pick the policy
// (serve only fresh, or serve stale while rebuilding).
class ISnapshotCache {
public:
    virtual ~ISnapshotCache() = default;

    virtual bool isValid() const = 0;
    virtual SnapshotLoadResult load() const = 0;
    virtual et::mirror::domain::OpResult save(const et::mirror::domain::Snapshot& snapshot) = 0;
    virtual et::mirror::domain::OpResult invalidate() = 0;
};

} // namespace et::mirror::app

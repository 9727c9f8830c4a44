#pragma once

#include <optional>
#include <string>

#include "app/ISnapshotCache.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::infra {

// Single-snapshot cache stored as one JSON file.
//
// Writes go through QSaveFile (temp file + rename), so a reader sees either
// the previous snapshot or the new one, never a torn file. There is no
// in-process locking: concurrent writers are serialized by the rename alone.
//
// Expiry uses the timestamp stored in the document; files without a readable
// timestamp fall back to the file modification time.
class SnapshotCache : public et::mirror::app::ISnapshotCache {
public:
    explicit SnapshotCache(et::mirror::domain::CacheSettings settings,
                           et::mirror::domain::NowFn now = {});

    bool isValid() const override;
    et::mirror::app::SnapshotLoadResult load() const override;
    et::mirror::domain::OpResult save(const et::mirror::domain::Snapshot& snapshot) override;
    et::mirror::domain::OpResult invalidate() override;

    // When the stored snapshot was written, if there is one.
    std::optional<et::mirror::domain::TimePoint> writtenAt() const;

private:
    bool ensureCacheDir() const;

    et::mirror::domain::CacheSettings settings_;
    et::mirror::domain::NowFn         now_;
};

} // namespace et::mirror::infra

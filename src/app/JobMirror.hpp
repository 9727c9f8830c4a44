#pragma once

#include <string>
#include <vector>

#include "app/IHistoryRepository.hpp"
#include "app/ISchedulerClient.hpp"
#include "domain/GraphLayout.hpp"
#include "domain/Snapshot.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::app {

class ISnapshotCache;

struct MirrorSettings {
    std::string                        jobDirectory{"your-job-directory"};
    et::mirror::domain::LayoutSettings layout;
};

struct SnapshotResult {
    bool                               ok{false};
    et::mirror::domain::Error          error;
    et::mirror::domain::Snapshot       snapshot;
    et::mirror::domain::SnapshotSource source{et::mirror::domain::SnapshotSource::Fresh};
    std::vector<std::string>           implicitNodes;
};

struct RefreshResult {
    bool                         ok{false};
    et::mirror::domain::Error    error;
    et::mirror::domain::Snapshot snapshot;
    std::vector<std::string>     implicitNodes;

    int                      recorded{0};   // history entries written
    std::vector<std::string> skippedJobs;   // names whose status lookup failed
};

// Serves the job graph from the snapshot cache while it is valid and rebuilds
// it from the scheduler otherwise. Every rebuild records one history entry
// per job whose status could be fetched.
//
// Rebuild order: job list, graph, cache write, history append. A failure at
// any step stops the rebuild and keeps the kind of the failing step.
class JobMirror {
public:
    JobMirror(ISchedulerClient& client,
              ISnapshotCache& cache,
              IHistoryRepository& history,
              MirrorSettings settings,
              et::mirror::domain::NowFn now = {});

    SnapshotResult getSnapshot();

    // Drops the cached snapshot and rebuilds unconditionally.
    RefreshResult refresh();

    et::mirror::domain::LayoutResult layout(const et::mirror::domain::JobGraph& graph) const;

    HistoryQueryResult historyFor(const std::string& jobNameOrId, int limit) const;
    HistoryQueryResult recentHistory(int limit) const;
    JobNamesResult historyJobNames() const;

    bool isCacheValid() const;

    TextResult fetchOutput(const et::mirror::domain::JobId& jobId);
    TextResult fetchLog(const et::mirror::domain::JobId& jobId, const std::string& logType);

private:
    RefreshResult rebuild();
    void recordStatuses(RefreshResult& res);

    ISchedulerClient&             client_;
    ISnapshotCache&               cache_;
    IHistoryRepository&           history_;
    MirrorSettings                settings_;
    et::mirror::domain::NowFn     now_;
};

} // namespace et::mirror::app

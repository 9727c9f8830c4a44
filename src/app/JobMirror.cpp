#include "app/JobMirror.hpp"

#include <QDebug>
#include <QString>
#include <QStringList>

#include "app/DependencyGraphBuilder.hpp"
#include "app/ISnapshotCache.hpp"
#include "domain/JobGraph.hpp"

namespace et::mirror::app {

using namespace et::mirror::domain;

namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

JobMirror::JobMirror(ISchedulerClient& client,
                     ISnapshotCache& cache,
                     IHistoryRepository& history,
                     MirrorSettings settings,
                     NowFn now)
    : client_(client)
    , cache_(cache)
    , history_(history)
    , settings_(std::move(settings))
    , now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

SnapshotResult JobMirror::getSnapshot() {
    SnapshotResult res;

    if (cache_.isValid()) {
        auto loaded = cache_.load();
        if (loaded.ok && loaded.snapshot) {
            res.snapshot      = std::move(*loaded.snapshot);
            res.implicitNodes = findImplicitNodes(res.snapshot.graph, res.snapshot.jobs);
            res.source        = SnapshotSource::Cache;
            res.ok            = true;
            qInfo() << "Serving job graph from cache:" << res.snapshot.jobs.size() << "jobs";
            return res;
        }
        if (!loaded.ok) {
            qWarning() << "Cached snapshot unreadable, rebuilding:" << qs(to_string(loaded.error));
        }
    }

    auto rebuilt = rebuild();
    res.ok            = rebuilt.ok;
    res.error         = std::move(rebuilt.error);
    res.snapshot      = std::move(rebuilt.snapshot);
    res.implicitNodes = std::move(rebuilt.implicitNodes);
    res.source        = SnapshotSource::Fresh;
    return res;
}

RefreshResult JobMirror::refresh() {
    const auto dropped = cache_.invalidate();
    if (!dropped.ok) {
        RefreshResult res;
        res.error = dropped.error;
        return res;
    }

    qInfo() << "Refreshing job graph for directory" << qs(settings_.jobDirectory);
    return rebuild();
}

RefreshResult JobMirror::rebuild() {
    RefreshResult res;

    auto listed = client_.listJobs(settings_.jobDirectory);
    if (!listed.ok) {
        res.error = std::move(listed.error);
        qWarning() << "Job list fetch failed:" << qs(to_string(res.error));
        return res;
    }

    DependencyGraphBuilder builder(client_);
    auto built = builder.build(listed.jobs);
    if (!built.ok) {
        res.error = std::move(built.error);
        qWarning() << "Dependency graph build failed:" << qs(to_string(res.error));
        return res;
    }

    res.snapshot.jobs      = std::move(listed.jobs);
    res.snapshot.graph     = std::move(built.graph);
    res.snapshot.createdAt = now_();
    res.implicitNodes      = std::move(built.implicitNodes);

    const auto saved = cache_.save(res.snapshot);
    if (!saved.ok) {
        res.error = saved.error;
        qWarning() << "Snapshot cache write failed:" << qs(to_string(res.error));
        return res;
    }

    qInfo() << "Job graph rebuilt:" << res.snapshot.jobs.size() << "jobs,"
            << res.snapshot.graph.edgeCount() << "dependencies";

    recordStatuses(res);
    return res;
}

void JobMirror::recordStatuses(RefreshResult& res) {
    std::vector<HistoryEntry> entries;
    entries.reserve(res.snapshot.jobs.size());

    const auto observedAt = now_();
    for (const auto& job : res.snapshot.jobs) {
        const auto st = client_.getStatus(job.id);
        if (!st.ok) {
            qWarning() << "Skipping status for job" << qs(job.name) << ":" << qs(to_string(st.error));
            res.skippedJobs.push_back(job.name);
            continue;
        }

        HistoryEntry e;
        e.timestamp = observedAt;
        e.jobId     = job.id;
        e.jobName   = job.name;
        e.status    = st.status;
        entries.push_back(std::move(e));
    }

    const auto appended = history_.appendBatch(entries);
    if (!appended.ok) {
        res.error = appended.error;
        qWarning() << "History append failed:" << qs(to_string(res.error));
        return;
    }

    res.recorded = static_cast<int>(entries.size());
    res.ok = true;

    if (!res.skippedJobs.empty()) {
        QStringList names;
        for (const auto& n : res.skippedJobs) {
            names << qs(n);
        }
        qWarning() << "No status recorded for:" << names.join(", ");
    }
    qInfo() << "History recorded:" << res.recorded << "entries";
}

LayoutResult JobMirror::layout(const JobGraph& graph) const {
    auto res = computeHierarchicalLayout(graph, settings_.layout);
    if (!res.ok) {
        qWarning() << "Layout failed:" << qs(to_string(res.error));
    }
    return res;
}

HistoryQueryResult JobMirror::historyFor(const std::string& jobNameOrId, int limit) const {
    return history_.queryByJob(jobNameOrId, limit);
}

HistoryQueryResult JobMirror::recentHistory(int limit) const {
    return history_.queryAll(limit);
}

JobNamesResult JobMirror::historyJobNames() const {
    return history_.jobNames();
}

bool JobMirror::isCacheValid() const {
    return cache_.isValid();
}

TextResult JobMirror::fetchOutput(const JobId& jobId) {
    return client_.getOutput(jobId);
}

TextResult JobMirror::fetchLog(const JobId& jobId, const std::string& logType) {
    return client_.getLog(jobId, logType);
}

} // namespace et::mirror::app

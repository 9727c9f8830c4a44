#include "cli/ReportFormatter.hpp"
#include "cli/Formatters.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>
#include <QTextStream>

#include "infra/JsonCodec.hpp"

namespace et::mirror::cli {

using et::mirror::domain::HistoryEntry;
using et::mirror::domain::JobGraph;
using et::mirror::domain::LayoutResult;
using et::mirror::domain::TimePoint;

namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

QJsonArray toJsonArray(const std::vector<std::string>& items) {
    QJsonArray arr;
    for (const auto& s : items) {
        arr.append(qs(s));
    }
    return arr;
}

QString joinNames(const std::vector<std::string>& items) {
    QStringList parts;
    for (const auto& s : items) {
        parts << qs(s);
    }
    return parts.join(QStringLiteral(", "));
}

} // namespace

QJsonDocument ReportFormatter::snapshotJson(const et::mirror::app::SnapshotResult& res,
                                            bool cacheValid,
                                            TimePoint now) {
    const auto& snap = res.snapshot;

    QJsonArray jobs;
    for (const auto& job : snap.jobs) {
        jobs.append(et::mirror::infra::json::jobToJson(job));
    }

    QJsonArray deps;
    for (const auto& e : snap.graph.edges()) {
        QJsonObject o;
        o.insert(QStringLiteral("source"), qs(e.source));
        o.insert(QStringLiteral("target"), qs(e.target));
        deps.append(o);
    }

    QJsonObject root;
    root.insert(QStringLiteral("jobs"), jobs);
    root.insert(QStringLiteral("dependencies"), deps);
    root.insert(QStringLiteral("data_source"), qs(et::mirror::domain::to_string(res.source)));
    root.insert(QStringLiteral("job_count"), static_cast<int>(snap.jobs.size()));
    root.insert(QStringLiteral("edge_count"), static_cast<int>(snap.graph.edgeCount()));
    root.insert(QStringLiteral("implicit_nodes"), toJsonArray(res.implicitNodes));
    root.insert(QStringLiteral("cache_valid"), cacheValid);
    root.insert(QStringLiteral("timestamp"), et::mirror::infra::json::toIsoUtc(now));
    return QJsonDocument(root);
}

QString ReportFormatter::snapshotText(const et::mirror::app::SnapshotResult& res, bool cacheValid) {
    const auto& snap = res.snapshot;

    QString outStr;
    QTextStream out(&outStr);

    out << "Data source: " << qs(et::mirror::domain::to_string(res.source)) << "\n";
    out << "Cache valid: " << (cacheValid ? "yes" : "no") << "\n";
    out << "Snapshot taken: " << fmt::formatLocalTime(snap.createdAt) << "\n";
    out << "Jobs: " << snap.jobs.size() << ", dependencies: " << snap.graph.edgeCount() << "\n";
    if (!res.implicitNodes.empty()) {
        out << "Implicit nodes (no job record): " << joinNames(res.implicitNodes) << "\n";
    }
    out << "\n";

    for (const auto& job : snap.jobs) {
        out << qs(job.name) << " [" << fmt::formatJobStatus(job.status) << "]"
            << "  start: " << fmt::formatStartTime(job)
            << "  end: " << fmt::formatEndTime(job)
            << "  dependencies: " << snap.graph.predecessors(job.name).size()
            << "  triggers: " << snap.graph.successors(job.name).size() << "\n";
    }
    return outStr;
}

QJsonDocument ReportFormatter::refreshJson(const et::mirror::app::RefreshResult& res, TimePoint now) {
    QJsonObject root;
    root.insert(QStringLiteral("success"), res.ok);
    if (res.ok) {
        root.insert(QStringLiteral("message"), QStringLiteral("Data refreshed successfully"));
    } else {
        root.insert(QStringLiteral("message"), qs(et::mirror::domain::to_string(res.error)));
    }
    root.insert(QStringLiteral("job_count"), static_cast<int>(res.snapshot.jobs.size()));
    root.insert(QStringLiteral("recorded"), res.recorded);
    root.insert(QStringLiteral("skipped"), toJsonArray(res.skippedJobs));
    root.insert(QStringLiteral("timestamp"), et::mirror::infra::json::toIsoUtc(now));
    return QJsonDocument(root);
}

QString ReportFormatter::refreshText(const et::mirror::app::RefreshResult& res) {
    QString outStr;
    QTextStream out(&outStr);

    out << "Refreshed " << res.snapshot.jobs.size() << " jobs, "
        << res.snapshot.graph.edgeCount() << " dependencies\n";
    out << "History entries recorded: " << res.recorded << "\n";
    if (!res.skippedJobs.empty()) {
        out << "Status unavailable for: " << joinNames(res.skippedJobs) << "\n";
    }
    return outStr;
}

QJsonDocument ReportFormatter::layoutJson(const JobGraph& graph, const LayoutResult& layout) {
    QJsonArray nodes;
    for (const auto& name : graph.nodes()) {
        const auto lvl = layout.levels.find(name);
        const auto pos = layout.positions.find(name);
        if (lvl == layout.levels.end() || pos == layout.positions.end()) {
            continue;
        }

        QJsonObject o;
        o.insert(QStringLiteral("name"), qs(name));
        o.insert(QStringLiteral("level"), lvl->second);
        o.insert(QStringLiteral("x"), pos->second.x);
        o.insert(QStringLiteral("y"), pos->second.y);
        nodes.append(o);
    }

    QJsonObject root;
    root.insert(QStringLiteral("nodes"), nodes);
    return QJsonDocument(root);
}

QString ReportFormatter::layoutText(const LayoutResult& layout) {
    QString outStr;
    QTextStream out(&outStr);

    for (std::size_t level = 0; level < layout.layers.size(); ++level) {
        out << "Level " << level << ":\n";
        for (const auto& name : layout.layers[level]) {
            const auto& p = layout.positions.at(name);
            out << "  " << qs(name) << " (" << p.x << ", " << p.y << ")\n";
        }
    }
    return outStr;
}

QJsonDocument ReportFormatter::historyJson(const std::optional<std::string>& jobName,
                                           const std::vector<HistoryEntry>& entries) {
    QJsonArray arr;
    for (const auto& e : entries) {
        arr.append(et::mirror::infra::json::historyEntryToJson(e));
    }

    QJsonObject root;
    if (jobName) {
        root.insert(QStringLiteral("job_name"), qs(*jobName));
    }
    root.insert(QStringLiteral("history"), arr);
    return QJsonDocument(root);
}

QString ReportFormatter::historyText(const std::optional<std::string>& jobName,
                                     const std::vector<HistoryEntry>& entries) {
    QString outStr;
    QTextStream out(&outStr);

    if (entries.empty()) {
        out << "No history recorded"
            << (jobName ? QStringLiteral(" for ") + qs(*jobName) : QString()) << "\n";
        return outStr;
    }

    for (const auto& e : entries) {
        out << et::mirror::infra::json::toIsoUtc(e.timestamp) << ": ";
        if (!jobName) {
            out << qs(e.jobName) << " - ";
        }
        out << fmt::formatJobStatus(e.status) << "\n";
    }
    return outStr;
}

QJsonDocument ReportFormatter::jobNamesJson(const std::vector<std::string>& names) {
    QJsonObject root;
    root.insert(QStringLiteral("jobs"), toJsonArray(names));
    return QJsonDocument(root);
}

QString ReportFormatter::jobNamesText(const std::vector<std::string>& names) {
    QString outStr;
    QTextStream out(&outStr);
    for (const auto& n : names) {
        out << qs(n) << "\n";
    }
    return outStr;
}

QString ReportFormatter::outputFileName(const std::string& jobId, const std::optional<std::string>& logType) {
    const QString suffix = logType ? qs(*logType) : QStringLiteral("output");
    return qs(jobId) + QLatin1Char('_') + suffix + QStringLiteral(".txt");
}

} // namespace et::mirror::cli

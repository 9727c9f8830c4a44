#pragma once

#include <QJsonDocument>
#include <QString>
#include <optional>
#include <string>
#include <vector>

#include "app/JobMirror.hpp"
#include "domain/GraphLayout.hpp"
#include "domain/JobGraph.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::cli {

// Renders mirror results for the terminal, either as plain text or as JSON
// documents shaped like the dashboard web API.
class ReportFormatter final {
public:
    // {jobs, dependencies, data_source, job_count, edge_count, implicit_nodes, cache_valid, timestamp}
    static QJsonDocument snapshotJson(const et::mirror::app::SnapshotResult& res,
                                      bool cacheValid,
                                      et::mirror::domain::TimePoint now);
    static QString snapshotText(const et::mirror::app::SnapshotResult& res, bool cacheValid);

    // {success, message, job_count, recorded, skipped, timestamp}
    static QJsonDocument refreshJson(const et::mirror::app::RefreshResult& res,
                                     et::mirror::domain::TimePoint now);
    static QString refreshText(const et::mirror::app::RefreshResult& res);

    // {nodes: [{name, level, x, y}]} in graph node order.
    static QJsonDocument layoutJson(const et::mirror::domain::JobGraph& graph,
                                    const et::mirror::domain::LayoutResult& layout);
    static QString layoutText(const et::mirror::domain::LayoutResult& layout);

    // {job_name?, history}. Entries are expected oldest first.
    static QJsonDocument historyJson(const std::optional<std::string>& jobName,
                                     const std::vector<et::mirror::domain::HistoryEntry>& entries);
    static QString historyText(const std::optional<std::string>& jobName,
                               const std::vector<et::mirror::domain::HistoryEntry>& entries);

    static QJsonDocument jobNamesJson(const std::vector<std::string>& names);
    static QString jobNamesText(const std::vector<std::string>& names);

    // "<id>_output.txt", or "<id>_<logType>.txt" for a named log.
    static QString outputFileName(const std::string& jobId, const std::optional<std::string>& logType);

private:
    ReportFormatter() = delete;
};

} // namespace et::mirror::cli

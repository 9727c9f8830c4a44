#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "app/ISchedulerClient.hpp"
#include "domain/JobGraph.hpp"
#include "domain/Snapshot.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::infra::json {

// --- Time -------------------------------------------------------------------

// UTC, millisecond precision, e.g. "2026-01-01T12:00:00.000Z".
QString toIsoUtc(et::mirror::domain::TimePoint tp);

// Lenient ISO-8601 parsing. Returns nullopt for anything Qt cannot read.
std::optional<et::mirror::domain::TimePoint> parseIsoTimestamp(const QString& text);

// --- Scheduler payloads -----------------------------------------------------

// Accepts a JSON array of jobs or an object holding a "jobs" array.
et::mirror::app::JobListResult parseJobList(const QByteArray& payload);

// Array of {"triggered_job_name": "..."}.
et::mirror::app::TriggerListResult parseTriggerList(const QByteArray& payload);

// Object with an optional "status" key; a missing key reads as unknown.
et::mirror::app::StatusResult parseStatus(const QByteArray& payload);

// Object with an optional "output" key; any other JSON value is kept as text.
et::mirror::app::TextResult parseOutput(const QByteArray& payload);

// --- Records ----------------------------------------------------------------

QJsonObject jobToJson(const et::mirror::domain::Job& job);

// Fails when "id" or "name" is missing; unknown status text maps to unknown.
bool jobFromJson(const QJsonObject& o, et::mirror::domain::Job& out, QString* errorOut);

QJsonObject historyEntryToJson(const et::mirror::domain::HistoryEntry& entry);

// --- Graph (node-link form) -------------------------------------------------

QJsonObject graphToNodeLink(const et::mirror::domain::JobGraph& graph);

// Reads "links" or "edges" for the edge list.
bool graphFromNodeLink(const QJsonObject& o, et::mirror::domain::JobGraph& out, QString* errorOut);

// --- Snapshot document ------------------------------------------------------

struct SnapshotParseResult {
    bool                          ok{false};
    QString                       error;
    et::mirror::domain::Snapshot  snapshot;
    bool                          hasTimestamp{false}; // false -> createdAt was not in the document
};

QJsonDocument snapshotToJson(const et::mirror::domain::Snapshot& snapshot);
SnapshotParseResult snapshotFromJson(const QByteArray& bytes);

} // namespace et::mirror::infra::json

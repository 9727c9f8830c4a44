#include "infra/JsonCodec.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonParseError>
#include <QJsonValue>
#include <QTimeZone>
#include <chrono>
#include <cmath>

namespace et::mirror::infra::json {

using et::mirror::domain::ErrorKind;
using et::mirror::domain::HistoryEntry;
using et::mirror::domain::Job;
using et::mirror::domain::JobGraph;
using et::mirror::domain::Snapshot;
using et::mirror::domain::TimePoint;

namespace {

// 2^63 as a double; every integral value below it fits in qint64.
constexpr double kMaxExactInt64 = 9223372036854775808.0;

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// Scheduler ids and names arrive as strings or numbers depending on the endpoint.
std::optional<std::string> textValue(const QJsonValue& v) {
    if (v.isString()) {
        return v.toString().toStdString();
    }
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (std::floor(d) == d) {
            // Beyond qint64 the cast is undefined; print the integral double instead.
            if (std::fabs(d) < kMaxExactInt64) {
                return QString::number(static_cast<qint64>(d)).toStdString();
            }
            return QString::number(d, 'f', 0).toStdString();
        }
        return QString::number(d).toStdString();
    }
    return std::nullopt;
}

QJsonValue optionalText(const std::optional<std::string>& s) {
    if (!s) {
        return QJsonValue(QJsonValue::Null);
    }
    return QString::fromStdString(*s);
}

bool parseDocument(const QByteArray& payload, QJsonDocument& doc, std::string& error) {
    QJsonParseError err{};
    doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        error = "invalid JSON: " + err.errorString().toStdString();
        return false;
    }
    return true;
}

} // namespace

QString toIsoUtc(TimePoint tp) {
    return QDateTime::fromMSecsSinceEpoch(toUnixMs(tp), QTimeZone::utc()).toString(Qt::ISODateWithMs);
}

std::optional<TimePoint> parseIsoTimestamp(const QString& text) {
    const QString t = text.trimmed();
    if (t.isEmpty()) {
        return std::nullopt;
    }

    QDateTime dt = QDateTime::fromString(t, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(t, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return fromUnixMs(dt.toMSecsSinceEpoch());
}

et::mirror::app::JobListResult parseJobList(const QByteArray& payload) {
    et::mirror::app::JobListResult res;

    QJsonDocument doc;
    std::string parseError;
    if (!parseDocument(payload, doc, parseError)) {
        res.error = domain::makeError(ErrorKind::MalformedResponse, parseError);
        return res;
    }

    QJsonArray arr;
    if (doc.isArray()) {
        arr = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("jobs")).isArray()) {
        arr = doc.object().value(QStringLiteral("jobs")).toArray();
    } else {
        res.error = domain::makeError(ErrorKind::MalformedResponse, "Unexpected API response format");
        return res;
    }

    res.jobs.reserve(static_cast<std::size_t>(arr.size()));
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const auto v = arr.at(i);
        if (!v.isObject()) {
            res.jobs.clear();
            res.error = domain::makeError(ErrorKind::MalformedResponse,
                                          "job entry " + std::to_string(i) + " is not an object");
            return res;
        }

        Job job;
        QString err;
        if (!jobFromJson(v.toObject(), job, &err)) {
            res.jobs.clear();
            res.error = domain::makeError(ErrorKind::MalformedResponse,
                                          "job entry " + std::to_string(i) + ": " + err.toStdString());
            return res;
        }
        res.jobs.push_back(std::move(job));
    }

    res.ok = true;
    return res;
}

et::mirror::app::TriggerListResult parseTriggerList(const QByteArray& payload) {
    et::mirror::app::TriggerListResult res;

    QJsonDocument doc;
    std::string parseError;
    if (!parseDocument(payload, doc, parseError)) {
        res.error = domain::makeError(ErrorKind::MalformedResponse, parseError);
        return res;
    }
    if (!doc.isArray()) {
        res.error = domain::makeError(ErrorKind::MalformedResponse, "trigger list is not an array");
        return res;
    }

    const auto arr = doc.array();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const auto name = textValue(arr.at(i).toObject().value(QStringLiteral("triggered_job_name")));
        if (!name || name->empty()) {
            res.triggers.clear();
            res.error = domain::makeError(ErrorKind::MalformedResponse,
                                          "trigger entry " + std::to_string(i) +
                                              " has no triggered_job_name");
            return res;
        }
        res.triggers.push_back({*name});
    }

    res.ok = true;
    return res;
}

et::mirror::app::StatusResult parseStatus(const QByteArray& payload) {
    et::mirror::app::StatusResult res;

    QJsonDocument doc;
    std::string parseError;
    if (!parseDocument(payload, doc, parseError)) {
        res.error = domain::makeError(ErrorKind::MalformedResponse, parseError);
        return res;
    }
    if (!doc.isObject()) {
        res.error = domain::makeError(ErrorKind::MalformedResponse, "status response is not an object");
        return res;
    }

    const auto status = textValue(doc.object().value(QStringLiteral("status")));
    res.status = status ? domain::jobStatusFromString(*status) : domain::JobStatus::Unknown;
    res.ok = true;
    return res;
}

et::mirror::app::TextResult parseOutput(const QByteArray& payload) {
    et::mirror::app::TextResult res;
    res.ok = true;

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        // Plain-text bodies (or bare JSON scalars) are the output itself.
        res.text = payload.toStdString();
        return res;
    }

    if (doc.isObject()) {
        const auto v = doc.object().value(QStringLiteral("output"));
        if (v.isString()) {
            res.text = v.toString().toStdString();
        } else if (!v.isUndefined() && !v.isNull()) {
            res.text = textValue(v).value_or(std::string());
        }
        return res;
    }

    res.text = doc.toJson(QJsonDocument::Compact).toStdString();
    return res;
}

QJsonObject jobToJson(const Job& job) {
    QJsonObject o;
    o.insert(QStringLiteral("id"), QString::fromStdString(job.id));
    o.insert(QStringLiteral("name"), QString::fromStdString(job.name));
    o.insert(QStringLiteral("status"), QString::fromStdString(domain::to_string(job.status)));
    o.insert(QStringLiteral("start_time"), optionalText(job.startTime));
    o.insert(QStringLiteral("end_time"), optionalText(job.endTime));
    return o;
}

bool jobFromJson(const QJsonObject& o, Job& out, QString* errorOut) {
    const auto id = textValue(o.value(QStringLiteral("id")));
    const auto name = textValue(o.value(QStringLiteral("name")));
    if (!id || id->empty() || !name || name->empty()) {
        if (errorOut) *errorOut = QStringLiteral("missing 'id' or 'name'");
        return false;
    }

    out.id = *id;
    out.name = *name;

    const auto status = textValue(o.value(QStringLiteral("status")));
    out.status = status ? domain::jobStatusFromString(*status) : domain::JobStatus::Unknown;

    out.startTime = textValue(o.value(QStringLiteral("start_time")));
    out.endTime = textValue(o.value(QStringLiteral("end_time")));
    return true;
}

QJsonObject historyEntryToJson(const HistoryEntry& entry) {
    QJsonObject o;
    o.insert(QStringLiteral("timestamp"), toIsoUtc(entry.timestamp));
    o.insert(QStringLiteral("job_id"), QString::fromStdString(entry.jobId));
    o.insert(QStringLiteral("job_name"), QString::fromStdString(entry.jobName));
    o.insert(QStringLiteral("status"), QString::fromStdString(domain::to_string(entry.status)));
    o.insert(QStringLiteral("output"), optionalText(entry.output));
    o.insert(QStringLiteral("error_log"), optionalText(entry.errorLog));
    return o;
}

QJsonObject graphToNodeLink(const JobGraph& graph) {
    QJsonArray nodes;
    for (const auto& n : graph.nodes()) {
        QJsonObject node;
        node.insert(QStringLiteral("id"), QString::fromStdString(n));
        nodes.append(node);
    }

    QJsonArray links;
    for (const auto& e : graph.edges()) {
        QJsonObject link;
        link.insert(QStringLiteral("source"), QString::fromStdString(e.source));
        link.insert(QStringLiteral("target"), QString::fromStdString(e.target));
        links.append(link);
    }

    QJsonObject o;
    o.insert(QStringLiteral("directed"), true);
    o.insert(QStringLiteral("multigraph"), false);
    o.insert(QStringLiteral("graph"), QJsonObject());
    o.insert(QStringLiteral("nodes"), nodes);
    o.insert(QStringLiteral("links"), links);
    return o;
}

bool graphFromNodeLink(const QJsonObject& o, JobGraph& out, QString* errorOut) {
    if (!o.value(QStringLiteral("nodes")).isArray()) {
        if (errorOut) *errorOut = QStringLiteral("graph has no 'nodes' array");
        return false;
    }

    JobGraph graph;
    for (const auto& v : o.value(QStringLiteral("nodes")).toArray()) {
        const auto id = textValue(v.toObject().value(QStringLiteral("id")));
        if (!id) {
            if (errorOut) *errorOut = QStringLiteral("graph node without 'id'");
            return false;
        }
        graph.addNode(*id);
    }

    QJsonValue linksValue = o.value(QStringLiteral("links"));
    if (linksValue.isUndefined()) {
        linksValue = o.value(QStringLiteral("edges"));
    }

    for (const auto& v : linksValue.toArray()) {
        const auto link = v.toObject();
        const auto source = textValue(link.value(QStringLiteral("source")));
        const auto target = textValue(link.value(QStringLiteral("target")));
        if (!source || !target) {
            if (errorOut) *errorOut = QStringLiteral("graph link without 'source'/'target'");
            return false;
        }
        graph.addEdge(*source, *target);
    }

    out = std::move(graph);
    return true;
}

QJsonDocument snapshotToJson(const Snapshot& snapshot) {
    QJsonArray jobs;
    for (const auto& job : snapshot.jobs) {
        jobs.append(jobToJson(job));
    }

    QJsonObject root;
    root.insert(QStringLiteral("timestamp"), toIsoUtc(snapshot.createdAt));
    root.insert(QStringLiteral("jobs"), jobs);
    root.insert(QStringLiteral("graph"), graphToNodeLink(snapshot.graph));
    return QJsonDocument(root);
}

SnapshotParseResult snapshotFromJson(const QByteArray& bytes) {
    SnapshotParseResult res;

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        res.error = err.error != QJsonParseError::NoError ? err.errorString()
                                                           : QStringLiteral("snapshot is not an object");
        return res;
    }

    const auto root = doc.object();
    if (!root.value(QStringLiteral("jobs")).isArray() || !root.value(QStringLiteral("graph")).isObject()) {
        res.error = QStringLiteral("snapshot needs both 'jobs' and 'graph'");
        return res;
    }

    for (const auto& v : root.value(QStringLiteral("jobs")).toArray()) {
        Job job;
        QString jobErr;
        if (!jobFromJson(v.toObject(), job, &jobErr)) {
            res.error = QStringLiteral("snapshot job: ") + jobErr;
            return res;
        }
        res.snapshot.jobs.push_back(std::move(job));
    }

    QString graphErr;
    if (!graphFromNodeLink(root.value(QStringLiteral("graph")).toObject(), res.snapshot.graph, &graphErr)) {
        res.error = graphErr;
        return res;
    }

    if (const auto ts = parseIsoTimestamp(root.value(QStringLiteral("timestamp")).toString())) {
        res.snapshot.createdAt = *ts;
        res.hasTimestamp = true;
    }

    res.ok = true;
    return res;
}

} // namespace et::mirror::infra::json

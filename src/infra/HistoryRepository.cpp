#include "infra/HistoryRepository.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <algorithm>
#include <chrono>

namespace et::mirror::infra {

using et::mirror::app::HistoryQueryResult;
using et::mirror::app::JobNamesResult;
using et::mirror::domain::ErrorKind;
using et::mirror::domain::HistoryEntry;
using et::mirror::domain::OpResult;
using et::mirror::domain::TimePoint;

namespace {

constexpr int kDefaultCap = 1000;
constexpr auto kBusyTimeoutOption = "QSQLITE_BUSY_TIMEOUT=5000";

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

QVariant textOrNull(const std::optional<std::string>& s) {
    if (!s.has_value()) {
        return {};
    }
    return QVariant(QString::fromStdString(*s));
}

std::optional<std::string> textFromColumn(const QVariant& v) {
    if (v.isNull()) {
        return std::nullopt;
    }
    return v.toString().toStdString();
}

OpResult sqlFailure(const QString& what, const QSqlError& err) {
    return et::mirror::domain::failure(ErrorKind::HistoryIO,
                                       (what + QStringLiteral(": ") + err.text()).toStdString());
}

bool insertEntry(QSqlQuery& q, const HistoryEntry& entry) {
    q.bindValue(0, QVariant(toUnixMs(entry.timestamp)));
    q.bindValue(1, QString::fromStdString(entry.jobId));
    q.bindValue(2, QString::fromStdString(entry.jobName));
    q.bindValue(3, QString::fromStdString(et::mirror::domain::to_string(entry.status)));
    q.bindValue(4, textOrNull(entry.output));
    q.bindValue(5, textOrNull(entry.errorLog));
    return q.exec();
}

// Rows come newest first from the queries below; callers get them oldest first.
HistoryQueryResult readEntries(QSqlQuery& q) {
    HistoryQueryResult res;

    while (q.next()) {
        HistoryEntry e;
        e.timestamp = fromUnixMs(q.value(0).toLongLong());
        e.jobId     = q.value(1).toString().toStdString();
        e.jobName   = q.value(2).toString().toStdString();
        e.status    = et::mirror::domain::jobStatusFromString(q.value(3).toString().toStdString());
        e.output    = textFromColumn(q.value(4));
        e.errorLog  = textFromColumn(q.value(5));
        res.entries.push_back(std::move(e));
    }

    std::reverse(res.entries.begin(), res.entries.end());
    res.ok = true;
    return res;
}

} // namespace

HistoryRepository::HistoryRepository(et::mirror::domain::HistorySettings settings)
    : settings_(std::move(settings)) {
    if (settings_.cap <= 0) {
        qWarning() << "Invalid history cap" << settings_.cap << ", using" << kDefaultCap;
        settings_.cap = kDefaultCap;
    }

    const QFileInfo fi(QString::fromStdString(settings_.path));
    if (!QDir().mkpath(fi.absolutePath())) {
        openError_ = QStringLiteral("cannot create history directory ") + fi.absolutePath();
        qWarning() << "Failed to open history DB:" << openError_;
        return;
    }

    // One connection per database file; repositories on the same file share it.
    const auto connName = QStringLiteral("history:") + fi.absoluteFilePath();

    if (QSqlDatabase::contains(connName)) {
        db_ = QSqlDatabase::database(connName);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connName);
        db_.setDatabaseName(fi.absoluteFilePath());
        db_.setConnectOptions(QString::fromLatin1(kBusyTimeoutOption));
    }

    if (!db_.isOpen() && !db_.open()) {
        openError_ = db_.lastError().text();
        qWarning() << "Failed to open history DB:" << openError_;
        return;
    }

    if (!initSchema()) {
        db_.close();
    }
}

bool HistoryRepository::initSchema() {
    QSqlQuery q(db_);

    if (!q.exec(
            "CREATE TABLE IF NOT EXISTS history ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "ts INTEGER NOT NULL,"
            "job_id TEXT NOT NULL,"
            "job_name TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "output TEXT,"
            "error_log TEXT)")) {
        openError_ = q.lastError().text();
        qWarning() << "Failed to create history schema:" << openError_;
        return false;
    }

    q.exec("CREATE INDEX IF NOT EXISTS idx_history_job_name ON history(job_name)");
    q.exec("CREATE INDEX IF NOT EXISTS idx_history_job_id ON history(job_id)");
    return true;
}

OpResult HistoryRepository::append(const HistoryEntry& entry) {
    return appendBatch({entry});
}

OpResult HistoryRepository::appendBatch(const std::vector<HistoryEntry>& entries) {
    if (!db_.isOpen()) {
        return et::mirror::domain::failure(ErrorKind::HistoryIO,
                                           "history store unavailable: " + openError_.toStdString());
    }
    if (entries.empty()) {
        return et::mirror::domain::success();
    }

    if (!db_.transaction()) {
        return sqlFailure(QStringLiteral("cannot start history transaction"), db_.lastError());
    }

    QSqlQuery ins(db_);
    ins.prepare(
        "INSERT INTO history (ts, job_id, job_name, status, output, error_log)"
        " VALUES (?, ?, ?, ?, ?, ?)");

    for (const auto& entry : entries) {
        if (!insertEntry(ins, entry)) {
            const auto err = ins.lastError();
            db_.rollback();
            return sqlFailure(QStringLiteral("failed to append history entry"), err);
        }
    }

    QSqlQuery trim(db_);
    trim.prepare(
        "DELETE FROM history WHERE id NOT IN"
        " (SELECT id FROM history ORDER BY id DESC LIMIT ?)");
    trim.addBindValue(settings_.cap);
    if (!trim.exec()) {
        const auto err = trim.lastError();
        db_.rollback();
        return sqlFailure(QStringLiteral("failed to trim history"), err);
    }

    if (!db_.commit()) {
        const auto err = db_.lastError();
        db_.rollback();
        return sqlFailure(QStringLiteral("failed to commit history"), err);
    }

    return et::mirror::domain::success();
}

HistoryQueryResult HistoryRepository::queryByJob(const std::string& nameOrId, int limit) const {
    HistoryQueryResult res;
    if (!db_.isOpen()) {
        res.error = et::mirror::domain::makeError(ErrorKind::HistoryIO,
                                                  "history store unavailable: " + openError_.toStdString());
        return res;
    }
    if (limit <= 0) {
        res.ok = true;
        return res;
    }

    QSqlQuery q(db_);
    q.prepare(
        "SELECT ts, job_id, job_name, status, output, error_log FROM history"
        " WHERE job_name = ? OR job_id = ? ORDER BY id DESC LIMIT ?");
    q.addBindValue(QString::fromStdString(nameOrId));
    q.addBindValue(QString::fromStdString(nameOrId));
    q.addBindValue(limit);

    if (!q.exec()) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::HistoryIO, "failed to read job history: " + q.lastError().text().toStdString());
        return res;
    }
    return readEntries(q);
}

HistoryQueryResult HistoryRepository::queryAll(int limit) const {
    HistoryQueryResult res;
    if (!db_.isOpen()) {
        res.error = et::mirror::domain::makeError(ErrorKind::HistoryIO,
                                                  "history store unavailable: " + openError_.toStdString());
        return res;
    }
    if (limit <= 0) {
        res.ok = true;
        return res;
    }

    QSqlQuery q(db_);
    q.prepare(
        "SELECT ts, job_id, job_name, status, output, error_log FROM history"
        " ORDER BY id DESC LIMIT ?");
    q.addBindValue(limit);

    if (!q.exec()) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::HistoryIO, "failed to read history: " + q.lastError().text().toStdString());
        return res;
    }
    return readEntries(q);
}

JobNamesResult HistoryRepository::jobNames() const {
    JobNamesResult res;
    if (!db_.isOpen()) {
        res.error = et::mirror::domain::makeError(ErrorKind::HistoryIO,
                                                  "history store unavailable: " + openError_.toStdString());
        return res;
    }

    QSqlQuery q(db_);
    if (!q.exec("SELECT DISTINCT job_name FROM history ORDER BY job_name ASC")) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::HistoryIO, "failed to list history jobs: " + q.lastError().text().toStdString());
        return res;
    }

    while (q.next()) {
        res.names.push_back(q.value(0).toString().toStdString());
    }
    res.ok = true;
    return res;
}

} // namespace et::mirror::infra

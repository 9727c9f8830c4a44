#include "infra/SnapshotCache.hpp"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <chrono>

#include "infra/JsonCodec.hpp"

namespace et::mirror::infra {

using et::mirror::app::SnapshotLoadResult;
using et::mirror::domain::Clock;
using et::mirror::domain::ErrorKind;
using et::mirror::domain::OpResult;
using et::mirror::domain::Snapshot;
using et::mirror::domain::TimePoint;

namespace {

TimePoint fileModifiedAt(const QFileInfo& fi) {
    return TimePoint(std::chrono::milliseconds(fi.lastModified().toMSecsSinceEpoch()));
}

struct ReadOutcome {
    bool                      ok{false};
    QString                   error;
    json::SnapshotParseResult parsed;
};

ReadOutcome readSnapshotFile(const QString& path) {
    ReadOutcome out;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        out.error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return out;
    }

    out.parsed = json::snapshotFromJson(file.readAll());
    if (!out.parsed.ok) {
        out.error = QStringLiteral("corrupt snapshot %1: %2").arg(path, out.parsed.error);
        return out;
    }

    if (!out.parsed.hasTimestamp) {
        out.parsed.snapshot.createdAt = fileModifiedAt(QFileInfo(path));
    }
    out.ok = true;
    return out;
}

} // namespace

SnapshotCache::SnapshotCache(et::mirror::domain::CacheSettings settings,
                             et::mirror::domain::NowFn now)
    : settings_(std::move(settings))
    , now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    if (settings_.expiryHours <= 0) {
        qWarning() << "Invalid cache expiry" << settings_.expiryHours << "h, using 24 h";
        settings_.expiryHours = 24;
    }
}

bool SnapshotCache::ensureCacheDir() const {
    const QFileInfo fi(QString::fromStdString(settings_.path));
    return QDir().mkpath(fi.absolutePath());
}

std::optional<TimePoint> SnapshotCache::writtenAt() const {
    const auto path = QString::fromStdString(settings_.path);
    if (!QFileInfo::exists(path)) {
        return std::nullopt;
    }

    const auto read = readSnapshotFile(path);
    if (!read.ok) {
        qWarning() << "Snapshot cache unreadable, treating as expired:" << read.error;
        return std::nullopt;
    }
    return read.parsed.snapshot.createdAt;
}

bool SnapshotCache::isValid() const {
    const auto written = writtenAt();
    if (!written) {
        return false;
    }
    return (now_() - *written) < std::chrono::hours(settings_.expiryHours);
}

SnapshotLoadResult SnapshotCache::load() const {
    SnapshotLoadResult res;

    const auto path = QString::fromStdString(settings_.path);
    if (!QFileInfo::exists(path)) {
        res.ok = true;
        return res;
    }

    auto read = readSnapshotFile(path);
    if (!read.ok) {
        res.error = et::mirror::domain::makeError(ErrorKind::CacheIO, read.error.toStdString());
        return res;
    }

    res.snapshot = std::move(read.parsed.snapshot);
    res.ok = true;
    return res;
}

OpResult SnapshotCache::save(const Snapshot& snapshot) {
    const auto path = QString::fromStdString(settings_.path);

    if (!ensureCacheDir()) {
        return et::mirror::domain::failure(ErrorKind::CacheIO,
                                           "cannot create cache directory for " + settings_.path);
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return et::mirror::domain::failure(
            ErrorKind::CacheIO, "cannot write " + settings_.path + ": " + file.errorString().toStdString());
    }

    const QByteArray bytes = json::snapshotToJson(snapshot).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return et::mirror::domain::failure(
            ErrorKind::CacheIO, "short write to " + settings_.path + ": " + file.errorString().toStdString());
    }

    if (!file.commit()) {
        return et::mirror::domain::failure(
            ErrorKind::CacheIO, "cannot commit " + settings_.path + ": " + file.errorString().toStdString());
    }

    qDebug() << "Snapshot cached:" << path << "jobs:" << snapshot.jobs.size();
    return et::mirror::domain::success();
}

OpResult SnapshotCache::invalidate() {
    QFile file(QString::fromStdString(settings_.path));
    if (!file.exists()) {
        return et::mirror::domain::success();
    }

    if (!file.remove()) {
        return et::mirror::domain::failure(
            ErrorKind::CacheIO, "cannot remove " + settings_.path + ": " + file.errorString().toStdString());
    }

    qDebug() << "Snapshot cache invalidated:" << file.fileName();
    return et::mirror::domain::success();
}

} // namespace et::mirror::infra

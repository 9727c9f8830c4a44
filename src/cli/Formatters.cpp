#include "cli/Formatters.hpp"

#include <QDateTime>
#include <QTimeZone>
#include <chrono>

namespace et::mirror::cli::fmt {

namespace {

const QString kDisplayFormat = QStringLiteral("yyyy-MM-dd HH:mm:ss");

} // namespace

qint64 toUnixMs(et::mirror::domain::TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch())
            .count());
}

QString formatLocalTime(et::mirror::domain::TimePoint tp) {
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(toUnixMs(tp), QTimeZone::utc());
    return dt.toLocalTime().toString(kDisplayFormat);
}

QString formatJobStatus(et::mirror::domain::JobStatus status) {
    return QString::fromStdString(et::mirror::domain::to_string(status));
}

QString formatRawTime(const std::string& raw) {
    const auto text = QString::fromStdString(raw).trimmed();

    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(text, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return QStringLiteral("Invalid time");
    }
    return dt.toString(kDisplayFormat);
}

QString formatStartTime(const et::mirror::domain::Job& job) {
    if (!job.startTime || job.startTime->empty()) {
        return QStringLiteral("Not started");
    }
    return formatRawTime(*job.startTime);
}

QString formatEndTime(const et::mirror::domain::Job& job) {
    if (!job.endTime || job.endTime->empty()) {
        return job.status == et::mirror::domain::JobStatus::Running
                   ? QStringLiteral("In progress")
                   : QStringLiteral("Not finished");
    }
    return formatRawTime(*job.endTime);
}

} // namespace et::mirror::cli::fmt

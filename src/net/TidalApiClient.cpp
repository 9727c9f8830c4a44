#include "net/TidalApiClient.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QTimer>
#include <QUrlQuery>

#include "infra/JsonCodec.hpp"

namespace et::mirror::net {

using et::mirror::app::JobListResult;
using et::mirror::app::StatusResult;
using et::mirror::app::TextResult;
using et::mirror::app::TriggerListResult;
using et::mirror::domain::ErrorKind;

namespace {

constexpr int kDefaultTimeoutSeconds = 30;
constexpr int kBodyExcerptChars      = 200;

QString trimmedBase(const QString& baseUrl) {
    QString base = baseUrl.trimmed();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    return base;
}

QString pathSegment(const QString& s) {
    return QString::fromLatin1(QUrl::toPercentEncoding(s));
}

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

TidalApiClient::TidalApiClient(et::mirror::domain::ApiSettings settings, QObject* parent)
    : QObject(parent)
    , settings_(std::move(settings)) {
    if (settings_.timeoutSeconds <= 0) {
        qWarning() << "Invalid API timeout" << settings_.timeoutSeconds << "s, using" << kDefaultTimeoutSeconds;
        settings_.timeoutSeconds = kDefaultTimeoutSeconds;
    }
}

QUrl TidalApiClient::jobsUrl(const QString& baseUrl, const QString& directory) {
    QUrl url(trimmedBase(baseUrl) + QStringLiteral("/api/jobs"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("directory"), directory);
    url.setQuery(query);
    return url;
}

QUrl TidalApiClient::jobUrl(const QString& baseUrl, const QString& jobId, const QString& suffix) {
    QString path = trimmedBase(baseUrl) + QStringLiteral("/api/jobs/") + pathSegment(jobId);
    if (!suffix.isEmpty()) {
        path += QLatin1Char('/') + suffix;
    }
    return QUrl(path);
}

ErrorKind TidalApiClient::classifyReply(QNetworkReply::NetworkError error, int httpStatus, bool timedOut) {
    if (timedOut) {
        return ErrorKind::Timeout;
    }
    if (httpStatus == 401 || httpStatus == 403) {
        return ErrorKind::Auth;
    }
    if (httpStatus == 404) {
        return ErrorKind::NotFound;
    }
    if (httpStatus >= 400) {
        return ErrorKind::Connection;
    }

    switch (error) {
        case QNetworkReply::NoError:
            return ErrorKind::None;
        case QNetworkReply::TimeoutError:
            return ErrorKind::Timeout;
        case QNetworkReply::AuthenticationRequiredError:
        case QNetworkReply::ContentAccessDenied:
            return ErrorKind::Auth;
        case QNetworkReply::ContentNotFoundError:
            return ErrorKind::NotFound;
        default:
            return ErrorKind::Connection;
    }
}

QNetworkRequest TidalApiClient::makeRequest(const QUrl& url) const {
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    req.setRawHeader("Accept", "application/json");
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    if (!settings_.username.empty()) {
        const QByteArray credentials =
            QByteArray::fromStdString(settings_.username) + ':' + QByteArray::fromStdString(settings_.password);
        req.setRawHeader("Authorization", "Basic " + credentials.toBase64());
    }
    return req;
}

TidalApiClient::Exchange TidalApiClient::get(const QUrl& url) {
    Exchange ex;

    QNetworkReply* reply = nam_.get(makeRequest(url));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&timedOut, reply]() {
        timedOut = true;
        reply->abort();
    });

    timer.start(settings_.timeoutSeconds * 1000);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const auto kind = classifyReply(reply->error(), httpStatus, timedOut);
    ex.payload = reply->readAll();
    const QString errorString = reply->errorString();
    reply->deleteLater();

    if (kind == ErrorKind::None) {
        ex.ok = true;
        return ex;
    }

    QString message;
    if (kind == ErrorKind::Timeout) {
        message = QStringLiteral("request timed out after %1 s: %2")
                      .arg(settings_.timeoutSeconds)
                      .arg(url.toString());
    } else if (httpStatus >= 400) {
        message = QStringLiteral("HTTP error %1: %2")
                      .arg(httpStatus)
                      .arg(QString::fromUtf8(ex.payload.left(kBodyExcerptChars)));
    } else {
        message = QStringLiteral("request failed: %1 (%2)").arg(errorString, url.toString());
    }

    qWarning() << "Scheduler request failed:" << url.toString() << message;
    ex.error = et::mirror::domain::makeError(kind, message.toStdString());
    return ex;
}

JobListResult TidalApiClient::listJobs(const std::string& directory) {
    const auto ex = get(jobsUrl(qs(settings_.baseUrl), qs(directory)));
    if (!ex.ok) {
        JobListResult res;
        res.error = ex.error;
        return res;
    }
    return et::mirror::infra::json::parseJobList(ex.payload);
}

TriggerListResult TidalApiClient::listTriggers(const et::mirror::domain::JobId& jobId) {
    const auto ex = get(jobUrl(qs(settings_.baseUrl), qs(jobId), QStringLiteral("dependencies")));
    if (!ex.ok) {
        TriggerListResult res;
        res.error = ex.error;
        return res;
    }
    return et::mirror::infra::json::parseTriggerList(ex.payload);
}

StatusResult TidalApiClient::getStatus(const et::mirror::domain::JobId& jobId) {
    const auto ex = get(jobUrl(qs(settings_.baseUrl), qs(jobId), QStringLiteral("status")));
    if (!ex.ok) {
        StatusResult res;
        res.error = ex.error;
        return res;
    }
    return et::mirror::infra::json::parseStatus(ex.payload);
}

TextResult TidalApiClient::getOutput(const et::mirror::domain::JobId& jobId) {
    const auto ex = get(jobUrl(qs(settings_.baseUrl), qs(jobId), QStringLiteral("output")));
    if (!ex.ok) {
        TextResult res;
        res.error = ex.error;
        return res;
    }
    return et::mirror::infra::json::parseOutput(ex.payload);
}

TextResult TidalApiClient::getLog(const et::mirror::domain::JobId& jobId, const std::string& logType) {
    const auto suffix = QStringLiteral("logs/") + pathSegment(qs(logType));
    const auto ex = get(jobUrl(qs(settings_.baseUrl), qs(jobId), suffix));

    TextResult res;
    if (!ex.ok) {
        res.error = ex.error;
        return res;
    }
    res.text = QString::fromUtf8(ex.payload).toStdString();
    res.ok = true;
    return res;
}

} // namespace et::mirror::net

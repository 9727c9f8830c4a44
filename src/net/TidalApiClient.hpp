#pragma once

#include <QObject>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include "app/ISchedulerClient.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::net {

// Tidal REST transport (JSON over HTTPS, optional basic auth).
//
// Endpoints live under {base}/api/jobs. Each call performs one GET, waits on a
// local event loop until the reply finishes or the timeout fires, and maps the
// outcome onto domain::ErrorKind. Payload parsing is delegated to infra::json.
class TidalApiClient final : public QObject, public et::mirror::app::ISchedulerClient {
    Q_OBJECT

public:
    explicit TidalApiClient(et::mirror::domain::ApiSettings settings, QObject* parent = nullptr);

    et::mirror::app::JobListResult listJobs(const std::string& directory) override;
    et::mirror::app::TriggerListResult listTriggers(const et::mirror::domain::JobId& jobId) override;
    et::mirror::app::StatusResult getStatus(const et::mirror::domain::JobId& jobId) override;
    et::mirror::app::TextResult getOutput(const et::mirror::domain::JobId& jobId) override;
    et::mirror::app::TextResult getLog(const et::mirror::domain::JobId& jobId,
                                       const std::string& logType) override;

    // URL builders. The base URL may carry a trailing slash.
    static QUrl jobsUrl(const QString& baseUrl, const QString& directory);
    static QUrl jobUrl(const QString& baseUrl, const QString& jobId, const QString& suffix);

    // Maps a finished (or aborted) reply onto the error taxonomy.
    // Returns ErrorKind::None for a successful exchange.
    static et::mirror::domain::ErrorKind classifyReply(QNetworkReply::NetworkError error,
                                                       int httpStatus,
                                                       bool timedOut);

private:
    struct Exchange {
        bool                      ok{false};
        et::mirror::domain::Error error;
        QByteArray                payload;
    };

    QNetworkRequest makeRequest(const QUrl& url) const;
    Exchange get(const QUrl& url);

    et::mirror::domain::ApiSettings settings_;
    QNetworkAccessManager           nam_;
};

} // namespace et::mirror::net

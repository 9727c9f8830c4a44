#include "infra/ConfigRepository.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace et::mirror::infra {

using et::mirror::domain::MirrorConfig;

namespace {

std::string stringOr(const QJsonObject& o, const char* key, const std::string& fallback) {
    const auto v = o.value(QLatin1String(key));
    if (!v.isString() || v.toString().trimmed().isEmpty()) {
        return fallback;
    }
    return v.toString().toStdString();
}

int positiveIntOr(const QJsonObject& o, const char* key, int fallback) {
    const auto v = o.value(QLatin1String(key));
    if (v.isUndefined()) {
        return fallback;
    }
    const int n = v.toInt(0);
    if (n <= 0) {
        qWarning() << "Invalid config value for" << key << ", using default" << fallback;
        return fallback;
    }
    return n;
}

double positiveDoubleOr(const QJsonObject& o, const char* key, double fallback) {
    const auto v = o.value(QLatin1String(key));
    if (v.isUndefined()) {
        return fallback;
    }
    const double d = v.toDouble(0.0);
    if (d <= 0.0) {
        qWarning() << "Invalid config value for" << key << ", using default" << fallback;
        return fallback;
    }
    return d;
}

} // namespace

ConfigRepository::ConfigRepository(std::string path)
    : path_(std::move(path)) {
}

MirrorConfig ConfigRepository::load() const {
    return load(QProcessEnvironment::systemEnvironment());
}

MirrorConfig ConfigRepository::load(const QProcessEnvironment& env) const {
    auto config = loadFile();
    applyEnvironment(config, env);
    return config;
}

MirrorConfig ConfigRepository::loadFile() const {
    const MirrorConfig defaults;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Config not found, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open config, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid config, using defaults:" << parseErr.errorString();
        return defaults;
    }

    const auto root = doc.object();
    MirrorConfig c;

    const auto api = root.value(QStringLiteral("api")).toObject();
    c.api.baseUrl        = stringOr(api, "base_url", defaults.api.baseUrl);
    c.api.username       = api.value(QStringLiteral("username")).toString().toStdString();
    c.api.password       = api.value(QStringLiteral("password")).toString().toStdString();
    c.api.timeoutSeconds = positiveIntOr(api, "timeout_seconds", defaults.api.timeoutSeconds);

    c.jobDirectory = stringOr(root, "job_directory", defaults.jobDirectory);

    const auto storage = root.value(QStringLiteral("storage")).toObject();
    c.cache.path        = stringOr(storage, "cache_file", defaults.cache.path);
    c.cache.expiryHours = positiveIntOr(storage, "cache_expiry_hours", defaults.cache.expiryHours);
    c.history.path      = stringOr(storage, "history_file", defaults.history.path);
    c.history.cap       = positiveIntOr(storage, "history_cap", defaults.history.cap);
    c.outputDir         = stringOr(storage, "output_dir", defaults.outputDir);

    const auto layout = root.value(QStringLiteral("layout")).toObject();
    c.layout.horizontalSpacing =
        positiveDoubleOr(layout, "horizontal_spacing", defaults.layout.horizontalSpacing);
    c.layout.verticalSpacing =
        positiveDoubleOr(layout, "vertical_spacing", defaults.layout.verticalSpacing);

    qDebug() << "Config loaded:" << QString::fromStdString(path_);
    return c;
}

void ConfigRepository::applyEnvironment(MirrorConfig& config, const QProcessEnvironment& env) {
    const auto text = [&env](const char* name) {
        return env.value(QLatin1String(name)).trimmed();
    };

    if (const auto v = text("TIDAL_API_URL"); !v.isEmpty()) {
        config.api.baseUrl = v.toStdString();
    }
    if (const auto v = text("TIDAL_JOB_DIRECTORY"); !v.isEmpty()) {
        config.jobDirectory = v.toStdString();
    }
    if (const auto v = text("TIDAL_USERNAME"); !v.isEmpty()) {
        config.api.username = v.toStdString();
    }
    if (env.contains(QStringLiteral("TIDAL_PASSWORD"))) {
        config.api.password = env.value(QStringLiteral("TIDAL_PASSWORD")).toStdString();
    }
    if (const auto v = text("CACHE_EXPIRY_HOURS"); !v.isEmpty()) {
        bool ok = false;
        const int hours = v.toInt(&ok);
        if (ok && hours > 0) {
            config.cache.expiryHours = hours;
        } else {
            qWarning() << "Ignoring invalid CACHE_EXPIRY_HOURS:" << v;
        }
    }
}

bool ConfigRepository::save(const MirrorConfig& c) const {
    QJsonObject api;
    api.insert(QStringLiteral("base_url"),        QString::fromStdString(c.api.baseUrl));
    api.insert(QStringLiteral("username"),        QString::fromStdString(c.api.username));
    api.insert(QStringLiteral("password"),        QString::fromStdString(c.api.password));
    api.insert(QStringLiteral("timeout_seconds"), c.api.timeoutSeconds);

    QJsonObject storage;
    storage.insert(QStringLiteral("cache_file"),         QString::fromStdString(c.cache.path));
    storage.insert(QStringLiteral("cache_expiry_hours"), c.cache.expiryHours);
    storage.insert(QStringLiteral("history_file"),       QString::fromStdString(c.history.path));
    storage.insert(QStringLiteral("history_cap"),        c.history.cap);
    storage.insert(QStringLiteral("output_dir"),         QString::fromStdString(c.outputDir));

    QJsonObject layout;
    layout.insert(QStringLiteral("horizontal_spacing"), c.layout.horizontalSpacing);
    layout.insert(QStringLiteral("vertical_spacing"),   c.layout.verticalSpacing);

    QJsonObject root;
    root.insert(QStringLiteral("api"),           api);
    root.insert(QStringLiteral("job_directory"), QString::fromStdString(c.jobDirectory));
    root.insert(QStringLiteral("storage"),       storage);
    root.insert(QStringLiteral("layout"),        layout);

    QSaveFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write config:" << QString::fromStdString(path_);
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Failed to commit config:" << QString::fromStdString(path_) << file.errorString();
        return false;
    }
    return true;
}

} // namespace et::mirror::infra

#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "infra/ConfigRepository.hpp"

using et::mirror::domain::MirrorConfig;
using et::mirror::infra::ConfigRepository;

class ConfigRepositoryTest : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;

    QString writeConfig(const QString& name, const QByteArray& body) {
        const QString path = dir_.filePath(name);
        QFile f(path);
        if (f.open(QIODevice::WriteOnly)) {
            f.write(body);
        }
        return path;
    }

private slots:
    void missingFileGivesDefaults() {
        QVERIFY(dir_.isValid());
        ConfigRepository repo(dir_.filePath("absent.json").toStdString());
        const auto c = repo.load(QProcessEnvironment());

        const MirrorConfig d;
        QCOMPARE(c.api.baseUrl, d.api.baseUrl);
        QCOMPARE(c.api.timeoutSeconds, 30);
        QCOMPARE(c.jobDirectory, std::string("your-job-directory"));
        QCOMPARE(c.cache.expiryHours, 24);
        QCOMPARE(c.history.cap, 1000);
        QCOMPARE(c.layout.horizontalSpacing, 200.0);
        QCOMPARE(c.layout.verticalSpacing, 100.0);
    }

    void fileValues() {
        const auto path = writeConfig("full.json", R"({
            "api": {"base_url": "https://tidal.corp", "username": "svc", "password": "pw",
                    "timeout_seconds": 10},
            "job_directory": "finance",
            "storage": {"cache_file": "c.json", "history_file": "h.sqlite", "output_dir": "out",
                        "cache_expiry_hours": 6, "history_cap": 50},
            "layout": {"horizontal_spacing": 120, "vertical_spacing": 40}
        })");

        const auto c = ConfigRepository(path.toStdString()).load(QProcessEnvironment());
        QCOMPARE(c.api.baseUrl, std::string("https://tidal.corp"));
        QCOMPARE(c.api.username, std::string("svc"));
        QCOMPARE(c.api.password, std::string("pw"));
        QCOMPARE(c.api.timeoutSeconds, 10);
        QCOMPARE(c.jobDirectory, std::string("finance"));
        QCOMPARE(c.cache.path, std::string("c.json"));
        QCOMPARE(c.cache.expiryHours, 6);
        QCOMPARE(c.history.path, std::string("h.sqlite"));
        QCOMPARE(c.history.cap, 50);
        QCOMPARE(c.outputDir, std::string("out"));
        QCOMPARE(c.layout.horizontalSpacing, 120.0);
        QCOMPARE(c.layout.verticalSpacing, 40.0);
    }

    void invalidValuesFallBack() {
        const auto path = writeConfig("bad-values.json", R"({
            "storage": {"cache_expiry_hours": -3, "history_cap": 0},
            "layout": {"horizontal_spacing": "wide"}
        })");

        const auto c = ConfigRepository(path.toStdString()).load(QProcessEnvironment());
        QCOMPARE(c.cache.expiryHours, 24);
        QCOMPARE(c.history.cap, 1000);
        QCOMPARE(c.layout.horizontalSpacing, 200.0);
    }

    void brokenJsonGivesDefaults() {
        const auto path = writeConfig("broken.json", "{ not json");
        const auto c = ConfigRepository(path.toStdString()).load(QProcessEnvironment());
        QCOMPARE(c.jobDirectory, std::string("your-job-directory"));
    }

    void environmentOverrides() {
        const auto path = writeConfig("env.json", R"({"job_directory": "from-file"})");

        QProcessEnvironment env;
        env.insert(QStringLiteral("TIDAL_API_URL"), QStringLiteral("https://override"));
        env.insert(QStringLiteral("TIDAL_JOB_DIRECTORY"), QStringLiteral("from-env"));
        env.insert(QStringLiteral("TIDAL_USERNAME"), QStringLiteral("envuser"));
        env.insert(QStringLiteral("TIDAL_PASSWORD"), QStringLiteral("secret"));
        env.insert(QStringLiteral("CACHE_EXPIRY_HOURS"), QStringLiteral("2"));

        const auto c = ConfigRepository(path.toStdString()).load(env);
        QCOMPARE(c.api.baseUrl, std::string("https://override"));
        QCOMPARE(c.jobDirectory, std::string("from-env"));
        QCOMPARE(c.api.username, std::string("envuser"));
        QCOMPARE(c.api.password, std::string("secret"));
        QCOMPARE(c.cache.expiryHours, 2);
    }

    void invalidEnvironmentNumberIgnored() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("CACHE_EXPIRY_HOURS"), QStringLiteral("soon"));

        const auto c = ConfigRepository(dir_.filePath("absent.json").toStdString()).load(env);
        QCOMPARE(c.cache.expiryHours, 24);
    }

    void saveThenLoad() {
        MirrorConfig c;
        c.api.baseUrl = "https://saved";
        c.jobDirectory = "saved-dir";
        c.history.cap = 7;
        c.layout.verticalSpacing = 55.0;

        ConfigRepository repo(dir_.filePath("saved.json").toStdString());
        QVERIFY(repo.save(c));

        const auto back = repo.load(QProcessEnvironment());
        QCOMPARE(back.api.baseUrl, std::string("https://saved"));
        QCOMPARE(back.jobDirectory, std::string("saved-dir"));
        QCOMPARE(back.history.cap, 7);
        QCOMPARE(back.layout.verticalSpacing, 55.0);
    }
};

QTEST_GUILESS_MAIN(ConfigRepositoryTest)
#include "ConfigRepositoryTest.moc"

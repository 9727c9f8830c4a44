#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>

#include <optional>
#include <string>

#include "app/JobMirror.hpp"
#include "cli/OutputFiles.hpp"
#include "cli/ReportFormatter.hpp"
#include "domain/domain_model.hpp"
#include "infra/ConfigRepository.hpp"
#include "infra/HistoryRepository.hpp"
#include "infra/SnapshotCache.hpp"
#include "net/TidalApiClient.hpp"

namespace {

using et::mirror::cli::ReportFormatter;
using et::mirror::domain::Clock;
using et::mirror::domain::Error;
using et::mirror::domain::ErrorKind;

constexpr int kExitUsage     = 1;
constexpr int kExitScheduler = 2;
constexpr int kExitStorage   = 3;
constexpr int kExitCycle     = 4;
constexpr int kDefaultLimit  = 20;

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CacheIO:
        case ErrorKind::HistoryIO:
        case ErrorKind::OutputIO:
            return kExitStorage;
        case ErrorKind::CyclicGraph:
            return kExitCycle;
        case ErrorKind::None:
            return 0;
        default:
            return kExitScheduler;
    }
}

int fail(const Error& error) {
    QTextStream(stderr) << QString::fromStdString(et::mirror::domain::to_string(error)) << "\n";
    return exitCodeFor(error.kind);
}

int usage(const QCommandLineParser& parser, const QString& message) {
    QTextStream err(stderr);
    err << message << "\n\n" << parser.helpText();
    return kExitUsage;
}

void print(const QString& text) {
    QTextStream(stdout) << text;
}

void print(const QJsonDocument& doc) {
    QTextStream(stdout) << doc.toJson(QJsonDocument::Indented);
}

struct Context {
    et::mirror::app::JobMirror&             mirror;
    const et::mirror::domain::MirrorConfig& config;
    bool                                    json{false};
};

int runShow(Context& ctx) {
    const auto res = ctx.mirror.getSnapshot();
    if (!res.ok) {
        return fail(res.error);
    }

    const bool cacheValid = ctx.mirror.isCacheValid();
    if (ctx.json) {
        print(ReportFormatter::snapshotJson(res, cacheValid, Clock::now()));
    } else {
        print(ReportFormatter::snapshotText(res, cacheValid));
    }
    return 0;
}

int runRefresh(Context& ctx) {
    const auto res = ctx.mirror.refresh();
    if (ctx.json) {
        print(ReportFormatter::refreshJson(res, Clock::now()));
    }
    if (!res.ok) {
        return fail(res.error);
    }
    if (!ctx.json) {
        print(ReportFormatter::refreshText(res));
    }
    return 0;
}

int runLayout(Context& ctx) {
    const auto snap = ctx.mirror.getSnapshot();
    if (!snap.ok) {
        return fail(snap.error);
    }

    const auto layout = ctx.mirror.layout(snap.snapshot.graph);
    if (!layout.ok) {
        return fail(layout.error);
    }

    if (ctx.json) {
        print(ReportFormatter::layoutJson(snap.snapshot.graph, layout));
    } else {
        print(ReportFormatter::layoutText(layout));
    }
    return 0;
}

int runHistory(Context& ctx, const std::optional<std::string>& job, int limit) {
    const auto res = job ? ctx.mirror.historyFor(*job, limit) : ctx.mirror.recentHistory(limit);
    if (!res.ok) {
        return fail(res.error);
    }

    if (ctx.json) {
        print(ReportFormatter::historyJson(job, res.entries));
    } else {
        print(ReportFormatter::historyText(job, res.entries));
    }
    return 0;
}

int runJobsInHistory(Context& ctx) {
    const auto res = ctx.mirror.historyJobNames();
    if (!res.ok) {
        return fail(res.error);
    }

    if (ctx.json) {
        print(ReportFormatter::jobNamesJson(res.names));
    } else {
        print(ReportFormatter::jobNamesText(res.names));
    }
    return 0;
}

int runOutput(Context& ctx, const std::string& jobId, const std::optional<std::string>& logType) {
    const auto res = logType ? ctx.mirror.fetchLog(jobId, *logType) : ctx.mirror.fetchOutput(jobId);
    if (!res.ok) {
        return fail(res.error);
    }

    const auto text = QString::fromStdString(res.text);
    const auto saved = et::mirror::cli::writeJobOutput(QString::fromStdString(ctx.config.outputDir),
                                                       ReportFormatter::outputFileName(jobId, logType),
                                                       text);
    if (!saved.ok) {
        return fail(saved.error);
    }

    qInfo() << "Output written to" << saved.path;
    print(text);
    if (!text.endsWith(QLatin1Char('\n'))) {
        print(QStringLiteral("\n"));
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("easytidal"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Mirror of Tidal job dependencies and run history."));
    parser.addHelpOption();

    const QCommandLineOption configOpt(QStringLiteral("config"),
                                       QStringLiteral("Configuration file."),
                                       QStringLiteral("file"),
                                       QStringLiteral("easytidal.json"));
    const QCommandLineOption jsonOpt(QStringLiteral("json"), QStringLiteral("Print JSON documents."));
    const QCommandLineOption quietOpt(QStringLiteral("quiet"), QStringLiteral("Suppress debug and info logging."));
    const QCommandLineOption limitOpt(QStringLiteral("limit"),
                                      QStringLiteral("Number of history entries (history)."),
                                      QStringLiteral("n"),
                                      QString::number(kDefaultLimit));
    const QCommandLineOption logOpt(QStringLiteral("log"),
                                    QStringLiteral("Fetch the named log instead of the output (output)."),
                                    QStringLiteral("type"));
    parser.addOption(configOpt);
    parser.addOption(jsonOpt);
    parser.addOption(quietOpt);
    parser.addOption(limitOpt);
    parser.addOption(logOpt);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("show | refresh | layout | history [JOB] | jobs-in-history | output JOB_ID"));

    parser.process(app);

    if (parser.isSet(quietOpt)) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false\n*.info=false"));
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.isEmpty() ? QStringLiteral("show") : args.first();

    bool limitOk = false;
    const int limit = parser.value(limitOpt).toInt(&limitOk);
    if (!limitOk || limit <= 0) {
        return usage(parser, QStringLiteral("--limit expects a positive number"));
    }

    const QString configPath = QDir::current().absoluteFilePath(parser.value(configOpt));
    qDebug() << "Config path:" << configPath;

    et::mirror::infra::ConfigRepository configRepo(configPath.toStdString());
    const auto config = configRepo.load();

    et::mirror::net::TidalApiClient client(config.api);
    et::mirror::infra::SnapshotCache cache(config.cache);
    et::mirror::infra::HistoryRepository history(config.history);

    et::mirror::app::MirrorSettings settings;
    settings.jobDirectory = config.jobDirectory;
    settings.layout       = config.layout;

    et::mirror::app::JobMirror mirror(client, cache, history, settings);
    Context ctx{mirror, config, parser.isSet(jsonOpt)};

    if (command == QLatin1String("show") && args.size() <= 1) {
        return runShow(ctx);
    }
    if (command == QLatin1String("refresh") && args.size() == 1) {
        return runRefresh(ctx);
    }
    if (command == QLatin1String("layout") && args.size() == 1) {
        return runLayout(ctx);
    }
    if (command == QLatin1String("history") && args.size() <= 2) {
        std::optional<std::string> job;
        if (args.size() == 2) {
            job = args.at(1).toStdString();
        }
        return runHistory(ctx, job, limit);
    }
    if (command == QLatin1String("jobs-in-history") && args.size() == 1) {
        return runJobsInHistory(ctx);
    }
    if (command == QLatin1String("output") && args.size() == 2) {
        std::optional<std::string> logType;
        if (parser.isSet(logOpt)) {
            logType = parser.value(logOpt).toStdString();
        }
        return runOutput(ctx, args.at(1).toStdString(), logType);
    }

    return usage(parser, QStringLiteral("Unknown command or wrong arguments: ") + args.join(QLatin1Char(' ')));
}

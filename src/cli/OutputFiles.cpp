#include "cli/OutputFiles.hpp"

#include <QDebug>
#include <QDir>
#include <QSaveFile>

namespace et::mirror::cli {

using et::mirror::domain::ErrorKind;

OutputWriteResult writeJobOutput(const QString& outputDir, const QString& fileName, const QString& text) {
    OutputWriteResult res;

    QDir dir(outputDir);
    if (!dir.mkpath(QStringLiteral("."))) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::OutputIO, "cannot create output directory " + outputDir.toStdString());
        return res;
    }

    res.path = dir.filePath(fileName);

    QSaveFile file(res.path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::OutputIO, "cannot write " + res.path.toStdString() + ": " + file.errorString().toStdString());
        return res;
    }

    file.write(text.toUtf8());
    if (!file.commit()) {
        res.error = et::mirror::domain::makeError(
            ErrorKind::OutputIO, "cannot commit " + res.path.toStdString() + ": " + file.errorString().toStdString());
        return res;
    }

    qDebug() << "Job output saved:" << res.path;
    res.ok = true;
    return res;
}

} // namespace et::mirror::cli

#pragma once

#include <QString>

#include "domain/domain_model.hpp"

namespace et::mirror::cli {

struct OutputWriteResult {
    bool                      ok{false};
    et::mirror::domain::Error error;
    QString                   path;
};

// Writes fetched job output under `outputDir` (created when missing).
// The file is replaced atomically; failures are OutputIO.
OutputWriteResult writeJobOutput(const QString& outputDir, const QString& fileName, const QString& text);

} // namespace et::mirror::cli

#pragma once

#include <QProcessEnvironment>
#include <string>

#include "domain/domain_model.hpp"

namespace et::mirror::infra {

class ConfigRepository {
public:
    explicit ConfigRepository(std::string path);

    // Load settings from the JSON file, then apply environment overrides
    // (TIDAL_API_URL, TIDAL_JOB_DIRECTORY, TIDAL_USERNAME, TIDAL_PASSWORD,
    // CACHE_EXPIRY_HOURS). A missing or invalid file yields the defaults and
    // logs a warning; an invalid single value falls back to its default.
    et::mirror::domain::MirrorConfig load() const;
    et::mirror::domain::MirrorConfig load(const QProcessEnvironment& env) const;

    // Write the settings back as JSON. Returns false (and logs) on failure.
    bool save(const et::mirror::domain::MirrorConfig& config) const;

private:
    et::mirror::domain::MirrorConfig loadFile() const;
    static void applyEnvironment(et::mirror::domain::MirrorConfig& config,
                                 const QProcessEnvironment& env);

    std::string path_;
};

} // namespace et::mirror::infra

#pragma once

#include <QString>
#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace et::mirror::cli::fmt {

// Convert domain timepoint to milliseconds since Unix epoch.
qint64 toUnixMs(et::mirror::domain::TimePoint tp);

// Format a domain timepoint as local "yyyy-MM-dd HH:mm:ss".
QString formatLocalTime(et::mirror::domain::TimePoint tp);

QString formatJobStatus(et::mirror::domain::JobStatus status);

// Raw scheduler timestamp as "yyyy-MM-dd HH:mm:ss" in the offset it was
// written with, or "Invalid time" when it does not parse.
QString formatRawTime(const std::string& raw);

// "Not started" when the job has no start time.
QString formatStartTime(const et::mirror::domain::Job& job);

// "In progress" for a running job without end time, "Not finished" otherwise.
QString formatEndTime(const et::mirror::domain::Job& job);

} // namespace et::mirror::cli::fmt

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace et::mirror::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using JobId     = std::string;

// Injectable "now" so cache expiry and history timestamps can be driven by tests.
using NowFn = std::function<TimePoint()>;

// --- Job status -------------------------------------------------------------

enum class JobStatus {
    Unknown = 0,
    Success = 1,
    Failed  = 2,
    Running = 3,
    Pending = 4
};

// --- Job --------------------------------------------------------------------

struct Job {
    JobId       id;
    std::string name;
    JobStatus   status{JobStatus::Unknown};

    // Raw ISO-8601 text as reported by the scheduler. Not guaranteed to parse.
    std::optional<std::string> startTime;
    std::optional<std::string> endTime;
};

// One scheduler-declared trigger: completion of the owning job starts this one.
struct Trigger {
    std::string triggeredJobName;
};

// --- History ----------------------------------------------------------------

struct HistoryEntry {
    TimePoint                  timestamp{Clock::now()};
    JobId                      jobId;
    std::string                jobName;
    JobStatus                  status{JobStatus::Unknown};
    std::optional<std::string> output;
    std::optional<std::string> errorLog;
};

// --- Errors -----------------------------------------------------------------

enum class ErrorKind {
    None              = 0,
    Connection        = 1,
    Timeout           = 2,
    Auth              = 3,
    NotFound          = 4,
    MalformedResponse = 5,
    CacheIO           = 6,
    CyclicGraph       = 7,
    HistoryIO         = 8,
    OutputIO          = 9
};

struct Error {
    ErrorKind   kind{ErrorKind::None};
    std::string message;
};

inline Error makeError(ErrorKind kind, std::string message) {
    return {kind, std::move(message)};
}

// Outcome of an operation with no payload (save, invalidate, append).
struct OpResult {
    bool  ok{false};
    Error error;
};

inline OpResult success() {
    return {true, {}};
}

inline OpResult failure(ErrorKind kind, std::string message) {
    return {false, makeError(kind, std::move(message))};
}

// --- Configuration ----------------------------------------------------------

struct ApiSettings {
    std::string baseUrl{"https://your-tidal-server/api"};
    std::string username;
    std::string password;
    int         timeoutSeconds{30};
};

struct CacheSettings {
    std::string path{"data/job_graph_cache.json"};
    int         expiryHours{24};
};

struct HistorySettings {
    std::string path{"data/job_history.sqlite"};
    int         cap{1000};
};

struct LayoutSettings {
    double horizontalSpacing{200.0};
    double verticalSpacing{100.0};
};

struct MirrorConfig {
    ApiSettings     api;
    std::string     jobDirectory{"your-job-directory"};
    CacheSettings   cache;
    HistorySettings history;
    std::string     outputDir{"data/job_outputs"};
    LayoutSettings  layout;
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Unknown: return "unknown";
        case JobStatus::Success: return "success";
        case JobStatus::Failed:  return "failed";
        case JobStatus::Running: return "running";
        case JobStatus::Pending: return "pending";
    }
    return "unknown";
}

// Anything outside the closed set maps to Unknown (forward compatibility).
inline JobStatus jobStatusFromString(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (const char ch : text) {
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            continue;
        }
        s.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch);
    }

    if (s == "success") return JobStatus::Success;
    if (s == "failed")  return JobStatus::Failed;
    if (s == "running") return JobStatus::Running;
    if (s == "pending") return JobStatus::Pending;
    return JobStatus::Unknown;
}

inline std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Connection:        return "ConnectionError";
        case ErrorKind::Timeout:           return "TimeoutError";
        case ErrorKind::Auth:              return "AuthError";
        case ErrorKind::NotFound:          return "NotFoundError";
        case ErrorKind::MalformedResponse: return "MalformedResponseError";
        case ErrorKind::CacheIO:           return "CacheIOError";
        case ErrorKind::CyclicGraph:       return "CyclicGraphError";
        case ErrorKind::HistoryIO:         return "HistoryIOError";
        case ErrorKind::OutputIO:          return "OutputIOError";
    }
    return "None";
}

inline std::string to_string(const Error& e) {
    return to_string(e.kind) + ": " + e.message;
}

} // namespace et::mirror::domain

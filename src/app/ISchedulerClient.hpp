#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace et::mirror::app {

struct JobListResult {
    bool                             ok{false};
    et::mirror::domain::Error        error;
    std::vector<et::mirror::domain::Job> jobs;
};

struct TriggerListResult {
    bool                                 ok{false};
    et::mirror::domain::Error            error;
    std::vector<et::mirror::domain::Trigger> triggers;
};

struct StatusResult {
    bool                          ok{false};
    et::mirror::domain::Error     error;
    et::mirror::domain::JobStatus status{et::mirror::domain::JobStatus::Unknown};
};

struct TextResult {
    bool                      ok{false};
    et::mirror::domain::Error error;
    std::string               text;
};

// Port/interface to the external batch-job scheduler.
// Implementations live in net (e.g. Tidal REST over QtNetwork).
//
// Every call blocks until it completes or times out, and maps transport
// failures onto domain::ErrorKind (Connection, Timeout, Auth, NotFound,
// MalformedResponse).
class ISchedulerClient {
public:
    virtual ~ISchedulerClient() = default;

    virtual JobListResult listJobs(const std::string& directory) = 0;
    virtual TriggerListResult listTriggers(const et::mirror::domain::JobId& jobId) = 0;
    virtual StatusResult getStatus(const et::mirror::domain::JobId& jobId) = 0;

    virtual TextResult getOutput(const et::mirror::domain::JobId& jobId) = 0;
    virtual TextResult getLog(const et::mirror::domain::JobId& jobId, const std::string& logType) = 0;
};

} // namespace et::mirror::app

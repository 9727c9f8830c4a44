#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "app/ISchedulerClient.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::tests {

// In-memory scheduler: jobs, triggers and statuses are set up by the test,
// and any job id can be made to fail its trigger or status lookup.
class FakeSchedulerClient : public et::mirror::app::ISchedulerClient {
public:
    void addJob(const std::string& id,
                const std::string& name,
                et::mirror::domain::JobStatus status = et::mirror::domain::JobStatus::Success) {
        et::mirror::domain::Job job;
        job.id     = id;
        job.name   = name;
        job.status = status;
        jobs.push_back(job);
        statuses[id] = status;
    }

    void addTrigger(const std::string& jobId, const std::string& triggeredName) {
        triggers[jobId].push_back(et::mirror::domain::Trigger{triggeredName});
    }

    et::mirror::app::JobListResult listJobs(const std::string& directory) override {
        ++listJobsCalls;
        lastDirectory = directory;

        et::mirror::app::JobListResult res;
        if (listJobsError.kind != et::mirror::domain::ErrorKind::None) {
            res.error = listJobsError;
            return res;
        }
        res.jobs = jobs;
        res.ok = true;
        return res;
    }

    et::mirror::app::TriggerListResult listTriggers(const et::mirror::domain::JobId& jobId) override {
        ++listTriggersCalls;

        et::mirror::app::TriggerListResult res;
        if (failingTriggers.count(jobId)) {
            res.error = et::mirror::domain::makeError(et::mirror::domain::ErrorKind::Timeout,
                                                      "trigger lookup timed out");
            return res;
        }
        const auto it = triggers.find(jobId);
        if (it != triggers.end()) {
            res.triggers = it->second;
        }
        res.ok = true;
        return res;
    }

    et::mirror::app::StatusResult getStatus(const et::mirror::domain::JobId& jobId) override {
        ++getStatusCalls;

        et::mirror::app::StatusResult res;
        if (failingStatus.count(jobId)) {
            res.error = et::mirror::domain::makeError(et::mirror::domain::ErrorKind::Connection,
                                                      "status unavailable");
            return res;
        }
        const auto it = statuses.find(jobId);
        res.status = it != statuses.end() ? it->second : et::mirror::domain::JobStatus::Unknown;
        res.ok = true;
        return res;
    }

    et::mirror::app::TextResult getOutput(const et::mirror::domain::JobId& jobId) override {
        et::mirror::app::TextResult res;
        const auto it = outputs.find(jobId);
        if (it == outputs.end()) {
            res.error = et::mirror::domain::makeError(et::mirror::domain::ErrorKind::NotFound,
                                                      "no output for " + jobId);
            return res;
        }
        res.text = it->second;
        res.ok = true;
        return res;
    }

    et::mirror::app::TextResult getLog(const et::mirror::domain::JobId& jobId,
                                       const std::string& logType) override {
        et::mirror::app::TextResult res;
        const auto it = outputs.find(jobId + "/" + logType);
        if (it == outputs.end()) {
            res.error = et::mirror::domain::makeError(et::mirror::domain::ErrorKind::NotFound,
                                                      "no " + logType + " log for " + jobId);
            return res;
        }
        res.text = it->second;
        res.ok = true;
        return res;
    }

    std::vector<et::mirror::domain::Job>                           jobs;
    std::map<std::string, std::vector<et::mirror::domain::Trigger>> triggers;
    std::map<std::string, et::mirror::domain::JobStatus>           statuses;
    std::map<std::string, std::string>                             outputs; // "id" or "id/logType"
    std::set<std::string>                                          failingTriggers;
    std::set<std::string>                                          failingStatus;
    et::mirror::domain::Error                                      listJobsError;

    int         listJobsCalls{0};
    int         listTriggersCalls{0};
    int         getStatusCalls{0};
    std::string lastDirectory;
};

} // namespace et::mirror::tests

#pragma once

#include <string>
#include <vector>

#include "domain/JobGraph.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::app {

class ISchedulerClient;

struct GraphBuildResult {
    bool                         ok{false};
    et::mirror::domain::Error    error;
    et::mirror::domain::JobGraph graph;

    // Trigger targets absent from the job list (no status, no history).
    std::vector<std::string> implicitNodes;
};

// Turns a flat job list into the trigger graph, one trigger lookup per job.
//
// Fail-fast: the first failed lookup aborts the build and its error kind is
// kept. A failed build never yields a graph, so nothing partial gets cached.
class DependencyGraphBuilder {
public:
    explicit DependencyGraphBuilder(ISchedulerClient& client);

    GraphBuildResult build(const std::vector<et::mirror::domain::Job>& jobs);

private:
    ISchedulerClient& client_;
};

} // namespace et::mirror::app

#pragma once

#include <string>
#include <vector>

#include "domain/JobGraph.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::domain {

// The cached pairing of a job list and the graph derived from it.
// Always stored and loaded as one unit.
struct Snapshot {
    std::vector<Job> jobs;
    JobGraph         graph;
    TimePoint        createdAt{Clock::now()};
};

enum class SnapshotSource {
    Cache = 0,
    Fresh = 1
};

inline std::string to_string(SnapshotSource s) {
    switch (s) {
        case SnapshotSource::Cache: return "cache";
        case SnapshotSource::Fresh: return "fresh";
    }
    return "fresh";
}

} // namespace et::mirror::domain

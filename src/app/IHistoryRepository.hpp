#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace et::mirror::app {

struct HistoryQueryResult {
    bool                                      ok{false};
    et::mirror::domain::Error                 error;
    std::vector<et::mirror::domain::HistoryEntry> entries; // oldest first
};

struct JobNamesResult {
    bool                      ok{false};
    et::mirror::domain::Error error;
    std::vector<std::string>  names;
};

// Port/interface for the bounded job status history.
// Implementations live in infra (e.g. SQLite via QtSql).
//
// The log never holds more than its cap: every append drops the oldest
// entries beyond it. A store that does not exist yet reads as empty.
class IHistoryRepository {
public:
    virtual ~IHistoryRepository() = default;

    virtual et::mirror::domain::OpResult append(const et::mirror::domain::HistoryEntry& entry) = 0;

    // One write for many entries; preferred for bulk status updates.
    virtual et::mirror::domain::OpResult appendBatch(
        const std::vector<et::mirror::domain::HistoryEntry>& entries) = 0;

    // Most recent `limit` entries whose job name or job id matches.
    virtual HistoryQueryResult queryByJob(const std::string& nameOrId, int limit) const = 0;

    // Most recent `limit` entries overall.
    virtual HistoryQueryResult queryAll(int limit) const = 0;

    virtual JobNamesResult jobNames() const = 0;
};

} // namespace et::mirror::app

#pragma once

#include <QString>
#include <QtSql/QSqlDatabase>
#include <vector>

#include "domain/domain_model.hpp"
#include "app/IHistoryRepository.hpp"

namespace et::mirror::infra {

// Bounded status history stored in SQLite (table `history`).
//
// Row order (autoincrement id) is append order. Each append inserts and trims
// to the newest `cap` rows inside one write transaction, so the cap holds
// after every commit. SQLite's database lock serializes writers from several
// processes; a writer waits up to the busy timeout before failing.
class HistoryRepository : public et::mirror::app::IHistoryRepository {
public:
    explicit HistoryRepository(et::mirror::domain::HistorySettings settings);

    et::mirror::domain::OpResult append(const et::mirror::domain::HistoryEntry& entry) override;
    et::mirror::domain::OpResult appendBatch(
        const std::vector<et::mirror::domain::HistoryEntry>& entries) override;

    et::mirror::app::HistoryQueryResult queryByJob(const std::string& nameOrId, int limit) const override;
    et::mirror::app::HistoryQueryResult queryAll(int limit) const override;
    et::mirror::app::JobNamesResult jobNames() const override;

private:
    bool initSchema();

    et::mirror::domain::HistorySettings settings_;
    QSqlDatabase                        db_;
    QString                             openError_;
};

} // namespace et::mirror::infra

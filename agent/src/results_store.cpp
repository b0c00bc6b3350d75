#include "results_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ResultsStore::ResultsStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("ResultsStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection ResultsStore::make_connection() {
    return pqxx::connection(dsn_);
}

void ResultsStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS check_results (
                id BIGSERIAL PRIMARY KEY,
                title TEXT NOT NULL,
                endpoint TEXT NOT NULL,
                healthy BOOLEAN NOT NULL,
                degraded BOOLEAN NOT NULL,
                down BOOLEAN NOT NULL,
                result JSONB NOT NULL,
                checked_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_check_results_checked_at
            ON check_results (checked_at)
        )");

        txn.commit();
        spdlog::info("Database schema initialized");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void ResultsStore::store(const std::vector<Verdict>& verdicts) {
    if (verdicts.empty()) return;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        for (const auto& v : verdicts) {
            txn.exec_params(
                "INSERT INTO check_results (title, endpoint, healthy, degraded, down, result) "
                "VALUES ($1, $2, $3, $4, $5, $6::jsonb)",
                v.title, v.endpoint, v.healthy(), v.degraded(), v.down(), v.to_json().dump()
            );
        }

        txn.commit();
        spdlog::info("Stored {} verdicts", verdicts.size());
    } catch (const std::exception& e) {
        spdlog::error("Failed to store verdicts: {}", e.what());
        throw;
    }
}

size_t ResultsStore::maintain(std::chrono::hours expiry) {
    if (expiry.count() <= 0) {
        return 0;
    }

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "DELETE FROM check_results WHERE checked_at < NOW() - ($1 * INTERVAL '1 hour')",
            static_cast<int>(expiry.count())
        );

        txn.commit();
        size_t removed = static_cast<size_t>(result.affected_rows());
        if (removed > 0) {
            spdlog::info("Deleted {} verdicts older than {}h", removed, expiry.count());
        }
        return removed;
    } catch (const std::exception& e) {
        spdlog::error("Failed to prune verdicts: {}", e.what());
        throw;
    }
}

bool ResultsStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Postgres ping failed: {}", e.what());
        return false;
    }
}

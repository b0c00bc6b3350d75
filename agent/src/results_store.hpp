#pragma once
#include "verdict.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <pqxx/pqxx>

// Append-only history of verdicts with age-based pruning.
class ResultsStore {
public:
    explicit ResultsStore(const std::string& dsn);

    void init_schema();
    void store(const std::vector<Verdict>& verdicts);

    // Deletes rows older than `expiry`; a zero expiry keeps everything.
    // Returns the number of rows removed.
    size_t maintain(std::chrono::hours expiry);

    bool ping();

private:
    std::string dsn_;
    pqxx::connection make_connection();
};

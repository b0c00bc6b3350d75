#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Checks
    std::string checks_file;
    int max_parallel_checks;

    // Redis export (disabled when redis_url is empty)
    std::string redis_url;
    std::string stream_results;
    std::string test_location;

    // Postgres storage (disabled when pg_dsn is empty)
    std::string pg_dsn;
    int check_expiry_hours;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};

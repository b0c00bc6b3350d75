#pragma once
#include "verdict.hpp"
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    RedisBus(const std::string& redis_url, const std::string& run_location);

    // Returns the number of verdicts that could not be published
    size_t export_verdicts(const std::string& stream, const std::vector<Verdict>& verdicts);
    bool publish(const std::string& stream, const nlohmann::json& data);
    bool ping();

    // Flattened availability view of a verdict
    static nlohmann::json availability_record(const Verdict& verdict, const std::string& run_location);

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string run_location_;
};

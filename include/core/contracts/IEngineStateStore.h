#pragma once

#include <optional>

#include <nlohmann/json.hpp>

namespace perpscalp {
namespace core {

struct EngineStateSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    nlohmann::json risk_state = nlohmann::json::object();
    nlohmann::json positions = nlohmann::json::array();
    nlohmann::json manual_review = nlohmann::json::array();
};

class IEngineStateStore {
public:
    virtual ~IEngineStateStore() = default;

    // Empty when there is nothing usable. lastLoadCorrupt() tells a missing
    // file apart from one that exists but could not be parsed.
    virtual std::optional<EngineStateSnapshot> load() = 0;
    virtual bool lastLoadCorrupt() const = 0;
    virtual bool save(const EngineStateSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace perpscalp

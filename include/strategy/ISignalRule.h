#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/IndicatorPipeline.h"
#include "common/Types.h"

namespace perpscalp {
namespace strategy {

// Immutable once produced; consumed at most once by the risk gate.
struct Signal {
    std::string symbol;
    Direction direction = Direction::LONG;
    double confidence = 0.0;
    std::vector<std::string> triggering_rules;
    long long timestamp = 0;
    double reference_price = 0.0;
    double atr = 0.0;
};

struct RuleVote {
    std::string rule_name;
    std::optional<Direction> direction;   // empty = abstain
    double weight = 0.0;
    std::string detail;
};

// One independent entry rule. Rules see only indicator state; order-book
// and volume confirmation is applied afterwards by the engine's gate.
class ISignalRule {
public:
    virtual ~ISignalRule() = default;

    virtual std::string getName() const = 0;
    virtual RuleVote evaluate(const analytics::IndicatorState& state) const = 0;

    // Counter-trend rules are exempt from the trend filter.
    virtual bool followsTrend() const { return true; }
};

} // namespace strategy
} // namespace perpscalp

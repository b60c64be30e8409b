#pragma once

namespace perpscalp {

// Error taxonomy shared by every layer. Errors travel as values
// (RiskDecision, GatewayResult, IndicatorUpdate), never as exceptions.
enum class ErrorKind {
    NONE,
    DATA,               // stale or malformed market data: skip the cycle
    VALIDATION,         // bad order parameters: terminal for that signal
    TRANSIENT_GATEWAY,  // network / rate limit: bounded retry with backoff
    RISK_LIMIT,         // daily loss or trade cap: halt new entries
    RECONCILIATION      // local state disagrees with the venue: manual review
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::DATA: return "DataError";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::TRANSIENT_GATEWAY: return "TransientGatewayError";
        case ErrorKind::RISK_LIMIT: return "RiskLimitError";
        case ErrorKind::RECONCILIATION: return "ReconciliationError";
    }
    return "UNKNOWN";
}

} // namespace perpscalp

#ifndef BLOCKFLOW_TYPES_RECOVERY_H
#define BLOCKFLOW_TYPES_RECOVERY_H

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace blockflow {

struct FixedBackoff {
    std::chrono::milliseconds delay{100};
};

struct ExponentialBackoff {
    std::chrono::milliseconds initial{100};
    double factor = 2.0;
    std::chrono::milliseconds max{10000};
};

struct LinearBackoff {
    std::chrono::milliseconds initial{100};
    std::chrono::milliseconds increment{100};
    std::chrono::milliseconds max{5000};
};

using BackoffSpec = std::variant<FixedBackoff, ExponentialBackoff, LinearBackoff>;

enum class FallbackAction : uint8_t {
    SKIP,
    SIMPLIFY,
    REVERT,
    USE_ALTERNATE,
    SUBDIVIDE,
    ABORT
};

struct Fallback {
    FallbackAction action = FallbackAction::ABORT;
    std::string alternate; // only for USE_ALTERNATE
};

struct RecoveryPolicy {
    int max_retries = 1;
    BackoffSpec backoff = FixedBackoff{};
    Fallback fallback;
};

// Delay slept before retry number `retry` (0-based).
inline std::chrono::milliseconds backoff_delay(const BackoffSpec& spec, int retry) {
    using std::chrono::milliseconds;
    const double n = static_cast<double>(std::max(retry, 0));
    if (const auto* fixed = std::get_if<FixedBackoff>(&spec)) {
        return fixed->delay;
    }
    if (const auto* exp = std::get_if<ExponentialBackoff>(&spec)) {
        const double cap = static_cast<double>(exp->max.count());
        const double value = static_cast<double>(exp->initial.count()) * std::pow(exp->factor, n);
        if (!std::isfinite(value) || value >= cap) return exp->max;
        return milliseconds(static_cast<milliseconds::rep>(value));
    }
    const auto& lin = std::get<LinearBackoff>(spec);
    const double cap = static_cast<double>(lin.max.count());
    const double value = static_cast<double>(lin.initial.count()) + static_cast<double>(lin.increment.count()) * n;
    if (value >= cap) return lin.max;
    return milliseconds(static_cast<milliseconds::rep>(value));
}

inline std::string to_string(FallbackAction action) {
    switch (action) {
        case FallbackAction::SKIP: return "skip";
        case FallbackAction::SIMPLIFY: return "simplify";
        case FallbackAction::REVERT: return "revert";
        case FallbackAction::USE_ALTERNATE: return "use_alternate";
        case FallbackAction::SUBDIVIDE: return "subdivide";
        case FallbackAction::ABORT: return "abort";
    }
    return "unknown";
}

inline FallbackAction parse_fallback_action(const std::string& s) {
    if (s == "skip") return FallbackAction::SKIP;
    if (s == "simplify") return FallbackAction::SIMPLIFY;
    if (s == "revert") return FallbackAction::REVERT;
    if (s == "use_alternate") return FallbackAction::USE_ALTERNATE;
    if (s == "subdivide") return FallbackAction::SUBDIVIDE;
    if (s == "abort") return FallbackAction::ABORT;
    throw std::runtime_error("Unknown fallback action '" + s + "'");
}

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_RECOVERY_H

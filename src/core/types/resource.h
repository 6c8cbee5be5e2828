#ifndef BLOCKFLOW_TYPES_RESOURCE_H
#define BLOCKFLOW_TYPES_RESOURCE_H

#include "errors.h"
#include <chrono>
#include <cstdint>
#include <optional>

namespace blockflow {

struct ResourceUsage {
    double memory_mb = 0.0;
    double cpu_percent = 0.0;
    double disk_mb = 0.0;
};

// A limit <= 0 means unlimited.
struct ResourceLimits {
    double memory_mb = 4096.0;
    double cpu_percent = 100.0;
    double disk_mb = 10240.0;
    double warning_ratio = 0.9;
};

enum class ResourceStatus : uint8_t {
    NORMAL,
    WARNING,
    EXCEEDED
};

struct ResourceSample {
    std::chrono::steady_clock::time_point timestamp;
    ResourceUsage usage;
    ResourceLimits limits;
    ResourceUsage high_watermark;
};

struct ResourceReport {
    ResourceStatus memory = ResourceStatus::NORMAL;
    ResourceStatus cpu = ResourceStatus::NORMAL;
    ResourceStatus disk = ResourceStatus::NORMAL;

    bool any_exceeded() const {
        return memory == ResourceStatus::EXCEEDED || cpu == ResourceStatus::EXCEEDED ||
               disk == ResourceStatus::EXCEEDED;
    }

    std::optional<ResourceError::Kind> first_exceeded() const {
        if (memory == ResourceStatus::EXCEEDED) return ResourceError::Kind::MEMORY_LIMIT_EXCEEDED;
        if (cpu == ResourceStatus::EXCEEDED) return ResourceError::Kind::CPU_LIMIT_EXCEEDED;
        if (disk == ResourceStatus::EXCEEDED) return ResourceError::Kind::DISK_LIMIT_EXCEEDED;
        return std::nullopt;
    }
};

inline const char* to_string(ResourceStatus status) {
    switch (status) {
        case ResourceStatus::NORMAL: return "normal";
        case ResourceStatus::WARNING: return "warning";
        case ResourceStatus::EXCEEDED: return "exceeded";
    }
    return "unknown";
}

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_RESOURCE_H

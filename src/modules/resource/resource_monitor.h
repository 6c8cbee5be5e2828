// modules/resource/resource_monitor.h
#ifndef BLOCKFLOW_MODULES_RESOURCE_RESOURCE_MONITOR_H
#define BLOCKFLOW_MODULES_RESOURCE_RESOURCE_MONITOR_H

#include "core/types/resource.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace blockflow {

// Source of raw usage numbers.
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;
    virtual ResourceUsage sample() = 0;
};

// 读取当前进程: /proc/self/statm (RSS), getrusage (CPU), tracked directory size (disk)
class SystemResourceProbe : public ResourceProbe {
public:
    explicit SystemResourceProbe(std::optional<std::filesystem::path> tracked_dir = std::nullopt);

    ResourceUsage sample() override;

private:
    std::optional<std::filesystem::path> tracked_dir_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_wall_;
    double last_cpu_seconds_ = 0.0;
    bool has_previous_ = false;

    static double read_resident_mb();
    static double read_cpu_seconds();
    double read_disk_mb() const;
};

/**
 * One monitor per orchestration run, shared by the scheduler and the chunker.
 * All accessors lock; samples are taken at most once per interval.
 */
class ResourceMonitor {
public:
    using Clock = std::chrono::steady_clock;

    ResourceMonitor(ResourceLimits limits,
                    std::shared_ptr<ResourceProbe> probe,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    // Returns false when skipped because the interval has not elapsed.
    bool update();
    // Samples regardless of the interval.
    void force_update();

    ResourceReport check_limits();

    double memory_usage_percent() const;
    double cpu_usage_percent() const;
    double disk_usage_percent() const;

    ResourceSample current() const;
    const ResourceLimits& limits() const { return limits_; }

private:
    const ResourceLimits limits_;
    std::shared_ptr<ResourceProbe> probe_;
    const std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    ResourceSample sample_;
    bool sampled_ = false;

    void take_sample_locked(Clock::time_point now);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_RESOURCE_RESOURCE_MONITOR_H

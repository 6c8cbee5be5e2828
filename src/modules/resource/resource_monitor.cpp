// modules/resource/resource_monitor.cpp
#include "modules/resource/resource_monitor.h"
#include <sys/resource.h>
#include <unistd.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace blockflow {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

ResourceStatus classify(double usage, double limit, double warning_ratio) {
    if (limit <= 0.0) return ResourceStatus::NORMAL;
    if (usage > limit) return ResourceStatus::EXCEEDED;
    if (usage > limit * warning_ratio) return ResourceStatus::WARNING;
    return ResourceStatus::NORMAL;
}

double percent(double usage, double limit) {
    if (limit <= 0.0) return 0.0;
    return usage / limit * 100.0;
}

} // namespace

// --- SystemResourceProbe ---

SystemResourceProbe::SystemResourceProbe(std::optional<std::filesystem::path> tracked_dir)
    : tracked_dir_(std::move(tracked_dir)) {}

double SystemResourceProbe::read_resident_mb() {
    std::ifstream statm("/proc/self/statm");
    long total_pages = 0;
    long resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0.0;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    return static_cast<double>(resident_pages) * static_cast<double>(page_size) / kBytesPerMb;
}

double SystemResourceProbe::read_cpu_seconds() {
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    auto to_seconds = [](const timeval& tv) {
        return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
    };
    return to_seconds(usage.ru_utime) + to_seconds(usage.ru_stime);
}

double SystemResourceProbe::read_disk_mb() const {
    if (!tracked_dir_) return 0.0;
    std::error_code ec;
    if (!std::filesystem::exists(*tracked_dir_, ec)) return 0.0;

    uintmax_t total = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(*tracked_dir_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            const auto size = it->file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return static_cast<double>(total) / kBytesPerMb;
}

ResourceUsage SystemResourceProbe::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    ResourceUsage usage;
    usage.memory_mb = read_resident_mb();
    usage.disk_mb = read_disk_mb();

    const auto now = std::chrono::steady_clock::now();
    const double cpu_seconds = read_cpu_seconds();
    if (has_previous_) {
        const double wall = std::chrono::duration<double>(now - last_wall_).count();
        const unsigned cores = std::max(1u, std::thread::hardware_concurrency());
        if (wall > 0.0) {
            usage.cpu_percent = (cpu_seconds - last_cpu_seconds_) / wall / cores * 100.0;
        }
    }
    last_wall_ = now;
    last_cpu_seconds_ = cpu_seconds;
    has_previous_ = true;
    return usage;
}

// --- ResourceMonitor ---

ResourceMonitor::ResourceMonitor(ResourceLimits limits,
                                 std::shared_ptr<ResourceProbe> probe,
                                 std::chrono::milliseconds interval)
    : limits_(limits), probe_(std::move(probe)), interval_(interval) {
    if (!probe_) {
        throw std::invalid_argument("ResourceMonitor requires a probe");
    }
    sample_.limits = limits_;
}

bool ResourceMonitor::update() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    if (sampled_ && now - sample_.timestamp < interval_) {
        return false;
    }
    take_sample_locked(now);
    return true;
}

void ResourceMonitor::force_update() {
    std::lock_guard<std::mutex> lock(mutex_);
    take_sample_locked(Clock::now());
}

void ResourceMonitor::take_sample_locked(Clock::time_point now) {
    ResourceUsage usage = probe_->sample();
    sample_.timestamp = sampled_ ? std::max(now, sample_.timestamp) : now;
    sample_.usage = usage;
    sample_.high_watermark.memory_mb = std::max(sample_.high_watermark.memory_mb, usage.memory_mb);
    sample_.high_watermark.cpu_percent = std::max(sample_.high_watermark.cpu_percent, usage.cpu_percent);
    sample_.high_watermark.disk_mb = std::max(sample_.high_watermark.disk_mb, usage.disk_mb);
    sampled_ = true;
}

ResourceReport ResourceMonitor::check_limits() {
    update();
    std::lock_guard<std::mutex> lock(mutex_);
    ResourceReport report;
    report.memory = classify(sample_.usage.memory_mb, limits_.memory_mb, limits_.warning_ratio);
    report.cpu = classify(sample_.usage.cpu_percent, limits_.cpu_percent, limits_.warning_ratio);
    report.disk = classify(sample_.usage.disk_mb, limits_.disk_mb, limits_.warning_ratio);
    return report;
}

double ResourceMonitor::memory_usage_percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent(sample_.usage.memory_mb, limits_.memory_mb);
}

double ResourceMonitor::cpu_usage_percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent(sample_.usage.cpu_percent, limits_.cpu_percent);
}

double ResourceMonitor::disk_usage_percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent(sample_.usage.disk_mb, limits_.disk_mb);
}

ResourceSample ResourceMonitor::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_;
}

} // namespace blockflow

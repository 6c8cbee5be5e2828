// modules/scheduler/worker_pool.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_WORKER_POOL_H
#define BLOCKFLOW_MODULES_SCHEDULER_WORKER_POOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blockflow {

// Fixed set of threads draining a FIFO of tasks.
class WorkerPool {
public:
    // 0 = one thread per hardware core
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Tasks must not throw; callers carry failures back themselves.
    void submit(std::function<void()> task);

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void worker_loop();
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_WORKER_POOL_H

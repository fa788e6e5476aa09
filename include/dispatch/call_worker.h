// =============================================================================
// FILE: include/dispatch/call_worker.h
// =============================================================================
#ifndef CALL_WORKER_H
#define CALL_WORKER_H

#include "common/types.h"
#include "common/config.h"
#include "dispatch/call.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>

namespace sip_subscription {

class SlowTaskLogger;

struct WorkerStats {
    std::atomic<uint64_t> tasks_received{0};
    std::atomic<uint64_t> tasks_processed{0};
    std::atomic<uint64_t> tasks_dropped{0};
    std::atomic<uint64_t> tasks_timed_out{0};
    std::atomic<uint64_t> calls_active{0};
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> slow_tasks{0};
};

// One thread owning a shard of calls. Every operation is queued to that
// thread and the caller blocks until it has run or apply_timeout passes.
// A task still queued when its caller times out is dropped unrun; a task
// already running is waited for, since it may use the caller's references.
class CallWorker {
public:
    using CallFn = std::function<Result(Call&)>;

    CallWorker(size_t worker_index, const Config& config,
               std::shared_ptr<SlowTaskLogger> slow_logger);
    ~CallWorker();

    Result start();
    void stop();

    Result create_call(const ServiceId& service_id, const CallId& call_id);
    Result remove_call(const ServiceId& service_id, const CallId& call_id);
    Result apply(const ServiceId& service_id, const CallId& call_id,
                 const char* operation, CallFn fn);

    const WorkerStats& stats() const { return stats_; }
    size_t worker_index() const { return worker_index_; }

    static std::string call_key(const ServiceId& service_id, const CallId& call_id);

    CallWorker(const CallWorker&) = delete;
    CallWorker& operator=(const CallWorker&) = delete;

private:
    enum class TaskKind { kCreate, kRemove, kApply };

    struct TaskState {
        enum class Phase { kQueued, kRunning, kDone, kAbandoned };
        std::mutex mu;
        std::condition_variable cv;
        Phase phase = Phase::kQueued;
        Result result = Result::kError;
    };

    struct Task {
        TaskKind    kind = TaskKind::kApply;
        ServiceId   service_id;
        CallId      call_id;
        const char* operation = "";
        CallFn      fn;
        std::shared_ptr<TaskState> state;
        TimePoint   enqueued_at;
    };

    Result submit(Task task);
    void run();
    void execute(Task& task);
    Result run_task(Task& task);

    size_t worker_index_;
    Config config_;
    std::shared_ptr<SlowTaskLogger> slow_logger_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex incoming_mu_;
    std::condition_variable incoming_cv_;
    std::queue<Task> incoming_queue_;

    // Keyed by call_key(); worker thread only.
    std::unordered_map<std::string, Call> calls_;
    WorkerStats stats_;
};

} // namespace sip_subscription
#endif // CALL_WORKER_H

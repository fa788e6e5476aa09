// =============================================================================
// FILE: include/dispatch/call_dispatcher.h
// =============================================================================
#ifndef CALL_DISPATCHER_H
#define CALL_DISPATCHER_H

#include "common/types.h"
#include "common/config.h"
#include "dispatch/call_worker.h"
#include <functional>
#include <memory>
#include <vector>

namespace sip_subscription {

class SlowTaskLogger;

// Routes call operations to the worker owning the call:
// hash(service_id, call_id) % num_workers. Every operation blocks the
// caller; none may be issued from inside another call operation.
class CallDispatcher {
public:
    using CallFn   = std::function<Result(Call&)>;
    using DialogFn = std::function<Result(Dialog&)>;

    CallDispatcher(const Config& config, std::shared_ptr<SlowTaskLogger> slow_logger);
    ~CallDispatcher();

    Result start();
    void stop();
    bool started() const { return started_; }

    Result create_call(const ServiceId& service_id, const CallId& call_id);
    Result remove_call(const ServiceId& service_id, const CallId& call_id);

    // kNotFound when the call is gone; otherwise whatever fn returns.
    Result apply_call(const ServiceId& service_id, const CallId& call_id, CallFn fn);

    // kNotFound when the call or the dialog is gone.
    Result apply_dialog(const ServiceId& service_id, const CallId& call_id,
                        const DialogId& dialog_id, DialogFn fn);

    size_t worker_index_for(const ServiceId& service_id, const CallId& call_id) const;
    size_t num_workers() const { return workers_.size(); }
    CallWorker& worker(size_t idx) { return *workers_[idx]; }
    const CallWorker& worker(size_t idx) const { return *workers_[idx]; }

    struct AggregateStats {
        uint64_t total_tasks_received = 0, total_tasks_processed = 0;
        uint64_t total_tasks_dropped = 0, total_tasks_timed_out = 0;
        uint64_t total_calls_active = 0, total_slow_tasks = 0;
        uint64_t max_queue_depth = 0;
    };
    AggregateStats aggregate_stats() const;

    CallDispatcher(const CallDispatcher&) = delete;
    CallDispatcher& operator=(const CallDispatcher&) = delete;

private:
    CallWorker* route(const ServiceId& service_id, const CallId& call_id, Result& err);

    Config config_;
    std::vector<std::unique_ptr<CallWorker>> workers_;
    bool started_ = false;
};

} // namespace sip_subscription
#endif // CALL_DISPATCHER_H

// =============================================================================
// FILE: src/dispatch/call_dispatcher.cpp
// =============================================================================
#include "dispatch/call_dispatcher.h"
#include "common/slow_task_logger.h"
#include "common/logger.h"
#include <string>

namespace sip_subscription {

CallDispatcher::CallDispatcher(const Config& config,
                               std::shared_ptr<SlowTaskLogger> slow_logger)
    : config_(config) {
    if (!slow_logger) slow_logger = std::make_shared<SlowTaskLogger>(config_);
    size_t n = config_.num_workers > 0 ? config_.num_workers : Config::default_worker_count();
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i)
        workers_.push_back(std::make_unique<CallWorker>(i, config_, slow_logger));
}

CallDispatcher::~CallDispatcher() { stop(); }

Result CallDispatcher::start() {
    if (started_) return Result::kAlreadyExists;
    for (auto& w : workers_) {
        auto r = w->start();
        if (r != Result::kOk) {
            LOG_ERROR("CallDispatcher: worker %zu failed to start: %s",
                      w->worker_index(), result_to_string(r));
            for (auto& started : workers_) started->stop();
            return r;
        }
    }
    started_ = true;
    LOG_INFO("CallDispatcher: started %zu workers", workers_.size());
    return Result::kOk;
}

void CallDispatcher::stop() {
    if (!started_) return;
    for (auto& w : workers_) w->stop();
    started_ = false;
    LOG_INFO("CallDispatcher: stopped");
}

size_t CallDispatcher::worker_index_for(const ServiceId& service_id, const CallId& call_id) const {
    return std::hash<std::string>{}(CallWorker::call_key(service_id, call_id)) % workers_.size();
}

CallWorker* CallDispatcher::route(const ServiceId& service_id, const CallId& call_id, Result& err) {
    if (!started_) { err = Result::kShuttingDown; return nullptr; }
    if (call_id.empty()) { err = Result::kInvalidArgument; return nullptr; }
    return workers_[worker_index_for(service_id, call_id)].get();
}

Result CallDispatcher::create_call(const ServiceId& service_id, const CallId& call_id) {
    Result err = Result::kOk;
    CallWorker* w = route(service_id, call_id, err);
    if (!w) return err;
    return w->create_call(service_id, call_id);
}

Result CallDispatcher::remove_call(const ServiceId& service_id, const CallId& call_id) {
    Result err = Result::kOk;
    CallWorker* w = route(service_id, call_id, err);
    if (!w) return err;
    return w->remove_call(service_id, call_id);
}

Result CallDispatcher::apply_call(const ServiceId& service_id, const CallId& call_id, CallFn fn) {
    Result err = Result::kOk;
    CallWorker* w = route(service_id, call_id, err);
    if (!w) return err;
    return w->apply(service_id, call_id, "apply_call", std::move(fn));
}

Result CallDispatcher::apply_dialog(const ServiceId& service_id, const CallId& call_id,
                                    const DialogId& dialog_id, DialogFn fn) {
    if (!fn) return Result::kInvalidArgument;
    Result err = Result::kOk;
    CallWorker* w = route(service_id, call_id, err);
    if (!w) return err;
    return w->apply(service_id, call_id, "apply_dialog",
        [&dialog_id, &fn](Call& call) {
            Dialog* dialog = call.find_dialog(dialog_id);
            if (!dialog) return Result::kNotFound;
            return fn(*dialog);
        });
}

CallDispatcher::AggregateStats CallDispatcher::aggregate_stats() const {
    AggregateStats a{};
    for (const auto& w : workers_) {
        const auto& s = w->stats();
        a.total_tasks_received  += s.tasks_received.load();
        a.total_tasks_processed += s.tasks_processed.load();
        a.total_tasks_dropped   += s.tasks_dropped.load();
        a.total_tasks_timed_out += s.tasks_timed_out.load();
        a.total_calls_active    += s.calls_active.load();
        a.total_slow_tasks      += s.slow_tasks.load();
        uint64_t qd = s.queue_depth.load();
        if (qd > a.max_queue_depth) a.max_queue_depth = qd;
    }
    return a;
}

} // namespace sip_subscription

// =============================================================================
// FILE: src/dispatch/call_worker.cpp
// =============================================================================
#include "dispatch/call_worker.h"
#include "common/slow_task_logger.h"
#include "common/logger.h"
#include <exception>

namespace sip_subscription {

namespace {

// Set while a worker thread runs tasks; a task that submits to any worker
// would block the thread it needs.
thread_local const CallWorker* tl_current_worker = nullptr;

} // namespace

CallWorker::CallWorker(size_t idx, const Config& config,
                       std::shared_ptr<SlowTaskLogger> slow_logger)
    : worker_index_(idx), config_(config)
    , slow_logger_(slow_logger ? std::move(slow_logger)
                               : std::make_shared<SlowTaskLogger>(config))
{}

CallWorker::~CallWorker() { stop(); }

std::string CallWorker::call_key(const ServiceId& service_id, const CallId& call_id) {
    return std::to_string(service_id.size()) + ":" + service_id + "|" + call_id;
}

Result CallWorker::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false);
    running_.store(true);
    thread_ = std::thread(&CallWorker::run, this);
    return Result::kOk;
}

void CallWorker::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(incoming_mu_); stop_requested_.store(true); }
    incoming_cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);

    if (!calls_.empty()) {
        LOG_DEBUG("Worker %zu: dropping %zu calls on stop", worker_index_, calls_.size());
    }
    calls_.clear();
    stats_.calls_active.store(0);
}

Result CallWorker::create_call(const ServiceId& service_id, const CallId& call_id) {
    Task task;
    task.kind = TaskKind::kCreate;
    task.service_id = service_id;
    task.call_id = call_id;
    task.operation = "create_call";
    return submit(std::move(task));
}

Result CallWorker::remove_call(const ServiceId& service_id, const CallId& call_id) {
    Task task;
    task.kind = TaskKind::kRemove;
    task.service_id = service_id;
    task.call_id = call_id;
    task.operation = "remove_call";
    return submit(std::move(task));
}

Result CallWorker::apply(const ServiceId& service_id, const CallId& call_id,
                         const char* operation, CallFn fn) {
    if (!fn) return Result::kInvalidArgument;
    Task task;
    task.kind = TaskKind::kApply;
    task.service_id = service_id;
    task.call_id = call_id;
    task.operation = operation;
    task.fn = std::move(fn);
    return submit(std::move(task));
}

Result CallWorker::submit(Task task) {
    if (tl_current_worker != nullptr) {
        LOG_ERROR("Worker %zu: %s for call=%s submitted from a worker thread",
                  worker_index_, task.operation, task.call_id.c_str());
        return Result::kInvalidArgument;
    }

    auto state = std::make_shared<TaskState>();
    task.state = state;
    task.enqueued_at = Clock::now();
    const char* operation = task.operation;
    CallId call_id = task.call_id;

    {
        std::lock_guard<std::mutex> lk(incoming_mu_);
        if (!running_.load() || stop_requested_.load()) return Result::kShuttingDown;
        if (incoming_queue_.size() >= config_.max_incoming_queue_per_worker) {
            stats_.tasks_dropped.fetch_add(1);
            return Result::kCapacityExceeded;
        }
        incoming_queue_.push(std::move(task));
        stats_.tasks_received.fetch_add(1);
        stats_.queue_depth.store(incoming_queue_.size());
    }
    incoming_cv_.notify_one();

    std::unique_lock<std::mutex> lk(state->mu);
    bool done = state->cv.wait_for(lk, config_.apply_timeout, [&state] {
        return state->phase == TaskState::Phase::kDone;
    });
    if (done) return state->result;

    if (state->phase == TaskState::Phase::kQueued) {
        state->phase = TaskState::Phase::kAbandoned;
        stats_.tasks_timed_out.fetch_add(1);
        LOG_WARN("Worker %zu: %s call=%s timed out after %lldms in queue",
                 worker_index_, operation, call_id.c_str(),
                 static_cast<long long>(config_.apply_timeout.count()));
        return Result::kTimeout;
    }

    state->cv.wait(lk, [&state] { return state->phase == TaskState::Phase::kDone; });
    return state->result;
}

void CallWorker::run() {
    tl_current_worker = this;
    std::queue<Task> local_batch;

    while (true) {
        {
            std::unique_lock<std::mutex> lk(incoming_mu_);
            incoming_cv_.wait_for(lk, Millisecs(100), [this] {
                return !incoming_queue_.empty() || stop_requested_.load();
            });
            if (stop_requested_.load() && incoming_queue_.empty()) break;
            std::swap(local_batch, incoming_queue_);
            stats_.queue_depth.store(0);
        }

        while (!local_batch.empty()) {
            execute(local_batch.front());
            local_batch.pop();
        }
    }

    tl_current_worker = nullptr;
}

void CallWorker::execute(Task& task) {
    {
        std::lock_guard<std::mutex> lk(task.state->mu);
        if (task.state->phase == TaskState::Phase::kAbandoned) {
            LOG_DEBUG("Worker %zu: skipping abandoned %s call=%s",
                      worker_index_, task.operation, task.call_id.c_str());
            return;
        }
        task.state->phase = TaskState::Phase::kRunning;
    }

    SlowTaskLogger::Timer timer(*slow_logger_, task.operation, task.call_id,
                                "service=" + task.service_id);
    Result result = run_task(task);
    timer.finish();
    if (timer.elapsed() >= config_.slow_task_warn_threshold) {
        stats_.slow_tasks.fetch_add(1);
    }
    stats_.tasks_processed.fetch_add(1);

    {
        std::lock_guard<std::mutex> lk(task.state->mu);
        task.state->result = result;
        task.state->phase = TaskState::Phase::kDone;
    }
    task.state->cv.notify_all();
}

Result CallWorker::run_task(Task& task) {
    std::string key = call_key(task.service_id, task.call_id);

    switch (task.kind) {
        case TaskKind::kCreate: {
            if (calls_.count(key)) return Result::kAlreadyExists;
            if (calls_.size() >= config_.max_calls_per_worker) {
                LOG_WARN("Worker %zu: call limit %zu reached, rejecting call=%s",
                         worker_index_, config_.max_calls_per_worker, task.call_id.c_str());
                return Result::kCapacityExceeded;
            }
            Call call;
            call.service_id = task.service_id;
            call.call_id = task.call_id;
            calls_.emplace(std::move(key), std::move(call));
            stats_.calls_active.store(calls_.size());
            LOG_DEBUG("Worker %zu: created call=%s service=%s",
                      worker_index_, task.call_id.c_str(), task.service_id.c_str());
            return Result::kOk;
        }

        case TaskKind::kRemove: {
            if (calls_.erase(key) == 0) return Result::kNotFound;
            stats_.calls_active.store(calls_.size());
            LOG_DEBUG("Worker %zu: removed call=%s service=%s",
                      worker_index_, task.call_id.c_str(), task.service_id.c_str());
            return Result::kOk;
        }

        case TaskKind::kApply: {
            auto it = calls_.find(key);
            if (it == calls_.end()) return Result::kNotFound;
            try {
                return task.fn(it->second);
            } catch (const std::exception& e) {
                LOG_ERROR("Worker %zu: %s call=%s threw: %s",
                          worker_index_, task.operation, task.call_id.c_str(), e.what());
                return Result::kError;
            }
        }
    }
    return Result::kError;
}

} // namespace sip_subscription

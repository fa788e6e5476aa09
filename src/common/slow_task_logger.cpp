// =============================================================================
// FILE: src/common/slow_task_logger.cpp
// =============================================================================
#include "common/slow_task_logger.h"
#include "common/logger.h"

namespace sip_subscription {

SlowTaskLogger::SlowTaskLogger(const Config& config)
    : warn_ms_(config.slow_task_warn_threshold.count())
    , error_ms_(config.slow_task_error_threshold.count())
    , critical_ms_(config.slow_task_critical_threshold.count())
{}

void SlowTaskLogger::set_thresholds(Millisecs warn, Millisecs error, Millisecs critical) {
    warn_ms_.store(warn.count(), std::memory_order_relaxed);
    error_ms_.store(error.count(), std::memory_order_relaxed);
    critical_ms_.store(critical.count(), std::memory_order_relaxed);
}

SlowTaskLogger::Thresholds SlowTaskLogger::thresholds() const {
    return {
        Millisecs(warn_ms_.load(std::memory_order_relaxed)),
        Millisecs(error_ms_.load(std::memory_order_relaxed)),
        Millisecs(critical_ms_.load(std::memory_order_relaxed))
    };
}

void SlowTaskLogger::check_and_log(const char* operation,
                                   const std::string& call_id,
                                   const std::string& extra_context,
                                   Millisecs elapsed) {
    int64_t ms = elapsed.count();
    long long ms_ll = static_cast<long long>(ms);

    uint64_t prev_max = stats_.max_duration_ms.load(std::memory_order_relaxed);
    while (ms > 0 && static_cast<uint64_t>(ms) > prev_max) {
        if (stats_.max_duration_ms.compare_exchange_weak(prev_max, static_cast<uint64_t>(ms),
                std::memory_order_relaxed)) break;
    }

    if (ms >= critical_ms_.load(std::memory_order_relaxed)) {
        stats_.critical_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW_TASK CRITICAL: %s took %lldms call=%s %s",
                  operation, ms_ll, call_id.c_str(), extra_context.c_str());
    } else if (ms >= error_ms_.load(std::memory_order_relaxed)) {
        stats_.error_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW_TASK: %s took %lldms call=%s %s",
                  operation, ms_ll, call_id.c_str(), extra_context.c_str());
    } else if (ms >= warn_ms_.load(std::memory_order_relaxed)) {
        stats_.warn_count.fetch_add(1, std::memory_order_relaxed);
        LOG_SLOW("SLOW_TASK: %s took %lldms call=%s %s",
                 operation, ms_ll, call_id.c_str(), extra_context.c_str());
    }
}

SlowTaskLogger::Timer::Timer(SlowTaskLogger& logger, const char* operation,
                             const std::string& call_id, const std::string& extra)
    : logger_(logger), operation_(operation), call_id_(call_id)
    , extra_context_(extra), start_(Clock::now())
{}

SlowTaskLogger::Timer::~Timer() {
    if (!finished_) finish();
}

void SlowTaskLogger::Timer::finish() {
    if (finished_) return;
    finished_ = true;
    logger_.check_and_log(operation_, call_id_, extra_context_, elapsed());
}

} // namespace sip_subscription

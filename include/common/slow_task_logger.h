// =============================================================================
// FILE: include/common/slow_task_logger.h
// =============================================================================
#ifndef SLOW_TASK_LOGGER_H
#define SLOW_TASK_LOGGER_H

#include "common/types.h"
#include "common/config.h"
#include <atomic>
#include <string>

namespace sip_subscription {

// Logs call tasks whose run time crosses the configured thresholds.
// Usage:
//   SlowTaskLogger::Timer timer(slow_logger, "apply_dialog", call_id);
//   ... run task ...
//   timer.finish(); // or let the destructor do it
//
//   >= warn_threshold:     LOG_SLOW
//   >= error_threshold:    LOG_ERROR
//   >= critical_threshold: LOG_ERROR, counted separately
class SlowTaskLogger {
public:
    explicit SlowTaskLogger(const Config& config);

    void set_thresholds(Millisecs warn, Millisecs error, Millisecs critical);

    struct Thresholds {
        Millisecs warn;
        Millisecs error;
        Millisecs critical;
    };
    Thresholds thresholds() const;

    class Timer {
    public:
        Timer(SlowTaskLogger& logger,
              const char* operation,
              const std::string& call_id,
              const std::string& extra_context = "");
        ~Timer();

        void finish();

        Millisecs elapsed() const {
            return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
        }

    private:
        SlowTaskLogger& logger_;
        const char* operation_;
        std::string call_id_;
        std::string extra_context_;
        TimePoint start_;
        bool finished_ = false;
    };

    struct Stats {
        std::atomic<uint64_t> warn_count{0};
        std::atomic<uint64_t> error_count{0};
        std::atomic<uint64_t> critical_count{0};
        std::atomic<uint64_t> max_duration_ms{0};
    };
    const Stats& stats() const { return stats_; }

private:
    friend class Timer;
    void check_and_log(const char* operation,
                       const std::string& call_id,
                       const std::string& extra_context,
                       Millisecs elapsed);

    std::atomic<int64_t> warn_ms_;
    std::atomic<int64_t> error_ms_;
    std::atomic<int64_t> critical_ms_;
    Stats stats_;
};

} // namespace sip_subscription
#endif // SLOW_TASK_LOGGER_H

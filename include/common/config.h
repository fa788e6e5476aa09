// =============================================================================
// FILE: include/common/config.h
// =============================================================================
#ifndef COMMON_CONFIG_H
#define COMMON_CONFIG_H

#include "common/types.h"
#include <cstddef>
#include <string>
#include <unordered_map>

namespace sip_subscription {

struct LoggingOptions;

struct Config {
    // General
    std::string service_id     = "sipsub-01";
    std::string log_level_str  = "info";

    // Call dispatcher
    size_t    num_workers                   = 0;
    size_t    max_incoming_queue_per_worker = 50000;
    size_t    max_calls_per_worker          = 200000;
    Millisecs apply_timeout                 = Millisecs(5000);

    // Slow task logging thresholds
    Millisecs slow_task_warn_threshold      = Millisecs(50);
    Millisecs slow_task_error_threshold     = Millisecs(200);
    Millisecs slow_task_critical_threshold  = Millisecs(1000);

    // Logging
    std::string log_directory           = "/var/log/sip_subscription";
    std::string log_base_name           = "sip_subscription";
    std::string log_console_level_str   = "warn";
    size_t      log_max_file_size_mb    = 50;
    int         log_max_rotated_files   = 10;
    bool        log_split_debug_file    = true;

    LoggingOptions logging_options() const;

    // Parse from INI-style config file
    static Config load_from_file(const std::string& path);
    static Config load_defaults();
    static size_t default_worker_count();

private:
    static std::unordered_map<std::string, std::string> parse_ini(const std::string& path);
    static std::string get_or(const std::unordered_map<std::string, std::string>& m,
                               const std::string& key, const std::string& def);
    static int get_int(const std::unordered_map<std::string, std::string>& m,
                        const std::string& key, int def);
    static size_t get_size(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, size_t def);
    static bool get_bool(const std::unordered_map<std::string, std::string>& m,
                          const std::string& key, bool def);
};

} // namespace sip_subscription
#endif // COMMON_CONFIG_H

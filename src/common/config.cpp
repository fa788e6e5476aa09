// =============================================================================
// FILE: src/common/config.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include <thread>
#include <fstream>
#include <stdexcept>
#include <cstdlib>

namespace sip_subscription {

namespace {

void trim(std::string& s, const char* ws = " \t\r\n") {
    s.erase(0, s.find_first_not_of(ws));
    s.erase(s.find_last_not_of(ws) + 1);
}

// ${ENV_VAR} -> value of ENV_VAR, empty when unset
void substitute_env(std::string& val) {
    size_t pos = 0;
    while ((pos = val.find("${", pos)) != std::string::npos) {
        auto end = val.find('}', pos);
        if (end == std::string::npos) break;
        std::string env_name = val.substr(pos + 2, end - pos - 2);
        const char* env_val = std::getenv(env_name.c_str());
        std::string replacement = env_val ? env_val : "";
        val.replace(pos, end - pos + 1, replacement);
        pos += replacement.size();
    }
}

} // namespace

std::unordered_map<std::string, std::string> Config::parse_ini(const std::string& path) {
    std::unordered_map<std::string, std::string> map;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: %s", path.c_str());
        return map;
    }

    std::string section, line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) section = line.substr(1, end - 1);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key, " \t");
        trim(val, " \t");
        substitute_env(val);

        map[section.empty() ? key : section + "." + key] = val;
    }
    return map;
}

std::string Config::get_or(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, const std::string& def) {
    auto it = m.find(key);
    return (it != m.end()) ? it->second : def;
}

int Config::get_int(const std::unordered_map<std::string, std::string>& m,
                     const std::string& key, int def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        LOG_WARN("Config: '%s' is not an integer (%s), using %d",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

size_t Config::get_size(const std::unordered_map<std::string, std::string>& m,
                         const std::string& key, size_t def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoull(it->second);
    } catch (const std::logic_error&) {
        LOG_WARN("Config: '%s' is not a size (%s), using %zu",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

bool Config::get_bool(const std::unordered_map<std::string, std::string>& m,
                       const std::string& key, bool def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    return (it->second == "true" || it->second == "1" || it->second == "yes");
}

size_t Config::default_worker_count() {
    unsigned int hw = std::thread::hardware_concurrency();
    return (hw > 0) ? hw : 8;
}

LoggingOptions Config::logging_options() const {
    LoggingOptions opts;
    opts.directory           = log_directory;
    opts.base_name           = log_base_name;
    opts.console_level       = parse_log_level(log_console_level_str);
    opts.max_file_size_bytes = log_max_file_size_mb * 1024 * 1024;
    opts.max_rotated_files   = log_max_rotated_files;
    opts.split_debug_file    = log_split_debug_file;
    return opts;
}

Config Config::load_defaults() {
    Config cfg;
    cfg.num_workers = default_worker_count();
    LOG_INFO("Config: defaults loaded, %zu workers", cfg.num_workers);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    auto m = parse_ini(path);
    if (m.empty()) {
        LOG_WARN("Config: empty or missing file '%s', using defaults", path.c_str());
        return load_defaults();
    }

    Config c;

    // General
    c.service_id     = get_or(m, "general.service_id", c.service_id);
    c.log_level_str  = get_or(m, "general.log_level", c.log_level_str);

    // Dispatcher
    c.num_workers = get_size(m, "dispatcher.num_workers", 0);
    if (c.num_workers == 0) c.num_workers = default_worker_count();
    c.max_incoming_queue_per_worker = get_size(m, "dispatcher.max_incoming_queue_per_worker",
                                               c.max_incoming_queue_per_worker);
    c.max_calls_per_worker = get_size(m, "dispatcher.max_calls_per_worker", c.max_calls_per_worker);
    c.apply_timeout        = Millisecs(get_int(m, "dispatcher.apply_timeout_ms", 5000));

    // Slow task
    c.slow_task_warn_threshold     = Millisecs(get_int(m, "slow_task.warn_threshold_ms", 50));
    c.slow_task_error_threshold    = Millisecs(get_int(m, "slow_task.error_threshold_ms", 200));
    c.slow_task_critical_threshold = Millisecs(get_int(m, "slow_task.critical_threshold_ms", 1000));

    // Logging
    c.log_directory         = get_or(m, "logging.directory", c.log_directory);
    c.log_base_name         = get_or(m, "logging.base_name", c.log_base_name);
    c.log_console_level_str = get_or(m, "logging.console_level", c.log_console_level_str);
    c.log_max_file_size_mb  = get_size(m, "logging.max_file_size_mb", 50);
    c.log_max_rotated_files = get_int(m, "logging.max_rotated_files", 10);
    c.log_split_debug_file  = get_bool(m, "logging.split_debug_file", true);

    LOG_INFO("Config: loaded from '%s', service=%s workers=%zu apply_timeout=%lldms",
             path.c_str(), c.service_id.c_str(), c.num_workers,
             static_cast<long long>(c.apply_timeout.count()));

    return c;
}

} // namespace sip_subscription

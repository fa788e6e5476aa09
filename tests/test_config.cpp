// =============================================================================
// FILE: tests/test_config.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/config.h"
#include "common/logger.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace sip_subscription;

TEST(Config, LoadDefaults) {
    auto c = Config::load_defaults();
    EXPECT_GT(c.num_workers, 0u);
    EXPECT_EQ(c.service_id, "sipsub-01");
    EXPECT_EQ(c.apply_timeout.count(), 5000);
    EXPECT_EQ(c.max_incoming_queue_per_worker, 50000u);
}

TEST(Config, LoadFromFile) {
    const char* path = "/tmp/test_sipsub.conf";
    std::ofstream f(path);
    f << "[general]\nservice_id = test-svc\nlog_level = debug\n\n"
      << "[dispatcher]\nnum_workers = 4\napply_timeout_ms = 250\n"
      << "max_calls_per_worker = 10\n\n"
      << "[slow_task]\nwarn_threshold_ms = 5\n\n"
      << "[logging]\ndirectory = /tmp/sipsub-logs\nsplit_debug_file = false\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.service_id, "test-svc");
    EXPECT_EQ(c.log_level_str, "debug");
    EXPECT_EQ(c.num_workers, 4u);
    EXPECT_EQ(c.apply_timeout.count(), 250);
    EXPECT_EQ(c.max_calls_per_worker, 10u);
    EXPECT_EQ(c.slow_task_warn_threshold.count(), 5);
    EXPECT_EQ(c.slow_task_error_threshold.count(), 200);
    EXPECT_EQ(c.log_directory, "/tmp/sipsub-logs");
    EXPECT_FALSE(c.log_split_debug_file);

    remove(path);
}

TEST(Config, EnvSubstitution) {
    const char* path = "/tmp/test_sipsub_env.conf";
    setenv("SIPSUB_TEST_SERVICE", "from-env", 1);
    std::ofstream f(path);
    f << "[general]\nservice_id = ${SIPSUB_TEST_SERVICE}-1\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.service_id, "from-env-1");

    unsetenv("SIPSUB_TEST_SERVICE");
    remove(path);
}

TEST(Config, BadNumberFallsBackToDefault) {
    const char* path = "/tmp/test_sipsub_bad.conf";
    std::ofstream f(path);
    f << "; comment\n[dispatcher]\napply_timeout_ms = soon\nnum_workers = 2\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.apply_timeout.count(), 5000);
    EXPECT_EQ(c.num_workers, 2u);

    remove(path);
}

TEST(Config, MissingFileUsesDefaults) {
    auto c = Config::load_from_file("/tmp/does-not-exist-sipsub.conf");
    EXPECT_EQ(c.service_id, "sipsub-01");
    EXPECT_GT(c.num_workers, 0u);
}

TEST(Config, LoggingOptions) {
    Config c;
    c.log_max_file_size_mb = 2;
    c.log_console_level_str = "error";
    auto opts = c.logging_options();
    EXPECT_EQ(opts.max_file_size_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(opts.console_level, LogLevel::kError);
    EXPECT_EQ(opts.directory, c.log_directory);
}

// =============================================================================
// FILE: tests/test_call_dispatcher.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "dispatch/call_dispatcher.h"
#include "common/slow_task_logger.h"
#include "sip/sip_dialog_id.h"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace sip_subscription;

class CallDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.num_workers = 4;
        config_.apply_timeout = Millisecs(2000);
        config_.slow_task_warn_threshold = Millisecs(10000);
        config_.slow_task_error_threshold = Millisecs(20000);
        config_.slow_task_critical_threshold = Millisecs(30000);
    }

    static Dialog make_dialog(const ServiceId& service, const CallId& call,
                              const std::string& local_tag, const std::string& remote_tag) {
        Dialog d;
        d.service_id = service;
        d.call_id = call;
        d.local_tag = local_tag;
        d.remote_tag = remote_tag;
        d.id = DialogIdBuilder::build(call, local_tag, remote_tag);
        return d;
    }

    Config config_;
};

TEST_F(CallDispatcherTest, RejectsBeforeStart) {
    CallDispatcher dispatcher(config_, nullptr);
    EXPECT_EQ(dispatcher.create_call("svc", "call-1"), Result::kShuttingDown);
}

TEST_F(CallDispatcherTest, ZeroWorkersUsesHardwareConcurrency) {
    config_.num_workers = 0;
    CallDispatcher dispatcher(config_, nullptr);
    EXPECT_EQ(dispatcher.num_workers(), Config::default_worker_count());
    EXPECT_LT(dispatcher.worker_index_for("svc", "call-1"), dispatcher.num_workers());
}

TEST_F(CallDispatcherTest, CreateApplyRemove) {
    CallDispatcher dispatcher(config_, std::make_shared<SlowTaskLogger>(config_));
    ASSERT_EQ(dispatcher.start(), Result::kOk);

    EXPECT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);
    EXPECT_EQ(dispatcher.create_call("svc", "call-1"), Result::kAlreadyExists);

    std::string seen;
    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [&seen](Call& call) {
        seen = call.call_id;
        return Result::kOk;
    }), Result::kOk);
    EXPECT_EQ(seen, "call-1");

    EXPECT_EQ(dispatcher.remove_call("svc", "call-1"), Result::kOk);
    EXPECT_EQ(dispatcher.remove_call("svc", "call-1"), Result::kNotFound);
    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [](Call&) { return Result::kOk; }),
              Result::kNotFound);
}

TEST_F(CallDispatcherTest, CallsAreScopedByService) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);

    ASSERT_EQ(dispatcher.create_call("svc-a", "call-1"), Result::kOk);
    EXPECT_EQ(dispatcher.create_call("svc-b", "call-1"), Result::kOk);
    EXPECT_EQ(dispatcher.remove_call("svc-a", "call-1"), Result::kOk);
    EXPECT_EQ(dispatcher.apply_call("svc-b", "call-1", [](Call&) { return Result::kOk; }),
              Result::kOk);
}

TEST_F(CallDispatcherTest, FunctionResultIsReturned) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);

    EXPECT_EQ(dispatcher.apply_call("svc", "call-1",
                                    [](Call&) { return Result::kInvalidSubscription; }),
              Result::kInvalidSubscription);
}

TEST_F(CallDispatcherTest, ApplyDialog) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);

    Dialog d = make_dialog("svc", "call-1", "a", "b");
    ASSERT_EQ(dispatcher.apply_call("svc", "call-1",
                                    [&d](Call& call) { return call.add_dialog(d); }),
              Result::kOk);
    EXPECT_EQ(dispatcher.apply_call("svc", "call-1",
                                    [&d](Call& call) { return call.add_dialog(d); }),
              Result::kAlreadyExists);

    std::string remote_tag;
    EXPECT_EQ(dispatcher.apply_dialog("svc", "call-1", d.id, [&remote_tag](Dialog& dialog) {
        remote_tag = dialog.remote_tag;
        dialog.remote_seq = 9;
        return Result::kOk;
    }), Result::kOk);
    EXPECT_EQ(remote_tag, "b");

    uint32_t seq = 0;
    EXPECT_EQ(dispatcher.apply_dialog("svc", "call-1", d.id, [&seq](Dialog& dialog) {
        seq = dialog.remote_seq;
        return Result::kOk;
    }), Result::kOk);
    EXPECT_EQ(seq, 9u);

    EXPECT_EQ(dispatcher.apply_dialog("svc", "call-1", "no-such-dialog",
                                      [](Dialog&) { return Result::kOk; }),
              Result::kNotFound);
    EXPECT_EQ(dispatcher.apply_dialog("svc", "call-2", d.id,
                                      [](Dialog&) { return Result::kOk; }),
              Result::kNotFound);
}

TEST_F(CallDispatcherTest, AddDialogValidatesOwnership) {
    Call call;
    call.service_id = "svc";
    call.call_id = "call-1";
    EXPECT_EQ(call.add_dialog(make_dialog("svc", "call-2", "a", "b")), Result::kInvalidArgument);
    EXPECT_EQ(call.add_dialog(make_dialog("other", "call-1", "a", "b")), Result::kInvalidArgument);
    EXPECT_EQ(call.add_dialog(make_dialog("svc", "call-1", "a", "b")), Result::kOk);
    EXPECT_EQ(call.remove_dialog(DialogIdBuilder::build("call-1", "a", "b")), Result::kOk);
    EXPECT_EQ(call.remove_dialog(DialogIdBuilder::build("call-1", "a", "b")), Result::kNotFound);
}

TEST_F(CallDispatcherTest, EmptyCallIdRejected) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    EXPECT_EQ(dispatcher.create_call("svc", ""), Result::kInvalidArgument);
}

TEST_F(CallDispatcherTest, RoutingIsStable) {
    CallDispatcher dispatcher(config_, nullptr);
    size_t idx = dispatcher.worker_index_for("svc", "call-1");
    EXPECT_LT(idx, dispatcher.num_workers());
    for (int i = 0; i < 10; ++i) EXPECT_EQ(dispatcher.worker_index_for("svc", "call-1"), idx);
}

TEST_F(CallDispatcherTest, TimedOutTaskNeverRuns) {
    config_.num_workers = 1;
    config_.apply_timeout = Millisecs(100);
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blocker_started{false};

    // Occupies the only worker for longer than the timeout.
    std::thread blocker([&] {
        Result r = dispatcher.apply_call("svc", "call-1", [&](Call&) {
            blocker_started = true;
            released.wait();
            return Result::kOk;
        });
        EXPECT_EQ(r, Result::kOk);
    });
    while (!blocker_started) std::this_thread::sleep_for(Millisecs(1));

    std::atomic<bool> late_ran{false};
    Result r = dispatcher.apply_call("svc", "call-1", [&late_ran](Call&) {
        late_ran = true;
        return Result::kOk;
    });
    EXPECT_EQ(r, Result::kTimeout);

    release.set_value();
    blocker.join();

    // Anything queued after the abandoned task runs, the abandoned one does not.
    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [](Call&) { return Result::kOk; }),
              Result::kOk);
    EXPECT_FALSE(late_ran);
    EXPECT_EQ(dispatcher.aggregate_stats().total_tasks_timed_out, 1u);
}

TEST_F(CallDispatcherTest, QueueOverflowIsCapacityExceeded) {
    config_.num_workers = 1;
    config_.max_incoming_queue_per_worker = 1;
    config_.apply_timeout = Millisecs(5000);
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blocker_started{false};

    std::thread blocker([&] {
        EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [&](Call&) {
            blocker_started = true;
            released.wait();
            return Result::kOk;
        }), Result::kOk);
    });
    while (!blocker_started) std::this_thread::sleep_for(Millisecs(1));

    // Fills the single queue slot.
    std::thread queued([&] {
        EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [](Call&) { return Result::kOk; }),
                  Result::kOk);
    });
    while (dispatcher.worker(0).stats().queue_depth.load() < 1)
        std::this_thread::sleep_for(Millisecs(1));

    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [](Call&) { return Result::kOk; }),
              Result::kCapacityExceeded);

    release.set_value();
    blocker.join();
    queued.join();
    EXPECT_EQ(dispatcher.aggregate_stats().total_tasks_dropped, 1u);
}

TEST_F(CallDispatcherTest, CallLimitPerWorker) {
    config_.num_workers = 1;
    config_.max_calls_per_worker = 2;
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);

    EXPECT_EQ(dispatcher.create_call("svc", "c1"), Result::kOk);
    EXPECT_EQ(dispatcher.create_call("svc", "c2"), Result::kOk);
    EXPECT_EQ(dispatcher.create_call("svc", "c3"), Result::kCapacityExceeded);
    EXPECT_EQ(dispatcher.aggregate_stats().total_calls_active, 2u);
}

TEST_F(CallDispatcherTest, NestedSubmissionIsRejected) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-2"), Result::kOk);

    Result inner = Result::kOk;
    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [&](Call&) {
        inner = dispatcher.apply_call("svc", "call-2", [](Call&) { return Result::kOk; });
        return Result::kOk;
    }), Result::kOk);
    EXPECT_EQ(inner, Result::kInvalidArgument);
}

TEST_F(CallDispatcherTest, StopRejectsNewWork) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);
    ASSERT_EQ(dispatcher.create_call("svc", "call-1"), Result::kOk);
    dispatcher.stop();

    EXPECT_EQ(dispatcher.apply_call("svc", "call-1", [](Call&) { return Result::kOk; }),
              Result::kShuttingDown);
    EXPECT_EQ(dispatcher.worker(0).stats().calls_active.load() +
              dispatcher.worker(1).stats().calls_active.load() +
              dispatcher.worker(2).stats().calls_active.load() +
              dispatcher.worker(3).stats().calls_active.load(), 0u);
}

TEST_F(CallDispatcherTest, ConcurrentCallers) {
    CallDispatcher dispatcher(config_, nullptr);
    ASSERT_EQ(dispatcher.start(), Result::kOk);

    const int kCalls = 50;
    for (int i = 0; i < kCalls; ++i)
        ASSERT_EQ(dispatcher.create_call("svc", "call-" + std::to_string(i)), Result::kOk);

    std::vector<int> counters(kCalls, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kCalls; ++i) {
                Result r = dispatcher.apply_call("svc", "call-" + std::to_string(i),
                    [&counters, i](Call&) {
                        ++counters[i];
                        return Result::kOk;
                    });
                EXPECT_EQ(r, Result::kOk);
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int i = 0; i < kCalls; ++i) EXPECT_EQ(counters[i], 4) << i;
    auto agg = dispatcher.aggregate_stats();
    EXPECT_EQ(agg.total_calls_active, static_cast<uint64_t>(kCalls));
    EXPECT_EQ(agg.total_tasks_processed, agg.total_tasks_received);
}

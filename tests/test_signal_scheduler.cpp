#include <catch2/catch.hpp>
#include "core/SignalScheduler.h"
#include "test_fakes.h"

#include <atomic>
#include <thread>

namespace
{
    // One nominal second per millisecond unless a test needs a slower clock.
    SignalScheduler::TimingConfig fast_timing(int ms_per_second = 1)
    {
        SignalScheduler::TimingConfig timing;
        timing.second_length = chrono::milliseconds(ms_per_second);
        timing.preemption_check_interval = chrono::milliseconds(1);
        return timing;
    }

    struct Rig
    {
        shared_ptr<SharedLaneState> lanes;
        shared_ptr<RecordingLogger> logger;
        shared_ptr<SignalScheduler> scheduler;

        Rig(int lane_count, const SignalScheduler::TimingConfig &timing)
            : lanes(make_shared<SharedLaneState>(lane_count)),
              logger(make_shared<RecordingLogger>())
        {
            scheduler = make_shared<SignalScheduler>(lanes, logger, timing);
            weak_ptr<SignalScheduler> weak = scheduler;
            lanes->set_emergency_listener([weak](int lane)
                                          {
                if (auto s = weak.lock())
                    s->notify_emergency(lane); });
        }

        ~Rig()
        {
            scheduler->stop(chrono::milliseconds(2000));
        }

        int green_lane()
        {
            for (const auto &entry : scheduler->get_all_states())
            {
                if (entry.second == SignalState::GREEN)
                    return entry.first;
            }
            return 0;
        }
    };
}

TEST_CASE("Lanes are served round robin without emergencies", "[scheduler]")
{
    Rig rig(4, fast_timing());
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 9; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    auto records = rig.logger->snapshot();
    for (size_t i = 0; i < records.size(); i++)
    {
        INFO("record " << i);
        REQUIRE(records[i].lane_id == static_cast<int>(i % 4) + 1);
        REQUIRE(records[i].mode == SignalMode::NORMAL);
        REQUIRE(records[i].green_duration == 15);
        REQUIRE_FALSE(records[i].ambulance_detected);
    }
}

TEST_CASE("Green time follows the served lane's vehicle count", "[scheduler]")
{
    Rig rig(3, fast_timing());
    rig.lanes->publish(1, LaneSnapshot(1, {{"car", 12}, {"truck", 8}}, false));
    rig.lanes->publish(2, LaneSnapshot(2, {{"car", 7}, {"bus", 3}}, false));
    rig.lanes->publish(3, LaneSnapshot(3, {{"motorcycle", 3}}, false));

    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 3; }));
    rig.scheduler->stop(chrono::milliseconds(1000));

    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 1);
    REQUIRE(records[0].green_duration == 60);
    REQUIRE(records[0].total_vehicles() == 20);
    REQUIRE(records[1].lane_id == 2);
    REQUIRE(records[1].green_duration == 30);
    REQUIRE(records[2].lane_id == 3);
    REQUIRE(records[2].green_duration == 15);
    REQUIRE(records[2].vehicle_counts.at("motorcycle") == 3);
}

TEST_CASE("At most one lane is ever non-red", "[scheduler]")
{
    Rig rig(4, fast_timing());
    REQUIRE(rig.scheduler->start());

    int violations = 0;
    int samples = 0;
    auto until = chrono::steady_clock::now() + chrono::milliseconds(300);
    while (chrono::steady_clock::now() < until)
    {
        int non_red = 0;
        for (const auto &entry : rig.scheduler->get_all_states())
        {
            if (entry.second != SignalState::RED)
                non_red++;
        }
        if (non_red > 1)
            violations++;
        samples++;
    }

    // Also while an ambulance forces transitions.
    rig.lanes->publish(3, LaneSnapshot(3, {}, true));
    until = chrono::steady_clock::now() + chrono::milliseconds(200);
    while (chrono::steady_clock::now() < until)
    {
        int non_red = 0;
        for (const auto &entry : rig.scheduler->get_all_states())
        {
            if (entry.second != SignalState::RED)
                non_red++;
        }
        if (non_red > 1)
            violations++;
        samples++;
    }

    REQUIRE(samples > 0);
    REQUIRE(violations == 0);
}

TEST_CASE("Statistics track cycles and wait time saved", "[scheduler]")
{
    Rig rig(4, fast_timing());
    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.scheduler->get_statistics().cycles >= 5; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    ControllerStatistics stats = rig.scheduler->get_statistics();
    size_t started_phases = rig.logger->size();

    // The last green may have been cut short by stop.
    REQUIRE(stats.cycles >= 5);
    REQUIRE((stats.cycles == started_phases || stats.cycles + 1 == started_phases));
    REQUIRE(stats.cumulative_wait_saved == Approx(45.0 * started_phases));
    REQUIRE(stats.average_wait_saved_per_cycle == Approx(stats.cumulative_wait_saved / stats.cycles));
    REQUIRE(stats.emergency_events == 0);
    REQUIRE(stats.dropped_log_events == 0);
}

TEST_CASE("An ambulance in another lane preempts the running green", "[scheduler]")
{
    // Lane 1 heavy: 60 nominal seconds = 1.2s of wall time.
    Rig rig(4, fast_timing(20));
    rig.lanes->publish(1, LaneSnapshot(1, {{"car", 30}}, false));
    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 1; }));

    auto raised = chrono::steady_clock::now();
    rig.lanes->publish(3, LaneSnapshot(3, {{"car", 2}}, true));

    // Yellow + red clearance is 5 nominal seconds = 100ms.
    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 3; },
                       chrono::milliseconds(1000)));
    REQUIRE(chrono::steady_clock::now() - raised < chrono::milliseconds(700));

    ControllerStatistics stats = rig.scheduler->get_statistics();
    REQUIRE(stats.mode == SignalMode::EMERGENCY);
    REQUIRE(stats.emergency_events == 1);
    REQUIRE(stats.current_lane == 3);

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 2; }));
    auto records = rig.logger->snapshot();
    REQUIRE(records[1].lane_id == 3);
    REQUIRE(records[1].mode == SignalMode::EMERGENCY);
    REQUIRE(records[1].ambulance_detected);
    REQUIRE(records[1].green_duration == 45);
}

TEST_CASE("Ambulance in the served lane extends it in emergency mode", "[scheduler]")
{
    Rig rig(4, fast_timing(5));
    rig.lanes->publish(1, LaneSnapshot(1, {{"car", 2}}, true));
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 1; }));
    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 1);
    REQUIRE(records[0].mode == SignalMode::EMERGENCY);
    REQUIRE(records[0].ambulance_detected);
    REQUIRE(records[0].green_duration == 15);
    REQUIRE(rig.scheduler->get_statistics().emergency_events >= 1);
}

TEST_CASE("Simultaneous ambulances are each served a full green in lane order", "[scheduler]")
{
    // 45 nominal seconds = 90ms of wall time.
    Rig rig(4, fast_timing(2));
    rig.lanes->publish(4, LaneSnapshot(4, {{"car", 1}}, true));
    rig.lanes->publish(2, LaneSnapshot(2, {{"car", 1}}, true));
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 4; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 2);
    REQUIRE(records[0].mode == SignalMode::EMERGENCY);
    REQUIRE(records[0].green_duration == 45);
    REQUIRE(records[1].lane_id == 4);
    REQUIRE(records[1].mode == SignalMode::EMERGENCY);
    REQUIRE(records[1].green_duration == 45);

    // Lane 4 waited for the whole of lane 2's green.
    REQUIRE(records[1].timestamp - records[0].timestamp >= chrono::milliseconds(90));

    // Both reports are served; round robin resumes after lane 4.
    REQUIRE(records[2].lane_id == 1);
    REQUIRE(records[2].mode == SignalMode::NORMAL);
    REQUIRE(records[3].lane_id == 2);
    REQUIRE(records[3].green_duration == 15);
}

TEST_CASE("A new emergency moves an emergency green", "[scheduler]")
{
    // 45 nominal seconds = 900ms of wall time.
    Rig rig(4, fast_timing(20));
    REQUIRE(rig.scheduler->force_emergency(3));
    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 3; }));

    auto raised = chrono::steady_clock::now();

    SECTION("ambulance raised in another lane")
    {
        rig.lanes->publish(2, LaneSnapshot(2, {}, true));
    }
    SECTION("override for another lane")
    {
        REQUIRE(rig.scheduler->force_emergency(2));
    }

    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 2; }));
    REQUIRE(chrono::steady_clock::now() - raised < chrono::milliseconds(600));
    REQUIRE(rig.scheduler->get_statistics().emergency_events == 2);

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 2; }));
    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 3);
    REQUIRE(records[0].mode == SignalMode::EMERGENCY);
    REQUIRE(records[1].lane_id == 2);
    REQUIRE(records[1].mode == SignalMode::EMERGENCY);
}

TEST_CASE("A lasting ambulance report preempts only once", "[scheduler]")
{
    Rig rig(4, fast_timing());
    rig.lanes->publish(3, LaneSnapshot(3, {{"car", 2}}, true));
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 10; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 3);
    REQUIRE(records[0].green_duration == 45);

    // Round robin carries on after lane 3; its own turns extend, not preempt.
    for (size_t i = 1; i < records.size(); i++)
    {
        INFO("record " << i);
        REQUIRE(records[i].lane_id == static_cast<int>((i + 2) % 4) + 1);
        REQUIRE(records[i].green_duration == 15);
        if (records[i].lane_id == 3)
        {
            REQUIRE(records[i].mode == SignalMode::EMERGENCY);
        }
        else
        {
            REQUIRE(records[i].mode == SignalMode::NORMAL);
        }
    }
}

TEST_CASE("An ambulance that clears and returns preempts again", "[scheduler]")
{
    Rig rig(4, fast_timing(2));
    rig.lanes->publish(3, LaneSnapshot(3, {}, true));
    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 2; }));

    rig.lanes->publish(3, LaneSnapshot(3, {}, false));
    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 1; }));
    rig.lanes->publish(3, LaneSnapshot(3, {}, true));

    REQUIRE(eventually([&rig]
                       {
        int preempted = 0;
        for (const auto &record : rig.logger->snapshot())
        {
            if (record.lane_id == 3 && record.green_duration == 45)
                preempted++;
        }
        return preempted == 2; }));
}

TEST_CASE("A failing cycle is logged and the loop carries on", "[scheduler]")
{
    SignalScheduler::TimingConfig timing = fast_timing();
    timing.error_backoff = 5;
    Rig rig(3, timing);

    // Corrupt counts make lane 1's cycle throw.
    rig.lanes->publish(1, LaneSnapshot(1, {{"car", -4}}, false));
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.scheduler->get_statistics().cycle_errors >= 2; }));
    REQUIRE(rig.scheduler->is_running());
    REQUIRE(rig.logger->size() == 0);
    REQUIRE(rig.scheduler->get_statistics().cycles == 0);

    rig.lanes->publish(1, LaneSnapshot(1, {{"car", 4}}, false));
    REQUIRE(eventually([&rig]
                       { return rig.scheduler->get_statistics().cycles >= 3; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 1);
    REQUIRE(records[0].total_vehicles() == 4);
}

TEST_CASE("Manual override is consumed exactly once", "[scheduler]")
{
    Rig rig(4, fast_timing(2));

    REQUIRE(rig.scheduler->force_emergency(3));
    REQUIRE(rig.scheduler->force_emergency(3));
    REQUIRE(rig.scheduler->has_pending_override());

    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 3; }));
    REQUIRE_FALSE(rig.scheduler->has_pending_override());

    // After the emergency green, round robin resumes at lane 4.
    REQUIRE(eventually([&rig]
                       { return rig.green_lane() == 4; }));
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(1000)));

    REQUIRE(rig.scheduler->get_statistics().emergency_events == 1);

    int emergency_records = 0;
    for (const auto &record : rig.logger->snapshot())
    {
        if (record.mode == SignalMode::EMERGENCY)
        {
            emergency_records++;
            REQUIRE(record.lane_id == 3);
        }
    }
    REQUIRE(emergency_records == 1);
}

TEST_CASE("Override for the active lane holds without counting an event", "[scheduler]")
{
    Rig rig(4, fast_timing());
    REQUIRE(rig.scheduler->force_emergency(1));
    REQUIRE(rig.scheduler->start());

    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 2; }));
    rig.scheduler->stop(chrono::milliseconds(1000));

    REQUIRE_FALSE(rig.scheduler->has_pending_override());
    REQUIRE(rig.scheduler->get_statistics().emergency_events == 0);
    auto records = rig.logger->snapshot();
    REQUIRE(records[0].lane_id == 1);
    REQUIRE(records[0].mode == SignalMode::NORMAL);
}

TEST_CASE("Out of range override is rejected", "[scheduler]")
{
    Rig rig(4, fast_timing());

    REQUIRE_FALSE(rig.scheduler->force_emergency(0));
    REQUIRE_FALSE(rig.scheduler->force_emergency(5));
    REQUIRE_FALSE(rig.scheduler->force_emergency(-2));
    REQUIRE_FALSE(rig.scheduler->has_pending_override());
}

TEST_CASE("Stop interrupts a long green promptly and is idempotent", "[scheduler]")
{
    // Real seconds: the first green alone would last 15s.
    Rig rig(4, SignalScheduler::TimingConfig());
    REQUIRE(rig.scheduler->start());
    REQUIRE(eventually([&rig]
                       { return rig.logger->size() >= 1; }));

    auto requested = chrono::steady_clock::now();
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(2000)));
    REQUIRE(chrono::steady_clock::now() - requested < chrono::milliseconds(1000));
    REQUIRE_FALSE(rig.scheduler->is_running());

    REQUIRE(rig.scheduler->stop(chrono::milliseconds(10)));
    REQUIRE(rig.scheduler->get_statistics().cycles == 0);
}

TEST_CASE("Stop before start succeeds", "[scheduler]")
{
    Rig rig(2, fast_timing());
    REQUIRE(rig.scheduler->stop(chrono::milliseconds(10)));
    REQUIRE_FALSE(rig.scheduler->is_running());
}

TEST_CASE("Scheduler can only be started once", "[scheduler]")
{
    Rig rig(2, fast_timing());
    REQUIRE(rig.scheduler->start());
    REQUIRE_FALSE(rig.scheduler->start());
}

TEST_CASE("Failing log sink never stalls the signals", "[scheduler]")
{
    auto lanes = make_shared<SharedLaneState>(3);

    SECTION("sink returns false")
    {
        auto logger = make_shared<FailingLogger>(false);
        auto scheduler = make_shared<SignalScheduler>(lanes, logger, fast_timing());
        REQUIRE(scheduler->start());
        REQUIRE(eventually([&scheduler]
                           { return scheduler->get_statistics().cycles >= 4; }));
        REQUIRE(scheduler->stop(chrono::milliseconds(1000)));
        REQUIRE(scheduler->get_statistics().dropped_log_events >= 4);
        REQUIRE(logger->attempts >= 4);
    }

    SECTION("sink throws")
    {
        auto logger = make_shared<FailingLogger>(true);
        auto scheduler = make_shared<SignalScheduler>(lanes, logger, fast_timing());
        REQUIRE(scheduler->start());
        REQUIRE(eventually([&scheduler]
                           { return scheduler->get_statistics().cycles >= 4; }));
        REQUIRE(scheduler->stop(chrono::milliseconds(1000)));
        REQUIRE(scheduler->get_statistics().dropped_log_events >= 4);
    }
}

TEST_CASE("Slow log sink overflows the queue and counts the drops", "[scheduler]")
{
    auto lanes = make_shared<SharedLaneState>(3);
    auto logger = make_shared<RecordingLogger>();
    logger->delay_ms = 100;

    SignalScheduler::TimingConfig timing = fast_timing();
    timing.log_queue_capacity = 1;
    auto scheduler = make_shared<SignalScheduler>(lanes, logger, timing);

    REQUIRE(scheduler->start());
    REQUIRE(eventually([&scheduler]
                       { return scheduler->get_statistics().dropped_log_events >= 1; }));
    REQUIRE(scheduler->get_statistics().cycles >= 1);
    scheduler->stop(chrono::milliseconds(2000));
}

TEST_CASE("Scheduler runs without a log sink", "[scheduler]")
{
    auto lanes = make_shared<SharedLaneState>(2);
    auto scheduler = make_shared<SignalScheduler>(lanes, nullptr, fast_timing());

    REQUIRE(scheduler->start());
    REQUIRE(eventually([&scheduler]
                       { return scheduler->get_statistics().cycles >= 3; }));
    REQUIRE(scheduler->stop(chrono::milliseconds(1000)));
    REQUIRE(scheduler->get_statistics().dropped_log_events == 0);
}

#ifndef TRAFFICSYSTEM_H
#define TRAFFICSYSTEM_H

#include "../../include/itms_types.hpp"
#include "../../include/itms_config.hpp"

#include "../core/SharedLaneState.h"
#include "../core/SignalScheduler.h"
#include "../core/CycleLogStore.h"

#include "../modules/lane_monitor.h"
#include "../modules/video_source.h"
#include "../modules/vehicle_detector.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
using namespace std;

struct StopReport
{
    bool clean;                     // every worker finished in time
    bool scheduler_stopped;
    vector<int> abandoned_lanes;

    StopReport() : clean(true), scheduler_stopped(true) {}
};

// Owns the lane monitors, the shared lane table, the scheduler and the cycle
// log, and starts/stops them as one unit.
class TrafficSystem
{
public:
    using DetectorFactory = function<shared_ptr<Detector>(int lane_id)>;
    using SourceFactory = function<unique_ptr<VideoSource>(int lane_id)>;

private:
    ITMSConfig config_;

    shared_ptr<SharedLaneState> lane_state_;
    shared_ptr<SignalScheduler> scheduler_;
    shared_ptr<JsonCycleLogStore> log_store_;
    shared_ptr<CycleLogger> logger_;
    map<int, shared_ptr<Detector>> detectors_;
    map<int, shared_ptr<LaneMonitor>> monitors_;
    vector<int> active_lanes_;

    DetectorFactory detector_factory_;
    SourceFactory source_factory_;

    bool initialized_;
    bool running_;
    bool stopped_;
    StopReport last_report_;
    mutable mutex mtx_;

    shared_ptr<Detector> make_default_detector(int lane_id)
    {
        (void)lane_id;
        YoloVehicleDetector::DetectorConfig detector_config;
        detector_config.model_path = config_.model_path;
        detector_config.class_names_path = config_.class_names_path;
        detector_config.confidence = config_.confidence;
        detector_config.nms_threshold = config_.nms_threshold;
        detector_config.input_size = config_.input_size;

        auto detector = make_shared<YoloVehicleDetector>();
        if (!detector->initialize(detector_config))
        {
            return nullptr;
        }
        return detector;
    }

public:
    TrafficSystem(const ITMSConfig &config)
        : config_(config), initialized_(false), running_(false), stopped_(false) {}

    ~TrafficSystem()
    {
        stop();
    }

    static SignalScheduler::TimingConfig timing_from_config(const ITMSConfig &config)
    {
        SignalScheduler::TimingConfig timing;
        timing.heavy_traffic_threshold = config.heavy_traffic_threshold;
        timing.light_traffic_threshold = config.light_traffic_threshold;
        timing.heavy_green = config.heavy_green;
        timing.medium_green = config.medium_green;
        timing.light_green = config.light_green;
        timing.reference_green = config.reference_green;
        timing.yellow_duration = config.yellow_duration;
        timing.transition_delay = config.transition_delay;
        timing.emergency_green = config.emergency_green;
        timing.error_backoff = config.error_backoff;
        timing.second_length = chrono::milliseconds(config.second_length_ms);
        timing.preemption_check_interval = chrono::milliseconds(config.preemption_check_ms);
        return timing;
    }

    // Must be called before initialize().
    void set_detector_factory(DetectorFactory factory) { detector_factory_ = factory; }
    void set_source_factory(SourceFactory factory) { source_factory_ = factory; }
    void set_logger(shared_ptr<CycleLogger> logger) { logger_ = logger; }

    bool initialize()
    {
        lock_guard<mutex> lock(mtx_);
        if (initialized_)
        {
            return true;
        }

        cout << "=== Intelligent Traffic Management System ===" << endl;
        cout << "Initializing..." << endl;

        string error;
        if (!config_.validate(error))
        {
            cerr << "ERROR: Invalid configuration: " << error << endl;
            return false;
        }

        cout << "  [1/4] Initializing shared lane state (" << config_.lane_count << " lanes)..." << endl;
        lane_state_ = make_shared<SharedLaneState>(config_.lane_count);
        cout << "    ✓ Lane state ready" << endl;

        cout << "  [2/4] Opening cycle log..." << endl;
        if (!logger_)
        {
            log_store_ = make_shared<JsonCycleLogStore>(config_.log_path, config_.reference_green);
            if (!log_store_->open())
            {
                cerr << "    ⚠ Cycle log unavailable, records will be dropped" << endl;
            }
            else
            {
                cout << "    ✓ Logging to " << config_.log_path << endl;
            }
            logger_ = log_store_;
        }
        else
        {
            cout << "    ✓ Using external cycle logger" << endl;
        }

        cout << "  [3/4] Initializing detectors and lane monitors..." << endl;
        for (int lane = 1; lane <= config_.lane_count; lane++)
        {
            auto path = config_.video_paths.find(lane);
            if (path == config_.video_paths.end())
            {
                cout << "    ⚠ Lane " << lane << ": no video source configured" << endl;
                continue;
            }

            shared_ptr<Detector> detector = detector_factory_ ? detector_factory_(lane)
                                                              : make_default_detector(lane);
            if (!detector)
            {
                cerr << "    ERROR: Detector for lane " << lane << " failed to initialize" << endl;
                return false;
            }
            detectors_[lane] = detector;

            unique_ptr<VideoSource> source = source_factory_ ? source_factory_(lane)
                                                             : unique_ptr<VideoSource>(new FileVideoSource());

            LaneMonitor::MonitorConfig monitor_config;
            monitor_config.lane_id = lane;
            monitor_config.video_path = path->second;
            monitor_config.frame_width = config_.frame_width;
            monitor_config.frame_height = config_.frame_height;
            monitor_config.loop_delay_ms = config_.loop_delay_ms;

            monitors_[lane] = make_shared<LaneMonitor>(monitor_config, move(source), detector, lane_state_);
        }
        cout << "    ✓ " << monitors_.size() << " lane monitor(s) prepared" << endl;

        cout << "  [4/4] Initializing signal scheduler..." << endl;
        scheduler_ = make_shared<SignalScheduler>(lane_state_, logger_, timing_from_config(config_));

        weak_ptr<SignalScheduler> weak_scheduler = scheduler_;
        lane_state_->set_emergency_listener([weak_scheduler](int lane_id)
                                            {
            if (auto scheduler = weak_scheduler.lock())
            {
                scheduler->notify_emergency(lane_id);
            } });
        cout << "    ✓ Scheduler ready" << endl;

        cout << endl
             << "✓ Initialization complete!" << endl
             << endl;
        initialized_ = true;
        return true;
    }

    bool start()
    {
        lock_guard<mutex> lock(mtx_);
        if (!initialized_)
        {
            cerr << "ERROR: start() called before initialize()" << endl;
            return false;
        }
        if (running_ || stopped_)
        {
            cerr << "ERROR: System already started" << endl;
            return false;
        }

        active_lanes_.clear();
        for (auto &entry : monitors_)
        {
            if (entry.second->start())
            {
                active_lanes_.push_back(entry.first);
            }
            else
            {
                cerr << "  ⚠ Lane " << entry.first << " will run without live data" << endl;
            }
        }

        if (active_lanes_.empty())
        {
            cerr << "ERROR: No lane monitor could be started" << endl;
            return false;
        }

        if (!scheduler_->start())
        {
            cerr << "ERROR: Scheduler failed to start" << endl;
            for (int lane : active_lanes_)
            {
                monitors_[lane]->stop(chrono::milliseconds(config_.stop_timeout_ms));
            }
            return false;
        }

        running_ = true;

        cout << endl;
        cout << "╔════════════════════════════════════════╗" << endl;
        cout << "║  Traffic Controller RUNNING            ║" << endl;
        cout << "╠════════════════════════════════════════╣" << endl;
        cout << "║  Lanes: " << setw(30) << left << config_.lane_count << " ║" << endl;
        cout << "║  Live feeds: " << setw(25) << left << active_lanes_.size() << " ║" << endl;
        cout << "╚════════════════════════════════════════╝" << endl;
        cout << endl;
        return true;
    }

    // Idempotent; a second call returns the first call's report.
    StopReport stop()
    {
        lock_guard<mutex> lock(mtx_);
        if (stopped_ || !running_)
        {
            return last_report_;
        }
        stopped_ = true;
        running_ = false;

        cout << endl
             << "Shutting down traffic system..." << endl;

        auto timeout = chrono::milliseconds(config_.stop_timeout_ms);
        auto deadline = chrono::steady_clock::now() + timeout;
        auto remaining = [&deadline]()
        {
            auto left = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            return max(left, chrono::milliseconds(0));
        };

        // Let every monitor start winding down before waiting on any of them.
        for (auto &entry : monitors_)
        {
            entry.second->requestStop();
        }

        StopReport report;
        report.scheduler_stopped = scheduler_->stop(remaining());
        if (!report.scheduler_stopped)
        {
            report.clean = false;
        }

        for (int lane : active_lanes_)
        {
            if (!monitors_[lane]->stop(remaining()))
            {
                report.abandoned_lanes.push_back(lane);
                report.clean = false;
            }
        }

        if (log_store_)
        {
            log_store_->close();
        }

        print_statistics();

        if (report.clean)
        {
            cout << "Traffic system stopped successfully." << endl;
        }
        else
        {
            cerr << "⚠ Partial stop:";
            if (!report.scheduler_stopped)
                cerr << " scheduler";
            for (int lane : report.abandoned_lanes)
                cerr << " lane " << lane;
            cerr << " did not finish in time" << endl;
        }

        last_report_ = report;
        return report;
    }

    bool is_running() const
    {
        lock_guard<mutex> lock(mtx_);
        return running_;
    }

    vector<int> active_lanes() const
    {
        lock_guard<mutex> lock(mtx_);
        return active_lanes_;
    }

    int lane_count() const { return config_.lane_count; }

    bool force_emergency(int lane_id)
    {
        return scheduler_ && scheduler_->force_emergency(lane_id);
    }

    void update_confidence(float confidence)
    {
        for (auto &entry : detectors_)
        {
            entry.second->updateConfidence(confidence);
        }
        cout << "Detector confidence set to " << confidence << endl;
    }

    map<int, SignalState> get_all_states() const
    {
        return scheduler_ ? scheduler_->get_all_states() : map<int, SignalState>();
    }

    map<int, LaneSnapshot> get_all_lane_data() const
    {
        return lane_state_ ? lane_state_->get_all() : map<int, LaneSnapshot>();
    }

    ControllerStatistics get_statistics() const
    {
        return scheduler_ ? scheduler_->get_statistics() : ControllerStatistics();
    }

    vector<CycleLogRecord> recent_logs(size_t limit) const
    {
        return log_store_ ? log_store_->recent_logs(limit) : vector<CycleLogRecord>();
    }

    TodayStats today_stats() const
    {
        return log_store_ ? log_store_->today_stats() : TodayStats();
    }

    vector<LaneAnalytics> lane_stats(int hours) const
    {
        return log_store_ ? log_store_->lane_stats(hours) : vector<LaneAnalytics>();
    }

private:
    void print_statistics()
    {
        ControllerStatistics stats = scheduler_->get_statistics();

        cout << endl;
        cout << "=== Controller Statistics ===" << endl;
        cout << "  Cycles: " << stats.cycles << endl;
        cout << "  Emergency Events: " << stats.emergency_events << endl;
        cout << "  Wait Time Saved: " << stats.cumulative_wait_saved << "s" << endl;
        cout << "  Avg Saved/Cycle: " << fixed << setprecision(1) << stats.average_wait_saved_per_cycle << "s" << endl;
        cout << "  Dropped Log Records: " << stats.dropped_log_events << endl;
        cout << "  Cycle Errors: " << stats.cycle_errors << endl;
        cout << endl;

        cout << "=== Lane Monitors ===" << endl;
        for (int lane : active_lanes_)
        {
            LaneMonitor::MonitorStats lane_stats = monitors_[lane]->getStats();
            cout << "  Lane " << lane << ": " << lane_stats.frames_processed << " frames, "
                 << lane_stats.frames_skipped << " skipped, " << lane_stats.rewinds << " rewinds" << endl;
        }
        cout << endl;
    }
};

#endif

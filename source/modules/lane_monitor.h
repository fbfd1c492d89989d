// lane_monitor.h - One worker per lane: frames -> detector -> shared lane state
#pragma once

#include "video_source.h"
#include "vehicle_detector.h"
#include "../core/SharedLaneState.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace std;

class LaneMonitor : public enable_shared_from_this<LaneMonitor>
{
public:
    struct MonitorConfig
    {
        int lane_id = 1;
        string video_path;
        int frame_width = 640;       // 0 keeps the source size
        int frame_height = 360;
        int loop_delay_ms = 30;
    };

    struct MonitorStats
    {
        long frames_processed = 0;
        long frames_skipped = 0;
        long detection_failures = 0;
        long rewinds = 0;
        double last_inference_ms = 0;
    };

    LaneMonitor(const MonitorConfig &config,
                unique_ptr<VideoSource> source,
                shared_ptr<Detector> detector,
                shared_ptr<SharedLaneState> lane_state);
    ~LaneMonitor();

    LaneMonitor(const LaneMonitor &) = delete;
    LaneMonitor &operator=(const LaneMonitor &) = delete;

    // Opens the video source and spawns the worker. False if the source
    // cannot be opened; the worker is not started in that case.
    bool start();

    // Asks the worker to leave its loop; does not wait.
    void requestStop();

    // Waits up to timeout for the worker to finish. A worker that does not
    // finish in time is detached and false is returned. Safe to call twice.
    bool stop(chrono::milliseconds timeout);

    bool getSnapshot(LaneSnapshot &snapshot) const;

    int getLaneId() const { return config.lane_id; }
    bool isRunning() const { return running.load(); }
    bool wasAbandoned() const { return abandoned.load(); }
    MonitorStats getStats() const;

private:
    MonitorConfig config;
    unique_ptr<VideoSource> source;
    shared_ptr<Detector> detector;
    shared_ptr<SharedLaneState> lane_state;

    atomic<bool> running;
    atomic<bool> started;
    atomic<bool> abandoned;
    thread worker;
    promise<void> exited;
    shared_future<void> exited_future;

    mutex wake_mutex;
    condition_variable wake_cv;

    mutex stop_mutex;
    bool stop_completed;
    bool stop_result;

    mutable mutex stats_mutex;
    MonitorStats stats;

    void run();
    bool processFrame(Mat &frame);
    bool sleepFor(chrono::milliseconds duration);
};

// lane_monitor.cpp - Free-running detection loop for a single lane
#include "lane_monitor.h"
#include <iostream>

using namespace std::chrono;

LaneMonitor::LaneMonitor(const MonitorConfig &cfg,
                         unique_ptr<VideoSource> src,
                         shared_ptr<Detector> det,
                         shared_ptr<SharedLaneState> state)
    : config(cfg),
      source(move(src)),
      detector(det),
      lane_state(state),
      running(false),
      started(false),
      abandoned(false),
      stop_completed(false),
      stop_result(true)
{
    exited_future = exited.get_future().share();
}

LaneMonitor::~LaneMonitor()
{
    requestStop();
    if (worker.joinable())
    {
        // The worker keeps this object alive, so the last reference may be
        // dropped on the worker itself.
        if (worker.get_id() == this_thread::get_id())
        {
            worker.detach();
        }
        else
        {
            worker.join();
        }
    }
    if (source)
    {
        source->close();
    }
}

bool LaneMonitor::start()
{
    if (started)
    {
        cerr << "[LANE " << config.lane_id << "] Monitor already started" << endl;
        return false;
    }

    if (!source || !detector || !lane_state)
    {
        cerr << "[LANE " << config.lane_id << "] Monitor is missing a source, detector or lane state" << endl;
        return false;
    }

    cout << "[LANE " << config.lane_id << "] Opening " << config.video_path << endl;
    if (!source->open(config.video_path))
    {
        cerr << "[LANE " << config.lane_id << "] ✗ Cannot open video source: " << config.video_path << endl;
        source->close();
        return false;
    }

    running = true;
    started = true;

    auto self = shared_from_this();
    worker = thread([self]()
                    {
        self->run();
        self->exited.set_value(); });

    cout << "[LANE " << config.lane_id << "] ✓ Monitor started" << endl;
    return true;
}

void LaneMonitor::requestStop()
{
    {
        lock_guard<mutex> lock(wake_mutex);
        running = false;
    }
    wake_cv.notify_all();
}

bool LaneMonitor::stop(milliseconds timeout)
{
    lock_guard<mutex> lock(stop_mutex);
    if (stop_completed)
    {
        return stop_result;
    }
    stop_completed = true;

    requestStop();

    if (!started)
    {
        stop_result = true;
        return stop_result;
    }

    if (exited_future.wait_for(timeout) == future_status::ready)
    {
        if (worker.joinable())
        {
            worker.join();
        }
        stop_result = true;
    }
    else
    {
        cerr << "[LANE " << config.lane_id << "] ⚠ Monitor did not stop within "
             << timeout.count() << " ms, abandoning it" << endl;
        abandoned = true;
        worker.detach();
        stop_result = false;
    }
    return stop_result;
}

bool LaneMonitor::getSnapshot(LaneSnapshot &snapshot) const
{
    return lane_state->get(config.lane_id, snapshot);
}

LaneMonitor::MonitorStats LaneMonitor::getStats() const
{
    lock_guard<mutex> lock(stats_mutex);
    return stats;
}

bool LaneMonitor::sleepFor(milliseconds duration)
{
    unique_lock<mutex> lock(wake_mutex);
    wake_cv.wait_for(lock, duration, [this]
                     { return !running.load(); });
    return running.load();
}

void LaneMonitor::run()
{
    Mat frame;
    int consecutive_failures = 0;
    int consecutive_rewinds = 0;

    cout << "[LANE " << config.lane_id << "] Processing thread started" << endl;

    while (running)
    {
        VideoSource::FrameStatus status;
        try
        {
            status = source->nextFrame(frame);
        }
        catch (const exception &e)
        {
            cerr << "[LANE " << config.lane_id << "] Frame read error: " << e.what() << endl;
            status = VideoSource::READ_ERROR;
        }

        if (status == VideoSource::END_OF_STREAM)
        {
            // Treat the video as an endless loop.
            {
                lock_guard<mutex> lock(stats_mutex);
                stats.rewinds++;
            }
            consecutive_rewinds++;
            if (!source->rewind())
            {
                cerr << "[LANE " << config.lane_id << "] Rewind failed, retrying" << endl;
                sleepFor(milliseconds(500));
            }
            else if (consecutive_rewinds > 3)
            {
                // Source yields no frames at all between rewinds.
                sleepFor(milliseconds(100));
            }
            continue;
        }

        if (status == VideoSource::READ_ERROR)
        {
            consecutive_failures++;
            {
                lock_guard<mutex> lock(stats_mutex);
                stats.frames_skipped++;
            }
            if (consecutive_failures % 10 == 1)
            {
                cerr << "[LANE " << config.lane_id << "] Frame read failed ("
                     << consecutive_failures << " in a row), skipping" << endl;
            }

            // Progressive backoff
            if (consecutive_failures < 10)
                sleepFor(milliseconds(50));
            else if (consecutive_failures < 30)
                sleepFor(milliseconds(100));
            else
                sleepFor(milliseconds(500));
            continue;
        }

        consecutive_failures = 0;
        consecutive_rewinds = 0;

        if (!processFrame(frame))
        {
            lock_guard<mutex> lock(stats_mutex);
            stats.frames_skipped++;
            stats.detection_failures++;
        }

        if (config.loop_delay_ms > 0)
        {
            sleepFor(milliseconds(config.loop_delay_ms));
        }
    }

    source->close();
    lane_state->clear(config.lane_id);

    cout << "[LANE " << config.lane_id << "] Processing thread stopped" << endl;
}

bool LaneMonitor::processFrame(Mat &frame)
{
    try
    {
        if (config.frame_width > 0 && config.frame_height > 0 &&
            (frame.cols != config.frame_width || frame.rows != config.frame_height))
        {
            Mat resized;
            resize(frame, resized, Size(config.frame_width, config.frame_height));
            frame = resized;
        }

        DetectionResult result = detector->detect(frame);

        lane_state->publish(config.lane_id,
                            LaneSnapshot(config.lane_id, result.counts, result.ambulance_present));

        lock_guard<mutex> lock(stats_mutex);
        stats.frames_processed++;
        stats.last_inference_ms = result.inference_time;
        return true;
    }
    catch (const cv::Exception &e)
    {
        cerr << "[LANE " << config.lane_id << "] Detection error: " << e.what() << endl;
    }
    catch (const exception &e)
    {
        cerr << "[LANE " << config.lane_id << "] Detection error: " << e.what() << endl;
    }
    return false;
}

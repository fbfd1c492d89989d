#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include "modules/video_source.h"
#include "modules/vehicle_detector.h"
#include "core/CycleLogStore.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std;

// Detector returning whatever the test last set.
class FakeDetector : public Detector
{
public:
    FakeDetector() : ambulance(false), delay_ms(0), throw_on_detect(false),
                     calls(0), confidence(0.5f) {}

    void set_result(const map<string, int> &c, bool amb)
    {
        lock_guard<mutex> lock(mtx);
        counts = c;
        ambulance = amb;
    }

    DetectionResult detect(const Mat &frame) override
    {
        (void)frame;
        calls++;
        if (delay_ms > 0)
        {
            this_thread::sleep_for(chrono::milliseconds(delay_ms.load()));
        }
        if (throw_on_detect)
        {
            throw runtime_error("inference failed");
        }

        DetectionResult result;
        lock_guard<mutex> lock(mtx);
        result.counts = counts;
        result.ambulance_present = ambulance;
        result.inference_time = 1.0;
        return result;
    }

    void updateConfidence(float c) override { confidence = c; }

    mutex mtx;
    map<string, int> counts;
    bool ambulance;
    atomic<int> delay_ms;
    atomic<bool> throw_on_detect;
    atomic<long> calls;
    atomic<float> confidence;
};

// Observable side of a ScriptedVideoSource, which is handed over by unique_ptr.
struct SourceScript
{
    atomic<int> opens{0};
    atomic<int> rewinds{0};
    atomic<int> closes{0};
    atomic<long> frames{0};
    atomic<bool> fail_open{false};
    atomic<int> frames_per_pass{-1};     // -1 = endless
    atomic<int> error_every{0};          // every Nth read is a READ_ERROR
    atomic<int> read_delay_ms{0};
};

class ScriptedVideoSource : public VideoSource
{
public:
    explicit ScriptedVideoSource(shared_ptr<SourceScript> p)
        : script(p), opened(false), position(0), reads(0) {}

    bool open(const string &path) override
    {
        (void)path;
        script->opens++;
        if (script->fail_open)
            return false;
        opened = true;
        position = 0;
        return true;
    }

    FrameStatus nextFrame(Mat &frame) override
    {
        if (script->read_delay_ms > 0)
        {
            this_thread::sleep_for(chrono::milliseconds(script->read_delay_ms.load()));
        }
        reads++;
        int every = script->error_every;
        if (every > 0 && reads % every == 0)
        {
            return READ_ERROR;
        }
        int per_pass = script->frames_per_pass;
        if (per_pass >= 0 && position >= per_pass)
        {
            return END_OF_STREAM;
        }
        position++;
        script->frames++;
        frame = Mat(360, 640, CV_8UC3, Scalar(0, 0, 0));
        return FRAME_OK;
    }

    bool rewind() override
    {
        script->rewinds++;
        position = 0;
        return true;
    }

    void close() override
    {
        if (opened)
        {
            script->closes++;
        }
        opened = false;
    }

    bool isOpened() const override { return opened; }
    string getSourceInfo() const override { return "scripted"; }

private:
    shared_ptr<SourceScript> script;
    bool opened;
    int position;
    long reads;
};

class RecordingLogger : public CycleLogger
{
public:
    RecordingLogger() : delay_ms(0) {}

    bool log_cycle(const CycleLogRecord &record) override
    {
        if (delay_ms > 0)
        {
            this_thread::sleep_for(chrono::milliseconds(delay_ms.load()));
        }
        lock_guard<mutex> lock(mtx);
        records.push_back(record);
        return true;
    }

    vector<CycleLogRecord> snapshot()
    {
        lock_guard<mutex> lock(mtx);
        return records;
    }

    size_t size()
    {
        lock_guard<mutex> lock(mtx);
        return records.size();
    }

    atomic<int> delay_ms;

private:
    mutex mtx;
    vector<CycleLogRecord> records;
};

class FailingLogger : public CycleLogger
{
public:
    explicit FailingLogger(bool should_throw) : throws(should_throw), attempts(0) {}

    bool log_cycle(const CycleLogRecord &record) override
    {
        (void)record;
        attempts++;
        if (throws)
            throw runtime_error("disk full");
        return false;
    }

    bool throws;
    atomic<int> attempts;
};

// Polls pred until it holds or timeout expires.
inline bool eventually(function<bool()> pred, chrono::milliseconds timeout = chrono::milliseconds(2000))
{
    auto deadline = chrono::steady_clock::now() + timeout;
    while (chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        this_thread::sleep_for(chrono::milliseconds(2));
    }
    return pred();
}

#endif

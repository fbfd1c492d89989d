#ifndef CYCLELOGSTORE_H
#define CYCLELOGSTORE_H

#include "../../include/itms_types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <sys/stat.h>
#include <vector>

using namespace std;
using json = nlohmann::json;

// Sink for completed phases. Implementations report failure by returning
// false or throwing; callers never let either reach the signal timing.
class CycleLogger
{
public:
    virtual ~CycleLogger() {}
    virtual bool log_cycle(const CycleLogRecord &record) = 0;
};

struct TodayStats
{
    uint64_t total_cycles;
    uint64_t total_vehicles;
    uint64_t emergency_events;
    double wait_time_saved;

    TodayStats() : total_cycles(0), total_vehicles(0), emergency_events(0), wait_time_saved(0) {}
};

struct LaneAnalytics
{
    int lane_id;
    uint64_t total_vehicles;
    double avg_vehicles;
    uint64_t total_cycles;
    uint64_t emergency_events;
    double avg_green_time;

    LaneAnalytics() : lane_id(0), total_vehicles(0), avg_vehicles(0), total_cycles(0),
                      emergency_events(0), avg_green_time(0) {}
};

inline json record_to_json(const CycleLogRecord &record)
{
    json j = json::object();
    j["timestamp"] = format_local_time(record.timestamp);
    j["lane_id"] = record.lane_id;
    j["vehicle_counts"] = record.vehicle_counts;
    j["ambulance_detected"] = record.ambulance_detected;
    j["green_duration"] = record.green_duration;
    j["signal_mode"] = signal_mode_name(record.mode);
    return j;
}

inline bool record_from_json(const json &j, CycleLogRecord &record)
{
    if (!j.is_object())
    {
        return false;
    }
    if (!parse_local_time(j.value("timestamp", ""), record.timestamp))
    {
        return false;
    }
    if (!parse_signal_mode(j.value("signal_mode", ""), record.mode))
    {
        return false;
    }
    record.lane_id = j.at("lane_id").get<int>();
    record.vehicle_counts = j.value("vehicle_counts", map<string, int>());
    record.ambulance_detected = j.value("ambulance_detected", false);
    record.green_duration = j.value("green_duration", 0.0);
    return true;
}

// Append-only JSON-lines file of completed phases, one object per line.
class JsonCycleLogStore : public CycleLogger
{
private:
    string filename_;
    ofstream out_;
    mutable mutex mtx_;
    double reference_green_;

    bool ensure_directory()
    {
        size_t last_slash = filename_.find_last_of('/');
        if (last_slash == string::npos)
        {
            return true;
        }

        string directory = filename_.substr(0, last_slash);
        struct stat st;
        if (stat(directory.c_str(), &st) == 0)
        {
            return true;
        }

        cout << "[LOG] Creating directory: " << directory << endl;
        string cmd = "mkdir -p \"" + directory + "\"";
        if (system(cmd.c_str()) != 0)
        {
            cerr << "[LOG] ERROR: Failed to create directory " << directory << endl;
            return false;
        }
        return true;
    }

    vector<CycleLogRecord> read_all() const
    {
        vector<CycleLogRecord> records;
        ifstream in(filename_);
        if (!in.is_open())
        {
            return records;
        }

        string line;
        int line_number = 0;
        int skipped = 0;
        while (getline(in, line))
        {
            line_number++;
            if (line.empty())
                continue;

            try
            {
                CycleLogRecord record;
                if (record_from_json(json::parse(line), record))
                {
                    records.push_back(record);
                }
                else
                {
                    skipped++;
                }
            }
            catch (const json::exception &e)
            {
                skipped++;
                if (skipped <= 3)
                {
                    cerr << "[LOG] Skipping corrupt line " << line_number << ": " << e.what() << endl;
                }
            }
        }

        if (skipped > 0)
        {
            cerr << "[LOG] ⚠ " << skipped << " unreadable record(s) in " << filename_ << endl;
        }
        return records;
    }

public:
    JsonCycleLogStore(const string &filename, double reference_green = 60.0)
        : filename_(filename), reference_green_(reference_green) {}

    ~JsonCycleLogStore()
    {
        close();
    }

    bool open()
    {
        lock_guard<mutex> lock(mtx_);
        if (out_.is_open())
        {
            return true;
        }
        if (!ensure_directory())
        {
            return false;
        }

        out_.open(filename_, ios::out | ios::app);
        if (!out_.is_open())
        {
            cerr << "[LOG] ERROR: Cannot open log file: " << filename_ << endl;
            return false;
        }
        return true;
    }

    bool isOpen() const
    {
        lock_guard<mutex> lock(mtx_);
        return out_.is_open();
    }

    void close()
    {
        lock_guard<mutex> lock(mtx_);
        if (out_.is_open())
        {
            out_.flush();
            out_.close();
        }
    }

    const string &filename() const { return filename_; }

    bool log_cycle(const CycleLogRecord &record) override
    {
        string line = record_to_json(record).dump();

        lock_guard<mutex> lock(mtx_);
        if (!out_.is_open())
        {
            return false;
        }
        out_ << line << '\n';
        out_.flush();
        return out_.good();
    }

    // Newest first.
    vector<CycleLogRecord> recent_logs(size_t limit = 50) const
    {
        vector<CycleLogRecord> records;
        {
            lock_guard<mutex> lock(mtx_);
            records = read_all();
        }

        // File order is append order; timestamps only have second resolution.
        reverse(records.begin(), records.end());
        stable_sort(records.begin(), records.end(),
                    [](const CycleLogRecord &a, const CycleLogRecord &b)
                    { return a.timestamp > b.timestamp; });

        if (records.size() > limit)
        {
            records.resize(limit);
        }
        return records;
    }

    TodayStats today_stats() const
    {
        time_t now = time(nullptr);
        struct tm local_tm;
        localtime_r(&now, &local_tm);
        local_tm.tm_hour = 0;
        local_tm.tm_min = 0;
        local_tm.tm_sec = 0;
        local_tm.tm_isdst = -1;
        auto start_of_day = chrono::system_clock::from_time_t(mktime(&local_tm));

        vector<CycleLogRecord> records;
        {
            lock_guard<mutex> lock(mtx_);
            records = read_all();
        }

        TodayStats stats;
        for (const auto &record : records)
        {
            if (record.timestamp < start_of_day)
                continue;

            stats.total_cycles++;
            stats.total_vehicles += record.total_vehicles();
            if (record.mode == SignalMode::EMERGENCY)
            {
                stats.emergency_events++;
            }
            stats.wait_time_saved += max(0.0, reference_green_ - record.green_duration);
        }
        return stats;
    }

    vector<LaneAnalytics> lane_stats(int hours = 24) const
    {
        auto window_start = chrono::system_clock::now() - chrono::hours(hours);

        vector<CycleLogRecord> records;
        {
            lock_guard<mutex> lock(mtx_);
            records = read_all();
        }

        map<int, LaneAnalytics> by_lane;
        map<int, double> green_sum;
        for (const auto &record : records)
        {
            if (record.timestamp < window_start)
                continue;

            LaneAnalytics &lane = by_lane[record.lane_id];
            lane.lane_id = record.lane_id;
            lane.total_vehicles += record.total_vehicles();
            lane.total_cycles++;
            if (record.ambulance_detected)
            {
                lane.emergency_events++;
            }
            green_sum[record.lane_id] += record.green_duration;
        }

        vector<LaneAnalytics> result;
        for (auto &entry : by_lane)
        {
            LaneAnalytics &lane = entry.second;
            lane.avg_vehicles = static_cast<double>(lane.total_vehicles) / lane.total_cycles;
            lane.avg_green_time = green_sum[entry.first] / lane.total_cycles;
            result.push_back(lane);
        }
        return result;
    }
};

#endif

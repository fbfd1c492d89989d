#ifndef ITMS_TYPES_HPP
#define ITMS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <iostream>
using namespace std;

enum class SignalState : uint8_t
{
    RED = 0,
    YELLOW = 1,
    GREEN = 2
};

enum class SignalMode : uint8_t
{
    NORMAL = 0,
    EMERGENCY = 1
};

inline const char *signal_state_name(SignalState state)
{
    switch (state)
    {
    case SignalState::RED:
        return "RED";
    case SignalState::YELLOW:
        return "YELLOW";
    case SignalState::GREEN:
        return "GREEN";
    }
    return "RED";
}

inline const char *signal_mode_name(SignalMode mode)
{
    switch (mode)
    {
    case SignalMode::NORMAL:
        return "NORMAL";
    case SignalMode::EMERGENCY:
        return "EMERGENCY";
    }
    return "NORMAL";
}

inline bool parse_signal_mode(const string &text, SignalMode &mode)
{
    if (text == "NORMAL")
    {
        mode = SignalMode::NORMAL;
        return true;
    }
    if (text == "EMERGENCY")
    {
        mode = SignalMode::EMERGENCY;
        return true;
    }
    return false;
}

// Latest detection result for one lane. Published as a whole, never patched.
struct LaneSnapshot
{
    int lane_id;
    map<string, int> counts;
    bool ambulance_present;
    chrono::system_clock::time_point captured_at;

    LaneSnapshot() : lane_id(0), ambulance_present(false) {}

    LaneSnapshot(int lane, const map<string, int> &c, bool ambulance)
        : lane_id(lane), counts(c), ambulance_present(ambulance),
          captured_at(chrono::system_clock::now()) {}

    int total_vehicles() const
    {
        int total = 0;
        for (const auto &entry : counts)
        {
            total += entry.second;
        }
        return total;
    }
};

struct ControllerStatistics
{
    uint64_t cycles;
    uint64_t emergency_events;
    double cumulative_wait_saved;   // seconds
    double average_wait_saved_per_cycle;
    SignalMode mode;
    int current_lane;
    uint64_t dropped_log_events;
    uint64_t cycle_errors;          // cycles aborted by an exception

    ControllerStatistics() : cycles(0), emergency_events(0), cumulative_wait_saved(0),
                             average_wait_saved_per_cycle(0), mode(SignalMode::NORMAL),
                             current_lane(1), dropped_log_events(0), cycle_errors(0) {}
};

// One completed phase, as persisted by the cycle log.
struct CycleLogRecord
{
    chrono::system_clock::time_point timestamp;
    int lane_id;
    map<string, int> vehicle_counts;
    bool ambulance_detected;
    double green_duration;          // seconds
    SignalMode mode;

    CycleLogRecord() : lane_id(0), ambulance_detected(false), green_duration(0),
                       mode(SignalMode::NORMAL) {}

    int total_vehicles() const
    {
        int total = 0;
        for (const auto &entry : vehicle_counts)
        {
            total += entry.second;
        }
        return total;
    }
};

inline string format_local_time(chrono::system_clock::time_point tp)
{
    time_t t = chrono::system_clock::to_time_t(tp);
    struct tm local_tm;
    localtime_r(&t, &local_tm);

    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local_tm);
    return string(buffer);
}

inline bool parse_local_time(const string &text, chrono::system_clock::time_point &tp)
{
    struct tm local_tm = {};
    if (strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &local_tm) == nullptr)
    {
        return false;
    }
    local_tm.tm_isdst = -1;
    time_t t = mktime(&local_tm);
    if (t == static_cast<time_t>(-1))
    {
        return false;
    }
    tp = chrono::system_clock::from_time_t(t);
    return true;
}

#endif // ITMS_TYPES_HPP

#ifndef SIGNALSCHEDULER_H
#define SIGNALSCHEDULER_H

#include "../../include/itms_types.hpp"
#include "../data_structures/CircularQueue.h"
#include "SharedLaneState.h"
#include "CycleLogStore.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
using namespace std;

/*
 * Single control loop for all signals.
 *
 * Round robin over lanes 1..N with a green time picked from the active lane's
 * vehicle count. Every green (normal or emergency) is a cancellable wait that
 * ends early on stop, on a manual override for another lane, or when another
 * lane raises an ambulance flag. Yellow and red clearance phases only end
 * early on stop.
 *
 * An ambulance report preempts once. After its lane has been served, the
 * same report (flag still up) no longer preempts anything; the lane must
 * clear and raise its flag again. Reports that lose the tie-break to an
 * emergency lane wait for that lane's green to end.
 *
 * Durations are nominal seconds; second_length maps them to wall time.
 */
class SignalScheduler : public enable_shared_from_this<SignalScheduler>
{
public:
    struct TimingConfig
    {
        int heavy_traffic_threshold = 15;
        int light_traffic_threshold = 5;
        int heavy_green = 60;
        int medium_green = 30;
        int light_green = 15;
        int reference_green = 60;
        int yellow_duration = 3;
        int transition_delay = 2;
        int emergency_green = 45;
        int error_backoff = 5;
        chrono::milliseconds second_length = chrono::milliseconds(1000);
        chrono::milliseconds preemption_check_interval = chrono::milliseconds(100);
        int log_queue_capacity = 256;
    };

    SignalScheduler(shared_ptr<SharedLaneState> lanes,
                    shared_ptr<CycleLogger> logger,
                    const TimingConfig &timing);
    ~SignalScheduler();

    SignalScheduler(const SignalScheduler &) = delete;
    SignalScheduler &operator=(const SignalScheduler &) = delete;

    // Must be owned by a shared_ptr: the worker threads keep it alive.
    bool start();

    // Idempotent. False if a worker had to be abandoned after timeout.
    bool stop(chrono::milliseconds timeout);

    bool is_running() const { return running_.load(); }

    bool force_emergency(int lane_id);
    bool has_pending_override() const;

    // Wakes a pending green wait so it re-checks the lanes right away.
    // Called on a raised ambulance flag.
    void notify_emergency(int lane_id);

    SignalState get_lane_state(int lane_id) const;
    map<int, SignalState> get_all_states() const;
    map<int, LaneSnapshot> get_all_lane_data() const;
    ControllerStatistics get_statistics() const;

    int calculate_green_duration(int vehicle_count) const;
    double wait_time_saved(int green_duration) const;

    int lane_count() const { return lane_count_; }
    const TimingConfig &timing() const { return timing_; }

private:
    enum class WaitOutcome
    {
        COMPLETED,
        PREEMPTED,
        STOPPED
    };

    struct Preemption
    {
        int lane = 0;
        bool manual = false;
    };

    shared_ptr<SharedLaneState> lanes_;
    shared_ptr<CycleLogger> logger_;
    TimingConfig timing_;
    int lane_count_;

    mutable mutex mtx_;
    condition_variable wake_cv_;
    vector<SignalState> states_;        // index = lane_id - 1
    int current_lane_;
    SignalMode mode_;
    int pending_override_;              // 0 = none
    bool emergency_flag_;
    bool stop_requested_;

    // Ambulance report ids (SharedLaneState::ambulance_raise), index = lane_id - 1.
    vector<uint64_t> served_raise_;
    vector<uint64_t> passed_over_raise_;    // only during an emergency green

    uint64_t cycles_;
    uint64_t emergency_events_;
    uint64_t cycle_errors_;
    double cumulative_wait_saved_;

    atomic<bool> running_;
    atomic<bool> started_;
    atomic<uint64_t> dropped_logs_;

    CircularQueue<CycleLogRecord> log_queue_;

    thread control_thread_;
    thread log_thread_;
    promise<void> control_exited_;
    promise<void> log_exited_;
    shared_future<void> control_exited_future_;
    shared_future<void> log_exited_future_;

    mutex stop_mutex_;
    bool stop_completed_;
    bool stop_result_;

    void run();
    void log_dispatch_loop();

    void handle_normal_cycle();
    void handle_emergency(Preemption preemption);
    Preemption select_emergency_lane(int active_lane);

    // mtx_ must be held for these three.
    int unserved_ambulance_lane(int active_lane) const;
    void claim_emergency_lane(int emergency_lane);
    void release_passed_over();

    WaitOutcome wait_phase(int seconds, int active_lane, Preemption &preemption);
    bool hold(int seconds);
    bool transition_to_lane(int from_lane, int to_lane, const string &reason);

    void set_state(int lane_id, SignalState state);
    void emit_log(int lane_id, const map<string, int> &counts, bool ambulance,
                  int green_duration, SignalMode mode);
    int next_lane(int lane_id) const { return (lane_id % lane_count_) + 1; }
    chrono::milliseconds to_wall(int seconds) const { return timing_.second_length * seconds; }
};

#endif

#include "SignalScheduler.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace std::chrono;

SignalScheduler::SignalScheduler(shared_ptr<SharedLaneState> lanes,
                                 shared_ptr<CycleLogger> logger,
                                 const TimingConfig &timing)
    : lanes_(lanes), logger_(logger), timing_(timing),
      lane_count_(0), current_lane_(1), mode_(SignalMode::NORMAL),
      pending_override_(0), emergency_flag_(false), stop_requested_(false),
      cycles_(0), emergency_events_(0), cycle_errors_(0), cumulative_wait_saved_(0),
      running_(false), started_(false), dropped_logs_(0),
      log_queue_(timing.log_queue_capacity),
      stop_completed_(false), stop_result_(true)
{
    if (!lanes_)
    {
        throw invalid_argument("SignalScheduler needs a lane state");
    }
    lane_count_ = lanes_->lane_count();
    if (lane_count_ < 2)
    {
        throw invalid_argument("SignalScheduler needs at least two lanes");
    }

    states_.assign(lane_count_, SignalState::RED);
    states_[0] = SignalState::GREEN;
    served_raise_.assign(lane_count_, 0);
    passed_over_raise_.assign(lane_count_, 0);

    control_exited_future_ = control_exited_.get_future().share();
    log_exited_future_ = log_exited_.get_future().share();
}

SignalScheduler::~SignalScheduler()
{
    {
        lock_guard<mutex> lock(mtx_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    log_queue_.shutdown();

    for (thread *t : {&control_thread_, &log_thread_})
    {
        if (!t->joinable())
            continue;
        if (t->get_id() == this_thread::get_id())
            t->detach();
        else
            t->join();
    }
}

bool SignalScheduler::start()
{
    if (started_.exchange(true))
    {
        cerr << "[SCHEDULER] Already started" << endl;
        return false;
    }

    running_ = true;
    auto self = shared_from_this();

    if (logger_)
    {
        log_thread_ = thread([self]()
                             {
            self->log_dispatch_loop();
            self->log_exited_.set_value(); });
    }
    else
    {
        log_exited_.set_value();
    }

    control_thread_ = thread([self]()
                             {
        self->run();
        self->control_exited_.set_value(); });

    cout << "[SCHEDULER] Control thread started" << endl;
    return true;
}

bool SignalScheduler::stop(milliseconds timeout)
{
    lock_guard<mutex> stop_lock(stop_mutex_);
    if (stop_completed_)
    {
        return stop_result_;
    }
    stop_completed_ = true;

    {
        lock_guard<mutex> lock(mtx_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (!started_)
    {
        log_queue_.shutdown();
        stop_result_ = true;
        return stop_result_;
    }

    auto deadline = steady_clock::now() + timeout;
    bool clean = true;

    if (control_exited_future_.wait_until(deadline) == future_status::ready)
    {
        if (control_thread_.joinable())
            control_thread_.join();
    }
    else
    {
        cerr << "[SCHEDULER] ⚠ Control thread did not stop in time, abandoning it" << endl;
        control_thread_.detach();
        clean = false;
    }

    // Remaining records are still written before the dispatcher exits.
    log_queue_.shutdown();
    if (log_exited_future_.wait_until(deadline) == future_status::ready)
    {
        if (log_thread_.joinable())
            log_thread_.join();
    }
    else
    {
        cerr << "[SCHEDULER] ⚠ Log dispatcher did not stop in time, abandoning it" << endl;
        if (log_thread_.joinable())
            log_thread_.detach();
        clean = false;
    }

    running_ = false;
    stop_result_ = clean;
    cout << "[SCHEDULER] Stopped" << endl;
    return stop_result_;
}

bool SignalScheduler::force_emergency(int lane_id)
{
    if (lane_id < 1 || lane_id > lane_count_)
    {
        cerr << "[MANUAL OVERRIDE] Rejected: no lane " << lane_id << endl;
        return false;
    }

    {
        lock_guard<mutex> lock(mtx_);
        pending_override_ = lane_id;
    }
    wake_cv_.notify_all();

    cout << "[MANUAL OVERRIDE] Emergency triggered for Lane " << lane_id << endl;
    return true;
}

bool SignalScheduler::has_pending_override() const
{
    lock_guard<mutex> lock(mtx_);
    return pending_override_ != 0;
}

void SignalScheduler::notify_emergency(int lane_id)
{
    if (lane_id < 1 || lane_id > lane_count_)
    {
        return;
    }
    {
        lock_guard<mutex> lock(mtx_);
        emergency_flag_ = true;
    }
    wake_cv_.notify_all();

    cout << "[EMERGENCY] Ambulance reported in Lane " << lane_id << endl;
}

SignalState SignalScheduler::get_lane_state(int lane_id) const
{
    lock_guard<mutex> lock(mtx_);
    if (lane_id < 1 || lane_id > lane_count_)
    {
        return SignalState::RED;
    }
    return states_[lane_id - 1];
}

map<int, SignalState> SignalScheduler::get_all_states() const
{
    lock_guard<mutex> lock(mtx_);
    map<int, SignalState> result;
    for (int lane = 1; lane <= lane_count_; lane++)
    {
        result[lane] = states_[lane - 1];
    }
    return result;
}

map<int, LaneSnapshot> SignalScheduler::get_all_lane_data() const
{
    return lanes_->get_all();
}

ControllerStatistics SignalScheduler::get_statistics() const
{
    lock_guard<mutex> lock(mtx_);
    ControllerStatistics stats;
    stats.cycles = cycles_;
    stats.emergency_events = emergency_events_;
    stats.cumulative_wait_saved = cumulative_wait_saved_;
    stats.average_wait_saved_per_cycle = cycles_ > 0 ? cumulative_wait_saved_ / cycles_ : 0.0;
    stats.mode = mode_;
    stats.current_lane = current_lane_;
    stats.dropped_log_events = dropped_logs_.load();
    stats.cycle_errors = cycle_errors_;
    return stats;
}

int SignalScheduler::calculate_green_duration(int vehicle_count) const
{
    if (vehicle_count > timing_.heavy_traffic_threshold)
    {
        return timing_.heavy_green;
    }
    if (vehicle_count >= timing_.light_traffic_threshold)
    {
        return timing_.medium_green;
    }
    return timing_.light_green;
}

double SignalScheduler::wait_time_saved(int green_duration) const
{
    return max(0, timing_.reference_green - green_duration);
}

void SignalScheduler::set_state(int lane_id, SignalState state)
{
    lock_guard<mutex> lock(mtx_);
    states_[lane_id - 1] = state;
}

void SignalScheduler::run()
{
    cout << endl
         << string(70, '=') << endl;
    cout << "[TRAFFIC CONTROLLER] System Started" << endl;
    cout << string(70, '=') << endl;
    cout << "Initial State: Lane " << current_lane_ << " GREEN" << endl;
    cout << "Lanes: " << lane_count_ << endl;
    cout << string(70, '=') << endl
         << endl;

    while (true)
    {
        {
            lock_guard<mutex> lock(mtx_);
            if (stop_requested_)
                break;
        }

        try
        {
            int active;
            {
                lock_guard<mutex> lock(mtx_);
                active = current_lane_;
            }

            Preemption preemption = select_emergency_lane(active);
            if (preemption.lane != 0)
            {
                handle_emergency(preemption);
            }
            else
            {
                handle_normal_cycle();
            }
        }
        catch (const exception &e)
        {
            {
                lock_guard<mutex> lock(mtx_);
                cycle_errors_++;
                release_passed_over();
            }
            cerr << "[ERROR] Traffic controller error: " << e.what() << endl;
            hold(timing_.error_backoff);
        }
    }

    running_ = false;
    cout << endl
         << "[TRAFFIC CONTROLLER] Stopped" << endl;
}

SignalScheduler::Preemption SignalScheduler::select_emergency_lane(int active_lane)
{
    Preemption preemption;
    lock_guard<mutex> lock(mtx_);

    // A manual override wins and is consumed here, exactly once.
    if (pending_override_ != 0)
    {
        preemption.lane = pending_override_;
        preemption.manual = true;
        pending_override_ = 0;
        return preemption;
    }

    emergency_flag_ = false;
    release_passed_over();
    preemption.lane = unserved_ambulance_lane(active_lane);
    return preemption;
}

int SignalScheduler::unserved_ambulance_lane(int active_lane) const
{
    // Slot locks are never held while calling back into the scheduler,
    // so scanning under mtx_ cannot deadlock.
    for (int lane = 1; lane <= lane_count_; lane++)
    {
        if (lane == active_lane)
            continue;

        uint64_t raise = lanes_->ambulance_raise(lane);
        if (raise != 0 && raise != served_raise_[lane - 1] && raise != passed_over_raise_[lane - 1])
        {
            return lane;
        }
    }
    return 0;
}

void SignalScheduler::claim_emergency_lane(int emergency_lane)
{
    for (int lane = 1; lane <= lane_count_; lane++)
    {
        uint64_t raise = lanes_->ambulance_raise(lane);
        if (lane == emergency_lane)
            served_raise_[lane - 1] = raise;
        else
            passed_over_raise_[lane - 1] = raise;
    }
}

void SignalScheduler::release_passed_over()
{
    fill(passed_over_raise_.begin(), passed_over_raise_.end(), 0);
}

void SignalScheduler::handle_normal_cycle()
{
    int lane;
    {
        lock_guard<mutex> lock(mtx_);
        lane = current_lane_;
    }

    // No data yet counts as an empty lane.
    LaneSnapshot snapshot;
    map<string, int> counts;
    bool ambulance = false;
    if (lanes_->get(lane, snapshot))
    {
        counts = snapshot.counts;
        ambulance = snapshot.ambulance_present;
    }
    for (const auto &entry : counts)
    {
        if (entry.second < 0)
        {
            throw out_of_range("Lane " + to_string(lane) + " reported " + to_string(entry.second) +
                               " " + entry.first);
        }
    }
    int total_vehicles = snapshot.total_vehicles();

    int green_duration = calculate_green_duration(total_vehicles);
    double saved = wait_time_saved(green_duration);

    SignalMode mode;
    uint64_t cycle_number;
    {
        lock_guard<mutex> lock(mtx_);
        if (ambulance)
        {
            // Ambulance already in the served lane: extend, do not redirect.
            mode_ = SignalMode::EMERGENCY;
            emergency_events_++;
            served_raise_[lane - 1] = lanes_->ambulance_raise(lane);
        }
        else
        {
            mode_ = SignalMode::NORMAL;
        }
        cumulative_wait_saved_ += saved;
        mode = mode_;
        cycle_number = cycles_ + 1;
    }

    if (ambulance)
    {
        cout << "[AMBULANCE DETECTED] Lane " << lane << " - Extending green time" << endl;
    }

    cout << endl
         << string(70, '=') << endl;
    cout << "[CYCLE " << cycle_number << "] Lane " << lane << " - " << signal_mode_name(mode) << " MODE" << endl;
    cout << "  Vehicles Detected: " << total_vehicles << endl;
    cout << "  Ambulance Present: " << (ambulance ? "yes" : "no") << endl;
    cout << "  Green Duration: " << green_duration << "s" << endl;
    cout << "  Time Saved vs Fixed (" << timing_.reference_green << "s): " << saved << "s" << endl;
    cout << string(70, '=') << endl;

    emit_log(lane, counts, ambulance, green_duration, mode);

    Preemption preemption;
    WaitOutcome outcome = wait_phase(green_duration, lane, preemption);
    if (outcome == WaitOutcome::STOPPED)
    {
        return;
    }
    if (outcome == WaitOutcome::PREEMPTED)
    {
        handle_emergency(preemption);
        return;
    }

    if (!transition_to_lane(lane, next_lane(lane), "Normal Cycle"))
    {
        return;
    }

    lock_guard<mutex> lock(mtx_);
    cycles_++;
    mode_ = SignalMode::NORMAL;
}

void SignalScheduler::handle_emergency(Preemption preemption)
{
    while (preemption.lane != 0)
    {
        int emergency_lane = preemption.lane;
        int current;
        {
            lock_guard<mutex> lock(mtx_);
            if (stop_requested_)
                return;
            current = current_lane_;
        }

        if (emergency_lane == current)
        {
            cout << "[EMERGENCY] Lane " << emergency_lane << " is already green - holding" << endl;
            return;
        }

        {
            lock_guard<mutex> lock(mtx_);
            mode_ = SignalMode::EMERGENCY;
            emergency_events_++;
            claim_emergency_lane(emergency_lane);
        }

        cout << endl
             << string(70, '*') << endl;
        cout << "[EMERGENCY OVERRIDE] Switching to Lane " << emergency_lane << " immediately!"
             << (preemption.manual ? " (manual)" : "") << endl;
        cout << string(70, '*') << endl;

        string reason = preemption.manual ? "MANUAL OVERRIDE" : "AMBULANCE DETECTED";
        if (!transition_to_lane(current, emergency_lane, reason))
        {
            lock_guard<mutex> lock(mtx_);
            release_passed_over();
            return;
        }

        {
            lock_guard<mutex> lock(mtx_);
            cycles_++;
        }

        LaneSnapshot snapshot;
        map<string, int> counts;
        if (lanes_->get(emergency_lane, snapshot))
        {
            counts = snapshot.counts;
        }

        cout << "[EMERGENCY] Lane " << emergency_lane << " GREEN for " << timing_.emergency_green << "s" << endl;
        emit_log(emergency_lane, counts, true, timing_.emergency_green, SignalMode::EMERGENCY);

        Preemption next;
        WaitOutcome outcome = wait_phase(timing_.emergency_green, emergency_lane, next);
        {
            lock_guard<mutex> lock(mtx_);
            release_passed_over();
        }
        if (outcome == WaitOutcome::STOPPED)
        {
            return;
        }
        if (outcome == WaitOutcome::PREEMPTED)
        {
            preemption = next;
            continue;
        }

        // Resume round robin after the emergency lane.
        cout << string(70, '*') << endl
             << endl;
        if (!transition_to_lane(emergency_lane, next_lane(emergency_lane), "Emergency cleared"))
        {
            return;
        }

        lock_guard<mutex> lock(mtx_);
        mode_ = SignalMode::NORMAL;
        return;
    }
}

SignalScheduler::WaitOutcome SignalScheduler::wait_phase(int seconds, int active_lane, Preemption &preemption)
{
    auto deadline = steady_clock::now() + to_wall(seconds);
    unique_lock<mutex> lock(mtx_);

    while (true)
    {
        if (stop_requested_)
        {
            return WaitOutcome::STOPPED;
        }

        if (pending_override_ != 0)
        {
            int lane = pending_override_;
            pending_override_ = 0;
            if (lane != active_lane)
            {
                preemption.lane = lane;
                preemption.manual = true;
                return WaitOutcome::PREEMPTED;
            }
            cout << "[MANUAL OVERRIDE] Lane " << lane << " already green - holding" << endl;
        }

        emergency_flag_ = false;
        int ambulance_lane = unserved_ambulance_lane(active_lane);
        if (ambulance_lane != 0)
        {
            preemption.lane = ambulance_lane;
            preemption.manual = false;
            return WaitOutcome::PREEMPTED;
        }

        auto now = steady_clock::now();
        if (now >= deadline)
        {
            return WaitOutcome::COMPLETED;
        }

        auto wake_at = min(deadline, now + timing_.preemption_check_interval);
        wake_cv_.wait_until(lock, wake_at, [this]
                            { return stop_requested_ || pending_override_ != 0 || emergency_flag_; });
    }
}

bool SignalScheduler::hold(int seconds)
{
    auto deadline = steady_clock::now() + to_wall(seconds);
    unique_lock<mutex> lock(mtx_);
    wake_cv_.wait_until(lock, deadline, [this]
                        { return stop_requested_; });
    return !stop_requested_;
}

bool SignalScheduler::transition_to_lane(int from_lane, int to_lane, const string &reason)
{
    cout << endl
         << "[TRANSITION] Lane " << from_lane << " -> Lane " << to_lane << " | Reason: " << reason << endl;

    // Clearance phases run to completion unless the system is stopping.
    set_state(from_lane, SignalState::YELLOW);
    cout << "  Lane " << from_lane << ": YELLOW (" << timing_.yellow_duration << "s)" << endl;
    if (!hold(timing_.yellow_duration))
    {
        return false;
    }

    set_state(from_lane, SignalState::RED);
    cout << "  Lane " << from_lane << ": RED (transition delay " << timing_.transition_delay << "s)" << endl;
    if (!hold(timing_.transition_delay))
    {
        return false;
    }

    {
        lock_guard<mutex> lock(mtx_);
        states_[to_lane - 1] = SignalState::GREEN;
        current_lane_ = to_lane;
    }
    cout << "  Lane " << to_lane << ": GREEN" << endl;
    return true;
}

void SignalScheduler::emit_log(int lane_id, const map<string, int> &counts, bool ambulance,
                               int green_duration, SignalMode mode)
{
    if (!logger_)
    {
        return;
    }

    CycleLogRecord record;
    record.timestamp = system_clock::now();
    record.lane_id = lane_id;
    record.vehicle_counts = counts;
    record.ambulance_detected = ambulance;
    record.green_duration = green_duration;
    record.mode = mode;

    if (!log_queue_.try_enqueue(record))
    {
        uint64_t dropped = ++dropped_logs_;
        if (dropped % 10 == 1)
        {
            cerr << "[LOG] Log queue full, dropped " << dropped << " record(s) so far" << endl;
        }
    }
}

void SignalScheduler::log_dispatch_loop()
{
    CycleLogRecord record;
    while (true)
    {
        if (!log_queue_.wait_dequeue(record, milliseconds(200)))
        {
            if (log_queue_.is_shutdown() && log_queue_.empty())
                break;
            continue;
        }

        bool ok = false;
        try
        {
            ok = logger_->log_cycle(record);
        }
        catch (const exception &e)
        {
            cerr << "[LOG] Error logging cycle for lane " << record.lane_id << ": " << e.what() << endl;
        }

        if (!ok)
        {
            uint64_t dropped = ++dropped_logs_;
            if (dropped % 10 == 1)
            {
                cerr << "[LOG] Failed to persist cycle record (" << dropped << " dropped)" << endl;
            }
        }
    }
}

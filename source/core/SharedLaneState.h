#ifndef SHAREDLANESTATE_H
#define SHAREDLANESTATE_H

#include "../../include/itms_types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
using namespace std;

// Latest detection per lane. Every slot has its own lock, so a publish on one
// lane never waits for another lane or for a reader of another lane.
class SharedLaneState
{
private:
    struct Slot
    {
        mutable mutex mtx;
        shared_ptr<const LaneSnapshot> snapshot;
        uint64_t ambulance_raises = 0;  // clear -> set transitions
    };

    vector<unique_ptr<Slot>> slots_;   // index = lane_id - 1
    function<void(int)> emergency_listener_;

    Slot *slot_for(int lane_id) const
    {
        if (lane_id < 1 || lane_id > static_cast<int>(slots_.size()))
        {
            return nullptr;
        }
        return slots_[lane_id - 1].get();
    }

public:
    explicit SharedLaneState(int lane_count)
    {
        if (lane_count < 1)
        {
            throw invalid_argument("SharedLaneState needs at least one lane");
        }
        slots_.reserve(lane_count);
        for (int i = 0; i < lane_count; i++)
        {
            slots_.push_back(make_unique<Slot>());
        }
    }

    int lane_count() const { return static_cast<int>(slots_.size()); }

    // Must be set before any monitor starts publishing.
    void set_emergency_listener(function<void(int)> listener)
    {
        emergency_listener_ = listener;
    }

    void publish(int lane_id, const LaneSnapshot &snapshot)
    {
        Slot *slot = slot_for(lane_id);
        if (!slot)
        {
            throw out_of_range("publish: unknown lane " + to_string(lane_id));
        }

        // Build the replacement outside the lock, then swap it in.
        auto fresh = make_shared<const LaneSnapshot>(snapshot);
        bool raised = false;
        {
            lock_guard<mutex> lock(slot->mtx);
            bool had_ambulance = slot->snapshot && slot->snapshot->ambulance_present;
            slot->snapshot.swap(fresh);
            if (snapshot.ambulance_present && !had_ambulance)
            {
                slot->ambulance_raises++;
                raised = true;
            }
        }

        // Only a newly raised flag is news to the listener.
        if (raised && emergency_listener_)
        {
            emergency_listener_(lane_id);
        }
    }

    bool get(int lane_id, LaneSnapshot &snapshot) const
    {
        Slot *slot = slot_for(lane_id);
        if (!slot)
        {
            return false;
        }

        shared_ptr<const LaneSnapshot> current;
        {
            lock_guard<mutex> lock(slot->mtx);
            current = slot->snapshot;
        }
        if (!current)
        {
            return false;
        }
        snapshot = *current;
        return true;
    }

    map<int, LaneSnapshot> get_all() const
    {
        map<int, LaneSnapshot> result;
        for (int lane = 1; lane <= lane_count(); lane++)
        {
            LaneSnapshot snapshot;
            if (get(lane, snapshot))
            {
                result[lane] = snapshot;
            }
        }
        return result;
    }

    bool ambulance_in(int lane_id) const
    {
        Slot *slot = slot_for(lane_id);
        if (!slot)
        {
            return false;
        }
        lock_guard<mutex> lock(slot->mtx);
        return slot->snapshot && slot->snapshot->ambulance_present;
    }

    // Identifies the ambulance report currently up in a lane: the number of
    // times its flag has been raised, or 0 while no ambulance is reported.
    uint64_t ambulance_raise(int lane_id) const
    {
        Slot *slot = slot_for(lane_id);
        if (!slot)
        {
            return 0;
        }
        lock_guard<mutex> lock(slot->mtx);
        if (!slot->snapshot || !slot->snapshot->ambulance_present)
        {
            return 0;
        }
        return slot->ambulance_raises;
    }

    // Lowest lane id reporting an ambulance, skipping excluded_lane. 0 if none.
    int lowest_ambulance_lane(int excluded_lane = 0) const
    {
        for (int lane = 1; lane <= lane_count(); lane++)
        {
            if (lane != excluded_lane && ambulance_in(lane))
            {
                return lane;
            }
        }
        return 0;
    }

    void clear(int lane_id)
    {
        Slot *slot = slot_for(lane_id);
        if (!slot)
        {
            return;
        }
        lock_guard<mutex> lock(slot->mtx);
        slot->snapshot.reset();
    }
};

#endif

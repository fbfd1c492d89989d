#ifndef STATUSBRIDGE_H
#define STATUSBRIDGE_H

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <nlohmann/json.hpp>

#include "TrafficSystem.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace std;
using json = nlohmann::json;

// WebSocket feed for dashboards: periodic "status" broadcasts plus a small
// JSON command protocol ({"command": "...", ...}).
class StatusBridge
{
public:
    using server = websocketpp::server<websocketpp::config::asio>;
    using connection_hdl = websocketpp::connection_hdl;

    StatusBridge(TrafficSystem &system, int broadcast_interval_ms = 500);
    ~StatusBridge();

    StatusBridge(const StatusBridge &) = delete;
    StatusBridge &operator=(const StatusBridge &) = delete;

    bool start(uint16_t port = 8081);
    void stop();
    bool is_running() const { return running.load(); }
    size_t client_count();

    // Command dispatch without a connection; the reply is what a client
    // would receive.
    json handle_request(const string &payload);

    json build_status() const;

    static json statistics_to_json(const ControllerStatistics &stats);
    static json snapshot_to_json(const LaneSnapshot &snapshot);
    static json today_stats_to_json(const TodayStats &stats);
    static json lane_analytics_to_json(const LaneAnalytics &lane);

private:
    struct connection_data
    {
        time_t connected_at;
    };

    TrafficSystem &traffic;
    int broadcast_interval_ms;

    server ws_server;
    thread server_thread;
    thread broadcast_thread;
    atomic<bool> running;

    map<connection_hdl, connection_data, owner_less<connection_hdl>> clients;
    mutex clients_mutex;

    mutex wake_mutex;
    condition_variable wake_cv;

    void on_open(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_message(connection_hdl hdl, server::message_ptr msg);

    json handle_force_emergency(const json &data);
    json handle_set_confidence(const json &data);
    json handle_get_stats();
    json handle_get_logs(const json &data);
    json handle_get_today_stats();
    json handle_get_lane_stats(const json &data);

    void broadcast_loop();

    static json make_error(const string &message);
    void send_message(connection_hdl hdl, const string &msg);
    void broadcast_message(const string &msg);
};

#endif

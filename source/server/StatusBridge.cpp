// StatusBridge.cpp - WebSocket status feed and dashboard commands
#include "StatusBridge.h"
#include <iostream>

StatusBridge::StatusBridge(TrafficSystem &sys, int interval_ms)
    : traffic(sys),
      broadcast_interval_ms(interval_ms > 0 ? interval_ms : 500),
      running(false)
{
    ws_server.clear_access_channels(websocketpp::log::alevel::all);
    ws_server.clear_error_channels(websocketpp::log::elevel::all);

    ws_server.init_asio();
    ws_server.set_reuse_addr(true);

    ws_server.set_open_handler(bind(&StatusBridge::on_open, this, placeholders::_1));
    ws_server.set_close_handler(bind(&StatusBridge::on_close, this, placeholders::_1));
    ws_server.set_message_handler(bind(&StatusBridge::on_message, this, placeholders::_1, placeholders::_2));

    ws_server.set_fail_handler([this](connection_hdl hdl)
                               {
        lock_guard<mutex> lock(clients_mutex);
        clients.erase(hdl); });
}

StatusBridge::~StatusBridge()
{
    stop();
}

bool StatusBridge::start(uint16_t port)
{
    if (running)
        return true;

    websocketpp::lib::error_code ec;
    ws_server.listen(port, ec);
    if (ec)
    {
        cerr << "[BRIDGE] ✗ Cannot listen on port " << port << ": " << ec.message() << endl;
        return false;
    }
    ws_server.start_accept(ec);
    if (ec)
    {
        cerr << "[BRIDGE] ✗ Cannot accept connections: " << ec.message() << endl;
        ws_server.stop_listening(ec);
        return false;
    }

    running = true;

    server_thread = thread([this, port]()
                           {
        cout << "[BRIDGE] WebSocket server starting on port " << port << endl;
        try {
            ws_server.run();
        } catch (const exception& e) {
            cerr << "[BRIDGE] WebSocket server error: " << e.what() << endl;
        } });

    broadcast_thread = thread(&StatusBridge::broadcast_loop, this);

    cout << "[BRIDGE] ✓ Status feed on ws://localhost:" << port << endl;
    return true;
}

void StatusBridge::stop()
{
    {
        lock_guard<mutex> lock(wake_mutex);
        if (!running)
            return;
        running = false;
    }
    wake_cv.notify_all();

    if (broadcast_thread.joinable())
    {
        broadcast_thread.join();
    }

    websocketpp::lib::error_code ec;
    ws_server.stop_listening(ec);
    if (ec)
    {
        cerr << "[BRIDGE] Error closing listener: " << ec.message() << endl;
    }

    {
        lock_guard<mutex> lock(clients_mutex);
        for (auto &client : clients)
        {
            websocketpp::lib::error_code close_ec;
            ws_server.close(client.first, websocketpp::close::status::going_away, "Server shutdown", close_ec);
        }
        clients.clear();
    }

    ws_server.stop();

    if (server_thread.joinable())
    {
        server_thread.join();
    }

    cout << "[BRIDGE] Stopped" << endl;
}

size_t StatusBridge::client_count()
{
    lock_guard<mutex> lock(clients_mutex);
    return clients.size();
}

void StatusBridge::on_open(connection_hdl hdl)
{
    size_t total;
    {
        lock_guard<mutex> lock(clients_mutex);
        connection_data data;
        data.connected_at = time(nullptr);
        clients[hdl] = data;
        total = clients.size();
    }
    cout << "[BRIDGE] Client connected. Total: " << total << endl;

    json init = json::object();
    init["type"] = "init";
    init["data"] = build_status()["data"];
    send_message(hdl, init.dump());
}

void StatusBridge::on_close(connection_hdl hdl)
{
    lock_guard<mutex> lock(clients_mutex);
    clients.erase(hdl);
    cout << "[BRIDGE] Client disconnected. Remaining: " << clients.size() << endl;
}

void StatusBridge::on_message(connection_hdl hdl, server::message_ptr msg)
{
    json response = handle_request(msg->get_payload());
    send_message(hdl, response.dump());
}

json StatusBridge::handle_request(const string &payload)
{
    if (payload.empty())
    {
        return make_error("Empty message");
    }

    try
    {
        json data = json::parse(payload);
        if (!data.is_object())
        {
            return make_error("Expected a JSON object");
        }

        string cmd = data.value("command", "");

        if (cmd == "force_emergency")
            return handle_force_emergency(data);
        if (cmd == "set_confidence")
            return handle_set_confidence(data);
        if (cmd == "get_stats")
            return handle_get_stats();
        if (cmd == "get_logs")
            return handle_get_logs(data);
        if (cmd == "get_today_stats")
            return handle_get_today_stats();
        if (cmd == "get_lane_stats")
            return handle_get_lane_stats(data);
        if (cmd == "ping")
        {
            json response = json::object();
            response["type"] = "pong";
            response["timestamp"] = time(nullptr);
            return response;
        }

        return make_error("Unknown command: " + cmd);
    }
    catch (const json::exception &e)
    {
        cerr << "[BRIDGE] JSON error: " << e.what() << endl;
        return make_error("Invalid JSON: " + string(e.what()));
    }
    catch (const exception &e)
    {
        cerr << "[BRIDGE] Error processing message: " << e.what() << endl;
        return make_error("Processing error: " + string(e.what()));
    }
}

json StatusBridge::handle_force_emergency(const json &data)
{
    if (!data.contains("lane") || !data["lane"].is_number_integer())
    {
        return make_error("force_emergency requires an integer 'lane'");
    }

    int lane = data["lane"].get<int>();
    if (!traffic.force_emergency(lane))
    {
        return make_error("Invalid lane: " + to_string(lane));
    }

    json data_obj = json::object();
    data_obj["lane"] = lane;

    json response = json::object();
    response["type"] = "emergency_forced";
    response["data"] = data_obj;
    return response;
}

json StatusBridge::handle_set_confidence(const json &data)
{
    if (!data.contains("confidence") || !data["confidence"].is_number())
    {
        return make_error("set_confidence requires a numeric 'confidence'");
    }

    double confidence = data["confidence"].get<double>();
    if (confidence <= 0.0 || confidence > 1.0)
    {
        return make_error("Confidence must be in (0, 1]");
    }

    traffic.update_confidence(static_cast<float>(confidence));

    json data_obj = json::object();
    data_obj["confidence"] = confidence;

    json response = json::object();
    response["type"] = "confidence_updated";
    response["data"] = data_obj;
    return response;
}

json StatusBridge::handle_get_stats()
{
    json response = json::object();
    response["type"] = "stats_response";
    response["data"] = statistics_to_json(traffic.get_statistics());
    return response;
}

json StatusBridge::handle_get_logs(const json &data)
{
    int limit = data.value("limit", 50);
    if (limit <= 0)
    {
        return make_error("limit must be positive");
    }

    json logs = json::array();
    for (const auto &record : traffic.recent_logs(static_cast<size_t>(limit)))
    {
        logs.push_back(record_to_json(record));
    }

    json response = json::object();
    response["type"] = "logs";
    response["data"] = logs;
    return response;
}

json StatusBridge::handle_get_today_stats()
{
    json response = json::object();
    response["type"] = "today_stats";
    response["data"] = today_stats_to_json(traffic.today_stats());
    return response;
}

json StatusBridge::handle_get_lane_stats(const json &data)
{
    int hours = data.value("hours", 24);
    if (hours <= 0)
    {
        return make_error("hours must be positive");
    }

    json lanes = json::array();
    for (const auto &lane : traffic.lane_stats(hours))
    {
        lanes.push_back(lane_analytics_to_json(lane));
    }

    json response = json::object();
    response["type"] = "lane_stats";
    response["data"] = lanes;
    return response;
}

json StatusBridge::build_status() const
{
    json states = json::object();
    for (const auto &entry : traffic.get_all_states())
    {
        states[to_string(entry.first)] = signal_state_name(entry.second);
    }

    json lanes = json::object();
    for (const auto &entry : traffic.get_all_lane_data())
    {
        lanes[to_string(entry.first)] = snapshot_to_json(entry.second);
    }

    json data_obj = json::object();
    data_obj["signals"] = states;
    data_obj["lanes"] = lanes;
    data_obj["statistics"] = statistics_to_json(traffic.get_statistics());
    data_obj["active_lanes"] = traffic.active_lanes();
    data_obj["timestamp"] = time(nullptr);

    json status = json::object();
    status["type"] = "status";
    status["data"] = data_obj;
    return status;
}

json StatusBridge::statistics_to_json(const ControllerStatistics &stats)
{
    json j = json::object();
    j["cycles"] = stats.cycles;
    j["emergency_events"] = stats.emergency_events;
    j["cumulative_wait_saved"] = stats.cumulative_wait_saved;
    j["average_wait_saved_per_cycle"] = stats.average_wait_saved_per_cycle;
    j["mode"] = signal_mode_name(stats.mode);
    j["current_lane"] = stats.current_lane;
    j["dropped_log_events"] = stats.dropped_log_events;
    j["cycle_errors"] = stats.cycle_errors;
    return j;
}

json StatusBridge::snapshot_to_json(const LaneSnapshot &snapshot)
{
    json j = json::object();
    j["lane_id"] = snapshot.lane_id;
    j["counts"] = snapshot.counts;
    j["total"] = snapshot.total_vehicles();
    j["ambulance"] = snapshot.ambulance_present;
    j["captured_at"] = format_local_time(snapshot.captured_at);
    return j;
}

json StatusBridge::today_stats_to_json(const TodayStats &stats)
{
    json j = json::object();
    j["total_cycles"] = stats.total_cycles;
    j["total_vehicles"] = stats.total_vehicles;
    j["emergency_events"] = stats.emergency_events;
    j["wait_time_saved"] = stats.wait_time_saved;
    return j;
}

json StatusBridge::lane_analytics_to_json(const LaneAnalytics &lane)
{
    json j = json::object();
    j["lane_id"] = lane.lane_id;
    j["total_vehicles"] = lane.total_vehicles;
    j["avg_vehicles"] = lane.avg_vehicles;
    j["total_cycles"] = lane.total_cycles;
    j["emergency_events"] = lane.emergency_events;
    j["avg_green_time"] = lane.avg_green_time;
    return j;
}

void StatusBridge::broadcast_loop()
{
    while (running.load())
    {
        try
        {
            broadcast_message(build_status().dump());
        }
        catch (const exception &e)
        {
            cerr << "[BRIDGE] Broadcast error: " << e.what() << endl;
        }

        unique_lock<mutex> lock(wake_mutex);
        wake_cv.wait_for(lock, chrono::milliseconds(broadcast_interval_ms), [this]
                         { return !running.load(); });
    }
}

json StatusBridge::make_error(const string &message)
{
    json response = json::object();
    response["type"] = "error";
    response["message"] = message;
    response["timestamp"] = time(nullptr);
    return response;
}

void StatusBridge::send_message(connection_hdl hdl, const string &msg)
{
    websocketpp::lib::error_code ec;
    ws_server.send(hdl, msg, websocketpp::frame::opcode::text, ec);
    if (ec)
    {
        cerr << "[BRIDGE] Error sending message: " << ec.message() << endl;
        lock_guard<mutex> lock(clients_mutex);
        clients.erase(hdl);
    }
}

void StatusBridge::broadcast_message(const string &msg)
{
    lock_guard<mutex> lock(clients_mutex);
    vector<connection_hdl> to_remove;

    for (const auto &client : clients)
    {
        websocketpp::lib::error_code ec;
        ws_server.send(client.first, msg, websocketpp::frame::opcode::text, ec);
        if (ec)
        {
            to_remove.push_back(client.first);
        }
    }

    // Remove dead connections
    for (const auto &hdl : to_remove)
    {
        clients.erase(hdl);
    }
}

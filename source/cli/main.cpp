
#include "../server/TrafficSystem.h"
#include "../server/StatusBridge.h"
#include "../../include/itms_config.hpp"

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <vector>
#include <sys/stat.h>

using namespace std;

static volatile sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        g_shutdown_requested = 1;
    }
}

static void print_usage(const char *program)
{
    cout << "Intelligent Traffic Management System - Usage:" << endl;
    cout << "  " << program << " [OPTIONS]" << endl;
    cout << endl;
    cout << "Options:" << endl;
    cout << "  --config FILE      Use specified configuration file" << endl;
    cout << "  --video N=PATH     Video source for lane N (repeatable)" << endl;
    cout << "  --model FILE       ONNX detection model" << endl;
    cout << "  --port PORT        Status bridge port" << endl;
    cout << "  --no-bridge        Do not start the status bridge" << endl;
    cout << "  --help             Show this help message" << endl;
    cout << endl;
}

static bool file_exists(const string &path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

// Verifies the files a run needs before any thread is started.
static bool check_setup(const ITMSConfig &config)
{
    bool ok = true;

    cout << "Checking setup..." << endl;
    if (!file_exists(config.model_path))
    {
        cerr << "  ✗ Model not found: " << config.model_path << endl;
        ok = false;
    }
    else
    {
        cout << "  ✓ Model: " << config.model_path << endl;
    }

    if (config.video_paths.empty())
    {
        cerr << "  ✗ No lane video sources configured" << endl;
        ok = false;
    }

    int found = 0;
    for (const auto &entry : config.video_paths)
    {
        if (file_exists(entry.second) || entry.second.rfind("/dev/video", 0) == 0 ||
            entry.second.find('!') != string::npos)
        {
            cout << "  ✓ Lane " << entry.first << ": " << entry.second << endl;
            found++;
        }
        else
        {
            cerr << "  ⚠ Lane " << entry.first << ": video not found: " << entry.second << endl;
        }
    }
    if (found == 0)
    {
        ok = false;
    }

    return ok;
}

int main(int argc, char *argv[])
{
    string config_file = "include/itms.conf";
    map<int, string> video_overrides;
    string model_override;
    int port_override = -1;
    bool disable_bridge = false;

    for (int i = 1; i < argc; i++)
    {
        string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_file = argv[++i];
        }
        else if (arg == "--video" && i + 1 < argc)
        {
            string mapping = argv[++i];
            size_t eq_pos = mapping.find('=');
            if (eq_pos == string::npos)
            {
                cerr << "ERROR: --video expects N=PATH, got: " << mapping << endl;
                return 1;
            }
            try
            {
                video_overrides[stoi(mapping.substr(0, eq_pos))] = mapping.substr(eq_pos + 1);
            }
            catch (const exception &)
            {
                cerr << "ERROR: Invalid lane number in --video " << mapping << endl;
                return 1;
            }
        }
        else if (arg == "--model" && i + 1 < argc)
        {
            model_override = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            try
            {
                port_override = stoi(argv[++i]);
            }
            catch (const exception &)
            {
                cerr << "ERROR: Invalid port number: " << argv[i] << endl;
                return 1;
            }
            if (port_override <= 0 || port_override > 65535)
            {
                cerr << "ERROR: Port out of range: " << port_override << endl;
                return 1;
            }
        }
        else if (arg == "--no-bridge")
        {
            disable_bridge = true;
        }
        else if (arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            cerr << "Unknown option: " << arg << endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ITMSConfig config;
    cout << "Loading config from: " << config_file << endl;

    vector<string> config_paths = {
        config_file,
        "include/itms.conf",
        "../include/itms.conf",
        "../../include/itms.conf"};

    bool config_loaded = false;
    for (const auto &path : config_paths)
    {
        if (config.load_from_file(path))
        {
            cout << "✓ Config loaded successfully from: " << path << endl;
            config_loaded = true;
            break;
        }
    }

    if (!config_loaded)
    {
        cout << "⚠ Warning: Could not load config file from any location" << endl;
        for (const auto &path : config_paths)
        {
            cout << "  Tried: " << path << endl;
        }
        cout << "  Using default configuration..." << endl;
    }

    for (const auto &entry : video_overrides)
    {
        config.video_paths[entry.first] = entry.second;
    }
    if (!model_override.empty())
        config.model_path = model_override;
    if (port_override > 0)
        config.bridge_port = static_cast<uint16_t>(port_override);
    if (disable_bridge)
        config.bridge_enabled = false;

    string error;
    if (!config.validate(error))
    {
        cerr << "ERROR: Invalid configuration: " << error << endl;
        return 1;
    }

    cout << "\n=== Configuration ===" << endl;
    cout << "Lanes: " << config.lane_count << endl;
    cout << "Model: " << config.model_path << " (confidence " << config.confidence << ")" << endl;
    cout << "Green times: " << config.light_green << "/" << config.medium_green << "/"
         << config.heavy_green << "s, emergency " << config.emergency_green << "s" << endl;
    cout << "Cycle log: " << config.log_path << endl;
    if (config.bridge_enabled)
        cout << "Status bridge: port " << config.bridge_port << endl;
    else
        cout << "Status bridge: disabled" << endl;
    cout << "========================\n"
         << endl;

    if (!check_setup(config))
    {
        cerr << "ERROR: Setup incomplete, see messages above" << endl;
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    TrafficSystem traffic(config);

    if (!traffic.initialize())
    {
        cerr << "ERROR: System initialization failed!" << endl;
        return 1;
    }

    if (!traffic.start())
    {
        cerr << "ERROR: System start failed!" << endl;
        return 1;
    }

    unique_ptr<StatusBridge> bridge;
    if (config.bridge_enabled)
    {
        bridge.reset(new StatusBridge(traffic, config.broadcast_interval_ms));
        if (!bridge->start(config.bridge_port))
        {
            cerr << "⚠ Continuing without status bridge" << endl;
            bridge.reset();
        }
    }

    cout << "Press Ctrl+C to stop" << endl;
    while (!g_shutdown_requested)
    {
        this_thread::sleep_for(chrono::milliseconds(200));
    }

    cout << endl
         << "Received shutdown signal..." << endl;

    if (bridge)
    {
        bridge->stop();
    }

    StopReport report = traffic.stop();
    return report.clean ? 0 : 2;
}

#ifndef ITMS_CONFIG_HPP
#define ITMS_CONFIG_HPP

#include <string>
#include <cstdint>
#include <fstream>
#include <map>
#include <vector>
#include <stdexcept>
#include <utility>
#include <iostream>
using namespace std;

struct ITMSConfig {
    // Lanes
    int lane_count;
    map<int, string> video_paths;       // lane id -> video file

    // Detector
    string model_path;
    string class_names_path;            // empty = COCO names
    float confidence;
    float nms_threshold;
    int input_size;
    int frame_width;                    // 0 disables resizing
    int frame_height;
    int loop_delay_ms;

    // Timing (nominal seconds unless noted)
    int heavy_traffic_threshold;        // count above this gets heavy_green
    int light_traffic_threshold;        // count below this gets light_green
    int heavy_green;
    int medium_green;
    int light_green;
    int reference_green;                // fixed-time baseline for wait saved
    int yellow_duration;
    int transition_delay;
    int emergency_green;
    int error_backoff;
    int second_length_ms;
    int preemption_check_ms;
    int stop_timeout_ms;

    // Status bridge
    bool bridge_enabled;
    uint16_t bridge_port;
    int broadcast_interval_ms;

    // File paths
    string log_path;

    ITMSConfig() : lane_count(4), model_path("models/yolov8n.onnx"),
                   confidence(0.5f), nms_threshold(0.45f), input_size(640),
                   frame_width(640), frame_height(360), loop_delay_ms(30),
                   heavy_traffic_threshold(15), light_traffic_threshold(5),
                   heavy_green(60), medium_green(30), light_green(15),
                   reference_green(60), yellow_duration(3), transition_delay(2),
                   emergency_green(45), error_backoff(5), second_length_ms(1000),
                   preemption_check_ms(100), stop_timeout_ms(2000),
                   bridge_enabled(true), bridge_port(8081),
                   broadcast_interval_ms(500),
                   log_path("data/traffic_log.jsonl") {}

    bool load_from_file(const string& filename) {
        ifstream file(filename);
        if (!file.is_open()) return false;

        string line, section;
        int line_number = 0;
        while (getline(file, line)) {
            line_number++;

            // Remove comments
            size_t comment_pos = line.find('#');
            if (comment_pos != string::npos) {
                line = line.substr(0, comment_pos);
            }

            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            if (line.empty()) continue;

            // Section header
            if (line[0] == '[' && line[line.length() - 1] == ']') {
                section = line.substr(1, line.length() - 2);
                continue;
            }

            // Key-value pair
            size_t eq_pos = line.find('=');
            if (eq_pos == string::npos) continue;

            string key = line.substr(0, eq_pos);
            string value = line.substr(eq_pos + 1);

            // Trim
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);

            try {
                parse_value(section, key, value);
            } catch (const exception& e) {
                cerr << "Config error in " << filename << ":" << line_number
                     << " [" << section << "] " << key << " = '" << value
                     << "': " << e.what() << endl;
                return false;
            }
        }

        return true;
    }

    // Checks cross-field constraints after loading and CLI overrides.
    bool validate(string& error) const {
        if (lane_count < 2) {
            error = "lanes.count must be at least 2";
            return false;
        }
        for (const auto& entry : video_paths) {
            if (entry.first < 1 || entry.first > lane_count) {
                error = "video_" + to_string(entry.first) + " is outside 1.." + to_string(lane_count);
                return false;
            }
        }
        if (light_traffic_threshold > heavy_traffic_threshold) {
            error = "timing.light_traffic_threshold exceeds heavy_traffic_threshold";
            return false;
        }
        const pair<const char*, int> phases[] = {
            {"heavy_green", heavy_green}, {"medium_green", medium_green},
            {"light_green", light_green}, {"reference_green", reference_green},
            {"yellow_duration", yellow_duration}, {"emergency_green", emergency_green}};
        for (const auto& phase : phases) {
            if (phase.second <= 0) {
                error = string("timing.") + phase.first + " must be positive";
                return false;
            }
        }
        if (transition_delay < 0 || error_backoff < 0 || stop_timeout_ms < 0) {
            error = "timing.transition_delay, error_backoff and stop_timeout_ms must not be negative";
            return false;
        }
        if (second_length_ms <= 0 || preemption_check_ms <= 0) {
            error = "timing.second_length_ms and preemption_check_ms must be positive";
            return false;
        }
        if (confidence <= 0.0f || confidence > 1.0f) {
            error = "detector.confidence must be in (0, 1]";
            return false;
        }
        return true;
    }

private:
    void parse_value(const string& section, const string& key, const string& value) {
        if (section == "lanes") {
            if (key == "count") lane_count = stoi(value);
            else if (key.compare(0, 6, "video_") == 0) video_paths[stoi(key.substr(6))] = value;
        }
        else if (section == "detector") {
            if (key == "model_path") model_path = value;
            else if (key == "class_names_path") class_names_path = value;
            else if (key == "confidence") confidence = stof(value);
            else if (key == "nms_threshold") nms_threshold = stof(value);
            else if (key == "input_size") input_size = stoi(value);
            else if (key == "frame_width") frame_width = stoi(value);
            else if (key == "frame_height") frame_height = stoi(value);
            else if (key == "loop_delay_ms") loop_delay_ms = stoi(value);
        }
        else if (section == "timing") {
            if (key == "heavy_traffic_threshold") heavy_traffic_threshold = stoi(value);
            else if (key == "light_traffic_threshold") light_traffic_threshold = stoi(value);
            else if (key == "heavy_green") heavy_green = stoi(value);
            else if (key == "medium_green") medium_green = stoi(value);
            else if (key == "light_green") light_green = stoi(value);
            else if (key == "reference_green") reference_green = stoi(value);
            else if (key == "yellow_duration") yellow_duration = stoi(value);
            else if (key == "transition_delay") transition_delay = stoi(value);
            else if (key == "emergency_green") emergency_green = stoi(value);
            else if (key == "error_backoff") error_backoff = stoi(value);
            else if (key == "second_length_ms") second_length_ms = stoi(value);
            else if (key == "preemption_check_ms") preemption_check_ms = stoi(value);
            else if (key == "stop_timeout_ms") stop_timeout_ms = stoi(value);
        }
        else if (section == "bridge") {
            if (key == "enabled") bridge_enabled = (value == "true");
            else if (key == "port") bridge_port = static_cast<uint16_t>(stoi(value));
            else if (key == "broadcast_interval_ms") broadcast_interval_ms = stoi(value);
        }
        else if (section == "paths") {
            if (key == "log_path") log_path = value;
        }
    }
};

#endif // ITMS_CONFIG_HPP

// vehicle_detector.cpp - YOLOv8 ONNX inference through cv::dnn
#include "vehicle_detector.h"
#include <chrono>
#include <fstream>
#include <iostream>

using namespace std::chrono;

YoloVehicleDetector::YoloVehicleDetector()
    : model_loaded(false), confidence_threshold(0.5f)
{
}

vector<string> YoloVehicleDetector::cocoClassNames()
{
    return {
        "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck", "boat",
        "traffic light", "fire hydrant", "stop sign", "parking meter", "bench", "bird", "cat",
        "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe", "backpack",
        "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard", "sports ball",
        "kite", "baseball bat", "baseball glove", "skateboard", "surfboard", "tennis racket",
        "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl", "banana", "apple",
        "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
        "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop", "mouse",
        "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
        "refrigerator", "book", "clock", "vase", "scissors", "teddy bear", "hair drier",
        "toothbrush"};
}

const set<string> &YoloVehicleDetector::vehicleClasses()
{
    static const set<string> classes = {"car", "motorcycle", "bus", "truck"};
    return classes;
}

bool YoloVehicleDetector::initialize(const DetectorConfig &cfg)
{
    config = cfg;
    confidence_threshold = cfg.confidence;

    cout << "Initializing YOLOv8 vehicle detector..." << endl;
    cout << "  Model: " << config.model_path << endl;

    ifstream model_file(config.model_path);
    if (!model_file.good())
    {
        cerr << "  ✗ Model file not found: " << config.model_path << endl;
        return false;
    }

    if (config.class_names_path.empty())
    {
        class_names = cocoClassNames();
    }
    else if (!loadClassNames(config.class_names_path))
    {
        return false;
    }

    try
    {
        net = dnn::readNetFromONNX(config.model_path);
        if (config.use_cuda)
        {
            net.setPreferableBackend(dnn::DNN_BACKEND_CUDA);
            net.setPreferableTarget(dnn::DNN_TARGET_CUDA);
        }
        else
        {
            net.setPreferableBackend(dnn::DNN_BACKEND_OPENCV);
            net.setPreferableTarget(dnn::DNN_TARGET_CPU);
        }
    }
    catch (const cv::Exception &e)
    {
        cerr << "  ✗ Failed to load model: " << e.what() << endl;
        return false;
    }

    if (net.empty())
    {
        cerr << "  ✗ Model loaded but network is empty" << endl;
        return false;
    }

    model_loaded = true;
    cout << "  ✓ Detector ready (" << class_names.size() << " classes, confidence "
         << confidence_threshold.load() << ")" << endl;
    return true;
}

bool YoloVehicleDetector::loadClassNames(const string &path)
{
    ifstream in(path);
    if (!in.is_open())
    {
        cerr << "  ✗ Class names file not found: " << path << endl;
        return false;
    }

    class_names.clear();
    string line;
    while (getline(in, line))
    {
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (!line.empty())
        {
            class_names.push_back(line);
        }
    }

    if (class_names.empty())
    {
        cerr << "  ✗ Class names file is empty: " << path << endl;
        return false;
    }
    return true;
}

void YoloVehicleDetector::updateConfidence(float confidence)
{
    confidence_threshold = confidence;
}

DetectionResult YoloVehicleDetector::detect(const Mat &frame)
{
    DetectionResult result;
    for (const auto &name : vehicleClasses())
    {
        result.counts[name] = 0;
    }

    if (frame.empty() || !model_loaded)
    {
        return result;
    }

    auto start = high_resolution_clock::now();

    Mat blob = dnn::blobFromImage(frame, 1.0 / 255.0, Size(config.input_size, config.input_size),
                                  Scalar(), true, false);

    vector<Mat> outputs;
    {
        lock_guard<mutex> lock(net_mutex);
        net.setInput(blob);
        net.forward(outputs, net.getUnconnectedOutLayersNames());
    }

    if (outputs.empty())
    {
        return result;
    }

    float x_factor = frame.cols / static_cast<float>(config.input_size);
    float y_factor = frame.rows / static_cast<float>(config.input_size);
    vector<Box> boxes = parseOutput(outputs[0], x_factor, y_factor);

    tally(boxes, class_names, result.counts, result.ambulance_present);

    if (config.draw_detections)
    {
        result.annotated_frame = frame.clone();
        drawBoxes(result.annotated_frame, boxes);
    }

    result.inference_time = duration_cast<microseconds>(high_resolution_clock::now() - start).count() / 1000.0;
    return result;
}

vector<YoloVehicleDetector::Box> YoloVehicleDetector::parseOutput(const Mat &output, float x_factor,
                                                                  float y_factor) const
{
    // YOLOv8 output is [1, 4 + classes, anchors]; transpose to one row per anchor.
    if (output.dims != 3 || output.size[1] <= 4)
    {
        cerr << "Unexpected detector output shape (" << output.dims << " dims)" << endl;
        return {};
    }
    int attributes = output.size[1];
    int anchors = output.size[2];
    int num_classes = attributes - 4;

    Mat rows = Mat(attributes, anchors, CV_32F, const_cast<float *>(output.ptr<float>())).t();

    float threshold = confidence_threshold.load();
    vector<int> class_ids;
    vector<float> confidences;
    vector<Rect> rects;

    for (int i = 0; i < anchors; i++)
    {
        const float *row = rows.ptr<float>(i);
        Mat scores(1, num_classes, CV_32F, const_cast<float *>(row + 4));
        Point class_id;
        double max_score;
        minMaxLoc(scores, nullptr, &max_score, nullptr, &class_id);

        if (max_score < threshold)
            continue;

        float cx = row[0], cy = row[1], w = row[2], h = row[3];
        int left = static_cast<int>((cx - 0.5f * w) * x_factor);
        int top = static_cast<int>((cy - 0.5f * h) * y_factor);
        int width = static_cast<int>(w * x_factor);
        int height = static_cast<int>(h * y_factor);

        class_ids.push_back(class_id.x);
        confidences.push_back(static_cast<float>(max_score));
        rects.push_back(Rect(left, top, width, height));
    }

    vector<int> keep;
    dnn::NMSBoxes(rects, confidences, threshold, config.nms_threshold, keep);

    vector<Box> boxes;
    boxes.reserve(keep.size());
    for (int idx : keep)
    {
        boxes.push_back({class_ids[idx], confidences[idx], rects[idx]});
    }
    return boxes;
}

void YoloVehicleDetector::tally(const vector<Box> &boxes, const vector<string> &names,
                                map<string, int> &counts, bool &ambulance)
{
    for (const auto &box : boxes)
    {
        if (box.class_id < 0 || box.class_id >= static_cast<int>(names.size()))
            continue;

        const string &name = names[box.class_id];
        if (vehicleClasses().count(name))
        {
            counts[name]++;
        }
        if (name == "ambulance")
        {
            ambulance = true;
        }
    }
}

void YoloVehicleDetector::drawBoxes(Mat &frame, const vector<Box> &boxes) const
{
    for (const auto &box : boxes)
    {
        string name = (box.class_id >= 0 && box.class_id < static_cast<int>(class_names.size()))
                          ? class_names[box.class_id]
                          : "object";
        Scalar color = (name == "ambulance") ? Scalar(0, 0, 255) : Scalar(0, 255, 0);

        rectangle(frame, box.rect, color, 2);
        string label = name + " " + to_string(static_cast<int>(box.confidence * 100)) + "%";
        putText(frame, label, Point(box.rect.x, max(box.rect.y - 5, 10)),
                FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
    }
}

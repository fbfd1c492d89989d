// vehicle_detector.h - Vehicle counting and ambulance detection on single frames
#pragma once

#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace cv;
using namespace std;

struct DetectionResult
{
    Mat annotated_frame;
    map<string, int> counts;        // vehicle class name -> count
    bool ambulance_present;
    double inference_time;          // ms

    DetectionResult() : ambulance_present(false), inference_time(0) {}
};

// Stateless as far as callers are concerned: one frame in, one result out.
class Detector
{
public:
    virtual ~Detector() {}
    virtual DetectionResult detect(const Mat &frame) = 0;
    virtual void updateConfidence(float confidence) { (void)confidence; }
};

// YOLOv8 exported to ONNX, run through OpenCV's DNN module.
class YoloVehicleDetector : public Detector
{
public:
    struct DetectorConfig
    {
        string model_path = "models/yolov8n.onnx";
        string class_names_path = "";   // empty = COCO
        float confidence = 0.5f;
        float nms_threshold = 0.45f;
        int input_size = 640;
        bool use_cuda = false;
        bool draw_detections = true;
    };

    struct Box
    {
        int class_id;
        float confidence;
        Rect rect;
    };

    YoloVehicleDetector();

    bool initialize(const DetectorConfig &config);
    bool isLoaded() const { return model_loaded; }

    DetectionResult detect(const Mat &frame) override;
    void updateConfidence(float confidence) override;
    float getConfidence() const { return confidence_threshold.load(); }

    const vector<string> &getClassNames() const { return class_names; }

    static vector<string> cocoClassNames();
    static const set<string> &vehicleClasses();

    // Turns raw boxes into per-class counts and the ambulance flag.
    static void tally(const vector<Box> &boxes, const vector<string> &names,
                      map<string, int> &counts, bool &ambulance);

private:
    DetectorConfig config;
    dnn::Net net;
    bool model_loaded;
    atomic<float> confidence_threshold;
    vector<string> class_names;
    mutex net_mutex;

    bool loadClassNames(const string &path);
    vector<Box> parseOutput(const Mat &output, float x_factor, float y_factor) const;
    void drawBoxes(Mat &frame, const vector<Box> &boxes) const;
};

#include <catch2/catch.hpp>
#include "modules/vehicle_detector.h"

TEST_CASE("Only the four vehicle classes are counted", "[detector]")
{
    vector<string> names = YoloVehicleDetector::cocoClassNames();
    REQUIRE(names.size() == 80);
    REQUIRE(names[2] == "car");
    REQUIRE(names[3] == "motorcycle");
    REQUIRE(names[5] == "bus");
    REQUIRE(names[7] == "truck");

    vector<YoloVehicleDetector::Box> boxes = {
        {2, 0.9f, Rect(0, 0, 10, 10)},
        {2, 0.8f, Rect(20, 0, 10, 10)},
        {7, 0.7f, Rect(40, 0, 10, 10)},
        {0, 0.9f, Rect(60, 0, 10, 10)},    // person
        {99, 0.9f, Rect(80, 0, 10, 10)}};  // unknown id

    map<string, int> counts;
    bool ambulance = false;
    YoloVehicleDetector::tally(boxes, names, counts, ambulance);

    REQUIRE(counts["car"] == 2);
    REQUIRE(counts["truck"] == 1);
    REQUIRE(counts.count("person") == 0);
    REQUIRE_FALSE(ambulance);
}

TEST_CASE("An ambulance class sets the flag without counting as a vehicle", "[detector]")
{
    vector<string> names = {"car", "ambulance", "bus"};
    vector<YoloVehicleDetector::Box> boxes = {
        {0, 0.9f, Rect(0, 0, 10, 10)},
        {1, 0.6f, Rect(20, 0, 10, 10)}};

    map<string, int> counts;
    bool ambulance = false;
    YoloVehicleDetector::tally(boxes, names, counts, ambulance);

    REQUIRE(ambulance);
    REQUIRE(counts["car"] == 1);
    REQUIRE(counts.count("ambulance") == 0);
}

TEST_CASE("Unloaded detector reports zero counts", "[detector]")
{
    YoloVehicleDetector detector;
    REQUIRE_FALSE(detector.isLoaded());

    DetectionResult result = detector.detect(Mat(360, 640, CV_8UC3, Scalar(0, 0, 0)));
    REQUIRE(result.counts.size() == 4);
    for (const auto &entry : result.counts)
    {
        REQUIRE(entry.second == 0);
    }
    REQUIRE_FALSE(result.ambulance_present);

    DetectionResult empty = detector.detect(Mat());
    REQUIRE(empty.counts["bus"] == 0);
}

TEST_CASE("Missing model file fails initialization", "[detector]")
{
    YoloVehicleDetector detector;
    YoloVehicleDetector::DetectorConfig config;
    config.model_path = "/nonexistent/model.onnx";

    REQUIRE_FALSE(detector.initialize(config));
    REQUIRE_FALSE(detector.isLoaded());

    detector.updateConfidence(0.7f);
    REQUIRE(detector.getConfidence() == Approx(0.7f));
}

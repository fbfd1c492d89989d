// video_source.h - Frame sources feeding the lane monitors
#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <atomic>
#include <chrono>

using namespace cv;
using namespace std;

class VideoSource {
public:
    enum FrameStatus {
        FRAME_OK,
        END_OF_STREAM,           // monitor rewinds and keeps going
        READ_ERROR               // transient, frame is skipped
    };

    virtual ~VideoSource() {}

    virtual bool open(const string& path) = 0;
    virtual FrameStatus nextFrame(Mat& frame) = 0;
    virtual bool rewind() = 0;
    virtual void close() = 0;
    virtual bool isOpened() const = 0;
    virtual string getSourceInfo() const = 0;
};

// cv::VideoCapture over a video file, a V4L2 device or a network stream.
class FileVideoSource : public VideoSource {
public:
    enum SourceType {
        SOURCE_FILE,
        SOURCE_V4L2,             // /dev/videoN
        SOURCE_GSTREAMER         // rtsp:// or http://
    };

    FileVideoSource();
    ~FileVideoSource();

    bool open(const string& path) override;
    FrameStatus nextFrame(Mat& frame) override;
    bool rewind() override;
    void close() override;
    bool isOpened() const override { return source_opened; }
    string getSourceInfo() const override;

    SourceType getSourceType() const { return source_type; }
    double getCurrentFPS() const { return current_fps.load(); }
    long getFramesRead() const { return frames_read.load(); }
    int getRewindCount() const { return rewind_count.load(); }

    static SourceType detectSourceType(const string& path);

private:
    string source_path;
    SourceType source_type;
    VideoCapture cap;
    atomic<bool> source_opened;

    atomic<long> frames_read;
    atomic<int> rewind_count;
    atomic<double> current_fps;
    int frame_counter;
    chrono::steady_clock::time_point fps_start_time;

    bool openCapture();
    string buildGStreamerPipeline() const;
    void updateFPS();
};

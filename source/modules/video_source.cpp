// video_source.cpp - OpenCV backed frame source with looping playback
#include "video_source.h"
#include <iostream>
#include <sstream>
#include <sys/stat.h>

using namespace std::chrono;

FileVideoSource::FileVideoSource()
    : source_type(SOURCE_FILE),
      source_opened(false),
      frames_read(0),
      rewind_count(0),
      current_fps(0.0),
      frame_counter(0)
{
    fps_start_time = steady_clock::now();
}

FileVideoSource::~FileVideoSource()
{
    close();
}

FileVideoSource::SourceType FileVideoSource::detectSourceType(const string &path)
{
    if (path.find("rtsp://") == 0 || path.find("http://") == 0)
    {
        return SOURCE_GSTREAMER;
    }
    if (path.find("/dev/video") == 0)
    {
        return SOURCE_V4L2;
    }
    return SOURCE_FILE;
}

bool FileVideoSource::open(const string &path)
{
    close();

    source_path = path;
    source_type = detectSourceType(path);

    if (source_type == SOURCE_FILE)
    {
        struct stat st;
        if (stat(path.c_str(), &st) != 0)
        {
            cerr << "  ✗ Video file not found: " << path << endl;
            return false;
        }
    }

    if (!openCapture())
    {
        return false;
    }

    source_opened = true;
    frames_read = 0;
    frame_counter = 0;
    fps_start_time = steady_clock::now();
    return true;
}

string FileVideoSource::buildGStreamerPipeline() const
{
    if (source_path.find("rtsp://") == 0)
    {
        return "rtspsrc location=" + source_path + " latency=0 ! "
               "rtph264depay ! h264parse ! avdec_h264 ! "
               "videoconvert ! appsink drop=true max-buffers=1";
    }
    return "souphttpsrc location=" + source_path + " is-live=true ! "
           "jpegdec ! videoconvert ! appsink drop=true max-buffers=1";
}

bool FileVideoSource::openCapture()
{
    try
    {
        switch (source_type)
        {
        case SOURCE_GSTREAMER:
            cap.open(buildGStreamerPipeline(), CAP_GSTREAMER);
            break;
        case SOURCE_V4L2:
            cap.open(source_path, CAP_V4L2);
            break;
        case SOURCE_FILE:
        default:
            cap.open(source_path);
            break;
        }
    }
    catch (const cv::Exception &e)
    {
        cerr << "  ✗ OpenCV error opening " << source_path << ": " << e.what() << endl;
        return false;
    }

    if (!cap.isOpened())
    {
        cerr << "  ✗ Failed to open video source: " << source_path << endl;
        return false;
    }

    if (source_type != SOURCE_FILE)
    {
        cap.set(CAP_PROP_BUFFERSIZE, 1);
    }
    return true;
}

VideoSource::FrameStatus FileVideoSource::nextFrame(Mat &frame)
{
    if (!source_opened)
    {
        return READ_ERROR;
    }

    try
    {
        if (!cap.grab())
        {
            // Files run out; live streams drop. Both are handled by rewind().
            return END_OF_STREAM;
        }
        if (!cap.retrieve(frame) || frame.empty())
        {
            return READ_ERROR;
        }
    }
    catch (const cv::Exception &e)
    {
        cerr << "Frame decode error on " << source_path << ": " << e.what() << endl;
        return READ_ERROR;
    }

    frames_read++;
    updateFPS();
    return FRAME_OK;
}

bool FileVideoSource::rewind()
{
    if (!source_opened)
    {
        return false;
    }

    rewind_count++;

    if (source_type == SOURCE_FILE && cap.set(CAP_PROP_POS_FRAMES, 0))
    {
        return true;
    }

    // Seeking is not supported by every backend; reopening always starts at frame 0.
    cap.release();
    if (!openCapture())
    {
        source_opened = false;
        return false;
    }
    return true;
}

void FileVideoSource::close()
{
    if (cap.isOpened())
    {
        cap.release();
    }
    source_opened = false;
}

string FileVideoSource::getSourceInfo() const
{
    stringstream ss;
    ss << source_path << " [";
    switch (source_type)
    {
    case SOURCE_FILE:
        ss << "file";
        break;
    case SOURCE_V4L2:
        ss << "V4L2";
        break;
    case SOURCE_GSTREAMER:
        ss << "GStreamer";
        break;
    }
    ss << ", " << frames_read.load() << " frames, " << rewind_count.load() << " rewinds]";
    return ss.str();
}

void FileVideoSource::updateFPS()
{
    frame_counter++;
    auto now = steady_clock::now();
    auto elapsed = duration_cast<milliseconds>(now - fps_start_time).count();
    if (elapsed >= 1000)
    {
        current_fps = frame_counter * 1000.0 / elapsed;
        frame_counter = 0;
        fps_start_time = now;
    }
}

#pragma once
#include <string>

#include "rtsp_watch_dog.h"

// Откуда брать кадры.
//   backend = "opencv"    -> cv::VideoCapture (индекс камеры "0", файл, http-поток)
//   backend = "gstreamer" -> StreamWorker (uridecodebin), для rtsp:// с watchdog'ом
//   backend = "auto"      -> gstreamer для rtsp://, иначе opencv
struct SourceConfig {
    std::string source = "0";
    std::string backend = "auto";
    int frame_width = 640;          // пожелание для VideoCapture, сеть может игнорировать
    int frame_height = 480;
    int read_timeout_ms = 100;      // ожидание кадра от StreamWorker
    int open_timeout_ms = 5000;     // ожидание первого кадра при open()
    RtspWatchDog::Config watchdog;
    bool verbose = true;
};

#pragma once
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>

#include "frame_store.h"
#include "rtsp_watch_dog.h"
#include "source/stream_worker.h"
#include "source/source_config.h"

// Источник кадров. open() == false: фатальная ошибка старта,
// read() == false: временная, цикл просто пробует снова.
// Деструктор освобождает устройство/пайплайн.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    virtual bool read(cv::Mat& out) = 0;
    virtual void release() = 0;
    virtual std::string describe() const = 0;
};

class CaptureSource : public FrameSource {
public:
    explicit CaptureSource(const SourceConfig& cfg);
    ~CaptureSource() override;

    bool open() override;
    bool read(cv::Mat& out) override;
    void release() override;
    std::string describe() const override;

private:
    SourceConfig cfg_;
    cv::VideoCapture cap_;
};

class GstStreamSource : public FrameSource {
public:
    explicit GstStreamSource(const SourceConfig& cfg);
    ~GstStreamSource() override;

    bool open() override;
    bool read(cv::Mat& out) override;
    void release() override;
    std::string describe() const override;

private:
    SourceConfig cfg_;
    FrameStore store_;
    StreamWorker worker_;
    RtspWatchDog watchdog_;
    bool opened_ = false;
};

// "0", "1", ...: индекс камеры.
bool isCameraIndex(const std::string& source);

// Итоговый backend с учётом "auto": "opencv" или "gstreamer".
std::string resolveBackend(const SourceConfig& cfg);

std::unique_ptr<FrameSource> makeFrameSource(const SourceConfig& cfg);

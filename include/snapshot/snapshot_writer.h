#pragma once
#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "notify/channel.h"

// Сохранение кадра события. Реализация решает, куда и как писать;
// ядро только передаёт результат дальше в каналы.
class SnapshotWriter {
public:
    virtual ~SnapshotWriter() = default;

    // nullptr = снимка нет, каналы отправят только текст.
    virtual std::shared_ptr<const notify::Snapshot> persist(const cv::Mat& frame,
                                                            std::chrono::system_clock::time_point when) = 0;
};

// JPEG в каталог save_dir: event_YYYYmmdd_HHMMSS.jpg.
class JpegSnapshotWriter : public SnapshotWriter {
public:
    struct Config {
        std::string save_dir = "events";
        int jpeg_quality = 95;
        bool verbose = true;
    };

    explicit JpegSnapshotWriter(const Config& cfg);

    std::shared_ptr<const notify::Snapshot> persist(const cv::Mat& frame,
                                                    std::chrono::system_clock::time_point when) override;

private:
    Config cfg_;
};

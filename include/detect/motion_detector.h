#pragma once
#include <opencv2/opencv.hpp>
#include <vector>

// Источник покадрового флага движения для MotionPipeline.
class MotionSignal {
public:
    virtual ~MotionSignal() = default;

    // true = на этом кадре есть движение.
    virtual bool evaluate(const cv::Mat& frame_bgr) = 0;
};

// Результат последнего evaluate(), нужен только для превью/отладки.
struct MotionResult {
    bool motion = false;
    double moving_area = 0.0;       // суммарная площадь учтённых контуров, px
    double required_area = 0.0;     // min_area_fraction * площадь кадра, px
    std::vector<cv::Rect> boxes;    // рамки учтённых контуров
    cv::Mat gray;                   // размытый серый кадр
    cv::Mat mask;                   // бинарная маска после dilate
};

// MOG2 background subtraction:
// gray -> GaussianBlur -> MOG2 -> threshold -> dilate -> контуры -> площадь.
class MotionDetector : public MotionSignal {
public:
    struct Config {
        double min_area_fraction = 0.01;   // доля кадра, начиная с которой считаем движением
        double min_contour_area = 100.0;   // контуры меньше считаются шумом
        int history = 500;
        double var_threshold = 16.0;
        bool detect_shadows = true;
        int blur_size = 5;
        int binarize_threshold = 200;      // тени MOG2 (127) отсекаются
        int dilate_iterations = 2;
    };

    explicit MotionDetector(const Config& cfg);

    bool evaluate(const cv::Mat& frame_bgr) override;
    const MotionResult& last_result() const { return last_; }

    void reset();

private:
    static cv::Mat to_gray(const cv::Mat& frame);

    Config cfg_;
    cv::Ptr<cv::BackgroundSubtractorMOG2> subtractor_;
    MotionResult last_;
};

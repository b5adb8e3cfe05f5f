#include "detect/motion_detector.h"

#include <algorithm>

MotionDetector::MotionDetector(const Config& cfg) : cfg_(cfg) {
    cfg_.min_area_fraction = std::max(0.0, std::min(cfg_.min_area_fraction, 1.0));
    cfg_.min_contour_area = std::max(0.0, cfg_.min_contour_area);
    cfg_.history = std::max(1, cfg_.history);
    cfg_.binarize_threshold = std::max(0, std::min(cfg_.binarize_threshold, 254));
    cfg_.dilate_iterations = std::max(0, cfg_.dilate_iterations);
    if (cfg_.blur_size > 1 && cfg_.blur_size % 2 == 0) {
        cfg_.blur_size += 1;
    }
    reset();
}

void MotionDetector::reset() {
    subtractor_ = cv::createBackgroundSubtractorMOG2(
            cfg_.history,
            cfg_.var_threshold,
            cfg_.detect_shadows
    );
    last_ = MotionResult{};
}

cv::Mat MotionDetector::to_gray(const cv::Mat& frame) {
    if (frame.channels() == 3) {
        cv::Mat gray;
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        return gray;
    }
    return frame.clone();
}

bool MotionDetector::evaluate(const cv::Mat& frame_bgr) {
    MotionResult res;
    if (frame_bgr.empty()) {
        last_ = res;
        return false;
    }

    // Серый + лёгкое размытие, чтобы снизить шум сенсора.
    res.gray = to_gray(frame_bgr);
    if (cfg_.blur_size > 1) {
        cv::GaussianBlur(res.gray, res.gray, cv::Size(cfg_.blur_size, cfg_.blur_size), 0);
    }

    cv::Mat fgmask;
    subtractor_->apply(res.gray, fgmask);
    cv::threshold(fgmask, res.mask, cfg_.binarize_threshold, 255, cv::THRESH_BINARY);
    if (cfg_.dilate_iterations > 0) {
        cv::dilate(res.mask, res.mask, cv::Mat(), cv::Point(-1, -1), cfg_.dilate_iterations);
    }

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(res.mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    for (const auto& contour : contours) {
        const double area = cv::contourArea(contour);
        if (area < cfg_.min_contour_area) {
            continue;
        }
        res.moving_area += area;
        res.boxes.push_back(cv::boundingRect(contour));
    }

    const double frame_area = static_cast<double>(res.gray.rows) * static_cast<double>(res.gray.cols);
    res.required_area = cfg_.min_area_fraction * frame_area;
    res.motion = res.moving_area >= res.required_area;

    last_ = std::move(res);
    return last_.motion;
}

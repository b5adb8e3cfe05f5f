#include "ui/preview_window.h"

#include <cstdio>
#include <utility>

namespace ui {

    PreviewWindow::PreviewWindow(std::string window_name, bool show_mask)
            : window_(std::move(window_name)),
              mask_window_(window_ + " mask"),
              show_mask_(show_mask) {
        cv::namedWindow(window_, cv::WINDOW_NORMAL);
        if (show_mask_) {
            cv::namedWindow(mask_window_, cv::WINDOW_NORMAL);
        }
    }

    PreviewWindow::~PreviewWindow() {
        cv::destroyWindow(window_);
        if (show_mask_) {
            cv::destroyWindow(mask_window_);
        }
    }

    bool PreviewWindow::show(const MotionResult& result) {
        if (!result.gray.empty()) {
            cv::Mat view = result.gray.clone();
            for (const auto& r : result.boxes) {
                cv::rectangle(view, r, cv::Scalar(255, 255, 255), 2);
            }

            char status[96];
            std::snprintf(status, sizeof(status), "Motion:%s area:%.0f/%.0f",
                          result.motion ? "YES" : "no", result.moving_area, result.required_area);
            cv::putText(view, status, cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX,
                        0.55, cv::Scalar(255, 255, 255), 2);

            cv::imshow(window_, view);
        }
        if (show_mask_ && !result.mask.empty()) {
            cv::imshow(mask_window_, result.mask);
        }

        return poll();
    }

    bool PreviewWindow::poll() {
        return isQuitKey(cv::pollKey());
    }

    bool isQuitKey(int key) {
        if (key < 0) {
            return false;
        }
        const int k = key & 0xFF;
        return k == 'q' || k == 'Q' || k == 27;
    }

} // namespace ui

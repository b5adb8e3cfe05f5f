#pragma once
#include <opencv2/opencv.hpp>
#include <string>

#include "detect/motion_detector.h"

namespace ui {

// Окно предпросмотра в потоке основного цикла.
// Рисует рамки движения и строку статуса на сером кадре, опционально маску.
// Без waitKey: события HighGUI обрабатываются через pollKey().
class PreviewWindow {
public:
    PreviewWindow(std::string window_name, bool show_mask);
    ~PreviewWindow();

    PreviewWindow(const PreviewWindow&) = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    // Показать кадр. true = пользователь попросил выход ('q' или ESC).
    bool show(const MotionResult& result);

    // Только обработать события окна (кадр не анализировался).
    bool poll();

private:
    std::string window_;
    std::string mask_window_;
    bool show_mask_;
};

// 'q', 'Q' или ESC. Код из pollKey() может нести биты модификаторов, смотрим младший байт.
bool isQuitKey(int key);

} // namespace ui

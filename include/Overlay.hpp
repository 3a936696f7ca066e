#pragma once
#include "CountingSession.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <string>

/** Draws identities, the counting line and the running counts onto `img`. */
void draw_overlay(cv::Mat& img, const FrameView& view, const AppConfig& cfg);

/**
 * Display window for a running session. Replayed frames have no image, so
 * a blank canvas of the frame size is drawn instead. 'q' or Esc raises
 * `stop`. The window is destroyed with the object.
 */
class OverlayWindow
{
public:
    OverlayWindow(const AppConfig& cfg, std::atomic<bool>& stop);
    ~OverlayWindow();
    OverlayWindow(const OverlayWindow&) = delete;
    OverlayWindow& operator=(const OverlayWindow&) = delete;

    void operator()(const FrameView& view);

private:
    const AppConfig&   cfg_;
    std::atomic<bool>& stop_;
    std::string        title_;
    cv::Mat            canvas_;
};

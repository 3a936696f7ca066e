#include "Overlay.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <sstream>

void draw_overlay(cv::Mat& img, const FrameView& view, const AppConfig& cfg)
{
    const cv::Scalar yellow(0, 255, 255), green(0, 255, 0), red(0, 0, 255), blue(255, 0, 0);

    for (const auto& b : view.frame.boxes) {
        cv::rectangle(img, cv::Point(cvRound(b.x1), cvRound(b.y1)),
                      cv::Point(cvRound(b.x2), cvRound(b.y2)), green, 2);
        cv::putText(img, b.label, cv::Point(cvRound(b.x1), cvRound(b.y1) - 10),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, green, 2);
    }

    for (const auto& t : view.objects) {
        cv::Point c(cvRound(t.centroid.x), cvRound(t.centroid.y));
        cv::circle(img, c, 4, yellow, -1);
        cv::putText(img, "ID " + std::to_string(t.id), {c.x - 10, c.y - 10},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, yellow, 2);
    }

    const auto& agg = view.aggregator;
    std::ostringstream text;
    text << "Total " << cfg.object_type << ": " << agg.total();
    if (view.line) {
        cv::line(img, view.line->p1, view.line->p2, blue, 2);
        Orientation o = cfg.line.orientation;
        text << "   (" << bucket_label(o, Bucket::First) << ": " << agg.dir1()
             << "   " << bucket_label(o, Bucket::Second) << ": " << agg.dir2() << ")";
    }
    text << "   since " << format_session_time(agg.session_start());
    cv::putText(img, text.str(), {10, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.7, red, 2);
}

OverlayWindow::OverlayWindow(const AppConfig& cfg, std::atomic<bool>& stop)
    : cfg_(cfg), stop_(stop),
      title_(cfg.analysis_mode == CountingMode::Directional ? "Directional Counting"
                                                            : "Unique Counting")
{
    cv::namedWindow(title_, cv::WINDOW_NORMAL);
    cv::resizeWindow(title_, cfg.resolution_width, cfg.resolution_height);
}

OverlayWindow::~OverlayWindow()
{
    try {
        cv::destroyWindow(title_);
    } catch (const cv::Exception& e) {
        std::cerr << "[display] " << e.what() << std::endl;
    }
}

void OverlayWindow::operator()(const FrameView& view)
{
    if (!view.frame.image.empty())
        view.frame.image.copyTo(canvas_);
    else
        canvas_ = cv::Mat(view.frame.size, CV_8UC3, cv::Scalar(30, 30, 30));

    draw_overlay(canvas_, view, cfg_);
    cv::imshow(title_, canvas_);

    int key = cv::waitKey(1);
    if (key == 27 || key == 'q' || key == 'Q') stop_ = true;
}

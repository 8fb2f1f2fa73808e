/**
 * @file ScreenMapping.cpp
 * @brief Pad-to-screen mapping and pad range calibration
 */

#include "padpoint/prediction/ScreenMapping.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace padpoint {
namespace prediction {

namespace {

void apply_margin(int& lo, int& hi, double fraction) {
    fraction = std::max(0.0, std::min(1.0, fraction));
    int w = hi - lo;
    int lo2 = static_cast<int>(lo + w * fraction);
    int hi2 = static_cast<int>(hi - w * fraction);
    if (hi2 > lo2) {
        lo = lo2;
        hi = hi2;
    }
}

} // namespace

double PredictionParameters::clamped_ratio() const {
    return std::max(0.05, std::min(0.95, pointer_ellipse_ratio));
}

double PredictionParameters::clamped_gamma() const {
    return std::max(0.1, pointer_center_shift_gamma);
}

std::string confidence_to_string(PredictionConfidence confidence) {
    switch (confidence) {
        case PredictionConfidence::NORMAL: return "Normal";
        case PredictionConfidence::OCCLUDED: return "Occluded";
        case PredictionConfidence::INVALID: return "Invalid";
        default: return "Unknown";
    }
}

std::string occlusion_strategy_to_string(OcclusionStrategy strategy) {
    switch (strategy) {
        case OcclusionStrategy::GEOMETRIC: return "geometric";
        case OcclusionStrategy::CONTACT_SIZE: return "contact_size";
        default: return "invalid";
    }
}

bool parse_occlusion_strategy(const std::string& name, OcclusionStrategy& strategy) {
    if (name == "geometric") {
        strategy = OcclusionStrategy::GEOMETRIC;
        return true;
    }
    if (name == "contact_size") {
        strategy = OcclusionStrategy::CONTACT_SIZE;
        return true;
    }
    return false;
}

// ===== ScreenMapping =====

ScreenMapping::ScreenMapping()
    : screen_width_(0)
    , screen_height_(0) {
}

ScreenMapping::ScreenMapping(const PadBounds& bounds, int screen_width, int screen_height)
    : bounds_(bounds)
    , screen_width_(screen_width)
    , screen_height_(screen_height) {
}

cv::Point2d ScreenMapping::scale() const {
    double span_x = std::max(1, bounds_.width());
    double span_y = std::max(1, bounds_.height());
    return cv::Point2d((screen_width_ - 1) / span_x, (screen_height_ - 1) / span_y);
}

cv::Point2d ScreenMapping::pad_to_screen(const cv::Point2d& pad) const {
    double px = std::max<double>(bounds_.min_x, std::min<double>(pad.x, bounds_.max_x));
    double py = std::max<double>(bounds_.min_y, std::min<double>(pad.y, bounds_.max_y));
    cv::Point2d s = scale();
    return clamp_to_screen(cv::Point2d((px - bounds_.min_x) * s.x,
                                       (py - bounds_.min_y) * s.y));
}

cv::Point2d ScreenMapping::screen_to_pad(const cv::Point2d& screen) const {
    cv::Point2d s = scale();
    cv::Point2d clamped = clamp_to_screen(screen);
    double px = s.x > 0.0 ? bounds_.min_x + clamped.x / s.x : bounds_.min_x;
    double py = s.y > 0.0 ? bounds_.min_y + clamped.y / s.y : bounds_.min_y;
    return cv::Point2d(std::max<double>(bounds_.min_x, std::min<double>(px, bounds_.max_x)),
                       std::max<double>(bounds_.min_y, std::min<double>(py, bounds_.max_y)));
}

cv::Point2d ScreenMapping::clamp_to_screen(const cv::Point2d& screen) const {
    double max_x = std::max(0, screen_width_ - 1);
    double max_y = std::max(0, screen_height_ - 1);
    return cv::Point2d(std::max(0.0, std::min(screen.x, max_x)),
                       std::max(0.0, std::min(screen.y, max_y)));
}

cv::Point ScreenMapping::to65535(const cv::Point2d& screen) const {
    cv::Point2d clamped = clamp_to_screen(screen);
    double span_x = std::max(1, screen_width_ - 1);
    double span_y = std::max(1, screen_height_ - 1);
    return cv::Point(static_cast<int>(std::lround(65535.0 * clamped.x / span_x)),
                     static_cast<int>(std::lround(65535.0 * clamped.y / span_y)));
}

// ===== PadCalibrator =====

PadCalibrator::PadCalibrator()
    : calib_seconds_(0.0)
    , margin_(0.0)
    , calibrating_(false) {
}

PadCalibrator::PadCalibrator(const PadBounds& initial, double calib_seconds, double margin)
    : bounds_(initial)
    , calib_seconds_(calib_seconds)
    , margin_(margin)
    , calibrating_(false) {
}

void PadCalibrator::start(core::TimePoint now) {
    started_at_ = now;
    calibrating_ = calib_seconds_ > 0.0;
    if (calibrating_) {
        PADPOINT_LOG_INFO("Calibration") << "Calibrating pad range for "
            << calib_seconds_ << "s, sweep the whole surface";
    }
}

void PadCalibrator::observe(int x, int y, core::TimePoint now) {
    if (!calibrating_ ||
        std::chrono::duration<double>(now - started_at_).count() >= calib_seconds_) {
        return;
    }
    bounds_.min_x = std::min(bounds_.min_x, x);
    bounds_.max_x = std::max(bounds_.max_x, x);
    bounds_.min_y = std::min(bounds_.min_y, y);
    bounds_.max_y = std::max(bounds_.max_y, y);
}

bool PadCalibrator::update(core::TimePoint now) {
    if (!calibrating_ ||
        std::chrono::duration<double>(now - started_at_).count() < calib_seconds_) {
        return false;
    }
    calibrating_ = false;
    apply_margin(bounds_.min_x, bounds_.max_x, margin_);
    apply_margin(bounds_.min_y, bounds_.max_y, margin_);

    PADPOINT_LOG_INFO("Calibration") << "Pad range x=[" << bounds_.min_x << ", "
        << bounds_.max_x << "] y=[" << bounds_.min_y << ", " << bounds_.max_y << "]";
    return true;
}

} // namespace prediction
} // namespace padpoint

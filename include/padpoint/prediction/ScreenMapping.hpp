/**
 * @file ScreenMapping.hpp
 * @brief Pad-to-screen affine mapping and automatic pad range calibration
 */

#ifndef PADPOINT_PREDICTION_SCREEN_MAPPING_HPP
#define PADPOINT_PREDICTION_SCREEN_MAPPING_HPP

#include <opencv2/core.hpp>
#include "PredictionTypes.hpp"

namespace padpoint {
namespace prediction {

/**
 * @brief Maps pad bounds onto [0, w-1] x [0, h-1]
 */
class ScreenMapping {
public:
    ScreenMapping();
    ScreenMapping(const PadBounds& bounds, int screen_width, int screen_height);

    /**
     * @brief Map a pad point to screen pixels, clamped to the screen
     */
    cv::Point2d pad_to_screen(const cv::Point2d& pad) const;

    /**
     * @brief Inverse mapping, clamped to the pad bounds
     */
    cv::Point2d screen_to_pad(const cv::Point2d& screen) const;

    /**
     * @brief Screen pixels per pad unit along x and y
     */
    cv::Point2d scale() const;

    /**
     * @brief Convert a screen point to the 0..65535 absolute axis range
     */
    cv::Point to65535(const cv::Point2d& screen) const;

    cv::Point2d clamp_to_screen(const cv::Point2d& screen) const;

    const PadBounds& bounds() const { return bounds_; }
    int screen_width() const { return screen_width_; }
    int screen_height() const { return screen_height_; }
    bool is_valid() const { return bounds_.is_valid() && screen_width_ > 0 && screen_height_ > 0; }

private:
    PadBounds bounds_;
    int screen_width_;
    int screen_height_;
};

/**
 * @brief Widens the reported pad range with observed extremes
 *
 * Touches seen during the first calib_seconds extend the bounds; when the
 * window closes the bounds are shrunk by the configured margin on each side.
 */
class PadCalibrator {
public:
    PadCalibrator();
    PadCalibrator(const PadBounds& initial, double calib_seconds, double margin);

    void start(core::TimePoint now);

    /**
     * @brief Extend the bounds if the window is still open
     */
    void observe(int x, int y, core::TimePoint now);

    /**
     * @brief Close the window once it has elapsed
     * @return true exactly once, on the call that finalized the bounds
     */
    bool update(core::TimePoint now);

    bool is_calibrating() const { return calibrating_; }
    const PadBounds& get_bounds() const { return bounds_; }

private:
    PadBounds bounds_;
    double calib_seconds_;
    double margin_;
    core::TimePoint started_at_;
    bool calibrating_;
};

} // namespace prediction
} // namespace padpoint

#endif // PADPOINT_PREDICTION_SCREEN_MAPPING_HPP

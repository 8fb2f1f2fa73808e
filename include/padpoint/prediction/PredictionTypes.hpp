/**
 * @file PredictionTypes.hpp
 * @brief Types for pointer prediction from the reference pose
 */

#ifndef PADPOINT_PREDICTION_PREDICTION_TYPES_HPP
#define PADPOINT_PREDICTION_PREDICTION_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "padpoint/core/types.hpp"

namespace padpoint {
namespace prediction {

/**
 * @brief How the pointing contact's own ellipse is derived for the
 *        confidence checks
 */
enum class OcclusionStrategy {
    GEOMETRIC = 0,  ///< Ellipse through the contact, centered on the reference point
    CONTACT_SIZE    ///< Ellipse from the reported touch_major/touch_minor
};

enum class PredictionConfidence {
    NORMAL = 0,     ///< Fresh sample
    OCCLUDED,       ///< Middle finger in the way; extrapolated from the last good sample
    INVALID         ///< Degenerate geometry; output suppressed
};

/**
 * @brief Geometry constants of the elliptical sector model
 *
 * Loaded once at startup and never changed afterwards.
 */
struct PredictionParameters {
    double outer_ellipse_scale = 1.0;
    double outer_ellipse_aspect = 1.0;       ///< b_o / a_o
    double pointer_ellipse_ratio = 0.62;     ///< Clamped to [0.05, 0.95]
    double pointer_center_shift_gamma = 1.0; ///< Radius warp exponent, at least 0.1
    double pointer_mark_deg = -20.0;
    double pointer_mark_slope = 1.0;

    double pred_min_ellipse_a_px = 160.0;
    double pred_min_ellipse_b_px = 120.0;
    double pred_minM_ellipse_a_px = 200.0;
    double pred_minM_ellipse_b_px = 140.0;

    OcclusionStrategy occlusion_strategy = OcclusionStrategy::GEOMETRIC;
    double default_contact_ellipse_a_px = 12.0;
    double default_contact_ellipse_b_px = 10.0;

    /// Velocity multiplier applied per consecutive occluded tick
    double occlusion_velocity_decay = 0.8;

    double clamped_ratio() const;
    double clamped_gamma() const;

    bool is_valid() const {
        return outer_ellipse_scale > 0.0 &&
               outer_ellipse_aspect > 0.0 &&
               pointer_ellipse_ratio > 0.0 && pointer_ellipse_ratio < 1.0 &&
               pointer_center_shift_gamma > 0.0 &&
               pred_min_ellipse_a_px >= 0.0 && pred_min_ellipse_b_px >= 0.0 &&
               pred_minM_ellipse_a_px >= 0.0 && pred_minM_ellipse_b_px >= 0.0 &&
               default_contact_ellipse_a_px > 0.0 && default_contact_ellipse_b_px > 0.0 &&
               occlusion_velocity_decay >= 0.0 && occlusion_velocity_decay <= 1.0;
    }
};

/**
 * @brief Result of one prediction
 */
struct PredictedPointer {
    cv::Point2d pad_point;          ///< Predicted location in pad units
    cv::Point2d screen_point;       ///< Predicted location in screen pixels
    double sector_angle = 0.0;      ///< Corrected angle in degrees, 0 along the perpendicular
    PredictionConfidence confidence = PredictionConfidence::INVALID;
    core::TimePoint timestamp;
    std::uint64_t contact_id = 0;   ///< Pointing contact the prediction was made for

    /// False when nothing may be forwarded (Invalid, or Occluded without history)
    bool has_output = false;
};

/**
 * @brief Ellipse outlines sampled in screen pixels, for drawing
 */
struct PredictionGeometry {
    std::vector<cv::Point2d> outer_outline;
    std::vector<cv::Point2d> pointer_outline;
    bool valid = false;
};

/**
 * @brief Pad coordinate range reported by (or calibrated for) the device
 */
struct PadBounds {
    int min_x = 0;
    int max_x = 0;
    int min_y = 0;
    int max_y = 0;

    bool is_valid() const {
        return max_x > min_x && max_y > min_y;
    }

    int width() const { return max_x - min_x; }
    int height() const { return max_y - min_y; }
};

/**
 * @brief Pad-to-screen calibration settings
 */
struct CalibrationConfig {
    PadBounds pad_bounds;           ///< Empty means: use the device's reported ranges
    int screen_width = 1920;
    int screen_height = 1080;
    double calib_seconds = 1.5;     ///< Observation window; 0 disables auto-calibration
    double margin = 0.02;           ///< Fraction trimmed from each side after calibration

    bool is_valid() const {
        return screen_width > 0 && screen_height > 0 &&
               calib_seconds >= 0.0 &&
               margin >= 0.0 && margin < 0.5 &&
               (pad_bounds.is_valid() ||
                (pad_bounds.min_x == 0 && pad_bounds.max_x == 0 &&
                 pad_bounds.min_y == 0 && pad_bounds.max_y == 0));
    }
};

std::string confidence_to_string(PredictionConfidence confidence);
std::string occlusion_strategy_to_string(OcclusionStrategy strategy);
bool parse_occlusion_strategy(const std::string& name, OcclusionStrategy& strategy);

} // namespace prediction
} // namespace padpoint

#endif // PADPOINT_PREDICTION_PREDICTION_TYPES_HPP

/**
 * @file TouchTypes.hpp
 * @brief Core data types for touch contact tracking
 *
 * Defines the raw touch report consumed from the device layer, the tracked
 * Contact, the ReferencePose built from the steady reference fingers, and the
 * tracking configuration.
 */

#ifndef PADPOINT_TRACKING_TOUCH_TYPES_HPP
#define PADPOINT_TRACKING_TOUCH_TYPES_HPP

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "padpoint/core/types.hpp"

namespace padpoint {
namespace tracking {

/**
 * @brief Kind of a single touch report
 */
enum class TouchEventKind {
    DOWN = 0,   ///< Finger placed on a slot
    MOVE,       ///< Position or size update on an active slot
    UP          ///< Finger lifted from a slot
};

/**
 * @brief One touch report from the device layer, keyed by hardware slot
 */
struct TouchReport {
    int slot_id = 0;
    int x = 0;
    int y = 0;
    TouchEventKind kind = TouchEventKind::MOVE;
    core::TimePoint timestamp;
    int touch_major = 0;    ///< Contact ellipse major axis in pad units, 0 if not reported
    int touch_minor = 0;    ///< Contact ellipse minor axis in pad units, 0 if not reported
};

/// Reports that arrived between two batch boundaries (one tick)
using TouchBatch = std::vector<TouchReport>;

/**
 * @brief One active touch contact with stable identity
 *
 * The id is never reused: a slot that is freed and reassigned produces a new
 * Contact with a new id.
 */
struct Contact {
    std::uint64_t id = 0;
    int slot_id = -1;
    cv::Point position;
    int touch_major = 0;
    int touch_minor = 0;
    core::TimePoint established_at;
    core::TimePoint last_seen;
    std::uint64_t last_seen_tick = 0;

    bool has_size() const { return touch_major > 0; }

    cv::Point2d position_d() const {
        return cv::Point2d(position.x, position.y);
    }
};

/**
 * @brief Direction from thumb to pinky used for role assignment
 *
 * Pad y grows downward, so BOTTOM_TO_TOP places the thumb at the largest y.
 */
enum class RoleAxis {
    LEFT_TO_RIGHT = 0,  ///< Thumb is the leftmost reference contact
    RIGHT_TO_LEFT,      ///< Thumb is the rightmost reference contact
    TOP_TO_BOTTOM,      ///< Thumb is the topmost reference contact
    BOTTOM_TO_TOP       ///< Thumb is the bottommost reference contact
};

/**
 * @brief Reference pose built from the thumb, middle and pinky contacts
 */
struct ReferencePose {
    Contact thumb;
    Contact middle;
    Contact pinky;

    /// All reference contacts ordered along the role axis (thumb first)
    std::vector<Contact> references;

    cv::Point2d baseline;             ///< pinky - thumb
    cv::Point2d centroid;             ///< Mean of the reference positions
    cv::Point2d perpendicular_axis;   ///< Unit vector, pointing away from the palm

    core::TimePoint established_at;
    bool valid = false;

    double baseline_length() const {
        return std::sqrt(baseline.x * baseline.x + baseline.y * baseline.y);
    }

    cv::Point2d baseline_unit() const {
        double len = baseline_length();
        if (len <= 0.0) {
            return cv::Point2d(1.0, 0.0);
        }
        return cv::Point2d(baseline.x / len, baseline.y / len);
    }

    bool contains(std::uint64_t contact_id) const {
        for (const auto& c : references) {
            if (c.id == contact_id) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Contact tracking and reference pose configuration
 */
struct TrackingConfig {
    /// Number of steady reference contacts (thumb, middle, pinky)
    int ref_count = 3;

    /// Hardware-supported simultaneous contacts; extras evict the stalest contact
    int max_contacts = 5;

    /// Ticks without a report before a contact is dropped (0 = never)
    int contact_timeout_ticks = 0;

    /// Thumb-to-pinky direction used to assign roles
    RoleAxis role_axis = RoleAxis::LEFT_TO_RIGHT;

    /// Per-tick movement (pad units) below which a previous role assignment is kept
    double role_jitter_threshold = 8.0;

    /// Thumb-pinky distance (pad units) below which no pose is formed
    double min_baseline_length = 10.0;

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return ref_count >= 3 &&
               max_contacts > ref_count &&
               contact_timeout_ticks >= 0 &&
               role_jitter_threshold >= 0.0 &&
               min_baseline_length >= 0.0;
    }
};

inline std::string role_axis_to_string(RoleAxis axis) {
    switch (axis) {
        case RoleAxis::LEFT_TO_RIGHT: return "left_to_right";
        case RoleAxis::RIGHT_TO_LEFT: return "right_to_left";
        case RoleAxis::TOP_TO_BOTTOM: return "top_to_bottom";
        case RoleAxis::BOTTOM_TO_TOP: return "bottom_to_top";
        default: return "invalid";
    }
}

inline bool parse_role_axis(const std::string& name, RoleAxis& axis) {
    if (name == "left_to_right") { axis = RoleAxis::LEFT_TO_RIGHT; return true; }
    if (name == "right_to_left") { axis = RoleAxis::RIGHT_TO_LEFT; return true; }
    if (name == "top_to_bottom") { axis = RoleAxis::TOP_TO_BOTTOM; return true; }
    if (name == "bottom_to_top") { axis = RoleAxis::BOTTOM_TO_TOP; return true; }
    return false;
}

inline std::string touch_event_kind_to_string(TouchEventKind kind) {
    switch (kind) {
        case TouchEventKind::DOWN: return "Down";
        case TouchEventKind::MOVE: return "Move";
        case TouchEventKind::UP: return "Up";
        default: return "Invalid";
    }
}

} // namespace tracking
} // namespace padpoint

#endif // PADPOINT_TRACKING_TOUCH_TYPES_HPP

/**
 * @file GestureTrigger.hpp
 * @brief Press-and-hold state machine gating pointer output and trace recording
 *
 * Idle -> Holding -> Armed -> Idle. A hold must last gesture_hold_ms with the
 * same pointing contact inside hold_move_tolerance before the trigger arms,
 * so accidental grazes never produce output.
 */

#ifndef PADPOINT_TRIGGER_GESTURE_TRIGGER_HPP
#define PADPOINT_TRIGGER_GESTURE_TRIGGER_HPP

#include <cstdint>
#include <string>
#include <opencv2/core.hpp>
#include "padpoint/core/types.hpp"

namespace padpoint {
namespace trigger {

enum class TriggerPhase {
    IDLE = 0,
    HOLDING,
    ARMED
};

/**
 * @brief Trigger strategy, selected once at configuration time
 */
enum class TriggerMode {
    GESTURE = 0,    ///< Hold the pointing finger still
    KEYBOARD,       ///< Armed while the hotkey is held down
    BOTH            ///< Either of the above
};

struct TriggerConfig {
    TriggerMode mode = TriggerMode::GESTURE;
    int gesture_hold_ms = 350;
    double hold_move_tolerance = 40.0;    ///< Pad units from the hold anchor
    std::string hotkey = "KEY_SPACE";
    std::string hotkey_device;            ///< Empty: listen on all keyboards

    bool is_valid() const {
        return gesture_hold_ms >= 0 && hold_move_tolerance >= 0.0 &&
               (mode == TriggerMode::GESTURE || !hotkey.empty());
    }
};

/**
 * @brief Per-tick inputs to the trigger
 */
struct TriggerInputs {
    core::TimePoint now;
    bool pose_valid = false;
    bool has_pointing = false;
    std::uint64_t pointing_id = 0;
    cv::Point2d pointing_position;
    bool key_pressed = false;
};

/**
 * @brief Snapshot of the trigger state
 */
struct GestureTriggerState {
    TriggerPhase phase = TriggerPhase::IDLE;
    bool holding = false;                 ///< hold_started_at is meaningful
    core::TimePoint hold_started_at;
    int hold_threshold_ms = 350;
};

class GestureTrigger {
public:
    GestureTrigger();
    explicit GestureTrigger(const TriggerConfig& config);

    /**
     * @brief Advance the state machine by one tick
     * @return Phase after this tick
     */
    TriggerPhase evaluate(const TriggerInputs& inputs);

    TriggerPhase get_phase() const { return phase_; }
    TriggerPhase get_previous_phase() const { return previous_phase_; }

    bool armed_this_tick() const {
        return phase_ == TriggerPhase::ARMED && previous_phase_ != TriggerPhase::ARMED;
    }
    bool disarmed_this_tick() const {
        return previous_phase_ == TriggerPhase::ARMED && phase_ != TriggerPhase::ARMED;
    }

    GestureTriggerState get_state() const;

    /// Number of Idle/Holding -> Armed transitions so far
    std::uint64_t get_arm_count() const { return arm_count_; }

    void reset();

    const TriggerConfig& get_config() const { return config_; }

private:
    TriggerPhase evaluate_gesture(const TriggerInputs& inputs);

    TriggerConfig config_;
    TriggerPhase phase_;
    TriggerPhase previous_phase_;
    TriggerPhase gesture_phase_;
    core::TimePoint hold_started_at_;
    std::uint64_t hold_contact_id_;
    cv::Point2d hold_anchor_;
    std::uint64_t arm_count_;
};

std::string trigger_phase_to_string(TriggerPhase phase);
std::string trigger_mode_to_string(TriggerMode mode);
bool parse_trigger_mode(const std::string& name, TriggerMode& mode);

} // namespace trigger
} // namespace padpoint

#endif // PADPOINT_TRIGGER_GESTURE_TRIGGER_HPP

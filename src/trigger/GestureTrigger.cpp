/**
 * @file GestureTrigger.cpp
 * @brief Implementation of the hold-to-arm trigger
 */

#include "padpoint/trigger/GestureTrigger.hpp"
#include "padpoint/core/Logger.hpp"
#include <chrono>
#include <cmath>

namespace padpoint {
namespace trigger {

GestureTrigger::GestureTrigger()
    : GestureTrigger(TriggerConfig{}) {
}

GestureTrigger::GestureTrigger(const TriggerConfig& config)
    : config_(config)
    , phase_(TriggerPhase::IDLE)
    , previous_phase_(TriggerPhase::IDLE)
    , gesture_phase_(TriggerPhase::IDLE)
    , hold_contact_id_(0)
    , arm_count_(0) {
    if (!config_.is_valid()) {
        LOG_WARNING("GestureTrigger: invalid trigger config, using defaults");
        config_ = TriggerConfig{};
    }
}

TriggerPhase GestureTrigger::evaluate_gesture(const TriggerInputs& inputs) {
    const bool condition = inputs.pose_valid && inputs.has_pointing;

    switch (gesture_phase_) {
        case TriggerPhase::IDLE:
            if (!condition) {
                break;
            }
            gesture_phase_ = TriggerPhase::HOLDING;
            hold_started_at_ = inputs.now;
            hold_contact_id_ = inputs.pointing_id;
            hold_anchor_ = inputs.pointing_position;
            PADPOINT_LOG_DEBUG("Trigger") << "Hold started by contact " << hold_contact_id_;
            if (config_.gesture_hold_ms == 0) {
                gesture_phase_ = TriggerPhase::ARMED;
            }
            break;

        case TriggerPhase::HOLDING: {
            cv::Point2d moved = inputs.pointing_position - hold_anchor_;
            bool still = condition &&
                         inputs.pointing_id == hold_contact_id_ &&
                         std::sqrt(moved.dot(moved)) <= config_.hold_move_tolerance;
            if (!still) {
                PADPOINT_LOG_DEBUG("Trigger") << "Hold broken before threshold";
                gesture_phase_ = TriggerPhase::IDLE;
            } else if (inputs.now - hold_started_at_ >=
                       std::chrono::milliseconds(config_.gesture_hold_ms)) {
                gesture_phase_ = TriggerPhase::ARMED;
            }
            break;
        }

        case TriggerPhase::ARMED:
            if (!condition || inputs.pointing_id != hold_contact_id_) {
                gesture_phase_ = TriggerPhase::IDLE;
            }
            break;
    }

    return gesture_phase_;
}

TriggerPhase GestureTrigger::evaluate(const TriggerInputs& inputs) {
    previous_phase_ = phase_;

    switch (config_.mode) {
        case TriggerMode::GESTURE:
            phase_ = evaluate_gesture(inputs);
            break;

        case TriggerMode::KEYBOARD:
            phase_ = inputs.key_pressed ? TriggerPhase::ARMED : TriggerPhase::IDLE;
            break;

        case TriggerMode::BOTH: {
            TriggerPhase gesture = evaluate_gesture(inputs);
            phase_ = inputs.key_pressed ? TriggerPhase::ARMED : gesture;
            break;
        }
    }

    if (armed_this_tick()) {
        arm_count_++;
        PADPOINT_LOG_INFO("Trigger") << "Armed (" << trigger_mode_to_string(config_.mode) << ")";
    } else if (disarmed_this_tick()) {
        PADPOINT_LOG_INFO("Trigger") << "Disarmed";
    }
    return phase_;
}

GestureTriggerState GestureTrigger::get_state() const {
    GestureTriggerState state;
    state.phase = phase_;
    state.holding = gesture_phase_ != TriggerPhase::IDLE;
    state.hold_started_at = hold_started_at_;
    state.hold_threshold_ms = config_.gesture_hold_ms;
    return state;
}

void GestureTrigger::reset() {
    phase_ = TriggerPhase::IDLE;
    previous_phase_ = TriggerPhase::IDLE;
    gesture_phase_ = TriggerPhase::IDLE;
    hold_contact_id_ = 0;
}

std::string trigger_phase_to_string(TriggerPhase phase) {
    switch (phase) {
        case TriggerPhase::IDLE: return "Idle";
        case TriggerPhase::HOLDING: return "Holding";
        case TriggerPhase::ARMED: return "Armed";
        default: return "Unknown";
    }
}

std::string trigger_mode_to_string(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::GESTURE: return "gesture";
        case TriggerMode::KEYBOARD: return "keyboard";
        case TriggerMode::BOTH: return "both";
        default: return "invalid";
    }
}

bool parse_trigger_mode(const std::string& name, TriggerMode& mode) {
    if (name == "gesture") { mode = TriggerMode::GESTURE; return true; }
    if (name == "keyboard") { mode = TriggerMode::KEYBOARD; return true; }
    if (name == "both") { mode = TriggerMode::BOTH; return true; }
    return false;
}

} // namespace trigger
} // namespace padpoint

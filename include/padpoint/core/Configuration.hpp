#pragma once

#include "padpoint/prediction/PredictionTypes.hpp"
#include "padpoint/trace/TraceTypes.hpp"
#include "padpoint/tracking/TouchTypes.hpp"
#include "padpoint/trigger/GestureTrigger.hpp"
#include <string>

namespace padpoint {
namespace core {

/**
 * On-screen overlay settings
 */
struct OverlayConfig {
    bool enabled = false;
    int grid = 0;
    int indicator_size = 18;      // Marker diameter in px
    int fade_ms = 120;            // Reference dot fade-out after pose loss
    bool show_action_dot = true;
};

/**
 * Input device settings
 */
struct DeviceConfig {
    std::string path;             // /dev/input/eventN, normally given on the command line
    bool grab = false;            // EVIOCGRAB so the desktop stops seeing the pad
    bool require_grab = false;    // Fail startup if the grab is refused
    int poll_timeout_ms = 10;     // Idle tick interval while no reports arrive
};

/**
 * Logging settings
 */
struct LoggingConfig {
    std::string level = "info";
    std::string directory;        // Empty: console only
};

/**
 * Complete runtime configuration, immutable once the tick loop starts
 */
struct PadpointConfig {
    tracking::TrackingConfig tracking;
    prediction::PredictionParameters prediction;
    trigger::TriggerConfig trigger;
    prediction::CalibrationConfig calibration;
    trace::TraceConfig trace;
    OverlayConfig overlay;
    DeviceConfig device;
    LoggingConfig logging;

    /**
     * Check all ranges
     * @throws ConfigException listing every invalid value
     */
    void validate() const;
};

/**
 * YAML loader for PadpointConfig
 *
 * Missing keys keep their defaults, unknown keys are reported as warnings.
 * A leading "~" in paths is expanded to $HOME.
 */
class ConfigLoader {
public:
    /**
     * @throws ConfigException on unreadable, malformed or invalid input
     */
    static PadpointConfig loadFile(const std::string& filename);

    /**
     * @throws ConfigException on malformed or invalid input
     */
    static PadpointConfig loadString(const std::string& yaml);

    static std::string expandUserPath(const std::string& path);
};

} // namespace core
} // namespace padpoint

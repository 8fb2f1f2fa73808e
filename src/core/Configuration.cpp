#include "padpoint/core/Configuration.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/exception.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>
#include <vector>

namespace padpoint {
namespace core {

namespace {

class SectionReader {
public:
    SectionReader(const YAML::Node& root, const std::string& name)
        : node_(root[name]), name_(name) {
        if (node_ && !node_.IsMap()) {
            PADPOINT_THROW(ConfigException, "Section '" + name + "' must be a map");
        }
    }

    template<typename T>
    void read(const std::string& key, T& out) {
        known_.insert(key);
        if (!node_ || !node_[key]) {
            return;
        }
        try {
            out = node_[key].as<T>();
        } catch (const YAML::Exception& e) {
            PADPOINT_THROW(ConfigException,
                           "Bad value for " + name_ + "." + key + ": " + e.what());
        }
    }

    // Warn about keys nobody asked for
    void finish() const {
        if (!node_) {
            return;
        }
        for (const auto& entry : node_) {
            std::string key = entry.first.as<std::string>();
            if (known_.find(key) == known_.end()) {
                PADPOINT_LOG_WARNING("Config") << "Unknown key " << name_ << "." << key
                                               << " ignored";
            }
        }
    }

private:
    const YAML::Node node_;
    std::string name_;
    std::set<std::string> known_;
};

PadpointConfig fromYaml(const YAML::Node& document) {
    PadpointConfig config;
    const YAML::Node root = (!document || document.IsNull())
        ? YAML::Node(YAML::NodeType::Map) : document;
    if (!root.IsMap()) {
        PADPOINT_THROW(ConfigException, "Top level of the configuration must be a map");
    }

    static const std::set<std::string> kSections = {
        "tracking", "prediction", "trigger", "calibration",
        "trace", "overlay", "device", "logging"
    };
    for (const auto& entry : root) {
        std::string key = entry.first.as<std::string>();
        if (kSections.find(key) == kSections.end()) {
            PADPOINT_LOG_WARNING("Config") << "Unknown section " << key << " ignored";
        }
    }

    {
        SectionReader s(root, "tracking");
        auto& t = config.tracking;
        std::string axis = tracking::role_axis_to_string(t.role_axis);
        s.read("ref_count", t.ref_count);
        s.read("max_contacts", t.max_contacts);
        s.read("contact_timeout_ticks", t.contact_timeout_ticks);
        s.read("role_axis", axis);
        s.read("role_jitter_threshold", t.role_jitter_threshold);
        s.read("min_baseline_length", t.min_baseline_length);
        if (!tracking::parse_role_axis(axis, t.role_axis)) {
            PADPOINT_THROW(ConfigException, "Unknown tracking.role_axis '" + axis + "'");
        }
        s.finish();
    }

    {
        SectionReader s(root, "prediction");
        auto& p = config.prediction;
        std::string strategy = prediction::occlusion_strategy_to_string(p.occlusion_strategy);
        s.read("outer_ellipse_scale", p.outer_ellipse_scale);
        s.read("outer_ellipse_aspect", p.outer_ellipse_aspect);
        s.read("pointer_ellipse_ratio", p.pointer_ellipse_ratio);
        s.read("pointer_center_shift_gamma", p.pointer_center_shift_gamma);
        s.read("pointer_mark_deg", p.pointer_mark_deg);
        s.read("pointer_mark_slope", p.pointer_mark_slope);
        s.read("pred_min_ellipse_a_px", p.pred_min_ellipse_a_px);
        s.read("pred_min_ellipse_b_px", p.pred_min_ellipse_b_px);
        s.read("pred_minM_ellipse_a_px", p.pred_minM_ellipse_a_px);
        s.read("pred_minM_ellipse_b_px", p.pred_minM_ellipse_b_px);
        s.read("occlusion_strategy", strategy);
        s.read("default_contact_ellipse_a_px", p.default_contact_ellipse_a_px);
        s.read("default_contact_ellipse_b_px", p.default_contact_ellipse_b_px);
        s.read("occlusion_velocity_decay", p.occlusion_velocity_decay);
        if (!prediction::parse_occlusion_strategy(strategy, p.occlusion_strategy)) {
            PADPOINT_THROW(ConfigException,
                           "Unknown prediction.occlusion_strategy '" + strategy + "'");
        }
        s.finish();
    }

    {
        SectionReader s(root, "trigger");
        auto& t = config.trigger;
        std::string mode = trigger::trigger_mode_to_string(t.mode);
        s.read("mode", mode);
        s.read("gesture_hold_ms", t.gesture_hold_ms);
        s.read("hold_move_tolerance", t.hold_move_tolerance);
        s.read("hotkey", t.hotkey);
        s.read("hotkey_device", t.hotkey_device);
        if (!trigger::parse_trigger_mode(mode, t.mode)) {
            PADPOINT_THROW(ConfigException, "Unknown trigger.mode '" + mode + "'");
        }
        s.finish();
    }

    {
        SectionReader s(root, "calibration");
        auto& c = config.calibration;
        std::vector<int> bounds;
        s.read("pad_bounds", bounds);
        s.read("screen_width", c.screen_width);
        s.read("screen_height", c.screen_height);
        s.read("calib_seconds", c.calib_seconds);
        s.read("margin", c.margin);
        if (!bounds.empty()) {
            if (bounds.size() != 4) {
                PADPOINT_THROW(ConfigException,
                               "calibration.pad_bounds needs [min_x, max_x, min_y, max_y]");
            }
            c.pad_bounds.min_x = bounds[0];
            c.pad_bounds.max_x = bounds[1];
            c.pad_bounds.min_y = bounds[2];
            c.pad_bounds.max_y = bounds[3];
        }
        s.finish();
    }

    {
        SectionReader s(root, "trace");
        auto& t = config.trace;
        int capacity = static_cast<int>(t.queue_capacity);
        s.read("enabled", t.enabled);
        s.read("output_dir", t.output_dir);
        s.read("record_reference_paths", t.record_reference_paths);
        s.read("stroke_px", t.stroke_px);
        s.read("grid", t.grid);
        s.read("queue_capacity", capacity);
        if (capacity <= 0) {
            PADPOINT_THROW(ConfigException, "trace.queue_capacity must be positive");
        }
        t.queue_capacity = static_cast<size_t>(capacity);
        s.finish();
    }

    {
        SectionReader s(root, "overlay");
        auto& o = config.overlay;
        s.read("enabled", o.enabled);
        s.read("grid", o.grid);
        s.read("indicator_size", o.indicator_size);
        s.read("fade_ms", o.fade_ms);
        s.read("show_action_dot", o.show_action_dot);
        s.finish();
    }

    {
        SectionReader s(root, "device");
        auto& d = config.device;
        s.read("path", d.path);
        s.read("grab", d.grab);
        s.read("require_grab", d.require_grab);
        s.read("poll_timeout_ms", d.poll_timeout_ms);
        s.finish();
    }

    {
        SectionReader s(root, "logging");
        s.read("level", config.logging.level);
        s.read("directory", config.logging.directory);
        s.finish();
    }

    config.trace.output_dir = ConfigLoader::expandUserPath(config.trace.output_dir);
    config.logging.directory = ConfigLoader::expandUserPath(config.logging.directory);

    config.validate();
    return config;
}

} // namespace

void PadpointConfig::validate() const {
    std::vector<std::string> errors;

    if (tracking.ref_count < 3) {
        errors.push_back("tracking.ref_count must be at least 3");
    }
    if (tracking.max_contacts <= tracking.ref_count) {
        errors.push_back("tracking.max_contacts must exceed ref_count");
    }
    if (tracking.contact_timeout_ticks < 0) {
        errors.push_back("tracking.contact_timeout_ticks must not be negative");
    }
    if (tracking.role_jitter_threshold < 0.0 || tracking.min_baseline_length < 0.0) {
        errors.push_back("tracking thresholds must not be negative");
    }

    if (prediction.outer_ellipse_scale <= 0.0 || prediction.outer_ellipse_aspect <= 0.0) {
        errors.push_back("prediction.outer_ellipse_scale and outer_ellipse_aspect must be positive");
    }
    if (prediction.pointer_ellipse_ratio <= 0.0 || prediction.pointer_ellipse_ratio >= 1.0) {
        errors.push_back("prediction.pointer_ellipse_ratio must be in (0, 1)");
    }
    if (prediction.pointer_center_shift_gamma <= 0.0) {
        errors.push_back("prediction.pointer_center_shift_gamma must be positive");
    }
    if (prediction.pred_min_ellipse_a_px < 0.0 || prediction.pred_min_ellipse_b_px < 0.0 ||
        prediction.pred_minM_ellipse_a_px < 0.0 || prediction.pred_minM_ellipse_b_px < 0.0) {
        errors.push_back("prediction ellipse minimums must not be negative");
    }
    if (prediction.default_contact_ellipse_a_px <= 0.0 ||
        prediction.default_contact_ellipse_b_px <= 0.0) {
        errors.push_back("prediction.default_contact_ellipse must be positive");
    }
    if (prediction.occlusion_velocity_decay < 0.0 || prediction.occlusion_velocity_decay > 1.0) {
        errors.push_back("prediction.occlusion_velocity_decay must be in [0, 1]");
    }

    if (trigger.gesture_hold_ms < 0) {
        errors.push_back("trigger.gesture_hold_ms must not be negative");
    }
    if (trigger.hold_move_tolerance < 0.0) {
        errors.push_back("trigger.hold_move_tolerance must not be negative");
    }
    if (trigger.mode != trigger::TriggerMode::GESTURE && trigger.hotkey.empty()) {
        errors.push_back("trigger.hotkey is required for keyboard trigger modes");
    }

    if (calibration.screen_width <= 0 || calibration.screen_height <= 0) {
        errors.push_back("calibration screen size must be positive");
    }
    if (!calibration.is_valid()) {
        errors.push_back("calibration.pad_bounds, calib_seconds or margin out of range");
    }

    if (!trace.isValid()) {
        errors.push_back("trace settings out of range (output_dir, stroke_px, grid, queue_capacity)");
    }

    if (overlay.grid < 0 || overlay.indicator_size <= 0 || overlay.fade_ms < 0) {
        errors.push_back("overlay settings out of range");
    }
    if (device.poll_timeout_ms <= 0) {
        errors.push_back("device.poll_timeout_ms must be positive");
    }

    LogLevel level;
    if (!parseLogLevel(logging.level, level)) {
        errors.push_back("logging.level '" + logging.level + "' is not a log level");
    }

    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Invalid configuration:";
        for (const auto& e : errors) {
            oss << "\n  - " << e;
        }
        PADPOINT_THROW(ConfigException, oss.str());
    }
}

PadpointConfig ConfigLoader::loadFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        PADPOINT_THROW(ConfigException, "Configuration file not found: " + filename);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        PADPOINT_THROW(ConfigException, "Failed to parse " + filename + ": " + e.what());
    }

    PadpointConfig config = fromYaml(root);
    LOG_INFO("Configuration loaded from " + filename);
    return config;
}

PadpointConfig ConfigLoader::loadString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        PADPOINT_THROW(ConfigException, std::string("Failed to parse configuration: ") + e.what());
    }
    return fromYaml(root);
}

std::string ConfigLoader::expandUserPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

} // namespace core
} // namespace padpoint

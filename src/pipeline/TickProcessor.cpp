#include "padpoint/pipeline/TickProcessor.hpp"
#include "padpoint/core/Logger.hpp"
#include <chrono>
#include <exception>

namespace padpoint {
namespace pipeline {

TickContext::TickContext(const core::PadpointConfig& config,
                         const prediction::ScreenMapping& initialMapping)
    : tracker(config.tracking)
    , estimator(config.tracking)
    , predictor(config.prediction, initialMapping)
    , trigger(config.trigger)
    , recorder(config.trace.record_reference_paths)
    , calibrator(initialMapping.bounds(), config.calibration.calib_seconds,
                 config.calibration.margin)
    , mapping(initialMapping) {
}

prediction::PadBounds resolvePadBounds(const prediction::CalibrationConfig& calibration,
                                       const prediction::PadBounds& deviceBounds) {
    if (calibration.pad_bounds.is_valid()) {
        return calibration.pad_bounds;
    }
    return deviceBounds;
}

TickProcessor::TickProcessor(const core::PadpointConfig& config,
                             const prediction::PadBounds& deviceBounds,
                             PointerSink* pointer,
                             OverlaySink* overlay,
                             trace::TraceSink* traces)
    : config_(config)
    , context_(config, prediction::ScreenMapping(resolvePadBounds(config.calibration, deviceBounds),
                                                 config.calibration.screen_width,
                                                 config.calibration.screen_height))
    , pointer_(pointer)
    , overlay_(overlay)
    , traces_(traces) {
    const auto& b = context_.mapping.bounds();
    PADPOINT_LOG_INFO("TickProcessor") << "Pad x=[" << b.min_x << ", " << b.max_x
        << "] y=[" << b.min_y << ", " << b.max_y << "] -> screen "
        << context_.mapping.screen_width() << "x" << context_.mapping.screen_height()
        << ", trigger " << trigger::trigger_mode_to_string(config_.trigger.mode);
}

void TickProcessor::runCalibration(const tracking::TouchBatch& batch, core::TimePoint now) {
    if (!context_.calibrationStarted) {
        context_.calibrator.start(now);
        context_.calibrationStarted = true;
    }
    if (!context_.calibrator.is_calibrating()) {
        return;
    }

    for (const auto& report : batch) {
        if (report.kind != tracking::TouchEventKind::UP) {
            context_.calibrator.observe(report.x, report.y, now);
        }
    }

    if (context_.calibrator.update(now)) {
        context_.mapping = prediction::ScreenMapping(context_.calibrator.get_bounds(),
                                                     config_.calibration.screen_width,
                                                     config_.calibration.screen_height);
        context_.predictor.set_screen_mapping(context_.mapping);
    }
}

TickResult TickProcessor::processTick(const tracking::TouchBatch& batch, core::TimePoint now,
                                      bool keyPressed) {
    TickResult result;
    result.tick = ++context_.tickIndex;

    runCalibration(batch, now);

    result.contacts = context_.tracker.process_batch(batch, now);
    const tracking::ReferencePose& pose = context_.estimator.update(result.contacts, now);
    result.poseValid = pose.valid;
    result.hasPointing = context_.estimator.select_pointing_contact(result.contacts, result.pointing);

    if (!pose.valid) {
        context_.predictor.reset();
    } else if (result.hasPointing) {
        result.prediction = context_.predictor.predict(pose, result.pointing, now);
        result.hasPrediction = true;
        if (result.prediction.has_output) {
            context_.lastOutput = result.prediction;
            context_.hasLastOutput = true;
        }
    }

    trigger::TriggerInputs inputs;
    inputs.now = now;
    inputs.pose_valid = pose.valid;
    inputs.has_pointing = result.hasPointing;
    inputs.pointing_id = result.pointing.id;
    inputs.pointing_position = result.pointing.position_d();
    inputs.key_pressed = keyPressed;
    result.phase = context_.trigger.evaluate(inputs);

    if (context_.trigger.armed_this_tick()) {
        context_.recorder.begin(now);
    }

    if (result.phase == trigger::TriggerPhase::ARMED) {
        if (result.hasPrediction && result.prediction.has_output) {
            if (pointer_ != nullptr) {
                pointer_->moveTo(result.prediction.screen_point);
            }
            result.forwarded = true;
            forwarded_++;
            context_.recorder.append(result.prediction.pad_point);
            context_.recorder.appendReferences(pose);
        }
    } else if (context_.trigger.disarmed_this_tick()) {
        result.traceSubmitted = flushTrace(now);
        if (pointer_ != nullptr) {
            pointer_->release();
        }
    }

    if (result.hasPrediction) {
        PADPOINT_LOG_TRACE("TickProcessor") << "tick " << result.tick
            << " contacts=" << result.contacts.size()
            << " phase=" << trigger::trigger_phase_to_string(result.phase)
            << " confidence=" << prediction::confidence_to_string(result.prediction.confidence)
            << " screen=(" << result.prediction.screen_point.x << ", "
            << result.prediction.screen_point.y << ")";
    }

    publishOverlay(result);
    return result;
}

bool TickProcessor::flushTrace(core::TimePoint now) {
    if (traces_ == nullptr || !config_.trace.enabled) {
        context_.recorder.discard();
        return false;
    }
    trace::TracePath path = context_.recorder.finish(now);
    if (path.empty()) {
        PADPOINT_LOG_DEBUG("TickProcessor") << "Armed interval ended without points, no trace";
        return false;
    }

    trace::TraceJob job;
    job.fileStem = trace::TraceRecorder::makeFileStem(std::chrono::system_clock::now());
    job.outputDir = config_.trace.output_dir;
    job.mapping = context_.mapping;
    job.strokePx = config_.trace.stroke_px;
    job.grid = config_.trace.grid;
    job.path = std::move(path);

    try {
        if (!traces_->submit(std::move(job))) {
            return false;
        }
    } catch (const std::exception& e) {
        PADPOINT_LOG_ERROR("TickProcessor") << "Trace hand-off failed: " << e.what();
        return false;
    }
    tracesSubmitted_++;
    return true;
}

void TickProcessor::publishOverlay(const TickResult& result) {
    if (overlay_ == nullptr) {
        return;
    }

    OverlaySnapshot snapshot;
    snapshot.tick = result.tick;
    snapshot.phase = result.phase;
    snapshot.screenWidth = context_.mapping.screen_width();
    snapshot.screenHeight = context_.mapping.screen_height();

    const tracking::ReferencePose& pose = context_.estimator.get_pose();
    if (pose.valid) {
        snapshot.hasPose = true;
        snapshot.pose = pose;
        for (const auto& ref : pose.references) {
            snapshot.referencePoints.push_back(context_.mapping.pad_to_screen(ref.position_d()));
        }
        snapshot.geometry = context_.predictor.describe(pose);
    }

    if (result.hasPrediction) {
        snapshot.hasPrediction = true;
        snapshot.prediction = result.prediction;
        if (!result.prediction.has_output && context_.hasLastOutput) {
            // Suppressed: keep showing where the cursor is held
            snapshot.prediction.screen_point = context_.lastOutput.screen_point;
            snapshot.prediction.pad_point = context_.lastOutput.pad_point;
        }
    } else if (context_.hasLastOutput && pose.valid) {
        snapshot.hasPrediction = true;
        snapshot.prediction = context_.lastOutput;
    }

    if (result.phase == trigger::TriggerPhase::ARMED && context_.hasLastOutput) {
        snapshot.actionActive = true;
        snapshot.actionPoint = context_.lastOutput.screen_point;
    }

    overlay_->publish(snapshot);
}

void TickProcessor::shutdown(core::TimePoint now) {
    if (context_.trigger.get_phase() != trigger::TriggerPhase::ARMED) {
        return;
    }
    PADPOINT_LOG_INFO("TickProcessor") << "Shutting down while armed, flushing trace";
    flushTrace(now);
    if (pointer_ != nullptr) {
        pointer_->release();
    }
    context_.trigger.reset();
}

} // namespace pipeline
} // namespace padpoint

#pragma once

#include "padpoint/core/Configuration.hpp"
#include "padpoint/pipeline/OutputSinks.hpp"
#include "padpoint/prediction/PointerPredictor.hpp"
#include "padpoint/prediction/ScreenMapping.hpp"
#include "padpoint/trace/TraceRecorder.hpp"
#include "padpoint/trace/TraceTypes.hpp"
#include "padpoint/tracking/ContactTracker.hpp"
#include "padpoint/tracking/ReferencePoseEstimator.hpp"
#include "padpoint/trigger/GestureTrigger.hpp"
#include <cstdint>
#include <vector>

namespace padpoint {
namespace pipeline {

/**
 * All state owned by the tick loop
 *
 * Nothing here is shared with another thread; consumers only see copies
 * published through the sinks.
 */
struct TickContext {
    tracking::ContactTracker tracker;
    tracking::ReferencePoseEstimator estimator;
    prediction::PointerPredictor predictor;
    trigger::GestureTrigger trigger;
    trace::TraceRecorder recorder;
    prediction::PadCalibrator calibrator;
    prediction::ScreenMapping mapping;

    uint64_t tickIndex = 0;
    bool calibrationStarted = false;

    // Last forwarded prediction, held while no new one is produced
    bool hasLastOutput = false;
    prediction::PredictedPointer lastOutput;

    TickContext(const core::PadpointConfig& config, const prediction::ScreenMapping& initialMapping);
};

/**
 * Outcome of one tick, mostly for tests and diagnostics
 */
struct TickResult {
    uint64_t tick = 0;
    std::vector<tracking::Contact> contacts;
    bool poseValid = false;
    bool hasPointing = false;
    tracking::Contact pointing;
    bool hasPrediction = false;
    prediction::PredictedPointer prediction;
    trigger::TriggerPhase phase = trigger::TriggerPhase::IDLE;
    bool forwarded = false;
    bool traceSubmitted = false;
};

/**
 * One synchronous pass per batch:
 * ContactTracker -> ReferencePoseEstimator -> PointerPredictor ->
 * GestureTrigger -> {PointerSink, TraceRecorder, OverlaySink}
 *
 * Sinks are optional and not owned.
 */
class TickProcessor {
public:
    TickProcessor(const core::PadpointConfig& config,
                  const prediction::PadBounds& deviceBounds,
                  PointerSink* pointer = nullptr,
                  OverlaySink* overlay = nullptr,
                  trace::TraceSink* traces = nullptr);

    TickProcessor(const TickProcessor&) = delete;
    TickProcessor& operator=(const TickProcessor&) = delete;

    /**
     * Process the reports of one batch
     *
     * @param batch Reports since the previous boundary (may be empty for idle ticks)
     * @param now Tick time
     * @param keyPressed Hotkey state for the keyboard trigger modes
     */
    TickResult processTick(const tracking::TouchBatch& batch, core::TimePoint now,
                           bool keyPressed = false);

    /**
     * Disarm cleanly on shutdown: flush a running trace and release the pointer
     */
    void shutdown(core::TimePoint now);

    const TickContext& context() const { return context_; }
    const core::PadpointConfig& config() const { return config_; }

    uint64_t getForwardedCount() const { return forwarded_; }
    uint64_t getTraceCount() const { return tracesSubmitted_; }

private:
    void runCalibration(const tracking::TouchBatch& batch, core::TimePoint now);
    bool flushTrace(core::TimePoint now);
    void publishOverlay(const TickResult& result);

    core::PadpointConfig config_;
    TickContext context_;
    PointerSink* pointer_;
    OverlaySink* overlay_;
    trace::TraceSink* traces_;

    uint64_t forwarded_ = 0;
    uint64_t tracesSubmitted_ = 0;
};

/**
 * Pad bounds to use: configured ones win over the device's reported ranges
 */
prediction::PadBounds resolvePadBounds(const prediction::CalibrationConfig& calibration,
                                       const prediction::PadBounds& deviceBounds);

} // namespace pipeline
} // namespace padpoint

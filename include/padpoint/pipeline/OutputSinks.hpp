#pragma once

#include "padpoint/pipeline/LatestValueMailbox.hpp"
#include "padpoint/prediction/PredictionTypes.hpp"
#include "padpoint/tracking/TouchTypes.hpp"
#include "padpoint/trigger/GestureTrigger.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace padpoint {
namespace pipeline {

/**
 * Synthetic absolute pointer
 *
 * moveTo() is called at most once per tick and only while armed; release()
 * once when the trigger disarms.
 */
class PointerSink {
public:
    virtual ~PointerSink() = default;

    virtual void moveTo(const cv::Point2d& screenPoint) = 0;
    virtual void release() = 0;
};

/**
 * Everything the overlay needs to draw one frame, in screen pixels
 */
struct OverlaySnapshot {
    uint64_t tick = 0;
    trigger::TriggerPhase phase = trigger::TriggerPhase::IDLE;

    bool hasPose = false;
    tracking::ReferencePose pose;
    std::vector<cv::Point2d> referencePoints;

    bool hasPrediction = false;
    prediction::PredictedPointer prediction;
    prediction::PredictionGeometry geometry;

    /// Last forwarded position, shown as the action dot while armed
    bool actionActive = false;
    cv::Point2d actionPoint;

    int screenWidth = 0;
    int screenHeight = 0;
};

class OverlaySink {
public:
    virtual ~OverlaySink() = default;

    /// Must not block
    virtual void publish(const OverlaySnapshot& snapshot) = 0;
};

/**
 * OverlaySink backed by a latest-value mailbox
 */
class MailboxOverlaySink : public OverlaySink {
public:
    explicit MailboxOverlaySink(LatestValueMailbox<OverlaySnapshot>& mailbox)
        : mailbox_(mailbox) {}

    void publish(const OverlaySnapshot& snapshot) override {
        mailbox_.publish(snapshot);
    }

private:
    LatestValueMailbox<OverlaySnapshot>& mailbox_;
};

} // namespace pipeline
} // namespace padpoint

#pragma once

#include "padpoint/core/types.hpp"
#include "padpoint/tracking/TouchTypes.hpp"
#include <cstdint>
#include <vector>

namespace padpoint {
namespace io {

/**
 * Decodes evdev multi-touch protocol B (or single-touch ABS_X/ABS_Y) into
 * slot-keyed TouchReports, one batch per SYN_REPORT.
 *
 * After SYN_DROPPED everything up to and including the next SYN_REPORT is
 * discarded and needsResync() becomes true; the owner then reads the slot
 * state from the kernel and passes it to resync().
 */
class MtProtocolDecoder {
public:
    struct SlotState {
        int trackingId = -1;
        int x = 0;
        int y = 0;
        int touchMajor = 0;
        int touchMinor = 0;

        bool active() const { return trackingId >= 0; }
    };

    explicit MtProtocolDecoder(int slotCount = 10, bool multitouch = true);

    /**
     * Feed one event
     * @return true when a batch is complete and can be taken
     */
    bool feed(uint16_t type, uint16_t code, int32_t value, core::TimePoint timestamp);

    tracking::TouchBatch takeBatch();

    bool needsResync() const { return needsResync_; }

    /**
     * Reconcile with the kernel's slot state after a drop
     * @return true if the reconciliation produced reports
     */
    bool resync(const std::vector<SlotState>& slots, int currentSlot, core::TimePoint now);

    const std::vector<SlotState>& getSlots() const { return slots_; }
    size_t getDroppedFrames() const { return droppedFrames_; }

private:
    struct PendingSlot {
        std::vector<tracking::TouchEventKind> ops;
        bool moved = false;
    };

    SlotState* currentSlotState();
    void pushOp(tracking::TouchEventKind kind);
    void markMoved();
    void emit(int slot, tracking::TouchEventKind kind, core::TimePoint timestamp);
    void flushFrame(core::TimePoint timestamp);

    bool multitouch_;
    int currentSlot_;
    bool dropping_;
    bool needsResync_;
    size_t droppedFrames_;
    std::vector<SlotState> slots_;
    std::vector<SlotState> reported_;   // Slot state as last seen by consumers
    std::vector<PendingSlot> pending_;
    tracking::TouchBatch batch_;
};

} // namespace io
} // namespace padpoint

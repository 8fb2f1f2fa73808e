#include "padpoint/io/MtProtocolDecoder.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>

extern "C" {
#include <linux/input.h>
}

namespace padpoint {
namespace io {

using tracking::TouchEventKind;

MtProtocolDecoder::MtProtocolDecoder(int slotCount, bool multitouch)
    : multitouch_(multitouch)
    , currentSlot_(0)
    , dropping_(false)
    , needsResync_(false)
    , droppedFrames_(0)
    , slots_(static_cast<size_t>(slotCount > 0 ? slotCount : 1))
    , reported_(slots_.size())
    , pending_(slots_.size()) {
}

MtProtocolDecoder::SlotState* MtProtocolDecoder::currentSlotState() {
    if (currentSlot_ < 0 || currentSlot_ >= static_cast<int>(slots_.size())) {
        return nullptr;
    }
    return &slots_[currentSlot_];
}

void MtProtocolDecoder::pushOp(TouchEventKind kind) {
    pending_[currentSlot_].ops.push_back(kind);
}

void MtProtocolDecoder::markMoved() {
    pending_[currentSlot_].moved = true;
}

bool MtProtocolDecoder::feed(uint16_t type, uint16_t code, int32_t value,
                             core::TimePoint timestamp) {
    if (type == EV_SYN) {
        if (code == SYN_DROPPED) {
            PADPOINT_LOG_WARNING("MtDecoder") << "SYN_DROPPED, discarding partial batch";
            dropping_ = true;
            droppedFrames_++;
            for (auto& p : pending_) {
                p = PendingSlot();
            }
            return false;
        }
        if (code == SYN_REPORT) {
            if (dropping_) {
                dropping_ = false;
                needsResync_ = true;
                return false;
            }
            flushFrame(timestamp);
            return true;
        }
        return false;
    }

    if (dropping_) {
        return false;
    }

    if (multitouch_ && type == EV_ABS) {
        if (code == ABS_MT_SLOT) {
            currentSlot_ = value;
            if (currentSlotState() == nullptr) {
                PADPOINT_LOG_DEBUG("MtDecoder") << "Slot " << value << " out of range, ignored";
            }
            return false;
        }

        SlotState* slot = currentSlotState();
        if (slot == nullptr) {
            return false;
        }

        switch (code) {
            case ABS_MT_TRACKING_ID:
                if (value >= 0) {
                    if (slot->active()) {
                        pushOp(TouchEventKind::UP);
                    }
                    pushOp(TouchEventKind::DOWN);
                } else if (slot->active()) {
                    pushOp(TouchEventKind::UP);
                }
                slot->trackingId = value;
                break;
            case ABS_MT_POSITION_X:
                slot->x = value;
                markMoved();
                break;
            case ABS_MT_POSITION_Y:
                slot->y = value;
                markMoved();
                break;
            case ABS_MT_TOUCH_MAJOR:
                slot->touchMajor = value;
                markMoved();
                break;
            case ABS_MT_TOUCH_MINOR:
                slot->touchMinor = value;
                markMoved();
                break;
            default:
                break;
        }
        return false;
    }

    if (!multitouch_) {
        // Single-touch device: everything goes to slot 0
        currentSlot_ = 0;
        SlotState& slot = slots_[0];
        if (type == EV_ABS && code == ABS_X) {
            slot.x = value;
            markMoved();
        } else if (type == EV_ABS && code == ABS_Y) {
            slot.y = value;
            markMoved();
        } else if (type == EV_KEY && code == BTN_TOUCH) {
            if (value != 0 && !slot.active()) {
                slot.trackingId = 0;
                pushOp(TouchEventKind::DOWN);
            } else if (value == 0 && slot.active()) {
                slot.trackingId = -1;
                pushOp(TouchEventKind::UP);
            }
        }
    }
    return false;
}

void MtProtocolDecoder::emit(int slot, TouchEventKind kind, core::TimePoint timestamp) {
    const SlotState& state = slots_[slot];
    tracking::TouchReport report;
    report.slot_id = slot;
    report.x = state.x;
    report.y = state.y;
    report.kind = kind;
    report.timestamp = timestamp;
    report.touch_major = state.touchMajor;
    report.touch_minor = state.touchMinor;
    batch_.push_back(report);
}

void MtProtocolDecoder::flushFrame(core::TimePoint timestamp) {
    for (size_t i = 0; i < pending_.size(); ++i) {
        PendingSlot& p = pending_[i];
        const int slot = static_cast<int>(i);
        for (TouchEventKind kind : p.ops) {
            emit(slot, kind, timestamp);
        }
        if (p.ops.empty() && p.moved && slots_[i].active()) {
            emit(slot, TouchEventKind::MOVE, timestamp);
        }
        reported_[i] = slots_[i];
        p = PendingSlot();
    }
}

tracking::TouchBatch MtProtocolDecoder::takeBatch() {
    tracking::TouchBatch out;
    out.swap(batch_);
    return out;
}

bool MtProtocolDecoder::resync(const std::vector<SlotState>& slots, int currentSlot,
                               core::TimePoint now) {
    needsResync_ = false;
    const size_t count = std::min(slots.size(), slots_.size());
    const size_t before = batch_.size();

    for (size_t i = 0; i < count; ++i) {
        const SlotState& fresh = slots[i];
        const SlotState old = reported_[i];
        const int slot = static_cast<int>(i);

        slots_[i] = fresh;
        if (old.active() && (!fresh.active() || fresh.trackingId != old.trackingId)) {
            emit(slot, TouchEventKind::UP, now);
        }
        const bool wasSame = old.active() && fresh.active() &&
                             fresh.trackingId == old.trackingId;
        const bool moved = fresh.x != old.x || fresh.y != old.y;
        reported_[i] = fresh;
        if (fresh.active() && !wasSame) {
            emit(slot, TouchEventKind::DOWN, now);
        } else if (wasSame && moved) {
            emit(slot, TouchEventKind::MOVE, now);
        }
    }
    currentSlot_ = currentSlot;

    PADPOINT_LOG_DEBUG("MtDecoder") << "Resynced slot state, "
        << (batch_.size() - before) << " reports";
    return batch_.size() > before;
}

} // namespace io
} // namespace padpoint

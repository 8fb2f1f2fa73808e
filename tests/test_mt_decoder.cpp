/**
 * @file test_mt_decoder.cpp
 * @brief Tests for the multi-touch protocol B decoder, fed with synthetic evdev frames
 */

#include <gtest/gtest.h>
#include <padpoint/io/MtProtocolDecoder.hpp>
#include <padpoint/core/Logger.hpp>

extern "C" {
#include <linux/input.h>
}

using namespace padpoint::io;
using padpoint::tracking::TouchEventKind;

class MtDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::CRITICAL);
        now_ = padpoint::core::Clock::now();
    }

    void abs(MtProtocolDecoder& d, uint16_t code, int32_t value) {
        d.feed(EV_ABS, code, value, now_);
    }

    bool syn(MtProtocolDecoder& d) {
        return d.feed(EV_SYN, SYN_REPORT, 0, now_);
    }

    void touchDown(MtProtocolDecoder& d, int slot, int id, int x, int y) {
        abs(d, ABS_MT_SLOT, slot);
        abs(d, ABS_MT_TRACKING_ID, id);
        abs(d, ABS_MT_POSITION_X, x);
        abs(d, ABS_MT_POSITION_Y, y);
    }

    padpoint::core::TimePoint now_;
};

TEST_F(MtDecoderTest, DownMoveUp) {
    MtProtocolDecoder decoder(5, true);

    touchDown(decoder, 0, 10, 100, 200);
    EXPECT_TRUE(syn(decoder));
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::DOWN);
    EXPECT_EQ(batch[0].slot_id, 0);
    EXPECT_EQ(batch[0].x, 100);
    EXPECT_EQ(batch[0].y, 200);
    EXPECT_EQ(batch[0].timestamp, now_);

    abs(decoder, ABS_MT_POSITION_X, 110);
    syn(decoder);
    batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::MOVE);
    EXPECT_EQ(batch[0].x, 110);
    EXPECT_EQ(batch[0].y, 200);

    abs(decoder, ABS_MT_TRACKING_ID, -1);
    syn(decoder);
    batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::UP);
    EXPECT_FALSE(decoder.getSlots()[0].active());
}

TEST_F(MtDecoderTest, SeveralSlotsInOneFrame) {
    MtProtocolDecoder decoder(5, true);
    touchDown(decoder, 0, 1, 10, 10);
    touchDown(decoder, 1, 2, 20, 20);
    touchDown(decoder, 2, 3, 30, 30);
    syn(decoder);

    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(batch[i].slot_id, i);
        EXPECT_EQ(batch[i].kind, TouchEventKind::DOWN);
    }

    // Quiet frame produces nothing
    syn(decoder);
    EXPECT_TRUE(decoder.takeBatch().empty());
}

TEST_F(MtDecoderTest, TrackingIdChangeIsUpThenDown) {
    MtProtocolDecoder decoder(5, true);
    touchDown(decoder, 0, 1, 10, 10);
    syn(decoder);
    decoder.takeBatch();

    abs(decoder, ABS_MT_TRACKING_ID, 7);
    abs(decoder, ABS_MT_POSITION_X, 400);
    syn(decoder);
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::UP);
    EXPECT_EQ(batch[1].kind, TouchEventKind::DOWN);
    EXPECT_EQ(batch[1].x, 400);
}

TEST_F(MtDecoderTest, TouchSizeIsReported) {
    MtProtocolDecoder decoder(5, true);
    touchDown(decoder, 0, 1, 10, 10);
    abs(decoder, ABS_MT_TOUCH_MAJOR, 30);
    abs(decoder, ABS_MT_TOUCH_MINOR, 20);
    syn(decoder);
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].touch_major, 30);
    EXPECT_EQ(batch[0].touch_minor, 20);
}

TEST_F(MtDecoderTest, OutOfRangeSlotIgnored) {
    MtProtocolDecoder decoder(2, true);
    touchDown(decoder, 5, 1, 10, 10);
    syn(decoder);
    EXPECT_TRUE(decoder.takeBatch().empty());
}

TEST_F(MtDecoderTest, DroppedFrameDiscardsBatchAndRequestsResync) {
    MtProtocolDecoder decoder(5, true);
    touchDown(decoder, 0, 1, 10, 10);
    decoder.feed(EV_SYN, SYN_DROPPED, 0, now_);
    abs(decoder, ABS_MT_POSITION_X, 999);
    EXPECT_FALSE(syn(decoder));
    EXPECT_TRUE(decoder.takeBatch().empty());
    EXPECT_TRUE(decoder.needsResync());
    EXPECT_EQ(decoder.getDroppedFrames(), 1u);

    // Kernel state after the drop: slot 0 active at (50, 60), slot 1 new
    std::vector<MtProtocolDecoder::SlotState> kernel(5);
    kernel[0].trackingId = 1;
    kernel[0].x = 50;
    kernel[0].y = 60;
    kernel[1].trackingId = 2;
    kernel[1].x = 70;
    kernel[1].y = 80;

    EXPECT_TRUE(decoder.resync(kernel, 1, now_));
    EXPECT_FALSE(decoder.needsResync());
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].slot_id, 0);
    EXPECT_EQ(batch[0].kind, TouchEventKind::DOWN);
    EXPECT_EQ(batch[1].slot_id, 1);
    EXPECT_EQ(batch[1].kind, TouchEventKind::DOWN);
}

TEST_F(MtDecoderTest, ResyncReportsLiftedAndMovedSlots) {
    MtProtocolDecoder decoder(3, true);
    touchDown(decoder, 0, 1, 10, 10);
    touchDown(decoder, 1, 2, 20, 20);
    syn(decoder);
    decoder.takeBatch();

    std::vector<MtProtocolDecoder::SlotState> kernel(3);
    kernel[0].trackingId = 1;
    kernel[0].x = 15;
    kernel[0].y = 10;

    EXPECT_TRUE(decoder.resync(kernel, 0, now_));
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::MOVE);
    EXPECT_EQ(batch[0].x, 15);
    EXPECT_EQ(batch[1].slot_id, 1);
    EXPECT_EQ(batch[1].kind, TouchEventKind::UP);
}

TEST_F(MtDecoderTest, SingleTouchFallback) {
    MtProtocolDecoder decoder(1, false);
    decoder.feed(EV_KEY, BTN_TOUCH, 1, now_);
    abs(decoder, ABS_X, 300);
    abs(decoder, ABS_Y, 400);
    syn(decoder);
    auto batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::DOWN);
    EXPECT_EQ(batch[0].x, 300);

    abs(decoder, ABS_X, 310);
    syn(decoder);
    batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::MOVE);

    decoder.feed(EV_KEY, BTN_TOUCH, 0, now_);
    syn(decoder);
    batch = decoder.takeBatch();
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].kind, TouchEventKind::UP);
}

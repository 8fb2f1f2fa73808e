/**
 * @file test_contact_tracker.cpp
 * @brief Unit tests for ContactTracker
 *
 * Validates:
 * - Stable ids across moves, fresh ids on slot reuse
 * - Down/Move/Up handling including missed Down and stray Up
 * - Eviction of the stalest contact when the limit is exceeded
 * - Optional timeout of silent contacts
 */

#include <gtest/gtest.h>
#include <padpoint/tracking/ContactTracker.hpp>
#include <padpoint/core/Logger.hpp>
#include <chrono>

using namespace padpoint::tracking;
using padpoint::core::TimePoint;

namespace {

TouchReport report(int slot, int x, int y, TouchEventKind kind, TimePoint t) {
    TouchReport r;
    r.slot_id = slot;
    r.x = x;
    r.y = y;
    r.kind = kind;
    r.timestamp = t;
    return r;
}

} // namespace

class ContactTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::WARNING);
        t0_ = padpoint::core::Clock::now();
    }

    TimePoint at(int ms) const {
        return t0_ + std::chrono::milliseconds(ms);
    }

    TimePoint t0_;
};

TEST_F(ContactTrackerTest, DownCreatesContactWithStableId) {
    ContactTracker tracker;

    auto contacts = tracker.process_batch({report(0, 100, 200, TouchEventKind::DOWN, at(0))}, at(0));
    ASSERT_EQ(contacts.size(), 1u);
    const auto id = contacts[0].id;
    EXPECT_EQ(contacts[0].position, cv::Point(100, 200));
    EXPECT_EQ(contacts[0].established_at, at(0));

    contacts = tracker.process_batch({report(0, 110, 205, TouchEventKind::MOVE, at(8))}, at(8));
    ASSERT_EQ(contacts.size(), 1u);
    EXPECT_EQ(contacts[0].id, id);
    EXPECT_EQ(contacts[0].position, cv::Point(110, 205));
    EXPECT_EQ(contacts[0].established_at, at(0));
    EXPECT_EQ(contacts[0].last_seen, at(8));
}

TEST_F(ContactTrackerTest, UpRemovesContact) {
    ContactTracker tracker;
    tracker.process_batch({report(0, 1, 1, TouchEventKind::DOWN, at(0)),
                           report(1, 50, 50, TouchEventKind::DOWN, at(0))}, at(0));
    EXPECT_EQ(tracker.get_contact_count(), 2u);

    auto contacts = tracker.process_batch({report(0, 1, 1, TouchEventKind::UP, at(10))}, at(10));
    ASSERT_EQ(contacts.size(), 1u);
    EXPECT_EQ(contacts[0].slot_id, 1);
}

TEST_F(ContactTrackerTest, SlotReuseProducesNewId) {
    ContactTracker tracker;
    auto first = tracker.process_batch({report(2, 10, 10, TouchEventKind::DOWN, at(0))}, at(0));
    tracker.process_batch({report(2, 10, 10, TouchEventKind::UP, at(5))}, at(5));
    auto second = tracker.process_batch({report(2, 20, 20, TouchEventKind::DOWN, at(10))}, at(10));

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(first[0].id, second[0].id);
    EXPECT_GT(second[0].id, first[0].id);
}

TEST_F(ContactTrackerTest, DownOnOccupiedSlotReplacesContact) {
    ContactTracker tracker;
    auto first = tracker.process_batch({report(0, 10, 10, TouchEventKind::DOWN, at(0))}, at(0));
    auto second = tracker.process_batch({report(0, 90, 90, TouchEventKind::DOWN, at(4))}, at(4));

    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(second[0].id, first[0].id);
    EXPECT_EQ(second[0].position, cv::Point(90, 90));
}

TEST_F(ContactTrackerTest, MoveOnUnknownSlotActsAsDown) {
    ContactTracker tracker;
    auto contacts = tracker.process_batch({report(3, 40, 60, TouchEventKind::MOVE, at(0))}, at(0));
    ASSERT_EQ(contacts.size(), 1u);
    EXPECT_EQ(contacts[0].slot_id, 3);
    EXPECT_EQ(contacts[0].established_at, at(0));
}

TEST_F(ContactTrackerTest, UpOnUnknownSlotIsIgnored) {
    ContactTracker tracker;
    tracker.process_batch({report(0, 10, 10, TouchEventKind::DOWN, at(0))}, at(0));
    auto contacts = tracker.process_batch({report(7, 0, 0, TouchEventKind::UP, at(5))}, at(5));
    EXPECT_EQ(contacts.size(), 1u);
}

TEST_F(ContactTrackerTest, ContactsOrderedByEstablishment) {
    ContactTracker tracker;
    tracker.process_batch({report(4, 0, 0, TouchEventKind::DOWN, at(0))}, at(0));
    tracker.process_batch({report(1, 0, 0, TouchEventKind::DOWN, at(5))}, at(5));
    auto contacts = tracker.process_batch({report(2, 0, 0, TouchEventKind::DOWN, at(9))}, at(9));

    ASSERT_EQ(contacts.size(), 3u);
    EXPECT_EQ(contacts[0].slot_id, 4);
    EXPECT_EQ(contacts[1].slot_id, 1);
    EXPECT_EQ(contacts[2].slot_id, 2);
}

TEST_F(ContactTrackerTest, OverflowEvictsStalestContact) {
    TrackingConfig config;
    config.max_contacts = 4;
    ContactTracker tracker(config);

    tracker.process_batch({report(0, 0, 0, TouchEventKind::DOWN, at(0)),
                           report(1, 10, 0, TouchEventKind::DOWN, at(0)),
                           report(2, 20, 0, TouchEventKind::DOWN, at(0)),
                           report(3, 30, 0, TouchEventKind::DOWN, at(0))}, at(0));

    // Slot 1 stays silent, everything else moves
    tracker.process_batch({report(0, 1, 0, TouchEventKind::MOVE, at(10)),
                           report(2, 21, 0, TouchEventKind::MOVE, at(10)),
                           report(3, 31, 0, TouchEventKind::MOVE, at(10))}, at(10));

    auto contacts = tracker.process_batch({report(4, 40, 0, TouchEventKind::DOWN, at(20))}, at(20));
    ASSERT_EQ(contacts.size(), 4u);
    EXPECT_EQ(tracker.get_evicted_count(), 1u);
    for (const auto& c : contacts) {
        EXPECT_NE(c.slot_id, 1);
    }
}

TEST_F(ContactTrackerTest, NoTimeoutByDefault) {
    ContactTracker tracker;
    tracker.process_batch({report(0, 5, 5, TouchEventKind::DOWN, at(0))}, at(0));
    for (int i = 1; i <= 100; ++i) {
        tracker.end_tick(at(i * 10));
    }
    EXPECT_EQ(tracker.get_contact_count(), 1u);
    EXPECT_EQ(tracker.get_tick_count(), 101u);
}

TEST_F(ContactTrackerTest, SilentContactTimesOut) {
    TrackingConfig config;
    config.contact_timeout_ticks = 3;
    ContactTracker tracker(config);

    tracker.process_batch({report(0, 5, 5, TouchEventKind::DOWN, at(0)),
                           report(1, 50, 5, TouchEventKind::DOWN, at(0))}, at(0));

    // Slot 1 keeps reporting, slot 0 goes quiet
    tracker.process_batch({report(1, 51, 5, TouchEventKind::MOVE, at(10))}, at(10));
    auto contacts = tracker.process_batch({report(1, 52, 5, TouchEventKind::MOVE, at(20))}, at(20));
    EXPECT_EQ(contacts.size(), 2u);

    contacts = tracker.process_batch({report(1, 53, 5, TouchEventKind::MOVE, at(30))}, at(30));
    ASSERT_EQ(contacts.size(), 1u);
    EXPECT_EQ(contacts[0].slot_id, 1);
}

TEST_F(ContactTrackerTest, ClearDropsEverything) {
    ContactTracker tracker;
    tracker.process_batch({report(0, 5, 5, TouchEventKind::DOWN, at(0))}, at(0));
    tracker.clear();
    EXPECT_EQ(tracker.get_contact_count(), 0u);
    EXPECT_TRUE(tracker.get_active_contacts().empty());
}

TEST_F(ContactTrackerTest, InvalidConfigFallsBackToDefaults) {
    TrackingConfig config;
    config.max_contacts = 2;    // not more than ref_count
    ContactTracker tracker(config);
    EXPECT_EQ(tracker.get_config().max_contacts, 5);
}

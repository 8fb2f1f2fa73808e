/**
 * @file ContactTracker.hpp
 * @brief Maintains the set of active touch contacts from slot-keyed reports
 *
 * Converts the hardware slot stream into contacts with stable identities.
 * Each tick the tracker applies a batch of reports and returns a snapshot of
 * the active contacts ordered by establishment time.
 */

#ifndef PADPOINT_TRACKING_CONTACT_TRACKER_HPP
#define PADPOINT_TRACKING_CONTACT_TRACKER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "TouchTypes.hpp"

namespace padpoint {
namespace tracking {

/**
 * @brief Slot-to-contact tracker
 *
 * Rules:
 * - Down on a free slot creates a contact with a fresh id
 * - Down on an occupied slot ends the old contact and creates a new one
 * - Move on an unknown slot is treated as Down
 * - Up removes the contact; Up on an unknown slot is ignored
 * - More than max_contacts simultaneous contacts evicts the least recently
 *   updated one
 */
class ContactTracker {
public:
    ContactTracker();
    explicit ContactTracker(const TrackingConfig& config);
    ~ContactTracker();

    ContactTracker(const ContactTracker&) = delete;
    ContactTracker& operator=(const ContactTracker&) = delete;

    /**
     * @brief Apply a single report to the pending tick
     */
    void apply(const TouchReport& report);

    /**
     * @brief Close the current tick
     *
     * Applies the inactivity timeout and advances the tick counter.
     *
     * @return Active contacts ordered by establishment time
     */
    std::vector<Contact> end_tick(core::TimePoint now);

    /**
     * @brief Apply a full batch and close the tick
     */
    std::vector<Contact> process_batch(const TouchBatch& batch, core::TimePoint now);

    /**
     * @brief Snapshot of active contacts ordered by establishment time
     */
    std::vector<Contact> get_active_contacts() const;

    size_t get_contact_count() const;
    std::uint64_t get_tick_count() const;

    /// Contacts evicted because max_contacts was exceeded
    size_t get_evicted_count() const;

    /**
     * @brief Drop all contacts; ids keep increasing
     */
    void clear();

    TrackingConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tracking
} // namespace padpoint

#endif // PADPOINT_TRACKING_CONTACT_TRACKER_HPP

/**
 * @file ContactTracker.cpp
 * @brief Implementation of slot-keyed contact tracking
 */

#include "padpoint/tracking/ContactTracker.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>
#include <map>

namespace padpoint {
namespace tracking {

class ContactTracker::Impl {
public:
    TrackingConfig config;
    std::map<int, Contact> slots;       ///< Active contacts keyed by slot
    std::uint64_t next_id = 1;
    std::uint64_t tick_count = 0;
    size_t evicted = 0;

    std::uint64_t pending_tick() const { return tick_count + 1; }

    void begin_contact(const TouchReport& report) {
        auto existing = slots.find(report.slot_id);
        if (existing != slots.end()) {
            PADPOINT_LOG_DEBUG("ContactTracker") << "Slot " << report.slot_id
                << " reassigned, ending contact " << existing->second.id;
            slots.erase(existing);
        }

        if (static_cast<int>(slots.size()) >= config.max_contacts) {
            evict_stalest();
        }

        Contact contact;
        contact.id = next_id++;
        contact.slot_id = report.slot_id;
        contact.position = cv::Point(report.x, report.y);
        contact.touch_major = report.touch_major;
        contact.touch_minor = report.touch_minor;
        contact.established_at = report.timestamp;
        contact.last_seen = report.timestamp;
        contact.last_seen_tick = pending_tick();
        slots[report.slot_id] = contact;

        PADPOINT_LOG_TRACE("ContactTracker") << "Contact " << contact.id
            << " down on slot " << report.slot_id
            << " at (" << report.x << ", " << report.y << ")";
    }

    void evict_stalest() {
        auto stalest = slots.end();
        for (auto it = slots.begin(); it != slots.end(); ++it) {
            if (stalest == slots.end()) {
                stalest = it;
                continue;
            }
            const Contact& a = it->second;
            const Contact& b = stalest->second;
            if (a.last_seen < b.last_seen ||
                (a.last_seen == b.last_seen && a.id < b.id)) {
                stalest = it;
            }
        }
        if (stalest != slots.end()) {
            PADPOINT_LOG_WARNING("ContactTracker") << "Contact limit "
                << config.max_contacts << " exceeded, evicting contact "
                << stalest->second.id << " on slot " << stalest->first;
            slots.erase(stalest);
            evicted++;
        }
    }

    std::vector<Contact> snapshot() const {
        std::vector<Contact> contacts;
        contacts.reserve(slots.size());
        for (const auto& entry : slots) {
            contacts.push_back(entry.second);
        }
        std::sort(contacts.begin(), contacts.end(),
            [](const Contact& a, const Contact& b) {
                if (a.established_at != b.established_at) {
                    return a.established_at < b.established_at;
                }
                return a.id < b.id;
            });
        return contacts;
    }
};

ContactTracker::ContactTracker()
    : pImpl(std::make_unique<Impl>()) {
}

ContactTracker::ContactTracker(const TrackingConfig& config)
    : pImpl(std::make_unique<Impl>()) {
    if (config.is_valid()) {
        pImpl->config = config;
    } else {
        LOG_WARNING("ContactTracker: invalid tracking config, using defaults");
    }
}

ContactTracker::~ContactTracker() = default;

void ContactTracker::apply(const TouchReport& report) {
    switch (report.kind) {
        case TouchEventKind::DOWN:
            pImpl->begin_contact(report);
            break;

        case TouchEventKind::MOVE: {
            auto it = pImpl->slots.find(report.slot_id);
            if (it == pImpl->slots.end()) {
                // Missed Down, possibly after a dropped batch
                pImpl->begin_contact(report);
                break;
            }
            Contact& contact = it->second;
            contact.position = cv::Point(report.x, report.y);
            if (report.touch_major > 0) {
                contact.touch_major = report.touch_major;
                contact.touch_minor = report.touch_minor;
            }
            contact.last_seen = report.timestamp;
            contact.last_seen_tick = pImpl->pending_tick();
            break;
        }

        case TouchEventKind::UP: {
            auto it = pImpl->slots.find(report.slot_id);
            if (it == pImpl->slots.end()) {
                PADPOINT_LOG_TRACE("ContactTracker") << "Up on unknown slot "
                    << report.slot_id << " ignored";
                break;
            }
            PADPOINT_LOG_TRACE("ContactTracker") << "Contact " << it->second.id
                << " up on slot " << report.slot_id;
            pImpl->slots.erase(it);
            break;
        }
    }
}

std::vector<Contact> ContactTracker::end_tick(core::TimePoint /*now*/) {
    pImpl->tick_count++;

    if (pImpl->config.contact_timeout_ticks > 0) {
        const std::uint64_t timeout =
            static_cast<std::uint64_t>(pImpl->config.contact_timeout_ticks);
        for (auto it = pImpl->slots.begin(); it != pImpl->slots.end();) {
            if (pImpl->tick_count - it->second.last_seen_tick >= timeout) {
                PADPOINT_LOG_DEBUG("ContactTracker") << "Contact " << it->second.id
                    << " timed out after " << timeout << " silent ticks";
                it = pImpl->slots.erase(it);
            } else {
                ++it;
            }
        }
    }

    return pImpl->snapshot();
}

std::vector<Contact> ContactTracker::process_batch(const TouchBatch& batch,
                                                   core::TimePoint now) {
    for (const auto& report : batch) {
        apply(report);
    }
    return end_tick(now);
}

std::vector<Contact> ContactTracker::get_active_contacts() const {
    return pImpl->snapshot();
}

size_t ContactTracker::get_contact_count() const {
    return pImpl->slots.size();
}

std::uint64_t ContactTracker::get_tick_count() const {
    return pImpl->tick_count;
}

size_t ContactTracker::get_evicted_count() const {
    return pImpl->evicted;
}

void ContactTracker::clear() {
    pImpl->slots.clear();
}

TrackingConfig ContactTracker::get_config() const {
    return pImpl->config;
}

} // namespace tracking
} // namespace padpoint

/**
 * @file ReferencePoseEstimator.cpp
 * @brief Implementation of reference pose estimation
 */

#include "padpoint/tracking/ReferencePoseEstimator.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace padpoint {
namespace tracking {

namespace {

cv::Point2d axis_vector(RoleAxis axis) {
    switch (axis) {
        case RoleAxis::RIGHT_TO_LEFT: return cv::Point2d(-1.0, 0.0);
        case RoleAxis::TOP_TO_BOTTOM: return cv::Point2d(0.0, 1.0);
        case RoleAxis::BOTTOM_TO_TOP: return cv::Point2d(0.0, -1.0);
        case RoleAxis::LEFT_TO_RIGHT:
        default:
            return cv::Point2d(1.0, 0.0);
    }
}

const Contact* find_contact(const std::vector<Contact>& contacts, std::uint64_t id) {
    for (const auto& c : contacts) {
        if (c.id == id) {
            return &c;
        }
    }
    return nullptr;
}

double distance(const cv::Point& a, const cv::Point& b) {
    double dx = static_cast<double>(a.x - b.x);
    double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

class ReferencePoseEstimator::Impl {
public:
    TrackingConfig config;
    ReferencePose pose;
    bool invalidated_last_update = false;

    /// +1: perpendicular is the baseline rotated counter-clockwise, -1: clockwise
    double perp_sign = 1.0;

    /**
     * @brief Role order for the tracked ids, applying the jitter tie-break
     *
     * @param current Reference contacts with this tick's positions, in the
     *                previous role order
     */
    std::vector<Contact> assign_roles(const std::vector<Contact>& current) const {
        std::vector<Contact> fresh = sort_by_role_axis(current, config.role_axis);

        bool same_order = true;
        for (size_t i = 0; i < fresh.size(); ++i) {
            if (fresh[i].id != current[i].id) {
                same_order = false;
                break;
            }
        }
        if (same_order) {
            return fresh;
        }

        // Ambiguous sort: keep the old roles unless something really moved
        for (const auto& contact : current) {
            const Contact* previous = find_contact(pose.references, contact.id);
            if (previous == nullptr ||
                distance(previous->position, contact.position) >= config.role_jitter_threshold) {
                PADPOINT_LOG_DEBUG("PoseEstimator") << "Role order changed, re-sorting";
                return fresh;
            }
        }

        PADPOINT_LOG_TRACE("PoseEstimator") << "Role sort flipped under jitter, keeping roles";
        return current;
    }

    /**
     * @brief Fill the pose geometry from role-ordered references
     * @return false if the shape check fails
     */
    bool compute_geometry(const std::vector<Contact>& ordered, ReferencePose& out) {
        out.references = ordered;
        out.thumb = ordered.front();
        out.pinky = ordered.back();
        out.middle = ordered[ordered.size() / 2];

        cv::Point2d sum(0.0, 0.0);
        for (const auto& c : ordered) {
            sum += c.position_d();
        }
        out.centroid = sum * (1.0 / static_cast<double>(ordered.size()));

        out.baseline = out.pinky.position_d() - out.thumb.position_d();
        double length = out.baseline_length();
        if (length < config.min_baseline_length || length <= 0.0) {
            return false;
        }

        // Counter-clockwise rotation of the baseline unit
        cv::Point2d unit = out.baseline_unit();
        cv::Point2d ccw(-unit.y, unit.x);

        // Fingers lie on the far side of the thumb-pinky line from the palm
        cv::Point2d mid = (out.thumb.position_d() + out.pinky.position_d()) * 0.5;
        double side = ccw.dot(out.middle.position_d() - mid);
        if (std::abs(side) > 1e-9) {
            perp_sign = side > 0.0 ? 1.0 : -1.0;
        }
        out.perpendicular_axis = ccw * perp_sign;
        return true;
    }

    void invalidate(const char* reason) {
        if (pose.valid) {
            PADPOINT_LOG_INFO("PoseEstimator") << "Reference pose lost: " << reason;
        }
        pose.valid = false;
        invalidated_last_update = true;
    }
};

ReferencePoseEstimator::ReferencePoseEstimator()
    : pImpl(std::make_unique<Impl>()) {
}

ReferencePoseEstimator::ReferencePoseEstimator(const TrackingConfig& config)
    : pImpl(std::make_unique<Impl>()) {
    if (config.is_valid()) {
        pImpl->config = config;
    } else {
        LOG_WARNING("ReferencePoseEstimator: invalid tracking config, using defaults");
    }
}

ReferencePoseEstimator::~ReferencePoseEstimator() = default;

const ReferencePose& ReferencePoseEstimator::update(const std::vector<Contact>& contacts,
                                                    core::TimePoint now) {
    pImpl->invalidated_last_update = false;
    ReferencePose& pose = pImpl->pose;

    if (pose.valid) {
        // Refresh the same ids; any missing id ends the pose on this tick
        std::vector<Contact> current;
        current.reserve(pose.references.size());
        for (const auto& ref : pose.references) {
            const Contact* live = find_contact(contacts, ref.id);
            if (live == nullptr) {
                pImpl->invalidate("reference contact lifted");
                return pose;
            }
            current.push_back(*live);
        }

        std::vector<Contact> ordered = pImpl->assign_roles(current);
        ReferencePose next = pose;
        if (!pImpl->compute_geometry(ordered, next)) {
            pImpl->invalidate("baseline below minimum length");
            return pose;
        }
        pose = next;
        return pose;
    }

    if (static_cast<int>(contacts.size()) != pImpl->config.ref_count) {
        return pose;
    }

    ReferencePose candidate;
    std::vector<Contact> ordered = sort_by_role_axis(contacts, pImpl->config.role_axis);
    if (!pImpl->compute_geometry(ordered, candidate)) {
        PADPOINT_LOG_TRACE("PoseEstimator") << "Candidate pose rejected, baseline "
            << candidate.baseline_length();
        return pose;
    }

    candidate.established_at = now;
    candidate.valid = true;
    pose = candidate;

    PADPOINT_LOG_INFO("PoseEstimator") << "Reference pose established: thumb="
        << pose.thumb.id << " middle=" << pose.middle.id << " pinky=" << pose.pinky.id
        << " baseline=" << pose.baseline_length();
    return pose;
}

const ReferencePose& ReferencePoseEstimator::get_pose() const {
    return pImpl->pose;
}

std::vector<Contact> ReferencePoseEstimator::get_non_reference_contacts(
    const std::vector<Contact>& contacts) const {
    std::vector<Contact> others;
    if (!pImpl->pose.valid) {
        return others;
    }
    for (const auto& c : contacts) {
        if (!pImpl->pose.contains(c.id)) {
            others.push_back(c);
        }
    }
    return others;
}

bool ReferencePoseEstimator::select_pointing_contact(const std::vector<Contact>& contacts,
                                                     Contact& pointing) const {
    bool found = false;
    for (const auto& c : get_non_reference_contacts(contacts)) {
        if (!found ||
            c.established_at > pointing.established_at ||
            (c.established_at == pointing.established_at && c.id > pointing.id)) {
            pointing = c;
            found = true;
        }
    }
    return found;
}

bool ReferencePoseEstimator::was_invalidated() const {
    return pImpl->invalidated_last_update;
}

void ReferencePoseEstimator::reset() {
    pImpl->pose = ReferencePose();
    pImpl->invalidated_last_update = false;
    pImpl->perp_sign = 1.0;
}

TrackingConfig ReferencePoseEstimator::get_config() const {
    return pImpl->config;
}

std::vector<Contact> ReferencePoseEstimator::sort_by_role_axis(
    const std::vector<Contact>& contacts, RoleAxis axis) {
    const cv::Point2d dir = axis_vector(axis);
    std::vector<Contact> sorted = contacts;
    std::stable_sort(sorted.begin(), sorted.end(),
        [&dir](const Contact& a, const Contact& b) {
            double pa = dir.dot(a.position_d());
            double pb = dir.dot(b.position_d());
            if (pa != pb) {
                return pa < pb;
            }
            return a.id < b.id;
        });
    return sorted;
}

} // namespace tracking
} // namespace padpoint

/**
 * @file ReferencePoseEstimator.hpp
 * @brief Reference pose (thumb, middle, pinky) selection and frame computation
 *
 * A pose is established when exactly ref_count contacts are on the pad and
 * stays valid while those same contacts persist. Losing any of them
 * invalidates the pose on that tick; it is never repaired by substituting
 * another contact.
 *
 * @see TouchTypes.hpp for ReferencePose and TrackingConfig
 */

#ifndef PADPOINT_TRACKING_REFERENCE_POSE_ESTIMATOR_HPP
#define PADPOINT_TRACKING_REFERENCE_POSE_ESTIMATOR_HPP

#include <memory>
#include <vector>
#include "TouchTypes.hpp"

namespace padpoint {
namespace tracking {

class ReferencePoseEstimator {
public:
    ReferencePoseEstimator();
    explicit ReferencePoseEstimator(const TrackingConfig& config);
    ~ReferencePoseEstimator();

    ReferencePoseEstimator(const ReferencePoseEstimator&) = delete;
    ReferencePoseEstimator& operator=(const ReferencePoseEstimator&) = delete;

    /**
     * @brief Re-evaluate the pose against the current contact set
     *
     * @param contacts Active contacts from the ContactTracker
     * @param now Tick time, stored as established_at on establishment
     * @return Current pose; check ReferencePose::valid
     */
    const ReferencePose& update(const std::vector<Contact>& contacts,
                                core::TimePoint now);

    const ReferencePose& get_pose() const;

    /**
     * @brief Contacts that are not part of the current valid pose
     *
     * Empty when no pose is valid. Order of the input is preserved.
     */
    std::vector<Contact> get_non_reference_contacts(
        const std::vector<Contact>& contacts) const;

    /**
     * @brief Select the pointing contact among the non-reference contacts
     *
     * The most recently established non-reference contact wins.
     *
     * @param[out] pointing Selected contact
     * @return false if no valid pose or no non-reference contact
     */
    bool select_pointing_contact(const std::vector<Contact>& contacts,
                                 Contact& pointing) const;

    /// True if the pose was invalidated during the last update() call
    bool was_invalidated() const;

    /**
     * @brief Forget the pose and role history
     */
    void reset();

    TrackingConfig get_config() const;

    /**
     * @brief Order contacts along the role axis (thumb first)
     */
    static std::vector<Contact> sort_by_role_axis(const std::vector<Contact>& contacts,
                                                  RoleAxis axis);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tracking
} // namespace padpoint

#endif // PADPOINT_TRACKING_REFERENCE_POSE_ESTIMATOR_HPP

#pragma once

/**
 * @file trail_driver.h
 * @brief Time-windowed history of a moving position
 *
 * The trail records a new point whenever the tracked position moves further
 * than minVertexDistance from the last recorded point. Points live in a ring
 * of maxTrailPoints slots; slot s owns endpoint element 2s and pipe element
 * 2s+1 (connecting slot s to slot s+1). The live range runs from the start
 * cursor (oldest) to the end cursor (newest, always tracking the current
 * position).
 *
 * Each tick ages the newest point upward (capped at the lifetime) and the
 * oldest point downward. When the oldest point runs out it expires, and
 * once the last point expires the trail becomes invisible.
 *
 * Positions are recorded in world space.
 */

#include <strand/chain_driver.h>
#include <vector>

namespace strand {

class TrailDriver : public ChainDriver {
public:
    /// Floor applied to minVertexDistance
    static constexpr float kAbsoluteMinVertexDistance = 0.01f;

    /// Floor applied to maxTrailPoints
    static constexpr int kMinTrailPoints = 3;

    // -------------------------------------------------------------------------
    /// @name Parameters
    /// @{

    Param<int> maxTrailPoints{"maxTrailPoints", 20, kMinTrailPoints, 1024};        ///< Ring capacity (>= 3)
    Param<bool> stealLastPointWhenEmpty{"stealLastPointWhenEmpty", true};         ///< Recycle the oldest point when full
    Param<float> time{"time", 5.0f, 0.0f, 60.0f};                                 ///< Point lifetime in seconds
    Param<float> minVertexDistance{"minVertexDistance", 0.1f,
                                   kAbsoluteMinVertexDistance, 10.0f};            ///< Movement needed to record a point
    Param<bool> autodestruct{"autodestruct", false};                              ///< Request destruction once empty
    Param<bool> smoothInterpolation{"smoothInterpolation", false};                ///< Slide the tail toward the next point

    /// @}

    TrailDriver();

    DriverKind kind() const override { return DriverKind::Trail; }

    size_t requiredCapacity() const override { return 2 * capacity(); }
    bool needsReinitialize() const override;

    /// @brief Same as reinitialize(); the style is sampled on the next tick
    void rebuild(const ChainStyle& style) override;

    /// @brief Reinitialize anchored at the startup position
    void start(const glm::vec3& position, const ChainStyle& style) override;

    void updateWidths(const ChainStyle& style) override;
    void updateColors(const ChainStyle& style) override;

    /**
     * @brief Move the k-th live point
     * @param index 0 = oldest live point, positionCount() = newest
     */
    void incrementalUpdate(size_t index, const glm::vec3& position,
                           const ChainStyle& style) override;

    TickResult tick(float deltaTime, const glm::vec3& position,
                    const ChainStyle& style) override;

    /// @brief Hide every element, reset the cursors and re-anchor at position
    void clear(const glm::vec3& position) override;

    /// @brief Number of live segments (0 when the trail is empty)
    size_t positionCount() const override;

    /// @brief Live point by age (0 = oldest)
    glm::vec3 position(size_t index) const override;

    bool hasGeometry() const override { return m_start != m_end; }

    /**
     * @brief Size the ring for the current maxTrailPoints and clear
     *
     * Storage is only reallocated when the capacity changed.
     */
    void reinitialize();

    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    /// @brief Ring capacity (maxTrailPoints clamped to >= 3)
    size_t capacity() const;

    /// @brief Point lifetime (time clamped to >= 0)
    float lifetime() const;

    /// @brief Recording distance (minVertexDistance clamped to the floor)
    float effectiveMinVertexDistance() const;

    size_t startIndex() const { return m_start; }
    size_t endIndex() const { return m_end; }

    /// @brief Age counter of a ring slot
    float pointTime(size_t slot) const { return m_pointTimes.at(slot); }

    glm::vec3 lastRecordedPoint() const { return m_lastRecordedPoint; }

    /// @brief Parameter distance between consecutive live points
    float stepSize() const { return m_stepSize; }

    /// @}

private:
    size_t nextSlot(size_t slot) const { return (slot + 1) % m_points.size(); }
    size_t prevSlot(size_t slot) const { return (slot + m_points.size() - 1) % m_points.size(); }
    size_t liveSlot(size_t index) const;

    void hideSlot(size_t slot);
    void updateBoundaryElements();
    void sampleWidths(const ChainStyle& style);
    void sampleColors(const ChainStyle& style);

    std::vector<glm::vec3> m_points;
    std::vector<float> m_pointTimes;
    size_t m_start = 0;
    size_t m_end = 0;
    glm::vec3 m_lastRecordedPoint{0.0f};
    glm::vec3 m_anchor{0.0f};
    float m_lastPointTime = 1.0f;
    float m_stepSize = 1.0f;
};

} // namespace strand

#pragma once

/**
 * @file chain_driver.h
 * @brief Interface shared by the line and trail drivers
 *
 * A driver owns one MeshChain and translates its domain points (a caller
 * supplied list, or a recorded history) into element updates. The
 * ChainRenderer picks a driver by DriverKind and talks to it only through
 * this interface.
 */

#include <strand/chain_style.h>
#include <strand/mesh_chain.h>
#include <strand/param.h>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace strand {

/// @brief Which driver a ChainRenderer runs
enum class DriverKind {
    Line,   ///< Caller-owned point list
    Trail   ///< Time-windowed history of a moving position
};

inline const char* driverKindName(DriverKind kind) {
    switch (kind) {
        case DriverKind::Line:  return "line";
        case DriverKind::Trail: return "trail";
        default:                return "unknown";
    }
}

/// @brief Outcome of one frame tick
struct TickResult {
    bool needsRefresh = false;      ///< Chain has pending changes to commit
    bool visible = false;           ///< Chain currently has visible geometry
    bool expired = false;           ///< A point expired this tick
    bool destroyRequested = false;  ///< Autodestruct fired this tick
};

class ChainDriver : public ParamRegistry {
public:
    virtual ~ChainDriver() = default;

    virtual DriverKind kind() const = 0;

    // -------------------------------------------------------------------------
    /// @name Capacity
    /// @{

    /// @brief Element count the current configuration needs
    virtual size_t requiredCapacity() const = 0;

    /// @brief True if the chain no longer matches requiredCapacity()
    virtual bool needsReinitialize() const {
        return chain().reservedElements() != requiredCapacity();
    }

    /**
     * @brief Reallocate if needed and regenerate every element
     * @param style Width and color functions
     */
    virtual void rebuild(const ChainStyle& style) = 0;

    /**
     * @brief Called once before the first tick
     * @param position Tracked position at startup
     */
    virtual void start(const glm::vec3& position, const ChainStyle& style) {
        (void)position;
        rebuild(style);
    }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Updates
    /// @{

    /// @brief Re-sample widths along the chain (marks Sizes)
    virtual void updateWidths(const ChainStyle& style) = 0;

    /// @brief Re-sample colors along the chain (marks Colors)
    virtual void updateColors(const ChainStyle& style) = 0;

    /**
     * @brief Move one point and patch only the elements touching it
     * @param index Point index (line: list index, trail: 0 = oldest live point)
     * @param position New position
     * @throw std::out_of_range if index does not name a live point
     */
    virtual void incrementalUpdate(size_t index, const glm::vec3& position,
                                   const ChainStyle& style) = 0;

    /**
     * @brief Advance one frame
     * @param deltaTime Seconds since the previous tick
     * @param position Current tracked position (ignored by the line driver)
     */
    virtual TickResult tick(float deltaTime, const glm::vec3& position,
                            const ChainStyle& style) = 0;

    /**
     * @brief Drop all points
     * @param position Anchor for the next recorded point (trail only)
     */
    virtual void clear(const glm::vec3& position) = 0;

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    /// @brief Line: point count. Trail: live segment count (occupancy).
    virtual size_t positionCount() const = 0;

    /// @brief Point position (same indexing as incrementalUpdate)
    virtual glm::vec3 position(size_t index) const = 0;

    /// @brief True if the chain currently has any visible geometry
    virtual bool hasGeometry() const = 0;

    MeshChain& chain() { return m_chain; }
    const MeshChain& chain() const { return m_chain; }

    /// @}

protected:
    MeshChain m_chain;
};

} // namespace strand

#pragma once

/**
 * @file line_driver.h
 * @brief Caller-supplied polyline mapped onto a MeshChain
 *
 * Point i owns endpoint element 2i. The pipe between points i and i+1 is
 * element 2i+1. A looping line adds one trailing pipe from the last point
 * back to the first, so N points need 2N-1 elements (2N when looping).
 *
 * @par Example
 * @code
 * LineDriver line;
 * ChainStyle style;
 * line.setPositions({{0,0,0}, {1,0,0}, {1,1,0}}, style);
 * line.setPosition(1, {2,0,0}, style);   // patches elements 1, 2 and 3
 * line.chain().refreshMesh();
 * @endcode
 */

#include <strand/chain_driver.h>
#include <vector>

namespace strand {

class LineDriver : public ChainDriver {
public:
    /// @brief Connect the last point back to the first
    Param<bool> loop{"loop", false};

    /// @brief Treat positions as world space (otherwise local to the owner's transform)
    Param<bool> worldSpace{"worldSpace", false};

    LineDriver();

    DriverKind kind() const override { return DriverKind::Line; }

    size_t requiredCapacity() const override;
    void rebuild(const ChainStyle& style) override;
    void updateWidths(const ChainStyle& style) override;
    void updateColors(const ChainStyle& style) override;
    void incrementalUpdate(size_t index, const glm::vec3& position,
                           const ChainStyle& style) override;
    TickResult tick(float deltaTime, const glm::vec3& position,
                    const ChainStyle& style) override;
    void clear(const glm::vec3& position) override;

    size_t positionCount() const override { return m_positions.size(); }
    glm::vec3 position(size_t index) const override;
    bool hasGeometry() const override { return !m_positions.empty(); }

    // -------------------------------------------------------------------------
    /// @name Point list
    /// @{

    /**
     * @brief Move a single point
     * @throw std::out_of_range if index >= positionCount()
     *
     * Only the endpoint and the (up to two) pipes touching the point are
     * rewritten. Falls back to a full rebuild if the chain capacity no
     * longer matches the point list.
     */
    void setPosition(size_t index, const glm::vec3& position, const ChainStyle& style);

    /**
     * @brief Replace the whole point list
     * @param knownSizeChange Suppress the warning when the count changes
     *
     * A different point count forces a full rebuild.
     */
    void setPositions(std::vector<glm::vec3> positions, const ChainStyle& style,
                      bool knownSizeChange = false);

    /// @brief Resize the point list, keeping existing points (new ones at origin)
    void setVertexCount(size_t count, const ChainStyle& style);

    /// @brief Change looping and rebuild if the capacity changed
    void setLoop(bool enabled, const ChainStyle& style);

    const std::vector<glm::vec3>& positions() const { return m_positions; }

    /// @brief Parameter distance between consecutive points
    float stepSize() const { return m_stepSize; }

    /// @}

private:
    void writePosition(size_t index);

    std::vector<glm::vec3> m_positions;
    float m_stepSize = 1.0f;
};

} // namespace strand

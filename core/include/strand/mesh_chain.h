#pragma once

/**
 * @file mesh_chain.h
 * @brief Flat element buffer of billboards and pipes with deferred refresh
 *
 * A MeshChain owns a fixed number of elements. Drivers place endpoints at
 * even indices and pipes at odd indices, flag what they changed, and call
 * refreshMesh() once per frame to regenerate vertex data. Setters are O(1)
 * and never touch vertex data; refreshMesh() is the only O(capacity) step.
 *
 * @par Example
 * @code
 * MeshChain chain;
 * chain.generate(3);
 * chain.setElementPosition(0, a);
 * chain.setElementPipe(1, a, b);
 * chain.setElementPosition(2, b);
 * chain.setMeshDataDirty(MeshRefreshFlag::Positions);
 * chain.refreshMesh();
 * @endcode
 */

#include <strand/color.h>
#include <strand/draw_buffer.h>
#include <glm/glm.hpp>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace strand {

/**
 * @brief Stored per-element values
 *
 * Endpoints use only the A side (B mirrors A). Pipes interpolate from A to B.
 */
struct ChainElement {
    glm::vec3 positionA{0.0f};
    glm::vec3 positionB{0.0f};
    float sizeA = 0.0f;
    float sizeB = 0.0f;
    Color colorA = Color::Clear;
    Color colorB = Color::Clear;
    bool pipe = false;
};

class MeshChain {
public:
    static constexpr uint32_t kVerticesPerElement = 4;
    static constexpr uint32_t kIndicesPerElement = 6;

    MeshChain() = default;
    ~MeshChain() = default;

    MeshChain(const MeshChain&) = delete;
    MeshChain& operator=(const MeshChain&) = delete;
    MeshChain(MeshChain&&) noexcept = default;
    MeshChain& operator=(MeshChain&&) noexcept = default;

    // -------------------------------------------------------------------------
    /// @name Allocation
    /// @{

    /**
     * @brief Size the chain for a number of elements
     * @param elementCount Required element count
     *
     * Does nothing if the chain already holds exactly elementCount elements.
     * Otherwise discards all previous contents, resets every element to an
     * invisible default and marks all data dirty.
     */
    void generate(size_t elementCount);

    /// @brief Number of elements the chain currently holds
    size_t reservedElements() const { return m_elements.size(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Element setters
    /// All throw std::out_of_range if index >= reservedElements().
    /// @{

    void setElementPosition(size_t index, const glm::vec3& position);
    void setElementPipe(size_t index, const glm::vec3& start, const glm::vec3& end);
    void setElementSize(size_t index, float size);
    void setElementSize(size_t index, float startSize, float endSize);
    void setElementColor(size_t index, const Color& color);
    void setElementColor(size_t index, const Color& startColor, const Color& endColor);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Refresh
    /// @{

    /// @brief Flag attribute categories for the next refreshMesh()
    void setMeshDataDirty(MeshRefreshFlag flags) { m_dirty |= flags; }

    MeshRefreshFlag dirtyFlags() const { return m_dirty; }

    /**
     * @brief Commit pending changes into the vertex buffer
     * @return True if anything was regenerated
     *
     * Regenerates the flagged attributes for every element, recomputes
     * bounds when positions or sizes changed, hands the result to the
     * attached DrawBuffer and clears the flags.
     */
    bool refreshMesh();

    /// @brief Number of refreshes that did work since construction
    uint64_t refreshCount() const { return m_refreshCount; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Output
    /// @{

    const ChainElement& element(size_t index) const;
    const std::vector<ChainVertex>& vertices() const { return m_vertices; }
    const std::vector<uint32_t>& indices() const { return m_indices; }
    const Bounds& bounds() const { return m_bounds; }

    /**
     * @brief Mark positions as world space (backend skips the model transform)
     *
     * A change flags Positions so the next refresh hands the new flag to the
     * draw buffer.
     */
    void setWorldSpaceData(bool worldSpace);
    bool worldSpaceData() const { return m_worldSpace; }

    /// @brief Attach a sink that receives every refresh (not owned, may be null)
    void setDrawBuffer(DrawBuffer* buffer) { m_drawBuffer = buffer; }
    DrawBuffer* drawBuffer() const { return m_drawBuffer; }

    /// @}

private:
    void checkIndex(size_t index) const;
    void writePositions();
    void writeSizes();
    void writeColors();
    void computeBounds();

    std::vector<ChainElement> m_elements;
    std::vector<ChainVertex> m_vertices;
    std::vector<uint32_t> m_indices;
    Bounds m_bounds;
    MeshRefreshFlag m_dirty = MeshRefreshFlag::None;
    uint64_t m_refreshCount = 0;
    bool m_worldSpace = false;
    DrawBuffer* m_drawBuffer = nullptr;
};

/// @brief True if STRAND_DEBUG_CHAIN is set to 1 or true (read once)
bool chainDebugEnabled();

} // namespace strand

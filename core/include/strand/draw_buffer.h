#pragma once

/**
 * @file draw_buffer.h
 * @brief Vertex layout and the sink interface a MeshChain commits into
 *
 * A chain produces one indexed triangle mesh: four vertices and two
 * triangles per element. The backend extrudes each vertex by
 * `offset * size`. Billboards (axis == 0) extrude in the view plane; pipes
 * extrude offset.x across their axis.
 */

#include <glm/glm.hpp>
#include <vector>
#include <cstdint>

namespace strand {

/// @brief Vertex format written by MeshChain::refreshMesh()
struct ChainVertex {
    glm::vec3 position{0.0f};  ///< Element anchor (pipe: A for corners 0-1, B for 2-3)
    glm::vec3 axis{0.0f};      ///< Pipe direction B - A, zero for billboards
    glm::vec2 offset{0.0f};    ///< Quad corner in [-1, 1]
    float size = 0.0f;         ///< Extrusion radius
    glm::vec4 color{0.0f};     ///< RGBA
};

static_assert(sizeof(ChainVertex) == 52, "ChainVertex must be tightly packed (52 bytes)");

/**
 * @brief Categories of per-element data awaiting a refresh
 */
enum class MeshRefreshFlag : uint32_t {
    None      = 0,
    Positions = 1 << 0,
    Sizes     = 1 << 1,
    Colors    = 1 << 2,
    All       = Positions | Sizes | Colors
};

inline MeshRefreshFlag operator|(MeshRefreshFlag a, MeshRefreshFlag b) {
    return static_cast<MeshRefreshFlag>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline MeshRefreshFlag operator&(MeshRefreshFlag a, MeshRefreshFlag b) {
    return static_cast<MeshRefreshFlag>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline MeshRefreshFlag& operator|=(MeshRefreshFlag& a, MeshRefreshFlag b) {
    a = a | b;
    return a;
}

/// @brief True if any bit of `flag` is set in `flags`
inline bool hasFlag(MeshRefreshFlag flags, MeshRefreshFlag flag) {
    return (flags & flag) != MeshRefreshFlag::None;
}

/// @brief Axis-aligned bounds of the visible elements
struct Bounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    bool valid = false;  ///< False when no element has a non-zero size

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 extents() const { return (max - min) * 0.5f; }
};

/// @brief View of a chain's committed mesh, valid for the duration of upload()
struct ChainMeshData {
    const std::vector<ChainVertex>& vertices;
    const std::vector<uint32_t>& indices;
    const Bounds& bounds;
    bool worldSpace;  ///< True if positions are already in world space
};

/**
 * @brief Destination for committed chain meshes
 *
 * Implemented by the rendering backend (see strand-webgpu's GpuChainBuffer).
 */
class DrawBuffer {
public:
    virtual ~DrawBuffer() = default;

    /**
     * @brief Receive the refreshed mesh
     * @param data Complete vertex and index arrays
     * @param changed Attribute categories regenerated by this refresh
     *
     * The index array and vertex count only change when the chain is
     * reallocated, which always reports MeshRefreshFlag::All.
     */
    virtual void upload(const ChainMeshData& data, MeshRefreshFlag changed) = 0;
};

} // namespace strand

#pragma once

/**
 * @file gpu_chain_buffer.h
 * @brief WebGPU vertex and index buffers fed by a MeshChain
 *
 * Attach one GpuChainBuffer per chain with MeshChain::setDrawBuffer().
 * Each refresh writes the vertex buffer in place; the buffers are only
 * recreated when the chain was reallocated to a different size.
 *
 * @par Example
 * @code
 * GpuChainBuffer gpu(device, queue);
 * renderer.setDrawBuffer(&gpu);
 * ...
 * if (renderer.visible() && gpu.valid()) {
 *     wgpuRenderPassEncoderSetVertexBuffer(pass, 0, gpu.vertexBuffer(), 0, WGPU_WHOLE_SIZE);
 *     wgpuRenderPassEncoderSetIndexBuffer(pass, gpu.indexBuffer(), WGPUIndexFormat_Uint32, 0, WGPU_WHOLE_SIZE);
 *     wgpuRenderPassEncoderDrawIndexed(pass, gpu.indexCount(), 1, 0, 0, 0);
 * }
 * @endcode
 */

#include <strand/draw_buffer.h>
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>
#include <cstdint>

namespace strand::webgpu {

/// Uniform block read by chainShaderSource() at group 0, binding 0
struct ChainUniforms {
    glm::mat4 viewProj{1.0f};
    glm::mat4 model{1.0f};            ///< Applied unless the chain is world space
    glm::vec3 cameraPosition{0.0f};
    float worldSpace = 0.0f;          ///< 1 = skip the model transform
    glm::vec3 cameraRight{1.0f, 0.0f, 0.0f};
    float _pad0 = 0.0f;
    glm::vec3 cameraUp{0.0f, 1.0f, 0.0f};
    float _pad1 = 0.0f;
};

static_assert(sizeof(ChainUniforms) == 176, "ChainUniforms must match the WGSL layout");

/**
 * @brief WGSL source that extrudes chain vertices
 *
 * Billboards expand in the camera plane and are clipped to a disc. Pipes
 * expand across their axis, facing the camera. Entry points vs_main and
 * fs_main; output is straight RGBA for standard alpha blending.
 */
const char* chainShaderSource();

class GpuChainBuffer : public DrawBuffer {
public:
    /// Number of attributes in vertexLayout()
    static constexpr uint32_t kAttributeCount = 5;

    GpuChainBuffer(WGPUDevice device, WGPUQueue queue);
    ~GpuChainBuffer() override;

    GpuChainBuffer(const GpuChainBuffer&) = delete;
    GpuChainBuffer& operator=(const GpuChainBuffer&) = delete;

    GpuChainBuffer(GpuChainBuffer&& other) noexcept;
    GpuChainBuffer& operator=(GpuChainBuffer&& other) noexcept;

    void upload(const ChainMeshData& data, MeshRefreshFlag changed) override;

    /// Release GPU resources
    void release();

    bool valid() const { return m_vertexBuffer != nullptr && m_indexBuffer != nullptr; }

    WGPUBuffer vertexBuffer() const { return m_vertexBuffer; }
    WGPUBuffer indexBuffer() const { return m_indexBuffer; }
    uint32_t vertexCount() const { return m_vertexCount; }
    uint32_t indexCount() const { return m_indexCount; }

    /// Bounds of the last upload (for culling)
    const Bounds& bounds() const { return m_bounds; }

    /// True if the last upload was in world space (skip the model transform)
    bool worldSpace() const { return m_worldSpace; }

    /// Number of uploads that recreated the buffers
    uint32_t allocationCount() const { return m_allocationCount; }

    /**
     * @brief Vertex layout matching ChainVertex
     *
     * Locations: 0 position, 1 axis, 2 offset, 3 size, 4 color. The returned
     * layout points at static attribute storage.
     */
    static WGPUVertexBufferLayout vertexLayout();

private:
    void allocate(uint32_t vertexCount, uint32_t indexCount);

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUBuffer m_vertexBuffer = nullptr;
    WGPUBuffer m_indexBuffer = nullptr;
    uint32_t m_vertexCount = 0;
    uint32_t m_indexCount = 0;
    uint32_t m_allocationCount = 0;
    Bounds m_bounds;
    bool m_worldSpace = false;
};

} // namespace strand::webgpu

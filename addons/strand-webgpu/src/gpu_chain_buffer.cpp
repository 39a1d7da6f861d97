#include <strand/webgpu/gpu_chain_buffer.h>
#include <cstddef>
#include <iostream>
#include <utility>

namespace strand::webgpu {

namespace {

inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

const char* CHAIN_SHADER_SOURCE = R"(
const EPSILON: f32 = 0.000001;

struct ChainUniforms {
    viewProj: mat4x4f,
    model: mat4x4f,
    cameraPosition: vec3f,
    worldSpace: f32,
    cameraRight: vec3f,
    _pad0: f32,
    cameraUp: vec3f,
    _pad1: f32,
}

@group(0) @binding(0) var<uniform> uniforms: ChainUniforms;

struct VertexInput {
    @location(0) position: vec3f,
    @location(1) axis: vec3f,
    @location(2) offset: vec2f,
    @location(3) size: f32,
    @location(4) color: vec4f,
}

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec4f,
    @location(1) corner: vec2f,
    @location(2) billboard: f32,
}

@vertex
fn vs_main(input: VertexInput) -> VertexOutput {
    var output: VertexOutput;

    var world = input.position;
    var axis = input.axis;
    if (uniforms.worldSpace < 0.5) {
        world = (uniforms.model * vec4f(input.position, 1.0)).xyz;
        axis = (uniforms.model * vec4f(input.axis, 0.0)).xyz;
    }

    if (dot(axis, axis) > EPSILON) {
        // Pipe: widen across the axis, facing the camera
        let toCamera = uniforms.cameraPosition - world;
        var side = cross(normalize(axis), toCamera);
        if (dot(side, side) < EPSILON) {
            side = uniforms.cameraRight;
        }
        world = world + normalize(side) * input.offset.x * input.size;
        output.billboard = 0.0;
    } else {
        // Endpoint: camera-facing quad
        world = world + (uniforms.cameraRight * input.offset.x +
                         uniforms.cameraUp * input.offset.y) * input.size;
        output.billboard = 1.0;
    }

    output.position = uniforms.viewProj * vec4f(world, 1.0);
    output.color = input.color;
    output.corner = input.offset;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    if (input.billboard > 0.5 && dot(input.corner, input.corner) > 1.0) {
        discard;
    }
    return input.color;
}
)";

} // anonymous namespace

const char* chainShaderSource() {
    return CHAIN_SHADER_SOURCE;
}

GpuChainBuffer::GpuChainBuffer(WGPUDevice device, WGPUQueue queue)
    : m_device(device)
    , m_queue(queue) {}

GpuChainBuffer::~GpuChainBuffer() {
    release();
}

GpuChainBuffer::GpuChainBuffer(GpuChainBuffer&& other) noexcept
    : m_device(other.m_device)
    , m_queue(other.m_queue)
    , m_vertexBuffer(other.m_vertexBuffer)
    , m_indexBuffer(other.m_indexBuffer)
    , m_vertexCount(other.m_vertexCount)
    , m_indexCount(other.m_indexCount)
    , m_allocationCount(other.m_allocationCount)
    , m_bounds(other.m_bounds)
    , m_worldSpace(other.m_worldSpace) {
    other.m_vertexBuffer = nullptr;
    other.m_indexBuffer = nullptr;
    other.m_vertexCount = 0;
    other.m_indexCount = 0;
}

GpuChainBuffer& GpuChainBuffer::operator=(GpuChainBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_device = other.m_device;
        m_queue = other.m_queue;
        m_vertexBuffer = other.m_vertexBuffer;
        m_indexBuffer = other.m_indexBuffer;
        m_vertexCount = other.m_vertexCount;
        m_indexCount = other.m_indexCount;
        m_allocationCount = other.m_allocationCount;
        m_bounds = other.m_bounds;
        m_worldSpace = other.m_worldSpace;
        other.m_vertexBuffer = nullptr;
        other.m_indexBuffer = nullptr;
        other.m_vertexCount = 0;
        other.m_indexCount = 0;
    }
    return *this;
}

void GpuChainBuffer::allocate(uint32_t vertexCount, uint32_t indexCount) {
    release();

    WGPUBufferDescriptor vertexBufferDesc = {};
    vertexBufferDesc.label = toStringView("Strand Chain Vertex Buffer");
    vertexBufferDesc.size = static_cast<uint64_t>(vertexCount) * sizeof(ChainVertex);
    vertexBufferDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    vertexBufferDesc.mappedAtCreation = false;
    m_vertexBuffer = wgpuDeviceCreateBuffer(m_device, &vertexBufferDesc);

    WGPUBufferDescriptor indexBufferDesc = {};
    indexBufferDesc.label = toStringView("Strand Chain Index Buffer");
    indexBufferDesc.size = static_cast<uint64_t>(indexCount) * sizeof(uint32_t);
    indexBufferDesc.usage = WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst;
    indexBufferDesc.mappedAtCreation = false;
    m_indexBuffer = wgpuDeviceCreateBuffer(m_device, &indexBufferDesc);

    if (!m_vertexBuffer || !m_indexBuffer) {
        std::cerr << "[GpuChainBuffer] Failed to create buffers for "
                  << vertexCount << " vertices" << std::endl;
        release();
        return;
    }

    m_vertexCount = vertexCount;
    m_indexCount = indexCount;
    ++m_allocationCount;
}

void GpuChainBuffer::upload(const ChainMeshData& data, MeshRefreshFlag changed) {
    (void)changed;
    m_bounds = data.bounds;
    m_worldSpace = data.worldSpace;

    const uint32_t vertexCount = static_cast<uint32_t>(data.vertices.size());
    const uint32_t indexCount = static_cast<uint32_t>(data.indices.size());

    if (vertexCount == 0 || indexCount == 0) {
        release();
        return;
    }

    const bool resized = !valid() || vertexCount != m_vertexCount || indexCount != m_indexCount;
    if (resized) {
        allocate(vertexCount, indexCount);
        if (!valid()) {
            return;
        }
        wgpuQueueWriteBuffer(m_queue, m_indexBuffer, 0,
                             data.indices.data(), indexCount * sizeof(uint32_t));
    }

    // Attributes are interleaved, so any change rewrites the whole vertex array
    wgpuQueueWriteBuffer(m_queue, m_vertexBuffer, 0,
                         data.vertices.data(), vertexCount * sizeof(ChainVertex));
}

void GpuChainBuffer::release() {
    if (m_vertexBuffer) {
        wgpuBufferDestroy(m_vertexBuffer);
        wgpuBufferRelease(m_vertexBuffer);
        m_vertexBuffer = nullptr;
    }
    if (m_indexBuffer) {
        wgpuBufferDestroy(m_indexBuffer);
        wgpuBufferRelease(m_indexBuffer);
        m_indexBuffer = nullptr;
    }
    m_vertexCount = 0;
    m_indexCount = 0;
}

WGPUVertexBufferLayout GpuChainBuffer::vertexLayout() {
    static WGPUVertexAttribute attributes[kAttributeCount] = {};
    attributes[0].format = WGPUVertexFormat_Float32x3;
    attributes[0].offset = offsetof(ChainVertex, position);
    attributes[0].shaderLocation = 0;
    attributes[1].format = WGPUVertexFormat_Float32x3;
    attributes[1].offset = offsetof(ChainVertex, axis);
    attributes[1].shaderLocation = 1;
    attributes[2].format = WGPUVertexFormat_Float32x2;
    attributes[2].offset = offsetof(ChainVertex, offset);
    attributes[2].shaderLocation = 2;
    attributes[3].format = WGPUVertexFormat_Float32;
    attributes[3].offset = offsetof(ChainVertex, size);
    attributes[3].shaderLocation = 3;
    attributes[4].format = WGPUVertexFormat_Float32x4;
    attributes[4].offset = offsetof(ChainVertex, color);
    attributes[4].shaderLocation = 4;

    WGPUVertexBufferLayout layout = {};
    layout.arrayStride = sizeof(ChainVertex);
    layout.stepMode = WGPUVertexStepMode_Vertex;
    layout.attributeCount = kAttributeCount;
    layout.attributes = attributes;
    return layout;
}

} // namespace strand::webgpu

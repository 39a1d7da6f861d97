// Strand - Mesh Chain Implementation

#include <strand/mesh_chain.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace strand {

namespace {

// Corner offsets shared by billboards and pipes. Corners 0-1 sit at the A
// end of a pipe, corners 2-3 at the B end.
const glm::vec2 kCornerOffsets[MeshChain::kVerticesPerElement] = {
    {-1.0f, -1.0f},
    { 1.0f, -1.0f},
    {-1.0f,  1.0f},
    { 1.0f,  1.0f},
};

// Two triangles per quad, counter-clockwise when viewed with offset.y up
const uint32_t kQuadIndices[MeshChain::kIndicesPerElement] = {0, 1, 2, 2, 1, 3};

} // anonymous namespace

bool chainDebugEnabled() {
    static const bool enabled = []() {
        const char* envVal = std::getenv("STRAND_DEBUG_CHAIN");
        bool on = envVal && (std::string(envVal) == "1" || std::string(envVal) == "true");
        if (on) {
            std::cout << "[MeshChain Debug] Debug mode enabled via STRAND_DEBUG_CHAIN" << std::endl;
        }
        return on;
    }();
    return enabled;
}

void MeshChain::generate(size_t elementCount) {
    if (elementCount == m_elements.size()) {
        return;
    }

    if (chainDebugEnabled()) {
        std::cout << "[MeshChain Debug] Reallocating " << m_elements.size()
                  << " -> " << elementCount << " elements" << std::endl;
    }

    m_elements.assign(elementCount, ChainElement{});
    m_vertices.assign(elementCount * kVerticesPerElement, ChainVertex{});
    m_indices.resize(elementCount * kIndicesPerElement);

    for (size_t e = 0; e < elementCount; ++e) {
        const size_t vertexBase = e * kVerticesPerElement;
        for (uint32_t corner = 0; corner < kVerticesPerElement; ++corner) {
            m_vertices[vertexBase + corner].offset = kCornerOffsets[corner];
        }
        const size_t indexBase = e * kIndicesPerElement;
        for (uint32_t i = 0; i < kIndicesPerElement; ++i) {
            m_indices[indexBase + i] = static_cast<uint32_t>(vertexBase) + kQuadIndices[i];
        }
    }

    m_bounds = Bounds{};
    m_dirty = MeshRefreshFlag::All;
}

void MeshChain::checkIndex(size_t index) const {
    if (index >= m_elements.size()) {
        throw std::out_of_range("MeshChain: element " + std::to_string(index) +
                                " out of range (reserved " +
                                std::to_string(m_elements.size()) + ")");
    }
}

void MeshChain::setElementPosition(size_t index, const glm::vec3& position) {
    checkIndex(index);
    ChainElement& e = m_elements[index];
    e.positionA = position;
    e.positionB = position;
    e.pipe = false;
}

void MeshChain::setElementPipe(size_t index, const glm::vec3& start, const glm::vec3& end) {
    checkIndex(index);
    ChainElement& e = m_elements[index];
    e.positionA = start;
    e.positionB = end;
    e.pipe = true;
}

void MeshChain::setElementSize(size_t index, float size) {
    checkIndex(index);
    m_elements[index].sizeA = size;
    m_elements[index].sizeB = size;
}

void MeshChain::setElementSize(size_t index, float startSize, float endSize) {
    checkIndex(index);
    m_elements[index].sizeA = startSize;
    m_elements[index].sizeB = endSize;
}

void MeshChain::setElementColor(size_t index, const Color& color) {
    checkIndex(index);
    m_elements[index].colorA = color;
    m_elements[index].colorB = color;
}

void MeshChain::setElementColor(size_t index, const Color& startColor, const Color& endColor) {
    checkIndex(index);
    m_elements[index].colorA = startColor;
    m_elements[index].colorB = endColor;
}

const ChainElement& MeshChain::element(size_t index) const {
    checkIndex(index);
    return m_elements[index];
}

void MeshChain::setWorldSpaceData(bool worldSpace) {
    if (worldSpace == m_worldSpace) {
        return;
    }
    m_worldSpace = worldSpace;
    setMeshDataDirty(MeshRefreshFlag::Positions);
}

bool MeshChain::refreshMesh() {
    if (m_dirty == MeshRefreshFlag::None) {
        return false;
    }

    if (hasFlag(m_dirty, MeshRefreshFlag::Positions)) {
        writePositions();
    }
    if (hasFlag(m_dirty, MeshRefreshFlag::Sizes)) {
        writeSizes();
    }
    if (hasFlag(m_dirty, MeshRefreshFlag::Colors)) {
        writeColors();
    }
    if (hasFlag(m_dirty, MeshRefreshFlag::Positions | MeshRefreshFlag::Sizes)) {
        computeBounds();
    }

    MeshRefreshFlag changed = m_dirty;
    m_dirty = MeshRefreshFlag::None;
    ++m_refreshCount;

    if (m_drawBuffer) {
        ChainMeshData data{m_vertices, m_indices, m_bounds, m_worldSpace};
        m_drawBuffer->upload(data, changed);
    }
    return true;
}

void MeshChain::writePositions() {
    for (size_t e = 0; e < m_elements.size(); ++e) {
        const ChainElement& element = m_elements[e];
        ChainVertex* v = &m_vertices[e * kVerticesPerElement];
        glm::vec3 axis = element.pipe ? element.positionB - element.positionA : glm::vec3(0.0f);

        v[0].position = element.positionA;
        v[1].position = element.positionA;
        v[2].position = element.positionB;
        v[3].position = element.positionB;
        for (uint32_t corner = 0; corner < kVerticesPerElement; ++corner) {
            v[corner].axis = axis;
        }
    }
}

void MeshChain::writeSizes() {
    for (size_t e = 0; e < m_elements.size(); ++e) {
        const ChainElement& element = m_elements[e];
        ChainVertex* v = &m_vertices[e * kVerticesPerElement];
        v[0].size = element.sizeA;
        v[1].size = element.sizeA;
        v[2].size = element.sizeB;
        v[3].size = element.sizeB;
    }
}

void MeshChain::writeColors() {
    for (size_t e = 0; e < m_elements.size(); ++e) {
        const ChainElement& element = m_elements[e];
        ChainVertex* v = &m_vertices[e * kVerticesPerElement];
        v[0].color = element.colorA;
        v[1].color = element.colorA;
        v[2].color = element.colorB;
        v[3].color = element.colorB;
    }
}

void MeshChain::computeBounds() {
    m_bounds = Bounds{};
    for (const ChainElement& element : m_elements) {
        float radius = std::max(element.sizeA, element.sizeB);
        if (radius <= 0.0f) {
            continue;
        }
        glm::vec3 lo = glm::min(element.positionA, element.positionB) - glm::vec3(radius);
        glm::vec3 hi = glm::max(element.positionA, element.positionB) + glm::vec3(radius);
        if (!m_bounds.valid) {
            m_bounds.min = lo;
            m_bounds.max = hi;
            m_bounds.valid = true;
        } else {
            m_bounds.min = glm::min(m_bounds.min, lo);
            m_bounds.max = glm::max(m_bounds.max, hi);
        }
    }
}

} // namespace strand

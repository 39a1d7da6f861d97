// Strand - Line Driver Implementation

#include <strand/line_driver.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace strand {

LineDriver::LineDriver() {
    registerParam(loop);
    registerParam(worldSpace);
}

size_t LineDriver::requiredCapacity() const {
    const size_t count = m_positions.size();
    if (count == 0) {
        return 0;
    }
    return 2 * count - 1 + (loop ? 1 : 0);
}

void LineDriver::rebuild(const ChainStyle& style) {
    const size_t count = m_positions.size();
    const bool looping = loop;

    m_chain.setWorldSpaceData(worldSpace);
    m_chain.generate(requiredCapacity());

    if (chainDebugEnabled()) {
        std::cout << "[LineDriver Debug] Rebuild " << count << " points"
                  << (looping ? " (loop)" : "") << std::endl;
    }

    if (count == 0) {
        m_stepSize = 1.0f;
        return;
    }

    const size_t segments = looping ? count : count - 1;
    m_stepSize = 1.0f / static_cast<float>(std::max<size_t>(segments, 1));

    float percent = 0.0f;
    float lastWidth = style.width(percent);
    Color lastColor = style.color(percent);

    m_chain.setElementPosition(0, m_positions[0]);
    m_chain.setElementSize(0, lastWidth);
    m_chain.setElementColor(0, lastColor);

    size_t element = 1;
    for (size_t i = 1; i < count; ++i) {
        percent += m_stepSize;
        float nextWidth = style.width(percent);
        Color nextColor = style.color(percent);

        m_chain.setElementPipe(element, m_positions[i - 1], m_positions[i]);
        m_chain.setElementSize(element, lastWidth, nextWidth);
        m_chain.setElementColor(element, lastColor, nextColor);
        ++element;

        m_chain.setElementPosition(element, m_positions[i]);
        m_chain.setElementSize(element, nextWidth);
        m_chain.setElementColor(element, nextColor);
        ++element;

        lastWidth = nextWidth;
        lastColor = nextColor;
    }

    if (looping) {
        m_chain.setElementPipe(element, m_positions[count - 1], m_positions[0]);
        m_chain.setElementSize(element, lastWidth, style.width(1.0f));
        m_chain.setElementColor(element, lastColor, style.color(1.0f));
    }

    m_chain.setMeshDataDirty(MeshRefreshFlag::All);
}

void LineDriver::updateWidths(const ChainStyle& style) {
    const size_t count = m_positions.size();
    if (count == 0 || needsReinitialize()) {
        return;
    }

    float percent = 0.0f;
    float lastWidth = style.width(percent);
    m_chain.setElementSize(0, lastWidth);

    for (size_t i = 1; i < count; ++i) {
        percent += m_stepSize;
        float nextWidth = style.width(percent);
        m_chain.setElementSize(2 * i - 1, lastWidth, nextWidth);
        m_chain.setElementSize(2 * i, nextWidth);
        lastWidth = nextWidth;
    }

    if (loop) {
        m_chain.setElementSize(2 * count - 1, lastWidth, style.width(1.0f));
    }

    m_chain.setMeshDataDirty(MeshRefreshFlag::Sizes);
}

void LineDriver::updateColors(const ChainStyle& style) {
    const size_t count = m_positions.size();
    if (count == 0 || needsReinitialize()) {
        return;
    }

    float percent = 0.0f;
    Color lastColor = style.color(percent);
    m_chain.setElementColor(0, lastColor);

    for (size_t i = 1; i < count; ++i) {
        percent += m_stepSize;
        Color nextColor = style.color(percent);
        m_chain.setElementColor(2 * i - 1, lastColor, nextColor);
        m_chain.setElementColor(2 * i, nextColor);
        lastColor = nextColor;
    }

    if (loop) {
        m_chain.setElementColor(2 * count - 1, lastColor, style.color(1.0f));
    }

    m_chain.setMeshDataDirty(MeshRefreshFlag::Colors);
}

void LineDriver::writePosition(size_t index) {
    const size_t count = m_positions.size();
    const bool looping = loop;
    const glm::vec3& p = m_positions[index];

    // Incoming pipe
    if (index > 0) {
        m_chain.setElementPipe(2 * index - 1, m_positions[index - 1], p);
    } else if (looping) {
        m_chain.setElementPipe(2 * count - 1, m_positions[count - 1], p);
    }

    m_chain.setElementPosition(2 * index, p);

    // Outgoing pipe
    if (index + 1 < count) {
        m_chain.setElementPipe(2 * index + 1, p, m_positions[index + 1]);
    } else if (looping) {
        m_chain.setElementPipe(2 * index + 1, p, m_positions[0]);
    }
}

void LineDriver::setPosition(size_t index, const glm::vec3& position, const ChainStyle& style) {
    if (index >= m_positions.size()) {
        throw std::out_of_range("LineDriver: position " + std::to_string(index) +
                                " out of range (count " +
                                std::to_string(m_positions.size()) + ")");
    }

    m_positions[index] = position;

    if (needsReinitialize()) {
        rebuild(style);
        return;
    }

    writePosition(index);
    m_chain.setMeshDataDirty(MeshRefreshFlag::Positions);
}

void LineDriver::incrementalUpdate(size_t index, const glm::vec3& position,
                                   const ChainStyle& style) {
    setPosition(index, position, style);
}

void LineDriver::setPositions(std::vector<glm::vec3> positions, const ChainStyle& style,
                              bool knownSizeChange) {
    const bool sizeChanged = positions.size() != m_positions.size();
    if (sizeChanged && !knownSizeChange) {
        std::cerr << "[LineDriver Warning] setPositions changed the point count from "
                  << m_positions.size() << " to " << positions.size()
                  << ", rebuilding. Use setVertexCount first or pass knownSizeChange."
                  << std::endl;
    }

    m_positions = std::move(positions);

    if (sizeChanged || needsReinitialize()) {
        rebuild(style);
        return;
    }

    for (size_t i = 0; i < m_positions.size(); ++i) {
        writePosition(i);
    }
    m_chain.setMeshDataDirty(MeshRefreshFlag::Positions);
}

void LineDriver::setVertexCount(size_t count, const ChainStyle& style) {
    if (count == m_positions.size()) {
        return;
    }
    m_positions.resize(count, glm::vec3(0.0f));
    rebuild(style);
}

void LineDriver::setLoop(bool enabled, const ChainStyle& style) {
    loop = enabled;
    if (needsReinitialize()) {
        rebuild(style);
    }
}

TickResult LineDriver::tick(float deltaTime, const glm::vec3& position,
                            const ChainStyle& style) {
    (void)deltaTime;
    (void)position;

    if (needsReinitialize()) {
        rebuild(style);
    }
    m_chain.setWorldSpaceData(worldSpace);

    TickResult result;
    result.visible = hasGeometry();
    result.needsRefresh = m_chain.dirtyFlags() != MeshRefreshFlag::None;
    return result;
}

void LineDriver::clear(const glm::vec3& position) {
    (void)position;
    m_positions.clear();
    m_stepSize = 1.0f;
    m_chain.generate(0);
}

glm::vec3 LineDriver::position(size_t index) const {
    if (index >= m_positions.size()) {
        throw std::out_of_range("LineDriver: position " + std::to_string(index) +
                                " out of range (count " +
                                std::to_string(m_positions.size()) + ")");
    }
    return m_positions[index];
}

} // namespace strand

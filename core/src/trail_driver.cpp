// Strand - Trail Driver Implementation

#include <strand/trail_driver.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace strand {

TrailDriver::TrailDriver() {
    registerParam(maxTrailPoints);
    registerParam(stealLastPointWhenEmpty);
    registerParam(time);
    registerParam(minVertexDistance);
    registerParam(autodestruct);
    registerParam(smoothInterpolation);

    m_chain.setWorldSpaceData(true);
}

size_t TrailDriver::capacity() const {
    return static_cast<size_t>(std::max(maxTrailPoints.get(), kMinTrailPoints));
}

float TrailDriver::lifetime() const {
    return std::max(time.get(), 0.0f);
}

float TrailDriver::effectiveMinVertexDistance() const {
    return std::max(minVertexDistance.get(), kAbsoluteMinVertexDistance);
}

bool TrailDriver::needsReinitialize() const {
    return m_points.size() != capacity() || m_chain.reservedElements() != requiredCapacity();
}

void TrailDriver::reinitialize() {
    const size_t cap = capacity();
    if (m_points.size() != cap || m_chain.reservedElements() != 2 * cap) {
        if (chainDebugEnabled()) {
            std::cout << "[TrailDriver Debug] Capacity " << m_points.size()
                      << " -> " << cap << " points" << std::endl;
        }
        m_points.assign(cap, glm::vec3(0.0f));
        m_pointTimes.assign(cap, 0.0f);
        m_chain.setWorldSpaceData(true);
        m_chain.generate(2 * cap);
    }
    clear(m_anchor);
}

void TrailDriver::rebuild(const ChainStyle& style) {
    (void)style;
    reinitialize();
}

void TrailDriver::start(const glm::vec3& position, const ChainStyle& style) {
    (void)style;
    m_anchor = position;
    reinitialize();
}

void TrailDriver::clear(const glm::vec3& position) {
    const size_t elements = m_chain.reservedElements();
    for (size_t e = 0; e < elements; ++e) {
        if (e % 2 == 0) {
            m_chain.setElementPosition(e, glm::vec3(0.0f));
        } else {
            m_chain.setElementPipe(e, glm::vec3(0.0f), glm::vec3(0.0f));
        }
        m_chain.setElementSize(e, 0.0f);
        m_chain.setElementColor(e, Color::Clear);
    }
    std::fill(m_points.begin(), m_points.end(), glm::vec3(0.0f));
    std::fill(m_pointTimes.begin(), m_pointTimes.end(), 0.0f);

    m_start = 0;
    m_end = 0;
    m_lastRecordedPoint = position;
    m_anchor = position;
    m_lastPointTime = lifetime();
    m_stepSize = 1.0f;

    m_chain.setMeshDataDirty(MeshRefreshFlag::All);
}

size_t TrailDriver::positionCount() const {
    if (m_points.empty()) {
        return 0;
    }
    return (m_end + m_points.size() - m_start) % m_points.size();
}

size_t TrailDriver::liveSlot(size_t index) const {
    const size_t live = hasGeometry() ? positionCount() + 1 : 0;
    if (index >= live) {
        throw std::out_of_range("TrailDriver: point " + std::to_string(index) +
                                " out of range (live " + std::to_string(live) + ")");
    }
    return (m_start + index) % m_points.size();
}

glm::vec3 TrailDriver::position(size_t index) const {
    return m_points[liveSlot(index)];
}

void TrailDriver::hideSlot(size_t slot) {
    m_chain.setElementSize(2 * slot, 0.0f);
    m_chain.setElementSize(2 * slot + 1, 0.0f);
    m_chain.setMeshDataDirty(MeshRefreshFlag::Sizes);
}

TickResult TrailDriver::tick(float deltaTime, const glm::vec3& position,
                             const ChainStyle& style) {
    if (needsReinitialize()) {
        reinitialize();
    }
    m_anchor = position;

    TickResult result;
    const float life = lifetime();
    const float minDistance = effectiveMinVertexDistance();

    // Record a new point once the tracked position has moved far enough
    glm::vec3 delta = position - m_lastRecordedPoint;
    if (glm::dot(delta, delta) > minDistance * minDistance) {
        if (m_start == m_end) {
            // Commit the anchor as the oldest point
            m_points[m_start] = m_lastRecordedPoint;
            m_pointTimes[m_start] = life;
            m_lastPointTime = life;
        }

        const size_t newEnd = nextSlot(m_end);
        if (newEnd != m_start) {
            m_end = newEnd;
            m_pointTimes[m_end] = 0.0f;
        } else if (stealLastPointWhenEmpty) {
            hideSlot(m_start);
            m_start = nextSlot(m_start);
            m_end = newEnd;
            m_pointTimes[m_end] = 0.0f;
            m_lastPointTime = m_pointTimes[m_start];
        }
        // Full without stealing: the newest slot stays pinned and follows the position

        m_points[m_end] = position;
        m_lastRecordedPoint = position;
    }

    // Age the newest point up and the oldest point down
    m_pointTimes[m_end] = std::min(m_pointTimes[m_end] + deltaTime, life);

    if (m_start != m_end) {
        m_pointTimes[m_start] -= deltaTime;
        if (m_pointTimes[m_start] <= 0.0f) {
            hideSlot(m_start);
            m_start = nextSlot(m_start);
            m_lastPointTime = m_pointTimes[m_start];
            result.expired = true;
            if (m_start == m_end) {
                hideSlot(m_end);
            }
        }
    }

    if (m_start != m_end) {
        updateBoundaryElements();
        sampleWidths(style);
        sampleColors(style);
        m_chain.setMeshDataDirty(MeshRefreshFlag::All);
        result.visible = true;
    } else if (result.expired && autodestruct) {
        result.destroyRequested = true;
    }

    result.needsRefresh = m_chain.dirtyFlags() != MeshRefreshFlag::None;
    return result;
}

void TrailDriver::updateBoundaryElements() {
    const size_t prev = prevSlot(m_end);
    m_chain.setElementPipe(2 * prev + 1, m_points[prev], m_points[m_end]);
    m_chain.setElementPosition(2 * m_end, m_points[m_end]);

    // Oldest point last, so a smoothed tail wins when prev == start
    const size_t next = nextSlot(m_start);
    glm::vec3 tail = m_points[m_start];
    if (smoothInterpolation && m_lastPointTime > 0.0f) {
        float toNext = 1.0f - m_pointTimes[m_start] / m_lastPointTime;
        toNext = std::clamp(toNext, 0.0f, 1.0f);
        tail = glm::mix(m_points[m_start], m_points[next], toNext);
    }
    m_chain.setElementPosition(2 * m_start, tail);
    m_chain.setElementPipe(2 * m_start + 1, tail, m_points[next]);
}

void TrailDriver::sampleWidths(const ChainStyle& style) {
    const size_t count = positionCount();
    m_stepSize = count > 0 ? 1.0f / static_cast<float>(count) : 1.0f;

    float percent = 0.0f;
    float lastWidth = style.width(percent);
    for (size_t slot = m_start; slot != m_end; slot = nextSlot(slot)) {
        percent += m_stepSize;
        float nextWidth = style.width(percent);
        m_chain.setElementSize(2 * slot, lastWidth);
        m_chain.setElementSize(2 * slot + 1, lastWidth, nextWidth);
        lastWidth = nextWidth;
    }
    m_chain.setElementSize(2 * m_end, style.width(1.0f));
}

void TrailDriver::sampleColors(const ChainStyle& style) {
    const size_t count = positionCount();
    const float step = count > 0 ? 1.0f / static_cast<float>(count) : 1.0f;

    float percent = 0.0f;
    Color lastColor = style.color(percent);
    for (size_t slot = m_start; slot != m_end; slot = nextSlot(slot)) {
        percent += step;
        Color nextColor = style.color(percent);
        m_chain.setElementColor(2 * slot, lastColor);
        m_chain.setElementColor(2 * slot + 1, lastColor, nextColor);
        lastColor = nextColor;
    }
    m_chain.setElementColor(2 * m_end, style.color(1.0f));
}

void TrailDriver::updateWidths(const ChainStyle& style) {
    if (!hasGeometry()) {
        return;
    }
    sampleWidths(style);
    m_chain.setMeshDataDirty(MeshRefreshFlag::Sizes);
}

void TrailDriver::updateColors(const ChainStyle& style) {
    if (!hasGeometry()) {
        return;
    }
    sampleColors(style);
    m_chain.setMeshDataDirty(MeshRefreshFlag::Colors);
}

void TrailDriver::incrementalUpdate(size_t index, const glm::vec3& position,
                                    const ChainStyle& style) {
    (void)style;
    const size_t slot = liveSlot(index);
    m_points[slot] = position;

    m_chain.setElementPosition(2 * slot, position);
    if (slot != m_end) {
        m_chain.setElementPipe(2 * slot + 1, position, m_points[nextSlot(slot)]);
    }
    if (slot != m_start) {
        const size_t prev = prevSlot(slot);
        m_chain.setElementPipe(2 * prev + 1, m_points[prev], position);
    }
    m_chain.setMeshDataDirty(MeshRefreshFlag::Positions);
}

} // namespace strand

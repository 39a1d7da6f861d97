// Strand - Chain Renderer Implementation

#include <strand/chain_renderer.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace strand {

namespace {

std::unique_ptr<ChainDriver> makeDriver(DriverKind kind) {
    switch (kind) {
        case DriverKind::Line:  return std::make_unique<LineDriver>();
        case DriverKind::Trail: return std::make_unique<TrailDriver>();
    }
    throw std::invalid_argument("ChainRenderer: unknown driver kind");
}

} // anonymous namespace

ChainRenderer::ChainRenderer(DriverKind kind)
    : m_kind(kind)
    , m_driver(makeDriver(kind)) {
    m_registry.registerParam(widthMultiplier);
    m_style.widthMultiplier = widthMultiplier;
}

void ChainRenderer::setWorldPosition(const glm::vec3& position) {
    m_worldTransform[3] = glm::vec4(position, 1.0f);
}

void ChainRenderer::ensureStarted() {
    if (m_started) {
        return;
    }
    m_driver->start(worldPosition(), m_style);
    m_started = true;
}

void ChainRenderer::applyParams() {
    // Negative widths are not drawable
    const float multiplier = std::max(widthMultiplier.get(), 0.0f);
    if (multiplier != m_style.widthMultiplier) {
        m_style.widthMultiplier = multiplier;
        m_driver->updateWidths(m_style);
    }

    if (m_driver->needsReinitialize()) {
        if (chainDebugEnabled()) {
            std::cout << "[ChainRenderer Debug] '" << m_name << "' reinitializing "
                      << m_driver->chain().reservedElements() << " -> "
                      << m_driver->requiredCapacity() << " elements" << std::endl;
        }
        m_driver->rebuild(m_style);
    }
}

void ChainRenderer::onFrameUpdate(float deltaTime, const glm::vec3& worldPosition) {
    setWorldPosition(worldPosition);
    onFrameUpdate(deltaTime);
}

void ChainRenderer::onFrameUpdate(float deltaTime) {
    if (!m_enabled || m_destroyRequested) {
        return;
    }

    ensureStarted();
    applyParams();

    TickResult result = m_driver->tick(deltaTime, worldPosition(), m_style);
    if (result.needsRefresh) {
        m_driver->chain().refreshMesh();
    }

    if (result.destroyRequested) {
        m_destroyRequested = true;
        if (chainDebugEnabled()) {
            std::cout << "[ChainRenderer Debug] '" << m_name
                      << "' trail emptied, autodestruct requested" << std::endl;
        }
    }
    ++m_frameCount;
}

void ChainRenderer::reinitialize() {
    m_driver->rebuild(m_style);
}

void ChainRenderer::clear() {
    m_driver->clear(worldPosition());
}

// -----------------------------------------------------------------------------
// Style

void ChainRenderer::setWidthMultiplier(float multiplier) {
    widthMultiplier = std::max(multiplier, 0.0f);
    m_style.widthMultiplier = widthMultiplier;
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setWidthCurve(const WidthCurve& curve) {
    m_style.widthCurve = curve;
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setColorGradient(const ColorGradient& gradient) {
    m_style.colorGradient = gradient;
    m_driver->updateColors(m_style);
}

void ChainRenderer::setWidthFunction(WidthFunction fn) {
    m_style.customWidth = std::move(fn);
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setColorFunction(ColorFunction fn) {
    m_style.customColor = std::move(fn);
    m_driver->updateColors(m_style);
}

void ChainRenderer::setTotalWidth(float width) {
    widthMultiplier = std::max(width, 0.0f);
    m_style.widthMultiplier = widthMultiplier;
    m_style.widthCurve = WidthCurve::constant(1.0f);
    m_style.customWidth = nullptr;
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setTotalColor(const Color& color) {
    m_style.colorGradient = ColorGradient::constant(color);
    m_style.customColor = nullptr;
    m_driver->updateColors(m_style);
}

void ChainRenderer::setWidthStart(float width) {
    const float multiplier = m_style.widthMultiplier;
    if (multiplier == 0.0f || std::isnan(width)) {
        return;
    }
    m_style.widthCurve.setFirstValue(width / multiplier);
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setWidthEnd(float width) {
    const float multiplier = m_style.widthMultiplier;
    if (multiplier == 0.0f || std::isnan(width)) {
        return;
    }
    m_style.widthCurve.setLastValue(width / multiplier);
    m_driver->updateWidths(m_style);
}

void ChainRenderer::setColorStart(const Color& color) {
    m_style.colorGradient.setStartColor(color);
    m_driver->updateColors(m_style);
}

void ChainRenderer::setColorEnd(const Color& color) {
    m_style.colorGradient.setEndColor(color);
    m_driver->updateColors(m_style);
}

// -----------------------------------------------------------------------------
// Line points

void ChainRenderer::setPositions(std::vector<glm::vec3> positions, bool knownSizeChange) {
    line().setPositions(std::move(positions), m_style, knownSizeChange);
}

void ChainRenderer::setPosition(size_t index, const glm::vec3& position) {
    line().setPosition(index, position, m_style);
}

void ChainRenderer::setVertexCount(size_t count) {
    line().setVertexCount(count, m_style);
}

void ChainRenderer::setLoop(bool enabled) {
    line().setLoop(enabled, m_style);
}

// -----------------------------------------------------------------------------
// Driver access

LineDriver& ChainRenderer::line() {
    if (m_kind != DriverKind::Line) {
        throw std::runtime_error("ChainRenderer '" + m_name + "' is a " +
                                 driverKindName(m_kind) + " renderer, not a line");
    }
    return static_cast<LineDriver&>(*m_driver);
}

const LineDriver& ChainRenderer::line() const {
    if (m_kind != DriverKind::Line) {
        throw std::runtime_error("ChainRenderer '" + m_name + "' is a " +
                                 driverKindName(m_kind) + " renderer, not a line");
    }
    return static_cast<const LineDriver&>(*m_driver);
}

TrailDriver& ChainRenderer::trail() {
    if (m_kind != DriverKind::Trail) {
        throw std::runtime_error("ChainRenderer '" + m_name + "' is a " +
                                 driverKindName(m_kind) + " renderer, not a trail");
    }
    return static_cast<TrailDriver&>(*m_driver);
}

const TrailDriver& ChainRenderer::trail() const {
    if (m_kind != DriverKind::Trail) {
        throw std::runtime_error("ChainRenderer '" + m_name + "' is a " +
                                 driverKindName(m_kind) + " renderer, not a trail");
    }
    return static_cast<const TrailDriver&>(*m_driver);
}

// -----------------------------------------------------------------------------
// Parameters

std::vector<ParamDecl> ChainRenderer::params() const {
    std::vector<ParamDecl> decls = m_registry.registeredParams();
    for (const ParamDecl& decl : m_driver->registeredParams()) {
        decls.push_back(decl);
    }
    return decls;
}

bool ChainRenderer::getParam(const std::string& name, float out[4]) const {
    return m_registry.getRegisteredParam(name, out) ||
           m_driver->getRegisteredParam(name, out);
}

bool ChainRenderer::setParam(const std::string& name, const float value[4]) {
    if (!m_registry.setRegisteredParam(name, value) &&
        !m_driver->setRegisteredParam(name, value)) {
        return false;
    }
    applyParams();
    return true;
}

} // namespace strand

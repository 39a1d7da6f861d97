#pragma once

/**
 * @file chain_renderer.h
 * @brief Line or trail renderer: driver, style and per-frame refresh
 *
 * A ChainRenderer owns one ChainDriver selected by DriverKind and the
 * ChainStyle both drivers sample. The host calls onFrameUpdate() once per
 * frame (directly or through a FrameScheduler) after it has moved the
 * renderer's transform; that call ticks the driver and commits the chain.
 *
 * @par Example
 * @code
 * ChainRenderer trail(DriverKind::Trail);
 * trail.trail().time = 2.0f;
 * trail.setColorGradient(ColorGradient::twoColor(Color::Clear, Color::Coral));
 * trail.setTotalWidth(0.1f);
 *
 * // each frame
 * trail.onFrameUpdate(dt, playerPosition);
 * @endcode
 */

#include <strand/chain_driver.h>
#include <strand/line_driver.h>
#include <strand/trail_driver.h>
#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <vector>

namespace strand {

class ChainRenderer {
public:
    /// @brief Width scale applied on top of the width curve
    Param<float> widthMultiplier{"widthMultiplier", 1.0f, 0.0f, 10.0f};

    explicit ChainRenderer(DriverKind kind);
    ~ChainRenderer() = default;

    ChainRenderer(const ChainRenderer&) = delete;
    ChainRenderer& operator=(const ChainRenderer&) = delete;

    DriverKind kind() const { return m_kind; }

    void setName(const std::string& name) { m_name = name; }
    const std::string& name() const { return m_name; }

    // -------------------------------------------------------------------------
    /// @name Frame
    /// @{

    /**
     * @brief Advance one frame
     * @param deltaTime Seconds since the previous frame
     *
     * Applies parameter changes (reinitializing on a capacity change),
     * ticks the driver and refreshes the chain if anything is pending.
     * Does nothing while disabled or after autodestruct fired.
     */
    void onFrameUpdate(float deltaTime);

    /// @brief Move to worldPosition, then advance one frame
    void onFrameUpdate(float deltaTime, const glm::vec3& worldPosition);

    void setWorldTransform(const glm::mat4& transform) { m_worldTransform = transform; }
    const glm::mat4& worldTransform() const { return m_worldTransform; }
    glm::vec3 worldPosition() const { return glm::vec3(m_worldTransform[3]); }
    void setWorldPosition(const glm::vec3& position);

    /// @brief Discard the chain and regenerate it from the current state
    void reinitialize();

    /// @brief Drop all points (line: empty list, trail: re-anchor at the current position)
    void clear();

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool enabled() const { return m_enabled; }

    /// @brief Enabled and the driver has geometry to draw
    bool visible() const { return m_enabled && m_driver->hasGeometry(); }

    /// @brief Autodestruct fired; the owner should discard this renderer
    bool destroyRequested() const { return m_destroyRequested; }

    uint64_t frameCount() const { return m_frameCount; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Style
    /// Every setter re-samples the affected attribute along the chain.
    /// @{

    const ChainStyle& style() const { return m_style; }

    /// @brief Scale applied to the width curve (negative values clamp to 0)
    void setWidthMultiplier(float multiplier);
    void setWidthCurve(const WidthCurve& curve);
    const WidthCurve& widthCurve() const { return m_style.widthCurve; }
    void setColorGradient(const ColorGradient& gradient);
    const ColorGradient& colorGradient() const { return m_style.colorGradient; }

    /// @brief Replace the width curve with a function of t (empty clears)
    void setWidthFunction(WidthFunction fn);
    /// @brief Replace the color gradient with a function of t (empty clears)
    void setColorFunction(ColorFunction fn);

    /// @brief Uniform width: multiplier = width, curve = constant 1
    void setTotalWidth(float width);
    /// @brief Uniform color: gradient = constant color
    void setTotalColor(const Color& color);

    float widthStart() const { return m_style.width(0.0f); }
    float widthEnd() const { return m_style.width(1.0f); }
    /// @brief Set the width at t = 0 (ignored while the multiplier is 0)
    void setWidthStart(float width);
    /// @brief Set the width at t = 1 (ignored while the multiplier is 0)
    void setWidthEnd(float width);

    Color colorStart() const { return m_style.color(0.0f); }
    Color colorEnd() const { return m_style.color(1.0f); }
    void setColorStart(const Color& color);
    void setColorEnd(const Color& color);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Line points
    /// Forward to the line driver with this renderer's style.
    /// @throw std::runtime_error if this is not a line renderer
    /// @{

    void setPositions(std::vector<glm::vec3> positions, bool knownSizeChange = false);
    void setPosition(size_t index, const glm::vec3& position);
    void setVertexCount(size_t count);
    void setLoop(bool enabled);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Driver access
    /// @{

    ChainDriver& driver() { return *m_driver; }
    const ChainDriver& driver() const { return *m_driver; }

    /// @throw std::runtime_error if kind() != DriverKind::Line
    LineDriver& line();
    const LineDriver& line() const;

    /// @throw std::runtime_error if kind() != DriverKind::Trail
    TrailDriver& trail();
    const TrailDriver& trail() const;

    MeshChain& chain() { return m_driver->chain(); }
    const MeshChain& chain() const { return m_driver->chain(); }

    /// @brief Attach the backend sink for this renderer's chain (not owned)
    void setDrawBuffer(DrawBuffer* buffer) { m_driver->chain().setDrawBuffer(buffer); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Parameters
    /// Renderer parameters first, then the driver's.
    /// @{

    std::vector<ParamDecl> params() const;
    bool getParam(const std::string& name, float out[4]) const;

    /// @brief Set a parameter by name and apply it immediately
    bool setParam(const std::string& name, const float value[4]);

    /// @}

private:
    void applyParams();
    void ensureStarted();

    DriverKind m_kind;
    std::unique_ptr<ChainDriver> m_driver;
    ParamRegistry m_registry;
    ChainStyle m_style;
    glm::mat4 m_worldTransform{1.0f};
    std::string m_name;
    uint64_t m_frameCount = 0;
    bool m_enabled = true;
    bool m_started = false;
    bool m_destroyRequested = false;
};

} // namespace strand

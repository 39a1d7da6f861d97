#pragma once

/**
 * @file frame_scheduler.h
 * @brief Host-owned per-frame ordering of callbacks and renderers
 *
 * Each update() runs every Update stage callback, then every Late stage
 * callback, then every registered renderer in insertion order. Renderers
 * therefore see the transforms the host moved earlier in the same frame.
 *
 * Renderers are not owned. A renderer that requests autodestruct is
 * unregistered at the end of the frame and reported to the onDestroyed
 * callback, which is where the host releases it.
 *
 * @par Example
 * @code
 * FrameScheduler scheduler;
 * scheduler.addCallback(UpdateStage::Update, [&](float dt) { ship.move(dt); });
 * scheduler.addRenderer(trail);
 * scheduler.onDestroyed([&](ChainRenderer& r) { renderers.erase(&r); });
 * scheduler.update(dt);
 * @endcode
 */

#include <strand/chain_renderer.h>
#include <functional>
#include <vector>
#include <cstdint>

namespace strand {

enum class UpdateStage {
    Update,  ///< Host simulation (moves transforms)
    Late     ///< Runs after every Update callback
};

class FrameScheduler {
public:
    using Callback = std::function<void(float deltaTime)>;
    using DestroyCallback = std::function<void(ChainRenderer& renderer)>;

    FrameScheduler() = default;
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    /// @brief Register a host callback for a stage
    void addCallback(UpdateStage stage, Callback callback);

    /// @brief Register a renderer (ignored if already registered)
    void addRenderer(ChainRenderer& renderer);

    /// @brief Unregister a renderer
    /// @return False if it was not registered
    bool removeRenderer(ChainRenderer& renderer);

    bool hasRenderer(const ChainRenderer& renderer) const;

    /// @brief Called once for every renderer removed by autodestruct
    void onDestroyed(DestroyCallback callback) { m_onDestroyed = std::move(callback); }

    /// @brief Run one frame
    void update(float deltaTime);

    size_t rendererCount() const { return m_renderers.size(); }
    uint64_t frameCount() const { return m_frameCount; }

private:
    std::vector<Callback> m_updateCallbacks;
    std::vector<Callback> m_lateCallbacks;
    std::vector<ChainRenderer*> m_renderers;
    DestroyCallback m_onDestroyed;
    uint64_t m_frameCount = 0;
};

} // namespace strand

// Strand - Frame Scheduler Implementation

#include <strand/frame_scheduler.h>
#include <algorithm>
#include <iostream>

namespace strand {

void FrameScheduler::addCallback(UpdateStage stage, Callback callback) {
    if (!callback) {
        return;
    }
    if (stage == UpdateStage::Update) {
        m_updateCallbacks.push_back(std::move(callback));
    } else {
        m_lateCallbacks.push_back(std::move(callback));
    }
}

void FrameScheduler::addRenderer(ChainRenderer& renderer) {
    if (hasRenderer(renderer)) {
        return;
    }
    m_renderers.push_back(&renderer);
}

bool FrameScheduler::removeRenderer(ChainRenderer& renderer) {
    auto it = std::find(m_renderers.begin(), m_renderers.end(), &renderer);
    if (it == m_renderers.end()) {
        return false;
    }
    m_renderers.erase(it);
    return true;
}

bool FrameScheduler::hasRenderer(const ChainRenderer& renderer) const {
    return std::find(m_renderers.begin(), m_renderers.end(), &renderer) != m_renderers.end();
}

void FrameScheduler::update(float deltaTime) {
    for (auto& callback : m_updateCallbacks) {
        callback(deltaTime);
    }
    for (auto& callback : m_lateCallbacks) {
        callback(deltaTime);
    }

    std::vector<ChainRenderer*> destroyed;
    for (ChainRenderer* renderer : m_renderers) {
        renderer->onFrameUpdate(deltaTime);
        if (renderer->destroyRequested()) {
            destroyed.push_back(renderer);
        }
    }

    for (ChainRenderer* renderer : destroyed) {
        removeRenderer(*renderer);
        if (chainDebugEnabled()) {
            std::cout << "[FrameScheduler Debug] Removed '" << renderer->name()
                      << "' after autodestruct" << std::endl;
        }
        if (m_onDestroyed) {
            m_onDestroyed(*renderer);
        }
    }

    ++m_frameCount;
}

} // namespace strand

/**
 * @file test_frame_scheduler.cpp
 * @brief Unit tests for FrameScheduler ordering and autodestruct removal
 */

#include <catch2/catch_test_macros.hpp>

#include <strand/frame_scheduler.h>
#include <string>
#include <vector>

using namespace strand;

TEST_CASE("FrameScheduler ordering", "[scheduler]") {
    FrameScheduler scheduler;
    std::vector<std::string> order;

    scheduler.addCallback(UpdateStage::Late, [&](float) { order.push_back("late"); });
    scheduler.addCallback(UpdateStage::Update, [&](float) { order.push_back("update1"); });
    scheduler.addCallback(UpdateStage::Update, [&](float) { order.push_back("update2"); });

    scheduler.update(0.016f);
    REQUIRE(order == std::vector<std::string>{"update1", "update2", "late"});
    REQUIRE(scheduler.frameCount() == 1);
}

TEST_CASE("FrameScheduler drives renderers after host updates", "[scheduler]") {
    FrameScheduler scheduler;
    ChainRenderer trail(DriverKind::Trail);
    trail.trail().minVertexDistance = 0.5f;

    float x = 0.0f;
    scheduler.addCallback(UpdateStage::Update, [&](float) {
        x += 1.0f;
        trail.setWorldPosition(glm::vec3(x, 0.0f, 0.0f));
    });
    scheduler.addRenderer(trail);
    scheduler.addRenderer(trail);
    REQUIRE(scheduler.rendererCount() == 1);

    scheduler.update(0.125f);
    REQUIRE(trail.trail().lastRecordedPoint() == glm::vec3(1.0f, 0.0f, 0.0f));

    scheduler.update(0.125f);
    REQUIRE(trail.visible());
    REQUIRE(trail.trail().position(1) == glm::vec3(2.0f, 0.0f, 0.0f));
    REQUIRE(trail.frameCount() == 2);

    REQUIRE(scheduler.removeRenderer(trail));
    REQUIRE_FALSE(scheduler.removeRenderer(trail));
    scheduler.update(0.125f);
    REQUIRE(trail.frameCount() == 2);
}

TEST_CASE("FrameScheduler removes autodestructed renderers", "[scheduler]") {
    FrameScheduler scheduler;
    ChainRenderer keep(DriverKind::Line);
    ChainRenderer comet(DriverKind::Trail);
    comet.setName("comet");
    comet.trail().time = 0.25f;
    comet.trail().minVertexDistance = 0.5f;
    comet.trail().autodestruct = true;

    scheduler.addRenderer(keep);
    scheduler.addRenderer(comet);

    std::vector<std::string> destroyed;
    scheduler.onDestroyed([&](ChainRenderer& renderer) {
        destroyed.push_back(renderer.name());
    });

    comet.setWorldPosition(glm::vec3(0.0f));
    scheduler.update(0.125f);
    comet.setWorldPosition(glm::vec3(1.0f, 0.0f, 0.0f));
    scheduler.update(0.125f);
    REQUIRE(scheduler.rendererCount() == 2);

    for (int i = 0; i < 10; ++i) {
        scheduler.update(0.125f);
    }

    REQUIRE(destroyed == std::vector<std::string>{"comet"});
    REQUIRE(scheduler.rendererCount() == 1);
    REQUIRE(scheduler.hasRenderer(keep));
    REQUIRE_FALSE(scheduler.hasRenderer(comet));
}

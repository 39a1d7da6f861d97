/**
 * @file test_trail_driver.cpp
 * @brief Unit tests for TrailDriver recording, aging and expiry
 *
 * Tick sizes are powers of two so lifetimes count down exactly.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <strand/trail_driver.h>
#include <stdexcept>

using namespace strand;
using Catch::Matchers::WithinAbs;

namespace {

glm::vec3 x(float value) {
    return glm::vec3(value, 0.0f, 0.0f);
}

void requireOccupancyInvariant(const TrailDriver& trail) {
    const size_t cap = trail.capacity();
    const size_t expected = (trail.endIndex() + cap - trail.startIndex()) % cap;
    REQUIRE(trail.positionCount() == expected);
    REQUIRE(trail.positionCount() <= cap - 1);
}

} // anonymous namespace

TEST_CASE("TrailDriver parameters", "[trail_driver]") {
    TrailDriver trail;

    SECTION("defaults") {
        REQUIRE(static_cast<int>(trail.maxTrailPoints) == 20);
        REQUIRE(static_cast<bool>(trail.stealLastPointWhenEmpty));
        REQUIRE(static_cast<float>(trail.time) == 5.0f);
        REQUIRE(static_cast<float>(trail.minVertexDistance) == 0.1f);
        REQUIRE_FALSE(static_cast<bool>(trail.autodestruct));
        REQUIRE_FALSE(static_cast<bool>(trail.smoothInterpolation));
    }

    SECTION("invalid values are clamped") {
        trail.maxTrailPoints = 1;
        trail.time = -2.0f;
        trail.minVertexDistance = 0.0f;
        REQUIRE(trail.capacity() == 3);
        REQUIRE(trail.lifetime() == 0.0f);
        REQUIRE(trail.effectiveMinVertexDistance() == TrailDriver::kAbsoluteMinVertexDistance);
    }

    SECTION("registered for name access") {
        float value[4] = {12.0f, 0, 0, 0};
        REQUIRE(trail.setRegisteredParam("maxTrailPoints", value));
        REQUIRE(static_cast<int>(trail.maxTrailPoints) == 12);

        float out[4] = {0};
        REQUIRE(trail.getRegisteredParam("stealLastPointWhenEmpty", out));
        REQUIRE(out[0] == 1.0f);
        REQUIRE(trail.registeredParams().size() == 6);
        REQUIRE_FALSE(trail.getRegisteredParam("loop", out));
    }
}

TEST_CASE("TrailDriver initialization", "[trail_driver]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 4;

    SECTION("start allocates two elements per point") {
        REQUIRE(trail.needsReinitialize());
        trail.start(x(3.0f), style);
        REQUIRE_FALSE(trail.needsReinitialize());
        REQUIRE(trail.chain().reservedElements() == 8);
        REQUIRE(trail.chain().worldSpaceData());
        REQUIRE(trail.positionCount() == 0);
        REQUIRE_FALSE(trail.hasGeometry());
        REQUIRE(trail.lastRecordedPoint() == x(3.0f));
    }

    SECTION("capacity change reallocates, same capacity only clears") {
        trail.start(glm::vec3(0.0f), style);
        trail.tick(0.25f, x(1.0f), style);
        REQUIRE(trail.positionCount() == 1);

        trail.reinitialize();
        REQUIRE(trail.positionCount() == 0);
        REQUIRE(trail.chain().reservedElements() == 8);

        trail.maxTrailPoints = 6;
        REQUIRE(trail.needsReinitialize());
        trail.reinitialize();
        REQUIRE(trail.chain().reservedElements() == 12);
    }

    SECTION("clear hides every element") {
        trail.start(glm::vec3(0.0f), style);
        trail.tick(0.25f, x(1.0f), style);
        trail.tick(0.25f, x(2.0f), style);
        trail.chain().refreshMesh();

        trail.clear(x(2.0f));
        REQUIRE(trail.positionCount() == 0);
        REQUIRE(trail.startIndex() == 0);
        REQUIRE(trail.endIndex() == 0);
        REQUIRE(trail.chain().dirtyFlags() == MeshRefreshFlag::All);
        for (size_t e = 0; e < trail.chain().reservedElements(); ++e) {
            REQUIRE(trail.chain().element(e).sizeA == 0.0f);
            REQUIRE(trail.chain().element(e).colorA.a == 0.0f);
        }
    }

    SECTION("empty trail ticks are no-ops") {
        trail.start(glm::vec3(0.0f), style);
        trail.chain().refreshMesh();
        TickResult result = trail.tick(0.25f, glm::vec3(0.0f), style);
        REQUIRE_FALSE(result.visible);
        REQUIRE_FALSE(result.needsRefresh);
        REQUIRE_FALSE(result.expired);
        REQUIRE_FALSE(trail.chain().refreshMesh());
    }
}

TEST_CASE("TrailDriver recording", "[trail_driver]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 8;
    trail.minVertexDistance = 1.0f;
    trail.time = 10.0f;
    trail.start(glm::vec3(0.0f), style);

    SECTION("movement below the threshold records nothing") {
        TickResult result = trail.tick(0.25f, x(0.5f), style);
        REQUIRE_FALSE(result.visible);
        REQUIRE(trail.positionCount() == 0);
    }

    SECTION("first point commits the anchor and the current position") {
        TickResult result = trail.tick(0.25f, x(2.0f), style);
        REQUIRE(result.visible);
        REQUIRE(result.needsRefresh);
        REQUIRE(trail.positionCount() == 1);
        REQUIRE(trail.position(0) == glm::vec3(0.0f));
        REQUIRE(trail.position(1) == x(2.0f));

        const MeshChain& chain = trail.chain();
        REQUIRE(chain.element(0).positionA == glm::vec3(0.0f));
        REQUIRE(chain.element(1).pipe);
        REQUIRE(chain.element(1).positionB == x(2.0f));
        REQUIRE(chain.element(2).positionA == x(2.0f));
    }

    SECTION("oldest point counts down from the lifetime, newest counts up") {
        trail.tick(0.25f, x(2.0f), style);
        REQUIRE(trail.pointTime(trail.startIndex()) == 9.75f);
        REQUIRE(trail.pointTime(trail.endIndex()) == 0.25f);

        trail.tick(0.5f, x(2.0f), style);
        REQUIRE(trail.pointTime(trail.startIndex()) == 9.25f);
        REQUIRE(trail.pointTime(trail.endIndex()) == 0.75f);
    }

    SECTION("newest point age is capped at the lifetime") {
        trail.time = 1.0f;
        trail.tick(0.25f, x(2.0f), style);
        trail.tick(0.5f, x(4.0f), style);
        trail.tick(0.5f, x(4.0f), style);
        trail.tick(0.5f, x(4.0f), style);
        REQUIRE(trail.pointTime(trail.endIndex()) <= 1.0f);
    }

    SECTION("widths run from t = 0 at the oldest to t = 1 at the newest") {
        style.widthCurve = WidthCurve::linear(0.0f, 1.0f);
        trail.tick(0.25f, x(2.0f), style);
        trail.tick(0.25f, x(4.0f), style);
        REQUIRE(trail.positionCount() == 2);
        REQUIRE(trail.stepSize() == 0.5f);

        const MeshChain& chain = trail.chain();
        REQUIRE_THAT(chain.element(0).sizeA, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(chain.element(1).sizeB, WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(chain.element(2).sizeA, WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(chain.element(4).sizeA, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("incremental update moves one live point") {
        trail.tick(0.25f, x(2.0f), style);
        trail.tick(0.25f, x(4.0f), style);
        trail.chain().refreshMesh();

        trail.incrementalUpdate(1, glm::vec3(2.0f, 1.0f, 0.0f), style);
        REQUIRE(trail.chain().dirtyFlags() == MeshRefreshFlag::Positions);
        REQUIRE(trail.position(1) == glm::vec3(2.0f, 1.0f, 0.0f));
        REQUIRE(trail.chain().element(1).positionB == glm::vec3(2.0f, 1.0f, 0.0f));
        REQUIRE(trail.chain().element(2).positionA == glm::vec3(2.0f, 1.0f, 0.0f));
        REQUIRE(trail.chain().element(3).positionA == glm::vec3(2.0f, 1.0f, 0.0f));

        REQUIRE_THROWS_AS(trail.incrementalUpdate(3, glm::vec3(0.0f), style), std::out_of_range);
    }

    SECTION("empty trail has no live points") {
        REQUIRE_THROWS_AS(trail.position(0), std::out_of_range);
        REQUIRE_THROWS_AS(trail.incrementalUpdate(0, glm::vec3(0.0f), style), std::out_of_range);
    }
}

TEST_CASE("TrailDriver expiry with stealing disabled", "[trail_driver][scenario]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 4;
    trail.minVertexDistance = 1.0f;
    trail.time = 5.0f;
    trail.stealLastPointWhenEmpty = false;
    trail.autodestruct = true;
    trail.start(glm::vec3(0.0f), style);

    TickResult result = trail.tick(0.5f, glm::vec3(0.0f), style);
    REQUIRE(trail.positionCount() == 0);

    result = trail.tick(0.5f, x(2.0f), style);
    REQUIRE(trail.positionCount() == 1);
    REQUIRE(result.visible);

    // Stand still for six more seconds
    int destroyEvents = 0;
    int expiredEvents = 0;
    int expiredAtTick = -1;
    for (int i = 1; i <= 12; ++i) {
        result = trail.tick(0.5f, x(2.0f), style);
        if (result.expired) {
            ++expiredEvents;
            expiredAtTick = i;
        }
        if (result.destroyRequested) {
            ++destroyEvents;
            REQUIRE(result.expired);
        }
        requireOccupancyInvariant(trail);
    }

    // 0.5s while recording plus nine 0.5s ticks = 5s
    REQUIRE(expiredAtTick == 9);
    REQUIRE(expiredEvents == 1);
    REQUIRE(destroyEvents == 1);
    REQUIRE(trail.positionCount() == 0);
    REQUIRE_FALSE(result.visible);
}

TEST_CASE("TrailDriver emptied by expiry commits a hidden mesh", "[trail_driver]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 4;
    trail.minVertexDistance = 1.0f;
    trail.time = 1.0f;
    trail.start(glm::vec3(0.0f), style);

    trail.tick(0.5f, x(2.0f), style);
    REQUIRE(trail.positionCount() == 1);
    trail.chain().refreshMesh();
    REQUIRE(trail.chain().bounds().valid);

    TickResult result;
    for (int i = 0; i < 4 && !result.expired; ++i) {
        result = trail.tick(0.5f, x(2.0f), style);
    }
    REQUIRE(result.expired);
    REQUIRE_FALSE(result.visible);
    REQUIRE(result.needsRefresh);

    REQUIRE(trail.chain().refreshMesh());
    for (const ChainVertex& v : trail.chain().vertices()) {
        REQUIRE(v.size == 0.0f);
    }
    REQUIRE_FALSE(trail.chain().bounds().valid);

    // Recording again brings the new pair back
    result = trail.tick(0.5f, x(4.0f), style);
    REQUIRE(result.visible);
    trail.chain().refreshMesh();
    REQUIRE(trail.chain().bounds().valid);
}

TEST_CASE("TrailDriver full buffer", "[trail_driver][scenario]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 4;
    trail.minVertexDistance = 0.5f;
    trail.time = 100.0f;
    trail.start(glm::vec3(0.0f), style);

    trail.tick(0.125f, x(1.0f), style);
    trail.tick(0.125f, x(2.0f), style);
    trail.tick(0.125f, x(3.0f), style);
    REQUIRE(trail.positionCount() == 3);

    SECTION("stealing evicts the oldest point and keeps occupancy") {
        const size_t oldStart = trail.startIndex();
        trail.tick(0.125f, x(4.0f), style);

        REQUIRE(trail.positionCount() == 3);
        REQUIRE(trail.startIndex() == (oldStart + 1) % 4);
        REQUIRE(trail.position(0) == x(1.0f));
        REQUIRE(trail.position(3) == x(4.0f));
        requireOccupancyInvariant(trail);

        // The newest point reuses slot 0
        REQUIRE(trail.endIndex() == 0);
        REQUIRE(trail.chain().element(0).positionA == x(4.0f));
        REQUIRE(trail.chain().element(7).positionB == x(4.0f));
    }

    SECTION("without stealing the newest slot is pinned and follows the position") {
        trail.stealLastPointWhenEmpty = false;
        const size_t oldStart = trail.startIndex();
        const size_t oldEnd = trail.endIndex();
        trail.tick(0.125f, x(4.0f), style);

        REQUIRE(trail.positionCount() == 3);
        REQUIRE(trail.startIndex() == oldStart);
        REQUIRE(trail.endIndex() == oldEnd);
        REQUIRE(trail.position(0) == glm::vec3(0.0f));
        REQUIRE(trail.position(3) == x(4.0f));
        REQUIRE(trail.lastRecordedPoint() == x(4.0f));
    }
}

TEST_CASE("TrailDriver aging", "[trail_driver]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 10;
    trail.minVertexDistance = 0.5f;
    trail.time = 1.0f;
    trail.start(glm::vec3(0.0f), style);

    trail.tick(0.125f, x(1.0f), style);
    trail.tick(0.125f, x(2.0f), style);
    REQUIRE(trail.positionCount() == 2);

    SECTION("remaining lifetime only decreases and each point expires once") {
        int expired = 0;
        size_t trackedSlot = trail.startIndex();
        float trackedTime = trail.pointTime(trackedSlot);

        for (int i = 0; i < 40; ++i) {
            TickResult result = trail.tick(0.125f, x(2.0f), style);
            if (result.expired) {
                ++expired;
            } else if (trail.hasGeometry()) {
                REQUIRE(trail.startIndex() == trackedSlot);
                REQUIRE(trail.pointTime(trackedSlot) < trackedTime);
            }
            trackedSlot = trail.startIndex();
            trackedTime = trail.pointTime(trackedSlot);
            requireOccupancyInvariant(trail);
        }

        REQUIRE(expired == 2);
        REQUIRE_FALSE(trail.hasGeometry());
    }

    SECTION("no autodestruct unless enabled") {
        for (int i = 0; i < 40; ++i) {
            REQUIRE_FALSE(trail.tick(0.125f, x(2.0f), style).destroyRequested);
        }
    }
}

TEST_CASE("TrailDriver smooth interpolation", "[trail_driver]") {
    TrailDriver trail;
    ChainStyle style;
    trail.maxTrailPoints = 10;
    trail.minVertexDistance = 0.5f;
    trail.time = 1.0f;
    trail.start(glm::vec3(0.0f), style);

    SECTION("tail slides toward the next point as it ages") {
        trail.smoothInterpolation = true;
        trail.tick(0.25f, x(1.0f), style);
        REQUIRE_THAT(trail.chain().element(0).positionA.x, WithinAbs(0.25f, 1e-6f));
        REQUIRE_THAT(trail.chain().element(1).positionA.x, WithinAbs(0.25f, 1e-6f));

        trail.tick(0.25f, x(1.0f), style);
        REQUIRE_THAT(trail.chain().element(0).positionA.x, WithinAbs(0.5f, 1e-6f));
    }

    SECTION("tail stays put without smoothing") {
        trail.tick(0.25f, x(1.0f), style);
        trail.tick(0.25f, x(1.0f), style);
        REQUIRE(trail.chain().element(0).positionA == glm::vec3(0.0f));
    }

    SECTION("zero lifetime never divides by zero") {
        trail.smoothInterpolation = true;
        trail.time = 0.0f;
        TickResult result = trail.tick(0.25f, x(1.0f), style);
        REQUIRE(result.expired);
        REQUIRE_FALSE(result.visible);
        REQUIRE(trail.positionCount() == 0);
    }
}

TEST_CASE("TrailDriver occupancy invariant", "[trail_driver]") {
    ChainStyle style;

    for (bool steal : {true, false}) {
        DYNAMIC_SECTION("steal=" << steal) {
            TrailDriver trail;
            trail.maxTrailPoints = 5;
            trail.minVertexDistance = 0.5f;
            trail.time = 0.75f;
            trail.stealLastPointWhenEmpty = steal;
            trail.start(glm::vec3(0.0f), style);

            // Alternate bursts of movement with pauses
            float pos = 0.0f;
            for (int i = 0; i < 200; ++i) {
                if ((i / 7) % 2 == 0) {
                    pos += 1.0f;
                }
                trail.tick(0.0625f, x(pos), style);
                requireOccupancyInvariant(trail);
            }
        }
    }
}

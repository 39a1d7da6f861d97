/**
 * @file test_preset.cpp
 * @brief Unit tests for JSON renderer presets
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <strand/preset.h>
#include <filesystem>

using namespace strand;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

namespace {

const char* kTrailPreset = R"({
    "name": "comet",
    "kind": "trail",
    "params": {
        "maxTrailPoints": 40,
        "time": 1.5,
        "autodestruct": true,
        "widthMultiplier": 0.2
    },
    "widthCurve": [ { "time": 1, "value": 0 }, { "time": 0, "value": 1 } ],
    "colorGradient": {
        "mode": "blend",
        "colorKeys": [ { "time": 0, "color": "#FF0000" }, { "time": 1, "color": [0, 0, 1] } ],
        "alphaKeys": [ { "time": 0, "alpha": 0 }, { "time": 1, "alpha": 1 } ]
    }
})";

} // anonymous namespace

TEST_CASE("Preset parsing", "[preset]") {
    RendererPreset preset;

    SECTION("full trail preset") {
        REQUIRE(parsePreset(kTrailPreset, preset));
        REQUIRE(preset.name == "comet");
        REQUIRE(preset.kind == DriverKind::Trail);
        REQUIRE(preset.params.size() == 4);
        REQUIRE(preset.widthCurve.has_value());
        REQUIRE(preset.widthCurve->keys().front().time == 0.0f);
        REQUIRE(preset.colorGradient.has_value());
        REQUIRE(preset.colorGradient->evaluate(0.0f) == Color::Red.withAlpha(0.0f));
        REQUIRE(preset.colorGradient->evaluate(1.0f) == Color::Blue);
    }

    SECTION("line preset with points") {
        REQUIRE(parsePreset(R"({"kind": "line", "params": {"loop": true},
                               "points": [[0,0,0],[1,0,0],[1,1,0]]})", preset));
        REQUIRE(preset.kind == DriverKind::Line);
        REQUIRE(preset.points.size() == 3);
        REQUIRE(preset.points[2] == glm::vec3(1.0f, 1.0f, 0.0f));
        REQUIRE(preset.params[0].second == 1.0f);
    }

    SECTION("malformed input is rejected") {
        REQUIRE_FALSE(parsePreset("{not json", preset));
        REQUIRE_FALSE(parsePreset("[1, 2, 3]", preset));
        REQUIRE_FALSE(parsePreset(R"({"kind": "ribbon"})", preset));
        REQUIRE_FALSE(parsePreset(R"({"params": {"time": "slow"}})", preset));
        REQUIRE_FALSE(parsePreset(R"({"points": [[0, 1]]})", preset));
        REQUIRE_FALSE(parsePreset(R"({"colorGradient": {"mode": "smooth"}})", preset));
        REQUIRE_FALSE(parsePreset(R"({"colorGradient": {"colorKeys": [{"color": "#XYZ"}]}})", preset));
    }

    SECTION("failed parse leaves the output untouched") {
        preset.name = "before";
        REQUIRE_FALSE(parsePreset(R"({"name": "after", "kind": "ribbon"})", preset));
        REQUIRE(preset.name == "before");
    }
}

TEST_CASE("Preset application", "[preset]") {
    RendererPreset preset;
    REQUIRE(parsePreset(kTrailPreset, preset));

    SECTION("createRenderer applies everything") {
        auto renderer = createRenderer(preset);
        REQUIRE(renderer->name() == "comet");
        REQUIRE(renderer->kind() == DriverKind::Trail);
        REQUIRE(static_cast<int>(renderer->trail().maxTrailPoints) == 40);
        REQUIRE(static_cast<float>(renderer->trail().time) == 1.5f);
        REQUIRE(static_cast<bool>(renderer->trail().autodestruct));
        REQUIRE_THAT(renderer->widthStart(), WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(renderer->widthEnd(), WithinAbs(0.0f, 1e-6f));
        REQUIRE(renderer->colorEnd() == Color::Blue);
    }

    SECTION("kind mismatch applies nothing") {
        ChainRenderer line(DriverKind::Line);
        REQUIRE_FALSE(applyPreset(line, preset));
        REQUIRE(static_cast<float>(line.widthMultiplier) == 1.0f);
    }

    SECTION("unknown parameters are reported but the rest still applies") {
        preset.params.emplace_back("loop", 1.0f);
        ChainRenderer trail(DriverKind::Trail);
        REQUIRE_FALSE(applyPreset(trail, preset));
        REQUIRE(static_cast<int>(trail.trail().maxTrailPoints) == 40);
    }

    SECTION("line points are applied") {
        RendererPreset linePreset;
        REQUIRE(parsePreset(R"({"kind": "line", "params": {"loop": true},
                               "points": [[0,0,0],[1,0,0],[1,1,0]]})", linePreset));
        auto line = createRenderer(linePreset);
        REQUIRE(line->line().positionCount() == 3);
        REQUIRE(line->chain().reservedElements() == 6);
    }
}

TEST_CASE("Preset files", "[preset]") {
    const fs::path path = fs::temp_directory_path() / "strand_test_preset.json";

    SECTION("save then load restores the configuration") {
        ChainRenderer source(DriverKind::Line);
        source.setName("outline");
        source.setPositions({glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f)}, true);
        source.setLoop(true);
        source.setTotalWidth(0.5f);
        source.setColorGradient(ColorGradient::twoColor(Color::Red, Color::Green));

        REQUIRE(savePreset(capturePreset(source), path.string()));

        RendererPreset loaded;
        REQUIRE(loadPreset(path.string(), loaded));
        auto copy = createRenderer(loaded);
        REQUIRE(copy->name() == "outline");
        REQUIRE(static_cast<bool>(copy->line().loop));
        REQUIRE(copy->line().positions() == source.line().positions());
        REQUIRE_THAT(copy->widthEnd(), WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(copy->colorEnd().g, WithinAbs(Color::Green.g, 1e-6f));

        fs::remove(path);
    }

    SECTION("missing file fails") {
        RendererPreset preset;
        REQUIRE_FALSE(loadPreset((fs::temp_directory_path() / "strand_missing_preset.json").string(), preset));
    }
}

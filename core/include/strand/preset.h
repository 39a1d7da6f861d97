#pragma once

/**
 * @file preset.h
 * @brief JSON presets for chain renderers
 *
 * A preset stores a renderer's kind, its named parameters, its width curve
 * and color gradient, and (for lines) its point list:
 * @code{.json}
 * {
 *   "name": "comet",
 *   "kind": "trail",
 *   "params": { "time": 1.5, "maxTrailPoints": 40, "widthMultiplier": 0.2 },
 *   "widthCurve": [ { "time": 0, "value": 0 }, { "time": 1, "value": 1 } ],
 *   "colorGradient": {
 *     "mode": "blend",
 *     "colorKeys": [ { "time": 0, "color": "#FF7F50" }, { "time": 1, "color": [1, 1, 1] } ],
 *     "alphaKeys": [ { "time": 0, "alpha": 0 }, { "time": 1, "alpha": 1 } ]
 *   }
 * }
 * @endcode
 *
 * Loading never throws. Failures return false and log a [strand-preset]
 * message on std::cerr.
 */

#include <strand/chain_renderer.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strand {

struct RendererPreset {
    std::string name;
    DriverKind kind = DriverKind::Trail;
    std::vector<std::pair<std::string, float>> params;  ///< In file order
    std::optional<WidthCurve> widthCurve;
    std::optional<ColorGradient> colorGradient;
    std::vector<glm::vec3> points;                      ///< Line renderers only
};

/// @brief Decode a preset from parsed JSON
bool presetFromJson(const nlohmann::json& j, RendererPreset& out);

nlohmann::json presetToJson(const RendererPreset& preset);

/// @brief Parse preset text
bool parsePreset(const std::string& text, RendererPreset& out);

/// @brief Read and parse a preset file
bool loadPreset(const std::string& path, RendererPreset& out);

/// @brief Write a preset file (pretty printed)
bool savePreset(const RendererPreset& preset, const std::string& path);

/**
 * @brief Apply a preset to an existing renderer
 * @return False if the kinds differ (nothing applied) or a parameter name
 *         was unknown (the remaining values are still applied)
 */
bool applyPreset(ChainRenderer& renderer, const RendererPreset& preset);

/// @brief Create a renderer of the preset's kind with the preset applied
std::unique_ptr<ChainRenderer> createRenderer(const RendererPreset& preset);

/**
 * @brief Snapshot a renderer's current configuration
 *
 * Custom width and color functions cannot be stored; the curve and
 * gradient underneath them are captured instead.
 */
RendererPreset capturePreset(const ChainRenderer& renderer);

} // namespace strand

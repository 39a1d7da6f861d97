#pragma once

/**
 * @file gradient.h
 * @brief Color gradient describing color along a chain
 *
 * Color and alpha are keyed independently, so a gradient can fade out a
 * trail while its hue stays constant:
 * @code
 * ColorGradient fade({{Color::Cyan, 0.0f}},
 *                    {{0.0f, 0.0f}, {1.0f, 1.0f}});
 * @endcode
 */

#include <strand/color.h>
#include <vector>

namespace strand {

/// @brief How a gradient moves between keys
enum class GradientMode {
    Blend,  ///< Linear interpolation between neighbouring keys
    Fixed   ///< Step to the next key's value (no interpolation)
};

struct ColorKey {
    Color color;       ///< RGB used; alpha comes from the alpha keys
    float time = 0.0f;
};

struct AlphaKey {
    float alpha = 1.0f;
    float time = 0.0f;
};

class ColorGradient {
public:
    /// @brief Maximum number of color keys and of alpha keys
    static constexpr size_t kMaxKeys = 8;

    /// @brief Opaque white gradient
    ColorGradient();

    ColorGradient(std::vector<ColorKey> colorKeys,
                  std::vector<AlphaKey> alphaKeys,
                  GradientMode mode = GradientMode::Blend);

    /// @brief Gradient holding a single color (alpha included) along its length
    static ColorGradient constant(const Color& color);

    /// @brief Two-key gradient from start (t=0) to end (t=1)
    static ColorGradient twoColor(const Color& start, const Color& end);

    Color evaluate(float t) const;

    Color operator()(float t) const { return evaluate(t); }

    const std::vector<ColorKey>& colorKeys() const { return m_colorKeys; }
    const std::vector<AlphaKey>& alphaKeys() const { return m_alphaKeys; }
    GradientMode mode() const { return m_mode; }

    /// @brief Replace color keys (sorted, truncated to kMaxKeys, white if empty)
    void setColorKeys(std::vector<ColorKey> keys);

    /// @brief Replace alpha keys (sorted, truncated to kMaxKeys, opaque if empty)
    void setAlphaKeys(std::vector<AlphaKey> keys);

    void setMode(GradientMode mode) { m_mode = mode; }

    /// @brief Overwrite the first color key's RGB and the first alpha key
    void setStartColor(const Color& color);

    /// @brief Overwrite the last color key's RGB and the last alpha key
    void setEndColor(const Color& color);

private:
    std::vector<ColorKey> m_colorKeys;
    std::vector<AlphaKey> m_alphaKeys;
    GradientMode m_mode = GradientMode::Blend;
};

} // namespace strand

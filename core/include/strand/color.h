#pragma once

/**
 * @file color.h
 * @brief RGBA color used for per-vertex chain colors
 *
 * Color implicitly converts to glm::vec4 so it can be written straight into
 * vertex data, and offers the factories used by presets and gradients.
 *
 * @par Example
 * @code
 * trail.setTotalColor(Color::fromHex("#FF7F50"));
 * Color mid = Color::Red.lerp(Color::Blue, 0.5f);
 * @endcode
 */

#include <glm/glm.hpp>
#include <string>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <cctype>

namespace strand {

/**
 * @brief RGBA color with components in 0-1 range
 */
class Color {
public:
    float r, g, b, a;

    /// @brief Default constructor (opaque white)
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    constexpr Color(const glm::vec3& v)
        : r(v.r), g(v.g), b(v.b), a(1.0f) {}

    /// @brief Implicit conversion to glm::vec4 for vertex data
    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create color from HSV values
     * @param h Hue (0-1, wraps)
     * @param s Saturation (0-1)
     * @param v Value/brightness (0-1)
     * @param a Alpha (default 1.0)
     */
    static Color fromHSV(float h, float s, float v, float a = 1.0f) {
        h = h - std::floor(h);

        float c = v * s;
        float x = c * (1.0f - std::abs(std::fmod(h * 6.0f, 2.0f) - 1.0f));
        float m = v - c;

        float ri, gi, bi;
        if (h < 1.0f/6.0f)      { ri = c; gi = x; bi = 0; }
        else if (h < 2.0f/6.0f) { ri = x; gi = c; bi = 0; }
        else if (h < 3.0f/6.0f) { ri = 0; gi = c; bi = x; }
        else if (h < 4.0f/6.0f) { ri = 0; gi = x; bi = c; }
        else if (h < 5.0f/6.0f) { ri = x; gi = 0; bi = c; }
        else                    { ri = c; gi = 0; bi = x; }

        return Color(ri + m, gi + m, bi + m, a);
    }

    /**
     * @brief Create color from hex integer (0xRRGGBB or 0xRRGGBBAA)
     */
    static constexpr Color fromHex(uint32_t hex) {
        if (hex > 0xFFFFFF) {
            return Color(
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f
            );
        }
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Parse a hex string ("#RRGGBB", "#RRGGBBAA", with or without '#')
     * @param hex Hex string
     * @param out Receives the parsed color
     * @return False if the string is not a valid 6 or 8 digit hex color
     */
    static bool parseHex(const std::string& hex, Color& out) {
        std::string s = hex;
        if (!s.empty() && s[0] == '#') {
            s = s.substr(1);
        }
        if (s.length() != 6 && s.length() != 8) {
            return false;
        }
        for (char ch : s) {
            if (!std::isxdigit(static_cast<unsigned char>(ch))) {
                return false;
            }
        }
        uint32_t val = static_cast<uint32_t>(std::stoul(s, nullptr, 16));
        if (s.length() == 8) {
            out = Color(((val >> 24) & 0xFF) / 255.0f, ((val >> 16) & 0xFF) / 255.0f,
                        ((val >> 8) & 0xFF) / 255.0f, (val & 0xFF) / 255.0f);
        } else {
            out = fromHex(val);
        }
        return true;
    }

    /**
     * @brief Create color from hex string
     * @return Parsed color, or visible magenta on parse error
     */
    static Color fromHex(const std::string& hex) {
        Color c;
        if (!parseHex(hex, c)) {
            return Color(1.0f, 0.0f, 1.0f, 1.0f);
        }
        return c;
    }

    static constexpr Color fromBytes(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
    }

    // =========================================================================
    // Manipulation
    // =========================================================================

    /// @brief Return color with modified alpha
    constexpr Color withAlpha(float newAlpha) const {
        return Color(r, g, b, newAlpha);
    }

    /// @brief Return the color with alpha forced to 1
    constexpr Color opaque() const {
        return Color(r, g, b, 1.0f);
    }

    /**
     * @brief Linear interpolation between two colors
     * @param other Target color
     * @param t Interpolation factor (0 = this, 1 = other)
     */
    constexpr Color lerp(const Color& other, float t) const {
        return Color(
            r + (other.r - r) * t,
            g + (other.g - g) * t,
            b + (other.b - b) * t,
            a + (other.a - a) * t
        );
    }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    // =========================================================================
    // Named Colors
    // =========================================================================

    static const Color White;
    static const Color Black;
    static const Color Clear;
    static const Color Red;
    static const Color Green;
    static const Color Blue;
    static const Color Yellow;
    static const Color Cyan;
    static const Color Magenta;
    static const Color Orange;
    static const Color Coral;
    static const Color Gold;
};

inline constexpr Color Color::White{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color Color::Black{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color Color::Clear{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color Color::Red{1.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color Color::Green{0.0f, 0.502f, 0.0f, 1.0f};
inline constexpr Color Color::Blue{0.0f, 0.0f, 1.0f, 1.0f};
inline constexpr Color Color::Yellow{1.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color Color::Cyan{0.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color Color::Magenta{1.0f, 0.0f, 1.0f, 1.0f};
inline constexpr Color Color::Orange{1.0f, 0.647f, 0.0f, 1.0f};
inline constexpr Color Color::Coral{1.0f, 0.498f, 0.314f, 1.0f};
inline constexpr Color Color::Gold{1.0f, 0.843f, 0.0f, 1.0f};

/// @brief Free function lerp for convenience
inline Color lerp(const Color& a, const Color& b, float t) {
    return a.lerp(b, t);
}

} // namespace strand

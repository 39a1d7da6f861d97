#pragma once

/**
 * @file chain_style.h
 * @brief Width and color functions sampled along a chain
 *
 * Drivers receive the style by const reference and only ever call width(t)
 * and color(t); they never hold on to it between calls.
 */

#include <strand/curve.h>
#include <strand/gradient.h>
#include <functional>

namespace strand {

using WidthFunction = std::function<float(float)>;
using ColorFunction = std::function<Color(float)>;

struct ChainStyle {
    float widthMultiplier = 1.0f;   ///< World-space width scale
    WidthCurve widthCurve;          ///< Width factor over t (empty = 1)
    ColorGradient colorGradient;    ///< Color over t (default white)
    WidthFunction customWidth;      ///< Replaces widthCurve when set
    ColorFunction customColor;      ///< Replaces colorGradient when set

    /// @brief Final world-space width at t
    float width(float t) const {
        float factor = customWidth ? customWidth(t) : widthCurve.evaluate(t);
        return factor * widthMultiplier;
    }

    Color color(float t) const {
        return customColor ? customColor(t) : colorGradient.evaluate(t);
    }
};

} // namespace strand

#pragma once

/**
 * @file curve.h
 * @brief Keyframe curve describing width along a chain
 *
 * The curve is sampled with t in [0, 1] (0 = chain start, 1 = chain end) and
 * multiplied by the renderer's width multiplier. Keys are kept sorted by
 * time; evaluation interpolates linearly and clamps outside the key range.
 *
 * @par Example
 * @code
 * WidthCurve taper({{0.0f, 1.0f}, {1.0f, 0.0f}});
 * float w = taper(0.25f);  // 0.75
 * @endcode
 */

#include <vector>

namespace strand {

/// @brief One curve key (time in 0-1, value is a width factor)
struct Keyframe {
    float time = 0.0f;
    float value = 1.0f;
};

class WidthCurve {
public:
    /// @brief Empty curve, evaluates to 1 everywhere
    WidthCurve() = default;

    explicit WidthCurve(std::vector<Keyframe> keys);

    /// @brief Flat curve at the given value
    static WidthCurve constant(float value);

    /// @brief Straight line from start (t=0) to end (t=1)
    static WidthCurve linear(float start, float end);

    /**
     * @brief Sample the curve
     * @param t Position along the chain (clamped to the key range)
     */
    float evaluate(float t) const;

    float operator()(float t) const { return evaluate(t); }

    const std::vector<Keyframe>& keys() const { return m_keys; }

    /// @brief Replace all keys (sorted by time)
    void setKeys(std::vector<Keyframe> keys);

    /// @brief Insert a key, keeping the key list sorted
    void addKey(float time, float value);

    /// @brief Set the value at t=0 (adds a key there if no key sits at t=0)
    void setFirstValue(float value);

    /// @brief Set the value at t=1 (adds a key there if no key sits at t=1)
    void setLastValue(float value);

    bool empty() const { return m_keys.empty(); }

private:
    void sortKeys();

    std::vector<Keyframe> m_keys;
};

} // namespace strand

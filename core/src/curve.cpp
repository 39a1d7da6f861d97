// Strand - Width Curve

#include <strand/curve.h>
#include <algorithm>

namespace strand {

WidthCurve::WidthCurve(std::vector<Keyframe> keys)
    : m_keys(std::move(keys)) {
    sortKeys();
}

WidthCurve WidthCurve::constant(float value) {
    return WidthCurve({{0.0f, value}});
}

WidthCurve WidthCurve::linear(float start, float end) {
    return WidthCurve({{0.0f, start}, {1.0f, end}});
}

float WidthCurve::evaluate(float t) const {
    if (m_keys.empty()) {
        return 1.0f;
    }
    if (t <= m_keys.front().time) {
        return m_keys.front().value;
    }
    if (t >= m_keys.back().time) {
        return m_keys.back().value;
    }

    // First key strictly after t; the key before it brackets t from below
    auto upper = std::upper_bound(m_keys.begin(), m_keys.end(), t,
        [](float value, const Keyframe& key) { return value < key.time; });
    const Keyframe& b = *upper;
    const Keyframe& a = *(upper - 1);

    float span = b.time - a.time;
    if (span <= 0.0f) {
        return b.value;
    }
    float f = (t - a.time) / span;
    return a.value + (b.value - a.value) * f;
}

void WidthCurve::setKeys(std::vector<Keyframe> keys) {
    m_keys = std::move(keys);
    sortKeys();
}

void WidthCurve::addKey(float time, float value) {
    m_keys.push_back({time, value});
    sortKeys();
}

void WidthCurve::setFirstValue(float value) {
    if (m_keys.empty() || m_keys.front().time > 0.0f) {
        m_keys.insert(m_keys.begin(), Keyframe{0.0f, value});
        return;
    }
    m_keys.front().value = value;
}

void WidthCurve::setLastValue(float value) {
    if (m_keys.empty() || m_keys.back().time < 1.0f) {
        m_keys.push_back({1.0f, value});
        return;
    }
    m_keys.back().value = value;
}

void WidthCurve::sortKeys() {
    std::stable_sort(m_keys.begin(), m_keys.end(),
        [](const Keyframe& a, const Keyframe& b) { return a.time < b.time; });
}

} // namespace strand

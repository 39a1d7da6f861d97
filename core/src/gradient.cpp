// Strand - Color Gradient

#include <strand/gradient.h>
#include <algorithm>
#include <iostream>

namespace strand {

namespace {

// Samples a sorted key list. Value(key) extracts the keyed quantity and
// Mix(a, b, f) interpolates it.
template<typename Key, typename Value, typename Mix>
auto sampleKeys(const std::vector<Key>& keys, float t, GradientMode mode,
                Value value, Mix mix) -> decltype(value(keys.front())) {
    if (t <= keys.front().time) {
        return value(keys.front());
    }
    for (size_t i = 1; i < keys.size(); ++i) {
        if (t <= keys[i].time) {
            if (mode == GradientMode::Fixed) {
                return value(keys[i]);
            }
            float span = keys[i].time - keys[i - 1].time;
            float f = span > 0.0f ? (t - keys[i - 1].time) / span : 1.0f;
            return mix(value(keys[i - 1]), value(keys[i]), f);
        }
    }
    return value(keys.back());
}

template<typename Key>
void sortAndTruncate(std::vector<Key>& keys, const char* what) {
    std::stable_sort(keys.begin(), keys.end(),
        [](const Key& a, const Key& b) { return a.time < b.time; });
    if (keys.size() > ColorGradient::kMaxKeys) {
        std::cerr << "[ColorGradient Warning] " << keys.size() << " " << what
                  << " keys given, keeping the first " << ColorGradient::kMaxKeys << "\n";
        keys.resize(ColorGradient::kMaxKeys);
    }
}

} // anonymous namespace

ColorGradient::ColorGradient()
    : m_colorKeys{{Color::White, 0.0f}, {Color::White, 1.0f}}
    , m_alphaKeys{{1.0f, 0.0f}, {1.0f, 1.0f}} {}

ColorGradient::ColorGradient(std::vector<ColorKey> colorKeys,
                             std::vector<AlphaKey> alphaKeys,
                             GradientMode mode)
    : m_mode(mode) {
    setColorKeys(std::move(colorKeys));
    setAlphaKeys(std::move(alphaKeys));
}

ColorGradient ColorGradient::constant(const Color& color) {
    return ColorGradient({{color.opaque(), 0.0f}, {color.opaque(), 1.0f}},
                         {{color.a, 0.0f}, {color.a, 1.0f}});
}

ColorGradient ColorGradient::twoColor(const Color& start, const Color& end) {
    return ColorGradient({{start.opaque(), 0.0f}, {end.opaque(), 1.0f}},
                         {{start.a, 0.0f}, {end.a, 1.0f}});
}

Color ColorGradient::evaluate(float t) const {
    glm::vec3 rgb = sampleKeys(m_colorKeys, t, m_mode,
        [](const ColorKey& k) { return glm::vec3(k.color.r, k.color.g, k.color.b); },
        [](const glm::vec3& a, const glm::vec3& b, float f) { return a + (b - a) * f; });
    float alpha = sampleKeys(m_alphaKeys, t, m_mode,
        [](const AlphaKey& k) { return k.alpha; },
        [](float a, float b, float f) { return a + (b - a) * f; });
    return Color(rgb.r, rgb.g, rgb.b, alpha);
}

void ColorGradient::setColorKeys(std::vector<ColorKey> keys) {
    if (keys.empty()) {
        keys = {{Color::White, 0.0f}, {Color::White, 1.0f}};
    }
    sortAndTruncate(keys, "color");
    m_colorKeys = std::move(keys);
}

void ColorGradient::setAlphaKeys(std::vector<AlphaKey> keys) {
    if (keys.empty()) {
        keys = {{1.0f, 0.0f}, {1.0f, 1.0f}};
    }
    sortAndTruncate(keys, "alpha");
    m_alphaKeys = std::move(keys);
}

void ColorGradient::setStartColor(const Color& color) {
    m_colorKeys.front().color = color.opaque();
    m_alphaKeys.front().alpha = color.a;
}

void ColorGradient::setEndColor(const Color& color) {
    m_colorKeys.back().color = color.opaque();
    m_alphaKeys.back().alpha = color.a;
}

} // namespace strand

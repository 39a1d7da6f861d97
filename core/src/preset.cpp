// Strand - Renderer Presets

#include <strand/preset.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace strand {

using json = nlohmann::json;

namespace {

bool parseKind(const std::string& name, DriverKind& out) {
    if (name == "line") {
        out = DriverKind::Line;
        return true;
    }
    if (name == "trail") {
        out = DriverKind::Trail;
        return true;
    }
    return false;
}

// Accepts "#RRGGBB[AA]" or [r, g, b(, a)] in 0-1
Color colorFromJson(const json& j) {
    if (j.is_string()) {
        Color c;
        if (!Color::parseHex(j.get<std::string>(), c)) {
            throw std::invalid_argument("invalid color '" + j.get<std::string>() + "'");
        }
        return c;
    }
    if (j.is_array() && (j.size() == 3 || j.size() == 4)) {
        float a = j.size() == 4 ? j[3].get<float>() : 1.0f;
        return Color(j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), a);
    }
    throw std::invalid_argument("color must be a hex string or an array of 3-4 numbers");
}

json colorToJson(const Color& c) {
    return json::array({c.r, c.g, c.b});
}

WidthCurve curveFromJson(const json& j) {
    std::vector<Keyframe> keys;
    for (const auto& key : j) {
        Keyframe k;
        k.time = key.value("time", 0.0f);
        k.value = key.value("value", 1.0f);
        keys.push_back(k);
    }
    return WidthCurve(std::move(keys));
}

ColorGradient gradientFromJson(const json& j) {
    GradientMode mode = GradientMode::Blend;
    std::string modeName = j.value("mode", "blend");
    if (modeName == "fixed") {
        mode = GradientMode::Fixed;
    } else if (modeName != "blend") {
        throw std::invalid_argument("unknown gradient mode '" + modeName + "'");
    }

    std::vector<ColorKey> colorKeys;
    if (j.contains("colorKeys")) {
        for (const auto& key : j.at("colorKeys")) {
            ColorKey k;
            k.color = colorFromJson(key.at("color"));
            k.time = key.value("time", 0.0f);
            colorKeys.push_back(k);
        }
    }

    std::vector<AlphaKey> alphaKeys;
    if (j.contains("alphaKeys")) {
        for (const auto& key : j.at("alphaKeys")) {
            AlphaKey k;
            k.alpha = key.value("alpha", 1.0f);
            k.time = key.value("time", 0.0f);
            alphaKeys.push_back(k);
        }
    }

    return ColorGradient(std::move(colorKeys), std::move(alphaKeys), mode);
}

} // anonymous namespace

bool presetFromJson(const json& j, RendererPreset& out) {
    if (!j.is_object()) {
        std::cerr << "[strand-preset] Preset must be a JSON object" << std::endl;
        return false;
    }

    RendererPreset preset;
    try {
        preset.name = j.value("name", "");

        std::string kindName = j.value("kind", "trail");
        if (!parseKind(kindName, preset.kind)) {
            std::cerr << "[strand-preset] Unknown renderer kind '" << kindName << "'" << std::endl;
            return false;
        }

        if (j.contains("params")) {
            for (const auto& item : j.at("params").items()) {
                const json& value = item.value();
                if (value.is_boolean()) {
                    preset.params.emplace_back(item.key(), value.get<bool>() ? 1.0f : 0.0f);
                } else if (value.is_number()) {
                    preset.params.emplace_back(item.key(), value.get<float>());
                } else {
                    std::cerr << "[strand-preset] Parameter '" << item.key()
                              << "' must be a number or bool" << std::endl;
                    return false;
                }
            }
        }

        if (j.contains("widthCurve")) {
            preset.widthCurve = curveFromJson(j.at("widthCurve"));
        }
        if (j.contains("colorGradient")) {
            preset.colorGradient = gradientFromJson(j.at("colorGradient"));
        }

        if (j.contains("points")) {
            for (const auto& p : j.at("points")) {
                if (!p.is_array() || p.size() != 3) {
                    std::cerr << "[strand-preset] Points must be [x, y, z] arrays" << std::endl;
                    return false;
                }
                preset.points.emplace_back(p[0].get<float>(), p[1].get<float>(), p[2].get<float>());
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[strand-preset] Invalid preset: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[strand-preset] Invalid preset: " << e.what() << std::endl;
        return false;
    }

    out = std::move(preset);
    return true;
}

json presetToJson(const RendererPreset& preset) {
    json j;
    if (!preset.name.empty()) {
        j["name"] = preset.name;
    }
    j["kind"] = driverKindName(preset.kind);

    json params = json::object();
    for (const auto& [name, value] : preset.params) {
        params[name] = value;
    }
    j["params"] = params;

    if (preset.widthCurve) {
        json keys = json::array();
        for (const Keyframe& k : preset.widthCurve->keys()) {
            keys.push_back({{"time", k.time}, {"value", k.value}});
        }
        j["widthCurve"] = keys;
    }

    if (preset.colorGradient) {
        const ColorGradient& g = *preset.colorGradient;
        json colorKeys = json::array();
        for (const ColorKey& k : g.colorKeys()) {
            colorKeys.push_back({{"time", k.time}, {"color", colorToJson(k.color)}});
        }
        json alphaKeys = json::array();
        for (const AlphaKey& k : g.alphaKeys()) {
            alphaKeys.push_back({{"time", k.time}, {"alpha", k.alpha}});
        }
        j["colorGradient"] = {
            {"mode", g.mode() == GradientMode::Fixed ? "fixed" : "blend"},
            {"colorKeys", colorKeys},
            {"alphaKeys", alphaKeys}
        };
    }

    if (!preset.points.empty()) {
        json points = json::array();
        for (const glm::vec3& p : preset.points) {
            points.push_back(json::array({p.x, p.y, p.z}));
        }
        j["points"] = points;
    }
    return j;
}

bool parsePreset(const std::string& text, RendererPreset& out) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[strand-preset] Parse error" << std::endl;
        return false;
    }
    return presetFromJson(j, out);
}

bool loadPreset(const std::string& path, RendererPreset& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[strand-preset] Failed to open: " << path << std::endl;
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        std::cerr << "[strand-preset] Parse error in " << path << ": " << e.what() << std::endl;
        return false;
    }

    if (!presetFromJson(j, out)) {
        std::cerr << "[strand-preset] Rejected " << path << std::endl;
        return false;
    }
    return true;
}

bool savePreset(const RendererPreset& preset, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[strand-preset] Failed to write: " << path << std::endl;
        return false;
    }
    file << std::setw(2) << presetToJson(preset) << std::endl;
    return file.good();
}

bool applyPreset(ChainRenderer& renderer, const RendererPreset& preset) {
    if (renderer.kind() != preset.kind) {
        std::cerr << "[strand-preset] Preset '" << preset.name << "' is for a "
                  << driverKindName(preset.kind) << " renderer, not a "
                  << driverKindName(renderer.kind()) << std::endl;
        return false;
    }

    bool ok = true;
    for (const auto& [name, value] : preset.params) {
        const float values[4] = {value, 0.0f, 0.0f, 0.0f};
        if (!renderer.setParam(name, values)) {
            std::cerr << "[strand-preset] Unknown parameter '" << name << "' for "
                      << driverKindName(renderer.kind()) << " renderer" << std::endl;
            ok = false;
        }
    }

    if (preset.widthCurve) {
        renderer.setWidthCurve(*preset.widthCurve);
    }
    if (preset.colorGradient) {
        renderer.setColorGradient(*preset.colorGradient);
    }

    if (!preset.points.empty()) {
        if (renderer.kind() == DriverKind::Line) {
            renderer.setPositions(preset.points, true);
        } else {
            std::cerr << "[strand-preset] Ignoring points on trail preset '"
                      << preset.name << "'" << std::endl;
        }
    }
    return ok;
}

std::unique_ptr<ChainRenderer> createRenderer(const RendererPreset& preset) {
    auto renderer = std::make_unique<ChainRenderer>(preset.kind);
    renderer->setName(preset.name);
    applyPreset(*renderer, preset);
    return renderer;
}

RendererPreset capturePreset(const ChainRenderer& renderer) {
    RendererPreset preset;
    preset.name = renderer.name();
    preset.kind = renderer.kind();
    for (const ParamDecl& decl : renderer.params()) {
        preset.params.emplace_back(decl.name, decl.defaultVal[0]);
    }
    preset.widthCurve = renderer.widthCurve();
    preset.colorGradient = renderer.colorGradient();
    if (renderer.kind() == DriverKind::Line) {
        preset.points = renderer.line().positions();
    }
    return preset;
}

} // namespace strand

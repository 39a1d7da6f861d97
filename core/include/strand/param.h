#pragma once

/**
 * @file param.h
 * @brief Parameter wrappers and registry for renderer configuration
 *
 * Param<T> combines a value with its name and range so drivers can expose
 * their tunables for introspection and preset loading without repeating
 * metadata. Values may be bound to a source that is evaluated on read:
 * @code
 * renderer.widthMultiplier.bind([&]() { return level; }, 0.05f, 0.25f);
 * @endcode
 *
 * Range metadata is descriptive. Owners clamp on read where a value has a
 * hard floor (see TrailDriver::minVertexDistance).
 */

#include <string>
#include <vector>
#include <functional>
#include <cmath>
#include <utility>

namespace strand {

/**
 * @brief Parameter types for introspection
 */
enum class ParamType {
    Float,  ///< Single float value
    Int,    ///< Integer value
    Bool    ///< Boolean toggle
};

/**
 * @brief Parameter declaration for introspection and presets
 */
struct ParamDecl {
    std::string name;                    ///< Parameter name
    ParamType type;                      ///< Data type
    float minVal = 0.0f;                 ///< Minimum value
    float maxVal = 1.0f;                 ///< Maximum value
    float defaultVal[4] = {0, 0, 0, 0};  ///< Current value(s)
};

template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Named scalar tunable (float, int or bool) with a descriptive range
 *
 * Reads like a plain member through the implicit conversion. While a source
 * is bound, every read pulls from it; assigning a value drops the source.
 */
template<typename T>
class Param {
public:
    Param(const char* name, T value, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(value), m_min(minVal), m_max(maxVal) {}

    operator T() const { return get(); }

    T get() const { return m_source ? m_source() : m_value; }

    Param& operator=(T value) {
        m_value = value;
        m_source = nullptr;
        return *this;
    }

    /**
     * @brief Drive the value from a normalized source
     *
     * The source's 0-1 output is remapped onto [outMin, outMax] on each read,
     * e.g. an audio level steering a trail's width.
     */
    void bind(std::function<float()> source, T outMin, T outMax) {
        m_source = [source = std::move(source), outMin, outMax]() {
            return static_cast<T>(outMin + source() * (outMax - outMin));
        };
    }

    const char* name() const { return m_name; }
    T min() const { return m_min; }
    T max() const { return m_max; }

    /// Declaration carrying the current value in defaultVal[0]
    ParamDecl decl() const {
        ParamDecl d;
        d.name = m_name;
        d.type = ParamTypeFor<T>::value;
        d.minVal = static_cast<float>(m_min);
        d.maxVal = static_cast<float>(m_max);
        d.defaultVal[0] = static_cast<float>(get());
        return d;
    }

private:
    const char* m_name;
    T m_value;
    T m_min;
    T m_max;
    std::function<T()> m_source;
};

/**
 * @brief Name-addressed access to a set of registered Params
 *
 * Owners register their Param members in their constructor. The registry
 * stores pointers to those members, so owners must not be copied or moved
 * after registration.
 *
 * @par Example
 * @code
 * class TrailDriver : public ChainDriver {
 *     Param<float> time{"time", 5.0f, 0.0f, 60.0f};
 *     TrailDriver() { registerParam(time); }
 * };
 * @endcode
 */
class ParamRegistry {
public:
    ParamRegistry() = default;
    ParamRegistry(const ParamRegistry&) = delete;
    ParamRegistry& operator=(const ParamRegistry&) = delete;

    void registerParam(Param<float>& p) {
        m_params.push_back({p.name(),
            [&p]() { return p.decl(); },
            [&p](float out[4]) { out[0] = p.get(); },
            [&p](const float value[4]) { p = value[0]; }});
    }

    void registerParam(Param<int>& p) {
        m_params.push_back({p.name(),
            [&p]() { return p.decl(); },
            [&p](float out[4]) { out[0] = static_cast<float>(p.get()); },
            [&p](const float value[4]) { p = static_cast<int>(std::lround(value[0])); }});
    }

    void registerParam(Param<bool>& p) {
        m_params.push_back({p.name(),
            [&p]() { return p.decl(); },
            [&p](float out[4]) { out[0] = p.get() ? 1.0f : 0.0f; },
            [&p](const float value[4]) { p = value[0] != 0.0f; }});
    }

    /// @brief Declarations for every registered parameter, in registration order
    std::vector<ParamDecl> registeredParams() const {
        std::vector<ParamDecl> decls;
        decls.reserve(m_params.size());
        for (const auto& entry : m_params) {
            decls.push_back(entry.decl());
        }
        return decls;
    }

    bool getRegisteredParam(const std::string& name, float out[4]) const {
        for (const auto& entry : m_params) {
            if (name == entry.name) {
                entry.get(out);
                return true;
            }
        }
        return false;
    }

    bool setRegisteredParam(const std::string& name, const float value[4]) {
        for (auto& entry : m_params) {
            if (name == entry.name) {
                entry.set(value);
                return true;
            }
        }
        return false;
    }

private:
    struct Entry {
        const char* name;
        std::function<ParamDecl()> decl;
        std::function<void(float[4])> get;
        std::function<void(const float[4])> set;
    };
    std::vector<Entry> m_params;
};

} // namespace strand

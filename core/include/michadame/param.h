#pragma once

/**
 * @file param.h
 * @brief Parameter declarations for introspection and persistence
 *
 * Tunable values (shader parameters, viewer toggles) describe themselves
 * with ParamDecl so they can be listed, clamped and serialized by name.
 */

#include <string>
#include <vector>
#include <algorithm>
#include <cmath>

namespace michadame {

/**
 * @brief Parameter types for UI/serialization
 */
enum class ParamType {
    Float,    ///< Continuous float value
    Int,      ///< Discrete value stored as float, rounded on use
    Bool      ///< Boolean toggle
};

/**
 * @brief Parameter declaration for introspection
 *
 * Contains metadata about a parameter including its name, type, and valid range.
 */
struct ParamDecl {
    std::string name;           ///< Key used for lookup and persistence
    ParamType type;             ///< Data type
    float minVal = 0.0f;        ///< Minimum value
    float maxVal = 1.0f;        ///< Maximum value
    float defaultVal = 0.0f;    ///< Default value

    /// Clamp a value into [minVal, maxVal], rounding Int params. NaN maps to defaultVal.
    float clamp(float value) const {
        if (std::isnan(value)) return defaultVal;
        float v = std::clamp(value, minVal, maxVal);
        if (type == ParamType::Int) {
            v = static_cast<float>(static_cast<int>(v + (v < 0.0f ? -0.5f : 0.5f)));
        }
        return v;
    }
};

/// Find a declaration by name, nullptr if unknown
inline const ParamDecl* findParam(const std::vector<ParamDecl>& decls, const std::string& name) {
    for (const auto& d : decls) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

} // namespace michadame

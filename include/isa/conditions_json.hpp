#pragma once

#include "isa/conditions.hpp"

#include <nlohmann/json.hpp>

namespace nlohmann {

/// @brief JSON conversion for AtmosConditions
///
/// Keys: Hp_m, T_K, dT_K, p_Pa, rho_kg_m3, a_m_s. AtmosConditions has no
/// default constructor, so the conversion is provided as a serializer
/// specialization instead of free to_json/from_json functions.
template <>
struct adl_serializer<isa::AtmosConditions> {
    static void to_json(json& j, const isa::AtmosConditions& cond) {
        j = json{
            {"Hp_m", cond.Hp_m},
            {"T_K", cond.T_K},
            {"dT_K", cond.dT_K},
            {"p_Pa", cond.p_Pa},
            {"rho_kg_m3", cond.rho_kg_m3},
            {"a_m_s", cond.a_m_s}
        };
    }

    /// @throws json::out_of_range if a key is missing
    /// @throws json::type_error if a value is not a number
    static auto from_json(const json& j) -> isa::AtmosConditions {
        return isa::AtmosConditions(
            j.at("Hp_m").get<double>(),
            j.at("T_K").get<double>(),
            j.at("dT_K").get<double>(),
            j.at("p_Pa").get<double>(),
            j.at("rho_kg_m3").get<double>(),
            j.at("a_m_s").get<double>()
        );
    }
};

} // namespace nlohmann

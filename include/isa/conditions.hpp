#pragma once

#include <iosfwd>

namespace isa {

/// @brief Snapshot of the atmospheric state at one pressure altitude
///
/// Holds the altitude and temperature offset the state was computed for
/// together with the resulting temperature, pressure, density and speed of
/// sound. All fields are set at construction and never change; a different
/// altitude or offset means a new snapshot.
///
/// Use conditions() to compute a consistent snapshot. The constructor can
/// also be used to hold an externally supplied set of conditions.
struct AtmosConditions {
    const double Hp_m;         ///< Geopotential pressure altitude (m)
    const double T_K;          ///< Temperature (K)
    const double dT_K;         ///< Temperature offset used to compute the state (K)
    const double p_Pa;         ///< Pressure (Pa)
    const double rho_kg_m3;    ///< Density (kg/m³)
    const double a_m_s;        ///< Speed of sound (m/s)

    AtmosConditions(double Hp_m_, double T_K_, double dT_K_, double p_Pa_, double rho_kg_m3_, double a_m_s_);
};

/// @brief Computes the atmospheric state at a pressure altitude
/// @param Hp Geopotential pressure altitude (m)
/// @param dT Temperature offset from the standard day (K)
auto conditions(double Hp, double dT = 0.0) -> AtmosConditions;

std::ostream& operator<<(std::ostream& os, const AtmosConditions& cond);

} // namespace isa

#pragma once

namespace isa {
namespace constants {

// ============================================
// ISA SEA-LEVEL REFERENCE VALUES
// ============================================

constexpr double T0_K = 288.15;          ///< Temperature at mean sea level (K)
constexpr double p0_Pa = 101325.0;       ///< Pressure at mean sea level (Pa)
constexpr double rho0_kg_m3 = 1.225;     ///< Density at mean sea level (kg/m³)
constexpr double a0_m_s = 340.294;       ///< Speed of sound at mean sea level (m/s)

// ============================================
// AIR PROPERTIES
// ============================================

constexpr double kappa = 1.4;                    ///< Adiabatic index of air
constexpr double mu = (kappa - 1.0) / kappa;     ///< Exponent used by the Vcas <-> Vtas relations
constexpr double R_m2_K_s2 = 287.05287;          ///< Specific gas constant for air (m²/(K·s²))
constexpr double g0_m_s2 = 9.80665;              ///< Gravitational acceleration (m/s²)

// ============================================
// TEMPERATURE PROFILE
// ============================================

constexpr double betaT_K_m = -0.0065;    ///< Temperature gradient below the tropopause (K/m)
constexpr double Hp_trop_m = 11000.0;    ///< Geopotential pressure altitude of the tropopause (m)

} // namespace constants
} // namespace isa

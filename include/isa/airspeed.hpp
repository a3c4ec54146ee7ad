#pragma once

#include "isa/conditions.hpp"

namespace isa {

// ============================================
// CALIBRATED <-> TRUE AIRSPEED
// ============================================

/// @brief Converts calibrated airspeed to true airspeed
///
/// @details Compressible flow relation between the impact pressure measured
///          against sea-level conditions and the local conditions:
///
///          Vtas = sqrt( 2p/(μρ) · ( (1 + p₀/p · ((1 + μρ₀/(2p₀)·Vcas²)^(1/μ) - 1))^μ - 1 ) )
///
///          where ρ = ρ(p, T).
///
/// @param Vcas Calibrated airspeed (m/s)
/// @param p Pressure (Pa)
/// @param T Temperature (K)
/// @return True airspeed (m/s)
double vcas_to_vtas(double Vcas, double p, double T);

/// @brief Converts calibrated airspeed to true airspeed using a snapshot's p and T
double vcas_to_vtas(double Vcas, const AtmosConditions& cond);

/// @brief Converts true airspeed to calibrated airspeed
///
/// @details Mirror of vcas_to_vtas() with the local (p, ρ) and sea-level
///          (p₀, ρ₀) roles swapped:
///
///          Vcas = sqrt( 2p₀/(μρ₀) · ( (1 + p/p₀ · ((1 + μρ/(2p)·Vtas²)^(1/μ) - 1))^μ - 1 ) )
///
/// @param Vtas True airspeed (m/s)
/// @param p Pressure (Pa)
/// @param T Temperature (K)
/// @return Calibrated airspeed (m/s)
double vtas_to_vcas(double Vtas, double p, double T);

double vtas_to_vcas(double Vtas, const AtmosConditions& cond);

// ============================================
// MACH <-> TRUE AIRSPEED
// ============================================

/// @brief True airspeed for a Mach number, Vtas = M·a(T)
double mach_to_vtas(double M, double T);

/// @brief True airspeed for a Mach number using the snapshot's speed of sound
double mach_to_vtas(double M, const AtmosConditions& cond);

/// @brief Mach number for a true airspeed, M = Vtas/a(T)
double vtas_to_mach(double Vtas, double T);

double vtas_to_mach(double Vtas, const AtmosConditions& cond);

// ============================================
// MACH <-> CALIBRATED AIRSPEED
// ============================================

/// @brief Calibrated airspeed for a Mach number (through true airspeed)
double mach_to_vcas(double M, double p, double T);

double mach_to_vcas(double M, const AtmosConditions& cond);

/// @brief Mach number for a calibrated airspeed (through true airspeed)
double vcas_to_mach(double Vcas, double p, double T);

double vcas_to_mach(double Vcas, const AtmosConditions& cond);

// ============================================
// CROSSOVER ALTITUDE
// ============================================

/// @brief Transition (crossover) altitude between a calibrated airspeed and a Mach number
///
/// @details Pressure altitude at which Vcas and M correspond to the same true
///          airspeed, in closed form:
///
///          δ_trans = ((1 + (κ-1)/2·(Vcas/a₀)²)^(1/μ) - 1) / ((1 + (κ-1)/2·M²)^(1/μ) - 1)
///          θ_trans = δ_trans^(-βT·R/g₀)
///          Hp_trans = T₀/βT · (θ_trans - 1)
///
/// @note Only valid below the tropopause; the result is not checked against it.
///       The pressure altitude does not depend on the temperature offset, so
///       dT has no effect on the result.
///
/// @param Vcas Calibrated airspeed (m/s)
/// @param M Mach number
/// @param dT Temperature offset from the standard day (K)
/// @return Transition altitude (m)
double transition_altitude(double Vcas, double M, double dT = 0.0);

} // namespace isa

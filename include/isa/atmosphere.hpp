#pragma once

namespace isa {

/// @brief Standard atmosphere temperature
/// @details Below the tropopause: T = T₀ + ΔT + βT·Hp.
///          Above it the temperature stays at its tropopause value.
/// @param Hp Geopotential pressure altitude (m)
/// @param dT Temperature offset from the standard day (K)
/// @return Temperature (K)
double temperature(double Hp, double dT = 0.0);

/// @brief Standard atmosphere pressure
/// @details Below the tropopause the pressure follows the power law
///          p = p₀·((T - ΔT)/T₀)^(-g₀/(βT·R)), i.e. the offset is removed
///          from the temperature ratio. Above it the isothermal barometric
///          formula is applied starting from the tropopause pressure, with
///          the standard (ΔT = 0) tropopause temperature in the exponent.
/// @param Hp Geopotential pressure altitude (m)
/// @param dT Temperature offset from the standard day (K)
/// @return Pressure (Pa)
double pressure(double Hp, double dT = 0.0);

/// @brief Air density from the ideal gas law ρ = p/(R·T)
/// @param p Pressure (Pa)
/// @param T Temperature (K)
/// @return Density (kg/m³)
double density(double p, double T);

/// @brief Speed of sound a = sqrt(κ·R·T)
/// @note Returns NaN for negative temperatures.
double speed_of_sound(double T);

/// @brief Temperature ratio θ = T/T₀
double theta(double T);

/// @brief Pressure ratio δ = p/p₀
double delta(double p);

/// @brief Density ratio σ = ρ/ρ₀
double sigma(double rho);

} // namespace isa

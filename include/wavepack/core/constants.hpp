#pragma once

#include <cstddef>

namespace wavepack::constants {

// ================================================================================================
// FUNDAMENTAL PHYSICAL CONSTANTS
// ================================================================================================

namespace physical {
/// Speed of light in vacuum [m/s]
inline constexpr double speed_of_light = 2.998e8;

/// Mathematical constant π
inline constexpr double pi = 3.14159265358979323846;

/// Reference temperature for the baseline property tables [K]
inline constexpr double reference_temperature = 273.15;

/// Sutherland constant used for the viscosity law [K]
inline constexpr double sutherland_constant = 110.0;

/// Offset between the Fahrenheit and Rankine scales
inline constexpr double rankine_offset = 459.67;
}  // namespace physical

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
inline constexpr double inch_to_m = 0.0254;
inline constexpr double foot_to_m = 0.3048;
inline constexpr double psi_to_pa = 6894.76;
inline constexpr double kg_to_lbm = 2.20462;
inline constexpr double hz_to_ghz = 1.0e-9;

/// Kelvin per Rankine degree
inline constexpr double rankine_to_kelvin = 5.0 / 9.0;

/// Progress percentage conversion factor
inline constexpr double to_percentage = 100.0;
}  // namespace conversion

// ================================================================================================
// FLOW MODEL
// ================================================================================================

namespace flow {
/// Laminar/turbulent transition; Re at or above this value is turbulent
inline constexpr double transition_reynolds = 2300.0;

/// Hagen-Poiseuille laminar friction coefficient (f = 64/Re)
inline constexpr double laminar_coefficient = 64.0;

/// Swamee-Jain coefficients
namespace swamee_jain {
inline constexpr double numerator = 0.25;
inline constexpr double roughness_divisor = 3.7;
inline constexpr double reynolds_coefficient = 5.74;
inline constexpr double reynolds_exponent = 0.9;
}  // namespace swamee_jain
}  // namespace flow

// ================================================================================================
// ELECTROMAGNETIC MODEL
// ================================================================================================

namespace electromagnetics {
/// First root of J1' for the TE11 mode of a circular guide
inline constexpr double te11_root = 1.8412;

/// Attenuation used at or below cutoff
inline constexpr double below_cutoff_alpha = 1.0;

/// Default decade range of the frequency sweep [log10 Hz]
inline constexpr int default_decade_min = 5;
inline constexpr int default_decade_max = 10;

/// Accepted decade range; 10^decade stays a finite, normal double
inline constexpr int min_decade = -300;
inline constexpr int max_decade = 300;
}  // namespace electromagnetics

// ================================================================================================
// GEOMETRY AND SIZING
// ================================================================================================

namespace geometry {
inline constexpr int min_channels = 1;
inline constexpr int max_channels = 2500;

/// Assumed back-pressure fraction of the dynamic pressure per channel
inline constexpr double back_pressure_margin = 0.1;

/// Hexagonal packing efficiency applied to staggered circular channels
inline constexpr double staggered_packing = 0.9069;

inline constexpr double rectangular_open_ratio = 1.0;
}  // namespace geometry

// ================================================================================================
// DEFAULTS
// ================================================================================================

namespace defaults {
inline constexpr int temperature_samples = 10;
inline constexpr int min_temperature_samples = 2;

/// Compliance thresholds used by the report
inline constexpr double min_shielding_db = 80.0;
inline constexpr double shielding_check_frequency_hz = 1.0e9;
}  // namespace defaults

// ================================================================================================
// FILE I/O AND FORMATTING CONSTANTS
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Default HDF5 chunk size for datasets
inline constexpr std::size_t default_hdf5_chunk_size = 1024;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Default WAVEPACK version string
inline constexpr const char* default_wavepack_version = "1.0.0";
}  // namespace io

// ================================================================================================
// ARRAY AND INDEXING CONSTANTS
// ================================================================================================

namespace indexing {
inline constexpr std::size_t first = 0;
inline constexpr std::size_t second = 1;
inline constexpr std::size_t third = 2;
}  // namespace indexing

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
/// Length of comma-space separator for options
inline constexpr std::size_t option_separator_length = 2;

/// Format precision for floating point display
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_3 = 3;
inline constexpr int float_precision_4 = 4;

/// Field widths for tabular output
inline constexpr int narrow_field_width = 6;
inline constexpr int medium_field_width = 8;
inline constexpr int wide_field_width = 10;
inline constexpr int separator_width = 36;

/// ANSI escape sequences for console output
namespace colors {
inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* blue = "\033[34m";
inline constexpr const char* cyan = "\033[36m";
inline constexpr const char* reset = "\033[0m";
}  // namespace colors
}  // namespace string_processing

}  // namespace wavepack::constants

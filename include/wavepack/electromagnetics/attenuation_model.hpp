#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "../geometry/geometry_types.hpp"
#include "../properties/property_library.hpp"
#include <expected>
#include <optional>
#include <vector>

namespace wavepack::electromagnetics {

// Waveguide-below-cutoff shielding of one channel
struct AttenuationResult {
  double cutoff_frequency;          // [Hz]
  std::vector<double> frequencies;  // [Hz], ascending
  std::vector<double> alpha;        // [1/m], aligned with frequencies
  std::vector<double> shielding_db; // [dB], aligned with frequencies

  // SE at the sweep point matching the given frequency, if it was swept
  [[nodiscard]] auto shielding_at(double frequency) const -> std::optional<double>;
};

// SE of the sweep point within 1e-9 relative of the given frequency, if any
[[nodiscard]] auto lookup_shielding(const std::vector<double>& frequencies, const std::vector<double>& shielding_db,
                                    double frequency) -> std::optional<double>;

// One point per decade, 10^decade_min ... 10^decade_max [Hz]
[[nodiscard]] auto decade_sweep(int decade_min = constants::electromagnetics::default_decade_min,
                                int decade_max = constants::electromagnetics::default_decade_max)
    -> std::expected<std::vector<double>, core::SolveError>;

// TE10-style rectangular or TE11 circular cutoff, scaled by 1/sqrt(μr·εr)
[[nodiscard]] auto cutoff_frequency(const geometry::ChannelGeometry& channel,
                                    const properties::MaterialProperties& material)
    -> std::expected<double, core::SolveError>;

// Below or at cutoff the attenuation is floored to 1 Np/m
[[nodiscard]] auto attenuation_constant(double frequency, double cutoff, double mu_eps) noexcept -> double;

// 20·log10(exp(α·L)), evaluated without forming the exponential
[[nodiscard]] auto shielding_effectiveness(double alpha, double length) noexcept -> double;

[[nodiscard]] auto evaluate(const geometry::ChannelGeometry& channel, const properties::MaterialProperties& material,
                            const std::vector<double>& frequencies)
    -> std::expected<AttenuationResult, core::SolveError>;

} // namespace wavepack::electromagnetics

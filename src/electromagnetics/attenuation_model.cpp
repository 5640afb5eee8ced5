#include "wavepack/electromagnetics/attenuation_model.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace wavepack::electromagnetics {

auto lookup_shielding(const std::vector<double>& frequencies, const std::vector<double>& shielding_db,
                      double frequency) -> std::optional<double> {
  for (std::size_t i = 0; i < frequencies.size() && i < shielding_db.size(); ++i) {
    if (std::fabs(frequencies[i] - frequency) <= 1e-9 * std::fabs(frequency)) {
      return shielding_db[i];
    }
  }
  return std::nullopt;
}

auto AttenuationResult::shielding_at(double frequency) const -> std::optional<double> {
  return lookup_shielding(frequencies, shielding_db, frequency);
}

auto decade_sweep(int decade_min, int decade_max) -> std::expected<std::vector<double>, core::SolveError> {
  constexpr int lowest = constants::electromagnetics::min_decade;
  constexpr int highest = constants::electromagnetics::max_decade;
  if (decade_min < lowest || decade_min > highest) {
    return std::unexpected(core::InvalidInputError("frequency_decade_min", std::to_string(decade_min),
                                                   std::format("Decade must lie in [{}, {}]", lowest, highest)));
  }
  if (decade_max < lowest || decade_max > highest) {
    return std::unexpected(core::InvalidInputError("frequency_decade_max", std::to_string(decade_max),
                                                   std::format("Decade must lie in [{}, {}]", lowest, highest)));
  }
  if (decade_max < decade_min) {
    return std::unexpected(core::InvalidInputError(
        "frequency_decade_max", std::to_string(decade_max),
        std::format("Upper decade must not be below the lower decade ({})", decade_min)));
  }

  std::vector<double> frequencies;
  frequencies.reserve(static_cast<std::size_t>(decade_max - decade_min + 1));
  for (int decade = decade_min; decade <= decade_max; ++decade) {
    frequencies.push_back(std::pow(10.0, decade));
  }
  return frequencies;
}

auto cutoff_frequency(const geometry::ChannelGeometry& channel, const properties::MaterialProperties& material)
    -> std::expected<double, core::SolveError> {

  const double mu_eps = material.relative_permeability * material.relative_permittivity;
  if (!(mu_eps > 0.0) || !std::isfinite(mu_eps)) {
    return std::unexpected(core::DomainError("mu_r*eps_r", std::format("{}", mu_eps),
                                             "Relative permeability-permittivity product must be positive"));
  }
  if (!(channel.width > 0.0)) {
    return std::unexpected(core::DomainError("a", std::format("{}", channel.width), "Channel dimension must be positive"));
  }

  constexpr double c = constants::physical::speed_of_light;

  switch (channel.shape) {
  case geometry::ChannelShape::Rectangular: {
    if (!(channel.height > 0.0)) {
      return std::unexpected(
          core::DomainError("b", std::format("{}", channel.height), "Channel dimension must be positive"));
    }
    const double inv_a = 1.0 / channel.width;
    const double inv_b = 1.0 / channel.height;
    return (c / 2.0) * std::sqrt(inv_a * inv_a + inv_b * inv_b) / std::sqrt(mu_eps);
  }
  case geometry::ChannelShape::CircularInline:
  case geometry::ChannelShape::CircularStaggered:
    return constants::electromagnetics::te11_root * c / (std::numbers::pi * channel.width * std::sqrt(mu_eps));
  }

  return std::unexpected(core::InvalidInputError("shape", std::to_string(static_cast<int>(channel.shape)),
                                                 "Unhandled channel shape"));
}

auto attenuation_constant(double frequency, double cutoff, double mu_eps) noexcept -> double {
  if (frequency <= cutoff) {
    return constants::electromagnetics::below_cutoff_alpha;
  }
  return (2.0 * std::numbers::pi / constants::physical::speed_of_light) *
         std::sqrt(mu_eps * (frequency * frequency - cutoff * cutoff));
}

auto shielding_effectiveness(double alpha, double length) noexcept -> double {
  return 20.0 * alpha * length * std::numbers::log10e;
}

auto evaluate(const geometry::ChannelGeometry& channel, const properties::MaterialProperties& material,
              const std::vector<double>& frequencies) -> std::expected<AttenuationResult, core::SolveError> {

  if (!(channel.length > 0.0)) {
    return std::unexpected(
        core::DomainError("L", std::format("{}", channel.length), "Channel length must be positive"));
  }

  AttenuationResult result;
  auto fc = cutoff_frequency(channel, material);
  if (!fc) {
    return std::unexpected(fc.error());
  }
  result.cutoff_frequency = fc.value();

  const double mu_eps = material.relative_permeability * material.relative_permittivity;

  result.frequencies = frequencies;
  result.alpha.reserve(frequencies.size());
  result.shielding_db.reserve(frequencies.size());
  for (double f : frequencies) {
    const double alpha = attenuation_constant(f, result.cutoff_frequency, mu_eps);
    result.alpha.push_back(alpha);
    result.shielding_db.push_back(shielding_effectiveness(alpha, channel.length));
  }

  return result;
}

} // namespace wavepack::electromagnetics

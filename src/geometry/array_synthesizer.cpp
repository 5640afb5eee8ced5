#include "wavepack/geometry/array_synthesizer.hpp"
#include "wavepack/core/constants.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace wavepack::geometry {

namespace {

auto integer_sqrt(int n) noexcept -> int {
  int root = static_cast<int>(std::sqrt(static_cast<double>(n)));
  while (root > 0 && root * root > n) {
    --root;
  }
  while ((root + 1) * (root + 1) <= n) {
    ++root;
  }
  return root;
}

} // namespace

auto channel_section(const ChannelGeometry& channel) -> std::expected<ChannelSection, core::SolveError> {
  if (!(channel.width > 0.0)) {
    return std::unexpected(core::DomainError("a", std::format("{}", channel.width), "Channel dimension must be positive"));
  }

  switch (channel.shape) {
  case ChannelShape::Rectangular: {
    if (!(channel.height > 0.0)) {
      return std::unexpected(
          core::DomainError("b", std::format("{}", channel.height), "Channel dimension must be positive"));
    }
    const double a = channel.width;
    const double b = channel.height;
    return ChannelSection{2.0 * a * b / (a + b), constants::geometry::rectangular_open_ratio, a * b, a, b};
  }
  case ChannelShape::CircularInline:
  case ChannelShape::CircularStaggered: {
    const double d = channel.width;
    const double inline_ratio = std::numbers::pi / 4.0;
    const double ratio = channel.shape == ChannelShape::CircularInline
                             ? inline_ratio
                             : constants::geometry::staggered_packing * inline_ratio;
    return ChannelSection{d, ratio, std::numbers::pi * d * d / 4.0, d, d};
  }
  }

  return std::unexpected(core::InvalidInputError("shape", std::to_string(static_cast<int>(channel.shape)),
                                                 "Unhandled channel shape"));
}

auto required_channel_count(double open_ratio, double dp_limit, double density, double velocity)
    -> std::expected<int, core::SolveError> {
  if (!(dp_limit > 0.0)) {
    return std::unexpected(
        core::DomainError("dp_limit", std::format("{}", dp_limit), "Pressure-drop limit must be positive"));
  }
  if (!(density > 0.0)) {
    return std::unexpected(core::DomainError("density", std::format("{}", density), "Density must be positive"));
  }
  if (!(velocity > 0.0)) {
    return std::unexpected(core::DomainError("velocity", std::format("{}", velocity), "Velocity must be positive"));
  }

  const double raw =
      std::floor(open_ratio * dp_limit / (constants::geometry::back_pressure_margin * density * (velocity * velocity)));
  // Clamped before the integer cast
  const double bounded = std::clamp(raw, static_cast<double>(constants::geometry::min_channels),
                                    static_cast<double>(constants::geometry::max_channels));
  return static_cast<int>(bounded);
}

auto square_layout(int channels_required, LayoutPolicy policy) noexcept -> ArrayLayout {
  const int required =
      std::clamp(channels_required, constants::geometry::min_channels, constants::geometry::max_channels);
  int side = integer_sqrt(required);

  if (policy == LayoutPolicy::RoundUpToSquare && side * side < required) {
    ++side;
    if (side * side > constants::geometry::max_channels) {
      side = integer_sqrt(constants::geometry::max_channels);
    }
  }

  return ArrayLayout{side, side, required, side * side};
}

auto synthesize_envelope(const ChannelGeometry& channel, const ChannelSection& section, const ArrayLayout& layout,
                         double material_density) -> std::expected<Envelope, core::SolveError> {
  if (!(channel.wall_thickness > 0.0)) {
    return std::unexpected(core::DomainError("t", std::format("{}", channel.wall_thickness),
                                             "Wall thickness must be positive"));
  }
  if (!(channel.length > 0.0)) {
    return std::unexpected(
        core::DomainError("L", std::format("{}", channel.length), "Channel length must be positive"));
  }
  if (!(material_density > 0.0)) {
    return std::unexpected(core::DomainError("material_density", std::format("{}", material_density),
                                             "Material density must be positive"));
  }

  Envelope envelope{};
  envelope.width = layout.columns * (section.footprint_width + 2.0 * channel.wall_thickness);
  envelope.height = layout.rows * (section.footprint_height + 2.0 * channel.wall_thickness);
  envelope.envelope_volume = envelope.width * envelope.height * channel.length;
  envelope.void_volume = layout.channels_placed * section.flow_area * channel.length;

  if (envelope.void_volume > envelope.envelope_volume) {
    return std::unexpected(core::DomainError(
        "void_volume", std::format("{}", envelope.void_volume),
        std::format("Channel void exceeds envelope volume {} m³; mass would be negative", envelope.envelope_volume)));
  }

  envelope.mass_kg = material_density * (envelope.envelope_volume - envelope.void_volume);
  envelope.mass_lbm = envelope.mass_kg * constants::conversion::kg_to_lbm;
  return envelope;
}

} // namespace wavepack::geometry

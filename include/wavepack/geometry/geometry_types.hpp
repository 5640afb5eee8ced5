#pragma once
#include <string_view>

namespace wavepack::geometry {

enum class ChannelShape { Rectangular, CircularInline, CircularStaggered };

// How the required channel count is mapped onto a square array
enum class LayoutPolicy {
  Truncate,       // floor(sqrt(N)) per side, shortfall reported
  RoundUpToSquare // next complete square, capped at the channel limit
};

[[nodiscard]] constexpr auto is_circular(ChannelShape shape) noexcept -> bool {
  return shape != ChannelShape::Rectangular;
}

[[nodiscard]] constexpr auto shape_name(ChannelShape shape) noexcept -> std::string_view {
  switch (shape) {
  case ChannelShape::Rectangular:
    return "Rectangular";
  case ChannelShape::CircularInline:
    return "Circular-Inline";
  case ChannelShape::CircularStaggered:
    return "Circular-Staggered";
  }
  return "Unknown";
}

[[nodiscard]] constexpr auto layout_policy_name(LayoutPolicy policy) noexcept -> std::string_view {
  switch (policy) {
  case LayoutPolicy::Truncate:
    return "truncate";
  case LayoutPolicy::RoundUpToSquare:
    return "round_up";
  }
  return "unknown";
}

// Single channel, SI units. For circular shapes width is the diameter and height is unused.
struct ChannelGeometry {
  ChannelShape shape = ChannelShape::Rectangular;
  double width = 0.0;          // a [m]
  double height = 0.0;         // b [m]
  double wall_thickness = 0.0; // t [m]
  double length = 0.0;         // L [m]
};

} // namespace wavepack::geometry

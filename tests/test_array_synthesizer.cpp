#include "wavepack/geometry/array_synthesizer.hpp"
#include <cmath>
#include <iostream>
#include <numbers>

int main() {
  using namespace wavepack::geometry;
  using wavepack::core::ErrorKind;

  // Channel count bounds
  for (double dp : {1e-9, 1.0, 1e3, 1e6, 1e12}) {
    auto n = required_channel_count(0.6, dp, 1.2, 15.0);
    if (!n || *n < 1 || *n > 2500) {
      std::cerr << "Channel count out of [1, 2500] for dp = " << dp << "\n";
      return 1;
    }
  }
  auto huge = required_channel_count(0.6, 1e12, 1.2, 15.0);
  if (!huge || *huge != 2500) {
    std::cerr << "Large ratios must clamp to 2500\n";
    return 1;
  }
  if (auto tiny = required_channel_count(0.6, 1e-9, 1.2, 15.0); !tiny || *tiny != 1) {
    std::cerr << "Small ratios must clamp to 1\n";
    return 1;
  }
  auto no_velocity = required_channel_count(0.6, 1.0, 1.2, 0.0);
  if (no_velocity || no_velocity.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero velocity\n";
    return 1;
  }

  // Layout policies
  auto truncated = square_layout(1419, LayoutPolicy::Truncate);
  if (truncated.rows != 37 || truncated.columns != 37 || truncated.channels_placed != 1369 ||
      truncated.shortfall() != 50) {
    std::cerr << "Truncate layout of 1419 should be 37 x 37 with a shortfall of 50\n";
    return 1;
  }
  auto rounded = square_layout(1419, LayoutPolicy::RoundUpToSquare);
  if (rounded.rows != 38 || rounded.channels_placed != 1444 || rounded.shortfall() > 0) {
    std::cerr << "Round-up layout of 1419 should be 38 x 38\n";
    return 1;
  }
  auto exact = square_layout(144, LayoutPolicy::RoundUpToSquare);
  if (exact.rows != 12 || exact.shortfall() != 0) {
    std::cerr << "Complete squares are kept as is\n";
    return 1;
  }
  auto capped = square_layout(2499, LayoutPolicy::RoundUpToSquare);
  if (capped.rows * capped.columns > 2500) {
    std::cerr << "Round-up must stay within 2500 channels\n";
    return 1;
  }
  if (square_layout(1, LayoutPolicy::Truncate).rows != 1) {
    std::cerr << "A single channel is a 1 x 1 array\n";
    return 1;
  }

  // Sections
  ChannelGeometry rect{ChannelShape::Rectangular, 0.0508, 0.0254, 0.00127, 0.1524};
  auto rect_section = channel_section(rect);
  if (!rect_section || std::fabs(rect_section->hydraulic_diameter - 0.0338666666666667) > 1e-12 ||
      rect_section->open_ratio != 1.0) {
    std::cerr << "Rectangular section mismatch\n";
    return 1;
  }

  ChannelGeometry inline_tube{ChannelShape::CircularInline, 0.00635, 0.0, 0.000508, 0.0254};
  ChannelGeometry staggered_tube = inline_tube;
  staggered_tube.shape = ChannelShape::CircularStaggered;
  auto inline_section = channel_section(inline_tube);
  auto staggered_section = channel_section(staggered_tube);
  if (!inline_section || !staggered_section ||
      std::fabs(inline_section->open_ratio - std::numbers::pi / 4.0) > 1e-15 ||
      std::fabs(staggered_section->open_ratio - 0.9069 * std::numbers::pi / 4.0) > 1e-15 ||
      inline_section->hydraulic_diameter != 0.00635) {
    std::cerr << "Circular section mismatch\n";
    return 1;
  }

  // Envelope and mass
  auto envelope = synthesize_envelope(rect, *rect_section, truncated, 8000.0);
  if (!envelope) {
    std::cerr << envelope.error().message() << "\n";
    return 1;
  }
  if (std::fabs(envelope->mass_lbm - 735.9380744761052) > 1e-6 || envelope->mass_kg < 0.0) {
    std::cerr << "Reference envelope mass mismatch: " << envelope->mass_lbm << "\n";
    return 1;
  }
  if (std::fabs(envelope->width / 0.0254 - 77.7) > 1e-9 || std::fabs(envelope->height / 0.0254 - 40.7) > 1e-9) {
    std::cerr << "Reference envelope dimensions mismatch\n";
    return 1;
  }

  auto no_wall = rect;
  no_wall.wall_thickness = 0.0;
  auto thin = synthesize_envelope(no_wall, *rect_section, truncated, 8000.0);
  if (thin || thin.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero wall thickness\n";
    return 1;
  }

  // A void larger than the envelope would give negative mass
  ChannelSection oversized = *rect_section;
  oversized.flow_area *= 10.0;
  auto negative = synthesize_envelope(rect, oversized, truncated, 8000.0);
  if (negative || negative.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error for negative mass\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

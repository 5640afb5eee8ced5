#pragma once
#include "../core/exceptions.hpp"
#include "geometry_types.hpp"
#include <expected>

namespace wavepack::geometry {

// Shape-derived properties of one channel
struct ChannelSection {
  double hydraulic_diameter; // [m]
  double open_ratio;         // fraction of the duct section that carries flow
  double flow_area;          // [m²]
  double footprint_width;    // [m], excluding walls
  double footprint_height;   // [m], excluding walls
};

struct ArrayLayout {
  int rows;
  int columns;
  int channels_required;
  int channels_placed;

  [[nodiscard]] auto shortfall() const noexcept -> int { return channels_required - channels_placed; }
};

struct Envelope {
  double width;           // [m]
  double height;          // [m]
  double envelope_volume; // [m³]
  double void_volume;     // [m³]
  double mass_kg;
  double mass_lbm;
};

[[nodiscard]] auto channel_section(const ChannelGeometry& channel) -> std::expected<ChannelSection, core::SolveError>;

/**
 * @brief Sizing heuristic for the number of parallel channels
 *
 * N = clamp(floor(open_ratio · dp_limit / (0.1 · ρ · v²)), 1, 2500), where 0.1 is an
 * assumed back-pressure fraction of the dynamic pressure. Not a hydraulic solve.
 */
[[nodiscard]] auto required_channel_count(double open_ratio, double dp_limit, double density, double velocity)
    -> std::expected<int, core::SolveError>;

// Square array; side = floor(sqrt(N)) or the next complete square per policy
[[nodiscard]] auto square_layout(int channels_required, LayoutPolicy policy) noexcept -> ArrayLayout;

// Envelope adds 2t per channel in both directions; mass = ρ·(envelope - void)
[[nodiscard]] auto synthesize_envelope(const ChannelGeometry& channel, const ChannelSection& section,
                                       const ArrayLayout& layout, double material_density)
    -> std::expected<Envelope, core::SolveError>;

} // namespace wavepack::geometry

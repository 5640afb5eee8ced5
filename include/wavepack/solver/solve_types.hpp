#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include "../flow/flow_solver.hpp"
#include "../geometry/geometry_types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wavepack::solver {

// One case as entered by the user (imperial units)
struct SolveInput {
  double a_in = 0.0; // channel width, or diameter for circular shapes
  double b_in = 0.0; // channel height, ignored for circular shapes
  double t_in = 0.0; // wall thickness
  double L_in = 0.0; // channel length
  geometry::ChannelShape shape = geometry::ChannelShape::Rectangular;
  std::string material;
  std::string fluid;
  double vel_target_fts = 0.0;
  double dp_limit_psi = 0.0;
  double T_min_F = 0.0;
  double T_max_F = 0.0;
};

struct SolveOptions {
  int temperature_samples = constants::defaults::temperature_samples;
  int frequency_decade_min = constants::electromagnetics::default_decade_min;
  int frequency_decade_max = constants::electromagnetics::default_decade_max;
  geometry::LayoutPolicy layout_policy = geometry::LayoutPolicy::Truncate;
  bool temperature_sweep = true;
};

// Columns of SolveResult::temperature_sweep
namespace sweep_columns {
inline constexpr std::size_t temperature_f = 0;
inline constexpr std::size_t temperature_k = 1;
inline constexpr std::size_t density = 2;
inline constexpr std::size_t viscosity = 3;
inline constexpr std::size_t reynolds = 4;
inline constexpr std::size_t friction_factor = 5;
inline constexpr std::size_t delta_p_psi = 6;
inline constexpr std::size_t count = 7;

inline constexpr const char* names[count] = {"T_F", "T_K", "density", "viscosity",
                                             "reynolds", "friction_factor", "deltaP_psi"};
inline constexpr const char* units[count] = {"degF", "K", "kg/m^3", "Pa*s", "", "", "psi"};
} // namespace sweep_columns

// Intermediate quantities kept for reporting
struct SolveDiagnostics {
  double hydraulic_diameter_m = 0.0;
  double open_ratio = 0.0;
  double density = 0.0;   // mean over the temperature range [kg/m³]
  double viscosity = 0.0; // mean over the temperature range [Pa·s]
  double reynolds = 0.0;
  double friction_factor = 0.0;
  flow::FlowRegime regime = flow::FlowRegime::Laminar;
  int channels_required = 0;
  int channels_placed = 0;
  int channel_shortfall = 0;
  double envelope_width_in = 0.0;
  double envelope_height_in = 0.0;
  double total_mass_kg = 0.0;
  geometry::LayoutPolicy layout_policy = geometry::LayoutPolicy::Truncate;
};

struct SolveResult {
  std::pair<int, int> array_dims{0, 0}; // rows x columns
  double velocity_fts = 0.0;
  double delta_p_psi = 0.0;
  double fc_ghz = 0.0;
  std::vector<double> se_db; // aligned with freqs
  std::vector<double> freqs; // [Hz]
  double total_weight_lbm = 0.0;
  double a_in = 0.0;
  double b_in = 0.0;
  double t_in = 0.0;
  double L_ft = 0.0;

  SolveDiagnostics diagnostics;

  // One row per temperature sample, see sweep_columns
  core::Matrix<double> temperature_sweep;

  // SE at the swept frequency matching the argument, if present
  [[nodiscard]] auto shielding_at(double frequency) const -> std::optional<double>;
};

} // namespace wavepack::solver

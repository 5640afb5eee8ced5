#include "wavepack/solver/wavepack_solver.hpp"
#include "wavepack/core/expected_utils.hpp"
#include "wavepack/flow/flow_solver.hpp"
#include <cmath>
#include <format>

namespace wavepack::solver {

namespace {

auto require_finite(std::string_view field, double value) -> std::expected<void, core::SolveError> {
  if (!std::isfinite(value)) {
    return std::unexpected(core::InvalidInputError(std::string(field), std::format("{}", value), "Value is not finite"));
  }
  return {};
}

auto require_positive(std::string_view field, double value) -> std::expected<void, core::SolveError> {
  if (value <= 0.0) {
    return std::unexpected(core::DomainError(std::string(field), std::format("{}", value), "Value must be positive"));
  }
  return {};
}

} // namespace

auto SolveResult::shielding_at(double frequency) const -> std::optional<double> {
  return electromagnetics::lookup_shielding(freqs, se_db, frequency);
}

auto WavepackSolver::resolve(const SolveInput& input) const -> std::expected<ResolvedCase, core::SolveError> {
  WAVEPACK_TRY_VOID(require_finite("a_in", input.a_in));
  WAVEPACK_TRY_VOID(require_finite("b_in", input.b_in));
  WAVEPACK_TRY_VOID(require_finite("t_in", input.t_in));
  WAVEPACK_TRY_VOID(require_finite("L_in", input.L_in));
  WAVEPACK_TRY_VOID(require_finite("vel_target_fts", input.vel_target_fts));
  WAVEPACK_TRY_VOID(require_finite("dp_limit_psi", input.dp_limit_psi));
  WAVEPACK_TRY_VOID(require_finite("T_min_F", input.T_min_F));
  WAVEPACK_TRY_VOID(require_finite("T_max_F", input.T_max_F));

  WAVEPACK_TRY_VOID(require_positive("a_in", input.a_in));
  if (input.shape == geometry::ChannelShape::Rectangular) {
    WAVEPACK_TRY_VOID(require_positive("b_in", input.b_in));
  }
  WAVEPACK_TRY_VOID(require_positive("t_in", input.t_in));
  WAVEPACK_TRY_VOID(require_positive("L_in", input.L_in));
  WAVEPACK_TRY_VOID(require_positive("vel_target_fts", input.vel_target_fts));
  WAVEPACK_TRY_VOID(require_positive("dp_limit_psi", input.dp_limit_psi));

  ResolvedCase resolved{};
  resolved.channel.shape = input.shape;
  resolved.channel.width = inches_to_meters(input.a_in);
  resolved.channel.height = geometry::is_circular(input.shape) ? resolved.channel.width : inches_to_meters(input.b_in);
  resolved.channel.wall_thickness = inches_to_meters(input.t_in);
  resolved.channel.length = inches_to_meters(input.L_in);
  resolved.velocity = feet_to_meters(input.vel_target_fts);
  resolved.dp_limit = psi_to_pascal(input.dp_limit_psi);

  WAVEPACK_TRY_ASSIGN(resolved.material, library_.lookup_material(input.material));
  WAVEPACK_TRY_ASSIGN(resolved.fluid, library_.lookup_fluid(input.fluid));

  return resolved;
}

auto WavepackSolver::solve(const SolveInput& input) const -> std::expected<SolveResult, core::SolveError> {
  ResolvedCase resolved;
  WAVEPACK_TRY_ASSIGN(resolved, resolve(input));

  properties::TemperatureProfile profile;
  WAVEPACK_TRY_ASSIGN(profile, properties::interpolate_profile(resolved.fluid, input.T_min_F, input.T_max_F,
                                                               options_.temperature_samples));
  const double rho = profile.mean_density;
  const double mu = profile.mean_viscosity;

  geometry::ChannelSection section;
  WAVEPACK_TRY_ASSIGN(section, geometry::channel_section(resolved.channel));

  int channels_required = 0;
  WAVEPACK_TRY_ASSIGN(channels_required,
                      geometry::required_channel_count(section.open_ratio, resolved.dp_limit, rho, resolved.velocity));

  flow::ChannelFlow channel_flow;
  WAVEPACK_TRY_ASSIGN(channel_flow, flow::solve_channel(rho, resolved.velocity, mu, resolved.channel.length,
                                                        section.hydraulic_diameter, resolved.material.roughness));

  std::vector<double> frequencies;
  WAVEPACK_TRY_ASSIGN(frequencies, electromagnetics::decade_sweep(options_.frequency_decade_min,
                                                                  options_.frequency_decade_max));
  electromagnetics::AttenuationResult attenuation;
  WAVEPACK_TRY_ASSIGN(attenuation, electromagnetics::evaluate(resolved.channel, resolved.material, frequencies));

  const auto layout = geometry::square_layout(channels_required, options_.layout_policy);
  geometry::Envelope envelope;
  WAVEPACK_TRY_ASSIGN(envelope,
                      geometry::synthesize_envelope(resolved.channel, section, layout, resolved.material.density));

  SolveResult result;
  result.array_dims = {layout.rows, layout.columns};
  result.velocity_fts = input.vel_target_fts;
  result.delta_p_psi = pascal_to_psi(channel_flow.pressure_drop);
  result.fc_ghz = attenuation.cutoff_frequency * constants::conversion::hz_to_ghz;
  result.se_db = std::move(attenuation.shielding_db);
  result.freqs = std::move(attenuation.frequencies);
  result.total_weight_lbm = envelope.mass_lbm;
  result.a_in = meters_to_inches(resolved.channel.width);
  result.b_in = input.b_in;
  result.t_in = meters_to_inches(resolved.channel.wall_thickness);
  result.L_ft = meters_to_feet(resolved.channel.length);

  auto& diag = result.diagnostics;
  diag.hydraulic_diameter_m = section.hydraulic_diameter;
  diag.open_ratio = section.open_ratio;
  diag.density = rho;
  diag.viscosity = mu;
  diag.reynolds = channel_flow.reynolds;
  diag.friction_factor = channel_flow.friction_factor;
  diag.regime = channel_flow.regime;
  diag.channels_required = layout.channels_required;
  diag.channels_placed = layout.channels_placed;
  diag.channel_shortfall = layout.shortfall();
  diag.envelope_width_in = meters_to_inches(envelope.width);
  diag.envelope_height_in = meters_to_inches(envelope.height);
  diag.total_mass_kg = envelope.mass_kg;
  diag.layout_policy = options_.layout_policy;

  if (options_.temperature_sweep) {
    WAVEPACK_TRY_ASSIGN(result.temperature_sweep,
                        build_temperature_sweep(profile, resolved, section.hydraulic_diameter));
  }

  return result;
}

auto WavepackSolver::build_temperature_sweep(const properties::TemperatureProfile& profile,
                                             const ResolvedCase& resolved, double hydraulic_diameter) const
    -> std::expected<core::Matrix<double>, core::SolveError> {

  core::Matrix<double> sweep(profile.samples.size(), sweep_columns::count);

  for (std::size_t i = 0; i < profile.samples.size(); ++i) {
    const auto& sample = profile.samples[i];

    flow::ChannelFlow point;
    WAVEPACK_TRY_ASSIGN(point, flow::solve_channel(sample.density, resolved.velocity, sample.viscosity,
                                                   resolved.channel.length, hydraulic_diameter,
                                                   resolved.material.roughness));

    sweep(i, sweep_columns::temperature_f) = properties::kelvin_to_fahrenheit(sample.temperature);
    sweep(i, sweep_columns::temperature_k) = sample.temperature;
    sweep(i, sweep_columns::density) = sample.density;
    sweep(i, sweep_columns::viscosity) = sample.viscosity;
    sweep(i, sweep_columns::reynolds) = point.reynolds;
    sweep(i, sweep_columns::friction_factor) = point.friction_factor;
    sweep(i, sweep_columns::delta_p_psi) = pascal_to_psi(point.pressure_drop);
  }

  return sweep;
}

} // namespace wavepack::solver

#include "wavepack/core/solve_runner.hpp"
#include "wavepack/core/constants.hpp"
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>

namespace wavepack::core {

auto SolveRunner::run_solve(const solver::WavepackSolver& solver, const io::Configuration& config,
                            PerformanceMetrics& metrics) -> std::expected<solver::SolveResult, ApplicationError> {

  std::cout << "\n=== SIZING WAVEGUIDE ARRAY ===" << std::endl;

  auto solve_start = std::chrono::high_resolution_clock::now();
  auto solve_result = solver.solve(config.input);
  auto solve_end = std::chrono::high_resolution_clock::now();

  metrics.solve_time = std::chrono::duration_cast<std::chrono::microseconds>(solve_end - solve_start);

  if (!solve_result) {
    const auto& error = solve_result.error();
    return std::unexpected(ApplicationError{
        "Solver failed: " + (config.verbose ? error.full_message() : error.message()), constants::indexing::second});
  }

  std::cout << "✓ Solution completed successfully!" << std::endl;
  std::cout << "  Solve time: " << metrics.solve_time.count() << " µs" << std::endl;

  return std::move(solve_result.value());
}

auto SolveRunner::display_solve_results(const solver::SolveResult& result, const io::Configuration& config) const
    -> void {
  display_array_summary(result);
  display_flow_summary(result, config);

  const auto& diag = result.diagnostics;
  if (diag.channel_shortfall > 0) {
    std::cout << constants::string_processing::colors::yellow
              << std::format("Warning: square layout places {} of {} required channels ({} short, {} policy)",
                             diag.channels_placed, diag.channels_required, diag.channel_shortfall,
                             geometry::layout_policy_name(diag.layout_policy))
              << constants::string_processing::colors::reset << std::endl;
  }

  if (result.delta_p_psi > config.input.dp_limit_psi) {
    std::cout << constants::string_processing::colors::red
              << std::format("Warning: pressure drop {:.4e} psi exceeds the {:g} psi limit", result.delta_p_psi,
                             config.input.dp_limit_psi)
              << constants::string_processing::colors::reset << std::endl;
  }

  if (config.verbose) {
    display_shielding_curve(result);
    if (result.temperature_sweep.rows() > 0) {
      display_temperature_sweep(result.temperature_sweep);
    }
  }
}

auto SolveRunner::display_array_summary(const solver::SolveResult& result) const -> void {
  const auto& diag = result.diagnostics;

  std::cout << "\n"
            << constants::string_processing::colors::green << "┌─ ARRAY ───────────────────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Array dims      : " << std::setw(22) << std::left
            << std::format("{} x {}", result.array_dims.first, result.array_dims.second) << " │" << std::endl;
  std::cout << "│ Channels (req)  : " << std::setw(22) << std::left << diag.channels_required << " │" << std::endl;
  std::cout << "│ Channels (plac) : " << std::setw(22) << std::left << diag.channels_placed << " │" << std::endl;
  std::cout << "│ Envelope        : " << std::setw(22) << std::left
            << std::format("{:.2f} x {:.2f} in", diag.envelope_width_in, diag.envelope_height_in) << " │"
            << std::endl;
  std::cout << "│ Weight          : " << std::setw(22) << std::left
            << std::format("{:.2f} lbm", result.total_weight_lbm) << " │" << std::endl;
  std::cout << "│ Cutoff freq.    : " << std::setw(22) << std::left << std::format("{:.4f} GHz", result.fc_ghz)
            << " │" << std::endl;
  std::cout << constants::string_processing::colors::green << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

auto SolveRunner::display_flow_summary(const solver::SolveResult& result, const io::Configuration& config) const
    -> void {
  const auto& diag = result.diagnostics;

  std::cout << "\n=== FLOW SUMMARY ===" << std::endl;
  std::cout << "  Velocity        : " << result.velocity_fts << " ft/s" << std::endl;
  std::cout << std::format("  Mean density    : {:.6f} kg/m³", diag.density) << std::endl;
  std::cout << std::format("  Mean viscosity  : {:.6e} Pa·s", diag.viscosity) << std::endl;
  std::cout << std::format("  Reynolds        : {:.1f} ({})", diag.reynolds, flow::regime_name(diag.regime))
            << std::endl;
  std::cout << std::format("  Friction factor : {:.6f}", diag.friction_factor) << std::endl;
  std::cout << std::format("  ΔP per channel  : {:.6e} psi (limit {:g} psi)", result.delta_p_psi,
                           config.input.dp_limit_psi)
            << std::endl;

  const auto& sweep = result.temperature_sweep;
  if (!sweep.empty()) {
    const auto [dp_low, dp_high] = sweep.column_range(solver::sweep_columns::delta_p_psi);
    const auto [re_low, re_high] = sweep.column_range(solver::sweep_columns::reynolds);
    std::cout << std::format("  ΔP over range   : {:.6e} .. {:.6e} psi", dp_low, dp_high) << std::endl;
    std::cout << std::format("  Re over range   : {:.1f} .. {:.1f}", re_low, re_high) << std::endl;
  }
}

auto SolveRunner::display_shielding_curve(const solver::SolveResult& result) const -> void {
  std::cout << "\nShielding effectiveness:" << std::endl;
  std::cout << std::setw(14) << "f [Hz]" << std::setw(14) << "SE [dB]" << std::endl;
  std::cout << std::string(28, '-') << std::endl;
  for (std::size_t i = 0; i < result.freqs.size(); ++i) {
    std::cout << std::setw(14) << std::scientific << std::setprecision(1) << result.freqs[i] << std::setw(14)
              << std::fixed << std::setprecision(constants::string_processing::float_precision_3) << result.se_db[i]
              << std::endl;
  }
}

auto SolveRunner::display_temperature_sweep(const core::Matrix<double>& sweep) const -> void {
  namespace col = solver::sweep_columns;

  std::cout << "\nPer-temperature flow:" << std::endl;
  std::cout << std::setw(constants::string_processing::medium_field_width) << "T [°F]" << std::setw(12) << "rho"
            << std::setw(14) << "mu" << std::setw(10) << "Re" << std::setw(14) << "ΔP [psi]" << std::endl;
  std::cout << std::string(58, '-') << std::endl;
  for (std::size_t i = 0; i < sweep.rows(); ++i) {
    std::cout << std::format("{:>8.1f}{:>12.5f}{:>14.4e}{:>10.0f}{:>14.4e}", sweep(i, col::temperature_f),
                             sweep(i, col::density), sweep(i, col::viscosity), sweep(i, col::reynolds),
                             sweep(i, col::delta_p_psi))
              << std::endl;
  }
}

} // namespace wavepack::core

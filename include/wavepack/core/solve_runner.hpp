#pragma once
#include "../io/config_types.hpp"
#include "../solver/wavepack_solver.hpp"
#include "application_types.hpp"
#include <expected>

namespace wavepack::core {

class SolveRunner {
public:
  [[nodiscard]] auto run_solve(const solver::WavepackSolver& solver, const io::Configuration& config,
                               PerformanceMetrics& metrics) -> std::expected<solver::SolveResult, ApplicationError>;

  auto display_solve_results(const solver::SolveResult& result, const io::Configuration& config) const -> void;

private:
  auto display_array_summary(const solver::SolveResult& result) const -> void;

  auto display_flow_summary(const solver::SolveResult& result, const io::Configuration& config) const -> void;

  auto display_shielding_curve(const solver::SolveResult& result) const -> void;

  auto display_temperature_sweep(const core::Matrix<double>& sweep) const -> void;
};

} // namespace wavepack::core

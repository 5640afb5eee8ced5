#include "wavepack/solver/wavepack_solver.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace {

using wavepack::geometry::ChannelShape;
using wavepack::solver::SolveInput;
using wavepack::solver::SolveResult;
using wavepack::solver::WavepackSolver;

bool near(double actual, double expected, double rel = 1e-9) {
  return std::fabs(actual - expected) <= rel * std::fabs(expected);
}

bool check(bool condition, const std::string& what) {
  if (!condition) {
    std::cerr << what << "\n";
  }
  return condition;
}

struct Golden {
  int side;
  int required;
  double delta_p_psi;
  double fc_ghz;
  double se_below_cutoff;
  double weight_lbm;
  double envelope_in;
};

bool check_scenario(const std::string& name, const SolveInput& input, const Golden& golden) {
  WavepackSolver solver;
  auto result = solver.solve(input);
  if (!result) {
    std::cerr << name << ": " << result.error().message() << "\n";
    return false;
  }

  bool ok = true;
  ok &= check(result->array_dims.first == golden.side && result->array_dims.second == golden.side,
              name + ": array_dims");
  ok &= check(result->diagnostics.channels_required == golden.required, name + ": channels_required");
  ok &= check(near(result->delta_p_psi, golden.delta_p_psi), name + ": deltaP_psi");
  ok &= check(near(result->fc_ghz, golden.fc_ghz), name + ": fc_GHz");
  ok &= check(near(result->total_weight_lbm, golden.weight_lbm, 1e-8), name + ": total_weight_lbm");
  ok &= check(near(result->diagnostics.envelope_width_in, golden.envelope_in, 1e-9), name + ": envelope width");
  ok &= check(result->freqs.size() == 6 && result->se_db.size() == 6, name + ": sweep length");
  for (std::size_t i = 0; i < result->se_db.size() && golden.se_below_cutoff > 0.0; ++i) {
    if (result->freqs[i] <= golden.fc_ghz * 1e9) {
      ok &= check(near(result->se_db[i], golden.se_below_cutoff), name + ": SE below cutoff");
    }
  }
  return ok;
}

} // namespace

int main() {
  SolveInput rectangular{2.0, 1.0, 0.05, 6.0, ChannelShape::Rectangular, "Stainless Steel", "Air",
                         50.0, 5.0, 32.0, 212.0};
  SolveInput staggered{0.5, 0.5, 0.03, 2.0, ChannelShape::CircularStaggered, "Aluminum", "Air", 20.0, 0.5, 60.0, 120.0};
  SolveInput inline_water{0.25, 0.25, 0.02, 1.0, ChannelShape::CircularInline, "Aluminum", "Water",
                          2.0, 1.0, 50.0, 80.0};

  if (!check_scenario("rectangular", rectangular,
                      {37, 1419, 0.001923345007174379, 6.439146013065995, 1.3237295808411114, 735.9380744761052, 77.7}))
    return 1;
  if (!check_scenario("staggered", staggered,
                      {24, 602, 0.00047001109857355047, 13.83499482677089, 0.44124319361370384, 13.17545700556479,
                       13.44}))
    return 1;
  if (!check_scenario("inline water", inline_water,
                      {12, 155, 0.004310569220984371, 27.66998965354178, 0.22062159680685192, 0.49179679564681233,
                       3.48}))
    return 1;

  WavepackSolver solver;

  // Reference case details
  auto reference = solver.solve(rectangular);
  if (!reference) {
    std::cerr << reference.error().message() << "\n";
    return 1;
  }
  const auto& diag = reference->diagnostics;
  if (!check(near(reference->se_db[5], 217.49980537880094), "SE at 10 GHz") ||
      !check(diag.channels_placed == 1369 && diag.channel_shortfall == 50, "truncation shortfall") ||
      !check(near(diag.friction_factor, 0.02426616984509436), "friction factor") ||
      !check(diag.regime == wavepack::flow::FlowRegime::Turbulent, "regime") ||
      !check(near(reference->a_in, 2.0, 1e-12) && reference->b_in == 1.0 && near(reference->t_in, 0.05, 1e-12),
             "echoed dimensions") ||
      !check(near(reference->L_ft, 0.5, 1e-12), "length in feet") ||
      !check(reference->velocity_fts == 50.0, "velocity echo")) {
    return 1;
  }

  // Temperature sweep: one row per sample, pressure drop falls as air heats
  const auto& sweep = reference->temperature_sweep;
  namespace col = wavepack::solver::sweep_columns;
  if (!check(sweep.rows() == 10 && sweep.cols() == col::count, "temperature sweep shape") ||
      !check(near(sweep(0, col::temperature_f), 32.0, 1e-12) && near(sweep(9, col::temperature_f), 212.0, 1e-12),
             "temperature sweep bounds") ||
      !check(sweep(9, col::delta_p_psi) < sweep(0, col::delta_p_psi), "pressure drop trend") ||
      !check(near(sweep.column_mean(col::density), reference->diagnostics.density, 1e-12), "sweep mean density") ||
      !check(sweep.column_range(col::delta_p_psi).second == sweep(0, col::delta_p_psi), "largest drop when coldest")) {
    return 1;
  }

  // Result-level lookup agrees with the swept curve
  if (reference->shielding_at(1e10) != reference->se_db.back() || reference->shielding_at(3e9)) {
    std::cerr << "SolveResult::shielding_at should match swept points only\n";
    return 1;
  }

  // Determinism
  auto again = solver.solve(rectangular);
  if (!again || again->se_db != reference->se_db || again->delta_p_psi != reference->delta_p_psi ||
      again->total_weight_lbm != reference->total_weight_lbm || again->array_dims != reference->array_dims) {
    std::cerr << "Repeated solve differs\n";
    return 1;
  }

  // Round-up layout closes the shortfall
  wavepack::solver::SolveOptions round_up;
  round_up.layout_policy = wavepack::geometry::LayoutPolicy::RoundUpToSquare;
  WavepackSolver rounding_solver(wavepack::properties::PropertyLibrary::reference(), round_up);
  auto rounded = rounding_solver.solve(rectangular);
  if (!rounded || rounded->array_dims.first != 38 || rounded->diagnostics.channel_shortfall != 0 ||
      rounded->total_weight_lbm <= reference->total_weight_lbm) {
    std::cerr << "Round-up policy should place a 38 x 38 array\n";
    return 1;
  }

  // Sweep disabled
  wavepack::solver::SolveOptions no_sweep;
  no_sweep.temperature_sweep = false;
  auto plain = WavepackSolver(wavepack::properties::PropertyLibrary::reference(), no_sweep).solve(rectangular);
  if (!plain || plain->temperature_sweep.rows() != 0 || plain->delta_p_psi != reference->delta_p_psi) {
    std::cerr << "Disabling the sweep must not change the primary result\n";
    return 1;
  }

  // A configured sweep reaching past the double range fails instead of reporting infinite SE
  wavepack::solver::SolveOptions huge_sweep;
  huge_sweep.frequency_decade_max = 400;
  auto overflow = WavepackSolver(wavepack::properties::PropertyLibrary::reference(), huge_sweep).solve(rectangular);
  if (overflow || overflow.error().kind() != wavepack::core::ErrorKind::InvalidInput ||
      overflow.error().field() != "frequency_decade_max") {
    std::cerr << "Expected InvalidInput for frequency_decade_max = 400\n";
    return 1;
  }

  // Errors
  auto unknown = rectangular;
  unknown.material = "Unobtainium";
  auto missing = solver.solve(unknown);
  if (missing || missing.error().kind() != wavepack::core::ErrorKind::UnknownLookup ||
      missing.error().field() != "material" || missing.error().value() != "Unobtainium") {
    std::cerr << "Expected UnknownLookup for Unobtainium\n";
    return 1;
  }
  // Detailed form names the raising site after the plain message
  const auto detailed = missing.error().full_message();
  if (detailed.rfind(missing.error().message(), 0) != 0 || detailed.find("property_library") == std::string::npos) {
    std::cerr << "Detailed error should start with the message and name the lookup site: " << detailed << "\n";
    return 1;
  }

  auto unknown_fluid = rectangular;
  unknown_fluid.fluid = "Plasma";
  if (auto r = solver.solve(unknown_fluid); r || r.error().kind() != wavepack::core::ErrorKind::UnknownLookup) {
    std::cerr << "Expected UnknownLookup for an unknown fluid\n";
    return 1;
  }

  auto stopped = rectangular;
  stopped.vel_target_fts = 0.0;
  if (auto r = solver.solve(stopped); r || r.error().kind() != wavepack::core::ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero velocity\n";
    return 1;
  }

  auto not_a_number = rectangular;
  not_a_number.a_in = std::numeric_limits<double>::quiet_NaN();
  if (auto r = solver.solve(not_a_number); r || r.error().kind() != wavepack::core::ErrorKind::InvalidInput) {
    std::cerr << "Expected InvalidInput for a NaN dimension\n";
    return 1;
  }

  auto flat = rectangular;
  flat.b_in = 0.0;
  if (auto r = solver.solve(flat); r || r.error().kind() != wavepack::core::ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero height\n";
    return 1;
  }

  // Circular channels ignore b
  auto circular_no_b = staggered;
  circular_no_b.b_in = 0.0;
  if (auto r = solver.solve(circular_no_b); !r) {
    std::cerr << "Circular channels should not validate b: " << r.error().message() << "\n";
    return 1;
  }

  wavepack::solver::SolveOptions one_sample;
  one_sample.temperature_samples = 1;
  auto sampled = WavepackSolver(wavepack::properties::PropertyLibrary::reference(), one_sample).solve(rectangular);
  if (sampled || sampled.error().kind() != wavepack::core::ErrorKind::InvalidInput) {
    std::cerr << "Expected InvalidInput for a single temperature sample\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

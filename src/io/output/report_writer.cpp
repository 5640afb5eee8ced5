#include "wavepack/io/output/report_writer.hpp"
#include "wavepack/geometry/geometry_types.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wavepack::io::output {

namespace {

auto format_date(std::chrono::system_clock::time_point time_point) -> std::string {
  auto time_t = std::chrono::system_clock::to_time_t(time_point);
  auto tm = *std::localtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return oss.str();
}

} // namespace

auto evaluate_compliance(const OutputDataset& dataset, const ReportSettings& settings)
    -> std::vector<ComplianceCheck> {
  const auto& input = dataset.input;
  const auto& result = dataset.result;

  std::vector<ComplianceCheck> checks;

  ComplianceCheck pressure{.name = "Pressure drop",
                           .requirement = std::format("<= {:.4g} psi", input.dp_limit_psi),
                           .achieved = std::format("{:.4g} psi", result.delta_p_psi),
                           .status = result.delta_p_psi <= input.dp_limit_psi ? CheckStatus::Pass : CheckStatus::Fail};
  checks.push_back(std::move(pressure));

  const double check_ghz = settings.shielding_check_frequency_hz * constants::conversion::hz_to_ghz;
  ComplianceCheck shielding{.name = std::format("Shielding at {:g} GHz", check_ghz),
                            .requirement = std::format(">= {:g} dB", settings.min_shielding_db),
                            .achieved = "frequency not swept",
                            .status = CheckStatus::NotEvaluated};
  if (auto se = result.shielding_at(settings.shielding_check_frequency_hz)) {
    shielding.achieved = std::format("{:.2f} dB", *se);
    shielding.status = *se >= settings.min_shielding_db ? CheckStatus::Pass : CheckStatus::Fail;
  }
  checks.push_back(std::move(shielding));

  return checks;
}

auto ReportWriter::write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                         const OutputConfig& config,
                         ProgressCallback progress) const -> std::expected<void, OutputError> {

  try {
    if (progress)
      progress(0.0, "Starting report");

    std::ofstream file(file_path);
    if (!file.is_open()) {
      return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    const auto& settings = config.report;

    write_header(file, dataset, settings);
    write_inputs(file, dataset.input);
    write_results(file, dataset.result, dataset.input.shape);

    if (progress)
      progress(0.5, "Writing report tables");
    write_shielding_table(file, dataset.result);
    if (config.save_temperature_sweep && dataset.result.temperature_sweep.rows() > 0) {
      write_temperature_table(file, dataset.result.temperature_sweep);
    }

    write_attachments(file, settings.attachments);
    write_compliance(file, evaluate_compliance(dataset, settings));

    if (!file.good()) {
      return std::unexpected(FileWriteError(file_path, "Stream error while writing"));
    }

    if (progress)
      progress(1.0, "Report complete");
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("Report write failed: {}", e.what())));
  }
}

auto ReportWriter::write_header(std::ostream& out, const OutputDataset& dataset,
                                const ReportSettings& settings) const -> void {
  out << "# " << settings.title << "\n\n";
  out << std::format("Generated {} by wavepack {}", format_date(dataset.metadata.creation_time),
                     dataset.metadata.wavepack_version);
  if (!dataset.metadata.case_name.empty()) {
    out << std::format(" for case `{}`", dataset.metadata.case_name);
  }
  out << ".\n\n";
}

auto ReportWriter::write_inputs(std::ostream& out, const solver::SolveInput& input) const -> void {
  out << "## Inputs\n\n";
  out << "| Parameter | Value |\n|---|---|\n";
  out << std::format("| Material | {} |\n", input.material);
  out << std::format("| Fluid | {} |\n", input.fluid);
  out << std::format("| Channel shape | {} |\n", geometry::shape_name(input.shape));
  out << std::format("| Temperature range | {:g} to {:g} °F |\n", input.T_min_F, input.T_max_F);
  out << std::format("| Velocity target | {:g} ft/s |\n", input.vel_target_fts);
  out << std::format("| Pressure drop limit | {:g} psi |\n\n", input.dp_limit_psi);
}

auto ReportWriter::write_results(std::ostream& out, const solver::SolveResult& result,
                                 geometry::ChannelShape shape) const -> void {
  const auto& diag = result.diagnostics;

  out << "## Results\n\n";
  out << "| Quantity | Value |\n|---|---|\n";
  out << std::format("| Array size | {} x {} channels |\n", result.array_dims.first, result.array_dims.second);
  out << std::format("| Overall envelope | {:.2f} in x {:.2f} in |\n", diag.envelope_width_in,
                     diag.envelope_height_in);
  if (geometry::is_circular(shape)) {
    out << std::format("| Channel diameter | {:.4g} in |\n", result.a_in);
    out << std::format("| Channel height b | {:.4g} in (ignored for circular channels) |\n", result.b_in);
  } else {
    out << std::format("| Channel size | {:.4g} in x {:.4g} in |\n", result.a_in, result.b_in);
  }
  out << std::format("| Wall thickness | {:.4g} in |\n", result.t_in);
  out << std::format("| Channel length | {:.4g} ft |\n", result.L_ft);
  out << std::format("| Channel velocity | {:.4g} ft/s |\n", result.velocity_fts);
  out << std::format("| Pressure drop | {:.4e} psi |\n", result.delta_p_psi);
  out << std::format("| Weight | {:.2f} lbm |\n", result.total_weight_lbm);
  out << std::format("| Cutoff frequency | {:.4f} GHz |\n", result.fc_ghz);
  out << std::format("| Channels required / placed | {} / {} |\n", diag.channels_required, diag.channels_placed);
  out << std::format("| Flow regime | {} (Re = {:.0f}) |\n\n", flow::regime_name(diag.regime), diag.reynolds);

  if (diag.channel_shortfall > 0) {
    out << std::format("> The square layout places {} fewer channels than required ({} policy).\n\n",
                       diag.channel_shortfall, geometry::layout_policy_name(diag.layout_policy));
  }

  if (geometry::is_circular(shape)) {
    out << "Circular channels use a D x D footprint with pitch D + 2t; the input height b does not affect the "
           "result.\n\n";
  }

  out << "Channel count is sized with a back-pressure heuristic and should be confirmed against test data.\n\n";
}

auto ReportWriter::write_shielding_table(std::ostream& out, const solver::SolveResult& result) const -> void {
  out << "## Shielding Effectiveness\n\n";
  out << "| Frequency [Hz] | SE [dB] |\n|---:|---:|\n";
  for (std::size_t i = 0; i < result.freqs.size(); ++i) {
    out << std::format("| {:.0e} | {:.2f} |\n", result.freqs[i], result.se_db[i]);
  }
  out << "\n";
}

auto ReportWriter::write_temperature_table(std::ostream& out, const core::Matrix<double>& sweep) const -> void {
  namespace col = solver::sweep_columns;

  out << "## Flow vs. Temperature\n\n";
  out << "| T [°F] | Density [kg/m³] | Viscosity [Pa·s] | Re | f | ΔP [psi] |\n";
  out << "|---:|---:|---:|---:|---:|---:|\n";
  for (std::size_t i = 0; i < sweep.rows(); ++i) {
    out << std::format("| {:.1f} | {:.4f} | {:.4e} | {:.0f} | {:.5f} | {:.4e} |\n", sweep(i, col::temperature_f),
                       sweep(i, col::density), sweep(i, col::viscosity), sweep(i, col::reynolds),
                       sweep(i, col::friction_factor), sweep(i, col::delta_p_psi));
  }
  const auto [dp_low, dp_high] = sweep.column_range(col::delta_p_psi);
  out << std::format("\nPressure drop spans {:.4e} to {:.4e} psi across the range (mean {:.4e} psi).\n\n", dp_low,
                     dp_high, sweep.column_mean(col::delta_p_psi));
}

auto ReportWriter::write_attachments(std::ostream& out, const ReportConfig::Attachments& attachments) const -> void {
  const std::pair<const std::optional<std::string>*, const char*> figures[] = {
      {&attachments.schematic, "Isometric Schematic of Wavepack"},
      {&attachments.chart_pt, "Pressure and Velocity vs. Temperature"},
      {&attachments.chart_af, "Attenuation vs. Frequency"}};

  bool any = false;
  for (const auto& [path, caption] : figures) {
    if (!path->has_value())
      continue;
    if (!any) {
      out << "## Figures\n\n";
      any = true;
    }
    out << std::format("![{0}]({1})\n\n*{0}*\n\n", caption, path->value());
  }
}

auto ReportWriter::write_compliance(std::ostream& out, const std::vector<ComplianceCheck>& checks) const -> void {
  out << "## Compliance\n\n";
  out << "| Check | Requirement | Achieved | Status |\n|---|---|---|---|\n";
  for (const auto& check : checks) {
    out << std::format("| {} | {} | {} | {} |\n", check.name, check.requirement, check.achieved,
                       check_status_name(check.status));
  }
  out << "\n";
}

} // namespace wavepack::io::output

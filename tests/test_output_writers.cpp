#include "wavepack/io/output/hdf5_writer.hpp"
#include "wavepack/io/output/output_writer.hpp"
#include "wavepack/io/output/report_writer.hpp"
#include "wavepack/solver/wavepack_solver.hpp"
#include <filesystem>
#include <fstream>
#include <hdf5.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace wavepack;

auto read_text(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto read_scalar(hid_t file, const char* path, double& value) -> bool {
  hid_t dataset = H5Dopen2(file, path, H5P_DEFAULT);
  if (dataset < 0) {
    return false;
  }
  const bool ok = H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value) >= 0;
  H5Dclose(dataset);
  return ok;
}

auto read_doubles(hid_t file, const char* path, std::vector<double>& values) -> bool {
  hid_t dataset = H5Dopen2(file, path, H5P_DEFAULT);
  if (dataset < 0) {
    return false;
  }
  hid_t space = H5Dget_space(dataset);
  const auto count = H5Sget_simple_extent_npoints(space);
  values.resize(static_cast<std::size_t>(count));
  const bool ok = H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) >= 0;
  H5Sclose(space);
  H5Dclose(dataset);
  return ok;
}

auto read_ints(hid_t file, const char* path, std::vector<int>& values) -> bool {
  hid_t dataset = H5Dopen2(file, path, H5P_DEFAULT);
  if (dataset < 0) {
    return false;
  }
  hid_t space = H5Dget_space(dataset);
  values.resize(static_cast<std::size_t>(H5Sget_simple_extent_npoints(space)));
  const bool ok = H5Dread(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) >= 0;
  H5Sclose(space);
  H5Dclose(dataset);
  return ok;
}

} // namespace

int main() {
  solver::SolveInput input{2.0, 1.0, 0.05, 6.0, geometry::ChannelShape::Rectangular, "Stainless Steel", "Air",
                           50.0, 5.0, 32.0, 212.0};
  solver::WavepackSolver solver;
  auto result = solver.solve(input);
  if (!result) {
    std::cerr << result.error().message() << "\n";
    return 1;
  }

  const auto out_dir = std::filesystem::temp_directory_path() / "wavepack_output_writer_test";
  std::filesystem::remove_all(out_dir);

  io::output::OutputConfig config;
  config.base_directory = out_dir;
  config.primary_format = io::output::OutputFormat::HDF5;
  config.additional_formats = {io::output::OutputFormat::CSV, io::output::OutputFormat::Report,
                               io::output::OutputFormat::CSV};
  config.include_timestamp = false;
  config.report.title = "Writer Test";
  config.report.shielding_check_frequency_hz = 1.0e10;
  config.report.min_shielding_db = 200.0;
  config.report.attachments.chart_af = "images/af.png";

  io::output::OutputWriter writer(config);
  if (auto valid = writer.validate_config(); !valid) {
    std::cerr << valid.error().message() << "\n";
    return 1;
  }

  io::output::RunMetadata metadata;
  metadata.config_file = "reference.yaml";
  auto files = writer.write_result(*result, input, solver.options(), "reference", nullptr, metadata);
  if (!files) {
    std::cerr << files.error().message() << "\n";
    return 1;
  }
  if (files->size() != 3) {
    std::cerr << "Expected one file per distinct format, got " << files->size() << "\n";
    return 1;
  }

  // HDF5 layout
  const auto h5_path = out_dir / "reference.h5";
  if (auto valid = io::output::hdf5::validate_file(h5_path); !valid) {
    std::cerr << valid.error().message() << "\n";
    return 1;
  }
  hid_t file = H5Fopen(h5_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (file < 0) {
    std::cerr << "Cannot reopen HDF5 output\n";
    return 1;
  }

  bool ok = true;
  std::vector<int> dims;
  ok &= read_ints(file, "/result/array_dims", dims) && dims == std::vector<int>{37, 37};
  double delta_p = 0.0;
  ok &= read_scalar(file, "/result/deltaP_psi", delta_p) && delta_p == result->delta_p_psi;
  double fc = 0.0;
  ok &= read_scalar(file, "/result/fc_GHz", fc) && fc == result->fc_ghz;
  double weight = 0.0;
  ok &= read_scalar(file, "/result/total_weight_lbm", weight) && weight == result->total_weight_lbm;
  std::vector<double> se;
  ok &= read_doubles(file, "/result/SE_db", se) && se == result->se_db;
  std::vector<double> freqs;
  ok &= read_doubles(file, "/result/freqs", freqs) && freqs == result->freqs;
  double required = 0.0;
  ok &= read_scalar(file, "/diagnostics/channels_required", required) && required == 1419.0;
  std::vector<double> sweep;
  ok &= read_doubles(file, "/temperature_sweep/table", sweep) && sweep.size() == 10 * solver::sweep_columns::count;
  // Row-major: second element of the first row is T_K
  ok &= sweep.size() > 1 && sweep[1] == result->temperature_sweep(0, solver::sweep_columns::temperature_k);
  ok &= H5Aexists_by_name(file, "metadata", "wavepack_version", H5P_DEFAULT) > 0;
  ok &= H5Aexists_by_name(file, "inputs", "material", H5P_DEFAULT) > 0;
  H5Fclose(file);

  if (!ok) {
    std::cerr << "HDF5 content does not match the solve result\n";
    return 1;
  }

  // CSV sections
  const auto csv = read_text(out_dir / "reference.csv");
  if (csv.find("deltaP_psi,") == std::string::npos || csv.find("frequency_Hz,SE_db") == std::string::npos ||
      csv.find("T_F,T_K,density") == std::string::npos || csv.find("channels_placed,1369") == std::string::npos) {
    std::cerr << "CSV output is missing a section\n";
    return 1;
  }

  // Report
  const auto report = read_text(out_dir / "reference.md");
  if (report.find("# Writer Test") == std::string::npos || report.find("37 x 37") == std::string::npos ||
      report.find("1419 / 1369") == std::string::npos ||
      report.find("![Attenuation vs. Frequency](images/af.png)") == std::string::npos ||
      report.find("heuristic") == std::string::npos) {
    std::cerr << "Report is missing expected content\n";
    return 1;
  }

  // 217.5 dB at 10 GHz against a 200 dB requirement; pressure drop well under 5 psi
  io::output::OutputDataset dataset{metadata, input, solver.options(), *result};
  auto checks = io::output::evaluate_compliance(dataset, config.report);
  if (checks.size() != 2 || checks[0].status != io::output::CheckStatus::Pass ||
      checks[1].status != io::output::CheckStatus::Pass) {
    std::cerr << "Compliance checks should pass for the reference case\n";
    return 1;
  }
  io::output::ReportSettings strict = config.report;
  strict.min_shielding_db = 250.0;
  if (io::output::evaluate_compliance(dataset, strict)[1].status != io::output::CheckStatus::Fail) {
    std::cerr << "Shielding check should fail above the achieved SE\n";
    return 1;
  }
  io::output::ReportSettings off_grid = config.report;
  off_grid.shielding_check_frequency_hz = 3.0e9;
  if (io::output::evaluate_compliance(dataset, off_grid)[1].status != io::output::CheckStatus::NotEvaluated) {
    std::cerr << "Unswept check frequency should not be evaluated\n";
    return 1;
  }

  // Circular channels echo b but flag it as unused
  if (csv.find("b_in,1,in\n") == std::string::npos || report.find("ignored for circular") != std::string::npos) {
    std::cerr << "Rectangular output should report b as a plain dimension\n";
    return 1;
  }
  solver::SolveInput circular{0.5, 0.5, 0.03, 2.0, geometry::ChannelShape::CircularStaggered, "Aluminum", "Air",
                              20.0, 0.5, 60.0, 120.0};
  auto circular_result = solver.solve(circular);
  if (!circular_result) {
    std::cerr << circular_result.error().message() << "\n";
    return 1;
  }
  if (auto written = writer.write_result(*circular_result, circular, solver.options(), "circular"); !written) {
    std::cerr << written.error().message() << "\n";
    return 1;
  }
  const auto circular_csv = read_text(out_dir / "circular.csv");
  const auto circular_report = read_text(out_dir / "circular.md");
  if (circular_csv.find("b_in,0.5,in (ignored for circular channels)") == std::string::npos ||
      circular_report.find("Channel diameter") == std::string::npos ||
      circular_report.find("(ignored for circular channels)") == std::string::npos ||
      circular_report.find("pitch D + 2t") == std::string::npos) {
    std::cerr << "Circular output should mark b as ignored\n";
    return 1;
  }

  // Inconsistent result is rejected before any file is written
  auto broken = *result;
  broken.se_db.pop_back();
  if (writer.write_result(broken, input, solver.options(), "broken")) {
    std::cerr << "Mismatched frequency and SE lengths should be rejected\n";
    return 1;
  }

  std::filesystem::remove_all(out_dir);

  std::cout << "OK\n";
  return 0;
}

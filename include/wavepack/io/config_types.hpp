#pragma once
#include "../core/constants.hpp"
#include "../solver/solve_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wavepack::io {

struct PropertiesConfig {
  // Extra or overriding fluids/materials; empty means reference tables only
  std::optional<std::string> property_file;
};

struct OutputConfig {
  enum class Format { HDF5, CSV, Report };
  std::string output_directory = "wavepack_outputs";
  std::vector<Format> formats = {Format::HDF5};
  bool include_timestamp = true;
};

struct ReportConfig {
  std::string title = "Wavepack Analysis Report";
  double min_shielding_db = constants::defaults::min_shielding_db;
  double shielding_check_frequency_hz = constants::defaults::shielding_check_frequency_hz;

  // Externally rendered images referenced by the report
  struct Attachments {
    std::optional<std::string> schematic;
    std::optional<std::string> chart_pt;
    std::optional<std::string> chart_af;
  } attachments;
};

struct Configuration {
  solver::SolveInput input;
  solver::SolveOptions numerical;
  PropertiesConfig properties;
  OutputConfig output;
  ReportConfig report;
  bool verbose = false;
};

} // namespace wavepack::io

#include "wavepack/io/config_manager.hpp"
#include "wavepack/io/yaml_parser.hpp"
#include <iostream>
#include <string>

namespace {

auto parse_text(const std::string& text) -> std::expected<wavepack::io::Configuration, wavepack::core::ConfigurationError> {
  wavepack::io::YamlParser parser("inline.yaml");
  if (auto loaded = parser.load_from_string(text); !loaded) {
    return std::unexpected(wavepack::core::ConfigurationError(loaded.error().message()));
  }
  return parser.parse();
}

const char* minimal_circular = R"(
input:
  shape: circular_inline
  material: Aluminum
  fluid: Water
  a_in: 0.25
  t_in: 0.02
  L_in: 1.0
  vel_target_fts: 2.0
  dp_limit_psi: 1.0
  T_min_F: 50
  T_max_F: 80
)";

} // namespace

int main() {
  using namespace wavepack;

  if (io::normalize_key("Circular_Staggered") != "circular-staggered" ||
      io::normalize_key("Round Up") != "round-up") {
    std::cerr << "normalize_key mismatch\n";
    return 1;
  }

  // Full case file
  io::ConfigurationManager manager;
  auto config = manager.load("data/reference_case.yaml");
  if (!config) {
    std::cerr << config.error().message() << "\n";
    return 1;
  }
  if (config->input.shape != geometry::ChannelShape::Rectangular || config->input.material != "Stainless Steel" ||
      config->input.a_in != 2.0 || config->input.b_in != 1.0 || config->input.T_max_F != 212.0) {
    std::cerr << "Input section parsed incorrectly\n";
    return 1;
  }
  if (config->numerical.temperature_samples != 12 ||
      config->numerical.layout_policy != geometry::LayoutPolicy::RoundUpToSquare ||
      config->numerical.frequency_decade_min != 5 || config->numerical.frequency_decade_max != 10) {
    std::cerr << "Numerical section parsed incorrectly\n";
    return 1;
  }
  // Duplicate aliases collapse to one format each
  if (config->output.formats.size() != 3 || config->output.include_timestamp ||
      config->output.output_directory != "test_outputs") {
    std::cerr << "Output section parsed incorrectly\n";
    return 1;
  }
  if (!config->properties.property_file ||
      config->properties.property_file->find("data") == std::string::npos) {
    std::cerr << "Relative property file should resolve against the case file directory\n";
    return 1;
  }
  if (config->report.title != "Reference Case" || config->report.min_shielding_db != 150.0 ||
      !config->report.attachments.schematic || config->report.attachments.chart_af) {
    std::cerr << "Report section parsed incorrectly\n";
    return 1;
  }
  if (!config->verbose) {
    std::cerr << "verbose flag not read\n";
    return 1;
  }

  // Circular shapes may omit b_in; optional sections take defaults
  auto circular = parse_text(minimal_circular);
  if (!circular) {
    std::cerr << circular.error().message() << "\n";
    return 1;
  }
  if (circular->input.shape != geometry::ChannelShape::CircularInline || circular->input.b_in != 0.25 ||
      circular->numerical.layout_policy != geometry::LayoutPolicy::Truncate ||
      circular->output.formats.size() != 1 || circular->properties.property_file) {
    std::cerr << "Defaults for the minimal circular case are wrong\n";
    return 1;
  }

  // Rectangular shapes require b_in
  std::string no_height = minimal_circular;
  no_height.replace(no_height.find("circular_inline"), std::string("circular_inline").size(), "rectangular");
  auto rect = parse_text(no_height);
  if (rect || rect.error().message().find("b_in") == std::string::npos) {
    std::cerr << "Missing b_in for a rectangular channel should name the field\n";
    return 1;
  }

  std::string bad_shape = minimal_circular;
  bad_shape.replace(bad_shape.find("circular_inline"), std::string("circular_inline").size(), "hexagonal");
  auto shape = parse_text(bad_shape);
  if (shape || shape.error().message().find("circular-staggered") == std::string::npos) {
    std::cerr << "Unknown shape should list the valid options\n";
    return 1;
  }

  std::string non_numeric = minimal_circular;
  non_numeric.replace(non_numeric.find("0.02"), 4, "thin");
  auto numeric = parse_text(non_numeric);
  if (numeric || numeric.error().message().find("t_in") == std::string::npos) {
    std::cerr << "Non-numeric field should be reported by name\n";
    return 1;
  }

  if (parse_text("numerical:\n  temperature_samples: 4\n")) {
    std::cerr << "Missing input section should fail\n";
    return 1;
  }

  if (parse_text(std::string(minimal_circular) + "output:\n  formats: [pdf]\n")) {
    std::cerr << "Unknown output format should fail\n";
    return 1;
  }

  io::ConfigurationManager missing_manager;
  if (missing_manager.load("data/does_not_exist.yaml")) {
    std::cerr << "Missing file should fail\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

#include "wavepack/io/yaml_parser.hpp"
#include "wavepack/core/constants.hpp"
#include "wavepack/core/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace wavepack::io {

auto normalize_key(std::string value) -> std::string {
  std::ranges::transform(value, value.begin(), [](unsigned char c) {
    if (c == '_' || c == ' ') {
      return '-';
    }
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_from_string(std::string_view content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(std::string(content));
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  if (!root_ || root_.IsNull()) {
    return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
  }
  if (!root_.IsMap()) {
    return std::unexpected(core::ConfigurationError("Top-level YAML node must be a mapping"));
  }

  Configuration config;

  if (!root_["input"]) {
    return std::unexpected(core::ConfigurationError("Missing required 'input' section."));
  }

  auto input_result = parse_input_config(root_["input"]);
  if (!input_result) {
    return std::unexpected(input_result.error());
  }
  config.input = std::move(input_result.value());

  // Remaining sections are optional and fall back to defaults
  if (root_["numerical"]) {
    auto num_result = parse_numerical_config(root_["numerical"]);
    if (!num_result) {
      return std::unexpected(num_result.error());
    }
    config.numerical = num_result.value();
  }

  if (root_["properties"]) {
    auto prop_result = parse_properties_config(root_["properties"]);
    if (!prop_result) {
      return std::unexpected(prop_result.error());
    }
    config.properties = std::move(prop_result.value());
  }

  if (root_["output"]) {
    auto out_result = parse_output_config(root_["output"]);
    if (!out_result) {
      return std::unexpected(out_result.error());
    }
    config.output = std::move(out_result.value());
  }

  if (root_["report"]) {
    auto report_result = parse_report_config(root_["report"]);
    if (!report_result) {
      return std::unexpected(report_result.error());
    }
    config.report = std::move(report_result.value());
  }

  if (root_["verbose"]) {
    auto verbose_result = extract_value<bool>(root_, "verbose");
    if (!verbose_result) {
      return std::unexpected(verbose_result.error());
    }
    config.verbose = verbose_result.value();
  }

  return config;
}

auto YamlParser::parse_input_config(const YAML::Node& node) const
    -> std::expected<solver::SolveInput, core::ConfigurationError> {

  solver::SolveInput input;

  auto section_error = [](const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'input' section: {}", e.message())));
  };

  auto shape_result = extract_enum(node, "shape", enum_mappings::channel_shapes);
  if (!shape_result)
    return section_error(shape_result.error());
  input.shape = shape_result.value();

  auto material_result = extract_value<std::string>(node, "material");
  if (!material_result)
    return section_error(material_result.error());
  input.material = material_result.value();

  auto fluid_result = extract_value<std::string>(node, "fluid");
  if (!fluid_result)
    return section_error(fluid_result.error());
  input.fluid = fluid_result.value();

  const std::pair<const char*, double solver::SolveInput::*> numeric_fields[] = {
      {"a_in", &solver::SolveInput::a_in},
      {"t_in", &solver::SolveInput::t_in},
      {"L_in", &solver::SolveInput::L_in},
      {"vel_target_fts", &solver::SolveInput::vel_target_fts},
      {"dp_limit_psi", &solver::SolveInput::dp_limit_psi},
      {"T_min_F", &solver::SolveInput::T_min_F},
      {"T_max_F", &solver::SolveInput::T_max_F}};

  for (const auto& [key, member] : numeric_fields) {
    auto value_result = extract_value<double>(node, key);
    if (!value_result)
      return section_error(value_result.error());
    input.*member = value_result.value();
  }

  // b_in carries no meaning for circular channels and may be omitted there
  if (node["b_in"] || input.shape == geometry::ChannelShape::Rectangular) {
    auto b_result = extract_value<double>(node, "b_in");
    if (!b_result)
      return section_error(b_result.error());
    input.b_in = b_result.value();
  } else {
    input.b_in = input.a_in;
  }

  return input;
}

auto YamlParser::parse_numerical_config(const YAML::Node& node) const
    -> std::expected<solver::SolveOptions, core::ConfigurationError> {

  solver::SolveOptions options;

  auto section_error = [](const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'numerical' section: {}", e.message())));
  };

  if (node["temperature_samples"]) {
    auto result = extract_value<int>(node, "temperature_samples");
    if (!result)
      return section_error(result.error());
    options.temperature_samples = result.value();
  }

  if (node["frequency_decade_min"]) {
    auto result = extract_value<int>(node, "frequency_decade_min");
    if (!result)
      return section_error(result.error());
    options.frequency_decade_min = result.value();
  }

  if (node["frequency_decade_max"]) {
    auto result = extract_value<int>(node, "frequency_decade_max");
    if (!result)
      return section_error(result.error());
    options.frequency_decade_max = result.value();
  }

  if (node["layout_policy"]) {
    auto result = extract_enum(node, "layout_policy", enum_mappings::layout_policies);
    if (!result)
      return section_error(result.error());
    options.layout_policy = result.value();
  }

  if (node["temperature_sweep"]) {
    auto result = extract_value<bool>(node, "temperature_sweep");
    if (!result)
      return section_error(result.error());
    options.temperature_sweep = result.value();
  }

  return options;
}

auto YamlParser::parse_properties_config(const YAML::Node& node) const
    -> std::expected<PropertiesConfig, core::ConfigurationError> {

  PropertiesConfig config;

  if (node["property_file"]) {
    auto file_result = extract_value<std::string>(node, "property_file");
    if (!file_result) {
      return std::unexpected(
          core::ConfigurationError(std::format("In 'properties' section: {}", file_result.error().message())));
    }

    // Relative paths are taken from the directory of the case file
    std::filesystem::path property_path(file_result.value());
    if (property_path.is_relative() && !file_path_.empty()) {
      property_path = std::filesystem::path(file_path_).parent_path() / property_path;
    }
    config.property_file = property_path.string();
  }

  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  auto section_error = [](const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", e.message())));
  };

  if (node["output_directory"]) {
    auto output_dir_result = extract_value<std::string>(node, "output_directory");
    if (!output_dir_result)
      return section_error(output_dir_result.error());
    config.output_directory = output_dir_result.value();
  }

  if (node["formats"]) {
    auto formats_result = extract_value<std::vector<std::string>>(node, "formats");
    if (!formats_result)
      return section_error(formats_result.error());

    config.formats.clear();
    for (const auto& name : formats_result.value()) {
      auto format_result = lookup_enum(name, "formats", enum_mappings::output_formats);
      if (!format_result)
        return section_error(format_result.error());
      if (std::ranges::find(config.formats, format_result.value()) == config.formats.end()) {
        config.formats.push_back(format_result.value());
      }
    }
    if (config.formats.empty()) {
      return section_error(core::ValidationError("formats", "At least one output format is required"));
    }
  }

  if (node["include_timestamp"]) {
    auto timestamp_result = extract_value<bool>(node, "include_timestamp");
    if (!timestamp_result)
      return section_error(timestamp_result.error());
    config.include_timestamp = timestamp_result.value();
  }

  return config;
}

auto YamlParser::parse_report_config(const YAML::Node& node) const
    -> std::expected<ReportConfig, core::ConfigurationError> {

  ReportConfig config;

  auto section_error = [](const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'report' section: {}", e.message())));
  };

  if (node["title"]) {
    auto result = extract_value<std::string>(node, "title");
    if (!result)
      return section_error(result.error());
    config.title = result.value();
  }

  if (node["min_shielding_db"]) {
    auto result = extract_value<double>(node, "min_shielding_db");
    if (!result)
      return section_error(result.error());
    config.min_shielding_db = result.value();
  }

  if (node["shielding_check_frequency_hz"]) {
    auto result = extract_value<double>(node, "shielding_check_frequency_hz");
    if (!result)
      return section_error(result.error());
    if (!(result.value() > 0.0)) {
      return section_error(core::ValidationError("shielding_check_frequency_hz", "Frequency must be positive"));
    }
    config.shielding_check_frequency_hz = result.value();
  }

  if (node["attachments"]) {
    const auto attachments = node["attachments"];
    const std::pair<const char*, std::optional<std::string> ReportConfig::Attachments::*> slots[] = {
        {"schematic", &ReportConfig::Attachments::schematic},
        {"chart_pt", &ReportConfig::Attachments::chart_pt},
        {"chart_af", &ReportConfig::Attachments::chart_af}};

    for (const auto& [key, member] : slots) {
      if (attachments[key]) {
        auto result = extract_value<std::string>(attachments, key);
        if (!result)
          return section_error(result.error());
        config.attachments.*member = result.value();
      }
    }
  }

  return config;
}

} // namespace wavepack::io

#include "wavepack/io/property_file_parser.hpp"
#include <cmath>
#include <format>

namespace wavepack::io {

namespace {

enum class Bound { Positive, NonNegative };

auto read_number(const std::string& entry, const YAML::Node& node, const char* key, Bound bound)
    -> std::expected<double, core::ConfigurationError> {
  const auto field = std::format("{}.{}", entry, key);
  if (!node[key]) {
    return std::unexpected(core::ValidationError(field, "Required field is missing"));
  }

  double value = 0.0;
  try {
    value = node[key].as<double>();
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ValidationError(field, std::format("Failed to parse value: {}", e.what())));
  }

  if (!std::isfinite(value)) {
    return std::unexpected(core::ValidationError(field, "Value must be finite"));
  }
  if (bound == Bound::Positive && value <= 0.0) {
    return std::unexpected(core::ValidationError(field, std::format("Value must be positive, got {}", value)));
  }
  if (bound == Bound::NonNegative && value < 0.0) {
    return std::unexpected(core::ValidationError(field, std::format("Value must be non-negative, got {}", value)));
  }
  return value;
}

} // namespace

auto PropertyFileParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open property file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto PropertyFileParser::parse_fluid(const std::string& name, const YAML::Node& node) const
    -> std::expected<properties::FluidProperties, core::ConfigurationError> {
  properties::FluidProperties fluid{};

  auto density = read_number(name, node, "density", Bound::Positive);
  if (!density)
    return std::unexpected(density.error());
  fluid.density = density.value();

  auto viscosity = read_number(name, node, "viscosity", Bound::Positive);
  if (!viscosity)
    return std::unexpected(viscosity.error());
  fluid.viscosity = viscosity.value();

  return fluid;
}

auto PropertyFileParser::parse_material(const std::string& name, const YAML::Node& node) const
    -> std::expected<properties::MaterialProperties, core::ConfigurationError> {
  properties::MaterialProperties material{};

  auto density = read_number(name, node, "density", Bound::Positive);
  if (!density)
    return std::unexpected(density.error());
  material.density = density.value();

  auto permittivity = read_number(name, node, "relative_permittivity", Bound::Positive);
  if (!permittivity)
    return std::unexpected(permittivity.error());
  material.relative_permittivity = permittivity.value();

  auto permeability = read_number(name, node, "relative_permeability", Bound::Positive);
  if (!permeability)
    return std::unexpected(permeability.error());
  material.relative_permeability = permeability.value();

  auto roughness = read_number(name, node, "roughness", Bound::NonNegative);
  if (!roughness)
    return std::unexpected(roughness.error());
  material.roughness = roughness.value();

  return material;
}

auto PropertyFileParser::parse() const -> std::expected<PropertyTables, core::ConfigurationError> {
  if (!root_ || root_.IsNull()) {
    return std::unexpected(core::ConfigurationError("No property data loaded. Call load() first."));
  }

  PropertyTables tables;

  try {
    if (const auto fluids = root_["fluids"]) {
      if (!fluids.IsMap()) {
        return std::unexpected(core::ConfigurationError("'fluids' must be a mapping of name to properties"));
      }
      for (const auto& entry : fluids) {
        const auto name = entry.first.as<std::string>();
        auto fluid = parse_fluid(name, entry.second);
        if (!fluid)
          return std::unexpected(fluid.error());
        tables.fluids.insert_or_assign(name, fluid.value());
      }
    }

    if (const auto materials = root_["materials"]) {
      if (!materials.IsMap()) {
        return std::unexpected(core::ConfigurationError("'materials' must be a mapping of name to properties"));
      }
      for (const auto& entry : materials) {
        const auto name = entry.first.as<std::string>();
        auto material = parse_material(name, entry.second);
        if (!material)
          return std::unexpected(material.error());
        tables.materials.insert_or_assign(name, material.value());
      }
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Malformed property file '{}': {}", file_path_, e.what())));
  }

  return tables;
}

auto load_property_library(const std::filesystem::path& file_path, const properties::PropertyLibrary& base)
    -> std::expected<properties::PropertyLibrary, core::ConfigurationError> {
  PropertyFileParser parser(file_path.string());

  if (auto load_result = parser.load(); !load_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to load property file: {}", load_result.error().message())));
  }

  auto tables = parser.parse();
  if (!tables) {
    return std::unexpected(tables.error());
  }

  return base.extended(tables->fluids, tables->materials);
}

} // namespace wavepack::io

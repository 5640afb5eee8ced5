#pragma once
#include "../core/exceptions.hpp"
#include "../properties/property_library.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace wavepack::io {

struct PropertyTables {
  properties::FluidTable fluids;
  properties::MaterialTable materials;
};

/**
 * @brief Reads user-supplied fluid and material entries
 *
 * Expected layout:
 * @code
 * fluids:
 *   Glycol: {density: 1110, viscosity: 1.6e-2}
 * materials:
 *   Inconel: {density: 8440, relative_permittivity: 1.0, relative_permeability: 1.002, roughness: 1.6e-6}
 * @endcode
 * Either map may be absent. Every numeric field is required for an entry.
 */
class PropertyFileParser {
private:
  YAML::Node root_;
  std::string file_path_;

  [[nodiscard]] auto parse_fluid(const std::string& name, const YAML::Node& node) const
      -> std::expected<properties::FluidProperties, core::ConfigurationError>;

  [[nodiscard]] auto parse_material(const std::string& name, const YAML::Node& node) const
      -> std::expected<properties::MaterialProperties, core::ConfigurationError>;

public:
  explicit PropertyFileParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<PropertyTables, core::ConfigurationError>;
};

// Reference library extended with the entries of the given file
[[nodiscard]] auto load_property_library(const std::filesystem::path& file_path,
                                         const properties::PropertyLibrary& base = properties::PropertyLibrary::reference())
    -> std::expected<properties::PropertyLibrary, core::ConfigurationError>;

} // namespace wavepack::io

#pragma once
#include "../io/config_types.hpp"
#include "../properties/property_library.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace wavepack::core {

class ConfigurationLoader {
public:
  struct LoadResult {
    io::Configuration config;
    properties::PropertyLibrary library;
    std::string property_source; // "reference" or the property file path
    std::filesystem::path config_path;
  };

  // Load configuration and the property library it selects
  [[nodiscard]] auto load_configuration(const std::string& config_file) -> std::expected<LoadResult, ApplicationError>;

  auto display_configuration_info(const io::Configuration& config, const properties::PropertyLibrary& library) const
      -> void;

private:
  [[nodiscard]] auto load_library(const io::PropertiesConfig& properties_config)
      -> std::expected<properties::PropertyLibrary, ApplicationError>;

  auto display_library_info(const properties::PropertyLibrary& library) const -> void;

  auto display_case_info(const io::Configuration& config) const -> void;

  auto display_operating_conditions(const io::Configuration& config) const -> void;
};

} // namespace wavepack::core

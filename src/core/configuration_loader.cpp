#include "wavepack/core/configuration_loader.hpp"
#include "wavepack/core/constants.hpp"
#include "wavepack/io/config_manager.hpp"
#include "wavepack/io/property_file_parser.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace wavepack::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file)
    -> std::expected<LoadResult, ApplicationError> {

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);
  if (!config_result) {
    return std::unexpected(
        ApplicationError{"Failed to load config: " + config_result.error().message(), constants::indexing::second});
  }
  auto config = std::move(config_result.value());

  std::cout << "✓ Configuration loaded successfully" << std::endl;

  auto library_result = load_library(config.properties);
  if (!library_result) {
    return std::unexpected(library_result.error());
  }
  auto library = std::move(library_result.value());

  std::cout << "✓ Property library ready (" << library.fluid_count() << " fluids, " << library.material_count()
            << " materials)" << std::endl;

  display_configuration_info(config, library);

  std::string source = config.properties.property_file.value_or("reference");
  return LoadResult{std::move(config), std::move(library), std::move(source), config_manager.config_file_path()};
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config,
                                                     const properties::PropertyLibrary& library) const -> void {
  if (config.verbose) {
    display_library_info(library);
  }
  display_case_info(config);
  display_operating_conditions(config);
}

auto ConfigurationLoader::load_library(const io::PropertiesConfig& properties_config)
    -> std::expected<properties::PropertyLibrary, ApplicationError> {

  if (!properties_config.property_file) {
    return properties::PropertyLibrary::reference();
  }

  std::cout << "Loading property file: " << *properties_config.property_file << std::endl;

  auto library_result = io::load_property_library(*properties_config.property_file);
  if (!library_result) {
    return std::unexpected(ApplicationError{"Failed to load property file: " + library_result.error().message(),
                                            constants::indexing::second});
  }

  return std::move(library_result.value());
}

auto ConfigurationLoader::display_library_info(const properties::PropertyLibrary& library) const -> void {
  std::cout << "\nFluids:" << std::endl;
  for (const auto& name : library.fluid_names()) {
    auto fluid = library.lookup_fluid(name);
    if (fluid) {
      std::cout << std::format("  {:<12} rho0 = {:8.4f} kg/m³  mu0 = {:.3e} Pa·s", name, fluid->density,
                               fluid->viscosity)
                << std::endl;
    }
  }

  std::cout << "Materials:" << std::endl;
  for (const auto& name : library.material_names()) {
    auto material = library.lookup_material(name);
    if (material) {
      std::cout << std::format("  {:<16} rho = {:7.1f} kg/m³  eps_r = {:g}  mu_r = {:g}", name, material->density,
                               material->relative_permittivity, material->relative_permeability)
                << std::endl;
    }
  }
}

auto ConfigurationLoader::display_case_info(const io::Configuration& config) const -> void {
  const auto& input = config.input;
  const bool circular = geometry::is_circular(input.shape);

  std::cout << "\n"
            << constants::string_processing::colors::cyan << "┌─ ARRAY CASE ──────────────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Channel shape   : " << std::setw(22) << std::left << geometry::shape_name(input.shape) << " │"
            << std::endl;
  std::cout << "│ Material        : " << std::setw(22) << std::left << input.material << " │" << std::endl;
  std::cout << "│ Fluid           : " << std::setw(22) << std::left << input.fluid << " │" << std::endl;
  if (circular) {
    std::cout << "│ Diameter        : " << std::setw(18) << std::right << input.a_in << " in  │" << std::endl;
  } else {
    std::cout << "│ Width (a)       : " << std::setw(18) << std::right << input.a_in << " in  │" << std::endl;
    std::cout << "│ Height (b)      : " << std::setw(18) << std::right << input.b_in << " in  │" << std::endl;
  }
  std::cout << "│ Wall thickness  : " << std::setw(18) << std::right << input.t_in << " in  │" << std::endl;
  std::cout << "│ Length          : " << std::setw(18) << std::right << input.L_in << " in  │" << std::endl;
  std::cout << "│ Layout policy   : " << std::setw(22) << std::left
            << geometry::layout_policy_name(config.numerical.layout_policy) << " │" << std::endl;
  std::cout << constants::string_processing::colors::cyan << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

auto ConfigurationLoader::display_operating_conditions(const io::Configuration& config) const -> void {
  const auto& input = config.input;

  std::cout << "\n"
            << constants::string_processing::colors::blue << "┌─ OPERATING CONDITIONS ────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Velocity target : " << std::setw(17) << std::right << input.vel_target_fts << " ft/s │" << std::endl;
  std::cout << "│ ΔP limit        : " << std::setw(17) << std::right << input.dp_limit_psi << " psi  │" << std::endl;
  std::cout << "│ T min           : " << std::setw(17) << std::right << input.T_min_F << " °F   │" << std::endl;
  std::cout << "│ T max           : " << std::setw(17) << std::right << input.T_max_F << " °F   │" << std::endl;
  std::cout << "│ T samples       : " << std::setw(17) << std::right << config.numerical.temperature_samples
            << "      │" << std::endl;
  std::cout << constants::string_processing::colors::blue << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

} // namespace wavepack::core

#include "wavepack/properties/property_library.hpp"
#include <format>

namespace wavepack::properties {

namespace {

auto join_names(const std::vector<std::string>& names) -> std::string {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

} // namespace

auto PropertyLibrary::reference() -> const PropertyLibrary& {
  static const PropertyLibrary library{
      FluidTable{{"Air", {1.225, 1.81e-5}},
                 {"Water", {998.0, 1.00e-3}},
                 {"Diesel", {830.0, 3.50e-3}},
                 {"Oil", {870.0, 8.00e-3}},
                 {"Gasoline", {740.0, 6.00e-4}}},
      MaterialTable{{"Stainless Steel", {8000.0, 1.0, 1.05, 1.5e-6}},
                    {"Aluminum", {2700.0, 1.0, 1.0, 1.2e-6}},
                    {"Copper", {8960.0, 1.0, 0.999, 1.0e-6}},
                    {"Brass", {8500.0, 1.0, 1.0, 1.3e-6}},
                    {"Titanium", {4500.0, 1.0, 1.1, 1.7e-6}}}};
  return library;
}

auto PropertyLibrary::lookup_fluid(std::string_view name) const
    -> std::expected<FluidProperties, core::SolveError> {
  auto it = fluids_.find(name);
  if (it == fluids_.end()) {
    return std::unexpected(core::UnknownLookupError(
        "fluid", std::string(name), std::format("Unknown fluid. Available: {}", join_names(fluid_names()))));
  }
  return it->second;
}

auto PropertyLibrary::lookup_material(std::string_view name) const
    -> std::expected<MaterialProperties, core::SolveError> {
  auto it = materials_.find(name);
  if (it == materials_.end()) {
    return std::unexpected(core::UnknownLookupError(
        "material", std::string(name),
        std::format("Unknown material. Available: {}", join_names(material_names()))));
  }
  return it->second;
}

auto PropertyLibrary::extended(const FluidTable& fluids, const MaterialTable& materials) const -> PropertyLibrary {
  auto merged_fluids = fluids_;
  for (const auto& [name, props] : fluids) {
    merged_fluids.insert_or_assign(name, props);
  }
  auto merged_materials = materials_;
  for (const auto& [name, props] : materials) {
    merged_materials.insert_or_assign(name, props);
  }
  return PropertyLibrary{std::move(merged_fluids), std::move(merged_materials)};
}

auto PropertyLibrary::fluid_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(fluids_.size());
  for (const auto& [name, _] : fluids_) {
    names.push_back(name);
  }
  return names;
}

auto PropertyLibrary::material_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(materials_.size());
  for (const auto& [name, _] : materials_) {
    names.push_back(name);
  }
  return names;
}

} // namespace wavepack::properties

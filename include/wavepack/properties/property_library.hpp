#pragma once
#include "../core/exceptions.hpp"
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wavepack::properties {

// Baseline fluid properties at the reference temperature
struct FluidProperties {
  double density;   // [kg/m³]
  double viscosity; // dynamic [Pa·s]
};

struct MaterialProperties {
  double density;               // [kg/m³]
  double relative_permittivity; // εr
  double relative_permeability; // μr
  double roughness;             // surface roughness length [m]
};

using FluidTable = std::map<std::string, FluidProperties, std::less<>>;
using MaterialTable = std::map<std::string, MaterialProperties, std::less<>>;

/**
 * @brief Immutable name -> property lookup for fluids and materials
 *
 * Names are matched exactly. The reference tables are a process-wide constant;
 * extended libraries are independent copies and never alter the reference.
 */
class PropertyLibrary {
private:
  FluidTable fluids_;
  MaterialTable materials_;

public:
  PropertyLibrary(FluidTable fluids, MaterialTable materials)
      : fluids_(std::move(fluids)), materials_(std::move(materials)) {}

  // Built-in tables (5 fluids, 5 materials)
  [[nodiscard]] static auto reference() -> const PropertyLibrary&;

  [[nodiscard]] auto lookup_fluid(std::string_view name) const
      -> std::expected<FluidProperties, core::SolveError>;

  [[nodiscard]] auto lookup_material(std::string_view name) const
      -> std::expected<MaterialProperties, core::SolveError>;

  // New library holding this one's entries plus the given ones; given entries win on name clashes
  [[nodiscard]] auto extended(const FluidTable& fluids, const MaterialTable& materials) const -> PropertyLibrary;

  [[nodiscard]] auto fluid_names() const -> std::vector<std::string>;
  [[nodiscard]] auto material_names() const -> std::vector<std::string>;

  [[nodiscard]] auto fluid_count() const noexcept -> std::size_t { return fluids_.size(); }
  [[nodiscard]] auto material_count() const noexcept -> std::size_t { return materials_.size(); }
};

} // namespace wavepack::properties

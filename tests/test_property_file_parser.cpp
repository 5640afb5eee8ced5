#include "wavepack/io/property_file_parser.hpp"
#include <iostream>

int main() {
  using namespace wavepack;

  auto library = io::load_property_library("data/extra_properties.yaml");
  if (!library) {
    std::cerr << library.error().message() << "\n";
    return 1;
  }

  if (library->fluid_count() != 6 || library->material_count() != 6) {
    std::cerr << "Expected reference entries plus one new fluid and one new material\n";
    return 1;
  }

  auto glycol = library->lookup_fluid("Glycol");
  auto inconel = library->lookup_material("Inconel 625");
  if (!glycol || glycol->viscosity != 5.7e-2 || !inconel || inconel->relative_permeability != 1.0006) {
    std::cerr << "New entries not loaded\n";
    return 1;
  }

  auto air = library->lookup_fluid("Air");
  if (!air || air->density != 1.3) {
    std::cerr << "File entries should override reference entries\n";
    return 1;
  }
  if (properties::PropertyLibrary::reference().lookup_fluid("Air")->density != 1.225) {
    std::cerr << "Reference table must stay unchanged\n";
    return 1;
  }

  // Extension works on top of a non-reference base
  auto stacked = io::load_property_library("data/extra_properties.yaml", *library);
  if (!stacked || stacked->fluid_count() != 6) {
    std::cerr << "Reloading the same entries should not add duplicates\n";
    return 1;
  }

  auto negative = io::load_property_library("data/bad_properties.yaml");
  if (negative || negative.error().message().find("Foam.density") == std::string::npos) {
    std::cerr << "Negative density should be rejected with the entry name\n";
    return 1;
  }

  if (io::load_property_library("data/no_such_file.yaml")) {
    std::cerr << "Missing property file should fail\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

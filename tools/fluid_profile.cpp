#include "wavepack/io/property_file_parser.hpp"
#include "wavepack/properties/property_library.hpp"
#include "wavepack/properties/temperature_interpolator.hpp"
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  wavepack_fluid_profile <fluid> <T_min_F> <T_max_F> [samples] [property_file]\n";
    std::cout << "\nPrints density and viscosity of the fluid at equally spaced temperatures\n";
    std::cout << "between the bounds (endpoints included) and their arithmetic means.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  wavepack_fluid_profile Air 32 212\n";
    std::cout << "  wavepack_fluid_profile Water 50 80 7\n";
    std::cout << "  wavepack_fluid_profile Glycol 0 150 10 config/properties/extra_materials.yaml\n";
}

void print_available(const wavepack::properties::PropertyLibrary& library) {
    std::cout << "Available fluids:";
    for (const auto& name : library.fluid_names()) {
        std::cout << " " << name;
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 6) {
        print_usage();
        return 1;
    }

    std::string fluid_name = argv[1];
    double t_min_f = 0.0;
    double t_max_f = 0.0;
    int samples = wavepack::constants::defaults::temperature_samples;

    try {
        t_min_f = std::stod(argv[2]);
        t_max_f = std::stod(argv[3]);
        if (argc > 4) {
            samples = std::stoi(argv[4]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        print_usage();
        return 1;
    }

    std::optional<wavepack::properties::PropertyLibrary> extended;
    if (argc > 5) {
        auto library_result = wavepack::io::load_property_library(argv[5]);
        if (!library_result) {
            std::cerr << "Error: " << library_result.error().message() << "\n";
            return 1;
        }
        extended = std::move(library_result.value());
    }
    const auto& library = extended ? *extended : wavepack::properties::PropertyLibrary::reference();

    auto fluid = library.lookup_fluid(fluid_name);
    if (!fluid) {
        std::cerr << "Error: " << fluid.error().message() << "\n";
        print_available(library);
        return 1;
    }

    auto profile = wavepack::properties::interpolate_profile(*fluid, t_min_f, t_max_f, samples);
    if (!profile) {
        std::cerr << "Error: " << profile.error().message() << "\n";
        return 1;
    }

    std::cout << "\n=== Fluid Property Profile ===\n";
    std::cout << "Fluid: " << fluid_name << "\n";
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "Reference (273.15 K): rho0 = " << fluid->density << " kg/m^3, mu0 = " << fluid->viscosity
              << " Pa*s\n\n";

    std::cout << std::setw(10) << "T [F]" << std::setw(12) << "T [K]" << std::setw(16) << "rho [kg/m^3]"
              << std::setw(16) << "mu [Pa*s]" << "\n";
    std::cout << std::string(54, '-') << "\n";

    for (const auto& sample : profile->samples) {
        std::cout << std::fixed << std::setprecision(2) << std::setw(10)
                  << wavepack::properties::kelvin_to_fahrenheit(sample.temperature) << std::setw(12)
                  << sample.temperature << std::scientific << std::setprecision(6) << std::setw(16) << sample.density
                  << std::setw(16) << sample.viscosity << "\n";
    }

    std::cout << std::string(54, '-') << "\n";
    std::cout << std::setw(22) << "mean" << std::setw(16) << profile->mean_density << std::setw(16)
              << profile->mean_viscosity << "\n";

    return 0;
}

#include "wavepack/core/application_runner.hpp"
#include "wavepack/core/constants.hpp"
#include "wavepack/io/output/hdf5_writer.hpp"
#include "wavepack/solver/wavepack_solver.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace wavepack::core {

ApplicationRunner::ApplicationRunner()
    : config_loader_(std::make_unique<ConfigurationLoader>()), output_manager_(std::make_unique<OutputManager>()),
      solve_runner_(std::make_unique<SolveRunner>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argv[constants::indexing::first]);
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::indexing::first, "Help displayed"};
    }

    display_header();

    auto load_result = config_loader_->load_configuration(args.config_file);
    if (!load_result) {
      return handle_error(load_result.error());
    }
    auto loaded = std::move(load_result.value());
    const auto& config = loaded.config;

    if (auto output_init = output_manager_->initialize_output_system(config); !output_init) {
      return handle_error(output_init.error());
    }
    if (config.verbose) {
      output_manager_->display_planned_outputs(args.output_name);
    }

    solver::WavepackSolver solver(loaded.library, config.numerical);

    auto solve_result = solve_runner_->run_solve(solver, config, metrics);
    if (!solve_result) {
      return handle_error(solve_result.error());
    }
    auto result = std::move(solve_result.value());

    solve_runner_->display_solve_results(result, config);

    io::output::RunMetadata metadata;
    metadata.config_file = loaded.config_path.string();
    metadata.property_source = loaded.property_source;

    auto output_result =
        output_manager_->write_solve_results(result, config, args.output_name, std::move(metadata), metrics);
    if (!output_result) {
      return handle_error(output_result.error());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    display_performance_summary(metrics);
    display_completion_message();

    cleanup();

    return {true, constants::indexing::first, "Success"};

  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::indexing::second});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[])
    -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int max_accepted_args = 3;

  CommandLineArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help_requested = true;
      return args;
    }
  }

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::indexing::second});
  }
  if (argc > max_accepted_args) {
    return std::unexpected(ApplicationError{"Too many arguments provided", constants::indexing::second});
  }

  args.config_file = argv[constants::indexing::second];

  if (argc == max_accepted_args) {
    args.output_name = argv[constants::indexing::third];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [output_name]\n"
            << "\n"
            << "Sizes a perforated-tube waveguide array for the case described in the\n"
            << "configuration file and writes HDF5, CSV and report outputs.\n"
            << "\n"
            << "  -h, --help    show this message\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== WAVEPACK Waveguide Array Sizer ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  std::cout << "  Solve : " << metrics.solve_time.count() << " µs" << std::endl;
  std::cout << "  Output: " << metrics.output_time.count() << " ms" << std::endl;
}

auto ApplicationRunner::display_completion_message() const -> void {
  std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;
  std::cout << "\nPost-processing recommendations:" << std::endl;
  std::cout << "  • Open .h5 files with HDFView or Python (h5py, pandas)" << std::endl;
  std::cout << "  • The .md report renders in any Markdown viewer" << std::endl;
}

auto ApplicationRunner::cleanup() -> void {
  io::output::hdf5::finalize();
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << constants::string_processing::colors::red << "Error: " << error.message
            << constants::string_processing::colors::reset << std::endl;
  cleanup();
  return {false, error.exit_code, error.message};
}

} // namespace wavepack::core

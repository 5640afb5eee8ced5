#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_writer.hpp"
#include "../solver/solve_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wavepack::core {

class OutputManager {
public:
  using ProgressCallback = std::function<void(double, const std::string&)>;

  [[nodiscard]] auto initialize_output_system(const io::Configuration& config) -> std::expected<void, ApplicationError>;

  [[nodiscard]] auto write_solve_results(const solver::SolveResult& result, const io::Configuration& config,
                                         const std::string& case_name, io::output::RunMetadata metadata,
                                         PerformanceMetrics& metrics)
      -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  auto display_planned_outputs(const std::string& case_name) const -> void;

  // Maps the YAML output and report sections onto the writer configuration
  [[nodiscard]] static auto create_output_config(const io::Configuration& config) -> io::output::OutputConfig;

private:
  std::unique_ptr<io::output::OutputWriter> output_writer_;

  [[nodiscard]] auto initialize_hdf5() -> std::expected<void, ApplicationError>;

  auto create_progress_callback() -> ProgressCallback;
};

} // namespace wavepack::core

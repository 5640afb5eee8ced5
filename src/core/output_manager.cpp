#include "wavepack/core/output_manager.hpp"
#include "wavepack/core/constants.hpp"
#include "wavepack/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace wavepack::core {

namespace {

auto to_output_format(io::OutputConfig::Format format) -> io::output::OutputFormat {
  switch (format) {
  case io::OutputConfig::Format::HDF5:
    return io::output::OutputFormat::HDF5;
  case io::OutputConfig::Format::CSV:
    return io::output::OutputFormat::CSV;
  case io::OutputConfig::Format::Report:
    return io::output::OutputFormat::Report;
  }
  return io::output::OutputFormat::HDF5;
}

} // namespace

auto OutputManager::initialize_output_system(const io::Configuration& config)
    -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  if (auto hdf5_init = initialize_hdf5(); !hdf5_init) {
    return std::unexpected(hdf5_init.error());
  }

  output_writer_ = std::make_unique<io::output::OutputWriter>(create_output_config(config));

  if (auto validation = output_writer_->validate_config(); !validation) {
    return std::unexpected(
        ApplicationError{"Output configuration error: " + validation.error().message(), constants::indexing::second});
  }

  std::cout << constants::string_processing::colors::green << "✓ Output system configured"
            << constants::string_processing::colors::reset << std::endl;

  return {};
}

auto OutputManager::write_solve_results(const solver::SolveResult& result, const io::Configuration& config,
                                        const std::string& case_name, io::output::RunMetadata metadata,
                                        PerformanceMetrics& metrics)
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError> {

  if (!output_writer_) {
    return std::unexpected(ApplicationError{"Output system not initialized", constants::indexing::second});
  }

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  auto progress_callback = create_progress_callback();

  auto output_start = std::chrono::high_resolution_clock::now();
  auto output_result = output_writer_->write_result(result, config.input, config.numerical, case_name,
                                                    progress_callback, std::move(metadata));
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  std::cout << std::endl;

  if (!output_result) {
    const auto& error = output_result.error();
    return std::unexpected(ApplicationError{
        "Failed to write output: " + (config.verbose ? error.full_message() : error.message()),
        constants::indexing::second});
  }

  auto output_files = std::move(output_result.value());
  metrics.output_files = output_files;

  std::cout << constants::string_processing::colors::green << "✓ Output written successfully!"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::cout << "\nGenerated files:" << std::endl;

  for (const auto& file_path : output_files) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    std::cout << "  " << file_path.filename().string();
    if (!ec) {
      std::cout << " (" << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
                << (file_size / constants::io::bytes_to_kb) << " KB)";
    }
    std::cout << std::endl;
  }

  return output_files;
}

auto OutputManager::display_planned_outputs(const std::string& case_name) const -> void {
  if (!output_writer_) {
    return;
  }

  std::cout << "\nPlanned output files:" << std::endl;
  for (const auto& [format, path] : output_writer_->get_output_info(case_name)) {
    std::cout << "  " << io::output::format_name(format) << ": " << path.filename().string()
              << (output_writer_->get_config().include_timestamp ? " (timestamp set at write time)" : "")
              << std::endl;
  }
}

auto OutputManager::initialize_hdf5() -> std::expected<void, ApplicationError> {
  if (auto hdf5_init = io::output::hdf5::initialize(); !hdf5_init) {
    std::cerr << constants::string_processing::colors::yellow
              << "Warning: Failed to initialize HDF5: " << hdf5_init.error().message()
              << constants::string_processing::colors::reset << std::endl;
  } else {
    if (auto version = io::output::hdf5::check_version()) {
      std::cout << constants::string_processing::colors::green
                << "✓ HDF5 library version: " << constants::string_processing::colors::reset << version.value()
                << std::endl;
    }
  }
  return {};
}

auto OutputManager::create_output_config(const io::Configuration& config) -> io::output::OutputConfig {
  io::output::OutputConfig output_config;
  output_config.base_directory = config.output.output_directory;
  output_config.include_timestamp = config.output.include_timestamp;
  output_config.save_metadata = true;
  output_config.save_temperature_sweep = config.numerical.temperature_sweep;
  output_config.compress_data = true;

  const auto& formats = config.output.formats;
  if (!formats.empty()) {
    output_config.primary_format = to_output_format(formats.front());
    for (std::size_t i = constants::indexing::second; i < formats.size(); ++i) {
      output_config.additional_formats.push_back(to_output_format(formats[i]));
    }
  }

  output_config.report.title = config.report.title;
  output_config.report.min_shielding_db = config.report.min_shielding_db;
  output_config.report.shielding_check_frequency_hz = config.report.shielding_check_frequency_hz;
  output_config.report.attachments = config.report.attachments;

  return output_config;
}

auto OutputManager::create_progress_callback() -> ProgressCallback {
  return [](double progress, const std::string& stage) {
    std::cout << "\r" << std::setw(constants::string_processing::separator_width + 24) << std::left
              << ("  " + stage + " [" +
                  std::to_string(static_cast<int>(progress * constants::conversion::to_percentage)) + "%]")
              << std::flush;
  };
}

} // namespace wavepack::core

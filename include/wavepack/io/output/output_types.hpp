#pragma once
#include "../../core/constants.hpp"
#include "../../core/exceptions.hpp"
#include "../../solver/solve_types.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>

namespace wavepack::io::output {

enum class OutputFormat { HDF5, CSV, Report };

[[nodiscard]] constexpr auto format_name(OutputFormat format) noexcept -> std::string_view {
  switch (format) {
  case OutputFormat::HDF5:
    return "HDF5";
  case OutputFormat::CSV:
    return "CSV";
  case OutputFormat::Report:
    return "Report";
  }
  return "Unknown";
}

// Report-specific settings carried alongside the generic output options
struct ReportSettings {
  std::string title = "Wavepack Analysis Report";
  double min_shielding_db = constants::defaults::min_shielding_db;
  double shielding_check_frequency_hz = constants::defaults::shielding_check_frequency_hz;
  ReportConfig::Attachments attachments;
};

struct OutputConfig {
  std::filesystem::path base_directory = "wavepack_outputs";
  OutputFormat primary_format = OutputFormat::HDF5;
  std::vector<OutputFormat> additional_formats;
  bool save_metadata = true;
  bool save_temperature_sweep = true;
  bool compress_data = true;
  double compression_level = constants::io::default_hdf5_compression; // 0-9 for HDF5

  bool include_timestamp = true;

  ReportSettings report;
};

struct RunMetadata {
  std::string wavepack_version = constants::io::default_wavepack_version;
  std::chrono::system_clock::time_point creation_time;
  std::string case_name;
  std::string config_file;
  std::string property_source = "reference";
};

// Everything a writer needs; built once per run
struct OutputDataset {
  RunMetadata metadata;
  solver::SolveInput input;
  solver::SolveOptions options;
  solver::SolveResult result;
};

using ProgressCallback = std::function<void(double progress, const std::string& stage)>;

class OutputError : public core::WavepackException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : WavepackException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

class UnsupportedFormatError : public OutputError {
public:
  explicit UnsupportedFormatError(OutputFormat format, std::source_location location = std::source_location::current())
      : OutputError(std::format("Unsupported output format: {}", static_cast<int>(format)), location) {}
};

} // namespace wavepack::io::output

#include "wavepack/io/output/output_writer.hpp"
#include "wavepack/io/output/csv_writer.hpp"
#include "wavepack/io/output/hdf5_writer.hpp"
#include "wavepack/io/output/report_writer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace wavepack::io::output {

auto WriterFactory::create_writer(OutputFormat format)
    -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError> {

  switch (format) {
  case OutputFormat::HDF5:
    return std::make_unique<HDF5Writer>();
  case OutputFormat::CSV:
    return std::make_unique<CSVWriter>();
  case OutputFormat::Report:
    return std::make_unique<ReportWriter>();
  }

  return std::unexpected(UnsupportedFormatError(format));
}

OutputWriter::OutputWriter(OutputConfig config) : config_(std::move(config)) {
  initialize_writers();
}

auto OutputWriter::initialize_writers() -> void {
  writers_.clear();

  std::vector<OutputFormat> formats = {config_.primary_format};
  for (auto format : config_.additional_formats) {
    if (std::ranges::find(formats, format) == formats.end()) {
      formats.push_back(format);
    }
  }

  for (auto format : formats) {
    if (auto writer = WriterFactory::create_writer(format)) {
      writers_.emplace_back(format, std::move(writer.value()));
    }
  }
}

auto OutputWriter::write_result(const solver::SolveResult& result, const solver::SolveInput& input,
                                const solver::SolveOptions& options, const std::string& case_name,
                                ProgressCallback progress, RunMetadata metadata)
    -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  auto dataset_result = convert_result(result, input, options, case_name);
  if (!dataset_result) {
    return std::unexpected(dataset_result.error());
  }
  auto dataset = std::move(dataset_result.value());

  // Caller-supplied provenance; the timestamp is always taken here
  metadata.creation_time = dataset.metadata.creation_time;
  metadata.case_name = case_name;
  dataset.metadata = std::move(metadata);

  auto file_paths = generate_file_paths(case_name, dataset.metadata.creation_time);

  if (!file_paths.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(file_paths.front().parent_path(), ec);
    if (ec) {
      return std::unexpected(OutputError(std::format("Cannot create output directory '{}': {}",
                                                     file_paths.front().parent_path().string(), ec.message())));
    }
  }

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (std::size_t i = 0; i < writers_.size() && i < file_paths.size(); ++i) {
    const auto& writer = writers_[i].second;
    const auto& file_path = file_paths[i];

    if (progress) {
      progress(static_cast<double>(i) / writers_.size(), std::format("Writing {}", file_path.filename().string()));
    }

    if (auto write_result = writer->write(file_path, dataset, config_, progress); !write_result) {
      return std::unexpected(FileWriteError(file_path, write_result.error().message()));
    }

    written_files.push_back(file_path);
  }

  if (progress) {
    progress(1.0, "Output complete");
  }

  return written_files;
}

auto OutputWriter::convert_result(const solver::SolveResult& result, const solver::SolveInput& input,
                                  const solver::SolveOptions& options, const std::string& case_name) const
    -> std::expected<OutputDataset, OutputError> {

  if (result.freqs.size() != result.se_db.size()) {
    return std::unexpected(OutputError(std::format("Frequency sweep ({}) and SE curve ({}) lengths differ",
                                                   result.freqs.size(), result.se_db.size())));
  }
  if (result.temperature_sweep.rows() > 0 && result.temperature_sweep.cols() != solver::sweep_columns::count) {
    return std::unexpected(OutputError(std::format("Temperature sweep has {} columns, expected {}",
                                                   result.temperature_sweep.cols(), solver::sweep_columns::count)));
  }

  OutputDataset dataset;
  dataset.metadata.creation_time = std::chrono::system_clock::now();
  dataset.metadata.case_name = case_name;
  dataset.input = input;
  dataset.options = options;
  dataset.result = result;

  return dataset;
}

auto OutputWriter::generate_file_paths(const std::string& case_name,
                                       const std::chrono::system_clock::time_point& timestamp) const
    -> std::vector<std::filesystem::path> {

  std::vector<std::filesystem::path> paths;
  paths.reserve(writers_.size());

  std::string timestamp_str;
  if (config_.include_timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto tm = *std::localtime(&time_t);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    timestamp_str = "_" + oss.str();
  }

  for (const auto& [format, writer] : writers_) {
    auto filename = case_name + timestamp_str + std::string(writer->get_extension());
    paths.push_back(config_.base_directory / filename);
  }

  return paths;
}

auto OutputWriter::validate_config() const -> std::expected<void, OutputError> {
  if (!std::filesystem::exists(config_.base_directory)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.base_directory, ec);
    if (ec) {
      return std::unexpected(OutputError(
          std::format("Cannot create output directory '{}': {}", config_.base_directory.string(), ec.message())));
    }
  }

  if (config_.compression_level < 0.0 || config_.compression_level > 9.0) {
    return std::unexpected(OutputError("Compression level must be between 0.0 and 9.0"));
  }

  if (writers_.empty()) {
    return std::unexpected(OutputError("No output writer could be created for the configured formats"));
  }

  return {};
}

auto OutputWriter::get_output_info(const std::string& case_name) const
    -> std::vector<std::pair<OutputFormat, std::filesystem::path>> {

  std::vector<std::pair<OutputFormat, std::filesystem::path>> info;

  auto paths = generate_file_paths(case_name, std::chrono::system_clock::now());
  for (std::size_t i = 0; i < std::min(writers_.size(), paths.size()); ++i) {
    info.emplace_back(writers_[i].first, paths[i]);
  }

  return info;
}

} // namespace wavepack::io::output

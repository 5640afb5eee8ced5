#pragma once
#include "output_writer.hpp"
#include <hdf5.h>
#include <memory>
#include <string_view>

namespace wavepack::io::output {

struct HDF5Config {
  int compression_level = constants::io::default_hdf5_compression; // 0-9, higher = better compression
  bool use_shuffle_filter = true;
  bool use_fletcher32 = false;
  std::size_t chunk_size = constants::io::default_hdf5_chunk_size;
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;
using AttributeHandle = HDF5Handle<hid_t, H5Aclose>;

/**
 * @brief HDF5 layout
 *
 *   /metadata            attributes only (version, creation time, provenance)
 *   /inputs              case inputs as entered, plus solve options
 *   /result              array_dims, velocity_fts, deltaP_psi, fc_GHz, SE_db, freqs,
 *                        total_weight_lbm, a_in, b_in, t_in, L_ft
 *   /diagnostics         intermediate quantities
 *   /temperature_sweep   table [n_samples x n_columns] and column_names
 */
class HDF5Writer : public FormatWriter {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file, const RunMetadata& metadata) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_inputs(FileHandle& file, const solver::SolveInput& input,
                                  const solver::SolveOptions& options) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_result(FileHandle& file, const solver::SolveResult& result) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_diagnostics(FileHandle& file, const solver::SolveDiagnostics& diagnostics) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_temperature_sweep(FileHandle& file, const core::Matrix<double>& sweep) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_int_vector(hid_t parent, const std::string& name,
                                      const std::vector<int>& data) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value, const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  // Stored as an attribute of parent (file, group or dataset)
  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto
  write_string_array(hid_t parent, const std::string& name,
                     const std::vector<std::string>& values) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_chunked_properties(std::vector<hsize_t> dims) const
      -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                           const OutputConfig& config,
                           ProgressCallback progress = nullptr) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".h5"; }
};

namespace hdf5 {

// Initialize HDF5 library (call once at program start)
auto initialize() -> std::expected<void, OutputError>;

// Cleanup HDF5 library (call at program end)
auto finalize() -> void;

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace wavepack::io::output

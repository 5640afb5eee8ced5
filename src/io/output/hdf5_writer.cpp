#include "wavepack/io/output/hdf5_writer.hpp"
#include "wavepack/geometry/geometry_types.hpp"
#include <algorithm>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace wavepack::io::output {

auto HDF5Writer::write(const std::filesystem::path& file_path, const OutputDataset& dataset, const OutputConfig& config,
                       ProgressCallback progress) const -> std::expected<void, OutputError> {

  const int requested_level = config.compress_data ? static_cast<int>(config.compression_level) : 0;
  if (requested_level != hdf5_config_.compression_level) {
    HDF5Config adjusted = hdf5_config_;
    adjusted.compression_level = requested_level;
    return HDF5Writer(adjusted).write(file_path, dataset, config, progress);
  }

  try {
    if (progress)
      progress(0.0, "Creating HDF5 file");

    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (config.save_metadata) {
      if (progress)
        progress(0.1, "Writing metadata");
      if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
        return std::unexpected(meta_result.error());
      }
    }

    if (progress)
      progress(0.3, "Writing inputs");
    if (auto inputs_result = write_inputs(file, dataset.input, dataset.options); !inputs_result) {
      return std::unexpected(inputs_result.error());
    }

    if (progress)
      progress(0.5, "Writing result");
    if (auto result = write_result(file, dataset.result); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_diagnostics(file, dataset.result.diagnostics); !result) {
      return std::unexpected(result.error());
    }

    if (config.save_temperature_sweep && dataset.result.temperature_sweep.rows() > 0) {
      if (progress)
        progress(0.8, "Writing temperature sweep");
      if (auto result = write_temperature_sweep(file, dataset.result.temperature_sweep); !result) {
        return std::unexpected(result.error());
      }
    }

    if (progress)
      progress(1.0, "HDF5 write complete");

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file, const RunMetadata& metadata) const
    -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");

  const std::pair<const char*, std::string> attributes[] = {{"wavepack_version", metadata.wavepack_version},
                                                            {"creation_time", oss.str()},
                                                            {"case_name", metadata.case_name},
                                                            {"config_file", metadata.config_file},
                                                            {"property_source", metadata.property_source}};
  for (const auto& [name, value] : attributes) {
    if (auto result = write_string(metadata_group, name, value); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_inputs(FileHandle& file, const solver::SolveInput& input,
                              const solver::SolveOptions& options) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "inputs");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  struct Field {
    const char* name;
    double value;
    const char* units;
  };
  const Field fields[] = {{"a_in", input.a_in, "in"},
                          {"b_in", input.b_in, "in"},
                          {"t_in", input.t_in, "in"},
                          {"L_in", input.L_in, "in"},
                          {"vel_target_fts", input.vel_target_fts, "ft/s"},
                          {"dp_limit_psi", input.dp_limit_psi, "psi"},
                          {"T_min_F", input.T_min_F, "degF"},
                          {"T_max_F", input.T_max_F, "degF"},
                          {"temperature_samples", static_cast<double>(options.temperature_samples), ""},
                          {"frequency_decade_min", static_cast<double>(options.frequency_decade_min), "log10(Hz)"},
                          {"frequency_decade_max", static_cast<double>(options.frequency_decade_max), "log10(Hz)"}};

  for (const auto& field : fields) {
    if (auto result = write_scalar(group, field.name, field.value, field.units); !result) {
      return std::unexpected(result.error());
    }
  }

  const std::pair<const char*, std::string> labels[] = {
      {"shape", std::string(geometry::shape_name(input.shape))},
      {"material", input.material},
      {"fluid", input.fluid},
      {"layout_policy", std::string(geometry::layout_policy_name(options.layout_policy))}};
  for (const auto& [name, value] : labels) {
    if (auto result = write_string(group, name, value); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_result(FileHandle& file, const solver::SolveResult& result) const
    -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "result");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto r = write_int_vector(group, "array_dims", {result.array_dims.first, result.array_dims.second}); !r) {
    return std::unexpected(r.error());
  }

  struct Field {
    const char* name;
    double value;
    const char* units;
    const char* description;
  };
  const Field fields[] = {
      {"velocity_fts", result.velocity_fts, "ft/s", "Channel velocity"},
      {"deltaP_psi", result.delta_p_psi, "psi", "Pressure drop of one representative channel"},
      {"fc_GHz", result.fc_ghz, "GHz", "Waveguide cutoff frequency"},
      {"total_weight_lbm", result.total_weight_lbm, "lbm", "Array mass"},
      {"a_in", result.a_in, "in", "Channel width or diameter"},
      {"b_in", result.b_in, "in", "Channel height, ignored for circular channels"},
      {"t_in", result.t_in, "in", "Wall thickness"},
      {"L_ft", result.L_ft, "ft", "Channel length"}};

  for (const auto& field : fields) {
    if (auto r = write_scalar(group, field.name, field.value, field.units, field.description); !r) {
      return std::unexpected(r.error());
    }
  }

  if (auto r = write_vector(group, "freqs", result.freqs, "Hz", "Sweep frequencies"); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = write_vector(group, "SE_db", result.se_db, "dB", "Shielding effectiveness aligned with freqs"); !r) {
    return std::unexpected(r.error());
  }

  return {};
}

auto HDF5Writer::write_diagnostics(FileHandle& file, const solver::SolveDiagnostics& diagnostics) const
    -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "diagnostics");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  const std::pair<const char*, double> fields[] = {
      {"hydraulic_diameter_m", diagnostics.hydraulic_diameter_m},
      {"open_ratio", diagnostics.open_ratio},
      {"density", diagnostics.density},
      {"viscosity", diagnostics.viscosity},
      {"reynolds", diagnostics.reynolds},
      {"friction_factor", diagnostics.friction_factor},
      {"channels_required", static_cast<double>(diagnostics.channels_required)},
      {"channels_placed", static_cast<double>(diagnostics.channels_placed)},
      {"channel_shortfall", static_cast<double>(diagnostics.channel_shortfall)},
      {"envelope_width_in", diagnostics.envelope_width_in},
      {"envelope_height_in", diagnostics.envelope_height_in},
      {"total_mass_kg", diagnostics.total_mass_kg}};

  for (const auto& [name, value] : fields) {
    if (auto r = write_scalar(group, name, value); !r) {
      return std::unexpected(r.error());
    }
  }

  if (auto r = write_string(group, "flow_regime", std::string(flow::regime_name(diagnostics.regime))); !r) {
    return std::unexpected(r.error());
  }

  return {};
}

auto HDF5Writer::write_temperature_sweep(FileHandle& file, const core::Matrix<double>& sweep) const
    -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "temperature_sweep");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto r = write_matrix(group, "table", sweep, "", "Flow state per temperature sample"); !r) {
    return std::unexpected(r.error());
  }

  std::vector<std::string> names(std::begin(solver::sweep_columns::names), std::end(solver::sweep_columns::names));
  std::vector<std::string> units(std::begin(solver::sweep_columns::units), std::end(solver::sweep_columns::units));
  if (auto r = write_string_array(group, "column_names", names); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = write_string_array(group, "column_units", units); !r) {
    return std::unexpected(r.error());
  }

  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {};
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties({dims});
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_int_vector(hid_t parent, const std::string& name,
                                  const std::vector<int>& data) const -> std::expected<void, OutputError> {

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_INT, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.rows() == 0 || data.cols() == 0) {
    return {};
  }

  hsize_t dims[2] = {static_cast<hsize_t>(data.rows()), static_cast<hsize_t>(data.cols())};
  auto space_id = H5Screate_simple(2, dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for matrix '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties({dims[0], dims[1]});
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // Eigen storage is column-major, HDF5 expects row-major
  const auto& eigen_data = data.eigen();
  std::vector<double> row_major_data(data.rows() * data.cols());
  for (std::size_t i = 0; i < data.rows(); ++i) {
    for (std::size_t j = 0; j < data.cols(); ++j) {
      row_major_data[i * data.cols() + j] = eigen_data(i, j);
    }
  }

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major_data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write matrix data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  H5I_type_t obj_type = H5Iget_type(parent);
  if (obj_type != H5I_DATASET && obj_type != H5I_GROUP && obj_type != H5I_FILE) {
    return std::unexpected(OutputError(std::format("Cannot attach string attribute '{}' to this object", name)));
  }

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  // HDF5 rejects zero-sized string types
  H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1));
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, string_type, value.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {};
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, max_len);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::memcpy(&buffer[i * max_len], values[i].data(), values[i].length());
  }

  if (H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::create_chunked_properties(std::vector<hsize_t> dims) const
    -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Filters need a chunked layout; chunk extents must not exceed the data extents
  std::vector<hsize_t> chunk_dims(dims.size());
  for (std::size_t i = 0; i < dims.size(); ++i) {
    chunk_dims[i] = std::max<hsize_t>(1, std::min<hsize_t>(dims[i], hdf5_config_.chunk_size));
  }

  if (H5Pset_chunk(props, static_cast<int>(chunk_dims.size()), chunk_dims.data()) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }

  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));

  if (hdf5_config_.use_fletcher32) {
    H5Pset_fletcher32(props);
  }

  return props;
}

namespace hdf5 {

auto initialize() -> std::expected<void, OutputError> {
  if (H5open() < 0) {
    return std::unexpected(OutputError("Failed to initialize HDF5 library"));
  }
  return {};
}

auto finalize() -> void {
  H5close();
}

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  if (H5Fis_hdf5(file_path.c_str()) <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

} // namespace hdf5

} // namespace wavepack::io::output

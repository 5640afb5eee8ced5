#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <concepts>
#include <expected>
#include <format>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace wavepack::io {

// Lowercase; '_' and ' ' become '-' so "Circular_Inline" and "circular inline" match "circular-inline"
[[nodiscard]] auto normalize_key(std::string value) -> std::string;

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto lookup_enum(std::string raw_value, std::string_view key,
                                 const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_input_config(const YAML::Node& node) const -> std::expected<solver::SolveInput, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_numerical_config(const YAML::Node& node) const -> std::expected<solver::SolveOptions, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_properties_config(const YAML::Node& node) const -> std::expected<PropertiesConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_report_config(const YAML::Node& node) const -> std::expected<ReportConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parse from an in-memory document instead of the file
  [[nodiscard]] auto load_from_string(std::string_view content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ValidationError(key, "Required field is missing"));
    }

    if constexpr (std::same_as<T, std::vector<std::string>>) {
      auto sequence = node[std::string(key)];
      if (!sequence.IsSequence()) {
        return std::unexpected(core::ValidationError(key, "Expected a list"));
      }
      std::vector<std::string> result;
      result.reserve(sequence.size());
      for (const auto& item : sequence) {
        result.push_back(item.as<std::string>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ValidationError(key, std::format("Failed to parse value: {}", e.what())));
  }
}

template <typename EnumType>
auto YamlParser::lookup_enum(std::string raw_value, std::string_view key,
                             const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_value = normalize_key(std::move(raw_value));

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::vector<std::string> options;
    for (const auto& [option, _] : mapping) {
      options.push_back(option);
    }
    std::ranges::sort(options);

    std::string valid_options;
    for (const auto& option : options) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - constants::string_processing::option_separator_length);

    return std::unexpected(core::ValidationError(
        key, std::format("Invalid value '{}'. Valid options: {}", str_value, valid_options)));
  }

  return it->second;
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }
  return lookup_enum(std::move(str_result.value()), key, mapping);
}

// Enum mappings, keyed by normalize_key() output
namespace enum_mappings {

inline const std::unordered_map<std::string, geometry::ChannelShape> channel_shapes = {
    {"rectangular", geometry::ChannelShape::Rectangular},
    {"circular-inline", geometry::ChannelShape::CircularInline},
    {"circular-staggered", geometry::ChannelShape::CircularStaggered}};

inline const std::unordered_map<std::string, geometry::LayoutPolicy> layout_policies = {
    {"truncate", geometry::LayoutPolicy::Truncate},
    {"round-up", geometry::LayoutPolicy::RoundUpToSquare},
    {"round-up-to-square", geometry::LayoutPolicy::RoundUpToSquare}};

inline const std::unordered_map<std::string, OutputConfig::Format> output_formats = {
    {"hdf5", OutputConfig::Format::HDF5},
    {"h5", OutputConfig::Format::HDF5},
    {"csv", OutputConfig::Format::CSV},
    {"report", OutputConfig::Format::Report},
    {"markdown", OutputConfig::Format::Report}};

} // namespace enum_mappings

} // namespace wavepack::io

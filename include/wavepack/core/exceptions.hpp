#pragma once
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wavepack::core {

class WavepackException : public std::exception {
private:
  std::string message_;
  std::source_location location_;

public:
  explicit WavepackException(std::string message, std::source_location location = std::source_location::current())
      : message_(std::move(message)), location_(location) {}

  [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }

  // Message followed by the site that raised it
  [[nodiscard]] auto full_message() const -> std::string {
    return std::format("{} [{}:{}:{}]", message_, location_.file_name(), location_.line(), location_.function_name());
  }
};

class ConfigurationError : public WavepackException {
public:
  explicit ConfigurationError(std::string_view message, std::source_location location = std::source_location::current())
      : WavepackException(std::format("Configuration Error: {}", message), location) {}
};

class FileError : public WavepackException {
private:
  std::string filename_;

public:
  explicit FileError(std::string_view message, std::string filename,
                     std::source_location location = std::source_location::current())
      : WavepackException(std::format("File Error ({}): {}", filename, message), location),
        filename_(std::move(filename)) {}

  [[nodiscard]] auto filename() const noexcept -> const std::string& { return filename_; }
};

class ValidationError : public ConfigurationError {
public:
  explicit ValidationError(std::string_view field_name, std::string_view message,
                           std::source_location location = std::source_location::current())
      : ConfigurationError(std::format("Field '{}': {}", field_name, message), location) {}
};

// Failures raised by the solve pipeline. Every one carries the offending field and value.
enum class ErrorKind { InvalidInput, UnknownLookup, Domain };

[[nodiscard]] constexpr auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
  case ErrorKind::InvalidInput:
    return "InvalidInputError";
  case ErrorKind::UnknownLookup:
    return "UnknownLookupError";
  case ErrorKind::Domain:
    return "DomainError";
  }
  return "SolveError";
}

class SolveError : public WavepackException {
private:
  ErrorKind kind_;
  std::string field_;
  std::string value_;

public:
  SolveError(ErrorKind kind, std::string field, std::string value, std::string_view message,
             std::source_location location = std::source_location::current())
      : WavepackException(std::format("{} [{}={}]: {}", error_kind_name(kind), field, value, message), location),
        kind_(kind), field_(std::move(field)), value_(std::move(value)) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }
  [[nodiscard]] auto field() const noexcept -> const std::string& { return field_; }
  [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }
};

class InvalidInputError : public SolveError {
public:
  InvalidInputError(std::string field, std::string value, std::string_view message,
                    std::source_location location = std::source_location::current())
      : SolveError(ErrorKind::InvalidInput, std::move(field), std::move(value), message, location) {}
};

class UnknownLookupError : public SolveError {
public:
  UnknownLookupError(std::string field, std::string value, std::string_view message,
                     std::source_location location = std::source_location::current())
      : SolveError(ErrorKind::UnknownLookup, std::move(field), std::move(value), message, location) {}
};

class DomainError : public SolveError {
public:
  DomainError(std::string field, std::string value, std::string_view message,
              std::source_location location = std::source_location::current())
      : SolveError(ErrorKind::Domain, std::move(field), std::move(value), message, location) {}
};

} // namespace wavepack::core

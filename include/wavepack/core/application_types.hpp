#pragma once
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace wavepack::core {

// Application-level error handling
struct ApplicationError {
  std::string message;
  int exit_code;
};

struct CommandLineArgs {
  std::string config_file;
  std::string output_name = "wavepack";
  bool help_requested = false;
};

struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::microseconds solve_time{0};
  std::chrono::milliseconds output_time{0};
  std::vector<std::filesystem::path> output_files;
};

} // namespace wavepack::core

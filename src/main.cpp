#include "wavepack/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  wavepack::core::ApplicationRunner runner;
  auto result = runner.run(argc, argv);
  return result.exit_code;
}

#pragma once
#include "output_writer.hpp"
#include <ostream>

namespace wavepack::io::output {

enum class CheckStatus { Pass, Fail, NotEvaluated };

[[nodiscard]] constexpr auto check_status_name(CheckStatus status) noexcept -> std::string_view {
  switch (status) {
  case CheckStatus::Pass:
    return "PASS";
  case CheckStatus::Fail:
    return "FAIL";
  case CheckStatus::NotEvaluated:
    return "NOT EVALUATED";
  }
  return "UNKNOWN";
}

struct ComplianceCheck {
  std::string name;
  std::string requirement;
  std::string achieved;
  CheckStatus status = CheckStatus::NotEvaluated;
};

// Pressure-drop and shielding checks shown in the report
[[nodiscard]] auto evaluate_compliance(const OutputDataset& dataset, const ReportSettings& settings)
    -> std::vector<ComplianceCheck>;

/**
 * @brief Markdown engineering report
 *
 * Presents inputs, results, the shielding and temperature tables and the
 * compliance checks. Chart and schematic images are linked, never embedded.
 */
class ReportWriter : public FormatWriter {
private:
  auto write_header(std::ostream& out, const OutputDataset& dataset, const ReportSettings& settings) const -> void;
  auto write_inputs(std::ostream& out, const solver::SolveInput& input) const -> void;
  auto write_results(std::ostream& out, const solver::SolveResult& result,
                     geometry::ChannelShape shape) const -> void;
  auto write_shielding_table(std::ostream& out, const solver::SolveResult& result) const -> void;
  auto write_temperature_table(std::ostream& out, const core::Matrix<double>& sweep) const -> void;
  auto write_attachments(std::ostream& out, const ReportConfig::Attachments& attachments) const -> void;
  auto write_compliance(std::ostream& out, const std::vector<ComplianceCheck>& checks) const -> void;

public:
  [[nodiscard]] auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                           const OutputConfig& config,
                           ProgressCallback progress = nullptr) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".md"; }
};

} // namespace wavepack::io::output

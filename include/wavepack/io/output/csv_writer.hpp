#pragma once
#include "output_writer.hpp"
#include <fstream>
#include <iomanip>

namespace wavepack::io::output {

struct CSVConfig {
    char delimiter = ',';
    int precision = 12;
    bool include_headers = true;
    bool scientific_notation = false;
    std::string line_ending = "\n";
};

// Single CSV file with three blank-line separated sections:
//   key,value,units summary / frequency_Hz,SE_db / temperature sweep table
class CSVWriter : public FormatWriter {
private:
    CSVConfig csv_config_;

    auto write_summary(std::ostream& out, const OutputDataset& dataset) const -> void;

    auto write_shielding_table(std::ostream& out, const solver::SolveResult& result) const -> void;

    auto write_temperature_table(std::ostream& out, const core::Matrix<double>& sweep) const -> void;

    [[nodiscard]] auto format_value(double value) const -> std::string;

public:
    explicit CSVWriter(CSVConfig config = {}) : csv_config_(std::move(config)) {}

    [[nodiscard]] auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        const OutputConfig& config,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> override;

    [[nodiscard]] auto get_extension() const noexcept -> std::string_view override {
        return ".csv";
    }
};

} // namespace wavepack::io::output

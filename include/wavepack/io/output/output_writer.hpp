#pragma once
#include "output_types.hpp"
#include <expected>
#include <memory>

namespace wavepack::io::output {

// Abstract base class for format-specific writers
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    [[nodiscard]] virtual auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        const OutputConfig& config,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> = 0;

    [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
};

class WriterFactory {
public:
    [[nodiscard]] static auto create_writer(OutputFormat format)
        -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError>;
};

class OutputWriter {
private:
    OutputConfig config_;
    std::vector<std::pair<OutputFormat, std::unique_ptr<FormatWriter>>> writers_;

    [[nodiscard]] auto convert_result(
        const solver::SolveResult& result,
        const solver::SolveInput& input,
        const solver::SolveOptions& options,
        const std::string& case_name
    ) const -> std::expected<OutputDataset, OutputError>;

    [[nodiscard]] auto generate_file_paths(
        const std::string& case_name,
        const std::chrono::system_clock::time_point& timestamp
    ) const -> std::vector<std::filesystem::path>;

    auto initialize_writers() -> void;

public:
    explicit OutputWriter(OutputConfig config = {});

    // Writes every configured format; returns the files produced
    [[nodiscard]] auto write_result(
        const solver::SolveResult& result,
        const solver::SolveInput& input,
        const solver::SolveOptions& options,
        const std::string& case_name = "wavepack",
        ProgressCallback progress = nullptr,
        RunMetadata metadata = {}
    ) -> std::expected<std::vector<std::filesystem::path>, OutputError>;

    [[nodiscard]] auto get_config() const noexcept -> const OutputConfig& {
        return config_;
    }

    auto set_config(OutputConfig config) -> void {
        config_ = std::move(config);
        initialize_writers();
    }

    [[nodiscard]] auto validate_config() const -> std::expected<void, OutputError>;

    [[nodiscard]] auto get_output_info(const std::string& case_name = "wavepack") const
        -> std::vector<std::pair<OutputFormat, std::filesystem::path>>;
};

} // namespace wavepack::io::output

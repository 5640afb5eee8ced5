#include "wavepack/io/output/csv_writer.hpp"
#include "wavepack/geometry/geometry_types.hpp"
#include <sstream>

namespace wavepack::io::output {

auto CSVWriter::write(
    const std::filesystem::path& file_path,
    const OutputDataset& dataset,
    const OutputConfig& config,
    ProgressCallback progress
) const -> std::expected<void, OutputError> {

    try {
        if (progress) progress(0.0, "Starting CSV write");

        std::ofstream file(file_path);
        if (!file.is_open()) {
            return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
        }

        if (config.save_metadata && csv_config_.include_headers) {
            file << "# wavepack " << dataset.metadata.wavepack_version
                 << " case '" << dataset.metadata.case_name << "'" << csv_config_.line_ending;
        }

        write_summary(file, dataset);
        file << csv_config_.line_ending;

        if (progress) progress(0.4, "Writing shielding table");
        write_shielding_table(file, dataset.result);

        if (config.save_temperature_sweep && dataset.result.temperature_sweep.rows() > 0) {
            if (progress) progress(0.7, "Writing temperature sweep");
            file << csv_config_.line_ending;
            write_temperature_table(file, dataset.result.temperature_sweep);
        }

        if (!file.good()) {
            return std::unexpected(FileWriteError(file_path, "Stream error while writing"));
        }

        if (progress) progress(1.0, "CSV write complete");
        return {};

    } catch (const std::exception& e) {
        return std::unexpected(OutputError(
            std::format("CSV write failed: {}", e.what())
        ));
    }
}

auto CSVWriter::write_summary(std::ostream& out, const OutputDataset& dataset) const -> void {
    const auto d = csv_config_.delimiter;
    const auto& eol = csv_config_.line_ending;
    const auto& input = dataset.input;
    const auto& result = dataset.result;
    const auto& diag = result.diagnostics;

    if (csv_config_.include_headers) {
        out << "key" << d << "value" << d << "units" << eol;
    }

    auto text_row = [&](std::string_view key, std::string_view value) {
        out << key << d << value << d << eol;
    };
    auto number_row = [&](std::string_view key, double value, std::string_view units) {
        out << key << d << format_value(value) << d << units << eol;
    };

    text_row("shape", geometry::shape_name(input.shape));
    text_row("material", input.material);
    text_row("fluid", input.fluid);
    number_row("T_min_F", input.T_min_F, "degF");
    number_row("T_max_F", input.T_max_F, "degF");
    number_row("dp_limit_psi", input.dp_limit_psi, "psi");

    out << "array_rows" << d << result.array_dims.first << d << eol;
    out << "array_columns" << d << result.array_dims.second << d << eol;
    number_row("velocity_fts", result.velocity_fts, "ft/s");
    number_row("deltaP_psi", result.delta_p_psi, "psi");
    number_row("fc_GHz", result.fc_ghz, "GHz");
    number_row("total_weight_lbm", result.total_weight_lbm, "lbm");
    number_row("a_in", result.a_in, "in");
    number_row("b_in", result.b_in,
               geometry::is_circular(input.shape) ? "in (ignored for circular channels)" : "in");
    number_row("t_in", result.t_in, "in");
    number_row("L_ft", result.L_ft, "ft");

    out << "channels_required" << d << diag.channels_required << d << eol;
    out << "channels_placed" << d << diag.channels_placed << d << eol;
    text_row("layout_policy", geometry::layout_policy_name(diag.layout_policy));
    number_row("hydraulic_diameter_m", diag.hydraulic_diameter_m, "m");
    number_row("reynolds", diag.reynolds, "");
    number_row("friction_factor", diag.friction_factor, "");
    text_row("flow_regime", flow::regime_name(diag.regime));
    number_row("envelope_width_in", diag.envelope_width_in, "in");
    number_row("envelope_height_in", diag.envelope_height_in, "in");
}

auto CSVWriter::write_shielding_table(std::ostream& out, const solver::SolveResult& result) const -> void {
    if (csv_config_.include_headers) {
        out << "frequency_Hz" << csv_config_.delimiter << "SE_db" << csv_config_.line_ending;
    }
    for (std::size_t i = 0; i < result.freqs.size(); ++i) {
        out << format_value(result.freqs[i]) << csv_config_.delimiter
            << format_value(result.se_db[i]) << csv_config_.line_ending;
    }
}

auto CSVWriter::write_temperature_table(std::ostream& out, const core::Matrix<double>& sweep) const -> void {
    if (csv_config_.include_headers) {
        for (std::size_t j = 0; j < solver::sweep_columns::count; ++j) {
            if (j > 0) out << csv_config_.delimiter;
            out << solver::sweep_columns::names[j];
        }
        out << csv_config_.line_ending;
    }

    for (std::size_t i = 0; i < sweep.rows(); ++i) {
        for (std::size_t j = 0; j < sweep.cols(); ++j) {
            if (j > 0) out << csv_config_.delimiter;
            out << format_value(sweep(i, j));
        }
        out << csv_config_.line_ending;
    }
}

auto CSVWriter::format_value(double value) const -> std::string {
    std::ostringstream oss;

    if (csv_config_.scientific_notation) {
        oss << std::scientific;
    }
    oss << std::setprecision(csv_config_.precision) << value;

    return oss.str();
}

} // namespace wavepack::io::output

#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <utility>

namespace wavepack::core {

// Dense sample table: one row per sample, one column per quantity.
// Storage is Eigen's default column-major layout.
template<typename Scalar = double>
class Matrix {
private:
    Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> data_;

public:
    Matrix() = default;
    Matrix(std::size_t rows, std::size_t cols) : data_(rows, cols) { data_.setZero(); }

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return static_cast<std::size_t>(data_.rows()); }
    [[nodiscard]] auto cols() const noexcept -> std::size_t { return static_cast<std::size_t>(data_.cols()); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.size() == 0; }

    auto operator()(std::size_t i, std::size_t j) -> Scalar& { return data_(i, j); }
    [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const -> const Scalar& { return data_(i, j); }

    [[nodiscard]] auto eigen() -> auto& { return data_; }
    [[nodiscard]] auto eigen() const -> const auto& { return data_; }

    // Smallest and largest entry of column j; the table must not be empty
    [[nodiscard]] auto column_range(std::size_t j) const -> std::pair<Scalar, Scalar> {
        const auto column = data_.col(static_cast<Eigen::Index>(j));
        return {column.minCoeff(), column.maxCoeff()};
    }

    [[nodiscard]] auto column_mean(std::size_t j) const -> Scalar {
        return data_.col(static_cast<Eigen::Index>(j)).mean();
    }
};

} // namespace wavepack::core

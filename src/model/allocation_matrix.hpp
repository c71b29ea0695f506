#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace jamgame {
namespace model {

/**
 * Row-major players x channels matrix.
 *
 * One row per player. Each player only ever rewrites its own row, so a
 * row span is the unit handed to the update rules.
 */
class AllocationMatrix {
public:
    AllocationMatrix() = default;
    AllocationMatrix(size_t rows, size_t cols, double value = 0.0)
        : rows_(rows), cols_(cols), data_(rows * cols, value) {}

    // Build from nested rows; every row must already be cols long
    static AllocationMatrix fromRows(const std::vector<std::vector<double>>& rows, size_t cols) {
        AllocationMatrix m(rows.size(), cols);
        for (size_t r = 0; r < rows.size(); ++r) {
            for (size_t c = 0; c < cols && c < rows[r].size(); ++c) {
                m(r, c) = rows[r][c];
            }
        }
        return m;
    }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    double& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }
    double operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    std::span<double> row(size_t r) { return {data_.data() + r * cols_, cols_}; }
    std::span<const double> row(size_t r) const { return {data_.data() + r * cols_, cols_}; }

    void setRow(size_t r, std::span<const double> values) {
        for (size_t c = 0; c < cols_ && c < values.size(); ++c) {
            data_[r * cols_ + c] = values[c];
        }
    }

    std::vector<double> rowVector(size_t r) const {
        auto s = row(r);
        return std::vector<double>(s.begin(), s.end());
    }

    double rowSum(size_t r) const {
        double sum = 0.0;
        for (double v : row(r)) sum += v;
        return sum;
    }

    // Sum over all rows of one column
    double columnSum(size_t c) const {
        double sum = 0.0;
        for (size_t r = 0; r < rows_; ++r) sum += data_[r * cols_ + c];
        return sum;
    }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

} // namespace model
} // namespace jamgame

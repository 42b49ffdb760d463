/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <initializer_list>
#include <ostream>
#include <span>
#include <stdexcept>
#include <vector>

#include "batch_quad/sample_set.hpp"

namespace sample_set {

SampleSet::SampleSet(int rows, int cols) : rows_(rows), cols_(cols) {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("Sample set shape must be non-negative");
    }
    data_.assign(static_cast<size_t>(rows) * cols, 0.0);
}

SampleSet::SampleSet(int rows, int cols, const std::vector<double> &values) : SampleSet(rows, cols) {
    if (values.size() != data_.size()) {
        throw std::invalid_argument("Invalid number of values");
    }
    data_ = values;
}

SampleSet::SampleSet(std::initializer_list<std::initializer_list<double>> rows) : rows_(0), cols_(0) {
    for (const auto &row : rows) {
        append_row(std::span<const double>(row.begin(), row.size()));
    }
}

std::span<const double> SampleSet::row(int i) const noexcept {
    return std::span<const double>(data_.data() + flat_index(i, 0), cols_);
}

std::span<double> SampleSet::row(int i) noexcept { return std::span<double>(data_.data() + flat_index(i, 0), cols_); }

void SampleSet::append_row(std::span<const double> values) {
    if (rows_ == 0 && cols_ == 0) {
        cols_ = static_cast<int>(values.size());
    }
    if (static_cast<int>(values.size()) != cols_) {
        throw std::invalid_argument("Sample width does not match the set");
    }
    data_.insert(data_.end(), values.begin(), values.end());
    rows_ += 1;
}

SampleSet SampleSet::select(const std::vector<int> &indices) const {
    SampleSet ret(static_cast<int>(indices.size()), cols_);
    for (int i = 0; i < static_cast<int>(indices.size()); ++i) {
        const int src = indices[i];
        if (src < 0 || src >= rows_) {
            throw std::out_of_range("Row index out of range");
        }
        for (int j = 0; j < cols_; ++j) {
            ret(i, j) = (*this)(src, j);
        }
    }
    return ret;
}

std::ostream &operator<<(std::ostream &os, const SampleSet &samples) {
    for (int i = 0; i < samples.rows(); ++i) {
        for (int j = 0; j < samples.cols(); ++j) {
            if (j > 0) {
                os << " ";
            }
            os << samples(i, j);
        }
        os << "\n";
    }
    return os;
}

}; /* namespace sample_set */

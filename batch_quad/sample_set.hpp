/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <initializer_list>
#include <ostream>
#include <span>
#include <vector>

namespace sample_set {

/**
 * @brief Dense row-major batch of vector samples.
 *
 * One row per time point, one column per vector component. Storage is a flat vector; rows are exposed as spans so
 * that norms and quadrature weights can work on them without copying.
 */
class SampleSet {
public:
    /**
     * @brief Shape representation: {rows, cols}.
     */
    using Shape = std::array<int, 2>;

    /**
     * @brief Default constructor, creates an empty set with no rows and no columns.
     */
    SampleSet() : rows_(0), cols_(0) {}

    /**
     * @brief Construct a zero-filled set with the given shape.
     *
     * @param rows Number of samples.
     * @param cols Number of components per sample.
     */
    SampleSet(int rows, int cols);

    /**
     * @brief Construct a set with the given shape and row-major values.
     *
     * @param rows   Number of samples.
     * @param cols   Number of components per sample.
     * @param values Row-major values, rows * cols of them.
     */
    SampleSet(int rows, int cols, const std::vector<double> &values);

    /**
     * @brief Construct a set from nested rows, e.g. {{0.0, 1.0}, {2.0, 3.0}}.
     *
     * All rows must have the same length.
     */
    SampleSet(std::initializer_list<std::initializer_list<double>> rows);

    /**
     * @brief Return the component j of sample i.
     */
    double operator()(int i, int j) const noexcept { return data_[flat_index(i, j)]; }

    /**
     * @brief Return a reference to the component j of sample i.
     */
    double &operator()(int i, int j) noexcept { return data_[flat_index(i, j)]; }

    /**
     * @brief View of sample i (const).
     */
    std::span<const double> row(int i) const noexcept;

    /**
     * @brief View of sample i.
     */
    std::span<double> row(int i) noexcept;

    /**
     * @brief Append a sample; the first row appended to an empty set fixes the number of columns.
     *
     * @param values Components of the new sample.
     */
    void append_row(std::span<const double> values);

    /**
     * @brief Build a new set holding the given rows, in the given order.
     *
     * @param indices Row indices into this set.
     *
     * @return Set with indices.size() rows.
     */
    SampleSet select(const std::vector<int> &indices) const;

    int rows() const noexcept { return rows_; }

    int cols() const noexcept { return cols_; }

    Shape shape() const noexcept { return {rows_, cols_}; }

    bool empty() const noexcept { return rows_ == 0; }

    const double *data() const noexcept { return data_.data(); }

    bool operator==(const SampleSet &other) const = default;

    /**
     * @brief Write the set, one sample per line, components separated by spaces.
     */
    friend std::ostream &operator<<(std::ostream &os, const SampleSet &samples);

private:
    int flat_index(int i, int j) const noexcept { return i * cols_ + j; }

    /**
     * @brief Number of samples.
     */
    int rows_;

    /**
     * @brief Number of components per sample.
     */
    int cols_;

    /**
     * @brief Row-major values.
     */
    std::vector<double> data_;
};

}; /* namespace sample_set */

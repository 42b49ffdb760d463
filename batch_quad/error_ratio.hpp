/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <span>
#include <vector>

#include "batch_quad/sample_set.hpp"

namespace error_ratio {

/**
 * @brief Reduction of one error vector (the components of a single point) to a scalar.
 */
using ErrorNorm = std::function<double(std::span<const double>)>;

/**
 * @brief Root-mean-square of the components.
 *
 * @param error Components of one point.
 *
 * @return sqrt(mean(error^2)), 0 for an empty vector.
 */
double rms_norm(std::span<const double> error);

/**
 * @brief Largest absolute component.
 */
double max_norm(std::span<const double> error);

/**
 * @brief Build a weighted root-mean-square norm, sqrt(sum(w_i * e_i^2) / sum(w_i)).
 *
 * @param weights Non-negative per-component weights with a positive sum.
 *
 * @return Norm applicable to vectors of weights.size() components.
 */
ErrorNorm weighted_rms_norm(std::vector<double> weights);

/**
 * @brief Apply a norm to every row of a sample set.
 *
 * @return One scalar per row.
 */
std::vector<double> row_norms(const sample_set::SampleSet &samples, const ErrorNorm &norm);

/**
 * @brief Compute the normalized error ratio between two estimates of different order.
 *
 * For each row: norm(y_p1 - y_p) / (atol + rtol * norm(y_p1)). When norm(y_p1) is zero the scale falls back to atol
 * alone; if that is zero too the ratio is 0 for a zero error and +inf otherwise.
 *
 * @param y_p  Lower-order estimate, one row per interval.
 * @param y_p1 Higher-order estimate, same shape as y_p.
 * @param atol Absolute tolerance.
 * @param rtol Relative tolerance.
 * @param norm Norm applied to the error and to y_p1.
 *
 * @return One non-negative ratio per row; values above 1 fail the tolerance.
 */
std::vector<double> compute_error_ratios(const sample_set::SampleSet &y_p,
                                         const sample_set::SampleSet &y_p1,
                                         double atol,
                                         double rtol,
                                         const ErrorNorm &norm);

}; /* namespace error_ratio */

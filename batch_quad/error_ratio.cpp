/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "batch_quad/error_ratio.hpp"
#include "batch_quad/sample_set.hpp"

namespace error_ratio {

double rms_norm(std::span<const double> error) {
    if (error.empty()) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (const double e : error) {
        sum_sq += e * e;
    }
    return std::sqrt(sum_sq / static_cast<double>(error.size()));
}

double max_norm(std::span<const double> error) {
    double ret = 0.0;
    for (const double e : error) {
        ret = std::max(ret, std::abs(e));
    }
    return ret;
}

ErrorNorm weighted_rms_norm(std::vector<double> weights) {
    if (std::any_of(weights.begin(), weights.end(), [](double w) { return !(w >= 0.0); })) {
        throw std::invalid_argument("Norm weights must be non-negative");
    }
    const double weight_sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (weight_sum <= 0.0) {
        throw std::invalid_argument("Norm weights must have a positive sum");
    }

    return [weights = std::move(weights), weight_sum](std::span<const double> error) {
        if (error.size() != weights.size()) {
            throw std::invalid_argument("Error vector width does not match norm weights");
        }
        double sum_sq = 0.0;
        for (size_t i = 0; i < error.size(); ++i) {
            sum_sq += weights[i] * error[i] * error[i];
        }
        return std::sqrt(sum_sq / weight_sum);
    };
}

std::vector<double> row_norms(const sample_set::SampleSet &samples, const ErrorNorm &norm) {
    std::vector<double> ret(samples.rows());
    for (int i = 0; i < samples.rows(); ++i) {
        ret[i] = norm(samples.row(i));
    }
    return ret;
}

std::vector<double> compute_error_ratios(const sample_set::SampleSet &y_p,
                                         const sample_set::SampleSet &y_p1,
                                         double atol,
                                         double rtol,
                                         const ErrorNorm &norm) {
    if (y_p.shape() != y_p1.shape()) {
        throw std::invalid_argument("Estimates have different shapes");
    }

    std::vector<double> ratios(y_p.rows());
    std::vector<double> error(y_p.cols());

    for (int i = 0; i < y_p.rows(); ++i) {
        for (int j = 0; j < y_p.cols(); ++j) {
            error[j] = y_p1(i, j) - y_p(i, j);
        }
        const double error_norm = norm(error);
        const double value_norm = norm(y_p1.row(i));

        double scale = atol;
        if (value_norm != 0.0) {
            scale += rtol * value_norm;
        }

        if (scale > 0.0) {
            ratios[i] = error_norm / scale;
        } else {
            ratios[i] = (error_norm == 0.0) ? 0.0 : std::numeric_limits<double>::infinity();
        }
    }

    return ratios;
}

}; /* namespace error_ratio */

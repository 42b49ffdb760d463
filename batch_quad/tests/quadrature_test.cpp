/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "batch_quad/quadrature.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "batch_quad/sample_set.hpp"

using sample_set::SampleSet;

constexpr double eps = 1.0e-12;

/**
 * Samples a scalar function on a grid.
 */
static SampleSet sample(const std::vector<double> &times, const std::function<double(double)> &f) {
    SampleSet samples(static_cast<int>(times.size()), 1);
    for (int i = 0; i < static_cast<int>(times.size()); ++i) {
        samples(i, 0) = f(times[i]);
    }
    return samples;
}

const std::vector<double> uneven_grid{0.0, 0.1, 0.35, 0.5, 0.9, 1.0};

TEST(Quadrature, StencilWeightsSumToLength) {
    const std::vector<double> nodes{0.0, 0.3, 0.7, 1.2};

    auto weights = quadrature::stencil_weights(nodes, 0.3, 0.7);

    ASSERT_EQ(4, weights.size());
    ASSERT_NEAR(0.4, std::accumulate(weights.begin(), weights.end(), 0.0), eps);
}

TEST(Quadrature, StencilWeightsTrapezoid) {
    const std::vector<double> nodes{1.0, 3.0};

    auto weights = quadrature::stencil_weights(nodes, 1.0, 3.0);

    ASSERT_NEAR(1.0, weights[0], eps);
    ASSERT_NEAR(1.0, weights[1], eps);
}

TEST(Quadrature, StencilStart) {
    ASSERT_EQ(0, quadrature::stencil_start(0, 1, 5));
    ASSERT_EQ(3, quadrature::stencil_start(3, 1, 5));
    ASSERT_EQ(1, quadrature::stencil_start(1, 2, 5));
    ASSERT_EQ(2, quadrature::stencil_start(3, 2, 5));
    ASSERT_EQ(0, quadrature::stencil_start(0, 3, 6));
    ASSERT_EQ(1, quadrature::stencil_start(2, 3, 6));
    ASSERT_EQ(2, quadrature::stencil_start(4, 3, 6));
}

TEST(Quadrature, TrapezoidLinear) {
    auto samples = sample(uneven_grid, [](double t) { return 2.0 * t + 1.0; });

    auto estimate = quadrature::estimate(uneven_grid, samples, 0.0, 1);

    ASSERT_EQ(1, estimate.degree);
    ASSERT_NEAR(2.0, estimate.integral[0], eps);
}

TEST(Quadrature, TrapezoidIsNotExactForQuadratic) {
    auto samples = sample(uneven_grid, [](double t) { return t * t; });

    auto estimate = quadrature::estimate(uneven_grid, samples, 0.0, 1);

    ASSERT_GT(std::abs(estimate.integral[0] - 1.0 / 3.0), 1.0e-4);
}

TEST(Quadrature, QuadraticExact) {
    auto samples = sample(uneven_grid, [](double t) { return 3.0 * t * t - t + 2.0; });

    auto estimate = quadrature::estimate(uneven_grid, samples, 0.0, 2);

    ASSERT_EQ(2, estimate.degree);
    ASSERT_NEAR(2.5, estimate.integral[0], eps);
}

TEST(Quadrature, CubicExact) {
    auto samples = sample(uneven_grid, [](double t) { return t * t * t; });

    auto estimate = quadrature::estimate(uneven_grid, samples, 0.0, 3);

    ASSERT_NEAR(0.25, estimate.integral[0], eps);
}

TEST(Quadrature, IntervalsAndCumulativeSums) {
    auto samples = sample(uneven_grid, [](double t) { return 1.0; });

    auto estimate = quadrature::estimate(uneven_grid, samples, 0.5, 2);

    ASSERT_EQ(5, estimate.intervals.rows());
    ASSERT_EQ(6, estimate.cumulative.rows());
    ASSERT_EQ(0.5, estimate.cumulative(0, 0));
    for (int i = 0; i < 5; ++i) {
        ASSERT_NEAR(uneven_grid[i + 1] - uneven_grid[i], estimate.intervals(i, 0), eps);
        ASSERT_NEAR(0.5 + uneven_grid[i + 1], estimate.cumulative(i + 1, 0), eps);
    }
    ASSERT_NEAR(1.5, estimate.integral[0], eps);
}

TEST(Quadrature, VectorSamples) {
    SampleSet samples(static_cast<int>(uneven_grid.size()), 2);
    for (int i = 0; i < samples.rows(); ++i) {
        samples(i, 0) = uneven_grid[i];
        samples(i, 1) = -2.0;
    }

    auto estimate = quadrature::estimate(uneven_grid, samples, 1.0, 1);

    ASSERT_EQ(2, estimate.integral.size());
    ASSERT_NEAR(1.5, estimate.integral[0], eps);
    ASSERT_NEAR(-1.0, estimate.integral[1], eps);
}

TEST(Quadrature, DegreeLoweredOnShortGrid) {
    const std::vector<double> times{0.0, 2.0};
    auto samples = sample(times, [](double t) { return t; });

    auto estimate = quadrature::estimate(times, samples, 0.0, 3);

    ASSERT_EQ(1, estimate.degree);
    ASSERT_NEAR(2.0, estimate.integral[0], eps);
}

TEST(Quadrature, HigherDegreeConverges) {
    std::vector<double> times(41);
    for (int i = 0; i < 41; ++i) {
        times[i] = i / 40.0;
    }
    auto samples = sample(times, [](double t) { return std::sin(5.0 * t); });
    const double exact = (1.0 - std::cos(5.0)) / 5.0;

    const double error_1 = std::abs(quadrature::estimate(times, samples, 0.0, 1).integral[0] - exact);
    const double error_3 = std::abs(quadrature::estimate(times, samples, 0.0, 3).integral[0] - exact);

    ASSERT_LT(error_3, error_1);
    ASSERT_NEAR(exact, quadrature::estimate(times, samples, 0.0, 3).integral[0], 1.0e-7);
}

TEST(Quadrature, InvalidInput) {
    const std::vector<double> times{0.0, 1.0, 2.0};
    SampleSet samples{{0.0}, {1.0}};

    EXPECT_THROW(quadrature::estimate(times, samples, 0.0, 1), std::invalid_argument);
    EXPECT_THROW(quadrature::estimate({0.0}, SampleSet{{0.0}}, 0.0, 1), std::invalid_argument);
    EXPECT_THROW(quadrature::estimate({0.0, 1.0}, samples, 0.0, 0), std::invalid_argument);
}

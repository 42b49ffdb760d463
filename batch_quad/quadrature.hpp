/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <vector>

#include "batch_quad/sample_set.hpp"

namespace quadrature {

/**
 * @brief Integral estimate of a given polynomial degree over a sampled grid.
 */
struct QuadratureEstimate {
    int degree;                       /* Degree actually used (lowered on grids too short for the request) */
    std::vector<double> integral;     /* y0 + total integral, one value per component */
    sample_set::SampleSet intervals;  /* Contribution of each interval, n - 1 rows */
    sample_set::SampleSet cumulative; /* Partial sums, n rows, first row is y0 */
};

/**
 * @brief Integrate the Lagrange basis of a set of nodes over [a, b].
 *
 * The basis polynomials are integrated with the 30-point Gauss-Legendre rule in coordinates centered on [a, b], which
 * is exact up to 30 nodes.
 *
 * @param nodes Distinct interpolation nodes.
 * @param a     Lower limit of integration.
 * @param b     Upper limit of integration.
 *
 * @return One weight per node; sum_k w_k f(nodes[k]) integrates the interpolant of f over [a, b].
 */
std::vector<double> stencil_weights(std::span<const double> nodes, double a, double b);

/**
 * @brief First point of the stencil used for an interval.
 *
 * The stencil has degree + 1 consecutive points, starts at interval - (degree - 1) / 2 and is clamped into the grid,
 * so it always contains both ends of the interval.
 *
 * @param interval Interval index, in [0, n_points - 2].
 * @param degree   Stencil degree, at most n_points - 1.
 * @param n_points Number of grid points.
 */
int stencil_start(int interval, int degree, int n_points);

/**
 * @brief Compute the integral of sampled data using piecewise local interpolation of the given degree.
 *
 * Each interval [t_i, t_i+1] is integrated with the interpolating polynomial through degree + 1 neighbouring points.
 * Degree 1 is the trapezoid rule. When the grid holds fewer than degree + 1 points the largest available degree is
 * used and reported in the estimate.
 *
 * @param times   Strictly increasing grid, at least 2 points.
 * @param samples One row per grid point.
 * @param y0      Offset added to every component of the integral.
 * @param degree  Requested polynomial degree, >= 1.
 *
 * @return Integral, per-interval contributions and cumulative sums.
 */
QuadratureEstimate estimate(const std::vector<double> &times,
                            const sample_set::SampleSet &samples,
                            double y0,
                            int degree);

}; /* namespace quadrature */

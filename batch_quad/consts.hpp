/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace consts {

/* Quadrature order limits. */
constexpr int min_order = 1;  /* Lowest quadrature order accepted by the solvers. */
constexpr int max_order = 28; /* Highest order, the degree p + 1 stencil must fit the 30-point Gauss rule. */

/* Solver defaults. */
constexpr int default_order = 1;                /* Trapezoid paired with a local quadratic. */
constexpr double default_atol = 1.0e-6;         /* Absolute tolerance. */
constexpr double default_rtol = 1.0e-6;         /* Relative tolerance. */
constexpr int default_initial_points = 101;     /* Resolution of the uniform seed grid. */
constexpr double default_min_spacing = 0.0;     /* Coarsening threshold, 0 disables coarsening. */
constexpr int default_refine_points = 1;        /* Points inserted per flagged interval. */
constexpr int default_max_iterations = 50;      /* Refinement rounds per integrate call. */
constexpr int default_max_evaluations = 1 << 20; /* Distinct points evaluated per integrate call. */
constexpr std::chrono::milliseconds default_time_budget{0}; /* Wall-clock budget, 0 means unlimited. */

}; /* namespace consts */

/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stop_token>
#include <vector>

#include "batch_quad/error_ratio.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/solver.hpp"

namespace solver {

/**
 * @class ParallelAdaptiveIntegrator
 * @brief Adaptive-stepsize integrator that refines the grid in batches.
 *
 * Every round evaluates all pending candidate points with a single evaluator call, estimates the integral at degrees
 * P and P + 1, and removes points that are redundant in sample space. Points bordering a flagged interval and points
 * inserted by refinement are never removed, and a coarsened grid is checked again before it is accepted. Points are
 * then inserted into every interval whose error ratio exceeds 1. The loop stops when a round schedules no new point,
 * or when coarsening collapses the grid to its bounds.
 *
 * The grid of the last successful call is kept and seeds the next call, restricted to its bounds. Only one call may
 * run at a time on an instance; a concurrent or re-entrant call is rejected.
 */
class ParallelAdaptiveIntegrator : public SolverBase {
public:
    /**
     * @brief Construct a parallel adaptive integrator.
     *
     * @param config    Solver configuration.
     * @param evaluator Evaluator used by integrate(y0), may be empty.
     * @param norm      Error norm.
     */
    explicit ParallelAdaptiveIntegrator(const SolverConfig &config,
                                        evaluator::Evaluator evaluator = {},
                                        error_ratio::ErrorNorm norm = error_ratio::rms_norm);

    ParallelAdaptiveIntegrator(const ParallelAdaptiveIntegrator &) = delete;

    ParallelAdaptiveIntegrator &operator=(const ParallelAdaptiveIntegrator &) = delete;

    using SolverBase::integrate;

    /**
     * @brief Integrate an evaluator over [t_init, t_final].
     *
     * @throws errors::ConcurrentCallError if another call is running on this instance.
     * @throws errors::ConvergenceError if the iteration, evaluation or time budget runs out.
     * @throws errors::CancelledError if a stop is requested.
     */
    IntegralOutput integrate(const evaluator::Evaluator &evaluator,
                             double y0,
                             double t_init,
                             double t_final,
                             std::optional<std::vector<double>> explicit_grid = std::nullopt,
                             std::stop_token stop_token = {}) override;

    /**
     * @brief Copy of the grid cached by the last successful call, empty if none.
     */
    std::vector<double> warm_start_grid() const;

    /**
     * @brief Forget the cached grid; the next call starts from a uniform grid.
     */
    void clear_warm_start();

private:
    /**
     * @brief Initial candidate set: explicit grid, restricted cached grid or uniform grid.
     */
    std::vector<double> seed_grid(double t_init,
                                  double t_final,
                                  const std::optional<std::vector<double>> &explicit_grid) const;

    /**
     * @brief Final grid of the last successful call, only accessed under a CallGuard.
     */
    std::optional<std::vector<double>> previous_grid_;
};

}; /* namespace solver */

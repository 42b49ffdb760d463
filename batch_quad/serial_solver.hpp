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
 * @class SerialAdaptiveIntegrator
 * @brief Classical adaptive integrator inserting one point per step.
 *
 * After the seed grid, every step evaluates a single point: the midpoint of the interval with the largest error
 * ratio. It uses the same quadrature pair and error ratios as ParallelAdaptiveIntegrator, does not coarsen and keeps
 * no state between calls.
 */
class SerialAdaptiveIntegrator : public SolverBase {
public:
    explicit SerialAdaptiveIntegrator(const SolverConfig &config,
                                      evaluator::Evaluator evaluator = {},
                                      error_ratio::ErrorNorm norm = error_ratio::rms_norm);

    SerialAdaptiveIntegrator(const SerialAdaptiveIntegrator &) = delete;

    SerialAdaptiveIntegrator &operator=(const SerialAdaptiveIntegrator &) = delete;

    using SolverBase::integrate;

    /**
     * @brief Integrate an evaluator over [t_init, t_final].
     *
     * @throws errors::ConvergenceError if the evaluation or time budget runs out.
     */
    IntegralOutput integrate(const evaluator::Evaluator &evaluator,
                             double y0,
                             double t_init,
                             double t_final,
                             std::optional<std::vector<double>> explicit_grid = std::nullopt,
                             std::stop_token stop_token = {}) override;
};

}; /* namespace solver */

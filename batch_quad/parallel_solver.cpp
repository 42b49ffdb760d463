/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"

#include "batch_quad/errors.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/grid.hpp"
#include "batch_quad/parallel_solver.hpp"
#include "batch_quad/solver.hpp"

namespace solver {

/**
 * @brief Number of intervals whose error ratio exceeds 1.
 */
static int count_flagged(const std::vector<double> &ratios) {
    return static_cast<int>(std::count_if(ratios.begin(), ratios.end(), [](double r) { return r > 1.0; }));
}

ParallelAdaptiveIntegrator::ParallelAdaptiveIntegrator(const SolverConfig &config,
                                                       evaluator::Evaluator evaluator,
                                                       error_ratio::ErrorNorm norm)
    : SolverBase(config, std::move(evaluator), std::move(norm)) {}

IntegralOutput ParallelAdaptiveIntegrator::integrate(const evaluator::Evaluator &evaluator,
                                                     double y0,
                                                     double t_init,
                                                     double t_final,
                                                     std::optional<std::vector<double>> explicit_grid,
                                                     std::stop_token stop_token) {
    const CallGuard guard(busy_);
    if (!evaluator) {
        throw errors::ConfigurationError("Evaluator must be callable");
    }
    check_bounds(t_init, t_final);

    const auto start_time = std::chrono::steady_clock::now();

    std::vector<double> candidates = seed_grid(t_init, t_final, explicit_grid);
    spdlog::info("Integrating over [{}, {}] from {} seed points", t_init, t_final, candidates.size());

    grid::Grid grid;
    IntegralOutput output;
    bool collapsed = false;

    while (!candidates.empty()) {
        if (stop_token.stop_requested()) {
            spdlog::error("Integration cancelled after {} iterations", output.iterations);
            throw errors::CancelledError("Integration cancelled");
        }
        if (output.iterations >= config_.max_iterations) {
            spdlog::error("No convergence after {} iterations, {} intervals still flagged", output.iterations,
                          output.flagged.back());
            throw errors::ConvergenceError(
                fmt::format("No convergence within {} iterations", config_.max_iterations));
        }
        const auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (config_.time_budget.count() > 0 && elapsed > config_.time_budget) {
            spdlog::error("Time budget of {} ms exhausted after {} iterations", config_.time_budget.count(),
                          output.iterations);
            throw errors::ConvergenceError("Time budget exhausted");
        }

        output.iterations += 1;

        const int pending = grid.unevaluated(candidates);
        if (grid.evaluations() + pending > config_.max_evaluations) {
            spdlog::error("Evaluation budget of {} points exhausted, {} evaluated and {} pending",
                          config_.max_evaluations, grid.evaluations(), pending);
            throw errors::ConvergenceError(
                fmt::format("No convergence within {} evaluations", config_.max_evaluations));
        }

        /* evaluate the whole batch of new points at once and merge it into the grid, refinement points are locked */
        const grid::AddResult added = grid.add_points(candidates, evaluator, output.iterations > 1);
        if (added.evaluated > 0) {
            output.evaluator_calls += 1;
        }

        std::vector<double> ratios = interval_error_ratios(grid.times(), grid.samples());

        std::vector<bool> pinned = grid::pinned_points(ratios);
        const std::vector<bool> locked = grid.locked();
        for (size_t i = 0; i < pinned.size(); ++i) {
            pinned[i] = pinned[i] || locked[i];
        }

        const grid::Coarsening coarsening = grid.remove_points(config_.min_spacing, pinned);
        if (coarsening.degenerate) {
            /* terminal: the two-point grid is accepted without a higher-order check */
            spdlog::warn("DegenerateGridWarning: min_spacing={} removed all integration points between {} and {}",
                         config_.min_spacing, t_init, t_final);
            output.flagged.push_back(count_flagged(ratios));
            collapsed = true;
            break;
        }
        if (coarsening.removed > 0) {
            ratios = interval_error_ratios(grid.times(), grid.samples());
        }

        candidates = grid::refinement_points(grid.times(), ratios, config_.refine_points);

        const int flagged = count_flagged(ratios);
        output.flagged.push_back(flagged);

        spdlog::debug("Iteration {}: {} points ({} evaluated, {} reused), {} points removed, {} intervals flagged",
                      output.iterations, grid.size(), added.evaluated, added.reused, coarsening.removed, flagged);
    }

    output.degenerate = collapsed && grid.size() == 2;

    /* the higher-order estimate is the result */
    const auto estimate = calculate_integral(grid.times(), grid.samples(), y0, Degree::P1);

    output.integral = estimate.integral;
    output.times = grid.times();
    output.samples = grid.samples();
    output.evaluations = grid.evaluations();

    previous_grid_ = output.times;

    spdlog::info("Converged after {} iterations: {} points, {} evaluations in {} calls", output.iterations,
                 output.times.size(), output.evaluations, output.evaluator_calls);

    return output;
}

std::vector<double> ParallelAdaptiveIntegrator::warm_start_grid() const {
    const CallGuard guard(busy_);
    return previous_grid_.value_or(std::vector<double>{});
}

void ParallelAdaptiveIntegrator::clear_warm_start() {
    const CallGuard guard(busy_);
    previous_grid_.reset();
}

std::vector<double> ParallelAdaptiveIntegrator::seed_grid(double t_init,
                                                          double t_final,
                                                          const std::optional<std::vector<double>> &explicit_grid) const {
    if (explicit_grid) {
        return grid::normalize_grid(*explicit_grid, t_init, t_final);
    }

    if (previous_grid_) {
        std::vector<double> seed = grid::restrict_grid(*previous_grid_, t_init, t_final);
        if (seed.size() > 2) {
            return seed;
        }
        spdlog::debug("Cached grid does not overlap [{}, {}], using a uniform seed", t_init, t_final);
    }

    return grid::uniform_grid(t_init, t_final, config_.initial_points);
}

}; /* namespace solver */

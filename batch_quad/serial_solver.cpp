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
#include "batch_quad/serial_solver.hpp"
#include "batch_quad/solver.hpp"

namespace solver {

/**
 * @brief Grid interval with its error ratio, ordered by ratio.
 */
struct Interval {
    double a, b;
    double ratio;

    bool operator<(const Interval &other) const { return ratio < other.ratio; }
};

SerialAdaptiveIntegrator::SerialAdaptiveIntegrator(const SolverConfig &config,
                                                   evaluator::Evaluator evaluator,
                                                   error_ratio::ErrorNorm norm)
    : SolverBase(config, std::move(evaluator), std::move(norm)) {}

IntegralOutput SerialAdaptiveIntegrator::integrate(const evaluator::Evaluator &evaluator,
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

    const std::vector<double> seed = explicit_grid ? grid::normalize_grid(*explicit_grid, t_init, t_final)
                                                   : grid::uniform_grid(t_init, t_final, config_.initial_points);
    spdlog::info("Serial integration over [{}, {}] from {} seed points", t_init, t_final, seed.size());

    grid::Grid grid;
    IntegralOutput output;

    if (static_cast<int>(seed.size()) > config_.max_evaluations) {
        spdlog::error("Seed grid of {} points exceeds the evaluation budget of {}", seed.size(),
                      config_.max_evaluations);
        throw errors::ConvergenceError(
            fmt::format("No convergence within {} evaluations", config_.max_evaluations));
    }

    grid.add_points(seed, evaluator);
    output.evaluator_calls += 1;

    while (true) {
        if (stop_token.stop_requested()) {
            spdlog::error("Integration cancelled after {} steps", output.iterations);
            throw errors::CancelledError("Integration cancelled");
        }
        const auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (config_.time_budget.count() > 0 && elapsed > config_.time_budget) {
            spdlog::error("Time budget of {} ms exhausted after {} steps", config_.time_budget.count(),
                          output.iterations);
            throw errors::ConvergenceError("Time budget exhausted");
        }

        output.iterations += 1;

        const std::vector<double> ratios = interval_error_ratios(grid.times(), grid.samples());
        const int flagged = static_cast<int>(std::count_if(ratios.begin(), ratios.end(), [](double r) { return r > 1.0; }));
        output.flagged.push_back(flagged);
        if (flagged == 0) {
            break;
        }

        std::vector<Interval> intervals;
        intervals.reserve(ratios.size());
        for (size_t i = 0; i < ratios.size(); ++i) {
            intervals.push_back({grid.times()[i], grid.times()[i + 1], ratios[i]});
        }
        const Interval worst = *std::max_element(intervals.begin(), intervals.end());

        const double mid = 0.5 * (worst.a + worst.b);
        if (!(mid > worst.a && mid < worst.b)) {
            spdlog::error("Interval [{}, {}] cannot be split further", worst.a, worst.b);
            throw errors::ConvergenceError(fmt::format("Interval [{}, {}] is too narrow to refine", worst.a, worst.b));
        }
        if (grid.evaluations() >= config_.max_evaluations) {
            spdlog::error("Evaluation budget of {} points exhausted", config_.max_evaluations);
            throw errors::ConvergenceError(
                fmt::format("No convergence within {} evaluations", config_.max_evaluations));
        }

        grid.add_points({mid}, evaluator);
        output.evaluator_calls += 1;

        spdlog::trace("Step {}: split [{}, {}] with ratio {}, {} intervals flagged", output.iterations, worst.a,
                      worst.b, worst.ratio, flagged);
    }

    const auto estimate = calculate_integral(grid.times(), grid.samples(), y0, Degree::P1);

    output.integral = estimate.integral;
    output.times = grid.times();
    output.samples = grid.samples();
    output.evaluations = grid.evaluations();

    spdlog::info("Converged after {} steps: {} points", output.iterations, output.times.size());

    return output;
}

}; /* namespace solver */

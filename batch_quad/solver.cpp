/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <atomic>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "spdlog/fmt/fmt.h"

#include "batch_quad/consts.hpp"
#include "batch_quad/error_ratio.hpp"
#include "batch_quad/errors.hpp"
#include "batch_quad/quadrature.hpp"
#include "batch_quad/solver.hpp"

namespace solver {

void validate(const SolverConfig &config) {
    if (config.p < consts::min_order || config.p > consts::max_order) {
        throw errors::ConfigurationError(
            fmt::format("The order of the method must be in [{}, {}], got {}", consts::min_order, consts::max_order,
                        config.p));
    }
    if (!(config.atol >= 0.0) || !(config.rtol >= 0.0) || !std::isfinite(config.atol) ||
        !std::isfinite(config.rtol)) {
        throw errors::ConfigurationError(
            fmt::format("Tolerances must be finite and non-negative, got atol={} rtol={}", config.atol, config.rtol));
    }
    if (config.atol == 0.0 && config.rtol == 0.0) {
        throw errors::ConfigurationError("At least one of atol and rtol must be positive");
    }
    check_bounds(config.t_init, config.t_final);
    if (config.initial_points < 2) {
        throw errors::ConfigurationError(
            fmt::format("The seed grid needs at least 2 points, got {}", config.initial_points));
    }
    if (!(config.min_spacing >= 0.0) || !std::isfinite(config.min_spacing)) {
        throw errors::ConfigurationError(
            fmt::format("Minimum spacing must be finite and non-negative, got {}", config.min_spacing));
    }
    if (config.refine_points < 1) {
        throw errors::ConfigurationError(
            fmt::format("At least one point must be inserted per interval, got {}", config.refine_points));
    }
    if (config.max_iterations < 1) {
        throw errors::ConfigurationError(
            fmt::format("Iteration budget must be positive, got {}", config.max_iterations));
    }
    if (config.max_evaluations < 2) {
        throw errors::ConfigurationError(
            fmt::format("Evaluation budget must be at least 2, got {}", config.max_evaluations));
    }
    if (config.time_budget.count() < 0) {
        throw errors::ConfigurationError("Time budget must be non-negative");
    }
}

void check_bounds(double t_init, double t_final) {
    if (!std::isfinite(t_init) || !std::isfinite(t_final) || !(t_init < t_final)) {
        throw errors::ConfigurationError(fmt::format("Invalid integration bounds [{}, {}]", t_init, t_final));
    }
}

CallGuard::CallGuard(std::atomic<bool> &busy) : busy_(busy) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        throw errors::ConcurrentCallError("Integrator is already running an integration");
    }
}

SolverBase::SolverBase(const SolverConfig &config, evaluator::Evaluator evaluator, error_ratio::ErrorNorm norm)
    : config_(config), evaluator_(std::move(evaluator)) {
    validate(config_);
    set_error_norm(std::move(norm));
}

quadrature::QuadratureEstimate SolverBase::calculate_integral(const std::vector<double> &times,
                                                              const sample_set::SampleSet &samples,
                                                              double y0,
                                                              Degree degree) const {
    return quadrature::estimate(times, samples, y0, degree_value(degree));
}

IntegralOutput SolverBase::integrate(double y0) {
    if (!evaluator_) {
        throw errors::ConfigurationError("No evaluator bound to the solver");
    }
    return integrate(evaluator_, y0, config_.t_init, config_.t_final);
}

void SolverBase::set_error_norm(error_ratio::ErrorNorm norm) {
    const CallGuard guard(busy_);
    if (!norm) {
        throw errors::ConfigurationError("Error norm must be callable");
    }
    norm_ = std::move(norm);
}

std::vector<double> SolverBase::interval_error_ratios(const std::vector<double> &times,
                                                      const sample_set::SampleSet &samples) const {
    if (static_cast<int>(times.size()) < degree_value(Degree::P1) + 1) {
        return std::vector<double>(times.size() - 1, std::numeric_limits<double>::infinity());
    }

    const auto estimate_p = calculate_integral(times, samples, 0.0, Degree::P);
    const auto estimate_p1 = calculate_integral(times, samples, 0.0, Degree::P1);

    return error_ratio::compute_error_ratios(estimate_p.intervals, estimate_p1.intervals, config_.atol, config_.rtol,
                                             norm_);
}

}; /* namespace solver */

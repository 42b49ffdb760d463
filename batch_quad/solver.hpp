/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

#include "batch_quad/consts.hpp"
#include "batch_quad/error_ratio.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/quadrature.hpp"
#include "batch_quad/sample_set.hpp"

namespace solver {

/**
 * @brief Quadrature degree selector: the solver order P or the embedded higher order P + 1.
 */
enum class Degree { P, P1 };

/**
 * @brief Solver configuration.
 */
struct SolverConfig {
    int p = consts::default_order;                             /* Quadrature order, > 0 */
    double atol = consts::default_atol;                        /* Absolute tolerance, >= 0 */
    double rtol = consts::default_rtol;                        /* Relative tolerance, >= 0 */
    double t_init = 0.0;                                       /* Default lower bound */
    double t_final = 1.0;                                      /* Default upper bound, > t_init */
    int initial_points = consts::default_initial_points;       /* Uniform seed resolution, >= 2 */
    double min_spacing = consts::default_min_spacing;          /* Coarsening threshold, >= 0 */
    int refine_points = consts::default_refine_points;         /* Points per flagged interval, >= 1 */
    int max_iterations = consts::default_max_iterations;       /* Refinement rounds per call, >= 1 */
    int max_evaluations = consts::default_max_evaluations;     /* Distinct evaluated points per call, >= 2 */
    std::chrono::milliseconds time_budget = consts::default_time_budget; /* Per call, 0 means unlimited */
};

/**
 * @brief Check a configuration.
 *
 * @throws errors::ConfigurationError naming the first invalid field.
 */
void validate(const SolverConfig &config);

/**
 * @brief Result of an integration.
 */
struct IntegralOutput {
    std::vector<double> integral;  /* Degree P + 1 estimate including y0, one value per component */
    std::vector<double> times;     /* Final grid */
    sample_set::SampleSet samples; /* Final samples, aligned with times */

    int iterations = 0;        /* Refinement rounds (serial solver: insertion steps) */
    int evaluator_calls = 0;   /* Batches sent to the evaluator */
    int evaluations = 0;       /* Distinct times evaluated */
    std::vector<int> flagged;  /* Intervals flagged for refinement, per round */
    bool degenerate = false;   /* Coarsening collapsed the grid to its bounds */
};

/**
 * @brief Marks an integrator instance busy for the lifetime of the guard.
 *
 * Construction fails if the instance is already busy, whether the other call runs on another thread or further up
 * the stack of the current one.
 */
class CallGuard {
public:
    /**
     * @throws errors::ConcurrentCallError if busy is already set.
     */
    explicit CallGuard(std::atomic<bool> &busy);

    CallGuard(const CallGuard &) = delete;

    CallGuard &operator=(const CallGuard &) = delete;

    ~CallGuard() { busy_.store(false); }

private:
    std::atomic<bool> &busy_;
};

/**
 * @brief Capability interface of an integrator of batched sample functions over a time axis.
 */
class Integrator {
public:
    virtual ~Integrator() = default;

    /**
     * @brief Integral estimate of sampled data at degree P or P + 1.
     *
     * @param times   Strictly increasing grid.
     * @param samples One row per grid point.
     * @param y0      Initial integral offset.
     * @param degree  Degree selector.
     */
    virtual quadrature::QuadratureEstimate calculate_integral(const std::vector<double> &times,
                                                              const sample_set::SampleSet &samples,
                                                              double y0,
                                                              Degree degree) const = 0;

    /**
     * @brief Integrate an evaluator over [t_init, t_final].
     *
     * @param evaluator     Batched sample function.
     * @param y0            Initial integral offset.
     * @param t_init        Lower bound.
     * @param t_final       Upper bound, > t_init.
     * @param explicit_grid Optional starting grid inside the bounds.
     * @param stop_token    Checked between iterations.
     */
    virtual IntegralOutput integrate(const evaluator::Evaluator &evaluator,
                                     double y0,
                                     double t_init,
                                     double t_final,
                                     std::optional<std::vector<double>> explicit_grid = std::nullopt,
                                     std::stop_token stop_token = {}) = 0;
};

/**
 * @brief State and numerics shared by the concrete solvers.
 *
 * Holds the order, tolerances and default bounds, an optionally bound evaluator and the error norm strategy, and
 * computes quadrature estimates for every solver.
 */
class SolverBase : public Integrator {
public:
    /**
     * @brief Construct a solver base.
     *
     * @param config    Solver configuration, validated here.
     * @param evaluator Evaluator used by integrate(y0), may be empty.
     * @param norm      Error norm, RMS across components by default.
     *
     * @throws errors::ConfigurationError on an invalid configuration.
     */
    explicit SolverBase(const SolverConfig &config,
                        evaluator::Evaluator evaluator = {},
                        error_ratio::ErrorNorm norm = error_ratio::rms_norm);

    quadrature::QuadratureEstimate calculate_integral(const std::vector<double> &times,
                                                      const sample_set::SampleSet &samples,
                                                      double y0,
                                                      Degree degree) const override;

    using Integrator::integrate;

    /**
     * @brief Integrate the bound evaluator over the configured bounds.
     *
     * @throws errors::ConfigurationError if no evaluator is bound.
     */
    IntegralOutput integrate(double y0 = 0.0);

    /**
     * @brief Reduce the error vector of one point to a scalar with the configured norm.
     */
    double error_norm(std::span<const double> error) const { return norm_(error); }

    /**
     * @brief Replace the error norm.
     *
     * @throws errors::ConfigurationError if norm is empty.
     * @throws errors::ConcurrentCallError if an integration is running on this instance.
     */
    void set_error_norm(error_ratio::ErrorNorm norm);

    int order() const noexcept { return config_.p; }

    const SolverConfig &config() const noexcept { return config_; }

protected:
    /**
     * @brief Polynomial degree of a selector: p or p + 1.
     */
    int degree_value(Degree degree) const noexcept { return degree == Degree::P ? config_.p : config_.p + 1; }

    /**
     * @brief Per-interval error ratios between the degree P and P + 1 estimates on a grid.
     *
     * Every interval is flagged with an infinite ratio when the grid is too short to hold a degree P + 1 stencil.
     */
    std::vector<double> interval_error_ratios(const std::vector<double> &times,
                                              const sample_set::SampleSet &samples) const;

    SolverConfig config_;
    evaluator::Evaluator evaluator_;
    error_ratio::ErrorNorm norm_;

    /**
     * @brief Set while an integration runs on this instance.
     */
    mutable std::atomic<bool> busy_{false};
};

/**
 * @brief Check integration bounds.
 *
 * @throws errors::ConfigurationError unless both are finite and t_init < t_final.
 */
void check_bounds(double t_init, double t_final);

}; /* namespace solver */

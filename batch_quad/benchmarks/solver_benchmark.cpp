/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "batch_quad/parallel_solver.hpp"
#include "batch_quad/serial_solver.hpp"

#include <benchmark/benchmark.h>

#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

#include "spdlog/spdlog.h"

#include "batch_quad/evaluator.hpp"
#include "batch_quad/solver.hpp"

using solver::ParallelAdaptiveIntegrator;
using solver::SerialAdaptiveIntegrator;
using solver::SolverConfig;

const SolverConfig config{.p = 1, .atol = 1.0e-7, .rtol = 1.0e-7};

static std::vector<double> oscillation(double t) { return {std::sin(20.0 * t), std::cos(20.0 * t)}; }

/**
 * Point function with a fixed latency, standing in for an expensive simulation step.
 */
static std::vector<double> slow_oscillation(double t) {
    std::this_thread::sleep_for(std::chrono::microseconds(20));
    return oscillation(t);
}

static void BM_ParallelSolver(benchmark::State &state) {
    spdlog::set_level(spdlog::level::off);
    auto f = evaluator::make_evaluator(oscillation);

    for (auto _ : state) {
        ParallelAdaptiveIntegrator integrator(config);
        auto output = integrator.integrate(f, 0.0, 0.0, 1.0);
        benchmark::DoNotOptimize(output.integral);
    }
}

static void BM_SerialSolver(benchmark::State &state) {
    spdlog::set_level(spdlog::level::off);
    auto f = evaluator::make_evaluator(oscillation);

    for (auto _ : state) {
        SerialAdaptiveIntegrator integrator(config);
        auto output = integrator.integrate(f, 0.0, 0.0, 1.0);
        benchmark::DoNotOptimize(output.integral);
    }
}

static void BM_ParallelSolverThreadedEvaluator(benchmark::State &state) {
    spdlog::set_level(spdlog::level::off);
    auto f = evaluator::make_parallel_evaluator(slow_oscillation, static_cast<int>(state.range(0)));

    for (auto _ : state) {
        ParallelAdaptiveIntegrator integrator(config);
        auto output = integrator.integrate(f, 0.0, 0.0, 1.0);
        benchmark::DoNotOptimize(output.integral);
    }
}

/**
 * Repeated integration over a sliding window, with and without the cached grid.
 */
static void BM_WarmStart(benchmark::State &state) {
    spdlog::set_level(spdlog::level::off);
    const bool warm = state.range(0) != 0;
    auto f = evaluator::make_evaluator(oscillation);

    for (auto _ : state) {
        ParallelAdaptiveIntegrator integrator(config);
        for (int i = 0; i < 8; ++i) {
            if (!warm) {
                integrator.clear_warm_start();
            }
            auto output = integrator.integrate(f, 0.0, 0.05 * i, 0.05 * i + 1.0);
            benchmark::DoNotOptimize(output.integral);
        }
    }
}

BENCHMARK(BM_ParallelSolver);
BENCHMARK(BM_SerialSolver);
BENCHMARK(BM_ParallelSolverThreadedEvaluator)->Arg(1)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_WarmStart)->Arg(0)->Arg(1);

BENCHMARK_MAIN();

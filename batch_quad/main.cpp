/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "spdlog/spdlog.h"

#include "batch_quad/consts.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/parallel_solver.hpp"
#include "batch_quad/parse_verbosity.hpp"
#include "batch_quad/serial_solver.hpp"
#include "batch_quad/solver.hpp"

/* Define cli args */
ABSL_FLAG(std::string, function, "sin", "Sample function: identity, sin, gaussian, circle or constant");
ABSL_FLAG(double, frequency, 20.0, "Frequency (sin, circle) or sharpness (gaussian) of the sample function");
ABSL_FLAG(double, t_init, 0.0, "Lower integration bound");
ABSL_FLAG(double, t_final, 1.0, "Upper integration bound");
ABSL_FLAG(double, y0, 0.0, "Initial integral offset");
ABSL_FLAG(int, p, consts::default_order, "Quadrature order");
ABSL_FLAG(double, atol, consts::default_atol, "Absolute tolerance");
ABSL_FLAG(double, rtol, consts::default_rtol, "Relative tolerance");
ABSL_FLAG(int, initial_points, consts::default_initial_points, "Points of the uniform seed grid");
ABSL_FLAG(double, min_spacing, consts::default_min_spacing, "Coarsening threshold, 0 disables it");
ABSL_FLAG(int, refine_points, consts::default_refine_points, "Points inserted per flagged interval");
ABSL_FLAG(int, max_iterations, consts::default_max_iterations, "Refinement round budget");
ABSL_FLAG(int, max_evaluations, consts::default_max_evaluations, "Distinct evaluated point budget");
ABSL_FLAG(int, time_budget_ms, 0, "Wall-clock budget in milliseconds, 0 means unlimited");
ABSL_FLAG(int, threads, 0, "Evaluator worker threads, 0 uses the hardware concurrency");
ABSL_FLAG(bool, serial, false, "Use the one-point-per-step integrator");
ABSL_FLAG(std::string, output_path, "", "Grid and samples output file path");
ABSL_FLAG(spdlog::level::level_enum, verbosity, spdlog::level::info, "Logging verbosity");

/**
 * @brief Built-in sample function selected by name.
 *
 * @param name      Function name.
 * @param frequency Frequency or sharpness parameter.
 *
 * @return Point function.
 */
static evaluator::PointFunction make_point_function(const std::string &name, double frequency) {
    if (name == "identity") {
        return [](double t) { return std::vector<double>{t}; };
    }
    if (name == "sin") {
        return [frequency](double t) { return std::vector<double>{std::sin(frequency * t)}; };
    }
    if (name == "gaussian") {
        return [frequency](double t) { return std::vector<double>{std::exp(-frequency * (t - 0.5) * (t - 0.5))}; };
    }
    if (name == "circle") {
        return [frequency](double t) {
            return std::vector<double>{std::cos(frequency * t), std::sin(frequency * t)};
        };
    }
    if (name == "constant") {
        return [](double) { return std::vector<double>{1.0}; };
    }
    throw std::invalid_argument("Unknown sample function " + name);
}

/**
 * @brief Write the grid and samples, one point per line: time followed by the sample components.
 */
static void write_output(const std::string &filepath, const solver::IntegralOutput &output) {
    spdlog::info("Writing grid to file {}", filepath);

    if (std::filesystem::exists(filepath)) {
        spdlog::warn("File {} already exists, overwriting", filepath);
    }
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Cannot open file {}", filepath);
        throw std::runtime_error("Cannot open file " + filepath);
    }

    file.precision(17);
    for (int i = 0; i < static_cast<int>(output.times.size()); ++i) {
        file << output.times[i];
        for (const double v : output.samples.row(i)) {
            file << " " << v;
        }
        file << "\n";
    }

    spdlog::info("Writing grid done");
}

int main(int argc, char *argv[]) {
    absl::ParseCommandLine(argc, argv);

    auto function = absl::GetFlag(FLAGS_function);
    auto frequency = absl::GetFlag(FLAGS_frequency);
    auto y0 = absl::GetFlag(FLAGS_y0);
    auto threads = absl::GetFlag(FLAGS_threads);
    auto serial = absl::GetFlag(FLAGS_serial);
    auto output_path = absl::GetFlag(FLAGS_output_path);
    auto verbosity = absl::GetFlag(FLAGS_verbosity);

    solver::SolverConfig config{
        .p = absl::GetFlag(FLAGS_p),
        .atol = absl::GetFlag(FLAGS_atol),
        .rtol = absl::GetFlag(FLAGS_rtol),
        .t_init = absl::GetFlag(FLAGS_t_init),
        .t_final = absl::GetFlag(FLAGS_t_final),
        .initial_points = absl::GetFlag(FLAGS_initial_points),
        .min_spacing = absl::GetFlag(FLAGS_min_spacing),
        .refine_points = absl::GetFlag(FLAGS_refine_points),
        .max_iterations = absl::GetFlag(FLAGS_max_iterations),
        .max_evaluations = absl::GetFlag(FLAGS_max_evaluations),
        .time_budget = std::chrono::milliseconds(absl::GetFlag(FLAGS_time_budget_ms)),
    };

    spdlog::set_level(verbosity);

    spdlog::info("Parameters:");
    spdlog::info("\tfunction: {} (frequency {})", function, frequency);
    spdlog::info("\tbounds: [{}, {}]", config.t_init, config.t_final);
    spdlog::info("\tp: {}", config.p);
    spdlog::info("\tatol: {}, rtol: {}", config.atol, config.rtol);
    spdlog::info("\tinitial_points: {}", config.initial_points);
    spdlog::info("\tmin_spacing: {}", config.min_spacing);
    spdlog::info("\tsolver: {}", serial ? "serial" : "parallel");

    try {
        auto evaluator =
            evaluator::make_parallel_evaluator(make_point_function(function, frequency), threads);

        std::unique_ptr<solver::SolverBase> solver;
        if (serial) {
            solver = std::make_unique<solver::SerialAdaptiveIntegrator>(config, evaluator);
        } else {
            solver = std::make_unique<solver::ParallelAdaptiveIntegrator>(config, evaluator);
        }

        const auto start_time = std::chrono::steady_clock::now();
        const auto output = solver->integrate(y0);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;

        spdlog::info("Result:");
        for (int j = 0; j < static_cast<int>(output.integral.size()); ++j) {
            spdlog::info("\tintegral[{}]: {:.12g}", j, output.integral[j]);
        }
        spdlog::info("\tpoints: {}", output.times.size());
        spdlog::info("\titerations: {}", output.iterations);
        spdlog::info("\tevaluations: {} in {} calls", output.evaluations, output.evaluator_calls);
        spdlog::info("\telapsed: {:.3f} s", elapsed.count());

        if (!output_path.empty()) {
            write_output(output_path, output);
        }
    } catch (const std::exception &e) {
        spdlog::error("Integration failed: {}", e.what());
        return 1;
    }

    return 0;
}

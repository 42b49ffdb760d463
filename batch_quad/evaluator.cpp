/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <exception>
#include <span>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "spdlog/fmt/fmt.h"

#include "batch_quad/errors.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/sample_set.hpp"

namespace evaluator {

/**
 * @brief Pack per-point results into a sample set, checking that all widths agree.
 */
static sample_set::SampleSet pack_rows(const std::vector<std::vector<double>> &rows) {
    if (rows.empty()) {
        return sample_set::SampleSet();
    }

    const int cols = static_cast<int>(rows.front().size());
    sample_set::SampleSet ret(static_cast<int>(rows.size()), cols);

    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        if (static_cast<int>(rows[i].size()) != cols) {
            throw errors::EvaluatorError(
                fmt::format("Point function returned {} components at point {}, expected {}", rows[i].size(), i, cols));
        }
        std::copy(rows[i].begin(), rows[i].end(), ret.row(i).begin());
    }

    return ret;
}

Evaluator make_evaluator(PointFunction f) {
    return [f = std::move(f)](const std::vector<double> &times) {
        std::vector<std::vector<double>> rows;
        rows.reserve(times.size());
        for (const double t : times) {
            rows.push_back(f(t));
        }
        return pack_rows(rows);
    };
}

Evaluator make_parallel_evaluator(PointFunction f, int n_threads) {
    if (n_threads < 0) {
        throw std::invalid_argument("Number of threads must be non-negative");
    }
    if (n_threads == 0) {
        n_threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }

    return [f = std::move(f), n_threads](const std::vector<double> &times) {
        const int n = static_cast<int>(times.size());
        const int n_workers = std::max(1, std::min(n_threads, n));
        const int chunk = (n + n_workers - 1) / n_workers;

        std::vector<std::vector<double>> rows(n);
        std::vector<std::exception_ptr> failures(n_workers);
        std::vector<std::thread> workers;
        workers.reserve(n_workers);

        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back([&, w]() {
                const int begin = w * chunk;
                const int end = std::min(n, begin + chunk);
                try {
                    for (int i = begin; i < end; ++i) {
                        rows[i] = f(times[i]);
                    }
                } catch (...) {
                    failures[w] = std::current_exception();
                }
            });
        }

        for (auto &worker : workers) {
            worker.join();
        }

        for (const auto &failure : failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        return pack_rows(rows);
    };
}

sample_set::SampleSet evaluate_batch(const Evaluator &evaluator, const std::vector<double> &times, int cols) {
    sample_set::SampleSet samples = evaluator(times);

    if (samples.rows() != static_cast<int>(times.size())) {
        throw errors::EvaluatorError(
            fmt::format("Evaluator returned {} samples for {} times", samples.rows(), times.size()));
    }
    if (cols >= 0 && samples.cols() != cols) {
        throw errors::EvaluatorError(
            fmt::format("Evaluator returned samples of width {}, expected {}", samples.cols(), cols));
    }
    for (int i = 0; i < samples.rows(); ++i) {
        const auto row = samples.row(i);
        if (!std::all_of(row.begin(), row.end(), [](double v) { return std::isfinite(v); })) {
            throw errors::EvaluatorError(fmt::format("Evaluator returned a non-finite sample at t={}", times[i]));
        }
    }

    return samples;
}

}; /* namespace evaluator */

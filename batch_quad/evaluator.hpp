/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <vector>

#include "batch_quad/sample_set.hpp"

namespace evaluator {

/**
 * @brief Batched sample function.
 *
 * Maps a batch of time values to one sample row per time, in the same order. It must be deterministic and free of
 * side effects; it may process the batch in any internal order or in parallel.
 */
using Evaluator = std::function<sample_set::SampleSet(const std::vector<double> &)>;

/**
 * @brief Sample function of a single time value.
 */
using PointFunction = std::function<std::vector<double>(double)>;

/**
 * @brief Build an evaluator that calls a point function on every time of the batch, in order.
 *
 * @param f Point function; every call must return vectors of the same width.
 *
 * @return Batched evaluator.
 */
Evaluator make_evaluator(PointFunction f);

/**
 * @brief Build an evaluator that splits every batch into contiguous chunks evaluated on worker threads.
 *
 * The point function is called concurrently and must be thread-safe. An exception thrown by a worker is rethrown in
 * the calling thread once all workers have joined.
 *
 * @param f         Point function; every call must return vectors of the same width.
 * @param n_threads Number of worker threads, 0 uses the hardware concurrency.
 *
 * @return Batched evaluator.
 */
Evaluator make_parallel_evaluator(PointFunction f, int n_threads);

/**
 * @brief Run an evaluator on a batch and check that the output is aligned with it.
 *
 * @param evaluator Evaluator to call.
 * @param times     Batch of time values.
 * @param cols      Expected sample width, negative to accept any width.
 *
 * @return Samples, one finite row per time.
 *
 * @throws errors::EvaluatorError on a length or width mismatch, or on non-finite samples.
 */
sample_set::SampleSet evaluate_batch(const Evaluator &evaluator, const std::vector<double> &times, int cols);

}; /* namespace evaluator */

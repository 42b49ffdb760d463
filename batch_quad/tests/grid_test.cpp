/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "batch_quad/grid.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "batch_quad/errors.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/sample_set.hpp"

using sample_set::SampleSet;

/**
 * Evaluator returning {2 t} that records every batch it receives.
 */
struct RecordingEvaluator {
    std::vector<std::vector<double>> *batches;

    SampleSet operator()(const std::vector<double> &times) const {
        batches->push_back(times);
        SampleSet samples(static_cast<int>(times.size()), 1);
        for (int i = 0; i < samples.rows(); ++i) {
            samples(i, 0) = 2.0 * times[i];
        }
        return samples;
    }
};

/**
 * Tests merge positions of new points between retained ones.
 */
TEST(Grid, PlanMerge) {
    auto plan = grid::plan_merge({0.0, 0.5, 1.0}, {0.75, 0.25, 0.75});

    ASSERT_EQ((std::vector<double>{0.25, 0.75}), plan.new_times);
    ASSERT_EQ((std::vector<int>{0, 2, 4}), plan.old_idxs);
    ASSERT_EQ((std::vector<int>{1, 3}), plan.new_idxs);
}

/**
 * Tests merge positions into an empty grid.
 */
TEST(Grid, PlanMergeIntoEmptyGrid) {
    auto plan = grid::plan_merge({}, {1.0, 0.0});

    ASSERT_EQ((std::vector<double>{0.0, 1.0}), plan.new_times);
    ASSERT_TRUE(plan.old_idxs.empty());
    ASSERT_EQ((std::vector<int>{0, 1}), plan.new_idxs);
}

TEST(Grid, PlanMergeEmptyBatch) { EXPECT_THROW(grid::plan_merge({0.0, 1.0}, {}), errors::EmptyBatchError); }

TEST(Grid, PlanMergeDuplicate) { EXPECT_THROW(grid::plan_merge({0.0, 1.0}, {1.0}), std::invalid_argument); }

/**
 * Tests scattering times and samples with the same positions.
 */
TEST(Grid, Merge) {
    const std::vector<int> old_idxs{0, 3};
    const std::vector<int> new_idxs{1, 2};
    const std::vector<double> old_times{0.0, 1.0};
    const std::vector<double> new_times{0.3, 0.6};
    const SampleSet old_samples{{0.0, 0.0}, {1.0, 1.0}};
    const SampleSet new_samples{{0.3, 3.0}, {0.6, 6.0}};

    auto times = grid::merge(old_idxs, old_times, new_idxs, new_times);
    auto samples = grid::merge(old_idxs, old_samples, new_idxs, new_samples);

    ASSERT_EQ((std::vector<double>{0.0, 0.3, 0.6, 1.0}), times);
    ASSERT_EQ((SampleSet{{0.0, 0.0}, {0.3, 3.0}, {0.6, 6.0}, {1.0, 1.0}}), samples);
}

/**
 * Tests that merge positions must cover the output exactly once.
 */
TEST(Grid, MergeInvalidPositions) {
    const std::vector<double> old_times{0.0, 1.0};
    const std::vector<double> new_times{0.5};
    const SampleSet old_samples{{0.0}};
    const SampleSet wide_samples{{0.5, 1.0}};

    EXPECT_THROW(grid::merge({0, 1}, old_times, {1}, new_times), std::invalid_argument);
    EXPECT_THROW(grid::merge({0, 3}, old_times, {1}, new_times), std::invalid_argument);
    EXPECT_THROW(grid::merge({0}, old_times, {1}, new_times), std::invalid_argument);
    EXPECT_THROW(grid::merge({0}, old_samples, {1}, wide_samples), std::invalid_argument);
}

TEST(Grid, ArenaFindAndInsert) {
    grid::EvaluationArena arena;
    const std::vector<double> sample{1.0, 2.0};

    ASSERT_EQ(-1, arena.cols());
    ASSERT_FALSE(arena.find(0.5).has_value());

    const int id = arena.insert(0.5, sample);

    ASSERT_EQ(0, id);
    ASSERT_EQ(1, arena.size());
    ASSERT_EQ(2, arena.cols());
    ASSERT_EQ(id, arena.find(0.5).value());
    ASSERT_EQ(2.0, arena.sample(id)[1]);
    EXPECT_THROW(arena.insert(0.5, sample), std::invalid_argument);
}

/**
 * Tests batched insertion keeps the grid sorted and aligned with its samples.
 */
TEST(Grid, AddPoints) {
    std::vector<std::vector<double>> batches;
    RecordingEvaluator evaluator{&batches};
    grid::Grid g;

    auto added = g.add_points({1.0, 0.0, 0.5}, evaluator);
    ASSERT_EQ(3, added.inserted);
    ASSERT_EQ(3, added.evaluated);

    added = g.add_points({0.75, 0.25}, evaluator);
    ASSERT_EQ(2, added.evaluated);
    ASSERT_EQ(0, added.reused);

    ASSERT_EQ((std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}), g.times());
    ASSERT_EQ(5, g.samples().rows());
    for (int i = 0; i < g.size(); ++i) {
        ASSERT_EQ(2.0 * g.times()[i], g.samples()(i, 0));
    }

    ASSERT_EQ(2, batches.size());
    ASSERT_EQ((std::vector<double>{0.0, 0.5, 1.0}), batches[0]);
    ASSERT_EQ((std::vector<double>{0.25, 0.75}), batches[1]);
}

TEST(Grid, AddPointsEmptyBatch) {
    std::vector<std::vector<double>> batches;
    RecordingEvaluator evaluator{&batches};
    grid::Grid g;

    EXPECT_THROW(g.add_points({}, evaluator), errors::EmptyBatchError);
    ASSERT_TRUE(batches.empty());
}

/**
 * Tests that a removed point coming back is served from the arena instead of the evaluator.
 */
TEST(Grid, AddPointsReusesRemovedEvaluations) {
    std::vector<std::vector<double>> batches;
    RecordingEvaluator evaluator{&batches};
    grid::Grid g;

    g.add_points({0.0, 0.1, 0.2}, evaluator);
    auto coarsening = g.remove_points(0.5, {false, false, false});
    ASSERT_EQ(1, coarsening.removed);
    ASSERT_EQ((std::vector<double>{0.0, 0.2}), g.times());

    auto added = g.add_points({0.1}, evaluator);

    ASSERT_EQ(0, added.evaluated);
    ASSERT_EQ(1, added.reused);
    ASSERT_EQ(1, batches.size());
    ASSERT_EQ((std::vector<double>{0.0, 0.1, 0.2}), g.times());
    ASSERT_EQ(0.2, g.samples()(1, 0));
    ASSERT_EQ(3, g.evaluations());
}

/**
 * Tests that only distinct candidates missing from the arena count as pending evaluations.
 */
TEST(Grid, Unevaluated) {
    std::vector<std::vector<double>> batches;
    RecordingEvaluator evaluator{&batches};
    grid::Grid g;

    ASSERT_EQ(2, g.unevaluated({0.0, 1.0, 1.0}));

    g.add_points({0.0, 0.1, 0.2}, evaluator);
    g.remove_points(0.5, {false, false, false});

    ASSERT_EQ(0, g.unevaluated({0.1}));
    ASSERT_EQ(1, g.unevaluated({0.1, 0.15, 0.15}));
    ASSERT_EQ(1, batches.size());
}

/**
 * Tests that points inserted with a lock are reported per position and survive a grid change.
 */
TEST(Grid, LockedPoints) {
    std::vector<std::vector<double>> batches;
    RecordingEvaluator evaluator{&batches};
    grid::Grid g;

    g.add_points({0.0, 0.5, 1.0}, evaluator);
    ASSERT_EQ((std::vector<bool>{false, false, false}), g.locked());

    g.add_points({0.25, 0.75}, evaluator, true);
    ASSERT_EQ((std::vector<bool>{false, true, false, true, false}), g.locked());

    g.remove_points(0.6, g.locked());
    ASSERT_EQ((std::vector<double>{0.0, 0.25, 0.75, 1.0}), g.times());
    ASSERT_EQ((std::vector<bool>{false, true, true, false}), g.locked());
}

/**
 * Tests that an evaluator returning a wrong number of samples is rejected.
 */
TEST(Grid, AddPointsMisalignedEvaluator) {
    grid::Grid g;
    evaluator::Evaluator evaluator = [](const std::vector<double> &times) { return SampleSet{{1.0}}; };

    EXPECT_THROW(g.add_points({0.0, 1.0}, evaluator), errors::EvaluatorError);
}

TEST(Grid, UniformGrid) {
    auto times = grid::uniform_grid(0.0, 1.0, 5);

    ASSERT_EQ((std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}), times);
    ASSERT_EQ(101, grid::uniform_grid(-1.0, 3.0, 101).size());
    ASSERT_EQ(3.0, grid::uniform_grid(-1.0, 3.0, 101).back());
    EXPECT_THROW(grid::uniform_grid(0.0, 1.0, 1), errors::ConfigurationError);
    EXPECT_THROW(grid::uniform_grid(1.0, 1.0, 3), errors::ConfigurationError);
}

/**
 * Tests restriction of a previous grid to new bounds.
 */
TEST(Grid, RestrictGrid) {
    auto times = grid::restrict_grid({0.0, 0.1, 0.2, 0.6, 1.0}, 0.15, 0.6);

    ASSERT_EQ((std::vector<double>{0.15, 0.2, 0.6}), times);
}

TEST(Grid, NormalizeGrid) {
    auto times = grid::normalize_grid({0.5, 0.25, 0.5, 0.75}, 0.0, 1.0);

    ASSERT_EQ((std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}), times);
    EXPECT_THROW(grid::normalize_grid({0.5, 1.5}, 0.0, 1.0), errors::ConfigurationError);
    EXPECT_THROW(grid::normalize_grid({std::nan("")}, 0.0, 1.0), errors::ConfigurationError);
}

TEST(Grid, RefinementPoints) {
    const std::vector<double> times{0.0, 1.0, 2.0, 3.0};
    const std::vector<double> ratios{0.5, 2.0, 1.0};

    ASSERT_EQ((std::vector<double>{1.5}), grid::refinement_points(times, ratios, 1));
    ASSERT_EQ((std::vector<double>{1.25, 1.5, 1.75}), grid::refinement_points(times, ratios, 3));
    ASSERT_TRUE(grid::refinement_points(times, {0.0, 1.0, 0.3}, 1).empty());
    EXPECT_THROW(grid::refinement_points(times, {2.0}, 1), std::invalid_argument);
}

TEST(Grid, RefinementPointsIntervalTooNarrow) {
    const double a = 1.0;
    const double b = std::nextafter(a, 2.0);

    EXPECT_THROW(grid::refinement_points({a, b}, {2.0}, 1), errors::ConvergenceError);
}

TEST(Grid, PinnedPoints) {
    ASSERT_EQ((std::vector<bool>{false, true, true, false}), grid::pinned_points({0.5, 2.0, 0.1}));
    ASSERT_EQ((std::vector<bool>{true, true, true}), grid::pinned_points({3.0, std::numeric_limits<double>::infinity()}));
}

TEST(Grid, SampleDeltas) {
    auto deltas = grid::sample_deltas(SampleSet{{0.0, 0.0}, {3.0, 4.0}, {3.0, 4.0}});

    ASSERT_EQ((std::vector<double>{5.0, 0.0}), deltas);
}

/**
 * Tests removal of points closer than the threshold to their retained neighbour.
 */
TEST(Grid, RedundantPoints) {
    SampleSet samples{{0.0}, {0.1}, {0.2}, {1.0}, {1.05}, {2.0}};

    auto coarsening = grid::redundant_points(samples, 0.15, std::vector<bool>(6, false));

    ASSERT_EQ((std::vector<bool>{true, false, true, true, false, true}), coarsening.keep);
    ASSERT_EQ(2, coarsening.removed);
    ASSERT_FALSE(coarsening.degenerate);
}

/**
 * Tests that the interior point is dropped when it is too close to the final point.
 */
TEST(Grid, RedundantPointsNextToFinal) {
    SampleSet samples{{0.0}, {1.0}, {1.95}, {2.0}};

    auto coarsening = grid::redundant_points(samples, 0.1, std::vector<bool>(4, false));

    ASSERT_EQ((std::vector<bool>{true, true, false, true}), coarsening.keep);
}

TEST(Grid, RedundantPointsPinned) {
    SampleSet samples{{0.0}, {0.1}, {0.2}, {1.0}, {1.05}, {2.0}};

    auto coarsening = grid::redundant_points(samples, 0.15, {false, true, false, false, false, false});

    ASSERT_EQ((std::vector<bool>{true, true, false, true, false, true}), coarsening.keep);
}

/**
 * Tests collapse to the boundaries.
 */
TEST(Grid, RedundantPointsDegenerate) {
    SampleSet samples{{1.0}, {1.0}, {1.0}, {1.0}, {1.0}};

    auto coarsening = grid::redundant_points(samples, 0.5, std::vector<bool>(5, false));

    ASSERT_EQ((std::vector<bool>{true, false, false, false, true}), coarsening.keep);
    ASSERT_EQ(3, coarsening.removed);
    ASSERT_TRUE(coarsening.degenerate);
}

TEST(Grid, RedundantPointsDisabled) {
    SampleSet samples{{1.0}, {1.0}, {1.0}};

    auto coarsening = grid::redundant_points(samples, 0.0, std::vector<bool>(3, false));

    ASSERT_EQ(0, coarsening.removed);
    ASSERT_FALSE(coarsening.degenerate);
}

TEST(Grid, RedundantPointsTwoPointGrid) {
    SampleSet samples{{1.0}, {1.0}};

    auto coarsening = grid::redundant_points(samples, 10.0, std::vector<bool>(2, false));

    ASSERT_EQ(0, coarsening.removed);
    ASSERT_FALSE(coarsening.degenerate);
    EXPECT_THROW(grid::redundant_points(samples, 10.0, {false}), std::invalid_argument);
}

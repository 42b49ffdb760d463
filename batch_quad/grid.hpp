/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <span>
#include <vector>

#include "batch_quad/evaluator.hpp"
#include "batch_quad/sample_set.hpp"

namespace grid {

/**
 * @brief Positions of retained and new points in a merged grid.
 */
struct MergePlan {
    std::vector<int> old_idxs;      /* Merged position of every retained point, in retained order */
    std::vector<int> new_idxs;      /* Merged position of every new point, in new_times order */
    std::vector<double> new_times;  /* New points, sorted and de-duplicated */
};

/**
 * @brief Plan the merge of a batch of new times into a sorted grid.
 *
 * @param old_times Strictly increasing retained grid, possibly empty.
 * @param new_times Candidate times in any order; repeated values are collapsed.
 *
 * @return Merge positions for both inputs.
 *
 * @throws errors::EmptyBatchError if new_times is empty.
 * @throws std::invalid_argument if a candidate coincides with a retained point.
 */
MergePlan plan_merge(const std::vector<double> &old_times, const std::vector<double> &new_times);

/**
 * @brief Scatter retained and new values into one combined array.
 *
 * Every position in [0, old + new) must be targeted exactly once.
 */
std::vector<double> merge(const std::vector<int> &old_idxs,
                          const std::vector<double> &old_values,
                          const std::vector<int> &new_idxs,
                          const std::vector<double> &new_values);

/**
 * @brief Scatter retained and new sample rows into one combined sample set.
 *
 * Every row position in [0, old + new) must be targeted exactly once. An empty old set adopts the width of the new
 * rows.
 */
sample_set::SampleSet merge(const std::vector<int> &old_idxs,
                            const sample_set::SampleSet &old_values,
                            const std::vector<int> &new_idxs,
                            const sample_set::SampleSet &new_values);

/**
 * @brief Every evaluation made during one integrate call, addressed by stable ids.
 *
 * Points dropped from the grid stay in the arena, so a time that comes back is never evaluated twice.
 */
class EvaluationArena {
public:
    /**
     * @brief Id of the evaluation stored for exactly this time, if any.
     */
    std::optional<int> find(double t) const;

    /**
     * @brief Store an evaluation.
     *
     * @return Stable id of the stored sample.
     */
    int insert(double t, std::span<const double> sample);

    /**
     * @brief Sample stored under an id.
     */
    std::span<const double> sample(int id) const { return samples_.row(id); }

    int size() const noexcept { return samples_.rows(); }

    /**
     * @brief Sample width, -1 before the first insertion.
     */
    int cols() const noexcept { return samples_.empty() ? -1 : samples_.cols(); }

private:
    std::map<double, int> ids_;
    sample_set::SampleSet samples_;
};

/**
 * @brief Outcome of one batched insertion.
 */
struct AddResult {
    int inserted;  /* Points added to the grid */
    int evaluated; /* Points sent to the evaluator */
    int reused;    /* Points served from the arena */
};

/**
 * @brief Outcome of a coarsening pass.
 */
struct Coarsening {
    std::vector<bool> keep; /* Per input point, false for removed points */
    int removed;            /* Number of removed points */
    bool degenerate;        /* All interior points were removed */
};

/**
 * @brief Ordered time grid with its samples.
 *
 * Times are strictly increasing and aligned row by row with the samples. New points are inserted in batches, each
 * batch evaluated with a single evaluator call.
 */
class Grid {
public:
    Grid() = default;

    /**
     * @brief Insert a batch of candidate times.
     *
     * Candidates seen earlier in the lifetime of this grid are served from the arena; the remaining ones are sent to
     * the evaluator in one call. No call is made if the arena serves the whole batch.
     *
     * @param candidates Times to insert, not already in the grid.
     * @param evaluator  Batched evaluator.
     * @param lock       Keep the inserted points out of every later coarsening pass.
     *
     * @return Insertion statistics.
     */
    AddResult add_points(const std::vector<double> &candidates,
                         const evaluator::Evaluator &evaluator,
                         bool lock = false);

    /**
     * @brief Number of distinct candidates that add_points() would send to the evaluator.
     */
    int unevaluated(const std::vector<double> &candidates) const;

    /**
     * @brief Per point, true for points inserted with lock set.
     */
    std::vector<bool> locked() const;

    /**
     * @brief Remove points whose samples are closer than min_spacing to their retained neighbour.
     *
     * @param min_spacing Euclidean distance threshold in sample space, 0 disables removal.
     * @param pinned      Per point, true for points that must be kept.
     *
     * @return Coarsening result, already applied to the grid.
     */
    Coarsening remove_points(double min_spacing, const std::vector<bool> &pinned);

    const std::vector<double> &times() const noexcept { return times_; }

    const sample_set::SampleSet &samples() const noexcept { return samples_; }

    int size() const noexcept { return static_cast<int>(times_.size()); }

    /**
     * @brief Number of distinct times evaluated so far.
     */
    int evaluations() const noexcept { return arena_.size(); }

private:
    std::vector<double> times_;
    sample_set::SampleSet samples_;
    EvaluationArena arena_;
    std::set<double> locked_;
};

/**
 * @brief Uniform grid of n points over [t_init, t_final], ends included exactly.
 */
std::vector<double> uniform_grid(double t_init, double t_final, int n);

/**
 * @brief Points of a grid that lie inside [t_init, t_final], with both bounds added.
 */
std::vector<double> restrict_grid(const std::vector<double> &grid, double t_init, double t_final);

/**
 * @brief Validate a caller-supplied grid: sort it, collapse repeats and add missing bounds.
 *
 * @throws errors::ConfigurationError on non-finite points or points outside [t_init, t_final].
 */
std::vector<double> normalize_grid(const std::vector<double> &grid, double t_init, double t_final);

/**
 * @brief Times to insert into intervals whose error ratio exceeds 1.
 *
 * @param times      Strictly increasing grid.
 * @param ratios     One error ratio per interval.
 * @param per_interval Equally spaced points inserted in each flagged interval.
 *
 * @return Sorted new times.
 *
 * @throws errors::ConvergenceError if a flagged interval is too narrow to hold distinct new points.
 */
std::vector<double> refinement_points(const std::vector<double> &times,
                                      const std::vector<double> &ratios,
                                      int per_interval);

/**
 * @brief Points bordering an interval whose error ratio exceeds 1.
 */
std::vector<bool> pinned_points(const std::vector<double> &ratios);

/**
 * @brief Euclidean distance between consecutive samples.
 */
std::vector<double> sample_deltas(const sample_set::SampleSet &samples);

/**
 * @brief Select redundant points.
 *
 * Sweeps the grid keeping an anchor; an interior point whose sample is closer than min_spacing to the anchor's is
 * dropped. When the last kept interior point is that close to the final point, the interior point is dropped instead.
 * Sweeps repeat until nothing changes. Boundaries and pinned points are never dropped.
 *
 * @param samples     One row per grid point.
 * @param min_spacing Distance threshold, 0 disables removal.
 * @param pinned      Per point, true for points that must be kept.
 */
Coarsening redundant_points(const sample_set::SampleSet &samples, double min_spacing, const std::vector<bool> &pinned);

}; /* namespace grid */

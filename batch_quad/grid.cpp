/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "spdlog/fmt/fmt.h"

#include "batch_quad/errors.hpp"
#include "batch_quad/evaluator.hpp"
#include "batch_quad/grid.hpp"
#include "batch_quad/sample_set.hpp"

namespace grid {

/**
 * @brief Check that a set of positions covers [0, total) exactly once.
 */
static void check_positions(const std::vector<int> &old_idxs, const std::vector<int> &new_idxs, int total) {
    std::vector<bool> filled(total, false);
    for (const auto *idxs : {&old_idxs, &new_idxs}) {
        for (const int idx : *idxs) {
            if (idx < 0 || idx >= total || filled[idx]) {
                throw std::invalid_argument(fmt::format("Invalid merge position {}", idx));
            }
            filled[idx] = true;
        }
    }
}

MergePlan plan_merge(const std::vector<double> &old_times, const std::vector<double> &new_times) {
    if (new_times.empty()) {
        throw errors::EmptyBatchError("Do not expect an empty batch of points to add");
    }

    MergePlan plan;
    plan.new_times = new_times;
    std::sort(plan.new_times.begin(), plan.new_times.end());
    plan.new_times.erase(std::unique(plan.new_times.begin(), plan.new_times.end()), plan.new_times.end());

    plan.old_idxs.reserve(old_times.size());
    plan.new_idxs.reserve(plan.new_times.size());

    size_t i = 0;
    size_t j = 0;
    int position = 0;
    while (i < old_times.size() || j < plan.new_times.size()) {
        if (j == plan.new_times.size() || (i < old_times.size() && old_times[i] < plan.new_times[j])) {
            plan.old_idxs.push_back(position++);
            ++i;
        } else if (i == old_times.size() || plan.new_times[j] < old_times[i]) {
            plan.new_idxs.push_back(position++);
            ++j;
        } else {
            throw std::invalid_argument(fmt::format("Candidate time {} is already in the grid", plan.new_times[j]));
        }
    }

    return plan;
}

std::vector<double> merge(const std::vector<int> &old_idxs,
                          const std::vector<double> &old_values,
                          const std::vector<int> &new_idxs,
                          const std::vector<double> &new_values) {
    if (old_idxs.size() != old_values.size() || new_idxs.size() != new_values.size()) {
        throw std::invalid_argument("Merge positions and values have different lengths");
    }

    const int total = static_cast<int>(old_values.size() + new_values.size());
    check_positions(old_idxs, new_idxs, total);

    std::vector<double> combined(total);
    for (size_t i = 0; i < old_idxs.size(); ++i) {
        combined[old_idxs[i]] = old_values[i];
    }
    for (size_t i = 0; i < new_idxs.size(); ++i) {
        combined[new_idxs[i]] = new_values[i];
    }

    return combined;
}

sample_set::SampleSet merge(const std::vector<int> &old_idxs,
                            const sample_set::SampleSet &old_values,
                            const std::vector<int> &new_idxs,
                            const sample_set::SampleSet &new_values) {
    if (static_cast<int>(old_idxs.size()) != old_values.rows() ||
        static_cast<int>(new_idxs.size()) != new_values.rows()) {
        throw std::invalid_argument("Merge positions and samples have different lengths");
    }
    if (!old_values.empty() && !new_values.empty() && old_values.cols() != new_values.cols()) {
        throw std::invalid_argument("Merged samples have different widths");
    }

    const int total = old_values.rows() + new_values.rows();
    check_positions(old_idxs, new_idxs, total);

    const int cols = old_values.empty() ? new_values.cols() : old_values.cols();
    sample_set::SampleSet combined(total, cols);

    for (int i = 0; i < old_values.rows(); ++i) {
        std::copy(old_values.row(i).begin(), old_values.row(i).end(), combined.row(old_idxs[i]).begin());
    }
    for (int i = 0; i < new_values.rows(); ++i) {
        std::copy(new_values.row(i).begin(), new_values.row(i).end(), combined.row(new_idxs[i]).begin());
    }

    return combined;
}

std::optional<int> EvaluationArena::find(double t) const {
    auto it = ids_.find(t);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int EvaluationArena::insert(double t, std::span<const double> sample) {
    if (ids_.contains(t)) {
        throw std::invalid_argument(fmt::format("Time {} was already evaluated", t));
    }
    const int id = samples_.rows();
    samples_.append_row(sample);
    ids_.emplace(t, id);
    return id;
}

AddResult Grid::add_points(const std::vector<double> &candidates, const evaluator::Evaluator &evaluator, bool lock) {
    MergePlan plan = plan_merge(times_, candidates);

    /* split the batch into points served by the arena and points to evaluate */
    std::vector<int> ids(plan.new_times.size(), -1);
    std::vector<double> missing;
    for (size_t i = 0; i < plan.new_times.size(); ++i) {
        if (auto id = arena_.find(plan.new_times[i])) {
            ids[i] = *id;
        } else {
            missing.push_back(plan.new_times[i]);
        }
    }

    if (!missing.empty()) {
        sample_set::SampleSet evaluated = evaluator::evaluate_batch(evaluator, missing, arena_.cols());
        size_t k = 0;
        for (size_t i = 0; i < ids.size(); ++i) {
            if (ids[i] < 0) {
                ids[i] = arena_.insert(plan.new_times[i], evaluated.row(static_cast<int>(k++)));
            }
        }
    }

    sample_set::SampleSet new_samples(static_cast<int>(ids.size()), arena_.cols());
    for (size_t i = 0; i < ids.size(); ++i) {
        const auto sample = arena_.sample(ids[i]);
        std::copy(sample.begin(), sample.end(), new_samples.row(static_cast<int>(i)).begin());
    }

    times_ = merge(plan.old_idxs, times_, plan.new_idxs, plan.new_times);
    samples_ = merge(plan.old_idxs, samples_, plan.new_idxs, new_samples);

    if (lock) {
        locked_.insert(plan.new_times.begin(), plan.new_times.end());
    }

    const int inserted = static_cast<int>(plan.new_times.size());
    const int evaluated = static_cast<int>(missing.size());
    return {.inserted = inserted, .evaluated = evaluated, .reused = inserted - evaluated};
}

int Grid::unevaluated(const std::vector<double> &candidates) const {
    std::set<double> missing;
    for (const double t : candidates) {
        if (!arena_.find(t)) {
            missing.insert(t);
        }
    }
    return static_cast<int>(missing.size());
}

std::vector<bool> Grid::locked() const {
    std::vector<bool> ret(times_.size(), false);
    for (size_t i = 0; i < times_.size(); ++i) {
        ret[i] = locked_.contains(times_[i]);
    }
    return ret;
}

Coarsening Grid::remove_points(double min_spacing, const std::vector<bool> &pinned) {
    Coarsening coarsening = redundant_points(samples_, min_spacing, pinned);
    if (coarsening.removed == 0) {
        return coarsening;
    }

    std::vector<int> kept;
    kept.reserve(times_.size());
    for (int i = 0; i < size(); ++i) {
        if (coarsening.keep[i]) {
            kept.push_back(i);
        }
    }

    std::vector<double> times;
    times.reserve(kept.size());
    for (const int i : kept) {
        times.push_back(times_[i]);
    }

    times_ = std::move(times);
    samples_ = samples_.select(kept);

    return coarsening;
}

std::vector<double> uniform_grid(double t_init, double t_final, int n) {
    if (n < 2) {
        throw errors::ConfigurationError("A grid needs at least 2 points");
    }
    if (!(t_init < t_final)) {
        throw errors::ConfigurationError(fmt::format("Invalid bounds [{}, {}]", t_init, t_final));
    }

    std::vector<double> grid(n);
    const double dt = (t_final - t_init) / (n - 1);
    for (int i = 0; i < n - 1; ++i) {
        grid[i] = t_init + dt * i;
    }
    grid[n - 1] = t_final;

    return grid;
}

std::vector<double> restrict_grid(const std::vector<double> &grid, double t_init, double t_final) {
    std::vector<double> ret{t_init, t_final};
    for (const double t : grid) {
        if (t > t_init && t < t_final) {
            ret.push_back(t);
        }
    }
    std::sort(ret.begin(), ret.end());
    ret.erase(std::unique(ret.begin(), ret.end()), ret.end());
    return ret;
}

std::vector<double> normalize_grid(const std::vector<double> &grid, double t_init, double t_final) {
    for (const double t : grid) {
        if (!std::isfinite(t)) {
            throw errors::ConfigurationError("Grid contains a non-finite time");
        }
        if (t < t_init || t > t_final) {
            throw errors::ConfigurationError(fmt::format("Grid time {} is outside [{}, {}]", t, t_init, t_final));
        }
    }
    return restrict_grid(grid, t_init, t_final);
}

std::vector<double> refinement_points(const std::vector<double> &times,
                                      const std::vector<double> &ratios,
                                      int per_interval) {
    if (ratios.size() + 1 != times.size()) {
        throw std::invalid_argument("Expected one error ratio per interval");
    }
    if (per_interval < 1) {
        throw std::invalid_argument("At least one point must be inserted per interval");
    }

    std::vector<double> points;
    for (size_t i = 0; i < ratios.size(); ++i) {
        if (ratios[i] <= 1.0) {
            continue;
        }

        const double a = times[i];
        const double b = times[i + 1];
        const double h = (b - a) / (per_interval + 1);
        double previous = a;
        for (int m = 1; m <= per_interval; ++m) {
            const double t = a + h * m;
            if (!(t > previous && t < b)) {
                throw errors::ConvergenceError(fmt::format("Interval [{}, {}] is too narrow to refine", a, b));
            }
            points.push_back(t);
            previous = t;
        }
    }

    return points;
}

std::vector<bool> pinned_points(const std::vector<double> &ratios) {
    std::vector<bool> pinned(ratios.size() + 1, false);
    for (size_t i = 0; i < ratios.size(); ++i) {
        if (ratios[i] > 1.0) {
            pinned[i] = true;
            pinned[i + 1] = true;
        }
    }
    return pinned;
}

/**
 * @brief Euclidean distance between two samples.
 */
static double distance(const sample_set::SampleSet &samples, int i, int k) {
    double sum_sq = 0.0;
    for (int j = 0; j < samples.cols(); ++j) {
        const double d = samples(k, j) - samples(i, j);
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq);
}

std::vector<double> sample_deltas(const sample_set::SampleSet &samples) {
    std::vector<double> deltas(std::max(0, samples.rows() - 1));
    for (int i = 0; i + 1 < samples.rows(); ++i) {
        deltas[i] = distance(samples, i, i + 1);
    }
    return deltas;
}

Coarsening redundant_points(const sample_set::SampleSet &samples, double min_spacing, const std::vector<bool> &pinned) {
    const int n = samples.rows();
    if (static_cast<int>(pinned.size()) != n) {
        throw std::invalid_argument("Expected one pin flag per point");
    }

    Coarsening ret{.keep = std::vector<bool>(n, true), .removed = 0, .degenerate = false};
    if (min_spacing <= 0.0 || n <= 2) {
        return ret;
    }

    std::vector<int> kept(n);
    for (int i = 0; i < n; ++i) {
        kept[i] = i;
    }

    bool changed = true;
    while (changed) {
        changed = false;

        int anchor = kept.front();
        for (size_t m = 1; m + 1 < kept.size(); ++m) {
            const int k = kept[m];
            if (!pinned[k] && distance(samples, anchor, k) < min_spacing) {
                ret.keep[k] = false;
                changed = true;
            } else {
                anchor = k;
            }
        }

        /* t_final is never removed, drop the interior point next to it instead */
        const int last = kept.back();
        if (anchor != kept.front() && !pinned[anchor] && distance(samples, anchor, last) < min_spacing) {
            ret.keep[anchor] = false;
            changed = true;
        }

        kept.erase(std::remove_if(kept.begin(), kept.end(), [&](int i) { return !ret.keep[i]; }), kept.end());
    }

    ret.removed = n - static_cast<int>(kept.size());
    ret.degenerate = ret.removed > 0 && kept.size() == 2;

    return ret;
}

}; /* namespace grid */

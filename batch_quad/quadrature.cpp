/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <span>
#include <stdexcept>
#include <vector>

#include "batch_quad/quadrature.hpp"
#include "batch_quad/sample_set.hpp"

namespace quadrature {

/* clang-format off */

/**
 * @brief Positive nodes of the 30-point Gauss-Legendre rule on [-1, 1].
 */
static constexpr double xg[15] = {
  0.996893484074649540271630050918695,
  0.983668123279747209970032581605663,
  0.960021864968307512216871025581798,
  0.926200047429274325879324277080474,
  0.882560535792052681543116462530226,
  0.829565762382768397442898119732502,
  0.767777432104826194917977340974503,
  0.697850494793315796932292388026640,
  0.620526182989242861140477556431189,
  0.536624148142019899264169793311073,
  0.447033769538089176780609900322854,
  0.352704725530878113471037207089374,
  0.254636926167889846439805129817805,
  0.153869913608583546963794672743256,
  0.051471842555317695833025213166723
};

/**
 * @brief Gauss-Legendre weights corresponding to xg nodes (each node is used with both signs).
 */
static constexpr double wg[15] = {
  0.007968192496166605615465883474674,
  0.018466468311090959142302131912047,
  0.028784707883323369349719179611292,
  0.038799192569627049596801936446348,
  0.048402672830594052902938140422808,
  0.057493156217619066481721689402056,
  0.065974229882180495128128515115962,
  0.073755974737705206268243850022191,
  0.080755895229420215354694938460530,
  0.086899787201082979802387530715126,
  0.092122522237786128717632707087619,
  0.096368737174644259639468626351810,
  0.099593420586795267062780282103569,
  0.101762389748405504596428952168554,
  0.102852652893558840341285636705415
};

/* clang-format on */

/**
 * @brief Value of the k-th Lagrange basis polynomial of nodes at x.
 */
static double lagrange_basis(std::span<const double> nodes, int k, double x) {
    double ret = 1.0;
    for (int m = 0; m < static_cast<int>(nodes.size()); ++m) {
        if (m != k) {
            ret *= (x - nodes[m]) / (nodes[k] - nodes[m]);
        }
    }
    return ret;
}

std::vector<double> stencil_weights(std::span<const double> nodes, double a, double b) {
    if (nodes.empty() || nodes.size() > 30) {
        throw std::invalid_argument("Stencil must have between 1 and 30 nodes");
    }

    const double center = 0.5 * (a + b);
    const double half_length = 0.5 * (b - a);

    /* map nodes to [-1, 1] relative to the integration interval */
    std::vector<double> local(nodes.size());
    for (size_t k = 0; k < nodes.size(); ++k) {
        local[k] = (nodes[k] - center) / half_length;
    }

    std::vector<double> weights(nodes.size(), 0.0);
    for (int k = 0; k < static_cast<int>(local.size()); ++k) {
        double w = 0.0;
        for (int g = 0; g < 15; ++g) {
            w += wg[g] * (lagrange_basis(local, k, -xg[g]) + lagrange_basis(local, k, xg[g]));
        }
        weights[k] = w * half_length;
    }

    return weights;
}

int stencil_start(int interval, int degree, int n_points) {
    int start = interval - (degree - 1) / 2;
    start = std::min(start, n_points - 1 - degree);
    return std::max(start, 0);
}

QuadratureEstimate estimate(const std::vector<double> &times,
                            const sample_set::SampleSet &samples,
                            double y0,
                            int degree) {
    const int n = static_cast<int>(times.size());

    if (n < 2) {
        throw std::invalid_argument("Quadrature needs at least 2 grid points");
    }
    if (samples.rows() != n) {
        throw std::invalid_argument("Grid and samples have different lengths");
    }
    if (degree < 1) {
        throw std::invalid_argument("Quadrature degree must be positive");
    }

    const int dim = samples.cols();
    const int used_degree = std::min(degree, n - 1);

    QuadratureEstimate ret{
        .degree = used_degree,
        .integral = std::vector<double>(dim, y0),
        .intervals = sample_set::SampleSet(n - 1, dim),
        .cumulative = sample_set::SampleSet(n, dim),
    };

    for (int j = 0; j < dim; ++j) {
        ret.cumulative(0, j) = y0;
    }

    for (int i = 0; i < n - 1; ++i) {
        const int start = stencil_start(i, used_degree, n);
        const std::span<const double> nodes(times.data() + start, used_degree + 1);
        const std::vector<double> weights = stencil_weights(nodes, times[i], times[i + 1]);

        for (int j = 0; j < dim; ++j) {
            double value = 0.0;
            for (int k = 0; k <= used_degree; ++k) {
                value += weights[k] * samples(start + k, j);
            }
            ret.intervals(i, j) = value;
            ret.cumulative(i + 1, j) = ret.cumulative(i, j) + value;
        }
    }

    for (int j = 0; j < dim; ++j) {
        ret.integral[j] = ret.cumulative(n - 1, j);
    }

    return ret;
}

}; /* namespace quadrature */

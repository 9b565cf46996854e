// src/core/util.cpp
//
// Implementation of utility functions for the **CooperativeLocalizationEngine**
// core library.
//
// This file provides:
// • Standardized sample generation (anchors on the unit-square perimeter,
//   agents inside) for simulations and tests.
// • Position and distance error summaries for verifying estimates.
//
// Random numbers come from a local std::mt19937 seeded by the caller, so a
// sample is reproducible from its seed.
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Point at arc length \( t \in [0, 4) \) along the unit square's edge.
 */
Coordinates perimeterPoint(double t) {
    Coordinates p(2);
    if (t > 3.0) {
        p << 0.0, 4.0 - t;
    } else if (t > 2.0) {
        p << 3.0 - t, 1.0;
    } else if (t > 1.0) {
        p << 1.0, t - 1.0;
    } else {
        p << t, 0.0;
    }
    return p;
}

} // namespace

std::vector<GroundTruthPoint> generateStandardSample(int numAnchors, int numAgents,
                                                     double margin, unsigned int seed) {
    if (numAnchors < 0 || numAgents < 0) {
        throw std::invalid_argument("point counts must be non-negative");
    }
    if (!(margin >= 0.0 && margin < 0.5)) {
        throw std::invalid_argument("margin must lie in [0, 0.5)");
    }
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coord(margin, 1.0 - margin);

    std::vector<GroundTruthPoint> points;
    points.reserve(static_cast<std::size_t>(numAnchors + numAgents));
    for (int i = 0; i < numAnchors; ++i) {
        points.emplace_back(points.size(), PointType::Anchor,
                            perimeterPoint(4.0 * i / numAnchors));
    }
    for (int i = 0; i < numAgents; ++i) {
        Coordinates p(2);
        // Sequenced draws: x first, then y.
        const double x = coord(gen);
        const double y = coord(gen);
        p << x, y;
        points.emplace_back(points.size(), PointType::Agent, p);
    }
    return points;
}

/**
 * @brief Scores estimates against ground truth.
 *
 * Position errors cover agents only (anchors are exact by construction);
 * distance errors cover every ordered pair, anchors included. O(N^2).
 */
EvaluationSummary evaluateEstimates(const std::vector<GroundTruthPoint>& truth,
                                    const EstimateVector& estimates) {
    if (truth.size() != estimates.size()) {
        throw std::invalid_argument("estimate vector does not match the point count");
    }
    for (std::size_t i = 0; i < truth.size(); ++i) {
        if (estimates[i].size() != truth[i].dim()) {
            throw std::invalid_argument("estimate " + std::to_string(i) + " has wrong dimension");
        }
    }

    EvaluationSummary summary;
    double sum = 0.0;
    std::size_t agents = 0;
    for (std::size_t i = 0; i < truth.size(); ++i) {
        if (truth[i].isAnchor()) continue;
        const double err = (estimates[i] - truth[i].trueCoordinates()).norm();
        summary.maxPositionError = std::max(summary.maxPositionError, err);
        sum += err * err;
        ++agents;
    }
    if (agents > 0) summary.positionRmse = std::sqrt(sum / agents);

    sum = 0.0;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i < truth.size(); ++i) {
        for (std::size_t j = 0; j < truth.size(); ++j) {
            const double estimated = (estimates[i] - estimates[j]).norm();
            const double err = std::abs(estimated - truth[i].trueDistance(truth[j]));
            summary.maxDistanceError = std::max(summary.maxDistanceError, err);
            sum += err * err;
            ++pairs;
        }
    }
    if (pairs > 0) summary.distanceRmse = std::sqrt(sum / pairs);
    return summary;
}

// src/core/util.hpp
//
// Utility header for the **CooperativeLocalizationEngine** framework.
// Provides helper functions for sample generation and for scoring estimates
// against ground truth.
//
// Scoring reads agents' true coordinates and therefore belongs outside the
// strategies; it is used by the tests and the Python layer.
#ifndef UTIL_HPP
#define UTIL_HPP
#include <vector>
#include "Point.hpp"

/**
 * @brief Error summary of one estimate vector.
 */
struct EvaluationSummary {
    double maxPositionError = 0.0;  ///< Largest \( \|\hat{x}_i - x_i\| \) over agents.
    double positionRmse = 0.0;      ///< RMS of the same over agents.
    double maxDistanceError = 0.0;  ///< Largest \( |\|\hat{x}_i - \hat{x}_j\| - \|x_i - x_j\|| \) over all pairs.
    double distanceRmse = 0.0;      ///< RMS of the same over all ordered pairs.
};

/**
 * @brief Generates a standardized 2D sample in the unit square.
 *
 * @param numAnchors Anchors spread evenly along the square's perimeter,
 *        starting at (0, 0) and running counter-clockwise.
 * @param numAgents Agents drawn uniformly from \( [m, 1 - m]^2 \).
 * @param margin Border \( m \) kept free of agents, \( 0 \le m < 0.5 \).
 * @param seed Seed of the local Mersenne Twister.
 * @return std::vector<GroundTruthPoint> Anchors first, then agents.
 *
 * @throws std::invalid_argument for an invalid margin.
 */
std::vector<GroundTruthPoint> generateStandardSample(int numAnchors, int numAgents,
                                                     double margin, unsigned int seed);

/**
 * @brief Scores estimates against ground truth.
 *
 * @throws std::invalid_argument if sizes or dimensions differ.
 */
EvaluationSummary evaluateEstimates(const std::vector<GroundTruthPoint>& truth,
                                    const EstimateVector& estimates);

#endif // UTIL_HPP

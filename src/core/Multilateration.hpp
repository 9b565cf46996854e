// src/core/Multilateration.hpp
//
// Local position solve shared by every strategy of the
// **CooperativeLocalizationEngine**.
//
// A node with reference positions \( p_1, \dots, p_n \) and measured ranges
// \( d_1, \dots, d_n \) subtracts the first range equation from the others,
// which removes the quadratic term:
//
// \[
// 2\,(p_1 - p_k)^\top x = \|p_1\|^2 - \|p_k\|^2 - d_1^2 + d_k^2,
// \quad k = 2, \dots, n
// \]
//
// Coordinates are centred on the references' centroid \( c \) before the
// linear system is formed, and the minimum-norm least-squares solution is
// taken with a rank-revealing complete orthogonal decomposition. When the
// system is under-determined the result is therefore the solution closest to
// \( c \) rather than an arbitrary one.
#ifndef MULTILATERATION_HPP
#define MULTILATERATION_HPP
#include <vector>
#include "Point.hpp"

/**
 * @brief Quality of a local position solve.
 */
enum class EstimateStatus {
    Ok,              ///< At least dim + 1 references and a full-rank system.
    UnderDetermined, ///< Fewer than dim + 1 references.
    Singular         ///< Enough references, but collinear or nearly so (see kConditionThreshold).
};

/**
 * @brief A reference position with its measured range.
 *
 * References are anchors (known coordinates) or, in cooperative strategies,
 * neighbouring agents at their current estimate.
 */
struct ReferenceRange {
    Coordinates position;
    double distance;
};

/**
 * @brief Result of `multilaterate`.
 */
struct MultilaterationResult {
    Coordinates position; ///< Empty when no reference was given.
    EstimateStatus status;
    int rank;             ///< Numerical rank of the linearized system at kConditionThreshold.
};

/**
 * Smallest accepted ratio between the smallest and the largest pivot of the
 * linearized system. Pivots below it count as zero, so nearly collinear
 * references give a rank below `dim` and a `Singular` status, and the returned
 * position is the truncated minimum-norm solution.
 */
constexpr double kConditionThreshold = 1e-6;

/**
 * @brief Solves the linearized range equations of one node.
 *
 * @param references Reference positions and ranges (all of dimension `dim`).
 * @param dim Dimension of the problem.
 * @return MultilaterationResult Position, status and rank.
 *
 * Zero references yield an empty position. One reference yields that
 * reference's position. The status is decided by reference count first,
 * conditioning second.
 */
MultilaterationResult multilaterate(const std::vector<ReferenceRange>& references, int dim);

/**
 * @brief Arithmetic mean of a set of positions.
 *
 * @return Coordinates Zero vector of dimension `dim` for an empty set.
 */
Coordinates centroid(const std::vector<Coordinates>& positions, int dim);

#endif // MULTILATERATION_HPP

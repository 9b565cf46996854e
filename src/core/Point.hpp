// src/core/Point.hpp
//
// Header defining the node types of the **CooperativeLocalizationEngine**.
// Every node of a localization problem is either an **anchor** (its position
// is known) or an **agent** (its position must be estimated from ranges):
//
// \[
// \hat{x}_i \approx x_i, \quad \|x_i - x_j\| \approx d_{ij}
// \]
//
// Two views of a node exist:
//   • `GroundTruthPoint`: identity, type and true coordinates. Only the
//     measurement builder and scoring utilities consume it.
//   • `VisiblePoint`: the restricted view handed to estimation strategies.
//     It carries coordinates for anchors only; for agents there is nothing
//     to read.
#ifndef POINT_HPP
#define POINT_HPP
#include <cstddef>
#include <vector>
#include <Eigen/Dense>

/// Coordinates of one node, \( x_i \in \mathbb{R}^{dim} \).
using Coordinates = Eigen::VectorXd;

/// One coordinate vector per input point, in input order.
using EstimateVector = std::vector<Coordinates>;

/**
 * @brief Role of a node in the network.
 */
enum class PointType {
    Anchor, ///< Known position (record tag `S`).
    Agent   ///< Unknown position (record tag `A`).
};

class VisiblePoint;

/**
 * @class GroundTruthPoint
 * @brief Immutable record of a node with its true coordinates.
 *
 * Ids are positions in the input sequence and define the output order of
 * every estimate vector.
 */
class GroundTruthPoint {
public:
    /**
     * @brief Constructs a node.
     *
     * @param id Index of the node in its input sequence.
     * @param type Anchor or agent.
     * @param coords True coordinates (dimension taken from its size).
     */
    GroundTruthPoint(std::size_t id, PointType type, Coordinates coords);

    std::size_t id() const { return id_; }
    PointType type() const { return type_; }
    bool isAnchor() const { return type_ == PointType::Anchor; }
    int dim() const { return static_cast<int>(coords_.size()); }

    /**
     * @brief True coordinates, for anchors and agents alike.
     *
     * Never passed to estimation strategies; see `visible()`.
     */
    const Coordinates& trueCoordinates() const { return coords_; }

    /**
     * @brief Euclidean distance between the true positions of two nodes.
     */
    double trueDistance(const GroundTruthPoint& other) const;

    /**
     * @brief Returns the restricted view of this node.
     *
     * Agents are stripped of their coordinates.
     */
    VisiblePoint visible() const;

private:
    std::size_t id_;
    PointType type_;
    Coordinates coords_;
};

/**
 * @class VisiblePoint
 * @brief What an estimation strategy may know about a node.
 */
class VisiblePoint {
public:
    static VisiblePoint anchor(std::size_t id, Coordinates coords);
    static VisiblePoint agent(std::size_t id, int dim);

    std::size_t id() const { return id_; }
    PointType type() const { return type_; }
    bool isAnchor() const { return type_ == PointType::Anchor; }
    int dim() const { return dim_; }

    /**
     * @brief Known coordinates of an anchor.
     *
     * @throws std::logic_error when called on an agent.
     */
    const Coordinates& coordinates() const;

private:
    VisiblePoint(std::size_t id, PointType type, int dim, Coordinates coords);

    std::size_t id_;
    PointType type_;
    int dim_;
    Coordinates coords_; ///< Empty for agents.
};

/**
 * @brief Restricted views of a whole input sequence, order preserved.
 */
std::vector<VisiblePoint> makeVisible(const std::vector<GroundTruthPoint>& points);

/**
 * @brief Checks that a point sequence describes one consistent problem.
 *
 * Non-empty, one shared positive dimension, finite coordinates and
 * `points[i].id() == i`.
 *
 * @throws MalformedInputError otherwise.
 */
void validatePoints(const std::vector<GroundTruthPoint>& points);

#endif // POINT_HPP

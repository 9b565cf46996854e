// src/core/Network.hpp
//
// Measurement model of the **CooperativeLocalizationEngine**.
//
// Given ground-truth nodes, a visibility radius \( r \) and a noise level
// \( \sigma \), the builder produces the fixed measurement graph of one run:
//
// \[
// (i, j) \in E \iff \|x_i - x_j\| \le r, \qquad
// \tilde{d}_{ij} = \max\left(\|x_i - x_j\| + \varepsilon_{ij},\ d_{min}\right),
// \quad \varepsilon_{ij} \sim \mathcal{N}(0, \sigma^2)
// \]
//
// Pairs beyond the visibility radius have no edge at all. Each unordered pair
// is sampled once, so \( \tilde{d}_{ij} = \tilde{d}_{ji} \). All randomness
// comes from an explicitly passed `NoiseSource`.
#ifndef NETWORK_HPP
#define NETWORK_HPP
#include <cstddef>
#include <optional>
#include <random>
#include <vector>
#include "Point.hpp"

/// Floor applied to noisy range samples.
constexpr double kMinMeasuredDistance = 1e-9;

/**
 * @brief Seedable source of Gaussian range noise.
 *
 * Two sources built from the same seed produce the same sample sequence.
 */
class NoiseSource {
public:
    explicit NoiseSource(unsigned int seed);

    /**
     * @brief Draws one sample of \( \mathcal{N}(0, \sigma^2) \).
     *
     * Returns exactly 0 without consuming randomness when \( \sigma = 0 \).
     */
    double gaussian(double sigma);

    unsigned int seed() const { return seed_; }

private:
    unsigned int seed_;
    std::mt19937 gen_;
};

/**
 * @brief One measured range, seen from one endpoint.
 */
struct RangeMeasurement {
    std::size_t neighbor; ///< Id of the other endpoint.
    double distance;      ///< Noisy range \( \tilde{d}_{ij} \).
};

/**
 * @class MeasurementGraph
 * @brief Undirected graph of measured ranges between nodes.
 *
 * Adjacency lists are sorted by neighbour id. The graph also remembers each
 * node's type so that connectivity to anchors can be queried without access
 * to any coordinates.
 */
class MeasurementGraph {
public:
    MeasurementGraph(int dim, std::vector<PointType> types);

    std::size_t size() const { return types_.size(); }
    int dim() const { return dim_; }
    PointType type(std::size_t i) const { return types_.at(i); }
    std::size_t edgeCount() const { return edgeCount_; }

    /**
     * @brief Measured ranges of node `i`, sorted by neighbour id.
     */
    const std::vector<RangeMeasurement>& neighbors(std::size_t i) const { return adjacency_.at(i); }

    bool hasEdge(std::size_t i, std::size_t j) const { return distance(i, j).has_value(); }

    /**
     * @brief Measured range between `i` and `j`, empty if they cannot see each other.
     */
    std::optional<double> distance(std::size_t i, std::size_t j) const;

    /**
     * @brief Number of anchors node `i` has a measured range to.
     */
    std::size_t anchorDegree(std::size_t i) const;

    /**
     * @brief True when every node can be reached from every other node.
     */
    bool isConnected() const;

    /**
     * @brief True when node `i` is an anchor or is connected to one.
     *
     * An agent for which this is false cannot be placed in the anchors'
     * frame by any consistent algorithm.
     */
    bool reachesAnchor(std::size_t i) const;

    /**
     * @brief Ids of all agents for which `reachesAnchor` is false.
     */
    std::vector<std::size_t> unlocalizableAgents() const;

    /**
     * @brief Adds the undirected edge (i, j), in any order of insertion.
     *
     * @throws std::out_of_range for a self edge or an unknown node.
     * @throws std::invalid_argument if the edge already exists.
     */
    void addEdge(std::size_t i, std::size_t j, double distance);

private:
    /// Component label of every node (labels are the smallest id in the component).
    std::vector<std::size_t> components() const;

    int dim_;
    std::vector<PointType> types_;
    std::vector<std::vector<RangeMeasurement>> adjacency_;
    std::size_t edgeCount_ = 0;
};

/**
 * @brief Builds the measurement graph of one run.
 *
 * @param points Ground-truth nodes (validated, not modified).
 * @param sigma Standard deviation of additive range noise, \( \sigma \ge 0 \).
 * @param visibility Largest measurable true distance, or `kUnlimitedVisibility`.
 * @param noise Random source; pairs are sampled in order (0,1), (0,2), ..., (1,2), ...
 * @return MeasurementGraph Graph with one edge per visible pair.
 *
 * @throws MalformedInputError for an inconsistent point sequence.
 * @throws std::invalid_argument for a negative sigma or non-positive visibility.
 */
MeasurementGraph buildMeasurementGraph(const std::vector<GroundTruthPoint>& points,
                                       double sigma, double visibility,
                                       NoiseSource& noise);

#endif // NETWORK_HPP

// src/core/Network.cpp
//
// Implementation of the measurement model: noise source, measurement graph
// and its connectivity queries, and the graph builder.
#include "Network.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

NoiseSource::NoiseSource(unsigned int seed) : seed_(seed), gen_(seed) {}

double NoiseSource::gaussian(double sigma) {
    if (sigma == 0.0) return 0.0; // normal_distribution requires a positive stddev
    std::normal_distribution<double> dist(0.0, sigma);
    return dist(gen_);
}

MeasurementGraph::MeasurementGraph(int dim, std::vector<PointType> types)
    : dim_(dim), types_(std::move(types)), adjacency_(types_.size()) {}

namespace {

/**
 * @brief Inserts `m` into an adjacency list kept sorted by neighbour id.
 *
 * @return bool False if the list already holds that neighbour.
 */
bool insertSorted(std::vector<RangeMeasurement>& edges, const RangeMeasurement& m) {
    auto it = std::lower_bound(edges.begin(), edges.end(), m.neighbor,
                               [](const RangeMeasurement& e, std::size_t id) {
                                   return e.neighbor < id;
                               });
    if (it != edges.end() && it->neighbor == m.neighbor) return false;
    edges.insert(it, m);
    return true;
}

} // namespace

void MeasurementGraph::addEdge(std::size_t i, std::size_t j, double distance) {
    if (i == j || i >= size() || j >= size()) {
        throw std::out_of_range("invalid edge (" + std::to_string(i) + ", " +
                                std::to_string(j) + ")");
    }
    if (!insertSorted(adjacency_[i], {j, distance})) {
        throw std::invalid_argument("edge (" + std::to_string(i) + ", " +
                                    std::to_string(j) + ") already exists");
    }
    insertSorted(adjacency_[j], {i, distance});
    ++edgeCount_;
}

std::optional<double> MeasurementGraph::distance(std::size_t i, std::size_t j) const {
    const auto& edges = adjacency_.at(i);
    auto it = std::lower_bound(edges.begin(), edges.end(), j,
                               [](const RangeMeasurement& m, std::size_t id) {
                                   return m.neighbor < id;
                               });
    if (it == edges.end() || it->neighbor != j) {
        return std::nullopt;
    }
    return it->distance;
}

std::size_t MeasurementGraph::anchorDegree(std::size_t i) const {
    std::size_t count = 0;
    for (const auto& m : adjacency_.at(i)) {
        if (types_[m.neighbor] == PointType::Anchor) ++count;
    }
    return count;
}

/**
 * @brief Labels connected components with an iterative depth-first search.
 *
 * Nodes are visited in id order, so a label is the smallest id of its
 * component.
 */
std::vector<std::size_t> MeasurementGraph::components() const {
    const std::size_t N = size();
    std::vector<std::size_t> label(N, N);
    std::vector<std::size_t> stack;
    for (std::size_t root = 0; root < N; ++root) {
        if (label[root] != N) continue;
        label[root] = root;
        stack.push_back(root);
        while (!stack.empty()) {
            const std::size_t u = stack.back();
            stack.pop_back();
            for (const auto& m : adjacency_[u]) {
                if (label[m.neighbor] == N) {
                    label[m.neighbor] = root;
                    stack.push_back(m.neighbor);
                }
            }
        }
    }
    return label;
}

bool MeasurementGraph::isConnected() const {
    const auto label = components();
    return std::all_of(label.begin(), label.end(),
                       [](std::size_t l) { return l == 0; });
}

bool MeasurementGraph::reachesAnchor(std::size_t i) const {
    if (types_.at(i) == PointType::Anchor) return true;
    const auto label = components();
    for (std::size_t k = 0; k < size(); ++k) {
        if (types_[k] == PointType::Anchor && label[k] == label[i]) return true;
    }
    return false;
}

std::vector<std::size_t> MeasurementGraph::unlocalizableAgents() const {
    const auto label = components();
    std::vector<bool> anchored(size(), false);
    for (std::size_t k = 0; k < size(); ++k) {
        if (types_[k] == PointType::Anchor) anchored[label[k]] = true;
    }
    std::vector<std::size_t> result;
    for (std::size_t k = 0; k < size(); ++k) {
        if (types_[k] == PointType::Agent && !anchored[label[k]]) result.push_back(k);
    }
    return result;
}

/**
 * @brief Builds the fixed measurement graph of one run.
 *
 * O(N^2) pair loop. Noise is drawn only for visible pairs, in lexicographic
 * pair order, so the graph is a pure function of (points, sigma, visibility,
 * seed).
 */
MeasurementGraph buildMeasurementGraph(const std::vector<GroundTruthPoint>& points,
                                       double sigma, double visibility,
                                       NoiseSource& noise) {
    validatePoints(points);
    if (!(sigma >= 0.0) || std::isinf(sigma)) {
        throw std::invalid_argument("sigma must be finite and non-negative");
    }
    if (!(visibility > 0.0)) {
        throw std::invalid_argument("visibility must be positive");
    }

    std::vector<PointType> types;
    types.reserve(points.size());
    for (const auto& p : points) types.push_back(p.type());
    MeasurementGraph graph(points.front().dim(), std::move(types));

    const std::size_t N = points.size();
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            const double d = points[i].trueDistance(points[j]);
            if (d > visibility) continue;
            const double sample = d + noise.gaussian(sigma);
            graph.addEdge(i, j, std::max(sample, kMinMeasuredDistance));
        }
    }
    return graph;
}

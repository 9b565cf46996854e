// src/core/Engine.cpp
//
// Implements the **LocalizationEngine** facade and the reference strategies of
// the **CooperativeLocalizationEngine**.
//
// This file provides:
// • The shared snapshot machinery (`SnapshotStream::next`,
//   `IterativeStrategy::solve`) and per-node diagnostics.
// • One **non-cooperative** strategy: anchor-only least squares.
// • Five **cooperative** strategies: least squares with pseudo-anchors
//   (sequential and OpenMP), stress gradient descent, multidimensional
//   scaling and convex relaxation.
//
// Every refinement step is synchronous: the next snapshot is computed from a
// frozen copy of the previous one, so no agent observes a value updated in
// the same iteration and the visiting order cannot bias the result.
#include "Engine.hpp"
#include "Errors.hpp"
#include <Eigen/QR>
#include <Eigen/SVD>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

/* ============================== DIAGNOSTICS ============================== */

void SolveDiagnostics::reset(std::size_t nodes) {
    statuses_.assign(nodes, EstimateStatus::Ok);
    singularRecoveries_ = 0;
    iterations = 0;
    timeTaken = 0.0;
}

void SolveDiagnostics::record(std::size_t node, EstimateStatus status) {
    statuses_.at(node) = status;
    if (status == EstimateStatus::Singular) ++singularRecoveries_;
}

std::vector<std::size_t> SolveDiagnostics::underDetermined() const {
    std::vector<std::size_t> ids;
    for (std::size_t i = 0; i < statuses_.size(); ++i) {
        if (statuses_[i] == EstimateStatus::UnderDetermined) ids.push_back(i);
    }
    return ids;
}

std::vector<std::size_t> SolveDiagnostics::singular() const {
    std::vector<std::size_t> ids;
    for (std::size_t i = 0; i < statuses_.size(); ++i) {
        if (statuses_[i] == EstimateStatus::Singular) ids.push_back(i);
    }
    return ids;
}

void printDiagnostics(std::ostream& os, const SolveDiagnostics& diagnostics) {
    for (auto id : diagnostics.underDetermined()) {
        os << "Point " << id << " has too few references. Cannot determine position." << std::endl;
    }
    for (auto id : diagnostics.singular()) {
        os << "Point " << id << " has a singular local system. Kept previous estimate." << std::endl;
    }
}

/* ============================ SNAPSHOT STREAM ============================ */

bool SnapshotStream::next(EstimateVector& snapshot) {
    if (exhausted()) return false;
    const bool keepGoing = advance();
    ++produced_;
    diagnostics_.iterations = produced_;
    if (!keepGoing) finished_ = true;
    snapshot = current_;
    return true;
}

EstimateVector IterativeStrategy::solve(const std::vector<VisiblePoint>& points,
                                        const MeasurementGraph& graph,
                                        const RunConfig& config,
                                        SolveDiagnostics& diagnostics) const {
    auto stream = animate(points, graph, config);
    EstimateVector snapshot;
    while (stream->next(snapshot)) {
    }
    diagnostics = stream->diagnostics();
    return stream->current();
}

/* ================================ HELPERS ================================ */

namespace {

/**
 * @brief Rejects a point view that does not match the measurement graph.
 */
void checkInputs(const std::vector<VisiblePoint>& points, const MeasurementGraph& graph) {
    if (points.size() != graph.size()) {
        throw MalformedInputError("graph has " + std::to_string(graph.size()) +
                                  " nodes but " + std::to_string(points.size()) +
                                  " points were given");
    }
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (points[i].id() != i || points[i].dim() != graph.dim() ||
            points[i].type() != graph.type(i)) {
            throw MalformedInputError("point " + std::to_string(i) +
                                      " does not match the measurement graph");
        }
    }
}

/**
 * @brief Anchor-only solve of one agent, with the documented fallback.
 *
 * An agent that measures no anchor is placed at the origin.
 */
MultilaterationResult solveAgainstAnchors(const std::vector<VisiblePoint>& points,
                                          const MeasurementGraph& graph,
                                          std::size_t i) {
    std::vector<ReferenceRange> refs;
    for (const auto& m : graph.neighbors(i)) {
        const auto& other = points[m.neighbor];
        if (other.isAnchor()) refs.push_back({other.coordinates(), m.distance});
    }
    MultilaterationResult result = multilaterate(refs, graph.dim());
    if (result.position.size() == 0) {
        result.position = Coordinates::Zero(graph.dim());
    }
    return result;
}

} // namespace

EstimateVector cooperativeInitialEstimates(const std::vector<VisiblePoint>& points,
                                           const MeasurementGraph& graph,
                                           SolveDiagnostics& diagnostics) {
    const std::size_t N = points.size();
    const int dim = graph.dim();
    EstimateVector estimates(N, Coordinates::Zero(dim));
    std::vector<bool> placed(N, false);

    for (std::size_t i = 0; i < N; ++i) {
        if (points[i].isAnchor()) {
            estimates[i] = points[i].coordinates();
            placed[i] = true;
        } else if (graph.anchorDegree(i) > 0) {
            MultilaterationResult result = solveAgainstAnchors(points, graph, i);
            diagnostics.record(i, result.status);
            estimates[i] = std::move(result.position);
            placed[i] = true;
        } else {
            diagnostics.record(i, EstimateStatus::UnderDetermined);
        }
    }

    bool changed = true;
    while (changed) {
        changed = false;
        for (std::size_t i = 0; i < N; ++i) {
            if (placed[i]) continue;
            std::vector<Coordinates> around;
            for (const auto& m : graph.neighbors(i)) {
                if (placed[m.neighbor]) around.push_back(estimates[m.neighbor]);
            }
            if (around.empty()) continue;
            estimates[i] = centroid(around, dim);
            placed[i] = true;
            changed = true;
        }
    }
    return estimates;
}

/* ========================= NON-COOPERATIVE STRATEGY ========================= */

/**
 * @brief Anchor-only least squares.
 *
 * @param points Restricted node views.
 * @param graph Measurement graph.
 * @param config Not used.
 * @param diagnostics Per-agent status; iterations set to 1.
 * @return EstimateVector Anchors pinned, agents at their local LS solution.
 *
 * O(N * degree * dim^2). Agents are independent of each other.
 */
EstimateVector AnchorLeastSquaresStrategy::solve(const std::vector<VisiblePoint>& points,
                                                 const MeasurementGraph& graph,
                                                 const RunConfig& config,
                                                 SolveDiagnostics& diagnostics) const {
    (void)config;
    checkInputs(points, graph);
    const std::size_t N = points.size();
    diagnostics.reset(N);
    diagnostics.iterations = 1;

    EstimateVector estimates;
    estimates.reserve(N);
    for (std::size_t i = 0; i < N; ++i) {
        if (points[i].isAnchor()) {
            estimates.push_back(points[i].coordinates());
            continue;
        }
        MultilaterationResult result = solveAgainstAnchors(points, graph, i);
        diagnostics.record(i, result.status);
        estimates.push_back(std::move(result.position));
    }
    return estimates;
}

/* ========================= COOPERATIVE STRATEGIES ========================= */

namespace {

/**
 * @brief Snapshot stream of cooperative least squares.
 *
 * One step: every agent gathers its measured anchors (true coordinates) and
 * agent neighbours (estimates of the previous snapshot) and re-solves its
 * range equations. Only Ok solutions replace the previous estimate.
 */
class CooperativeLeastSquaresStream : public SnapshotStream {
public:
    CooperativeLeastSquaresStream(const std::vector<VisiblePoint>& points,
                                  const MeasurementGraph& graph,
                                  const RunConfig& config,
                                  bool parallel)
        : SnapshotStream(config.iterations),
          points_(points),
          graph_(graph),
          parallel_(parallel) {
        diagnostics_.reset(points_.size());
        current_ = cooperativeInitialEstimates(points_, graph_, diagnostics_);
    }

protected:
    bool advance() override {
        const std::size_t N = points_.size();
        const EstimateVector previous = current_;
        EstimateVector next = previous;
        std::vector<EstimateStatus> statuses(N, EstimateStatus::Ok);

        if (parallel_) {
#pragma omp parallel for schedule(static)
            for (std::size_t i = 0; i < N; ++i) {
                update(i, previous, next, statuses);
            }
        } else {
            for (std::size_t i = 0; i < N; ++i) {
                update(i, previous, next, statuses);
            }
        }

        for (std::size_t i = 0; i < N; ++i) diagnostics_.record(i, statuses[i]);
        current_ = std::move(next);
        return true;
    }

private:
    /**
     * @brief Writes agent `i`'s next estimate and status; reads only `previous`.
     */
    void update(std::size_t i, const EstimateVector& previous, EstimateVector& next,
                std::vector<EstimateStatus>& statuses) const {
        if (points_[i].isAnchor()) return;
        std::vector<ReferenceRange> refs;
        refs.reserve(graph_.neighbors(i).size());
        for (const auto& m : graph_.neighbors(i)) {
            const auto& other = points_[m.neighbor];
            refs.push_back({other.isAnchor() ? other.coordinates() : previous[m.neighbor],
                            m.distance});
        }
        MultilaterationResult result = multilaterate(refs, graph_.dim());
        if (result.status == EstimateStatus::Ok) {
            next[i] = std::move(result.position);
        }
        statuses[i] = result.status;
    }

    std::vector<VisiblePoint> points_;
    MeasurementGraph graph_;
    bool parallel_;
};

/**
 * @brief Snapshot stream of cooperative stress gradient descent.
 *
 * Gradient of one agent:
 * \( \nabla_i S = -2 \sum_{j \in N(i)} (\tilde{d}_{ij} - \|x_i - x_j\|)
 *    \frac{x_i - x_j}{\|x_i - x_j\|} \),
 * skipping neighbours at the same estimate.
 */
class CooperativeGradientStream : public SnapshotStream {
public:
    CooperativeGradientStream(const std::vector<VisiblePoint>& points,
                              const MeasurementGraph& graph,
                              const RunConfig& config)
        : SnapshotStream(config.iterations),
          points_(points),
          graph_(graph),
          eta0_(config.stepSize),
          tolerance_(config.tolerance) {
        diagnostics_.reset(points_.size());
        current_ = cooperativeInitialEstimates(points_, graph_, diagnostics_);
        for (std::size_t i = 0; i < graph_.size(); ++i) {
            maxDegree_ = std::max(maxDegree_, graph_.neighbors(i).size());
        }
        maxDegree_ = std::max<std::size_t>(maxDegree_, 1);
    }

protected:
    bool advance() override {
        const std::size_t N = points_.size();
        const int dim = graph_.dim();
        const EstimateVector& x = current_;
        EstimateVector next = x;
        const double eta = eta0_ / (static_cast<double>(step_ + 1) * static_cast<double>(maxDegree_));
        double largestStep = 0.0;

        for (std::size_t i = 0; i < N; ++i) {
            if (points_[i].isAnchor()) continue;
            const auto& edges = graph_.neighbors(i);
            Coordinates grad = Coordinates::Zero(dim);
            for (const auto& m : edges) {
                const Coordinates diff = x[i] - x[m.neighbor];
                const double n = diff.norm();
                if (n > 0.0) grad -= 2.0 * (m.distance - n) * diff / n;
            }
            const Coordinates stepVec = eta * grad;
            next[i] = x[i] - stepVec;
            largestStep = std::max(largestStep, stepVec.norm());
            diagnostics_.record(i, edges.size() < static_cast<std::size_t>(dim + 1)
                                       ? EstimateStatus::UnderDetermined
                                       : EstimateStatus::Ok);
        }

        ++step_;
        current_ = std::move(next);
        return !(tolerance_ > 0.0 && largestStep < tolerance_);
    }

private:
    std::vector<VisiblePoint> points_;
    MeasurementGraph graph_;
    double eta0_;
    double tolerance_;
    std::size_t maxDegree_ = 1;
    int step_ = 0;
};

/**
 * @brief Snapshot stream of SMACOF multidimensional scaling.
 *
 * The free layout \( X \) (one row per node) starts at the cooperative
 * initial condition. With unit weights on the pair set \( P \),
 *
 * \[
 * V = \sum_{(i,j) \in P} (e_i - e_j)(e_i - e_j)^\top, \qquad
 * B(X)_{ij} = -\frac{\tilde{d}_{ij}}{\|x_i - x_j\|} \ (i \ne j), \qquad
 * B(X)_{ii} = -\sum_{j \ne i} B(X)_{ij}
 * \]
 *
 * and each step sets \( X \leftarrow V^{+} B(X) X \). \( V^{+} \) is computed
 * once, in O(N^3).
 */
class MultidimensionalScalingStream : public SnapshotStream {
public:
    MultidimensionalScalingStream(const std::vector<VisiblePoint>& points,
                                  const MeasurementGraph& graph,
                                  const RunConfig& config)
        : SnapshotStream(config.iterations),
          points_(points) {
        const std::size_t N = points_.size();
        const int dim = graph.dim();
        diagnostics_.reset(N);
        initial_ = cooperativeInitialEstimates(points_, graph, diagnostics_);
        current_ = initial_;

        for (std::size_t i = 0; i < N; ++i) {
            if (points_[i].isAnchor()) anchors_.push_back(i);
            for (const auto& m : graph.neighbors(i)) {
                if (m.neighbor > i) pairs_.push_back({i, m.neighbor, m.distance});
            }
        }
        // Anchor-to-anchor distances are known exactly and make the anchor frame rigid.
        for (std::size_t a = 0; a < anchors_.size(); ++a) {
            for (std::size_t b = a + 1; b < anchors_.size(); ++b) {
                const std::size_t i = anchors_[a];
                const std::size_t j = anchors_[b];
                if (graph.hasEdge(i, j)) continue;
                pairs_.push_back({i, j, (points_[i].coordinates() - points_[j].coordinates()).norm()});
            }
        }

        const auto n = static_cast<Eigen::Index>(N);
        Eigen::MatrixXd V = Eigen::MatrixXd::Zero(n, n);
        for (const auto& p : pairs_) {
            const auto i = static_cast<Eigen::Index>(p.i);
            const auto j = static_cast<Eigen::Index>(p.j);
            V(i, i) += 1.0;
            V(j, j) += 1.0;
            V(i, j) -= 1.0;
            V(j, i) -= 1.0;
        }
        Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(n, n);
        cod.setThreshold(kLaplacianThreshold);
        cod.compute(V);
        vPlus_ = cod.pseudoInverse();

        layout_.resize(n, dim);
        for (std::size_t i = 0; i < N; ++i) {
            layout_.row(static_cast<Eigen::Index>(i)) = initial_[i].transpose();
        }

        // Only a component holding an anchor can be placed in the anchors' frame.
        const bool frameFixed = anchors_.size() >= static_cast<std::size_t>(dim + 1);
        placeable_.assign(N, true);
        for (auto id : graph.unlocalizableAgents()) placeable_[id] = false;
        for (std::size_t i = 0; i < N; ++i) {
            if (points_[i].isAnchor()) continue;
            statuses_.push_back(placeable_[i] && frameFixed ? EstimateStatus::Ok
                                                            : EstimateStatus::UnderDetermined);
            agents_.push_back(i);
        }
    }

protected:
    bool advance() override {
        const auto n = layout_.rows();
        Eigen::MatrixXd B = Eigen::MatrixXd::Zero(n, n);
        for (const auto& p : pairs_) {
            const auto i = static_cast<Eigen::Index>(p.i);
            const auto j = static_cast<Eigen::Index>(p.j);
            const double dist = (layout_.row(i) - layout_.row(j)).norm();
            if (dist <= 0.0) continue;
            const double v = p.distance / dist;
            B(i, j) -= v;
            B(j, i) -= v;
            B(i, i) += v;
            B(j, j) += v;
        }
        layout_ = vPlus_ * (B * layout_);

        EstimateVector next = alignToAnchors();
        for (auto i : anchors_) next[i] = points_[i].coordinates();
        for (std::size_t k = 0; k < agents_.size(); ++k) {
            const std::size_t i = agents_[k];
            if (!placeable_[i]) next[i] = initial_[i];
            diagnostics_.record(i, statuses_[k]);
        }
        current_ = std::move(next);
        return true;
    }

private:
    struct Pair {
        std::size_t i;
        std::size_t j;
        double distance;
    };

    /// Relative pivot threshold for the pseudo-inverse of the layout Laplacian.
    static constexpr double kLaplacianThreshold = 1e-10;

    /**
     * @brief Maps the layout onto the anchors with an orthogonal Procrustes fit.
     *
     * With anchor rows \( x_a \), true anchors \( w_a \) and their centroids
     * \( \bar{x}, \bar{w} \): \( H = \sum_a (x_a - \bar{x})(w_a - \bar{w})^\top
     * = U S V^\top \), \( R = V U^\top \), and every node maps to
     * \( R (x - \bar{x}) + \bar{w} \). Reflections are allowed since a layout
     * is only defined up to one.
     */
    EstimateVector alignToAnchors() const {
        const auto n = layout_.rows();
        const auto dim = layout_.cols();
        EstimateVector out;
        out.reserve(static_cast<std::size_t>(n));
        if (anchors_.empty()) {
            for (Eigen::Index i = 0; i < n; ++i) out.emplace_back(layout_.row(i).transpose());
            return out;
        }

        Coordinates xBar = Coordinates::Zero(dim);
        Coordinates wBar = Coordinates::Zero(dim);
        for (auto a : anchors_) {
            xBar += layout_.row(static_cast<Eigen::Index>(a)).transpose();
            wBar += points_[a].coordinates();
        }
        xBar /= static_cast<double>(anchors_.size());
        wBar /= static_cast<double>(anchors_.size());

        Eigen::MatrixXd H = Eigen::MatrixXd::Zero(dim, dim);
        for (auto a : anchors_) {
            const Coordinates x = layout_.row(static_cast<Eigen::Index>(a)).transpose() - xBar;
            H += x * (points_[a].coordinates() - wBar).transpose();
        }
        Eigen::JacobiSVD<Eigen::MatrixXd> svd(H, Eigen::ComputeFullU | Eigen::ComputeFullV);
        const Eigen::MatrixXd R = svd.matrixV() * svd.matrixU().transpose();

        for (Eigen::Index i = 0; i < n; ++i) {
            const Coordinates x = layout_.row(i).transpose();
            out.emplace_back(R * (x - xBar) + wBar);
        }
        return out;
    }

    std::vector<VisiblePoint> points_;
    std::vector<Pair> pairs_;
    std::vector<std::size_t> anchors_;
    std::vector<std::size_t> agents_;
    std::vector<EstimateStatus> statuses_; ///< Parallel to agents_.
    std::vector<bool> placeable_;
    EstimateVector initial_;
    Eigen::MatrixXd vPlus_;
    Eigen::MatrixXd layout_;
};

/**
 * @brief Snapshot stream of the convex relaxation.
 *
 * Gradients at the momentum point \( w \), with \( P_r(v) \) the projection of
 * \( v \) onto the ball of radius \( r \) around the origin:
 *
 * \[
 * \nabla_i g = \sum_{j \in N(i)} \left( w_i - w_j - P_{\tilde{d}_{ij}}(w_i - w_j) \right),
 * \qquad
 * \nabla_i h = \sum_{k \in A(i)} \left( w_i - a_k - P_{\tilde{d}_{ik}}(w_i - a_k) \right)
 * \]
 */
class ConvexRelaxationStream : public SnapshotStream {
public:
    ConvexRelaxationStream(const std::vector<VisiblePoint>& points,
                           const MeasurementGraph& graph,
                           const RunConfig& config)
        : SnapshotStream(config.iterations),
          points_(points),
          graph_(graph) {
        diagnostics_.reset(points_.size());
        current_ = cooperativeInitialEstimates(points_, graph_, diagnostics_);
        previous_ = current_;
        std::size_t maxDegree = 0;
        std::size_t maxAnchorDegree = 0;
        for (std::size_t i = 0; i < graph_.size(); ++i) {
            maxDegree = std::max(maxDegree, graph_.neighbors(i).size());
            maxAnchorDegree = std::max(maxAnchorDegree, graph_.anchorDegree(i));
        }
        lipschitz_ = std::max(1.0, 2.0 * static_cast<double>(maxDegree) +
                                       static_cast<double>(maxAnchorDegree));
    }

protected:
    bool advance() override {
        const std::size_t N = points_.size();
        const int dim = graph_.dim();
        ++step_;
        const double beta = (step_ - 2.0) / (step_ + 1.0);

        EstimateVector w = current_;
        for (std::size_t i = 0; i < N; ++i) {
            if (!points_[i].isAnchor()) w[i] += beta * (current_[i] - previous_[i]);
        }

        EstimateVector next = current_;
        for (std::size_t i = 0; i < N; ++i) {
            if (points_[i].isAnchor()) continue;
            const auto& edges = graph_.neighbors(i);
            Coordinates grad = Coordinates::Zero(dim);
            for (const auto& m : edges) {
                grad += w[i] - w[m.neighbor] - project(w[i] - w[m.neighbor], m.distance);
                if (points_[m.neighbor].isAnchor()) {
                    const Coordinates& a = points_[m.neighbor].coordinates();
                    grad += w[i] - a - project(w[i] - a, m.distance);
                }
            }
            next[i] = w[i] - grad / lipschitz_;
            diagnostics_.record(i, edges.size() < static_cast<std::size_t>(dim + 1)
                                       ? EstimateStatus::UnderDetermined
                                       : EstimateStatus::Ok);
        }

        previous_ = std::move(current_);
        current_ = std::move(next);
        return true;
    }

private:
    static Coordinates project(const Coordinates& v, double radius) {
        const double n = v.norm();
        return n > radius ? Coordinates(v * (radius / n)) : v;
    }

    std::vector<VisiblePoint> points_;
    MeasurementGraph graph_;
    EstimateVector previous_;
    double lipschitz_ = 1.0;
    int step_ = 0;
};

} // namespace

std::unique_ptr<SnapshotStream>
CooperativeLeastSquaresStrategy::animate(const std::vector<VisiblePoint>& points,
                                         const MeasurementGraph& graph,
                                         const RunConfig& config) const {
    checkInputs(points, graph);
    return std::make_unique<CooperativeLeastSquaresStream>(points, graph, config, false);
}

std::unique_ptr<SnapshotStream>
CooperativeLeastSquaresOpenMPStrategy::animate(const std::vector<VisiblePoint>& points,
                                               const MeasurementGraph& graph,
                                               const RunConfig& config) const {
    checkInputs(points, graph);
    return std::make_unique<CooperativeLeastSquaresStream>(points, graph, config, true);
}

std::unique_ptr<SnapshotStream>
CooperativeGradientStrategy::animate(const std::vector<VisiblePoint>& points,
                                     const MeasurementGraph& graph,
                                     const RunConfig& config) const {
    checkInputs(points, graph);
    return std::make_unique<CooperativeGradientStream>(points, graph, config);
}

std::unique_ptr<SnapshotStream>
MultidimensionalScalingStrategy::animate(const std::vector<VisiblePoint>& points,
                                         const MeasurementGraph& graph,
                                         const RunConfig& config) const {
    checkInputs(points, graph);
    return std::make_unique<MultidimensionalScalingStream>(points, graph, config);
}

std::unique_ptr<SnapshotStream>
ConvexRelaxationStrategy::animate(const std::vector<VisiblePoint>& points,
                                  const MeasurementGraph& graph,
                                  const RunConfig& config) const {
    checkInputs(points, graph);
    return std::make_unique<ConvexRelaxationStream>(points, graph, config);
}

/* ================================ FACADE ================================ */

LocalizationEngine::LocalizationEngine(std::unique_ptr<LocalizationStrategy> strategy)
    : strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw std::invalid_argument("LocalizationEngine requires a strategy");
    }
}

EstimateVector LocalizationEngine::run(const std::vector<VisiblePoint>& points,
                                       const MeasurementGraph& graph,
                                       const RunConfig& config,
                                       SolveDiagnostics& diagnostics) const {
    auto start = std::chrono::steady_clock::now();
    EstimateVector result = strategy_->solve(points, graph, config, diagnostics);
    auto end = std::chrono::steady_clock::now();
    diagnostics.timeTaken = std::chrono::duration<double>(end - start).count();
    return result;
}

std::vector<EstimateVector> LocalizationEngine::animate(const std::vector<VisiblePoint>& points,
                                                        const MeasurementGraph& graph,
                                                        const RunConfig& config,
                                                        SolveDiagnostics& diagnostics) const {
    const IterativeStrategy* iterative = strategy_->asIterative();
    if (iterative == nullptr) {
        throw CapabilityMissingError("algorithm '" + strategy_->name() +
                                     "' does not support animation");
    }
    auto start = std::chrono::steady_clock::now();
    auto stream = iterative->animate(points, graph, config);
    // Grows with the stream; limit() is an upper bound that early stopping may never reach.
    std::vector<EstimateVector> snapshots;
    EstimateVector snapshot;
    while (stream->next(snapshot)) {
        snapshots.push_back(snapshot);
    }
    diagnostics = stream->diagnostics();
    auto end = std::chrono::steady_clock::now();
    diagnostics.timeTaken = std::chrono::duration<double>(end - start).count();
    return snapshots;
}

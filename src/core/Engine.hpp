// src/core/Engine.hpp
//
// Declares the strategy interface, the reference localization strategies and
// the **LocalizationEngine** facade of the **CooperativeLocalizationEngine**.
//
// This file follows the **Strategy Design Pattern**:
// • `LocalizationStrategy` is the one-shot capability (`solve`).
// • `IterativeStrategy` adds the iterative capability (`animate`), which
//   returns a lazy, finite `SnapshotStream` of estimate vectors.
// • Callers detect the iterative capability with `asIterative()` instead of
//   assuming it; `LocalizationEngine::animate` raises `CapabilityMissingError`
//   for solve-only strategies.
//
// `LocalizationEngine` is the **Facade** used by the pipeline and the Python
// bindings. It owns its strategy and records timing in `SolveDiagnostics`.
//
// Mathematical context:
// • Anchor-only: each agent solves its range equations to anchors alone.
// • Cooperative: each agent also uses neighbouring agents at their current
//   estimates as pseudo-anchors, refined over a fixed number of iterations.
// • Gradient: descent on the stress \( S(X) = \sum_{(i,j) \in E}
//   (\tilde{d}_{ij} - \|x_i - x_j\|)^2 \) with diminishing step size.
// • MDS: stress majorization of a free layout, then a Procrustes fit onto
//   the anchors.
// • Convex relaxation: ranges relaxed to balls, minimized with accelerated
//   projected gradient steps.
#ifndef ENGINE_HPP
#define ENGINE_HPP
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Multilateration.hpp"
#include "Network.hpp"
#include "Point.hpp"

/**
 * @brief Per-node outcome of a run.
 *
 * `status(i)` describes the last refinement step of node `i` (anchors are
 * always Ok). Singular local systems recovered during the run are counted
 * in `singularRecoveries()`.
 */
class SolveDiagnostics {
public:
    /**
     * @brief Clears all state and sizes the table for `nodes` nodes.
     */
    void reset(std::size_t nodes);

    void record(std::size_t node, EstimateStatus status);
    EstimateStatus status(std::size_t node) const { return statuses_.at(node); }
    std::size_t size() const { return statuses_.size(); }

    /**
     * @brief Ids of nodes whose last status is UnderDetermined.
     */
    std::vector<std::size_t> underDetermined() const;

    /**
     * @brief Ids of nodes whose last status is Singular.
     */
    std::vector<std::size_t> singular() const;

    std::size_t singularRecoveries() const { return singularRecoveries_; }

    int iterations = 0;      ///< Refinement steps performed.
    double timeTaken = 0.0;  ///< Wall-clock seconds, set by LocalizationEngine.

private:
    std::vector<EstimateStatus> statuses_;
    std::size_t singularRecoveries_ = 0;
};

/**
 * @brief Lazy, finite, non-restartable sequence of estimate snapshots.
 *
 * Each call to `next()` performs one refinement step and hands out the full
 * estimate vector after it. At most `limit()` snapshots are produced; once
 * `next()` returns false it keeps returning false. A fresh
 * `IterativeStrategy::animate` call starts again from the initial condition.
 */
class SnapshotStream {
public:
    explicit SnapshotStream(int limit) : limit_(limit) {}
    virtual ~SnapshotStream() = default;

    SnapshotStream(const SnapshotStream&) = delete;
    SnapshotStream& operator=(const SnapshotStream&) = delete;

    /**
     * @brief Advances one step.
     *
     * @param snapshot Receives the estimate vector after the step.
     * @return bool False when the stream is exhausted (snapshot untouched).
     */
    bool next(EstimateVector& snapshot);

    bool exhausted() const { return finished_ || produced_ >= limit_; }
    int produced() const { return produced_; }
    int limit() const { return limit_; }

    /**
     * @brief Latest estimates: the initial condition before the first step.
     */
    const EstimateVector& current() const { return current_; }
    const SolveDiagnostics& diagnostics() const { return diagnostics_; }

protected:
    /**
     * @brief Performs one synchronous refinement step on `current_`.
     *
     * @return bool False to stop early; the step's result is still emitted.
     */
    virtual bool advance() = 0;

    EstimateVector current_;
    SolveDiagnostics diagnostics_;

private:
    int limit_;
    int produced_ = 0;
    bool finished_ = false;
};

class IterativeStrategy;

/**
 * @brief Abstract one-shot localization strategy.
 */
class LocalizationStrategy {
public:
    virtual ~LocalizationStrategy() = default;

    /**
     * @brief Estimates all positions.
     *
     * @param points Restricted views of the nodes, in input order.
     * @param graph Measurement graph of the run (not modified).
     * @param config Run configuration.
     * @param diagnostics Receives per-node status and iteration count.
     * @return EstimateVector One entry per point, anchors equal to their coordinates.
     */
    virtual EstimateVector solve(const std::vector<VisiblePoint>& points,
                                 const MeasurementGraph& graph,
                                 const RunConfig& config,
                                 SolveDiagnostics& diagnostics) const = 0;

    /**
     * @brief Capability query for `animate`.
     *
     * @return Iterative interface of this strategy, or nullptr if it has none.
     */
    virtual const IterativeStrategy* asIterative() const { return nullptr; }

    virtual std::string name() const = 0;
};

/**
 * @brief Strategy that can expose its refinement steps.
 *
 * `solve` drains a fresh stream and returns its last snapshot, or the initial
 * condition when the stream produces none.
 */
class IterativeStrategy : public LocalizationStrategy {
public:
    EstimateVector solve(const std::vector<VisiblePoint>& points,
                         const MeasurementGraph& graph,
                         const RunConfig& config,
                         SolveDiagnostics& diagnostics) const override;

    const IterativeStrategy* asIterative() const override { return this; }

    /**
     * @brief Starts a fresh snapshot stream.
     *
     * The stream keeps its own copies of `points` and `graph`.
     */
    virtual std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                                    const MeasurementGraph& graph,
                                                    const RunConfig& config) const = 0;
};

/**
 * @brief Non-cooperative least squares against measured anchors only.
 *
 * Requires dim + 1 anchor ranges per agent. Otherwise the agent keeps the
 * minimum-norm solution around its anchors' centroid (or the origin when it
 * measures no anchor) and is reported UnderDetermined.
 */
class AnchorLeastSquaresStrategy : public LocalizationStrategy {
public:
    EstimateVector solve(const std::vector<VisiblePoint>& points,
                         const MeasurementGraph& graph,
                         const RunConfig& config,
                         SolveDiagnostics& diagnostics) const override;
    std::string name() const override { return "leastsquares"; }
};

/**
 * @brief Cooperative least squares with synchronous pseudo-anchor updates.
 *
 * Every iteration, each agent re-solves with measured anchors and with its
 * agent neighbours at their estimates from the previous snapshot.
 * Under-determined or singular local systems keep the previous estimate.
 */
class CooperativeLeastSquaresStrategy : public IterativeStrategy {
public:
    std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                            const MeasurementGraph& graph,
                                            const RunConfig& config) const override;
    std::string name() const override { return "leastsquares_cooperative"; }
};

/**
 * @brief Cooperative least squares with the per-agent loop run under OpenMP.
 *
 * Agents write disjoint slots of the next snapshot, so results equal those of
 * `CooperativeLeastSquaresStrategy` bit for bit.
 */
class CooperativeLeastSquaresOpenMPStrategy : public IterativeStrategy {
public:
    std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                            const MeasurementGraph& graph,
                                            const RunConfig& config) const override;
    std::string name() const override { return "leastsquares_cooperative_openmp"; }
};

/**
 * @brief Cooperative gradient descent on the network stress.
 *
 * Implements \( x_i^{k+1} = x_i^k - \eta_k \nabla_i S(X^k) \) for all agents
 * at once, with \( \eta_k = \eta_0 / ((k + 1)\, \Delta) \) where \( \Delta \)
 * is the largest node degree. Stops early after a step whose largest
 * position change is below `config.tolerance` when that is positive.
 */
class CooperativeGradientStrategy : public IterativeStrategy {
public:
    std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                            const MeasurementGraph& graph,
                                            const RunConfig& config) const override;
    std::string name() const override { return "gradient_cooperative"; }
};

/**
 * @brief Metric multidimensional scaling by stress majorization (SMACOF).
 *
 * Every step applies the Guttman transform
 * \( X^{k+1} = V^{+} B(X^k) X^k \) to a free layout of all nodes, weighted by
 * the measured ranges and the known anchor-to-anchor distances. The layout is
 * then mapped onto the anchors by an orthogonal Procrustes fit (rotation,
 * reflection, translation) and the anchors are pinned. Agents in a component
 * without an anchor keep their initial estimate and are UnderDetermined, as
 * are all agents when fewer than dim + 1 anchors fix the frame.
 */
class MultidimensionalScalingStrategy : public IterativeStrategy {
public:
    std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                            const MeasurementGraph& graph,
                                            const RunConfig& config) const override;
    std::string name() const override { return "mds"; }
};

/**
 * @brief Convex relaxation of the range problem, solved with accelerated
 *        projected gradient steps.
 *
 * Each range constraint is relaxed to the ball \( \|x_i - x_j\| \le d_{ij} \)
 * (and \( \|x_i - a_k\| \le d_{ik} \) for anchors). One step:
 *
 * \[
 * w_i = x_i^k + \frac{k - 2}{k + 1}(x_i^k - x_i^{k-1}), \qquad
 * x_i^{k+1} = w_i - \frac{\nabla_i g(w) + \nabla_i h(w)}{L}
 * \]
 *
 * with \( L = 2\,\Delta + \Delta_a \), where \( \Delta \) is the largest node
 * degree and \( \Delta_a \) the largest anchor degree. All agents read the same
 * momentum point, so the step is synchronous.
 */
class ConvexRelaxationStrategy : public IterativeStrategy {
public:
    std::unique_ptr<SnapshotStream> animate(const std::vector<VisiblePoint>& points,
                                            const MeasurementGraph& graph,
                                            const RunConfig& config) const override;
    std::string name() const override { return "convexrelaxation"; }
};

/**
 * @brief Initial condition shared by the cooperative strategies.
 *
 * Anchors at their coordinates; agents at their anchor-only solution; agents
 * that measure no anchor at the centroid of already placed neighbours,
 * propagated in id order until nothing changes; any remaining agent at the
 * origin. The anchor-only status of every agent is recorded in `diagnostics`.
 */
EstimateVector cooperativeInitialEstimates(const std::vector<VisiblePoint>& points,
                                           const MeasurementGraph& graph,
                                           SolveDiagnostics& diagnostics);

/**
 * @brief Facade owning one strategy and driving it for a run.
 */
class LocalizationEngine {
public:
    /**
     * @param strategy Strategy to drive (ownership transferred, must not be null).
     */
    explicit LocalizationEngine(std::unique_ptr<LocalizationStrategy> strategy);

    /**
     * @brief Runs `solve` once and records wall-clock time.
     *
     * Uses `std::chrono::steady_clock`.
     */
    EstimateVector run(const std::vector<VisiblePoint>& points,
                       const MeasurementGraph& graph,
                       const RunConfig& config,
                       SolveDiagnostics& diagnostics) const;

    /**
     * @brief Materializes every snapshot of a fresh `animate` stream.
     *
     * @throws CapabilityMissingError if the strategy is solve-only.
     */
    std::vector<EstimateVector> animate(const std::vector<VisiblePoint>& points,
                                        const MeasurementGraph& graph,
                                        const RunConfig& config,
                                        SolveDiagnostics& diagnostics) const;

    bool supportsAnimation() const { return strategy_->asIterative() != nullptr; }
    const LocalizationStrategy& strategy() const { return *strategy_; }

private:
    std::unique_ptr<LocalizationStrategy> strategy_;
};

/**
 * @brief Prints under-determined and singular nodes to `os`, one per line.
 */
void printDiagnostics(std::ostream& os, const SolveDiagnostics& diagnostics);

#endif // ENGINE_HPP

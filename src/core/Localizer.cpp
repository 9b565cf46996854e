// src/core/Localizer.cpp
//
// Implementation of the strategy registry and the `localize` pipeline.
//
// The registry replaces per-mode `if` chains with a table, so new strategies
// are added with one `add` call. Output follows the library's plain stream
// convention: run summaries on std::cout, per-node warnings on std::cerr,
// both only when `RunConfig::verbose` is set.
#include "Localizer.hpp"
#include "Errors.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

void StrategyRegistry::add(const std::string& name, Factory factory) {
    if (name.empty() || !factory) {
        throw std::invalid_argument("strategy registration needs a name and a factory");
    }
    if (!factories_.emplace(name, std::move(factory)).second) {
        throw std::invalid_argument("strategy '" + name + "' is already registered");
    }
}

std::unique_ptr<LocalizationStrategy> StrategyRegistry::create(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw UnknownAlgorithmError("Unknown algorithm: " + name);
    }
    return it->second();
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& kv : factories_) result.push_back(kv.first);
    return result;
}

StrategyRegistry& defaultRegistry() {
    static StrategyRegistry registry = [] {
        StrategyRegistry r;
        r.add("leastsquares", [] { return std::make_unique<AnchorLeastSquaresStrategy>(); });
        r.add("leastsquares_cooperative",
              [] { return std::make_unique<CooperativeLeastSquaresStrategy>(); });
        r.add("leastsquares_cooperative_openmp",
              [] { return std::make_unique<CooperativeLeastSquaresOpenMPStrategy>(); });
        r.add("gradient_cooperative",
              [] { return std::make_unique<CooperativeGradientStrategy>(); });
        r.add("mds", [] { return std::make_unique<MultidimensionalScalingStrategy>(); });
        r.add("convexrelaxation", [] { return std::make_unique<ConvexRelaxationStrategy>(); });
        return r;
    }();
    return registry;
}

/**
 * @brief Validates, measures and solves one problem.
 *
 * All checks (points, configuration, strategy name, capability, optional
 * connectivity) happen before the strategy runs.
 */
LocalizationRun localize(const std::vector<GroundTruthPoint>& points,
                         const std::string& algorithm,
                         const RunConfig& config,
                         bool animate) {
    const AlgorithmSelector selector = parseAlgorithmSelector(algorithm);
    RunConfig effective = config;
    if (selector.iterations >= 0) effective.iterations = selector.iterations;
    effective.validate();
    validatePoints(points);

    LocalizationEngine engine(defaultRegistry().create(selector.name));
    if (animate && !engine.supportsAnimation()) {
        throw CapabilityMissingError("algorithm '" + selector.name + "' does not support animation");
    }

    NoiseSource noise(effective.seed);
    LocalizationRun run{buildMeasurementGraph(points, effective.sigma, effective.visibility, noise),
                        {}, {}, {}};
    if (effective.requireConnected && !run.graph.isConnected()) {
        throw DisconnectedGraphError("Graph is disconnected.");
    }

    const std::vector<VisiblePoint> view = makeVisible(points);
    if (animate) {
        run.snapshots = engine.animate(view, run.graph, effective, run.diagnostics);
        if (run.snapshots.empty()) {
            SolveDiagnostics initial;
            run.estimates = engine.run(view, run.graph, effective, initial);
        } else {
            run.estimates = run.snapshots.back();
        }
    } else {
        run.estimates = engine.run(view, run.graph, effective, run.diagnostics);
    }

    if (effective.verbose) {
        printDiagnostics(std::cerr, run.diagnostics);
        std::cout << "Ran '" << selector.name << "' on " << points.size() << " points ("
                  << run.graph.edgeCount() << " measured ranges): "
                  << run.diagnostics.iterations << " iterations in "
                  << run.diagnostics.timeTaken << " s" << std::endl;
    }
    return run;
}

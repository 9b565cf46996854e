// src/core/Localizer.hpp
//
// Strategy registry and end-to-end pipeline of the
// **CooperativeLocalizationEngine**.
//
// The registry maps a name to a factory producing a fresh strategy; the
// built-in strategies are registered when the default registry is first
// used. `localize` runs a whole localization problem in one call:
//
//   validate → build measurement graph → run (or animate) → collect
//
// and either returns a complete result or throws before computation starts.
#ifndef LOCALIZER_HPP
#define LOCALIZER_HPP
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Engine.hpp"
#include "Network.hpp"
#include "Point.hpp"

/**
 * @brief Name → strategy factory map.
 */
class StrategyRegistry {
public:
    using Factory = std::function<std::unique_ptr<LocalizationStrategy>()>;

    /**
     * @brief Registers `factory` under `name`.
     *
     * @throws std::invalid_argument if the name is empty or already taken.
     */
    void add(const std::string& name, Factory factory);

    bool contains(const std::string& name) const { return factories_.count(name) > 0; }

    /**
     * @brief Creates a fresh strategy.
     *
     * @throws UnknownAlgorithmError if nothing is registered under `name`.
     */
    std::unique_ptr<LocalizationStrategy> create(const std::string& name) const;

    /**
     * @brief Registered names, sorted.
     */
    std::vector<std::string> names() const;

private:
    std::map<std::string, Factory> factories_;
};

/**
 * @brief Process-wide registry holding the built-in strategies.
 *
 * `leastsquares`, `leastsquares_cooperative`,
 * `leastsquares_cooperative_openmp`, `gradient_cooperative`.
 */
StrategyRegistry& defaultRegistry();

/**
 * @brief Everything a run produces.
 */
struct LocalizationRun {
    MeasurementGraph graph;                 ///< Graph the strategy consumed.
    EstimateVector estimates;               ///< Final estimates (last snapshot when animated).
    std::vector<EstimateVector> snapshots;  ///< One per step when animated, else empty.
    SolveDiagnostics diagnostics;
};

/**
 * @brief Runs one localization problem from ground truth to estimates.
 *
 * @param points Ground-truth nodes (not modified).
 * @param algorithm Strategy selector, `name` or `name:iterations`; an
 *        iteration count in the selector overrides `config.iterations`.
 * @param config Run configuration.
 * @param animate Collect every snapshot (iterative strategies only).
 * @return LocalizationRun Graph, estimates, snapshots and diagnostics.
 *
 * @throws MalformedInputError, std::invalid_argument, UnknownAlgorithmError,
 *         DisconnectedGraphError, CapabilityMissingError before any estimate
 *         is computed.
 */
LocalizationRun localize(const std::vector<GroundTruthPoint>& points,
                         const std::string& algorithm,
                         const RunConfig& config,
                         bool animate = false);

#endif // LOCALIZER_HPP

// src/core/Config.hpp
//
// Run configuration of the **CooperativeLocalizationEngine**.
//
// One `RunConfig` describes a whole run: the measurement model (noise level,
// visibility radius, seed) and the iteration budget of iterative strategies.
// Values are validated once, before the measurement graph is built.
#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <limits>
#include <string>

/// Visibility sentinel: every pair of nodes can measure each other.
constexpr double kUnlimitedVisibility = std::numeric_limits<double>::infinity();

/**
 * @brief Options recognized by the measurement builder and the strategies.
 */
struct RunConfig {
    double sigma = 0.0;                       ///< Std. deviation of range noise (≥ 0).
    double visibility = kUnlimitedVisibility; ///< Largest measurable true distance (> 0).
    int iterations = 100;                     ///< Refinement steps of iterative strategies (≥ 0).
    unsigned int seed = 42;                   ///< Seed of the run's NoiseSource.
    double stepSize = 0.5;                    ///< \( \eta_0 \) of the gradient strategy (> 0).
    double tolerance = 0.0;                   ///< Early-stop threshold of the gradient strategy; 0 disables.
    bool requireConnected = false;            ///< Reject disconnected measurement graphs.
    bool verbose = false;                     ///< Print per-node warnings and a run summary.

    /**
     * @brief Checks every value range.
     *
     * @throws std::invalid_argument naming the offending option.
     */
    void validate() const;
};

/**
 * @brief Strategy selector of the form `name` or `name:iterations`.
 */
struct AlgorithmSelector {
    std::string name;
    int iterations = -1; ///< -1 when the selector carries no iteration count.
};

/**
 * @brief Parses a strategy selector such as `leastsquares_cooperative:50`.
 *
 * @throws std::invalid_argument for an empty name or a bad iteration count.
 */
AlgorithmSelector parseAlgorithmSelector(const std::string& text);

#endif // CONFIG_HPP

// src/core/Config.cpp
//
// Validation and parsing helpers for `RunConfig`.
#include "Config.hpp"
#include <cmath>
#include <stdexcept>

void RunConfig::validate() const {
    if (!(sigma >= 0.0) || std::isinf(sigma)) {
        throw std::invalid_argument("sigma must be finite and non-negative, got " +
                                    std::to_string(sigma));
    }
    // NaN fails the comparison; infinity is the unlimited sentinel.
    if (!(visibility > 0.0)) {
        throw std::invalid_argument("visibility must be positive, got " +
                                    std::to_string(visibility));
    }
    if (iterations < 0) {
        throw std::invalid_argument("iterations must be non-negative, got " +
                                    std::to_string(iterations));
    }
    if (!(stepSize > 0.0) || std::isinf(stepSize)) {
        throw std::invalid_argument("stepSize must be finite and positive, got " +
                                    std::to_string(stepSize));
    }
    if (!(tolerance >= 0.0)) {
        throw std::invalid_argument("tolerance must be non-negative, got " +
                                    std::to_string(tolerance));
    }
}

AlgorithmSelector parseAlgorithmSelector(const std::string& text) {
    AlgorithmSelector selector;
    const auto colon = text.find(':');
    selector.name = text.substr(0, colon);
    if (selector.name.empty()) {
        throw std::invalid_argument("empty algorithm name in '" + text + "'");
    }
    if (colon == std::string::npos) {
        return selector;
    }
    const std::string count = text.substr(colon + 1);
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(count, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad iteration count in '" + text + "'");
    }
    if (used != count.size() || value < 0) {
        throw std::invalid_argument("bad iteration count in '" + text + "'");
    }
    selector.iterations = value;
    return selector;
}

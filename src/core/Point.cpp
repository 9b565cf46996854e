// src/core/Point.cpp
//
// Implementation of the node views of the **CooperativeLocalizationEngine**.
//
// `GroundTruthPoint::visible()` is the only place where a restricted view is
// created from ground truth; agents lose their coordinates there.
#include "Point.hpp"
#include "Errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

GroundTruthPoint::GroundTruthPoint(std::size_t id, PointType type, Coordinates coords)
    : id_(id), type_(type), coords_(std::move(coords)) {}

/**
 * @brief Euclidean distance \( \|x_i - x_j\| \) between true positions.
 */
double GroundTruthPoint::trueDistance(const GroundTruthPoint& other) const {
    return (coords_ - other.coords_).norm();
}

VisiblePoint GroundTruthPoint::visible() const {
    if (isAnchor()) {
        return VisiblePoint::anchor(id_, coords_);
    }
    return VisiblePoint::agent(id_, dim());
}

VisiblePoint::VisiblePoint(std::size_t id, PointType type, int dim, Coordinates coords)
    : id_(id), type_(type), dim_(dim), coords_(std::move(coords)) {}

VisiblePoint VisiblePoint::anchor(std::size_t id, Coordinates coords) {
    const int dim = static_cast<int>(coords.size());
    return VisiblePoint(id, PointType::Anchor, dim, std::move(coords));
}

VisiblePoint VisiblePoint::agent(std::size_t id, int dim) {
    return VisiblePoint(id, PointType::Agent, dim, Coordinates());
}

const Coordinates& VisiblePoint::coordinates() const {
    if (!isAnchor()) {
        throw std::logic_error("Attempt to access coordinates of agent " + std::to_string(id_));
    }
    return coords_;
}

std::vector<VisiblePoint> makeVisible(const std::vector<GroundTruthPoint>& points) {
    std::vector<VisiblePoint> view;
    view.reserve(points.size());
    for (const auto& p : points) {
        view.push_back(p.visible());
    }
    return view;
}

/**
 * @brief Validates a point sequence before any measurement is taken.
 *
 * Dimension is fixed by the first point, as in the record format.
 */
void validatePoints(const std::vector<GroundTruthPoint>& points) {
    if (points.empty()) {
        throw MalformedInputError("no points given");
    }
    const int dim = points.front().dim();
    if (dim < 1) {
        throw MalformedInputError("points must have at least one coordinate");
    }
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto& p = points[i];
        if (p.id() != i) {
            throw MalformedInputError("point at position " + std::to_string(i) +
                                      " has id " + std::to_string(p.id()));
        }
        if (p.dim() != dim) {
            throw MalformedInputError("point " + std::to_string(i) + " has dimension " +
                                      std::to_string(p.dim()) + ", expected " +
                                      std::to_string(dim));
        }
        if (!p.trueCoordinates().allFinite()) {
            throw MalformedInputError("point " + std::to_string(i) + " has non-finite coordinates");
        }
    }
}

// src/core/Multilateration.cpp
//
// Implementation of the linearized least-squares position solve.
#include "Multilateration.hpp"
#include <Eigen/QR>

Coordinates centroid(const std::vector<Coordinates>& positions, int dim) {
    Coordinates c = Coordinates::Zero(dim);
    if (positions.empty()) return c;
    for (const auto& p : positions) c += p;
    return c / static_cast<double>(positions.size());
}

/**
 * @brief Solves \( A y = b/2 \) in centroid coordinates and returns \( x = c + y \).
 *
 * The decomposition is rank-revealing, so rank-deficient systems (too few
 * references, references on or near a line in 2D or a plane in 3D) still
 * yield a bounded minimum-norm solution; the status tells the caller whether
 * to trust it.
 */
MultilaterationResult multilaterate(const std::vector<ReferenceRange>& references, int dim) {
    const auto n = static_cast<Eigen::Index>(references.size());
    if (n == 0) {
        return {Coordinates(), EstimateStatus::UnderDetermined, 0};
    }
    if (n == 1) {
        return {references.front().position, EstimateStatus::UnderDetermined, 0};
    }

    Coordinates c = Coordinates::Zero(dim);
    for (const auto& r : references) c += r.position;
    c /= static_cast<double>(n);

    const Coordinates q0 = references.front().position - c;
    const double s0 = q0.squaredNorm();
    const double d0 = references.front().distance;

    Eigen::MatrixXd A(n - 1, dim);
    Eigen::VectorXd b(n - 1);
    for (Eigen::Index k = 1; k < n; ++k) {
        const auto& r = references[static_cast<std::size_t>(k)];
        const Coordinates qk = r.position - c;
        A.row(k - 1) = (q0 - qk).transpose();
        b(k - 1) = s0 - qk.squaredNorm() - d0 * d0 + r.distance * r.distance;
    }

    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(A.rows(), A.cols());
    cod.setThreshold(kConditionThreshold);
    cod.compute(A);
    const int rank = static_cast<int>(cod.rank());

    Coordinates x = c + 0.5 * cod.solve(b);
    if (!x.allFinite()) {
        return {c, EstimateStatus::Singular, rank};
    }
    if (n < dim + 1) {
        return {x, EstimateStatus::UnderDetermined, rank};
    }
    if (rank < dim) {
        return {x, EstimateStatus::Singular, rank};
    }
    return {x, EstimateStatus::Ok, rank};
}

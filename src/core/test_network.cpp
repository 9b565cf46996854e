// src/core/test_network.cpp
//
// CTest suite for the measurement model and the local position solve:
// visibility, noise reproducibility, symmetry, connectivity queries and
// multilateration in 2D and 3D.

#include "Config.hpp"
#include "Errors.hpp"
#include "Multilateration.hpp"
#include "Network.hpp"
#include "Point.hpp"
#include "util.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static int checks = 0;

void check(bool ok, const std::string& what) {
    ++checks;
    if (!ok) {
        std::cerr << "Test failed: " << what << std::endl;
        std::exit(1);
    }
    std::cout << "Test passed: " << what << std::endl;
}

template <typename E, typename F>
void checkThrows(F&& f, const std::string& what) {
    bool thrown = false;
    try {
        f();
    } catch (const E&) {
        thrown = true;
    }
    check(thrown, what);
}

Coordinates vec2(double x, double y) {
    Coordinates c(2);
    c << x, y;
    return c;
}

Coordinates vec3(double x, double y, double z) {
    Coordinates c(3);
    c << x, y, z;
    return c;
}

void test_visibility_and_exact_ranges() {
    const auto points = generateStandardSample(5, 40, 0.05, 13);
    const double visibility = 0.35;
    NoiseSource noise(1);
    const auto graph = buildMeasurementGraph(points, 0.0, visibility, noise);

    bool edgesMatch = true;
    bool exact = true;
    bool symmetric = true;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i < points.size(); ++i) {
        for (std::size_t j = 0; j < points.size(); ++j) {
            if (i == j) continue;
            const double d = points[i].trueDistance(points[j]);
            const auto measured = graph.distance(i, j);
            edgesMatch = edgesMatch && (measured.has_value() == (d <= visibility));
            if (measured) {
                exact = exact && *measured == d;
                symmetric = symmetric && graph.distance(j, i) == measured;
                if (i < j) ++pairs;
            }
        }
    }
    check(edgesMatch, "edge present exactly when the true distance is within visibility");
    check(exact, "sigma 0: measured ranges equal true distances");
    check(symmetric, "measured ranges are symmetric");
    check(graph.edgeCount() == pairs, "edge count matches visible unordered pairs");
    check(!graph.distance(0, 0).has_value(), "no self edge");

    bool sorted = true;
    for (std::size_t i = 0; i < graph.size(); ++i) {
        const auto& edges = graph.neighbors(i);
        for (std::size_t k = 1; k < edges.size(); ++k) {
            sorted = sorted && edges[k - 1].neighbor < edges[k].neighbor;
        }
    }
    check(sorted, "adjacency lists sorted by neighbour id");

    NoiseSource again(1);
    const auto full = buildMeasurementGraph(points, 0.0, kUnlimitedVisibility, again);
    const std::size_t n = points.size();
    check(full.edgeCount() == n * (n - 1) / 2, "unlimited visibility yields the complete graph");
    check(full.isConnected(), "complete graph is connected");
}

void test_noise_reproducibility() {
    const auto points = generateStandardSample(4, 20, 0.05, 2);
    NoiseSource a(77);
    NoiseSource b(77);
    NoiseSource c(78);
    const auto ga = buildMeasurementGraph(points, 0.05, kUnlimitedVisibility, a);
    const auto gb = buildMeasurementGraph(points, 0.05, kUnlimitedVisibility, b);
    const auto gc = buildMeasurementGraph(points, 0.05, kUnlimitedVisibility, c);

    bool same = true;
    bool differs = false;
    bool noisy = false;
    for (std::size_t i = 0; i < points.size(); ++i) {
        for (std::size_t j = i + 1; j < points.size(); ++j) {
            same = same && ga.distance(i, j) == gb.distance(i, j);
            differs = differs || ga.distance(i, j) != gc.distance(i, j);
            noisy = noisy || *ga.distance(i, j) != points[i].trueDistance(points[j]);
        }
    }
    check(same, "same seed reproduces every range");
    check(differs, "different seed changes the ranges");
    check(noisy, "sigma > 0 perturbs the ranges");

    std::vector<GroundTruthPoint> close = {
        GroundTruthPoint(0, PointType::Anchor, vec2(0.0, 0.0)),
        GroundTruthPoint(1, PointType::Agent, vec2(0.001, 0.0)),
        GroundTruthPoint(2, PointType::Agent, vec2(0.0, 0.002))};
    NoiseSource loud(5);
    const auto floored = buildMeasurementGraph(close, 10.0, kUnlimitedVisibility, loud);
    bool positive = true;
    for (std::size_t i = 0; i < close.size(); ++i) {
        for (const auto& m : floored.neighbors(i)) {
            positive = positive && m.distance >= kMinMeasuredDistance;
        }
    }
    check(positive, "noisy ranges never fall below the floor");

    NoiseSource quiet(3);
    check(quiet.gaussian(0.0) == 0.0 && quiet.seed() == 3, "sigma 0 draws exactly zero");
}

void test_connectivity_queries() {
    // Anchor 0 - agent 1 - agent 2 chained; agent 3 isolated with agent 4.
    std::vector<GroundTruthPoint> points = {
        GroundTruthPoint(0, PointType::Anchor, vec2(0.0, 0.0)),
        GroundTruthPoint(1, PointType::Agent, vec2(1.0, 0.0)),
        GroundTruthPoint(2, PointType::Agent, vec2(2.0, 0.0)),
        GroundTruthPoint(3, PointType::Agent, vec2(10.0, 10.0)),
        GroundTruthPoint(4, PointType::Agent, vec2(10.5, 10.0))};
    NoiseSource noise(1);
    const auto graph = buildMeasurementGraph(points, 0.0, 1.2, noise);

    check(graph.edgeCount() == 3, "chain and isolated pair give three edges");
    check(!graph.isConnected(), "two components are reported disconnected");
    check(graph.reachesAnchor(0) && graph.reachesAnchor(2), "chain reaches the anchor");
    check(!graph.reachesAnchor(3) && !graph.reachesAnchor(4), "isolated pair does not reach an anchor");
    check(graph.unlocalizableAgents() == std::vector<std::size_t>({3, 4}),
          "unlocalizable agents listed in id order");
    check(graph.anchorDegree(1) == 1 && graph.anchorDegree(2) == 0,
          "anchor degree counts anchors only");
    check(graph.type(0) == PointType::Anchor && graph.dim() == 2, "graph remembers types and dimension");

    MeasurementGraph manual(2, {PointType::Anchor, PointType::Agent});
    manual.addEdge(0, 1, 1.5);
    check(manual.distance(1, 0) == 1.5 && manual.isConnected(), "manual edge is undirected");
    checkThrows<std::out_of_range>([&] { manual.addEdge(0, 2, 1.0); }, "edge to unknown node rejected");

    MeasurementGraph unordered(2, {PointType::Anchor, PointType::Agent, PointType::Agent,
                                   PointType::Agent});
    unordered.addEdge(0, 3, 3.0);
    unordered.addEdge(0, 2, 2.0);
    unordered.addEdge(3, 1, 4.0);
    unordered.addEdge(0, 1, 1.0);
    check(unordered.edgeCount() == 4 && unordered.hasEdge(0, 1) && unordered.hasEdge(1, 0) &&
              unordered.distance(0, 2) == 2.0 && unordered.distance(1, 3) == 4.0 &&
              !unordered.hasEdge(1, 2),
          "edges added out of order are all found");
    const auto& around0 = unordered.neighbors(0);
    check(around0.size() == 3 && around0[0].neighbor == 1 && around0[1].neighbor == 2 &&
              around0[2].neighbor == 3,
          "adjacency stays sorted after out-of-order insertion");
    checkThrows<std::invalid_argument>([&] { unordered.addEdge(2, 0, 5.0); },
                                       "duplicate edge rejected");
    check(unordered.edgeCount() == 4 && unordered.distance(0, 2) == 2.0,
          "rejected duplicate leaves the graph unchanged");
}

void test_builder_rejects_bad_input() {
    std::vector<GroundTruthPoint> points = {
        GroundTruthPoint(0, PointType::Anchor, vec2(0.0, 0.0)),
        GroundTruthPoint(1, PointType::Agent, vec2(1.0, 1.0))};
    NoiseSource noise(1);

    checkThrows<std::invalid_argument>([&] { buildMeasurementGraph(points, -0.1, 1.0, noise); },
                                       "negative sigma rejected");
    checkThrows<std::invalid_argument>([&] { buildMeasurementGraph(points, 0.0, 0.0, noise); },
                                       "non-positive visibility rejected");
    checkThrows<MalformedInputError>(
        [&] { buildMeasurementGraph(std::vector<GroundTruthPoint>{}, 0.0, 1.0, noise); },
        "empty point sequence rejected");

    auto mixed = points;
    mixed.emplace_back(2, PointType::Agent, vec3(1.0, 2.0, 3.0));
    checkThrows<MalformedInputError>([&] { buildMeasurementGraph(mixed, 0.0, 1.0, noise); },
                                     "mixed dimensions rejected");

    auto shuffled = points;
    shuffled.emplace_back(7, PointType::Agent, vec2(2.0, 2.0));
    checkThrows<MalformedInputError>([&] { buildMeasurementGraph(shuffled, 0.0, 1.0, noise); },
                                     "ids out of input order rejected");

    auto nan = points;
    nan.emplace_back(2, PointType::Agent, vec2(std::nan(""), 0.0));
    checkThrows<MalformedInputError>([&] { buildMeasurementGraph(nan, 0.0, 1.0, noise); },
                                     "non-finite coordinates rejected");

    const auto before = points;
    buildMeasurementGraph(points, 0.1, 5.0, noise);
    check(points[1].trueCoordinates() == before[1].trueCoordinates(), "builder leaves the points untouched");
}

void test_multilateration() {
    const Coordinates target = vec2(3.0, 4.0);
    std::vector<ReferenceRange> refs;
    for (const auto& q : {vec2(0.0, 0.0), vec2(10.0, 0.0), vec2(0.0, 10.0), vec2(10.0, 10.0)}) {
        refs.push_back({q, (target - q).norm()});
    }
    auto result = multilaterate(refs, 2);
    check(result.status == EstimateStatus::Ok && result.rank == 2, "four anchors: full-rank 2D solve");
    check((result.position - target).norm() < 1e-9, "four anchors: exact 2D position");

    const Coordinates target3 = vec3(1.0, 2.0, 3.0);
    std::vector<ReferenceRange> refs3;
    for (const auto& q : {vec3(0.0, 0.0, 0.0), vec3(5.0, 0.0, 0.0), vec3(0.0, 5.0, 0.0),
                          vec3(0.0, 0.0, 5.0), vec3(5.0, 5.0, 5.0)}) {
        refs3.push_back({q, (target3 - q).norm()});
    }
    result = multilaterate(refs3, 3);
    check(result.status == EstimateStatus::Ok && (result.position - target3).norm() < 1e-9,
          "five anchors: exact 3D position");

    std::vector<ReferenceRange> planar;
    for (const auto& q : {vec3(0.0, 0.0, 0.0), vec3(5.0, 0.0, 0.0), vec3(0.0, 5.0, 0.0),
                          vec3(5.0, 5.0, 0.0)}) {
        planar.push_back({q, (target3 - q).norm()});
    }
    result = multilaterate(planar, 3);
    check(result.status == EstimateStatus::Singular && result.rank == 2 && result.position.allFinite(),
          "coplanar anchors in 3D: singular, finite fallback");

    // Third reference 1e-8 off the line through the first two.
    std::vector<ReferenceRange> nearLine;
    const Coordinates agent = vec2(1.0, 1.0);
    const double offsets[] = {0.004, -0.007, 0.01};
    int k = 0;
    for (const auto& q : {vec2(0.0, 0.0), vec2(1.0, 0.0), vec2(2.0, 1e-8)}) {
        nearLine.push_back({q, (agent - q).norm() + offsets[k++]});
    }
    result = multilaterate(nearLine, 2);
    check(result.status == EstimateStatus::Singular && result.rank == 1,
          "nearly collinear anchors: reported singular");
    check(result.position.allFinite() && result.position.norm() < 10.0,
          "nearly collinear anchors: bounded fallback position");

    result = multilaterate({}, 2);
    check(result.status == EstimateStatus::UnderDetermined && result.position.size() == 0,
          "no reference: under-determined, no position");

    result = multilaterate({{vec2(1.0, 2.0), 3.0}}, 2);
    check(result.status == EstimateStatus::UnderDetermined && result.position == vec2(1.0, 2.0),
          "one reference: its position");

    result = multilaterate({{vec2(0.0, 0.0), 5.0}, {vec2(10.0, 0.0), 5.0}}, 2);
    check(result.status == EstimateStatus::UnderDetermined &&
              (result.position - vec2(5.0, 0.0)).norm() < 1e-9,
          "two references: minimum-norm point between them");

    check(centroid({vec2(0.0, 0.0), vec2(2.0, 4.0)}, 2) == vec2(1.0, 2.0), "centroid of two points");
    check(centroid({}, 3) == Coordinates::Zero(3), "centroid of nothing is the origin");
}

int main() {
    test_visibility_and_exact_ranges();
    test_noise_reproducibility();
    test_connectivity_queries();
    test_builder_rejects_bad_input();
    test_multilateration();
    std::cout << "All " << checks << " network checks passed!" << std::endl;
    return 0;
}

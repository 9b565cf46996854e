// src/core/test_point_reader.cpp
//
// CTest suite for point record reading, sample generation and estimate
// scoring.

#include "Errors.hpp"
#include "Point.hpp"
#include "PointReader.hpp"
#include "util.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
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

/**
 * @brief Expects `readPoints` to reject `text` with an error on `line`.
 */
void checkRejected(const std::string& text, std::size_t line, const std::string& what) {
    std::istringstream in(text);
    bool thrown = false;
    try {
        readPoints(in);
    } catch (const MalformedInputError& e) {
        thrown = e.line() == line;
        if (!thrown) {
            std::cerr << "Wrong line reported: " << e.what() << std::endl;
        }
    }
    check(thrown, what);
}

void test_reading() {
    std::istringstream in(
        "# anchors first\n"
        "0, 0, S\n"
        "1,0,S\n"
        "\n"
        "0.5,0.25,A\n"
        "  0.2 , 0.3  \n");
    const auto points = readPoints(in);
    check(points.size() == 4, "four records read, comment and blank line skipped");
    check(points[0].isAnchor() && points[1].isAnchor(), "S tag marks anchors");
    check(points[2].type() == PointType::Agent, "A tag marks agents");
    check(points[3].type() == PointType::Agent, "missing tag means agent");
    check(points[2].dim() == 2 && points[2].trueCoordinates()(1) == 0.25, "coordinates parsed");
    bool ordered = true;
    for (std::size_t i = 0; i < points.size(); ++i) ordered = ordered && points[i].id() == i;
    check(ordered, "ids follow record order");

    std::istringstream in3("1,2,3,S\n4,5,6\n");
    const auto points3 = readPoints(in3);
    check(points3.size() == 2 && points3[1].dim() == 3, "3D records read");
}

void test_rejections() {
    checkRejected("0,0,S\n1,1,X\n", 2, "unknown type tag rejected with its line");
    checkRejected("0,0,S\n1,abc,A\n", 2, "unparsable coordinate rejected with its line");
    checkRejected("0,0,S\n\n1,1,1,A\n", 3, "dimension change rejected with its line");
    checkRejected("# only a comment\nS\n", 2, "record without coordinates rejected");
    checkRejected("0,inf,S\n", 1, "non-finite coordinate rejected");
    checkRejected("0,0,S\n1,2,\n", 2, "trailing delimiter rejected with its line");
    checkRejected("0,0,S\n1,2 , \n", 2, "trailing delimiter before whitespace rejected");
    checkRejected("0,,S\n", 1, "empty interior field rejected");
    checkRejected("", 0, "empty input rejected");

    bool thrown = false;
    try {
        readPointsFromFile("/nonexistent/points.csv");
    } catch (const MalformedInputError&) {
        thrown = true;
    }
    check(thrown, "missing file rejected");
}

void test_sample_generation() {
    const auto points = generateStandardSample(4, 30, 0.05, 42);
    check(points.size() == 34, "four anchors and thirty agents");
    check(points[0].trueCoordinates() == Coordinates::Zero(2), "first anchor at the origin corner");
    bool inside = true;
    for (std::size_t i = 4; i < points.size(); ++i) {
        const auto& p = points[i].trueCoordinates();
        inside = inside && !points[i].isAnchor() && p(0) >= 0.05 && p(0) <= 0.95 &&
                 p(1) >= 0.05 && p(1) <= 0.95;
    }
    check(inside, "agents inside the margin");

    bool onEdge = true;
    for (std::size_t i = 0; i < 4; ++i) {
        const auto& p = points[i].trueCoordinates();
        onEdge = onEdge && points[i].isAnchor() &&
                 (p(0) == 0.0 || p(0) == 1.0 || p(1) == 0.0 || p(1) == 1.0);
    }
    check(onEdge, "anchors on the unit-square perimeter");

    const auto again = generateStandardSample(4, 30, 0.05, 42);
    bool same = true;
    for (std::size_t i = 0; i < points.size(); ++i) {
        same = same && points[i].trueCoordinates() == again[i].trueCoordinates();
    }
    check(same, "same seed reproduces the sample");

    bool thrown = false;
    try {
        generateStandardSample(4, 10, 0.6, 1);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "margin beyond half the square rejected");
}

void test_evaluation() {
    const auto points = generateStandardSample(4, 5, 0.1, 3);
    EstimateVector estimates;
    for (const auto& p : points) estimates.push_back(p.trueCoordinates());

    auto summary = evaluateEstimates(points, estimates);
    check(summary.maxPositionError == 0.0 && summary.distanceRmse == 0.0, "exact estimates score zero");

    estimates[4](0) += 0.3;
    summary = evaluateEstimates(points, estimates);
    check(std::abs(summary.maxPositionError - 0.3) < 1e-12, "max position error of one shifted agent");
    check(std::abs(summary.positionRmse - 0.3 / std::sqrt(5.0)) < 1e-12, "position RMSE over agents only");
    check(summary.maxDistanceError > 0.0 && summary.maxDistanceError <= 0.3 + 1e-12,
          "distance error bounded by the shift");

    estimates.pop_back();
    bool thrown = false;
    try {
        evaluateEstimates(points, estimates);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "estimate count mismatch rejected");
}

int main() {
    test_reading();
    test_rejections();
    test_sample_generation();
    test_evaluation();
    std::cout << "All " << checks << " reader and utility checks passed!" << std::endl;
    return 0;
}

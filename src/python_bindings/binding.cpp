// src/python_bindings/binding.cpp
//
// PyBind11 bindings for the **CooperativeLocalizationEngine** framework.
// Exposes point construction, sample generation, record reading, the
// `localize` pipeline and scoring to Python, so that rendering and
// comparison scripts can drive the C++ core.
//
// Coordinates cross the boundary as NumPy arrays through `pybind11/eigen.h`;
// estimate vectors become lists of arrays. Engine exceptions are translated
// to Python exceptions with the same names.
//
// Key bindings:
// • `Point`: ground-truth node (id, type, coordinates).
// • `localize`: one run, returning estimates, snapshots and diagnostics.
// • `algorithms`: names of the registered strategies.
// • `generate_standard_sample`, `read_points`, `evaluate`.
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "Config.hpp"
#include "Engine.hpp"
#include "Errors.hpp"
#include "Localizer.hpp"
#include "Point.hpp"
#include "PointReader.hpp"
#include "util.hpp"
namespace py = pybind11;

/**
 * @brief Converts a run into a Python dict.
 *
 * Keys: `estimates`, `snapshots`, `under_determined`, `singular`,
 * `singular_recoveries`, `iterations`, `time_taken`, `edges`, `connected`,
 * `unlocalizable`.
 */
static py::dict runToDict(const LocalizationRun& run) {
    py::dict out;
    out["estimates"] = run.estimates;
    out["snapshots"] = run.snapshots;
    out["under_determined"] = run.diagnostics.underDetermined();
    out["singular"] = run.diagnostics.singular();
    out["singular_recoveries"] = run.diagnostics.singularRecoveries();
    out["iterations"] = run.diagnostics.iterations;
    out["time_taken"] = run.diagnostics.timeTaken;
    out["edges"] = run.graph.edgeCount();
    out["connected"] = run.graph.isConnected();
    out["unlocalizable"] = run.graph.unlocalizableAgents();
    return out;
}

/**
 * @brief PyBind11 module definition: `cle_bindings`
 */
PYBIND11_MODULE(cle_bindings, m) {
    m.doc() = "Python bindings for CooperativeLocalizationEngine";

    py::register_exception<LocalizationError>(m, "LocalizationError", PyExc_RuntimeError);
    py::register_exception<MalformedInputError>(m, "MalformedInputError", PyExc_ValueError);
    py::register_exception<CapabilityMissingError>(m, "CapabilityMissingError", PyExc_RuntimeError);
    py::register_exception<UnknownAlgorithmError>(m, "UnknownAlgorithmError", PyExc_KeyError);
    py::register_exception<DisconnectedGraphError>(m, "DisconnectedGraphError", PyExc_RuntimeError);

    py::enum_<PointType>(m, "PointType")
        .value("Anchor", PointType::Anchor)
        .value("Agent", PointType::Agent);

    py::class_<GroundTruthPoint>(m, "Point")
        .def(py::init<std::size_t, PointType, Coordinates>(),
             py::arg("id"), py::arg("type"), py::arg("coords"))
        .def_property_readonly("id", &GroundTruthPoint::id)
        .def_property_readonly("type", &GroundTruthPoint::type)
        .def_property_readonly("dim", &GroundTruthPoint::dim)
        .def_property_readonly("is_anchor", &GroundTruthPoint::isAnchor)
        .def_property_readonly("coords", &GroundTruthPoint::trueCoordinates);

    py::class_<RunConfig>(m, "RunConfig")
        .def(py::init<>())
        .def_readwrite("sigma", &RunConfig::sigma)
        .def_readwrite("visibility", &RunConfig::visibility)
        .def_readwrite("iterations", &RunConfig::iterations)
        .def_readwrite("seed", &RunConfig::seed)
        .def_readwrite("step_size", &RunConfig::stepSize)
        .def_readwrite("tolerance", &RunConfig::tolerance)
        .def_readwrite("require_connected", &RunConfig::requireConnected)
        .def_readwrite("verbose", &RunConfig::verbose)
        .def("validate", &RunConfig::validate);

    py::class_<EvaluationSummary>(m, "EvaluationSummary")
        .def_readonly("max_position_error", &EvaluationSummary::maxPositionError)
        .def_readonly("position_rmse", &EvaluationSummary::positionRmse)
        .def_readonly("max_distance_error", &EvaluationSummary::maxDistanceError)
        .def_readonly("distance_rmse", &EvaluationSummary::distanceRmse);

    m.def("localize",
          [](const std::vector<GroundTruthPoint>& points, const std::string& algorithm,
             const RunConfig& config, bool animate) {
              return runToDict(localize(points, algorithm, config, animate));
          },
          py::arg("points"), py::arg("algorithm"), py::arg("config") = RunConfig(),
          py::arg("animate") = false,
          "Build the measurement graph and run one strategy");
    m.def("algorithms", [] { return defaultRegistry().names(); },
          "Names of the registered strategies");
    m.def("generate_standard_sample", &generateStandardSample,
          py::arg("num_anchors") = 4, py::arg("num_agents") = 30,
          py::arg("margin") = 0.05, py::arg("seed") = 42,
          "Anchors on the unit-square perimeter, agents uniform inside");
    m.def("read_points", &readPointsFromFile, py::arg("path"),
          "Read point records from a file");
    m.def("evaluate", &evaluateEstimates, py::arg("points"), py::arg("estimates"),
          "Position and distance error summary");
}

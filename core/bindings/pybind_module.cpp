// PyBind11 bindings for the geopat core.
// Exposes points, patterns, point sets, MTPs/TECs and the discovery
// algorithms (instantiated for Point2D) to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DGEOPAT_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/operators.h>

#include <sstream>

#include "point_set/point.hpp"
#include "point_set/pattern.hpp"
#include "point_set/point_set.hpp"
#include "point_set/tec.hpp"
#include "discovery/algorithm_config.hpp"
#include "discovery/algorithm_factory.hpp"
#include "discovery/heuristic.hpp"
#include "search/exact_matcher.hpp"
#include "search/partial_matcher.hpp"
#include "util/logging.hpp"

namespace py = pybind11;

namespace {

using geopat::Point2D;
using PyPattern = geopat::Pattern<Point2D>;
using PyPointSet = geopat::PointSet<Point2D>;
using PyTec = geopat::Tec<Point2D>;
using PyMtp = geopat::Mtp<Point2D>;

template <typename T>
std::string repr(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

PyPointSet pointSetFromTuples(const std::vector<std::pair<double, double>>& tuples) {
    std::vector<Point2D> points;
    points.reserve(tuples.size());
    for (const auto& t : tuples) points.emplace_back(t.first, t.second);
    return PyPointSet(std::move(points));
}

} // namespace

PYBIND11_MODULE(geopat_bindings, m) {
    m.doc() = "geopat: geometric pattern discovery in point sets";

    // ── Logging ──
    py::enum_<geopat::LogLevel>(m, "LogLevel")
        .value("TRACE", geopat::LogLevel::Trace)
        .value("DEBUG", geopat::LogLevel::Debug)
        .value("INFO", geopat::LogLevel::Info)
        .value("WARNING", geopat::LogLevel::Warning)
        .value("ERROR", geopat::LogLevel::Error)
        .value("CRITICAL", geopat::LogLevel::Critical)
        .value("OFF", geopat::LogLevel::Off);
    m.def("set_log_level", &geopat::setLogLevel);

    // ── Point2D ──
    py::class_<Point2D>(m, "Point2D")
        .def(py::init<>())
        .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &Point2D::x)
        .def_readwrite("y", &Point2D::y)
        .def("is_zero", &Point2D::isZero)
        .def("component", &Point2D::component)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * double())
        .def(py::self == py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const Point2D& p) { return std::hash<Point2D>{}(p); })
        .def("__repr__", &repr<Point2D>);

    // ── Pattern ──
    py::class_<PyPattern>(m, "Pattern")
        .def(py::init<>())
        .def(py::init<std::vector<Point2D>>())
        .def("__len__", &PyPattern::size)
        .def("__getitem__", [](const PyPattern& p, size_t i) {
            if (i >= p.size()) throw py::index_error();
            return p[i];
        })
        .def("points", &PyPattern::points)
        .def("vectorize", &PyPattern::vectorize)
        .def("translate", &PyPattern::translate)
        .def(py::self == py::self)
        .def("__repr__", &repr<PyPattern>);

    // ── PointSet ──
    py::class_<PyPointSet>(m, "PointSet")
        .def(py::init<>())
        .def(py::init<std::vector<Point2D>>())
        .def(py::init(&pointSetFromTuples))
        .def("__len__", &PyPointSet::size)
        .def("__getitem__", [](const PyPointSet& s, size_t i) {
            if (i >= s.size()) throw py::index_error();
            return s[i];
        })
        .def("points", &PyPointSet::points)
        .def("get_pattern", &PyPointSet::getPattern)
        .def("translate", &PyPointSet::translate)
        .def("intersect", &PyPointSet::intersect)
        .def("union", &PyPointSet::unionWith)
        .def("difference", &PyPointSet::difference)
        .def("contains", &PyPointSet::contains)
        .def(py::self == py::self);

    // ── Mtp / Tec ──
    py::class_<PyMtp>(m, "Mtp")
        .def_readwrite("translator", &PyMtp::translator)
        .def_readwrite("pattern", &PyMtp::pattern)
        .def("__repr__", &repr<PyMtp>);

    py::class_<PyTec>(m, "Tec")
        .def(py::init<>())
        .def(py::init<PyPattern, std::vector<Point2D>>())
        .def_readwrite("pattern", &PyTec::pattern)
        .def_readwrite("translators", &PyTec::translators)
        .def("expand", &PyTec::expand)
        .def("covered_set", &PyTec::coveredSet)
        .def("conjugate", &PyTec::conjugate)
        .def("remove_redundant_translators", &PyTec::removeRedundantTranslators)
        .def(py::self == py::self)
        .def("__repr__", &repr<PyTec>);

    m.def("remove_translational_duplicates", [](std::vector<PyTec> tecs) {
        geopat::removeTranslationalDuplicates(tecs);
        return tecs;
    });

    m.def("comp_ratio", [](const PyTec& tec, const PyPointSet& point_set) {
        return geopat::statsOf(tec, point_set).comp_ratio;
    });

    // ── AlgorithmConfig ──
    py::enum_<geopat::AlgorithmKind>(m, "AlgorithmKind")
        .value("SIA", geopat::AlgorithmKind::Sia)
        .value("SIAR", geopat::AlgorithmKind::SiaR)
        .value("SIATEC", geopat::AlgorithmKind::Siatec)
        .value("SIATEC_C", geopat::AlgorithmKind::SiatecC)
        .value("SIATEC_CH", geopat::AlgorithmKind::SiatecCH);

    py::enum_<geopat::Covering>(m, "Covering")
        .value("NONE", geopat::Covering::None)
        .value("COSIATEC", geopat::Covering::Cosiatec)
        .value("SIATEC_COMPRESS", geopat::Covering::SiatecCompress);

    py::class_<geopat::AlgorithmConfig>(m, "AlgorithmConfig")
        .def(py::init<>())
        .def_readwrite("kind", &geopat::AlgorithmConfig::kind)
        .def_readwrite("r", &geopat::AlgorithmConfig::r)
        .def_readwrite("remove_duplicates", &geopat::AlgorithmConfig::remove_duplicates)
        .def_readwrite("max_ioi", &geopat::AlgorithmConfig::max_ioi)
        .def_readwrite("covering", &geopat::AlgorithmConfig::covering)
        .def("validate", &geopat::AlgorithmConfig::validate)
        .def("describe", &geopat::AlgorithmConfig::describe);

    m.def("parse_algorithm", &geopat::parseAlgorithmKind);
    m.def("parse_covering", &geopat::parseCovering);

    // ── Discovery ──
    m.def("discover_mtps",
          [](const PyPointSet& point_set, const geopat::AlgorithmConfig& config) {
              return geopat::makeMtpAlgorithm<Point2D>(config)->computeMtps(point_set);
          },
          py::arg("point_set"), py::arg("config"));

    m.def("discover_tecs",
          [](const PyPointSet& point_set, const geopat::AlgorithmConfig& config) {
              return geopat::makeTecAlgorithm<Point2D>(config)->computeTecs(point_set);
          },
          py::arg("point_set"), py::arg("config"));

    m.def("discover_tecs_to_output",
          [](const PyPointSet& point_set, const geopat::AlgorithmConfig& config,
             const std::function<void(PyTec)>& on_output) {
              geopat::makeTecAlgorithm<Point2D>(config)->computeTecsToOutput(point_set, on_output);
          },
          py::arg("point_set"), py::arg("config"), py::arg("on_output"));

    // ── Pattern search ──
    m.def("find_exact_matches", [](const PyPattern& query, const PyPointSet& point_set) {
        return geopat::ExactMatcher<Point2D>().findOccurrences(query, point_set);
    });
    m.def("find_partial_matches",
          [](const PyPattern& query, const PyPointSet& point_set, size_t min_match_size) {
              return geopat::PartialMatcher<Point2D>(min_match_size).findOccurrences(query, point_set);
          },
          py::arg("query"), py::arg("point_set"), py::arg("min_match_size"));
}

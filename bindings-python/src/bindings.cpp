#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <private_analytics/generalizer.hpp>
#include <private_analytics/phi_detector.hpp>
#include <private_analytics_runtime_eigen/mechanisms.hpp>
#include <private_analytics_runtime_eigen/utilities.hpp>

using namespace private_analytics;

// following examples from:
// https://pybind11.readthedocs.io/en/stable/classes.html
PYBIND11_MODULE(bindings_python, m) {
    m.doc() = "private analytics python module";

    pybind11::enum_<PhiCategory>(m, "PhiCategory")
            .value("NONE", PhiCategory::None)
            .value("DIRECT_IDENTIFIER", PhiCategory::DirectIdentifier)
            .value("CLINICAL_TERMINOLOGY", PhiCategory::ClinicalTerminology)
            .value("PERSISTENT_IDENTIFIER", PhiCategory::PersistentIdentifier)
            .value("PRECISE_COORDINATES", PhiCategory::PreciseCoordinates)
            .value("MILLISECOND_TIMESTAMP", PhiCategory::MillisecondTimestamp);

    pybind11::class_<PhiDetector>(m, "PhiDetector")
            .def(pybind11::init<>())
            .def("scan", &PhiDetector::scan)
            .def("add_pattern", &PhiDetector::add_pattern)
            .def_property_readonly("pattern_count", &PhiDetector::pattern_count);

    pybind11::class_<QuasiIdentifiers>(m, "QuasiIdentifiers")
            .def(pybind11::init<std::string, std::string, std::string, std::string>())
            .def_property_readonly("age_range", &QuasiIdentifiers::age_range)
            .def_property_readonly("region", &QuasiIdentifiers::region)
            .def_property_readonly("platform", &QuasiIdentifiers::platform)
            .def_property_readonly("app_version", &QuasiIdentifiers::app_version)
            .def("__eq__", &QuasiIdentifiers::operator==);

    pybind11::class_<QuasiIdentifierGeneralizer>(m, "QuasiIdentifierGeneralizer")
            .def(pybind11::init<int, std::string>())
            .def("generalize_age", &QuasiIdentifierGeneralizer::generalize_age)
            .def("generalize_region", &QuasiIdentifierGeneralizer::generalize_region)
            .def("generalize_platform", &QuasiIdentifierGeneralizer::generalize_platform)
            .def("generalize_app_version", &QuasiIdentifierGeneralizer::generalize_app_version)
            .def("is_generalized", &QuasiIdentifierGeneralizer::is_generalized);

    m.def("laplace_scale", &laplaceScale);
    m.def("gaussian_sigma", &gaussianSigma);
    m.def("laplace_mechanism", [](double value, double epsilon, double sensitivity) {
        return value + sampleLaplace(0., laplaceScale(epsilon, sensitivity));
    });
    m.def("gaussian_mechanism", [](double value, double epsilon, double delta, double sensitivity) {
        return value + sampleGaussian(0., gaussianSigma(epsilon, delta, sensitivity));
    });
    m.def("normalize_for_scan", &normalizeForScan);
}

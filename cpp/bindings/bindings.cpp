#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "rcflex/errors.hpp"
#include "rcflex/warnings.hpp"
#include "rcflex/material.hpp"
#include "rcflex/section.hpp"
#include "rcflex/steel_layer.hpp"
#include "rcflex/interaction_curve.hpp"
#include "rcflex/capacity_evaluator.hpp"
#include "rcflex/demand.hpp"
#include "rcflex/element_category.hpp"
#include "rcflex/slenderness.hpp"
#include "rcflex/demand_verifier.hpp"
#include "rcflex/curve_cache.hpp"

namespace py = pybind11;

/**
 * rcflex C++ Python bindings module.
 * Exposes section capacity, slenderness and verification to Python.
 */
PYBIND11_MODULE(_rcflex_cpp, m) {
    m.doc() = "rcflex C++ core module - P-M interaction and flexure-compression verification";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<rcflex::ErrorCode>(m, "ErrorCode", "Error codes for rcflex failures")
        .value("OK", rcflex::ErrorCode::OK, "No error")
        .value("INVALID_GEOMETRY", rcflex::ErrorCode::INVALID_GEOMETRY,
               "Section dimension is zero or negative")
        .value("INVALID_COVER", rcflex::ErrorCode::INVALID_COVER,
               "Cover is negative or leaves no room for reinforcement")
        .value("INVALID_MEMBER_LENGTH", rcflex::ErrorCode::INVALID_MEMBER_LENGTH,
               "Member length or effective length factor is not positive")
        .value("INVALID_MATERIAL", rcflex::ErrorCode::INVALID_MATERIAL,
               "Material strength is zero or negative")
        .value("INVALID_STIFFNESS_FACTOR", rcflex::ErrorCode::INVALID_STIFFNESS_FACTOR,
               "Stiffness factor outside (0, 1]")
        .value("INVALID_REINFORCEMENT", rcflex::ErrorCode::INVALID_REINFORCEMENT,
               "Layer does not fit the section")
        .value("INVALID_LAYOUT", rcflex::ErrorCode::INVALID_LAYOUT,
               "Layout parameters cannot produce layers")
        .value("SLENDERNESS_LIMIT_EXCEEDED", rcflex::ErrorCode::SLENDERNESS_LIMIT_EXCEEDED,
               "Slenderness above the admitted maximum")
        .value("UNSTABLE_MEMBER", rcflex::ErrorCode::UNSTABLE_MEMBER,
               "Axial load reaches the critical buckling load")
        .value("INVALID_SETTINGS", rcflex::ErrorCode::INVALID_SETTINGS,
               "Calculation setting outside its admissible range")
        .value("UNKNOWN_ERROR", rcflex::ErrorCode::UNKNOWN_ERROR, "Unknown error")
        .export_values();

    py::class_<rcflex::RcflexError>(m, "RcflexError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<rcflex::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &rcflex::RcflexError::code)
        .def_readwrite("message", &rcflex::RcflexError::message)
        .def_readwrite("details", &rcflex::RcflexError::details)
        .def_readwrite("suggestion", &rcflex::RcflexError::suggestion)
        .def("is_ok", &rcflex::RcflexError::is_ok)
        .def("is_error", &rcflex::RcflexError::is_error)
        .def("code_string", &rcflex::RcflexError::code_string)
        .def("to_string", &rcflex::RcflexError::to_string)
        .def("__repr__", [](const rcflex::RcflexError &e) {
            if (e.is_ok()) return std::string("<RcflexError OK>");
            return "<RcflexError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &rcflex::RcflexError::to_string)
        .def("__bool__", [](const rcflex::RcflexError &e) { return e.is_error(); });

    py::register_exception<rcflex::InputError>(m, "InputError", PyExc_ValueError);

    py::enum_<rcflex::WarningCode>(m, "WarningCode", "Warning codes for verification diagnostics")
        .value("RAY_FALLBACK_ANGULAR", rcflex::WarningCode::RAY_FALLBACK_ANGULAR)
        .value("RAY_FALLBACK_POLYGON", rcflex::WarningCode::RAY_FALLBACK_POLYGON)
        .value("EXCEEDS_AXIAL_CAPACITY", rcflex::WarningCode::EXCEEDS_AXIAL_CAPACITY)
        .value("EXCEEDS_TENSION_CAPACITY", rcflex::WarningCode::EXCEEDS_TENSION_CAPACITY)
        .value("NET_TENSION", rcflex::WarningCode::NET_TENSION)
        .value("SLENDER_MEMBER", rcflex::WarningCode::SLENDER_MEMBER)
        .value("UNSTABLE_MAGNIFICATION", rcflex::WarningCode::UNSTABLE_MAGNIFICATION)
        .value("MINIMUM_MOMENT_CONTROLS", rcflex::WarningCode::MINIMUM_MOMENT_CONTROLS)
        .value("SECOND_ORDER_LIMIT_EXCEEDED", rcflex::WarningCode::SECOND_ORDER_LIMIT_EXCEEDED)
        .value("EMPIRICAL_METHOD_INAPPLICABLE", rcflex::WarningCode::EMPIRICAL_METHOD_INAPPLICABLE)
        .value("NO_REINFORCEMENT", rcflex::WarningCode::NO_REINFORCEMENT)
        .export_values();

    py::enum_<rcflex::WarningSeverity>(m, "WarningSeverity")
        .value("Low", rcflex::WarningSeverity::Low)
        .value("Medium", rcflex::WarningSeverity::Medium)
        .value("High", rcflex::WarningSeverity::High)
        .export_values();

    py::class_<rcflex::RcflexWarning>(m, "RcflexWarning")
        .def_readonly("code", &rcflex::RcflexWarning::code)
        .def_readonly("severity", &rcflex::RcflexWarning::severity)
        .def_readonly("message", &rcflex::RcflexWarning::message)
        .def_readonly("combinations", &rcflex::RcflexWarning::combinations)
        .def_readonly("details", &rcflex::RcflexWarning::details)
        .def_readonly("suggestion", &rcflex::RcflexWarning::suggestion)
        .def("to_string", &rcflex::RcflexWarning::to_string)
        .def("__repr__", [](const rcflex::RcflexWarning &w) {
            return "<RcflexWarning " + w.code_string() + " [" + w.severity_string() + "]>";
        });

    py::class_<rcflex::WarningList>(m, "WarningList")
        .def(py::init<>())
        .def_readonly("warnings", &rcflex::WarningList::warnings)
        .def("has_warnings", &rcflex::WarningList::has_warnings)
        .def("count", &rcflex::WarningList::count)
        .def("contains", &rcflex::WarningList::contains, py::arg("code"))
        .def("summary", &rcflex::WarningList::summary)
        .def("__len__", &rcflex::WarningList::count);

    // ========================================================================
    // Materials, section and reinforcement
    // ========================================================================

    py::class_<rcflex::Concrete>(m, "Concrete", "Concrete material (f'c in MPa)")
        .def(py::init<double, std::string, double>(),
             py::arg("fc"), py::arg("name") = "", py::arg("lambda_") = 1.0)
        .def_readonly("name", &rcflex::Concrete::name)
        .def_readonly("fc", &rcflex::Concrete::fc)
        .def_readonly("Ec", &rcflex::Concrete::Ec)
        .def_readonly("beta1", &rcflex::Concrete::beta1)
        .def_readonly("lambda_", &rcflex::Concrete::lambda)
        .def("__repr__", [](const rcflex::Concrete &c) {
            return "<Concrete '" + c.name + "' fc=" + std::to_string(c.fc) + ">";
        });

    py::class_<rcflex::ReinforcingSteel>(m, "ReinforcingSteel", "Elasto-plastic reinforcing steel (MPa)")
        .def(py::init<double, std::string, double>(),
             py::arg("fy"), py::arg("name") = "", py::arg("Es") = 200000.0)
        .def_readonly("name", &rcflex::ReinforcingSteel::name)
        .def_readonly("fy", &rcflex::ReinforcingSteel::fy)
        .def_readonly("Es", &rcflex::ReinforcingSteel::Es)
        .def("epsilon_y", &rcflex::ReinforcingSteel::epsilon_y)
        .def("stress", &rcflex::ReinforcingSteel::stress, py::arg("strain"))
        .def("__repr__", [](const rcflex::ReinforcingSteel &s) {
            return "<ReinforcingSteel '" + s.name + "' fy=" + std::to_string(s.fy) + ">";
        });

    py::class_<rcflex::RectangularSection>(m, "RectangularSection", "Rectangular RC section (mm)")
        .def(py::init<double, double, double, int, std::string>(),
             py::arg("b"), py::arg("h"), py::arg("cover") = 25.0,
             py::arg("id") = 0, py::arg("name") = "")
        .def_readonly("id", &rcflex::RectangularSection::id)
        .def_readonly("name", &rcflex::RectangularSection::name)
        .def_readonly("b", &rcflex::RectangularSection::b)
        .def_readonly("h", &rcflex::RectangularSection::h)
        .def_readonly("cover", &rcflex::RectangularSection::cover)
        .def("Ag", &rcflex::RectangularSection::Ag)
        .def("Ig", &rcflex::RectangularSection::Ig)
        .def("rotated", &rcflex::RectangularSection::rotated)
        .def("__repr__", [](const rcflex::RectangularSection &s) {
            return "<RectangularSection " + std::to_string(s.b) + "x" + std::to_string(s.h) + ">";
        });

    py::class_<rcflex::SteelLayer>(m, "SteelLayer", "Reinforcement layer (position from compression face, area)")
        .def(py::init<double, double>(), py::arg("position"), py::arg("area"))
        .def_readonly("position", &rcflex::SteelLayer::position)
        .def_readonly("area", &rcflex::SteelLayer::area)
        .def("__repr__", [](const rcflex::SteelLayer &l) {
            return "<SteelLayer d=" + std::to_string(l.position) +
                   " As=" + std::to_string(l.area) + ">";
        });

    m.def("bar_area", &rcflex::bar_area, py::arg("diameter"));
    m.def("two_layer_layout", &rcflex::two_layer_layout,
          py::arg("h"), py::arg("cover"), py::arg("As_total"));
    m.def("column_layers", &rcflex::column_layers,
          py::arg("dimension"), py::arg("cover"), py::arg("n_layers"),
          py::arg("bars_per_layer"), py::arg("bar_area"));
    m.def("wall_layers", &rcflex::wall_layers,
          py::arg("length"), py::arg("cover"), py::arg("n_meshes"), py::arg("n_edge_bars"),
          py::arg("bar_area_edge"), py::arg("bar_area_mesh"), py::arg("spacing"));
    m.def("total_area", &rcflex::total_area, py::arg("layers"));
    m.def("effective_depth", &rcflex::effective_depth, py::arg("layers"));

    // ========================================================================
    // Interaction curve
    // ========================================================================

    py::class_<rcflex::CapacityPoint>(m, "CapacityPoint")
        .def_readonly("Pn", &rcflex::CapacityPoint::Pn)
        .def_readonly("Mn", &rcflex::CapacityPoint::Mn)
        .def_readonly("phi", &rcflex::CapacityPoint::phi)
        .def_readonly("phi_Pn", &rcflex::CapacityPoint::phi_Pn)
        .def_readonly("phi_Mn", &rcflex::CapacityPoint::phi_Mn)
        .def_readonly("c", &rcflex::CapacityPoint::c)
        .def_readonly("epsilon_t", &rcflex::CapacityPoint::epsilon_t);

    py::class_<rcflex::InteractionCurveSettings>(m, "InteractionCurveSettings")
        .def(py::init<>())
        .def_readwrite("n_points", &rcflex::InteractionCurveSettings::n_points)
        .def_readwrite("epsilon_cu", &rcflex::InteractionCurveSettings::epsilon_cu)
        .def_readwrite("phi_compression", &rcflex::InteractionCurveSettings::phi_compression)
        .def_readwrite("phi_spiral", &rcflex::InteractionCurveSettings::phi_spiral)
        .def_readwrite("phi_tension", &rcflex::InteractionCurveSettings::phi_tension)
        .def_readwrite("spiral", &rcflex::InteractionCurveSettings::spiral)
        .def_readwrite("compression_cap", &rcflex::InteractionCurveSettings::compression_cap);

    py::class_<rcflex::InteractionCurve, std::shared_ptr<rcflex::InteractionCurve>>(m, "InteractionCurve",
        "Immutable P-M interaction diagram (kN, kN·m)")
        .def("points", &rcflex::InteractionCurve::points)
        .def("design_curve", &rcflex::InteractionCurve::design_curve)
        .def("nominal_curve", &rcflex::InteractionCurve::nominal_curve)
        .def("phi_Pn_max", &rcflex::InteractionCurve::phi_Pn_max)
        .def("phi_Pt_min", &rcflex::InteractionCurve::phi_Pt_min)
        .def("with_compression_reduction", &rcflex::InteractionCurve::with_compression_reduction,
             py::arg("factor"))
        .def("nearest_point", &rcflex::InteractionCurve::nearest_point,
             py::arg("Mu"), py::arg("Pu"))
        .def("__len__", &rcflex::InteractionCurve::size);

    py::class_<rcflex::InteractionCurveBuilder>(m, "InteractionCurveBuilder")
        .def(py::init<rcflex::InteractionCurveSettings>(),
             py::arg("settings") = rcflex::InteractionCurveSettings{})
        .def("build",
             py::overload_cast<const rcflex::RectangularSection&, const rcflex::Concrete&,
                               const rcflex::ReinforcingSteel&, const std::vector<rcflex::SteelLayer>&>(
                 &rcflex::InteractionCurveBuilder::build, py::const_),
             py::arg("section"), py::arg("concrete"), py::arg("steel"), py::arg("layers"))
        .def("build",
             py::overload_cast<const rcflex::RectangularSection&, const rcflex::Concrete&,
                               const rcflex::ReinforcingSteel&, double>(
                 &rcflex::InteractionCurveBuilder::build, py::const_),
             py::arg("section"), py::arg("concrete"), py::arg("steel"), py::arg("As_total"))
        .def_static("squash_load", &rcflex::InteractionCurveBuilder::squash_load,
                    py::arg("section"), py::arg("concrete"), py::arg("steel"), py::arg("As_total"));

    // ========================================================================
    // Capacity evaluation
    // ========================================================================

    py::enum_<rcflex::RayCastTier>(m, "RayCastTier")
        .value("ZeroDemand", rcflex::RayCastTier::ZeroDemand)
        .value("Intersection", rcflex::RayCastTier::Intersection)
        .value("AngularNearest", rcflex::RayCastTier::AngularNearest)
        .value("PointInPolygon", rcflex::RayCastTier::PointInPolygon)
        .export_values();

    py::class_<rcflex::CapacityEvaluatorSettings>(m, "CapacityEvaluatorSettings")
        .def(py::init<>())
        .def_readwrite("angular_tolerance_deg", &rcflex::CapacityEvaluatorSettings::angular_tolerance_deg)
        .def_readwrite("ample_safety_factor", &rcflex::CapacityEvaluatorSettings::ample_safety_factor)
        .def_readwrite("insufficient_safety_factor",
                       &rcflex::CapacityEvaluatorSettings::insufficient_safety_factor);

    py::class_<rcflex::RayCastResult>(m, "RayCastResult")
        .def_readonly("safety_factor", &rcflex::RayCastResult::safety_factor)
        .def_readonly("inside", &rcflex::RayCastResult::inside)
        .def_readonly("tier", &rcflex::RayCastResult::tier)
        .def_readonly("capacity_distance", &rcflex::RayCastResult::capacity_distance);

    py::class_<rcflex::DemandPoint>(m, "DemandPoint")
        .def(py::init<double, double, std::string>(),
             py::arg("Pu"), py::arg("Mu"), py::arg("label") = "")
        .def_readwrite("Pu", &rcflex::DemandPoint::Pu)
        .def_readwrite("Mu", &rcflex::DemandPoint::Mu)
        .def_readwrite("label", &rcflex::DemandPoint::label);

    py::class_<rcflex::ComboResult>(m, "ComboResult")
        .def_readonly("label", &rcflex::ComboResult::label)
        .def_readonly("Pu", &rcflex::ComboResult::Pu)
        .def_readonly("Mu", &rcflex::ComboResult::Mu)
        .def_readonly("safety_factor", &rcflex::ComboResult::safety_factor)
        .def_readonly("dcr", &rcflex::ComboResult::dcr)
        .def_readonly("phi_Mn_at_Pu", &rcflex::ComboResult::phi_Mn_at_Pu)
        .def_readonly("is_tension", &rcflex::ComboResult::is_tension)
        .def_readonly("inside", &rcflex::ComboResult::inside)
        .def_readonly("tier", &rcflex::ComboResult::tier);

    py::class_<rcflex::FlexureCheck>(m, "FlexureCheck")
        .def_readonly("safety_factor", &rcflex::FlexureCheck::safety_factor)
        .def_readonly("ok", &rcflex::FlexureCheck::ok)
        .def_readonly("critical_combo", &rcflex::FlexureCheck::critical_combo)
        .def_readonly("critical_Pu", &rcflex::FlexureCheck::critical_Pu)
        .def_readonly("critical_Mu", &rcflex::FlexureCheck::critical_Mu)
        .def_readonly("phi_Mn_0", &rcflex::FlexureCheck::phi_Mn_0)
        .def_readonly("phi_Mn_at_Pu", &rcflex::FlexureCheck::phi_Mn_at_Pu)
        .def_readonly("phi_Pn_max", &rcflex::FlexureCheck::phi_Pn_max)
        .def_readonly("phi_Pt_min", &rcflex::FlexureCheck::phi_Pt_min)
        .def_readonly("exceeds_axial_capacity", &rcflex::FlexureCheck::exceeds_axial_capacity)
        .def_readonly("exceeds_tension_capacity", &rcflex::FlexureCheck::exceeds_tension_capacity)
        .def_readonly("has_tension", &rcflex::FlexureCheck::has_tension)
        .def_readonly("tension_combos", &rcflex::FlexureCheck::tension_combos)
        .def_readonly("angular_fallbacks", &rcflex::FlexureCheck::angular_fallbacks)
        .def_readonly("polygon_fallbacks", &rcflex::FlexureCheck::polygon_fallbacks)
        .def_readonly("combos", &rcflex::FlexureCheck::combos)
        .def_readonly("warnings", &rcflex::FlexureCheck::warnings)
        .def("dcr", &rcflex::FlexureCheck::dcr)
        .def("status", &rcflex::FlexureCheck::status);

    py::class_<rcflex::CapacityEvaluator>(m, "CapacityEvaluator")
        .def(py::init<rcflex::CapacityEvaluatorSettings>(),
             py::arg("settings") = rcflex::CapacityEvaluatorSettings{})
        .def("safety_factor",
             py::overload_cast<const rcflex::InteractionCurve&, double, double>(
                 &rcflex::CapacityEvaluator::safety_factor, py::const_),
             py::arg("curve"), py::arg("Pu"), py::arg("Mu"))
        .def("phi_Mn_at_P", &rcflex::CapacityEvaluator::phi_Mn_at_P, py::arg("curve"), py::arg("Pu"))
        .def("phi_Mn_at_P0", &rcflex::CapacityEvaluator::phi_Mn_at_P0, py::arg("curve"))
        .def("check_flexure", &rcflex::CapacityEvaluator::check_flexure,
             py::arg("curve"), py::arg("demands"));

    // ========================================================================
    // Demand extraction
    // ========================================================================

    py::enum_<rcflex::MomentAxis>(m, "MomentAxis")
        .value("M2", rcflex::MomentAxis::M2)
        .value("M3", rcflex::MomentAxis::M3)
        .value("Combined", rcflex::MomentAxis::Combined)
        .value("SRSS", rcflex::MomentAxis::SRSS)
        .export_values();

    py::class_<rcflex::CombinationForces>(m, "CombinationForces")
        .def(py::init<>())
        .def_readwrite("name", &rcflex::CombinationForces::name)
        .def_readwrite("location", &rcflex::CombinationForces::location)
        .def_readwrite("P", &rcflex::CombinationForces::P)
        .def_readwrite("V2", &rcflex::CombinationForces::V2)
        .def_readwrite("V3", &rcflex::CombinationForces::V3)
        .def_readwrite("M2", &rcflex::CombinationForces::M2)
        .def_readwrite("M3", &rcflex::CombinationForces::M3)
        .def("label", &rcflex::CombinationForces::label);

    m.def("extract_demands", &rcflex::extract_demands,
          py::arg("combinations"), py::arg("axis"), py::arg("angle_deg") = 0.0);

    // ========================================================================
    // Element categories and slenderness
    // ========================================================================

    py::enum_<rcflex::DesignBehavior>(m, "DesignBehavior")
        .value("Beam", rcflex::DesignBehavior::Beam)
        .value("Column", rcflex::DesignBehavior::Column)
        .value("SeismicColumn", rcflex::DesignBehavior::SeismicColumn)
        .value("WallPierColumn", rcflex::DesignBehavior::WallPierColumn)
        .value("WallPierAlternate", rcflex::DesignBehavior::WallPierAlternate)
        .value("Wall", rcflex::DesignBehavior::Wall)
        .value("SquatWall", rcflex::DesignBehavior::SquatWall)
        .value("DropBeam", rcflex::DesignBehavior::DropBeam)
        .export_values();

    py::class_<rcflex::BeamCategory>(m, "BeamCategory").def(py::init<>());
    py::class_<rcflex::ColumnCategory>(m, "ColumnCategory")
        .def(py::init<>())
        .def_readwrite("seismic", &rcflex::ColumnCategory::seismic);
    py::class_<rcflex::WallCategory>(m, "WallCategory")
        .def(py::init<>())
        .def_readwrite("lw", &rcflex::WallCategory::lw)
        .def_readwrite("tw", &rcflex::WallCategory::tw)
        .def_readwrite("hw", &rcflex::WallCategory::hw)
        .def_readwrite("cracked", &rcflex::WallCategory::cracked);
    py::class_<rcflex::DropBeamCategory>(m, "DropBeamCategory").def(py::init<>());

    py::class_<rcflex::BehaviorProfile>(m, "BehaviorProfile")
        .def_readonly("behavior", &rcflex::BehaviorProfile::behavior)
        .def_readonly("requires_pm_diagram", &rcflex::BehaviorProfile::requires_pm_diagram)
        .def_readonly("requires_seismic_checks", &rcflex::BehaviorProfile::requires_seismic_checks)
        .def_readonly("requires_column_checks", &rcflex::BehaviorProfile::requires_column_checks)
        .def_readonly("requires_wall_checks", &rcflex::BehaviorProfile::requires_wall_checks)
        .def_readonly("requires_confinement", &rcflex::BehaviorProfile::requires_confinement)
        .def_readonly("stiffness_factor", &rcflex::BehaviorProfile::stiffness_factor)
        .def_readonly("default_k", &rcflex::BehaviorProfile::default_k);

    m.def("resolve",
          [](const rcflex::ElementCategory& category) { return rcflex::resolve(category); },
          py::arg("category"));

    py::enum_<rcflex::MagnificationStatus>(m, "MagnificationStatus")
        .value("NotRequired", rcflex::MagnificationStatus::NotRequired)
        .value("Magnified", rcflex::MagnificationStatus::Magnified)
        .value("Unstable", rcflex::MagnificationStatus::Unstable)
        .export_values();

    py::class_<rcflex::SlendernessInput>(m, "SlendernessInput")
        .def(py::init<>())
        .def_readwrite("lu", &rcflex::SlendernessInput::lu)
        .def_readwrite("t", &rcflex::SlendernessInput::t)
        .def_readwrite("b", &rcflex::SlendernessInput::b)
        .def_readwrite("k", &rcflex::SlendernessInput::k)
        .def_readwrite("fc", &rcflex::SlendernessInput::fc)
        .def_readwrite("stiffness_factor", &rcflex::SlendernessInput::stiffness_factor)
        .def_readwrite("Cm", &rcflex::SlendernessInput::Cm)
        .def_readwrite("braced", &rcflex::SlendernessInput::braced)
        .def_readwrite("Pu", &rcflex::SlendernessInput::Pu);

    py::class_<rcflex::SlendernessResult>(m, "SlendernessResult")
        .def_readonly("lu", &rcflex::SlendernessResult::lu)
        .def_readonly("t", &rcflex::SlendernessResult::t)
        .def_readonly("k", &rcflex::SlendernessResult::k)
        .def_readonly("r", &rcflex::SlendernessResult::r)
        .def_readonly("lambda_ratio", &rcflex::SlendernessResult::lambda_ratio)
        .def_readonly("is_slender", &rcflex::SlendernessResult::is_slender)
        .def_readonly("lambda_limit", &rcflex::SlendernessResult::lambda_limit)
        .def_readonly("Pc", &rcflex::SlendernessResult::Pc)
        .def_readonly("Cm", &rcflex::SlendernessResult::Cm)
        .def_readonly("delta_ns", &rcflex::SlendernessResult::delta_ns)
        .def_readonly("status", &rcflex::SlendernessResult::status)
        .def_readonly("buckling_factor", &rcflex::SlendernessResult::buckling_factor)
        .def_property_readonly("EI_eff", [](const rcflex::SlendernessResult &r) {
            return r.stiffness.EI_eff;
        })
        .def_property_readonly("reduction_factor", [](const rcflex::SlendernessResult &r) {
            return r.reduction.factor;
        })
        .def_property_readonly("rejected", [](const rcflex::SlendernessResult &r) {
            return r.reduction.rejected;
        });

    py::class_<rcflex::SlendernessAnalyzer>(m, "SlendernessAnalyzer")
        .def(py::init<>())
        .def("analyze",
             py::overload_cast<const rcflex::SlendernessInput&>(
                 &rcflex::SlendernessAnalyzer::analyze, py::const_),
             py::arg("input"))
        .def("magnification", [](const rcflex::SlendernessAnalyzer &a,
                                 const rcflex::SlendernessResult &r, double Pu) {
            auto mag = a.magnification(r, Pu);
            return py::make_tuple(mag.delta, mag.status);
        }, py::arg("result"), py::arg("Pu"))
        .def("M2_min", &rcflex::SlendernessAnalyzer::M2_min, py::arg("Pu"), py::arg("h"));

    // ========================================================================
    // Verification and caching
    // ========================================================================

    py::enum_<rcflex::VerificationStatus>(m, "VerificationStatus")
        .value("Ok", rcflex::VerificationStatus::Ok)
        .value("NotOk", rcflex::VerificationStatus::NotOk)
        .value("Unstable", rcflex::VerificationStatus::Unstable)
        .value("SlendernessRejected", rcflex::VerificationStatus::SlendernessRejected)
        .export_values();

    py::enum_<rcflex::SlendernessTreatment>(m, "SlendernessTreatment")
        .value("MagnifyDemand", rcflex::SlendernessTreatment::MagnifyDemand)
        .value("ReduceCapacity", rcflex::SlendernessTreatment::ReduceCapacity)
        .export_values();

    py::class_<rcflex::VerificationSettings>(m, "VerificationSettings")
        .def(py::init<>())
        .def_readwrite("slenderness_treatment", &rcflex::VerificationSettings::slenderness_treatment)
        .def_readwrite("apply_minimum_moment", &rcflex::VerificationSettings::apply_minimum_moment);

    py::class_<rcflex::VerificationResult>(m, "VerificationResult")
        .def_readonly("status", &rcflex::VerificationResult::status)
        .def_readonly("flexure", &rcflex::VerificationResult::flexure)
        .def_readonly("slenderness_applied", &rcflex::VerificationResult::slenderness_applied)
        .def_readonly("capacity_reduction", &rcflex::VerificationResult::capacity_reduction)
        .def_readonly("unstable_combinations", &rcflex::VerificationResult::unstable_combinations)
        .def_readonly("warnings", &rcflex::VerificationResult::warnings)
        .def_readonly("error", &rcflex::VerificationResult::error)
        .def("is_ok", &rcflex::VerificationResult::is_ok)
        .def("safety_factor", &rcflex::VerificationResult::safety_factor)
        .def("dcr", &rcflex::VerificationResult::dcr)
        .def("__repr__", [](const rcflex::VerificationResult &r) {
            return "<VerificationResult " + r.status_string() +
                   " SF=" + std::to_string(r.safety_factor()) + ">";
        });

    py::class_<rcflex::DemandVerifier>(m, "DemandVerifier")
        .def(py::init<rcflex::VerificationSettings>(),
             py::arg("settings") = rcflex::VerificationSettings{})
        .def("verify",
             py::overload_cast<const rcflex::InteractionCurve&, const std::vector<rcflex::DemandPoint>&>(
                 &rcflex::DemandVerifier::verify, py::const_),
             py::arg("curve"), py::arg("demands"))
        .def("verify",
             py::overload_cast<const rcflex::InteractionCurve&, const std::vector<rcflex::DemandPoint>&,
                               const rcflex::SlendernessResult&>(
                 &rcflex::DemandVerifier::verify, py::const_),
             py::arg("curve"), py::arg("demands"), py::arg("slenderness"));

    py::class_<rcflex::CurveCache>(m, "CurveCache", "Caller-owned content-addressed curve cache")
        .def(py::init<>())
        .def("get_or_build", [](rcflex::CurveCache &cache,
                                const rcflex::InteractionCurveBuilder &builder,
                                const rcflex::RectangularSection &section,
                                const rcflex::Concrete &concrete,
                                const rcflex::ReinforcingSteel &steel,
                                const std::vector<rcflex::SteelLayer> &layers) {
            // Python receives an independent copy; the cached curve stays immutable
            return rcflex::InteractionCurve(*cache.get_or_build(builder, section, concrete, steel, layers));
        }, py::arg("builder"), py::arg("section"), py::arg("concrete"),
           py::arg("steel"), py::arg("layers"))
        .def("clear", &rcflex::CurveCache::clear)
        .def("size", &rcflex::CurveCache::size)
        .def("hits", &rcflex::CurveCache::hits)
        .def("misses", &rcflex::CurveCache::misses);
}

#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sonnetio/coupled_lines.hpp"
#include "sonnetio/current_density.hpp"
#include "sonnetio/errors.hpp"
#include "sonnetio/io/json_export.hpp"
#include "sonnetio/io/touchstone.hpp"
#include "sonnetio/network.hpp"
#include "sonnetio/triangular.hpp"

namespace py = pybind11;
using namespace sonnetio;

PYBIND11_MODULE(pysonnetio, m) {
  m.doc() = "Python bindings for the sonnetio output readers.";

  py::register_exception<FormatError>(m, "FormatError", PyExc_IOError);
  py::register_exception<UnsupportedFormatError>(m, "UnsupportedFormatError",
                                                 PyExc_IOError);
  py::register_exception<NotImplementedError>(m, "NotImplementedError",
                                              PyExc_NotImplementedError);

  py::enum_<MatrixStorage>(m, "MatrixStorage")
      .value("Full", MatrixStorage::Full)
      .value("Upper", MatrixStorage::Upper)
      .value("Lower", MatrixStorage::Lower);

  m.def("triangular_dimension", &triangular_dimension,
        "Solve k = n(n+1)/2 for n.", py::arg("count"));
  m.def(
      "unpack_symmetric",
      [](const std::vector<double> &upper) { return unpack_symmetric(upper); },
      "Symmetric matrix from its packed upper triangle.", py::arg("upper"));

  py::enum_<ParameterKind>(m, "ParameterKind")
      .value("S", ParameterKind::S)
      .value("Y", ParameterKind::Y)
      .value("Z", ParameterKind::Z);

  py::enum_<TouchstoneFormat>(m, "TouchstoneFormat")
      .value("RI", TouchstoneFormat::RI, "Real/Imaginary format")
      .value("MA", TouchstoneFormat::MA, "Magnitude/Angle format")
      .value("DB", TouchstoneFormat::DB, "dB/Angle format");

  py::enum_<FrequencyUnit>(m, "FrequencyUnit")
      .value("Hz", FrequencyUnit::Hz)
      .value("kHz", FrequencyUnit::kHz)
      .value("MHz", FrequencyUnit::MHz)
      .value("GHz", FrequencyUnit::GHz);

  py::enum_<SyzDialect>(m, "SyzDialect")
      .value("Touchstone", SyzDialect::Touchstone)
      .value("Databank", SyzDialect::Databank)
      .value("Cadence", SyzDialect::Cadence)
      .value("Spreadsheet", SyzDialect::Spreadsheet)
      .value("MdifS2p", SyzDialect::MdifS2p)
      .value("MdifEbridge", SyzDialect::MdifEbridge);

  py::class_<NetworkParameterSet>(m, "NetworkParameterSet",
                                  "S, Y or Z parameters over frequency.")
      .def(py::init<std::vector<double>, std::vector<Eigen::MatrixXcd>,
                    ParameterKind, std::vector<double>>(),
           py::arg("frequencies_ghz"), py::arg("matrices"),
           py::arg("kind") = ParameterKind::S,
           py::arg("reference_impedances") = std::vector<double>())
      .def_property_readonly("f", &NetworkParameterSet::frequencies,
                             "Frequencies in GHz.")
      .def_property_readonly("value", &NetworkParameterSet::matrices,
                             "One matrix per frequency.")
      .def_property_readonly("kind", &NetworkParameterSet::kind)
      .def_property_readonly("num_ports", &NetworkParameterSet::num_ports)
      .def_property_readonly("reference_impedances",
                             &NetworkParameterSet::reference_impedances)
      .def("trace", &NetworkParameterSet::trace,
           "Entry (i, j) across the sweep.", py::arg("i"), py::arg("j"))
      .def("__len__", &NetworkParameterSet::size);

  py::class_<TouchstoneReadOptions>(m, "TouchstoneReadOptions")
      .def(py::init<>())
      .def_readwrite("verbose", &TouchstoneReadOptions::verbose);

  py::class_<TouchstoneWriteOptions>(m, "TouchstoneWriteOptions",
                                     "Options for Touchstone export.")
      .def(py::init<>())
      .def_readwrite("format", &TouchstoneWriteOptions::format)
      .def_readwrite("unit", &TouchstoneWriteOptions::unit)
      .def_readwrite("version", &TouchstoneWriteOptions::version)
      .def_readwrite("matrix_format", &TouchstoneWriteOptions::matrix_format)
      .def_readwrite("precision", &TouchstoneWriteOptions::precision);

  m.def("read_touchstone",
        py::overload_cast<const std::string &, const TouchstoneReadOptions &>(
            &read_touchstone),
        "Reads a Touchstone (.sNp or .ts) file.", py::arg("path"),
        py::arg("opt") = TouchstoneReadOptions());
  m.def("read_syz_parameters", &read_syz_parameters,
        "Reads an S/Y/Z parameter file in the given dialect.",
        py::arg("path"), py::arg("dialect"),
        py::arg("opt") = TouchstoneReadOptions());
  m.def("write_touchstone",
        py::overload_cast<const std::string &, const NetworkParameterSet &,
                          const TouchstoneWriteOptions &>(&write_touchstone),
        "Writes a parameter set to a Touchstone file.", py::arg("path"),
        py::arg("data"), py::arg("opts") = TouchstoneWriteOptions());
  m.def("touchstone_extension", &touchstone_extension,
        "Get appropriate Touchstone file extension for given port count.",
        py::arg("num_ports"));

  m.def("convert_parameters", &convert_parameters,
        "Converts a parameter set to another parameter type.",
        py::arg("data"), py::arg("target"));
  m.def("is_reciprocal", &is_reciprocal, py::arg("M"),
        py::arg("tolerance") = 1e-6);
  m.def("is_passive", &is_passive, py::arg("S"), py::arg("tolerance") = 1e-6);

  py::class_<CoupledLineModel>(m, "CoupledLineModel",
                               "Modal analysis of N coupled lines.")
      .def(py::init<std::vector<double>, std::vector<Eigen::MatrixXd>,
                    std::vector<Eigen::MatrixXd>, std::vector<Eigen::MatrixXd>,
                    std::vector<Eigen::MatrixXd>>(),
           py::arg("frequencies"), py::arg("inductance"),
           py::arg("resistance"), py::arg("capacitance"),
           py::arg("conductance"))
      .def_property_readonly("frequencies", &CoupledLineModel::frequencies)
      .def_property_readonly("num_lines", &CoupledLineModel::num_lines)
      .def_property_readonly("inductance", &CoupledLineModel::inductance)
      .def_property_readonly("resistance", &CoupledLineModel::resistance)
      .def_property_readonly("capacitance", &CoupledLineModel::capacitance)
      .def_property_readonly("conductance", &CoupledLineModel::conductance)
      .def_property_readonly("impedance", &CoupledLineModel::impedance)
      .def_property_readonly("admittance", &CoupledLineModel::admittance)
      .def_property_readonly("propagation_constant",
                             &CoupledLineModel::propagation_constant)
      .def_property_readonly("propagation_basis",
                             &CoupledLineModel::propagation_basis)
      .def_property_readonly("characteristic_impedance_matrix",
                             &CoupledLineModel::characteristic_impedance_matrix)
      .def_property_readonly("characteristic_impedance",
                             &CoupledLineModel::characteristic_impedance)
      .def_property_readonly("impedance_basis",
                             &CoupledLineModel::impedance_basis)
      .def_property_readonly("effective_relative_permittivity",
                             &CoupledLineModel::effective_relative_permittivity);

  py::class_<CoupledLineReadOptions>(m, "CoupledLineReadOptions")
      .def(py::init<>())
      .def_readwrite("verbose", &CoupledLineReadOptions::verbose);

  py::enum_<CoupledLineDialect>(m, "CoupledLineDialect")
      .value("Spectre", CoupledLineDialect::Spectre)
      .value("Hspice", CoupledLineDialect::Hspice);

  m.def("read_spectre",
        py::overload_cast<const std::string &, const CoupledLineReadOptions &>(
            &read_spectre),
        "Reads an RLGC dump in the spectre dialect.", py::arg("path"),
        py::arg("opt") = CoupledLineReadOptions());
  m.def("read_coupled_lines", &read_coupled_lines,
        "Reads an RLGC dump in the given dialect.", py::arg("path"),
        py::arg("dialect"), py::arg("opt") = CoupledLineReadOptions());

  m.def("write_network_json", &write_network_json, py::arg("path"),
        py::arg("data"));
  m.def("write_coupled_lines_json", &write_coupled_lines_json,
        py::arg("path"), py::arg("model"));

  py::class_<CurrentDensity>(m, "CurrentDensity",
                             "Surface current density CSV output.")
      .def(py::init<std::string, bool>(), py::arg("file_name"),
           py::arg("load_on_init") = false)
      .def_property_readonly("version", &CurrentDensity::version)
      .def_property_readonly("sonnet_file_path",
                             &CurrentDensity::sonnet_file_path)
      .def_property_readonly("sonnet_version", &CurrentDensity::sonnet_version)
      .def_property_readonly("sonnet_file_name",
                             &CurrentDensity::sonnet_file_name)
      .def_property_readonly("frequency", &CurrentDensity::frequency)
      .def_property_readonly("ports", &CurrentDensity::ports)
      .def("drive_voltage", &CurrentDensity::drive_voltage, py::arg("port"))
      .def("drive_phase", &CurrentDensity::drive_phase, py::arg("port"))
      .def_property_readonly("level_string", &CurrentDensity::level_string)
      .def_property_readonly("level", &CurrentDensity::level)
      .def_property_readonly("position_unit_string",
                             &CurrentDensity::position_unit_string)
      .def_property_readonly("position_unit", &CurrentDensity::position_unit)
      .def_property_readonly("dx", &CurrentDensity::dx)
      .def_property_readonly("dy", &CurrentDensity::dy)
      .def_property_readonly("area", &CurrentDensity::area)
      .def_property_readonly("area_unit_string",
                             &CurrentDensity::area_unit_string)
      .def_property_readonly("current_unit_string",
                             &CurrentDensity::current_unit_string)
      .def_property_readonly("x_position", &CurrentDensity::x_position)
      .def_property_readonly("y_position", &CurrentDensity::y_position)
      .def("current_density", &CurrentDensity::current_density,
           py::arg("power") = py::none(), py::arg("impedance") = 50.0)
      .def("interpolate", &CurrentDensity::interpolate, py::arg("x"),
           py::arg("y"), py::arg("power") = py::none(),
           py::arg("impedance") = 50.0)
      .def("trim_data", &CurrentDensity::trim_data,
           py::arg("x_min") = py::none(), py::arg("x_max") = py::none(),
           py::arg("y_min") = py::none(), py::arg("y_max") = py::none());
}

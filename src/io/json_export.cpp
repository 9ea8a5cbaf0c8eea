#include "sonnetio/io/json_export.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sonnetio {

namespace {

// JSON has no nan/inf literals.
std::string number_to_json(double val) {
  if (!std::isfinite(val))
    return "null";
  std::ostringstream ss;
  ss << std::setprecision(12) << val;
  return ss.str();
}

std::string complex_to_json(std::complex<double> val) {
  return "[" + number_to_json(val.real()) + ", " + number_to_json(val.imag()) +
         "]";
}

std::string vector_to_json(const Eigen::VectorXcd &v) {
  std::ostringstream ss;
  ss << "[";
  for (int i = 0; i < v.size(); ++i) {
    ss << complex_to_json(v(i));
    if (i < v.size() - 1)
      ss << ", ";
  }
  ss << "]";
  return ss.str();
}

std::string matrix_to_json(const Eigen::MatrixXcd &M, int indent = 4) {
  std::ostringstream ss;
  std::string pad(indent, ' ');
  std::string inner_pad(indent + 2, ' ');

  ss << "[\n";
  for (int i = 0; i < M.rows(); ++i) {
    ss << inner_pad << vector_to_json(M.row(i).transpose());
    if (i < M.rows() - 1)
      ss << ",";
    ss << "\n";
  }
  ss << pad << "]";
  return ss.str();
}

std::ofstream open_output(const std::string &path) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot open file for writing: " + path);
  }
  ofs << std::setprecision(12);
  return ofs;
}

} // namespace

void write_network_json(const std::string &path,
                        const NetworkParameterSet &data) {
  std::ofstream ofs = open_output(path);
  ofs << "{\n";
  ofs << "  \"type\": \"network_parameters\",\n";
  ofs << "  \"parameter\": \"" << parameter_letter(data.kind()) << "\",\n";
  ofs << "  \"num_ports\": " << data.num_ports() << ",\n";
  ofs << "  \"reference_impedances\": [";
  const auto &z0 = data.reference_impedances();
  for (std::size_t i = 0; i < z0.size(); ++i) {
    ofs << z0[i];
    if (i < z0.size() - 1)
      ofs << ", ";
  }
  ofs << "],\n";
  ofs << "  \"frequency_unit\": \"GHz\",\n";
  ofs << "  \"num_frequencies\": " << data.size() << ",\n";
  ofs << "  \"data\": [\n";
  for (std::size_t k = 0; k < data.size(); ++k) {
    ofs << "    {\n";
    ofs << "      \"frequency\": " << data.frequencies()[k] << ",\n";
    ofs << "      \"value\": " << matrix_to_json(data.at(k), 6) << "\n";
    ofs << "    }";
    if (k < data.size() - 1)
      ofs << ",";
    ofs << "\n";
  }
  ofs << "  ]\n";
  ofs << "}\n";
}

void write_coupled_lines_json(const std::string &path,
                              const CoupledLineModel &model) {
  std::ofstream ofs = open_output(path);
  ofs << "{\n";
  ofs << "  \"type\": \"coupled_lines\",\n";
  ofs << "  \"num_lines\": " << model.num_lines() << ",\n";
  ofs << "  \"frequency_unit\": \"Hz\",\n";
  ofs << "  \"num_frequencies\": " << model.size() << ",\n";
  ofs << "  \"data\": [\n";
  for (std::size_t k = 0; k < model.size(); ++k) {
    ofs << "    {\n";
    ofs << "      \"frequency\": " << model.frequencies()[k] << ",\n";
    ofs << "      \"propagation_constant\": "
        << vector_to_json(model.propagation_constant()[k]) << ",\n";
    ofs << "      \"characteristic_impedance\": "
        << vector_to_json(model.characteristic_impedance()[k]) << ",\n";
    ofs << "      \"effective_relative_permittivity\": "
        << vector_to_json(model.effective_relative_permittivity()[k]) << ",\n";
    ofs << "      \"characteristic_impedance_matrix\": "
        << matrix_to_json(model.characteristic_impedance_matrix()[k], 6)
        << "\n";
    ofs << "    }";
    if (k < model.size() - 1)
      ofs << ",";
    ofs << "\n";
  }
  ofs << "  ]\n";
  ofs << "}\n";
}

} // namespace sonnetio

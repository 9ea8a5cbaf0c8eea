#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

#include "sonnetio/io/json_export.hpp"

using namespace sonnetio;

namespace {

std::string slurp(const std::string &path) {
  std::ifstream ifs(path);
  assert(ifs.good());
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

bool balanced(const std::string &text) {
  int braces = 0;
  int brackets = 0;
  for (char c : text) {
    braces += (c == '{') - (c == '}');
    brackets += (c == '[') - (c == ']');
    if (braces < 0 || brackets < 0)
      return false;
  }
  return braces == 0 && brackets == 0;
}

} // namespace

void test_network_json() {
  std::cout << "test_network_json..." << std::endl;

  Eigen::MatrixXcd S(2, 2);
  S << std::complex<double>(0.25, -0.5), std::complex<double>(0.75, 0.0),
      std::complex<double>(0.75, 0.0), std::complex<double>(0.25, -0.5);
  NetworkParameterSet data({1.5, 2.5}, {S, S}, ParameterKind::S, {50.0, 75.0});

  const std::string path = "/tmp/sonnetio_network.json";
  write_network_json(path, data);
  const std::string text = slurp(path);

  assert(balanced(text));
  assert(text.find("\"parameter\": \"S\"") != std::string::npos);
  assert(text.find("\"num_ports\": 2") != std::string::npos);
  assert(text.find("\"reference_impedances\": [50, 75]") != std::string::npos);
  assert(text.find("\"num_frequencies\": 2") != std::string::npos);
  assert(text.find("\"frequency\": 2.5") != std::string::npos);
  assert(text.find("[0.25, -0.5]") != std::string::npos);
}

void test_coupled_lines_json() {
  std::cout << "test_coupled_lines_json..." << std::endl;

  Eigen::MatrixXd L(1, 1), R(1, 1), C(1, 1), G(1, 1);
  L << 2.5e-7;
  R << 0.0;
  C << 1.0e-10;
  G << 0.0;
  CoupledLineModel model({1e9}, {L}, {R}, {C}, {G});

  const std::string path = "/tmp/sonnetio_coupled_lines.json";
  write_coupled_lines_json(path, model);
  const std::string text = slurp(path);

  assert(balanced(text));
  assert(text.find("\"type\": \"coupled_lines\"") != std::string::npos);
  assert(text.find("\"num_lines\": 1") != std::string::npos);
  assert(text.find("\"characteristic_impedance_matrix\"") != std::string::npos);
  assert(text.find("\"characteristic_impedance\": [[") != std::string::npos);
  // lossless line: Zc = sqrt(L / C) = 50 ohm
  assert(std::abs(model.characteristic_impedance()[0](0) - 50.0) < 1e-9);
}

void test_non_finite_values_written_as_null() {
  std::cout << "test_non_finite_values_written_as_null..." << std::endl;

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  Eigen::MatrixXcd S(1, 1);
  S(0, 0) = std::complex<double>(nan, -inf);
  NetworkParameterSet data({0.0}, {S});

  const std::string path = "/tmp/sonnetio_non_finite.json";
  write_network_json(path, data);
  const std::string text = slurp(path);

  assert(balanced(text));
  assert(text.find("[null, null]") != std::string::npos);
  assert(text.find("nan") == std::string::npos);
  assert(text.find("inf") == std::string::npos);
}

void test_unwritable_path_throws() {
  std::cout << "test_unwritable_path_throws..." << std::endl;

  NetworkParameterSet data({1.0}, {Eigen::MatrixXcd::Zero(1, 1)});
  bool threw = false;
  try {
    write_network_json("/nonexistent_dir/out.json", data);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_network_json();
  test_coupled_lines_json();
  test_non_finite_values_written_as_null();
  test_unwritable_path_throws();
  std::cout << "All JSON export tests passed!" << std::endl;
  return 0;
}

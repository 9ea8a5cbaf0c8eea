#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>

#include "sonnetio/network.hpp"

using namespace sonnetio;

void test_matched_network() {
  std::cout << "test_matched_network..." << std::endl;

  // Matched network: S = 0
  Eigen::MatrixXcd S = Eigen::MatrixXcd::Zero(2, 2);

  // For S = 0: Z = z0 * I, Y = I/z0
  Eigen::MatrixXcd expected_Z = 50.0 * Eigen::MatrixXcd::Identity(2, 2);
  assert(s_to_z(S).isApprox(expected_Z, 1e-10));
  Eigen::MatrixXcd expected_Y = Eigen::MatrixXcd::Identity(2, 2) / 50.0;
  assert(s_to_y(S).isApprox(expected_Y, 1e-10));

  std::cout << "  Z matrix:\n" << s_to_z(S) << std::endl;
}

void test_short_circuit() {
  std::cout << "test_short_circuit..." << std::endl;

  // Short circuit: S11 = -1
  Eigen::MatrixXcd S(1, 1);
  S(0, 0) = std::complex<double>(-1.0, 0.0);

  Eigen::MatrixXcd Z = s_to_z(S, 50.0);
  assert(std::abs(Z(0, 0)) < 1e-10);

  std::cout << "  Short circuit Z = " << Z(0, 0) << std::endl;
}

void test_series_resistor() {
  std::cout << "test_series_resistor..." << std::endl;

  // Series 100 ohm between two 50 ohm ports: S11 = 0.5, S21 = 0.5
  Eigen::MatrixXcd S(2, 2);
  S << 0.5, 0.5, 0.5, 0.5;
  Eigen::MatrixXcd Y = s_to_y(S, 50.0);

  Eigen::MatrixXcd expected(2, 2);
  expected << 0.01, -0.01, -0.01, 0.01;
  assert(Y.isApprox(expected, 1e-9));
  assert(is_reciprocal(S));
  assert(is_passive(S));
}

void test_round_trip_unequal_references() {
  std::cout << "test_round_trip_unequal_references..." << std::endl;

  Eigen::MatrixXcd S(3, 3);
  S << std::complex<double>(0.1, 0.02), std::complex<double>(0.3, -0.1),
      std::complex<double>(0.05, 0.0), std::complex<double>(0.3, -0.1),
      std::complex<double>(-0.2, 0.1), std::complex<double>(0.1, 0.1),
      std::complex<double>(0.05, 0.0), std::complex<double>(0.1, 0.1),
      std::complex<double>(0.25, -0.05);
  Eigen::VectorXd z0(3);
  z0 << 50.0, 75.0, 25.0;

  assert(z_to_s(s_to_z(S, z0), z0).isApprox(S, 1e-9));
  assert(y_to_s(s_to_y(S, z0), z0).isApprox(S, 1e-9));

  // Z and Y are inverses of each other
  Eigen::MatrixXcd ZY = s_to_z(S, z0) * s_to_y(S, z0);
  assert(ZY.isApprox(Eigen::MatrixXcd::Identity(3, 3), 1e-9));
}

void test_convert_parameter_set() {
  std::cout << "test_convert_parameter_set..." << std::endl;

  Eigen::MatrixXcd S(2, 2);
  S << std::complex<double>(0.2, 0.1), std::complex<double>(0.7, -0.2),
      std::complex<double>(0.7, -0.2), std::complex<double>(0.1, -0.3);
  NetworkParameterSet data({1.0, 2.0}, {S, S * 0.5}, ParameterKind::S,
                           {50.0, 100.0});

  auto Z = convert_parameters(data, ParameterKind::Z);
  assert(Z.kind() == ParameterKind::Z);
  assert(Z.frequencies() == data.frequencies());
  assert(Z.reference_impedances()[1] == 100.0);

  auto Y = convert_parameters(Z, ParameterKind::Y);
  auto back = convert_parameters(Y, ParameterKind::S);
  for (std::size_t k = 0; k < data.size(); ++k) {
    assert(back.at(k).isApprox(data.at(k), 1e-9));
  }
}

void test_reciprocity_and_passivity() {
  std::cout << "test_reciprocity_and_passivity..." << std::endl;

  Eigen::MatrixXcd S(2, 2);
  S << std::complex<double>(0.1, 0.0), std::complex<double>(0.9, 0.0),
      std::complex<double>(0.2, 0.0), std::complex<double>(0.1, 0.0);
  assert(!is_reciprocal(S));

  Eigen::MatrixXcd amp(2, 2);
  amp << 0.0, 0.0, 3.0, 0.0;
  assert(!is_passive(amp));

  bool threw = false;
  try {
    s_to_z(Eigen::MatrixXcd::Zero(2, 3), 50.0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_matched_network();
  test_short_circuit();
  test_series_resistor();
  test_round_trip_unequal_references();
  test_convert_parameter_set();
  test_reciprocity_and_passivity();
  std::cout << "All network tests passed!" << std::endl;
  return 0;
}

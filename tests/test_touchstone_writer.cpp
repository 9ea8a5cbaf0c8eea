#include <cassert>
#include <cmath>
#include <complex>
#include <fstream>
#include <iostream>
#include <sstream>

#include "sonnetio/io/touchstone.hpp"

using namespace sonnetio;

namespace {

NetworkParameterSet three_port(double z0 = 50.0) {
  std::vector<double> freq = {1.0, 2.0, 3.0};
  std::vector<Eigen::MatrixXcd> S_matrices;

  for (size_t i = 0; i < freq.size(); ++i) {
    Eigen::MatrixXcd S(3, 3);
    // Simple passive network
    S << std::complex<double>(0.1, 0.0), std::complex<double>(-0.3, 0.1),
        std::complex<double>(-0.2, 0.0), std::complex<double>(-0.3, 0.1),
        std::complex<double>(0.1, 0.0), std::complex<double>(-0.3, 0.1),
        std::complex<double>(-0.2, 0.0), std::complex<double>(-0.3, 0.1),
        std::complex<double>(0.1, 0.01 * i);
    S_matrices.push_back(S);
  }
  return NetworkParameterSet(freq, S_matrices, ParameterKind::S, {z0});
}

std::string option_line(const std::string &path) {
  std::ifstream ifs(path);
  assert(ifs.good());
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line[0] == '#')
      return line;
  }
  return "";
}

} // namespace

void test_touchstone_extension() {
  std::cout << "test_touchstone_extension..." << std::endl;

  assert(touchstone_extension(1) == ".s1p");
  assert(touchstone_extension(2) == ".s2p");
  assert(touchstone_extension(4) == ".s4p");
  assert(touchstone_extension(10) == ".s10p");
}

void test_write_3port() {
  std::cout << "test_write_3port..." << std::endl;

  std::string path = "/tmp/sonnetio_3port.s3p";
  write_touchstone(path, three_port());
  assert(option_line(path).find("GHz S RI R 50") != std::string::npos);

  auto back = read_touchstone(path);
  auto orig = three_port();
  assert(back.size() == orig.size());
  for (std::size_t k = 0; k < back.size(); ++k) {
    assert(std::abs(back.frequencies()[k] - orig.frequencies()[k]) < 1e-12);
    assert((back.at(k) - orig.at(k)).norm() < 1e-10);
  }
  std::cout << "  Wrote and re-read 3-port file: " << path << std::endl;
}

void test_write_4port_ma() {
  std::cout << "test_write_4port_ma..." << std::endl;

  Eigen::MatrixXcd S = Eigen::MatrixXcd::Constant(4, 4, std::complex<double>(-0.2, 0.05));
  S.diagonal().setConstant(0.1);
  NetworkParameterSet data({1.0, 2.0}, {S, S});

  TouchstoneWriteOptions opts;
  opts.format = TouchstoneFormat::MA;
  opts.unit = FrequencyUnit::MHz;

  std::string path = "/tmp/sonnetio_4port.s4p";
  write_touchstone(path, data, opts);
  assert(option_line(path).find("MHz S MA R 50") != std::string::npos);

  auto back = read_touchstone(path);
  assert(std::abs(back.frequencies()[1] - 2.0) < 1e-12);
  assert((back.at(1) - S).norm() < 1e-9);
}

void test_write_2port_db_keeps_order() {
  std::cout << "test_write_2port_db_keeps_order..." << std::endl;

  Eigen::MatrixXcd S(2, 2);
  S << std::complex<double>(0.1, 0.0), std::complex<double>(-0.9, 0.1),
      std::complex<double>(-0.5, 0.2), std::complex<double>(0.1, 0.0);
  NetworkParameterSet data({1.0}, {S});

  TouchstoneWriteOptions opts;
  opts.format = TouchstoneFormat::DB;

  std::string path = "/tmp/sonnetio_2port_db.s2p";
  write_touchstone(path, data, opts);
  assert(option_line(path).find("GHz S DB R 50") != std::string::npos);

  // Version 1 writes S21 before S12; reading must undo it.
  auto back = read_touchstone(path);
  assert(std::abs(back.at(0)(0, 1) - S(0, 1)) < 1e-9);
  assert(std::abs(back.at(0)(1, 0) - S(1, 0)) < 1e-9);
}

void test_write_version2_upper() {
  std::cout << "test_write_version2_upper..." << std::endl;

  auto data = NetworkParameterSet(
      {1.0}, {three_port().at(0)}, ParameterKind::Y, {50.0, 50.0, 75.0});

  TouchstoneWriteOptions opts;
  opts.version = 2;
  opts.matrix_format = MatrixStorage::Upper;

  std::ostringstream oss;
  write_touchstone(oss, data, opts);
  const std::string text = oss.str();
  assert(text.find("[Version] 2.0") != std::string::npos);
  assert(text.find("[Number of Ports] 3") != std::string::npos);
  assert(text.find("[Matrix Format] Upper") != std::string::npos);
  assert(text.find("[Reference] 50 50 75") != std::string::npos);
  assert(text.find("[End]") != std::string::npos);

  std::istringstream in(text);
  auto back = read_touchstone(in, "memory", std::nullopt);
  assert(back.kind() == ParameterKind::Y);
  assert(back.reference_impedances()[2] == 75.0);
  assert((back.at(0) - data.at(0)).norm() < 1e-10);
}

void test_bad_arguments_throw() {
  std::cout << "test_bad_arguments_throw..." << std::endl;

  bool threw = false;
  try {
    write_touchstone("/tmp/sonnetio_wrong.s2p", three_port());
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    write_touchstone("/tmp/sonnetio_v1.ts", three_port());
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    TouchstoneWriteOptions opts;
    opts.matrix_format = MatrixStorage::Lower;
    std::ostringstream oss;
    write_touchstone(oss, three_port(), opts);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_empty_data_throws() {
  std::cout << "test_empty_data_throws..." << std::endl;

  NetworkParameterSet empty({}, {});
  bool threw = false;
  try {
    std::ostringstream oss;
    write_touchstone(oss, empty);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_touchstone_extension();
  test_write_3port();
  test_write_4port_ma();
  test_write_2port_db_keeps_order();
  test_write_version2_upper();
  test_bad_arguments_throw();
  test_empty_data_throws();
  std::cout << "All Touchstone writer tests passed!" << std::endl;
  return 0;
}

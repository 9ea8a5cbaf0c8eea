#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "sonnetio/current_density.hpp"
#include "sonnetio/errors.hpp"

using namespace sonnetio;

namespace {
const std::string kFile = std::string(SONNETIO_TEST_DATA_DIR) +
                          "/current_density.csv";
} // namespace

void test_lazy_loading() {
  std::cout << "test_lazy_loading..." << std::endl;

  CurrentDensity cd(kFile);
  assert(!cd.is_header_loaded());
  assert(!cd.is_data_loaded());

  cd.frequency();
  assert(cd.is_header_loaded());
  assert(!cd.is_data_loaded());

  cd.x_position();
  assert(cd.is_data_loaded());

  CurrentDensity eager(kFile, true);
  assert(eager.is_header_loaded());
  assert(eager.is_data_loaded());

  bool threw = false;
  try {
    CurrentDensity unnamed("");
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_header() {
  std::cout << "test_header..." << std::endl;

  CurrentDensity cd(kFile);
  assert(cd.version() == "VER : 2");
  assert(cd.sonnet_file_path() ==
         "C:\\Users\\kids\\Documents\\Masks\\M1\\M1_912_90p612.son");
  assert(cd.sonnet_version() == "16.52");
  assert(cd.sonnet_file_name() == "M1_912_90p612");
  assert(cd.frequency() == 5687140000.0);

  const std::vector<int> ports = cd.ports();
  assert(ports.size() == 2);
  assert(ports[0] == 2 && ports[1] == 1);
  assert(cd.drive_voltage(2) == 0.0);
  assert(cd.drive_voltage(1) == 1.0);
  assert(cd.drive_phase(1) == 0.0);
  assert(cd.drive_phase(2) == 0.0);

  assert(cd.level_string() == "1");
  assert(cd.level() == 1);
  assert(cd.position_unit_string() == "\xC2\xB5m");
  assert(cd.position_unit() == 1e-6);
  assert(cd.dx() == 0.5);
  assert(cd.dy() == 0.05);
  assert(cd.area() == 2.5e-14);
  assert(cd.area_unit_string() == "m^2");
  assert(cd.current_unit_string() == "A/m");

  bool threw = false;
  try {
    cd.drive_voltage(3);
  } catch (const std::invalid_argument &e) {
    threw = true;
    std::cout << "  " << e.what() << std::endl;
  }
  assert(threw);
}

void test_grid() {
  std::cout << "test_grid..." << std::endl;

  CurrentDensity cd(kFile);
  Eigen::VectorXd x = cd.x_position();
  Eigen::VectorXd y = cd.y_position();
  assert(x.size() == 6);
  assert(y.size() == 5);
  assert(x(0) == 0.0 && x(5) == 50.0);
  assert(y(0) == 0.0 && y(4) == 20.0);

  Eigen::MatrixXd J = cd.current_density();
  assert(J.rows() == 5 && J.cols() == 6);
  assert(J(0, 0) == 100.0);
  assert(J(2, 3) == 123.0);
  assert(std::abs(J.mean() - 122.5) < 1e-12);

  std::cout << "  mean |J| = " << J.mean() << " A/m" << std::endl;
}

void test_rescaled_current_density() {
  std::cout << "test_rescaled_current_density..." << std::endl;

  CurrentDensity cd(kFile);
  // 1 V into 23.3 ohm rescaled to -23.2 dBm
  Eigen::MatrixXd J = cd.current_density(-23.2, 23.3);
  const double expected =
      122.5 * std::sqrt(1e-3 * std::pow(10.0, -2.32) * 2.0 * 23.3);
  assert(std::abs(J.mean() - expected) < 1e-9 * expected);
}

void test_rescale_without_ports_throws() {
  std::cout << "test_rescale_without_ports_throws..." << std::endl;

  // Same file with the drive row emptied of ports.
  const std::string path = "/tmp/sonnetio_no_ports.csv";
  {
    std::ifstream in(kFile);
    std::ofstream out(path);
    std::string line;
    for (int row = 0; std::getline(in, line); ++row)
      out << (row == 3 ? std::string("Drive:") : line) << "\n";
  }

  CurrentDensity cd(path);
  assert(cd.ports().empty());
  assert(cd.current_density().rows() == 5);

  bool threw = false;
  try {
    cd.current_density(-23.2, 23.3);
  } catch (const FormatError &e) {
    threw = true;
    std::cout << "  " << e.what() << std::endl;
  }
  assert(threw);
}

void test_interpolate() {
  std::cout << "test_interpolate..." << std::endl;

  CurrentDensity cd(kFile);
  // J is linear in the grid indices: 100 + 10 * (y / 5) + x / 10
  assert(std::abs(cd.interpolate(15.0, 7.5) - 116.5) < 1e-12);
  assert(std::abs(cd.interpolate(50.0, 20.0) - 145.0) < 1e-12);
  assert(std::abs(cd.interpolate(0.0, 0.0) - 100.0) < 1e-12);

  bool threw = false;
  try {
    cd.interpolate(60.0, 0.0);
  } catch (const std::out_of_range &) {
    threw = true;
  }
  assert(threw);
}

void test_trim_data() {
  std::cout << "test_trim_data..." << std::endl;

  CurrentDensity cd(kFile);
  cd.trim_data(10.0, 30.0, 5.0, 15.0);
  Eigen::MatrixXd J = cd.current_density();
  assert(J.rows() == 3 && J.cols() == 3);
  assert(cd.x_position()(0) == 10.0);
  assert(cd.y_position()(2) == 15.0);
  assert(J(0, 0) == 111.0);
  assert(J(2, 2) == 133.0);

  // one-sided bound
  cd.trim_data(std::nullopt, 20.0, std::nullopt, std::nullopt);
  assert(cd.current_density().cols() == 2);

  bool threw = false;
  try {
    cd.trim_data(std::nullopt, std::nullopt, std::nullopt, std::nullopt);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_missing_file_throws() {
  std::cout << "test_missing_file_throws..." << std::endl;

  CurrentDensity cd("/tmp/sonnetio_no_such_file.csv");
  bool threw = false;
  try {
    cd.frequency();
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_lazy_loading();
  test_header();
  test_grid();
  test_rescaled_current_density();
  test_rescale_without_ports_throws();
  test_interpolate();
  test_trim_data();
  test_missing_file_throws();
  std::cout << "All current density tests passed!" << std::endl;
  return 0;
}

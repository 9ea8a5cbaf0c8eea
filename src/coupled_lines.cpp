#include "sonnetio/coupled_lines.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <numeric>
#include <stdexcept>

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include "io/text_util.hpp"
#include "sonnetio/errors.hpp"
#include "sonnetio/triangular.hpp"

namespace sonnetio {

namespace {
constexpr double c0 = 299792458.0; // speed of light in vacuum (m/s)

bool eigen_less(const std::complex<double> &a, const std::complex<double> &b) {
  if (a.real() != b.real())
    return a.real() < b.real();
  return a.imag() < b.imag();
}

Eigen::MatrixXd parse_upper(const std::string &line, int dim,
                            const std::string &context) {
  std::vector<double> values;
  for (const auto &tok : text::split_whitespace(line))
    values.push_back(text::parse_double(tok, context));
  return unpack_matrix(values, dim, MatrixStorage::Upper);
}

void check_sizes(std::size_t expected, std::size_t got, const char *name) {
  if (got != expected) {
    throw std::invalid_argument(std::string("CoupledLineModel: ") + name +
                                " has " + std::to_string(got) +
                                " entries, expected " +
                                std::to_string(expected));
  }
}
} // namespace

SortedEigen eig_sorted(const Eigen::MatrixXcd &A) {
  Eigen::ComplexEigenSolver<Eigen::MatrixXcd> ces(A);
  if (ces.info() != Eigen::Success) {
    throw std::runtime_error("Eigenvalue computation failed.");
  }
  const Eigen::VectorXcd &values = ces.eigenvalues();
  const Eigen::MatrixXcd &vectors = ces.eigenvectors();

  std::vector<int> order(static_cast<std::size_t>(values.size()));
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
    return eigen_less(values(a), values(b));
  });

  SortedEigen out;
  out.values.resize(values.size());
  out.vectors.resize(vectors.rows(), vectors.cols());
  for (int k = 0; k < static_cast<int>(order.size()); ++k) {
    out.values(k) = values(order[k]);
    out.vectors.col(k) = vectors.col(order[k]);
  }
  return out;
}

CoupledLineModel::CoupledLineModel(std::vector<double> frequencies,
                                   std::vector<Eigen::MatrixXd> inductance,
                                   std::vector<Eigen::MatrixXd> resistance,
                                   std::vector<Eigen::MatrixXd> capacitance,
                                   std::vector<Eigen::MatrixXd> conductance)
    : frequencies_(std::move(frequencies)), inductance_(std::move(inductance)),
      resistance_(std::move(resistance)), capacitance_(std::move(capacitance)),
      conductance_(std::move(conductance)) {
  const std::size_t m = frequencies_.size();
  check_sizes(m, inductance_.size(), "inductance");
  check_sizes(m, resistance_.size(), "resistance");
  check_sizes(m, capacitance_.size(), "capacitance");
  check_sizes(m, conductance_.size(), "conductance");
  if (m > 0)
    num_lines_ = static_cast<int>(inductance_.front().rows());
  for (std::size_t k = 0; k < m; ++k) {
    for (const Eigen::MatrixXd *M : {&inductance_[k], &resistance_[k],
                                     &capacitance_[k], &conductance_[k]}) {
      if (M->rows() != num_lines_ || M->cols() != num_lines_) {
        throw std::invalid_argument(
            "CoupledLineModel: every RLGC matrix must be " +
            std::to_string(num_lines_) + "x" + std::to_string(num_lines_));
      }
    }
  }
  compute();
}

void CoupledLineModel::compute() {
  const std::size_t m = frequencies_.size();
  impedance_.reserve(m);
  admittance_.reserve(m);
  propagation_constant_.reserve(m);
  propagation_basis_.reserve(m);
  characteristic_impedance_matrix_.reserve(m);
  characteristic_impedance_.reserve(m);
  impedance_basis_.reserve(m);
  effective_relative_permittivity_.reserve(m);

  const std::complex<double> j(0.0, 1.0);
  for (std::size_t k = 0; k < m; ++k) {
    const double omega = 2.0 * M_PI * frequencies_[k];
    Eigen::MatrixXcd Z = resistance_[k].cast<std::complex<double>>() +
                         j * omega * inductance_[k].cast<std::complex<double>>();
    Eigen::MatrixXcd Y = conductance_[k].cast<std::complex<double>>() +
                         j * omega * capacitance_[k].cast<std::complex<double>>();

    SortedEigen prop = eig_sorted(Y * Z);
    Eigen::VectorXcd gamma = prop.values.cwiseSqrt();
    const Eigen::MatrixXcd &T = prop.vectors;

    Eigen::MatrixXcd gamma_inv = gamma.cwiseInverse().asDiagonal();
    Eigen::MatrixXcd Zc = Z * T * gamma_inv * T.inverse();
    SortedEigen zc = eig_sorted(Zc);

    // (gamma / (j k0))^2 with k0 = w / c0
    Eigen::VectorXcd eps = (gamma / (j * omega / c0)).array().square();

    impedance_.push_back(std::move(Z));
    admittance_.push_back(std::move(Y));
    propagation_constant_.push_back(std::move(gamma));
    propagation_basis_.push_back(std::move(prop.vectors));
    characteristic_impedance_matrix_.push_back(std::move(Zc));
    characteristic_impedance_.push_back(std::move(zc.values));
    impedance_basis_.push_back(std::move(zc.vectors));
    effective_relative_permittivity_.push_back(std::move(eps));
  }
}

namespace {
std::vector<std::complex<double>>
mode_column(const std::vector<Eigen::VectorXcd> &data, int mode, int n) {
  if (mode < 0 || mode >= n) {
    throw std::out_of_range("Mode index " + std::to_string(mode) +
                            " out of range for " + std::to_string(n) +
                            " lines");
  }
  std::vector<std::complex<double>> out;
  out.reserve(data.size());
  for (const auto &v : data)
    out.push_back(v(mode));
  return out;
}
} // namespace

std::vector<std::complex<double>>
CoupledLineModel::mode_propagation_constant(int mode) const {
  return mode_column(propagation_constant_, mode, num_lines_);
}

std::vector<std::complex<double>>
CoupledLineModel::mode_characteristic_impedance(int mode) const {
  return mode_column(characteristic_impedance_, mode, num_lines_);
}

std::vector<std::complex<double>>
CoupledLineModel::mode_effective_permittivity(int mode) const {
  return mode_column(effective_relative_permittivity_, mode, num_lines_);
}

CoupledLineModel read_spectre(const std::string &path,
                              const CoupledLineReadOptions &opt) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open coupled-lines file: " + path);
  }
  return read_spectre(in, path, opt);
}

CoupledLineModel read_spectre(std::istream &in, const std::string &source_name,
                              const CoupledLineReadOptions &opt) {
  std::vector<double> frequencies;
  std::vector<Eigen::MatrixXd> L, R, C, G;
  int dim = 0;

  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string line = text::to_lower(text::strip_comment(raw, ';'));
    if (line.empty())
      continue;
    const std::string context = source_name + ":" + std::to_string(line_no);

    if (text::starts_with(line, "format")) {
      const auto colons =
          static_cast<std::size_t>(std::count(line.begin(), line.end(), ':'));
      if (colons < 2) {
        throw FormatError("Format line lists no matrix entries in " + context);
      }
      // one colon follows the frequency label
      dim = triangular_dimension(colons - 1);
      for (int i = 0; i < 3 && std::getline(in, raw); ++i)
        ++line_no;
      if (opt.verbose) {
        std::cerr << "read_spectre: " << source_name << ": " << dim
                  << " coupled lines" << std::endl;
      }
      continue;
    }

    if (dim == 0) {
      throw FormatError("File '" + source_name +
                        "' doesn't have the required format line before " +
                        "the data at line " + std::to_string(line_no));
    }

    const std::size_t colon = line.find(':');
    if (colon == std::string::npos ||
        line.find(':', colon + 1) != std::string::npos) {
      throw FormatError("Expected '<frequency>: <values>' in " + context);
    }
    const double f = text::parse_double(line.substr(0, colon), context);
    Eigen::MatrixXd l = parse_upper(line.substr(colon + 1), dim, context);

    std::vector<Eigen::MatrixXd> rest;
    for (int i = 0; i < 3; ++i) {
      if (!std::getline(in, raw))
        break;
      ++line_no;
      rest.push_back(parse_upper(text::strip_comment(raw, ';'), dim,
                                 source_name + ":" + std::to_string(line_no)));
    }
    if (rest.size() < 3) {
      if (opt.verbose) {
        std::cerr << "read_spectre: " << source_name
                  << ": dropped incomplete record at f = " << f << std::endl;
      }
      break;
    }

    frequencies.push_back(f);
    L.push_back(std::move(l));
    R.push_back(std::move(rest[0]));
    C.push_back(std::move(rest[1]));
    G.push_back(std::move(rest[2]));
  }

  if (opt.verbose) {
    std::cerr << "read_spectre: " << source_name << ": " << frequencies.size()
              << " frequencies" << std::endl;
  }
  return CoupledLineModel(std::move(frequencies), std::move(L), std::move(R),
                          std::move(C), std::move(G));
}

CoupledLineModel read_coupled_lines(const std::string &path,
                                    CoupledLineDialect dialect,
                                    const CoupledLineReadOptions &opt) {
  switch (dialect) {
  case CoupledLineDialect::Spectre:
    return read_spectre(path, opt);
  case CoupledLineDialect::Hspice:
    break;
  }
  throw NotImplementedError("Reading the HSPICE coupled-lines dialect");
}

} // namespace sonnetio

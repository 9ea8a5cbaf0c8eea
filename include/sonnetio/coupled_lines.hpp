#pragma once

#include <complex>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace sonnetio {

/// Eigenvalues and eigenvectors (as columns) sorted ascending by real part,
/// then imaginary part.
struct SortedEigen {
  Eigen::VectorXcd values;
  Eigen::MatrixXcd vectors;
};

/// Eigendecomposition of a general complex matrix with sorted eigenpairs.
/// The ordering depends only on the eigenvalues, so mode indices at
/// different frequencies are not tracked for continuity.
/// @throws std::runtime_error if the eigensolver does not converge
SortedEigen eig_sorted(const Eigen::MatrixXcd &A);

/// Modal analysis of N coupled transmission lines from per-unit-length RLGC
/// matrices sampled over frequency.
///
/// For every frequency f (Hz), with w = 2*pi*f:
///   Z  = R + jwL,  Y = G + jwC
///   Y*Z = T diag(gamma^2) T^-1        (propagation modes)
///   Zc = Z T diag(1/gamma) T^-1       (characteristic impedance matrix)
///   eps_eff = (gamma / (j w sqrt(eps0 mu0)))^2
/// All quantities are computed in the constructor.
class CoupledLineModel {
public:
  /// @throws std::invalid_argument on inconsistent sizes
  CoupledLineModel(std::vector<double> frequencies,
                   std::vector<Eigen::MatrixXd> inductance,
                   std::vector<Eigen::MatrixXd> resistance,
                   std::vector<Eigen::MatrixXd> capacitance,
                   std::vector<Eigen::MatrixXd> conductance);

  std::size_t size() const { return frequencies_.size(); }
  int num_lines() const { return num_lines_; }

  /// Frequencies in Hz.
  const std::vector<double> &frequencies() const { return frequencies_; }

  const std::vector<Eigen::MatrixXd> &inductance() const { return inductance_; }
  const std::vector<Eigen::MatrixXd> &resistance() const { return resistance_; }
  const std::vector<Eigen::MatrixXd> &capacitance() const { return capacitance_; }
  const std::vector<Eigen::MatrixXd> &conductance() const { return conductance_; }

  /// Series impedance per unit length, R + jwL.
  const std::vector<Eigen::MatrixXcd> &impedance() const { return impedance_; }
  /// Shunt admittance per unit length, G + jwC.
  const std::vector<Eigen::MatrixXcd> &admittance() const { return admittance_; }

  const std::vector<Eigen::VectorXcd> &propagation_constant() const {
    return propagation_constant_;
  }
  const std::vector<Eigen::MatrixXcd> &propagation_basis() const {
    return propagation_basis_;
  }
  const std::vector<Eigen::MatrixXcd> &characteristic_impedance_matrix() const {
    return characteristic_impedance_matrix_;
  }
  const std::vector<Eigen::VectorXcd> &characteristic_impedance() const {
    return characteristic_impedance_;
  }
  const std::vector<Eigen::MatrixXcd> &impedance_basis() const {
    return impedance_basis_;
  }
  const std::vector<Eigen::VectorXcd> &effective_relative_permittivity() const {
    return effective_relative_permittivity_;
  }

  // Single mode across the sweep.
  std::vector<std::complex<double>> mode_propagation_constant(int mode) const;
  std::vector<std::complex<double>> mode_characteristic_impedance(int mode) const;
  std::vector<std::complex<double>> mode_effective_permittivity(int mode) const;

private:
  void compute();

  std::vector<double> frequencies_;
  int num_lines_ = 0;
  std::vector<Eigen::MatrixXd> inductance_;
  std::vector<Eigen::MatrixXd> resistance_;
  std::vector<Eigen::MatrixXd> capacitance_;
  std::vector<Eigen::MatrixXd> conductance_;
  std::vector<Eigen::MatrixXcd> impedance_;
  std::vector<Eigen::MatrixXcd> admittance_;
  std::vector<Eigen::VectorXcd> propagation_constant_;
  std::vector<Eigen::MatrixXcd> propagation_basis_;
  std::vector<Eigen::MatrixXcd> characteristic_impedance_matrix_;
  std::vector<Eigen::VectorXcd> characteristic_impedance_;
  std::vector<Eigen::MatrixXcd> impedance_basis_;
  std::vector<Eigen::VectorXcd> effective_relative_permittivity_;
};

struct CoupledLineReadOptions {
  /// Print parse diagnostics (dimension, dropped trailing record) to stderr
  bool verbose = false;
};

/// Read an RLGC dump in the "spectre" dialect.
///
/// A `format` line fixes the line count N from its colon count and is
/// followed by three header lines. Each record then spans four lines:
/// `<f>: <L upper triangle>`, and the upper triangles of R, C and G.
/// A record cut short by the end of the file is dropped.
/// @throws FormatError on data before the format line or a bad record
/// @throws std::runtime_error if the file cannot be opened
CoupledLineModel read_spectre(const std::string &path,
                              const CoupledLineReadOptions &opt =
                                  CoupledLineReadOptions());

CoupledLineModel read_spectre(std::istream &in, const std::string &source_name,
                              const CoupledLineReadOptions &opt =
                                  CoupledLineReadOptions());

enum class CoupledLineDialect { Spectre, Hspice };

/// @throws NotImplementedError for the HSPICE dialect
CoupledLineModel read_coupled_lines(const std::string &path,
                                    CoupledLineDialect dialect,
                                    const CoupledLineReadOptions &opt =
                                        CoupledLineReadOptions());

} // namespace sonnetio

#include "sonnetio/network.hpp"

#include <Eigen/Dense>
#include <stdexcept>

namespace sonnetio {

namespace {

// A * B^-1, regularizing B if it is singular.
Eigen::MatrixXcd right_divide(const Eigen::MatrixXcd &A,
                              const Eigen::MatrixXcd &B) {
  const int n = static_cast<int>(B.rows());
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXcd> cod(B);
  if (cod.rank() < n) {
    Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
    Eigen::MatrixXcd B_reg = B + 1e-12 * I;
    return A * B_reg.inverse();
  }
  return A * cod.pseudoInverse();
}

void check_square(const Eigen::MatrixXcd &M, const Eigen::VectorXd &z0) {
  if (M.rows() != M.cols()) {
    throw std::invalid_argument("Network matrix must be square");
  }
  if (z0.size() != M.rows()) {
    throw std::invalid_argument(
        "Need one reference impedance per port");
  }
  if ((z0.array() <= 0.0).any()) {
    throw std::invalid_argument("Reference impedances must be positive");
  }
}

Eigen::VectorXd uniform(Eigen::Index n, double z0) {
  return Eigen::VectorXd::Constant(n, z0);
}

} // namespace

Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0) {
  check_square(S, z0);
  const int n = static_cast<int>(S.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd F = z0.cwiseSqrt().cast<std::complex<double>>().asDiagonal();
  return F * right_divide(I + S, I - S) * F;
}

Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0) {
  check_square(S, z0);
  const int n = static_cast<int>(S.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd F_inv =
      z0.cwiseSqrt().cwiseInverse().cast<std::complex<double>>().asDiagonal();
  return F_inv * right_divide(I - S, I + S) * F_inv;
}

Eigen::MatrixXcd z_to_s(const Eigen::MatrixXcd &Z, const Eigen::VectorXd &z0) {
  check_square(Z, z0);
  const int n = static_cast<int>(Z.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd F_inv =
      z0.cwiseSqrt().cwiseInverse().cast<std::complex<double>>().asDiagonal();
  Eigen::MatrixXcd z = F_inv * Z * F_inv;
  return right_divide(z - I, z + I);
}

Eigen::MatrixXcd y_to_s(const Eigen::MatrixXcd &Y, const Eigen::VectorXd &z0) {
  check_square(Y, z0);
  const int n = static_cast<int>(Y.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd F = z0.cwiseSqrt().cast<std::complex<double>>().asDiagonal();
  Eigen::MatrixXcd y = F * Y * F;
  return right_divide(I - y, I + y);
}

Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, double z0) {
  return s_to_z(S, uniform(S.rows(), z0));
}

Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, double z0) {
  return s_to_y(S, uniform(S.rows(), z0));
}

NetworkParameterSet convert_parameters(const NetworkParameterSet &data,
                                       ParameterKind target) {
  const Eigen::VectorXd z0 = Eigen::Map<const Eigen::VectorXd>(
      data.reference_impedances().data(),
      static_cast<Eigen::Index>(data.reference_impedances().size()));

  std::vector<Eigen::MatrixXcd> out;
  out.reserve(data.size());
  for (const auto &M : data.matrices()) {
    Eigen::MatrixXcd S;
    switch (data.kind()) {
    case ParameterKind::S:
      S = M;
      break;
    case ParameterKind::Z:
      S = z_to_s(M, z0);
      break;
    case ParameterKind::Y:
      S = y_to_s(M, z0);
      break;
    }
    switch (target) {
    case ParameterKind::S:
      out.push_back(S);
      break;
    case ParameterKind::Z:
      out.push_back(s_to_z(S, z0));
      break;
    case ParameterKind::Y:
      out.push_back(s_to_y(S, z0));
      break;
    }
  }
  return NetworkParameterSet(data.frequencies(), std::move(out), target,
                             data.reference_impedances());
}

bool is_reciprocal(const Eigen::MatrixXcd &M, double tolerance) {
  if (M.rows() != M.cols()) {
    return false;
  }
  return M.isApprox(M.transpose(), tolerance);
}

bool is_passive(const Eigen::MatrixXcd &S, double tolerance) {
  if (S.rows() != S.cols()) {
    return false;
  }
  Eigen::JacobiSVD<Eigen::MatrixXcd> svd(S);
  const Eigen::VectorXd sv = svd.singularValues();
  for (int i = 0; i < sv.size(); ++i) {
    if (sv(i) > 1.0 + tolerance) {
      return false;
    }
  }
  return true;
}

} // namespace sonnetio

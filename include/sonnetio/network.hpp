#pragma once

#include <Eigen/Core>

#include "sonnetio/io/touchstone.hpp"

namespace sonnetio {

// Conversions between scattering, impedance and admittance matrices for real
// per-port reference impedances z0 (ohms). With F = diag(sqrt(z0)):
//   Z = F (I + S) (I - S)^-1 F
//   Y = F^-1 (I - S) (I + S)^-1 F^-1

Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0);
Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0);
Eigen::MatrixXcd z_to_s(const Eigen::MatrixXcd &Z, const Eigen::VectorXd &z0);
Eigen::MatrixXcd y_to_s(const Eigen::MatrixXcd &Y, const Eigen::VectorXd &z0);

/// Same reference impedance on every port.
Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, double z0 = 50.0);
Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, double z0 = 50.0);

/// Convert a whole set to another parameter type using its reference
/// impedances. Frequencies and reference impedances are kept.
NetworkParameterSet convert_parameters(const NetworkParameterSet &data,
                                       ParameterKind target);

/// A network is reciprocal if M = M^T.
bool is_reciprocal(const Eigen::MatrixXcd &M, double tolerance = 1e-6);

/// A network is passive if all singular values of S are <= 1.
bool is_passive(const Eigen::MatrixXcd &S, double tolerance = 1e-6);

} // namespace sonnetio

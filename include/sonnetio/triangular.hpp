#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "sonnetio/errors.hpp"

namespace sonnetio {

/// Layout of the values describing an n×n matrix.
enum class MatrixStorage {
  Full,  ///< n*n values, row-major
  Upper, ///< n(n+1)/2 values, upper triangle (with diagonal) row-major
  Lower  ///< n(n+1)/2 values, lower triangle (with diagonal) row-major
};

/// Solve k = n(n+1)/2 for n.
/// @throws FormatError if k is not a triangular number of a positive n
int triangular_dimension(std::size_t count);

/// Number of stored values for an n×n matrix in the given layout.
std::size_t stored_value_count(int n, MatrixStorage storage);

MatrixStorage parse_matrix_storage(const std::string &name);

/// Rebuild an n×n matrix from `count` values starting at `values`.
/// Triangular layouts are mirrored into the missing half.
/// @throws FormatError on a count that does not match the layout
template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>
unpack_matrix(const Scalar *values, std::size_t count, int n,
              MatrixStorage storage) {
  if (n <= 0) {
    throw FormatError("Matrix dimension must be positive, got " +
                      std::to_string(n));
  }
  if (count != stored_value_count(n, storage)) {
    throw FormatError("Expected " +
                      std::to_string(stored_value_count(n, storage)) +
                      " values for a " + std::to_string(n) + "x" +
                      std::to_string(n) + " matrix, got " +
                      std::to_string(count));
  }

  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> M(n, n);
  std::size_t k = 0;
  switch (storage) {
  case MatrixStorage::Full:
    for (int i = 0; i < n; ++i)
      for (int j = 0; j < n; ++j)
        M(i, j) = values[k++];
    break;
  case MatrixStorage::Upper:
    for (int i = 0; i < n; ++i)
      for (int j = i; j < n; ++j)
        M(i, j) = values[k++];
    for (int i = 1; i < n; ++i)
      for (int j = 0; j < i; ++j)
        M(i, j) = M(j, i);
    break;
  case MatrixStorage::Lower:
    for (int i = 0; i < n; ++i)
      for (int j = 0; j <= i; ++j)
        M(i, j) = values[k++];
    for (int i = 0; i < n; ++i)
      for (int j = i + 1; j < n; ++j)
        M(i, j) = M(j, i);
    break;
  }
  return M;
}

template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>
unpack_matrix(const std::vector<Scalar> &values, int n,
              MatrixStorage storage) {
  return unpack_matrix(values.data(), values.size(), n, storage);
}

/// Symmetric matrix from its packed upper triangle; n is solved from the
/// value count.
template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>
unpack_symmetric(const std::vector<Scalar> &upper) {
  return unpack_matrix(upper, triangular_dimension(upper.size()),
                       MatrixStorage::Upper);
}

/// Values of M in the given layout. Inverse of unpack_matrix for symmetric M.
template <typename Derived>
std::vector<typename Derived::Scalar>
pack_matrix(const Eigen::MatrixBase<Derived> &M, MatrixStorage storage) {
  const int n = static_cast<int>(M.rows());
  std::vector<typename Derived::Scalar> out;
  out.reserve(stored_value_count(n, storage));
  for (int i = 0; i < n; ++i) {
    const int j0 = storage == MatrixStorage::Upper ? i : 0;
    const int j1 = storage == MatrixStorage::Lower ? i + 1 : n;
    for (int j = j0; j < j1; ++j)
      out.push_back(M(i, j));
  }
  return out;
}

} // namespace sonnetio

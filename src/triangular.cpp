#include "sonnetio/triangular.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace sonnetio {

int triangular_dimension(std::size_t count) {
  if (count == 0) {
    throw FormatError("Cannot build a matrix from zero values");
  }
  const double root = (std::sqrt(8.0 * static_cast<double>(count) + 1.0) - 1.0) / 2.0;
  const int n = static_cast<int>(std::lround(root));
  if (n <= 0 || static_cast<std::size_t>(n) * (n + 1) / 2 != count) {
    throw FormatError(std::to_string(count) +
                      " values do not fill the triangle of a square matrix");
  }
  return n;
}

std::size_t stored_value_count(int n, MatrixStorage storage) {
  const std::size_t m = static_cast<std::size_t>(n);
  return storage == MatrixStorage::Full ? m * m : m * (m + 1) / 2;
}

MatrixStorage parse_matrix_storage(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "full")
    return MatrixStorage::Full;
  if (s == "upper")
    return MatrixStorage::Upper;
  if (s == "lower")
    return MatrixStorage::Lower;
  throw FormatError("Unknown matrix format '" + name +
                    "', expected full, upper or lower");
}

} // namespace sonnetio

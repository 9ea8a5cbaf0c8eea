#include "sonnetio/io/touchstone.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

#include "io/text_util.hpp"
#include "sonnetio/errors.hpp"

namespace sonnetio {

namespace {

constexpr double kRadToDeg = 180.0 / M_PI;

std::string format_name(TouchstoneFormat format) {
  switch (format) {
  case TouchstoneFormat::RI:
    return "RI";
  case TouchstoneFormat::MA:
    return "MA";
  case TouchstoneFormat::DB:
    return "DB";
  }
  return "RI";
}

void write_pair(std::ostream &out, std::complex<double> v,
                TouchstoneFormat format) {
  switch (format) {
  case TouchstoneFormat::RI:
    out << ' ' << v.real() << ' ' << v.imag();
    break;
  case TouchstoneFormat::MA:
    out << ' ' << std::abs(v) << ' ' << std::arg(v) * kRadToDeg;
    break;
  case TouchstoneFormat::DB:
    out << ' ' << 20.0 * std::log10(std::max(std::abs(v), 1e-300)) << ' '
        << std::arg(v) * kRadToDeg;
    break;
  }
}

} // namespace

char parameter_letter(ParameterKind kind) {
  switch (kind) {
  case ParameterKind::S:
    return 'S';
  case ParameterKind::Y:
    return 'Y';
  case ParameterKind::Z:
    return 'Z';
  }
  return 'S';
}

ParameterKind parse_parameter_kind(const std::string &token) {
  const std::string t = text::to_lower(token);
  if (t == "s")
    return ParameterKind::S;
  if (t == "y")
    return ParameterKind::Y;
  if (t == "z")
    return ParameterKind::Z;
  if (t == "h" || t == "g") {
    throw UnsupportedFormatError("Hybrid (" + token +
                                 ") parameters are not supported");
  }
  throw FormatError("Unknown network parameter type '" + token + "'");
}

double frequency_multiplier(FrequencyUnit unit) {
  switch (unit) {
  case FrequencyUnit::Hz:
    return 1.0;
  case FrequencyUnit::kHz:
    return 1e3;
  case FrequencyUnit::MHz:
    return 1e6;
  case FrequencyUnit::GHz:
    return 1e9;
  }
  return 1.0;
}

FrequencyUnit parse_frequency_unit(const std::string &token) {
  const std::string t = text::to_lower(token);
  if (t == "hz")
    return FrequencyUnit::Hz;
  if (t == "khz")
    return FrequencyUnit::kHz;
  if (t == "mhz")
    return FrequencyUnit::MHz;
  if (t == "ghz")
    return FrequencyUnit::GHz;
  throw FormatError("Unknown frequency unit '" + token + "'");
}

std::string frequency_unit_name(FrequencyUnit unit) {
  switch (unit) {
  case FrequencyUnit::Hz:
    return "Hz";
  case FrequencyUnit::kHz:
    return "kHz";
  case FrequencyUnit::MHz:
    return "MHz";
  case FrequencyUnit::GHz:
    return "GHz";
  }
  return "Hz";
}

std::string dialect_name(SyzDialect dialect) {
  switch (dialect) {
  case SyzDialect::Touchstone:
    return "Touchstone";
  case SyzDialect::Databank:
    return "databank";
  case SyzDialect::Cadence:
    return "Cadence";
  case SyzDialect::Spreadsheet:
    return "spreadsheet";
  case SyzDialect::MdifS2p:
    return "MDIF S2P";
  case SyzDialect::MdifEbridge:
    return "MDIF EBRIDGE";
  }
  return "unknown";
}

NetworkParameterSet::NetworkParameterSet(
    std::vector<double> frequencies_ghz, std::vector<Eigen::MatrixXcd> matrices,
    ParameterKind kind, std::vector<double> reference_impedances)
    : frequencies_(std::move(frequencies_ghz)), matrices_(std::move(matrices)),
      kind_(kind), reference_impedances_(std::move(reference_impedances)) {
  if (frequencies_.size() != matrices_.size()) {
    throw std::invalid_argument(
        "NetworkParameterSet: " + std::to_string(frequencies_.size()) +
        " frequencies but " + std::to_string(matrices_.size()) + " matrices");
  }
  if (!matrices_.empty())
    num_ports_ = static_cast<int>(matrices_.front().rows());
  for (const auto &M : matrices_) {
    if (M.rows() != M.cols() || M.rows() != num_ports_) {
      throw std::invalid_argument(
          "NetworkParameterSet: every matrix must be " +
          std::to_string(num_ports_) + "x" + std::to_string(num_ports_));
    }
  }
  if (reference_impedances_.empty())
    reference_impedances_.assign(static_cast<std::size_t>(num_ports_), 50.0);
  else if (reference_impedances_.size() == 1)
    reference_impedances_.assign(static_cast<std::size_t>(num_ports_),
                                 reference_impedances_.front());
  if (!matrices_.empty() &&
      reference_impedances_.size() != static_cast<std::size_t>(num_ports_)) {
    throw std::invalid_argument(
        "NetworkParameterSet: need one reference impedance per port");
  }
}

std::vector<std::complex<double>> NetworkParameterSet::trace(int i,
                                                             int j) const {
  if (i < 0 || j < 0 || i >= num_ports_ || j >= num_ports_) {
    throw std::out_of_range("Port index out of range");
  }
  std::vector<std::complex<double>> out;
  out.reserve(matrices_.size());
  for (const auto &M : matrices_)
    out.push_back(M(i, j));
  return out;
}

std::string touchstone_extension(int num_ports) {
  if (num_ports <= 0) {
    throw std::invalid_argument("Port count must be positive");
  }
  return ".s" + std::to_string(num_ports) + "p";
}

void write_touchstone(std::ostream &out, const NetworkParameterSet &data,
                      const TouchstoneWriteOptions &opts) {
  if (data.empty()) {
    throw std::runtime_error("Cannot write Touchstone file without data");
  }
  if (opts.version != 1 && opts.version != 2) {
    throw std::invalid_argument("Touchstone version must be 1 or 2");
  }
  if (opts.version == 1 && opts.matrix_format != MatrixStorage::Full) {
    throw std::invalid_argument(
        "Touchstone version 1 only stores full matrices");
  }

  const int P = data.num_ports();
  const double z0 = data.reference_impedances().front();
  const double from_ghz = 1e9 / frequency_multiplier(opts.unit);

  out << "! Written by sonnetio\n";
  if (opts.version == 2) {
    out << "[Version] 2.0\n";
  }
  out << "# " << frequency_unit_name(opts.unit) << ' '
      << parameter_letter(data.kind()) << ' ' << format_name(opts.format)
      << " R " << z0 << '\n';
  if (opts.version == 2) {
    out << "[Number of Ports] " << P << '\n';
    if (P == 2)
      out << "[Two-Port Data Order] 12_21\n";
    out << "[Number of Frequencies] " << data.size() << '\n';
    bool uniform = true;
    for (double r : data.reference_impedances())
      uniform = uniform && r == z0;
    if (!uniform) {
      out << "[Reference]";
      for (double r : data.reference_impedances())
        out << ' ' << r;
      out << '\n';
    }
    switch (opts.matrix_format) {
    case MatrixStorage::Full:
      out << "[Matrix Format] Full\n";
      break;
    case MatrixStorage::Upper:
      out << "[Matrix Format] Upper\n";
      break;
    case MatrixStorage::Lower:
      out << "[Matrix Format] Lower\n";
      break;
    }
    out << "[Network Data]\n";
  }

  out << std::setprecision(opts.precision);
  for (std::size_t k = 0; k < data.size(); ++k) {
    Eigen::MatrixXcd M = data.at(k);
    if (opts.version == 1 && P == 2)
      M.transposeInPlace();
    out << data.frequencies()[k] * from_ghz;
    if (P <= 2) {
      for (const auto &v : pack_matrix(M, opts.matrix_format))
        write_pair(out, v, opts.format);
      out << '\n';
      continue;
    }
    // Larger networks: one matrix row per line, at most four pairs per line.
    for (int i = 0; i < P; ++i) {
      const int j0 = opts.matrix_format == MatrixStorage::Upper ? i : 0;
      const int j1 = opts.matrix_format == MatrixStorage::Lower ? i + 1 : P;
      int on_line = 0;
      for (int j = j0; j < j1; ++j) {
        if (on_line == 4) {
          out << '\n';
          on_line = 0;
        }
        write_pair(out, M(i, j), opts.format);
        ++on_line;
      }
      out << '\n';
    }
  }
  if (opts.version == 2) {
    out << "[End]\n";
  }
}

void write_touchstone(const std::string &path, const NetworkParameterSet &data,
                      const TouchstoneWriteOptions &opts) {
  const std::optional<int> ports = touchstone_ports_from_extension(path);
  if (ports && *ports != data.num_ports()) {
    throw std::runtime_error("Extension of " + path + " does not match " +
                             std::to_string(data.num_ports()) + " ports");
  }
  if (!ports && opts.version != 2) {
    throw std::invalid_argument(".ts files require Touchstone version 2");
  }
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot open file for writing: " + path);
  }
  write_touchstone(ofs, data, opts);
}

} // namespace sonnetio

#pragma once

#include <complex>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "sonnetio/triangular.hpp"

namespace sonnetio {

/// Network parameter type named by the option line letter.
enum class ParameterKind { S, Y, Z };

/// Numeric pair format of the data lines.
enum class TouchstoneFormat {
  RI, ///< real, imaginary
  MA, ///< magnitude, angle (degrees)
  DB  ///< 20*log10(magnitude), angle (degrees)
};

enum class FrequencyUnit { Hz, kHz, MHz, GHz };

char parameter_letter(ParameterKind kind);
ParameterKind parse_parameter_kind(const std::string &token);

/// Multiplier from the unit to Hz.
double frequency_multiplier(FrequencyUnit unit);
FrequencyUnit parse_frequency_unit(const std::string &token);
std::string frequency_unit_name(FrequencyUnit unit);

/// Network parameters over a frequency sweep.
///
/// One P×P complex matrix per frequency. Frequencies are in GHz and are
/// non-decreasing for every set produced by read_touchstone(). The set is
/// immutable once constructed.
class NetworkParameterSet {
public:
  /// @param frequencies_ghz Frequencies in GHz
  /// @param matrices One square matrix per frequency, all of the same size
  /// @param kind Parameter type (S, Y or Z)
  /// @param reference_impedances Per-port reference impedance in ohms; a
  ///        single value is applied to every port, empty means 50 ohms
  /// @throws std::invalid_argument if the sizes are inconsistent
  NetworkParameterSet(std::vector<double> frequencies_ghz,
                      std::vector<Eigen::MatrixXcd> matrices,
                      ParameterKind kind = ParameterKind::S,
                      std::vector<double> reference_impedances = {});

  const std::vector<double> &frequencies() const { return frequencies_; }
  const std::vector<Eigen::MatrixXcd> &matrices() const { return matrices_; }
  const Eigen::MatrixXcd &at(std::size_t k) const { return matrices_.at(k); }
  ParameterKind kind() const { return kind_; }
  int num_ports() const { return num_ports_; }
  std::size_t size() const { return frequencies_.size(); }
  bool empty() const { return frequencies_.empty(); }

  /// Reference impedance of each port (ohms).
  const std::vector<double> &reference_impedances() const {
    return reference_impedances_;
  }

  /// Entry (i, j) across the sweep, 0-based port indices.
  std::vector<std::complex<double>> trace(int i, int j) const;

private:
  std::vector<double> frequencies_;
  std::vector<Eigen::MatrixXcd> matrices_;
  ParameterKind kind_;
  int num_ports_ = 0;
  std::vector<double> reference_impedances_;
};

struct TouchstoneReadOptions {
  /// Print parse diagnostics (detected layout, dropped rows) to stderr
  bool verbose = false;
};

/// Port count implied by a Touchstone file name.
/// @return P for `.sNp` names, std::nullopt for `.ts` names
/// @throws FormatError for any other extension or a non-numeric N
std::optional<int> touchstone_ports_from_extension(const std::string &path);

/// Read a Touchstone 1.x/2.x file (`.sNp` or `.ts`).
/// @throws FormatError on malformed input or an unexpected extension
/// @throws UnsupportedFormatError for mixed-mode data
/// @throws std::runtime_error if the file cannot be opened
NetworkParameterSet read_touchstone(const std::string &path,
                                    const TouchstoneReadOptions &opt =
                                        TouchstoneReadOptions());

/// Read Touchstone data from a stream.
/// @param source_name Name used in error messages
/// @param num_ports Port count from the file name; required unless the data
///        carries a [Number of Ports] keyword
NetworkParameterSet read_touchstone(std::istream &in,
                                    const std::string &source_name,
                                    std::optional<int> num_ports,
                                    const TouchstoneReadOptions &opt =
                                        TouchstoneReadOptions());

/// Output dialects the simulator can write S/Y/Z parameters in.
enum class SyzDialect {
  Touchstone,
  Databank,
  Cadence,
  Spreadsheet,
  MdifS2p,
  MdifEbridge
};

std::string dialect_name(SyzDialect dialect);

/// Read an S/Y/Z parameter file in the given dialect.
/// @throws NotImplementedError for every dialect except Touchstone
NetworkParameterSet read_syz_parameters(const std::string &path,
                                        SyzDialect dialect,
                                        const TouchstoneReadOptions &opt =
                                            TouchstoneReadOptions());

struct TouchstoneWriteOptions {
  TouchstoneFormat format = TouchstoneFormat::RI;
  FrequencyUnit unit = FrequencyUnit::GHz;
  int version = 1;                             // 1 or 2
  MatrixStorage matrix_format = MatrixStorage::Full; // version 2 only
  int precision = 12;
};

/// File extension for a port count, e.g. ".s4p".
std::string touchstone_extension(int num_ports);

/// Write a parameter set as a Touchstone file.
/// @throws std::runtime_error on empty data or an unwritable path
/// @throws std::invalid_argument on options the version cannot express
void write_touchstone(const std::string &path, const NetworkParameterSet &data,
                      const TouchstoneWriteOptions &opts =
                          TouchstoneWriteOptions());

void write_touchstone(std::ostream &out, const NetworkParameterSet &data,
                      const TouchstoneWriteOptions &opts =
                          TouchstoneWriteOptions());

} // namespace sonnetio

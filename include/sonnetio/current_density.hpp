#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace sonnetio {

/// Surface current density exported by the simulator as CSV.
///
/// The file has nine header rows (format version, project, frequency, port
/// drive, level, position unit, grid step and area, current unit, data
/// label) followed by a grid whose first row holds the x positions and whose
/// first column holds the y positions. Header and grid are read lazily and
/// independently on first access.
class CurrentDensity {
public:
  /// @param file_name Path of the CSV file
  /// @param load_on_init Read header and grid immediately
  explicit CurrentDensity(std::string file_name, bool load_on_init = false);

  const std::string &file_name() const { return file_name_; }
  bool is_header_loaded() const { return header_loaded_; }
  bool is_data_loaded() const { return data_loaded_; }

  /// File format version, e.g. "VER : 2".
  std::string version() const;
  /// Path of the simulator project the data came from.
  std::string sonnet_file_path() const;
  std::string sonnet_version() const;
  std::string sonnet_file_name() const;
  /// Frequency (Hz) at which the data was evaluated.
  double frequency() const;

  /// Port numbers in file order.
  std::vector<int> ports() const;

  /// Amplitude (V) of the sine wave driving `port`.
  /// @throws std::invalid_argument if the port is not in the file
  double drive_voltage(int port) const;

  /// Phase (degrees) of the sine wave driving `port`.
  /// @throws std::invalid_argument if the port is not in the file
  double drive_phase(int port) const;

  /// Level name, e.g. "1" or "2a" for thick metal layers.
  std::string level_string() const;
  /// Unique level index.
  int level() const;

  std::string position_unit_string() const;
  /// Position unit in meters (1e-6 for microns).
  double position_unit() const;
  double dx() const;
  double dy() const;
  double area() const;
  std::string area_unit_string() const;
  std::string current_unit_string() const;

  /// x positions of the grid columns.
  Eigen::VectorXd x_position() const;
  /// y positions of the grid rows.
  Eigen::VectorXd y_position() const;

  /// Current density indexed (y, x).
  /// @param power_dbm Input power to rescale to; the file's drive voltage is
  ///        used when empty
  /// @param impedance Port impedance (ohms) used with power_dbm
  /// @throws FormatError if power_dbm is given and no port is listed
  Eigen::MatrixXd current_density(std::optional<double> power_dbm = std::nullopt,
                                  double impedance = 50.0) const;

  /// Bilinear interpolation of current_density() at (x, y).
  /// @throws std::out_of_range outside the grid
  double interpolate(double x, double y,
                     std::optional<double> power_dbm = std::nullopt,
                     double impedance = 50.0) const;

  /// Keep only the samples inside the inclusive window. Missing bounds are
  /// unbounded. The removed samples are gone for good.
  /// @throws std::invalid_argument if no bound is given
  void trim_data(std::optional<double> x_min, std::optional<double> x_max,
                 std::optional<double> y_min, std::optional<double> y_max);

private:
  static constexpr int kHeaderLines = 9;

  const std::string &cell(int row, int col) const;
  double number(int row, int col) const;
  void load_header() const;
  void load_data() const;

  std::string file_name_;

  mutable bool header_loaded_ = false;
  mutable std::vector<std::vector<std::string>> header_;

  mutable bool data_loaded_ = false;
  mutable Eigen::VectorXd x_;
  mutable Eigen::VectorXd y_;
  mutable Eigen::MatrixXd values_;
};

} // namespace sonnetio

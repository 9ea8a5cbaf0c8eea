#include "sonnetio/current_density.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "io/text_util.hpp"
#include "sonnetio/errors.hpp"

namespace sonnetio {

namespace {

bool is_port_cell(const std::string &cell) {
  return cell.size() > 4 && cell.compare(0, 4, "Port") == 0;
}

// Index i with v(i), v(i+1) around x, and the fraction t between them.
void bracket(const Eigen::VectorXd &v, double x, const char *axis, int &i,
             double &t) {
  const int n = static_cast<int>(v.size());
  if (n == 1 && x == v(0)) {
    i = 0;
    t = 0.0;
    return;
  }
  for (i = 0; i + 1 < n; ++i) {
    const double lo = std::min(v(i), v(i + 1));
    const double hi = std::max(v(i), v(i + 1));
    if (x >= lo && x <= hi) {
      const double span = v(i + 1) - v(i);
      t = span == 0.0 ? 0.0 : (x - v(i)) / span;
      return;
    }
  }
  throw std::out_of_range(std::string(axis) + " = " + std::to_string(x) +
                          " is outside the current density grid");
}

} // namespace

CurrentDensity::CurrentDensity(std::string file_name, bool load_on_init)
    : file_name_(std::move(file_name)) {
  if (file_name_.empty()) {
    throw std::invalid_argument("CurrentDensity: must specify a file name");
  }
  if (load_on_init) {
    load_data();
    load_header();
  }
}

void CurrentDensity::load_header() const {
  std::ifstream in(file_name_);
  if (!in) {
    throw std::runtime_error("Failed to open current density file: " +
                             file_name_);
  }
  std::vector<std::vector<std::string>> header;
  std::string line;
  for (int i = 0; i < kHeaderLines; ++i) {
    if (!std::getline(in, line)) {
      throw FormatError("Current density file " + file_name_ + " has only " +
                        std::to_string(i) + " of " +
                        std::to_string(kHeaderLines) + " header rows");
    }
    header.push_back(text::split_csv(line));
  }
  header_ = std::move(header);
  header_loaded_ = true;
}

void CurrentDensity::load_data() const {
  std::ifstream in(file_name_);
  if (!in) {
    throw std::runtime_error("Failed to open current density file: " +
                             file_name_);
  }
  std::string line;
  for (int i = 0; i < kHeaderLines; ++i) {
    if (!std::getline(in, line)) {
      throw FormatError("Current density file " + file_name_ +
                        " ends inside the header");
    }
  }

  std::vector<std::vector<double>> rows;
  std::size_t line_no = kHeaderLines;
  while (std::getline(in, line)) {
    ++line_no;
    if (text::trim(line).empty())
      continue;
    std::vector<std::string> fields = text::split_csv(line);
    // rows end with a separator
    if (fields.size() > 1 && text::trim(fields.back()).empty())
      fields.pop_back();
    const std::string context = file_name_ + ":" + std::to_string(line_no);
    std::vector<double> row;
    row.reserve(fields.size());
    for (std::size_t c = 0; c < fields.size(); ++c) {
      const std::string f = text::trim(fields[c]);
      if (f.empty() || (rows.empty() && c == 0)) {
        // missing sample, or the "X Position ->" label
        row.push_back(std::numeric_limits<double>::quiet_NaN());
      } else {
        row.push_back(text::parse_double(f, context));
      }
    }
    if (!rows.empty() && row.size() != rows.front().size()) {
      throw FormatError("Row with " + std::to_string(row.size()) +
                        " columns, expected " +
                        std::to_string(rows.front().size()) + " in " + context);
    }
    rows.push_back(std::move(row));
  }
  if (rows.size() < 2 || rows.front().size() < 2) {
    throw FormatError("Current density file " + file_name_ +
                      " holds no grid data");
  }

  const int ny = static_cast<int>(rows.size()) - 1;
  const int nx = static_cast<int>(rows.front().size()) - 1;
  Eigen::VectorXd x(nx);
  Eigen::VectorXd y(ny);
  Eigen::MatrixXd values(ny, nx);
  for (int c = 0; c < nx; ++c)
    x(c) = rows[0][c + 1];
  for (int r = 0; r < ny; ++r) {
    y(r) = rows[r + 1][0];
    for (int c = 0; c < nx; ++c)
      values(r, c) = rows[r + 1][c + 1];
  }
  x_ = std::move(x);
  y_ = std::move(y);
  values_ = std::move(values);
  data_loaded_ = true;
}

const std::string &CurrentDensity::cell(int row, int col) const {
  if (!header_loaded_)
    load_header();
  const auto &r = header_.at(static_cast<std::size_t>(row));
  if (col >= static_cast<int>(r.size())) {
    throw FormatError("Header row " + std::to_string(row + 1) + " of " +
                      file_name_ + " has no column " + std::to_string(col + 1));
  }
  return r[static_cast<std::size_t>(col)];
}

double CurrentDensity::number(int row, int col) const {
  return text::parse_double(cell(row, col),
                            file_name_ + " header row " +
                                std::to_string(row + 1));
}

std::string CurrentDensity::version() const { return cell(0, 0); }
std::string CurrentDensity::sonnet_file_path() const { return cell(0, 2); }
std::string CurrentDensity::sonnet_version() const { return cell(1, 1); }
std::string CurrentDensity::sonnet_file_name() const { return cell(1, 3); }
double CurrentDensity::frequency() const { return number(2, 1); }

std::vector<int> CurrentDensity::ports() const {
  if (!header_loaded_)
    load_header();
  std::vector<int> out;
  for (const auto &c : header_[3]) {
    if (is_port_cell(c))
      out.push_back(text::parse_int(c.substr(5), file_name_ + " port list"));
  }
  return out;
}

double CurrentDensity::drive_voltage(int port) const {
  const std::vector<int> valid = ports();
  const auto &row = header_[3];
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (is_port_cell(row[i]) &&
        text::parse_int(row[i].substr(5), file_name_) == port)
      return number(3, static_cast<int>(i) + 2);
  }
  std::ostringstream msg;
  msg << port << " is not a valid port number. Use one of:";
  for (int p : valid)
    msg << ' ' << p;
  throw std::invalid_argument(msg.str());
}

double CurrentDensity::drive_phase(int port) const {
  const std::vector<int> valid = ports();
  const auto &row = header_[3];
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (is_port_cell(row[i]) &&
        text::parse_int(row[i].substr(5), file_name_) == port)
      return number(3, static_cast<int>(i) + 4);
  }
  std::ostringstream msg;
  msg << port << " is not a valid port number. Use one of:";
  for (int p : valid)
    msg << ' ' << p;
  throw std::invalid_argument(msg.str());
}

std::string CurrentDensity::level_string() const { return cell(4, 1); }

int CurrentDensity::level() const {
  return text::parse_int(cell(4, 2), file_name_ + " level");
}

std::string CurrentDensity::position_unit_string() const {
  const std::string &unit = cell(5, 1);
  return unit == "UM" ? "\xC2\xB5m" : unit;
}

double CurrentDensity::position_unit() const { return number(5, 2); }
double CurrentDensity::dx() const { return number(6, 1); }
double CurrentDensity::dy() const { return number(6, 4); }
double CurrentDensity::area() const { return number(6, 9); }
std::string CurrentDensity::area_unit_string() const { return cell(6, 10); }

std::string CurrentDensity::current_unit_string() const {
  const std::string &unit = cell(7, 2);
  return unit == "Amps/Meter" ? "A/m" : unit;
}

Eigen::VectorXd CurrentDensity::x_position() const {
  if (!data_loaded_)
    load_data();
  return x_;
}

Eigen::VectorXd CurrentDensity::y_position() const {
  if (!data_loaded_)
    load_data();
  return y_;
}

Eigen::MatrixXd CurrentDensity::current_density(std::optional<double> power_dbm,
                                                double impedance) const {
  if (!data_loaded_)
    load_data();
  if (!power_dbm)
    return values_;

  const std::vector<int> driven = ports();
  if (driven.empty()) {
    throw FormatError("Current density file " + file_name_ +
                      " lists no driven ports to rescale from");
  }
  // power delivered by the largest drive voltage in the file
  double voltage = -std::numeric_limits<double>::infinity();
  for (int port : driven)
    voltage = std::max(voltage, drive_voltage(port));
  const double power_data = voltage * voltage / impedance / 2.0;

  const double power = 1e-3 * std::pow(10.0, *power_dbm / 10.0);
  return values_ * std::sqrt(power / power_data);
}

double CurrentDensity::interpolate(double x, double y,
                                   std::optional<double> power_dbm,
                                   double impedance) const {
  const Eigen::MatrixXd J = current_density(power_dbm, impedance);
  int i = 0;
  int k = 0;
  double tx = 0.0;
  double ty = 0.0;
  bracket(x_, x, "x", i, tx);
  bracket(y_, y, "y", k, ty);
  const int i1 = std::min(i + 1, static_cast<int>(x_.size()) - 1);
  const int k1 = std::min(k + 1, static_cast<int>(y_.size()) - 1);
  const double lower = (1.0 - tx) * J(k, i) + tx * J(k, i1);
  const double upper = (1.0 - tx) * J(k1, i) + tx * J(k1, i1);
  return (1.0 - ty) * lower + ty * upper;
}

void CurrentDensity::trim_data(std::optional<double> x_min,
                               std::optional<double> x_max,
                               std::optional<double> y_min,
                               std::optional<double> y_max) {
  if (!x_min && !x_max && !y_min && !y_max) {
    throw std::invalid_argument(
        "one of x_min, x_max, y_min, or y_max must be specified");
  }
  if (!data_loaded_)
    load_data();

  const double inf = std::numeric_limits<double>::infinity();
  const double x0 = x_min.value_or(-inf);
  const double x1 = x_max.value_or(inf);
  const double y0 = y_min.value_or(-inf);
  const double y1 = y_max.value_or(inf);

  std::vector<int> cols;
  std::vector<int> rows;
  for (int c = 0; c < x_.size(); ++c)
    if (x_(c) >= x0 && x_(c) <= x1)
      cols.push_back(c);
  for (int r = 0; r < y_.size(); ++r)
    if (y_(r) >= y0 && y_(r) <= y1)
      rows.push_back(r);

  Eigen::VectorXd x(static_cast<int>(cols.size()));
  Eigen::VectorXd y(static_cast<int>(rows.size()));
  Eigen::MatrixXd values(y.size(), x.size());
  for (int c = 0; c < x.size(); ++c)
    x(c) = x_(cols[c]);
  for (int r = 0; r < y.size(); ++r) {
    y(r) = y_(rows[r]);
    for (int c = 0; c < x.size(); ++c)
      values(r, c) = values_(rows[r], cols[c]);
  }
  x_ = std::move(x);
  y_ = std::move(y);
  values_ = std::move(values);
}

} // namespace sonnetio

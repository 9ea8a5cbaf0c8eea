#include "sonnetio/io/touchstone.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "io/text_util.hpp"
#include "sonnetio/errors.hpp"

namespace sonnetio {

namespace {

constexpr double kDegToRad = M_PI / 180.0;

struct ParserState {
  double version = 1.0;
  std::optional<int> num_ports;
  bool flip_port_order = false;
  MatrixStorage matrix_format = MatrixStorage::Full;
  FrequencyUnit unit = FrequencyUnit::GHz;
  ParameterKind kind = ParameterKind::S;
  TouchstoneFormat format = TouchstoneFormat::MA;
  double z0 = 50.0;
  std::vector<double> reference;
  std::size_t pending_reference = 0;
  bool in_noise_data = false;
  bool in_information = false;
  std::vector<double> values;
};

TouchstoneFormat parse_format(const std::string &token) {
  if (token == "ri")
    return TouchstoneFormat::RI;
  if (token == "ma")
    return TouchstoneFormat::MA;
  if (token == "db")
    return TouchstoneFormat::DB;
  throw FormatError("Unknown Touchstone data format '" + token + "'");
}

std::complex<double> pair_to_complex(double a, double b,
                                     TouchstoneFormat format) {
  switch (format) {
  case TouchstoneFormat::RI:
    return {a, b};
  case TouchstoneFormat::MA:
    return std::polar(a, b * kDegToRad);
  case TouchstoneFormat::DB:
    return std::polar(std::pow(10.0, a / 20.0), b * kDegToRad);
  }
  return {a, b};
}

// Remainder of a keyword line after "[keyword]".
std::string keyword_value(const std::string &line, const std::string &keyword) {
  return text::trim(line.substr(keyword.size()));
}

void parse_option_line(const std::string &line, ParserState &st,
                       const std::string &context) {
  std::vector<std::string> options = text::split_whitespace(line.substr(1));
  const std::vector<std::string> defaults = {"ghz", "s", "ma", "r", "50"};
  for (std::size_t i = options.size(); i < defaults.size(); ++i)
    options.push_back(defaults[i]);

  st.unit = parse_frequency_unit(options[0]);
  st.kind = parse_parameter_kind(options[1]);
  st.format = parse_format(options[2]);
  if (options[3] != "r") {
    throw FormatError("Expected 'R' before the reference impedance in " +
                      context);
  }
  st.z0 = text::parse_double(options[4], context);
}

void consume_numbers(const std::string &line, ParserState &st,
                     const std::string &context) {
  for (const auto &tok : text::split_whitespace(line)) {
    const double v = text::parse_double(tok, context);
    if (st.pending_reference > 0) {
      st.reference.push_back(v);
      --st.pending_reference;
    } else if (!st.in_noise_data) {
      st.values.push_back(v);
    }
  }
}

// Returns true if the line was a keyword line.
bool parse_keyword(const std::string &line, ParserState &st,
                   const std::string &context) {
  if (line[0] != '[')
    return false;

  if (text::starts_with(line, "[version]")) {
    st.version = text::parse_double(keyword_value(line, "[version]"), context);
  } else if (text::starts_with(line, "[number of ports]")) {
    st.num_ports =
        text::parse_int(keyword_value(line, "[number of ports]"), context);
    if (*st.num_ports <= 0) {
      throw FormatError("Port count must be positive in " + context);
    }
  } else if (text::starts_with(line, "[two-port data order]")) {
    if (keyword_value(line, "[two-port data order]") == "21_12")
      st.flip_port_order = true;
  } else if (text::starts_with(line, "[number of frequencies]") ||
             text::starts_with(line, "[number of noise frequencies]")) {
    // informational only
  } else if (text::starts_with(line, "[matrix format]")) {
    st.matrix_format =
        parse_matrix_storage(keyword_value(line, "[matrix format]"));
  } else if (text::starts_with(line, "[mixed-mode order]")) {
    throw UnsupportedFormatError(
        "The mixed-mode order data format is not supported (" + context + ")");
  } else if (text::starts_with(line, "[reference]")) {
    if (!st.num_ports) {
      throw FormatError("[Reference] must follow [Number of Ports] in " +
                        context);
    }
    st.reference.clear();
    st.pending_reference = static_cast<std::size_t>(*st.num_ports);
    consume_numbers(keyword_value(line, "[reference]"), st, context);
  } else if (text::starts_with(line, "[noise data]")) {
    st.in_noise_data = true;
  } else if (text::starts_with(line, "[begin information]")) {
    st.in_information = true;
  } else if (text::starts_with(line, "[network data]") ||
             text::starts_with(line, "[end]")) {
    // no-op
  } else {
    throw FormatError("Unknown Touchstone keyword '" + line + "' in " +
                      context);
  }
  return true;
}

} // namespace

std::optional<int> touchstone_ports_from_extension(const std::string &path) {
  const std::size_t slash = path.find_last_of("/\\");
  const std::size_t dot = path.rfind('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    throw FormatError("The file name '" + path +
                      "' does not have the expected Touchstone extension "
                      "(.sNp or .ts)");
  }
  const std::string ext = text::to_lower(path.substr(dot));
  if (ext == ".ts")
    return std::nullopt;
  if (ext.size() > 2 && ext[1] == 's' && ext.back() == 'p') {
    const std::string digits = ext.substr(2, ext.size() - 3);
    int ports = 0;
    try {
      ports = text::parse_int(digits, path);
    } catch (const FormatError &) {
      throw FormatError("The file name does not have a s-parameter "
                        "extension. It is [" +
                        path.substr(dot) +
                        "] instead. Use the form '.sNp', where N is the "
                        "number of ports.");
    }
    if (ports <= 0) {
      throw FormatError("Invalid port count in extension of '" + path + "'");
    }
    return ports;
  }
  throw FormatError("The file name '" + path +
                    "' does not have the expected Touchstone extension "
                    "(.sNp or .ts)");
}

NetworkParameterSet read_touchstone(const std::string &path,
                                    const TouchstoneReadOptions &opt) {
  const std::optional<int> ports = touchstone_ports_from_extension(path);
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open Touchstone file: " + path);
  }
  return read_touchstone(in, path, ports, opt);
}

NetworkParameterSet read_touchstone(std::istream &in,
                                    const std::string &source_name,
                                    std::optional<int> num_ports,
                                    const TouchstoneReadOptions &opt) {
  ParserState st;
  st.num_ports = num_ports;

  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string line = text::to_lower(text::strip_comment(raw, '!'));
    if (line.empty())
      continue;
    const std::string context =
        source_name + ":" + std::to_string(line_no);

    // free-form vendor block, skipped as a whole
    if (st.in_information) {
      if (text::starts_with(line, "[end information]"))
        st.in_information = false;
      continue;
    }
    if (parse_keyword(line, st, context))
      continue;
    if (line[0] == '#') {
      parse_option_line(line, st, context);
      continue;
    }
    consume_numbers(line, st, context);
  }

  if (!st.num_ports) {
    throw FormatError("Touchstone file " + source_name +
                      " does not declare [Number of Ports]");
  }
  if (st.in_information) {
    throw FormatError("Touchstone file " + source_name +
                      " ends inside a [Begin Information] block");
  }
  if (st.pending_reference > 0) {
    throw FormatError("Touchstone file " + source_name +
                      " ends inside the [Reference] list");
  }
  const int P = *st.num_ports;

  // Version 1 files store 2-port data as 11 21 12 22.
  if (st.version < 2 && P == 2)
    st.flip_port_order = true;

  const std::size_t entries = stored_value_count(P, st.matrix_format);
  const std::size_t row_len = 2 * entries + 1;
  if (st.values.size() % row_len != 0) {
    throw FormatError("Touchstone file " + source_name + " holds " +
                      std::to_string(st.values.size()) +
                      " values, which is not a multiple of the " +
                      std::to_string(row_len) + " values per frequency");
  }
  const std::size_t rows = st.values.size() / row_len;

  // Keep only the rows after the last frequency decrease.
  std::size_t first = 0;
  for (std::size_t r = 1; r < rows; ++r) {
    if (st.values[r * row_len] < st.values[(r - 1) * row_len])
      first = r;
  }
  if (opt.verbose) {
    std::cerr << "read_touchstone: " << source_name << ": " << P
              << " ports, version " << st.version << ", " << rows
              << " rows";
    if (first > 0)
      std::cerr << ", dropped " << first << " leading noise rows";
    std::cerr << std::endl;
  }

  const double to_ghz = frequency_multiplier(st.unit) / 1e9;
  std::vector<double> freq;
  std::vector<Eigen::MatrixXcd> matrices;
  freq.reserve(rows - first);
  matrices.reserve(rows - first);
  std::vector<std::complex<double>> z(entries);
  for (std::size_t r = first; r < rows; ++r) {
    const double *row = st.values.data() + r * row_len;
    freq.push_back(row[0] * to_ghz);
    for (std::size_t e = 0; e < entries; ++e)
      z[e] = pair_to_complex(row[1 + 2 * e], row[2 + 2 * e], st.format);
    Eigen::MatrixXcd M =
        unpack_matrix(z.data(), z.size(), P, st.matrix_format);
    if (st.flip_port_order)
      M.transposeInPlace();
    matrices.push_back(std::move(M));
  }

  std::vector<double> reference = st.reference;
  if (reference.empty())
    reference.assign(static_cast<std::size_t>(P), st.z0);
  return NetworkParameterSet(std::move(freq), std::move(matrices), st.kind,
                             std::move(reference));
}

NetworkParameterSet read_syz_parameters(const std::string &path,
                                        SyzDialect dialect,
                                        const TouchstoneReadOptions &opt) {
  switch (dialect) {
  case SyzDialect::Touchstone:
    return read_touchstone(path, opt);
  case SyzDialect::Databank:
  case SyzDialect::Cadence:
  case SyzDialect::Spreadsheet:
  case SyzDialect::MdifS2p:
  case SyzDialect::MdifEbridge:
    break;
  }
  throw NotImplementedError("Reading the " + dialect_name(dialect) +
                            " parameter dialect");
}

} // namespace sonnetio

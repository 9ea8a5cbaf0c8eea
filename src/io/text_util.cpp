#include "io/text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

#include "sonnetio/errors.hpp"

namespace sonnetio {
namespace text {

std::string trim(const std::string &s) {
  std::size_t a = 0;
  std::size_t b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a])))
    ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
    --b;
  return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string strip_comment(const std::string &s, char marker) {
  const std::size_t pos = s.find(marker);
  return trim(pos == std::string::npos ? s : s.substr(0, pos));
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_whitespace(const std::string &s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok)
    out.push_back(tok);
  return out;
}

double parse_double(const std::string &token, const std::string &context) {
  const std::string t = trim(token);
  const char *begin = t.c_str();
  char *end = nullptr;
  errno = 0;
  const double value = std::strtod(begin, &end);
  if (t.empty() || end != begin + t.size()) {
    throw FormatError("Invalid numeric token '" + token + "' in " + context);
  }
  if (errno == ERANGE) {
    throw FormatError("Numeric value out of range '" + token + "' in " +
                      context);
  }
  return value;
}

int parse_int(const std::string &token, const std::string &context) {
  const std::string t = trim(token);
  const char *begin = t.c_str();
  char *end = nullptr;
  errno = 0;
  const long value = std::strtol(begin, &end, 10);
  if (t.empty() || end != begin + t.size()) {
    throw FormatError("Invalid integer '" + token + "' in " + context);
  }
  if (errno == ERANGE || value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    throw FormatError("Integer out of range '" + token + "' in " + context);
  }
  return static_cast<int>(value);
}

std::vector<std::string> split_csv(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r' && c != '\n') {
      field.push_back(c);
    }
  }
  fields.push_back(field);
  return fields;
}

} // namespace text
} // namespace sonnetio

#pragma once

#include <string>
#include <vector>

namespace sonnetio {
namespace text {

std::string trim(const std::string &s);

std::string to_lower(std::string s);

// Drop everything from the first `marker` on, then trim.
std::string strip_comment(const std::string &s, char marker);

bool starts_with(const std::string &s, const std::string &prefix);

std::vector<std::string> split_whitespace(const std::string &s);

// Full-token conversion; `context` names the file/line for the error message.
double parse_double(const std::string &token, const std::string &context);
int parse_int(const std::string &token, const std::string &context);

// One CSV record with double-quote quoting. Empty fields are kept.
std::vector<std::string> split_csv(const std::string &line);

} // namespace text
} // namespace sonnetio

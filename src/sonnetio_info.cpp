#include <cctype>
#include <exception>
#include <iostream>
#include <string>

#include "sonnetio/coupled_lines.hpp"
#include "sonnetio/current_density.hpp"
#include "sonnetio/io/json_export.hpp"
#include "sonnetio/io/touchstone.hpp"
#include "sonnetio/network.hpp"

using namespace sonnetio;

namespace {

std::string extension_of(const std::string &path) {
  const std::size_t dot = path.rfind('.');
  const std::size_t slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
    return "";
  std::string ext = path.substr(dot);
  for (auto &c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

bool is_touchstone(const std::string &ext) {
  if (ext == ".ts")
    return true;
  return ext.size() > 3 && ext[1] == 's' && ext.back() == 'p';
}

void summarize(const NetworkParameterSet &data) {
  std::cout << parameter_letter(data.kind()) << "-parameters, "
            << data.num_ports() << " ports, " << data.size()
            << " frequencies";
  if (!data.empty()) {
    std::cout << " from " << data.frequencies().front() << " to "
              << data.frequencies().back() << " GHz";
  }
  std::cout << "\n";
  if (data.empty())
    return;
  const auto &first = data.at(0);
  std::cout << "reciprocal at first point: "
            << (is_reciprocal(first) ? "yes" : "no") << "\n";
  if (data.kind() == ParameterKind::S) {
    std::cout << "passive at first point: "
              << (is_passive(first) ? "yes" : "no") << "\n";
  }
}

void summarize(const CoupledLineModel &model) {
  std::cout << model.num_lines() << " coupled lines, " << model.size()
            << " frequencies\n";
  for (std::size_t k = 0; k < model.size(); ++k) {
    std::cout << "f=" << model.frequencies()[k] / 1e9 << " GHz";
    for (int m = 0; m < model.num_lines(); ++m) {
      std::cout << "  mode " << m
                << ": Zc=" << model.characteristic_impedance()[k](m)
                << " eps_eff="
                << model.effective_relative_permittivity()[k](m).real();
    }
    std::cout << "\n";
  }
}

void summarize(const CurrentDensity &cd) {
  std::cout << cd.version() << ", project " << cd.sonnet_file_name()
            << ", f=" << cd.frequency() << " Hz, level "
            << cd.level_string() << "\n";
  for (int port : cd.ports()) {
    std::cout << "port " << port << ": " << cd.drive_voltage(port) << " V at "
              << cd.drive_phase(port) << " deg\n";
  }
  const auto J = cd.current_density();
  std::cout << "grid " << J.cols() << " x " << J.rows() << " ("
            << cd.position_unit_string() << "), max "
            << J.maxCoeff() << " " << cd.current_unit_string() << "\n";
}

} // namespace

int main(int argc, char **argv) {
  bool verbose = false;
  std::string json_path;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--json" && i + 1 < argc) {
      json_path = argv[++i];
    } else if (path.empty()) {
      path = arg;
    } else {
      path.clear();
      break;
    }
  }
  if (path.empty()) {
    std::cerr << "Usage: " << argv[0]
              << " [--verbose] [--json <out.json>] <file>\n";
    return 1;
  }

  try {
    const std::string ext = extension_of(path);
    if (is_touchstone(ext)) {
      TouchstoneReadOptions opt;
      opt.verbose = verbose;
      auto data = read_touchstone(path, opt);
      summarize(data);
      if (!json_path.empty())
        write_network_json(json_path, data);
    } else if (ext == ".csv") {
      if (!json_path.empty()) {
        std::cerr << "JSON export covers Touchstone and coupled-line files\n";
        return 1;
      }
      CurrentDensity cd(path);
      summarize(cd);
    } else {
      CoupledLineReadOptions opt;
      opt.verbose = verbose;
      auto model = read_spectre(path, opt);
      summarize(model);
      if (!json_path.empty())
        write_coupled_lines_json(json_path, model);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (!json_path.empty() && verbose)
    std::cerr << "Wrote " << json_path << "\n";
  return 0;
}
